//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Cancellable periodic background work.
///
/// Heartbeats and health monitors run on a dedicated worker that sleeps
/// between ticks. The sleep wakes immediately on cancellation so that
/// shutdown never waits out a full interval.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_SUPPORT_PERIODIC_TASK_H
#define LSPVISOR_SUPPORT_PERIODIC_TASK_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace lspvisor
{

class CancellationSource;

/// @brief Cooperative cancellation token observed by background work.
class CancellationToken final
{
public:
    /// @brief Returns whether cancellation has been requested.
    [[nodiscard]] bool isCancellationRequested() const;

    /// @brief Sleeps for up to `duration`, waking early on cancellation.
    /// @param[in] duration Maximum sleep.
    /// @return `true` when cancellation was requested before or during the sleep.
    [[nodiscard]] bool waitFor(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;
    struct State;
    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

/// @brief Owner side of a cancellation token.
class CancellationSource final
{
public:
    CancellationSource();

    /// @brief Returns a token observing this source.
    [[nodiscard]] CancellationToken token() const;

    /// @brief Requests cancellation and wakes all sleeping observers.
    void cancel();

    /// @brief Returns whether cancellation has been requested.
    [[nodiscard]] bool isCancelled() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

/// @brief Tick callback invoked once per interval.
using PeriodicBody = std::function<void(const CancellationToken& token)>;

/// @brief Worker thread running a body at a fixed interval until stopped.
class PeriodicTask final
{
public:
    /// @brief Starts the worker.
    /// @param[in] name Task name for diagnostics.
    /// @param[in] interval Delay before each tick.
    /// @param[in] body Tick callback.
    PeriodicTask(std::string name, std::chrono::milliseconds interval, PeriodicBody body);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&)            = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// @brief Stops the worker.
    ///
    /// Joins the worker unless called from the worker itself, in which case the
    /// stop is only requested and the current tick is the last one.
    void stop();

    /// @brief Returns whether a stop has been requested.
    [[nodiscard]] bool isStopping() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lspvisor

#endif  // LSPVISOR_SUPPORT_PERIODIC_TASK_H
