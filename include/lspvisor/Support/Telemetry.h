//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Outbound request telemetry aggregation and sink integration.
///
/// The client records one sample per request it sends, covering the round
/// trip from write to response, timeout, or failure.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_SUPPORT_TELEMETRY_H
#define LSPVISOR_SUPPORT_TELEMETRY_H

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lspvisor
{

/// @brief Outcome classification of a completed request.
enum class RequestOutcome
{
    /// @brief A response arrived (result or error object).
    Answered,

    /// @brief No response arrived within the request timeout.
    TimedOut,

    /// @brief The request failed locally (write error, connection lost).
    Failed,
};

/// @brief Immutable telemetry sample for a completed request.
struct RequestMetric final
{
    /// @brief JSON-RPC method name.
    std::string method;

    /// @brief Request latency in microseconds.
    std::uint64_t latencyMicros{0};

    /// @brief Request outcome.
    RequestOutcome outcome{RequestOutcome::Answered};
};

/// @brief Sink callback invoked for each telemetry sample.
using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Thread-safe request telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded metrics.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Records one request metric sample.
    /// @param[in] method JSON-RPC method name.
    /// @param[in] latencyMicros Elapsed time in microseconds.
    /// @param[in] outcome Request outcome.
    void record(std::string method, std::uint64_t latencyMicros, RequestOutcome outcome);

    /// @brief Returns total recorded request count for the method.
    [[nodiscard]] std::uint64_t requestCount(std::string_view method) const;

    /// @brief Returns the number of timed-out requests for the method.
    [[nodiscard]] std::uint64_t timeoutCount(std::string_view method) const;

private:
    struct Counters final
    {
        std::uint64_t total{0};
        std::uint64_t timedOut{0};
    };

    mutable std::mutex                        mutex_;
    RequestMetricSink                         sink_;
    std::unordered_map<std::string, Counters> counters_;
};

}  // namespace lspvisor

#endif  // LSPVISOR_SUPPORT_TELEMETRY_H
