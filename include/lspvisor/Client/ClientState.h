//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Client connection state machine and reconnect backoff policy.
///
/// Both are pure values so lifecycle rules are testable without a transport.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_CLIENT_CLIENT_STATE_H
#define LSPVISOR_CLIENT_CLIENT_STATE_H

#include "llvm/ADT/StringRef.h"

#include <chrono>
#include <cstdint>
#include <optional>

namespace lspvisor
{

/// @brief Connection state of a client.
enum class ClientState
{
    /// @brief No channel; the initial and final state.
    Disconnected,

    /// @brief Channel open, initialize handshake in progress.
    Initializing,

    /// @brief Handshake complete; operations are accepted.
    Ready,

    /// @brief Shutdown handshake in progress.
    ShuttingDown,
};

/// @brief Lifecycle event driving a state transition.
enum class ClientEvent
{
    /// @brief `connect()` opened the channel.
    ChannelOpened,

    /// @brief The initialize handshake completed.
    HandshakeSucceeded,

    /// @brief The initialize handshake failed or timed out.
    HandshakeFailed,

    /// @brief `disconnect()` began the shutdown sequence.
    DisconnectRequested,

    /// @brief Resources were released.
    ChannelClosed,

    /// @brief The channel failed unexpectedly.
    TransportLost,
};

/// @brief Returns a lowercase state name.
[[nodiscard]] llvm::StringRef clientStateName(ClientState state);

/// @brief Returns the state reached from `state` on `event`.
/// @return Next state, or `std::nullopt` when the event is not valid in `state`.
[[nodiscard]] std::optional<ClientState> transition(ClientState state, ClientEvent event);

/// @brief Exponential reconnect backoff with a ceiling.
struct ReconnectPolicy final
{
    /// @brief Whether reconnects are attempted at all.
    bool enabled{true};

    /// @brief Attempts before giving up.
    std::uint32_t maxAttempts{5};

    /// @brief Delay of the first attempt.
    std::chrono::milliseconds baseDelay{std::chrono::seconds(1)};

    /// @brief Upper bound on any delay.
    std::chrono::milliseconds maxDelay{std::chrono::seconds(30)};

    /// @brief Returns `baseDelay * 2^attempt`, capped at `maxDelay`.
    /// @param[in] attempt Zero-based attempt number.
    [[nodiscard]] std::chrono::milliseconds backoff(std::uint32_t attempt) const;

    /// @brief Returns whether another attempt is allowed after `attemptsMade`.
    [[nodiscard]] bool allows(std::uint32_t attemptsMade) const
    {
        return enabled && attemptsMade < maxAttempts;
    }
};

}  // namespace lspvisor

#endif  // LSPVISOR_CLIENT_CLIENT_STATE_H
