//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "lspvisor/Client/ClientState.h"

namespace lspvisor
{

llvm::StringRef clientStateName(const ClientState state)
{
    switch (state)
    {
    case ClientState::Disconnected:
        return "disconnected";
    case ClientState::Initializing:
        return "initializing";
    case ClientState::Ready:
        return "ready";
    case ClientState::ShuttingDown:
        return "shutting-down";
    }
    return "disconnected";
}

std::optional<ClientState> transition(const ClientState state, const ClientEvent event)
{
    switch (state)
    {
    case ClientState::Disconnected:
        if (event == ClientEvent::ChannelOpened)
        {
            return ClientState::Initializing;
        }
        if (event == ClientEvent::ChannelClosed)
        {
            return ClientState::Disconnected;
        }
        break;
    case ClientState::Initializing:
        if (event == ClientEvent::HandshakeSucceeded)
        {
            return ClientState::Ready;
        }
        if (event == ClientEvent::HandshakeFailed || event == ClientEvent::TransportLost ||
            event == ClientEvent::ChannelClosed)
        {
            return ClientState::Disconnected;
        }
        break;
    case ClientState::Ready:
        if (event == ClientEvent::DisconnectRequested)
        {
            return ClientState::ShuttingDown;
        }
        if (event == ClientEvent::TransportLost || event == ClientEvent::ChannelClosed)
        {
            return ClientState::Disconnected;
        }
        break;
    case ClientState::ShuttingDown:
        if (event == ClientEvent::ChannelClosed || event == ClientEvent::TransportLost)
        {
            return ClientState::Disconnected;
        }
        break;
    }
    return std::nullopt;
}

std::chrono::milliseconds ReconnectPolicy::backoff(const std::uint32_t attempt) const
{
    std::chrono::milliseconds delay = baseDelay;
    for (std::uint32_t step = 0; step < attempt; ++step)
    {
        if (delay >= maxDelay)
        {
            break;
        }
        delay *= 2;
    }
    return delay < maxDelay ? delay : maxDelay;
}

}  // namespace lspvisor
