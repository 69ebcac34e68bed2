//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Persistent WebSocket transport, one payload per text frame.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_TRANSPORT_WEB_SOCKET_TRANSPORT_H
#define LSPVISOR_TRANSPORT_WEB_SOCKET_TRANSPORT_H

#include "lspvisor/Transport/Transport.h"

#include <memory>

namespace lspvisor
{

/// @brief WebSocket transport at `ws://host:port/path`.
class WebSocketTransport final : public Transport
{
public:
    /// @brief Creates an unconnected transport.
    /// @param[in] options Endpoint options.
    explicit WebSocketTransport(TransportOptions options);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&)            = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    [[nodiscard]] ConnectionKind kind() const override
    {
        return ConnectionKind::WebSocket;
    }

    [[nodiscard]] llvm::Error connect() override;
    [[nodiscard]] llvm::Expected<std::optional<std::string>> send(llvm::StringRef payload) override;
    [[nodiscard]] llvm::Expected<std::optional<std::string>> receive() override;
    void                                                      interrupt() override;
    void                                                      disconnect() override;
    [[nodiscard]] bool                                        isAlive() override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lspvisor

#endif  // LSPVISOR_TRANSPORT_WEB_SOCKET_TRANSPORT_H
