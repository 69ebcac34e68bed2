//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Raw TCP socket transport with `Content-Length` framing.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_TRANSPORT_TCP_TRANSPORT_H
#define LSPVISOR_TRANSPORT_TCP_TRANSPORT_H

#include "lspvisor/Transport/Transport.h"

#include <memory>

namespace lspvisor
{

/// @brief `Content-Length` framed transport over a TCP connection.
class TcpTransport final : public Transport
{
public:
    /// @brief Creates an unconnected transport.
    /// @param[in] options Endpoint options.
    explicit TcpTransport(TransportOptions options);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&)            = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    [[nodiscard]] ConnectionKind kind() const override
    {
        return ConnectionKind::Tcp;
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

#endif  // LSPVISOR_TRANSPORT_TCP_TRANSPORT_H
