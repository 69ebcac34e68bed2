//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request-per-call HTTP transport.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_TRANSPORT_HTTP_TRANSPORT_H
#define LSPVISOR_TRANSPORT_HTTP_TRANSPORT_H

#include "lspvisor/Transport/Transport.h"

#include <memory>

namespace lspvisor
{

/// @brief HTTP transport posting each payload to `http://host:port/path`.
///
/// `receive` never blocks and always reports end of stream; the response to a
/// request is the return value of `send`.
class HttpTransport final : public Transport
{
public:
    /// @brief Creates an unconnected transport.
    /// @param[in] options Endpoint options.
    explicit HttpTransport(TransportOptions options);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&)            = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    [[nodiscard]] ConnectionKind kind() const override
    {
        return ConnectionKind::Http;
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

#endif  // LSPVISOR_TRANSPORT_HTTP_TRANSPORT_H
