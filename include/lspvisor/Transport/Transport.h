//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Byte-level channels to a language server.
///
/// A transport moves whole JSON-RPC payloads. Stream kinds (stdio, tcp) add
/// and strip `Content-Length` framing, the message-socket kind maps one
/// payload to one WebSocket frame, and the request-per-call kind performs a
/// full HTTP round trip inside `send`.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_TRANSPORT_TRANSPORT_H
#define LSPVISOR_TRANSPORT_TRANSPORT_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lspvisor
{

/// @brief Channel kind used to reach a server.
enum class ConnectionKind
{
    /// @brief Subprocess speaking over its standard streams.
    Stdio,

    /// @brief Raw TCP socket.
    Tcp,

    /// @brief Persistent WebSocket at `ws://host:port/lsp`.
    WebSocket,

    /// @brief One HTTP `POST` per message to `http://host:port/lsp`.
    Http,
};

/// @brief Returns the configuration name of a connection kind (`"stdio"`, ...).
[[nodiscard]] llvm::StringRef connectionKindName(ConnectionKind kind);

/// @brief Parses a connection kind name.
/// @return Parsed kind, or `std::nullopt` for unknown names.
[[nodiscard]] std::optional<ConnectionKind> parseConnectionKind(llvm::StringRef name);

/// @brief Returns whether the kind delivers server-initiated messages through `receive`.
[[nodiscard]] bool hasInboundStream(ConnectionKind kind);

/// @brief Parameters needed to open any transport kind.
struct TransportOptions final
{
    /// @brief Channel kind.
    ConnectionKind kind{ConnectionKind::Stdio};

    /// @brief Server command line for stdio.
    std::vector<std::string> command;

    /// @brief Server working directory for stdio, or empty to inherit.
    std::string workingDirectory;

    /// @brief Extra server environment for stdio.
    std::map<std::string, std::string> environment;

    /// @brief Remote host for socket kinds.
    std::string host{"localhost"};

    /// @brief Remote port for socket kinds.
    std::uint16_t port{8080};

    /// @brief Request target for WebSocket and HTTP.
    std::string path{"/lsp"};

    /// @brief Bound on establishing a socket connection.
    std::chrono::milliseconds connectTimeout{std::chrono::seconds(10)};

    /// @brief Bound on one HTTP round trip.
    std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};
};

/// @brief Channel carrying JSON-RPC payloads to and from one server.
///
/// `send` may be called from any thread while another thread is blocked in
/// `receive`. Every other member is called by the owning client only.
class Transport
{
public:
    virtual ~Transport() = default;

    /// @brief Returns the channel kind.
    [[nodiscard]] virtual ConnectionKind kind() const = 0;

    /// @brief Establishes the channel.
    ///
    /// On failure every partially acquired resource is released before
    /// returning.
    [[nodiscard]] virtual llvm::Error connect() = 0;

    /// @brief Sends one payload.
    /// @param[in] payload JSON text.
    /// @return For the request-per-call kind, the response body when the server
    ///         returned one. Always `std::nullopt` for other kinds.
    [[nodiscard]] virtual llvm::Expected<std::optional<std::string>> send(llvm::StringRef payload) = 0;

    /// @brief Blocks until one inbound payload arrives.
    /// @return Payload, or `std::nullopt` when the peer closed the channel or
    ///         `interrupt` was called.
    [[nodiscard]] virtual llvm::Expected<std::optional<std::string>> receive() = 0;

    /// @brief Wakes a thread blocked in `connect` or `receive`. Safe from any thread.
    virtual void interrupt() = 0;

    /// @brief Releases the channel. Idempotent.
    virtual void disconnect() = 0;

    /// @brief Returns whether the channel is open and, for stdio, the subprocess is alive.
    [[nodiscard]] virtual bool isAlive() = 0;

    /// @brief Returns the server process id for stdio transports.
    [[nodiscard]] virtual std::optional<int> processId() const
    {
        return std::nullopt;
    }

    /// @brief Forcefully ends the channel: SIGTERM, then SIGKILL after `grace` for stdio.
    /// @return `true` when the server exited within the grace period or there is no process.
    virtual bool terminate(std::chrono::milliseconds grace)
    {
        (void) grace;
        disconnect();
        return true;
    }
};

/// @brief Creates an unconnected transport for the given options.
using TransportFactory = std::function<std::unique_ptr<Transport>(const TransportOptions& options)>;

/// @brief Creates the built-in transport matching `options.kind`.
[[nodiscard]] std::unique_ptr<Transport> createTransport(const TransportOptions& options);

}  // namespace lspvisor

#endif  // LSPVISOR_TRANSPORT_TRANSPORT_H
