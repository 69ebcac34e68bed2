//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements connection-kind naming and the built-in transport factory.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Transport/Transport.h"

#include "lspvisor/Transport/HttpTransport.h"
#include "lspvisor/Transport/StdioTransport.h"
#include "lspvisor/Transport/TcpTransport.h"
#include "lspvisor/Transport/WebSocketTransport.h"

namespace lspvisor
{

llvm::StringRef connectionKindName(const ConnectionKind kind)
{
    switch (kind)
    {
    case ConnectionKind::Stdio:
        return "stdio";
    case ConnectionKind::Tcp:
        return "tcp";
    case ConnectionKind::WebSocket:
        return "websocket";
    case ConnectionKind::Http:
        return "http";
    }
    return "stdio";
}

std::optional<ConnectionKind> parseConnectionKind(const llvm::StringRef name)
{
    const std::string lowered = name.trim().lower();
    if (lowered == "stdio")
    {
        return ConnectionKind::Stdio;
    }
    if (lowered == "tcp")
    {
        return ConnectionKind::Tcp;
    }
    if (lowered == "websocket")
    {
        return ConnectionKind::WebSocket;
    }
    if (lowered == "http")
    {
        return ConnectionKind::Http;
    }
    return std::nullopt;
}

bool hasInboundStream(const ConnectionKind kind)
{
    return kind != ConnectionKind::Http;
}

std::unique_ptr<Transport> createTransport(const TransportOptions& options)
{
    switch (options.kind)
    {
    case ConnectionKind::Stdio:
        return std::make_unique<StdioTransport>(options);
    case ConnectionKind::Tcp:
        return std::make_unique<TcpTransport>(options);
    case ConnectionKind::WebSocket:
        return std::make_unique<WebSocketTransport>(options);
    case ConnectionKind::Http:
        return std::make_unique<HttpTransport>(options);
    }
    return nullptr;
}

}  // namespace lspvisor
