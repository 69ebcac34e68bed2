//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Managed server configuration records and status snapshots.
///
/// A configuration is persisted as one JSON object with snake_case keys;
/// durations are stored as floating-point seconds.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_MANAGER_SERVER_CONFIG_H
#define LSPVISOR_MANAGER_SERVER_CONFIG_H

#include "lspvisor/Transport/Transport.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lspvisor
{

/// @brief Lifecycle status of a managed server.
enum class ServerStatus
{
    Stopped,
    Starting,
    Running,
    Stopping,
    Error,
};

/// @brief Returns a lowercase status name.
[[nodiscard]] llvm::StringRef serverStatusName(ServerStatus status);

/// @brief Launch and supervision settings of one server.
struct ServerConfig final
{
    /// @brief Unique registry key.
    std::string name;

    /// @brief Command line for stdio servers.
    std::vector<std::string> command;

    std::optional<std::string>         workingDirectory;
    std::map<std::string, std::string> environment;

    ConnectionKind connectionKind{ConnectionKind::Stdio};
    std::string    host{"localhost"};
    std::uint16_t  port{8080};

    /// @brief Started by `ServerManager::startAll`.
    bool autoStart{true};

    /// @brief Restarted by the health monitor after a failed probe.
    bool autoRestart{true};

    /// @brief Health-driven restarts allowed before the server is marked failed.
    std::uint32_t maxRestartAttempts{3};

    std::chrono::milliseconds healthCheckInterval{std::chrono::seconds(30)};
    std::chrono::milliseconds startupTimeout{std::chrono::seconds(60)};
    std::chrono::milliseconds shutdownTimeout{std::chrono::seconds(30)};
};

/// @brief Serializes a configuration with the persisted key set.
[[nodiscard]] llvm::json::Value toJson(const ServerConfig& config);

/// @brief Parses a persisted configuration.
///
/// `name` and `command` are required; every other key falls back to its default.
///
/// @return Configuration, or a protocol error naming the offending key.
[[nodiscard]] llvm::Expected<ServerConfig> parseServerConfig(const llvm::json::Value& value);

/// @brief Returns the transport options that reach the configured server.
[[nodiscard]] TransportOptions transportOptionsFor(const ServerConfig& config);

/// @brief Point-in-time view of one managed server.
struct ServerInfo final
{
    ServerConfig config;
    ServerStatus status{ServerStatus::Stopped};

    /// @brief Server process id for stdio servers while running.
    std::optional<int> processId;

    /// @brief Start time in seconds since the Unix epoch.
    std::optional<double> startTime;

    /// @brief Time of the last health probe in seconds since the Unix epoch.
    std::optional<double> lastHealthCheck;

    std::uint32_t              restartCount{0};
    std::optional<std::string> errorMessage;

    /// @brief Seconds since `startTime`, when running.
    [[nodiscard]] std::optional<double> uptime() const;
};

/// @brief Serializes a status snapshot for display.
[[nodiscard]] llvm::json::Value toJson(const ServerInfo& info);

}  // namespace lspvisor

#endif  // LSPVISOR_MANAGER_SERVER_CONFIG_H
