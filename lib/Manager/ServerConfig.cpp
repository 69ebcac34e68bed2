//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements configuration serialization and status snapshots.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Manager/ServerConfig.h"

#include "lspvisor/Retrieval/CodeError.h"
#include "lspvisor/Support/Error.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace lspvisor
{
namespace
{

double toSeconds(const std::chrono::milliseconds duration)
{
    return static_cast<double>(duration.count()) / 1000.0;
}

llvm::Expected<std::chrono::milliseconds> readDuration(const llvm::json::Object&  object,
                                                       const llvm::StringRef      key,
                                                       const std::chrono::milliseconds fallback)
{
    const auto* value = object.get(key);
    if (!value)
    {
        return fallback;
    }
    const auto seconds = value->getAsNumber();
    if (!seconds || *seconds < 0.0 || !std::isfinite(*seconds))
    {
        return makeProtocolError("'" + key + "' must be a non-negative number of seconds");
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(*seconds * 1000.0)));
}

llvm::Expected<bool> readBool(const llvm::json::Object& object, const llvm::StringRef key, const bool fallback)
{
    const auto* value = object.get(key);
    if (!value)
    {
        return fallback;
    }
    const auto flag = value->getAsBoolean();
    if (!flag)
    {
        return makeProtocolError("'" + key + "' must be a boolean");
    }
    return *flag;
}

}  // namespace

llvm::StringRef serverStatusName(const ServerStatus status)
{
    switch (status)
    {
    case ServerStatus::Stopped:
        return "stopped";
    case ServerStatus::Starting:
        return "starting";
    case ServerStatus::Running:
        return "running";
    case ServerStatus::Stopping:
        return "stopping";
    case ServerStatus::Error:
        return "error";
    }
    return "error";
}

llvm::json::Value toJson(const ServerConfig& config)
{
    llvm::json::Array command;
    for (const auto& arg : config.command)
    {
        command.push_back(arg);
    }
    llvm::json::Object environment;
    for (const auto& [key, value] : config.environment)
    {
        environment[key] = value;
    }

    llvm::json::Object object;
    object["name"]                  = config.name;
    object["command"]               = std::move(command);
    object["working_directory"]     = config.workingDirectory ? llvm::json::Value(*config.workingDirectory)
                                                              : llvm::json::Value(nullptr);
    object["environment"]           = std::move(environment);
    object["connection_type"]       = connectionKindName(config.connectionKind);
    object["host"]                  = config.host;
    object["port"]                  = static_cast<std::int64_t>(config.port);
    object["auto_start"]            = config.autoStart;
    object["auto_restart"]          = config.autoRestart;
    object["max_restart_attempts"]  = static_cast<std::int64_t>(config.maxRestartAttempts);
    object["health_check_interval"] = toSeconds(config.healthCheckInterval);
    object["startup_timeout"]       = toSeconds(config.startupTimeout);
    object["shutdown_timeout"]      = toSeconds(config.shutdownTimeout);
    return llvm::json::Value(std::move(object));
}

llvm::Expected<ServerConfig> parseServerConfig(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return makeProtocolError("server configuration must be a JSON object");
    }

    ServerConfig config;
    const auto   name = object->getString("name");
    if (!name || name->empty())
    {
        return makeProtocolError("'name' must be a non-empty string");
    }
    config.name = name->str();

    const auto* command = object->getArray("command");
    if (!command)
    {
        return makeProtocolError("'command' must be an array of strings");
    }
    for (const auto& arg : *command)
    {
        const auto text = arg.getAsString();
        if (!text)
        {
            return makeProtocolError("'command' must be an array of strings");
        }
        config.command.push_back(text->str());
    }

    if (const auto* directory = object->get("working_directory"))
    {
        if (const auto text = directory->getAsString())
        {
            config.workingDirectory = text->str();
        }
        else if (!directory->getAsNull())
        {
            return makeProtocolError("'working_directory' must be a string or null");
        }
    }

    if (const auto* environment = object->get("environment"))
    {
        const auto* entries = environment->getAsObject();
        if (!entries)
        {
            return makeProtocolError("'environment' must be an object of strings");
        }
        for (const auto& [key, entry] : *entries)
        {
            const auto text = entry.getAsString();
            if (!text)
            {
                return makeProtocolError("'environment' must be an object of strings");
            }
            config.environment[key.str()] = text->str();
        }
    }

    if (const auto* kindValue = object->get("connection_type"))
    {
        const auto kindName = kindValue->getAsString();
        const auto kind     = kindName ? parseConnectionKind(*kindName) : std::nullopt;
        if (!kind)
        {
            return makeProtocolError("'connection_type' must be one of stdio, tcp, websocket, http");
        }
        config.connectionKind = *kind;
    }

    if (const auto* hostValue = object->get("host"))
    {
        const auto host = hostValue->getAsString();
        if (!host)
        {
            return makeProtocolError("'host' must be a string");
        }
        config.host = host->str();
    }

    if (const auto* portValue = object->get("port"))
    {
        const auto port = portValue->getAsInteger();
        if (!port || *port < 0 || *port > std::numeric_limits<std::uint16_t>::max())
        {
            return makeProtocolError("'port' must be an integer in [0, 65535]");
        }
        config.port = static_cast<std::uint16_t>(*port);
    }

    if (const auto* attemptsValue = object->get("max_restart_attempts"))
    {
        const auto attempts = attemptsValue->getAsInteger();
        if (!attempts || *attempts < 0)
        {
            return makeProtocolError("'max_restart_attempts' must be a non-negative integer");
        }
        config.maxRestartAttempts = static_cast<std::uint32_t>(*attempts);
    }

    auto autoStart = readBool(*object, "auto_start", config.autoStart);
    if (!autoStart)
    {
        return autoStart.takeError();
    }
    config.autoStart = *autoStart;

    auto autoRestart = readBool(*object, "auto_restart", config.autoRestart);
    if (!autoRestart)
    {
        return autoRestart.takeError();
    }
    config.autoRestart = *autoRestart;

    auto healthInterval = readDuration(*object, "health_check_interval", config.healthCheckInterval);
    if (!healthInterval)
    {
        return healthInterval.takeError();
    }
    config.healthCheckInterval = *healthInterval;

    auto startupTimeout = readDuration(*object, "startup_timeout", config.startupTimeout);
    if (!startupTimeout)
    {
        return startupTimeout.takeError();
    }
    config.startupTimeout = *startupTimeout;

    auto shutdownTimeout = readDuration(*object, "shutdown_timeout", config.shutdownTimeout);
    if (!shutdownTimeout)
    {
        return shutdownTimeout.takeError();
    }
    config.shutdownTimeout = *shutdownTimeout;

    return config;
}

TransportOptions transportOptionsFor(const ServerConfig& config)
{
    TransportOptions options;
    options.kind             = config.connectionKind;
    options.command          = config.command;
    options.workingDirectory = config.workingDirectory ? *config.workingDirectory : std::string();
    options.environment      = config.environment;
    options.host             = config.host;
    options.port             = config.port;
    options.connectTimeout   = std::min(options.connectTimeout, config.startupTimeout);
    return options;
}

std::optional<double> ServerInfo::uptime() const
{
    if (!startTime)
    {
        return std::nullopt;
    }
    return unixNow() - *startTime;
}

llvm::json::Value toJson(const ServerInfo& info)
{
    const auto optionalNumber = [](const std::optional<double>& number) {
        return number ? llvm::json::Value(*number) : llvm::json::Value(nullptr);
    };

    llvm::json::Object object;
    object["name"]              = info.config.name;
    object["status"]            = serverStatusName(info.status);
    object["connection_type"]   = connectionKindName(info.config.connectionKind);
    object["process_id"]        = info.processId ? llvm::json::Value(static_cast<std::int64_t>(*info.processId))
                                                 : llvm::json::Value(nullptr);
    object["start_time"]        = optionalNumber(info.startTime);
    object["uptime"]            = optionalNumber(info.uptime());
    object["last_health_check"] = optionalNumber(info.lastHealthCheck);
    object["restart_count"]     = static_cast<std::int64_t>(info.restartCount);
    object["error_message"]     = info.errorMessage ? llvm::json::Value(*info.errorMessage) : llvm::json::Value(nullptr);
    object["config"]            = toJson(info.config);
    return llvm::json::Value(std::move(object));
}

}  // namespace lspvisor
