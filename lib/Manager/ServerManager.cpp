//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements server registration, lifecycle, health monitoring, and discovery.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Manager/ServerManager.h"

#include "lspvisor/Retrieval/CodeError.h"
#include "lspvisor/Support/Logging.h"

#include "llvm/Support/FormatVariadic.h"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <future>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>

namespace lspvisor
{

/// @brief Registry record of one server.
///
/// `info` and `client` are guarded by the manager mutex; `monitor` is guarded
/// by `operation`, which serializes lifecycle operations on this server.
struct ServerManager::Entry final : std::enable_shared_from_this<ServerManager::Entry>
{
    std::timed_mutex              operation;
    ServerInfo                    info;
    std::shared_ptr<LspClient>    client;
    std::unique_ptr<PeriodicTask> monitor;
};

namespace
{

constexpr const char* KnownExecutables[] = {
    "serena-lsp-server",
    "serena-server",
    "serena-language-server",
    "serena",
};

constexpr std::chrono::milliseconds MonitorLockPoll{50};

}  // namespace

std::shared_ptr<LspClient> defaultClientFactory(const ServerConfig& config)
{
    ClientOptions options;
    options.transport         = transportOptionsFor(config);
    options.reconnect.enabled = false;
    options.shutdownTimeout   = config.shutdownTimeout;
    return std::make_shared<LspClient>(std::move(options));
}

bool defaultHealthProbe(LspClient& client)
{
    return client.isConnected() && client.isTransportAlive();
}

ServerManager::ServerManager(ManagerOptions options)
    : options_(std::move(options))
    , store_(options_.configDirectory.empty() ? ConfigStore::defaultDirectory() : options_.configDirectory)
{
    if (!options_.clientFactory)
    {
        options_.clientFactory = defaultClientFactory;
    }
    if (!options_.healthProbe)
    {
        options_.healthProbe = defaultHealthProbe;
    }
    if (!options_.persist)
    {
        return;
    }
    for (auto& config : store_.loadAll())
    {
        auto entry         = std::make_shared<Entry>();
        entry->info.config = std::move(config);
        entries_[entry->info.config.name] = std::move(entry);
    }
}

ServerManager::~ServerManager()
{
    stopAll();
}

bool ServerManager::registerServer(ServerConfig config)
{
    const std::string name = config.name;
    if (name.empty())
    {
        logError("manager", "cannot register a server without a name");
        return false;
    }

    auto existing = find(name);
    if (existing)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (existing->info.status != ServerStatus::Stopped && existing->info.status != ServerStatus::Error)
        {
            logError("manager", "cannot re-register " + name + " while it is " + serverStatusName(existing->info.status));
            return false;
        }
    }

    if (options_.persist)
    {
        if (auto err = store_.save(config))
        {
            logError("manager", "error registering server " + name + ": " + llvm::toString(std::move(err)));
            return false;
        }
    }

    auto entry         = std::make_shared<Entry>();
    entry->info.config = std::move(config);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[name] = std::move(entry);
    }
    logInfo("manager", "registered server " + name);
    return true;
}

bool ServerManager::unregisterServer(const llvm::StringRef name)
{
    auto entry = find(name);
    if (!entry)
    {
        logError("manager", "server not found: " + name);
        return false;
    }
    {
        std::lock_guard<std::timed_mutex> operation(entry->operation);
        stopLocked(*entry);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = entries_.find(name.str());
        if (it != entries_.end() && it->second == entry)
        {
            entries_.erase(it);
        }
    }
    if (options_.persist)
    {
        if (auto err = store_.remove(name))
        {
            logError("manager", "error removing record of " + name + ": " + llvm::toString(std::move(err)));
            return false;
        }
    }
    logInfo("manager", "unregistered server " + name);
    return true;
}

bool ServerManager::start(const llvm::StringRef name)
{
    auto entry = find(name);
    if (!entry)
    {
        logError("manager", "server not found: " + name);
        return false;
    }
    std::lock_guard<std::timed_mutex> operation(entry->operation);
    return startLocked(*entry, true);
}

bool ServerManager::stop(const llvm::StringRef name)
{
    auto entry = find(name);
    if (!entry)
    {
        logError("manager", "server not found: " + name);
        return false;
    }
    std::lock_guard<std::timed_mutex> operation(entry->operation);
    return stopLocked(*entry);
}

bool ServerManager::restart(const llvm::StringRef name)
{
    auto entry = find(name);
    if (!entry)
    {
        logError("manager", "server not found: " + name);
        return false;
    }
    std::lock_guard<std::timed_mutex> operation(entry->operation);
    return restartLocked(*entry);
}

bool ServerManager::startLocked(Entry& entry, const bool resetRestartCount)
{
    ServerConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entry.info.status == ServerStatus::Running)
        {
            logInfo("manager", "server " + entry.info.config.name + " is already running");
            return true;
        }
        config = entry.info.config;
    }
    if (entry.client)
    {
        // Left behind by a failed health check; release it before starting over.
        entry.client->forceTerminate(options_.forceKillGrace);
        std::lock_guard<std::mutex> lock(mutex_);
        entry.client.reset();
    }
    setStatus(entry, ServerStatus::Starting);

    std::shared_ptr<LspClient> client;
    try
    {
        client = options_.clientFactory(config);
    } catch (const std::exception& ex)
    {
        return failStart(entry, std::string("cannot create client: ") + ex.what());
    }
    if (!client)
    {
        return failStart(entry, "cannot create client");
    }

    auto pending = std::async(std::launch::async, [client] { return client->connect(); });
    if (pending.wait_for(config.startupTimeout) != std::future_status::ready)
    {
        client->abort();
        llvm::consumeError(pending.get());
        client->forceTerminate(options_.forceKillGrace);
        logError("manager", "server " + config.name + " startup timeout");
        return failStart(entry, "Server startup timeout");
    }
    if (auto err = pending.get())
    {
        const std::string reason = llvm::toString(std::move(err));
        client->forceTerminate(options_.forceKillGrace);
        return failStart(entry, reason);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.client               = client;
        entry.info.processId       = client->processId();
        entry.info.startTime       = unixNow();
        entry.info.lastHealthCheck = std::nullopt;
        entry.info.errorMessage    = std::nullopt;
        if (resetRestartCount)
        {
            entry.info.restartCount = 0;
        }
    }
    setStatus(entry, ServerStatus::Running);
    startMonitor(entry.shared_from_this());
    logInfo("manager", "started server " + config.name);
    return true;
}

bool ServerManager::failStart(Entry& entry, const std::string& reason)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.info.errorMessage = reason;
        entry.info.processId    = std::nullopt;
        entry.info.startTime    = std::nullopt;
        logError("manager", "error starting server " + entry.info.config.name + ": " + reason);
    }
    setStatus(entry, ServerStatus::Error);
    return false;
}

bool ServerManager::stopLocked(Entry& entry)
{
    std::string                name;
    std::shared_ptr<LspClient> client;
    std::chrono::milliseconds  shutdownTimeout{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        name = entry.info.config.name;
        if (entry.info.status == ServerStatus::Stopped)
        {
            logInfo("manager", "server " + name + " is already stopped");
            return true;
        }
        client          = entry.client;
        shutdownTimeout = entry.info.config.shutdownTimeout;
    }
    setStatus(entry, ServerStatus::Stopping);

    // The monitor is cancelled first so a probe never races the shutdown.
    if (entry.monitor)
    {
        entry.monitor->stop();
        entry.monitor.reset();
    }

    if (client)
    {
        if (client->shutdown(shutdownTimeout))
        {
            client->disconnect();
        }
        else
        {
            logError("manager", "server " + name + " shutdown timeout; forcing termination");
            if (!client->forceTerminate(options_.forceKillGrace))
            {
                logWarning("manager", "server " + name + " ignored SIGTERM and was killed");
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.client.reset();
        entry.info.processId       = std::nullopt;
        entry.info.startTime       = std::nullopt;
        entry.info.lastHealthCheck = std::nullopt;
        entry.info.errorMessage    = std::nullopt;
    }
    setStatus(entry, ServerStatus::Stopped);
    logInfo("manager", "stopped server " + name);
    return true;
}

bool ServerManager::restartLocked(Entry& entry)
{
    logInfo("manager", "restarting server " + entry.info.config.name);
    if (!stopLocked(entry))
    {
        return false;
    }
    if (options_.restartDelay.count() > 0)
    {
        std::this_thread::sleep_for(options_.restartDelay);
    }
    if (!startLocked(entry, false))
    {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++entry.info.restartCount;
    return true;
}

void ServerManager::startMonitor(const std::shared_ptr<Entry>& entry)
{
    std::chrono::milliseconds interval{0};
    std::string               name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interval = entry->info.config.healthCheckInterval;
        name     = entry->info.config.name;
    }
    if (interval.count() <= 0)
    {
        logDebug("manager", "health monitoring disabled for " + name);
        return;
    }
    const std::weak_ptr<Entry> weak = entry;
    entry->monitor                  = std::make_unique<PeriodicTask>("health:" + name,
                                                    interval,
                                                    [this, weak](const CancellationToken& token) {
                                                        runHealthCheck(weak, token);
                                                    });
}

void ServerManager::runHealthCheck(const std::weak_ptr<Entry>& weak, const CancellationToken& token)
{
    const auto entry = weak.lock();
    if (!entry)
    {
        return;
    }

    std::string                name;
    std::shared_ptr<LspClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entry->info.status != ServerStatus::Running)
        {
            return;
        }
        name   = entry->info.config.name;
        client = entry->client;
    }

    bool healthy = false;
    if (client)
    {
        try
        {
            healthy = options_.healthProbe(*client);
        } catch (const std::exception& ex)
        {
            logError("manager", "health check error for " + name + ": " + ex.what());
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry->info.lastHealthCheck = unixNow();
    }
    if (healthy)
    {
        return;
    }
    logWarning("manager", "health check failed for server " + name);

    // A concurrent stop holds the operation lock and cancels this monitor.
    std::unique_lock<std::timed_mutex> operation(entry->operation, std::defer_lock);
    while (!operation.try_lock_for(MonitorLockPoll))
    {
        if (token.isCancellationRequested())
        {
            return;
        }
    }
    if (token.isCancellationRequested())
    {
        return;
    }

    bool         canRestart = false;
    std::uint32_t attempts  = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entry->info.status != ServerStatus::Running)
        {
            return;
        }
        attempts   = entry->info.restartCount;
        canRestart = entry->info.config.autoRestart && attempts < entry->info.config.maxRestartAttempts;
    }

    if (canRestart)
    {
        logInfo("manager", llvm::formatv("auto-restarting unhealthy server {0} (attempt {1})", name, attempts + 1).str());
        restartLocked(*entry);
        return;
    }

    if (entry->monitor)
    {
        entry->monitor->stop();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry->info.errorMessage = "Health check failed";
    }
    setStatus(*entry, ServerStatus::Error);
    logError("manager", "server " + name + " failed its health check; monitoring stopped");
}

void ServerManager::setStatus(Entry& entry, const ServerStatus status)
{
    std::string  name;
    ServerStatus previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous           = entry.info.status;
        entry.info.status = status;
        name               = entry.info.config.name;
    }
    logDebug("manager", "server " + name + " status: " + serverStatusName(previous) + " -> " + serverStatusName(status));

    std::vector<std::pair<std::uint64_t, StatusListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = listeners_;
    }
    for (const auto& [_, listener] : listeners)
    {
        try
        {
            listener(name, status);
        } catch (const std::exception& ex)
        {
            logError("manager", std::string("error in status listener: ") + ex.what());
        } catch (...)
        {
            logError("manager", "error in status listener: unknown exception");
        }
    }
}

std::map<std::string, std::optional<bool>> ServerManager::startAll()
{
    std::vector<std::pair<std::string, bool>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : entries_)
        {
            targets.emplace_back(name, entry->info.config.autoStart);
        }
    }
    std::map<std::string, std::optional<bool>> results;
    for (const auto& [name, autoStart] : targets)
    {
        results[name] = autoStart ? std::optional<bool>(start(name)) : std::nullopt;
    }
    return results;
}

std::map<std::string, bool> ServerManager::stopAll()
{
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, _] : entries_)
        {
            names.push_back(name);
        }
    }
    std::map<std::string, bool> results;
    for (const auto& name : names)
    {
        results[name] = stop(name);
    }
    return results;
}

std::shared_ptr<ServerManager::Entry> ServerManager::find(const llvm::StringRef name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = entries_.find(name.str());
    return it == entries_.end() ? nullptr : it->second;
}

std::optional<ServerInfo> ServerManager::serverInfo(const llvm::StringRef name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = entries_.find(name.str());
    if (it == entries_.end())
    {
        return std::nullopt;
    }
    return it->second->info;
}

std::vector<ServerInfo> ServerManager::allServers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerInfo>     infos;
    for (const auto& [_, entry] : entries_)
    {
        infos.push_back(entry->info);
    }
    return infos;
}

std::vector<ServerInfo> ServerManager::runningServers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerInfo>     infos;
    for (const auto& [_, entry] : entries_)
    {
        if (entry->info.status == ServerStatus::Running)
        {
            infos.push_back(entry->info);
        }
    }
    return infos;
}

std::shared_ptr<LspClient> ServerManager::client(const llvm::StringRef name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = entries_.find(name.str());
    return it == entries_.end() ? nullptr : it->second->client;
}

std::uint64_t ServerManager::addStatusListener(StatusListener listener)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    const std::uint64_t         handle = nextListener_++;
    listeners_.emplace_back(handle, std::move(listener));
    return handle;
}

bool ServerManager::removeStatusListener(const std::uint64_t handle)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    return std::erase_if(listeners_, [handle](const auto& entry) { return entry.first == handle; }) != 0;
}

std::vector<std::string> ServerManager::defaultSearchPaths()
{
    std::vector<std::string> paths{"/usr/local/bin", "/usr/bin"};
    if (const char* home = std::getenv("HOME"); home && *home)
    {
        paths.push_back((std::filesystem::path(home) / ".local" / "bin").string());
        paths.push_back((std::filesystem::path(home) / "bin").string());
    }
    return paths;
}

std::vector<ServerConfig> ServerManager::discover(const std::vector<std::string>& searchPaths)
{
    const std::vector<std::string> paths = searchPaths.empty() ? defaultSearchPaths() : searchPaths;

    std::vector<ServerConfig> discovered;
    for (const auto& directory : paths)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec))
        {
            continue;
        }
        for (const char* executable : KnownExecutables)
        {
            const std::filesystem::path candidate = std::filesystem::path(directory) / executable;
            if (!std::filesystem::is_regular_file(candidate, ec) || ::access(candidate.c_str(), X_OK) != 0)
            {
                continue;
            }
            ServerConfig config;
            config.name    = std::string("discovered_") + executable;
            config.command = {candidate.string()};
            discovered.push_back(std::move(config));
            logDebug("manager", "discovered " + candidate.string());
        }
    }
    return discovered;
}

}  // namespace lspvisor
