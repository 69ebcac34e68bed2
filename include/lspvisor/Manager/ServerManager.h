//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Registry and lifecycle supervision of named language servers.
///
/// Each registered server owns at most one client while starting or running
/// and at most one health monitor while running. Lifecycle operations on one
/// server are serialized; operations on different servers run independently.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_MANAGER_SERVER_MANAGER_H
#define LSPVISOR_MANAGER_SERVER_MANAGER_H

#include "lspvisor/Client/LspClient.h"
#include "lspvisor/Manager/ConfigStore.h"
#include "lspvisor/Manager/ServerConfig.h"
#include "lspvisor/Support/PeriodicTask.h"

#include "llvm/ADT/StringRef.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lspvisor
{

/// @brief Listener receiving every status change as `(name, status)`.
using StatusListener = std::function<void(llvm::StringRef name, ServerStatus status)>;

/// @brief Creates the client of a server being started.
using ClientFactory = std::function<std::shared_ptr<LspClient>(const ServerConfig& config)>;

/// @brief Liveness probe of a running server's client.
using HealthProbe = std::function<bool(LspClient& client)>;

/// @brief Manager construction options.
struct ManagerOptions final
{
    /// @brief Configuration directory; empty selects `ConfigStore::defaultDirectory()`.
    std::string configDirectory;

    /// @brief Whether registrations are loaded from and written to the directory.
    bool persist{true};

    /// @brief Client factory; empty selects `defaultClientFactory`.
    ClientFactory clientFactory;

    /// @brief Health probe; empty selects `defaultHealthProbe`.
    HealthProbe healthProbe;

    /// @brief Delay between SIGTERM and SIGKILL when a server is force-stopped.
    std::chrono::milliseconds forceKillGrace{std::chrono::seconds(5)};

    /// @brief Pause between the stop and start halves of a restart.
    std::chrono::milliseconds restartDelay{std::chrono::seconds(2)};
};

/// @brief Creates a client for the configured channel with automatic reconnect
///        disabled, since the health monitor owns recovery of managed servers.
[[nodiscard]] std::shared_ptr<LspClient> defaultClientFactory(const ServerConfig& config);

/// @brief Healthy when the client is ready and its channel and process are alive.
[[nodiscard]] bool defaultHealthProbe(LspClient& client);

/// @brief Owns the registry of managed servers.
///
/// Status listeners run on the thread performing the transition and must not
/// call lifecycle operations of the same server.
class ServerManager final
{
public:
    explicit ServerManager(ManagerOptions options = {});

    /// @brief Stops every server.
    ~ServerManager();

    ServerManager(const ServerManager&)            = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Registers or replaces a configuration and persists it.
    /// @return `false` when the name is in use by a server that is not stopped,
    ///         or the record cannot be written.
    bool registerServer(ServerConfig config);

    /// @brief Stops the server if needed and deletes its record.
    /// @return `false` for unknown names.
    bool unregisterServer(llvm::StringRef name);

    /// @brief Starts a server, bounded by its startup timeout.
    ///
    /// Resets the restart count. On failure the status becomes
    /// `ServerStatus::Error` with the reason in the error message.
    bool start(llvm::StringRef name);

    /// @brief Stops a server: shutdown handshake, then forceful termination on timeout.
    bool stop(llvm::StringRef name);

    /// @brief Stops then starts a server and increments its restart count.
    bool restart(llvm::StringRef name);

    /// @brief Starts every server with `autoStart`; others map to `std::nullopt`.
    std::map<std::string, std::optional<bool>> startAll();

    /// @brief Stops every server.
    std::map<std::string, bool> stopAll();

    [[nodiscard]] std::optional<ServerInfo> serverInfo(llvm::StringRef name) const;
    [[nodiscard]] std::vector<ServerInfo>   allServers() const;
    [[nodiscard]] std::vector<ServerInfo>   runningServers() const;

    /// @brief Returns the client of a starting or running server.
    [[nodiscard]] std::shared_ptr<LspClient> client(llvm::StringRef name) const;

    std::uint64_t addStatusListener(StatusListener listener);
    bool          removeStatusListener(std::uint64_t handle);

    /// @brief Finds server executables. Candidates are returned, never registered.
    /// @param[in] searchPaths Directories to scan; empty selects `defaultSearchPaths()`.
    [[nodiscard]] static std::vector<ServerConfig> discover(const std::vector<std::string>& searchPaths = {});

    /// @brief Returns `/usr/local/bin`, `/usr/bin`, `~/.local/bin`, `~/bin`.
    [[nodiscard]] static std::vector<std::string> defaultSearchPaths();

    [[nodiscard]] const ConfigStore& configStore() const
    {
        return store_;
    }

private:
    struct Entry;

    [[nodiscard]] std::shared_ptr<Entry> find(llvm::StringRef name) const;

    bool startLocked(Entry& entry, bool resetRestartCount);
    bool stopLocked(Entry& entry);
    bool restartLocked(Entry& entry);
    bool failStart(Entry& entry, const std::string& reason);
    void startMonitor(const std::shared_ptr<Entry>& entry);
    void runHealthCheck(const std::weak_ptr<Entry>& weak, const CancellationToken& token);
    void setStatus(Entry& entry, ServerStatus status);

    ManagerOptions options_;
    ConfigStore    store_;

    mutable std::mutex                             mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;

    std::mutex                                            listenerMutex_;
    std::uint64_t                                         nextListener_{1};
    std::vector<std::pair<std::uint64_t, StatusListener>> listeners_;
};

}  // namespace lspvisor

#endif  // LSPVISOR_MANAGER_SERVER_MANAGER_H
