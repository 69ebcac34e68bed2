//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language server client owning one transport and one protocol handler.
///
/// The client runs the inbound message loop and the heartbeat, performs the
/// initialize and shutdown handshakes, exposes the typed diagnostic
/// operations, and reconnects with exponential backoff after an unexpected
/// transport loss.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_CLIENT_LSP_CLIENT_H
#define LSPVISOR_CLIENT_LSP_CLIENT_H

#include "lspvisor/Client/ClientState.h"
#include "lspvisor/Protocol/Extensions.h"
#include "lspvisor/Protocol/Message.h"
#include "lspvisor/Protocol/ProtocolHandler.h"
#include "lspvisor/Retrieval/ErrorList.h"
#include "lspvisor/Retrieval/ErrorRetriever.h"
#include "lspvisor/Support/PeriodicTask.h"
#include "lspvisor/Support/Telemetry.h"
#include "lspvisor/Transport/Transport.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lspvisor
{

/// @brief Client construction options.
struct ClientOptions final
{
    /// @brief Channel parameters.
    TransportOptions transport;

    /// @brief Default bound on one request.
    std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};

    /// @brief Bound on the `shutdown` request during `disconnect`.
    std::chrono::milliseconds shutdownTimeout{std::chrono::seconds(5)};

    /// @brief Delay between `$/ping` notifications.
    std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(30)};

    /// @brief Automatic reconnect after transport loss.
    ReconnectPolicy reconnect;

    /// @brief Name and version reported in `initialize`.
    ClientIdentity identity;
};

/// @brief Listener receiving `true` on connect and `false` on disconnect or loss.
using ConnectionListener = std::function<void(bool connected)>;

/// @brief Handler observing every parsed inbound message.
using MessageHandler = std::function<void(const Message& message)>;

/// @brief Callback invoked once automatic reconnect gives up.
using ReconnectExhaustedCallback = std::function<void()>;

/// @brief Client of one language server.
///
/// Every public member is safe to call from any thread. Listener and handler
/// callbacks run on the client's worker threads; they must not block for long
/// and must not call `connect`, `disconnect` or `forceTerminate`.
class LspClient final
{
public:
    /// @brief Creates a disconnected client.
    /// @param[in] options Connection and timing options.
    /// @param[in] factory Creates a fresh transport for every connect attempt.
    explicit LspClient(ClientOptions options, TransportFactory factory = createTransport);

    /// @brief Disconnects and joins every worker.
    ~LspClient();

    LspClient(const LspClient&)            = delete;
    LspClient& operator=(const LspClient&) = delete;

    /// @brief Opens the channel and performs the initialize handshake.
    ///
    /// On failure every acquired resource is released and the client is back
    /// in `ClientState::Disconnected`.
    [[nodiscard]] llvm::Error connect();

    /// @brief Runs the shutdown handshake when ready, then releases everything. Idempotent.
    void disconnect();

    /// @brief Sends `shutdown`, waits up to `timeout`, then sends `exit`.
    ///
    /// The channel stays open; `disconnect` or `forceTerminate` releases it.
    ///
    /// @return `true` when the server answered `shutdown` in time.
    bool shutdown(std::chrono::milliseconds timeout);

    /// @brief Terminates the server without a handshake and releases everything.
    /// @param[in] grace Delay between SIGTERM and SIGKILL for stdio servers.
    /// @return `true` when the server exited within the grace period.
    bool forceTerminate(std::chrono::milliseconds grace);

    /// @brief Interrupts an in-flight `connect` from another thread.
    void abort();

    /// @brief Runs the whole-workspace diagnostic query.
    /// @return Findings (empty when the query fails), or an error when the
    ///         client is not ready or the server refuses extension methods.
    [[nodiscard]] llvm::Expected<ComprehensiveErrorList> getComprehensiveErrors(const ComprehensiveQuery& query = {});

    /// @brief Runs the single-file diagnostic query.
    [[nodiscard]] llvm::Expected<std::vector<CodeError>> getFileErrors(llvm::StringRef filePath);

    /// @brief Runs a bulk codebase analysis.
    [[nodiscard]] llvm::Expected<ComprehensiveErrorList> analyzeCodebase(llvm::StringRef                 rootPath,
                                                                         const std::vector<std::string>& includePatterns = {},
                                                                         const std::vector<std::string>& excludePatterns = {});

    /// @brief Asks the server to analyze one file, optionally with unsaved content.
    /// @return Raw analysis result.
    [[nodiscard]] llvm::Expected<llvm::json::Value> analyzeFile(llvm::StringRef                   filePath,
                                                                const std::optional<std::string>& content = std::nullopt);

    /// @brief Asks the server to refresh its analysis.
    /// @return `true` when the server acknowledged the refresh, `false` when the request failed.
    [[nodiscard]] llvm::Expected<bool> refreshAnalysis();

    /// @brief Sends an arbitrary request while ready.
    /// @param[in] timeout Overrides the default request timeout.
    [[nodiscard]] llvm::Expected<llvm::json::Value> sendRequest(llvm::StringRef                          method,
                                                                std::optional<llvm::json::Value>         params  = std::nullopt,
                                                                std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @brief Sends an arbitrary notification while ready.
    [[nodiscard]] llvm::Error sendNotification(llvm::StringRef method, std::optional<llvm::json::Value> params = std::nullopt);

    /// @brief Registers a listener for retrieved and pushed findings.
    std::uint64_t addErrorListener(ErrorListener listener);
    bool          removeErrorListener(std::uint64_t handle);

    /// @brief Registers a connection-state listener.
    std::uint64_t addConnectionListener(ConnectionListener listener);
    bool          removeConnectionListener(std::uint64_t handle);

    /// @brief Registers a raw inbound message handler.
    std::uint64_t addMessageHandler(MessageHandler handler);
    bool          removeMessageHandler(std::uint64_t handle);

    /// @brief Sets the callback invoked when automatic reconnect gives up.
    void setReconnectExhaustedCallback(ReconnectExhaustedCallback callback);

    [[nodiscard]] ClientState state() const;

    /// @brief Returns whether the client is ready for operations.
    [[nodiscard]] bool isConnected() const;

    /// @brief Returns the capability map reported by the server, empty before the handshake.
    [[nodiscard]] llvm::json::Object serverCapabilities() const;

    /// @brief Returns the server process id for stdio connections.
    [[nodiscard]] std::optional<int> processId() const;

    /// @brief Returns whether the channel is open and the server process alive.
    [[nodiscard]] bool isTransportAlive() const;

    [[nodiscard]] ConnectionKind connectionKind() const
    {
        return options_.transport.kind;
    }

    [[nodiscard]] const ClientOptions& options() const
    {
        return options_;
    }

    [[nodiscard]] ErrorRetriever& errorRetriever()
    {
        return retriever_;
    }

    [[nodiscard]] ProtocolHandler& protocol()
    {
        return protocol_;
    }

    [[nodiscard]] Telemetry& telemetry()
    {
        return telemetry_;
    }

private:
    [[nodiscard]] llvm::Error                      connectLocked();
    [[nodiscard]] llvm::Expected<llvm::json::Value> call(llvm::StringRef                  method,
                                                         std::optional<llvm::json::Value> params,
                                                         std::chrono::milliseconds        timeout);
    [[nodiscard]] llvm::Error                      notify(llvm::StringRef method, std::optional<llvm::json::Value> params);
    [[nodiscard]] llvm::Expected<std::optional<std::string>> write(const Message& message);
    [[nodiscard]] llvm::Error                      requireReady(bool needsExtensions) const;
    [[nodiscard]] std::shared_ptr<Transport>       currentTransport() const;

    struct Release final
    {
        bool wasReady{false};
        bool exitedInGrace{true};
    };

    bool    handshakeShutdown(std::chrono::milliseconds timeout);
    Release releaseLocked(llvm::StringRef reason, std::optional<std::chrono::milliseconds> terminateGrace);
    void runMessageLoop(std::shared_ptr<Transport> transport);
    void processPayload(llvm::StringRef payload);
    void heartbeatTick();
    void reportTransportLoss(llvm::StringRef reason);
    void runRecovery(std::shared_ptr<CancellationSource> cancel);
    void stopRecovery();
    void applyEvent(ClientEvent event);
    void notifyConnectionListeners(bool connected);

    ClientOptions    options_;
    TransportFactory factory_;
    ProtocolHandler  protocol_;
    ErrorRetriever   retriever_;
    Telemetry        telemetry_;

    std::mutex                    lifecycleMutex_;
    mutable std::mutex            stateMutex_;
    ClientState                   state_{ClientState::Disconnected};
    llvm::json::Object            serverCapabilities_;
    std::shared_ptr<Transport>    transport_;
    std::thread                   loopThread_;
    std::unique_ptr<PeriodicTask> heartbeat_;
    std::atomic<bool>             stopping_{false};
    std::atomic<bool>             aborted_{false};
    bool                          lossHandling_{false};

    std::mutex                          recoveryMutex_;
    std::thread                         recoveryThread_;
    std::shared_ptr<CancellationSource> recoveryCancel_;
    ReconnectExhaustedCallback          exhaustedCallback_;

    std::mutex                                                listenerMutex_;
    std::uint64_t                                             nextListener_{1};
    std::vector<std::pair<std::uint64_t, ConnectionListener>> connectionListeners_;
    std::vector<std::pair<std::uint64_t, MessageHandler>>     messageHandlers_;
};

}  // namespace lspvisor

#endif  // LSPVISOR_CLIENT_LSP_CLIENT_H
