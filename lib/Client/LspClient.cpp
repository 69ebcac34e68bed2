//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the language server client, its workers, and reconnect logic.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Client/LspClient.h"

#include "lspvisor/Support/Error.h"
#include "lspvisor/Support/Logging.h"
#include "lspvisor/Version.h"

#include "llvm/Support/FormatVariadic.h"

#include <exception>
#include <future>
#include <utility>

namespace lspvisor
{
namespace
{

std::uint64_t microsSince(const std::chrono::steady_clock::time_point start)
{
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count());
}

template <typename Callback, typename... Args>
void invokeIsolated(llvm::StringRef what, const Callback& callback, Args&&... args)
{
    try
    {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& ex)
    {
        logError("client", what + " threw: " + ex.what());
    } catch (...)
    {
        logError("client", what + " threw an unknown exception");
    }
}

}  // namespace

LspClient::LspClient(ClientOptions options, TransportFactory factory)
    : options_(std::move(options))
    , factory_(std::move(factory))
    , retriever_([this](llvm::StringRef method, llvm::json::Value params) {
        return call(method, std::move(params), options_.requestTimeout);
    })
{
    if (options_.identity.version.empty())
    {
        options_.identity.version = kVersionString;
    }
    const auto ingest = [this](const llvm::json::Value& params) { retriever_.handleDiagnosticsNotification(params); };
    protocol_.registerNotificationHandler(methods::ErrorUpdated, ingest);
    protocol_.registerNotificationHandler(methods::PublishDiagnostics, ingest);
}

LspClient::~LspClient()
{
    disconnect();
}

llvm::Error LspClient::connect()
{
    std::unique_lock<std::mutex> lock(lifecycleMutex_);
    if (auto err = connectLocked())
    {
        return err;
    }
    lock.unlock();
    notifyConnectionListeners(true);
    return llvm::Error::success();
}

llvm::Error LspClient::connectLocked()
{
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ != ClientState::Disconnected)
        {
            return makeConnectionError("client is already " + clientStateName(state_));
        }
    }
    if (aborted_.exchange(false))
    {
        return makeConnectionError("connect aborted");
    }

    const ConnectionKind       kind = options_.transport.kind;
    std::shared_ptr<Transport> transport(factory_(options_.transport));
    if (!transport)
    {
        return makeConnectionError("no transport available for " + connectionKindName(kind));
    }
    if (auto err = transport->connect())
    {
        return err;
    }

    stopping_ = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        transport_    = transport;
        lossHandling_ = false;
    }
    applyEvent(ClientEvent::ChannelOpened);
    logInfo("client", "channel open over " + connectionKindName(kind));

    if (hasInboundStream(kind))
    {
        loopThread_ = std::thread(&LspClient::runMessageLoop, this, transport);
    }

    const auto failed = [this](llvm::Error error) -> llvm::Error {
        applyEvent(ClientEvent::HandshakeFailed);
        releaseLocked("initialize failed", std::nullopt);
        aborted_ = false;
        return error;
    };
    if (aborted_)
    {
        return failed(makeConnectionError("connect aborted"));
    }

    auto initialized = call(methods::Initialize,
                            llvm::json::Value(initializeParams(options_.identity)),
                            options_.requestTimeout);
    if (!initialized)
    {
        return failed(initialized.takeError());
    }
    if (aborted_)
    {
        return failed(makeConnectionError("connect aborted"));
    }

    llvm::json::Object capabilities;
    if (const auto* result = initialized->getAsObject())
    {
        if (const auto* reported = result->getObject("capabilities"))
        {
            capabilities = *reported;
        }
    }

    if (auto err = notify(methods::Initialized, llvm::json::Value(llvm::json::Object{})))
    {
        return failed(std::move(err));
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        serverCapabilities_ = std::move(capabilities);
    }
    applyEvent(ClientEvent::HandshakeSucceeded);

    if (hasInboundStream(kind) && options_.heartbeatInterval.count() > 0)
    {
        heartbeat_ = std::make_unique<PeriodicTask>("heartbeat",
                                                    options_.heartbeatInterval,
                                                    [this](const CancellationToken&) { heartbeatTick(); });
    }
    logInfo("client", "initialize handshake complete");
    return llvm::Error::success();
}

void LspClient::disconnect()
{
    stopRecovery();
    Release released;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        handshakeShutdown(options_.shutdownTimeout);
        released = releaseLocked("client disconnected", std::nullopt);
    }
    // A loss reported while the handshake ran may have scheduled a recovery.
    stopRecovery();
    if (released.wasReady)
    {
        notifyConnectionListeners(false);
    }
}

bool LspClient::shutdown(const std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return handshakeShutdown(timeout);
}

bool LspClient::forceTerminate(const std::chrono::milliseconds grace)
{
    stopRecovery();
    Release released;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        released = releaseLocked("server terminated", grace);
    }
    stopRecovery();
    if (released.wasReady)
    {
        notifyConnectionListeners(false);
    }
    return released.exitedInGrace;
}

void LspClient::abort()
{
    aborted_ = true;
    if (const auto transport = currentTransport())
    {
        transport->interrupt();
    }
    protocol_.failAllPending("connection aborted");
}

bool LspClient::handshakeShutdown(const std::chrono::milliseconds timeout)
{
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ != ClientState::Ready)
        {
            return false;
        }
    }
    applyEvent(ClientEvent::DisconnectRequested);

    auto answered = call(methods::Shutdown, std::nullopt, timeout);
    if (!answered)
    {
        logWarning("client", "shutdown handshake failed: " + llvm::toString(answered.takeError()));
        return false;
    }
    if (auto err = notify(methods::Exit, std::nullopt))
    {
        logWarning("client", "exit notification failed: " + llvm::toString(std::move(err)));
    }
    return true;
}

LspClient::Release LspClient::releaseLocked(const llvm::StringRef                          reason,
                                            const std::optional<std::chrono::milliseconds> terminateGrace)
{
    Release                    released;
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        transport          = std::move(transport_);
        transport_         = nullptr;
        released.wasReady  = state_ == ClientState::Ready || state_ == ClientState::ShuttingDown;
    }

    // Workers stop before the channel closes so none of them touches a released transport.
    stopping_ = true;
    if (heartbeat_)
    {
        heartbeat_->stop();
        heartbeat_.reset();
    }
    if (transport)
    {
        transport->interrupt();
    }
    if (loopThread_.joinable())
    {
        if (loopThread_.get_id() == std::this_thread::get_id())
        {
            loopThread_.detach();
        }
        else
        {
            loopThread_.join();
        }
    }

    if (transport)
    {
        if (terminateGrace)
        {
            released.exitedInGrace = transport->terminate(*terminateGrace);
        }
        else
        {
            transport->disconnect();
        }
        logInfo("client", "channel released: " + reason);
    }

    protocol_.failAllPending(reason);
    applyEvent(ClientEvent::ChannelClosed);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        serverCapabilities_.clear();
        lossHandling_ = false;
    }
    return released;
}

void LspClient::runMessageLoop(std::shared_ptr<Transport> transport)
{
    for (;;)
    {
        auto payload = transport->receive();
        if (!payload)
        {
            const std::string reason = llvm::toString(payload.takeError());
            if (!stopping_)
            {
                protocol_.failAllPending(reason);
                reportTransportLoss(reason);
            }
            return;
        }
        if (!*payload)
        {
            if (!stopping_)
            {
                protocol_.failAllPending("server closed the connection");
                reportTransportLoss("server closed the connection");
            }
            return;
        }
        processPayload(**payload);
    }
}

void LspClient::processPayload(const llvm::StringRef payload)
{
    auto message = parseMessageText(payload);
    if (!message)
    {
        logWarning("client", "dropping malformed message: " + llvm::toString(message.takeError()));
        return;
    }

    if (auto reply = protocol_.handleMessage(*message))
    {
        auto sent = write(Message(std::move(*reply)));
        if (!sent)
        {
            logWarning("client", "failed to answer server request: " + llvm::toString(sent.takeError()));
        }
    }

    std::vector<std::pair<std::uint64_t, MessageHandler>> handlers;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        handlers = messageHandlers_;
    }
    for (const auto& [_, handler] : handlers)
    {
        invokeIsolated("message handler", handler, *message);
    }
}

void LspClient::heartbeatTick()
{
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ != ClientState::Ready)
        {
            return;
        }
    }
    if (auto err = notify(methods::Ping, std::nullopt))
    {
        const std::string reason = "heartbeat failed: " + llvm::toString(std::move(err));
        logWarning("client", reason);
        reportTransportLoss(reason);
    }
}

void LspClient::reportTransportLoss(const llvm::StringRef reason)
{
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (stopping_ || lossHandling_ || state_ != ClientState::Ready)
        {
            return;
        }
        lossHandling_ = true;
    }
    logWarning("client", "transport lost: " + reason);
    applyEvent(ClientEvent::TransportLost);
    protocol_.failAllPending(reason);
    notifyConnectionListeners(false);

    std::lock_guard<std::mutex> lock(recoveryMutex_);
    if (recoveryThread_.joinable())
    {
        if (recoveryThread_.get_id() == std::this_thread::get_id())
        {
            recoveryThread_.detach();
        }
        else
        {
            recoveryThread_.join();
        }
    }
    recoveryCancel_ = std::make_shared<CancellationSource>();
    recoveryThread_ = std::thread(&LspClient::runRecovery, this, recoveryCancel_);
}

void LspClient::runRecovery(std::shared_ptr<CancellationSource> cancel)
{
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        releaseLocked("transport lost", std::nullopt);
    }

    const ReconnectPolicy& policy = options_.reconnect;
    if (!policy.enabled)
    {
        logInfo("client", "automatic reconnect is disabled; staying disconnected");
        return;
    }
    const CancellationToken token = cancel->token();
    std::uint32_t           attempt = 0;
    for (; policy.allows(attempt); ++attempt)
    {
        const auto delay = policy.backoff(attempt);
        logInfo("client",
                llvm::formatv("reconnect attempt {0} of {1} in {2} ms", attempt + 1, policy.maxAttempts, delay.count())
                    .str());
        if (token.waitFor(delay))
        {
            return;
        }
        auto err = connect();
        if (!err)
        {
            logInfo("client", "reconnected");
            return;
        }
        logWarning("client", "reconnect attempt failed: " + llvm::toString(std::move(err)));
    }
    if (token.isCancellationRequested())
    {
        return;
    }

    logError("client", llvm::formatv("giving up after {0} reconnect attempts", attempt).str());
    ReconnectExhaustedCallback callback;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        callback = exhaustedCallback_;
    }
    if (callback)
    {
        invokeIsolated("reconnect-exhausted callback", callback);
    }
}

void LspClient::stopRecovery()
{
    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(recoveryMutex_);
        if (recoveryCancel_)
        {
            recoveryCancel_->cancel();
        }
        thread = std::move(recoveryThread_);
    }
    if (!thread.joinable())
    {
        return;
    }
    if (thread.get_id() == std::this_thread::get_id())
    {
        thread.detach();
    }
    else
    {
        thread.join();
    }
}

llvm::Expected<llvm::json::Value> LspClient::call(const llvm::StringRef                  method,
                                                  std::optional<llvm::json::Value>       params,
                                                  const std::chrono::milliseconds        timeout)
{
    const Request     request = protocol_.createRequest(method, std::move(params));
    const std::string key     = idKey(request.id);
    auto              pending = protocol_.trackRequest(request);
    if (!pending)
    {
        return pending.takeError();
    }

    const auto start = std::chrono::steady_clock::now();
    auto       sent  = write(request);
    if (!sent)
    {
        protocol_.cancelRequest(key);
        telemetry_.record(method.str(), microsSince(start), RequestOutcome::Failed);
        const std::string reason = llvm::toString(sent.takeError());
        reportTransportLoss(reason);
        return makeConnectionError(method + " could not be sent: " + reason);
    }
    if (*sent)
    {
        // Request-per-call channels return the response from the write itself.
        auto reply = parseMessageText(**sent);
        if (!reply)
        {
            protocol_.cancelRequest(key);
            telemetry_.record(method.str(), microsSince(start), RequestOutcome::Failed);
            return reply.takeError();
        }
        if (protocol_.handleMessage(*reply))
        {
            logDebug("client", "server request over a request-per-call channel left unanswered");
        }
    }

    if (pending->wait_for(timeout) != std::future_status::ready && protocol_.cancelRequest(key))
    {
        telemetry_.record(method.str(), microsSince(start), RequestOutcome::TimedOut);
        logWarning("client", llvm::formatv("{0} timed out after {1} ms", method, timeout.count()).str());
        return makeTimeoutError(llvm::formatv("request {0} timed out after {1} ms", method, timeout.count()).str());
    }

    CallOutcome outcome = pending->get();
    switch (outcome.status)
    {
    case CallOutcome::Status::Result:
        telemetry_.record(method.str(), microsSince(start), RequestOutcome::Answered);
        return std::move(outcome.result);
    case CallOutcome::Status::ServerError:
        telemetry_.record(method.str(), microsSince(start), RequestOutcome::Answered);
        return makeProtocolError(method + ": " + outcome.error.message, outcome.error.code);
    case CallOutcome::Status::ConnectionLost:
        break;
    }
    telemetry_.record(method.str(), microsSince(start), RequestOutcome::Failed);
    return makeConnectionError(method + " failed: " + outcome.reason);
}

llvm::Error LspClient::notify(const llvm::StringRef method, std::optional<llvm::json::Value> params)
{
    auto sent = write(protocol_.createNotification(method, std::move(params)));
    if (!sent)
    {
        return sent.takeError();
    }
    return llvm::Error::success();
}

llvm::Expected<std::optional<std::string>> LspClient::write(const Message& message)
{
    const auto transport = currentTransport();
    if (!transport)
    {
        return makeConnectionError("not connected to language server");
    }
    return transport->send(serializeMessage(message));
}

llvm::Error LspClient::requireReady(const bool needsExtensions) const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ != ClientState::Ready)
    {
        return makeConnectionError("not connected to language server (state " + clientStateName(state_) + ")");
    }
    if (needsExtensions && !supportsExtensions(serverCapabilities_))
    {
        return makeProtocolError("server does not support extension methods");
    }
    return llvm::Error::success();
}

std::shared_ptr<Transport> LspClient::currentTransport() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return transport_;
}

llvm::Expected<ComprehensiveErrorList> LspClient::getComprehensiveErrors(const ComprehensiveQuery& query)
{
    if (auto err = requireReady(true))
    {
        return std::move(err);
    }
    return retriever_.getComprehensiveErrors(query);
}

llvm::Expected<std::vector<CodeError>> LspClient::getFileErrors(const llvm::StringRef filePath)
{
    if (auto err = requireReady(true))
    {
        return std::move(err);
    }
    return retriever_.getFileErrors(filePath);
}

llvm::Expected<ComprehensiveErrorList> LspClient::analyzeCodebase(const llvm::StringRef           rootPath,
                                                                  const std::vector<std::string>& includePatterns,
                                                                  const std::vector<std::string>& excludePatterns)
{
    if (auto err = requireReady(true))
    {
        return std::move(err);
    }
    return retriever_.analyzeCodebase(rootPath, includePatterns, excludePatterns);
}

llvm::Expected<llvm::json::Value> LspClient::analyzeFile(const llvm::StringRef             filePath,
                                                         const std::optional<std::string>& content)
{
    if (auto err = requireReady(true))
    {
        return std::move(err);
    }
    return call(methods::AnalyzeFile,
                llvm::json::Value(analyzeFileParams(filePath, content)),
                options_.requestTimeout);
}

llvm::Expected<bool> LspClient::refreshAnalysis()
{
    if (auto err = requireReady(true))
    {
        return std::move(err);
    }
    auto result = call(methods::RefreshAnalysis, llvm::json::Value(llvm::json::Object{}), options_.requestTimeout);
    if (!result)
    {
        logError("client", "refresh analysis failed: " + llvm::toString(result.takeError()));
        return false;
    }
    return true;
}

llvm::Expected<llvm::json::Value> LspClient::sendRequest(const llvm::StringRef                          method,
                                                         std::optional<llvm::json::Value>               params,
                                                         const std::optional<std::chrono::milliseconds> timeout)
{
    if (auto err = requireReady(false))
    {
        return std::move(err);
    }
    return call(method, std::move(params), timeout.value_or(options_.requestTimeout));
}

llvm::Error LspClient::sendNotification(const llvm::StringRef method, std::optional<llvm::json::Value> params)
{
    if (auto err = requireReady(false))
    {
        return err;
    }
    return notify(method, std::move(params));
}

std::uint64_t LspClient::addErrorListener(ErrorListener listener)
{
    return retriever_.addErrorListener(std::move(listener));
}

bool LspClient::removeErrorListener(const std::uint64_t handle)
{
    return retriever_.removeErrorListener(handle);
}

std::uint64_t LspClient::addConnectionListener(ConnectionListener listener)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    const std::uint64_t         handle = nextListener_++;
    connectionListeners_.emplace_back(handle, std::move(listener));
    return handle;
}

bool LspClient::removeConnectionListener(const std::uint64_t handle)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    const auto                  erased = std::erase_if(connectionListeners_, [handle](const auto& entry) {
        return entry.first == handle;
    });
    return erased != 0;
}

std::uint64_t LspClient::addMessageHandler(MessageHandler handler)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    const std::uint64_t         handle = nextListener_++;
    messageHandlers_.emplace_back(handle, std::move(handler));
    return handle;
}

bool LspClient::removeMessageHandler(const std::uint64_t handle)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    const auto erased = std::erase_if(messageHandlers_, [handle](const auto& entry) { return entry.first == handle; });
    return erased != 0;
}

void LspClient::setReconnectExhaustedCallback(ReconnectExhaustedCallback callback)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    exhaustedCallback_ = std::move(callback);
}

void LspClient::notifyConnectionListeners(const bool connected)
{
    std::vector<std::pair<std::uint64_t, ConnectionListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = connectionListeners_;
    }
    for (const auto& [_, listener] : listeners)
    {
        invokeIsolated("connection listener", listener, connected);
    }
}

void LspClient::applyEvent(const ClientEvent event)
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    const auto                  next = transition(state_, event);
    if (!next)
    {
        logDebug("client", "lifecycle event ignored in state " + clientStateName(state_));
        return;
    }
    if (*next != state_)
    {
        logDebug("client", clientStateName(state_) + " -> " + clientStateName(*next));
    }
    state_ = *next;
}

ClientState LspClient::state() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

bool LspClient::isConnected() const
{
    return state() == ClientState::Ready;
}

llvm::json::Object LspClient::serverCapabilities() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return serverCapabilities_;
}

std::optional<int> LspClient::processId() const
{
    const auto transport = currentTransport();
    return transport ? transport->processId() : std::nullopt;
}

bool LspClient::isTransportAlive() const
{
    const auto transport = currentTransport();
    return transport && transport->isAlive();
}

}  // namespace lspvisor
