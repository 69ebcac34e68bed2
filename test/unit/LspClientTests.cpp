//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Drives the client through handshakes, queries, pushes, timeouts and
/// reconnects against the scripted in-process language server.
///
//===----------------------------------------------------------------------===//

#include "FakeLanguageServer.h"

#include "lspvisor/Client/LspClient.h"
#include "lspvisor/Protocol/Extensions.h"
#include "lspvisor/Support/Error.h"
#include "lspvisor/Support/Logging.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

using lspvisor::test::FakeLanguageServer;

/// Polls `predicate` until it holds or `timeout` elapses.
bool eventually(const std::function<bool()>& predicate,
                std::chrono::milliseconds    timeout = std::chrono::milliseconds(2000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

/// Connection events observed by a listener, guarded for the worker threads.
struct ConnectionLog
{
    mutable std::mutex mutex;
    std::vector<bool>  events;

    lspvisor::ConnectionListener bind()
    {
        return [this](bool connected) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(connected);
        };
    }

    std::vector<bool> snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};

lspvisor::ClientOptions quickOptions()
{
    lspvisor::ClientOptions options;
    options.requestTimeout      = std::chrono::milliseconds(2000);
    options.shutdownTimeout     = std::chrono::milliseconds(200);
    options.heartbeatInterval   = std::chrono::milliseconds(0);
    options.reconnect.enabled   = false;
    options.reconnect.baseDelay = std::chrono::milliseconds(10);
    options.reconnect.maxDelay  = std::chrono::milliseconds(40);
    return options;
}

llvm::json::Value diagnostic(int line, int character, const char* message)
{
    return llvm::json::Object{
        {"range", llvm::json::Object{{"start", llvm::json::Object{{"line", line}, {"character", character}}}}},
        {"severity", 1},
        {"message", message},
    };
}

bool expectKind(llvm::Error error, lspvisor::ErrorKind expected, const char* what)
{
    const auto consumed = lspvisor::classifyError(std::move(error));
    if (consumed.kind != expected)
    {
        std::cerr << what << ": unexpected error kind, message: " << consumed.message << "\n";
        return false;
    }
    return true;
}

bool connectOrReport(lspvisor::LspClient& client)
{
    if (auto err = client.connect())
    {
        std::cerr << "connect failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    return true;
}

bool runHandshakeTests()
{
    ConnectionLog       log;
    const auto          server = FakeLanguageServer::create();
    lspvisor::LspClient client(quickOptions(), server->factory());
    client.addConnectionListener(log.bind());

    if (!connectOrReport(client))
    {
        return false;
    }
    const std::vector<std::string> methods = server->receivedMethods();
    if (methods.size() < 2U || methods[0] != lspvisor::methods::Initialize ||
        methods[1] != lspvisor::methods::Initialized)
    {
        std::cerr << "handshake must send initialize then initialized\n";
        return false;
    }
    const auto initParams = server->lastParams(lspvisor::methods::Initialize);
    const auto* initObject = initParams ? initParams->getAsObject() : nullptr;
    if (!initObject || !initObject->getObject("clientInfo"))
    {
        std::cerr << "initialize must carry client info\n";
        return false;
    }
    if (client.state() != lspvisor::ClientState::Ready || !client.isConnected() || client.processId() != 4242)
    {
        std::cerr << "client must be ready after the handshake\n";
        return false;
    }
    if (!eventually([&] { return log.snapshot() == std::vector<bool>{true}; }))
    {
        std::cerr << "connection listener must see the connect\n";
        return false;
    }

    // A second connect while ready is refused.
    if (!expectKind(client.connect(), lspvisor::ErrorKind::Connection, "double connect"))
    {
        return false;
    }

    client.disconnect();
    if (server->countReceived(lspvisor::methods::Shutdown) != 1U || server->countReceived(lspvisor::methods::Exit) != 1U)
    {
        std::cerr << "disconnect must send shutdown and exit\n";
        return false;
    }
    if (client.state() != lspvisor::ClientState::Disconnected || client.processId())
    {
        std::cerr << "client must be disconnected after disconnect\n";
        return false;
    }
    client.disconnect();
    if (log.snapshot() != std::vector<bool>{true, false} || server->countReceived(lspvisor::methods::Shutdown) != 1U)
    {
        std::cerr << "disconnect must be idempotent and notify once\n";
        return false;
    }

    // A refused channel leaves the client disconnected.
    server->setConnectFailure(true);
    if (!expectKind(client.connect(), lspvisor::ErrorKind::Connection, "refused connect") ||
        client.state() != lspvisor::ClientState::Disconnected)
    {
        return false;
    }

    // A failing initialize releases the channel.
    server->setConnectFailure(false);
    server->failWith(lspvisor::methods::Initialize, -32603, "boom");
    const std::size_t disconnects = server->disconnectCount();
    if (!expectKind(client.connect(), lspvisor::ErrorKind::Protocol, "failed initialize") ||
        client.state() != lspvisor::ClientState::Disconnected || server->disconnectCount() != disconnects + 1U)
    {
        std::cerr << "failed handshake must release the channel\n";
        return false;
    }
    return true;
}

bool runQueryTests()
{
    const auto          server = FakeLanguageServer::create();
    lspvisor::LspClient client(quickOptions(), server->factory());

    server->respond(lspvisor::methods::GetComprehensiveErrors, [](const lspvisor::Request&) {
        return std::optional<llvm::json::Value>(llvm::json::Object{
            {"diagnostics",
             llvm::json::Object{{"file:///w/a.py", llvm::json::Array{diagnostic(0, 0, "bad"), diagnostic(1, 0, "worse")}}}},
        });
    });
    server->respond(lspvisor::methods::GetErrors, [](const lspvisor::Request&) {
        return std::optional<llvm::json::Value>(
            llvm::json::Object{{"diagnostics", llvm::json::Array{diagnostic(3, 4, "undefined name")}}});
    });
    server->failWith(lspvisor::methods::AnalyzeFile, -32001, "analysis crashed");
    server->silence("custom/slow");

    // Nothing works before connect.
    auto early = client.getFileErrors("/w/a.py");
    if (early || !expectKind(early.takeError(), lspvisor::ErrorKind::Connection, "query before connect"))
    {
        std::cerr << "queries before connect must fail with a connection error\n";
        return false;
    }

    if (!connectOrReport(client))
    {
        return false;
    }

    auto all = client.getComprehensiveErrors();
    if (!all || all->totalCount() != 2U)
    {
        if (!all)
        {
            llvm::consumeError(all.takeError());
        }
        std::cerr << "expected two findings from the bulk query\n";
        return false;
    }

    auto file = client.getFileErrors("/w/b.py");
    if (!file || file->size() != 1U || file->front().location().line != 4)
    {
        if (!file)
        {
            llvm::consumeError(file.takeError());
        }
        std::cerr << "expected one normalized finding from the file query\n";
        return false;
    }
    if (client.errorRetriever().getCachedErrors(llvm::StringRef("/w/b.py")).size() != 1U)
    {
        std::cerr << "file query must populate the cache\n";
        return false;
    }
    auto again = client.getFileErrors("/w/c.py");
    if (!again)
    {
        llvm::consumeError(again.takeError());
    }
    const auto  fileParams = server->lastParams(lspvisor::methods::GetErrors);
    const auto* fileObject = fileParams ? fileParams->getAsObject() : nullptr;
    if (!fileObject || fileObject->getString("uri") != llvm::StringRef("file:///w/c.py"))
    {
        std::cerr << "file query must send the latest uri\n";
        return false;
    }

    // Server error objects carry their code.
    auto analyzed = client.analyzeFile("/w/a.py");
    if (analyzed)
    {
        std::cerr << "analyzeFile must surface the server error\n";
        return false;
    }
    std::optional<std::int64_t> rpcCode;
    llvm::handleAllErrors(analyzed.takeError(),
                          [&rpcCode](const lspvisor::ClientError& error) { rpcCode = error.rpcCode(); },
                          [](const llvm::ErrorInfoBase&) {});
    if (rpcCode != std::optional<std::int64_t>(-32001))
    {
        std::cerr << "protocol error must keep the server error code\n";
        return false;
    }

    // Unanswered requests time out and leave nothing pending.
    auto slow = client.sendRequest("custom/slow", std::nullopt, std::chrono::milliseconds(50));
    if (slow || !expectKind(slow.takeError(), lspvisor::ErrorKind::Timeout, "silent request"))
    {
        std::cerr << "silent request must time out\n";
        return false;
    }
    if (!client.protocol().pendingRequestIds().empty() || client.telemetry().timeoutCount("custom/slow") != 1U)
    {
        std::cerr << "timed out request must be dropped and counted\n";
        return false;
    }

    // Unknown methods answered with null still succeed.
    auto plain = client.sendRequest("custom/echo", llvm::json::Value(llvm::json::Object{}));
    if (!plain)
    {
        std::cerr << "plain request failed: " << llvm::toString(plain.takeError()) << "\n";
        return false;
    }
    if (auto err = client.sendNotification("custom/note"))
    {
        std::cerr << "notification failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    if (!server->waitForMethod("custom/note", 1, std::chrono::milliseconds(1000)))
    {
        std::cerr << "notification must reach the server\n";
        return false;
    }

    auto refreshed = client.refreshAnalysis();
    if (!refreshed || !*refreshed)
    {
        if (!refreshed)
        {
            llvm::consumeError(refreshed.takeError());
        }
        std::cerr << "refreshAnalysis must report success\n";
        return false;
    }

    client.disconnect();
    return true;
}

bool runExtensionGateTests()
{
    const auto server = FakeLanguageServer::create();
    server->setCapabilities(llvm::json::Object{{"experimental", llvm::json::Object{{"serenaExtensions", false}}}});
    lspvisor::LspClient client(quickOptions(), server->factory());
    if (!connectOrReport(client))
    {
        return false;
    }

    auto gated = client.getComprehensiveErrors();
    if (gated || !expectKind(gated.takeError(), lspvisor::ErrorKind::Protocol, "extension gate"))
    {
        std::cerr << "extension queries must be refused without server support\n";
        return false;
    }
    if (server->countReceived(lspvisor::methods::GetComprehensiveErrors) != 0U)
    {
        std::cerr << "refused extension query must not reach the server\n";
        return false;
    }
    const auto capabilities = client.serverCapabilities();
    if (!capabilities.getObject("experimental"))
    {
        std::cerr << "server capabilities must be retained\n";
        return false;
    }

    auto plain = client.sendRequest("textDocument/hover");
    if (!plain)
    {
        std::cerr << "standard requests must still work: " << llvm::toString(plain.takeError()) << "\n";
        return false;
    }
    client.disconnect();
    return true;
}

bool runPushTests()
{
    std::atomic<int>    pushes{0};
    std::atomic<int>    seen{0};
    const auto          server = FakeLanguageServer::create();
    lspvisor::LspClient client(quickOptions(), server->factory());

    client.addErrorListener([&pushes](const std::vector<lspvisor::CodeError>&) { ++pushes; });
    const std::uint64_t handler = client.addMessageHandler([&seen](const lspvisor::Message& message) {
        if (lspvisor::methodOf(message) == lspvisor::methods::ErrorUpdated)
        {
            ++seen;
        }
    });

    if (!connectOrReport(client))
    {
        return false;
    }
    // Malformed payloads are dropped and the loop keeps running.
    server->pushRaw("{not json");
    server->pushNotification(lspvisor::methods::ErrorUpdated,
                             llvm::json::Object{
                                 {"uri", "file:///w/pushed.py"},
                                 {"diagnostics", llvm::json::Array{diagnostic(5, 2, "undefined name")}},
                             });
    if (!eventually([&] { return client.errorRetriever().hasCachedFile("/w/pushed.py"); }))
    {
        std::cerr << "pushed diagnostics must reach the cache\n";
        return false;
    }
    const auto cached = client.errorRetriever().getCachedErrors(llvm::StringRef("/w/pushed.py"));
    if (cached.size() != 1U || cached.front().location().line != 6 || cached.front().location().column != 3 ||
        cached.front().severity() != lspvisor::Severity::Error)
    {
        std::cerr << "pushed diagnostic must be normalized\n";
        return false;
    }
    if (!eventually([&] { return pushes.load() == 1 && seen.load() == 1; }))
    {
        std::cerr << "error listener and message handler must each see the push once\n";
        return false;
    }

    // Standard publishDiagnostics is ingested the same way.
    server->pushNotification(lspvisor::methods::PublishDiagnostics,
                             llvm::json::Object{{"uri", "file:///w/std.py"}, {"diagnostics", llvm::json::Array{}}});
    if (!eventually([&] { return client.errorRetriever().hasCachedFile("/w/std.py"); }))
    {
        std::cerr << "publishDiagnostics must be ingested\n";
        return false;
    }

    if (!client.removeMessageHandler(handler) || client.removeMessageHandler(handler))
    {
        std::cerr << "message handler removal mismatch\n";
        return false;
    }
    client.disconnect();
    return true;
}

bool runHeartbeatTests()
{
    const auto              server  = FakeLanguageServer::create();
    lspvisor::ClientOptions options = quickOptions();
    options.heartbeatInterval       = std::chrono::milliseconds(20);
    lspvisor::LspClient client(options, server->factory());
    if (!connectOrReport(client))
    {
        return false;
    }
    if (!server->waitForMethod(lspvisor::methods::Ping, 2, std::chrono::milliseconds(2000)))
    {
        std::cerr << "heartbeat must send periodic pings\n";
        return false;
    }
    client.disconnect();
    const std::size_t pings = server->countReceived(lspvisor::methods::Ping);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    if (server->countReceived(lspvisor::methods::Ping) != pings)
    {
        std::cerr << "heartbeat must stop with the connection\n";
        return false;
    }
    return true;
}

bool runHttpTests()
{
    const auto              server  = FakeLanguageServer::create(lspvisor::ConnectionKind::Http);
    lspvisor::ClientOptions options = quickOptions();
    options.transport.kind          = lspvisor::ConnectionKind::Http;
    options.heartbeatInterval       = std::chrono::milliseconds(20);
    lspvisor::LspClient client(options, server->factory());

    server->respond(lspvisor::methods::GetErrors, [](const lspvisor::Request&) {
        return std::optional<llvm::json::Value>(
            llvm::json::Object{{"diagnostics", llvm::json::Array{diagnostic(0, 0, "over http")}}});
    });
    if (!connectOrReport(client))
    {
        return false;
    }
    auto errors = client.getFileErrors("/w/http.py");
    if (!errors || errors->size() != 1U)
    {
        if (!errors)
        {
            llvm::consumeError(errors.takeError());
        }
        std::cerr << "request-per-call channel must deliver responses from the write\n";
        return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    if (server->countReceived(lspvisor::methods::Ping) != 0U)
    {
        std::cerr << "request-per-call channels have no heartbeat\n";
        return false;
    }
    client.disconnect();
    return true;
}

bool runReconnectTests()
{
    {
        ConnectionLog           log;
        const auto              server  = FakeLanguageServer::create();
        lspvisor::ClientOptions options = quickOptions();
        options.reconnect.enabled       = true;
        options.reconnect.maxAttempts   = 3;
        lspvisor::LspClient client(options, server->factory());
        client.addConnectionListener(log.bind());
        if (!connectOrReport(client))
        {
            return false;
        }

        server->dropConnection();
        if (!eventually([&] { return server->connectCount() == 2U && client.isConnected(); }))
        {
            std::cerr << "client must reconnect after the server drops the channel\n";
            return false;
        }
        if (!eventually([&] { return log.snapshot() == std::vector<bool>{true, false, true}; }))
        {
            std::cerr << "listener must see connect, loss and reconnect in order\n";
            return false;
        }
        client.disconnect();
    }

    {
        std::atomic<int>        exhausted{0};
        const auto              server  = FakeLanguageServer::create();
        lspvisor::ClientOptions options = quickOptions();
        options.reconnect.enabled       = true;
        options.reconnect.maxAttempts   = 2;
        lspvisor::LspClient client(options, server->factory());
        client.setReconnectExhaustedCallback([&exhausted]() { ++exhausted; });
        if (!connectOrReport(client))
        {
            return false;
        }

        server->setConnectFailure(true);
        server->dropConnection();
        if (!eventually([&] { return exhausted.load() == 1; }))
        {
            std::cerr << "exhausted reconnect must invoke the callback\n";
            return false;
        }
        if (client.state() != lspvisor::ClientState::Disconnected || server->connectCount() != 1U)
        {
            std::cerr << "client must stay disconnected after giving up\n";
            return false;
        }
    }

    // Without reconnect a drop just leaves the client disconnected, quietly.
    std::mutex                       recordMutex;
    std::vector<lspvisor::LogRecord> records;
    const lspvisor::LogLevel         previousLevel = lspvisor::logLevel();
    lspvisor::setLogSink([&records, &recordMutex](const lspvisor::LogRecord& record) {
        std::lock_guard<std::mutex> lock(recordMutex);
        records.push_back(record);
    });
    lspvisor::setLogLevel(lspvisor::LogLevel::Warning);
    auto restoreLogging = [&]() {
        lspvisor::setLogSink(nullptr);
        lspvisor::setLogLevel(previousLevel);
    };

    bool disabledOk = true;
    {
        std::atomic<int>    exhausted{0};
        const auto          server = FakeLanguageServer::create();
        lspvisor::LspClient client(quickOptions(), server->factory());
        client.setReconnectExhaustedCallback([&exhausted]() { ++exhausted; });
        if (!connectOrReport(client))
        {
            disabledOk = false;
        }
        else
        {
            server->dropConnection();
            if (!eventually([&] { return client.state() == lspvisor::ClientState::Disconnected; }))
            {
                std::cerr << "lost channel must move the client to disconnected\n";
                disabledOk = false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (server->connectCount() != 1U || exhausted.load() != 0)
            {
                std::cerr << "disabled reconnect must neither reconnect nor report exhaustion\n";
                disabledOk = false;
            }
        }
    }
    restoreLogging();
    if (!disabledOk)
    {
        return false;
    }

    bool sawLoss = false;
    for (const auto& record : records)
    {
        if (record.level == lspvisor::LogLevel::Error && record.component == "client")
        {
            std::cerr << "disabled reconnect must not log an error: " << record.message << "\n";
            return false;
        }
        sawLoss = sawLoss || record.message.find("transport lost") != std::string::npos;
    }
    if (!sawLoss)
    {
        std::cerr << "the transport loss itself must be logged\n";
        return false;
    }
    return true;
}

bool runShutdownTests()
{
    ConnectionLog       log;
    const auto          server = FakeLanguageServer::create();
    lspvisor::LspClient client(quickOptions(), server->factory());
    client.addConnectionListener(log.bind());
    if (!connectOrReport(client))
    {
        return false;
    }

    server->silence(lspvisor::methods::Shutdown);
    if (client.shutdown(std::chrono::milliseconds(50)))
    {
        std::cerr << "unanswered shutdown must report failure\n";
        return false;
    }
    if (client.state() != lspvisor::ClientState::ShuttingDown || server->countReceived(lspvisor::methods::Exit) != 0U)
    {
        std::cerr << "client must stay shutting down without sending exit\n";
        return false;
    }

    if (!client.forceTerminate(std::chrono::milliseconds(100)))
    {
        std::cerr << "forceTerminate must report the grace result\n";
        return false;
    }
    if (server->terminateCount() != 1U || client.state() != lspvisor::ClientState::Disconnected)
    {
        std::cerr << "forceTerminate must terminate and release the channel\n";
        return false;
    }
    if (log.snapshot() != std::vector<bool>{true, false})
    {
        std::cerr << "termination must notify listeners once\n";
        return false;
    }
    return true;
}

}  // namespace

bool runLspClientTests()
{
    const lspvisor::LogLevel previousLevel = lspvisor::logLevel();
    lspvisor::setLogLevel(lspvisor::LogLevel::Off);

    bool ok = true;
    ok      = runHandshakeTests() && ok;
    ok      = runQueryTests() && ok;
    ok      = runExtensionGateTests() && ok;
    ok      = runPushTests() && ok;
    ok      = runHeartbeatTests() && ok;
    ok      = runHttpTests() && ok;
    ok      = runReconnectTests() && ok;
    ok      = runShutdownTests() && ok;

    lspvisor::setLogLevel(previousLevel);
    return ok;
}
