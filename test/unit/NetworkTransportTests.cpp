//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runs the socket transports against loopback servers built on Asio and
/// Beast: fragmented Content-Length frames over TCP, a persistent WebSocket
/// session, and one HTTP POST per message.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Client/LspClient.h"
#include "lspvisor/Protocol/Extensions.h"
#include "lspvisor/Protocol/Message.h"
#include "lspvisor/Support/Error.h"
#include "lspvisor/Support/Logging.h"
#include "lspvisor/Transport/HttpTransport.h"
#include "lspvisor/Transport/MessageFraming.h"
#include "lspvisor/Transport/TcpTransport.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <sys/socket.h>

namespace
{

namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
using tcp           = asio::ip::tcp;

/// Polls `predicate` until it holds or `timeout` elapses.
bool eventually(const std::function<bool()>& predicate,
                std::chrono::milliseconds    timeout = std::chrono::milliseconds(3000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
        {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

llvm::json::Value diagnostic(int line, int character, const char* message)
{
    return llvm::json::Object{
        {"range", llvm::json::Object{{"start", llvm::json::Object{{"line", line}, {"character", character}}}}},
        {"severity", 1},
        {"message", message},
    };
}

/// Minimal analysis server behavior shared by every loopback server.
class ScriptedAnswers final
{
public:
    /// Queues a server notification sent once the client reports `initialized`.
    void pushAfterInitialized(lspvisor::Notification notification)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pushes_.push_back(lspvisor::serializeMessage(lspvisor::Message(std::move(notification))));
    }

    /// Returns the payloads to send back for one inbound payload.
    std::vector<std::string> answer(const llvm::StringRef payload)
    {
        auto message = lspvisor::parseMessageText(payload);
        if (!message)
        {
            llvm::consumeError(message.takeError());
            return {};
        }
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string           method = lspvisor::methodOf(*message).str();
        methods_.push_back(method);

        const auto* request = std::get_if<lspvisor::Request>(&*message);
        if (!request)
        {
            if (method == lspvisor::methods::Initialized)
            {
                return std::exchange(pushes_, {});
            }
            return {};
        }

        lspvisor::Response response;
        response.id = request->id;
        if (method == lspvisor::methods::Initialize)
        {
            response.result = llvm::json::Object{{"capabilities", llvm::json::Object{{"hoverProvider", true}}}};
        }
        else if (method == lspvisor::methods::GetErrors)
        {
            response.result = llvm::json::Object{{"diagnostics", llvm::json::Array{diagnostic(3, 4, "undefined name")}}};
        }
        return {lspvisor::serializeMessage(lspvisor::Message(std::move(response)))};
    }

    [[nodiscard]] std::size_t count(const llvm::StringRef method) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count(methods_.begin(), methods_.end(), method.str()));
    }

private:
    mutable std::mutex       mutex_;
    std::vector<std::string> methods_;
    std::vector<std::string> pushes_;
};

/// Accepts on an ephemeral loopback port and serves on a background thread.
class LoopbackServer
{
public:
    virtual ~LoopbackServer() = default;

    [[nodiscard]] std::uint16_t port() const
    {
        return port_;
    }

protected:
    explicit LoopbackServer(ScriptedAnswers& answers)
        : answers_(answers)
        , acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        , acceptorFd_(acceptor_.native_handle())
        , port_(acceptor_.local_endpoint().port())
    {
    }

    void start()
    {
        thread_ = std::thread([this]() { serve(); });
    }

    /// Wakes the blocked accept or read and joins the server thread.
    void stop()
    {
        stopping_.store(true);
        ::shutdown(acceptorFd_, SHUT_RDWR);
        const int session = sessionFd_.load();
        if (session >= 0)
        {
            ::shutdown(session, SHUT_RDWR);
        }
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    virtual void serve() = 0;

    ScriptedAnswers&  answers_;
    asio::io_context  io_;
    tcp::acceptor     acceptor_;
    int               acceptorFd_;
    std::uint16_t     port_;
    std::atomic_bool  stopping_{false};
    std::atomic_int   sessionFd_{-1};
    std::thread       thread_;
};

/// Reads framed messages straight from a server-side socket.
class SocketSource final : public lspvisor::ByteSource
{
public:
    explicit SocketSource(tcp::socket& socket)
        : socket_(socket)
    {
    }

    llvm::Expected<std::size_t> readSome(char* buffer, const std::size_t capacity) override
    {
        boost::system::error_code ec;
        const std::size_t         got = socket_.read_some(asio::buffer(buffer, capacity), ec);
        return ec ? 0U : got;
    }

private:
    tcp::socket& socket_;
};

/// Content-Length server that writes every frame in small fragments.
class TcpLoopbackServer final : public LoopbackServer
{
public:
    TcpLoopbackServer(ScriptedAnswers& answers, const std::size_t fragment, std::vector<std::string> greeting = {},
                      const bool hangUpAfterGreeting = false)
        : LoopbackServer(answers)
        , fragment_(fragment)
        , greeting_(std::move(greeting))
        , hangUp_(hangUpAfterGreeting)
    {
        start();
    }

    ~TcpLoopbackServer() override
    {
        stop();
    }

private:
    void serve() override
    {
        boost::system::error_code ec;
        tcp::socket               socket(io_);
        acceptor_.accept(socket, ec);
        if (ec)
        {
            return;
        }
        socket.set_option(tcp::no_delay(true), ec);
        sessionFd_.store(socket.native_handle());

        bool open = true;
        for (const auto& payload : greeting_)
        {
            open = open && writeFragmented(socket, lspvisor::encodeFrame(payload));
        }
        SocketSource          source(socket);
        lspvisor::FrameReader reader(source);
        while (open && !hangUp_ && !stopping_.load())
        {
            auto frame = reader.readFrame();
            if (!frame)
            {
                llvm::consumeError(frame.takeError());
                break;
            }
            if (!*frame)
            {
                break;
            }
            for (const auto& reply : answers_.answer(**frame))
            {
                open = open && writeFragmented(socket, lspvisor::encodeFrame(reply));
            }
        }
        sessionFd_.store(-1);
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    bool writeFragmented(tcp::socket& socket, const std::string& frame) const
    {
        for (std::size_t offset = 0; offset < frame.size(); offset += fragment_)
        {
            boost::system::error_code ec;
            asio::write(socket, asio::buffer(frame.data() + offset, std::min(fragment_, frame.size() - offset)), ec);
            if (ec)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
        return true;
    }

    std::size_t              fragment_;
    std::vector<std::string> greeting_;
    bool                     hangUp_;
};

/// WebSocket server carrying one JSON-RPC message per text frame.
class WebSocketLoopbackServer final : public LoopbackServer
{
public:
    explicit WebSocketLoopbackServer(ScriptedAnswers& answers)
        : LoopbackServer(answers)
    {
        start();
    }

    ~WebSocketLoopbackServer() override
    {
        stop();
    }

    [[nodiscard]] std::string target() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return target_;
    }

private:
    void serve() override
    {
        boost::system::error_code ec;
        tcp::socket               socket(io_);
        acceptor_.accept(socket, ec);
        if (ec)
        {
            return;
        }
        sessionFd_.store(socket.native_handle());

        websocket::stream<tcp::socket>   ws(std::move(socket));
        beast::flat_buffer               buffer;
        http::request<http::string_body> upgrade;
        http::read(ws.next_layer(), buffer, upgrade, ec);
        if (!ec)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                target_.assign(upgrade.target().data(), upgrade.target().size());
            }
            ws.accept(upgrade, ec);
        }
        if (!ec)
        {
            ws.text(true);
            buffer.consume(buffer.size());
            while (!stopping_.load())
            {
                ws.read(buffer, ec);
                if (ec)
                {
                    break;
                }
                const std::string payload = beast::buffers_to_string(buffer.data());
                buffer.consume(buffer.size());
                for (const auto& reply : answers_.answer(payload))
                {
                    ws.write(asio::buffer(reply), ec);
                }
                if (ec)
                {
                    break;
                }
            }
        }
        sessionFd_.store(-1);
        ws.next_layer().close(ec);
    }

    mutable std::mutex mutex_;
    std::string        target_;
};

/// HTTP server answering every POST with the JSON-RPC response body.
class HttpLoopbackServer final : public LoopbackServer
{
public:
    explicit HttpLoopbackServer(ScriptedAnswers& answers, const http::status status = http::status::ok)
        : LoopbackServer(answers)
        , status_(status)
    {
        start();
    }

    ~HttpLoopbackServer() override
    {
        stop();
    }

    [[nodiscard]] std::size_t requestCount() const
    {
        return requests_.load();
    }

    /// Returns whether every request was a JSON POST to `/lsp`.
    [[nodiscard]] bool allWellFormed() const
    {
        return wellFormed_.load();
    }

private:
    void serve() override
    {
        while (!stopping_.load())
        {
            boost::system::error_code ec;
            tcp::socket               socket(io_);
            acceptor_.accept(socket, ec);
            if (ec)
            {
                return;
            }
            sessionFd_.store(socket.native_handle());

            beast::flat_buffer               buffer;
            http::request<http::string_body> request;
            http::read(socket, buffer, request, ec);
            if (!ec)
            {
                ++requests_;
                const auto target      = request.target();
                const auto contentType = request[http::field::content_type];
                if (request.method() != http::verb::post || std::string(target.data(), target.size()) != "/lsp" ||
                    std::string(contentType.data(), contentType.size()) != "application/json")
                {
                    wellFormed_.store(false);
                }

                http::response<http::string_body> response{status_, request.version()};
                response.set(http::field::content_type, "application/json");
                response.keep_alive(false);
                if (status_ == http::status::ok)
                {
                    const std::vector<std::string> replies = answers_.answer(request.body());
                    if (!replies.empty())
                    {
                        response.body() = replies.front();
                    }
                }
                response.prepare_payload();
                http::write(socket, response, ec);
            }
            sessionFd_.store(-1);
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    }

    http::status       status_;
    std::atomic_size_t requests_{0};
    std::atomic_bool   wellFormed_{true};
};

lspvisor::ClientOptions loopbackOptions(const lspvisor::ConnectionKind kind, const std::uint16_t port)
{
    lspvisor::ClientOptions options;
    options.transport.kind           = kind;
    options.transport.host           = "127.0.0.1";
    options.transport.port           = port;
    options.transport.connectTimeout = std::chrono::milliseconds(2000);
    options.transport.requestTimeout = std::chrono::milliseconds(2000);
    options.requestTimeout           = std::chrono::milliseconds(2000);
    options.shutdownTimeout          = std::chrono::milliseconds(500);
    options.heartbeatInterval        = std::chrono::milliseconds(0);
    options.reconnect.enabled        = false;
    return options;
}

lspvisor::Notification errorUpdate()
{
    return lspvisor::Notification{
        lspvisor::methods::ErrorUpdated.str(),
        llvm::json::Value(llvm::json::Object{
            {"uri", "file:///a.py"},
            {"diagnostics", llvm::json::Array{diagnostic(5, 2, "pushed")}},
        }),
    };
}

/// Connects, checks the pushed and queried findings, then disconnects.
bool exerciseClient(lspvisor::LspClient& client, const ScriptedAnswers& answers, const bool expectPush,
                    const char* kind, const std::size_t minimumPings = 0U)
{
    if (auto err = client.connect())
    {
        std::cerr << kind << ": connect failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    if (client.state() != lspvisor::ClientState::Ready ||
        client.serverCapabilities().getBoolean("hoverProvider") != true)
    {
        std::cerr << kind << ": client must be ready with the server capabilities\n";
        return false;
    }

    if (expectPush)
    {
        const bool cached = eventually([&client]() {
            const auto errors = client.errorRetriever().getCachedErrors(llvm::StringRef("/a.py"));
            return errors.size() == 1U && errors.front().location().line == 6 && errors.front().location().column == 3;
        });
        if (!cached)
        {
            std::cerr << kind << ": pushed finding must be cached with 1-based positions\n";
            return false;
        }
    }

    auto file = client.getFileErrors("/w/b.py");
    if (!file || file->size() != 1U || file->front().location().line != 4)
    {
        if (!file)
        {
            std::cerr << kind << ": " << llvm::toString(file.takeError()) << "\n";
        }
        std::cerr << kind << ": file query must round-trip through the server\n";
        return false;
    }
    if (!eventually([&answers, minimumPings]() { return answers.count(lspvisor::methods::Ping) >= minimumPings; }))
    {
        std::cerr << kind << ": heartbeat must reach the server\n";
        return false;
    }

    client.disconnect();
    if (!eventually([&answers]() {
            return answers.count(lspvisor::methods::Shutdown) == 1U && answers.count(lspvisor::methods::Exit) == 1U;
        }))
    {
        std::cerr << kind << ": disconnect must send shutdown and exit once\n";
        return false;
    }
    if (client.state() != lspvisor::ClientState::Disconnected)
    {
        std::cerr << kind << ": client must end disconnected\n";
        return false;
    }
    return true;
}

bool runTcpTests()
{
    {
        // Frames arrive in 7-byte fragments; the peer then hangs up.
        ScriptedAnswers                answers;
        const std::vector<std::string> greeting{R"({"jsonrpc":"2.0","method":"$/ping"})",
                                                R"({"jsonrpc":"2.0","id":"x","result":{"text":"fragmented"}})"};
        TcpLoopbackServer              server(answers, 7U, greeting, true);

        lspvisor::TransportOptions options;
        options.kind = lspvisor::ConnectionKind::Tcp;
        options.host = "127.0.0.1";
        options.port = server.port();
        lspvisor::TcpTransport transport(options);
        if (auto err = transport.connect())
        {
            std::cerr << "tcp connect failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        for (const auto& expected : greeting)
        {
            auto received = transport.receive();
            if (!received || !*received || **received != expected)
            {
                if (!received)
                {
                    llvm::consumeError(received.takeError());
                }
                std::cerr << "fragmented frame must be reassembled\n";
                return false;
            }
        }
        auto closed = transport.receive();
        if (!closed || *closed)
        {
            if (!closed)
            {
                llvm::consumeError(closed.takeError());
            }
            std::cerr << "peer hang-up must read as end of stream\n";
            return false;
        }
        if (transport.isAlive())
        {
            std::cerr << "tcp transport must not be alive after the peer closed\n";
            return false;
        }
        transport.disconnect();
    }

    {
        // Nothing listens on a port whose acceptor was just closed.
        std::uint16_t port = 0;
        {
            asio::io_context io;
            tcp::acceptor    acceptor(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
            port = acceptor.local_endpoint().port();
        }
        lspvisor::TransportOptions options;
        options.kind           = lspvisor::ConnectionKind::Tcp;
        options.host           = "127.0.0.1";
        options.port           = port;
        options.connectTimeout = std::chrono::milliseconds(1000);
        lspvisor::TcpTransport transport(options);
        if (lspvisor::classifyError(transport.connect()).kind != lspvisor::ErrorKind::Connection)
        {
            std::cerr << "refused tcp connect must be a connection error\n";
            return false;
        }
    }

    ScriptedAnswers answers;
    answers.pushAfterInitialized(errorUpdate());
    TcpLoopbackServer   server(answers, 7U);
    lspvisor::LspClient client(loopbackOptions(lspvisor::ConnectionKind::Tcp, server.port()));
    return exerciseClient(client, answers, true, "tcp");
}

bool runWebSocketTests()
{
    ScriptedAnswers answers;
    answers.pushAfterInitialized(errorUpdate());
    WebSocketLoopbackServer server(answers);

    lspvisor::ClientOptions options = loopbackOptions(lspvisor::ConnectionKind::WebSocket, server.port());
    options.heartbeatInterval       = std::chrono::milliseconds(20);
    lspvisor::LspClient client(options);
    if (!exerciseClient(client, answers, true, "websocket", 2U))
    {
        return false;
    }
    if (server.target() != "/lsp")
    {
        std::cerr << "websocket handshake must target /lsp, got " << server.target() << "\n";
        return false;
    }
    return true;
}

bool runHttpTests()
{
    {
        ScriptedAnswers    answers;
        HttpLoopbackServer server(answers);
        lspvisor::ClientOptions options = loopbackOptions(lspvisor::ConnectionKind::Http, server.port());
        options.heartbeatInterval       = std::chrono::milliseconds(20);
        lspvisor::LspClient client(options);
        if (!exerciseClient(client, answers, false, "http"))
        {
            return false;
        }
        if (answers.count(lspvisor::methods::Ping) != 0U)
        {
            std::cerr << "http must not send heartbeats\n";
            return false;
        }
        // initialize, initialized, getErrors, shutdown and exit each take one POST.
        if (server.requestCount() != 5U || !server.allWellFormed())
        {
            std::cerr << "http must POST each message as JSON to /lsp, saw " << server.requestCount() << "\n";
            return false;
        }
    }

    {
        ScriptedAnswers    answers;
        HttpLoopbackServer server(answers, http::status::service_unavailable);

        lspvisor::TransportOptions options;
        options.kind = lspvisor::ConnectionKind::Http;
        options.host = "127.0.0.1";
        options.port = server.port();
        lspvisor::HttpTransport transport(options);
        if (auto err = transport.connect())
        {
            std::cerr << "http connect failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        auto sent = transport.send(R"({"jsonrpc":"2.0","id":"lspvisor-1","method":"shutdown"})");
        if (sent)
        {
            std::cerr << "non-2xx http status must fail the send\n";
            return false;
        }
        if (lspvisor::classifyError(sent.takeError()).kind != lspvisor::ErrorKind::Connection)
        {
            std::cerr << "non-2xx http status must be a connection error\n";
            return false;
        }
        transport.disconnect();
        auto late = transport.send("{}");
        if (late)
        {
            std::cerr << "send after disconnect must fail\n";
            return false;
        }
        llvm::consumeError(late.takeError());
    }
    return true;
}

}  // namespace

bool runNetworkTransportTests()
{
    const lspvisor::LogLevel previousLevel = lspvisor::logLevel();
    lspvisor::setLogLevel(lspvisor::LogLevel::Off);

    bool ok = true;
    ok      = runTcpTests() && ok;
    ok      = runWebSocketTests() && ok;
    ok      = runHttpTests() && ok;

    lspvisor::setLogLevel(previousLevel);
    return ok;
}
