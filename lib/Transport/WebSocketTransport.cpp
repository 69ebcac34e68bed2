//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the WebSocket transport on Boost.Beast.
///
/// Every stream operation runs on one private I/O thread so the WebSocket
/// state machine is never touched concurrently. Inbound text frames are queued
/// for `receive`; outbound payloads are queued and written in order, with the
/// caller waiting for its own write to complete.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Transport/WebSocketTransport.h"

#include "lspvisor/Support/Error.h"
#include "lspvisor/Support/Logging.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <utility>

namespace lspvisor
{

namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using tcp           = asio::ip::tcp;

namespace
{

/// Bound on the closing handshake.
constexpr std::chrono::seconds kCloseTimeout{2};

}  // namespace

class WebSocketTransport::Impl final
{
public:
    explicit Impl(TransportOptions options)
        : options_(std::move(options))
        , resolver_(io_)
    {
    }

    ~Impl()
    {
        disconnect();
    }

    llvm::Error connect()
    {
        if (thread_.joinable())
        {
            return makeConnectionError("websocket transport is already connected");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbound_.clear();
            closed_      = false;
            interrupted_ = false;
            closeMessage_.clear();
        }
        readBuffer_.consume(readBuffer_.size());

        stream_ = std::make_unique<websocket::stream<beast::tcp_stream>>(io_);
        io_.restart();
        work_.emplace(asio::make_work_guard(io_));
        thread_ = std::thread([this]() { io_.run(); });

        auto handshake = std::make_shared<std::promise<boost::system::error_code>>();
        auto done      = handshake->get_future();
        connecting_.store(true);
        asio::post(io_, [this, handshake]() { startConnect(handshake); });

        boost::system::error_code ec;
        if (done.wait_for(options_.connectTimeout + kCloseTimeout) != std::future_status::ready)
        {
            ec = asio::error::timed_out;
        }
        else
        {
            ec = done.get();
        }
        connecting_.store(false);

        if (!ec && interrupted())
        {
            ec = asio::error::operation_aborted;
        }
        if (ec)
        {
            stopIoThread(false);
            return makeConnectionError("failed to connect to " + targetText() + ": " + ec.message());
        }

        open_.store(true);
        asio::post(io_, [this]() { startRead(); });
        logInfo("websocket", "connected to " + targetText());
        return llvm::Error::success();
    }

    llvm::Expected<std::optional<std::string>> send(const llvm::StringRef payload)
    {
        if (!open_.load())
        {
            return makeConnectionError("websocket transport is not connected");
        }
        auto written = std::make_shared<std::promise<boost::system::error_code>>();
        auto done    = written->get_future();
        asio::post(io_, [this, text = payload.str(), written]() mutable {
            writes_.push_back(PendingWrite{std::move(text), std::move(written)});
            if (writes_.size() == 1U)
            {
                startWrite();
            }
        });

        if (done.wait_for(options_.requestTimeout) != std::future_status::ready)
        {
            return makeConnectionError("websocket write stalled");
        }
        const boost::system::error_code ec = done.get();
        if (ec)
        {
            markClosed(ec.message());
            return makeConnectionError("websocket write failed: " + ec.message());
        }
        return std::optional<std::string>();
    }

    llvm::Expected<std::optional<std::string>> receive()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !inbound_.empty() || closed_ || interrupted_; });
        if (!inbound_.empty())
        {
            std::string payload = std::move(inbound_.front());
            inbound_.pop_front();
            return std::optional<std::string>(std::move(payload));
        }
        if (interrupted_ || closeMessage_.empty())
        {
            return std::optional<std::string>();
        }
        return makeConnectionError("websocket read failed: " + closeMessage_);
    }

    void interrupt()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = true;
        }
        cv_.notify_all();
        if (connecting_.load())
        {
            asio::post(io_, [this]() {
                boost::system::error_code ignored;
                resolver_.cancel();
                beast::get_lowest_layer(*stream_).socket().close(ignored);
            });
        }
    }

    void disconnect()
    {
        if (!thread_.joinable())
        {
            return;
        }
        stopIoThread(open_.exchange(false));
        logDebug("websocket", "disconnected from " + targetText());
    }

    bool isAlive()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_.load() && !closed_;
    }

private:
    struct PendingWrite final
    {
        std::string                                                payload;
        std::shared_ptr<std::promise<boost::system::error_code>> done;
    };

    using HandshakePromise = std::shared_ptr<std::promise<boost::system::error_code>>;

    void startConnect(const HandshakePromise& handshake)
    {
        resolver_.async_resolve(
            options_.host,
            std::to_string(options_.port),
            [this, handshake](const boost::system::error_code& ec, const tcp::resolver::results_type& results) {
                if (ec)
                {
                    handshake->set_value(ec);
                    return;
                }
                beast::get_lowest_layer(*stream_).expires_after(options_.connectTimeout);
                beast::get_lowest_layer(*stream_).async_connect(
                    results,
                    [this, handshake](const boost::system::error_code& connectEc, const tcp::endpoint&) {
                        if (connectEc)
                        {
                            handshake->set_value(connectEc);
                            return;
                        }
                        startHandshake(handshake);
                    });
            });
    }

    void startHandshake(const HandshakePromise& handshake)
    {
        stream_->set_option(websocket::stream_base::decorator([](websocket::request_type& request) {
            request.set(beast::http::field::user_agent, "lspvisor");
        }));
        stream_->async_handshake(options_.host + ":" + std::to_string(options_.port),
                                 options_.path,
                                 [this, handshake](const boost::system::error_code& ec) {
                                     beast::get_lowest_layer(*stream_).expires_never();
                                     if (!ec)
                                     {
                                         stream_->text(true);
                                     }
                                     handshake->set_value(ec);
                                 });
    }

    void startRead()
    {
        stream_->async_read(readBuffer_, [this](const boost::system::error_code& ec, std::size_t) {
            if (ec)
            {
                const bool clean = ec == websocket::error::closed || ec == asio::error::operation_aborted ||
                                   ec == asio::error::eof;
                markClosed(clean ? std::string() : ec.message());
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inbound_.push_back(beast::buffers_to_string(readBuffer_.data()));
            }
            readBuffer_.consume(readBuffer_.size());
            cv_.notify_all();
            startRead();
        });
    }

    void startWrite()
    {
        stream_->async_write(asio::buffer(writes_.front().payload),
                             [this](const boost::system::error_code& ec, std::size_t) {
                                 writes_.front().done->set_value(ec);
                                 writes_.pop_front();
                                 if (!writes_.empty())
                                 {
                                     startWrite();
                                 }
                             });
    }

    void markClosed(std::string message)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_)
            {
                closed_       = true;
                closeMessage_ = std::move(message);
            }
        }
        cv_.notify_all();
    }

    bool interrupted()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return interrupted_;
    }

    void stopIoThread(const bool sendClose)
    {
        asio::post(io_, [this, sendClose]() {
            boost::system::error_code ignored;
            resolver_.cancel();
            if (sendClose && stream_->is_open())
            {
                beast::get_lowest_layer(*stream_).expires_after(kCloseTimeout);
                stream_->async_close(websocket::close_code::normal, [this](const boost::system::error_code&) {
                    boost::system::error_code closeIgnored;
                    beast::get_lowest_layer(*stream_).socket().close(closeIgnored);
                });
                return;
            }
            beast::get_lowest_layer(*stream_).socket().close(ignored);
        });
        work_.reset();
        thread_.join();
        stream_.reset();
        writes_.clear();
        markClosed(std::string());
    }

    std::string targetText() const
    {
        return "ws://" + options_.host + ":" + std::to_string(options_.port) + options_.path;
    }

    TransportOptions                                                       options_;
    asio::io_context                                                       io_;
    tcp::resolver                                                          resolver_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::thread                                                            thread_;
    std::unique_ptr<websocket::stream<beast::tcp_stream>>                  stream_;
    beast::flat_buffer                                                     readBuffer_;
    std::deque<PendingWrite>                                               writes_;
    std::mutex                                                             mutex_;
    std::condition_variable                                                cv_;
    std::deque<std::string>                                                inbound_;
    bool                                                                   closed_{true};
    bool                                                                   interrupted_{false};
    std::string                                                            closeMessage_;
    std::atomic_bool                                                       open_{false};
    std::atomic_bool                                                       connecting_{false};
};

WebSocketTransport::WebSocketTransport(TransportOptions options)
    : impl_(std::make_unique<Impl>(std::move(options)))
{
}

WebSocketTransport::~WebSocketTransport() = default;

llvm::Error WebSocketTransport::connect()
{
    return impl_->connect();
}

llvm::Expected<std::optional<std::string>> WebSocketTransport::send(const llvm::StringRef payload)
{
    return impl_->send(payload);
}

llvm::Expected<std::optional<std::string>> WebSocketTransport::receive()
{
    return impl_->receive();
}

void WebSocketTransport::interrupt()
{
    impl_->interrupt();
}

void WebSocketTransport::disconnect()
{
    impl_->disconnect();
}

bool WebSocketTransport::isAlive()
{
    return impl_->isAlive();
}

}  // namespace lspvisor
