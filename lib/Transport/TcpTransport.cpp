//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the TCP transport on Boost.Asio.
///
/// The connect phase runs asynchronously on a private `io_context` so it can be
/// bounded and aborted. Afterwards reads and writes are synchronous: the
/// message loop blocks in `read_some` while callers write under a mutex, and
/// `interrupt` shuts the socket down to release the reader.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Transport/TcpTransport.h"

#include "lspvisor/Support/Error.h"
#include "lspvisor/Support/Logging.h"
#include "lspvisor/Transport/MessageFraming.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <utility>

#include <sys/socket.h>

namespace lspvisor
{

namespace asio = boost::asio;
using tcp      = asio::ip::tcp;

class TcpTransport::Impl final : private ByteSource
{
public:
    explicit Impl(TransportOptions options)
        : options_(std::move(options))
        , socket_(io_)
        , reader_(*this)
    {
    }

    ~Impl()
    {
        disconnect();
    }

    llvm::Error connect()
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (connected_)
        {
            return makeConnectionError("tcp transport is already connected");
        }
        interrupted_.store(false);
        peerClosed_.store(false);

        boost::system::error_code ec;
        tcp::resolver             resolver(io_);
        const auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port), ec);
        if (ec)
        {
            return makeConnectionError("cannot resolve " + options_.host + ": " + ec.message());
        }

        boost::system::error_code connectEc = asio::error::would_block;
        asio::async_connect(socket_,
                            endpoints,
                            [&connectEc](const boost::system::error_code& result, const tcp::endpoint&) {
                                connectEc = result;
                            });
        connecting_.store(true);
        io_.restart();
        io_.run_for(options_.connectTimeout);
        connecting_.store(false);

        if (connectEc == asio::error::would_block)
        {
            closeSocket();
            io_.restart();
            io_.poll();
            return makeConnectionError("timed out connecting to " + endpointText());
        }
        if (connectEc || interrupted_.load())
        {
            closeSocket();
            return makeConnectionError("failed to connect to " + endpointText() + ": " +
                                       (connectEc ? connectEc.message() : std::string("aborted")));
        }

        socket_.set_option(tcp::no_delay(true), ec);
        nativeHandle_.store(socket_.native_handle());
        reader_.reset();
        connected_ = true;
        logInfo("tcp", "connected to " + endpointText());
        return llvm::Error::success();
    }

    llvm::Expected<std::optional<std::string>> send(const llvm::StringRef payload)
    {
        const std::string           frame = encodeFrame(payload);
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (nativeHandle_.load() < 0)
        {
            return makeConnectionError("tcp transport is not connected");
        }
        boost::system::error_code ec;
        asio::write(socket_, asio::buffer(frame), ec);
        if (ec)
        {
            peerClosed_.store(true);
            return makeConnectionError("tcp write failed: " + ec.message());
        }
        return std::optional<std::string>();
    }

    llvm::Expected<std::optional<std::string>> receive()
    {
        if (nativeHandle_.load() < 0)
        {
            return makeConnectionError("tcp transport is not connected");
        }
        auto frame = reader_.readFrame();
        if (interrupted_.load())
        {
            if (!frame)
            {
                llvm::consumeError(frame.takeError());
            }
            return std::optional<std::string>();
        }
        if (frame && !*frame)
        {
            peerClosed_.store(true);
        }
        return frame;
    }

    void interrupt()
    {
        interrupted_.store(true);
        if (connecting_.load())
        {
            asio::post(io_, [this]() { closeSocket(); });
        }
        const int fd = nativeHandle_.load();
        if (fd >= 0)
        {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    void disconnect()
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!connected_)
        {
            return;
        }
        connected_ = false;
        {
            std::lock_guard<std::mutex> writeLock(writeMutex_);
            nativeHandle_.store(-1);
            closeSocket();
        }
        logDebug("tcp", "disconnected from " + endpointText());
    }

    bool isAlive()
    {
        return nativeHandle_.load() >= 0 && !peerClosed_.load();
    }

private:
    llvm::Expected<std::size_t> readSome(char* buffer, const std::size_t capacity) override
    {
        boost::system::error_code ec;
        const std::size_t         got = socket_.read_some(asio::buffer(buffer, capacity), ec);
        if (ec == asio::error::eof || interrupted_.load())
        {
            return 0U;
        }
        if (ec)
        {
            peerClosed_.store(true);
            return makeConnectionError("tcp read failed: " + ec.message());
        }
        return got;
    }

    void closeSocket()
    {
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    std::string endpointText() const
    {
        return options_.host + ":" + std::to_string(options_.port);
    }

    TransportOptions  options_;
    asio::io_context  io_;
    tcp::socket       socket_;
    FrameReader       reader_;
    std::mutex        stateMutex_;
    std::mutex        writeMutex_;
    bool              connected_{false};
    std::atomic_int   nativeHandle_{-1};
    std::atomic_bool  connecting_{false};
    std::atomic_bool  interrupted_{false};
    std::atomic_bool  peerClosed_{false};
};

TcpTransport::TcpTransport(TransportOptions options)
    : impl_(std::make_unique<Impl>(std::move(options)))
{
}

TcpTransport::~TcpTransport() = default;

llvm::Error TcpTransport::connect()
{
    return impl_->connect();
}

llvm::Expected<std::optional<std::string>> TcpTransport::send(const llvm::StringRef payload)
{
    return impl_->send(payload);
}

llvm::Expected<std::optional<std::string>> TcpTransport::receive()
{
    return impl_->receive();
}

void TcpTransport::interrupt()
{
    impl_->interrupt();
}

void TcpTransport::disconnect()
{
    impl_->disconnect();
}

bool TcpTransport::isAlive()
{
    return impl_->isAlive();
}

}  // namespace lspvisor
