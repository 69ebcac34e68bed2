//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the request-per-call HTTP transport on Boost.Beast.
///
/// Each `send` opens a connection, posts the payload as `application/json`,
/// and returns the response body. There is no inbound stream.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Transport/HttpTransport.h"

#include "lspvisor/Support/Error.h"
#include "lspvisor/Support/Logging.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <mutex>
#include <utility>

namespace lspvisor
{

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

class HttpTransport::Impl final
{
public:
    explicit Impl(TransportOptions options)
        : options_(std::move(options))
    {
    }

    llvm::Error connect()
    {
        asio::io_context          io;
        tcp::resolver             resolver(io);
        boost::system::error_code ec;
        resolver.resolve(options_.host, std::to_string(options_.port), ec);
        if (ec)
        {
            return makeConnectionError("cannot resolve " + options_.host + ": " + ec.message());
        }
        interrupted_.store(false);
        open_.store(true);
        logInfo("http", "using endpoint " + targetText());
        return llvm::Error::success();
    }

    llvm::Expected<std::optional<std::string>> send(const llvm::StringRef payload)
    {
        if (!open_.load())
        {
            return makeConnectionError("http transport is not connected");
        }

        asio::io_context io;
        {
            std::lock_guard<std::mutex> lock(activeMutex_);
            active_ = &io;
        }

        tcp::resolver                     resolver(io);
        beast::tcp_stream                 stream(io);
        beast::flat_buffer                buffer;
        http::request<http::string_body>  request{http::verb::post, options_.path, 11};
        http::response<http::string_body> response;
        boost::system::error_code         failure;
        bool                              finished = false;

        request.set(http::field::host, options_.host + ":" + std::to_string(options_.port));
        request.set(http::field::user_agent, "lspvisor");
        request.set(http::field::content_type, "application/json");
        request.body() = payload.str();
        request.prepare_payload();

        resolver.async_resolve(
            options_.host,
            std::to_string(options_.port),
            [&](const boost::system::error_code& ec, const tcp::resolver::results_type& results) {
                if (ec)
                {
                    failure = ec;
                    return;
                }
                stream.expires_after(options_.requestTimeout);
                stream.async_connect(results, [&](const boost::system::error_code& connectEc, const tcp::endpoint&) {
                    if (connectEc)
                    {
                        failure = connectEc;
                        return;
                    }
                    http::async_write(stream, request, [&](const boost::system::error_code& writeEc, std::size_t) {
                        if (writeEc)
                        {
                            failure = writeEc;
                            return;
                        }
                        http::async_read(stream, buffer, response, [&](const boost::system::error_code& readEc, std::size_t) {
                            failure  = readEc;
                            finished = !readEc;
                        });
                    });
                });
            });
        io.run();

        {
            std::lock_guard<std::mutex> lock(activeMutex_);
            active_ = nullptr;
        }
        boost::system::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

        if (interrupted_.load())
        {
            return makeConnectionError("http request to " + targetText() + " aborted");
        }
        if (failure == beast::error::timeout)
        {
            return makeTimeoutError("http request to " + targetText() + " timed out");
        }
        if (failure || !finished)
        {
            return makeConnectionError("http request to " + targetText() + " failed: " +
                                       (failure ? failure.message() : std::string("incomplete")));
        }

        const unsigned status = response.result_int();
        if (status < 200U || status >= 300U)
        {
            return makeConnectionError("http request to " + targetText() + " returned status " +
                                       std::to_string(status));
        }
        if (llvm::StringRef(response.body()).trim().empty())
        {
            return std::optional<std::string>();
        }
        return std::optional<std::string>(std::move(response.body()));
    }

    void interrupt()
    {
        interrupted_.store(true);
        std::lock_guard<std::mutex> lock(activeMutex_);
        if (active_ != nullptr)
        {
            active_->stop();
        }
    }

    void disconnect()
    {
        open_.store(false);
    }

    bool isAlive() const
    {
        return open_.load();
    }

private:
    std::string targetText() const
    {
        return "http://" + options_.host + ":" + std::to_string(options_.port) + options_.path;
    }

    TransportOptions  options_;
    std::mutex        activeMutex_;
    asio::io_context* active_{nullptr};
    std::atomic_bool  open_{false};
    std::atomic_bool  interrupted_{false};
};

HttpTransport::HttpTransport(TransportOptions options)
    : impl_(std::make_unique<Impl>(std::move(options)))
{
}

HttpTransport::~HttpTransport() = default;

llvm::Error HttpTransport::connect()
{
    return impl_->connect();
}

llvm::Expected<std::optional<std::string>> HttpTransport::send(const llvm::StringRef payload)
{
    return impl_->send(payload);
}

llvm::Expected<std::optional<std::string>> HttpTransport::receive()
{
    // Responses are returned by send().
    return std::optional<std::string>();
}

void HttpTransport::interrupt()
{
    impl_->interrupt();
}

void HttpTransport::disconnect()
{
    impl_->disconnect();
}

bool HttpTransport::isAlive()
{
    return impl_->isAlive();
}

}  // namespace lspvisor
