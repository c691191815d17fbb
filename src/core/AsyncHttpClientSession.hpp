#ifndef ASYNC_HTTP_CLIENT_SESSION_HPP
#define ASYNC_HTTP_CLIENT_SESSION_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../models/BackendUrlInfo.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One GET against one backend: resolve, connect, write, read, with an overall
// deadline. on_complete runs exactly once, whichever of completion, timeout or
// cancel() comes first.
class AsyncHttpClientSession : public std::enable_shared_from_this<AsyncHttpClientSession> {
public:
    using Callback = std::function<void(http::response<http::string_body>, beast::error_code)>;

    AsyncHttpClientSession(
        net::io_context& ioc,
        BackendUrlInfo backendInfo,
        const std::string& target_path,
        std::chrono::milliseconds timeout,
        Callback on_complete,
        std::shared_ptr<ILogger> logger = nullptr)
        : strand_(net::make_strand(ioc)),
          resolver_(strand_),
          stream_(strand_),
          backend_info_(std::move(backendInfo)),
          on_complete_(std::move(on_complete)),
          logger_(logger),
          timer_(strand_) {
        req_.version(11); // HTTP/1.1
        req_.method(http::verb::get);
        req_.target(target_path);
        req_.set(http::field::host, backend_info_.backend_host);
        req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req_.keep_alive(false);
        req_.prepare_payload();

        timer_.expires_after(timeout);
    }

    void run() {
        net::dispatch(strand_, [self = shared_from_this()]() {
            self->timer_.async_wait(beast::bind_front_handler(&AsyncHttpClientSession::on_timeout, self));
            self->do_resolve();
        });
    }

    void cancel() {
        net::dispatch(strand_, [self = shared_from_this()]() {
            self->timer_.cancel();
            beast::error_code ec;
            self->stream_.socket().close(ec);
            self->finish({}, net::error::operation_aborted);
        });
    }

    const BackendUrlInfo& backend() const { return backend_info_; }

private:
    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    BackendUrlInfo backend_info_;
    Callback on_complete_;
    std::shared_ptr<ILogger> logger_;
    net::steady_timer timer_;
    bool completed_ = false;

    void finish(http::response<http::string_body> res, beast::error_code ec) {
        if (completed_) {
            return;
        }
        completed_ = true;
        timer_.cancel();
        auto callback = std::move(on_complete_);
        on_complete_ = nullptr;
        callback(std::move(res), ec);
    }

    void on_timeout(beast::error_code ec) {
        if (ec == net::error::operation_aborted || completed_) {
            return;
        }
        if (logger_) logger_->error("AsyncHttpClientSession timeout for " + backend_info_.url + std::string(req_.target()));
        resolver_.cancel();
        beast::error_code close_ec;
        stream_.socket().close(close_ec);
        finish({}, beast::errc::make_error_code(beast::errc::timed_out));
    }

    void do_resolve() {
        resolver_.async_resolve(
            backend_info_.backend_host,
            std::to_string(backend_info_.backend_port),
            beast::bind_front_handler(&AsyncHttpClientSession::on_resolve, shared_from_this()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return finish({}, ec);
        if (completed_) return;
        stream_.async_connect(
            results,
            beast::bind_front_handler(&AsyncHttpClientSession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return finish({}, ec);
        if (completed_) return;
        // Note: HTTPS would require an SSL handshake here
        http::async_write(stream_, req_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);
        if (ec) return finish({}, ec);
        if (completed_) return;
        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        beast::error_code shut_ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, shut_ec);
        if (shut_ec && shut_ec != beast::errc::not_connected && logger_) {
            logger_->debug("AsyncHttpClientSession shutdown error: " + shut_ec.message());
        }

        finish(std::move(res_), ec == http::error::end_of_stream ? beast::error_code{} : ec);
    }
};

#endif // ASYNC_HTTP_CLIENT_SESSION_HPP
