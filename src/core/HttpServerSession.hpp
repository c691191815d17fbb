#ifndef HTTP_SERVER_SESSION_HPP
#define HTTP_SERVER_SESSION_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class CachingFacade;

// One client connection. Reads requests, routes them to the facade and
// writes responses back in order. Everything runs on the stream's strand;
// facade callbacks are hopped back onto it before touching session state.
class HttpServerSession : public std::enable_shared_from_this<HttpServerSession> {
public:
    HttpServerSession(
        tcp::socket&& socket,
        std::shared_ptr<CachingFacade> service,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config,
        std::function<void(std::shared_ptr<HttpServerSession>)> on_finish)
        : stream_(std::move(socket)),
          facade_(service),
          logger_(logger),
          config_(config),
          on_finish_callback_(std::move(on_finish)) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&HttpServerSession::do_read, shared_from_this()));
    }

    void stop() {
        net::dispatch(stream_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            if (self->stream_.socket().is_open()) {
                self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
                self->stream_.socket().close(ec);
            }
            if (ec && ec != beast::errc::not_connected) {
                self->logger_->error("HttpServerSession " + self->id() + " socket close error during stop: " + ec.message());
            }
        });
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<CachingFacade> facade_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::function<void(std::shared_ptr<HttpServerSession>)> on_finish_callback_;

    std::deque<std::shared_ptr<http::response<http::string_body>>> response_queue_;
    bool write_in_progress_ = false;
    bool request_pending_ = false;
    bool keep_alive_ = true;

    http::request<http::string_body> req_;

    std::string id() const {
        std::ostringstream oss;
        oss << static_cast<const void*>(this);
        return oss.str();
    }

    void do_read() {
        req_ = {};
        stream_.expires_after(std::chrono::seconds(30));
        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(&HttpServerSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec == http::error::end_of_stream) {
            return do_close();
        }
        if (ec) {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
                logger_->error("HttpServerSession " + id() + " on_read error: " + ec.message());
            }
            return do_close();
        }

        if (logger_->isDebugEnabled()) {
            logger_->debug("HttpServerSession " + id() + " handling " + std::string(req_.target()));
        }
        keep_alive_ = req_.keep_alive();
        request_pending_ = true;
        handle_request(std::move(req_));
    }

    // Implemented in HttpServerSession.cpp
    void handle_request(http::request<http::string_body>&& req);

    void send_response(std::optional<http::response<http::string_body>>&& opt_res);

    void do_write();
    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
};

#endif // HTTP_SERVER_SESSION_HPP
