#include "HttpServerSession.hpp"
#include "CachingFacade.hpp"

#include <string>

void HttpServerSession::handle_request(http::request<http::string_body>&& req) {
    if (!facade_) {
        logger_->error("HttpServerSession " + id() + ": facade is null.");
        return send_response(makeErrorResponse(http::status::internal_server_error,
            "Internal server error: service not available.", req.version(), req.keep_alive()));
    }

    // Responses may be produced on another strand (the cache's); hop back.
    auto respond = [self = shared_from_this()](std::optional<http::response<http::string_body>> opt_res) {
        net::dispatch(self->stream_.get_executor(), [self, opt_res = std::move(opt_res)]() mutable {
            self->send_response(std::move(opt_res));
        });
    };

    beast::string_view target_path = req.target();
    size_t query_pos = target_path.find('?');
    if (query_pos != beast::string_view::npos) {
        target_path = target_path.substr(0, query_pos);
    }

    if (req.method() != http::verb::get) {
        http::response<http::string_body> res{http::status::method_not_allowed, req.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, "text/plain");
        res.set(http::field::allow, "GET");
        res.keep_alive(req.keep_alive());
        res.body() = "Only GET is supported.";
        res.prepare_payload();
        return send_response(std::move(res));
    }

    if (target_path.rfind(Constants::RESOURCE_PATH_PREFIX, 0) == 0) {
        facade_->processResourceRequest(req, respond);
    } else if (target_path == Constants::STATUS_PATH) {
        facade_->processStatusRequest(req, respond);
    } else {
        logger_->debug("HttpServerSession " + id() + " target not found: " + std::string(req.target()));
        http::response<http::string_body> res{http::status::not_found, req.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, "text/plain");
        res.keep_alive(req.keep_alive());
        res.body() = "The resource '" + std::string(req.target()) + "' was not found.";
        res.prepare_payload();
        send_response(std::move(res));
    }
}

void HttpServerSession::send_response(std::optional<http::response<http::string_body>>&& opt_res) {
    request_pending_ = false;

    if (!opt_res) {
        logger_->warn("HttpServerSession " + id() + "::send_response: request dropped without a response.");
        if (write_in_progress_) {
            return;
        }
        return keep_alive_ ? do_read() : do_close();
    }

    if (response_queue_.size() >= config_.max_response_queue_size) {
        logger_->warn("HttpServerSession " + id() + "::send_response: response queue is full ("
            + std::to_string(response_queue_.size()) + "). Discarding oldest response.");
        response_queue_.pop_front();
    }
    response_queue_.push_back(std::make_shared<http::response<http::string_body>>(std::move(*opt_res)));

    if (!write_in_progress_) {
        do_write();
    }
}

void HttpServerSession::do_write() {
    if (response_queue_.empty()) {
        write_in_progress_ = false;
        return;
    }
    if (!stream_.socket().is_open()) {
        logger_->error("HttpServerSession " + id() + "::do_write - socket is not open. Dropping queued responses.");
        response_queue_.clear();
        write_in_progress_ = false;
        return do_close();
    }

    write_in_progress_ = true;
    auto response = response_queue_.front();
    stream_.expires_after(std::chrono::seconds(30));
    http::async_write(stream_, *response,
        [self = shared_from_this(), response](beast::error_code ec, std::size_t bytes_transferred) {
            self->on_write(response->keep_alive(), ec, bytes_transferred);
        });
}

void HttpServerSession::on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
        if (ec != net::error::operation_aborted) {
            logger_->error("HttpServerSession " + id() + " on_write error: " + ec.message());
        }
        response_queue_.clear();
        write_in_progress_ = false;
        return do_close();
    }

    if (!response_queue_.empty()) {
        response_queue_.pop_front();
    }
    if (!response_queue_.empty()) {
        return do_write();
    }

    write_in_progress_ = false;
    if (!keep_alive) {
        return do_close();
    }
    if (!request_pending_) {
        do_read();
    }
}

void HttpServerSession::do_close() {
    beast::error_code ec;
    if (stream_.socket().is_open()) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
    if (ec && ec != beast::errc::not_connected) {
        logger_->debug("HttpServerSession " + id() + " socket shutdown warning in do_close: " + ec.message());
    }

    if (on_finish_callback_) {
        auto cb = std::move(on_finish_callback_);
        on_finish_callback_ = nullptr;
        net::post(stream_.get_executor(), beast::bind_front_handler(std::move(cb), shared_from_this()));
    }
}
