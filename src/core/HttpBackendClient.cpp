#include "HttpBackendClient.hpp"

#include <stdexcept>
#include <vector>

HttpBackendClient::HttpBackendClient(net::io_context& ioc, std::chrono::milliseconds timeout, std::shared_ptr<ILogger> logger)
    : ioc_(ioc), timeout_(timeout), logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
}

void HttpBackendClient::get(const BackendUrlInfo& backend, const std::string& target, Callback on_complete) {
    if (backend.is_https) {
        // No TLS stream wired in; fail the request the same way a transport error would.
        logger_->error("HTTPS backends are not supported: " + backend.url);
        return on_complete({}, boost::asio::error::operation_not_supported);
    }

    // The session removes itself from active_sessions_ when it completes.
    auto holder = std::make_shared<std::weak_ptr<AsyncHttpClientSession>>();
    auto session = std::make_shared<AsyncHttpClientSession>(
        ioc_, backend, target, timeout_,
        [this, holder, on_complete = std::move(on_complete)](http::response<http::string_body> res, beast::error_code ec) {
            if (auto finished = holder->lock()) {
                std::lock_guard<std::mutex> lock(sessions_mutex_);
                active_sessions_.erase(finished);
            }
            on_complete(std::move(res), ec);
        },
        logger_);
    *holder = session;

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active_sessions_.insert(session);
    }
    if (logger_->isDebugEnabled()) {
        logger_->debug("HttpBackendClient: GET " + backend.url + target);
    }
    session->run();
}

void HttpBackendClient::cancelAll() {
    std::vector<std::shared_ptr<AsyncHttpClientSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.assign(active_sessions_.begin(), active_sessions_.end());
    }
    logger_->info("HttpBackendClient: cancelling " + std::to_string(sessions.size()) + " backend call(s)");
    for (auto& session : sessions) {
        session->cancel();
    }
}

std::size_t HttpBackendClient::activeSessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return active_sessions_.size();
}
