#include "BeastHttpServer.hpp"
#include "CachingFacade.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace {
std::string sessionId(const std::shared_ptr<HttpServerSession>& session) {
    std::ostringstream oss;
    oss << static_cast<void*>(session.get());
    return oss.str();
}
}

BeastHttpServer::BeastHttpServer(net::io_context& ioc,
                                 tcp::endpoint endpoint,
                                 std::shared_ptr<CachingFacade> facade,
                                 std::shared_ptr<ILogger> logger,
                                 const AppConfig& config)
    : ioc_(ioc),
      acceptor_(ioc),
      facade_(std::move(facade)),
      logger_(std::move(logger)),
      config_(config) {
    if (!facade_) {
        throw std::invalid_argument("CachingFacade pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }

    auto check = [this](beast::error_code ec, const char* step) {
        if (ec) {
            logger_->error(std::string("BeastHttpServer ") + step + " error: " + ec.message());
            throw std::runtime_error(std::string("Failed to ") + step + ": " + ec.message());
        }
    };

    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    check(ec, "open acceptor");
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    check(ec, "set reuse_address");
    acceptor_.bind(endpoint, ec);
    check(ec, "bind");
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    check(ec, "listen");
}

void BeastHttpServer::run() {
    auto endpoint = localEndpoint();
    logger_->setup("BeastHttpServer listening on " + endpoint.address().to_string() + ":" + std::to_string(endpoint.port()));
    do_accept();
}

void BeastHttpServer::stop() {
    logger_->info("BeastHttpServer stopping...");
    beast::error_code ec;
    acceptor_.cancel(ec);
    if (ec) logger_->error("BeastHttpServer acceptor cancel error: " + ec.message());
    acceptor_.close(ec);
    if (ec) logger_->error("BeastHttpServer acceptor close error: " + ec.message());

    std::unordered_set<std::shared_ptr<HttpServerSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(active_sessions_);
    }
    logger_->info("BeastHttpServer closing " + std::to_string(sessions.size()) + " session(s).");
    for (const auto& session : sessions) {
        session->stop();
    }
}

tcp::endpoint BeastHttpServer::localEndpoint() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? tcp::endpoint{} : endpoint;
}

void BeastHttpServer::do_accept() {
    // Each connection gets its own strand so a session's handlers never run
    // concurrently on the multi-threaded io_context.
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&BeastHttpServer::on_accept, shared_from_this()));
}

void BeastHttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        logger_->error("BeastHttpServer accept error: " + ec.message());
        return do_accept();
    }

    auto session = std::make_shared<HttpServerSession>(
        std::move(socket),
        facade_,
        logger_,
        config_,
        [self = shared_from_this()](std::shared_ptr<HttpServerSession> finished) {
            self->on_session_finish(finished);
        });

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active_sessions_.insert(session);
    }
    if (logger_->isDebugEnabled()) {
        logger_->debug("BeastHttpServer::on_accept - session " + sessionId(session) + " started.");
    }

    session->run();
    do_accept();
}

void BeastHttpServer::on_session_finish(std::shared_ptr<HttpServerSession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    size_t erased_count = active_sessions_.erase(session);
    if (erased_count > 0) {
        if (logger_->isDebugEnabled()) {
            logger_->debug("BeastHttpServer::on_session_finish - removed session " + sessionId(session)
                + ". Active sessions: " + std::to_string(active_sessions_.size()));
        }
    } else {
        // stop() clears the set before sessions report back.
        logger_->debug("BeastHttpServer::on_session_finish - session " + sessionId(session) + " already released.");
    }
}
