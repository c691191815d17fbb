#include "CachingFacade.hpp"

#include <boost/beast/version.hpp>

#include <chrono>
#include <stdexcept>
#include <utility>

#include "../utils/Utils.hpp"

http::response<http::string_body> makeJsonResponse(http::status status, const json& body, unsigned version, bool keep_alive) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

http::response<http::string_body> makeErrorResponse(http::status status, const std::string& message, unsigned version, bool keep_alive) {
    return makeJsonResponse(status, json{{"error", message}}, version, keep_alive);
}

CachingFacade::CachingFacade(net::io_context& ioc,
                             std::shared_ptr<IBackendClient> backend_client,
                             std::shared_ptr<IStatsDClient> statsd_client,
                             const AppConfig& config,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<IClock> clock)
    : backend_client_(std::move(backend_client)),
      statsd_client_(std::move(statsd_client)),
      config_(config),
      logger_(std::move(logger)),
      clock_(std::move(clock)) {
    if (!backend_client_) {
        throw std::invalid_argument("Backend client pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock pointer cannot be null");
    }
    circuit_breaker_ = std::make_unique<CircuitBreaker>(logger_, statsd_client_, clock_);
    cache_ = std::make_shared<Cache>(ioc, ResCacheOptions::fromConfig(config_), clock_, logger_);
    logger_->debug("CachingFacade initialized");
}

// --- Public Interface Method Implementations ---

void CachingFacade::processResourceRequest(const http::request<http::string_body>& req, ResponseCallback send_response_cb) const {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();
    statsd_client_->increment(MetricsDefinitions::REQUEST_RECEIVED);

    try {
        auto target = Utils::parseResourceTarget(std::string(req.target()));
        if (!target) {
            logger_->error("Returning 400 as request names no backend: " + std::string(req.target()));
            send_response_cb(makeErrorResponse(http::status::bad_request, "Missing backend name", version, keep_alive));
            return;
        }

        const BackendUrlInfo* backend = findBackendInfo(target->backend);
        if (!backend) {
            logger_->error("Unconfigured backend : " + target->backend);
            send_response_cb(makeErrorResponse(http::status::not_found, "Unconfigured backend", version, keep_alive));
            return;
        }

        const std::string cache_key = backend->name + target->path;
        cache_->get(
            cache_key,
            [this, backend, path = target->path](Cache::ResultHandler done) {
                fetchFromBackend(*backend, path, std::move(done));
            },
            [this, send_response_cb, version, keep_alive](std::exception_ptr error, BackendResponse value) {
                if (error) {
                    send_response_cb(errorResponse(error, version, keep_alive));
                    return;
                }
                http::response<http::string_body> res{http::status::ok, version};
                res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
                res.set(http::field::content_type,
                        value.content_type.empty() ? "application/octet-stream" : value.content_type);
                res.keep_alive(keep_alive);
                res.body() = std::move(value.body);
                res.prepare_payload();
                send_response_cb(std::move(res));
            });
    } catch (const std::exception& e) {
        logger_->error("Unexpected exception in processResourceRequest: " + std::string(e.what()));
        statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
        send_response_cb(makeErrorResponse(http::status::internal_server_error, "Internal Error", version, keep_alive));
    }
}

void CachingFacade::processStatusRequest(const http::request<http::string_body>& req, ResponseCallback send_response_cb) const {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();

    cache_->collectStats([this, send_response_cb, version, keep_alive](CacheStats stats) {
        const ResCacheOptions& options = cache_->options();
        json backends = json::array();
        for (const auto& [name, backend] : config_.backend_map) {
            backends.push_back({{"name", name}, {"url", backend.url}});
        }

        json body = {
            {"status", "ok"},
            {"cache", {
                {"policy", to_string(options.policy())},
                {"ttl_ms", options.ttl.count()},
                {"max_evicted", options.max_evicted},
                {"scan_interval_ms", options.scan_interval.count()},
                {"records", stats.records},
                {"queue_slots", stats.queue_slots},
                {"hits", stats.hits},
                {"misses", stats.misses},
                {"coalesced", stats.coalesced},
                {"expired", stats.expired},
                {"evicted", stats.evicted},
                {"failures", stats.failures}
            }},
            {"backends", backends}
        };
        send_response_cb(makeJsonResponse(http::status::ok, body, version, keep_alive));
    });
}

void CachingFacade::cancel_active_backend_calls() const {
    backend_client_->cancelAll();
}

// --- Private Helper Method Implementations ---

const BackendUrlInfo* CachingFacade::findBackendInfo(const std::string& name) const {
    auto it = config_.backend_map.find(name);
    if (it == config_.backend_map.end()) {
        return nullptr;
    }
    return &(it->second);
}

void CachingFacade::fetchFromBackend(const BackendUrlInfo& backend, const std::string& path, Cache::ResultHandler done) const {
    // --- Simple Circuit Breaker Check ---
    if (circuit_breaker_->isTripped(backend.name)) {
        done(std::make_exception_ptr(BackendError(BackendError::Kind::CircuitOpen,
                 "Circuit breaker open for backend " + backend.name)),
             BackendResponse{});
        return;
    }

    statsd_client_->increment(MetricsDefinitions::BACKEND_FETCH);
    const auto started = clock_->now();
    const BackendUrlInfo* backend_ptr = &backend;

    backend_client_->get(backend, path,
        [this, backend_ptr, path, done, started](http::response<http::string_body> res, beast::error_code ec) {
            statsd_client_->timing(MetricsDefinitions::BACKEND_FETCH,
                std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - started));

            BackendResponse value;
            std::exception_ptr error;
            try {
                value = toBackendResponse(*backend_ptr, path, res, ec);
            } catch (const BackendError&) {
                error = std::current_exception();
            }
            done(error, std::move(value));
        });
}

BackendResponse CachingFacade::toBackendResponse(const BackendUrlInfo& backend, const std::string& path,
                                                 http::response<http::string_body>& res, beast::error_code ec) const {
    if (ec) {
        statsd_client_->increment(MetricsDefinitions::BACKEND_ERROR);
        logger_->warn("Error calling backend " + backend.url + path + ": " + ec.message());
        throw BackendError(BackendError::Kind::Unreachable, "Backend unreachable: " + ec.message());
    }

    const unsigned status = res.result_int();
    if (status == 200) {
        BackendResponse value;
        value.status = status;
        value.content_type = std::string(res[http::field::content_type]);
        value.body = std::move(res.body());
        return value;
    }

    statsd_client_->increment(MetricsDefinitions::BACKEND_ERROR);
    if (status == 404) {
        logger_->debug("Backend " + backend.name + " has no resource " + path + ". Returning 404");
        throw BackendError(BackendError::Kind::NotFound, "Not found at backend " + backend.name, status);
    }
    if (status >= 500 && status < 600) {
        logger_->error("Backend returned " + std::to_string(status) + " for " + backend.url + path
            + ". Tripping circuit breaker for "
            + std::to_string(config_.circuit_breaker_cool_off_in_millis) + "ms.");
        circuit_breaker_->trip(backend.name, std::chrono::milliseconds(config_.circuit_breaker_cool_off_in_millis));
        throw BackendError(BackendError::Kind::UpstreamServerError,
            "Backend " + backend.name + " returned " + std::to_string(status), status);
    }

    logger_->error("Backend returned unexpected status " + std::to_string(status) + " for " + backend.url + path);
    throw BackendError(BackendError::Kind::UnexpectedStatus,
        "Backend " + backend.name + " returned " + std::to_string(status), status);
}

http::response<http::string_body> CachingFacade::errorResponse(std::exception_ptr error, unsigned version, bool keep_alive) const {
    try {
        std::rethrow_exception(error);
    } catch (const BackendError& e) {
        if (e.upstreamStatus() != 0 && logger_->isDebugEnabled()) {
            logger_->debug("Mapping upstream status " + std::to_string(e.upstreamStatus()) + ": " + e.what());
        }
        switch (e.kind()) {
            case BackendError::Kind::NotFound:
                return makeErrorResponse(http::status::not_found, "Not Found", version, keep_alive);
            case BackendError::Kind::UpstreamServerError:
                return makeErrorResponse(http::status::bad_gateway, "Bad Gateway - Upstream Server Error", version, keep_alive);
            case BackendError::Kind::UnexpectedStatus:
                return makeErrorResponse(http::status::bad_gateway, "Bad Gateway", version, keep_alive);
            case BackendError::Kind::Unreachable:
                return makeErrorResponse(http::status::gateway_timeout, "Gateway Timeout", version, keep_alive);
            case BackendError::Kind::CircuitOpen:
                return makeErrorResponse(http::status::gateway_timeout, "Gateway Timeout - Circuit Breaker Active", version, keep_alive);
        }
    } catch (const std::exception& e) {
        logger_->error("Unexpected exception from backend fetch: " + std::string(e.what()));
    } catch (...) {
        logger_->error("Unknown exception from backend fetch");
    }
    statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
    return makeErrorResponse(http::status::internal_server_error, "Internal Error", version, keep_alive);
}
