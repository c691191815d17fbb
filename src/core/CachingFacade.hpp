#ifndef CACHINGFACADE_HPP
#define CACHINGFACADE_HPP

#include <boost/asio/io_context.hpp>
#include <boost/beast/http.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "CircuitBreaker.hpp"
#include "../cache/ResCache.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/IBackendClient.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/BackendError.hpp"
#include "../models/BackendResponse.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

using json = nlohmann::json;

// HTTP front for the configured backends. Identical resource requests share a
// single upstream call through the result cache; successful replies are kept
// according to the cache policy, failures never are.
class CachingFacade {
public:
    using ResponseCallback = std::function<void(std::optional<http::response<http::string_body>>)>;
    using Cache = ResCache<std::string, BackendResponse>;

    CachingFacade(net::io_context& ioc,
                  std::shared_ptr<IBackendClient> backend_client,
                  std::shared_ptr<IStatsDClient> statsd_client,
                  const AppConfig& config,
                  std::shared_ptr<ILogger> logger,
                  std::shared_ptr<IClock> clock);

    virtual ~CachingFacade() = default;

    CachingFacade(const CachingFacade&) = delete;
    CachingFacade& operator=(const CachingFacade&) = delete;
    CachingFacade(CachingFacade&&) = delete;
    CachingFacade& operator=(CachingFacade&&) = delete;

    // GET /resource/<backend>/<path>
    void processResourceRequest(const http::request<http::string_body>& req, ResponseCallback send_response_cb) const;
    // GET /status
    void processStatusRequest(const http::request<http::string_body>& req, ResponseCallback send_response_cb) const;
    void cancel_active_backend_calls() const;

    const std::shared_ptr<Cache>& cache() const { return cache_; }

private:
    std::shared_ptr<IBackendClient> backend_client_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IClock> clock_;
    std::unique_ptr<CircuitBreaker> circuit_breaker_;
    std::shared_ptr<Cache> cache_;

    const BackendUrlInfo* findBackendInfo(const std::string& name) const;
    void fetchFromBackend(const BackendUrlInfo& backend, const std::string& path, Cache::ResultHandler done) const;
    BackendResponse toBackendResponse(const BackendUrlInfo& backend, const std::string& path,
                                      http::response<http::string_body>& res, beast::error_code ec) const;
    http::response<http::string_body> errorResponse(std::exception_ptr error, unsigned version, bool keep_alive) const;
};

// Small builders shared with the server session.
http::response<http::string_body> makeJsonResponse(http::status status, const json& body, unsigned version, bool keep_alive);
http::response<http::string_body> makeErrorResponse(http::status status, const std::string& message, unsigned version, bool keep_alive);

#endif // CACHINGFACADE_HPP
