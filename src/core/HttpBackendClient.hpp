#ifndef HTTPBACKENDCLIENT_HPP
#define HTTPBACKENDCLIENT_HPP

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_set>

#include "AsyncHttpClientSession.hpp"
#include "../interfaces/IBackendClient.hpp"
#include "../interfaces/ILogger.hpp"

// IBackendClient over Beast. Keeps every in-flight session so shutdown can
// cancel them.
class HttpBackendClient : public IBackendClient {
public:
    HttpBackendClient(net::io_context& ioc, std::chrono::milliseconds timeout, std::shared_ptr<ILogger> logger);

    void get(const BackendUrlInfo& backend, const std::string& target, Callback on_complete) override;
    void cancelAll() override;

    std::size_t activeSessions() const;

private:
    net::io_context& ioc_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<ILogger> logger_;
    mutable std::mutex sessions_mutex_;
    std::unordered_set<std::shared_ptr<AsyncHttpClientSession>> active_sessions_;
};

#endif // HTTPBACKENDCLIENT_HPP
