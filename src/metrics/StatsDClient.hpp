#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <cpp-statsd-client/StatsdClient.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// IStatsDClient over cpp-statsd-client. Metrics are batched and flushed by
// the library's sender thread every metrics_send_interval.
class StatsDClient : public IStatsDClient {
public:
    // stats_server_endpoint is "<host>:<port>". Throws std::runtime_error if
    // it cannot be parsed or the UDP sender fails to start.
    StatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger, const std::string& stats_server_endpoint);
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;

    // Splits "<host>:<port>", mapping "localhost" to 127.0.0.1.
    static std::pair<std::string, uint16_t> parseEndpoint(const std::string& endpoint);

private:
    std::shared_ptr<ILogger> logger_;
    std::unique_ptr<Statsd::StatsdClient> client_;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};
