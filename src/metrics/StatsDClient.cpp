#include <stdexcept>

#include "StatsDClient.hpp"

std::pair<std::string, uint16_t> StatsDClient::parseEndpoint(const std::string& endpoint) {
    auto colon_pos = endpoint.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = endpoint.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }

    int port;
    try {
        size_t pos;
        std::string port_str = endpoint.substr(colon_pos + 1);
        port = std::stoi(port_str, &pos);
        if (pos != port_str.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }
    if (port <= 0 || port > 65535) {
        throw std::runtime_error("Port out of range in STATSD_SERVER: " + std::to_string(port));
    }
    return {host, static_cast<uint16_t>(port)};
}

StatsDClient::StatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger, const std::string& stats_server_endpoint)
    : logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    auto [host, port] = parseEndpoint(stats_server_endpoint);

    client_ = std::make_unique<Statsd::StatsdClient>(
        host, port, "",
        static_cast<uint64_t>(config.metrics_batch_size),
        static_cast<uint64_t>(config.metrics_send_interval_in_millis));
    if (!client_->errorMessage().empty()) {
        throw std::runtime_error("Failed to initialize StatsD sender: " + client_->errorMessage());
    }
    logger_->setup("StatsDClient sending to " + host + ":" + std::to_string(port)
        + " (batch " + std::to_string(config.metrics_batch_size) + ", every "
        + std::to_string(config.metrics_send_interval_in_millis) + "ms)");
}

StatsDClient::~StatsDClient() {
    // Pushes out whatever is still batched before the sender thread stops.
    client_->flush();
    logger_->debug("StatsDClient destroyed.");
}

void StatsDClient::increment(const std::string& key, int value) {
    client_->count(key, value);
}

void StatsDClient::decrement(const std::string& key, int value) {
    client_->count(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    client_->gauge(key, value);
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    client_->timing(key, static_cast<unsigned int>(value.count()));
}
