#ifndef CIRCUITBREAKER_HPP
#define CIRCUITBREAKER_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Per-backend cool-off: once tripped, a backend is not called again until
// the cool-off period has passed.
class CircuitBreaker {
public:
    CircuitBreaker(std::shared_ptr<ILogger> logger,
                   std::shared_ptr<IStatsDClient> statsd_client,
                   std::shared_ptr<IClock> clock)
        : logger_(logger), statsd_client_(statsd_client), clock_(clock) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for CircuitBreaker");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient cannot be null for CircuitBreaker");
        }
        if (!clock_) {
            throw std::invalid_argument("Clock cannot be null for CircuitBreaker");
        }
    }

    bool isTripped(const std::string& backendName);

    void trip(const std::string& backendName, std::chrono::milliseconds coolDownDuration);

private:
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, IClock::time_point> tripped_until_;
};

#endif // CIRCUITBREAKER_HPP
