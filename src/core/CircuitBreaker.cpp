#include "CircuitBreaker.hpp"

#include <chrono>
#include <string>

#include "../config/AppConfig.hpp"

bool CircuitBreaker::isTripped(const std::string& backendName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tripped_it = tripped_until_.find(backendName);
    if (tripped_it == tripped_until_.end()) {
        return false;
    }
    if (tripped_it->second > clock_->now()) {
        logger_->debug("Circuit breaker open for backend: " + backendName);
        return true;
    }
    tripped_until_.erase(tripped_it); // cool-off over
    return false;
}

void CircuitBreaker::trip(const std::string& backendName, std::chrono::milliseconds coolDownDuration) {
    std::lock_guard<std::mutex> lock(mutex_);
    tripped_until_[backendName] = clock_->now() + coolDownDuration;
    statsd_client_->increment(MetricsDefinitions::CIRCUIT_BREAKER_TRIPPED);
    logger_->error("Tripping circuit breaker for backend: " + backendName + " for " + std::to_string(coolDownDuration.count()) + "ms");
}
