#pragma once

#include <chrono>
#include <string>

// StatsD metric sink. Implementations must be safe to call from any thread
// and must never throw.
class IStatsDClient {
public:
    virtual ~IStatsDClient() = default;

    // Counter ("|c").
    virtual void increment(const std::string& key, int value = 1) = 0;
    virtual void decrement(const std::string& key, int value = 1) = 0;
    // Gauge ("|g").
    virtual void gauge(const std::string& key, double value) = 0;
    // Timer ("|ms").
    virtual void timing(const std::string& key, std::chrono::milliseconds value) = 0;
};
