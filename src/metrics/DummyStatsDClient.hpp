#pragma once

#include "../interfaces/IStatsDClient.hpp"

// Stands in for StatsDClient when no STATSD_SERVER is configured: every
// metric is dropped.
class DummyStatsDClient final : public IStatsDClient {
public:
    void increment(const std::string&, int = 1) override {}
    void decrement(const std::string&, int = 1) override {}
    void gauge(const std::string&, double) override {}
    void timing(const std::string&, std::chrono::milliseconds) override {}
};
