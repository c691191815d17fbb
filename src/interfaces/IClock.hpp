#pragma once

#include <chrono>

// Source of "now" for everything that ages: cache records, scan throttling,
// circuit breaker cool-off. Injected so tests can move time by hand.
class IClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;
    virtual time_point now() const = 0;
};
