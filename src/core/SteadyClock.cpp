#include "SteadyClock.hpp"

IClock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}
