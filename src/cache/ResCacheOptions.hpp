#ifndef RESCACHEOPTIONS_HPP
#define RESCACHEOPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "../config/AppConfig.hpp"

enum class TtlPolicy {
    Disabled,  // ttl == 0: results are fanned out but never kept
    Periodic,  // ttl == -1: scanner drops the oldest records regardless of age
    Expiring   // ttl > 0: records expire ttl after creation
};

struct ResCacheOptions {
    std::chrono::milliseconds ttl{0};
    std::size_t max_evicted = 2;
    std::chrono::milliseconds scan_interval{60 * 1000};

    TtlPolicy policy() const {
        if (ttl.count() == 0) return TtlPolicy::Disabled;
        if (ttl.count() < 0) return TtlPolicy::Periodic;
        return TtlPolicy::Expiring;
    }

    void validate() const {
        if (ttl.count() < -1) {
            throw std::invalid_argument("Cache ttl must be -1, 0 or positive, got " + std::to_string(ttl.count()));
        }
        if (scan_interval.count() < 0) {
            throw std::invalid_argument("Cache scan interval cannot be negative, got " + std::to_string(scan_interval.count()));
        }
    }

    static ResCacheOptions fromConfig(const AppConfig& config) {
        ResCacheOptions options;
        options.ttl = std::chrono::milliseconds(config.cache_ttl_in_millis);
        options.max_evicted = config.cache_max_evicted;
        options.scan_interval = std::chrono::milliseconds(config.cache_scan_interval_in_millis);
        return options;
    }
};

inline const char* to_string(TtlPolicy policy) {
    switch (policy) {
        case TtlPolicy::Disabled: return "disabled";
        case TtlPolicy::Periodic: return "periodic";
        case TtlPolicy::Expiring: return "expiring";
    }
    return "unknown";
}

// Counters kept by the cache. Read them on the cache's strand.
struct CacheStats {
    uint64_t hits = 0;       // served from a completed record
    uint64_t misses = 0;     // started a producer invocation
    uint64_t coalesced = 0;  // attached to an in-flight invocation
    uint64_t expired = 0;    // expired records dropped on read
    uint64_t evicted = 0;    // records dropped by the scanner
    uint64_t failures = 0;   // producer invocations that failed
    std::size_t records = 0;
    std::size_t queue_slots = 0;
};

#endif // RESCACHEOPTIONS_HPP
