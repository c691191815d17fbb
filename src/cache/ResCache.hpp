#ifndef RESCACHE_HPP
#define RESCACHE_HPP

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "EvictionQueue.hpp"
#include "ResCacheOptions.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"

namespace net = boost::asio;

// Request-coalescing result cache.
//
// get(key, fetch, handler) runs fetch at most once per key per validity window
// and hands its single outcome to every caller that asked for the key while
// it was running. Stale records are dropped lazily: every get() first gives
// the scanner a chance to evict up to max_evicted records, at most once per
// scan_interval.
//
// All state lives on one strand, so the io_context may be run by any number
// of threads. The fetch function may complete from any thread.
//
// Fan-out order is not guaranteed: coalesced callers are resumed before the
// caller that started the fetch, in attach order, but nothing depends on it.
//
// Must be owned by a std::shared_ptr (in-flight work keeps it alive).
// Value must be default constructible and copyable.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class ResCache : public std::enable_shared_from_this<ResCache<Key, Value, Hash>> {
public:
    // Outcome of a fetch: (nullptr, value) on success, (error, Value{}) on failure.
    using ResultHandler = std::function<void(std::exception_ptr, Value)>;
    // Must call its argument exactly once. Throwing counts as failure.
    using FetchFunction = std::function<void(ResultHandler)>;
    using Strand = net::strand<net::io_context::executor_type>;
    using StatsHandler = std::function<void(CacheStats)>;

    ResCache(net::io_context& ioc,
             const ResCacheOptions& options,
             std::shared_ptr<IClock> clock,
             std::shared_ptr<ILogger> logger)
        : strand_(net::make_strand(ioc)),
          options_(options),
          clock_(std::move(clock)),
          logger_(std::move(logger)) {
        if (!clock_) {
            throw std::invalid_argument("Clock pointer cannot be null");
        }
        if (!logger_) {
            throw std::invalid_argument("Logger pointer cannot be null");
        }
        options_.validate();
    }

    ResCache(const ResCache&) = delete;
    ResCache& operator=(const ResCache&) = delete;
    ResCache(ResCache&&) = delete;
    ResCache& operator=(ResCache&&) = delete;

    // handler is always invoked later on the cache's strand, never from
    // inside get().
    void get(Key key, FetchFunction fetch, ResultHandler handler) {
        net::dispatch(strand_,
            [self = this->shared_from_this(),
             key = std::move(key),
             fetch = std::move(fetch),
             handler = std::move(handler)]() mutable {
                self->lookup(std::move(key), std::move(fetch), std::move(handler));
            });
    }

    // Snapshot of the counters, taken on the strand.
    void collectStats(StatsHandler handler) {
        net::dispatch(strand_, [self = this->shared_from_this(), handler = std::move(handler)]() {
            handler(self->stats());
        });
    }

    // The accessors below read unsynchronized state: call them on the strand
    // or while nothing runs the io_context.
    std::size_t size() const { return records_.size(); }
    std::size_t queueSize() const { return queue_.size(); }

    CacheStats stats() const {
        CacheStats snapshot = stats_;
        snapshot.records = records_.size();
        snapshot.queue_slots = queue_.size();
        return snapshot;
    }

    const ResCacheOptions& options() const { return options_; }
    const Strand& get_executor() const { return strand_; }

private:
    using Sequence = typename EvictionQueue<Key>::Sequence;

    struct PendingRecord {
        uint64_t flight;
        std::vector<ResultHandler> waiters;
    };

    struct CompletedRecord {
        IClock::time_point timestamp;
        Value data;
        Sequence seq; // slot in queue_
    };

    using CacheRecord = std::variant<PendingRecord, CompletedRecord>;

    Strand strand_;
    ResCacheOptions options_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ILogger> logger_;

    std::unordered_map<Key, CacheRecord, Hash> records_;
    EvictionQueue<Key> queue_;
    std::optional<IClock::time_point> last_evicted_; // empty until the first scan
    uint64_t last_flight_ = 0;
    CacheStats stats_;

    void lookup(Key key, FetchFunction fetch, ResultHandler handler) {
        shrink();

        auto it = records_.find(key);
        if (it == records_.end()) {
            return invoke(std::move(key), std::move(fetch), std::move(handler));
        }

        if (auto* pending = std::get_if<PendingRecord>(&it->second)) {
            ++stats_.coalesced;
            pending->waiters.push_back(std::move(handler));
            return;
        }

        auto& completed = std::get<CompletedRecord>(it->second);
        if (isExpired(completed, clock_->now())) {
            // Tombstone rather than erase the slot: the scanner will skip it,
            // and the fresh record for this key gets a slot of its own.
            ++stats_.expired;
            queue_.tombstone(completed.seq);
            records_.erase(it);
            return invoke(std::move(key), std::move(fetch), std::move(handler));
        }

        ++stats_.hits;
        deliver(std::move(handler), nullptr, completed.data);
    }

    void invoke(Key key, FetchFunction fetch, ResultHandler handler) {
        // Installed before fetch runs so that every get() for this key until
        // settle() coalesces onto this invocation.
        const uint64_t flight = ++last_flight_;
        records_.insert_or_assign(key, PendingRecord{flight, {}});
        ++stats_.misses;

        auto self = this->shared_from_this();
        auto settled = std::make_shared<std::atomic<bool>>(false);
        ResultHandler on_fetched = [self, key, flight, handler, settled](std::exception_ptr error, Value value) {
            if (settled->exchange(true)) {
                self->logger_->warn("ResCache: producer completed more than once, ignoring the extra result");
                return;
            }
            net::post(self->strand_,
                [self, key, flight, handler, error, value = std::move(value)]() mutable {
                    self->settle(key, flight, std::move(handler), error, std::move(value));
                });
        };

        try {
            fetch(on_fetched);
        } catch (...) {
            on_fetched(std::current_exception(), Value{});
        }
    }

    void settle(const Key& key, uint64_t flight, ResultHandler handler, std::exception_ptr error, Value value) {
        std::vector<ResultHandler> waiters;
        auto it = records_.find(key);
        bool owned = false;
        if (it != records_.end()) {
            auto* pending = std::get_if<PendingRecord>(&it->second);
            if (pending && pending->flight == flight) {
                waiters = std::move(pending->waiters);
                owned = true;
            }
        }
        if (!owned) {
            logger_->warn("ResCache: in-flight record was gone when its producer completed");
        }

        if (error) {
            ++stats_.failures;
            for (auto& waiter : waiters) {
                deliver(std::move(waiter), error, Value{});
            }
            // No negative caching: the next get() retries.
            if (owned) {
                records_.erase(it);
            }
            deliver(std::move(handler), error, Value{});
            return;
        }

        for (auto& waiter : waiters) {
            deliver(std::move(waiter), nullptr, value);
        }

        if (options_.policy() == TtlPolicy::Disabled) {
            if (owned) {
                records_.erase(it);
            }
        } else if (owned || it == records_.end()) {
            CompletedRecord completed{clock_->now(), value, queue_.pushBack(key)};
            if (owned) {
                it->second = std::move(completed);
            } else {
                records_.emplace(key, std::move(completed));
            }
        }

        deliver(std::move(handler), nullptr, std::move(value));
    }

    // Evicts up to max_evicted records from the front of the queue. Runs at
    // most once per scan_interval.
    std::size_t shrink() {
        const TtlPolicy policy = options_.policy();
        if (policy == TtlPolicy::Disabled) {
            return 0;
        }

        const auto now = clock_->now();
        if (last_evicted_ && now < *last_evicted_ + options_.scan_interval) {
            return 0;
        }
        last_evicted_ = now;

        std::size_t evicted = 0;
        while (evicted < options_.max_evicted) {
            auto slot = queue_.popFront();
            if (!slot) {
                break;
            }
            if (!slot->key) {
                continue; // tombstone, record already dropped on read
            }

            auto it = records_.find(*slot->key);
            if (it == records_.end()) {
                continue;
            }
            auto* completed = std::get_if<CompletedRecord>(&it->second);
            if (!completed || completed->seq != slot->seq) {
                continue; // the key's current record lives in another slot
            }

            if (policy == TtlPolicy::Expiring && !isExpired(*completed, now)) {
                // Queue is in creation order: everything behind is younger.
                queue_.pushFront(std::move(*slot));
                break;
            }

            records_.erase(it);
            ++evicted;
        }

        stats_.evicted += evicted;
        if (evicted > 0 && logger_->isDebugEnabled()) {
            logger_->debug("ResCache: scanner evicted " + std::to_string(evicted)
                + " record(s), " + std::to_string(queue_.size()) + " queue slot(s) left");
        }
        return evicted;
    }

    bool isExpired(const CompletedRecord& record, IClock::time_point now) const {
        return options_.policy() == TtlPolicy::Expiring && record.timestamp + options_.ttl < now;
    }

    void deliver(ResultHandler handler, std::exception_ptr error, Value value) {
        net::post(strand_, [handler = std::move(handler), error, value = std::move(value)]() mutable {
            handler(error, std::move(value));
        });
    }
};

#endif // RESCACHE_HPP
