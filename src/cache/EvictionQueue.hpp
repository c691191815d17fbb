#ifndef EVICTIONQUEUE_HPP
#define EVICTIONQUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>

// FIFO of cache keys in creation order, consumed from the front by the
// scanner. A slot whose record was removed elsewhere is tombstoned in place
// instead of erased so that no other slot moves.
//
// Every slot is addressed by a sequence number that never changes while the
// slot is queued: the front slot's sequence is front_seq_, the next one is
// front_seq_ + 1, and so on. Popping from the front advances front_seq_, so a
// sequence handed out by pushBack() stays valid until that slot is popped.
template <typename Key>
class EvictionQueue {
public:
    using Sequence = std::uint64_t;

    struct Slot {
        Sequence seq;
        std::optional<Key> key; // nullopt: tombstone
    };

    // Appends key at the back and returns the slot's sequence.
    Sequence pushBack(const Key& key) {
        Sequence seq = front_seq_ + slots_.size();
        slots_.emplace_back(key);
        return seq;
    }

    std::optional<Slot> popFront() {
        if (slots_.empty()) {
            return std::nullopt;
        }
        Slot slot{front_seq_, std::move(slots_.front())};
        slots_.pop_front();
        ++front_seq_;
        return slot;
    }

    // Undoes the last popFront(). The slot must be the one just popped.
    void pushFront(Slot slot) {
        slots_.push_front(std::move(slot.key));
        --front_seq_;
    }

    // Returns false if seq is no longer (or not yet) in the queue.
    bool tombstone(Sequence seq) {
        if (seq < front_seq_ || seq - front_seq_ >= slots_.size()) {
            return false;
        }
        slots_[seq - front_seq_].reset();
        return true;
    }

    bool isTombstone(Sequence seq) const {
        return seq >= front_seq_ && seq - front_seq_ < slots_.size() && !slots_[seq - front_seq_];
    }

    std::size_t size() const { return slots_.size(); }
    bool empty() const { return slots_.empty(); }
    Sequence frontSequence() const { return front_seq_; }

private:
    std::deque<std::optional<Key>> slots_;
    Sequence front_seq_ = 0;
};

#endif // EVICTIONQUEUE_HPP
