#ifndef CROWDSALE_JOURNAL_HPP
#define CROWDSALE_JOURNAL_HPP

#include <atomic>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <utility>
#include <vector>

#include "types.hpp"

namespace crowdsale {

// =============================================================================
// Journaled - state that can be checkpointed and rolled back
// =============================================================================

class Journaled {
public:
    virtual ~Journaled() = default;

    virtual void checkpoint() = 0;
    virtual void rollback() = 0;
    virtual void commit() = 0;

    // Runs after a committed transaction has released the sale lock
    virtual void after_commit() {}
};

// Single-level saved copy of a component's state
template <typename T>
class StateJournal {
public:
    void save(const T& state) { saved_ = state; }

    void restore(T& state) {
        if (saved_) {
            state = std::move(*saved_);
            saved_.reset();
        }
    }

    void discard() { saved_.reset(); }
    bool active() const { return saved_.has_value(); }

private:
    std::optional<T> saved_;
};

// Prior values of the map entries a transaction touched. Cost is
// proportional to the entries changed, not to the size of the map.
template <typename Map>
class UndoLog {
public:
    using Key = typename Map::key_type;
    using Value = typename Map::mapped_type;

    void begin() {
        entries_.clear();
        active_ = true;
    }

    // Call before changing or erasing map[key]
    void touch(const Map& map, const Key& key) {
        if (!active_) return;
        auto it = map.find(key);
        if (it == map.end()) {
            entries_.emplace_back(key, std::nullopt);
        } else {
            entries_.emplace_back(key, it->second);
        }
    }

    // Newest first, so each key ends at its value from before begin()
    void restore(Map& map) {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (it->second) {
                map[it->first] = *it->second;
            } else {
                map.erase(it->first);
            }
        }
        discard();
    }

    void discard() {
        entries_.clear();
        active_ = false;
    }

    bool active() const { return active_; }
    size_t size() const { return entries_.size(); }

private:
    std::vector<std::pair<Key, std::optional<Value>>> entries_;
    bool active_ = false;
};

// =============================================================================
// SaleLock - per-sale exclusive lock with transactional rollback
//
// Mutations run through execute(): the lock is taken exclusively, every
// enlisted participant is checkpointed, and the body's status decides between
// commit (OK) and rollback (anything else, or an exception, which is
// rethrown). After a commit the lock is released before participants'
// after_commit() runs, so observers may call back into the sale.
// A call from the thread already inside execute() is rejected with
// errors::REENTRANCY rather than deadlocking.
// =============================================================================

class SaleLock {
public:
    using Body = std::function<int32_t()>;

    SaleLock() = default;

    // Non-copyable
    SaleLock(const SaleLock&) = delete;
    SaleLock& operator=(const SaleLock&) = delete;

    void enlist(Journaled& participant);

    int32_t execute(const char* operation, const Body& body);

    // Shared lock for views; empty when the current thread holds the
    // exclusive lock (a collaborator reading back during a purchase)
    std::shared_lock<std::shared_mutex> read() const;

    bool held_by_current_thread() const;

private:
    mutable std::shared_mutex mutex_;
    std::atomic<std::thread::id> holder_{};
    std::vector<Journaled*> participants_;

    int32_t run_locked(const char* operation, const Body& body);

    void checkpoint_all();
    void rollback_all();
    void commit_all();
    void after_commit_all();
};

} // namespace crowdsale

#endif // CROWDSALE_JOURNAL_HPP
