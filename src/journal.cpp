// =============================================================================
// journal.cpp - SaleLock Exclusive Execution and Rollback
// =============================================================================

#include "crowdsale/journal.hpp"
#include "crowdsale/log.hpp"

#include <mutex>

namespace crowdsale {

void SaleLock::enlist(Journaled& participant) {
    std::unique_lock lock(mutex_);
    participants_.push_back(&participant);
}

bool SaleLock::held_by_current_thread() const {
    return holder_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

std::shared_lock<std::shared_mutex> SaleLock::read() const {
    if (held_by_current_thread()) {
        return std::shared_lock<std::shared_mutex>();
    }
    return std::shared_lock<std::shared_mutex>(mutex_);
}

namespace {

// Marks the calling thread as the lock holder for its own lifetime
class HolderScope {
public:
    explicit HolderScope(std::atomic<std::thread::id>& holder) : holder_(holder) {
        holder_.store(std::this_thread::get_id(), std::memory_order_release);
    }
    ~HolderScope() { holder_.store(std::thread::id(), std::memory_order_release); }

    HolderScope(const HolderScope&) = delete;
    HolderScope& operator=(const HolderScope&) = delete;

private:
    std::atomic<std::thread::id>& holder_;
};

} // anonymous namespace

int32_t SaleLock::execute(const char* operation, const Body& body) {
    if (held_by_current_thread()) {
        log::warn(std::string(operation) + ": rejected re-entrant call");
        return errors::REENTRANCY;
    }

    int32_t status = run_locked(operation, body);
    if (status == errors::OK) after_commit_all();
    return status;
}

int32_t SaleLock::run_locked(const char* operation, const Body& body) {
    std::unique_lock lock(mutex_);
    HolderScope holder(holder_);
    checkpoint_all();

    int32_t status;
    try {
        status = body();
    } catch (...) {
        rollback_all();
        log::error(std::string(operation) + ": aborted by exception, state rolled back");
        throw;
    }

    if (status == errors::OK) {
        commit_all();
    } else {
        rollback_all();
        log::debug(std::string(operation) + ": rolled back (" + error_name(status) + ")");
    }
    return status;
}

void SaleLock::checkpoint_all() {
    for (Journaled* p : participants_) p->checkpoint();
}

void SaleLock::rollback_all() {
    for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
        (*it)->rollback();
    }
}

void SaleLock::commit_all() {
    for (Journaled* p : participants_) p->commit();
}

void SaleLock::after_commit_all() {
    std::vector<Journaled*> participants;
    {
        std::shared_lock lock(mutex_);
        participants = participants_;
    }
    for (Journaled* p : participants) p->after_commit();
}

} // namespace crowdsale
