// =============================================================================
// events.cpp - Event Publication
// =============================================================================

#include "crowdsale/events.hpp"
#include "crowdsale/log.hpp"

#include <algorithm>
#include <exception>

namespace crowdsale {

namespace {

struct EventNamer {
    const char* operator()(const PurchaseCompleted&) const { return "PurchaseCompleted"; }
    const char* operator()(const StageAdded&) const { return "StageAdded"; }
    const char* operator()(const StageUpdated&) const { return "StageUpdated"; }
    const char* operator()(const SaleFinalized&) const { return "SaleFinalized"; }
    const char* operator()(const FundsWithdrawn&) const { return "FundsWithdrawn"; }
    const char* operator()(const EndTimeUpdated&) const { return "EndTimeUpdated"; }
    const char* operator()(const MaxPurchaseLimitUpdated&) const { return "MaxPurchaseLimitUpdated"; }
    const char* operator()(const SalePaused&) const { return "SalePaused"; }
    const char* operator()(const SaleUnpaused&) const { return "SaleUnpaused"; }
    const char* operator()(const PaymentAssetUpdated&) const { return "PaymentAssetUpdated"; }
    const char* operator()(const OwnershipTransferred&) const { return "OwnershipTransferred"; }
};

} // anonymous namespace

const char* event_name(const Event& event) {
    return std::visit(EventNamer{}, event);
}

// =============================================================================
// Subscription
// =============================================================================

uint64_t EventLog::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void EventLog::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        listeners_.end());
}

// =============================================================================
// Publication
// =============================================================================

void EventLog::publish(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (buffering_) {
            pending_.push_back(std::move(event));
            return;
        }
        history_.push_back(event);
        undelivered_.push_back(std::move(event));
    }
    deliver();
}

std::vector<Event> EventLog::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

// One thread delivers at a time. Events committed meanwhile, by another
// thread or by a listener calling back into the sale, join the queue and are
// drained by the active deliverer, so listeners see history order.
void EventLog::deliver() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (delivering_) return;
    delivering_ = true;

    while (!undelivered_.empty()) {
        std::vector<Event> batch;
        batch.swap(undelivered_);
        std::vector<Listener> listeners;
        for (const auto& entry : listeners_) listeners.push_back(entry.second);
        lock.unlock();

        try {
            for (const Event& event : batch) {
                for (const auto& listener : listeners) {
                    try {
                        listener(event);
                    } catch (const std::exception& e) {
                        log::error(std::string("listener failed on ") + event_name(event) +
                                   ": " + e.what());
                    }
                }
            }
        } catch (...) {
            lock.lock();
            delivering_ = false;
            throw;
        }

        lock.lock();
    }
    delivering_ = false;
}

// =============================================================================
// Transaction Hooks
// =============================================================================

void EventLog::checkpoint() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffering_ = true;
    pending_.clear();
}

void EventLog::rollback() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffering_ = false;
    pending_.clear();
}

// Records the transaction's events; listeners run later, in after_commit()
void EventLog::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffering_ = false;
    history_.insert(history_.end(), pending_.begin(), pending_.end());
    undelivered_.insert(undelivered_.end(), pending_.begin(), pending_.end());
    pending_.clear();
}

} // namespace crowdsale
