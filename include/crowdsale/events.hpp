#ifndef CROWDSALE_EVENTS_HPP
#define CROWDSALE_EVENTS_HPP

#include <functional>
#include <mutex>
#include <variant>
#include <vector>

#include "types.hpp"
#include "journal.hpp"

namespace crowdsale {

// =============================================================================
// Sale Events
// =============================================================================

struct PurchaseCompleted {
    Address buyer;
    Address payment_asset;
    Amount amount_paid;       // In the payment asset's base units
    Amount reference_amount;  // Amount paid in reference currency
    Amount tokens;            // Whole sale tokens received
    uint32_t stage_index;
};

struct StageAdded {
    uint32_t index;
    Amount rate;
    Amount cap;
};

struct StageUpdated {
    uint32_t previous_index;
    uint32_t index;
    bool manual;
};

enum class FinalizeReason : uint8_t {
    OWNER = 0,
    STAGES_EXHAUSTED = 1
};

struct SaleFinalized {
    FinalizeReason reason;
};

struct FundsWithdrawn {
    Address asset;
    Address to;
    Amount amount;
};

struct EndTimeUpdated {
    Timestamp previous_end;
    Timestamp end;
};

struct MaxPurchaseLimitUpdated {
    Amount previous_limit;
    Amount limit;
};

struct SalePaused {};
struct SaleUnpaused {};

struct PaymentAssetUpdated {
    Address asset;
    Address feed;
    bool active;
};

struct OwnershipTransferred {
    Address previous_owner;
    Address owner;
};

using Event = std::variant<
    PurchaseCompleted,
    StageAdded,
    StageUpdated,
    SaleFinalized,
    FundsWithdrawn,
    EndTimeUpdated,
    MaxPurchaseLimitUpdated,
    SalePaused,
    SaleUnpaused,
    PaymentAssetUpdated,
    OwnershipTransferred>;

const char* event_name(const Event& event);

// =============================================================================
// EventLog - publishes events; buffers them while a transaction is open
// =============================================================================

class EventLog : public Journaled {
public:
    using Listener = std::function<void(const Event&)>;

    EventLog() = default;

    // Non-copyable
    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    uint64_t subscribe(Listener listener);
    void unsubscribe(uint64_t id);

    void publish(Event event);

    // Committed events, oldest first
    std::vector<Event> history() const;
    size_t size() const;

    void checkpoint() override;
    void rollback() override;
    void commit() override;

    // Delivers committed events to listeners, oldest first. A listener that
    // throws is logged and skipped; later listeners and events still run.
    void after_commit() override { deliver(); }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<uint64_t, Listener>> listeners_;
    uint64_t next_listener_id_{1};

    std::vector<Event> history_;
    std::vector<Event> pending_;       // Published inside the open transaction
    std::vector<Event> undelivered_;   // Committed, not yet seen by listeners
    bool buffering_{false};
    bool delivering_{false};

    void deliver();
};

} // namespace crowdsale

#endif // CROWDSALE_EVENTS_HPP
