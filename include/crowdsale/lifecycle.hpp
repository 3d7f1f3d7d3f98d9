#ifndef CROWDSALE_LIFECYCLE_HPP
#define CROWDSALE_LIFECYCLE_HPP

#include "types.hpp"
#include "journal.hpp"
#include "events.hpp"
#include "ownership.hpp"

namespace crowdsale {

// =============================================================================
// Sale Phase
// =============================================================================

enum class SalePhase : uint8_t {
    PENDING = 0,     // Before start_time
    OPEN = 1,        // Within the window, not paused
    PAUSED = 2,      // Owner-paused; returns to OPEN on unpause
    ENDED = 3,       // Past end_time, not finalized
    FINALIZED = 4    // Terminal
};

const char* phase_name(SalePhase phase);

struct LifecycleState {
    Timestamp start_time;
    Timestamp end_time;
    bool finalized;
    bool paused;
    Amount max_purchase_per_address;  // Whole sale tokens
};

// =============================================================================
// SaleLifecycle - open/paused/finalized state machine and sale settings
// =============================================================================

class SaleLifecycle : public Journaled {
public:
    SaleLifecycle(const Ownership& ownership, EventLog& events,
                  Timestamp start_time, Timestamp end_time,
                  Amount max_purchase_per_address);

    SalePhase phase(Timestamp now) const;

    // errors::OK when a purchase may proceed at `now`
    int32_t check_purchasable(Timestamp now) const;

    // Administrative (owner only)
    int32_t pause(const Address& caller);
    int32_t unpause(const Address& caller);

    // A second call fails with ALREADY_FINALIZED
    int32_t finalize(const Address& caller);

    int32_t update_end_time(const Address& caller, Timestamp new_end, Timestamp now);
    int32_t update_max_purchase_limit(const Address& caller, Amount limit);

    // Signal from the stage ledger that the last stage sold out
    int32_t on_stages_exhausted();

    bool is_finalized() const { return state_.finalized; }
    bool is_paused() const { return state_.paused; }
    Timestamp start_time() const { return state_.start_time; }
    Timestamp end_time() const { return state_.end_time; }
    Amount max_purchase_per_address() const { return state_.max_purchase_per_address; }
    const LifecycleState& state() const { return state_; }

    void checkpoint() override { journal_.save(state_); }
    void rollback() override { journal_.restore(state_); }
    void commit() override { journal_.discard(); }

private:
    const Ownership& ownership_;
    EventLog& events_;

    LifecycleState state_;
    StateJournal<LifecycleState> journal_;

    // Owner check followed by the not-finalized check
    int32_t check_admin(const Address& caller) const;
    void mark_finalized(FinalizeReason reason);
};

} // namespace crowdsale

#endif // CROWDSALE_LIFECYCLE_HPP
