#ifndef CROWDSALE_STAGES_HPP
#define CROWDSALE_STAGES_HPP

#include <optional>
#include <vector>

#include "types.hpp"
#include "journal.hpp"
#include "events.hpp"
#include "ownership.hpp"
#include "lifecycle.hpp"

namespace crowdsale {

// =============================================================================
// Sale Stage
// =============================================================================

struct SaleStage {
    Amount rate;   // Whole tokens per whole reference-currency unit
    Amount cap;    // Max whole tokens sold in this stage
    Amount sold;   // Whole tokens sold so far
};

enum class AdvanceOutcome : uint8_t {
    NONE = 0,        // Current stage still has capacity
    ADVANCED = 1,    // Moved to the next stage
    EXHAUSTED = 2    // Last stage full; lifecycle finalized
};

// =============================================================================
// StageLedger - ordered stages and the advancement state machine
//
// The current index starts at 0, only ever moves forward by one, and every
// stage access is bounds-checked.
// =============================================================================

class StageLedger : public Journaled {
public:
    StageLedger(const Ownership& ownership, SaleLifecycle& lifecycle, EventLog& events);

    // Owner only; rejected once the sale is finalized
    int32_t add_stage(const Address& caller, Amount rate, Amount cap);

    // NO_ACTIVE_STAGE when there are no stages or the rate is 0
    Result<Amount> current_rate() const;

    // Adds to the current stage's `sold`. Capacity must be validated by the
    // caller under the same lock.
    int32_t record_sale(Amount tokens);

    // Advance one stage if the current one is full; signals the lifecycle
    // when the last stage is full
    AdvanceOutcome try_advance();

    // Owner only; FINAL_STAGE_REACHED when there is no next stage
    int32_t advance_manually(const Address& caller);

    uint32_t current_index() const { return state_.current; }
    std::optional<SaleStage> current_stage() const;
    std::optional<SaleStage> stage(uint32_t index) const;
    const std::vector<SaleStage>& stages() const { return state_.stages; }
    size_t size() const { return state_.stages.size(); }

    // Unsold capacity of the current stage (0 when there is none)
    Amount remaining_in_current() const;

    void checkpoint() override { journal_.save(state_); }
    void rollback() override { journal_.restore(state_); }
    void commit() override { journal_.discard(); }

private:
    struct State {
        std::vector<SaleStage> stages;
        uint32_t current = 0;
    };

    const Ownership& ownership_;
    SaleLifecycle& lifecycle_;
    EventLog& events_;

    State state_;
    StateJournal<State> journal_;

    bool has_next() const { return state_.current + 1 < state_.stages.size(); }
    void move_next(bool manual);
};

} // namespace crowdsale

#endif // CROWDSALE_STAGES_HPP
