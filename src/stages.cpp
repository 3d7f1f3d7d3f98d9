// =============================================================================
// stages.cpp - Stage Ledger and Advancement
// =============================================================================

#include "crowdsale/stages.hpp"
#include "crowdsale/log.hpp"

namespace crowdsale {

StageLedger::StageLedger(const Ownership& ownership, SaleLifecycle& lifecycle, EventLog& events)
    : ownership_(ownership)
    , lifecycle_(lifecycle)
    , events_(events) {}

// =============================================================================
// Stage Management
// =============================================================================

int32_t StageLedger::add_stage(const Address& caller, Amount rate, Amount cap) {
    if (int32_t rc = ownership_.check(caller); rc != errors::OK) return rc;
    if (lifecycle_.is_finalized()) return errors::ALREADY_FINALIZED;
    if (rate == 0) return errors::NON_POSITIVE_RATE;
    if (cap == 0) return errors::NON_POSITIVE_CAP;

    auto index = static_cast<uint32_t>(state_.stages.size());
    state_.stages.push_back(SaleStage{rate, cap, 0});

    events_.publish(StageAdded{index, rate, cap});
    log::info("stage " + std::to_string(index) + " added: rate " + amount::to_string(rate) +
              ", cap " + amount::to_string(cap));
    return errors::OK;
}

Result<Amount> StageLedger::current_rate() const {
    if (state_.current >= state_.stages.size()) {
        return Result<Amount>::failure(errors::NO_ACTIVE_STAGE);
    }
    Amount rate = state_.stages[state_.current].rate;
    if (rate == 0) return Result<Amount>::failure(errors::NO_ACTIVE_STAGE);
    return Result<Amount>::success(rate);
}

int32_t StageLedger::record_sale(Amount tokens) {
    if (state_.current >= state_.stages.size()) return errors::NO_ACTIVE_STAGE;

    SaleStage& stage = state_.stages[state_.current];
    auto sold = amount::checked_add(stage.sold, tokens);
    if (!sold) return errors::ARITHMETIC_OVERFLOW;
    stage.sold = *sold;
    return errors::OK;
}

// =============================================================================
// Advancement
// =============================================================================

AdvanceOutcome StageLedger::try_advance() {
    if (state_.current >= state_.stages.size()) return AdvanceOutcome::NONE;

    const SaleStage& stage = state_.stages[state_.current];
    if (stage.sold < stage.cap) return AdvanceOutcome::NONE;

    if (has_next()) {
        move_next(false);
        return AdvanceOutcome::ADVANCED;
    }

    if (lifecycle_.on_stages_exhausted() != errors::OK) {
        // Already finalized; nothing further to signal
        return AdvanceOutcome::NONE;
    }
    return AdvanceOutcome::EXHAUSTED;
}

int32_t StageLedger::advance_manually(const Address& caller) {
    if (int32_t rc = ownership_.check(caller); rc != errors::OK) return rc;
    if (lifecycle_.is_finalized()) return errors::ALREADY_FINALIZED;
    if (!has_next()) return errors::FINAL_STAGE_REACHED;

    move_next(true);
    return errors::OK;
}

void StageLedger::move_next(bool manual) {
    uint32_t previous = state_.current;
    ++state_.current;
    events_.publish(StageUpdated{previous, state_.current, manual});
    log::info("stage advanced " + std::to_string(previous) + " -> " +
              std::to_string(state_.current) + (manual ? " (manual)" : ""));
}

// =============================================================================
// Queries
// =============================================================================

std::optional<SaleStage> StageLedger::current_stage() const {
    return stage(state_.current);
}

std::optional<SaleStage> StageLedger::stage(uint32_t index) const {
    if (index >= state_.stages.size()) return std::nullopt;
    return state_.stages[index];
}

Amount StageLedger::remaining_in_current() const {
    if (state_.current >= state_.stages.size()) return 0;
    const SaleStage& stage = state_.stages[state_.current];
    return stage.sold >= stage.cap ? 0 : stage.cap - stage.sold;
}

} // namespace crowdsale
