// =============================================================================
// lifecycle.cpp - Sale Lifecycle State Machine
// =============================================================================

#include "crowdsale/lifecycle.hpp"
#include "crowdsale/log.hpp"

namespace crowdsale {

const char* phase_name(SalePhase phase) {
    switch (phase) {
        case SalePhase::PENDING: return "pending";
        case SalePhase::OPEN: return "open";
        case SalePhase::PAUSED: return "paused";
        case SalePhase::ENDED: return "ended";
        case SalePhase::FINALIZED: return "finalized";
    }
    return "unknown";
}

SaleLifecycle::SaleLifecycle(const Ownership& ownership, EventLog& events,
                             Timestamp start_time, Timestamp end_time,
                             Amount max_purchase_per_address)
    : ownership_(ownership)
    , events_(events)
    , state_{start_time, end_time, false, false, max_purchase_per_address} {}

// =============================================================================
// Phase Queries
// =============================================================================

SalePhase SaleLifecycle::phase(Timestamp now) const {
    if (state_.finalized) return SalePhase::FINALIZED;
    if (now < state_.start_time) return SalePhase::PENDING;
    if (now > state_.end_time) return SalePhase::ENDED;
    if (state_.paused) return SalePhase::PAUSED;
    return SalePhase::OPEN;
}

int32_t SaleLifecycle::check_purchasable(Timestamp now) const {
    switch (phase(now)) {
        case SalePhase::OPEN: return errors::OK;
        case SalePhase::PENDING: return errors::SALE_NOT_STARTED;
        case SalePhase::PAUSED: return errors::SALE_PAUSED;
        case SalePhase::ENDED: return errors::SALE_ENDED;
        case SalePhase::FINALIZED: return errors::ALREADY_FINALIZED;
    }
    return errors::ALREADY_FINALIZED;
}

// =============================================================================
// Pause / Finalize
// =============================================================================

int32_t SaleLifecycle::pause(const Address& caller) {
    if (int32_t rc = check_admin(caller); rc != errors::OK) return rc;
    if (state_.paused) return errors::ALREADY_PAUSED;

    state_.paused = true;
    events_.publish(SalePaused{});
    log::info("sale paused");
    return errors::OK;
}

int32_t SaleLifecycle::unpause(const Address& caller) {
    if (int32_t rc = check_admin(caller); rc != errors::OK) return rc;
    if (!state_.paused) return errors::NOT_PAUSED;

    state_.paused = false;
    events_.publish(SaleUnpaused{});
    log::info("sale unpaused");
    return errors::OK;
}

int32_t SaleLifecycle::finalize(const Address& caller) {
    if (int32_t rc = check_admin(caller); rc != errors::OK) return rc;

    mark_finalized(FinalizeReason::OWNER);
    return errors::OK;
}

int32_t SaleLifecycle::on_stages_exhausted() {
    if (state_.finalized) return errors::ALREADY_FINALIZED;

    mark_finalized(FinalizeReason::STAGES_EXHAUSTED);
    return errors::OK;
}

void SaleLifecycle::mark_finalized(FinalizeReason reason) {
    state_.finalized = true;
    events_.publish(SaleFinalized{reason});
    log::info(reason == FinalizeReason::OWNER
              ? "sale finalized by owner"
              : "sale finalized: last stage sold out");
}

// =============================================================================
// Settings
// =============================================================================

int32_t SaleLifecycle::update_end_time(const Address& caller, Timestamp new_end, Timestamp now) {
    if (int32_t rc = check_admin(caller); rc != errors::OK) return rc;
    if (new_end <= now) return errors::PAST_TIMESTAMP;
    if (new_end <= state_.start_time) return errors::BEFORE_START;

    Timestamp previous = state_.end_time;
    state_.end_time = new_end;
    events_.publish(EndTimeUpdated{previous, new_end});
    log::info("end time updated from " + std::to_string(previous) + " to " + std::to_string(new_end));
    return errors::OK;
}

int32_t SaleLifecycle::update_max_purchase_limit(const Address& caller, Amount limit) {
    if (int32_t rc = check_admin(caller); rc != errors::OK) return rc;
    if (limit == 0) return errors::NON_POSITIVE_AMOUNT;

    Amount previous = state_.max_purchase_per_address;
    state_.max_purchase_per_address = limit;
    events_.publish(MaxPurchaseLimitUpdated{previous, limit});
    log::info("max purchase per address set to " + amount::to_string(limit));
    return errors::OK;
}

int32_t SaleLifecycle::check_admin(const Address& caller) const {
    if (int32_t rc = ownership_.check(caller); rc != errors::OK) return rc;
    if (state_.finalized) return errors::ALREADY_FINALIZED;
    return errors::OK;
}

} // namespace crowdsale
