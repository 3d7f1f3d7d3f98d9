// =============================================================================
// sale.cpp - CrowdSale Controller
// =============================================================================

#include "crowdsale/sale.hpp"
#include "crowdsale/log.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

namespace crowdsale {

namespace {

Timestamp system_now() {
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

const SaleParams& validated(const SaleParams& params) {
    int32_t rc = SaleParams::validate(params);
    if (rc != errors::OK) {
        throw std::invalid_argument(std::string("invalid sale parameters: ") + error_name(rc));
    }
    return params;
}

} // anonymous namespace

// =============================================================================
// Sale Parameters
// =============================================================================

int32_t SaleParams::validate(const SaleParams& params) {
    if (addresses::is_zero(params.sale) || addresses::is_zero(params.owner) ||
        addresses::is_zero(params.treasury) || addresses::is_zero(params.native_asset)) {
        return errors::ZERO_ADDRESS;
    }
    if (params.start_time >= params.end_time) return errors::INVALID_TIME_WINDOW;
    if (params.max_purchase_per_address == 0) return errors::NON_POSITIVE_AMOUNT;
    return errors::OK;
}

// =============================================================================
// Construction
// =============================================================================

CrowdSale::CrowdSale(const SaleParams& params,
                     ITokenLedger& sale_token,
                     ITokenLedger& native_coin,
                     const IPriceFeed& feed,
                     const TokenDirectory& tokens)
    : params_(validated(params))
    , sale_token_(sale_token)
    , native_coin_(native_coin)
    , tokens_(tokens)
    , ownership_(params.owner, events_)
    , oracle_(feed)
    , registry_(ownership_, tokens, events_)
    , lifecycle_(ownership_, events_, params.start_time, params.end_time,
                 params.max_purchase_per_address)
    , stages_(ownership_, lifecycle_, events_)
    , engine_(PurchaseEngine::Context{params.sale, params.native_asset, sale_token,
                                      native_coin, tokens, params.treasury},
              lifecycle_, registry_, stages_, oracle_, events_)
    , clock_(system_now) {
    lock_.enlist(ownership_);
    lock_.enlist(registry_);
    lock_.enlist(lifecycle_);
    lock_.enlist(stages_);
    lock_.enlist(engine_);
    lock_.enlist(events_);

    log::info("sale " + addresses::to_hex(params.sale) + " created, window " +
              std::to_string(params.start_time) + " - " + std::to_string(params.end_time));
}

void CrowdSale::enlist(Journaled& participant) {
    lock_.enlist(participant);
}

void CrowdSale::set_clock(Clock clock) {
    clock_ = std::move(clock);
}

Timestamp CrowdSale::now() const {
    return clock_();
}

// =============================================================================
// Purchases
// =============================================================================

PurchaseResult CrowdSale::run_purchase(const char* operation,
                                       const std::function<PurchaseResult(Timestamp)>& body) {
    PurchaseResult result = PurchaseResult::failure(errors::OK);
    int32_t status = lock_.execute(operation, [&] {
        result = body(now());
        return result.status;
    });
    if (status != errors::OK) return PurchaseResult::failure(status);
    return result;
}

PurchaseResult CrowdSale::buy_with_native(const Address& buyer, Amount value) {
    return run_purchase("buy_with_native", [&](Timestamp t) {
        return engine_.buy_with_native(buyer, value, t);
    });
}

PurchaseResult CrowdSale::buy_with_token(const Address& buyer, const Address& asset, Amount amount) {
    return run_purchase("buy_with_token", [&](Timestamp t) {
        return engine_.buy_with_token(buyer, asset, amount, t);
    });
}

QuoteResult CrowdSale::quote(const Address& asset, Amount amount) const {
    auto lock = lock_.read();
    return engine_.quote(asset, amount);
}

QuoteResult CrowdSale::quote_native(Amount value) const {
    auto lock = lock_.read();
    return engine_.quote_native(value);
}

// =============================================================================
// Administration
// =============================================================================

int32_t CrowdSale::register_payment_asset(const Address& caller, const Address& asset,
                                          const Address& feed) {
    return lock_.execute("register_payment_asset", [&] {
        return registry_.register_asset(caller, asset, feed);
    });
}

int32_t CrowdSale::enable_payment_asset(const Address& caller, const Address& asset) {
    return lock_.execute("enable_payment_asset", [&] {
        return registry_.enable_asset(caller, asset);
    });
}

int32_t CrowdSale::disable_payment_asset(const Address& caller, const Address& asset) {
    return lock_.execute("disable_payment_asset", [&] {
        return registry_.disable_asset(caller, asset);
    });
}

int32_t CrowdSale::add_stage(const Address& caller, Amount rate, Amount cap) {
    return lock_.execute("add_stage", [&] {
        return stages_.add_stage(caller, rate, cap);
    });
}

int32_t CrowdSale::advance_stage(const Address& caller) {
    return lock_.execute("advance_stage", [&] {
        return stages_.advance_manually(caller);
    });
}

int32_t CrowdSale::update_end_time(const Address& caller, Timestamp new_end) {
    return lock_.execute("update_end_time", [&] {
        return lifecycle_.update_end_time(caller, new_end, now());
    });
}

int32_t CrowdSale::update_max_purchase_limit(const Address& caller, Amount limit) {
    return lock_.execute("update_max_purchase_limit", [&] {
        return lifecycle_.update_max_purchase_limit(caller, limit);
    });
}

int32_t CrowdSale::pause(const Address& caller) {
    return lock_.execute("pause", [&] { return lifecycle_.pause(caller); });
}

int32_t CrowdSale::unpause(const Address& caller) {
    return lock_.execute("unpause", [&] { return lifecycle_.unpause(caller); });
}

int32_t CrowdSale::finalize(const Address& caller) {
    return lock_.execute("finalize", [&] { return lifecycle_.finalize(caller); });
}

int32_t CrowdSale::transfer_ownership(const Address& caller, const Address& new_owner) {
    return lock_.execute("transfer_ownership", [&] {
        return ownership_.transfer(caller, new_owner);
    });
}

// =============================================================================
// Withdrawals
// =============================================================================

int32_t CrowdSale::withdraw_native(const Address& caller, const Address& to, Amount amount) {
    return lock_.execute("withdraw_native", [&] {
        if (int32_t rc = ownership_.check(caller); rc != errors::OK) return rc;
        return withdraw(native_coin_, params_.native_asset, to, amount);
    });
}

int32_t CrowdSale::withdraw_tokens(const Address& caller, const Address& asset,
                                   const Address& to, Amount amount) {
    return lock_.execute("withdraw_tokens", [&] {
        if (int32_t rc = ownership_.check(caller); rc != errors::OK) return rc;
        if (addresses::is_zero(asset)) return errors::ZERO_ADDRESS;

        ITokenLedger* ledger = ledger_for(asset);
        if (!ledger) return errors::UNKNOWN_TOKEN;
        return withdraw(*ledger, asset, to, amount);
    });
}

ITokenLedger* CrowdSale::ledger_for(const Address& asset) const {
    if (ITokenLedger* ledger = tokens_.find(asset)) return ledger;
    try {
        if (sale_token_.address() == asset) return &sale_token_;
    } catch (const std::exception& e) {
        log::warn(std::string("sale token address lookup failed: ") + e.what());
    }
    return nullptr;
}

int32_t CrowdSale::withdraw(ITokenLedger& ledger, const Address& asset,
                            const Address& to, Amount amount) {
    if (addresses::is_zero(to)) return errors::ZERO_ADDRESS;
    if (amount == 0) return errors::NON_POSITIVE_AMOUNT;

    bool moved = false;
    try {
        if (ledger.balance_of(params_.sale) < amount) return errors::INSUFFICIENT_BALANCE;
        moved = ledger.transfer(params_.sale, to, amount);
    } catch (const std::exception& e) {
        log::warn("withdrawal of " + addresses::to_hex(asset) + " threw: " + e.what());
        return errors::TRANSFER_FAILED;
    }
    if (!moved) return errors::TRANSFER_FAILED;

    events_.publish(FundsWithdrawn{asset, to, amount});
    log::info("withdrew " + amount::to_string(amount) + " of " + addresses::to_hex(asset) +
              " to " + addresses::to_hex(to));
    return errors::OK;
}

// =============================================================================
// Views
// =============================================================================

SaleState CrowdSale::state() const {
    auto lock = lock_.read();
    const LifecycleState& life = lifecycle_.state();
    return SaleState{
        life.start_time,
        life.end_time,
        life.finalized,
        life.paused,
        stages_.current_index(),
        engine_.total_raised(),
        engine_.total_tokens_sold(),
        life.max_purchase_per_address,
        params_.treasury,
        ownership_.owner(),
    };
}

SalePhase CrowdSale::phase() const {
    auto lock = lock_.read();
    return lifecycle_.phase(now());
}

std::vector<SaleStage> CrowdSale::stages() const {
    auto lock = lock_.read();
    return stages_.stages();
}

std::optional<SaleStage> CrowdSale::current_stage() const {
    auto lock = lock_.read();
    return stages_.current_stage();
}

std::optional<PurchaserRecord> CrowdSale::purchaser(const Address& buyer) const {
    auto lock = lock_.read();
    return engine_.purchaser(buyer);
}

std::optional<PaymentAsset> CrowdSale::payment_asset(const Address& asset) const {
    auto lock = lock_.read();
    return registry_.get(asset);
}

std::vector<std::pair<Address, PaymentAsset>> CrowdSale::payment_assets() const {
    auto lock = lock_.read();
    return registry_.assets();
}

bool CrowdSale::is_acceptable(const Address& asset) const {
    auto lock = lock_.read();
    return registry_.is_acceptable(asset);
}

} // namespace crowdsale
