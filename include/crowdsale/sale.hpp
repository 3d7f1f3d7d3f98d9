#ifndef CROWDSALE_SALE_HPP
#define CROWDSALE_SALE_HPP

// =============================================================================
// CrowdSale - Staged Token Sale
//
// Components:
//   Ownership             single privileged principal
//   PaymentTokenRegistry  accepted payment assets and their feeds
//   PriceOracleClient     validated, normalized prices
//   SaleLifecycle         open / paused / finalized, time window, limits
//   StageLedger           ordered stages and advancement
//   PurchaseEngine        pricing, checks, settlement and release
//   EventLog              committed event history and listeners
//
// =============================================================================

#include <functional>
#include <optional>
#include <vector>

#include "types.hpp"
#include "journal.hpp"
#include "events.hpp"
#include "ownership.hpp"
#include "token.hpp"
#include "oracle.hpp"
#include "registry.hpp"
#include "lifecycle.hpp"
#include "stages.hpp"
#include "purchase.hpp"

namespace crowdsale {

// =============================================================================
// Sale Parameters
// =============================================================================

struct SaleParams {
    Address sale;              // The sale's account on the token ledgers
    Address owner;
    Address treasury;          // Receives every settled payment
    Address native_asset;      // Registry key pricing native-coin payments
    Timestamp start_time;
    Timestamp end_time;
    Amount max_purchase_per_address = DEFAULT_MAX_PURCHASE;

    // errors::OK, or the first validation failure
    static int32_t validate(const SaleParams& params);
};

struct SaleState {
    Timestamp start_time;
    Timestamp end_time;
    bool finalized;
    bool paused;
    uint32_t current_stage_index;
    Amount total_raised;            // Whole reference units
    Amount total_tokens_sold;       // Whole sale tokens
    Amount max_purchase_per_address;
    Address treasury;
    Address owner;
};

// =============================================================================
// CrowdSale
// =============================================================================

class CrowdSale {
public:
    using Clock = std::function<Timestamp()>;

    // Throws std::invalid_argument when the parameters do not validate
    CrowdSale(const SaleParams& params,
              ITokenLedger& sale_token,
              ITokenLedger& native_coin,
              const IPriceFeed& feed,
              const TokenDirectory& tokens);

    // Non-copyable
    CrowdSale(const CrowdSale&) = delete;
    CrowdSale& operator=(const CrowdSale&) = delete;

    // Roll this collaborator back together with the sale's own state.
    // Call during setup, before any operation runs.
    void enlist(Journaled& participant);

    // Defaults to the system clock
    void set_clock(Clock clock);
    Timestamp now() const;

    // =========================================================================
    // Purchases
    // =========================================================================

    PurchaseResult buy_with_native(const Address& buyer, Amount value);
    PurchaseResult buy_with_token(const Address& buyer, const Address& asset, Amount amount);

    QuoteResult quote(const Address& asset, Amount amount) const;
    QuoteResult quote_native(Amount value) const;

    // =========================================================================
    // Administration (owner only)
    // =========================================================================

    int32_t register_payment_asset(const Address& caller, const Address& asset, const Address& feed);
    int32_t enable_payment_asset(const Address& caller, const Address& asset);
    int32_t disable_payment_asset(const Address& caller, const Address& asset);

    int32_t add_stage(const Address& caller, Amount rate, Amount cap);
    int32_t advance_stage(const Address& caller);

    int32_t update_end_time(const Address& caller, Timestamp new_end);
    int32_t update_max_purchase_limit(const Address& caller, Amount limit);

    int32_t pause(const Address& caller);
    int32_t unpause(const Address& caller);
    int32_t finalize(const Address& caller);

    // Move coins or tokens held by the sale account; allowed after finalization
    int32_t withdraw_native(const Address& caller, const Address& to, Amount amount);
    int32_t withdraw_tokens(const Address& caller, const Address& asset,
                            const Address& to, Amount amount);

    int32_t transfer_ownership(const Address& caller, const Address& new_owner);

    // =========================================================================
    // Views
    // =========================================================================

    SaleState state() const;
    SalePhase phase() const;
    std::vector<SaleStage> stages() const;
    std::optional<SaleStage> current_stage() const;
    std::optional<PurchaserRecord> purchaser(const Address& buyer) const;
    std::optional<PaymentAsset> payment_asset(const Address& asset) const;
    std::vector<std::pair<Address, PaymentAsset>> payment_assets() const;
    bool is_acceptable(const Address& asset) const;

    const SaleParams& params() const { return params_; }

    EventLog& events() { return events_; }
    const EventLog& events() const { return events_; }

private:
    SaleParams params_;
    ITokenLedger& sale_token_;
    ITokenLedger& native_coin_;
    const TokenDirectory& tokens_;

    EventLog events_;
    Ownership ownership_;
    PriceOracleClient oracle_;
    PaymentTokenRegistry registry_;
    SaleLifecycle lifecycle_;
    StageLedger stages_;
    PurchaseEngine engine_;

    mutable SaleLock lock_;
    Clock clock_;

    PurchaseResult run_purchase(const char* operation,
                                const std::function<PurchaseResult(Timestamp)>& body);

    // Resolves the ledger for `asset`, including the sale token itself
    ITokenLedger* ledger_for(const Address& asset) const;
    int32_t withdraw(ITokenLedger& ledger, const Address& asset, const Address& to, Amount amount);
};

} // namespace crowdsale

#endif // CROWDSALE_SALE_HPP
