#ifndef CROWDSALE_PURCHASE_HPP
#define CROWDSALE_PURCHASE_HPP

#include <optional>
#include <unordered_map>

#include "types.hpp"
#include "journal.hpp"
#include "events.hpp"
#include "token.hpp"
#include "oracle.hpp"
#include "registry.hpp"
#include "stages.hpp"
#include "lifecycle.hpp"

namespace crowdsale {

// =============================================================================
// Purchase Types
// =============================================================================

struct PurchaserRecord {
    Amount total_tokens_purchased;  // Whole sale tokens
    Amount total_paid_reference;    // Whole reference-currency units
    uint64_t purchase_count;
};

// Outcome of pricing a payment without executing it
struct PurchaseQuote {
    Amount price;             // Asset price, PRICE_DECIMALS fixed point
    Amount reference_amount;  // Payment value in whole reference units
    Amount tokens;            // Whole sale tokens
    Amount rate;
    uint32_t stage_index;
};

using QuoteResult = Result<PurchaseQuote>;

struct PurchaseResult {
    int32_t status;
    Amount reference_amount;
    Amount tokens;
    uint32_t stage_index;     // Stage the tokens were sold from
    bool stage_advanced;
    bool finalized;           // Last stage sold out

    bool ok() const { return status == errors::OK; }

    static PurchaseResult failure(int32_t code) {
        return PurchaseResult{code, 0, 0, 0, false, false};
    }
};

// =============================================================================
// PurchaseEngine - one purchase end to end
//
// Must run inside SaleLock::execute: settlement and release are external
// calls, and a failure after either one relies on the journal to restore
// totals, stage counters and purchaser records.
// =============================================================================

class PurchaseEngine : public Journaled {
public:
    struct Context {
        Address sale;             // The sale's own account on the ledgers
        Address native_asset;     // Registry key pricing native payments
        ITokenLedger& sale_token;
        ITokenLedger& native_coin;
        const TokenDirectory& tokens;
        Address treasury;
    };

    PurchaseEngine(Context context,
                   const SaleLifecycle& lifecycle,
                   const PaymentTokenRegistry& registry,
                   StageLedger& stages,
                   const PriceOracleClient& oracle,
                   EventLog& events);

    // Native coin: `value` base units moved buyer -> treasury
    PurchaseResult buy_with_native(const Address& buyer, Amount value, Timestamp now);

    // Token: `amount` base units pulled buyer -> treasury against the
    // allowance the buyer granted the sale
    PurchaseResult buy_with_token(const Address& buyer, const Address& asset,
                                  Amount amount, Timestamp now);

    // Pricing and allocation only; no limits, no side effects
    QuoteResult quote(const Address& asset, Amount amount) const;
    QuoteResult quote_native(Amount value) const { return quote(context_.native_asset, value); }

    std::optional<PurchaserRecord> purchaser(const Address& buyer) const;
    Amount total_raised() const { return totals_.total_raised; }
    Amount total_tokens_sold() const { return totals_.total_tokens_sold; }

    void checkpoint() override;
    void rollback() override;
    void commit() override;

private:
    struct Totals {
        Amount total_raised = 0;        // Whole reference units
        Amount total_tokens_sold = 0;   // Whole sale tokens
    };
    using PurchaserMap = std::unordered_map<Address, PurchaserRecord, AddressHash>;

    // Which ledger settles the payment
    enum class Settlement : uint8_t { NATIVE, TOKEN };

    Context context_;
    const SaleLifecycle& lifecycle_;
    const PaymentTokenRegistry& registry_;
    StageLedger& stages_;
    const PriceOracleClient& oracle_;
    EventLog& events_;

    Totals totals_;
    PurchaserMap purchasers_;
    StateJournal<Totals> totals_journal_;
    UndoLog<PurchaserMap> purchasers_undo_;

    PurchaseResult execute(Settlement settlement, const Address& buyer,
                           const Address& asset, Amount paid, Timestamp now);

    int32_t check_supply(Amount tokens, Amount& release_amount) const;
    int32_t check_limit(const Address& buyer, Amount tokens) const;
    int32_t settle(Settlement settlement, const Address& buyer,
                   const Address& asset, Amount paid);
    int32_t release(const Address& buyer, Amount release_amount);
    int32_t record(const Address& buyer, Amount reference_amount, Amount tokens);
};

} // namespace crowdsale

#endif // CROWDSALE_PURCHASE_HPP
