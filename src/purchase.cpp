// =============================================================================
// purchase.cpp - Purchase Pricing, Validation and Settlement
// =============================================================================

#include "crowdsale/purchase.hpp"
#include "crowdsale/log.hpp"

#include <exception>

namespace crowdsale {

PurchaseEngine::PurchaseEngine(Context context,
                               const SaleLifecycle& lifecycle,
                               const PaymentTokenRegistry& registry,
                               StageLedger& stages,
                               const PriceOracleClient& oracle,
                               EventLog& events)
    : context_(context)
    , lifecycle_(lifecycle)
    , registry_(registry)
    , stages_(stages)
    , oracle_(oracle)
    , events_(events) {}

// =============================================================================
// Entry Points
// =============================================================================

PurchaseResult PurchaseEngine::buy_with_native(const Address& buyer, Amount value, Timestamp now) {
    return execute(Settlement::NATIVE, buyer, context_.native_asset, value, now);
}

PurchaseResult PurchaseEngine::buy_with_token(const Address& buyer, const Address& asset,
                                              Amount amount, Timestamp now) {
    return execute(Settlement::TOKEN, buyer, asset, amount, now);
}

// =============================================================================
// Pricing
// =============================================================================

QuoteResult PurchaseEngine::quote(const Address& asset, Amount amount) const {
    if (amount == 0) return QuoteResult::failure(errors::NON_POSITIVE_AMOUNT);

    auto entry = registry_.get(asset);
    if (!entry || !registry_.is_acceptable(asset)) {
        return QuoteResult::failure(errors::ASSET_NOT_ACCEPTED);
    }

    auto rate = stages_.current_rate();
    if (!rate.ok()) return QuoteResult::failure(rate.status);

    auto price = oracle_.get_price(entry->feed, PRICE_DECIMALS);
    if (!price.ok()) return QuoteResult::failure(price.status);

    // reference = price * amount / 10^(18 + assetDecimals), split into two
    // truncating divisions so large asset decimals never overflow the scale
    auto price_scale = amount::pow10(PRICE_DECIMALS);
    auto scaled = amount::mul_div(price.value.value, amount, *price_scale);
    if (!scaled) return QuoteResult::failure(errors::ARITHMETIC_OVERFLOW);

    auto asset_scale = amount::pow10(entry->decimals);
    Amount reference = asset_scale ? *scaled / *asset_scale : 0;

    auto tokens = amount::checked_mul(reference, rate.value);
    if (!tokens) return QuoteResult::failure(errors::ARITHMETIC_OVERFLOW);
    if (*tokens == 0) return QuoteResult::failure(errors::ZERO_TOKEN_AMOUNT);

    return QuoteResult::success(PurchaseQuote{
        price.value.value, reference, *tokens, rate.value, stages_.current_index()});
}

// =============================================================================
// Purchase Pipeline
// =============================================================================

PurchaseResult PurchaseEngine::execute(Settlement settlement, const Address& buyer,
                                       const Address& asset, Amount paid, Timestamp now) {
    auto reject = [&](int32_t code) {
        log::debug("purchase by " + addresses::to_hex(buyer) + " rejected: " + error_name(code));
        return PurchaseResult::failure(code);
    };

    // Preconditions
    if (int32_t rc = lifecycle_.check_purchasable(now); rc != errors::OK) return reject(rc);
    if (addresses::is_zero(buyer)) return reject(errors::ZERO_ADDRESS);
    if (paid == 0) return reject(errors::NON_POSITIVE_AMOUNT);

    auto rate = stages_.current_rate();
    if (!rate.ok()) return reject(rate.status);
    if (!registry_.is_acceptable(asset)) return reject(errors::ASSET_NOT_ACCEPTED);

    // Price and allocate
    auto q = quote(asset, paid);
    if (!q.ok()) return reject(q.status);
    const PurchaseQuote& priced = q.value;

    // Supply, stage capacity and per-address limit
    Amount release_amount = 0;
    if (int32_t rc = check_supply(priced.tokens, release_amount); rc != errors::OK) return reject(rc);
    if (stages_.remaining_in_current() < priced.tokens) return reject(errors::STAGE_CAPACITY);
    if (int32_t rc = check_limit(buyer, priced.tokens); rc != errors::OK) return reject(rc);

    // Payment first, then bookkeeping, then release
    if (int32_t rc = settle(settlement, buyer, asset, paid); rc != errors::OK) return reject(rc);
    if (int32_t rc = record(buyer, priced.reference_amount, priced.tokens); rc != errors::OK) {
        return reject(rc);
    }
    if (int32_t rc = release(buyer, release_amount); rc != errors::OK) return reject(rc);

    uint32_t stage_index = priced.stage_index;
    AdvanceOutcome outcome = stages_.try_advance();

    events_.publish(PurchaseCompleted{
        buyer, asset, paid, priced.reference_amount, priced.tokens, stage_index});

    log::info("purchase: " + addresses::to_hex(buyer) + " paid " + amount::to_string(paid) +
              " of " + addresses::to_hex(asset) + " (" + amount::to_string(priced.reference_amount) +
              " ref) for " + amount::to_string(priced.tokens) + " tokens in stage " +
              std::to_string(stage_index));

    return PurchaseResult{errors::OK,
                          priced.reference_amount,
                          priced.tokens,
                          stage_index,
                          outcome == AdvanceOutcome::ADVANCED,
                          outcome == AdvanceOutcome::EXHAUSTED};
}

int32_t PurchaseEngine::check_supply(Amount tokens, Amount& release_amount) const {
    uint8_t decimals = 0;
    Amount balance = 0;
    try {
        decimals = context_.sale_token.decimals();
        balance = context_.sale_token.balance_of(context_.sale);
    } catch (const std::exception& e) {
        log::warn(std::string("sale token query failed: ") + e.what());
        return errors::RELEASE_FAILED;
    }

    auto scale = amount::pow10(decimals);
    if (!scale) return errors::ARITHMETIC_OVERFLOW;
    auto needed = amount::checked_mul(tokens, *scale);
    if (!needed) return errors::ARITHMETIC_OVERFLOW;

    if (balance < *needed) return errors::INSUFFICIENT_SUPPLY;

    release_amount = *needed;
    return errors::OK;
}

int32_t PurchaseEngine::check_limit(const Address& buyer, Amount tokens) const {
    Amount purchased = 0;
    auto it = purchasers_.find(buyer);
    if (it != purchasers_.end()) purchased = it->second.total_tokens_purchased;

    auto total = amount::checked_add(purchased, tokens);
    if (!total || *total > lifecycle_.max_purchase_per_address()) {
        return errors::LIMIT_EXCEEDED;
    }
    return errors::OK;
}

int32_t PurchaseEngine::settle(Settlement settlement, const Address& buyer,
                               const Address& asset, Amount paid) {
    bool settled = false;
    try {
        if (settlement == Settlement::NATIVE) {
            settled = context_.native_coin.transfer(buyer, context_.treasury, paid);
        } else {
            ITokenLedger* ledger = context_.tokens.find(asset);
            if (!ledger) return errors::UNKNOWN_TOKEN;
            settled = ledger->transfer_from(context_.sale, buyer, context_.treasury, paid);
        }
    } catch (const std::exception& e) {
        log::warn("payment from " + addresses::to_hex(buyer) + " threw: " + e.what());
        return errors::PAYMENT_FAILED;
    }
    return settled ? errors::OK : errors::PAYMENT_FAILED;
}

int32_t PurchaseEngine::record(const Address& buyer, Amount reference_amount, Amount tokens) {
    auto raised = amount::checked_add(totals_.total_raised, reference_amount);
    auto sold = amount::checked_add(totals_.total_tokens_sold, tokens);
    if (!raised || !sold) return errors::ARITHMETIC_OVERFLOW;

    if (int32_t rc = stages_.record_sale(tokens); rc != errors::OK) return rc;

    totals_.total_raised = *raised;
    totals_.total_tokens_sold = *sold;

    purchasers_undo_.touch(purchasers_, buyer);
    PurchaserRecord& rec = purchasers_[buyer];
    rec.total_tokens_purchased += tokens;  // Bounded by the limit check
    rec.total_paid_reference += reference_amount;
    ++rec.purchase_count;
    return errors::OK;
}

int32_t PurchaseEngine::release(const Address& buyer, Amount release_amount) {
    bool released = false;
    try {
        released = context_.sale_token.transfer(context_.sale, buyer, release_amount);
    } catch (const std::exception& e) {
        log::warn("token release to " + addresses::to_hex(buyer) + " threw: " + e.what());
        return errors::RELEASE_FAILED;
    }
    return released ? errors::OK : errors::RELEASE_FAILED;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<PurchaserRecord> PurchaseEngine::purchaser(const Address& buyer) const {
    auto it = purchasers_.find(buyer);
    if (it == purchasers_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Journaling
// =============================================================================

void PurchaseEngine::checkpoint() {
    totals_journal_.save(totals_);
    purchasers_undo_.begin();
}

void PurchaseEngine::rollback() {
    totals_journal_.restore(totals_);
    purchasers_undo_.restore(purchasers_);
}

void PurchaseEngine::commit() {
    totals_journal_.discard();
    purchasers_undo_.discard();
}

} // namespace crowdsale
