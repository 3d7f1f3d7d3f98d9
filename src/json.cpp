// =============================================================================
// json.cpp - JSON Rendering
// =============================================================================

#include "crowdsale/json.hpp"

#include <nlohmann/json.hpp>

namespace crowdsale {

using json = nlohmann::json;

namespace {

std::string str(Amount v) { return amount::to_string(v); }
std::string hex(const Address& a) { return addresses::to_hex(a); }

struct EventFields {
    json operator()(const PurchaseCompleted& e) const {
        return {{"buyer", hex(e.buyer)},
                {"payment_asset", hex(e.payment_asset)},
                {"amount_paid", str(e.amount_paid)},
                {"reference_amount", str(e.reference_amount)},
                {"tokens", str(e.tokens)},
                {"stage_index", e.stage_index}};
    }
    json operator()(const StageAdded& e) const {
        return {{"index", e.index}, {"rate", str(e.rate)}, {"cap", str(e.cap)}};
    }
    json operator()(const StageUpdated& e) const {
        return {{"previous_index", e.previous_index}, {"index", e.index}, {"manual", e.manual}};
    }
    json operator()(const SaleFinalized& e) const {
        return {{"reason", e.reason == FinalizeReason::OWNER ? "owner" : "stages_exhausted"}};
    }
    json operator()(const FundsWithdrawn& e) const {
        return {{"asset", hex(e.asset)}, {"to", hex(e.to)}, {"amount", str(e.amount)}};
    }
    json operator()(const EndTimeUpdated& e) const {
        return {{"previous_end", e.previous_end}, {"end", e.end}};
    }
    json operator()(const MaxPurchaseLimitUpdated& e) const {
        return {{"previous_limit", str(e.previous_limit)}, {"limit", str(e.limit)}};
    }
    json operator()(const SalePaused&) const { return json::object(); }
    json operator()(const SaleUnpaused&) const { return json::object(); }
    json operator()(const PaymentAssetUpdated& e) const {
        return {{"asset", hex(e.asset)}, {"feed", hex(e.feed)}, {"active", e.active}};
    }
    json operator()(const OwnershipTransferred& e) const {
        return {{"previous_owner", hex(e.previous_owner)}, {"owner", hex(e.owner)}};
    }
};

} // anonymous namespace

json status_json(int32_t status) {
    json out = {{"status", status}, {"ok", status == errors::OK}};
    if (status != errors::OK) out["error"] = error_name(status);
    return out;
}

json event_json(const Event& event) {
    return {{"event", event_name(event)}, {"data", std::visit(EventFields{}, event)}};
}

json state_json(const SaleState& state, SalePhase phase) {
    return {{"phase", phase_name(phase)},
            {"start_time", state.start_time},
            {"end_time", state.end_time},
            {"finalized", state.finalized},
            {"paused", state.paused},
            {"current_stage_index", state.current_stage_index},
            {"total_raised", str(state.total_raised)},
            {"total_tokens_sold", str(state.total_tokens_sold)},
            {"max_purchase_per_address", str(state.max_purchase_per_address)},
            {"treasury", hex(state.treasury)},
            {"owner", hex(state.owner)}};
}

json stage_json(const SaleStage& stage, uint32_t index) {
    return {{"index", index},
            {"rate", str(stage.rate)},
            {"cap", str(stage.cap)},
            {"sold", str(stage.sold)}};
}

json purchase_json(const PurchaseResult& result) {
    json out = status_json(result.status);
    if (result.ok()) {
        out["reference_amount"] = str(result.reference_amount);
        out["tokens"] = str(result.tokens);
        out["stage_index"] = result.stage_index;
        out["stage_advanced"] = result.stage_advanced;
        out["finalized"] = result.finalized;
    }
    return out;
}

json quote_json(const QuoteResult& quote) {
    json out = status_json(quote.status);
    if (quote.ok()) {
        out["price"] = str(quote.value.price);
        out["reference_amount"] = str(quote.value.reference_amount);
        out["tokens"] = str(quote.value.tokens);
        out["rate"] = str(quote.value.rate);
        out["stage_index"] = quote.value.stage_index;
    }
    return out;
}

json purchaser_json(const Address& buyer, const PurchaserRecord& record) {
    return {{"buyer", hex(buyer)},
            {"total_tokens_purchased", str(record.total_tokens_purchased)},
            {"total_paid_reference", str(record.total_paid_reference)},
            {"purchase_count", record.purchase_count}};
}

json asset_json(const Address& asset, const PaymentAsset& entry, bool acceptable) {
    return {{"asset", hex(asset)},
            {"feed", hex(entry.feed)},
            {"decimals", entry.decimals},
            {"active", entry.active},
            {"acceptable", acceptable}};
}

} // namespace crowdsale
