#ifndef CROWDSALE_JSON_HPP
#define CROWDSALE_JSON_HPP

// JSON views of sale state, results and events.
// Amounts are rendered as decimal strings; addresses as 0x-hex.

#include <nlohmann/json_fwd.hpp>

#include "sale.hpp"

namespace crowdsale {

nlohmann::json status_json(int32_t status);

nlohmann::json event_json(const Event& event);
nlohmann::json state_json(const SaleState& state, SalePhase phase);
nlohmann::json stage_json(const SaleStage& stage, uint32_t index);
nlohmann::json purchase_json(const PurchaseResult& result);
nlohmann::json quote_json(const QuoteResult& quote);
nlohmann::json purchaser_json(const Address& buyer, const PurchaserRecord& record);
nlohmann::json asset_json(const Address& asset, const PaymentAsset& entry, bool acceptable);

} // namespace crowdsale

#endif // CROWDSALE_JSON_HPP
