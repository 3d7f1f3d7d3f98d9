#ifndef CROWDSALE_REGISTRY_HPP
#define CROWDSALE_REGISTRY_HPP

#include <optional>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "journal.hpp"
#include "events.hpp"
#include "ownership.hpp"
#include "token.hpp"

namespace crowdsale {

// =============================================================================
// Payment Asset
// =============================================================================

struct PaymentAsset {
    Address feed;            // Price feed reference
    uint8_t decimals;        // Base-unit decimals of the asset
    bool active;
};

// =============================================================================
// PaymentTokenRegistry - accepted payment assets and their price feeds
// =============================================================================

class PaymentTokenRegistry : public Journaled {
public:
    PaymentTokenRegistry(const Ownership& ownership, const TokenDirectory& tokens, EventLog& events);

    // Upsert; a re-registered asset keeps its active flag
    int32_t register_asset(const Address& caller, const Address& asset, const Address& feed);

    int32_t enable_asset(const Address& caller, const Address& asset);
    int32_t disable_asset(const Address& caller, const Address& asset);

    bool is_acceptable(const Address& asset) const;
    std::optional<PaymentAsset> get(const Address& asset) const;

    // All registered assets ordered by address
    std::vector<std::pair<Address, PaymentAsset>> assets() const;

    void checkpoint() override { undo_.begin(); }
    void rollback() override { undo_.restore(assets_); }
    void commit() override { undo_.discard(); }

private:
    using AssetMap = std::unordered_map<Address, PaymentAsset, AddressHash>;

    const Ownership& ownership_;
    const TokenDirectory& tokens_;
    EventLog& events_;

    AssetMap assets_;
    UndoLog<AssetMap> undo_;
};

} // namespace crowdsale

#endif // CROWDSALE_REGISTRY_HPP
