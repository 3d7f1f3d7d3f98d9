// =============================================================================
// registry.cpp - Payment Asset Registry
// =============================================================================

#include "crowdsale/registry.hpp"
#include "crowdsale/log.hpp"

#include <algorithm>
#include <exception>

namespace crowdsale {

namespace {

constexpr uint8_t DEFAULT_ASSET_DECIMALS = 18;

} // anonymous namespace

PaymentTokenRegistry::PaymentTokenRegistry(const Ownership& ownership,
                                           const TokenDirectory& tokens,
                                           EventLog& events)
    : ownership_(ownership)
    , tokens_(tokens)
    , events_(events) {}

// =============================================================================
// Mutations (owner only)
// =============================================================================

int32_t PaymentTokenRegistry::register_asset(const Address& caller, const Address& asset,
                                             const Address& feed) {
    if (int32_t rc = ownership_.check(caller); rc != errors::OK) return rc;
    if (addresses::is_zero(asset) || addresses::is_zero(feed)) {
        return errors::ZERO_ADDRESS;
    }

    uint8_t decimals = DEFAULT_ASSET_DECIMALS;
    if (ITokenLedger* ledger = tokens_.find(asset)) {
        try {
            decimals = ledger->decimals();
        } catch (const std::exception& e) {
            log::warn("decimals() failed for " + addresses::to_hex(asset) + ": " + e.what());
            return errors::UNKNOWN_TOKEN;
        }
    }

    auto it = assets_.find(asset);
    bool active = (it != assets_.end()) && it->second.active;
    undo_.touch(assets_, asset);
    assets_[asset] = PaymentAsset{feed, decimals, active};

    events_.publish(PaymentAssetUpdated{asset, feed, active});
    log::info("payment asset " + addresses::to_hex(asset) + " registered with feed " +
              addresses::to_hex(feed));
    return errors::OK;
}

int32_t PaymentTokenRegistry::enable_asset(const Address& caller, const Address& asset) {
    if (int32_t rc = ownership_.check(caller); rc != errors::OK) return rc;

    auto it = assets_.find(asset);
    if (it == assets_.end() || it->second.active) {
        return errors::ALREADY_ENABLED;
    }

    undo_.touch(assets_, asset);
    it->second.active = true;
    events_.publish(PaymentAssetUpdated{asset, it->second.feed, true});
    log::info("payment asset " + addresses::to_hex(asset) + " enabled");
    return errors::OK;
}

int32_t PaymentTokenRegistry::disable_asset(const Address& caller, const Address& asset) {
    if (int32_t rc = ownership_.check(caller); rc != errors::OK) return rc;

    auto it = assets_.find(asset);
    if (it == assets_.end() || !it->second.active) {
        return errors::ALREADY_DISABLED;
    }

    undo_.touch(assets_, asset);
    it->second.active = false;
    events_.publish(PaymentAssetUpdated{asset, it->second.feed, false});
    log::info("payment asset " + addresses::to_hex(asset) + " disabled");
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

bool PaymentTokenRegistry::is_acceptable(const Address& asset) const {
    auto it = assets_.find(asset);
    return it != assets_.end() && it->second.active && !addresses::is_zero(it->second.feed);
}

std::optional<PaymentAsset> PaymentTokenRegistry::get(const Address& asset) const {
    auto it = assets_.find(asset);
    if (it == assets_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::pair<Address, PaymentAsset>> PaymentTokenRegistry::assets() const {
    std::vector<std::pair<Address, PaymentAsset>> out(assets_.begin(), assets_.end());
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return out;
}

} // namespace crowdsale
