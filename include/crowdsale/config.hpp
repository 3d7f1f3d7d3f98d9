#ifndef CROWDSALE_CONFIG_HPP
#define CROWDSALE_CONFIG_HPP

// Sale configuration
// Loaded from JSON; builder methods for programmatic setup

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace crowdsale {

struct SaleParams;

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct StageConfig {
    Amount rate;
    Amount cap;
};

// Payment asset accepted by the sale, priced through `feed`
struct PaymentAssetConfig {
    Address address{};
    Address feed{};
    uint8_t decimals = 18;
    bool enabled = true;
};

// Initial report seeded into a hosted price feed
struct FeedConfig {
    Address address{};
    I128 price = 0;
    uint8_t decimals = 8;
};

class SaleConfig {
public:
    Address sale{};
    Address token{};               // Sale-token ledger address
    Address treasury{};
    Address owner{};
    Address native_asset{};
    Address native_feed{};
    Timestamp start_time = 0;
    Timestamp end_time = 0;
    Amount max_purchase_per_address = DEFAULT_MAX_PURCHASE;
    uint8_t token_decimals = 18;
    uint8_t native_decimals = 18;
    Amount sale_supply = 0;        // Whole tokens minted to the sale account
    std::vector<StageConfig> stages;
    std::vector<PaymentAssetConfig> payment_assets;
    std::vector<FeedConfig> feeds;
    std::string log_level = "info";

    SaleConfig() = default;

    // Load from a JSON file
    static SaleConfig from_file(std::string_view path);

    // Load from a JSON document
    static SaleConfig from_json(std::string_view content);

    // Serialize back to a JSON document
    std::string to_json() const;

    // Throws ConfigError on the first invalid field
    void validate() const;

    SaleParams to_params() const;

    // Builder methods
    SaleConfig& with_sale(const Address& addr) {
        sale = addr;
        return *this;
    }

    SaleConfig& with_token(const Address& addr, uint8_t decimals = 18) {
        token = addr;
        token_decimals = decimals;
        return *this;
    }

    SaleConfig& with_treasury(const Address& addr) {
        treasury = addr;
        return *this;
    }

    SaleConfig& with_owner(const Address& addr) {
        owner = addr;
        return *this;
    }

    SaleConfig& with_native(const Address& asset, const Address& feed, uint8_t decimals = 18) {
        native_asset = asset;
        native_feed = feed;
        native_decimals = decimals;
        return *this;
    }

    SaleConfig& with_window(Timestamp start, Timestamp end) {
        start_time = start;
        end_time = end;
        return *this;
    }

    SaleConfig& set_max_purchase(Amount limit) {
        max_purchase_per_address = limit;
        return *this;
    }

    SaleConfig& set_sale_supply(Amount whole_tokens) {
        sale_supply = whole_tokens;
        return *this;
    }

    SaleConfig& with_stage(Amount rate, Amount cap) {
        stages.push_back(StageConfig{rate, cap});
        return *this;
    }

    SaleConfig& with_payment_asset(PaymentAssetConfig asset) {
        payment_assets.push_back(asset);
        return *this;
    }

    SaleConfig& with_feed(const Address& addr, I128 price, uint8_t decimals = 8) {
        feeds.push_back(FeedConfig{addr, price, decimals});
        return *this;
    }

    SaleConfig& set_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }
};

} // namespace crowdsale

#endif // CROWDSALE_CONFIG_HPP
