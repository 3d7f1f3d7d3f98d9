// Sale configuration - JSON loading and validation

#include "crowdsale/config.hpp"
#include "crowdsale/sale.hpp"
#include "crowdsale/log.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace crowdsale {

using json = nlohmann::json;

namespace {

constexpr uint8_t MAX_TOKEN_DECIMALS = 38;

const json* find_key(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

Address read_address(const json& obj, const char* key, const Address& fallback = {}) {
    const json* value = find_key(obj, key);
    if (!value) return fallback;
    if (!value->is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a hex address string");
    }
    auto addr = addresses::from_hex(value->get<std::string>());
    if (!addr) {
        throw ConfigError(std::string("'") + key + "' is not a valid address: " +
                          value->get<std::string>());
    }
    return *addr;
}

// Unsigned amounts accept JSON numbers or decimal strings (for values past 2^64)
Amount read_amount(const json& obj, const char* key, Amount fallback) {
    const json* value = find_key(obj, key);
    if (!value) return fallback;
    if (value->is_number_unsigned()) {
        return static_cast<Amount>(value->get<uint64_t>());
    }
    if (value->is_string()) {
        auto parsed = amount::parse(value->get<std::string>());
        if (parsed) return *parsed;
    }
    throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
}

I128 read_signed(const json& obj, const char* key, I128 fallback) {
    const json* value = find_key(obj, key);
    if (!value) return fallback;
    if (value->is_number_integer()) {
        return static_cast<I128>(value->get<int64_t>());
    }
    if (value->is_string()) {
        std::string text = value->get<std::string>();
        std::string_view digits(text);
        bool negative = !digits.empty() && digits.front() == '-';
        if (negative) digits.remove_prefix(1);
        auto magnitude = amount::parse(digits);
        constexpr Amount I128_MAX = AMOUNT_MAX >> 1;
        if (magnitude && *magnitude <= I128_MAX) {
            I128 v = static_cast<I128>(*magnitude);
            return negative ? -v : v;
        }
    }
    throw ConfigError(std::string("'") + key + "' must be an integer");
}

uint8_t read_decimals(const json& obj, const char* key, uint8_t fallback) {
    const json* value = find_key(obj, key);
    if (!value) return fallback;
    if (!value->is_number_unsigned() || value->get<uint64_t>() > 255) {
        throw ConfigError(std::string("'") + key + "' must be an integer in [0, 255]");
    }
    return static_cast<uint8_t>(value->get<uint64_t>());
}

Timestamp read_timestamp(const json& obj, const char* key) {
    const json* value = find_key(obj, key);
    if (!value) return 0;
    if (!value->is_number_unsigned()) {
        throw ConfigError(std::string("'") + key + "' must be a unix timestamp");
    }
    return value->get<uint64_t>();
}

bool read_bool(const json& obj, const char* key, bool fallback) {
    const json* value = find_key(obj, key);
    if (!value) return fallback;
    if (!value->is_boolean()) {
        throw ConfigError(std::string("'") + key + "' must be a boolean");
    }
    return value->get<bool>();
}

const json* read_array(const json& obj, const char* key) {
    const json* value = find_key(obj, key);
    if (!value) return nullptr;
    if (!value->is_array()) {
        throw ConfigError(std::string("'") + key + "' must be an array");
    }
    return value;
}

}  // namespace

SaleConfig SaleConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

SaleConfig SaleConfig::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid config JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    SaleConfig config;
    config.sale = read_address(root, "sale");
    config.token = read_address(root, "token");
    config.treasury = read_address(root, "treasury");
    config.owner = read_address(root, "owner");
    config.native_asset = read_address(root, "native_asset");
    config.native_feed = read_address(root, "native_feed");
    config.start_time = read_timestamp(root, "start_time");
    config.end_time = read_timestamp(root, "end_time");
    config.max_purchase_per_address =
        read_amount(root, "max_purchase_per_address", DEFAULT_MAX_PURCHASE);
    config.token_decimals = read_decimals(root, "token_decimals", 18);
    config.native_decimals = read_decimals(root, "native_decimals", 18);
    config.sale_supply = read_amount(root, "sale_supply", 0);

    if (const json* stages = read_array(root, "stages")) {
        for (const auto& entry : *stages) {
            if (!entry.is_object()) throw ConfigError("stage entries must be objects");
            config.stages.push_back(StageConfig{read_amount(entry, "rate", 0),
                                                read_amount(entry, "cap", 0)});
        }
    }

    if (const json* assets = read_array(root, "payment_assets")) {
        for (const auto& entry : *assets) {
            if (!entry.is_object()) throw ConfigError("payment asset entries must be objects");
            PaymentAssetConfig asset;
            asset.address = read_address(entry, "address");
            asset.feed = read_address(entry, "feed");
            asset.decimals = read_decimals(entry, "decimals", 18);
            asset.enabled = read_bool(entry, "enabled", true);
            config.payment_assets.push_back(asset);
        }
    }

    if (const json* feeds = read_array(root, "feeds")) {
        for (const auto& entry : *feeds) {
            if (!entry.is_object()) throw ConfigError("feed entries must be objects");
            FeedConfig feed;
            feed.address = read_address(entry, "address");
            feed.price = read_signed(entry, "price", 0);
            feed.decimals = read_decimals(entry, "decimals", 8);
            config.feeds.push_back(feed);
        }
    }

    if (const json* level = find_key(root, "log_level")) {
        if (!level->is_string()) throw ConfigError("'log_level' must be a string");
        config.log_level = level->get<std::string>();
    }

    config.validate();
    return config;
}

std::string SaleConfig::to_json() const {
    json root;
    root["sale"] = addresses::to_hex(sale);
    root["token"] = addresses::to_hex(token);
    root["treasury"] = addresses::to_hex(treasury);
    root["owner"] = addresses::to_hex(owner);
    root["native_asset"] = addresses::to_hex(native_asset);
    root["native_feed"] = addresses::to_hex(native_feed);
    root["start_time"] = start_time;
    root["end_time"] = end_time;
    root["max_purchase_per_address"] = amount::to_string(max_purchase_per_address);
    root["token_decimals"] = token_decimals;
    root["native_decimals"] = native_decimals;
    root["sale_supply"] = amount::to_string(sale_supply);
    root["log_level"] = log_level;

    root["stages"] = json::array();
    for (const auto& stage : stages) {
        root["stages"].push_back({{"rate", amount::to_string(stage.rate)},
                                  {"cap", amount::to_string(stage.cap)}});
    }

    root["payment_assets"] = json::array();
    for (const auto& asset : payment_assets) {
        root["payment_assets"].push_back({{"address", addresses::to_hex(asset.address)},
                                          {"feed", addresses::to_hex(asset.feed)},
                                          {"decimals", asset.decimals},
                                          {"enabled", asset.enabled}});
    }

    root["feeds"] = json::array();
    for (const auto& feed : feeds) {
        root["feeds"].push_back({{"address", addresses::to_hex(feed.address)},
                                 {"price", amount::to_string(feed.price)},
                                 {"decimals", feed.decimals}});
    }

    return root.dump(2);
}

void SaleConfig::validate() const {
    int32_t rc = SaleParams::validate(to_params());
    if (rc != errors::OK) {
        throw ConfigError(std::string("invalid sale parameters: ") + error_name(rc));
    }
    if (addresses::is_zero(token)) throw ConfigError("'token' must be set");
    if (addresses::is_zero(native_feed)) throw ConfigError("'native_feed' must be set");
    if (token_decimals > MAX_TOKEN_DECIMALS) {
        throw ConfigError("'token_decimals' must be at most 38");
    }
    if (!log::parse_level(log_level)) {
        throw ConfigError("unknown log_level: " + log_level);
    }

    for (size_t i = 0; i < stages.size(); ++i) {
        if (stages[i].rate == 0 || stages[i].cap == 0) {
            throw ConfigError("stage " + std::to_string(i) + " needs a positive rate and cap");
        }
    }
    for (const auto& asset : payment_assets) {
        if (addresses::is_zero(asset.address) || addresses::is_zero(asset.feed)) {
            throw ConfigError("payment assets need a non-zero address and feed");
        }
    }
    for (const auto& feed : feeds) {
        if (addresses::is_zero(feed.address)) throw ConfigError("feeds need a non-zero address");
    }
}

SaleParams SaleConfig::to_params() const {
    SaleParams params;
    params.sale = sale;
    params.owner = owner;
    params.treasury = treasury;
    params.native_asset = native_asset;
    params.start_time = start_time;
    params.end_time = end_time;
    params.max_purchase_per_address = max_purchase_per_address;
    return params;
}

}  // namespace crowdsale
