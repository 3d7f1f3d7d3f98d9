// crowdsale - Configuration and Hosting Tests

#include <catch2/catch.hpp>
#include <crowdsale/config.hpp>
#include <crowdsale/host.hpp>
#include <crowdsale/json.hpp>
#include <crowdsale/log.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace crowdsale;

namespace {

std::string addr(uint64_t n) { return addresses::to_hex(addresses::from_u64(n)); }

// Native coin at $2,000, USDC at $1, two stages
std::string sample_config() {
    nlohmann::json doc = {
        {"sale", addr(3)},
        {"token", addr(0x10)},
        {"treasury", addr(2)},
        {"owner", addr(1)},
        {"native_asset", addr(0x11)},
        {"native_feed", addr(0x21)},
        {"start_time", 1700000000},
        {"end_time", 1800000000},
        {"max_purchase_per_address", "100000"},
        {"token_decimals", 18},
        {"sale_supply", 500000},
        {"stages", {{{"rate", 10}, {"cap", "1000"}}, {{"rate", 5}, {"cap", 2000}}}},
        {"payment_assets", {{{"address", addr(0x12)}, {"feed", addr(0x22)}, {"decimals", 6}},
                            {{"address", addr(0x13)}, {"feed", addr(0x22)}, {"enabled", false}}}},
        {"feeds", {{{"address", addr(0x21)}, {"price", "200000000000"}, {"decimals", 8}},
                   {{"address", addr(0x22)}, {"price", 100000000}}}},
        {"log_level", "warn"},
    };
    return doc.dump();
}

SaleConfig valid_builder() {
    SaleConfig config;
    config.with_sale(addresses::from_u64(3))
        .with_token(addresses::from_u64(0x10))
        .with_treasury(addresses::from_u64(2))
        .with_owner(addresses::from_u64(1))
        .with_native(addresses::from_u64(0x11), addresses::from_u64(0x21))
        .with_window(1000, 2000)
        .with_stage(2, 100)
        .with_feed(addresses::from_u64(0x21), 100 * static_cast<I128>(100000000))
        .set_log_level("error");
    return config;
}

} // namespace

TEST_CASE("SaleConfig parses a JSON document", "[config]") {
    auto config = SaleConfig::from_json(sample_config());

    REQUIRE(config.sale == addresses::from_u64(3));
    REQUIRE(config.owner == addresses::from_u64(1));
    REQUIRE(config.start_time == 1700000000);
    REQUIRE(config.end_time == 1800000000);
    REQUIRE(config.max_purchase_per_address == 100000);
    REQUIRE(config.sale_supply == 500000);
    REQUIRE(config.native_decimals == 18);
    REQUIRE(config.log_level == "warn");

    REQUIRE(config.stages.size() == 2);
    REQUIRE(config.stages[0].rate == 10);
    REQUIRE(config.stages[0].cap == 1000);
    REQUIRE(config.stages[1].cap == 2000);

    REQUIRE(config.payment_assets.size() == 2);
    REQUIRE(config.payment_assets[0].decimals == 6);
    REQUIRE(config.payment_assets[0].enabled);
    REQUIRE(config.payment_assets[1].decimals == 18);
    REQUIRE_FALSE(config.payment_assets[1].enabled);

    REQUIRE(config.feeds.size() == 2);
    REQUIRE(config.feeds[0].price == 200000000000);
    REQUIRE(config.feeds[1].decimals == 8);

    auto params = config.to_params();
    REQUIRE(params.treasury == addresses::from_u64(2));
    REQUIRE(params.max_purchase_per_address == 100000);
}

TEST_CASE("SaleConfig defaults", "[config]") {
    auto doc = nlohmann::json::parse(sample_config());
    doc.erase("max_purchase_per_address");
    doc.erase("log_level");
    doc.erase("feeds");

    auto config = SaleConfig::from_json(doc.dump());
    REQUIRE(config.max_purchase_per_address == DEFAULT_MAX_PURCHASE);
    REQUIRE(config.log_level == "info");
    REQUIRE(config.feeds.empty());
}

TEST_CASE("SaleConfig rejects invalid documents", "[config]") {
    auto doc = nlohmann::json::parse(sample_config());

    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(SaleConfig::from_json("{ not json"), ConfigError);
        REQUIRE_THROWS_AS(SaleConfig::from_json("[1, 2]"), ConfigError);
    }

    SECTION("Bad address") {
        doc["treasury"] = "0x1234";
        REQUIRE_THROWS_AS(SaleConfig::from_json(doc.dump()), ConfigError);
    }

    SECTION("Missing treasury") {
        doc.erase("treasury");
        REQUIRE_THROWS_AS(SaleConfig::from_json(doc.dump()), ConfigError);
    }

    SECTION("Inverted window") {
        doc["end_time"] = 1600000000;
        REQUIRE_THROWS_AS(SaleConfig::from_json(doc.dump()), ConfigError);
    }

    SECTION("Zero-rate stage") {
        doc["stages"][0]["rate"] = 0;
        REQUIRE_THROWS_AS(SaleConfig::from_json(doc.dump()), ConfigError);
    }

    SECTION("Negative amount") {
        doc["max_purchase_per_address"] = -5;
        REQUIRE_THROWS_AS(SaleConfig::from_json(doc.dump()), ConfigError);
    }

    SECTION("Non-numeric amount string") {
        doc["sale_supply"] = "lots";
        REQUIRE_THROWS_AS(SaleConfig::from_json(doc.dump()), ConfigError);
    }

    SECTION("Unknown log level") {
        doc["log_level"] = "chatty";
        REQUIRE_THROWS_AS(SaleConfig::from_json(doc.dump()), ConfigError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(SaleConfig::from_file("/nonexistent/sale.json"), ConfigError);
    }
}

TEST_CASE("SaleConfig serializes back to JSON", "[config]") {
    auto config = SaleConfig::from_json(sample_config());
    auto again = SaleConfig::from_json(config.to_json());

    REQUIRE(again.sale == config.sale);
    REQUIRE(again.token == config.token);
    REQUIRE(again.sale_supply == config.sale_supply);
    REQUIRE(again.stages.size() == 2);
    REQUIRE(again.stages[1].rate == 5);
    REQUIRE(again.payment_assets.size() == 2);
    REQUIRE_FALSE(again.payment_assets[1].enabled);
    REQUIRE(again.feeds[0].price == config.feeds[0].price);
    REQUIRE(again.log_level == "warn");
}

TEST_CASE("SaleConfig builder", "[config]") {
    auto config = valid_builder();
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.stages.size() == 1);
    REQUIRE(config.feeds[0].decimals == 8);

    config.set_max_purchase(0);
    REQUIRE_THROWS_AS(config.validate(), ConfigError);
}

TEST_CASE("SaleHost builds a working sale", "[config][host]") {
    auto config = SaleConfig::from_json(sample_config());
    SaleHost host(config);
    CrowdSale& sale = host.sale();
    sale.set_clock([] { return Timestamp{1700000100}; });

    const Address owner = addresses::from_u64(1);
    const Address buyer = addresses::from_u64(0x100);

    REQUIRE(log::level() == log::Level::WARN);
    REQUIRE(sale.stages().size() == 2);
    REQUIRE(sale.is_acceptable(addresses::from_u64(0x11)));
    REQUIRE(sale.is_acceptable(addresses::from_u64(0x12)));
    REQUIRE_FALSE(sale.is_acceptable(addresses::from_u64(0x13)));
    REQUIRE(sale.payment_asset(addresses::from_u64(0x12))->decimals == 6);
    REQUIRE(host.sale_token().balance_of(addresses::from_u64(3)) ==
            500000 * *amount::pow10(18));

    // 1 coin at $2,000 and rate 10 -> 20,000 tokens overshoots the 1,000 cap
    host.native_coin().mint(buyer, *amount::pow10(18));
    REQUIRE(sale.buy_with_native(buyer, *amount::pow10(18)).status == errors::STAGE_CAPACITY);

    // $50 -> 500 tokens
    MemoryTokenLedger* usdc = host.ledger(addresses::from_u64(0x12));
    REQUIRE(usdc != nullptr);
    usdc->mint(buyer, 50000000);
    usdc->approve(buyer, addresses::from_u64(3), 50000000);
    auto result = sale.buy_with_token(buyer, addresses::from_u64(0x12), 50000000);
    REQUIRE(result.ok());
    REQUIRE(result.tokens == 500);
    REQUIRE(usdc->balance_of(addresses::from_u64(2)) == 50000000);

    REQUIRE(sale.state().owner == owner);
    REQUIRE(host.ledger(addresses::from_u64(0x99)) == nullptr);

    log::set_level(log::Level::INFO);
}

TEST_CASE("SaleHost rejects an invalid config", "[config][host]") {
    auto config = valid_builder();
    config.stages.push_back(StageConfig{0, 10});
    REQUIRE_THROWS_AS(SaleHost(config), ConfigError);
}

TEST_CASE("JSON views", "[config][json]") {
    SECTION("Status carries the error name") {
        auto ok = status_json(errors::OK);
        REQUIRE(ok["ok"].get<bool>());
        REQUIRE_FALSE(ok.contains("error"));

        auto failed = status_json(errors::ALREADY_FINALIZED);
        REQUIRE(failed["error"].get<std::string>() == "StateError::AlreadyFinalized");
    }

    SECTION("Events render their name and fields") {
        Event event = StageAdded{1, 2, 500};
        auto out = event_json(event);
        REQUIRE(out["event"].get<std::string>() == "StageAdded");
        REQUIRE(out["data"]["index"].get<uint32_t>() == 1);
        REQUIRE(out["data"]["cap"].get<std::string>() == "500");
    }

    SECTION("State amounts are decimal strings") {
        SaleState state{};
        state.total_tokens_sold = 1234;
        state.owner = addresses::from_u64(1);
        auto out = state_json(state, SalePhase::OPEN);
        REQUIRE(out["phase"].get<std::string>() == "open");
        REQUIRE(out["total_tokens_sold"].get<std::string>() == "1234");
        REQUIRE(out["owner"].get<std::string>() == addr(1));
    }
}
