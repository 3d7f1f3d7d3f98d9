// crowdsale - Price Oracle Client Tests

#include <catch2/catch.hpp>
#include <crowdsale/oracle.hpp>

#include <stdexcept>

using namespace crowdsale;

namespace {

class ThrowingFeed : public IPriceFeed {
public:
    std::optional<RoundReport> latest_report(const Address&) const override {
        throw std::runtime_error("aggregator offline");
    }
};

} // namespace

TEST_CASE("PriceOracleClient validates and normalizes", "[oracle]") {
    const Address feed_addr = addresses::from_u64(0x21);
    MemoryPriceFeed feed;
    PriceOracleClient client(feed);

    SECTION("Scales an 8-decimal report up to 18") {
        feed.set_report(feed_addr, 2000 * static_cast<I128>(100000000), 8);
        auto price = client.get_price(feed_addr);
        REQUIRE(price.ok());
        REQUIRE(price.value.decimals == 18);
        REQUIRE(price.value.value == 2000 * *amount::pow10(18));
    }

    SECTION("Scales down with truncation") {
        feed.set_report(feed_addr, 123456789, 8);
        auto price = client.get_price(feed_addr, 2);
        REQUIRE(price.ok());
        REQUIRE(price.value.value == 123);
    }

    SECTION("Negative price is stale or invalid") {
        feed.set_report(feed_addr, -1, 8);
        auto price = client.get_price(feed_addr);
        REQUIRE(price.status == errors::ORACLE_STALE_OR_INVALID);
    }

    SECTION("Zero price is stale or invalid") {
        feed.set_report(feed_addr, 0, 8);
        REQUIRE(client.get_price(feed_addr).status == errors::ORACLE_STALE_OR_INVALID);
    }

    SECTION("Price truncated to zero is stale or invalid") {
        feed.set_report(feed_addr, 5, 8);
        REQUIRE(client.get_price(feed_addr, 2).status == errors::ORACLE_STALE_OR_INVALID);
    }

    SECTION("Missing report is unavailable") {
        REQUIRE(client.get_price(feed_addr).status == errors::ORACLE_UNAVAILABLE);
    }

    SECTION("Every call re-queries the feed") {
        feed.set_report(feed_addr, 100, 0);
        REQUIRE(client.get_price(feed_addr, 0).value.value == 100);
        feed.set_report(feed_addr, 250, 0);
        REQUIRE(client.get_price(feed_addr, 0).value.value == 250);
        REQUIRE(feed.total_updates() == 2);
    }
}

TEST_CASE("PriceOracleClient handles a throwing feed", "[oracle]") {
    ThrowingFeed feed;
    PriceOracleClient client(feed);
    REQUIRE(client.get_price(addresses::from_u64(1)).status == errors::ORACLE_UNAVAILABLE);
}

TEST_CASE("Price normalization bounds", "[oracle]") {
    SECTION("Scaling past 128 bits overflows") {
        auto r = PriceOracleClient::normalize(static_cast<I128>(1) << 100, 0, 18);
        REQUIRE(r.status == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Same precision is identity") {
        auto r = PriceOracleClient::normalize(42, 18, 18);
        REQUIRE(r.ok());
        REQUIRE(r.value == 42);
    }
}

TEST_CASE("MemoryPriceFeed rollback", "[oracle][journal]") {
    const Address feed_addr = addresses::from_u64(0x21);
    MemoryPriceFeed feed;
    feed.set_report(feed_addr, 10, 0, 1);

    feed.checkpoint();
    feed.set_report(feed_addr, 20, 0, 2);
    feed.rollback();

    auto report = feed.latest_report(feed_addr);
    REQUIRE(report.has_value());
    REQUIRE(report->price == 10);
    REQUIRE(report->updated_at == 1);
}
