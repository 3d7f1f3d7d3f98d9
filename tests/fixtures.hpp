// crowdsale tests - shared sale fixture

#ifndef CROWDSALE_TESTS_FIXTURES_HPP
#define CROWDSALE_TESTS_FIXTURES_HPP

#include <catch2/catch.hpp>
#include <crowdsale/sale.hpp>

#include <memory>
#include <string>
#include <vector>

namespace crowdsale::testing {

constexpr Amount E18 = static_cast<Amount>(1000000000000000000ULL);
constexpr Amount E6 = 1000000;
constexpr Amount E8 = 100000000;

inline Amount ether(uint64_t n) { return static_cast<Amount>(n) * E18; }
inline Amount usdc(uint64_t n) { return static_cast<Amount>(n) * E6; }

// Event names in publication order
inline std::vector<std::string> event_names(const EventLog& log) {
    std::vector<std::string> names;
    for (const auto& event : log.history()) names.emplace_back(event_name(event));
    return names;
}

inline size_t count_events(const EventLog& log, const std::string& name) {
    size_t n = 0;
    for (const auto& event : log.history()) {
        if (name == event_name(event)) ++n;
    }
    return n;
}

// Sale over in-memory ledgers:
//   native coin priced at $100 (8-decimal feed), USDC (6 decimals) at $1,
//   1,000,000 whole sale tokens held by the sale account,
//   buyers funded with 1,000 native and 1,000,000 USDC (approved to the sale),
//   clock inside the sale window.
struct SaleFixture {
    const Address owner = addresses::from_u64(1);
    const Address treasury = addresses::from_u64(2);
    const Address sale_account = addresses::from_u64(3);
    const Address token_address = addresses::from_u64(0x10);
    const Address native = addresses::from_u64(0x11);
    const Address usdc_address = addresses::from_u64(0x12);
    const Address native_feed = addresses::from_u64(0x21);
    const Address usdc_feed = addresses::from_u64(0x22);
    const Address buyer = addresses::from_u64(0x100);
    const Address buyer2 = addresses::from_u64(0x101);
    const Address stranger = addresses::from_u64(0x666);

    const Timestamp start = 1700000000;
    const Timestamp end = 1800000000;
    Timestamp clock = start + 60;

    MemoryTokenLedger token{token_address, 18};
    MemoryTokenLedger native_coin{native, 18};
    MemoryTokenLedger usdc_ledger{usdc_address, 6};
    MemoryPriceFeed feed;
    TokenDirectory directory;
    std::unique_ptr<CrowdSale> sale;

    explicit SaleFixture(Amount max_purchase = DEFAULT_MAX_PURCHASE) {
        directory.add(native_coin);
        directory.add(usdc_ledger);

        SaleParams params;
        params.sale = sale_account;
        params.owner = owner;
        params.treasury = treasury;
        params.native_asset = native;
        params.start_time = start;
        params.end_time = end;
        params.max_purchase_per_address = max_purchase;

        sale = std::make_unique<CrowdSale>(params, token, native_coin, feed, directory);
        sale->set_clock([this]() { return clock; });
        sale->enlist(token);
        sale->enlist(native_coin);
        sale->enlist(usdc_ledger);
        sale->enlist(feed);

        feed.set_report(native_feed, static_cast<I128>(100 * E8), 8, start);
        feed.set_report(usdc_feed, static_cast<I128>(E8), 8, start);

        REQUIRE(sale->register_payment_asset(owner, native, native_feed) == errors::OK);
        REQUIRE(sale->enable_payment_asset(owner, native) == errors::OK);
        REQUIRE(sale->register_payment_asset(owner, usdc_address, usdc_feed) == errors::OK);
        REQUIRE(sale->enable_payment_asset(owner, usdc_address) == errors::OK);

        REQUIRE(token.mint(sale_account, ether(1000000)) == errors::OK);
        for (const Address& b : {buyer, buyer2}) {
            REQUIRE(native_coin.mint(b, ether(1000)) == errors::OK);
            REQUIRE(usdc_ledger.mint(b, usdc(1000000)) == errors::OK);
            REQUIRE(usdc_ledger.approve(b, sale_account, usdc(1000000)) == errors::OK);
        }
    }

    CrowdSale& s() { return *sale; }
};

} // namespace crowdsale::testing

#endif // CROWDSALE_TESTS_FIXTURES_HPP
