// crowdsale - Payment Token Registry Tests

#include <catch2/catch.hpp>
#include <crowdsale/registry.hpp>

#include <stdexcept>

using namespace crowdsale;

namespace {

class BrokenLedger : public ITokenLedger {
public:
    explicit BrokenLedger(const Address& addr) : addr_(addr) {}
    Address address() const override { return addr_; }
    uint8_t decimals() const override { throw std::runtime_error("no decimals"); }
    Amount balance_of(const Address&) const override { return 0; }
    bool transfer(const Address&, const Address&, Amount) override { return false; }
    bool transfer_from(const Address&, const Address&, const Address&, Amount) override {
        return false;
    }

private:
    Address addr_;
};

} // namespace

TEST_CASE("PaymentTokenRegistry lifecycle", "[registry]") {
    const Address owner = addresses::from_u64(1);
    const Address stranger = addresses::from_u64(2);
    const Address usdc = addresses::from_u64(0x12);
    const Address feed = addresses::from_u64(0x22);
    const Address other_feed = addresses::from_u64(0x23);

    EventLog events;
    Ownership ownership(owner, events);
    MemoryTokenLedger usdc_ledger(usdc, 6);
    TokenDirectory directory;
    directory.add(usdc_ledger);
    PaymentTokenRegistry registry(ownership, directory, events);

    SECTION("Register reads decimals and starts inactive") {
        REQUIRE(registry.register_asset(owner, usdc, feed) == errors::OK);
        auto entry = registry.get(usdc);
        REQUIRE(entry.has_value());
        REQUIRE(entry->decimals == 6);
        REQUIRE(entry->feed == feed);
        REQUIRE_FALSE(entry->active);
        REQUIRE_FALSE(registry.is_acceptable(usdc));
    }

    SECTION("Unknown ledger defaults to 18 decimals") {
        const Address unknown = addresses::from_u64(0x99);
        REQUIRE(registry.register_asset(owner, unknown, feed) == errors::OK);
        REQUIRE(registry.get(unknown)->decimals == 18);
    }

    SECTION("Zero addresses are rejected") {
        REQUIRE(registry.register_asset(owner, addresses::ZERO, feed) == errors::ZERO_ADDRESS);
        REQUIRE(registry.register_asset(owner, usdc, addresses::ZERO) == errors::ZERO_ADDRESS);
        REQUIRE(registry.assets().empty());
    }

    SECTION("Only the owner may mutate") {
        REQUIRE(registry.register_asset(stranger, usdc, feed) == errors::UNAUTHORIZED);
        registry.register_asset(owner, usdc, feed);
        REQUIRE(registry.enable_asset(stranger, usdc) == errors::UNAUTHORIZED);
        REQUIRE(registry.disable_asset(stranger, usdc) == errors::UNAUTHORIZED);
    }

    SECTION("Enable and disable toggle acceptance") {
        registry.register_asset(owner, usdc, feed);
        REQUIRE(registry.enable_asset(owner, usdc) == errors::OK);
        REQUIRE(registry.is_acceptable(usdc));
        REQUIRE(registry.enable_asset(owner, usdc) == errors::ALREADY_ENABLED);

        REQUIRE(registry.disable_asset(owner, usdc) == errors::OK);
        REQUIRE_FALSE(registry.is_acceptable(usdc));
    }

    SECTION("Disabling an already disabled asset fails") {
        registry.register_asset(owner, usdc, feed);
        registry.enable_asset(owner, usdc);
        registry.disable_asset(owner, usdc);
        REQUIRE(registry.disable_asset(owner, usdc) == errors::ALREADY_DISABLED);
    }

    SECTION("Unregistered assets cannot be toggled") {
        REQUIRE(registry.enable_asset(owner, usdc) == errors::ALREADY_ENABLED);
        REQUIRE(registry.disable_asset(owner, usdc) == errors::ALREADY_DISABLED);
    }

    SECTION("Re-registering overwrites the feed and keeps the flag") {
        registry.register_asset(owner, usdc, feed);
        registry.enable_asset(owner, usdc);
        REQUIRE(registry.register_asset(owner, usdc, other_feed) == errors::OK);
        REQUIRE(registry.get(usdc)->feed == other_feed);
        REQUIRE(registry.is_acceptable(usdc));
        REQUIRE(registry.assets().size() == 1);
    }

    SECTION("Every mutation emits PaymentAssetUpdated") {
        registry.register_asset(owner, usdc, feed);
        registry.enable_asset(owner, usdc);
        registry.disable_asset(owner, usdc);
        auto history = events.history();
        REQUIRE(history.size() == 3);
        auto& last = std::get<PaymentAssetUpdated>(history.back());
        REQUIRE(last.asset == usdc);
        REQUIRE_FALSE(last.active);
    }
}

TEST_CASE("PaymentTokenRegistry rejects a ledger without decimals", "[registry]") {
    const Address owner = addresses::from_u64(1);
    const Address asset = addresses::from_u64(0x13);
    EventLog events;
    Ownership ownership(owner, events);
    BrokenLedger broken(asset);
    TokenDirectory directory;
    directory.add(broken);
    PaymentTokenRegistry registry(ownership, directory, events);

    REQUIRE(registry.register_asset(owner, asset, addresses::from_u64(0x22)) == errors::UNKNOWN_TOKEN);
    REQUIRE_FALSE(registry.get(asset).has_value());
}

TEST_CASE("Assets are listed in address order", "[registry]") {
    const Address owner = addresses::from_u64(1);
    EventLog events;
    Ownership ownership(owner, events);
    TokenDirectory directory;
    PaymentTokenRegistry registry(ownership, directory, events);

    registry.register_asset(owner, addresses::from_u64(0x30), addresses::from_u64(0x40));
    registry.register_asset(owner, addresses::from_u64(0x10), addresses::from_u64(0x40));
    registry.register_asset(owner, addresses::from_u64(0x20), addresses::from_u64(0x40));

    auto listed = registry.assets();
    REQUIRE(listed.size() == 3);
    REQUIRE(listed[0].first == addresses::from_u64(0x10));
    REQUIRE(listed[2].first == addresses::from_u64(0x30));
}
