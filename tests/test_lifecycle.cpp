// crowdsale - Sale Lifecycle Tests

#include <catch2/catch.hpp>
#include <crowdsale/lifecycle.hpp>

using namespace crowdsale;

TEST_CASE("SaleLifecycle phases", "[lifecycle]") {
    const Address owner = addresses::from_u64(1);
    EventLog events;
    Ownership ownership(owner, events);
    SaleLifecycle lifecycle(ownership, events, 1000, 2000, DEFAULT_MAX_PURCHASE);

    SECTION("Window boundaries are inclusive") {
        REQUIRE(lifecycle.phase(999) == SalePhase::PENDING);
        REQUIRE(lifecycle.phase(1000) == SalePhase::OPEN);
        REQUIRE(lifecycle.phase(2000) == SalePhase::OPEN);
        REQUIRE(lifecycle.phase(2001) == SalePhase::ENDED);

        REQUIRE(lifecycle.check_purchasable(999) == errors::SALE_NOT_STARTED);
        REQUIRE(lifecycle.check_purchasable(1500) == errors::OK);
        REQUIRE(lifecycle.check_purchasable(2001) == errors::SALE_ENDED);
    }

    SECTION("Pause and unpause") {
        REQUIRE(lifecycle.unpause(owner) == errors::NOT_PAUSED);
        REQUIRE(lifecycle.pause(owner) == errors::OK);
        REQUIRE(lifecycle.pause(owner) == errors::ALREADY_PAUSED);
        REQUIRE(lifecycle.phase(1500) == SalePhase::PAUSED);
        REQUIRE(lifecycle.check_purchasable(1500) == errors::SALE_PAUSED);

        REQUIRE(lifecycle.unpause(owner) == errors::OK);
        REQUIRE(lifecycle.phase(1500) == SalePhase::OPEN);
    }

    SECTION("Finalization is terminal") {
        REQUIRE(lifecycle.finalize(owner) == errors::OK);
        REQUIRE(lifecycle.is_finalized());
        REQUIRE(lifecycle.phase(1500) == SalePhase::FINALIZED);
        REQUIRE(lifecycle.check_purchasable(1500) == errors::ALREADY_FINALIZED);

        REQUIRE(lifecycle.finalize(owner) == errors::ALREADY_FINALIZED);
        REQUIRE(lifecycle.pause(owner) == errors::ALREADY_FINALIZED);
        REQUIRE(lifecycle.unpause(owner) == errors::ALREADY_FINALIZED);
        REQUIRE(lifecycle.update_end_time(owner, 3000, 1500) == errors::ALREADY_FINALIZED);
        REQUIRE(lifecycle.update_max_purchase_limit(owner, 5) == errors::ALREADY_FINALIZED);
        REQUIRE(lifecycle.on_stages_exhausted() == errors::ALREADY_FINALIZED);
    }

    SECTION("Stage exhaustion finalizes with its own reason") {
        REQUIRE(lifecycle.on_stages_exhausted() == errors::OK);
        REQUIRE(lifecycle.is_finalized());
        auto history = events.history();
        REQUIRE(history.size() == 1);
        REQUIRE(std::get<SaleFinalized>(history[0]).reason == FinalizeReason::STAGES_EXHAUSTED);
    }

    SECTION("Administrative calls are owner only") {
        const Address stranger = addresses::from_u64(9);
        REQUIRE(lifecycle.pause(stranger) == errors::UNAUTHORIZED);
        REQUIRE(lifecycle.finalize(stranger) == errors::UNAUTHORIZED);
        REQUIRE(lifecycle.update_end_time(stranger, 3000, 1500) == errors::UNAUTHORIZED);
        REQUIRE(lifecycle.update_max_purchase_limit(stranger, 5) == errors::UNAUTHORIZED);
        REQUIRE_FALSE(lifecycle.is_finalized());
    }
}

TEST_CASE("SaleLifecycle settings", "[lifecycle]") {
    const Address owner = addresses::from_u64(1);
    EventLog events;
    Ownership ownership(owner, events);
    SaleLifecycle lifecycle(ownership, events, 1000, 2000, 100);

    SECTION("End time must be in the future and after start") {
        REQUIRE(lifecycle.update_end_time(owner, 1500, 1500) == errors::PAST_TIMESTAMP);
        REQUIRE(lifecycle.update_end_time(owner, 900, 500) == errors::BEFORE_START);
        REQUIRE(lifecycle.end_time() == 2000);

        REQUIRE(lifecycle.update_end_time(owner, 5000, 1500) == errors::OK);
        REQUIRE(lifecycle.end_time() == 5000);
        auto updated = std::get<EndTimeUpdated>(events.history().back());
        REQUIRE(updated.previous_end == 2000);
        REQUIRE(updated.end == 5000);
    }

    SECTION("Extending the end reopens an ended sale") {
        REQUIRE(lifecycle.phase(2500) == SalePhase::ENDED);
        REQUIRE(lifecycle.update_end_time(owner, 3000, 2500) == errors::OK);
        REQUIRE(lifecycle.phase(2500) == SalePhase::OPEN);
    }

    SECTION("Purchase limit must be positive") {
        REQUIRE(lifecycle.update_max_purchase_limit(owner, 0) == errors::NON_POSITIVE_AMOUNT);
        REQUIRE(lifecycle.update_max_purchase_limit(owner, 250) == errors::OK);
        REQUIRE(lifecycle.max_purchase_per_address() == 250);
        auto updated = std::get<MaxPurchaseLimitUpdated>(events.history().back());
        REQUIRE(updated.previous_limit == 100);
        REQUIRE(updated.limit == 250);
    }
}
