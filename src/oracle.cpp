// =============================================================================
// oracle.cpp - Price Feed Storage and Oracle Client
// =============================================================================

#include "crowdsale/oracle.hpp"
#include "crowdsale/log.hpp"

#include <chrono>
#include <exception>
#include <mutex>

namespace crowdsale {

namespace {

Timestamp current_timestamp() {
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // anonymous namespace

// =============================================================================
// MemoryPriceFeed
// =============================================================================

std::optional<RoundReport> MemoryPriceFeed::latest_report(const Address& feed) const {
    std::shared_lock lock(mutex_);
    auto it = reports_.find(feed);
    if (it == reports_.end()) return std::nullopt;
    return it->second;
}

void MemoryPriceFeed::set_report(const Address& feed, I128 price, uint8_t decimals,
                                 Timestamp timestamp) {
    if (timestamp == 0) {
        timestamp = current_timestamp();
    }

    std::unique_lock lock(mutex_);
    undo_.touch(reports_, feed);
    reports_[feed] = RoundReport{price, decimals, timestamp};
    total_updates_.fetch_add(1, std::memory_order_relaxed);
}

void MemoryPriceFeed::remove(const Address& feed) {
    std::unique_lock lock(mutex_);
    undo_.touch(reports_, feed);
    reports_.erase(feed);
}

void MemoryPriceFeed::checkpoint() {
    std::unique_lock lock(mutex_);
    undo_.begin();
}

void MemoryPriceFeed::rollback() {
    std::unique_lock lock(mutex_);
    undo_.restore(reports_);
}

void MemoryPriceFeed::commit() {
    std::unique_lock lock(mutex_);
    undo_.discard();
}

// =============================================================================
// PriceOracleClient
// =============================================================================

PriceOracleClient::PriceOracleClient(const IPriceFeed& feed)
    : feed_(feed) {}

PriceResult PriceOracleClient::get_price(const Address& feed, uint8_t decimals) const {
    std::optional<RoundReport> report;
    try {
        report = feed_.latest_report(feed);
    } catch (const std::exception& e) {
        log::warn("price feed " + addresses::to_hex(feed) + " threw: " + e.what());
        return PriceResult::failure(errors::ORACLE_UNAVAILABLE);
    }

    if (!report) {
        return PriceResult::failure(errors::ORACLE_UNAVAILABLE);
    }
    if (report->price <= 0) {
        log::debug("price feed " + addresses::to_hex(feed) + " reported " +
                   amount::to_string(report->price));
        return PriceResult::failure(errors::ORACLE_STALE_OR_INVALID);
    }

    auto value = normalize(report->price, report->decimals, decimals);
    if (!value.ok()) return PriceResult::failure(value.status);
    if (value.value == 0) return PriceResult::failure(errors::ORACLE_STALE_OR_INVALID);

    return PriceResult::success(PriceReport{value.value, decimals});
}

Result<Amount> PriceOracleClient::normalize(I128 price, uint8_t from_decimals, uint8_t to_decimals) {
    if (price <= 0) return Result<Amount>::failure(errors::ORACLE_STALE_OR_INVALID);

    Amount raw = static_cast<Amount>(price);
    if (to_decimals >= from_decimals) {
        auto scale = amount::pow10(to_decimals - from_decimals);
        if (!scale) return Result<Amount>::failure(errors::ARITHMETIC_OVERFLOW);
        auto scaled = amount::checked_mul(raw, *scale);
        if (!scaled) return Result<Amount>::failure(errors::ARITHMETIC_OVERFLOW);
        return Result<Amount>::success(*scaled);
    }

    // Scaling down truncates; a divisor past 10^38 leaves nothing
    auto scale = amount::pow10(from_decimals - to_decimals);
    return Result<Amount>::success(scale ? raw / *scale : 0);
}

} // namespace crowdsale
