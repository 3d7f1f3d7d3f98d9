#ifndef CROWDSALE_ORACLE_HPP
#define CROWDSALE_ORACLE_HPP

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include "types.hpp"
#include "journal.hpp"

namespace crowdsale {

// =============================================================================
// Raw Report from a Price Feed
// =============================================================================

struct RoundReport {
    I128 price;              // Signed; <= 0 means no usable quote
    uint8_t decimals;
    Timestamp updated_at;
};

// =============================================================================
// Price Feed Interface (Chainlink-style aggregator, external collaborator)
// =============================================================================

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    // Latest report for a feed; nullopt when the feed is unknown or down
    virtual std::optional<RoundReport> latest_report(const Address& feed) const = 0;
};

// =============================================================================
// MemoryPriceFeed - settable reports keyed by feed address
// =============================================================================

class MemoryPriceFeed : public IPriceFeed, public Journaled {
public:
    MemoryPriceFeed() = default;

    // Non-copyable
    MemoryPriceFeed(const MemoryPriceFeed&) = delete;
    MemoryPriceFeed& operator=(const MemoryPriceFeed&) = delete;

    std::optional<RoundReport> latest_report(const Address& feed) const override;

    // Stores the report as given, including non-positive prices.
    // timestamp 0 means "now".
    void set_report(const Address& feed, I128 price, uint8_t decimals, Timestamp timestamp = 0);
    void remove(const Address& feed);

    uint64_t total_updates() const { return total_updates_.load(std::memory_order_relaxed); }

    void checkpoint() override;
    void rollback() override;
    void commit() override;

private:
    using ReportMap = std::unordered_map<Address, RoundReport, AddressHash>;

    mutable std::shared_mutex mutex_;
    ReportMap reports_;
    UndoLog<ReportMap> undo_;
    std::atomic<uint64_t> total_updates_{0};
};

// =============================================================================
// PriceOracleClient - validated, decimal-normalized price lookups
// =============================================================================

struct PriceReport {
    Amount value;
    uint8_t decimals;
};

using PriceResult = Result<PriceReport>;

class PriceOracleClient {
public:
    explicit PriceOracleClient(const IPriceFeed& feed);

    // Re-queries the feed on every call. Fails with ORACLE_UNAVAILABLE when
    // there is no report and ORACLE_STALE_OR_INVALID when price <= 0.
    PriceResult get_price(const Address& feed, uint8_t decimals = PRICE_DECIMALS) const;

    // Rescale a positive raw price between decimal precisions
    static Result<Amount> normalize(I128 price, uint8_t from_decimals, uint8_t to_decimals);

private:
    const IPriceFeed& feed_;
};

} // namespace crowdsale

#endif // CROWDSALE_ORACLE_HPP
