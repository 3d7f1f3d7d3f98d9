#ifndef CROWDSALE_HOST_HPP
#define CROWDSALE_HOST_HPP

#include <memory>
#include <vector>

#include "config.hpp"
#include "sale.hpp"
#include "token.hpp"
#include "oracle.hpp"

namespace crowdsale {

// =============================================================================
// SaleHost - one sale over in-memory ledgers and feeds
//
// Builds the ledgers, price feed and directory a SaleConfig describes,
// creates the sale, enlists every in-memory collaborator so rolled-back
// purchases restore balances, then applies the configured assets and stages
// as the owner.
// =============================================================================

class SaleHost {
public:
    // Throws ConfigError when the config is invalid or a setup step fails
    explicit SaleHost(const SaleConfig& config);

    // Non-copyable
    SaleHost(const SaleHost&) = delete;
    SaleHost& operator=(const SaleHost&) = delete;

    CrowdSale& sale() { return *sale_; }
    const CrowdSale& sale() const { return *sale_; }

    MemoryTokenLedger& sale_token() { return *sale_token_; }
    MemoryTokenLedger& native_coin() { return *native_coin_; }
    MemoryPriceFeed& feed() { return feed_; }
    TokenDirectory& directory() { return directory_; }

    // Ledger of a configured payment asset (native coin included)
    MemoryTokenLedger* ledger(const Address& asset);

    const SaleConfig& config() const { return config_; }

private:
    SaleConfig config_;

    MemoryPriceFeed feed_;
    TokenDirectory directory_;
    std::unique_ptr<MemoryTokenLedger> sale_token_;
    std::unique_ptr<MemoryTokenLedger> native_coin_;
    std::vector<std::unique_ptr<MemoryTokenLedger>> payment_ledgers_;
    std::unique_ptr<CrowdSale> sale_;

    void apply(const char* step, int32_t status) const;
};

} // namespace crowdsale

#endif // CROWDSALE_HOST_HPP
