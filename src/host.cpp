// =============================================================================
// host.cpp - In-Memory Sale Wiring
// =============================================================================

#include "crowdsale/host.hpp"
#include "crowdsale/log.hpp"

namespace crowdsale {

SaleHost::SaleHost(const SaleConfig& config)
    : config_(config) {
    config_.validate();
    if (auto level = log::parse_level(config_.log_level)) {
        log::set_level(*level);
    }

    sale_token_ = std::make_unique<MemoryTokenLedger>(config_.token, config_.token_decimals);
    native_coin_ = std::make_unique<MemoryTokenLedger>(config_.native_asset, config_.native_decimals);
    directory_.add(*native_coin_);

    for (const auto& asset : config_.payment_assets) {
        if (asset.address == config_.native_asset || directory_.find(asset.address)) continue;
        payment_ledgers_.push_back(std::make_unique<MemoryTokenLedger>(asset.address, asset.decimals));
        directory_.add(*payment_ledgers_.back());
    }

    for (const auto& f : config_.feeds) {
        feed_.set_report(f.address, f.price, f.decimals);
    }

    sale_ = std::make_unique<CrowdSale>(config_.to_params(), *sale_token_, *native_coin_,
                                        feed_, directory_);
    sale_->enlist(*sale_token_);
    sale_->enlist(*native_coin_);
    for (auto& ledger : payment_ledgers_) sale_->enlist(*ledger);
    sale_->enlist(feed_);

    const Address& owner = config_.owner;
    apply("register native asset",
          sale_->register_payment_asset(owner, config_.native_asset, config_.native_feed));
    apply("enable native asset", sale_->enable_payment_asset(owner, config_.native_asset));

    for (const auto& asset : config_.payment_assets) {
        if (asset.address == config_.native_asset) continue;
        apply("register payment asset",
              sale_->register_payment_asset(owner, asset.address, asset.feed));
        if (asset.enabled && !sale_->is_acceptable(asset.address)) {
            apply("enable payment asset", sale_->enable_payment_asset(owner, asset.address));
        }
    }

    for (const auto& stage : config_.stages) {
        apply("add stage", sale_->add_stage(owner, stage.rate, stage.cap));
    }

    if (config_.sale_supply > 0) {
        auto scale = amount::pow10(config_.token_decimals);
        auto supply = scale ? amount::checked_mul(config_.sale_supply, *scale) : std::nullopt;
        if (!supply) apply("mint sale supply", errors::ARITHMETIC_OVERFLOW);
        apply("mint sale supply", sale_token_->mint(config_.sale, *supply));
    }

    log::info("hosted sale ready: " + std::to_string(config_.stages.size()) + " stage(s), " +
              std::to_string(config_.payment_assets.size()) + " payment asset(s)");
}

MemoryTokenLedger* SaleHost::ledger(const Address& asset) {
    if (asset == native_coin_->address()) return native_coin_.get();
    for (auto& ledger : payment_ledgers_) {
        if (ledger->address() == asset) return ledger.get();
    }
    return nullptr;
}

void SaleHost::apply(const char* step, int32_t status) const {
    if (status != errors::OK) {
        throw ConfigError(std::string(step) + " failed: " + error_name(status));
    }
}

} // namespace crowdsale
