// =============================================================================
// token.cpp - Token Directory and In-Memory Token Ledger
// =============================================================================

#include "crowdsale/token.hpp"
#include "crowdsale/log.hpp"

#include <mutex>

namespace crowdsale {

// =============================================================================
// TokenDirectory
// =============================================================================

void TokenDirectory::add(ITokenLedger& ledger) {
    std::unique_lock lock(mutex_);
    ledgers_[ledger.address()] = &ledger;
}

void TokenDirectory::remove(const Address& asset) {
    std::unique_lock lock(mutex_);
    ledgers_.erase(asset);
}

ITokenLedger* TokenDirectory::find(const Address& asset) const {
    std::shared_lock lock(mutex_);
    auto it = ledgers_.find(asset);
    return it == ledgers_.end() ? nullptr : it->second;
}

// =============================================================================
// MemoryTokenLedger
// =============================================================================

MemoryTokenLedger::MemoryTokenLedger(const Address& address, uint8_t decimals,
                                     std::optional<Amount> supply_cap)
    : address_(address)
    , decimals_(decimals)
    , supply_cap_(supply_cap) {}

Amount MemoryTokenLedger::balance_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = state_.balances.find(owner);
    return it == state_.balances.end() ? 0 : it->second;
}

bool MemoryTokenLedger::transfer(const Address& from, const Address& to, Amount amount) {
    {
        std::unique_lock lock(mutex_);
        if (!move_locked(from, to, amount)) return false;
    }

    auto revert = [&] {
        std::unique_lock lock(mutex_);
        if (!move_locked(to, from, amount)) {
            log::error("transfer revert failed on " + addresses::to_hex(address_));
        }
    };

    bool accepted;
    try {
        accepted = run_hook(from, to, amount);
    } catch (...) {
        revert();
        throw;
    }
    if (!accepted) revert();
    return accepted;
}

bool MemoryTokenLedger::transfer_from(const Address& spender, const Address& owner,
                                      const Address& to, Amount amount) {
    {
        std::unique_lock lock(mutex_);
        auto it = state_.allowances.find(AllowanceKey{owner, spender});
        if (it == state_.allowances.end() || it->second < amount) return false;
        Amount remaining = it->second - amount;
        if (!move_locked(owner, to, amount)) return false;
        set_allowance_locked(AllowanceKey{owner, spender}, remaining);
    }

    auto revert = [&] {
        std::unique_lock lock(mutex_);
        if (!move_locked(to, owner, amount)) {
            log::error("transfer_from revert failed on " + addresses::to_hex(address_));
        }
        AllowanceKey key{owner, spender};
        auto current = state_.allowances.find(key);
        set_allowance_locked(key, (current == state_.allowances.end() ? 0 : current->second) + amount);
    };

    bool accepted;
    try {
        accepted = run_hook(owner, to, amount);
    } catch (...) {
        revert();
        throw;
    }
    if (!accepted) revert();
    return accepted;
}

int32_t MemoryTokenLedger::mint(const Address& to, Amount amount) {
    if (addresses::is_zero(to)) return errors::ZERO_ADDRESS;
    if (amount == 0) return errors::NON_POSITIVE_AMOUNT;

    std::unique_lock lock(mutex_);
    auto supply = amount::checked_add(state_.total_supply, amount);
    if (!supply) return errors::ARITHMETIC_OVERFLOW;
    if (supply_cap_ && *supply > *supply_cap_) return errors::INSUFFICIENT_SUPPLY;

    state_.total_supply = *supply;
    balances_undo_.touch(state_.balances, to);
    state_.balances[to] += amount;
    return errors::OK;
}

int32_t MemoryTokenLedger::approve(const Address& owner, const Address& spender, Amount amount) {
    if (addresses::is_zero(owner) || addresses::is_zero(spender)) return errors::ZERO_ADDRESS;

    std::unique_lock lock(mutex_);
    set_allowance_locked(AllowanceKey{owner, spender}, amount);
    return errors::OK;
}

Amount MemoryTokenLedger::allowance(const Address& owner, const Address& spender) const {
    std::shared_lock lock(mutex_);
    auto it = state_.allowances.find(AllowanceKey{owner, spender});
    return it == state_.allowances.end() ? 0 : it->second;
}

Amount MemoryTokenLedger::total_supply() const {
    std::shared_lock lock(mutex_);
    return state_.total_supply;
}

void MemoryTokenLedger::set_transfer_hook(TransferHook hook) {
    std::unique_lock lock(mutex_);
    hook_ = std::move(hook);
}

// =============================================================================
// Journaling
// =============================================================================

void MemoryTokenLedger::checkpoint() {
    std::unique_lock lock(mutex_);
    supply_journal_.save(state_.total_supply);
    balances_undo_.begin();
    allowances_undo_.begin();
}

void MemoryTokenLedger::rollback() {
    std::unique_lock lock(mutex_);
    supply_journal_.restore(state_.total_supply);
    balances_undo_.restore(state_.balances);
    allowances_undo_.restore(state_.allowances);
}

void MemoryTokenLedger::commit() {
    std::unique_lock lock(mutex_);
    supply_journal_.discard();
    balances_undo_.discard();
    allowances_undo_.discard();
}

// =============================================================================
// Internal Helpers
// =============================================================================

bool MemoryTokenLedger::move_locked(const Address& from, const Address& to, Amount amount) {
    if (addresses::is_zero(to)) return false;

    auto it = state_.balances.find(from);
    if (it == state_.balances.end() || it->second < amount) return false;

    balances_undo_.touch(state_.balances, from);
    balances_undo_.touch(state_.balances, to);
    state_.balances[from] -= amount;
    state_.balances[to] += amount;
    return true;
}

void MemoryTokenLedger::set_allowance_locked(const AllowanceKey& key, Amount amount) {
    allowances_undo_.touch(state_.allowances, key);
    state_.allowances[key] = amount;
}

bool MemoryTokenLedger::run_hook(const Address& from, const Address& to, Amount amount) {
    TransferHook hook;
    {
        std::shared_lock lock(mutex_);
        hook = hook_;
    }
    if (!hook) return true;

    bool accepted = hook(from, to, amount);
    if (!accepted) {
        log::debug("transfer of " + amount::to_string(amount) + " on " +
                   addresses::to_hex(address_) + " rejected by hook");
    }
    return accepted;
}

} // namespace crowdsale
