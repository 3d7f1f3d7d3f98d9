#ifndef CROWDSALE_TOKEN_HPP
#define CROWDSALE_TOKEN_HPP

#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include "types.hpp"
#include "journal.hpp"

namespace crowdsale {

// =============================================================================
// Token Ledger Interface (ERC-20-like external collaborator)
//
// Implementations are untrusted: calls may fail, throw, or call back into
// the sale.
// =============================================================================

class ITokenLedger {
public:
    virtual ~ITokenLedger() = default;

    virtual Address address() const = 0;
    virtual uint8_t decimals() const = 0;
    virtual Amount balance_of(const Address& owner) const = 0;

    // Move `amount` from `from` (the authorizing caller) to `to`
    virtual bool transfer(const Address& from, const Address& to, Amount amount) = 0;

    // Move `amount` from `owner` to `to` against the allowance `owner`
    // granted to `spender`
    virtual bool transfer_from(const Address& spender, const Address& owner,
                               const Address& to, Amount amount) = 0;
};

// =============================================================================
// TokenDirectory - resolves asset addresses to their ledgers
// =============================================================================

class TokenDirectory {
public:
    void add(ITokenLedger& ledger);
    void remove(const Address& asset);

    ITokenLedger* find(const Address& asset) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<Address, ITokenLedger*, AddressHash> ledgers_;
};

// =============================================================================
// MemoryTokenLedger - in-process balances and allowances
// =============================================================================

class MemoryTokenLedger : public ITokenLedger, public Journaled {
public:
    // Invoked after a transfer moved funds; returning false reverts it
    using TransferHook = std::function<bool(const Address& from, const Address& to, Amount amount)>;

    MemoryTokenLedger(const Address& address, uint8_t decimals,
                      std::optional<Amount> supply_cap = std::nullopt);

    // Non-copyable
    MemoryTokenLedger(const MemoryTokenLedger&) = delete;
    MemoryTokenLedger& operator=(const MemoryTokenLedger&) = delete;

    Address address() const override { return address_; }
    uint8_t decimals() const override { return decimals_; }
    Amount balance_of(const Address& owner) const override;

    bool transfer(const Address& from, const Address& to, Amount amount) override;
    bool transfer_from(const Address& spender, const Address& owner,
                       const Address& to, Amount amount) override;

    // Setup and inspection
    int32_t mint(const Address& to, Amount amount);
    int32_t approve(const Address& owner, const Address& spender, Amount amount);
    Amount allowance(const Address& owner, const Address& spender) const;
    Amount total_supply() const;
    std::optional<Amount> supply_cap() const { return supply_cap_; }

    void set_transfer_hook(TransferHook hook);

    void checkpoint() override;
    void rollback() override;
    void commit() override;

private:
    struct AllowanceKey {
        Address owner;
        Address spender;
        bool operator==(const AllowanceKey& other) const {
            return owner == other.owner && spender == other.spender;
        }
    };
    struct AllowanceKeyHash {
        size_t operator()(const AllowanceKey& k) const {
            return AddressHash{}(k.owner) * 31 + AddressHash{}(k.spender);
        }
    };

    using BalanceMap = std::unordered_map<Address, Amount, AddressHash>;
    using AllowanceMap = std::unordered_map<AllowanceKey, Amount, AllowanceKeyHash>;

    struct State {
        BalanceMap balances;
        AllowanceMap allowances;
        Amount total_supply = 0;
    };

    Address address_;
    uint8_t decimals_;
    std::optional<Amount> supply_cap_;

    mutable std::shared_mutex mutex_;
    State state_;
    StateJournal<Amount> supply_journal_;
    UndoLog<BalanceMap> balances_undo_;
    UndoLog<AllowanceMap> allowances_undo_;
    TransferHook hook_;

    // Caller holds mutex_ exclusively
    void set_allowance_locked(const AllowanceKey& key, Amount amount);
    bool move_locked(const Address& from, const Address& to, Amount amount);
    bool run_hook(const Address& from, const Address& to, Amount amount);
};

} // namespace crowdsale

#endif // CROWDSALE_TOKEN_HPP
