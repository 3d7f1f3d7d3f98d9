#ifndef CROWDSALE_OWNERSHIP_HPP
#define CROWDSALE_OWNERSHIP_HPP

#include "types.hpp"
#include "journal.hpp"
#include "events.hpp"

namespace crowdsale {

// =============================================================================
// Ownership - single privileged principal for administrative mutations
// =============================================================================

class Ownership : public Journaled {
public:
    Ownership(const Address& owner, EventLog& events);

    const Address& owner() const { return owner_; }
    bool is_owner(const Address& caller) const { return caller == owner_; }

    // errors::OK for the owner, errors::UNAUTHORIZED for anyone else
    int32_t check(const Address& caller) const;

    int32_t transfer(const Address& caller, const Address& new_owner);

    void checkpoint() override { journal_.save(owner_); }
    void rollback() override { journal_.restore(owner_); }
    void commit() override { journal_.discard(); }

private:
    Address owner_;
    EventLog& events_;
    StateJournal<Address> journal_;
};

} // namespace crowdsale

#endif // CROWDSALE_OWNERSHIP_HPP
