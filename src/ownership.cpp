// =============================================================================
// ownership.cpp - Owner Principal Checks
// =============================================================================

#include "crowdsale/ownership.hpp"
#include "crowdsale/log.hpp"

namespace crowdsale {

Ownership::Ownership(const Address& owner, EventLog& events)
    : owner_(owner)
    , events_(events) {}

int32_t Ownership::check(const Address& caller) const {
    if (caller != owner_) {
        log::debug("unauthorized caller " + addresses::to_hex(caller));
        return errors::UNAUTHORIZED;
    }
    return errors::OK;
}

int32_t Ownership::transfer(const Address& caller, const Address& new_owner) {
    if (int32_t rc = check(caller); rc != errors::OK) return rc;
    if (addresses::is_zero(new_owner)) return errors::ZERO_ADDRESS;

    Address previous = owner_;
    owner_ = new_owner;
    events_.publish(OwnershipTransferred{previous, new_owner});
    log::info("ownership transferred to " + addresses::to_hex(new_owner));
    return errors::OK;
}

} // namespace crowdsale
