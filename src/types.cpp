// =============================================================================
// types.cpp - Address, Amount and Error Code Helpers
// =============================================================================

#include "crowdsale/types.hpp"

#include <algorithm>

namespace crowdsale {

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::optional<Address> from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() != 40) return std::nullopt;

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// 256-bit Intermediate (two U128 limbs)
// =============================================================================

namespace {

struct U256 {
    U128 lo;
    U128 hi;
};

U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// Restoring long division, one bit at a time from the top.
// The running remainder stays below denom, so it fits in 128 bits
// plus the bit shifted out, which is tracked as `carry`.
std::optional<U128> div_u256_u128(const U256& num, U128 denom) {
    if (denom == 0) return std::nullopt;
    if (num.hi == 0) return num.lo / denom;
    if (num.hi >= denom) return std::nullopt;  // quotient needs > 128 bits

    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    return quot;
}

} // anonymous namespace

// =============================================================================
// Amount Arithmetic
// =============================================================================

namespace amount {

std::optional<Amount> pow10(uint32_t exp) {
    if (exp > 38) return std::nullopt;
    Amount v = 1;
    for (uint32_t i = 0; i < exp; ++i) v *= 10;
    return v;
}

std::optional<Amount> checked_add(Amount a, Amount b) {
    if (a > AMOUNT_MAX - b) return std::nullopt;
    return a + b;
}

std::optional<Amount> checked_mul(Amount a, Amount b) {
    if (a != 0 && b > AMOUNT_MAX / a) return std::nullopt;
    return a * b;
}

std::optional<Amount> mul_div(Amount a, Amount b, Amount denom) {
    return div_u256_u128(mul_u128(a, b), denom);
}

std::string to_string(Amount v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(I128 v) {
    if (v >= 0) return to_string(static_cast<Amount>(v));
    // Negate in unsigned space so INT128_MIN does not overflow
    return "-" + to_string(static_cast<Amount>(0) - static_cast<Amount>(v));
}

std::optional<Amount> parse(std::string_view text) {
    if (text.empty()) return std::nullopt;
    Amount v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        auto scaled = checked_mul(v, 10);
        if (!scaled) return std::nullopt;
        auto next = checked_add(*scaled, static_cast<Amount>(c - '0'));
        if (!next) return std::nullopt;
        v = *next;
    }
    return v;
}

} // namespace amount

// =============================================================================
// Error Taxonomy
// =============================================================================

ErrorKind error_kind(int32_t code) {
    if (code == errors::OK) return ErrorKind::NONE;
    switch (-code / 100) {
        case 1: return ErrorKind::VALIDATION;
        case 2: return ErrorKind::STATE;
        case 3: return ErrorKind::ORACLE;
        case 4: return ErrorKind::INSUFFICIENT_SUPPLY;
        case 5: return ErrorKind::LIMIT_EXCEEDED;
        case 6: return ErrorKind::EXTERNAL;
        case 7: return ErrorKind::UNAUTHORIZED;
        case 8: return ErrorKind::REENTRANCY;
        default: return ErrorKind::EXTERNAL;
    }
}

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "Ok";
        case errors::ZERO_ADDRESS: return "ValidationError::ZeroAddress";
        case errors::NON_POSITIVE_AMOUNT: return "ValidationError::NonPositiveAmount";
        case errors::NON_POSITIVE_RATE: return "ValidationError::NonPositiveRate";
        case errors::NON_POSITIVE_CAP: return "ValidationError::NonPositiveCap";
        case errors::PAST_TIMESTAMP: return "ValidationError::PastTimestamp";
        case errors::BEFORE_START: return "ValidationError::BeforeStart";
        case errors::INVALID_TIME_WINDOW: return "ValidationError::InvalidTimeWindow";
        case errors::ZERO_TOKEN_AMOUNT: return "ValidationError::ZeroTokenAmount";
        case errors::ARITHMETIC_OVERFLOW: return "ValidationError::ArithmeticOverflow";
        case errors::ALREADY_FINALIZED: return "StateError::AlreadyFinalized";
        case errors::NO_ACTIVE_STAGE: return "StateError::NoActiveStage";
        case errors::FINAL_STAGE_REACHED: return "StateError::FinalStageReached";
        case errors::ALREADY_ENABLED: return "StateError::AlreadyEnabled";
        case errors::ALREADY_DISABLED: return "StateError::AlreadyDisabled";
        case errors::SALE_NOT_STARTED: return "StateError::SaleNotStarted";
        case errors::SALE_ENDED: return "StateError::SaleEnded";
        case errors::SALE_PAUSED: return "StateError::SalePaused";
        case errors::NOT_PAUSED: return "StateError::NotPaused";
        case errors::ALREADY_PAUSED: return "StateError::AlreadyPaused";
        case errors::ASSET_NOT_ACCEPTED: return "StateError::AssetNotAccepted";
        case errors::ORACLE_STALE_OR_INVALID: return "OracleError::StaleOrInvalid";
        case errors::ORACLE_UNAVAILABLE: return "OracleError::Unavailable";
        case errors::INSUFFICIENT_SUPPLY: return "InsufficientSupply";
        case errors::STAGE_CAPACITY: return "InsufficientSupply::StageCapacity";
        case errors::LIMIT_EXCEEDED: return "LimitExceeded";
        case errors::PAYMENT_FAILED: return "ExternalError::PaymentFailed";
        case errors::RELEASE_FAILED: return "ExternalError::ReleaseFailed";
        case errors::TRANSFER_FAILED: return "ExternalError::TransferFailed";
        case errors::UNKNOWN_TOKEN: return "ExternalError::UnknownToken";
        case errors::INSUFFICIENT_BALANCE: return "ExternalError::InsufficientBalance";
        case errors::UNAUTHORIZED: return "Unauthorized";
        case errors::REENTRANCY: return "ReentrancyError";
        default: return "UnknownError";
    }
}

} // namespace crowdsale
