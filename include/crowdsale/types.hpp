#ifndef CROWDSALE_TYPES_HPP
#define CROWDSALE_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <utility>

namespace crowdsale {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Build an address whose low 8 bytes hold `n` (test and CLI accounts)
constexpr Address from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional "0x" prefix; nullopt on bad length or digit
std::optional<Address> from_hex(std::string_view text);

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& addr) const {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Integer Amounts
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// Token, coin and reference-currency amounts
using Amount = U128;

// Seconds since the Unix epoch
using Timestamp = uint64_t;

constexpr Amount AMOUNT_MAX = ~static_cast<U128>(0);

// Prices are normalized to this many decimals before conversion
constexpr uint8_t PRICE_DECIMALS = 18;

// Default purchase limit per address, in whole sale tokens
constexpr Amount DEFAULT_MAX_PURCHASE = 10000000;

namespace amount {

// 10^exp; nullopt when it does not fit in 128 bits (exp > 38)
std::optional<Amount> pow10(uint32_t exp);

std::optional<Amount> checked_add(Amount a, Amount b);
std::optional<Amount> checked_mul(Amount a, Amount b);

// floor(a * b / denom) with a 256-bit intermediate product.
// nullopt when denom is zero or the quotient exceeds 128 bits.
std::optional<Amount> mul_div(Amount a, Amount b, Amount denom);

std::string to_string(Amount v);
std::string to_string(I128 v);

// Decimal digits only; nullopt on empty input, junk or overflow
std::optional<Amount> parse(std::string_view text);

} // namespace amount

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation (malformed input)
constexpr int32_t ZERO_ADDRESS = -101;
constexpr int32_t NON_POSITIVE_AMOUNT = -102;
constexpr int32_t NON_POSITIVE_RATE = -103;
constexpr int32_t NON_POSITIVE_CAP = -104;
constexpr int32_t PAST_TIMESTAMP = -105;
constexpr int32_t BEFORE_START = -106;
constexpr int32_t INVALID_TIME_WINDOW = -107;
constexpr int32_t ZERO_TOKEN_AMOUNT = -108;
constexpr int32_t ARITHMETIC_OVERFLOW = -109;

// State (invalid for the current lifecycle or stage)
constexpr int32_t ALREADY_FINALIZED = -201;
constexpr int32_t NO_ACTIVE_STAGE = -202;
constexpr int32_t FINAL_STAGE_REACHED = -203;
constexpr int32_t ALREADY_ENABLED = -204;
constexpr int32_t ALREADY_DISABLED = -205;
constexpr int32_t SALE_NOT_STARTED = -206;
constexpr int32_t SALE_ENDED = -207;
constexpr int32_t SALE_PAUSED = -208;
constexpr int32_t NOT_PAUSED = -209;
constexpr int32_t ALREADY_PAUSED = -210;
constexpr int32_t ASSET_NOT_ACCEPTED = -211;

// Oracle
constexpr int32_t ORACLE_STALE_OR_INVALID = -301;
constexpr int32_t ORACLE_UNAVAILABLE = -302;

// Supply
constexpr int32_t INSUFFICIENT_SUPPLY = -401;
constexpr int32_t STAGE_CAPACITY = -402;

// Per-address limit
constexpr int32_t LIMIT_EXCEEDED = -501;

// External calls
constexpr int32_t PAYMENT_FAILED = -601;
constexpr int32_t RELEASE_FAILED = -602;
constexpr int32_t TRANSFER_FAILED = -603;
constexpr int32_t UNKNOWN_TOKEN = -604;
constexpr int32_t INSUFFICIENT_BALANCE = -605;

constexpr int32_t UNAUTHORIZED = -701;

constexpr int32_t REENTRANCY = -801;
}

enum class ErrorKind : uint8_t {
    NONE = 0,
    VALIDATION = 1,
    STATE = 2,
    ORACLE = 3,
    INSUFFICIENT_SUPPLY = 4,
    LIMIT_EXCEEDED = 5,
    EXTERNAL = 6,
    UNAUTHORIZED = 7,
    REENTRANCY = 8
};

ErrorKind error_kind(int32_t code);

// Stable "Kind::Name" label, e.g. "StateError::AlreadyDisabled"
const char* error_name(int32_t code);

// Query outcome: `value` is meaningful only when status == errors::OK
template <typename T>
struct Result {
    int32_t status = errors::OK;
    T value{};

    bool ok() const { return status == errors::OK; }

    static Result failure(int32_t code) { return Result{code, T{}}; }
    static Result success(T v) { return Result{errors::OK, std::move(v)}; }
};

} // namespace crowdsale

#endif // CROWDSALE_TYPES_HPP
