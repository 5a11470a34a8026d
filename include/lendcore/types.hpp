#ifndef LENDCORE_TYPES_HPP
#define LENDCORE_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <cstring>
#include <vector>
#include <functional>
#include <optional>

namespace lendcore {

// =============================================================================
// Identifiers (EVM-style 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Build an address whose last two bytes carry a small integer tag.
// Handy for deterministic test accounts and well-known module slots.
constexpr Address from_tag(uint16_t tag) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((tag >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(tag & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without "0x" prefix; nullopt on bad length or digit
std::optional<Address> from_hex(const std::string& hex);

} // namespace addresses

// =============================================================================
// Fixed-Width Integers
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// Token amounts and values are unsigned and never wrap
using Amount = U128;

constexpr U128 U128_MAX = ~static_cast<U128>(0);

// Decimal rendering for 128-bit values (iostreams cannot print them)
std::string to_string(U128 value);
std::optional<U128> parse_u128(const std::string& text);

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_zero() const { return addresses::is_zero(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Hashing
// =============================================================================

inline uint64_t hash_address(const Address& addr) {
    uint64_t h = 1469598103934665603ULL;
    for (auto b : addr) {
        h ^= b;
        h *= 1099511628211ULL;
    }
    return h;
}

struct AddressHash {
    size_t operator()(const Address& addr) const {
        return static_cast<size_t>(hash_address(addr));
    }
};

struct CurrencyHash {
    size_t operator()(const Currency& c) const {
        return static_cast<size_t>(hash_address(c.addr));
    }
};

// (user, asset) key used by the ledger, the guarantee index and the fund
struct AccountAsset {
    Address user;
    Currency asset;

    bool operator==(const AccountAsset& other) const {
        return user == other.user && asset == other.asset;
    }
};

struct AccountAssetHash {
    size_t operator()(const AccountAsset& key) const {
        uint64_t h = hash_address(key.user);
        h = h * 31 + hash_address(key.asset.addr);
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Domain Enums
// =============================================================================

// Locked is the only non-terminal state
enum class GuaranteeStatus : uint8_t {
    LOCKED = 0,
    EARLY_REPAID = 1,
    MATURED_REPAID = 2,
    DEFAULTED = 3
};

enum class DegradationReason : uint8_t {
    ORACLE_CALL_FAILED = 0,   // feed absent, threw, timed out or returned nothing
    PRICE_STALE = 1,          // quote older than max price age
    SOURCE_UNHEALTHY = 2,     // feed flagged its own quote as unhealthy
    PRICE_IMPLAUSIBLE = 3,    // above max reasonable price or outside multiplier band
    INVALID_DECIMALS = 4      // decimals outside [min_decimals, max_decimals]
};

enum class DebtChange : uint8_t {
    BORROW = 0,
    REPAY = 1,
    FORCE_REDUCE = 2,
    REVERSAL = 3        // undo of an earlier change after a rollback
};

enum class CollateralChange : uint8_t {
    DEPOSIT = 0,
    WITHDRAW = 1,
    SEIZE = 2
};

const char* to_string(GuaranteeStatus status);
const char* to_string(DegradationReason reason);
const char* to_string(DebtChange change);
const char* to_string(CollateralChange change);

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCategory : uint8_t {
    None = 0,
    Validation = 1,
    Arithmetic = 2,
    SettlementIntegrity = 3,
    Authorization = 4
};

namespace errors {
constexpr int32_t OK = 0;

// Validation (-1xx): no state mutated, caller must fix input
constexpr int32_t ZERO_ADDRESS = -100;
constexpr int32_t ZERO_AMOUNT = -101;
constexpr int32_t BORROWER_IS_LENDER = -102;
constexpr int32_t INVALID_TERM = -103;
constexpr int32_t INTEREST_TOO_HIGH = -104;
constexpr int32_t INVALID_DECIMALS = -105;
constexpr int32_t OVERPAY = -106;
constexpr int32_t INSUFFICIENT_COLLATERAL = -107;
constexpr int32_t ACTIVE_GUARANTEE_EXISTS = -108;
constexpr int32_t RATE_TOO_HIGH = -109;
constexpr int32_t INVALID_CONFIG = -110;
constexpr int32_t HEALTH_FACTOR_TOO_LOW = -111;
constexpr int32_t NOT_LIQUIDATABLE = -112;
constexpr int32_t INVALID_TIMESTAMP = -113;

// Arithmetic (-2xx): fatal to the call, never saturated
constexpr int32_t ARITHMETIC_OVERFLOW = -200;
constexpr int32_t DIVISION_BY_ZERO = -201;
constexpr int32_t ID_SPACE_EXHAUSTED = -202;

// Settlement integrity (-3xx): whole operation aborted atomically
constexpr int32_t GUARANTEE_NOT_FOUND = -300;
constexpr int32_t GUARANTEE_NOT_ACTIVE = -301;
constexpr int32_t CALLER_MISMATCH = -302;
constexpr int32_t TRANSFER_FAILED = -303;
constexpr int32_t NOT_MATURED = -304;
constexpr int32_t ALREADY_MATURED = -305;
constexpr int32_t INSUFFICIENT_REPAYMENT = -306;
constexpr int32_t EFFECTS_NOT_CLOSED = -307;
constexpr int32_t VALUATION_UNAVAILABLE = -308;

// Authorization / lifecycle (-4xx)
constexpr int32_t UNAUTHORIZED = -400;
constexpr int32_t PAUSED = -401;
constexpr int32_t ALREADY_PAUSED = -402;
constexpr int32_t NOT_PAUSED = -403;
constexpr int32_t MODULE_UNAVAILABLE = -404;

ErrorCategory category(int32_t code);
const char* message(int32_t code);
} // namespace errors

// =============================================================================
// Time Source
// =============================================================================

class IClock {
public:
    virtual ~IClock() = default;

    // Seconds since the Unix epoch
    virtual uint64_t now() const = 0;
};

class SystemClock : public IClock {
public:
    uint64_t now() const override;
};

} // namespace lendcore

#endif // LENDCORE_TYPES_HPP
