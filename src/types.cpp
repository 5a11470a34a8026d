// =============================================================================
// types.cpp - Identifiers, 128-bit formatting, error taxonomy
// =============================================================================

#include "lendcore/types.hpp"
#include <chrono>
#include <algorithm>

namespace lendcore {

// =============================================================================
// Address Hex Encoding
// =============================================================================

namespace addresses {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[(b >> 4) & 0x0F]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(const std::string& hex) {
    size_t offset = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        offset = 2;
    }
    if (hex.size() - offset != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < 20; ++i) {
        int hi = hex_digit(hex[offset + 2 * i]);
        int lo = hex_digit(hex[offset + 2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// 128-bit Decimal Formatting
// =============================================================================

std::string to_string(U128 value) {
    if (value == 0) return "0";

    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<U128> parse_u128(const std::string& text) {
    if (text.empty()) return std::nullopt;

    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (value > (U128_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

// =============================================================================
// Enum Names
// =============================================================================

const char* to_string(GuaranteeStatus status) {
    switch (status) {
        case GuaranteeStatus::LOCKED: return "locked";
        case GuaranteeStatus::EARLY_REPAID: return "early_repaid";
        case GuaranteeStatus::MATURED_REPAID: return "matured_repaid";
        case GuaranteeStatus::DEFAULTED: return "defaulted";
    }
    return "unknown";
}

const char* to_string(DegradationReason reason) {
    switch (reason) {
        case DegradationReason::ORACLE_CALL_FAILED: return "oracle_call_failed";
        case DegradationReason::PRICE_STALE: return "price_stale";
        case DegradationReason::SOURCE_UNHEALTHY: return "source_unhealthy";
        case DegradationReason::PRICE_IMPLAUSIBLE: return "price_implausible";
        case DegradationReason::INVALID_DECIMALS: return "invalid_decimals";
    }
    return "unknown";
}

const char* to_string(DebtChange change) {
    switch (change) {
        case DebtChange::BORROW: return "borrow";
        case DebtChange::REPAY: return "repay";
        case DebtChange::FORCE_REDUCE: return "force_reduce";
        case DebtChange::REVERSAL: return "reversal";
    }
    return "unknown";
}

const char* to_string(CollateralChange change) {
    switch (change) {
        case CollateralChange::DEPOSIT: return "deposit";
        case CollateralChange::WITHDRAW: return "withdraw";
        case CollateralChange::SEIZE: return "seize";
    }
    return "unknown";
}

// =============================================================================
// Error Taxonomy
// =============================================================================

namespace errors {

ErrorCategory category(int32_t code) {
    if (code == OK) return ErrorCategory::None;
    if (code <= -100 && code > -200) return ErrorCategory::Validation;
    if (code <= -200 && code > -300) return ErrorCategory::Arithmetic;
    if (code <= -300 && code > -400) return ErrorCategory::SettlementIntegrity;
    return ErrorCategory::Authorization;
}

const char* message(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case ZERO_ADDRESS: return "zero address";
        case ZERO_AMOUNT: return "amount is zero";
        case BORROWER_IS_LENDER: return "borrower cannot be lender";
        case INVALID_TERM: return "term out of range";
        case INTEREST_TOO_HIGH: return "promised interest exceeds twice the principal";
        case INVALID_DECIMALS: return "price decimals out of range";
        case OVERPAY: return "repay amount exceeds debt";
        case INSUFFICIENT_COLLATERAL: return "withdraw amount exceeds collateral";
        case ACTIVE_GUARANTEE_EXISTS: return "active guarantee already exists";
        case RATE_TOO_HIGH: return "rate too high";
        case INVALID_CONFIG: return "invalid configuration";
        case HEALTH_FACTOR_TOO_LOW: return "health factor below minimum";
        case NOT_LIQUIDATABLE: return "position is not liquidatable";
        case INVALID_TIMESTAMP: return "timestamp predates guarantee start";
        case ARITHMETIC_OVERFLOW: return "arithmetic overflow";
        case DIVISION_BY_ZERO: return "division by zero";
        case ID_SPACE_EXHAUSTED: return "guarantee id counter saturated";
        case GUARANTEE_NOT_FOUND: return "guarantee not found";
        case GUARANTEE_NOT_ACTIVE: return "guarantee not active";
        case CALLER_MISMATCH: return "guarantee does not belong to caller";
        case TRANSFER_FAILED: return "fund transfer failed";
        case NOT_MATURED: return "guarantee has not matured";
        case ALREADY_MATURED: return "guarantee already matured";
        case INSUFFICIENT_REPAYMENT: return "repay amount below amount due";
        case EFFECTS_NOT_CLOSED: return "transfer issued before effects closed";
        case VALUATION_UNAVAILABLE: return "valuation unavailable";
        case UNAUTHORIZED: return "missing authorization claim";
        case PAUSED: return "system paused";
        case ALREADY_PAUSED: return "already paused";
        case NOT_PAUSED: return "not paused";
        case MODULE_UNAVAILABLE: return "module unavailable";
        default: return "unknown error";
    }
}

} // namespace errors

// =============================================================================
// Clock
// =============================================================================

uint64_t SystemClock::now() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace lendcore
