#ifndef LENDCORE_CONFIG_HPP
#define LENDCORE_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "math.hpp"

namespace lendcore {

// Thrown only while loading configuration; runtime operations use status codes
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Configuration Sections
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";
};

// How valuation behaves when the feed cannot be trusted
struct DegradationConfig {
    uint32_t conservative_ratio_bps = 5000;    // applied to last-known-good value
    bool use_stablecoin_face_value = true;
    Currency settlement_token;                 // asset valued at face when degraded
    bool enable_price_cache = true;
};

// Plausibility bounds for a feed response
struct ValidationConfig {
    uint32_t min_multiplier_bps = 5000;        // vs. reference price
    uint32_t max_multiplier_bps = 15000;
    U128 max_reasonable_price = static_cast<U128>(1000000000000ULL) * WAD;  // 1e12 * 1e18
    uint8_t min_decimals = 6;
    uint8_t max_decimals = 18;
};

struct RetryConfig {
    bool enable_retry = true;
    uint32_t max_retry_count = 1;
    uint64_t call_budget_ms = 2000;
};

struct OracleConfig {
    uint64_t max_price_age = 3600;             // seconds
    uint64_t max_future_skew = 60;             // seconds a quote may lead the clock
};

struct StablecoinConfig {
    Currency stablecoin;
    U128 expected_price = WAD;                 // 1.0 at 18 decimals
    uint32_t tolerance_bps = 100;
};

struct RiskConfig {
    uint32_t min_health_factor_bps = 11000;
    uint32_t liquidation_threshold_bps = 10500;
};

struct SettlementConfig {
    uint32_t platform_fee_rate_bps = 100;
    uint32_t max_platform_fee_rate_bps = 1000;
    Address platform_fee_receiver = addresses::ZERO;
    uint32_t early_repay_penalty_days = 3;
    uint32_t max_term_days = 3650;
};

// =============================================================================
// ProtocolConfig - aggregate with builder-style setters
// =============================================================================

class ProtocolConfig {
public:
    GeneralConfig general;
    DegradationConfig degradation;
    ValidationConfig validation;
    RetryConfig retry;
    OracleConfig oracle;
    std::vector<StablecoinConfig> stablecoins;
    RiskConfig risk;
    SettlementConfig settlement;

    ProtocolConfig() = default;

    // Load from a JSON document or file; throws ConfigError
    static ProtocolConfig from_json(std::string_view content);
    static ProtocolConfig from_file(std::string_view path);

    std::string to_json() const;

    // errors::OK or errors::INVALID_CONFIG / errors::RATE_TOO_HIGH
    int32_t validate() const;

    ProtocolConfig& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    ProtocolConfig& with_settlement_token(const Currency& token) {
        degradation.settlement_token = token;
        return *this;
    }

    ProtocolConfig& with_conservative_ratio(uint32_t bps) {
        degradation.conservative_ratio_bps = bps;
        return *this;
    }

    ProtocolConfig& with_stablecoin_face_value(bool enabled) {
        degradation.use_stablecoin_face_value = enabled;
        return *this;
    }

    ProtocolConfig& with_price_cache(bool enabled) {
        degradation.enable_price_cache = enabled;
        return *this;
    }

    ProtocolConfig& with_multiplier_bounds(uint32_t min_bps, uint32_t max_bps) {
        validation.min_multiplier_bps = min_bps;
        validation.max_multiplier_bps = max_bps;
        return *this;
    }

    ProtocolConfig& with_max_reasonable_price(U128 price) {
        validation.max_reasonable_price = price;
        return *this;
    }

    ProtocolConfig& with_retry(bool enabled, uint32_t max_count) {
        retry.enable_retry = enabled;
        retry.max_retry_count = max_count;
        return *this;
    }

    ProtocolConfig& with_call_budget_ms(uint64_t ms) {
        retry.call_budget_ms = ms;
        return *this;
    }

    ProtocolConfig& with_max_price_age(uint64_t seconds) {
        oracle.max_price_age = seconds;
        return *this;
    }

    ProtocolConfig& with_max_future_skew(uint64_t seconds) {
        oracle.max_future_skew = seconds;
        return *this;
    }

    ProtocolConfig& add_stablecoin(const Currency& coin, U128 expected_price,
                                   uint32_t tolerance_bps = 100) {
        stablecoins.push_back(StablecoinConfig{coin, expected_price, tolerance_bps});
        return *this;
    }

    ProtocolConfig& with_health_thresholds(uint32_t min_hf_bps, uint32_t liquidation_bps) {
        risk.min_health_factor_bps = min_hf_bps;
        risk.liquidation_threshold_bps = liquidation_bps;
        return *this;
    }

    ProtocolConfig& with_platform_fee(uint32_t rate_bps, const Address& receiver) {
        settlement.platform_fee_rate_bps = rate_bps;
        settlement.platform_fee_receiver = receiver;
        return *this;
    }

    ProtocolConfig& with_early_repay_penalty_days(uint32_t days) {
        settlement.early_repay_penalty_days = days;
        return *this;
    }
};

} // namespace lendcore

#endif // LENDCORE_CONFIG_HPP
