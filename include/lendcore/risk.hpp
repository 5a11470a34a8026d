#ifndef LENDCORE_RISK_HPP
#define LENDCORE_RISK_HPP

#include "types.hpp"
#include "config.hpp"

namespace lendcore {

class Ledger;
class ValuationService;

// Health factor of a position without debt
constexpr U128 HEALTH_FACTOR_MAX = U128_MAX;

struct HealthReport {
    Amount collateral_value;
    Amount debt_value;
    U128 health_factor_bps;
    bool degraded;               // some value came from the fallback path
    bool is_valid;               // every asset could be valued
    bool under_collateralized;   // health factor below min_health_factor_bps
};

// =============================================================================
// Risk Engine
// =============================================================================

class RiskEngine {
public:
    RiskEngine(Ledger& ledger, ValuationService& valuation, const RiskConfig& config);

    // collateral * 10000 / debt, floored; HEALTH_FACTOR_MAX when debt is zero
    // or the ratio exceeds the representable range
    static U128 health_factor(Amount collateral_value, Amount debt_value);

    static bool is_under_collateralized(Amount collateral_value, Amount debt_value,
                                        uint32_t min_health_factor_bps);

    // Additional debt value the collateral supports at min_health_factor_bps
    static Amount max_borrowable_value(Amount collateral_value, Amount debt_value,
                                       uint32_t min_health_factor_bps);

    // Full picture for one user (re-values debt first)
    HealthReport user_health(const Address& user);
    U128 user_health_factor(const Address& user);

    // Pre-trade gates: errors::OK, HEALTH_FACTOR_TOO_LOW or VALUATION_UNAVAILABLE
    int32_t check_borrow(const Address& user, const Currency& asset, Amount amount);
    int32_t check_withdraw(const Address& user, const Currency& asset, Amount amount);

    bool can_borrow(const Address& user, const Currency& asset, Amount amount) {
        return check_borrow(user, asset, amount) == errors::OK;
    }
    bool can_withdraw(const Address& user, const Currency& asset, Amount amount) {
        return check_withdraw(user, asset, amount) == errors::OK;
    }

    // errors::OK when the health factor is below liquidation_threshold_bps,
    // NOT_LIQUIDATABLE when it is not (or there is no debt), and
    // VALUATION_UNAVAILABLE when some debt asset cannot be valued at all
    int32_t check_liquidation(const Address& user);

    bool is_liquidatable(const Address& user);

    const RiskConfig& config() const { return config_; }

private:
    Ledger& ledger_;
    ValuationService& valuation_;
    RiskConfig config_;
};

} // namespace lendcore

#endif // LENDCORE_RISK_HPP
