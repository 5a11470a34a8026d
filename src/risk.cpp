// =============================================================================
// risk.cpp - Health factor and liquidation eligibility
// =============================================================================

#include "lendcore/risk.hpp"
#include "lendcore/ledger.hpp"
#include "lendcore/log.hpp"
#include "lendcore/math.hpp"
#include "lendcore/valuation.hpp"

namespace lendcore {

namespace {
constexpr const char* kComponent = "risk";
} // namespace

RiskEngine::RiskEngine(Ledger& ledger, ValuationService& valuation, const RiskConfig& config)
    : ledger_(ledger), valuation_(valuation), config_(config) {}

U128 RiskEngine::health_factor(Amount collateral_value, Amount debt_value) {
    if (debt_value == 0) return HEALTH_FACTOR_MAX;

    auto hf = fixed::mul_div(collateral_value, BPS_DENOMINATOR, debt_value);
    if (!hf) {
        // Quotient above U128_MAX, so the true ratio is at least HEALTH_FACTOR_MAX
        LENDCORE_DEBUG(kComponent, "health factor of " << to_string(collateral_value) << "/"
                       << to_string(debt_value) << " saturated");
        return HEALTH_FACTOR_MAX;
    }
    return *hf;
}

bool RiskEngine::is_under_collateralized(Amount collateral_value, Amount debt_value,
                                         uint32_t min_health_factor_bps) {
    return health_factor(collateral_value, debt_value) < min_health_factor_bps;
}

Amount RiskEngine::max_borrowable_value(Amount collateral_value, Amount debt_value,
                                        uint32_t min_health_factor_bps) {
    if (min_health_factor_bps == 0) return 0;

    auto capacity = fixed::mul_div(collateral_value, BPS_DENOMINATOR, min_health_factor_bps);
    if (!capacity) return U128_MAX;
    return *capacity > debt_value ? *capacity - debt_value : 0;
}

HealthReport RiskEngine::user_health(const Address& user) {
    ledger_.refresh_debt_value(user);
    PortfolioValue debt = ledger_.total_debt_value(user);
    PortfolioValue collateral = ledger_.total_collateral_value(user);

    HealthReport report;
    report.collateral_value = collateral.value;
    report.debt_value = debt.value;
    report.health_factor_bps = health_factor(collateral.value, debt.value);
    report.degraded = debt.degraded || collateral.degraded;
    report.is_valid = debt.is_valid && collateral.is_valid;
    report.under_collateralized = report.health_factor_bps < config_.min_health_factor_bps;
    return report;
}

U128 RiskEngine::user_health_factor(const Address& user) {
    return user_health(user).health_factor_bps;
}

int32_t RiskEngine::check_borrow(const Address& user, const Currency& asset, Amount amount) {
    HealthReport report = user_health(user);

    // An undervalued debt would overstate health
    if (!ledger_.total_debt_value(user).is_valid) return errors::VALUATION_UNAVAILABLE;

    ValuationResult added = valuation_.get_debt_value(asset, amount, "can_borrow");
    if (!added.is_valid) return errors::VALUATION_UNAVAILABLE;

    auto new_debt = fixed::checked_add(report.debt_value, added.value);
    if (!new_debt) return errors::ARITHMETIC_OVERFLOW;

    // Collateral that failed to value counts as zero
    U128 hf = health_factor(report.collateral_value, *new_debt);
    if (hf < config_.min_health_factor_bps) {
        LENDCORE_INFO(kComponent, "borrow rejected for " << addresses::to_hex(user)
                      << ": post-borrow health factor " << to_string(hf) << " bps");
        return errors::HEALTH_FACTOR_TOO_LOW;
    }
    return errors::OK;
}

int32_t RiskEngine::check_withdraw(const Address& user, const Currency& asset, Amount amount) {
    HealthReport report = user_health(user);
    if (report.debt_value == 0 && ledger_.total_debt_value(user).is_valid) return errors::OK;
    if (!ledger_.total_debt_value(user).is_valid) return errors::VALUATION_UNAVAILABLE;

    ValuationResult removed = valuation_.get_value(asset, amount, "can_withdraw");
    if (!removed.is_valid) return errors::VALUATION_UNAVAILABLE;

    Amount remaining = report.collateral_value > removed.value
        ? report.collateral_value - removed.value : 0;
    U128 hf = health_factor(remaining, report.debt_value);
    if (hf < config_.min_health_factor_bps) {
        LENDCORE_INFO(kComponent, "withdraw rejected for " << addresses::to_hex(user)
                      << ": post-withdraw health factor " << to_string(hf) << " bps");
        return errors::HEALTH_FACTOR_TOO_LOW;
    }
    return errors::OK;
}

int32_t RiskEngine::check_liquidation(const Address& user) {
    HealthReport report = user_health(user);

    // Unknown is reported as such, never as healthy
    if (!ledger_.total_debt_value(user).is_valid) {
        LENDCORE_WARN(kComponent, "debt of " << addresses::to_hex(user)
                      << " could not be valued, liquidation status unknown");
        return errors::VALUATION_UNAVAILABLE;
    }
    if (report.debt_value == 0) return errors::NOT_LIQUIDATABLE;
    if (report.health_factor_bps >= config_.liquidation_threshold_bps) return errors::NOT_LIQUIDATABLE;
    return errors::OK;
}

bool RiskEngine::is_liquidatable(const Address& user) {
    return check_liquidation(user) == errors::OK;
}

} // namespace lendcore
