// =============================================================================
// protocol.cpp - LendingProtocol front door
// =============================================================================

#include "lendcore/protocol.hpp"
#include "lendcore/log.hpp"

namespace lendcore {

namespace {
constexpr const char* kComponent = "protocol";
} // namespace

const char* to_string(Action action) {
    switch (action) {
        case Action::LOCK_GUARANTEE: return "lock_guarantee";
        case Action::SETTLE: return "settle";
        case Action::BORROW: return "borrow";
        case Action::REPAY: return "repay";
        case Action::LIQUIDATE: return "liquidate";
        case Action::DEPOSIT: return "deposit";
        case Action::WITHDRAW: return "withdraw";
        case Action::SET_PARAMETER: return "set_parameter";
        case Action::PAUSE: return "pause";
    }
    return "unknown";
}

// =============================================================================
// Construction
// =============================================================================

LendingProtocol::LendingProtocol(const ProtocolConfig& config, const Collaborators& modules,
                                 const IClock& clock)
    : config_(config)
    , modules_(modules)
    , clock_(clock)
    , valuation_(std::make_unique<ValuationService>(modules.price_feed, clock, config, &events_))
    , ledger_(std::make_unique<Ledger>(valuation_.get(), &events_))
    , risk_(std::make_unique<RiskEngine>(*ledger_, *valuation_, config.risk))
    , guarantees_(std::make_unique<GuaranteeStore>(clock, config.settlement.max_term_days,
                                                   config.settlement.early_repay_penalty_days))
    , fund_(std::make_unique<GuaranteeFund>())
    , settlement_(std::make_unique<SettlementEngine>(*guarantees_, *ledger_, *fund_,
                                                     valuation_.get(), modules.transfer_agent,
                                                     clock, config.settlement, &events_)) {

    log::set_level(parse_log_level(config_.general.log_level));

    if (!modules_.price_feed) {
        LENDCORE_WARN(kComponent, "no price feed: every valuation takes the fallback path");
    }
    if (!modules_.transfer_agent) {
        LENDCORE_WARN(kComponent, "no transfer agent: settlements will fail closed");
    }
    if (!modules_.access_control) {
        LENDCORE_WARN(kComponent, "no access control: every mutating call will be refused");
    }
}

std::unique_ptr<LendingProtocol> LendingProtocol::from_resolver(const ProtocolConfig& config,
                                                                IModuleResolver& resolver,
                                                                const IClock& clock) {
    Collaborators handles;

    ModuleHandle feed = resolver.resolve(modules::PRICE_FEED);
    if (auto* p = std::get_if<IPriceFeed*>(&feed)) handles.price_feed = *p;

    ModuleHandle access = resolver.resolve(modules::ACCESS_CONTROL);
    if (auto* p = std::get_if<IAccessControl*>(&access)) handles.access_control = *p;

    ModuleHandle agent = resolver.resolve(modules::TRANSFER_AGENT);
    if (auto* p = std::get_if<ITransferAgent*>(&agent)) handles.transfer_agent = *p;

    return std::make_unique<LendingProtocol>(config, handles, clock);
}

// =============================================================================
// Guarantees
// =============================================================================

int32_t LendingProtocol::lock_guarantee(const Address& caller, const Address& borrower,
                                        const Address& lender, const Currency& asset,
                                        Amount principal, Amount promised_interest,
                                        uint32_t term_days, uint64_t& id_out) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    int32_t status = admit(Action::LOCK_GUARANTEE, caller);
    if (status != errors::OK) return status;
    return settlement_->lock_guarantee(borrower, lender, asset, principal, promised_interest,
                                       term_days, id_out);
}

SettlementResult LendingProtocol::process_early_repayment(const Address& caller,
                                                          const Address& borrower,
                                                          const Currency& asset,
                                                          Amount actual_repay_amount) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    int32_t status = admit(Action::SETTLE, caller);
    if (status != errors::OK) return rejected(status, GuaranteeStatus::EARLY_REPAID);
    return settlement_->process_early_repayment(borrower, asset, actual_repay_amount);
}

SettlementResult LendingProtocol::process_matured_repayment(const Address& caller,
                                                            const Address& borrower,
                                                            const Currency& asset,
                                                            Amount actual_repay_amount) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    int32_t status = admit(Action::SETTLE, caller);
    if (status != errors::OK) return rejected(status, GuaranteeStatus::MATURED_REPAID);
    return settlement_->process_matured_repayment(borrower, asset, actual_repay_amount);
}

SettlementResult LendingProtocol::process_default(const Address& caller, const Address& borrower,
                                                  const Currency& asset) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    int32_t status = admit(Action::SETTLE, caller);
    if (status != errors::OK) return rejected(status, GuaranteeStatus::DEFAULTED);
    return settlement_->process_default(borrower, asset);
}

SettlementResult LendingProtocol::preview_early_repayment(uint64_t guarantee_id,
                                                          Amount actual_repay_amount) const {
    return settlement_->preview_early_repayment(guarantee_id, actual_repay_amount);
}

// =============================================================================
// Positions
// =============================================================================

int32_t LendingProtocol::deposit(const Address& caller, const Address& user,
                                 const Currency& asset, Amount amount) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    int32_t status = admit(Action::DEPOSIT, caller);
    if (status != errors::OK) return status;
    return ledger_->record_deposit_collateral(user, asset, amount);
}

int32_t LendingProtocol::withdraw(const Address& caller, const Address& user,
                                  const Currency& asset, Amount amount) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    int32_t status = admit(Action::WITHDRAW, caller);
    if (status != errors::OK) return status;

    if (amount > ledger_->get_collateral(user, asset)) return errors::INSUFFICIENT_COLLATERAL;
    status = risk_->check_withdraw(user, asset, amount);
    if (status != errors::OK) return status;
    return ledger_->record_withdraw_collateral(user, asset, amount);
}

int32_t LendingProtocol::borrow(const Address& caller, const Address& user,
                                const Currency& asset, Amount amount) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    int32_t status = admit(Action::BORROW, caller);
    if (status != errors::OK) return status;

    if (addresses::is_zero(user) || asset.is_zero()) return errors::ZERO_ADDRESS;
    if (amount == 0) return errors::ZERO_AMOUNT;

    status = risk_->check_borrow(user, asset, amount);
    if (status != errors::OK) return status;
    return ledger_->record_borrow(user, asset, amount);
}

int32_t LendingProtocol::repay(const Address& caller, const Address& user,
                               const Currency& asset, Amount amount) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    int32_t status = admit(Action::REPAY, caller);
    if (status != errors::OK) return status;
    return ledger_->record_repay(user, asset, amount);
}

LiquidationResult LendingProtocol::liquidate(const Address& liquidator, const Address& user,
                                             const Currency& debt_asset, Amount debt_amount,
                                             const Currency& collateral_asset,
                                             Amount collateral_amount) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    LiquidationResult result{errors::OK, 0, 0, 0};

    result.status = admit(Action::LIQUIDATE, liquidator);
    if (result.status != errors::OK) return result;
    if (addresses::is_zero(user) || debt_asset.is_zero() || collateral_asset.is_zero()) {
        result.status = errors::ZERO_ADDRESS;
        return result;
    }
    if (debt_amount == 0) {
        result.status = errors::ZERO_AMOUNT;
        return result;
    }

    HealthReport health = risk_->user_health(user);
    result.health_factor_bps = health.health_factor_bps;
    result.status = risk_->check_liquidation(user);
    if (result.status != errors::OK) return result;

    result.status = ledger_->record_force_reduce_debt(user, debt_asset, debt_amount,
                                                      result.debt_reduced);
    if (result.status != errors::OK) return result;

    if (collateral_amount > 0) {
        result.status = ledger_->record_seize_collateral(user, collateral_asset, collateral_amount,
                                                         result.collateral_seized);
        if (result.status != errors::OK) {
            if (result.debt_reduced > 0) {
                int32_t s = ledger_->reinstate_debt(user, debt_asset, result.debt_reduced);
                if (s != errors::OK) {
                    LENDCORE_ERROR(kComponent, "undo liquidation debt cut: " << errors::message(s));
                }
            }
            result.debt_reduced = 0;
            return result;
        }
    }

    LENDCORE_INFO(kComponent, "liquidated " << addresses::to_hex(user) << " by "
                  << addresses::to_hex(liquidator) << ": debt " << to_string(result.debt_reduced)
                  << ", collateral " << to_string(result.collateral_seized));
    return result;
}

// =============================================================================
// Governance
// =============================================================================

int32_t LendingProtocol::set_platform_fee_rate(const Address& caller, uint32_t rate_bps) {
    int32_t status = authorize(Action::SET_PARAMETER, caller);
    if (status != errors::OK) return status;
    return settlement_->set_platform_fee_rate(rate_bps);
}

int32_t LendingProtocol::set_platform_fee_receiver(const Address& caller, const Address& receiver) {
    int32_t status = authorize(Action::SET_PARAMETER, caller);
    if (status != errors::OK) return status;
    return settlement_->set_platform_fee_receiver(receiver);
}

int32_t LendingProtocol::set_early_repay_penalty_days(const Address& caller, uint32_t days) {
    int32_t status = authorize(Action::SET_PARAMETER, caller);
    if (status != errors::OK) return status;
    return settlement_->set_early_repay_penalty_days(days);
}

int32_t LendingProtocol::pause(const Address& caller) {
    int32_t status = authorize(Action::PAUSE, caller);
    if (status != errors::OK) return status;

    bool expected = false;
    if (!paused_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return errors::ALREADY_PAUSED;
    }
    LENDCORE_WARN(kComponent, "paused by " << addresses::to_hex(caller));
    return errors::OK;
}

int32_t LendingProtocol::unpause(const Address& caller) {
    int32_t status = authorize(Action::PAUSE, caller);
    if (status != errors::OK) return status;

    bool expected = true;
    if (!paused_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return errors::NOT_PAUSED;
    }
    LENDCORE_INFO(kComponent, "unpaused by " << addresses::to_hex(caller));
    return errors::OK;
}

// =============================================================================
// Views
// =============================================================================

std::optional<Position> LendingProtocol::get_position(const Address& user,
                                                      const Currency& asset) const {
    return ledger_->get_position(user, asset);
}

std::optional<GuaranteeRecord> LendingProtocol::get_guarantee(uint64_t id) const {
    return guarantees_->get(id);
}

U128 LendingProtocol::health_factor(const Address& user) {
    return risk_->user_health_factor(user);
}

HealthReport LendingProtocol::user_health(const Address& user) {
    return risk_->user_health(user);
}

OracleHealth LendingProtocol::check_price_oracle_health(const Currency& asset) const {
    return valuation_->check_price_oracle_health(asset);
}

bool LendingProtocol::publish_oracle_health(const Currency& asset) {
    return valuation_->publish_oracle_health(asset);
}

// =============================================================================
// Internal
// =============================================================================

int32_t LendingProtocol::authorize(Action action, const Address& caller) const {
    if (!modules_.access_control || !modules_.access_control->has_claim(action, caller)) {
        LENDCORE_WARN(kComponent, addresses::to_hex(caller) << " lacks claim " << to_string(action));
        return errors::UNAUTHORIZED;
    }
    return errors::OK;
}

int32_t LendingProtocol::admit(Action action, const Address& caller) const {
    int32_t status = authorize(action, caller);
    if (status != errors::OK) return status;
    if (paused()) return errors::PAUSED;
    return errors::OK;
}

SettlementResult LendingProtocol::rejected(int32_t status, GuaranteeStatus outcome) const {
    SettlementResult result{};
    result.status = status;
    result.outcome = outcome;
    return result;
}

} // namespace lendcore
