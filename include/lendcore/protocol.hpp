#ifndef LENDCORE_PROTOCOL_HPP
#define LENDCORE_PROTOCOL_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

#include "types.hpp"
#include "config.hpp"
#include "events.hpp"
#include "modules.hpp"
#include "valuation.hpp"
#include "ledger.hpp"
#include "risk.hpp"
#include "guarantee.hpp"
#include "guarantee_fund.hpp"
#include "settlement.hpp"

namespace lendcore {

// Typed collaborator handles; any may be null
struct Collaborators {
    IPriceFeed* price_feed = nullptr;
    IAccessControl* access_control = nullptr;
    ITransferAgent* transfer_agent = nullptr;
};

struct LiquidationResult {
    int32_t status;
    Amount debt_reduced;
    Amount collateral_seized;
    U128 health_factor_bps;     // before liquidation
};

// =============================================================================
// LendingProtocol - front door over all components
// =============================================================================

class LendingProtocol {
public:
    LendingProtocol(const ProtocolConfig& config, const Collaborators& modules, const IClock& clock);
    ~LendingProtocol() = default;

    // Non-copyable
    LendingProtocol(const LendingProtocol&) = delete;
    LendingProtocol& operator=(const LendingProtocol&) = delete;

    // Resolves PRICE_FEED, ACCESS_CONTROL and TRANSFER_AGENT once
    static std::unique_ptr<LendingProtocol> from_resolver(const ProtocolConfig& config,
                                                          IModuleResolver& resolver,
                                                          const IClock& clock);

    // =========================================================================
    // Guarantees
    // =========================================================================

    int32_t lock_guarantee(const Address& caller, const Address& borrower, const Address& lender,
                           const Currency& asset, Amount principal, Amount promised_interest,
                           uint32_t term_days, uint64_t& id_out);

    SettlementResult process_early_repayment(const Address& caller, const Address& borrower,
                                             const Currency& asset, Amount actual_repay_amount);
    SettlementResult process_matured_repayment(const Address& caller, const Address& borrower,
                                               const Currency& asset, Amount actual_repay_amount);
    SettlementResult process_default(const Address& caller, const Address& borrower,
                                     const Currency& asset);

    SettlementResult preview_early_repayment(uint64_t guarantee_id, Amount actual_repay_amount) const;

    // =========================================================================
    // Positions
    // =========================================================================

    int32_t deposit(const Address& caller, const Address& user, const Currency& asset, Amount amount);
    int32_t withdraw(const Address& caller, const Address& user, const Currency& asset, Amount amount);
    int32_t borrow(const Address& caller, const Address& user, const Currency& asset, Amount amount);
    int32_t repay(const Address& caller, const Address& user, const Currency& asset, Amount amount);

    LiquidationResult liquidate(const Address& liquidator, const Address& user,
                                const Currency& debt_asset, Amount debt_amount,
                                const Currency& collateral_asset, Amount collateral_amount);

    // =========================================================================
    // Governance
    // =========================================================================

    int32_t set_platform_fee_rate(const Address& caller, uint32_t rate_bps);
    int32_t set_platform_fee_receiver(const Address& caller, const Address& receiver);
    int32_t set_early_repay_penalty_days(const Address& caller, uint32_t days);

    int32_t pause(const Address& caller);
    int32_t unpause(const Address& caller);
    bool paused() const { return paused_.load(std::memory_order_acquire); }

    // =========================================================================
    // Views
    // =========================================================================

    std::optional<Position> get_position(const Address& user, const Currency& asset) const;
    std::optional<GuaranteeRecord> get_guarantee(uint64_t id) const;
    U128 health_factor(const Address& user);
    HealthReport user_health(const Address& user);
    OracleHealth check_price_oracle_health(const Currency& asset) const;
    bool publish_oracle_health(const Currency& asset);

    // =========================================================================
    // Components
    // =========================================================================

    EventBus& events() { return events_; }
    ValuationService& valuation() { return *valuation_; }
    Ledger& ledger() { return *ledger_; }
    RiskEngine& risk() { return *risk_; }
    GuaranteeStore& guarantees() { return *guarantees_; }
    GuaranteeFund& fund() { return *fund_; }
    SettlementEngine& settlement() { return *settlement_; }

    const ProtocolConfig& config() const { return config_; }

private:
    ProtocolConfig config_;
    Collaborators modules_;
    const IClock& clock_;

    EventBus events_;
    std::unique_ptr<ValuationService> valuation_;
    std::unique_ptr<Ledger> ledger_;
    std::unique_ptr<RiskEngine> risk_;
    std::unique_ptr<GuaranteeStore> guarantees_;
    std::unique_ptr<GuaranteeFund> fund_;
    std::unique_ptr<SettlementEngine> settlement_;

    std::atomic<bool> paused_{false};

    // Serializes business calls; recursive so a transfer agent may call back in
    std::recursive_mutex mutex_;

    // errors::OK, UNAUTHORIZED or (for business calls) PAUSED
    int32_t authorize(Action action, const Address& caller) const;
    int32_t admit(Action action, const Address& caller) const;

    SettlementResult rejected(int32_t status, GuaranteeStatus outcome) const;
};

} // namespace lendcore

#endif // LENDCORE_PROTOCOL_HPP
