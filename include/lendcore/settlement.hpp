#ifndef LENDCORE_SETTLEMENT_HPP
#define LENDCORE_SETTLEMENT_HPP

#include <functional>
#include <mutex>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "events.hpp"
#include "guarantee.hpp"

namespace lendcore {

class Ledger;
class GuaranteeFund;
class ValuationService;

// =============================================================================
// Fund Transfer Primitive
// =============================================================================

class ITransferAgent {
public:
    virtual ~ITransferAgent() = default;

    // Moves amount of token from protocol custody to `to`; false on failure
    virtual bool transfer(const Currency& token, const Address& to, Amount amount) = 0;

    // Pulls a completed transfer back into custody; false when unsupported
    virtual bool reclaim(const Currency& token, const Address& from, Amount amount) {
        (void)token; (void)from; (void)amount;
        return false;
    }
};

struct TransferInstruction {
    Currency token;
    Address to;
    Amount amount;
};

// =============================================================================
// SettlementTransaction - Effects, close(), then Interactions
// =============================================================================

// Effects register an undo action as they are applied. Transfers are refused
// until close() seals the effects. The first failed transfer rolls back every
// effect and reclaims the transfers already made. A transaction that is
// neither committed nor rolled back is rolled back on destruction.
class SettlementTransaction {
public:
    explicit SettlementTransaction(ITransferAgent* agent);
    ~SettlementTransaction();

    // Non-copyable
    SettlementTransaction(const SettlementTransaction&) = delete;
    SettlementTransaction& operator=(const SettlementTransaction&) = delete;

    // False once closed
    bool record_undo(std::function<void()> undo);

    void close() { closed_ = true; }
    bool closed() const { return closed_; }

    // errors::OK (zero amounts are skipped), EFFECTS_NOT_CLOSED,
    // MODULE_UNAVAILABLE or TRANSFER_FAILED
    int32_t transfer(const Currency& token, const Address& to, Amount amount);

    void commit();
    void rollback();

    bool committed() const { return committed_; }
    bool rolled_back() const { return rolled_back_; }
    const std::vector<TransferInstruction>& transfers() const { return transfers_; }

private:
    ITransferAgent* agent_;
    std::vector<std::function<void()>> undo_;
    std::vector<TransferInstruction> transfers_;
    bool closed_{false};
    bool committed_{false};
    bool rolled_back_{false};
};

// =============================================================================
// Settlement Results
// =============================================================================

struct SettlementResult {
    int32_t status;
    uint64_t guarantee_id;
    GuaranteeStatus outcome;

    uint64_t actual_days;
    uint64_t total_days;

    Amount principal;
    Amount promised_interest;
    Amount actual_interest_paid;
    Amount penalty_gross;           // before platform fee
    Amount penalty_to_lender;
    Amount platform_fee;
    Amount amount_due;

    Amount paid_to_lender;
    Amount refund_to_borrower;      // overpayment plus released guarantee
    Amount guarantee_released;
    Amount guarantee_forfeited;
    Amount principal_written_off;

    // Reporting value of the lender payout; degraded valuation never blocks settlement
    Amount settled_value;
    bool valuation_degraded;
};

// =============================================================================
// SettlementEngine - guarantee lifecycle state machine
// =============================================================================

class SettlementEngine {
public:
    // valuation, agent and events may be null. Without an agent every
    // fund-moving settlement fails with MODULE_UNAVAILABLE.
    SettlementEngine(GuaranteeStore& store, Ledger& ledger, GuaranteeFund& fund,
                     ValuationService* valuation, ITransferAgent* agent,
                     const IClock& clock, const SettlementConfig& config,
                     EventBus* events = nullptr);
    ~SettlementEngine() = default;

    // Non-copyable
    SettlementEngine(const SettlementEngine&) = delete;
    SettlementEngine& operator=(const SettlementEngine&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    // Stores the record, books the principal as debt and locks the promised
    // interest as the borrower's guarantee. All or nothing.
    int32_t lock_guarantee(const Address& borrower, const Address& lender, const Currency& asset,
                           Amount principal, Amount promised_interest, uint32_t term_days,
                           uint64_t& id_out);

    SettlementResult process_early_repayment(const Address& borrower, const Currency& asset,
                                             Amount actual_repay_amount);

    SettlementResult process_matured_repayment(const Address& borrower, const Currency& asset,
                                               Amount actual_repay_amount);

    SettlementResult process_default(const Address& borrower, const Currency& asset);

    // Figures process_early_repayment would produce now, without mutation
    SettlementResult preview_early_repayment(uint64_t guarantee_id, Amount actual_repay_amount) const;

    // =========================================================================
    // Parameters
    // =========================================================================

    int32_t set_platform_fee_rate(uint32_t rate_bps);
    int32_t set_platform_fee_receiver(const Address& receiver);
    int32_t set_early_repay_penalty_days(uint32_t days);

    uint32_t platform_fee_rate() const;
    Address platform_fee_receiver() const;

    bool has_transfer_agent() const { return agent_ != nullptr; }

private:
    GuaranteeStore& store_;
    Ledger& ledger_;
    GuaranteeFund& fund_;
    ValuationService* valuation_;
    ITransferAgent* agent_;
    const IClock& clock_;
    SettlementConfig config_;
    EventBus* events_;

    // One top-level call at a time; a same-thread re-entrant call gets
    // through and must fail the record checks
    mutable std::recursive_mutex mutex_;

    // Active record for (borrower, asset), or NOT_ACTIVE / NOT_FOUND
    int32_t find_active(const Address& borrower, const Currency& asset,
                        GuaranteeRecord& record) const;

    // Early repayment economics for `record` at time `now`
    SettlementResult compute_early(const GuaranteeRecord& record, uint64_t now,
                                   Amount actual_repay_amount) const;

    // Shared Effects for a repayment: terminal mark, debt repay, guarantee release
    int32_t apply_repayment_effects(SettlementTransaction& tx, const GuaranteeRecord& record,
                                    GuaranteeStatus outcome, Amount& released);

    SettlementResult fail(SettlementResult result, int32_t status) const;
    void finish(SettlementResult& result, const GuaranteeRecord& record, uint64_t now);
    void rolled_back(uint64_t id, int32_t status) const;
    void publish(const Event& event) const;
};

} // namespace lendcore

#endif // LENDCORE_SETTLEMENT_HPP
