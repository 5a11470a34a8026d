// =============================================================================
// settlement.cpp - Guarantee settlement with Effects before Interactions
// =============================================================================

#include "lendcore/settlement.hpp"
#include "lendcore/guarantee_fund.hpp"
#include "lendcore/ledger.hpp"
#include "lendcore/log.hpp"
#include "lendcore/math.hpp"
#include "lendcore/valuation.hpp"
#include <algorithm>
#include <exception>

namespace lendcore {

namespace {
constexpr const char* kComponent = "settlement";
} // namespace

// =============================================================================
// SettlementTransaction
// =============================================================================

SettlementTransaction::SettlementTransaction(ITransferAgent* agent) : agent_(agent) {}

SettlementTransaction::~SettlementTransaction() {
    if (!committed_ && !rolled_back_) rollback();
}

bool SettlementTransaction::record_undo(std::function<void()> undo) {
    if (closed_) return false;
    undo_.push_back(std::move(undo));
    return true;
}

int32_t SettlementTransaction::transfer(const Currency& token, const Address& to, Amount amount) {
    if (!closed_) return errors::EFFECTS_NOT_CLOSED;
    if (committed_ || rolled_back_) return errors::TRANSFER_FAILED;
    if (amount == 0) return errors::OK;

    if (!agent_) {
        rollback();
        return errors::MODULE_UNAVAILABLE;
    }

    bool ok = false;
    try {
        ok = agent_->transfer(token, to, amount);
    } catch (const std::exception& e) {
        LENDCORE_ERROR(kComponent, "transfer to " << addresses::to_hex(to) << " threw: " << e.what());
        ok = false;
    }

    if (!ok) {
        LENDCORE_WARN(kComponent, "transfer of " << to_string(amount) << " to "
                      << addresses::to_hex(to) << " failed, rolling back");
        rollback();
        return errors::TRANSFER_FAILED;
    }

    transfers_.push_back(TransferInstruction{token, to, amount});
    return errors::OK;
}

void SettlementTransaction::commit() {
    committed_ = true;
    undo_.clear();
}

void SettlementTransaction::rollback() {
    if (committed_ || rolled_back_) return;
    rolled_back_ = true;

    // Interactions first, newest to oldest
    for (auto it = transfers_.rbegin(); it != transfers_.rend(); ++it) {
        if (!agent_ || !agent_->reclaim(it->token, it->to, it->amount)) {
            LENDCORE_ERROR(kComponent, "could not reclaim " << to_string(it->amount)
                           << " from " << addresses::to_hex(it->to));
        }
    }

    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
        (*it)();
    }
    undo_.clear();
}

// =============================================================================
// SettlementEngine
// =============================================================================

SettlementEngine::SettlementEngine(GuaranteeStore& store, Ledger& ledger, GuaranteeFund& fund,
                                   ValuationService* valuation, ITransferAgent* agent,
                                   const IClock& clock, const SettlementConfig& config,
                                   EventBus* events)
    : store_(store)
    , ledger_(ledger)
    , fund_(fund)
    , valuation_(valuation)
    , agent_(agent)
    , clock_(clock)
    , config_(config)
    , events_(events) {}

// =============================================================================
// Lock
// =============================================================================

int32_t SettlementEngine::lock_guarantee(const Address& borrower, const Address& lender,
                                         const Currency& asset, Amount principal,
                                         Amount promised_interest, uint32_t term_days,
                                         uint64_t& id_out) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    // Validation before any mutation
    int32_t status = store_.validate_lock(borrower, lender, asset, principal,
                                          promised_interest, term_days);
    if (status != errors::OK) {
        LENDCORE_DEBUG(kComponent, "lock rejected: " << errors::message(status));
        return status;
    }

    SettlementTransaction tx(nullptr);

    uint64_t id = 0;
    status = store_.lock(borrower, lender, asset, principal, promised_interest, term_days, id);
    if (status != errors::OK) return status;
    tx.record_undo([this, id] {
        int32_t s = store_.revert_lock(id);
        if (s != errors::OK) LENDCORE_ERROR(kComponent, "revert lock " << id << ": " << errors::message(s));
    });

    status = ledger_.record_borrow(borrower, asset, principal);
    if (status != errors::OK) {
        tx.rollback();
        return status;
    }
    tx.record_undo([this, borrower, asset, principal] {
        int32_t s = ledger_.reverse_borrow(borrower, asset, principal);
        if (s != errors::OK) LENDCORE_ERROR(kComponent, "undo borrow: " << errors::message(s));
    });

    if (promised_interest > 0) {
        status = fund_.lock(borrower, asset, promised_interest);
        if (status != errors::OK) {
            tx.rollback();
            return status;
        }
        tx.record_undo([this, borrower, asset, promised_interest] {
            Amount released = 0;
            int32_t s = fund_.release(borrower, asset, promised_interest, released);
            if (s != errors::OK) LENDCORE_ERROR(kComponent, "undo guarantee lock: " << errors::message(s));
        });
    }

    tx.close();
    tx.commit();

    auto record = store_.get(id);
    if (record) {
        publish(GuaranteeLocked{id, borrower, lender, asset, principal, promised_interest,
                                record->start_time, record->maturity_time});
    }
    LENDCORE_INFO(kComponent, "guarantee " << id << " locked: principal " << to_string(principal)
                  << ", promised interest " << to_string(promised_interest));
    id_out = id;
    return errors::OK;
}

// =============================================================================
// Early Repayment
// =============================================================================

SettlementResult SettlementEngine::compute_early(const GuaranteeRecord& record, uint64_t now,
                                                 Amount actual_repay_amount) const {
    SettlementResult r{};
    r.status = errors::OK;
    r.guarantee_id = record.id;
    r.outcome = GuaranteeStatus::EARLY_REPAID;
    r.principal = record.principal;
    r.promised_interest = record.promised_interest;

    if (now < record.start_time) return fail(r, errors::INVALID_TIMESTAMP);
    if (now >= record.maturity_time) return fail(r, errors::ALREADY_MATURED);

    r.actual_days = (now - record.start_time) / SECONDS_PER_DAY;
    r.total_days = std::max<uint64_t>(1, record.term_seconds() / SECONDS_PER_DAY);

    // Single floor over the 256-bit product: exact to the unit
    int32_t status = fixed::mul_div(record.promised_interest, r.actual_days, r.total_days,
                                    r.actual_interest_paid);
    if (status != errors::OK) return fail(r, status);

    auto shortfall = fixed::checked_sub(record.promised_interest, r.actual_interest_paid);
    if (!shortfall) return fail(r, errors::ARITHMETIC_OVERFLOW);

    U128 penalty_cap = 0;
    status = fixed::mul_div(record.promised_interest, record.early_repay_penalty_days,
                            r.total_days, penalty_cap);
    if (status != errors::OK) return fail(r, status);
    r.penalty_gross = std::min(*shortfall, penalty_cap);

    // Without a receiver no fee is withheld
    uint32_t rate = addresses::is_zero(config_.platform_fee_receiver) ? 0 : config_.platform_fee_rate_bps;
    status = fixed::mul_div(r.penalty_gross, rate, BPS_DENOMINATOR, r.platform_fee);
    if (status != errors::OK) return fail(r, status);
    r.penalty_to_lender = r.penalty_gross - r.platform_fee;

    auto owed = fixed::checked_add(record.principal, r.actual_interest_paid);
    auto due = owed ? fixed::checked_add(*owed, r.penalty_gross) : std::nullopt;
    auto to_lender = owed ? fixed::checked_add(*owed, r.penalty_to_lender) : std::nullopt;
    if (!due || !to_lender) return fail(r, errors::ARITHMETIC_OVERFLOW);
    r.amount_due = *due;
    r.paid_to_lender = *to_lender;

    if (actual_repay_amount < r.amount_due) return fail(r, errors::INSUFFICIENT_REPAYMENT);
    r.refund_to_borrower = actual_repay_amount - r.amount_due;
    return r;
}

SettlementResult SettlementEngine::process_early_repayment(const Address& borrower,
                                                           const Currency& asset,
                                                           Amount actual_repay_amount) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    SettlementResult result{};
    result.outcome = GuaranteeStatus::EARLY_REPAID;
    if (actual_repay_amount == 0) return fail(result, errors::ZERO_AMOUNT);

    // Checks
    GuaranteeRecord record;
    int32_t status = find_active(borrower, asset, record);
    if (status != errors::OK) return fail(result, status);
    result.guarantee_id = record.id;
    if (!agent_) return fail(result, errors::MODULE_UNAVAILABLE);

    uint64_t now = clock_.now();
    result = compute_early(record, now, actual_repay_amount);
    if (result.status != errors::OK) return result;

    Ledger::DeferredRefresh defer(ledger_);
    SettlementTransaction tx(agent_);

    // Effects
    Amount released = 0;
    status = apply_repayment_effects(tx, record, GuaranteeStatus::EARLY_REPAID, released);
    if (status != errors::OK) {
        tx.rollback();
        return fail(result, status);
    }
    auto refund = fixed::checked_add(result.refund_to_borrower, released);
    if (!refund) {
        tx.rollback();
        return fail(result, errors::ARITHMETIC_OVERFLOW);
    }
    result.guarantee_released = released;
    result.refund_to_borrower = *refund;
    tx.close();

    // Interactions
    status = tx.transfer(asset, record.lender, result.paid_to_lender);
    if (status == errors::OK) {
        status = tx.transfer(asset, config_.platform_fee_receiver, result.platform_fee);
    }
    if (status == errors::OK) {
        status = tx.transfer(asset, borrower, result.refund_to_borrower);
    }
    if (status != errors::OK) {
        rolled_back(record.id, status);
        return fail(result, status);
    }

    tx.commit();
    finish(result, record, now);
    return result;
}

SettlementResult SettlementEngine::preview_early_repayment(uint64_t guarantee_id,
                                                           Amount actual_repay_amount) const {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    SettlementResult result{};
    result.guarantee_id = guarantee_id;
    result.outcome = GuaranteeStatus::EARLY_REPAID;

    auto record = store_.get(guarantee_id);
    if (!record) return fail(result, errors::GUARANTEE_NOT_FOUND);
    if (!record->is_active()) return fail(result, errors::GUARANTEE_NOT_ACTIVE);

    result = compute_early(*record, clock_.now(), actual_repay_amount);

    result.guarantee_released = std::min(record->promised_interest,
                                         fund_.locked(record->borrower, record->asset));
    auto refund = fixed::checked_add(result.refund_to_borrower, result.guarantee_released);
    if (refund) result.refund_to_borrower = *refund;
    return result;
}

// =============================================================================
// Matured Repayment
// =============================================================================

SettlementResult SettlementEngine::process_matured_repayment(const Address& borrower,
                                                             const Currency& asset,
                                                             Amount actual_repay_amount) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    SettlementResult result{};
    result.outcome = GuaranteeStatus::MATURED_REPAID;
    if (actual_repay_amount == 0) return fail(result, errors::ZERO_AMOUNT);

    GuaranteeRecord record;
    int32_t status = find_active(borrower, asset, record);
    if (status != errors::OK) return fail(result, status);
    result.guarantee_id = record.id;
    result.principal = record.principal;
    result.promised_interest = record.promised_interest;
    if (!agent_) return fail(result, errors::MODULE_UNAVAILABLE);

    uint64_t now = clock_.now();
    if (now < record.maturity_time) return fail(result, errors::NOT_MATURED);

    result.total_days = std::max<uint64_t>(1, record.term_seconds() / SECONDS_PER_DAY);
    result.actual_days = (now - record.start_time) / SECONDS_PER_DAY;

    auto due = fixed::checked_add(record.principal, record.promised_interest);
    if (!due) return fail(result, errors::ARITHMETIC_OVERFLOW);
    result.amount_due = *due;
    result.actual_interest_paid = record.promised_interest;
    result.paid_to_lender = *due;
    if (actual_repay_amount < result.amount_due) return fail(result, errors::INSUFFICIENT_REPAYMENT);

    Ledger::DeferredRefresh defer(ledger_);
    SettlementTransaction tx(agent_);

    // Effects
    Amount released = 0;
    status = apply_repayment_effects(tx, record, GuaranteeStatus::MATURED_REPAID, released);
    if (status != errors::OK) {
        tx.rollback();
        return fail(result, status);
    }
    auto refund = fixed::checked_add(actual_repay_amount - result.amount_due, released);
    if (!refund) {
        tx.rollback();
        return fail(result, errors::ARITHMETIC_OVERFLOW);
    }
    result.guarantee_released = released;
    result.refund_to_borrower = *refund;
    tx.close();

    // Interactions
    status = tx.transfer(asset, record.lender, result.paid_to_lender);
    if (status == errors::OK) {
        status = tx.transfer(asset, borrower, result.refund_to_borrower);
    }
    if (status != errors::OK) {
        rolled_back(record.id, status);
        return fail(result, status);
    }

    tx.commit();
    finish(result, record, now);
    return result;
}

// =============================================================================
// Default
// =============================================================================

SettlementResult SettlementEngine::process_default(const Address& borrower, const Currency& asset) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    SettlementResult result{};
    result.outcome = GuaranteeStatus::DEFAULTED;

    GuaranteeRecord record;
    int32_t status = find_active(borrower, asset, record);
    if (status != errors::OK) return fail(result, status);
    result.guarantee_id = record.id;
    result.principal = record.principal;
    result.promised_interest = record.promised_interest;
    if (!agent_) return fail(result, errors::MODULE_UNAVAILABLE);

    uint64_t now = clock_.now();
    if (now <= record.maturity_time) return fail(result, errors::NOT_MATURED);

    result.total_days = std::max<uint64_t>(1, record.term_seconds() / SECONDS_PER_DAY);
    result.actual_days = (now - record.start_time) / SECONDS_PER_DAY;

    Ledger::DeferredRefresh defer(ledger_);
    SettlementTransaction tx(agent_);

    // Effects
    status = store_.mark_terminal(record.id, GuaranteeStatus::DEFAULTED);
    if (status != errors::OK) return fail(result, status);
    uint64_t id = record.id;
    tx.record_undo([this, id] {
        int32_t s = store_.revert_terminal(id);
        if (s != errors::OK) LENDCORE_ERROR(kComponent, "revert terminal " << id << ": " << errors::message(s));
    });

    Amount forfeited = 0;
    status = fund_.forfeit(borrower, asset, record.promised_interest, forfeited);
    if (status != errors::OK) {
        tx.rollback();
        return fail(result, status);
    }
    if (forfeited > 0) {
        tx.record_undo([this, borrower, asset, forfeited] {
            int32_t s = fund_.lock(borrower, asset, forfeited);
            if (s != errors::OK) LENDCORE_ERROR(kComponent, "undo forfeit: " << errors::message(s));
        });
    }

    if (ledger_.get_debt(borrower, asset) > 0) {
        status = ledger_.record_force_reduce_debt(borrower, asset, record.principal,
                                                  result.principal_written_off);
        if (status != errors::OK) {
            tx.rollback();
            return fail(result, status);
        }
        Amount written_off = result.principal_written_off;
        if (written_off > 0) {
            tx.record_undo([this, borrower, asset, written_off] {
                int32_t s = ledger_.reinstate_debt(borrower, asset, written_off);
                if (s != errors::OK) LENDCORE_ERROR(kComponent, "undo write-off: " << errors::message(s));
            });
        }
    }

    result.guarantee_forfeited = forfeited;
    result.paid_to_lender = forfeited;
    tx.close();

    // Interactions
    status = tx.transfer(asset, record.lender, forfeited);
    if (status != errors::OK) {
        rolled_back(record.id, status);
        return fail(result, status);
    }

    tx.commit();
    finish(result, record, now);
    return result;
}

// =============================================================================
// Parameters
// =============================================================================

int32_t SettlementEngine::set_platform_fee_rate(uint32_t rate_bps) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    if (rate_bps > config_.max_platform_fee_rate_bps) return errors::RATE_TOO_HIGH;
    config_.platform_fee_rate_bps = rate_bps;
    return errors::OK;
}

int32_t SettlementEngine::set_platform_fee_receiver(const Address& receiver) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    if (addresses::is_zero(receiver)) return errors::ZERO_ADDRESS;
    config_.platform_fee_receiver = receiver;
    return errors::OK;
}

int32_t SettlementEngine::set_early_repay_penalty_days(uint32_t days) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    if (days > config_.max_term_days) return errors::INVALID_TERM;
    config_.early_repay_penalty_days = days;
    store_.set_early_repay_penalty_days(days);
    return errors::OK;
}

uint32_t SettlementEngine::platform_fee_rate() const {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    return config_.platform_fee_rate_bps;
}

Address SettlementEngine::platform_fee_receiver() const {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    return config_.platform_fee_receiver;
}

// =============================================================================
// Internal
// =============================================================================

int32_t SettlementEngine::find_active(const Address& borrower, const Currency& asset,
                                      GuaranteeRecord& record) const {
    if (addresses::is_zero(borrower) || asset.is_zero()) return errors::ZERO_ADDRESS;

    auto id = store_.active_id(borrower, asset);
    if (!id) {
        return store_.last_id(borrower, asset) ? errors::GUARANTEE_NOT_ACTIVE
                                               : errors::GUARANTEE_NOT_FOUND;
    }

    auto found = store_.get(*id);
    if (!found) return errors::GUARANTEE_NOT_FOUND;
    if (!found->is_active()) return errors::GUARANTEE_NOT_ACTIVE;
    if (found->borrower != borrower || found->asset != asset) return errors::CALLER_MISMATCH;

    record = *found;
    return errors::OK;
}

int32_t SettlementEngine::apply_repayment_effects(SettlementTransaction& tx,
                                                  const GuaranteeRecord& record,
                                                  GuaranteeStatus outcome, Amount& released) {
    const Address borrower = record.borrower;
    const Currency asset = record.asset;
    const uint64_t id = record.id;

    // Close the record first so a re-entrant call sees it inactive
    int32_t status = store_.mark_terminal(id, outcome);
    if (status != errors::OK) return status;
    tx.record_undo([this, id] {
        int32_t s = store_.revert_terminal(id);
        if (s != errors::OK) LENDCORE_ERROR(kComponent, "revert terminal " << id << ": " << errors::message(s));
    });

    // The principal booked at lock; partial repayments made elsewhere shrink it
    Amount repay = std::min(record.principal, ledger_.get_debt(borrower, asset));
    if (repay > 0) {
        status = ledger_.record_repay(borrower, asset, repay);
        if (status != errors::OK) return status;
        tx.record_undo([this, borrower, asset, repay] {
            int32_t s = ledger_.reinstate_debt(borrower, asset, repay);
            if (s != errors::OK) LENDCORE_ERROR(kComponent, "undo repay: " << errors::message(s));
        });
    }

    status = fund_.release(borrower, asset, record.promised_interest, released);
    if (status != errors::OK) return status;
    if (released > 0) {
        Amount amount = released;
        tx.record_undo([this, borrower, asset, amount] {
            int32_t s = fund_.lock(borrower, asset, amount);
            if (s != errors::OK) LENDCORE_ERROR(kComponent, "undo release: " << errors::message(s));
        });
    }
    return errors::OK;
}

SettlementResult SettlementEngine::fail(SettlementResult result, int32_t status) const {
    result.status = status;
    LENDCORE_DEBUG(kComponent, "guarantee " << result.guarantee_id << " "
                   << to_string(result.outcome) << " rejected: " << errors::message(status));
    return result;
}

void SettlementEngine::finish(SettlementResult& result, const GuaranteeRecord& record, uint64_t now) {
    result.status = errors::OK;

    if (valuation_ && result.paid_to_lender > 0) {
        ValuationResult v = valuation_->get_value(record.asset, result.paid_to_lender, "settlement");
        result.settled_value = v.is_valid ? v.value : 0;
        result.valuation_degraded = v.used_fallback || !v.is_valid;
    }

    publish(GuaranteeTerminated{record.id, record.borrower, record.lender, record.asset,
                                result.outcome, result.paid_to_lender, result.platform_fee,
                                result.refund_to_borrower, now});
    LENDCORE_INFO(kComponent, "guarantee " << record.id << " " << to_string(result.outcome)
                  << ": lender " << to_string(result.paid_to_lender)
                  << ", fee " << to_string(result.platform_fee)
                  << ", refund " << to_string(result.refund_to_borrower));
}

void SettlementEngine::rolled_back(uint64_t id, int32_t status) const {
    LENDCORE_WARN(kComponent, "guarantee " << id << " settlement rolled back: "
                  << errors::message(status));
    publish(SettlementRolledBack{id, status});
}

void SettlementEngine::publish(const Event& event) const {
    if (events_) events_->publish(event);
}

} // namespace lendcore
