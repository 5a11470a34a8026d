// =============================================================================
// guarantee.cpp - Guarantee records and the active-guarantee index
// =============================================================================

#include "lendcore/guarantee.hpp"
#include "lendcore/log.hpp"
#include "lendcore/math.hpp"
#include <algorithm>
#include <mutex>

namespace lendcore {

namespace {
constexpr const char* kComponent = "guarantee";
} // namespace

GuaranteeStore::GuaranteeStore(const IClock& clock, uint32_t max_term_days,
                               uint32_t early_repay_penalty_days, uint64_t first_id)
    : clock_(clock)
    , max_term_days_(max_term_days)
    , early_repay_penalty_days_(early_repay_penalty_days)
    , next_id_(first_id == 0 ? 1 : first_id) {}

// =============================================================================
// Lifecycle
// =============================================================================

int32_t GuaranteeStore::validate_lock(const Address& borrower, const Address& lender,
                                      const Currency& asset, Amount principal,
                                      Amount promised_interest, uint32_t term_days) const {
    std::shared_lock lock(mutex_);
    return validate_unlocked(borrower, lender, asset, principal, promised_interest, term_days);
}

int32_t GuaranteeStore::validate_unlocked(const Address& borrower, const Address& lender,
                                          const Currency& asset, Amount principal,
                                          Amount promised_interest, uint32_t term_days) const {
    if (addresses::is_zero(borrower) || addresses::is_zero(lender) || asset.is_zero()) {
        return errors::ZERO_ADDRESS;
    }
    if (principal == 0) return errors::ZERO_AMOUNT;
    if (borrower == lender) return errors::BORROWER_IS_LENDER;
    if (term_days == 0 || term_days > max_term_days_) return errors::INVALID_TERM;

    // promised_interest <= 2 * principal; a doubled principal beyond range bounds nothing
    auto cap = fixed::checked_mul(principal, 2);
    if (cap && promised_interest > *cap) return errors::INTEREST_TOO_HIGH;

    if (active_.count(AccountAsset{borrower, asset})) return errors::ACTIVE_GUARANTEE_EXISTS;
    if (next_id_ == ID_SATURATED) return errors::ID_SPACE_EXHAUSTED;
    return errors::OK;
}

int32_t GuaranteeStore::lock(const Address& borrower, const Address& lender,
                             const Currency& asset, Amount principal,
                             Amount promised_interest, uint32_t term_days,
                             uint64_t& id_out) {
    uint64_t now = clock_.now();

    std::unique_lock lock(mutex_);
    int32_t status = validate_unlocked(borrower, lender, asset, principal,
                                       promised_interest, term_days);
    if (status != errors::OK) return status;

    uint64_t term_seconds = static_cast<uint64_t>(term_days) * SECONDS_PER_DAY;
    if (now > std::numeric_limits<uint64_t>::max() - term_seconds) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    uint64_t id = next_id_++;
    GuaranteeRecord record{
        id, borrower, lender, asset, principal, promised_interest,
        now, now + term_seconds, early_repay_penalty_days_, GuaranteeStatus::LOCKED
    };
    records_.emplace(id, record);

    AccountAsset key{borrower, asset};
    active_[key] = id;
    last_[key] = id;

    id_out = id;
    LENDCORE_DEBUG(kComponent, "locked guarantee " << id << " for " << term_days << " days");
    return errors::OK;
}

int32_t GuaranteeStore::mark_terminal(uint64_t id, GuaranteeStatus outcome) {
    if (outcome == GuaranteeStatus::LOCKED) return errors::GUARANTEE_NOT_ACTIVE;

    std::unique_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return errors::GUARANTEE_NOT_FOUND;
    if (!it->second.is_active()) return errors::GUARANTEE_NOT_ACTIVE;

    it->second.status = outcome;
    active_.erase(AccountAsset{it->second.borrower, it->second.asset});
    return errors::OK;
}

int32_t GuaranteeStore::revert_terminal(uint64_t id) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return errors::GUARANTEE_NOT_FOUND;
    if (it->second.is_active()) return errors::OK;

    AccountAsset key{it->second.borrower, it->second.asset};
    auto current = active_.find(key);
    if (current != active_.end() && current->second != id) return errors::ACTIVE_GUARANTEE_EXISTS;

    it->second.status = GuaranteeStatus::LOCKED;
    active_[key] = id;
    return errors::OK;
}

int32_t GuaranteeStore::revert_lock(uint64_t id) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return errors::GUARANTEE_NOT_FOUND;

    AccountAsset key{it->second.borrower, it->second.asset};
    auto active = active_.find(key);
    if (active != active_.end() && active->second == id) active_.erase(active);

    // Fall back to the most recent surviving record for the pair
    auto last = last_.find(key);
    if (last != last_.end() && last->second == id) {
        last_.erase(last);
        uint64_t best = 0;
        for (const auto& [rid, rec] : records_) {
            if (rid != id && rec.borrower == key.user && rec.asset == key.asset && rid > best) {
                best = rid;
            }
        }
        if (best != 0) last_[key] = best;
    }

    records_.erase(it);
    return errors::OK;
}

void GuaranteeStore::set_early_repay_penalty_days(uint32_t days) {
    std::unique_lock lock(mutex_);
    early_repay_penalty_days_ = days;
}

uint32_t GuaranteeStore::early_repay_penalty_days() const {
    std::shared_lock lock(mutex_);
    return early_repay_penalty_days_;
}

// =============================================================================
// Reads
// =============================================================================

std::optional<GuaranteeRecord> GuaranteeStore::get(uint64_t id) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::optional<uint64_t> GuaranteeStore::active_id(const Address& borrower,
                                                  const Currency& asset) const {
    std::shared_lock lock(mutex_);
    auto it = active_.find(AccountAsset{borrower, asset});
    if (it == active_.end()) return std::nullopt;
    return it->second;
}

bool GuaranteeStore::has_active(const Address& borrower, const Currency& asset) const {
    return active_id(borrower, asset).has_value();
}

std::optional<uint64_t> GuaranteeStore::last_id(const Address& borrower,
                                                const Currency& asset) const {
    std::shared_lock lock(mutex_);
    auto it = last_.find(AccountAsset{borrower, asset});
    if (it == last_.end()) return std::nullopt;
    return it->second;
}

std::vector<GuaranteeRecord> GuaranteeStore::guarantees_of(const Address& borrower) const {
    std::shared_lock lock(mutex_);
    std::vector<GuaranteeRecord> out;
    for (const auto& [id, record] : records_) {
        if (record.borrower == borrower) out.push_back(record);
    }
    std::sort(out.begin(), out.end(),
              [](const GuaranteeRecord& a, const GuaranteeRecord& b) { return a.id < b.id; });
    return out;
}

size_t GuaranteeStore::active_count() const {
    std::shared_lock lock(mutex_);
    return active_.size();
}

size_t GuaranteeStore::total_count() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

uint64_t GuaranteeStore::next_id() const {
    std::shared_lock lock(mutex_);
    return next_id_;
}

} // namespace lendcore
