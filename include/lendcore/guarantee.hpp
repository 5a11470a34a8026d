#ifndef LENDCORE_GUARANTEE_HPP
#define LENDCORE_GUARANTEE_HPP

#include <limits>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace lendcore {

// =============================================================================
// Guarantee Record
// =============================================================================

struct GuaranteeRecord {
    uint64_t id;
    Address borrower;
    Address lender;
    Currency asset;
    Amount principal;
    Amount promised_interest;
    uint64_t start_time;
    uint64_t maturity_time;
    uint32_t early_repay_penalty_days;
    GuaranteeStatus status;

    bool is_active() const { return status == GuaranteeStatus::LOCKED; }
    uint64_t term_seconds() const { return maturity_time - start_time; }
};

// =============================================================================
// GuaranteeStore - fixed-term obligations between borrower and lender
// =============================================================================

class GuaranteeStore {
public:
    static constexpr uint64_t ID_SATURATED = std::numeric_limits<uint64_t>::max();

    explicit GuaranteeStore(const IClock& clock, uint32_t max_term_days = 3650,
                            uint32_t early_repay_penalty_days = 3, uint64_t first_id = 1);
    ~GuaranteeStore() = default;

    // Non-copyable
    GuaranteeStore(const GuaranteeStore&) = delete;
    GuaranteeStore& operator=(const GuaranteeStore&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    // Everything lock() checks, without mutating
    int32_t validate_lock(const Address& borrower, const Address& lender, const Currency& asset,
                          Amount principal, Amount promised_interest, uint32_t term_days) const;

    // Stores a Locked record starting now; maturity = now + term_days * 86400
    int32_t lock(const Address& borrower, const Address& lender, const Currency& asset,
                 Amount principal, Amount promised_interest, uint32_t term_days,
                 uint64_t& id_out);

    // Single transition out of Locked; GUARANTEE_NOT_ACTIVE when already terminal
    int32_t mark_terminal(uint64_t id, GuaranteeStatus outcome);

    // Undo hooks for an aborted settlement transaction
    int32_t revert_terminal(uint64_t id);
    int32_t revert_lock(uint64_t id);

    void set_early_repay_penalty_days(uint32_t days);
    uint32_t early_repay_penalty_days() const;

    // =========================================================================
    // Reads
    // =========================================================================

    std::optional<GuaranteeRecord> get(uint64_t id) const;
    std::optional<uint64_t> active_id(const Address& borrower, const Currency& asset) const;
    bool has_active(const Address& borrower, const Currency& asset) const;

    // Most recent guarantee for the pair, retained after termination
    std::optional<uint64_t> last_id(const Address& borrower, const Currency& asset) const;

    std::vector<GuaranteeRecord> guarantees_of(const Address& borrower) const;

    size_t active_count() const;
    size_t total_count() const;
    uint64_t next_id() const;

private:
    const IClock& clock_;
    uint32_t max_term_days_;
    uint32_t early_repay_penalty_days_;
    uint64_t next_id_;

    std::unordered_map<uint64_t, GuaranteeRecord> records_;
    std::unordered_map<AccountAsset, uint64_t, AccountAssetHash> active_;
    std::unordered_map<AccountAsset, uint64_t, AccountAssetHash> last_;

    mutable std::shared_mutex mutex_;

    int32_t validate_unlocked(const Address& borrower, const Address& lender,
                              const Currency& asset, Amount principal,
                              Amount promised_interest, uint32_t term_days) const;
};

} // namespace lendcore

#endif // LENDCORE_GUARANTEE_HPP
