#ifndef LENDCORE_LEDGER_HPP
#define LENDCORE_LEDGER_HPP

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "events.hpp"

namespace lendcore {

class ValuationService;

// =============================================================================
// Position
// =============================================================================

// One per (user, asset); logically removed once both sides are zero
struct Position {
    Address user;
    Currency asset;
    Amount collateral;
    Amount debt;
};

// Sum of a user's per-asset values through the ValuationService
struct PortfolioValue {
    int32_t status;      // errors::OK or ARITHMETIC_OVERFLOW
    Amount value;
    bool degraded;       // at least one asset took the fallback path
    bool is_valid;       // false when some asset could not be valued at all
};

// =============================================================================
// Ledger - per-user, per-asset debt and collateral accounting
// =============================================================================

class Ledger {
public:
    // valuation may be null; values are then nominal (unit price) and flagged degraded
    explicit Ledger(ValuationService* valuation = nullptr, EventBus* events = nullptr);
    ~Ledger() = default;

    // Non-copyable
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // =========================================================================
    // Debt
    // =========================================================================

    int32_t record_borrow(const Address& user, const Currency& asset, Amount amount);

    // Fails with OVERPAY when amount exceeds the outstanding debt
    int32_t record_repay(const Address& user, const Currency& asset, Amount amount);

    // Liquidation path: clamps to the outstanding debt, reports the reduction
    int32_t record_force_reduce_debt(const Address& user, const Currency& asset,
                                     Amount amount, Amount& reduced);

    // =========================================================================
    // Collateral
    // =========================================================================

    int32_t record_deposit_collateral(const Address& user, const Currency& asset, Amount amount);

    // Fails with INSUFFICIENT_COLLATERAL on overdraw
    int32_t record_withdraw_collateral(const Address& user, const Currency& asset, Amount amount);

    // Liquidation path: clamps to the deposited collateral
    int32_t record_seize_collateral(const Address& user, const Currency& asset,
                                    Amount amount, Amount& seized);

    // =========================================================================
    // Reads
    // =========================================================================

    std::optional<Position> get_position(const Address& user, const Currency& asset) const;
    Amount get_debt(const Address& user, const Currency& asset) const;
    Amount get_collateral(const Address& user, const Currency& asset) const;

    Amount total_debt_by_asset(const Currency& asset) const;
    Amount total_collateral_by_asset(const Currency& asset) const;

    // Assets with non-zero balance, in first-touched order
    std::vector<Currency> debt_assets(const Address& user) const;
    std::vector<Currency> collateral_assets(const Address& user) const;

    // Cached; refreshed after every debt change of the user
    PortfolioValue total_debt_value(const Address& user) const;

    // Computed on demand
    PortfolioValue total_collateral_value(const Address& user) const;

    // Re-value the user's debt (e.g. after a price move)
    void refresh_debt_value(const Address& user);

    size_t position_count() const;

    // =========================================================================
    // Reversal
    // =========================================================================

    // Undo hooks for a settlement or liquidation that failed after its Effects.
    // Each applies the inverse delta to one position and its asset aggregate,
    // so changes made to other positions in the meantime are kept.
    int32_t reverse_borrow(const Address& user, const Currency& asset, Amount amount);

    // Inverse of a repay or force reduce
    int32_t reinstate_debt(const Address& user, const Currency& asset, Amount amount);

    // While alive, debt-value refreshes are queued ledger-wide instead of
    // calling the ValuationService; the queue is drained on destruction.
    // Keeps feed calls (and their retries) out of a settlement's Effects.
    class DeferredRefresh {
    public:
        explicit DeferredRefresh(Ledger& ledger);
        ~DeferredRefresh();

        DeferredRefresh(const DeferredRefresh&) = delete;
        DeferredRefresh& operator=(const DeferredRefresh&) = delete;

    private:
        Ledger& ledger_;
    };

private:
    ValuationService* valuation_;
    EventBus* events_;

    std::unordered_map<AccountAsset, Position, AccountAssetHash> positions_;
    std::unordered_map<Currency, Amount, CurrencyHash> total_debt_;
    std::unordered_map<Currency, Amount, CurrencyHash> total_collateral_;

    // user -> assets with non-zero debt / collateral
    std::unordered_map<Address, std::vector<Currency>, AddressHash> debt_index_;
    std::unordered_map<Address, std::vector<Currency>, AddressHash> collateral_index_;

    std::unordered_map<Address, PortfolioValue, AddressHash> debt_value_cache_;

    uint32_t defer_depth_{0};
    std::vector<Address> pending_refresh_;

    mutable std::shared_mutex mutex_;

    int32_t validate(const Address& user, const Currency& asset, Amount amount) const;
    int32_t apply_reversal(const Address& user, const Currency& asset, Amount amount, bool add_back);

    // Caller holds mutex_
    Amount get_debt_unlocked(const Address& user, const Currency& asset) const;
    Amount get_collateral_unlocked(const Address& user, const Currency& asset) const;

    // Caller holds mutex_ exclusively
    Position& touch(const Address& user, const Currency& asset);
    void settle_entry(const AccountAsset& key);
    void update_index(std::unordered_map<Address, std::vector<Currency>, AddressHash>& index,
                      const Address& user, const Currency& asset, bool present);

    // Values (asset, amount) pairs without holding mutex_
    // Debt holdings go through the liability-side valuation
    PortfolioValue value_holdings(const std::vector<std::pair<Currency, Amount>>& holdings,
                                  const char* operation, bool liability) const;

    // Refresh now, or queue it while a DeferredRefresh is alive
    void schedule_refresh(const Address& user);

    void publish(const Event& event) const;
};

} // namespace lendcore

#endif // LENDCORE_LEDGER_HPP
