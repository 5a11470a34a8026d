// =============================================================================
// ledger.cpp - Debt and collateral accounting with exact aggregates
// =============================================================================

#include "lendcore/ledger.hpp"
#include "lendcore/log.hpp"
#include "lendcore/math.hpp"
#include "lendcore/valuation.hpp"
#include <algorithm>
#include <mutex>

namespace lendcore {

namespace {

constexpr const char* kComponent = "ledger";

template<typename Map>
Amount lookup(const Map& map, const typename Map::key_type& key) {
    auto it = map.find(key);
    return it == map.end() ? 0 : it->second;
}

} // namespace

Ledger::Ledger(ValuationService* valuation, EventBus* events)
    : valuation_(valuation), events_(events) {}

int32_t Ledger::validate(const Address& user, const Currency& asset, Amount amount) const {
    if (addresses::is_zero(user) || asset.is_zero()) return errors::ZERO_ADDRESS;
    if (amount == 0) return errors::ZERO_AMOUNT;
    return errors::OK;
}

// =============================================================================
// Debt
// =============================================================================

int32_t Ledger::record_borrow(const Address& user, const Currency& asset, Amount amount) {
    int32_t status = validate(user, asset, amount);
    if (status != errors::OK) return status;

    DebtRecorded event{user, asset, DebtChange::BORROW, amount, 0, 0};
    {
        std::unique_lock lock(mutex_);
        auto new_debt = fixed::checked_add(get_debt_unlocked(user, asset), amount);
        auto new_total = fixed::checked_add(lookup(total_debt_, asset), amount);
        if (!new_debt || !new_total) return errors::ARITHMETIC_OVERFLOW;

        Position& pos = touch(user, asset);
        pos.debt = *new_debt;
        total_debt_[asset] = *new_total;
        update_index(debt_index_, user, asset, true);

        event.new_debt = *new_debt;
        event.total_debt_by_asset = *new_total;
    }

    schedule_refresh(user);
    publish(event);
    return errors::OK;
}

int32_t Ledger::record_repay(const Address& user, const Currency& asset, Amount amount) {
    int32_t status = validate(user, asset, amount);
    if (status != errors::OK) return status;

    DebtRecorded event{user, asset, DebtChange::REPAY, amount, 0, 0};
    {
        std::unique_lock lock(mutex_);
        Amount debt = get_debt_unlocked(user, asset);
        if (amount > debt) {
            LENDCORE_WARN(kComponent, "repay " << to_string(amount) << " exceeds debt "
                          << to_string(debt) << " of " << addresses::to_hex(user));
            return errors::OVERPAY;
        }
        auto new_total = fixed::checked_sub(lookup(total_debt_, asset), amount);
        if (!new_total) return errors::ARITHMETIC_OVERFLOW;

        Position& pos = touch(user, asset);
        pos.debt = debt - amount;
        total_debt_[asset] = *new_total;
        update_index(debt_index_, user, asset, pos.debt > 0);

        event.new_debt = pos.debt;
        event.total_debt_by_asset = *new_total;
        settle_entry(AccountAsset{user, asset});
    }

    schedule_refresh(user);
    publish(event);
    return errors::OK;
}

int32_t Ledger::record_force_reduce_debt(const Address& user, const Currency& asset,
                                         Amount amount, Amount& reduced) {
    reduced = 0;
    int32_t status = validate(user, asset, amount);
    if (status != errors::OK) return status;

    DebtRecorded event{user, asset, DebtChange::FORCE_REDUCE, 0, 0, 0};
    {
        std::unique_lock lock(mutex_);
        Amount debt = get_debt_unlocked(user, asset);
        if (debt == 0) return errors::OK;

        Amount cut = std::min(amount, debt);
        auto new_total = fixed::checked_sub(lookup(total_debt_, asset), cut);
        if (!new_total) return errors::ARITHMETIC_OVERFLOW;

        Position& pos = touch(user, asset);
        pos.debt = debt - cut;
        total_debt_[asset] = *new_total;
        update_index(debt_index_, user, asset, pos.debt > 0);

        reduced = cut;
        event.amount = cut;
        event.new_debt = pos.debt;
        event.total_debt_by_asset = *new_total;
        settle_entry(AccountAsset{user, asset});
    }

    if (reduced < amount) {
        LENDCORE_DEBUG(kComponent, "force reduce clamped " << to_string(amount) << " to "
                       << to_string(reduced));
    }
    schedule_refresh(user);
    publish(event);
    return errors::OK;
}

// =============================================================================
// Collateral
// =============================================================================

int32_t Ledger::record_deposit_collateral(const Address& user, const Currency& asset,
                                          Amount amount) {
    int32_t status = validate(user, asset, amount);
    if (status != errors::OK) return status;

    CollateralRecorded event{user, asset, CollateralChange::DEPOSIT, amount, 0};
    {
        std::unique_lock lock(mutex_);
        auto new_collateral = fixed::checked_add(get_collateral_unlocked(user, asset), amount);
        auto new_total = fixed::checked_add(lookup(total_collateral_, asset), amount);
        if (!new_collateral || !new_total) return errors::ARITHMETIC_OVERFLOW;

        Position& pos = touch(user, asset);
        pos.collateral = *new_collateral;
        total_collateral_[asset] = *new_total;
        update_index(collateral_index_, user, asset, true);
        event.new_collateral = *new_collateral;
    }

    publish(event);
    return errors::OK;
}

int32_t Ledger::record_withdraw_collateral(const Address& user, const Currency& asset,
                                           Amount amount) {
    int32_t status = validate(user, asset, amount);
    if (status != errors::OK) return status;

    CollateralRecorded event{user, asset, CollateralChange::WITHDRAW, amount, 0};
    {
        std::unique_lock lock(mutex_);
        Amount collateral = get_collateral_unlocked(user, asset);
        if (amount > collateral) return errors::INSUFFICIENT_COLLATERAL;

        auto new_total = fixed::checked_sub(lookup(total_collateral_, asset), amount);
        if (!new_total) return errors::ARITHMETIC_OVERFLOW;

        Position& pos = touch(user, asset);
        pos.collateral = collateral - amount;
        total_collateral_[asset] = *new_total;
        update_index(collateral_index_, user, asset, pos.collateral > 0);
        event.new_collateral = pos.collateral;
        settle_entry(AccountAsset{user, asset});
    }

    publish(event);
    return errors::OK;
}

int32_t Ledger::record_seize_collateral(const Address& user, const Currency& asset,
                                        Amount amount, Amount& seized) {
    seized = 0;
    int32_t status = validate(user, asset, amount);
    if (status != errors::OK) return status;

    CollateralRecorded event{user, asset, CollateralChange::SEIZE, 0, 0};
    {
        std::unique_lock lock(mutex_);
        Amount collateral = get_collateral_unlocked(user, asset);
        if (collateral == 0) return errors::OK;

        Amount cut = std::min(amount, collateral);
        auto new_total = fixed::checked_sub(lookup(total_collateral_, asset), cut);
        if (!new_total) return errors::ARITHMETIC_OVERFLOW;

        Position& pos = touch(user, asset);
        pos.collateral = collateral - cut;
        total_collateral_[asset] = *new_total;
        update_index(collateral_index_, user, asset, pos.collateral > 0);

        seized = cut;
        event.amount = cut;
        event.new_collateral = pos.collateral;
        settle_entry(AccountAsset{user, asset});
    }

    publish(event);
    return errors::OK;
}

// =============================================================================
// Reads
// =============================================================================

std::optional<Position> Ledger::get_position(const Address& user, const Currency& asset) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(AccountAsset{user, asset});
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

Amount Ledger::get_debt(const Address& user, const Currency& asset) const {
    std::shared_lock lock(mutex_);
    return get_debt_unlocked(user, asset);
}

Amount Ledger::get_collateral(const Address& user, const Currency& asset) const {
    std::shared_lock lock(mutex_);
    return get_collateral_unlocked(user, asset);
}

Amount Ledger::get_debt_unlocked(const Address& user, const Currency& asset) const {
    auto it = positions_.find(AccountAsset{user, asset});
    return it == positions_.end() ? 0 : it->second.debt;
}

Amount Ledger::get_collateral_unlocked(const Address& user, const Currency& asset) const {
    auto it = positions_.find(AccountAsset{user, asset});
    return it == positions_.end() ? 0 : it->second.collateral;
}

Amount Ledger::total_debt_by_asset(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    return lookup(total_debt_, asset);
}

Amount Ledger::total_collateral_by_asset(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    return lookup(total_collateral_, asset);
}

std::vector<Currency> Ledger::debt_assets(const Address& user) const {
    std::shared_lock lock(mutex_);
    auto it = debt_index_.find(user);
    if (it == debt_index_.end()) return {};
    return it->second;
}

std::vector<Currency> Ledger::collateral_assets(const Address& user) const {
    std::shared_lock lock(mutex_);
    auto it = collateral_index_.find(user);
    if (it == collateral_index_.end()) return {};
    return it->second;
}

PortfolioValue Ledger::total_debt_value(const Address& user) const {
    std::shared_lock lock(mutex_);
    auto it = debt_value_cache_.find(user);
    if (it == debt_value_cache_.end()) return PortfolioValue{errors::OK, 0, false, true};
    return it->second;
}

PortfolioValue Ledger::total_collateral_value(const Address& user) const {
    std::vector<std::pair<Currency, Amount>> holdings;
    {
        std::shared_lock lock(mutex_);
        auto it = collateral_index_.find(user);
        if (it != collateral_index_.end()) {
            for (const auto& asset : it->second) {
                holdings.emplace_back(asset, get_collateral_unlocked(user, asset));
            }
        }
    }
    return value_holdings(holdings, "collateral_value", false);
}

void Ledger::refresh_debt_value(const Address& user) {
    std::vector<std::pair<Currency, Amount>> holdings;
    {
        std::shared_lock lock(mutex_);
        auto it = debt_index_.find(user);
        if (it != debt_index_.end()) {
            for (const auto& asset : it->second) {
                holdings.emplace_back(asset, get_debt_unlocked(user, asset));
            }
        }
    }

    // Valuation runs outside the lock
    PortfolioValue total = value_holdings(holdings, "debt_value", true);

    std::unique_lock lock(mutex_);
    if (holdings.empty()) {
        debt_value_cache_.erase(user);
    } else {
        debt_value_cache_[user] = total;
    }
}

size_t Ledger::position_count() const {
    std::shared_lock lock(mutex_);
    return positions_.size();
}

PortfolioValue Ledger::value_holdings(const std::vector<std::pair<Currency, Amount>>& holdings,
                                      const char* operation, bool liability) const {
    PortfolioValue total{errors::OK, 0, false, true};
    for (const auto& [asset, amount] : holdings) {
        Amount value = amount;
        if (valuation_) {
            ValuationResult r = liability ? valuation_->get_debt_value(asset, amount, operation)
                                          : valuation_->get_value(asset, amount, operation);
            if (r.used_fallback) total.degraded = true;
            if (!r.is_valid) {
                total.is_valid = false;
                continue;
            }
            value = r.value;
        } else {
            total.degraded = true;
        }

        auto sum = fixed::checked_add(total.value, value);
        if (!sum) {
            total.status = errors::ARITHMETIC_OVERFLOW;
            total.is_valid = false;
            return total;
        }
        total.value = *sum;
    }
    return total;
}

// =============================================================================
// Reversal
// =============================================================================

int32_t Ledger::reverse_borrow(const Address& user, const Currency& asset, Amount amount) {
    return apply_reversal(user, asset, amount, false);
}

int32_t Ledger::reinstate_debt(const Address& user, const Currency& asset, Amount amount) {
    return apply_reversal(user, asset, amount, true);
}

int32_t Ledger::apply_reversal(const Address& user, const Currency& asset, Amount amount,
                               bool add_back) {
    int32_t status = validate(user, asset, amount);
    if (status != errors::OK) return status;

    DebtRecorded event{user, asset, DebtChange::REVERSAL, amount, 0, 0};
    {
        std::unique_lock lock(mutex_);
        Amount debt = get_debt_unlocked(user, asset);
        Amount total = lookup(total_debt_, asset);
        auto new_debt = add_back ? fixed::checked_add(debt, amount) : fixed::checked_sub(debt, amount);
        auto new_total = add_back ? fixed::checked_add(total, amount) : fixed::checked_sub(total, amount);
        if (!new_debt || !new_total) {
            LENDCORE_ERROR(kComponent, "cannot reverse " << to_string(amount) << " of "
                           << addresses::to_hex(user) << " debt " << to_string(debt));
            return errors::ARITHMETIC_OVERFLOW;
        }

        Position& pos = touch(user, asset);
        pos.debt = *new_debt;
        total_debt_[asset] = *new_total;
        update_index(debt_index_, user, asset, pos.debt > 0);

        event.new_debt = pos.debt;
        event.total_debt_by_asset = *new_total;
        settle_entry(AccountAsset{user, asset});
    }

    schedule_refresh(user);
    publish(event);
    return errors::OK;
}

// =============================================================================
// Internal
// =============================================================================

Position& Ledger::touch(const Address& user, const Currency& asset) {
    AccountAsset key{user, asset};
    auto it = positions_.find(key);
    if (it == positions_.end()) {
        it = positions_.emplace(key, Position{user, asset, 0, 0}).first;
    }
    return it->second;
}

void Ledger::settle_entry(const AccountAsset& key) {
    auto it = positions_.find(key);
    if (it != positions_.end() && it->second.debt == 0 && it->second.collateral == 0) {
        positions_.erase(it);
    }
}

void Ledger::update_index(std::unordered_map<Address, std::vector<Currency>, AddressHash>& index,
                          const Address& user, const Currency& asset, bool present) {
    auto& assets = index[user];
    auto it = std::find(assets.begin(), assets.end(), asset);
    if (present && it == assets.end()) {
        assets.push_back(asset);
    } else if (!present && it != assets.end()) {
        assets.erase(it);
    }
    if (assets.empty()) index.erase(user);
}

void Ledger::schedule_refresh(const Address& user) {
    {
        std::unique_lock lock(mutex_);
        if (defer_depth_ > 0) {
            if (std::find(pending_refresh_.begin(), pending_refresh_.end(), user) ==
                pending_refresh_.end()) {
                pending_refresh_.push_back(user);
            }
            return;
        }
    }
    refresh_debt_value(user);
}

Ledger::DeferredRefresh::DeferredRefresh(Ledger& ledger) : ledger_(ledger) {
    std::unique_lock lock(ledger_.mutex_);
    ++ledger_.defer_depth_;
}

Ledger::DeferredRefresh::~DeferredRefresh() {
    std::vector<Address> pending;
    {
        std::unique_lock lock(ledger_.mutex_);
        if (--ledger_.defer_depth_ > 0) return;
        pending.swap(ledger_.pending_refresh_);
    }
    for (const auto& user : pending) ledger_.refresh_debt_value(user);
}

void Ledger::publish(const Event& event) const {
    if (events_) events_->publish(event);
}

} // namespace lendcore
