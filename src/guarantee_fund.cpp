// =============================================================================
// guarantee_fund.cpp - Guarantee deposit pool
// =============================================================================

#include "lendcore/guarantee_fund.hpp"
#include "lendcore/math.hpp"
#include <algorithm>
#include <mutex>

namespace lendcore {

int32_t GuaranteeFund::lock(const Address& user, const Currency& asset, Amount amount) {
    if (addresses::is_zero(user) || asset.is_zero()) return errors::ZERO_ADDRESS;
    if (amount == 0) return errors::ZERO_AMOUNT;

    std::unique_lock lock(mutex_);
    AccountAsset key{user, asset};
    auto balance = fixed::checked_add(locked_[key], amount);
    auto total = fixed::checked_add(totals_[asset], amount);
    if (!balance || !total) {
        if (locked_[key] == 0) locked_.erase(key);
        return errors::ARITHMETIC_OVERFLOW;
    }

    locked_[key] = *balance;
    totals_[asset] = *total;
    return errors::OK;
}

int32_t GuaranteeFund::release(const Address& user, const Currency& asset, Amount amount,
                               Amount& released) {
    released = 0;
    if (addresses::is_zero(user) || asset.is_zero()) return errors::ZERO_ADDRESS;

    std::unique_lock lock(mutex_);
    released = take(AccountAsset{user, asset}, amount);
    return errors::OK;
}

int32_t GuaranteeFund::forfeit(const Address& user, const Currency& asset, Amount amount,
                               Amount& forfeited) {
    forfeited = 0;
    if (addresses::is_zero(user) || asset.is_zero()) return errors::ZERO_ADDRESS;

    std::unique_lock lock(mutex_);
    forfeited = take(AccountAsset{user, asset}, amount);
    return errors::OK;
}

Amount GuaranteeFund::locked(const Address& user, const Currency& asset) const {
    std::shared_lock lock(mutex_);
    auto it = locked_.find(AccountAsset{user, asset});
    return it == locked_.end() ? 0 : it->second;
}

Amount GuaranteeFund::total_locked(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    auto it = totals_.find(asset);
    return it == totals_.end() ? 0 : it->second;
}

Amount GuaranteeFund::take(const AccountAsset& key, Amount amount) {
    auto it = locked_.find(key);
    if (it == locked_.end()) return 0;

    Amount cut = std::min(amount, it->second);
    it->second -= cut;
    totals_[key.asset] -= cut;
    if (it->second == 0) locked_.erase(it);
    return cut;
}

} // namespace lendcore
