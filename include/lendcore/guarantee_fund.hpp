#ifndef LENDCORE_GUARANTEE_FUND_HPP
#define LENDCORE_GUARANTEE_FUND_HPP

#include <shared_mutex>
#include <unordered_map>

#include "types.hpp"

namespace lendcore {

// =============================================================================
// GuaranteeFund - locked guarantee deposits per (user, asset)
// =============================================================================

class GuaranteeFund {
public:
    GuaranteeFund() = default;
    ~GuaranteeFund() = default;

    // Non-copyable
    GuaranteeFund(const GuaranteeFund&) = delete;
    GuaranteeFund& operator=(const GuaranteeFund&) = delete;

    int32_t lock(const Address& user, const Currency& asset, Amount amount);

    // Both clamp to the locked balance and report the amount actually moved
    int32_t release(const Address& user, const Currency& asset, Amount amount, Amount& released);
    int32_t forfeit(const Address& user, const Currency& asset, Amount amount, Amount& forfeited);

    Amount locked(const Address& user, const Currency& asset) const;
    Amount total_locked(const Currency& asset) const;

private:
    std::unordered_map<AccountAsset, Amount, AccountAssetHash> locked_;
    std::unordered_map<Currency, Amount, CurrencyHash> totals_;
    mutable std::shared_mutex mutex_;

    // Caller holds mutex_ exclusively
    Amount take(const AccountAsset& key, Amount amount);
};

} // namespace lendcore

#endif // LENDCORE_GUARANTEE_FUND_HPP
