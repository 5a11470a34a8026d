#ifndef LENDCORE_VALUATION_HPP
#define LENDCORE_VALUATION_HPP

#include <atomic>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "events.hpp"

namespace lendcore {

// =============================================================================
// Price Feed Interface
// =============================================================================

// Raw feed response. Transient: never stored beyond the call that fetched it,
// except as a normalized last-known-good price.
struct PriceQuote {
    U128 price;              // scaled by 10^decimals
    uint64_t timestamp;      // seconds since epoch
    uint8_t decimals;
    bool source_healthy;
};

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual bool supports(const Currency& asset) const = 0;

    // nullopt (or an exception) means the call failed
    virtual std::optional<PriceQuote> fetch_quote(const Currency& asset) = 0;
};

// =============================================================================
// Valuation Results
// =============================================================================

struct ValuationResult {
    int32_t status;                             // errors::OK unless is_valid is false
    Amount value;
    bool is_valid;
    bool used_fallback;
    std::optional<DegradationReason> degradation;
    std::string reason;
};

struct OracleHealth {
    bool is_healthy;
    std::string details;
};

// =============================================================================
// ValuationService - validated values with graceful degradation
// =============================================================================

class ValuationService {
public:
    // feed and events may be null; an absent feed sends every call down the
    // fallback path
    ValuationService(IPriceFeed* feed, const IClock& clock,
                     const ProtocolConfig& config, EventBus* events = nullptr);
    ~ValuationService() = default;

    // Non-copyable
    ValuationService(const ValuationService&) = delete;
    ValuationService& operator=(const ValuationService&) = delete;

    // =========================================================================
    // Valuation
    // =========================================================================

    ValuationResult get_value(const Currency& asset, Amount amount,
                              const std::string& operation = "get_value");

    // Same, with an explicit degradation policy in place of the configured one
    ValuationResult get_value(const Currency& asset, Amount amount,
                              const DegradationConfig& degradation,
                              const std::string& operation);

    // Liability side: on the fallback path the last-known-good value is used
    // without the conservative haircut, so a debt is never valued below it
    ValuationResult get_debt_value(const Currency& asset, Amount amount,
                                   const std::string& operation = "debt_value");

    // =========================================================================
    // Validation Helpers
    // =========================================================================

    bool validate_decimals(uint8_t decimals) const;

    // nullopt when valid, otherwise "Decimals too low (minimum: 6)" etc.
    std::optional<std::string> validate_decimals_with_error(uint8_t decimals) const;

    // Observed price within expected_price +/- tolerance_bps (18-decimal scale)
    bool validate_stablecoin_price(const Currency& stablecoin, U128 expected_price,
                                   uint32_t tolerance_bps);

    // Uses the configured StablecoinConfig entry; false when not configured
    bool validate_stablecoin_price(const Currency& stablecoin);

    // =========================================================================
    // Health Probes
    // =========================================================================

    // Read-only; never throws and never mutates the price cache
    OracleHealth check_price_oracle_health(const Currency& asset) const;

    std::vector<bool> batch_check_price_oracle_health(const std::vector<Currency>& assets) const;

    // Emits OracleHealthChanged when the healthy flag differs from the last
    // published one. Returns the current flag.
    bool publish_oracle_health(const Currency& asset);

    // =========================================================================
    // Price Cache
    // =========================================================================

    // Last validated price normalized to 18 decimals
    std::optional<U128> last_known_price(const Currency& asset) const;

    // Seed a reference price (18 decimals), e.g. from an operator snapshot
    void set_last_known_price(const Currency& asset, U128 price_x18);

    void clear_price_cache();

    bool has_feed() const { return feed_ != nullptr; }
    const ProtocolConfig& config() const { return config_; }

    struct Stats {
        uint64_t valuations;
        uint64_t fallbacks;
        uint64_t feed_failures;
    };
    Stats get_stats() const;

private:
    IPriceFeed* feed_;
    const IClock& clock_;
    ProtocolConfig config_;
    EventBus* events_;

    std::unordered_map<Currency, U128, CurrencyHash> price_cache_;
    mutable std::shared_mutex cache_mutex_;

    std::unordered_map<Currency, bool, CurrencyHash> published_health_;
    std::mutex health_mutex_;

    std::atomic<uint64_t> valuations_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> feed_failures_{0};

    // Bounded-retry feed call; nullopt after the last failed attempt
    std::optional<PriceQuote> fetch_with_retry(const Currency& asset, std::string& failure);

    ValuationResult fallback(const Currency& asset, Amount amount,
                             const DegradationConfig& degradation,
                             DegradationReason reason, const std::string& details,
                             const std::string& operation);

    void emit_degradation(const Currency& asset, const std::string& operation,
                          DegradationReason reason, const std::string& details,
                          Amount value, bool is_valid) const;

    static std::optional<U128> normalize_price(U128 price, uint8_t decimals);
};

} // namespace lendcore

#endif // LENDCORE_VALUATION_HPP
