// =============================================================================
// valuation.cpp - Validated asset valuation with conservative fallback
// =============================================================================

#include "lendcore/valuation.hpp"
#include "lendcore/log.hpp"
#include "lendcore/math.hpp"
#include <algorithm>
#include <chrono>
#include <exception>

namespace lendcore {

namespace {

constexpr const char* kComponent = "valuation";

const char* degradation_message(DegradationReason reason) {
    switch (reason) {
        case DegradationReason::ORACLE_CALL_FAILED: return "price oracle call failed";
        case DegradationReason::PRICE_STALE: return "price stale";
        case DegradationReason::SOURCE_UNHEALTHY: return "price source unhealthy";
        case DegradationReason::PRICE_IMPLAUSIBLE: return "price implausible";
        case DegradationReason::INVALID_DECIMALS: return "invalid decimals";
    }
    return "degraded";
}

ValuationResult invalid(int32_t status, std::optional<DegradationReason> degradation,
                        bool used_fallback, std::string reason) {
    return ValuationResult{status, 0, false, used_fallback, degradation, std::move(reason)};
}

} // namespace

ValuationService::ValuationService(IPriceFeed* feed, const IClock& clock,
                                   const ProtocolConfig& config, EventBus* events)
    : feed_(feed), clock_(clock), config_(config), events_(events) {}

// =============================================================================
// Valuation
// =============================================================================

ValuationResult ValuationService::get_value(const Currency& asset, Amount amount,
                                            const std::string& operation) {
    return get_value(asset, amount, config_.degradation, operation);
}

ValuationResult ValuationService::get_debt_value(const Currency& asset, Amount amount,
                                                 const std::string& operation) {
    DegradationConfig liability = config_.degradation;
    liability.conservative_ratio_bps = std::max(liability.conservative_ratio_bps,
                                                static_cast<uint32_t>(BPS_DENOMINATOR));
    return get_value(asset, amount, liability, operation);
}

ValuationResult ValuationService::get_value(const Currency& asset, Amount amount,
                                            const DegradationConfig& degradation,
                                            const std::string& operation) {
    valuations_.fetch_add(1, std::memory_order_relaxed);

    if (amount == 0) {
        return ValuationResult{errors::OK, 0, true, false, std::nullopt, "zero amount"};
    }
    if (asset.is_zero()) {
        return invalid(errors::ZERO_ADDRESS, std::nullopt, false, "zero address");
    }

    // Feed call (the only place untrusted code runs)
    std::string failure;
    auto quote = fetch_with_retry(asset, failure);
    if (!quote) {
        return fallback(asset, amount, degradation, DegradationReason::ORACLE_CALL_FAILED,
                        failure, operation);
    }

    // Decimals are a hard rejection: no fallback can repair a misconfigured asset
    if (auto err = validate_decimals_with_error(quote->decimals)) {
        LENDCORE_WARN(kComponent, operation << ": " << *err);
        emit_degradation(asset, operation, DegradationReason::INVALID_DECIMALS, *err, 0, false);
        return invalid(errors::INVALID_DECIMALS, DegradationReason::INVALID_DECIMALS, false, *err);
    }

    if (!quote->source_healthy) {
        return fallback(asset, amount, degradation, DegradationReason::SOURCE_UNHEALTHY,
                        "feed flagged quote unhealthy", operation);
    }

    uint64_t now = clock_.now();
    if (quote->timestamp < now && now - quote->timestamp > config_.oracle.max_price_age) {
        return fallback(asset, amount, degradation, DegradationReason::PRICE_STALE,
                        "quote age " + std::to_string(now - quote->timestamp) + "s", operation);
    }
    if (quote->timestamp > now && quote->timestamp - now > config_.oracle.max_future_skew) {
        return fallback(asset, amount, degradation, DegradationReason::PRICE_IMPLAUSIBLE,
                        "quote dated " + std::to_string(quote->timestamp - now) + "s ahead",
                        operation);
    }

    // Plausibility against absolute cap and reference band
    auto normalized = normalize_price(quote->price, quote->decimals);
    if (!normalized || *normalized == 0) {
        return fallback(asset, amount, degradation, DegradationReason::PRICE_IMPLAUSIBLE,
                        "zero or unrepresentable price", operation);
    }
    if (*normalized > config_.validation.max_reasonable_price) {
        return fallback(asset, amount, degradation, DegradationReason::PRICE_IMPLAUSIBLE,
                        "price above max reasonable price", operation);
    }

    auto reference = last_known_price(asset);
    if (reference) {
        auto lower = fixed::mul_div(*reference, config_.validation.min_multiplier_bps, BPS_DENOMINATOR);
        auto upper = fixed::mul_div(*reference, config_.validation.max_multiplier_bps, BPS_DENOMINATOR);
        if ((lower && *normalized < *lower) || (upper && *normalized > *upper)) {
            return fallback(asset, amount, degradation, DegradationReason::PRICE_IMPLAUSIBLE,
                            "price outside multiplier band of reference " + to_string(*reference),
                            operation);
        }
    }

    auto scale = fixed::pow10(quote->decimals);
    U128 value = 0;
    int32_t status = scale ? fixed::mul_div(amount, quote->price, *scale, value)
                           : errors::ARITHMETIC_OVERFLOW;
    if (status != errors::OK) {
        LENDCORE_ERROR(kComponent, operation << ": value computation failed: "
                       << errors::message(status));
        return invalid(status, std::nullopt, false, errors::message(status));
    }

    if (degradation.enable_price_cache) {
        std::unique_lock lock(cache_mutex_);
        price_cache_[asset] = *normalized;
    }

    return ValuationResult{errors::OK, value, true, false, std::nullopt,
                           "price calculation successful"};
}

std::optional<PriceQuote> ValuationService::fetch_with_retry(const Currency& asset,
                                                             std::string& failure) {
    if (!feed_) {
        failure = "price feed unavailable";
        feed_failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    if (!feed_->supports(asset)) {
        failure = "asset not supported";
        feed_failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    uint32_t attempts = 1 + (config_.retry.enable_retry ? config_.retry.max_retry_count : 0);
    for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
        auto start = std::chrono::steady_clock::now();
        std::optional<PriceQuote> quote;
        try {
            quote = feed_->fetch_quote(asset);
        } catch (const std::exception& e) {
            failure = std::string("feed threw: ") + e.what();
            feed_failures_.fetch_add(1, std::memory_order_relaxed);
            LENDCORE_DEBUG(kComponent, "attempt " << attempt + 1 << "/" << attempts << " " << failure);
            continue;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (static_cast<uint64_t>(elapsed) > config_.retry.call_budget_ms) {
            failure = "feed call exceeded " + std::to_string(config_.retry.call_budget_ms) + "ms";
            feed_failures_.fetch_add(1, std::memory_order_relaxed);
            LENDCORE_DEBUG(kComponent, "attempt " << attempt + 1 << "/" << attempts << " " << failure);
            continue;
        }

        if (!quote) {
            failure = "feed returned no quote";
            feed_failures_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        return quote;
    }
    return std::nullopt;
}

ValuationResult ValuationService::fallback(const Currency& asset, Amount amount,
                                           const DegradationConfig& degradation,
                                           DegradationReason reason, const std::string& details,
                                           const std::string& operation) {
    fallbacks_.fetch_add(1, std::memory_order_relaxed);
    const char* reason_text = degradation_message(reason);

    // Settlement token at unit face value
    if (degradation.use_stablecoin_face_value && !degradation.settlement_token.is_zero() &&
        asset == degradation.settlement_token) {
        LENDCORE_INFO(kComponent, operation << ": " << reason_text << ", using face value");
        emit_degradation(asset, operation, reason, details, amount, true);
        return ValuationResult{errors::OK, amount, true, true, reason, reason_text};
    }

    // Conservative share of the last-known-good value
    std::optional<U128> cached;
    if (degradation.enable_price_cache) cached = last_known_price(asset);
    if (cached) {
        U128 full = 0;
        int32_t status = fixed::mul_div(amount, *cached, WAD, full);
        U128 value = 0;
        if (status == errors::OK) {
            status = fixed::mul_div(full, degradation.conservative_ratio_bps, BPS_DENOMINATOR, value);
        }
        if (status != errors::OK) {
            emit_degradation(asset, operation, reason, details, 0, false);
            return invalid(status, reason, true, errors::message(status));
        }
        LENDCORE_INFO(kComponent, operation << ": " << reason_text << ", conservative value "
                      << to_string(value));
        emit_degradation(asset, operation, reason, details, value, true);
        return ValuationResult{errors::OK, value, true, true, reason, reason_text};
    }

    // Nothing trustworthy to fall back on
    LENDCORE_WARN(kComponent, operation << ": " << reason_text << ", no fallback available ("
                  << details << ")");
    emit_degradation(asset, operation, reason, details, 0, false);
    return invalid(errors::VALUATION_UNAVAILABLE, reason, true, reason_text);
}

void ValuationService::emit_degradation(const Currency& asset, const std::string& operation,
                                        DegradationReason reason, const std::string& details,
                                        Amount value, bool is_valid) const {
    if (!events_) return;
    events_->publish(DegradationTriggered{asset, operation, reason, details, value, is_valid});
}

std::optional<U128> ValuationService::normalize_price(U128 price, uint8_t decimals) {
    if (decimals > 18) return std::nullopt;
    auto scale = fixed::pow10(18 - decimals);
    if (!scale) return std::nullopt;
    return fixed::checked_mul(price, *scale);
}

// =============================================================================
// Validation Helpers
// =============================================================================

bool ValuationService::validate_decimals(uint8_t decimals) const {
    return !validate_decimals_with_error(decimals).has_value();
}

std::optional<std::string> ValuationService::validate_decimals_with_error(uint8_t decimals) const {
    if (decimals < config_.validation.min_decimals) {
        return "Decimals too low (minimum: " + std::to_string(config_.validation.min_decimals) + ")";
    }
    if (decimals > config_.validation.max_decimals) {
        return "Decimals too high (maximum: " + std::to_string(config_.validation.max_decimals) + ")";
    }
    return std::nullopt;
}

bool ValuationService::validate_stablecoin_price(const Currency& stablecoin, U128 expected_price,
                                                 uint32_t tolerance_bps) {
    if (stablecoin.is_zero() || tolerance_bps > BPS_DENOMINATOR) return false;

    std::string failure;
    auto quote = fetch_with_retry(stablecoin, failure);
    if (!quote || !validate_decimals(quote->decimals)) return false;

    auto observed = normalize_price(quote->price, quote->decimals);
    if (!observed) return false;

    auto lower = fixed::mul_div(expected_price, BPS_DENOMINATOR - tolerance_bps, BPS_DENOMINATOR);
    auto upper = fixed::mul_div(expected_price, BPS_DENOMINATOR + tolerance_bps, BPS_DENOMINATOR);
    if (!lower || !upper) return false;

    return *observed >= *lower && *observed <= *upper;
}

bool ValuationService::validate_stablecoin_price(const Currency& stablecoin) {
    for (const auto& coin : config_.stablecoins) {
        if (coin.stablecoin == stablecoin) {
            return validate_stablecoin_price(stablecoin, coin.expected_price, coin.tolerance_bps);
        }
    }
    return false;
}

// =============================================================================
// Health Probes
// =============================================================================

OracleHealth ValuationService::check_price_oracle_health(const Currency& asset) const {
    if (asset.is_zero()) return {false, "Zero address"};
    if (!feed_) return {false, "Price feed unavailable"};
    if (!feed_->supports(asset)) return {false, "Asset not supported"};

    std::optional<PriceQuote> quote;
    try {
        quote = feed_->fetch_quote(asset);
    } catch (const std::exception& e) {
        LENDCORE_DEBUG(kComponent, "health probe: feed threw: " << e.what());
        return {false, "Price oracle call failed"};
    }
    if (!quote) return {false, "Price oracle call failed"};

    if (auto err = validate_decimals_with_error(quote->decimals)) return {false, *err};
    if (!quote->source_healthy) return {false, "Price source unhealthy"};
    if (quote->price == 0) return {false, "Invalid price"};

    uint64_t now = clock_.now();
    if (quote->timestamp < now && now - quote->timestamp > config_.oracle.max_price_age) {
        return {false, "Price stale"};
    }
    if (quote->timestamp > now && quote->timestamp - now > config_.oracle.max_future_skew) {
        return {false, "Price timestamp in the future"};
    }
    return {true, "Healthy"};
}

std::vector<bool> ValuationService::batch_check_price_oracle_health(
    const std::vector<Currency>& assets) const {
    std::vector<bool> out;
    out.reserve(assets.size());
    for (const auto& asset : assets) {
        out.push_back(check_price_oracle_health(asset).is_healthy);
    }
    return out;
}

bool ValuationService::publish_oracle_health(const Currency& asset) {
    OracleHealth health = check_price_oracle_health(asset);

    bool changed = false;
    {
        std::lock_guard lock(health_mutex_);
        auto it = published_health_.find(asset);
        if (it == published_health_.end() || it->second != health.is_healthy) {
            published_health_[asset] = health.is_healthy;
            changed = true;
        }
    }

    if (changed) {
        LENDCORE_INFO(kComponent, "oracle health for " << addresses::to_hex(asset.addr) << ": "
                      << health.details);
        if (events_) events_->publish(OracleHealthChanged{asset, health.is_healthy, health.details});
    }
    return health.is_healthy;
}

// =============================================================================
// Price Cache
// =============================================================================

std::optional<U128> ValuationService::last_known_price(const Currency& asset) const {
    std::shared_lock lock(cache_mutex_);
    auto it = price_cache_.find(asset);
    if (it == price_cache_.end()) return std::nullopt;
    return it->second;
}

void ValuationService::set_last_known_price(const Currency& asset, U128 price_x18) {
    std::unique_lock lock(cache_mutex_);
    price_cache_[asset] = price_x18;
}

void ValuationService::clear_price_cache() {
    std::unique_lock lock(cache_mutex_);
    price_cache_.clear();
}

ValuationService::Stats ValuationService::get_stats() const {
    return Stats{
        valuations_.load(std::memory_order_relaxed),
        fallbacks_.load(std::memory_order_relaxed),
        feed_failures_.load(std::memory_order_relaxed),
    };
}

} // namespace lendcore
