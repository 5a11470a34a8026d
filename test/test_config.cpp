// lendcore - Configuration Tests

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include "mocks.hpp"

using namespace lendcore;
using namespace lendcore::test;

TEST_CASE("ProtocolConfig defaults", "[config]") {
    ProtocolConfig config;

    REQUIRE(config.general.log_level == "info");
    REQUIRE(config.degradation.conservative_ratio_bps == 5000);
    REQUIRE(config.degradation.use_stablecoin_face_value);
    REQUIRE(config.degradation.enable_price_cache);
    REQUIRE(config.validation.min_multiplier_bps == 5000);
    REQUIRE(config.validation.max_multiplier_bps == 15000);
    REQUIRE(config.validation.min_decimals == 6);
    REQUIRE(config.validation.max_decimals == 18);
    REQUIRE(config.retry.enable_retry);
    REQUIRE(config.retry.max_retry_count == 1);
    REQUIRE(config.oracle.max_price_age == 3600);
    REQUIRE(config.oracle.max_future_skew == 60);
    REQUIRE(config.risk.min_health_factor_bps == 11000);
    REQUIRE(config.risk.liquidation_threshold_bps == 10500);
    REQUIRE(config.settlement.platform_fee_rate_bps == 100);
    REQUIRE(config.settlement.max_platform_fee_rate_bps == 1000);
    REQUIRE(config.settlement.early_repay_penalty_days == 3);
    REQUIRE(config.settlement.max_term_days == 3650);
    REQUIRE(config.validate() == errors::OK);
}

TEST_CASE("ProtocolConfig builder and validation", "[config]") {
    ProtocolConfig config;

    SECTION("Builder chains") {
        config.with_settlement_token(USDC)
              .with_conservative_ratio(4000)
              .with_platform_fee(200, TREASURY)
              .add_stablecoin(USDC, WAD, 50);

        REQUIRE(config.degradation.settlement_token == USDC);
        REQUIRE(config.degradation.conservative_ratio_bps == 4000);
        REQUIRE(config.settlement.platform_fee_rate_bps == 200);
        REQUIRE(config.settlement.platform_fee_receiver == TREASURY);
        REQUIRE(config.stablecoins.size() == 1);
        REQUIRE(config.validate() == errors::OK);
    }

    SECTION("Fee rate above the cap") {
        config.with_platform_fee(1100, TREASURY);
        REQUIRE(config.validate() == errors::RATE_TOO_HIGH);
    }

    SECTION("Inconsistent bounds") {
        REQUIRE(ProtocolConfig(config).with_conservative_ratio(10001).validate() == errors::INVALID_CONFIG);
        REQUIRE(ProtocolConfig(config).with_multiplier_bounds(16000, 15000).validate() == errors::INVALID_CONFIG);
        REQUIRE(ProtocolConfig(config).with_max_reasonable_price(0).validate() == errors::INVALID_CONFIG);
        REQUIRE(ProtocolConfig(config).with_health_thresholds(10000, 10500).validate() == errors::INVALID_CONFIG);
        REQUIRE(ProtocolConfig(config).add_stablecoin(Currency{}, WAD).validate() == errors::INVALID_CONFIG);
    }
}

TEST_CASE("ProtocolConfig JSON loading", "[config]") {
    SECTION("Overrides selected fields") {
        nlohmann::json doc = {
            {"general", {{"log_level", "warn"}}},
            {"degradation", {{"settlement_token", addresses::to_hex(USDC.addr)},
                             {"conservative_ratio_bps", 2500}}},
            {"validation", {{"max_reasonable_price", "5000000000000000000000000000000"}}},
            {"retry", {{"enable_retry", false}}},
            {"stablecoins", {{{"stablecoin", addresses::to_hex(USDC.addr)}, {"tolerance_bps", 25}}}},
            {"settlement", {{"platform_fee_receiver", addresses::to_hex(TREASURY)},
                            {"platform_fee_rate_bps", 50}}},
        };

        auto config = ProtocolConfig::from_json(doc.dump());

        REQUIRE(config.general.log_level == "warn");
        REQUIRE(config.degradation.settlement_token == USDC);
        REQUIRE(config.degradation.conservative_ratio_bps == 2500);
        REQUIRE(config.validation.max_reasonable_price == *parse_u128("5000000000000000000000000000000"));
        REQUIRE_FALSE(config.retry.enable_retry);
        REQUIRE(config.stablecoins.size() == 1);
        REQUIRE(config.stablecoins[0].expected_price == WAD);
        REQUIRE(config.stablecoins[0].tolerance_bps == 25);
        REQUIRE(config.settlement.platform_fee_receiver == TREASURY);
        REQUIRE(config.settlement.platform_fee_rate_bps == 50);

        // Untouched sections keep their defaults
        REQUIRE(config.oracle.max_price_age == 3600);
        REQUIRE(config.risk.min_health_factor_bps == 11000);
    }

    SECTION("Oracle window") {
        auto config = ProtocolConfig::from_json(R"({"oracle": {"max_future_skew": 5}})");
        REQUIRE(config.oracle.max_future_skew == 5);
        REQUIRE(config.oracle.max_price_age == 3600);
    }

    SECTION("Empty object yields defaults") {
        auto config = ProtocolConfig::from_json("{}");
        REQUIRE(config.settlement.platform_fee_rate_bps == 100);
    }

    SECTION("Malformed input throws ConfigError") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_json("{not json"), ConfigError);
        REQUIRE_THROWS_AS(ProtocolConfig::from_json("[1, 2]"), ConfigError);
        REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"settlement": {"platform_fee_receiver": "0x12"}})"),
                          ConfigError);
        REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"retry": {"enable_retry": "yes"}})"), ConfigError);
        REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"risk": {"min_health_factor_bps": -1}})"),
                          ConfigError);
        REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"validation": {"min_decimals": 300}})"),
                          ConfigError);
    }

    SECTION("Validation failures throw") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"settlement": {"platform_fee_rate_bps": 1100}})"),
                          ConfigError);
        REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"settlement": {"max_term_days": 0}})"),
                          ConfigError);
    }

    SECTION("Missing file throws") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_file("/nonexistent/lendcore.json"), ConfigError);
    }
}

TEST_CASE("ProtocolConfig round trip", "[config]") {
    ProtocolConfig original;
    original.with_settlement_token(USDC)
            .with_max_reasonable_price(U128_MAX)
            .with_platform_fee(300, TREASURY)
            .with_early_repay_penalty_days(5)
            .add_stablecoin(USDC, WAD, 80);

    auto restored = ProtocolConfig::from_json(original.to_json());

    REQUIRE(restored.degradation.settlement_token == USDC);
    REQUIRE(restored.validation.max_reasonable_price == U128_MAX);
    REQUIRE(restored.settlement.platform_fee_rate_bps == 300);
    REQUIRE(restored.settlement.platform_fee_receiver == TREASURY);
    REQUIRE(restored.settlement.early_repay_penalty_days == 5);
    REQUIRE(restored.stablecoins.size() == 1);
    REQUIRE(restored.stablecoins[0].tolerance_bps == 80);
}
