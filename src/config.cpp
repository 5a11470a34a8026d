// =============================================================================
// config.cpp - JSON configuration loading
// =============================================================================

#include "lendcore/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>

namespace lendcore {

namespace {

using nlohmann::json;

Address read_address(const json& j, const char* key) {
    if (!j.at(key).is_string()) {
        throw ConfigError(std::string("Expected hex address for ") + key);
    }
    auto addr = addresses::from_hex(j.at(key).get<std::string>());
    if (!addr) {
        throw ConfigError(std::string("Malformed address for ") + key);
    }
    return *addr;
}

// 128-bit values are decimal strings; plain integers accepted when they fit 64 bits
U128 read_u128(const json& j, const char* key) {
    const json& v = j.at(key);
    if (v.is_number_unsigned()) {
        return static_cast<U128>(v.get<uint64_t>());
    }
    if (v.is_string()) {
        auto parsed = parse_u128(v.get<std::string>());
        if (!parsed) throw ConfigError(std::string("Malformed amount for ") + key);
        return *parsed;
    }
    throw ConfigError(std::string("Expected amount for ") + key);
}

template<typename T>
T read_uint(const json& j, const char* key) {
    const json& v = j.at(key);
    if (!v.is_number_unsigned()) {
        throw ConfigError(std::string("Expected unsigned integer for ") + key);
    }
    uint64_t raw = v.get<uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        throw ConfigError(std::string("Value out of range for ") + key);
    }
    return static_cast<T>(raw);
}

bool read_bool(const json& j, const char* key) {
    if (!j.at(key).is_boolean()) {
        throw ConfigError(std::string("Expected boolean for ") + key);
    }
    return j.at(key).get<bool>();
}

void parse_sections(const json& root, ProtocolConfig& config) {
    if (root.contains("general")) {
        const auto& s = root.at("general");
        if (s.contains("log_level")) config.general.log_level = s.at("log_level").get<std::string>();
    }

    if (root.contains("degradation")) {
        const auto& s = root.at("degradation");
        if (s.contains("conservative_ratio_bps"))
            config.degradation.conservative_ratio_bps = read_uint<uint32_t>(s, "conservative_ratio_bps");
        if (s.contains("use_stablecoin_face_value"))
            config.degradation.use_stablecoin_face_value = read_bool(s, "use_stablecoin_face_value");
        if (s.contains("settlement_token"))
            config.degradation.settlement_token = Currency(read_address(s, "settlement_token"));
        if (s.contains("enable_price_cache"))
            config.degradation.enable_price_cache = read_bool(s, "enable_price_cache");
    }

    if (root.contains("validation")) {
        const auto& s = root.at("validation");
        if (s.contains("min_multiplier_bps"))
            config.validation.min_multiplier_bps = read_uint<uint32_t>(s, "min_multiplier_bps");
        if (s.contains("max_multiplier_bps"))
            config.validation.max_multiplier_bps = read_uint<uint32_t>(s, "max_multiplier_bps");
        if (s.contains("max_reasonable_price"))
            config.validation.max_reasonable_price = read_u128(s, "max_reasonable_price");
        if (s.contains("min_decimals"))
            config.validation.min_decimals = read_uint<uint8_t>(s, "min_decimals");
        if (s.contains("max_decimals"))
            config.validation.max_decimals = read_uint<uint8_t>(s, "max_decimals");
    }

    if (root.contains("retry")) {
        const auto& s = root.at("retry");
        if (s.contains("enable_retry")) config.retry.enable_retry = read_bool(s, "enable_retry");
        if (s.contains("max_retry_count"))
            config.retry.max_retry_count = read_uint<uint32_t>(s, "max_retry_count");
        if (s.contains("call_budget_ms"))
            config.retry.call_budget_ms = read_uint<uint64_t>(s, "call_budget_ms");
    }

    if (root.contains("oracle")) {
        const auto& s = root.at("oracle");
        if (s.contains("max_price_age"))
            config.oracle.max_price_age = read_uint<uint64_t>(s, "max_price_age");
        if (s.contains("max_future_skew"))
            config.oracle.max_future_skew = read_uint<uint64_t>(s, "max_future_skew");
    }

    if (root.contains("stablecoins")) {
        const auto& list = root.at("stablecoins");
        if (!list.is_array()) throw ConfigError("Expected array for stablecoins");
        for (const auto& entry : list) {
            StablecoinConfig coin;
            coin.stablecoin = Currency(read_address(entry, "stablecoin"));
            if (entry.contains("expected_price")) coin.expected_price = read_u128(entry, "expected_price");
            if (entry.contains("tolerance_bps")) coin.tolerance_bps = read_uint<uint32_t>(entry, "tolerance_bps");
            config.stablecoins.push_back(coin);
        }
    }

    if (root.contains("risk")) {
        const auto& s = root.at("risk");
        if (s.contains("min_health_factor_bps"))
            config.risk.min_health_factor_bps = read_uint<uint32_t>(s, "min_health_factor_bps");
        if (s.contains("liquidation_threshold_bps"))
            config.risk.liquidation_threshold_bps = read_uint<uint32_t>(s, "liquidation_threshold_bps");
    }

    if (root.contains("settlement")) {
        const auto& s = root.at("settlement");
        if (s.contains("platform_fee_rate_bps"))
            config.settlement.platform_fee_rate_bps = read_uint<uint32_t>(s, "platform_fee_rate_bps");
        if (s.contains("max_platform_fee_rate_bps"))
            config.settlement.max_platform_fee_rate_bps = read_uint<uint32_t>(s, "max_platform_fee_rate_bps");
        if (s.contains("platform_fee_receiver"))
            config.settlement.platform_fee_receiver = read_address(s, "platform_fee_receiver");
        if (s.contains("early_repay_penalty_days"))
            config.settlement.early_repay_penalty_days = read_uint<uint32_t>(s, "early_repay_penalty_days");
        if (s.contains("max_term_days"))
            config.settlement.max_term_days = read_uint<uint32_t>(s, "max_term_days");
    }
}

} // namespace

ProtocolConfig ProtocolConfig::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Malformed config: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Config root must be an object");
    }

    ProtocolConfig config;
    try {
        parse_sections(root, config);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }

    int32_t status = config.validate();
    if (status != errors::OK) {
        throw ConfigError(std::string("Invalid config: ") + errors::message(status));
    }
    return config;
}

ProtocolConfig ProtocolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

std::string ProtocolConfig::to_json() const {
    json root;
    root["general"] = {{"log_level", general.log_level}};
    root["degradation"] = {
        {"conservative_ratio_bps", degradation.conservative_ratio_bps},
        {"use_stablecoin_face_value", degradation.use_stablecoin_face_value},
        {"settlement_token", addresses::to_hex(degradation.settlement_token.addr)},
        {"enable_price_cache", degradation.enable_price_cache},
    };
    root["validation"] = {
        {"min_multiplier_bps", validation.min_multiplier_bps},
        {"max_multiplier_bps", validation.max_multiplier_bps},
        {"max_reasonable_price", lendcore::to_string(validation.max_reasonable_price)},
        {"min_decimals", validation.min_decimals},
        {"max_decimals", validation.max_decimals},
    };
    root["retry"] = {
        {"enable_retry", retry.enable_retry},
        {"max_retry_count", retry.max_retry_count},
        {"call_budget_ms", retry.call_budget_ms},
    };
    root["oracle"] = {
        {"max_price_age", oracle.max_price_age},
        {"max_future_skew", oracle.max_future_skew},
    };

    json coins = json::array();
    for (const auto& coin : stablecoins) {
        coins.push_back({
            {"stablecoin", addresses::to_hex(coin.stablecoin.addr)},
            {"expected_price", lendcore::to_string(coin.expected_price)},
            {"tolerance_bps", coin.tolerance_bps},
        });
    }
    root["stablecoins"] = coins;

    root["risk"] = {
        {"min_health_factor_bps", risk.min_health_factor_bps},
        {"liquidation_threshold_bps", risk.liquidation_threshold_bps},
    };
    root["settlement"] = {
        {"platform_fee_rate_bps", settlement.platform_fee_rate_bps},
        {"max_platform_fee_rate_bps", settlement.max_platform_fee_rate_bps},
        {"platform_fee_receiver", addresses::to_hex(settlement.platform_fee_receiver)},
        {"early_repay_penalty_days", settlement.early_repay_penalty_days},
        {"max_term_days", settlement.max_term_days},
    };
    return root.dump(2);
}

int32_t ProtocolConfig::validate() const {
    if (degradation.conservative_ratio_bps > BPS_DENOMINATOR) return errors::INVALID_CONFIG;
    if (validation.min_multiplier_bps > validation.max_multiplier_bps) return errors::INVALID_CONFIG;
    if (validation.max_reasonable_price == 0) return errors::INVALID_CONFIG;
    if (validation.min_decimals < 6 || validation.max_decimals > 18 ||
        validation.min_decimals > validation.max_decimals) {
        return errors::INVALID_CONFIG;
    }
    for (const auto& coin : stablecoins) {
        if (coin.stablecoin.is_zero() || coin.tolerance_bps > BPS_DENOMINATOR) {
            return errors::INVALID_CONFIG;
        }
    }
    if (risk.liquidation_threshold_bps > risk.min_health_factor_bps) return errors::INVALID_CONFIG;
    if (settlement.max_platform_fee_rate_bps > BPS_DENOMINATOR) return errors::INVALID_CONFIG;
    if (settlement.platform_fee_rate_bps > settlement.max_platform_fee_rate_bps) {
        return errors::RATE_TOO_HIGH;
    }
    if (settlement.max_term_days == 0 || settlement.max_term_days > 3650) return errors::INVALID_CONFIG;
    return errors::OK;
}

} // namespace lendcore
