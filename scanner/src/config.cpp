#include "config.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    std::string get_env(const char* name, const std::string& default_value) {
        const char* value = std::getenv(name);
        return value ? value : default_value;
    }

    int get_env_int(const char* name, int default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stoi(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid integer value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    double get_env_double(const char* name, double default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stod(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid double value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    bool get_env_bool(const char* name, bool default_value) {
        const char* value = std::getenv(name);
        if (!value) {
            return default_value;
        }
        auto upper = to_upper(value);
        if (upper == "1" || upper == "TRUE" || upper == "YES") {
            return true;
        }
        if (upper == "0" || upper == "FALSE" || upper == "NO") {
            return false;
        }
        spdlog::warn("Invalid boolean value for {}: {}", name, value);
        return default_value;
    }

    // Comma separated list, blanks dropped
    std::vector<std::string> get_env_list(const char* name, const std::vector<std::string>& default_value) {
        const char* value = std::getenv(name);
        if (!value) {
            return default_value;
        }
        std::vector<std::string> result;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item.erase(std::remove_if(item.begin(), item.end(), ::isspace), item.end());
            if (!item.empty()) {
                result.push_back(to_upper(item));
            }
        }
        return result;
    }

    template <typename T>
    std::optional<T> opt_value(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return std::nullopt;
        }
        return it->get<T>();
    }

    ThresholdOverrides overrides_from_json(const nlohmann::json& j) {
        ThresholdOverrides overrides;
        overrides.min_base_score = opt_value<double>(j, "min_base_score");
        overrides.min_style_score = opt_value<double>(j, "min_style_score");
        overrides.min_risk_reward = opt_value<double>(j, "min_risk_reward");
        overrides.max_signals_per_symbol_per_hour = opt_value<int>(j, "max_signals_per_symbol_per_hour");
        overrides.cooldown_minutes = opt_value<int>(j, "cooldown_minutes");
        return overrides;
    }

    nlohmann::json overrides_to_json(const ThresholdOverrides& overrides) {
        nlohmann::json j = nlohmann::json::object();
        if (overrides.min_base_score) j["min_base_score"] = *overrides.min_base_score;
        if (overrides.min_style_score) j["min_style_score"] = *overrides.min_style_score;
        if (overrides.min_risk_reward) j["min_risk_reward"] = *overrides.min_risk_reward;
        if (overrides.max_signals_per_symbol_per_hour) {
            j["max_signals_per_symbol_per_hour"] = *overrides.max_signals_per_symbol_per_hour;
        }
        if (overrides.cooldown_minutes) j["cooldown_minutes"] = *overrides.cooldown_minutes;
        return j;
    }

    void validate_score(const std::string& name, double value) {
        if (value < 0.0 || value > 100.0) {
            throw std::runtime_error(fmt::format("{} must be between 0 and 100 (got {})", name, value));
        }
    }

    void validate_overrides(const std::string& scope, const ThresholdOverrides& overrides) {
        if (overrides.min_base_score) {
            validate_score(scope + ".min_base_score", *overrides.min_base_score);
        }
        if (overrides.min_style_score) {
            validate_score(scope + ".min_style_score", *overrides.min_style_score);
        }
        if (overrides.min_risk_reward && *overrides.min_risk_reward < 0.0) {
            throw std::runtime_error(scope + ".min_risk_reward must not be negative");
        }
        if (overrides.max_signals_per_symbol_per_hour && *overrides.max_signals_per_symbol_per_hour < 1) {
            throw std::runtime_error(scope + ".max_signals_per_symbol_per_hour must be at least 1");
        }
        if (overrides.cooldown_minutes && *overrides.cooldown_minutes < 0) {
            throw std::runtime_error(scope + ".cooldown_minutes must not be negative");
        }
    }
}

void ThresholdOverrides::apply_to(SignalThresholds& thresholds) const {
    if (min_base_score) thresholds.min_base_score = *min_base_score;
    if (min_style_score) thresholds.min_style_score = *min_style_score;
    if (min_risk_reward) thresholds.min_risk_reward = *min_risk_reward;
    if (max_signals_per_symbol_per_hour) {
        thresholds.max_signals_per_symbol_per_hour = *max_signals_per_symbol_per_hour;
    }
    if (cooldown_minutes) thresholds.cooldown_minutes = *cooldown_minutes;
}

SignalThresholds ScannerConfig::thresholds_for(AssetClass asset_class, const std::string& detector_type) const {
    SignalThresholds thresholds = default_thresholds;

    auto by_class = asset_class_thresholds.find(asset_class);
    if (by_class != asset_class_thresholds.end()) {
        by_class->second.apply_to(thresholds);
    }

    auto by_type = detector_thresholds.find(detector_type);
    if (by_type != detector_thresholds.end()) {
        by_type->second.apply_to(thresholds);
    }

    return thresholds;
}

AssetClass ScannerConfig::asset_class_for(const std::string& symbol) const {
    auto it = symbol_asset_classes.find(to_upper(symbol));
    if (it != symbol_asset_classes.end()) {
        return it->second;
    }
    return classify_symbol(symbol);
}

bool ScannerConfig::is_blacklisted(const std::string& symbol) const {
    auto upper = to_upper(symbol);
    return std::any_of(filters.blacklist.begin(), filters.blacklist.end(),
                       [&upper](const std::string& entry) { return to_upper(entry) == upper; });
}

std::chrono::minutes ScannerConfig::max_cooldown() const {
    int longest = default_thresholds.cooldown_minutes;
    for (const auto& [asset_class, overrides] : asset_class_thresholds) {
        longest = std::max(longest, overrides.cooldown_minutes.value_or(0));
    }
    for (const auto& [type, overrides] : detector_thresholds) {
        longest = std::max(longest, overrides.cooldown_minutes.value_or(0));
    }
    return std::chrono::minutes(longest);
}

std::chrono::minutes ScannerConfig::dedup_retention() const {
    return std::max({max_cooldown(), std::chrono::minutes(bar_interval_minutes), std::chrono::minutes(60)});
}

void ScannerConfig::load_from_env() {
    // Service configuration
    service_name = get_env("SERVICE_NAME", service_name);
    log_level = get_env("LOG_LEVEL", log_level);
    detector_version = get_env("SCANNER_DETECTOR_VERSION", detector_version);
    thread_pool_size = get_env_int("THREAD_POOL_SIZE", thread_pool_size);

    // Universal filters
    filters.market_hours_only = get_env_bool("SCANNER_MARKET_HOURS_ONLY", filters.market_hours_only);
    filters.min_rvol = get_env_double("SCANNER_MIN_RVOL", filters.min_rvol);
    filters.max_spread = get_env_double("SCANNER_MAX_SPREAD", filters.max_spread);
    filters.blacklist = get_env_list("SCANNER_BLACKLIST", filters.blacklist);
    filters.require_minimum_liquidity = get_env_bool("SCANNER_REQUIRE_LIQUIDITY", filters.require_minimum_liquidity);
    filters.min_avg_volume = get_env_double("SCANNER_MIN_AVG_VOLUME", filters.min_avg_volume);
    filters.allow_non_regular_hours = get_env_bool("ALLOW_WEEKEND_SIGNALS", filters.allow_non_regular_hours);

    // Signal thresholds
    default_thresholds.min_base_score = get_env_double("SCANNER_MIN_BASE_SCORE", default_thresholds.min_base_score);
    default_thresholds.min_style_score = get_env_double("SCANNER_MIN_STYLE_SCORE", default_thresholds.min_style_score);
    default_thresholds.min_risk_reward = get_env_double("SCANNER_MIN_RISK_REWARD", default_thresholds.min_risk_reward);
    default_thresholds.max_signals_per_symbol_per_hour = get_env_int(
        "SCANNER_MAX_SIGNALS_PER_HOUR", default_thresholds.max_signals_per_symbol_per_hour);
    default_thresholds.cooldown_minutes = get_env_int("SCANNER_COOLDOWN_MINUTES", default_thresholds.cooldown_minutes);

    // Scanning behaviour
    auto scope = get_env("SCANNER_RATE_CAP_SCOPE", rate_cap_scope == RateCapScope::PerSymbol ? "per_symbol" : "per_detector");
    if (scope == "per_symbol") {
        rate_cap_scope = RateCapScope::PerSymbol;
    } else if (scope == "per_detector") {
        rate_cap_scope = RateCapScope::PerDetector;
    } else {
        spdlog::warn("Invalid value for SCANNER_RATE_CAP_SCOPE: {}", scope);
    }
    bar_interval_minutes = get_env_int("SCANNER_BAR_INTERVAL_MINUTES", bar_interval_minutes);
    signal_ttl_minutes = get_env_int("SCANNER_SIGNAL_TTL_MINUTES", signal_ttl_minutes);
    enable_adaptive_thresholds = get_env_bool("SCANNER_ADAPTIVE_THRESHOLDS", enable_adaptive_thresholds);
}

void ScannerConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("Invalid JSON in {}: {}", path, e.what()));
    }

    *this = from_json(j);
}

ScannerConfig ScannerConfig::optimized() {
    ScannerConfig config;
    config.detector_version = "1.1.0-optimized";
    config.thread_pool_size = 10;

    config.filters.market_hours_only = true;
    config.filters.min_rvol = 0.0;
    config.filters.max_spread = 0.003;
    config.filters.require_minimum_liquidity = false;
    config.filters.min_avg_volume = 0.0;

    auto& d = config.default_thresholds;
    d.min_base_score = 80.0;
    d.min_style_score = 85.0;
    d.min_risk_reward = 2.0;
    d.max_signals_per_symbol_per_hour = 1;
    d.cooldown_minutes = 30;

    const ThresholdOverrides equity{78.0, 83.0, 2.0, 1, 30};
    config.asset_class_thresholds = {
        {AssetClass::Index, ThresholdOverrides{85.0, 88.0, 2.5, 2, 20}},
        {AssetClass::EquityEtf, equity},
        {AssetClass::Stock, equity}
    };

    const auto none = std::nullopt;
    config.detector_thresholds = {
        // Tier 1
        {"breakout_bullish", {78.0, 82.0, 2.0, none, none}},
        {"breakout_bearish", {78.0, 82.0, 2.0, none, none}},
        {"mean_reversion_long", {80.0, 85.0, 2.2, none, none}},
        {"mean_reversion_short", {80.0, 85.0, 2.2, none, none}},
        {"trend_continuation_long", {75.0, 80.0, 2.5, none, none}},
        {"trend_continuation_short", {75.0, 80.0, 2.5, none, none}},

        // Tier 2
        {"gamma_squeeze_bullish", {85.0, 88.0, 2.5, none, 45}},
        {"gamma_squeeze_bearish", {85.0, 88.0, 2.5, none, 45}},
        {"index_mean_reversion_long", {82.0, 86.0, 2.3, none, none}},
        {"index_mean_reversion_short", {82.0, 86.0, 2.3, none, none}},
        {"power_hour_reversal_bullish", {85.0, 88.0, 2.0, 1, none}},
        {"power_hour_reversal_bearish", {85.0, 88.0, 2.0, 1, none}},

        // Tier 3
        {"gamma_flip_bullish", {90.0, 92.0, 3.0, 1, 60}},
        {"gamma_flip_bearish", {90.0, 92.0, 3.0, 1, 60}},
        {"eod_pin_setup", {88.0, 90.0, 2.8, 1, 120}},
        {"opening_drive_bullish", {85.0, 88.0, 2.5, 1, none}},
        {"opening_drive_bearish", {85.0, 88.0, 2.5, 1, none}}
    };
    return config;
}

ScannerConfig ScannerConfig::from_json(const nlohmann::json& j) {
    auto profile = j.value("profile", std::string("default"));
    if (profile != "default" && profile != "optimized") {
        throw std::runtime_error("profile must be default or optimized");
    }
    ScannerConfig config = profile == "optimized" ? optimized() : ScannerConfig{};

    config.service_name = j.value("service_name", config.service_name);
    config.log_level = j.value("log_level", config.log_level);
    config.detector_version = j.value("detector_version", config.detector_version);
    config.thread_pool_size = j.value("thread_pool_size", config.thread_pool_size);

    if (j.contains("filters")) {
        const auto& f = j["filters"];
        config.filters.market_hours_only = f.value("market_hours_only", config.filters.market_hours_only);
        config.filters.min_rvol = f.value("min_rvol", config.filters.min_rvol);
        config.filters.max_spread = f.value("max_spread", config.filters.max_spread);
        config.filters.blacklist = f.value("blacklist", config.filters.blacklist);
        config.filters.require_minimum_liquidity = f.value(
            "require_minimum_liquidity", config.filters.require_minimum_liquidity);
        config.filters.min_avg_volume = f.value("min_avg_volume", config.filters.min_avg_volume);
        config.filters.allow_non_regular_hours = f.value(
            "allow_non_regular_hours", config.filters.allow_non_regular_hours);
    }

    if (j.contains("thresholds")) {
        const auto& t = j["thresholds"];
        auto& d = config.default_thresholds;
        d.min_base_score = t.value("min_base_score", d.min_base_score);
        d.min_style_score = t.value("min_style_score", d.min_style_score);
        d.min_risk_reward = t.value("min_risk_reward", d.min_risk_reward);
        d.max_signals_per_symbol_per_hour = t.value(
            "max_signals_per_symbol_per_hour", d.max_signals_per_symbol_per_hour);
        d.cooldown_minutes = t.value("cooldown_minutes", d.cooldown_minutes);
        d.weekend_min_base_score = opt_value<double>(t, "weekend_min_base_score");
        d.weekend_min_style_score = opt_value<double>(t, "weekend_min_style_score");
    }

    if (j.contains("asset_class_thresholds")) {
        config.asset_class_thresholds.clear();
        for (const auto& [name, value] : j["asset_class_thresholds"].items()) {
            auto asset_class = asset_class_from_string(name);
            if (!asset_class) {
                throw std::runtime_error("Unknown asset class in asset_class_thresholds: " + name);
            }
            config.asset_class_thresholds[*asset_class] = overrides_from_json(value);
        }
    }

    if (j.contains("detector_thresholds")) {
        for (const auto& [type, value] : j["detector_thresholds"].items()) {
            config.detector_thresholds[type] = overrides_from_json(value);
        }
    }

    if (j.contains("symbol_asset_classes")) {
        for (const auto& [symbol, value] : j["symbol_asset_classes"].items()) {
            auto asset_class = asset_class_from_string(value.get<std::string>());
            if (!asset_class) {
                throw std::runtime_error("Unknown asset class for symbol " + symbol);
            }
            config.symbol_asset_classes[to_upper(symbol)] = *asset_class;
        }
    }

    auto scope = j.value("rate_cap_scope", std::string("per_detector"));
    if (scope == "per_symbol") {
        config.rate_cap_scope = RateCapScope::PerSymbol;
    } else if (scope != "per_detector") {
        throw std::runtime_error("rate_cap_scope must be per_detector or per_symbol");
    }

    config.bar_interval_minutes = j.value("bar_interval_minutes", config.bar_interval_minutes);
    config.signal_ttl_minutes = j.value("signal_ttl_minutes", config.signal_ttl_minutes);
    config.enable_adaptive_thresholds = j.value("enable_adaptive_thresholds", config.enable_adaptive_thresholds);
    config.disabled_detectors = j.value("disabled_detectors", config.disabled_detectors);

    return config;
}

nlohmann::json ScannerConfig::to_json() const {
    nlohmann::json thresholds = {
        {"min_base_score", default_thresholds.min_base_score},
        {"min_style_score", default_thresholds.min_style_score},
        {"min_risk_reward", default_thresholds.min_risk_reward},
        {"max_signals_per_symbol_per_hour", default_thresholds.max_signals_per_symbol_per_hour},
        {"cooldown_minutes", default_thresholds.cooldown_minutes}
    };
    if (default_thresholds.weekend_min_base_score) {
        thresholds["weekend_min_base_score"] = *default_thresholds.weekend_min_base_score;
    }
    if (default_thresholds.weekend_min_style_score) {
        thresholds["weekend_min_style_score"] = *default_thresholds.weekend_min_style_score;
    }

    nlohmann::json by_class = nlohmann::json::object();
    for (const auto& [asset_class, overrides] : asset_class_thresholds) {
        by_class[to_string(asset_class)] = overrides_to_json(overrides);
    }
    nlohmann::json by_type = nlohmann::json::object();
    for (const auto& [type, overrides] : detector_thresholds) {
        by_type[type] = overrides_to_json(overrides);
    }
    nlohmann::json symbols = nlohmann::json::object();
    for (const auto& [symbol, asset_class] : symbol_asset_classes) {
        symbols[symbol] = to_string(asset_class);
    }

    return {
        {"service_name", service_name},
        {"log_level", log_level},
        {"detector_version", detector_version},
        {"thread_pool_size", thread_pool_size},
        {"filters", {
            {"market_hours_only", filters.market_hours_only},
            {"min_rvol", filters.min_rvol},
            {"max_spread", filters.max_spread},
            {"blacklist", filters.blacklist},
            {"require_minimum_liquidity", filters.require_minimum_liquidity},
            {"min_avg_volume", filters.min_avg_volume},
            {"allow_non_regular_hours", filters.allow_non_regular_hours}
        }},
        {"thresholds", thresholds},
        {"asset_class_thresholds", by_class},
        {"detector_thresholds", by_type},
        {"symbol_asset_classes", symbols},
        {"rate_cap_scope", rate_cap_scope == RateCapScope::PerSymbol ? "per_symbol" : "per_detector"},
        {"bar_interval_minutes", bar_interval_minutes},
        {"signal_ttl_minutes", signal_ttl_minutes},
        {"enable_adaptive_thresholds", enable_adaptive_thresholds},
        {"disabled_detectors", disabled_detectors}
    };
}

void ScannerConfig::validate() const {
    if (filters.min_rvol < 0.0) {
        throw std::runtime_error("filters.min_rvol must not be negative");
    }
    if (filters.max_spread <= 0.0) {
        throw std::runtime_error("filters.max_spread must be positive");
    }
    if (filters.min_avg_volume < 0.0) {
        throw std::runtime_error("filters.min_avg_volume must not be negative");
    }

    validate_score("thresholds.min_base_score", default_thresholds.min_base_score);
    validate_score("thresholds.min_style_score", default_thresholds.min_style_score);
    if (default_thresholds.weekend_min_base_score) {
        validate_score("thresholds.weekend_min_base_score", *default_thresholds.weekend_min_base_score);
    }
    if (default_thresholds.weekend_min_style_score) {
        validate_score("thresholds.weekend_min_style_score", *default_thresholds.weekend_min_style_score);
    }
    if (default_thresholds.min_risk_reward < 0.0) {
        throw std::runtime_error("thresholds.min_risk_reward must not be negative");
    }
    if (default_thresholds.max_signals_per_symbol_per_hour < 1) {
        throw std::runtime_error("thresholds.max_signals_per_symbol_per_hour must be at least 1");
    }
    if (default_thresholds.cooldown_minutes < 0) {
        throw std::runtime_error("thresholds.cooldown_minutes must not be negative");
    }

    for (const auto& [asset_class, overrides] : asset_class_thresholds) {
        validate_overrides("asset_class_thresholds." + to_string(asset_class), overrides);
    }
    for (const auto& [type, overrides] : detector_thresholds) {
        validate_overrides("detector_thresholds." + type, overrides);
    }

    if (bar_interval_minutes < 1 || bar_interval_minutes > 1440) {
        throw std::runtime_error("bar_interval_minutes must be between 1 and 1440");
    }
    if (signal_ttl_minutes < 1) {
        throw std::runtime_error("signal_ttl_minutes must be at least 1");
    }
    if (thread_pool_size < 1 || thread_pool_size > 64) {
        throw std::runtime_error("thread_pool_size must be between 1 and 64");
    }

    spdlog::debug("Scanner configuration validated successfully");
}
