#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

enum class RateCapScope {
    PerDetector,
    PerSymbol
};

struct UniversalFilters {
    bool market_hours_only = true;
    double min_rvol = 0.0;
    double max_spread = 0.005;          // fraction of price
    std::vector<std::string> blacklist;
    bool require_minimum_liquidity = false;
    double min_avg_volume = 0.0;
    bool allow_non_regular_hours = false;
};

struct SignalThresholds {
    double min_base_score = 70.0;
    double min_style_score = 75.0;
    double min_risk_reward = 1.5;
    int max_signals_per_symbol_per_hour = 2;
    int cooldown_minutes = 15;

    // Used instead of the regular minimums for non-regular-hours historical scans
    std::optional<double> weekend_min_base_score;
    std::optional<double> weekend_min_style_score;
};

// Partial overrides layered on top of the default thresholds
struct ThresholdOverrides {
    std::optional<double> min_base_score;
    std::optional<double> min_style_score;
    std::optional<double> min_risk_reward;
    std::optional<int> max_signals_per_symbol_per_hour;
    std::optional<int> cooldown_minutes;

    void apply_to(SignalThresholds& thresholds) const;
};

struct ScannerConfig {
    // Service configuration
    std::string service_name = "composite_scanner";
    std::string log_level = "info";
    std::string detector_version = "1.0.0";
    int thread_pool_size = 4;

    UniversalFilters filters;
    SignalThresholds default_thresholds;
    std::map<AssetClass, ThresholdOverrides> asset_class_thresholds = {
        {AssetClass::Index, ThresholdOverrides{75.0, 78.0, 1.8, std::nullopt, 20}}
    };
    std::map<std::string, ThresholdOverrides> detector_thresholds;

    RateCapScope rate_cap_scope = RateCapScope::PerDetector;
    int bar_interval_minutes = 1;
    int signal_ttl_minutes = 5;
    bool enable_adaptive_thresholds = false;

    std::vector<std::string> disabled_detectors;
    std::map<std::string, AssetClass> symbol_asset_classes;

    // Effective thresholds: defaults, then asset class, then detector type
    SignalThresholds thresholds_for(AssetClass asset_class, const std::string& detector_type) const;

    AssetClass asset_class_for(const std::string& symbol) const;

    bool is_blacklisted(const std::string& symbol) const;

    // Longest cooldown across defaults and overrides
    std::chrono::minutes max_cooldown() const;

    // History the dedup store must keep: longest cooldown, one bar, and the hourly cap window
    std::chrono::minutes dedup_retention() const;

    // Load from environment variables
    void load_from_env();

    // Load from a JSON file
    void load(const std::string& path);

    // High-selectivity preset: stricter minimums, one signal per hour, per-strategy overrides
    static ScannerConfig optimized();

    // "profile": "optimized" starts from optimized() instead of the defaults
    static ScannerConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Throws std::runtime_error on invalid values
    void validate() const;
};
