#pragma once

#include "types.hpp"
#include "config.hpp"
#include <optional>
#include <string>

enum class TimeWindow {
    PreMarket,
    OpeningDrive,
    MidMorning,
    LateMorning,
    LunchChop,
    EarlyAfternoon,
    Afternoon,
    PowerHour,
    AfterHours
};

enum class StrategyCategory {
    Breakout,
    MeanReversion,
    TrendContinuation,
    Gamma,
    Reversal
};

std::string to_string(TimeWindow window);
std::string to_string(StrategyCategory category);

// Session window from minutes since the 9:30 ET open; nullopt when the session is unknown
std::optional<TimeWindow> time_window_for(const FeatureSnapshot& features);

StrategyCategory categorize_strategy(const std::string& detector_type);

struct AdaptiveThresholds {
    double min_base_score = 75.0;
    double min_style_score = 78.0;
    double min_risk_reward = 1.5;
    double size_multiplier = 0.5;
    bool strategy_enabled = true;
    std::optional<TimeWindow> window;
    StrategyCategory category = StrategyCategory::Breakout;
};

// Combines the time-of-day window, VIX level and regime/strategy table
AdaptiveThresholds get_adaptive_thresholds(
    std::optional<TimeWindow> window,
    std::optional<VixLevel> vix,
    std::optional<MarketRegime> regime,
    StrategyCategory category
);

AdaptiveThresholds get_adaptive_thresholds(const FeatureSnapshot& features, const std::string& detector_type);

// Planning thresholds for non-regular-hours analysis
SignalThresholds weekend_thresholds(const SignalThresholds& base);

// Raise the configured minimums to the adaptive ones where those are stricter
SignalThresholds tighten(const SignalThresholds& base, const AdaptiveThresholds& adaptive);

// Strategy quality tier used by the optimized profile: 1 proven, 2 index, 3 exotic.
// Types outside the three lists count as tier 2.
int strategy_tier(const std::string& detector_type);

struct RegimePermission {
    bool allowed = true;
    std::string reason;
};

// Optimized-profile gate on the VIX value, session minute and trend strength (-100..100)
RegimePermission strategy_allowed_in_regime(
    const std::string& detector_type,
    double vix,
    int minutes_since_open,
    double trend_strength
);
