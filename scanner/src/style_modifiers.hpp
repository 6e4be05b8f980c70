#pragma once

#include "types.hpp"
#include "thresholds.hpp"
#include <optional>
#include <string>
#include <vector>

// Market context that decides which trading style suits a setup
struct StyleFactors {
    std::optional<TimeWindow> window;
    bool planning = false;                  // non-regular-hours historical review
    std::optional<MarketRegime> regime;
    std::optional<double> atr_percent;
    std::optional<double> relative_volume;
    bool near_key_level = false;
    std::optional<double> rsi;
    double mtf_alignment = 50.0;
    std::optional<int> minutes_to_close;
};

struct StyleModifiers {
    double scalp = 1.0;
    double day_trade = 1.0;
    double swing = 1.0;
    std::vector<std::string> warnings;
};

StyleFactors extract_style_factors(const FeatureSnapshot& features, Direction direction, AnalysisMode mode);

// Multipliers per style, each clamped to [0.5, 1.5]
StyleModifiers calculate_style_modifiers(const StyleFactors& factors);

// Base score times each modifier, clamped to [0, 100]; recommends the highest
StyleScores apply_style_modifiers(double base_score, const StyleModifiers& modifiers);

// ATR-based stop and three targets for the style; ratio is target2 over stop distance
RiskReward calculate_risk_reward(const FeatureSnapshot& features, Direction direction, TradingStyle style);
