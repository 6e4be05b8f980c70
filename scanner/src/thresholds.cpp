#include "thresholds.hpp"
#include <algorithm>
#include <cmath>
#include <vector>
#include <fmt/format.h>

namespace {
    struct WindowThresholds {
        double min_base;
        double min_style;
        double min_rr;
        double size;
    };

    struct VixAdjustment {
        double base;
        double style;
        double rr;
        double size;
    };

    struct RegimeStrategy {
        double min_base;
        double min_rr;
        bool enabled;
    };

    WindowThresholds window_thresholds(TimeWindow window) {
        switch (window) {
            case TimeWindow::PreMarket: return {80, 82, 2.0, 0.5};
            case TimeWindow::OpeningDrive: return {65, 70, 1.2, 1.0};
            case TimeWindow::MidMorning: return {72, 75, 1.5, 1.0};
            case TimeWindow::LateMorning: return {75, 78, 1.6, 0.9};
            case TimeWindow::LunchChop: return {85, 88, 2.2, 0.6};
            case TimeWindow::EarlyAfternoon: return {72, 75, 1.5, 0.9};
            case TimeWindow::Afternoon: return {70, 73, 1.4, 1.0};
            case TimeWindow::PowerHour: return {68, 72, 1.3, 1.1};
            case TimeWindow::AfterHours: return {85, 88, 2.5, 0.3};
        }
        return {75, 78, 1.5, 0.5};
    }

    VixAdjustment vix_adjustment(VixLevel level) {
        switch (level) {
            case VixLevel::Low: return {-5, -3, -0.2, 1.2};
            case VixLevel::Medium: return {0, 0, 0.0, 1.0};
            case VixLevel::High: return {5, 5, 0.3, 0.7};
            case VixLevel::Extreme: return {15, 12, 0.7, 0.4};
        }
        return {0, 0, 0.0, 1.0};
    }

    RegimeStrategy regime_strategy(MarketRegime regime, StrategyCategory category) {
        switch (regime) {
            case MarketRegime::Trending:
                switch (category) {
                    case StrategyCategory::Breakout: return {65, 1.3, true};
                    case StrategyCategory::MeanReversion: return {85, 2.0, false};
                    case StrategyCategory::TrendContinuation: return {60, 1.2, true};
                    case StrategyCategory::Gamma: return {70, 1.5, true};
                    case StrategyCategory::Reversal: return {88, 2.2, false};
                }
                break;
            case MarketRegime::Ranging:
                switch (category) {
                    case StrategyCategory::Breakout: return {85, 2.0, false};
                    case StrategyCategory::MeanReversion: return {65, 1.3, true};
                    case StrategyCategory::TrendContinuation: return {80, 1.8, false};
                    case StrategyCategory::Gamma: return {72, 1.5, true};
                    case StrategyCategory::Reversal: return {70, 1.4, true};
                }
                break;
            case MarketRegime::Choppy:
                switch (category) {
                    case StrategyCategory::Breakout: return {92, 2.5, false};
                    case StrategyCategory::MeanReversion: return {78, 1.5, true};
                    case StrategyCategory::TrendContinuation: return {88, 2.2, false};
                    case StrategyCategory::Gamma: return {82, 1.8, true};
                    case StrategyCategory::Reversal: return {75, 1.5, true};
                }
                break;
            case MarketRegime::Volatile:
                switch (category) {
                    case StrategyCategory::Breakout: return {85, 2.0, true};
                    case StrategyCategory::MeanReversion: return {80, 1.8, true};
                    case StrategyCategory::TrendContinuation: return {82, 2.0, true};
                    case StrategyCategory::Gamma: return {78, 1.6, true};
                    case StrategyCategory::Reversal: return {72, 1.4, true};
                }
                break;
        }
        return {70, 1.5, true};
    }

    bool contains(const std::string& haystack, const char* needle) {
        return haystack.find(needle) != std::string::npos;
    }

    const std::vector<std::string> tier_1_strategies = {
        "breakout_bullish", "breakout_bearish",
        "mean_reversion_long", "mean_reversion_short",
        "trend_continuation_long", "trend_continuation_short"
    };

    const std::vector<std::string> tier_2_strategies = {
        "gamma_squeeze_bullish", "gamma_squeeze_bearish",
        "index_mean_reversion_long", "index_mean_reversion_short",
        "power_hour_reversal_bullish", "power_hour_reversal_bearish"
    };

    const std::vector<std::string> tier_3_strategies = {
        "gamma_flip_bullish", "gamma_flip_bearish",
        "eod_pin_setup",
        "opening_drive_bullish", "opening_drive_bearish"
    };

    bool listed(const std::vector<std::string>& types, const std::string& type) {
        return std::find(types.begin(), types.end(), type) != types.end();
    }

    // Strategies each VIX band admits
    bool allowed_by_vix(const std::string& band, const std::string& type) {
        if (band == "low") {
            return type == "trend_continuation_long" || type == "trend_continuation_short"
                || type == "breakout_bullish" || type == "breakout_bearish";
        }
        if (band == "elevated") {
            return type == "mean_reversion_long" || type == "mean_reversion_short"
                || type == "gamma_squeeze_bullish" || type == "gamma_squeeze_bearish";
        }
        if (band == "high") {
            return type == "mean_reversion_long" || type == "index_mean_reversion_long";
        }
        return listed(tier_1_strategies, type) || listed(tier_2_strategies, type);
    }

    bool outside(int minutes, int from, int to) {
        return minutes < from || minutes > to;
    }
}

std::string to_string(TimeWindow window) {
    switch (window) {
        case TimeWindow::PreMarket: return "pre_market";
        case TimeWindow::OpeningDrive: return "opening_drive";
        case TimeWindow::MidMorning: return "mid_morning";
        case TimeWindow::LateMorning: return "late_morning";
        case TimeWindow::LunchChop: return "lunch_chop";
        case TimeWindow::EarlyAfternoon: return "early_afternoon";
        case TimeWindow::Afternoon: return "afternoon";
        case TimeWindow::PowerHour: return "power_hour";
        case TimeWindow::AfterHours: return "after_hours";
    }
    return "after_hours";
}

std::string to_string(StrategyCategory category) {
    switch (category) {
        case StrategyCategory::Breakout: return "breakout";
        case StrategyCategory::MeanReversion: return "mean_reversion";
        case StrategyCategory::TrendContinuation: return "trend_continuation";
        case StrategyCategory::Gamma: return "gamma";
        case StrategyCategory::Reversal: return "reversal";
    }
    return "breakout";
}

std::optional<TimeWindow> time_window_for(const FeatureSnapshot& features) {
    auto minutes = features.session.minutes_since_open;
    if (!minutes) {
        if (features.session.is_regular_hours == false) {
            return TimeWindow::AfterHours;
        }
        return std::nullopt;
    }

    int m = *minutes;
    if (m < 0) return TimeWindow::PreMarket;
    if (m < 30) return TimeWindow::OpeningDrive;
    if (m < 90) return TimeWindow::MidMorning;
    if (m < 120) return TimeWindow::LateMorning;
    if (m < 240) return TimeWindow::LunchChop;
    if (m < 300) return TimeWindow::EarlyAfternoon;
    if (m < 330) return TimeWindow::Afternoon;
    if (m < 390) return TimeWindow::PowerHour;
    return TimeWindow::AfterHours;
}

StrategyCategory categorize_strategy(const std::string& detector_type) {
    if (contains(detector_type, "breakout")) {
        return StrategyCategory::Breakout;
    }
    if (contains(detector_type, "reversion")) {
        return StrategyCategory::MeanReversion;
    }
    if (contains(detector_type, "continuation") || contains(detector_type, "ema_bounce")
        || contains(detector_type, "vwap_standard") || contains(detector_type, "king_queen")) {
        return StrategyCategory::TrendContinuation;
    }
    if (contains(detector_type, "gamma") || contains(detector_type, "pin")) {
        return StrategyCategory::Gamma;
    }
    if (contains(detector_type, "reversal")) {
        return StrategyCategory::Reversal;
    }
    // Opening drives and flow momentum trade like breakouts
    return StrategyCategory::Breakout;
}

AdaptiveThresholds get_adaptive_thresholds(
    std::optional<TimeWindow> window,
    std::optional<VixLevel> vix,
    std::optional<MarketRegime> regime,
    StrategyCategory category
) {
    AdaptiveThresholds result;
    result.window = window;
    result.category = category;

    // Conservative defaults outside a known session window
    WindowThresholds base = window ? window_thresholds(*window) : WindowThresholds{75, 78, 1.5, 0.5};
    VixAdjustment adj = vix_adjustment(vix.value_or(VixLevel::Medium));

    double regime_base = base.min_base;
    double regime_rr = base.min_rr;
    if (regime) {
        auto strategy = regime_strategy(*regime, category);
        regime_base = strategy.min_base;
        regime_rr = strategy.min_rr;
        result.strategy_enabled = strategy.enabled;
    }

    double final_base = std::max(base.min_base + adj.base,
                                 result.strategy_enabled ? regime_base : regime_base + 10.0);
    double final_rr = std::max(base.min_rr + adj.rr, regime_rr);

    result.min_base_score = std::round(final_base);
    result.min_style_score = std::round(base.min_style + adj.style);
    result.min_risk_reward = std::round(final_rr * 10.0) / 10.0;
    result.size_multiplier = std::round(base.size * adj.size * 100.0) / 100.0;
    return result;
}

AdaptiveThresholds get_adaptive_thresholds(const FeatureSnapshot& features, const std::string& detector_type) {
    return get_adaptive_thresholds(
        time_window_for(features),
        features.pattern.vix_level,
        features.pattern.market_regime,
        categorize_strategy(detector_type)
    );
}

SignalThresholds weekend_thresholds(const SignalThresholds& base) {
    SignalThresholds thresholds = base;
    thresholds.min_base_score = base.weekend_min_base_score.value_or(60.0);
    thresholds.min_style_score = base.weekend_min_style_score.value_or(65.0);
    thresholds.min_risk_reward = std::min(base.min_risk_reward, 1.3);
    return thresholds;
}

SignalThresholds tighten(const SignalThresholds& base, const AdaptiveThresholds& adaptive) {
    SignalThresholds thresholds = base;
    thresholds.min_base_score = std::max(base.min_base_score, adaptive.min_base_score);
    thresholds.min_style_score = std::max(base.min_style_score, adaptive.min_style_score);
    thresholds.min_risk_reward = std::max(base.min_risk_reward, adaptive.min_risk_reward);
    return thresholds;
}

int strategy_tier(const std::string& detector_type) {
    if (listed(tier_1_strategies, detector_type)) {
        return 1;
    }
    if (listed(tier_3_strategies, detector_type)) {
        return 3;
    }
    return 2;
}

RegimePermission strategy_allowed_in_regime(
    const std::string& detector_type,
    double vix,
    int minutes_since_open,
    double trend_strength
) {
    RegimePermission result;

    std::string band = "normal";
    if (vix < 15.0) {
        band = "low";
    } else if (vix >= 35.0) {
        band = "high";
    } else if (vix >= 25.0) {
        band = "elevated";
    }
    if (!allowed_by_vix(band, detector_type)) {
        result.allowed = false;
        result.reason = fmt::format("Strategy not suitable for {} VIX regime", band);
        return result;
    }

    if (contains(detector_type, "opening_drive") && outside(minutes_since_open, 0, 60)) {
        result.allowed = false;
        result.reason = "Opening drive only valid in first hour";
        return result;
    }
    if (contains(detector_type, "power_hour") && outside(minutes_since_open, 330, 390)) {
        result.allowed = false;
        result.reason = "Power hour reversal only valid in last hour";
        return result;
    }
    if (contains(detector_type, "eod_pin") && outside(minutes_since_open, 360, 390)) {
        result.allowed = false;
        result.reason = "EOD pin setup only valid in last 30 minutes";
        return result;
    }

    bool bullish = contains(detector_type, "bullish") || contains(detector_type, "long");
    bool bearish = contains(detector_type, "bearish") || contains(detector_type, "short");
    if (bullish && trend_strength < -30.0) {
        result.allowed = false;
        result.reason = "Strong downtrend, bullish trades not advised";
        return result;
    }
    if (bearish && trend_strength > 30.0) {
        result.allowed = false;
        result.reason = "Strong uptrend, bearish trades not advised";
        return result;
    }
    return result;
}
