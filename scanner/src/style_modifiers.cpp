#include "style_modifiers.hpp"
#include "factors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

namespace {
    constexpr int kSessionMinutes = 390;

    struct Triple {
        double scalp;
        double day_trade;
        double swing;
    };

    Triple window_modifiers(TimeWindow window) {
        switch (window) {
            case TimeWindow::PreMarket:      return {0.60, 0.70, 0.90};
            case TimeWindow::OpeningDrive:   return {1.35, 1.15, 0.75};
            case TimeWindow::MidMorning:     return {1.10, 1.15, 1.00};
            case TimeWindow::LateMorning:    return {1.00, 1.10, 1.05};
            case TimeWindow::LunchChop:      return {0.55, 0.75, 1.00};
            case TimeWindow::EarlyAfternoon: return {0.85, 1.00, 1.05};
            case TimeWindow::Afternoon:      return {0.95, 1.10, 1.00};
            case TimeWindow::PowerHour:      return {1.25, 1.20, 0.85};
            case TimeWindow::AfterHours:     return {0.50, 0.60, 0.90};
        }
        return {1.0, 1.0, 1.0};
    }

    Triple regime_modifiers(MarketRegime regime) {
        switch (regime) {
            case MarketRegime::Trending: return {1.00, 1.15, 1.25};
            case MarketRegime::Ranging:  return {1.10, 1.00, 0.85};
            case MarketRegime::Choppy:   return {0.65, 0.75, 0.55};
            case MarketRegime::Volatile: return {0.85, 1.10, 1.20};
        }
        return {1.0, 1.0, 1.0};
    }

    void scale(StyleModifiers& m, const Triple& t) {
        m.scalp *= t.scalp;
        m.day_trade *= t.day_trade;
        m.swing *= t.swing;
    }

    struct StyleProfile {
        double stop_atr;
        double target_atr[3];
    };

    StyleProfile profile_for(TradingStyle style) {
        switch (style) {
            case TradingStyle::Scalp:    return {0.75, {1.0, 1.5, 2.0}};
            case TradingStyle::DayTrade: return {1.0, {1.5, 2.5, 3.5}};
            case TradingStyle::Swing:    return {1.5, {2.0, 3.0, 4.0}};
        }
        return {1.0, {1.5, 2.5, 3.5}};
    }

    double risk_atr(const FeatureSnapshot& f) {
        auto atr = f.atr_at(14);
        if (atr && *atr > 0.0) {
            return *atr;
        }
        auto it = f.mtf.find("5m");
        if (it != f.mtf.end() && it->second.atr && *it->second.atr > 0.0) {
            return *it->second.atr;
        }
        return 2.0;
    }
}

StyleFactors extract_style_factors(const FeatureSnapshot& features, Direction direction, AnalysisMode mode) {
    StyleFactors factors;
    factors.window = time_window_for(features);
    factors.planning = mode == AnalysisMode::Historical && features.session.is_regular_hours == false;
    factors.regime = features.pattern.market_regime;
    factors.relative_volume = relative_volume(features);
    factors.rsi = features.rsi_at(14);
    factors.mtf_alignment = mtf_alignment_score(features, direction);

    auto atr = features.atr_at(14);
    if (atr && *atr > 0.0 && features.price.current > 0.0) {
        factors.atr_percent = *atr / features.price.current * 100.0;
    }

    auto distance = vwap_distance(features);
    factors.near_key_level = (distance && std::abs(*distance) < 0.25) || levels_near_price(features, 0.25) > 0;

    if (features.session.minutes_since_open && features.session.is_regular_hours != false) {
        factors.minutes_to_close = kSessionMinutes - *features.session.minutes_since_open;
    }
    return factors;
}

StyleModifiers calculate_style_modifiers(const StyleFactors& factors) {
    StyleModifiers m;

    if (factors.planning) {
        scale(m, {0.40, 0.50, 1.20});
    } else if (factors.window) {
        scale(m, window_modifiers(*factors.window));
    }

    if (factors.atr_percent) {
        double atr = *factors.atr_percent;
        if (atr > 2.5) {
            scale(m, {0.70, 1.05, 1.25});
            m.warnings.push_back("High ATR - scalp stops likely too tight");
        } else if (atr > 1.5) {
            scale(m, {0.90, 1.10, 1.15});
        } else if (atr < 0.5) {
            scale(m, {1.15, 0.85, 0.65});
            m.warnings.push_back("Low ATR - limited swing range");
        } else if (atr < 1.0) {
            scale(m, {1.10, 0.95, 0.80});
        }
    }

    if (factors.relative_volume) {
        double rvol = *factors.relative_volume;
        if (rvol > 1.5) {
            scale(m, {1.30, 1.15, 1.00});
        } else if (rvol < 0.5) {
            scale(m, {0.60, 0.75, 0.95});
            m.warnings.push_back("Very low volume - fills may be poor");
        } else if (rvol < 0.75) {
            scale(m, {0.80, 0.90, 0.98});
        }
    }

    if (factors.near_key_level) {
        scale(m, {1.25, 1.15, 1.10});
    }

    if (factors.rsi && (*factors.rsi < 30.0 || *factors.rsi > 70.0)) {
        scale(m, {0.85, 1.10, 1.25});
    }

    if (factors.mtf_alignment > 80.0) {
        scale(m, {1.05, 1.15, 1.30});
    } else if (factors.mtf_alignment > 60.0) {
        scale(m, {1.00, 1.05, 1.10});
    } else if (factors.mtf_alignment < 40.0) {
        scale(m, {1.00, 0.80, 0.60});
        m.warnings.push_back("Poor MTF alignment - avoid swing trades");
    }

    if (factors.regime) {
        scale(m, regime_modifiers(*factors.regime));
        if (*factors.regime == MarketRegime::Choppy) {
            m.warnings.push_back("Choppy regime - reduce position sizes");
        }
    }

    if (!factors.planning && factors.window == TimeWindow::PreMarket) {
        scale(m, {0.50, 0.60, 0.85});
        m.warnings.push_back("Pre-market - liquidity may be thin");
    }
    if (!factors.planning && factors.window == TimeWindow::AfterHours) {
        scale(m, {0.40, 0.50, 0.80});
        m.warnings.push_back("After-hours - limited liquidity");
    }

    if (factors.minutes_to_close && !factors.planning && factors.window != TimeWindow::AfterHours) {
        if (*factors.minutes_to_close < 30) {
            scale(m, {1.10, 0.60, 1.00});
        } else if (*factors.minutes_to_close < 60) {
            scale(m, {1.00, 0.85, 1.00});
        }
    }

    m.scalp = std::clamp(m.scalp, 0.5, 1.5);
    m.day_trade = std::clamp(m.day_trade, 0.5, 1.5);
    m.swing = std::clamp(m.swing, 0.5, 1.5);
    return m;
}

StyleScores apply_style_modifiers(double base_score, const StyleModifiers& modifiers) {
    StyleScores scores;
    scores.scalp = clamp_score(base_score * modifiers.scalp);
    scores.day_trade = clamp_score(base_score * modifiers.day_trade);
    scores.swing = clamp_score(base_score * modifiers.swing);

    // Ties go to day trade, then scalp
    scores.recommended = TradingStyle::DayTrade;
    scores.recommended_score = scores.day_trade;
    if (scores.scalp > scores.recommended_score) {
        scores.recommended = TradingStyle::Scalp;
        scores.recommended_score = scores.scalp;
    }
    if (scores.swing > scores.recommended_score) {
        scores.recommended = TradingStyle::Swing;
        scores.recommended_score = scores.swing;
    }
    return scores;
}

RiskReward calculate_risk_reward(const FeatureSnapshot& features, Direction direction, TradingStyle style) {
    StyleProfile profile = profile_for(style);
    double atr = risk_atr(features);
    double sign = direction_sign(direction);

    RiskReward rr;
    rr.entry = features.price.current;
    rr.stop = rr.entry - sign * profile.stop_atr * atr;
    rr.target1 = rr.entry + sign * profile.target_atr[0] * atr;
    rr.target2 = rr.entry + sign * profile.target_atr[1] * atr;
    rr.target3 = rr.entry + sign * profile.target_atr[2] * atr;

    double risk = std::abs(rr.entry - rr.stop);
    rr.ratio = risk > 0.0 ? std::abs(rr.target2 - rr.entry) / risk : 0.0;
    return rr;
}
