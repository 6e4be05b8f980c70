#include "detectors.hpp"
#include "factors.hpp"
#include <algorithm>
#include <cmath>

namespace {
    const std::vector<AssetClass> kAllClasses = {AssetClass::Index, AssetClass::EquityEtf, AssetClass::Stock};

    std::string suffix(Direction direction) {
        return direction == Direction::Long ? "_long" : "_short";
    }

    bool near_level(double price, double level, double tolerance_pct) {
        return level > 0.0 && std::abs(price - level) / level * 100.0 <= tolerance_pct;
    }

    // The four factors every KCU setup shares, plus one setup-specific session curve
    std::vector<ScoreFactor> kcu_factors(Direction direction, std::initializer_list<std::pair<double, double>> timing) {
        std::vector<std::pair<double, double>> curve(timing);
        return {
            {"level_confluence", 0.25, [](const FeatureSnapshot& f, const OptionsChainData*) {
                int levels = levels_near_price(f, 0.3);
                return interpolate(levels, {{0, 30}, {1, 55}, {2, 75}, {3, 90}, {4, 100}});
            }},
            {"trend_strength", 0.25, [direction](const FeatureSnapshot& f, const OptionsChainData*) {
                return 0.5 * ema_alignment_score(f, direction) + 0.5 * mtf_alignment_score(f, direction);
            }},
            {"patience_candle", 0.20, [](const FeatureSnapshot& f, const OptionsChainData*) {
                return f.pattern.patience_candle ? 90.0 : 40.0;
            }},
            volume_factor("volume_confirmation", 0.20),
            {"session_timing", 0.10, [curve](const FeatureSnapshot& f, const OptionsChainData*) {
                if (!f.session.minutes_since_open) {
                    return 50.0;
                }
                return interpolate(*f.session.minutes_since_open, curve);
            }}
        };
    }

    bool emas_stacked(const FeatureSnapshot& f, double sign) {
        auto fast = f.ema_at(8);
        auto slow = f.ema_at(21);
        return fast && slow && sign * (*fast - *slow) > 0.0 && sign * (f.price.current - *slow) > 0.0;
    }

    bool past_minute(const FeatureSnapshot& f, int minute) {
        return !f.session.minutes_since_open || *f.session.minutes_since_open >= minute;
    }

    OpportunityDetector make_ema_bounce(Direction direction) {
        double sign = direction_sign(direction);
        bool is_long = direction == Direction::Long;

        OpportunityDetector detector;
        detector.type = "kcu_ema_bounce" + suffix(direction);
        detector.direction = direction;
        detector.asset_classes = kAllClasses;
        detector.ideal_timeframe = "5m";
        detector.gate = [sign, is_long](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode) || !past_minute(f, 15)) {
                return false;
            }
            if (!emas_stacked(f, sign)) {
                return false;
            }
            // Pulled back into the fast EMA
            if (!near_level(f.price.current, *f.ema_at(8), 0.3)) {
                return false;
            }
            auto rsi = f.rsi_at(14);
            if (!rsi) {
                return false;
            }
            return is_long ? (*rsi >= 40.0 && *rsi <= 70.0) : (*rsi >= 30.0 && *rsi <= 60.0);
        };
        detector.score_factors = kcu_factors(direction, {{15, 60}, {30, 90}, {90, 100}, {150, 70}, {240, 65}, {330, 85}, {390, 50}});
        return detector;
    }

    OpportunityDetector make_vwap_standard(Direction direction) {
        double sign = direction_sign(direction);

        OpportunityDetector detector;
        detector.type = "kcu_vwap_standard" + suffix(direction);
        detector.direction = direction;
        detector.asset_classes = kAllClasses;
        detector.ideal_timeframe = "5m";
        detector.gate = [sign](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode) || !past_minute(f, 30)) {
                return false;
            }
            auto distance = vwap_distance(f);
            if (!distance) {
                return false;
            }
            // Holding VWAP from the trade side, no more than 0.3% away
            double held = sign * *distance;
            if (held < 0.0 || held > 0.3) {
                return false;
            }
            if (!emas_stacked(f, sign)) {
                return false;
            }
            auto rvol = relative_volume(f);
            return !rvol || *rvol >= 0.8;
        };
        detector.score_factors = kcu_factors(direction, {{30, 80}, {60, 100}, {120, 85}, {180, 60}, {300, 75}, {390, 50}});
        return detector;
    }

    // King = VWAP, queen = 21 EMA; trade the retest when both sit together
    OpportunityDetector make_king_queen(Direction direction) {
        double sign = direction_sign(direction);

        OpportunityDetector detector;
        detector.type = "kcu_king_queen" + suffix(direction);
        detector.direction = direction;
        detector.asset_classes = kAllClasses;
        detector.ideal_timeframe = "5m";
        detector.gate = [sign](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode) || !past_minute(f, 15)) {
                return false;
            }
            auto king = f.vwap.value;
            auto queen = f.ema_at(21);
            if (!king || !queen || *king <= 0.0 || *queen <= 0.0) {
                return false;
            }
            double price = f.price.current;
            if (std::abs(*king - *queen) / price * 100.0 > 0.25) {
                return false;
            }
            if (!near_level(price, *king, 0.3) || !near_level(price, *queen, 0.3)) {
                return false;
            }
            double edge = sign > 0 ? std::max(*king, *queen) : std::min(*king, *queen);
            if (sign * (price - edge) < 0.0) {
                return false;
            }
            auto fast = f.ema_at(8);
            return !fast || sign * (*fast - *queen) >= 0.0;
        };
        detector.score_factors = kcu_factors(direction, {{15, 70}, {45, 100}, {120, 85}, {210, 60}, {330, 80}, {390, 50}});
        return detector;
    }

    OpportunityDetector make_orb_breakout(Direction direction) {
        bool is_long = direction == Direction::Long;

        OpportunityDetector detector;
        detector.type = "kcu_orb_breakout" + suffix(direction);
        detector.direction = direction;
        detector.asset_classes = kAllClasses;
        detector.ideal_timeframe = "5m";
        detector.gate = [is_long](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode)) {
                return false;
            }
            auto high = f.pattern.orb_high;
            auto low = f.pattern.orb_low;
            auto minutes = f.session.minutes_since_open;
            if (!high || !low || *high <= *low || !minutes || *minutes < 15) {
                return false;
            }
            double price = f.price.current;
            bool broke = is_long ? price > *high * 1.001 : price < *low * 0.999;
            if (!broke) {
                return false;
            }
            // Range must be tradeable: between half and two and a half ATRs
            double range = *high - *low;
            double atr = atr_estimate(f);
            if (range < 0.5 * atr || range > 2.5 * atr) {
                return false;
            }
            auto rvol = relative_volume(f);
            return rvol && *rvol >= 0.8;
        };
        detector.score_factors = kcu_factors(direction, {{15, 100}, {30, 95}, {60, 80}, {90, 60}, {120, 40}, {390, 20}});
        return detector;
    }
}

std::vector<OpportunityDetector> make_kcu_detectors() {
    return {
        make_ema_bounce(Direction::Long),
        make_ema_bounce(Direction::Short),
        make_vwap_standard(Direction::Long),
        make_vwap_standard(Direction::Short),
        make_king_queen(Direction::Long),
        make_king_queen(Direction::Short),
        make_orb_breakout(Direction::Long),
        make_orb_breakout(Direction::Short)
    };
}
