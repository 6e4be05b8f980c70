#include "detectors.hpp"
#include "factors.hpp"

namespace {
    const std::vector<AssetClass> kEquityClasses = {AssetClass::Stock, AssetClass::EquityEtf};

    std::string suffix(Direction direction, const char* long_name, const char* short_name) {
        return direction == Direction::Long ? long_name : short_name;
    }

    OpportunityDetector make_breakout(Direction direction) {
        double sign = direction_sign(direction);
        bool is_long = direction == Direction::Long;

        OpportunityDetector detector;
        detector.type = "breakout_" + suffix(direction, "bullish", "bearish");
        detector.direction = direction;
        detector.asset_classes = kEquityClasses;
        detector.ideal_timeframe = "5m";
        detector.gate = [sign, is_long](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode)) {
                return false;
            }
            if (is_long ? !f.pattern.breakout_bullish : !f.pattern.breakout_bearish) {
                return false;
            }
            auto distance = vwap_distance(f);
            auto rvol = relative_volume(f);
            auto rsi = f.rsi_at(14);
            if (!distance || !rvol || !rsi) {
                return false;
            }
            if (sign * *distance < 0.2 || *rvol < 1.5) {
                return false;
            }
            return is_long ? (*rsi >= 50.0 && *rsi <= 80.0) : (*rsi >= 20.0 && *rsi <= 50.0);
        };
        detector.score_factors = {
            volume_factor("volume_surge", 0.30),
            vwap_position_factor(0.20, direction),
            rsi_momentum_factor(0.20, direction),
            regime_factor(0.15, {100, 40, 20, 70}),
            flow_confirmation_factor(0.15, direction)
        };
        return detector;
    }

    OpportunityDetector make_mean_reversion(Direction direction) {
        double sign = direction_sign(direction);
        bool is_long = direction == Direction::Long;

        OpportunityDetector detector;
        detector.type = "mean_reversion_" + suffix(direction, "long", "short");
        detector.direction = direction;
        detector.asset_classes = kEquityClasses;
        detector.ideal_timeframe = "5m";
        detector.gate = [sign, is_long](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode)) {
                return false;
            }
            auto rsi = f.rsi_at(14);
            auto distance = vwap_distance(f);
            if (!rsi || !distance) {
                return false;
            }
            if (is_long ? *rsi > 30.0 : *rsi < 70.0) {
                return false;
            }
            if (-sign * *distance < 1.0) {
                return false;
            }
            // Fading a trend is not a reversion
            if (f.pattern.market_regime == MarketRegime::Trending) {
                return false;
            }
            auto rvol = relative_volume(f);
            return !rvol || *rvol >= 0.8;
        };
        detector.score_factors = {
            rsi_extreme_factor(0.30, direction),
            vwap_stretch_factor(0.25, direction),
            divergence_factor(0.20, direction),
            volume_factor("volume_confirmation", 0.10),
            regime_factor(0.15, {10, 100, 70, 50})
        };
        return detector;
    }

    OpportunityDetector make_trend_continuation(Direction direction) {
        double sign = direction_sign(direction);
        bool is_long = direction == Direction::Long;

        OpportunityDetector detector;
        detector.type = "trend_continuation_" + suffix(direction, "long", "short");
        detector.direction = direction;
        detector.asset_classes = kEquityClasses;
        detector.ideal_timeframe = "15m";
        detector.gate = [sign, is_long](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode)) {
                return false;
            }
            auto fast = f.ema_at(8);
            auto slow = f.ema_at(21);
            auto rsi = f.rsi_at(14);
            auto distance = vwap_distance(f);
            if (!fast || !slow || !rsi || !distance) {
                return false;
            }
            if (sign * (*fast - *slow) <= 0.0 || sign * (f.price.current - *slow) <= 0.0) {
                return false;
            }
            if (sign * *distance < 0.0) {
                return false;
            }
            if (f.pattern.market_regime == MarketRegime::Choppy) {
                return false;
            }
            return is_long ? (*rsi >= 50.0 && *rsi <= 70.0) : (*rsi >= 30.0 && *rsi <= 50.0);
        };
        detector.score_factors = {
            ema_alignment_factor(0.30, direction),
            mtf_alignment_factor(0.20, direction),
            rsi_momentum_factor(0.20, direction),
            vwap_position_factor(0.15, direction),
            volume_factor("volume_confirmation", 0.15)
        };
        return detector;
    }
}

std::vector<OpportunityDetector> make_equity_detectors() {
    return {
        make_breakout(Direction::Long),
        make_breakout(Direction::Short),
        make_mean_reversion(Direction::Long),
        make_mean_reversion(Direction::Short),
        make_trend_continuation(Direction::Long),
        make_trend_continuation(Direction::Short)
    };
}
