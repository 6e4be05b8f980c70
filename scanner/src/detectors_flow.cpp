#include "detectors.hpp"
#include "factors.hpp"
#include <algorithm>

namespace {
    const std::vector<AssetClass> kAllClasses = {AssetClass::Index, AssetClass::EquityEtf, AssetClass::Stock};

    // Directional pressure: buy pressure for longs, sell pressure for shorts
    double directional_pressure(const FlowAggregates& flow, bool is_long) {
        if (!flow.buy_pressure) {
            return 50.0;
        }
        return is_long ? *flow.buy_pressure : 100.0 - *flow.buy_pressure;
    }

    ScoreFactor sweep_intensity_factor(double weight) {
        return {"sweep_intensity", weight, [](const FeatureSnapshot& f, const OptionsChainData*) {
            if (!f.flow) {
                return 0.0;
            }
            return interpolate(f.flow->sweep_count, {{0, 0}, {3, 50}, {5, 70}, {10, 90}, {15, 100}});
        }};
    }

    ScoreFactor flow_score_factor(const std::string& name, double weight) {
        return {name, weight, [](const FeatureSnapshot& f, const OptionsChainData*) {
            return f.flow ? f.flow->flow_score : 0.0;
        }};
    }

    ScoreFactor pressure_factor(double weight, bool is_long) {
        return {"buy_sell_pressure", weight, [is_long](const FeatureSnapshot& f, const OptionsChainData*) {
            if (!f.flow) {
                return 50.0;
            }
            return directional_pressure(*f.flow, is_long);
        }};
    }

    OpportunityDetector make_sweep_momentum(Direction direction) {
        double sign = direction_sign(direction);
        bool is_long = direction == Direction::Long;

        OpportunityDetector detector;
        detector.type = is_long ? "sweep_momentum_long" : "sweep_momentum_short";
        detector.direction = direction;
        detector.asset_classes = kAllClasses;
        detector.flow_primary = true;
        detector.ideal_timeframe = "5m";
        detector.gate = [sign, direction](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode) || !f.flow) {
                return false;
            }
            if (f.flow->sweep_count < 3 || f.flow->flow_score < 60.0 || !flow_aligned(f, direction)) {
                return false;
            }
            auto distance = vwap_distance(f);
            return distance && sign * *distance > 0.0;
        };
        detector.score_factors = {
            sweep_intensity_factor(0.35),
            flow_score_factor("flow_strength", 0.25),
            pressure_factor(0.20, is_long),
            vwap_position_factor(0.10, direction),
            volume_factor("volume_confirmation", 0.10)
        };
        return detector;
    }

    OpportunityDetector make_institutional_flow(Direction direction) {
        bool is_long = direction == Direction::Long;

        OpportunityDetector detector;
        detector.type = is_long ? "institutional_flow_bullish" : "institutional_flow_bearish";
        detector.direction = direction;
        detector.asset_classes = kAllClasses;
        detector.flow_primary = true;
        detector.ideal_timeframe = "5m";
        detector.gate = [is_long, direction](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode) || !f.flow) {
                return false;
            }
            const auto& flow = *f.flow;
            if (flow.flow_score < 80.0 || flow.sweep_count < 5) {
                return false;
            }
            if (!flow.buy_pressure || !flow.large_trade_percentage || !flow.aggressiveness) {
                return false;
            }
            if (is_long ? *flow.buy_pressure < 70.0 : *flow.buy_pressure > 30.0) {
                return false;
            }
            if (*flow.large_trade_percentage < 40.0) {
                return false;
            }
            if (*flow.aggressiveness != Aggressiveness::Aggressive
                && *flow.aggressiveness != Aggressiveness::VeryAggressive) {
                return false;
            }
            return flow_aligned(f, direction);
        };
        detector.score_factors = {
            flow_score_factor("institutional_score", 0.35),
            sweep_intensity_factor(0.25),
            pressure_factor(0.20, is_long),
            {"large_trade_pct", 0.15, [](const FeatureSnapshot& f, const OptionsChainData*) {
                if (!f.flow || !f.flow->large_trade_percentage) {
                    return 0.0;
                }
                return interpolate(*f.flow->large_trade_percentage, {{0, 0}, {40, 60}, {60, 85}, {80, 100}});
            }},
            {"aggressiveness", 0.05, [](const FeatureSnapshot& f, const OptionsChainData*) {
                if (!f.flow || !f.flow->aggressiveness) {
                    return 50.0;
                }
                switch (*f.flow->aggressiveness) {
                    case Aggressiveness::VeryAggressive: return 100.0;
                    case Aggressiveness::Aggressive: return 80.0;
                    case Aggressiveness::Normal: return 50.0;
                    case Aggressiveness::Passive: return 20.0;
                }
                return 50.0;
            }}
        };
        return detector;
    }
}

std::vector<OpportunityDetector> make_flow_detectors() {
    return {
        make_sweep_momentum(Direction::Long),
        make_sweep_momentum(Direction::Short),
        make_institutional_flow(Direction::Long),
        make_institutional_flow(Direction::Short)
    };
}
