#include "confidence.hpp"
#include "factors.hpp"
#include "util.hpp"
#include <cmath>
#include <fmt/format.h>

namespace {
    struct DataInput {
        const char* name;
        double weight;
        bool critical;
        bool available;
    };

    bool has_timeframe(const FeatureSnapshot& f, const char* timeframe) {
        auto it = f.mtf.find(timeframe);
        return it != f.mtf.end() && it->second.price.current > 0.0;
    }

    std::vector<DataInput> data_inputs(const FeatureSnapshot& f, bool weekend) {
        const auto& p = f.pattern;
        auto atr = f.atr_at(14);
        auto mtf_5m = f.mtf.find("5m");
        bool has_atr = (atr && *atr > 0.0)
            || (mtf_5m != f.mtf.end() && mtf_5m->second.atr && *mtf_5m->second.atr > 0.0);

        return {
            {"price", 20, true, f.price.current > 0.0},
            {"price_change", 5, false, f.price.prev_close.has_value()},
            {"volume", weekend ? 5.0 : 12.0, !weekend, f.volume.current && *f.volume.current > 0.0},
            {"volume_avg", 5, false, f.volume.avg && *f.volume.avg > 0.0},
            {"relative_volume", weekend ? 2.0 : 8.0, false, f.volume.relative_to_avg.has_value()},
            {"vwap", weekend ? 3.0 : 10.0, false, f.vwap.value && *f.vwap.value > 0.0},
            {"vwap_distance", weekend ? 2.0 : 5.0, false, f.vwap.distance_pct.has_value()},
            {"rsi", 8, false, f.rsi_at(14).has_value()},
            {"ema", 6, false, f.ema_at(21).has_value()},
            {"atr", 10, true, has_atr},
            {"mtf_1m", 2, false, has_timeframe(f, "1m")},
            {"mtf_5m", 4, false, has_timeframe(f, "5m")},
            {"mtf_15m", 3, false, has_timeframe(f, "15m")},
            {"mtf_60m", 2, false, has_timeframe(f, "60m")},
            {"flow", weekend ? 2.0 : 5.0, false, f.flow.has_value()},
            {"flow_score", weekend ? 1.0 : 4.0, false, f.flow.has_value()},
            {"flow_bias", weekend ? 1.0 : 3.0, false, f.flow.has_value()},
            {"orb", 3, false, p.orb_high && p.orb_low},
            {"prior_day_levels", weekend ? 10.0 : 4.0, false, f.price.prev_close.has_value()},
            {"swing_levels", weekend ? 8.0 : 2.0, false, p.swing_high && p.swing_low},
            {"vix_level", 5, false, p.vix_level.has_value()},
            {"market_regime", 5, false, p.market_regime.has_value()},
            {"session", 3, false, f.session.is_regular_hours.has_value()}
        };
    }
}

DataConfidence ConfidenceScorer::calculate_data_confidence(const FeatureSnapshot& features, bool weekend) const {
    DataConfidence result;
    double total_weight = 0.0;
    double available_weight = 0.0;

    for (const auto& input : data_inputs(features, weekend)) {
        total_weight += input.weight;
        if (input.available) {
            available_weight += input.weight;
        } else if (input.critical) {
            result.missing_critical.push_back(input.name);
        } else if (input.weight >= 5.0) {
            result.missing_important.push_back(input.name);
        }
    }

    result.completeness = std::round(available_weight / total_weight * 100.0);

    // Each missing critical input caps confidence 15 points lower
    if (!result.missing_critical.empty()) {
        result.base_confidence = 100.0 - 15.0 * result.missing_critical.size();
    }

    double bonus = 0.0;
    if (result.completeness < 50.0) {
        bonus = -20.0;
    } else if (result.completeness < 70.0) {
        bonus = -10.0;
    } else if (result.completeness >= 90.0) {
        bonus = 5.0;
    }

    result.adjusted_confidence = clamp_score(result.base_confidence * result.completeness / 100.0 + bonus);
    result.multiplier = result.adjusted_confidence / 100.0;
    return result;
}

ConfidenceResult ConfidenceScorer::score(
    const FeatureSnapshot& features,
    Direction direction,
    double raw_score,
    AnalysisMode mode
) const {
    ConfidenceResult result;
    bool weekend = mode == AnalysisMode::Historical && features.session.is_regular_hours == false;
    result.data = calculate_data_confidence(features, weekend);

    double confidence = clamp_score(raw_score) * result.data.multiplier;

    if (features.pattern.market_regime == MarketRegime::Volatile) {
        confidence *= 0.85;
        result.adjustments.push_back("volatile regime x0.85");
    } else if (features.pattern.market_regime == MarketRegime::Choppy) {
        confidence *= 0.80;
        result.adjustments.push_back("choppy regime x0.80");
    }

    if (features.flow) {
        const auto& flow = *features.flow;
        bool aligned = flow_aligned(features, direction);
        bool opposed = !aligned && flow.flow_bias != FlowBias::Neutral;
        if (aligned && flow.flow_score >= 60.0) {
            confidence *= 1.10;
            result.adjustments.push_back(fmt::format("flow aligned ({:.0f}) x1.10", flow.flow_score));
        } else if (opposed && flow.flow_score >= 60.0) {
            confidence *= 0.85;
            result.adjustments.push_back(fmt::format("flow opposed ({:.0f}) x0.85", flow.flow_score));
        } else if (flow.flow_score < 40.0) {
            confidence *= 0.95;
            result.adjustments.push_back("weak flow x0.95");
        }
    }

    if (!features.mtf.empty()) {
        double alignment = mtf_alignment_score(features, direction);
        if (alignment >= 80.0) {
            confidence *= 1.08;
            result.adjustments.push_back(fmt::format("timeframes aligned ({:.0f}%) x1.08", alignment));
        } else if (alignment < 40.0) {
            confidence *= 0.92;
            result.adjustments.push_back(fmt::format("timeframes conflicted ({:.0f}%) x0.92", alignment));
        }
    }

    result.confidence = clamp_score(confidence);
    result.level = confidence_level(result.confidence);
    return result;
}

std::string ConfidenceScorer::confidence_level(double confidence) {
    if (confidence >= 80.0) return "high";
    if (confidence >= 60.0) return "medium";
    if (confidence >= 40.0) return "low";
    return "very_low";
}
