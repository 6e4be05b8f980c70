#include "factors.hpp"
#include <algorithm>
#include <cmath>

bool should_run_detector(const FeatureSnapshot& features, AnalysisMode mode) {
    if (mode == AnalysisMode::Historical) {
        return true;
    }
    return features.session.is_regular_hours.value_or(true);
}

namespace {
    double interpolate_range(double x, const std::pair<double, double>* first, const std::pair<double, double>* end) {
        if (first == end) {
            return 0.0;
        }
        const auto* last = end - 1;
        if (!std::isfinite(x) || x <= first->first) {
            return first->second;
        }
        if (x >= last->first) {
            return last->second;
        }
        for (const auto* it = first; it != last; ++it) {
            const auto* next = it + 1;
            if (x <= next->first) {
                double span = next->first - it->first;
                if (span <= 0.0) {
                    return next->second;
                }
                return it->second + (next->second - it->second) * (x - it->first) / span;
            }
        }
        return last->second;
    }
}

double interpolate(double x, std::initializer_list<std::pair<double, double>> points) {
    return interpolate_range(x, points.begin(), points.end());
}

double interpolate(double x, const std::vector<std::pair<double, double>>& points) {
    return interpolate_range(x, points.data(), points.data() + points.size());
}

double direction_sign(Direction direction) {
    return direction == Direction::Long ? 1.0 : -1.0;
}

std::optional<double> relative_volume(const FeatureSnapshot& features) {
    if (features.volume.relative_to_avg) {
        return features.volume.relative_to_avg;
    }
    if (features.volume.current && features.volume.avg && *features.volume.avg > 0.0) {
        return *features.volume.current / *features.volume.avg;
    }
    return std::nullopt;
}

std::optional<double> vwap_distance(const FeatureSnapshot& features) {
    if (features.vwap.distance_pct) {
        return features.vwap.distance_pct;
    }
    if (features.vwap.value && *features.vwap.value > 0.0) {
        return (features.price.current - *features.vwap.value) / *features.vwap.value * 100.0;
    }
    return std::nullopt;
}

double atr_estimate(const FeatureSnapshot& features) {
    auto atr = features.atr_at(14);
    if (atr && *atr > 0.0) {
        return *atr;
    }
    auto it = features.mtf.find("5m");
    if (it != features.mtf.end() && it->second.atr && *it->second.atr > 0.0) {
        return *it->second.atr;
    }
    return features.price.current * 0.015;
}

bool flow_aligned(const FeatureSnapshot& features, Direction direction) {
    if (!features.flow) {
        return false;
    }
    auto wanted = direction == Direction::Long ? FlowBias::Bullish : FlowBias::Bearish;
    return features.flow->flow_bias == wanted;
}

double mtf_alignment_score(const FeatureSnapshot& features, Direction direction) {
    double sign = direction_sign(direction);
    int usable = 0;
    int agreeing = 0;

    for (const auto& [timeframe, tf] : features.mtf) {
        auto ema = tf.ema.find(21);
        if (ema != tf.ema.end() && tf.price.current > 0.0) {
            ++usable;
            if (sign * (tf.price.current - ema->second) > 0.0) {
                ++agreeing;
            }
        } else if (tf.vwap.distance_pct) {
            ++usable;
            if (sign * *tf.vwap.distance_pct > 0.0) {
                ++agreeing;
            }
        }
    }

    if (usable == 0) {
        return 50.0;
    }
    return 100.0 * agreeing / usable;
}

double ema_alignment_score(const FeatureSnapshot& features, Direction direction) {
    auto fast = features.ema_at(8);
    auto slow = features.ema_at(21);
    if (!fast || !slow) {
        return 0.0;
    }

    double sign = direction_sign(direction);
    if (sign * (*fast - *slow) <= 0.0) {
        return 20.0;
    }

    double score = 60.0;
    if (sign * (features.price.current - *fast) >= 0.0) {
        score += 20.0;
    }
    auto trend = features.ema_at(50);
    if (trend && sign * (*slow - *trend) > 0.0) {
        score += 20.0;
    }
    return score;
}

int levels_near_price(const FeatureSnapshot& features, double tolerance_pct) {
    double price = features.price.current;
    if (price <= 0.0) {
        return 0;
    }

    std::vector<std::optional<double>> levels = {
        features.vwap.value,
        features.ema_at(8),
        features.ema_at(21),
        features.pattern.orb_high,
        features.pattern.orb_low,
        features.pattern.prior_day_high,
        features.pattern.prior_day_low,
        features.pattern.swing_high,
        features.pattern.swing_low
    };

    return static_cast<int>(std::count_if(levels.begin(), levels.end(), [price, tolerance_pct](const auto& level) {
        return level && std::abs(*level - price) / price * 100.0 <= tolerance_pct;
    }));
}

ScoreFactor volume_factor(const std::string& name, double weight) {
    return {name, weight, [](const FeatureSnapshot& f, const OptionsChainData*) {
        auto rvol = relative_volume(f);
        if (!rvol) {
            return 50.0;
        }
        return interpolate(*rvol, {{0.5, 10}, {1.0, 40}, {1.5, 60}, {2.0, 75}, {3.0, 90}, {4.0, 100}});
    }};
}

ScoreFactor vwap_position_factor(double weight, Direction direction) {
    double sign = direction_sign(direction);
    return {"vwap_position", weight, [sign](const FeatureSnapshot& f, const OptionsChainData*) {
        auto distance = vwap_distance(f);
        if (!distance) {
            return 50.0;
        }
        return interpolate(sign * *distance, {{-1.0, 0}, {0.0, 30}, {0.3, 60}, {1.0, 85}, {2.0, 100}});
    }};
}

ScoreFactor vwap_stretch_factor(double weight, Direction direction) {
    double sign = direction_sign(direction);
    return {"vwap_stretch", weight, [sign](const FeatureSnapshot& f, const OptionsChainData*) {
        auto distance = vwap_distance(f);
        if (!distance) {
            return 0.0;
        }
        // Long reversions want price stretched below VWAP
        return interpolate(-sign * *distance, {{0.0, 0}, {0.5, 40}, {1.0, 65}, {2.0, 90}, {3.0, 100}});
    }};
}

ScoreFactor rsi_momentum_factor(double weight, Direction direction) {
    bool is_long = direction == Direction::Long;
    return {"rsi_momentum", weight, [is_long](const FeatureSnapshot& f, const OptionsChainData*) {
        auto rsi = f.rsi_at(14);
        if (!rsi) {
            return 50.0;
        }
        double value = is_long ? *rsi : 100.0 - *rsi;
        return interpolate(value, {{40, 20}, {50, 40}, {60, 75}, {65, 90}, {70, 85}, {80, 50}});
    }};
}

ScoreFactor rsi_extreme_factor(double weight, Direction direction) {
    bool is_long = direction == Direction::Long;
    return {"rsi_extreme", weight, [is_long](const FeatureSnapshot& f, const OptionsChainData*) {
        auto rsi = f.rsi_at(14);
        if (!rsi) {
            return 0.0;
        }
        double value = is_long ? *rsi : 100.0 - *rsi;
        return interpolate(value, {{15, 100}, {20, 95}, {25, 85}, {30, 70}, {35, 50}, {45, 20}});
    }};
}

ScoreFactor regime_factor(double weight, RegimeScores scores) {
    return {"regime_fit", weight, [scores](const FeatureSnapshot& f, const OptionsChainData*) {
        if (!f.pattern.market_regime) {
            return 50.0;
        }
        switch (*f.pattern.market_regime) {
            case MarketRegime::Trending: return scores.trending;
            case MarketRegime::Ranging: return scores.ranging;
            case MarketRegime::Choppy: return scores.choppy;
            case MarketRegime::Volatile: return scores.volatile_;
        }
        return 50.0;
    }};
}

ScoreFactor flow_confirmation_factor(double weight, Direction direction) {
    return {"flow_confirmation", weight, [direction](const FeatureSnapshot& f, const OptionsChainData*) {
        if (!f.flow) {
            return 50.0;
        }
        double strength = std::max(0.0, std::min(100.0, f.flow->flow_score));
        if (f.flow->flow_bias == FlowBias::Neutral) {
            return 50.0;
        }
        if (flow_aligned(f, direction)) {
            return 60.0 + 0.4 * strength;
        }
        return std::max(0.0, 40.0 - 0.4 * strength);
    }};
}

ScoreFactor mtf_alignment_factor(double weight, Direction direction) {
    return {"mtf_alignment", weight, [direction](const FeatureSnapshot& f, const OptionsChainData*) {
        return mtf_alignment_score(f, direction);
    }};
}

ScoreFactor divergence_factor(double weight, Direction direction) {
    return {"divergence", weight, [direction](const FeatureSnapshot& f, const OptionsChainData*) {
        if (!f.pattern.divergence) {
            return 40.0;
        }
        if (f.pattern.divergence->direction != direction) {
            return 10.0;
        }
        return 50.0 + std::max(0.0, std::min(100.0, f.pattern.divergence->confidence)) / 2.0;
    }};
}

ScoreFactor ema_alignment_factor(double weight, Direction direction) {
    return {"ema_alignment", weight, [direction](const FeatureSnapshot& f, const OptionsChainData*) {
        return ema_alignment_score(f, direction);
    }};
}
