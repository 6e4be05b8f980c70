#include "detectors.hpp"
#include "factors.hpp"
#include <cmath>

namespace {
    const std::vector<AssetClass> kIndexClasses = {AssetClass::Index};

    std::string suffix(Direction direction, const char* long_name, const char* short_name) {
        return direction == Direction::Long ? long_name : short_name;
    }

    bool in_window(const FeatureSnapshot& f, int from_minute, int to_minute) {
        auto minutes = f.session.minutes_since_open;
        return minutes && *minutes >= from_minute && *minutes <= to_minute;
    }

    // Percent distance of price from a level, signed with the direction
    double signed_distance_pct(double price, double level, double sign) {
        return sign * (price - level) / level * 100.0;
    }

    // Negative dealer gamma amplifies moves; scored on billions of gamma per 1% move
    ScoreFactor short_gamma_factor(double weight) {
        return {"dealer_gamma", weight, [](const FeatureSnapshot&, const OptionsChainData* options) {
            if (!options || !options->dealer_net_gamma) {
                return 50.0;
            }
            return interpolate(-*options->dealer_net_gamma, {{0.0, 40}, {0.5, 60}, {1.0, 75}, {3.0, 100}});
        }};
    }

    ScoreFactor long_gamma_factor(double weight) {
        return {"dealer_gamma", weight, [](const FeatureSnapshot&, const OptionsChainData* options) {
            if (!options || !options->dealer_net_gamma) {
                return 50.0;
            }
            return interpolate(*options->dealer_net_gamma, {{0.0, 40}, {0.5, 65}, {1.0, 80}, {3.0, 100}});
        }};
    }

    OpportunityDetector make_gamma_squeeze(Direction direction) {
        double sign = direction_sign(direction);

        OpportunityDetector detector;
        detector.type = "gamma_squeeze_" + suffix(direction, "bullish", "bearish");
        detector.direction = direction;
        detector.asset_classes = kIndexClasses;
        detector.requires_options_data = true;
        detector.ideal_timeframe = "5m";
        detector.gate = [sign](const FeatureSnapshot& f, const OptionsChainData* options, AnalysisMode mode) {
            if (!options || !should_run_detector(f, mode)) {
                return false;
            }
            if (!options->dealer_net_gamma || !options->max_gamma_strike || *options->max_gamma_strike <= 0.0) {
                return false;
            }
            if (*options->dealer_net_gamma >= 0.0) {
                return false;
            }
            // Price pushing through the gamma wall, at most 1% beyond it
            double beyond = signed_distance_pct(f.price.current, *options->max_gamma_strike, sign);
            if (beyond < 0.0 || beyond > 1.0) {
                return false;
            }
            auto rvol = relative_volume(f);
            auto distance = vwap_distance(f);
            if (!rvol || !distance) {
                return false;
            }
            return *rvol >= 1.2 && sign * *distance > 0.0;
        };
        detector.score_factors = {
            short_gamma_factor(0.35),
            {"strike_proximity", 0.25, [](const FeatureSnapshot& f, const OptionsChainData* options) {
                if (!options || !options->max_gamma_strike || *options->max_gamma_strike <= 0.0) {
                    return 0.0;
                }
                double distance = std::abs(f.price.current - *options->max_gamma_strike)
                                  / *options->max_gamma_strike * 100.0;
                return interpolate(distance, {{0.0, 100}, {0.25, 85}, {0.5, 65}, {1.0, 40}});
            }},
            volume_factor("volume_confirmation", 0.20),
            flow_confirmation_factor(0.10, direction),
            vwap_position_factor(0.10, direction)
        };
        return detector;
    }

    OpportunityDetector make_power_hour_reversal(Direction direction) {
        double sign = direction_sign(direction);
        bool is_long = direction == Direction::Long;

        OpportunityDetector detector;
        detector.type = "power_hour_reversal_" + suffix(direction, "bullish", "bearish");
        detector.direction = direction;
        detector.asset_classes = kIndexClasses;
        detector.ideal_timeframe = "5m";
        detector.gate = [sign, is_long](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode) || !in_window(f, 330, 390)) {
                return false;
            }
            auto rsi = f.rsi_at(14);
            auto distance = vwap_distance(f);
            if (!rsi || !distance || !f.price.high || !f.price.low || *f.price.high <= *f.price.low) {
                return false;
            }
            if (is_long ? *rsi > 35.0 : *rsi < 65.0) {
                return false;
            }
            if (-sign * *distance < 0.3) {
                return false;
            }
            // Needs a bounce off the session extreme
            double range = *f.price.high - *f.price.low;
            double bounce = is_long ? (f.price.current - *f.price.low) / range
                                    : (*f.price.high - f.price.current) / range;
            return bounce >= 0.15;
        };
        detector.score_factors = {
            rsi_extreme_factor(0.30, direction),
            vwap_stretch_factor(0.25, direction),
            {"bounce_quality", 0.20, [is_long](const FeatureSnapshot& f, const OptionsChainData*) {
                if (!f.price.high || !f.price.low || *f.price.high <= *f.price.low) {
                    return 0.0;
                }
                double range = *f.price.high - *f.price.low;
                double bounce = is_long ? (f.price.current - *f.price.low) / range
                                        : (*f.price.high - f.price.current) / range;
                return interpolate(bounce, {{0.15, 40}, {0.3, 70}, {0.5, 100}});
            }},
            {"session_timing", 0.15, [](const FeatureSnapshot& f, const OptionsChainData*) {
                if (!f.session.minutes_since_open) {
                    return 50.0;
                }
                return interpolate(*f.session.minutes_since_open, {{330, 60}, {360, 100}, {385, 70}, {390, 40}});
            }},
            flow_confirmation_factor(0.10, direction)
        };
        return detector;
    }

    OpportunityDetector make_index_mean_reversion(Direction direction) {
        double sign = direction_sign(direction);
        bool is_long = direction == Direction::Long;

        OpportunityDetector detector;
        detector.type = "index_mean_reversion_" + suffix(direction, "long", "short");
        detector.direction = direction;
        detector.asset_classes = kIndexClasses;
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
            if (is_long ? *rsi > 35.0 : *rsi < 65.0) {
                return false;
            }
            if (-sign * *distance < 0.5) {
                return false;
            }
            return f.pattern.market_regime != MarketRegime::Trending;
        };
        detector.score_factors = {
            vwap_stretch_factor(0.35, direction),
            rsi_extreme_factor(0.25, direction),
            regime_factor(0.20, {10, 100, 80, 50}),
            divergence_factor(0.10, direction),
            // Long dealer gamma dampens moves and favours reversion
            {"gamma_dampening", 0.10, [](const FeatureSnapshot&, const OptionsChainData* options) {
                if (!options || !options->dealer_net_gamma) {
                    return 50.0;
                }
                return *options->dealer_net_gamma > 0.0 ? 80.0 : 30.0;
            }}
        };
        return detector;
    }

    OpportunityDetector make_opening_drive(Direction direction) {
        double sign = direction_sign(direction);

        OpportunityDetector detector;
        detector.type = "opening_drive_" + suffix(direction, "bullish", "bearish");
        detector.direction = direction;
        detector.asset_classes = kIndexClasses;
        detector.ideal_timeframe = "1m";
        detector.gate = [sign](const FeatureSnapshot& f, const OptionsChainData*, AnalysisMode mode) {
            if (!should_run_detector(f, mode) || !in_window(f, 0, 60)) {
                return false;
            }
            if (!f.price.open || *f.price.open <= 0.0) {
                return false;
            }
            auto distance = vwap_distance(f);
            auto rvol = relative_volume(f);
            if (!distance || !rvol) {
                return false;
            }
            return signed_distance_pct(f.price.current, *f.price.open, sign) >= 0.2
                && sign * *distance >= 0.1
                && *rvol >= 1.3;
        };
        detector.score_factors = {
            {"drive_strength", 0.30, [sign](const FeatureSnapshot& f, const OptionsChainData*) {
                if (!f.price.open || *f.price.open <= 0.0) {
                    return 0.0;
                }
                double drive = signed_distance_pct(f.price.current, *f.price.open, sign);
                return interpolate(drive, {{0.0, 0}, {0.2, 40}, {0.5, 70}, {1.0, 90}, {1.5, 100}});
            }},
            volume_factor("volume_surge", 0.25),
            vwap_position_factor(0.20, direction),
            {"gap_alignment", 0.15, [sign](const FeatureSnapshot& f, const OptionsChainData*) {
                if (!f.price.open || !f.price.prev_close || *f.price.prev_close <= 0.0) {
                    return 50.0;
                }
                double gap = signed_distance_pct(*f.price.open, *f.price.prev_close, sign);
                return interpolate(gap, {{-0.5, 20}, {0.0, 50}, {0.3, 75}, {0.8, 100}});
            }},
            flow_confirmation_factor(0.10, direction)
        };
        return detector;
    }

    OpportunityDetector make_gamma_flip(Direction direction) {
        double sign = direction_sign(direction);
        bool is_long = direction == Direction::Long;

        OpportunityDetector detector;
        detector.type = "gamma_flip_" + suffix(direction, "bullish", "bearish");
        detector.direction = direction;
        detector.asset_classes = kIndexClasses;
        detector.requires_options_data = true;
        detector.ideal_timeframe = "5m";
        detector.gate = [sign, is_long](const FeatureSnapshot& f, const OptionsChainData* options, AnalysisMode mode) {
            if (!options || !should_run_detector(f, mode)) {
                return false;
            }
            if (!options->gamma_flip_level || *options->gamma_flip_level <= 0.0) {
                return false;
            }
            double flip = *options->gamma_flip_level;
            double beyond = signed_distance_pct(f.price.current, flip, sign);
            if (beyond <= 0.0) {
                return false;
            }
            // Crossed during this bar, or still hugging the flip level
            bool crossed = f.price.open && sign * (*f.price.open - flip) <= 0.0;
            if (!crossed && beyond > 0.15) {
                return false;
            }
            auto rsi = f.rsi_at(14);
            if (!rsi) {
                return false;
            }
            return is_long ? *rsi >= 45.0 : *rsi <= 55.0;
        };
        detector.score_factors = {
            {"flip_proximity", 0.35, [sign](const FeatureSnapshot& f, const OptionsChainData* options) {
                if (!options || !options->gamma_flip_level || *options->gamma_flip_level <= 0.0) {
                    return 0.0;
                }
                double beyond = signed_distance_pct(f.price.current, *options->gamma_flip_level, sign);
                if (beyond < 0.0) {
                    return 0.0;
                }
                return interpolate(beyond, {{0.0, 100}, {0.15, 85}, {0.4, 60}, {1.0, 30}});
            }},
            rsi_momentum_factor(0.20, direction),
            volume_factor("volume_confirmation", 0.20),
            {"gamma_regime", 0.15, [](const FeatureSnapshot&, const OptionsChainData* options) {
                if (!options || !options->dealer_net_gamma) {
                    return 50.0;
                }
                return *options->dealer_net_gamma < 0.0 ? 80.0 : 45.0;
            }},
            flow_confirmation_factor(0.10, direction)
        };
        return detector;
    }

    // Pin towards max pain (or the gamma wall) into a 0DTE close; price must sit just below the pin
    OpportunityDetector make_eod_pin() {
        OpportunityDetector detector;
        detector.type = "eod_pin_setup";
        detector.direction = Direction::Long;
        detector.asset_classes = kIndexClasses;
        detector.requires_options_data = true;
        detector.ideal_timeframe = "1m";

        auto pin_strike = [](const OptionsChainData* options) -> std::optional<double> {
            if (!options) {
                return std::nullopt;
            }
            if (options->max_pain_strike && *options->max_pain_strike > 0.0) {
                return options->max_pain_strike;
            }
            if (options->max_gamma_strike && *options->max_gamma_strike > 0.0) {
                return options->max_gamma_strike;
            }
            return std::nullopt;
        };

        detector.gate = [pin_strike](const FeatureSnapshot& f, const OptionsChainData* options, AnalysisMode mode) {
            if (!options || !options->is_0dte || !should_run_detector(f, mode)) {
                return false;
            }
            bool late = in_window(f, 360, 390)
                || (options->minutes_to_expiry && *options->minutes_to_expiry <= 30);
            if (!late) {
                return false;
            }
            auto pin = pin_strike(options);
            if (!pin || !options->dealer_net_gamma || *options->dealer_net_gamma <= 0.0) {
                return false;
            }
            double below = (*pin - f.price.current) / *pin * 100.0;
            return below > 0.0 && below <= 0.5;
        };
        detector.score_factors = {
            {"pin_distance", 0.35, [pin_strike](const FeatureSnapshot& f, const OptionsChainData* options) {
                auto pin = pin_strike(options);
                if (!pin) {
                    return 0.0;
                }
                double distance = std::abs(*pin - f.price.current) / *pin * 100.0;
                return interpolate(distance, {{0.0, 100}, {0.1, 90}, {0.25, 70}, {0.5, 40}});
            }},
            long_gamma_factor(0.25),
            {"time_to_expiry", 0.20, [](const FeatureSnapshot& f, const OptionsChainData* options) {
                std::optional<int> minutes;
                if (options && options->minutes_to_expiry) {
                    minutes = options->minutes_to_expiry;
                } else if (f.session.minutes_since_open) {
                    minutes = 390 - *f.session.minutes_since_open;
                }
                if (!minutes) {
                    return 50.0;
                }
                return interpolate(*minutes, {{0, 60}, {10, 100}, {30, 75}, {60, 40}});
            }},
            {"open_interest", 0.20, [pin_strike](const FeatureSnapshot&, const OptionsChainData* options) {
                auto pin = pin_strike(options);
                if (!pin || !options->open_interest_at_strike) {
                    return 50.0;
                }
                double open_interest = options->open_interest_at_strike(*pin);
                return interpolate(open_interest, {{0, 20}, {5000, 50}, {20000, 80}, {50000, 100}});
            }}
        };
        return detector;
    }
}

std::vector<OpportunityDetector> make_index_detectors() {
    return {
        make_gamma_squeeze(Direction::Long),
        make_gamma_squeeze(Direction::Short),
        make_power_hour_reversal(Direction::Long),
        make_power_hour_reversal(Direction::Short),
        make_index_mean_reversion(Direction::Long),
        make_index_mean_reversion(Direction::Short),
        make_opening_drive(Direction::Long),
        make_opening_drive(Direction::Short),
        make_gamma_flip(Direction::Long),
        make_gamma_flip(Direction::Short),
        make_eod_pin()
    };
}
