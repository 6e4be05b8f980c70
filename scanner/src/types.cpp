#include "types.hpp"
#include "util.hpp"
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {
    std::optional<double> opt_double(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it != j.end() && it->is_number()) {
            return it->get<double>();
        }
        return std::nullopt;
    }

    std::optional<int> opt_int(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) {
            return std::nullopt;
        }
        double value = it->get<double>();
        if (!std::isfinite(value) || value < std::numeric_limits<int>::min()
            || value > std::numeric_limits<int>::max()) {
            spdlog::warn("Ignoring out of range integer {}: {}", key, it->dump());
            return std::nullopt;
        }
        return static_cast<int>(value);
    }

    std::optional<bool> opt_bool(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it != j.end() && it->is_boolean()) {
            return it->get<bool>();
        }
        return std::nullopt;
    }

    std::string opt_string(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) {
            return it->get<std::string>();
        }
        return "";
    }

    // {"14": 61.2, "50": 48.0} -> period map; non-numeric keys are skipped
    std::map<int, double> period_map(const nlohmann::json& j) {
        std::map<int, double> result;
        if (!j.is_object()) {
            return result;
        }
        for (const auto& [key, value] : j.items()) {
            int period = 0;
            auto parsed = std::from_chars(key.data(), key.data() + key.size(), period);
            if (parsed.ec == std::errc() && value.is_number()) {
                result[period] = value.get<double>();
            }
        }
        return result;
    }

    std::optional<std::chrono::system_clock::time_point> opt_time(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end()) {
            return std::nullopt;
        }
        if (it->is_string()) {
            return parse_iso8601(it->get<std::string>());
        }
        if (it->is_number()) {
            // Epoch milliseconds, limited to +-100M days like ECMAScript dates
            constexpr double max_epoch_ms = 8.64e15;
            double value = it->get<double>();
            if (!std::isfinite(value) || std::abs(value) > max_epoch_ms) {
                throw std::out_of_range(std::string("Epoch milliseconds out of range for ") + key);
            }
            return std::chrono::system_clock::time_point(
                std::chrono::milliseconds(static_cast<int64_t>(value)));
        }
        return std::nullopt;
    }

    PriceInfo parse_price(const nlohmann::json& j) {
        PriceInfo price;
        price.current = j.value("current", 0.0);
        price.open = opt_double(j, "open");
        price.high = opt_double(j, "high");
        price.low = opt_double(j, "low");
        price.prev_close = opt_double(j, "prevClose");
        if (!price.prev_close) {
            price.prev_close = opt_double(j, "prev");
        }
        price.spread_pct = opt_double(j, "spreadPct");
        return price;
    }

    VwapInfo parse_vwap(const nlohmann::json& j) {
        VwapInfo vwap;
        vwap.value = opt_double(j, "value");
        vwap.distance_pct = opt_double(j, "distancePct");
        return vwap;
    }

    FlowBias parse_flow_bias(const std::string& value) {
        auto upper = to_upper(value);
        if (upper == "BULLISH") {
            return FlowBias::Bullish;
        }
        if (upper == "BEARISH") {
            return FlowBias::Bearish;
        }
        return FlowBias::Neutral;
    }

    std::optional<Aggressiveness> parse_aggressiveness(const std::string& value) {
        auto upper = to_upper(value);
        if (upper == "PASSIVE") return Aggressiveness::Passive;
        if (upper == "NORMAL" || upper == "MODERATE") return Aggressiveness::Normal;
        if (upper == "AGGRESSIVE") return Aggressiveness::Aggressive;
        if (upper == "VERY_AGGRESSIVE") return Aggressiveness::VeryAggressive;
        return std::nullopt;
    }

    PatternFlags parse_pattern(const nlohmann::json& j) {
        PatternFlags pattern;
        pattern.market_regime = market_regime_from_string(opt_string(j, "market_regime"));
        pattern.vix_level = vix_level_from_string(opt_string(j, "vix_level"));
        pattern.breakout_bullish = opt_bool(j, "breakout_bullish").value_or(false);
        pattern.breakout_bearish = opt_bool(j, "breakout_bearish").value_or(false);
        pattern.patience_candle = opt_bool(j, "patienceCandle").value_or(false);
        pattern.orb_high = opt_double(j, "orbHigh");
        pattern.orb_low = opt_double(j, "orbLow");
        pattern.swing_high = opt_double(j, "swingHigh");
        pattern.swing_low = opt_double(j, "swingLow");
        pattern.prior_day_high = opt_double(j, "priorDayHigh");
        pattern.prior_day_low = opt_double(j, "priorDayLow");

        auto div = j.find("divergence");
        if (div != j.end() && div->is_object()) {
            auto type = to_upper(opt_string(*div, "type"));
            if (type == "BULLISH" || type == "BEARISH") {
                Divergence divergence;
                divergence.direction = type == "BULLISH" ? Direction::Long : Direction::Short;
                divergence.confidence = div->value("confidence", 0.0);
                pattern.divergence = divergence;
            }
        }
        return pattern;
    }

    FlowAggregates parse_flow(const nlohmann::json& j) {
        FlowAggregates flow;
        flow.flow_score = j.value("flowScore", 0.0);
        flow.flow_bias = parse_flow_bias(opt_string(j, "flowBias"));
        flow.sweep_count = opt_int(j, "sweepCount").value_or(0);
        flow.block_count = opt_int(j, "blockCount").value_or(0);
        flow.buy_pressure = opt_double(j, "buyPressure");
        flow.large_trade_percentage = opt_double(j, "largeTradePercentage");
        flow.aggressiveness = parse_aggressiveness(opt_string(j, "aggressiveness"));
        flow.put_call_ratio = opt_double(j, "putCallRatio");
        return flow;
    }

    TimeframeSnapshot parse_timeframe(const nlohmann::json& j) {
        TimeframeSnapshot tf;
        if (j.contains("price") && j["price"].is_object()) {
            tf.price = parse_price(j["price"]);
        }
        if (j.contains("vwap") && j["vwap"].is_object()) {
            tf.vwap = parse_vwap(j["vwap"]);
        }
        if (j.contains("ema")) {
            tf.ema = period_map(j["ema"]);
        }
        if (j.contains("rsi")) {
            tf.rsi = period_map(j["rsi"]);
        }
        tf.atr = opt_double(j, "atr");
        return tf;
    }

    std::optional<double> lookup(const std::map<int, double>& values, int period) {
        auto it = values.find(period);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }
}

std::string to_string(AssetClass asset_class) {
    switch (asset_class) {
        case AssetClass::Index: return "INDEX";
        case AssetClass::EquityEtf: return "EQUITY_ETF";
        case AssetClass::Stock: return "STOCK";
    }
    return "STOCK";
}

std::string to_string(Direction direction) {
    return direction == Direction::Long ? "LONG" : "SHORT";
}

std::string to_string(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::Trending: return "trending";
        case MarketRegime::Ranging: return "ranging";
        case MarketRegime::Choppy: return "choppy";
        case MarketRegime::Volatile: return "volatile";
    }
    return "ranging";
}

std::string to_string(VixLevel level) {
    switch (level) {
        case VixLevel::Low: return "low";
        case VixLevel::Medium: return "medium";
        case VixLevel::High: return "high";
        case VixLevel::Extreme: return "extreme";
    }
    return "medium";
}

std::string to_string(TradingStyle style) {
    switch (style) {
        case TradingStyle::Scalp: return "scalp";
        case TradingStyle::DayTrade: return "day_trade";
        case TradingStyle::Swing: return "swing";
    }
    return "day_trade";
}

std::optional<AssetClass> asset_class_from_string(const std::string& value) {
    auto upper = to_upper(value);
    if (upper == "INDEX") return AssetClass::Index;
    if (upper == "EQUITY_ETF") return AssetClass::EquityEtf;
    if (upper == "STOCK") return AssetClass::Stock;
    return std::nullopt;
}

std::optional<MarketRegime> market_regime_from_string(const std::string& value) {
    auto upper = to_upper(value);
    if (upper == "TRENDING") return MarketRegime::Trending;
    if (upper == "RANGING") return MarketRegime::Ranging;
    if (upper == "CHOPPY") return MarketRegime::Choppy;
    if (upper == "VOLATILE") return MarketRegime::Volatile;
    return std::nullopt;
}

std::optional<VixLevel> vix_level_from_string(const std::string& value) {
    auto upper = to_upper(value);
    if (upper == "LOW") return VixLevel::Low;
    if (upper == "MEDIUM") return VixLevel::Medium;
    if (upper == "HIGH") return VixLevel::High;
    if (upper == "EXTREME") return VixLevel::Extreme;
    return std::nullopt;
}

std::optional<double> FeatureSnapshot::rsi_at(int period) const {
    return lookup(rsi, period);
}

std::optional<double> FeatureSnapshot::ema_at(int period) const {
    return lookup(ema, period);
}

std::optional<double> FeatureSnapshot::atr_at(int period) const {
    return lookup(atr, period);
}

std::optional<FeatureSnapshot> FeatureSnapshot::from_json(const nlohmann::json& j) {
    try {
        FeatureSnapshot features;
        features.symbol = j.at("symbol").get<std::string>();

        auto ts = opt_time(j, "timestamp");
        if (!ts) {
            ts = opt_time(j, "time");
        }
        features.timestamp = ts.value_or(std::chrono::system_clock::now());
        features.bar_time = opt_time(j, "barTime");

        const auto& price = j.at("price");
        if (!price.contains("current") || !price["current"].is_number()) {
            spdlog::warn("Feature snapshot for {} has no current price", features.symbol);
            return std::nullopt;
        }
        features.price = parse_price(price);

        if (j.contains("volume") && j["volume"].is_object()) {
            const auto& volume = j["volume"];
            features.volume.current = opt_double(volume, "current");
            features.volume.avg = opt_double(volume, "avg");
            features.volume.relative_to_avg = opt_double(volume, "relativeToAvg");
        }
        if (j.contains("vwap") && j["vwap"].is_object()) {
            features.vwap = parse_vwap(j["vwap"]);
        }
        if (j.contains("rsi")) {
            features.rsi = period_map(j["rsi"]);
        }
        if (j.contains("ema")) {
            features.ema = period_map(j["ema"]);
        }
        if (j.contains("atr")) {
            // A bare number is the 14-period ATR
            if (j["atr"].is_number()) {
                features.atr[14] = j["atr"].get<double>();
            } else {
                features.atr = period_map(j["atr"]);
            }
        }
        if (j.contains("session") && j["session"].is_object()) {
            features.session.minutes_since_open = opt_int(j["session"], "minutesSinceOpen");
            features.session.is_regular_hours = opt_bool(j["session"], "isRegularHours");
        }
        if (j.contains("pattern") && j["pattern"].is_object()) {
            features.pattern = parse_pattern(j["pattern"]);
        }
        if (j.contains("flow") && j["flow"].is_object()) {
            features.flow = parse_flow(j["flow"]);
        }
        if (j.contains("mtf") && j["mtf"].is_object()) {
            for (const auto& [timeframe, value] : j["mtf"].items()) {
                if (value.is_object()) {
                    features.mtf[timeframe] = parse_timeframe(value);
                }
            }
        }
        return features;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse feature snapshot: {}", e.what());
        return std::nullopt;
    }
}

std::optional<OptionsChainData> OptionsChainData::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    OptionsChainData options;
    options.dealer_net_gamma = opt_double(j, "dealerNetGamma");
    options.max_gamma_strike = opt_double(j, "maxGammaStrike");
    options.max_pain_strike = opt_double(j, "maxPainStrike");
    options.gamma_flip_level = opt_double(j, "gammaFlipLevel");
    options.call_put_ratio = opt_double(j, "callPutRatio");
    options.minutes_to_expiry = opt_int(j, "minutesToExpiry");
    options.is_0dte = opt_bool(j, "is0DTE").value_or(false);

    auto oi = j.find("openInterestByStrike");
    if (oi != j.end() && oi->is_object()) {
        std::map<double, double> by_strike;
        for (const auto& [strike, value] : oi->items()) {
            if (value.is_number()) {
                char* end = nullptr;
                double parsed = std::strtod(strike.c_str(), &end);
                if (end != strike.c_str()) {
                    by_strike[parsed] = value.get<double>();
                }
            }
        }
        options.open_interest_at_strike = [by_strike](double strike) {
            auto it = by_strike.find(strike);
            return it == by_strike.end() ? 0.0 : it->second;
        };
    }
    return options;
}

nlohmann::json CompositeSignal::to_json() const {
    nlohmann::json factor_list = nlohmann::json::array();
    for (const auto& factor : factors) {
        factor_list.push_back({
            {"name", factor.name},
            {"weight", factor.weight},
            {"score", factor.score},
            {"contribution", factor.contribution}
        });
    }

    return {
        {"symbol", symbol},
        {"detectorType", detector_type},
        {"direction", to_string(direction)},
        {"assetClass", to_string(asset_class)},
        {"baseScore", base_score},
        {"confidence", confidence},
        {"confidenceLevel", confidence_level},
        {"dataCompleteness", data_completeness},
        {"factors", factor_list},
        {"styleScores", {
            {"scalp", styles.scalp},
            {"dayTrade", styles.day_trade},
            {"swing", styles.swing},
            {"recommended", to_string(styles.recommended)},
            {"recommendedScore", styles.recommended_score}
        }},
        {"entry", risk.entry},
        {"stop", risk.stop},
        {"targets", {risk.target1, risk.target2, risk.target3}},
        {"riskReward", risk.ratio},
        {"barTimeKey", bar_time_key},
        {"detectedAt", format_iso8601(detected_at)},
        {"expiresAt", format_iso8601(expires_at)},
        {"detectorVersion", detector_version},
        {"filtered", filtered}
    };
}
