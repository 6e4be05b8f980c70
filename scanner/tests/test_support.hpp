#pragma once

#include "config.hpp"
#include "types.hpp"
#include "util.hpp"
#include <chrono>
#include <string>

// 10:30 ET on a Tuesday, one hour into the session
inline std::chrono::system_clock::time_point session_time(int minutes_after = 0) {
    return parse_iso8601("2024-03-05T15:30:00Z") + std::chrono::minutes(minutes_after);
}

// SPY breaking out 1.2% above VWAP on 2.5x volume, RSI 65
inline FeatureSnapshot breakout_snapshot(
    const std::string& symbol = "SPY",
    std::chrono::system_clock::time_point timestamp = session_time()
) {
    FeatureSnapshot f;
    f.symbol = symbol;
    f.timestamp = timestamp;
    f.price.current = 101.2;
    f.price.prev_close = 99.5;
    f.volume.current = 2500000;
    f.volume.avg = 1000000;
    f.volume.relative_to_avg = 2.5;
    f.vwap.value = 100.0;
    f.vwap.distance_pct = 1.2;
    f.rsi[14] = 65.0;
    f.atr[14] = 1.1;
    f.session.minutes_since_open = 60;
    f.session.is_regular_hours = true;
    f.pattern.breakout_bullish = true;
    f.pattern.market_regime = MarketRegime::Trending;
    return f;
}

// Thresholds wide open so emission depends only on gates and dedup
inline ScannerConfig permissive_config() {
    ScannerConfig config;
    config.default_thresholds.min_base_score = 0.0;
    config.default_thresholds.min_style_score = 0.0;
    config.default_thresholds.min_risk_reward = 0.0;
    config.default_thresholds.max_signals_per_symbol_per_hour = 100;
    config.default_thresholds.cooldown_minutes = 0;
    config.asset_class_thresholds.clear();
    return config;
}
