#include <cassert>
#include <cmath>
#include <string>

#include "composite_scanner.hpp"
#include "thresholds.hpp"
#include "test_support.hpp"

static bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

int main() {
    // Session windows
    auto f = breakout_snapshot();
    f.session.minutes_since_open = -10;
    assert(time_window_for(f) == TimeWindow::PreMarket);
    f.session.minutes_since_open = 0;
    assert(time_window_for(f) == TimeWindow::OpeningDrive);
    f.session.minutes_since_open = 150;
    assert(time_window_for(f) == TimeWindow::LunchChop);
    f.session.minutes_since_open = 389;
    assert(time_window_for(f) == TimeWindow::PowerHour);
    f.session.minutes_since_open = 390;
    assert(time_window_for(f) == TimeWindow::AfterHours);
    f.session.minutes_since_open.reset();
    assert(!time_window_for(f).has_value());
    f.session.is_regular_hours = false;
    assert(time_window_for(f) == TimeWindow::AfterHours);

    // Strategy categories
    assert(categorize_strategy("breakout_bullish") == StrategyCategory::Breakout);
    assert(categorize_strategy("kcu_orb_breakout_long") == StrategyCategory::Breakout);
    assert(categorize_strategy("index_mean_reversion_short") == StrategyCategory::MeanReversion);
    assert(categorize_strategy("kcu_king_queen_long") == StrategyCategory::TrendContinuation);
    assert(categorize_strategy("gamma_flip_bearish") == StrategyCategory::Gamma);
    assert(categorize_strategy("eod_pin_setup") == StrategyCategory::Gamma);
    assert(categorize_strategy("power_hour_reversal_bullish") == StrategyCategory::Reversal);
    assert(categorize_strategy("opening_drive_bullish") == StrategyCategory::Breakout);

    // Mid-morning breakout in a trend, normal VIX
    auto calm = get_adaptive_thresholds(TimeWindow::MidMorning, VixLevel::Medium, MarketRegime::Trending,
                                        StrategyCategory::Breakout);
    assert(calm.strategy_enabled);
    assert(near(calm.min_base_score, 72) && near(calm.min_style_score, 75));
    assert(near(calm.min_risk_reward, 1.5) && near(calm.size_multiplier, 1.0));

    // Lunch breakout in a range with high VIX is switched off and much stricter
    auto lunch = get_adaptive_thresholds(TimeWindow::LunchChop, VixLevel::High, MarketRegime::Ranging,
                                         StrategyCategory::Breakout);
    assert(!lunch.strategy_enabled);
    assert(near(lunch.min_base_score, 95) && near(lunch.min_style_score, 93));
    assert(near(lunch.min_risk_reward, 2.5) && near(lunch.size_multiplier, 0.42));

    // Regime minimum wins over a loose time window
    auto drive = get_adaptive_thresholds(TimeWindow::OpeningDrive, VixLevel::Low, MarketRegime::Volatile,
                                         StrategyCategory::Reversal);
    assert(near(drive.min_base_score, 72) && near(drive.min_style_score, 67));
    assert(near(drive.min_risk_reward, 1.4) && near(drive.size_multiplier, 1.2));

    auto unknown = get_adaptive_thresholds(std::nullopt, std::nullopt, std::nullopt, StrategyCategory::Gamma);
    assert(near(unknown.min_base_score, 75) && near(unknown.min_style_score, 78));
    assert(unknown.strategy_enabled);

    // Tightening only raises minimums
    SignalThresholds base;
    base.min_base_score = 80;
    auto tightened = tighten(base, calm);
    assert(near(tightened.min_base_score, 80) && near(tightened.min_style_score, 75));
    assert(tightened.cooldown_minutes == base.cooldown_minutes);

    // Weekend planning thresholds
    auto weekend = weekend_thresholds(SignalThresholds{});
    assert(near(weekend.min_base_score, 60) && near(weekend.min_style_score, 65));
    assert(near(weekend.min_risk_reward, 1.3));
    SignalThresholds configured;
    configured.weekend_min_base_score = 55;
    assert(near(weekend_thresholds(configured).min_base_score, 55));

    // Scanner: disabled strategy is reported by category and regime
    auto adaptive_config = permissive_config();
    adaptive_config.enable_adaptive_thresholds = true;
    CompositeScanner scanner(adaptive_config);
    assert(!scanner.scan_symbol("SPY", breakout_snapshot()).filtered);

    auto ranging = breakout_snapshot("QQQ");
    ranging.pattern.market_regime = MarketRegime::Ranging;
    auto blocked = scanner.scan_symbol("QQQ", ranging);
    assert(blocked.filtered);
    assert(blocked.filter_reason == "breakout_bullish: Strategy breakout disabled in ranging regime");

    // Adaptive off: the same snapshot emits
    CompositeScanner plain(permissive_config());
    assert(!plain.scan_symbol("QQQ", ranging).filtered);

    // Weekend minimums replace the regular ones for off-hours historical review
    ScannerConfig strict;
    strict.default_thresholds.min_base_score = 90;
    strict.default_thresholds.weekend_min_base_score = 60;
    strict.default_thresholds.weekend_min_style_score = 65;
    CompositeScanner review(strict);

    auto live = review.scan_symbol("SPY", breakout_snapshot());
    assert(live.filtered);
    assert(live.filter_reason.find("breakout_bullish: Base score 82.") != std::string::npos);
    assert(live.filter_reason.find("< 90.0") != std::string::npos);

    auto off_hours = breakout_snapshot("SPY", session_time(1));
    off_hours.session.is_regular_hours = false;
    auto reviewed = review.scan_symbol("SPY", off_hours, nullptr, AnalysisMode::Historical);
    assert(!reviewed.filtered);
    assert(reviewed.signal->styles.recommended == TradingStyle::Swing);
    return 0;
}
