#include <cassert>
#include <cmath>
#include <random>

#include "style_modifiers.hpp"
#include "test_support.hpp"

static bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

int main() {
    // Neutral context leaves every style at the base score
    StyleFactors neutral;
    auto flat = calculate_style_modifiers(neutral);
    assert(near(flat.scalp, 1.0) && near(flat.day_trade, 1.0) && near(flat.swing, 1.0));
    auto flat_scores = apply_style_modifiers(70.0, flat);
    assert(near(flat_scores.scalp, 70.0));
    assert(flat_scores.recommended == TradingStyle::DayTrade);

    // Opening drive on a volume spike favours scalps
    StyleFactors opening;
    opening.window = TimeWindow::OpeningDrive;
    opening.relative_volume = 2.0;
    auto drive = calculate_style_modifiers(opening);
    assert(drive.scalp > drive.swing);
    auto drive_scores = apply_style_modifiers(60.0, drive);
    assert(drive_scores.recommended == TradingStyle::Scalp);

    // Lunch chop in a choppy regime sinks to the floor
    StyleFactors lunch;
    lunch.window = TimeWindow::LunchChop;
    lunch.regime = MarketRegime::Choppy;
    lunch.mtf_alignment = 20.0;
    auto chop = calculate_style_modifiers(lunch);
    assert(near(chop.scalp, 0.5) && near(chop.swing, 0.5));
    assert(!chop.warnings.empty());

    // Planning review leans on swings
    StyleFactors planning;
    planning.planning = true;
    planning.regime = MarketRegime::Trending;
    auto review = calculate_style_modifiers(planning);
    assert(near(review.swing, 1.5));
    assert(apply_style_modifiers(50.0, review).recommended == TradingStyle::Swing);

    // Last half hour cuts day trades
    StyleFactors closing;
    closing.window = TimeWindow::PowerHour;
    closing.minutes_to_close = 20;
    auto late = calculate_style_modifiers(closing);
    assert(near(late.day_trade, 1.2 * 0.6));

    // Extraction from a snapshot
    auto f = breakout_snapshot();
    auto factors = extract_style_factors(f, Direction::Long, AnalysisMode::Live);
    assert(factors.window == TimeWindow::MidMorning);
    assert(!factors.planning);
    assert(factors.minutes_to_close == 330);
    assert(near(*factors.relative_volume, 2.5));
    assert(!factors.near_key_level);
    f.session.is_regular_hours = false;
    assert(extract_style_factors(f, Direction::Long, AnalysisMode::Historical).planning);

    // Modifiers and scores stay in range for any context
    std::mt19937 rng(99);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (int i = 0; i < 5000; ++i) {
        StyleFactors random;
        if (unit(rng) < 0.8) random.window = static_cast<TimeWindow>(static_cast<int>(unit(rng) * 9));
        random.planning = unit(rng) < 0.2;
        if (unit(rng) < 0.8) random.regime = static_cast<MarketRegime>(static_cast<int>(unit(rng) * 4));
        if (unit(rng) < 0.8) random.atr_percent = unit(rng) * 5.0;
        if (unit(rng) < 0.8) random.relative_volume = unit(rng) * 4.0;
        random.near_key_level = unit(rng) < 0.5;
        if (unit(rng) < 0.8) random.rsi = unit(rng) * 100.0;
        random.mtf_alignment = unit(rng) * 100.0;
        if (unit(rng) < 0.8) random.minutes_to_close = static_cast<int>(unit(rng) * 390);

        auto m = calculate_style_modifiers(random);
        for (double v : {m.scalp, m.day_trade, m.swing}) {
            assert(v >= 0.5 && v <= 1.5);
        }
        double base = unit(rng) * 100.0;
        auto scores = apply_style_modifiers(base, m);
        assert(scores.recommended_score >= scores.scalp);
        assert(scores.recommended_score >= scores.day_trade);
        assert(scores.recommended_score >= scores.swing);
        assert(scores.recommended_score <= 100.0);
    }

    // Risk/reward from the style's ATR profile
    auto entry = breakout_snapshot();
    auto day = calculate_risk_reward(entry, Direction::Long, TradingStyle::DayTrade);
    assert(near(day.stop, 101.2 - 1.1));
    assert(near(day.target2, 101.2 + 2.5 * 1.1));
    assert(std::abs(day.ratio - 2.5) < 1e-9);

    auto scalp_short = calculate_risk_reward(entry, Direction::Short, TradingStyle::Scalp);
    assert(scalp_short.stop > scalp_short.entry);
    assert(scalp_short.target3 < scalp_short.target1);
    assert(std::abs(scalp_short.ratio - 2.0) < 1e-9);

    // No ATR anywhere: fixed fallback
    auto no_atr = entry;
    no_atr.atr.clear();
    auto swing = calculate_risk_reward(no_atr, Direction::Long, TradingStyle::Swing);
    assert(near(swing.entry - swing.stop, 3.0));
    assert(std::abs(swing.ratio - 2.0) < 1e-9);
    return 0;
}
