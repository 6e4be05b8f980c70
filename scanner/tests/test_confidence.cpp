#include <algorithm>
#include <cassert>
#include <string>

#include "confidence.hpp"
#include "test_support.hpp"

static bool has(const std::vector<std::string> &names, const std::string &name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

int main() {
    ConfidenceScorer scorer;

    assert(ConfidenceScorer::confidence_level(80) == "high");
    assert(ConfidenceScorer::confidence_level(79.9) == "medium");
    assert(ConfidenceScorer::confidence_level(60) == "medium");
    assert(ConfidenceScorer::confidence_level(40) == "low");
    assert(ConfidenceScorer::confidence_level(39.9) == "very_low");

    // Price alone: both other critical inputs missing
    FeatureSnapshot bare;
    bare.symbol = "AAPL";
    bare.price.current = 180.0;
    auto sparse = scorer.calculate_data_confidence(bare, false);
    assert(has(sparse.missing_critical, "volume"));
    assert(has(sparse.missing_critical, "atr"));
    assert(sparse.base_confidence == 70.0);
    assert(sparse.completeness < 50.0);
    assert(sparse.multiplier >= 0.0 && sparse.multiplier <= 1.0);

    // Weekend review does not require live volume
    auto weekend = scorer.calculate_data_confidence(bare, true);
    assert(!has(weekend.missing_critical, "volume"));
    assert(has(weekend.missing_critical, "atr"));

    // A fuller snapshot is more complete and more trusted
    auto full = breakout_snapshot();
    full.ema[8] = 101.0;
    full.ema[21] = 100.5;
    full.pattern.vix_level = VixLevel::Medium;
    full.pattern.swing_high = 102.0;
    full.pattern.swing_low = 98.0;
    full.pattern.orb_high = 100.8;
    full.pattern.orb_low = 99.6;
    auto rich = scorer.calculate_data_confidence(full, false);
    assert(rich.missing_critical.empty());
    assert(rich.completeness > sparse.completeness);
    assert(rich.adjusted_confidence > sparse.adjusted_confidence);

    auto trending = scorer.score(full, Direction::Long, 80.0, AnalysisMode::Live);
    assert(trending.confidence > 0.0 && trending.confidence <= 100.0);
    assert(trending.level == ConfidenceScorer::confidence_level(trending.confidence));

    // Unstable regimes down-weight
    auto choppy_snapshot = full;
    choppy_snapshot.pattern.market_regime = MarketRegime::Choppy;
    auto choppy = scorer.score(choppy_snapshot, Direction::Long, 80.0, AnalysisMode::Live);
    assert(choppy.confidence < trending.confidence);

    // Flow alignment
    auto aligned_snapshot = full;
    FlowAggregates flow;
    flow.flow_score = 85.0;
    flow.flow_bias = FlowBias::Bullish;
    aligned_snapshot.flow = flow;
    auto aligned = scorer.score(aligned_snapshot, Direction::Long, 80.0, AnalysisMode::Live);
    auto opposed = scorer.score(aligned_snapshot, Direction::Short, 80.0, AnalysisMode::Live);
    assert(aligned.confidence > opposed.confidence);
    assert(!aligned.adjustments.empty());

    // Timeframes agreeing with the trade
    auto mtf_snapshot = full;
    for (const char *tf : {"1m", "5m", "15m", "60m"}) {
        TimeframeSnapshot snapshot;
        snapshot.price.current = 101.2;
        snapshot.ema[21] = 100.0;
        snapshot.atr = 0.8;
        mtf_snapshot.mtf[tf] = snapshot;
    }
    auto with_trend = scorer.score(mtf_snapshot, Direction::Long, 70.0, AnalysisMode::Live);
    auto against_trend = scorer.score(mtf_snapshot, Direction::Short, 70.0, AnalysisMode::Live);
    assert(with_trend.confidence > against_trend.confidence);

    // Out of range raw scores stay bounded
    assert(scorer.score(full, Direction::Long, 250.0, AnalysisMode::Live).confidence <= 100.0);
    assert(scorer.score(full, Direction::Long, -20.0, AnalysisMode::Live).confidence == 0.0);
    return 0;
}
