#include <cassert>
#include <cmath>
#include <limits>
#include <random>

#include "composite_scanner.hpp"
#include "registry.hpp"
#include "test_support.hpp"

static FeatureSnapshot random_snapshot(std::mt19937 &rng, const std::string &symbol) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> price_dist(20.0, 5000.0);
    std::uniform_real_distribution<double> pct(-3.0, 3.0);
    std::uniform_real_distribution<double> rsi(0.0, 100.0);
    std::uniform_int_distribution<int> minutes(-60, 450);
    std::uniform_int_distribution<int> regime(0, 3);
    std::uniform_int_distribution<int> vix(0, 3);
    std::uniform_int_distribution<int> count(0, 20);

    FeatureSnapshot f;
    f.symbol = symbol;
    f.timestamp = session_time(count(rng));
    double price = price_dist(rng);
    f.price.current = price;
    f.price.prev_close = price * (1.0 + pct(rng) / 100.0);
    if (unit(rng) < 0.3) f.price.spread_pct = unit(rng) * 0.2;
    if (unit(rng) < 0.8) {
        f.volume.avg = 1e6;
        f.volume.current = 1e6 * unit(rng) * 4.0;
        f.volume.relative_to_avg = *f.volume.current / 1e6;
    }
    if (unit(rng) < 0.8) {
        double distance = pct(rng);
        f.vwap.value = price / (1.0 + distance / 100.0);
        f.vwap.distance_pct = distance;
    }
    if (unit(rng) < 0.9) f.rsi[14] = rsi(rng);
    if (unit(rng) < 0.7) {
        f.ema[8] = price * (1.0 + pct(rng) / 300.0);
        f.ema[21] = price * (1.0 + pct(rng) / 300.0);
    }
    if (unit(rng) < 0.7) f.atr[14] = price * unit(rng) * 0.03;
    if (unit(rng) < 0.1) f.atr[14] = std::numeric_limits<double>::quiet_NaN();
    if (unit(rng) < 0.9) f.session.minutes_since_open = minutes(rng);
    if (unit(rng) < 0.9) f.session.is_regular_hours = unit(rng) < 0.8;
    if (unit(rng) < 0.8) f.pattern.market_regime = static_cast<MarketRegime>(regime(rng));
    if (unit(rng) < 0.5) f.pattern.vix_level = static_cast<VixLevel>(vix(rng));
    f.pattern.breakout_bullish = unit(rng) < 0.3;
    f.pattern.breakout_bearish = unit(rng) < 0.3;
    f.pattern.patience_candle = unit(rng) < 0.3;
    if (unit(rng) < 0.3) f.pattern.divergence = Divergence{unit(rng) < 0.5 ? Direction::Long : Direction::Short, unit(rng)};
    if (unit(rng) < 0.4) {
        f.pattern.orb_high = price * (1.0 + unit(rng) / 100.0);
        f.pattern.orb_low = price * (1.0 - unit(rng) / 100.0);
    }
    if (unit(rng) < 0.5) {
        FlowAggregates flow;
        flow.flow_score = unit(rng) * 100.0;
        flow.flow_bias = static_cast<FlowBias>(std::uniform_int_distribution<int>(0, 2)(rng));
        flow.sweep_count = count(rng);
        flow.block_count = count(rng);
        flow.buy_pressure = unit(rng) * 100.0;
        flow.large_trade_percentage = unit(rng) * 100.0;
        flow.aggressiveness = static_cast<Aggressiveness>(std::uniform_int_distribution<int>(0, 3)(rng));
        f.flow = flow;
    }
    if (unit(rng) < 0.5) {
        for (const char *tf : {"1m", "5m", "15m", "60m"}) {
            TimeframeSnapshot snapshot;
            snapshot.price.current = price * (1.0 + pct(rng) / 200.0);
            snapshot.ema[8] = price * (1.0 + pct(rng) / 200.0);
            snapshot.ema[21] = price * (1.0 + pct(rng) / 200.0);
            snapshot.rsi[14] = rsi(rng);
            snapshot.atr = price * 0.01;
            f.mtf[tf] = snapshot;
        }
    }
    return f;
}

static OptionsChainData random_options(std::mt19937 &rng, double price) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    OptionsChainData options;
    options.dealer_net_gamma = (unit(rng) - 0.5) * 1e9;
    options.max_gamma_strike = price * (1.0 + (unit(rng) - 0.5) / 50.0);
    options.max_pain_strike = price * (1.0 + (unit(rng) - 0.5) / 50.0);
    options.gamma_flip_level = price * (1.0 + (unit(rng) - 0.5) / 50.0);
    options.call_put_ratio = unit(rng) * 3.0;
    options.minutes_to_expiry = static_cast<int>(unit(rng) * 400);
    options.is_0dte = unit(rng) < 0.5;
    double oi = unit(rng) * 1e5;
    options.open_interest_at_strike = [oi](double) { return oi; };
    return options;
}

int main() {
    std::mt19937 rng(1234);
    auto registry = DetectorRegistry::with_builtin_detectors();
    const char *symbols[] = {"SPY", "AAPL", "SPX", "QQQ", "TSLA", "NDX"};

    CompositeScanner scanner(permissive_config());

    for (int i = 0; i < 2000; ++i) {
        const std::string symbol = symbols[i % 6];
        auto f = random_snapshot(rng, symbol);
        auto options = random_options(rng, f.price.current);
        const OptionsChainData *chain = (i % 2 == 0) ? &options : nullptr;
        AnalysisMode mode = (i % 3 == 0) ? AnalysisMode::Historical : AnalysisMode::Live;

        for (const auto &d : registry.all()) {
            auto composite = calculate_composite_score(d.score_factors, f, chain);
            assert(composite.score >= 0.0 && composite.score <= 100.0);
            for (const auto &factor : composite.factors) {
                assert(factor.score >= 0.0 && factor.score <= 100.0);
            }

            auto result = d.detect_with_score(f, chain, mode);
            if (!d.detect(f, chain, mode)) {
                assert(!result.detected);
            } else {
                assert(result.detected);
                assert(result.base_score >= 0.0 && result.base_score <= 100.0);
            }
        }

        // Every emission comes from a detector whose gate passed
        auto scan = scanner.scan_symbol(symbol, f, chain, mode);
        assert(scan.filtered == scan.signals.empty());
        for (const auto &signal : scan.signals) {
            const auto *d = registry.find(signal.detector_type);
            assert(d != nullptr);
            assert(d->detect(f, chain, scanner.config().filters.allow_non_regular_hours ? AnalysisMode::Historical : mode));
            assert(signal.base_score >= 0.0 && signal.base_score <= 100.0);
            assert(signal.confidence >= 0.0 && signal.confidence <= 100.0);
            assert(signal.styles.recommended_score >= 0.0 && signal.styles.recommended_score <= 100.0);
        }
        assert(scan.signals.size() <= static_cast<size_t>(scan.detection_count));
    }

    // A detector whose gate never passes never emits
    auto never = std::make_shared<DetectorRegistry>();
    OpportunityDetector closed;
    closed.type = "closed_gate";
    closed.asset_classes = {AssetClass::Stock, AssetClass::EquityEtf, AssetClass::Index};
    closed.gate = [](const FeatureSnapshot &, const OptionsChainData *, AnalysisMode) { return false; };
    closed.score_factors = {{"max", 1.0, [](const FeatureSnapshot &, const OptionsChainData *) { return 100.0; }}};
    never->register_detector(closed);

    CompositeScanner closed_scanner(permissive_config(), std::make_shared<SignalDeduplication>(), never);
    for (int i = 0; i < 200; ++i) {
        auto f = random_snapshot(rng, symbols[i % 6]);
        auto scan = closed_scanner.scan_symbol(f.symbol, f, nullptr, AnalysisMode::Historical);
        assert(scan.filtered);
        assert(scan.detection_count == 0);
        assert(!scan.signal.has_value());
    }
    return 0;
}
