#include <cassert>
#include <cmath>
#include <string>

#include <nlohmann/json.hpp>

#include "composite_scanner.hpp"
#include "test_support.hpp"

int main() {
    auto j = nlohmann::json::parse(R"({
        "symbol": "SPY",
        "timestamp": "2024-03-05T15:30:00.000Z",
        "price": {"current": 101.2, "prevClose": 99.5, "spreadPct": 0.02},
        "volume": {"current": 2500000, "avg": 1000000, "relativeToAvg": 2.5},
        "vwap": {"value": 100.0, "distancePct": 1.2},
        "rsi": {"14": 65.0},
        "ema": {"8": 101.0, "21": 100.4, "bad": 3},
        "atr": 1.1,
        "session": {"minutesSinceOpen": 60, "isRegularHours": true},
        "pattern": {
            "market_regime": "trending",
            "vix_level": "medium",
            "breakout_bullish": true,
            "divergence": {"type": "bullish", "confidence": 70}
        },
        "flow": {"flowScore": 72, "flowBias": "bullish", "sweepCount": 4, "aggressiveness": "AGGRESSIVE"},
        "mtf": {"5m": {"price": {"current": 101.1}, "ema": {"21": 100.6}, "atr": 0.6}}
    })");

    auto f = FeatureSnapshot::from_json(j);
    assert(f.has_value());
    assert(f->symbol == "SPY");
    assert(f->timestamp == session_time());
    assert(f->price.current == 101.2);
    assert(*f->price.spread_pct == 0.02);
    assert(*f->volume.relative_to_avg == 2.5);
    assert(*f->rsi_at(14) == 65.0);
    assert(f->ema.size() == 2);
    assert(*f->atr_at(14) == 1.1);
    assert(*f->session.minutes_since_open == 60);
    assert(*f->session.is_regular_hours);
    assert(f->pattern.market_regime == MarketRegime::Trending);
    assert(f->pattern.vix_level == VixLevel::Medium);
    assert(f->pattern.breakout_bullish);
    assert(f->pattern.divergence->direction == Direction::Long);
    assert(f->flow->flow_bias == FlowBias::Bullish);
    assert(f->flow->sweep_count == 4);
    assert(f->flow->aggressiveness == Aggressiveness::Aggressive);
    assert(*f->mtf.at("5m").atr == 0.6);

    // Malformed snapshots are rejected, not thrown
    assert(!FeatureSnapshot::from_json(nlohmann::json::parse(R"({"symbol": "SPY"})")).has_value());
    assert(!FeatureSnapshot::from_json(nlohmann::json::parse(R"({"symbol": "SPY", "price": {}})")).has_value());
    assert(!FeatureSnapshot::from_json(
        nlohmann::json::parse(R"({"symbol": "SPY", "timestamp": "yesterday", "price": {"current": 1}})")).has_value());

    // Integers outside int range are dropped, epoch times outside the clock range reject the snapshot
    auto huge = FeatureSnapshot::from_json(nlohmann::json::parse(R"({
        "symbol": "X",
        "price": {"current": 5},
        "session": {"minutesSinceOpen": 1e12},
        "flow": {"sweepCount": -1e20, "blockCount": 3}
    })"));
    assert(huge.has_value());
    assert(!huge->session.minutes_since_open.has_value());
    assert(huge->flow->sweep_count == 0);
    assert(huge->flow->block_count == 3);
    assert(!FeatureSnapshot::from_json(
        nlohmann::json::parse(R"({"symbol": "X", "timestamp": 1e300, "price": {"current": 5}})")).has_value());
    auto epoch = FeatureSnapshot::from_json(
        nlohmann::json::parse(R"({"symbol": "X", "timestamp": 1709652600000, "price": {"current": 5}})"));
    assert(epoch.has_value());
    assert(epoch->timestamp == session_time());

    // Unset session fields stay unknown
    auto minimal = FeatureSnapshot::from_json(nlohmann::json::parse(R"({"symbol": "X", "price": {"current": 5}})"));
    assert(minimal.has_value());
    assert(!minimal->session.is_regular_hours.has_value());
    assert(!minimal->flow.has_value());

    // Options chain
    auto options = OptionsChainData::from_json(nlohmann::json::parse(R"({
        "dealerNetGamma": -2.5e8,
        "gammaFlipLevel": 5010,
        "minutesToExpiry": 45,
        "is0DTE": true,
        "openInterestByStrike": {"5000": 12000, "5025": 8000}
    })"));
    assert(options.has_value());
    assert(*options->dealer_net_gamma < 0.0);
    assert(*options->minutes_to_expiry == 45);
    assert(options->is_0dte);
    assert(options->open_interest_at_strike(5000.0) == 12000.0);
    assert(options->open_interest_at_strike(4975.0) == 0.0);
    assert(!OptionsChainData::from_json(nlohmann::json::array()).has_value());
    auto far_expiry = OptionsChainData::from_json(nlohmann::json::parse(R"({"minutesToExpiry": 9e18})"));
    assert(far_expiry.has_value());
    assert(!far_expiry->minutes_to_expiry.has_value());

    // Parsed snapshot scans like the hand-built one
    CompositeScanner scanner{ScannerConfig{}};
    auto result = scanner.scan_symbol("spy", *f);
    assert(result.symbol == "SPY");
    assert(result.detection_count >= 1);

    // Emitted signal serialises with ISO timestamps and the bar key
    if (!result.filtered) {
        auto out = result.signal->to_json();
        assert(out["detectedAt"] == "2024-03-05T15:30:00.000Z");
        assert(out["expiresAt"] == "2024-03-05T15:35:00.000Z");
        assert(out["barTimeKey"] == "SPY:2024-03-05T15:30:00.000Z:" + result.signal->detector_type);
        assert(out["targets"].size() == 3);
    }
    return 0;
}
