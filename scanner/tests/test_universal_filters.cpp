#include <cassert>
#include <string>

#include "composite_scanner.hpp"
#include "test_support.hpp"

static bool starts_with(const std::string &value, const std::string &prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

int main() {
    // Scenario A: relative volume below the minimum
    {
        auto config = permissive_config();
        config.filters.min_rvol = 0.5;
        CompositeScanner scanner(config);

        auto f = breakout_snapshot();
        f.volume.relative_to_avg = 0.3;
        auto result = scanner.scan_symbol("SPY", f);
        assert(result.filtered);
        assert(!result.signal.has_value());
        assert(result.detection_count == 0);
        assert(starts_with(result.filter_reason, "Failed universal filters"));
        assert(result.filter_reason.find("relative volume") != std::string::npos);
    }

    // Blacklist, case-insensitive, checked before everything else
    {
        auto config = permissive_config();
        config.filters.blacklist = {"tsla"};
        config.filters.min_rvol = 5.0;
        CompositeScanner scanner(config);
        auto result = scanner.scan_symbol("TSLA", breakout_snapshot("TSLA"));
        assert(result.filtered);
        assert(result.filter_reason == "Failed universal filters: symbol is blacklisted");
        auto next = scanner.scan_symbol("AAPL", breakout_snapshot("AAPL"));
        assert(next.filter_reason.find("relative volume") != std::string::npos);
    }

    // Market hours: live scans stop, historical scans and the override pass
    {
        CompositeScanner scanner(permissive_config());
        auto f = breakout_snapshot();
        f.session.is_regular_hours = false;
        auto live = scanner.scan_symbol("SPY", f, nullptr, AnalysisMode::Live);
        assert(live.filtered);
        assert(live.filter_reason == "Failed universal filters: outside regular market hours");

        auto historical = scanner.scan_symbol("SPY", f, nullptr, AnalysisMode::Historical);
        assert(!historical.filtered);

        auto allow = permissive_config();
        allow.filters.allow_non_regular_hours = true;
        CompositeScanner weekend(allow);
        assert(!weekend.scan_symbol("SPY", f, nullptr, AnalysisMode::Live).filtered);

        // Unknown session counts as regular hours
        auto unknown = breakout_snapshot("QQQ");
        unknown.session.is_regular_hours.reset();
        assert(!scanner.scan_symbol("QQQ", unknown).filtered);

        auto no_filter = permissive_config();
        no_filter.filters.market_hours_only = false;
        CompositeScanner anytime(no_filter);
        auto gated = anytime.scan_symbol("SPY", f, nullptr, AnalysisMode::Live);
        assert(gated.filtered);
        assert(gated.filter_reason == "No opportunities detected");
    }

    // Spread, in percent of price against a fractional maximum
    {
        auto config = permissive_config();
        config.filters.max_spread = 0.001;
        CompositeScanner scanner(config);
        auto wide = breakout_snapshot();
        wide.price.spread_pct = 0.25;
        auto result = scanner.scan_symbol("SPY", wide);
        assert(result.filtered);
        assert(result.filter_reason.find("spread") != std::string::npos);

        auto tight = breakout_snapshot("QQQ");
        tight.price.spread_pct = 0.05;
        assert(!scanner.scan_symbol("QQQ", tight).filtered);
    }

    // Liquidity
    {
        auto config = permissive_config();
        config.filters.require_minimum_liquidity = true;
        config.filters.min_avg_volume = 2000000;
        CompositeScanner scanner(config);
        auto thin = scanner.scan_symbol("SPY", breakout_snapshot());
        assert(thin.filtered);
        assert(thin.filter_reason.find("average volume") != std::string::npos);

        auto unknown = breakout_snapshot("QQQ");
        unknown.volume.avg.reset();
        auto unknown_result = scanner.scan_symbol("QQQ", unknown);
        assert(unknown_result.filtered);
        assert(unknown_result.filter_reason == "Failed universal filters: average volume unknown");

        auto deep = breakout_snapshot("IWM");
        deep.volume.avg = 5000000;
        deep.volume.current = 12500000;
        assert(!scanner.scan_symbol("IWM", deep).filtered);
    }

    // Disabled detectors are never run
    {
        auto config = permissive_config();
        config.disabled_detectors = {"breakout_bullish"};
        CompositeScanner scanner(config);
        auto result = scanner.scan_symbol("SPY", breakout_snapshot());
        assert(result.filtered);
        assert(result.detection_count == 0);
        assert(result.filter_reason == "No opportunities detected");
    }
    return 0;
}
