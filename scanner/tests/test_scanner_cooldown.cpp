#include <cassert>
#include <string>

#include "composite_scanner.hpp"
#include "test_support.hpp"

int main() {
    auto config = permissive_config();
    config.default_thresholds.cooldown_minutes = 15;
    CompositeScanner scanner(config);

    auto first = scanner.scan_symbol("SPY", breakout_snapshot("SPY", session_time(0)));
    assert(!first.filtered);
    assert(first.signal->detector_type == "breakout_bullish");

    // T + cooldown - 1
    auto early = scanner.scan_symbol("SPY", breakout_snapshot("SPY", session_time(14)));
    assert(early.filtered);
    assert(early.detection_count == 1);
    assert(early.filter_reason.find("In cooldown (15 minutes, last emission 14 minutes ago)") != std::string::npos);

    // T + cooldown + 1
    auto later = scanner.scan_symbol("SPY", breakout_snapshot("SPY", session_time(16)));
    assert(!later.filtered);
    assert(later.signal->detected_at == session_time(16));

    // Cooldown is per symbol and detector
    auto other = scanner.scan_symbol("QQQ", breakout_snapshot("QQQ", session_time(17)));
    assert(!other.filtered);

    // A per-detector override replaces the default cooldown
    auto overridden = permissive_config();
    overridden.default_thresholds.cooldown_minutes = 15;
    overridden.detector_thresholds["breakout_bullish"].cooldown_minutes = 5;
    CompositeScanner short_cooldown(overridden);
    assert(!short_cooldown.scan_symbol("SPY", breakout_snapshot("SPY", session_time(0))).filtered);
    assert(short_cooldown.scan_symbol("SPY", breakout_snapshot("SPY", session_time(4))).filtered);
    assert(!short_cooldown.scan_symbol("SPY", breakout_snapshot("SPY", session_time(6))).filtered);

    // A tick stamped before the last emission is still inside the cooldown
    CompositeScanner out_of_order(config);
    assert(!out_of_order.scan_symbol("IWM", breakout_snapshot("IWM", session_time(10))).filtered);
    auto behind = out_of_order.scan_symbol("IWM", breakout_snapshot("IWM", session_time(9)));
    assert(behind.filtered);
    assert(behind.filter_reason.find("In cooldown (15 minutes, later emission 1 minutes ahead)") != std::string::npos);
    assert(!out_of_order.scan_symbol("IWM", breakout_snapshot("IWM", session_time(-6))).filtered);

    // Clearing the store lifts the cooldown
    scanner.clear_deduplication();
    assert(!scanner.scan_symbol("SPY", breakout_snapshot("SPY", session_time(18))).filtered);
    return 0;
}
