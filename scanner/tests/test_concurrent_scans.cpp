#include <atomic>
#include <cassert>
#include <string>
#include <thread>
#include <vector>

#include "composite_scanner.hpp"
#include "test_support.hpp"

int main() {
    // Racing scans of one bar admit exactly one signal
    {
        auto config = permissive_config();
        config.default_thresholds.cooldown_minutes = 15;
        CompositeScanner scanner(config);
        auto snapshot = breakout_snapshot();

        std::atomic<int> emitted{0};
        std::atomic<int> duplicates{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < 50; ++i) {
                    auto result = scanner.scan_symbol("SPY", snapshot);
                    if (!result.filtered) {
                        emitted++;
                    } else if (result.filter_reason.find("Duplicate bar time key") != std::string::npos) {
                        duplicates++;
                    }
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }
        assert(emitted == 1);
        assert(duplicates == 8 * 50 - 1);
    }

    // Shared store across scanners, config swaps while scanning
    {
        auto dedup = std::make_shared<SignalDeduplication>();
        auto registry = std::make_shared<const DetectorRegistry>(DetectorRegistry::with_builtin_detectors());
        CompositeScanner a(permissive_config(), dedup, registry);
        CompositeScanner b(permissive_config(), dedup, registry);

        assert(!a.scan_symbol("QQQ", breakout_snapshot("QQQ")).filtered);
        assert(b.scan_symbol("QQQ", breakout_snapshot("QQQ")).filtered);

        std::atomic<bool> done{false};
        std::thread updater([&]() {
            for (int i = 0; i < 100 && !done; ++i) {
                auto config = permissive_config();
                config.default_thresholds.cooldown_minutes = i % 2;
                a.update_config(config);
            }
        });
        for (int i = 0; i < 200; ++i) {
            auto result = a.scan_symbol("IWM", breakout_snapshot("IWM", session_time(i)));
            assert(result.detection_count == 1);
        }
        done = true;
        updater.join();
    }

    // Batch: symbols in parallel, each symbol in order, results in input order
    {
        auto config = permissive_config();
        config.thread_pool_size = 4;
        CompositeScanner scanner(config);

        std::vector<ScanRequest> requests;
        const char *symbols[] = {"SPY", "QQQ", "IWM", "DIA", "AAPL", "MSFT"};
        for (int round = 0; round < 3; ++round) {
            for (const char *symbol : symbols) {
                requests.push_back({symbol, breakout_snapshot(symbol), std::nullopt});
            }
        }

        auto results = scanner.scan_batch(requests);
        assert(results.size() == requests.size());
        for (size_t i = 0; i < results.size(); ++i) {
            assert(results[i].symbol == requests[i].symbol);
            if (i < 6) {
                assert(!results[i].filtered);
            } else {
                assert(results[i].filtered);
                assert(results[i].filter_reason.find("Duplicate bar time key") != std::string::npos);
            }
        }
        assert(scanner.deduplication_stats(session_time()).unique_symbols == 6);
        assert(scanner.scan_batch({}).empty());
    }
    return 0;
}
