#include "config.hpp"
#include "composite_scanner.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Global atomic flag to handle termination signals
std::atomic<bool> g_terminate_flag(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

int main(int argc, char* argv[]) {
    // Logs go to stderr so stdout carries only signals
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("composite_scanner", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::info);

    std::vector<std::string> positional;
    AnalysisMode mode = AnalysisMode::Live;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--historical") {
            mode = AnalysisMode::Historical;
        } else {
            positional.push_back(arg);
        }
    }

    ScannerConfig config;
    try {
        if (!positional.empty()) {
            config.load(positional[0]);
            spdlog::info("Configuration loaded from {}", positional[0]);
        }
        config.load_from_env();
        config.validate();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    std::ifstream file;
    if (positional.size() > 1) {
        file.open(positional[1]);
        if (!file.is_open()) {
            spdlog::critical("Cannot open snapshot file: {}", positional[1]);
            return 1;
        }
    }
    std::istream& input = positional.size() > 1 ? static_cast<std::istream&>(file) : std::cin;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::unique_ptr<CompositeScanner> scanner;
    try {
        scanner = std::make_unique<CompositeScanner>(config);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize the scanner: {}", e.what());
        return 1;
    }

    spdlog::info("Replaying snapshots in {} mode", mode == AnalysisMode::Historical ? "historical" : "live");

    size_t line_number = 0;
    size_t scanned = 0;
    size_t emitted = 0;
    std::string line;
    while (!g_terminate_flag && std::getline(input, line)) {
        line_number++;
        if (line.empty()) {
            continue;
        }

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("Skipping line {}: {}", line_number, e.what());
            continue;
        }

        auto features = FeatureSnapshot::from_json(j.value("features", nlohmann::json::object()));
        if (!features) {
            spdlog::warn("Skipping line {}: malformed features", line_number);
            continue;
        }
        std::string symbol = j.value("symbol", features->symbol);
        if (symbol.empty()) {
            spdlog::warn("Skipping line {}: missing symbol", line_number);
            continue;
        }

        std::optional<OptionsChainData> options;
        if (j.contains("options") && !j["options"].is_null()) {
            options = OptionsChainData::from_json(j["options"]);
            if (!options) {
                spdlog::warn("Line {}: ignoring malformed options chain", line_number);
            }
        }

        auto result = scanner->scan_symbol(symbol, *features, options ? &*options : nullptr, mode);
        scanned++;

        if (result.filtered) {
            spdlog::debug("{} filtered: {}", result.symbol, result.filter_reason);
            continue;
        }
        for (const auto& signal : result.signals) {
            std::cout << signal.to_json().dump() << std::endl;
            emitted++;
        }
    }

    auto stats = scanner->deduplication_stats();
    spdlog::info("Replay finished: {} scanned, {} signals emitted, dedup {}",
                 scanned, emitted, stats.to_json().dump());
    spdlog::shutdown();
    return 0;
}
