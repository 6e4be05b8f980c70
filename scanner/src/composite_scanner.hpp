#pragma once

#include "config.hpp"
#include "registry.hpp"
#include "signal_dedup.hpp"
#include "confidence.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct ScanRequest {
    std::string symbol;
    FeatureSnapshot features;
    std::optional<OptionsChainData> options;
};

class CompositeScanner {
public:
    explicit CompositeScanner(const ScannerConfig& config);

    // Share a dedup store or registry between scanners; throws on an invalid config
    CompositeScanner(
        const ScannerConfig& config,
        std::shared_ptr<SignalDeduplication> dedup,
        std::shared_ptr<const DetectorRegistry> registry
    );

    // Filters, runs every applicable detector and emits what passes thresholds and dedup
    ScanResult scan_symbol(
        const std::string& symbol,
        const FeatureSnapshot& features,
        const OptionsChainData* options = nullptr,
        AnalysisMode mode = AnalysisMode::Live
    );

    // Symbols scan concurrently, requests for one symbol in order; results follow input order
    std::vector<ScanResult> scan_batch(const std::vector<ScanRequest>& requests, AnalysisMode mode = AnalysisMode::Live);

    // Validates before swapping; the previous config stays on failure
    void update_config(const ScannerConfig& config);

    ScannerConfig config() const;

    DedupStats deduplication_stats(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
    void clear_deduplication();

    const DetectorRegistry& registry() const { return *registry_; }

private:
    // validate() plus every detector named by overrides or the disabled list must be registered
    void validate_config(const ScannerConfig& config) const;

    // Empty when the snapshot passes, otherwise the failing filter
    std::string check_universal_filters(
        const ScannerConfig& config,
        const std::string& symbol,
        const FeatureSnapshot& features,
        AnalysisMode mode
    ) const;

    std::vector<const OpportunityDetector*> select_detectors(
        const ScannerConfig& config,
        AssetClass asset_class,
        bool has_options
    ) const;

    std::shared_ptr<SignalDeduplication> dedup_;
    std::shared_ptr<const DetectorRegistry> registry_;
    ConfidenceScorer confidence_scorer_;

    mutable std::mutex config_mutex_;
    ScannerConfig config_;
};
