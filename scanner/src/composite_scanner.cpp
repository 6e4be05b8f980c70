#include "composite_scanner.hpp"
#include "factors.hpp"
#include "style_modifiers.hpp"
#include "thresholds.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <map>
#include <stdexcept>
#include <thread>

namespace {
    std::chrono::system_clock::time_point scan_clock(const FeatureSnapshot& features) {
        if (features.timestamp == std::chrono::system_clock::time_point{}) {
            return std::chrono::system_clock::now();
        }
        return features.timestamp;
    }

    bool contains(const std::vector<std::string>& values, const std::string& value) {
        return std::find(values.begin(), values.end(), value) != values.end();
    }
}

CompositeScanner::CompositeScanner(const ScannerConfig& config)
    : CompositeScanner(
          config,
          std::make_shared<SignalDeduplication>(config.dedup_retention()),
          std::make_shared<const DetectorRegistry>(DetectorRegistry::with_builtin_detectors())) {}

CompositeScanner::CompositeScanner(
    const ScannerConfig& config,
    std::shared_ptr<SignalDeduplication> dedup,
    std::shared_ptr<const DetectorRegistry> registry
) : dedup_(std::move(dedup)), registry_(std::move(registry)), config_(config) {
    if (!dedup_ || !registry_) {
        throw std::runtime_error("CompositeScanner requires a dedup store and a detector registry");
    }
    validate_config(config_);
    dedup_->set_retention(config_.dedup_retention());

    spdlog::info("Composite scanner ready with {} detectors (version {})",
                 registry_->size(), config_.detector_version);
}

ScannerConfig CompositeScanner::config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void CompositeScanner::validate_config(const ScannerConfig& config) const {
    config.validate();

    for (const auto& entry : config.detector_thresholds) {
        if (!registry_->find(entry.first)) {
            throw std::runtime_error("detector_thresholds names unknown detector: " + entry.first);
        }
    }
    for (const auto& type : config.disabled_detectors) {
        if (!registry_->find(type)) {
            throw std::runtime_error("disabled_detectors names unknown detector: " + type);
        }
    }
}

void CompositeScanner::update_config(const ScannerConfig& config) {
    validate_config(config);

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = config;
    }
    dedup_->set_retention(config.dedup_retention());

    spdlog::info("Scanner configuration updated: min_base={}, min_style={}, min_rr={}, cooldown={}m",
                 config.default_thresholds.min_base_score,
                 config.default_thresholds.min_style_score,
                 config.default_thresholds.min_risk_reward,
                 config.default_thresholds.cooldown_minutes);
}

DedupStats CompositeScanner::deduplication_stats(std::chrono::system_clock::time_point now) const {
    return dedup_->stats(now);
}

void CompositeScanner::clear_deduplication() {
    dedup_->clear();
    spdlog::info("Deduplication store cleared");
}

std::string CompositeScanner::check_universal_filters(
    const ScannerConfig& config,
    const std::string& symbol,
    const FeatureSnapshot& features,
    AnalysisMode mode
) const {
    const auto& filters = config.filters;

    if (config.is_blacklisted(symbol)) {
        return "symbol is blacklisted";
    }

    if (filters.market_hours_only && mode == AnalysisMode::Live && !filters.allow_non_regular_hours
        && features.session.is_regular_hours == false) {
        return "outside regular market hours";
    }

    auto rvol = relative_volume(features);
    if (filters.min_rvol > 0.0 && rvol && *rvol < filters.min_rvol) {
        return fmt::format("relative volume {:.2f} below minimum {:.2f}", *rvol, filters.min_rvol);
    }

    // spreadPct is a percentage, max_spread a fraction of price
    if (features.price.spread_pct) {
        double spread = *features.price.spread_pct / 100.0;
        if (spread > filters.max_spread) {
            return fmt::format("spread {:.4f} exceeds maximum {:.4f}", spread, filters.max_spread);
        }
    }

    if (filters.require_minimum_liquidity) {
        if (!features.volume.avg) {
            return "average volume unknown";
        }
        if (*features.volume.avg < filters.min_avg_volume) {
            return fmt::format("average volume {:.0f} below minimum {:.0f}",
                               *features.volume.avg, filters.min_avg_volume);
        }
    }

    return "";
}

std::vector<const OpportunityDetector*> CompositeScanner::select_detectors(
    const ScannerConfig& config,
    AssetClass asset_class,
    bool has_options
) const {
    std::vector<const OpportunityDetector*> selected;
    for (const auto* detector : registry_->for_asset_class(asset_class)) {
        if (detector->requires_options_data && !has_options) {
            continue;
        }
        if (contains(config.disabled_detectors, detector->type)) {
            continue;
        }
        selected.push_back(detector);
    }
    return selected;
}

ScanResult CompositeScanner::scan_symbol(
    const std::string& symbol,
    const FeatureSnapshot& features,
    const OptionsChainData* options,
    AnalysisMode mode
) {
    auto started = std::chrono::steady_clock::now();
    const ScannerConfig config = this->config();
    const std::string upper = to_upper(symbol);

    ScanResult result;
    result.symbol = upper;

    auto finish = [&result, started]() {
        result.scan_time = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        return result;
    };

    auto filter_failure = check_universal_filters(config, upper, features, mode);
    if (!filter_failure.empty()) {
        result.filter_reason = "Failed universal filters: " + filter_failure;
        spdlog::debug("{}: {}", upper, result.filter_reason);
        return finish();
    }

    // Allowing non-regular hours gates detectors as a historical review would
    AnalysisMode gate_mode = config.filters.allow_non_regular_hours ? AnalysisMode::Historical : mode;
    bool planning = gate_mode == AnalysisMode::Historical && features.session.is_regular_hours == false;

    const auto now = scan_clock(features);
    const auto bar_start = features.bar_time.value_or(floor_to_interval(now, config.bar_interval_minutes));
    const AssetClass asset_class = config.asset_class_for(upper);

    std::vector<std::string> rejections;

    for (const auto* detector : select_detectors(config, asset_class, options != nullptr)) {
        if (!detector->detect(features, options, gate_mode)) {
            continue;
        }
        result.detection_count++;

        auto score = calculate_composite_score(detector->score_factors, features, options);

        SignalThresholds thresholds = config.thresholds_for(asset_class, detector->type);
        std::optional<AdaptiveThresholds> adaptive;
        if (planning) {
            if (thresholds.weekend_min_base_score || thresholds.weekend_min_style_score
                || config.enable_adaptive_thresholds) {
                thresholds = weekend_thresholds(thresholds);
            }
        } else if (config.enable_adaptive_thresholds) {
            adaptive = get_adaptive_thresholds(features, detector->type);
            thresholds = tighten(thresholds, *adaptive);
        }

        auto modifiers = calculate_style_modifiers(extract_style_factors(features, detector->direction, gate_mode));
        auto styles = apply_style_modifiers(score.score, modifiers);
        auto risk = calculate_risk_reward(features, detector->direction, styles.recommended);

        std::string rejection;
        if (adaptive && !adaptive->strategy_enabled) {
            rejection = fmt::format("Strategy {} disabled in {} regime", to_string(adaptive->category),
                                    to_string(*features.pattern.market_regime));
        } else if (score.score < thresholds.min_base_score) {
            rejection = fmt::format("Base score {:.1f} < {:.1f}", score.score, thresholds.min_base_score);
        } else if (styles.recommended_score < thresholds.min_style_score) {
            rejection = fmt::format("Style score {:.1f} < {:.1f} ({})", styles.recommended_score,
                                    thresholds.min_style_score, to_string(styles.recommended));
        } else if (risk.ratio < thresholds.min_risk_reward) {
            rejection = fmt::format("Risk/reward {:.2f} < {:.2f}", risk.ratio, thresholds.min_risk_reward);
        }

        if (!rejection.empty()) {
            spdlog::debug("{} {} rejected: {}", upper, detector->type, rejection);
            rejections.push_back(fmt::format("{}: {}", detector->type, rejection));
            continue;
        }

        DedupRecord record{upper, detector->type, make_bar_time_key(upper, bar_start, detector->type), now};
        auto decision = dedup_->admit(record, thresholds.cooldown_minutes,
                                      thresholds.max_signals_per_symbol_per_hour, config.rate_cap_scope);
        if (!decision.admitted) {
            spdlog::debug("{} {} rejected: {}", upper, detector->type, decision.reason);
            rejections.push_back(fmt::format("{}: {}", detector->type, decision.reason));
            continue;
        }

        auto confidence = confidence_scorer_.score(features, detector->direction, score.score, gate_mode);

        CompositeSignal signal;
        signal.symbol = upper;
        signal.detector_type = detector->type;
        signal.direction = detector->direction;
        signal.asset_class = asset_class;
        signal.base_score = score.score;
        signal.confidence = confidence.confidence;
        signal.confidence_level = confidence.level;
        signal.data_completeness = confidence.data.completeness;
        signal.factors = std::move(score.factors);
        signal.styles = styles;
        signal.risk = risk;
        signal.bar_time_key = record.bar_time_key;
        signal.detected_at = now;
        signal.expires_at = now + std::chrono::minutes(config.signal_ttl_minutes);
        signal.detector_version = config.detector_version;

        spdlog::info("Emitted {} {} for {}: score {:.1f}, {} {:.1f}, confidence {:.0f} ({}), R:R {:.2f}",
                     to_string(signal.direction), signal.detector_type, upper, signal.base_score,
                     to_string(styles.recommended), styles.recommended_score,
                     signal.confidence, signal.confidence_level, risk.ratio);

        result.signals.push_back(std::move(signal));
    }

    if (result.signals.empty()) {
        result.filter_reason = rejections.empty()
            ? std::string("No opportunities detected")
            : fmt::format("{}", fmt::join(rejections, "; "));
        return finish();
    }

    result.filtered = false;
    result.signal = *std::max_element(result.signals.begin(), result.signals.end(),
        [](const CompositeSignal& a, const CompositeSignal& b) { return a.base_score < b.base_score; });
    return finish();
}

std::vector<ScanResult> CompositeScanner::scan_batch(const std::vector<ScanRequest>& requests, AnalysisMode mode) {
    std::vector<ScanResult> results(requests.size());

    // One work item per symbol keeps each symbol's requests in order
    std::map<std::string, std::vector<size_t>> by_symbol;
    for (size_t i = 0; i < requests.size(); ++i) {
        by_symbol[to_upper(requests[i].symbol)].push_back(i);
    }
    std::vector<const std::vector<size_t>*> groups;
    for (const auto& entry : by_symbol) {
        groups.push_back(&entry.second);
    }

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t g = next++; g < groups.size(); g = next++) {
            for (size_t index : *groups[g]) {
                const auto& request = requests[index];
                const OptionsChainData* options = request.options ? &*request.options : nullptr;
                results[index] = scan_symbol(request.symbol, request.features, options, mode);
            }
        }
    };

    size_t thread_count = std::min<size_t>(std::max(1, config().thread_pool_size), groups.size());
    std::vector<std::thread> threads;
    for (size_t t = 1; t < thread_count; ++t) {
        threads.emplace_back(worker);
    }
    worker();
    for (auto& thread : threads) {
        thread.join();
    }

    spdlog::debug("Scanned batch of {} requests across {} symbols", requests.size(), groups.size());
    return results;
}
