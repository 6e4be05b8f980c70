#include "registry.hpp"
#include "detectors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

DetectorRegistry DetectorRegistry::with_builtin_detectors() {
    DetectorRegistry registry;
    for (auto family : {make_equity_detectors, make_index_detectors, make_kcu_detectors, make_flow_detectors}) {
        for (auto& detector : family()) {
            registry.register_detector(std::move(detector));
        }
    }
    spdlog::debug("Registered {} opportunity detectors", registry.size());
    return registry;
}

void DetectorRegistry::register_detector(OpportunityDetector detector) {
    if (detector.type.empty()) {
        throw std::runtime_error("Detector type must not be empty");
    }
    if (find(detector.type) != nullptr) {
        throw std::runtime_error("Duplicate detector type: " + detector.type);
    }
    if (!detector.gate) {
        throw std::runtime_error("Detector " + detector.type + " has no gate");
    }
    if (detector.asset_classes.empty()) {
        throw std::runtime_error("Detector " + detector.type + " applies to no asset class");
    }
    if (detector.score_factors.empty()) {
        throw std::runtime_error("Detector " + detector.type + " has no score factors");
    }

    for (const auto& factor : detector.score_factors) {
        if (!factor.evaluate) {
            throw std::runtime_error(fmt::format("Factor {} of {} has no evaluator", factor.name, detector.type));
        }
        if (!(factor.weight > 0.0 && factor.weight <= 1.0)) {
            throw std::runtime_error(fmt::format(
                "Factor {} of {} has weight {} outside (0, 1]", factor.name, detector.type, factor.weight));
        }
    }

    double sum = detector.weight_sum();
    if (std::abs(sum - 1.0) > kWeightTolerance) {
        throw std::runtime_error(fmt::format(
            "Factor weights of {} sum to {:.3f}, expected 1.0 +/- {}", detector.type, sum, kWeightTolerance));
    }

    detectors_.push_back(std::move(detector));
}

const OpportunityDetector* DetectorRegistry::find(const std::string& type) const {
    auto it = std::find_if(detectors_.begin(), detectors_.end(),
                           [&type](const OpportunityDetector& d) { return d.type == type; });
    return it == detectors_.end() ? nullptr : &*it;
}

template <typename Pred>
std::vector<const OpportunityDetector*> DetectorRegistry::select(Pred pred) const {
    std::vector<const OpportunityDetector*> result;
    for (const auto& detector : detectors_) {
        if (pred(detector)) {
            result.push_back(&detector);
        }
    }
    return result;
}

std::vector<const OpportunityDetector*> DetectorRegistry::for_asset_class(AssetClass asset_class) const {
    return select([asset_class](const OpportunityDetector& d) { return d.applies_to(asset_class); });
}

std::vector<const OpportunityDetector*> DetectorRegistry::equity_only() const {
    return select([](const OpportunityDetector& d) { return !d.applies_to(AssetClass::Index); });
}

std::vector<const OpportunityDetector*> DetectorRegistry::index_only() const {
    return select([](const OpportunityDetector& d) {
        return d.applies_to(AssetClass::Index) && d.asset_classes.size() == 1;
    });
}

std::vector<const OpportunityDetector*> DetectorRegistry::options_dependent() const {
    return select([](const OpportunityDetector& d) { return d.requires_options_data; });
}

std::vector<const OpportunityDetector*> DetectorRegistry::flow_primary() const {
    return select([](const OpportunityDetector& d) { return d.flow_primary; });
}

std::vector<const OpportunityDetector*> DetectorRegistry::backtestable() const {
    return select([](const OpportunityDetector& d) { return !d.requires_options_data && !d.flow_primary; });
}
