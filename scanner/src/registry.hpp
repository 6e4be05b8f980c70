#pragma once

#include "detector.hpp"
#include <string>
#include <vector>

class DetectorRegistry {
public:
    // Allowed distance of a detector's factor weight sum from 1.0
    static constexpr double kWeightTolerance = 0.02;

    DetectorRegistry() = default;

    // Registry holding every built-in detector
    static DetectorRegistry with_builtin_detectors();

    // Validates and appends a detector; throws std::runtime_error on a bad definition
    void register_detector(OpportunityDetector detector);

    const std::vector<OpportunityDetector>& all() const { return detectors_; }
    size_t size() const { return detectors_.size(); }
    const OpportunityDetector* find(const std::string& type) const;

    std::vector<const OpportunityDetector*> for_asset_class(AssetClass asset_class) const;
    std::vector<const OpportunityDetector*> equity_only() const;
    std::vector<const OpportunityDetector*> index_only() const;
    std::vector<const OpportunityDetector*> options_dependent() const;
    std::vector<const OpportunityDetector*> flow_primary() const;

    // Detectors that can run on recorded bars: no options chain, no live flow
    std::vector<const OpportunityDetector*> backtestable() const;

private:
    template <typename Pred>
    std::vector<const OpportunityDetector*> select(Pred pred) const;

    std::vector<OpportunityDetector> detectors_;
};
