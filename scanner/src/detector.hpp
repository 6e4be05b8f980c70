#pragma once

#include "types.hpp"
#include <functional>
#include <string>
#include <vector>

using FactorFn = std::function<double(const FeatureSnapshot&, const OptionsChainData*)>;
using GateFn = std::function<bool(const FeatureSnapshot&, const OptionsChainData*, AnalysisMode)>;

// Named, weighted scoring function returning a value in [0, 100]
struct ScoreFactor {
    std::string name;
    double weight = 0.0;
    FactorFn evaluate;
};

struct DetectionResult {
    bool detected = false;
    double base_score = 0.0;
    std::vector<FactorContribution> factors;
};

struct CompositeScore {
    double score = 0.0;
    std::vector<FactorContribution> factors;
};

// Weighted sum of factor scores, clamped to [0, 100]. Weights are not renormalised.
CompositeScore calculate_composite_score(
    const std::vector<ScoreFactor>& factors,
    const FeatureSnapshot& features,
    const OptionsChainData* options
);

struct OpportunityDetector {
    std::string type;
    Direction direction = Direction::Long;
    std::vector<AssetClass> asset_classes;
    bool requires_options_data = false;
    bool flow_primary = false;
    std::string ideal_timeframe = "5m";
    GateFn gate;
    std::vector<ScoreFactor> score_factors;

    bool applies_to(AssetClass asset_class) const;

    double weight_sum() const;

    // Fail-closed gate; false when required inputs are missing
    bool detect(
        const FeatureSnapshot& features,
        const OptionsChainData* options = nullptr,
        AnalysisMode mode = AnalysisMode::Live
    ) const;

    DetectionResult detect_with_score(
        const FeatureSnapshot& features,
        const OptionsChainData* options = nullptr,
        AnalysisMode mode = AnalysisMode::Live
    ) const;
};
