#include "detector.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

CompositeScore calculate_composite_score(
    const std::vector<ScoreFactor>& factors,
    const FeatureSnapshot& features,
    const OptionsChainData* options
) {
    CompositeScore result;
    double weighted_sum = 0.0;

    for (const auto& factor : factors) {
        double score = clamp_score(factor.evaluate(features, options));
        double contribution = score * factor.weight;
        weighted_sum += contribution;
        result.factors.push_back({factor.name, factor.weight, score, contribution});
    }

    result.score = clamp_score(weighted_sum);
    return result;
}

bool OpportunityDetector::applies_to(AssetClass asset_class) const {
    return std::find(asset_classes.begin(), asset_classes.end(), asset_class) != asset_classes.end();
}

double OpportunityDetector::weight_sum() const {
    double sum = 0.0;
    for (const auto& factor : score_factors) {
        sum += factor.weight;
    }
    return sum;
}

bool OpportunityDetector::detect(
    const FeatureSnapshot& features,
    const OptionsChainData* options,
    AnalysisMode mode
) const {
    if (requires_options_data && options == nullptr) {
        return false;
    }
    if (!gate || features.price.current <= 0.0) {
        return false;
    }
    return gate(features, options, mode);
}

DetectionResult OpportunityDetector::detect_with_score(
    const FeatureSnapshot& features,
    const OptionsChainData* options,
    AnalysisMode mode
) const {
    DetectionResult result;
    if (!detect(features, options, mode)) {
        return result;
    }

    auto composite = calculate_composite_score(score_factors, features, options);
    result.detected = true;
    result.base_score = composite.score;
    result.factors = std::move(composite.factors);

    spdlog::debug("{} detected on {} with base score {:.1f}", type, features.symbol, result.base_score);
    return result;
}
