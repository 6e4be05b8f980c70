#pragma once

#include "types.hpp"
#include <string>
#include <vector>

struct DataConfidence {
    double completeness = 0.0;          // 0-100, share of weighted inputs present
    double base_confidence = 100.0;
    double adjusted_confidence = 0.0;
    double multiplier = 0.0;            // adjusted / 100
    std::vector<std::string> missing_critical;
    std::vector<std::string> missing_important;
};

struct ConfidenceResult {
    double confidence = 0.0;
    std::string level;
    DataConfidence data;
    std::vector<std::string> adjustments;
};

// Advisory confidence attached to emitted signals; it never gates emission
class ConfidenceScorer {
public:
    // Completeness of the snapshot against weighted input importance.
    // Weekend weights lean on levels and relax live volume/flow inputs.
    DataConfidence calculate_data_confidence(const FeatureSnapshot& features, bool weekend) const;

    // Raw score scaled by data quality, then by regime, flow and timeframe alignment
    ConfidenceResult score(
        const FeatureSnapshot& features,
        Direction direction,
        double raw_score,
        AnalysisMode mode
    ) const;

    static std::string confidence_level(double confidence);
};
