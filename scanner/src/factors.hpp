#pragma once

#include "detector.hpp"
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Market-hours gate shared by session-bound detectors. Historical scans always
// run; an unknown regular-hours flag counts as regular hours.
bool should_run_detector(const FeatureSnapshot& features, AnalysisMode mode);

// Piecewise-linear curve through (x, y) points, flat beyond the end points
double interpolate(double x, std::initializer_list<std::pair<double, double>> points);
double interpolate(double x, const std::vector<std::pair<double, double>>& points);

// +1 for long, -1 for short
double direction_sign(Direction direction);

std::optional<double> relative_volume(const FeatureSnapshot& features);

// Percent distance of price from VWAP
std::optional<double> vwap_distance(const FeatureSnapshot& features);

// ATR(14), then the 5m timeframe ATR, then 1.5% of price
double atr_estimate(const FeatureSnapshot& features);

bool flow_aligned(const FeatureSnapshot& features, Direction direction);

// Share of timeframes trending with the direction, 0-100; 50 when no timeframe data
double mtf_alignment_score(const FeatureSnapshot& features, Direction direction);

// 0-100; 0 when the 8/21 EMAs are missing
double ema_alignment_score(const FeatureSnapshot& features, Direction direction);

// Number of key levels within tolerance_pct of price
int levels_near_price(const FeatureSnapshot& features, double tolerance_pct);

struct RegimeScores {
    double trending;
    double ranging;
    double choppy;
    double volatile_;
};

// Factors reused across detector families
ScoreFactor volume_factor(const std::string& name, double weight);
ScoreFactor vwap_position_factor(double weight, Direction direction);
ScoreFactor vwap_stretch_factor(double weight, Direction direction);
ScoreFactor rsi_momentum_factor(double weight, Direction direction);
ScoreFactor rsi_extreme_factor(double weight, Direction direction);
ScoreFactor regime_factor(double weight, RegimeScores scores);
ScoreFactor flow_confirmation_factor(double weight, Direction direction);
ScoreFactor mtf_alignment_factor(double weight, Direction direction);
ScoreFactor divergence_factor(double weight, Direction direction);
ScoreFactor ema_alignment_factor(double weight, Direction direction);
