#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

enum class AssetClass {
    Index,
    EquityEtf,
    Stock
};

enum class Direction {
    Long,
    Short
};

// Live scans honour the session flag; Historical scans run detectors on any bar
enum class AnalysisMode {
    Live,
    Historical
};

enum class MarketRegime {
    Trending,
    Ranging,
    Choppy,
    Volatile
};

enum class VixLevel {
    Low,
    Medium,
    High,
    Extreme
};

enum class FlowBias {
    Bullish,
    Bearish,
    Neutral
};

enum class Aggressiveness {
    Passive,
    Normal,
    Aggressive,
    VeryAggressive
};

enum class TradingStyle {
    Scalp,
    DayTrade,
    Swing
};

std::string to_string(AssetClass asset_class);
std::string to_string(Direction direction);
std::string to_string(MarketRegime regime);
std::string to_string(VixLevel level);
std::string to_string(TradingStyle style);

std::optional<AssetClass> asset_class_from_string(const std::string& value);
std::optional<MarketRegime> market_regime_from_string(const std::string& value);
std::optional<VixLevel> vix_level_from_string(const std::string& value);

// Feature snapshot produced upstream, one per symbol per tick
struct PriceInfo {
    double current = 0.0;
    std::optional<double> open;
    std::optional<double> high;
    std::optional<double> low;
    std::optional<double> prev_close;
    std::optional<double> spread_pct;
};

struct VolumeInfo {
    std::optional<double> current;
    std::optional<double> avg;
    std::optional<double> relative_to_avg;
};

struct VwapInfo {
    std::optional<double> value;
    std::optional<double> distance_pct;
};

struct SessionInfo {
    std::optional<int> minutes_since_open;
    std::optional<bool> is_regular_hours;
};

struct Divergence {
    Direction direction = Direction::Long;
    double confidence = 0.0;
};

struct PatternFlags {
    std::optional<MarketRegime> market_regime;
    std::optional<VixLevel> vix_level;
    bool breakout_bullish = false;
    bool breakout_bearish = false;
    bool patience_candle = false;
    std::optional<Divergence> divergence;
    std::optional<double> orb_high;
    std::optional<double> orb_low;
    std::optional<double> swing_high;
    std::optional<double> swing_low;
    std::optional<double> prior_day_high;
    std::optional<double> prior_day_low;
};

struct FlowAggregates {
    double flow_score = 0.0;
    FlowBias flow_bias = FlowBias::Neutral;
    int sweep_count = 0;
    int block_count = 0;
    std::optional<double> buy_pressure;
    std::optional<double> large_trade_percentage;
    std::optional<Aggressiveness> aggressiveness;
    std::optional<double> put_call_ratio;
};

struct TimeframeSnapshot {
    PriceInfo price;
    VwapInfo vwap;
    std::map<int, double> ema;
    std::map<int, double> rsi;
    std::optional<double> atr;
};

struct FeatureSnapshot {
    std::string symbol;
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::chrono::system_clock::time_point> bar_time;

    PriceInfo price;
    VolumeInfo volume;
    VwapInfo vwap;
    std::map<int, double> rsi;
    std::map<int, double> ema;
    std::map<int, double> atr;
    SessionInfo session;
    PatternFlags pattern;
    std::optional<FlowAggregates> flow;
    std::map<std::string, TimeframeSnapshot> mtf;

    std::optional<double> rsi_at(int period) const;
    std::optional<double> ema_at(int period) const;
    std::optional<double> atr_at(int period) const;

    static std::optional<FeatureSnapshot> from_json(const nlohmann::json& j);
};

// Options chain context, only supplied for symbols with a chain
struct OptionsChainData {
    std::optional<double> dealer_net_gamma;
    std::optional<double> max_gamma_strike;
    std::optional<double> max_pain_strike;
    std::optional<double> gamma_flip_level;
    std::optional<double> call_put_ratio;
    std::optional<int> minutes_to_expiry;
    bool is_0dte = false;
    std::function<double(double)> open_interest_at_strike;

    static std::optional<OptionsChainData> from_json(const nlohmann::json& j);
};

struct FactorContribution {
    std::string name;
    double weight;
    double score;
    double contribution;
};

struct StyleScores {
    double scalp = 0.0;
    double day_trade = 0.0;
    double swing = 0.0;
    TradingStyle recommended = TradingStyle::DayTrade;
    double recommended_score = 0.0;
};

struct RiskReward {
    double entry = 0.0;
    double stop = 0.0;
    double target1 = 0.0;
    double target2 = 0.0;
    double target3 = 0.0;
    double ratio = 0.0;
};

struct CompositeSignal {
    std::string symbol;
    std::string detector_type;
    Direction direction = Direction::Long;
    AssetClass asset_class = AssetClass::Stock;
    double base_score = 0.0;
    double confidence = 0.0;
    std::string confidence_level;
    double data_completeness = 0.0;
    std::vector<FactorContribution> factors;
    StyleScores styles;
    RiskReward risk;
    std::string bar_time_key;
    std::chrono::system_clock::time_point detected_at;
    std::chrono::system_clock::time_point expires_at;
    std::string detector_version;
    bool filtered = false;

    nlohmann::json to_json() const;
};

struct ScanResult {
    std::string symbol;
    bool filtered = true;
    std::optional<CompositeSignal> signal;
    std::vector<CompositeSignal> signals;
    std::string filter_reason;
    int detection_count = 0;
    std::chrono::microseconds scan_time{0};
};
