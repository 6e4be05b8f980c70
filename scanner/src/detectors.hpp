#pragma once

#include "detector.hpp"
#include <vector>

// Breakout, mean reversion and trend continuation for stocks and ETFs
std::vector<OpportunityDetector> make_equity_detectors();

// SPX/NDX session and dealer-positioning setups
std::vector<OpportunityDetector> make_index_detectors();

// KCU LTP setups: EMA bounce, VWAP standard, king/queen, opening range breakout
std::vector<OpportunityDetector> make_kcu_detectors();

// Detectors driven primarily by options order flow
std::vector<OpportunityDetector> make_flow_detectors();
