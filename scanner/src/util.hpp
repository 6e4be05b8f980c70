#pragma once

#include "types.hpp"
#include <string>
#include <chrono>

// Format a time_point to an ISO8601 string (UTC, millisecond precision)
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

// Parse an ISO8601 UTC string to a time_point
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);

std::string to_upper(const std::string& value);

// SPX/NDX are indices, a fixed list of sector and broad ETFs, everything else a stock
AssetClass classify_symbol(const std::string& symbol);

// Clamp to [0, 100]; non-finite input maps to 0
double clamp_score(double value);

std::chrono::system_clock::time_point floor_to_interval(
    const std::chrono::system_clock::time_point& tp,
    int interval_minutes
);

// SYMBOL:<bar start>:detector_type
std::string make_bar_time_key(
    const std::string& symbol,
    const std::chrono::system_clock::time_point& bar_start,
    const std::string& detector_type
);
