#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <fmt/format.h>

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        tt -= 1;
    }

    std::tm tm = {};
    gmtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::stringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Invalid ISO8601 timestamp: " + iso_string);
    }

    // Handle fractional seconds, normalised to milliseconds
    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        digits.resize(3, '0');
        millis = std::stoi(digits);
    }

    auto time = std::chrono::system_clock::from_time_t(timegm(&tm));
    time += std::chrono::milliseconds(millis);
    return time;
}

std::string to_upper(const std::string& value) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

AssetClass classify_symbol(const std::string& symbol) {
    static const std::vector<std::string> index_symbols = {"SPX", "NDX", "$SPX", "$NDX"};
    static const std::vector<std::string> etf_symbols = {
        "SPY", "QQQ", "IWM", "DIA", "XLF", "XLE", "XLK", "XLV", "XLI", "XLP"
    };

    auto upper = to_upper(symbol);
    if (std::find(index_symbols.begin(), index_symbols.end(), upper) != index_symbols.end()) {
        return AssetClass::Index;
    }
    if (std::find(etf_symbols.begin(), etf_symbols.end(), upper) != etf_symbols.end()) {
        return AssetClass::EquityEtf;
    }
    return AssetClass::Stock;
}

double clamp_score(double value) {
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::max(0.0, std::min(100.0, value));
}

std::chrono::system_clock::time_point floor_to_interval(
    const std::chrono::system_clock::time_point& tp,
    int interval_minutes
) {
    auto interval = std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::minutes(std::max(1, interval_minutes)));
    auto since_epoch = tp.time_since_epoch();
    auto remainder = since_epoch % interval;
    if (remainder.count() < 0) {
        remainder += interval;
    }
    return std::chrono::system_clock::time_point(since_epoch - remainder);
}

std::string make_bar_time_key(
    const std::string& symbol,
    const std::chrono::system_clock::time_point& bar_start,
    const std::string& detector_type
) {
    return fmt::format("{}:{}:{}", to_upper(symbol), format_iso8601(bar_start), detector_type);
}
