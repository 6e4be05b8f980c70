#include "signal_dedup.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <set>

namespace {
    // Distance in either direction, so a late tick still sees emissions recorded after it
    std::chrono::system_clock::duration distance(const DedupRecord& record, std::chrono::system_clock::time_point now) {
        return record.emitted_at > now ? record.emitted_at - now : now - record.emitted_at;
    }

    bool within(const DedupRecord& record, std::chrono::minutes window, std::chrono::system_clock::time_point now) {
        return distance(record, now) < window;
    }
}

nlohmann::json DedupStats::to_json() const {
    nlohmann::json j;
    j["total_signals"] = total_signals;
    j["unique_symbols"] = unique_symbols;
    j["oldest_signal_age_seconds"] = oldest_signal_age ? nlohmann::json(oldest_signal_age->count()) : nlohmann::json();
    j["newest_signal_age_seconds"] = newest_signal_age ? nlohmann::json(newest_signal_age->count()) : nlohmann::json();
    return j;
}

SignalDeduplication::SignalDeduplication(std::chrono::minutes retention)
    : retention_(std::max(retention, std::chrono::minutes(60))) {}

void SignalDeduplication::record_signal(const DedupRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    Key key{record.symbol, record.detector_type};
    if (is_duplicate_locked(key, record.bar_time_key)) {
        return;
    }
    records_[key].push_back(record);
    cleanup(record.emitted_at);
}

bool SignalDeduplication::is_duplicate(
    const std::string& symbol,
    const std::string& detector_type,
    const std::string& bar_time_key
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_duplicate_locked({symbol, detector_type}, bar_time_key);
}

bool SignalDeduplication::is_duplicate_locked(const Key& key, const std::string& bar_time_key) const {
    auto it = records_.find(key);
    if (it == records_.end()) {
        return false;
    }
    return std::any_of(it->second.begin(), it->second.end(), [&](const DedupRecord& record) {
        return record.bar_time_key == bar_time_key;
    });
}

int SignalDeduplication::count_in_window(
    const std::string& symbol,
    const std::string& detector_type,
    std::chrono::minutes window,
    std::chrono::system_clock::time_point now
) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find({symbol, detector_type});
    if (it == records_.end()) {
        return 0;
    }
    return static_cast<int>(std::count_if(it->second.begin(), it->second.end(), [&](const DedupRecord& record) {
        return within(record, window, now);
    }));
}

int SignalDeduplication::count_symbol_in_window(
    const std::string& symbol,
    std::chrono::minutes window,
    std::chrono::system_clock::time_point now
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_symbol_locked(symbol, window, now);
}

int SignalDeduplication::count_symbol_locked(
    const std::string& symbol,
    std::chrono::minutes window,
    std::chrono::system_clock::time_point now
) const {
    int count = 0;
    for (const auto& entry : records_) {
        if (entry.first.first != symbol) {
            continue;
        }
        for (const auto& record : entry.second) {
            if (within(record, window, now)) {
                count++;
            }
        }
    }
    return count;
}

std::optional<std::chrono::system_clock::time_point> SignalDeduplication::get_last_emission(
    const std::string& symbol,
    const std::string& detector_type
) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find({symbol, detector_type});
    if (it == records_.end() || it->second.empty()) {
        return std::nullopt;
    }
    auto latest = std::max_element(it->second.begin(), it->second.end(),
        [](const DedupRecord& a, const DedupRecord& b) { return a.emitted_at < b.emitted_at; });
    return latest->emitted_at;
}

DedupDecision SignalDeduplication::admit(
    const DedupRecord& record,
    int cooldown_minutes,
    int max_per_hour,
    RateCapScope scope
) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = record.emitted_at;
    Key key{record.symbol, record.detector_type};
    DedupDecision decision;

    if (is_duplicate_locked(key, record.bar_time_key)) {
        decision.reason = fmt::format("Duplicate bar time key ({})", record.bar_time_key);
        return decision;
    }

    auto it = records_.find(key);
    if (it != records_.end() && !it->second.empty()) {
        auto nearest = std::min_element(it->second.begin(), it->second.end(),
            [now](const DedupRecord& a, const DedupRecord& b) { return distance(a, now) < distance(b, now); });
        if (within(*nearest, std::chrono::minutes(cooldown_minutes), now)) {
            auto gap = std::chrono::duration_cast<std::chrono::minutes>(distance(*nearest, now));
            if (nearest->emitted_at <= now) {
                decision.reason = fmt::format("In cooldown ({} minutes, last emission {} minutes ago)",
                                              cooldown_minutes, gap.count());
            } else {
                decision.reason = fmt::format("In cooldown ({} minutes, later emission {} minutes ahead)",
                                              cooldown_minutes, gap.count());
            }
            return decision;
        }
    }

    const std::chrono::minutes hour(60);
    int recent = 0;
    if (scope == RateCapScope::PerSymbol) {
        recent = count_symbol_locked(record.symbol, hour, now);
    } else if (it != records_.end()) {
        recent = static_cast<int>(std::count_if(it->second.begin(), it->second.end(), [&](const DedupRecord& r) {
            return within(r, hour, now);
        }));
    }
    if (recent >= max_per_hour) {
        decision.reason = fmt::format("Max signals per hour exceeded ({})", max_per_hour);
        return decision;
    }

    records_[key].push_back(record);
    cleanup(now);

    spdlog::debug("Recorded {} for {} at {}", record.detector_type, record.symbol, record.bar_time_key);
    decision.admitted = true;
    return decision;
}

DedupStats SignalDeduplication::stats(std::chrono::system_clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    DedupStats result;
    std::set<std::string> symbols;
    std::optional<std::chrono::system_clock::time_point> oldest;
    std::optional<std::chrono::system_clock::time_point> newest;

    for (const auto& entry : records_) {
        for (const auto& record : entry.second) {
            result.total_signals++;
            symbols.insert(record.symbol);
            if (!oldest || record.emitted_at < *oldest) {
                oldest = record.emitted_at;
            }
            if (!newest || record.emitted_at > *newest) {
                newest = record.emitted_at;
            }
        }
    }

    result.unique_symbols = symbols.size();
    if (oldest) {
        result.oldest_signal_age = std::chrono::duration_cast<std::chrono::seconds>(now - *oldest);
        result.newest_signal_age = std::chrono::duration_cast<std::chrono::seconds>(now - *newest);
    }
    return result;
}

void SignalDeduplication::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

void SignalDeduplication::set_retention(std::chrono::minutes retention) {
    std::lock_guard<std::mutex> lock(mutex_);
    retention_ = std::max(retention, std::chrono::minutes(60));
}

void SignalDeduplication::cleanup(std::chrono::system_clock::time_point now) {
    const auto retention = retention_;

    for (auto it = records_.begin(); it != records_.end();) {
        auto& history = it->second;
        history.erase(
            std::remove_if(
                history.begin(),
                history.end(),
                [now, retention](const DedupRecord& record) {
                    return now - record.emitted_at > retention;
                }
            ),
            history.end()
        );
        if (history.empty()) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
}
