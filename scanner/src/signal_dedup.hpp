#pragma once

#include "config.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

struct DedupRecord {
    std::string symbol;
    std::string detector_type;
    std::string bar_time_key;
    std::chrono::system_clock::time_point emitted_at;
};

struct DedupStats {
    size_t total_signals = 0;
    size_t unique_symbols = 0;
    std::optional<std::chrono::seconds> oldest_signal_age;
    std::optional<std::chrono::seconds> newest_signal_age;

    nlohmann::json to_json() const;
};

struct DedupDecision {
    bool admitted = false;
    std::string reason;
};

class SignalDeduplication {
public:
    explicit SignalDeduplication(std::chrono::minutes retention = std::chrono::minutes(60));

    // Append an emission; a record repeating (symbol, type, bar key) is ignored
    void record_signal(const DedupRecord& record);

    bool is_duplicate(const std::string& symbol, const std::string& detector_type, const std::string& bar_time_key) const;

    int count_in_window(
        const std::string& symbol,
        const std::string& detector_type,
        std::chrono::minutes window,
        std::chrono::system_clock::time_point now
    ) const;

    int count_symbol_in_window(
        const std::string& symbol,
        std::chrono::minutes window,
        std::chrono::system_clock::time_point now
    ) const;

    std::optional<std::chrono::system_clock::time_point> get_last_emission(
        const std::string& symbol,
        const std::string& detector_type
    ) const;

    // Duplicate bar, cooldown and hourly cap checked and recorded under one lock
    DedupDecision admit(
        const DedupRecord& record,
        int cooldown_minutes,
        int max_per_hour,
        RateCapScope scope
    );

    DedupStats stats(std::chrono::system_clock::time_point now) const;

    void clear();

    // Records older than max(retention, 1h) are pruned on each write.
    // Retention must cover the bar interval or a same-bar repeat loses its key.
    void set_retention(std::chrono::minutes retention);

private:
    using Key = std::pair<std::string, std::string>;

    bool is_duplicate_locked(const Key& key, const std::string& bar_time_key) const;
    int count_symbol_locked(const std::string& symbol, std::chrono::minutes window,
                            std::chrono::system_clock::time_point now) const;
    void cleanup(std::chrono::system_clock::time_point now);

    mutable std::mutex mutex_;
    std::map<Key, std::vector<DedupRecord>> records_;
    std::chrono::minutes retention_;
};
