#pragma once

#include "scan_data.hpp"

#include <cstddef>
#include <deque>
#include <utility>

// Scan timestamps (and, with persistence, their scan configs) for the rows still in the
// waterfall. Entries are evicted in step with row eviction.
class ScanConfigHistory {
public:
    ScanConfigHistory(size_t capacity, bool retain_configs);

    void push(double timestamp, const ScanConfig& scan_config);

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
    bool retains_configs() const { return keep_configs; }

    double oldest_time() const;
    double newest_time() const;
    const ScanConfig& oldest_config() const;
    const ScanConfig& newest_config() const;
    // Most recent entry recorded for the timestamp; throws std::out_of_range if it was evicted.
    const ScanConfig& config_at(double timestamp) const;

    std::deque<double> timestamps() const;

private:
    size_t limit;
    bool keep_configs;
    std::deque<std::pair<double, ScanConfig>> entries;
};
