#include "scan_config_history.hpp"
#include <stdexcept>

ScanConfigHistory::ScanConfigHistory(size_t capacity, bool retain_configs)
    : limit(capacity), keep_configs(retain_configs) {
    if (limit == 0) throw std::invalid_argument("ScanConfigHistory: capacity must be at least 1.");
}

void ScanConfigHistory::push(double timestamp, const ScanConfig& scan_config) {
    if (entries.size() == limit) entries.pop_front();
    entries.emplace_back(timestamp, keep_configs ? scan_config : ScanConfig());
}

double ScanConfigHistory::oldest_time() const {
    if (entries.empty()) throw std::out_of_range("ScanConfigHistory: no scans recorded.");
    return entries.front().first;
}

double ScanConfigHistory::newest_time() const {
    if (entries.empty()) throw std::out_of_range("ScanConfigHistory: no scans recorded.");
    return entries.back().first;
}

const ScanConfig& ScanConfigHistory::oldest_config() const {
    if (entries.empty()) throw std::out_of_range("ScanConfigHistory: no scans recorded.");
    return entries.front().second;
}

const ScanConfig& ScanConfigHistory::newest_config() const {
    if (entries.empty()) throw std::out_of_range("ScanConfigHistory: no scans recorded.");
    return entries.back().second;
}

const ScanConfig& ScanConfigHistory::config_at(double timestamp) const {
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (it->first == timestamp) return it->second;
    }
    throw std::out_of_range("ScanConfigHistory: no retained scan at requested timestamp.");
}

std::deque<double> ScanConfigHistory::timestamps() const {
    std::deque<double> times;
    for (const auto& e : entries) times.push_back(e.first);
    return times;
}
