#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Boundaries are fractional bin indices where the peak crosses its width height.
struct PeakCandidate {
    size_t bin_index;
    double left_ips;
    double right_ips;
    double peak_power;
    double prominence;
    double width_height;
};

class PeakDetector {
public:
    virtual ~PeakDetector() = default;
    virtual const std::string& name() const = 0;
    // Never throws on degenerate rows: empty or all-NaN input yields no candidates.
    virtual std::vector<PeakCandidate> find_peaks(const std::vector<double>& power_row) const = 0;
};
