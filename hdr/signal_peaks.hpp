#pragma once

#include "peak_detector.hpp"

#include <cstddef>
#include <limits>
#include <vector>

struct PeakSearchParams {
    double min_height = -std::numeric_limits<double>::infinity();
    double max_height = std::numeric_limits<double>::infinity();
    double min_prominence = 0.0;
    double max_prominence = std::numeric_limits<double>::infinity();
    double min_width = 0.0;
    double max_width = std::numeric_limits<double>::infinity();
    double rel_height = 0.5;
    size_t wlen = 0; // prominence search window in bins, 0 = whole row
};

/**
 * Local-maximum peak search over a power row.
 *
 * Candidates are local maxima (flat tops resolve to their midpoint) that pass, in order,
 * the height, prominence and width limits. Prominence is measured against the higher of
 * the lowest points reached left and right before the row rises above the peak (within
 * `wlen` when set). The width is evaluated at `peak - prominence * rel_height`, with both
 * crossing points linearly interpolated between samples.
 *
 * NaN samples are treated as the lowest finite value of the row.
 */
std::vector<PeakCandidate> find_signal_peaks(const std::vector<double>& row, const PeakSearchParams& params);

// NaN-ignoring mean; NaN when the row holds no finite value.
double finite_mean(const std::vector<double>& row);
