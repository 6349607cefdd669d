#pragma once

#include "peak_detector.hpp"

#include <vector>

// A surviving peak with its boundaries expressed in MHz.
struct MergedPeak {
    size_t bin_index;
    double start_freq;
    double end_freq;
    double power_db;
    double prominence;
    double width_height;
};

// Drops every candidate whose boundaries lie strictly inside another candidate's.
// Candidates with identical boundaries do not contain each other and are both kept.
// Survivors keep their input order.
std::vector<PeakCandidate> remove_nested_peaks(const std::vector<PeakCandidate>& candidates);

// Linear interpolation of a fractional bin index against an edge array, clamped to its ends.
double interpolate_edge(const std::vector<double>& edges, double fractional_index);

// Containment filter followed by translation of the boundaries through `freq_edges`, which
// must be the frequency edges the PSD grid of the same cycle was built with.
std::vector<MergedPeak> merge_peaks(const std::vector<PeakCandidate>& candidates,
                                    const std::vector<double>& freq_edges);
