#include "peak_merger.hpp"
#include <cmath>
#include <stdexcept>

std::vector<PeakCandidate> remove_nested_peaks(const std::vector<PeakCandidate>& candidates) {
    const size_t n = candidates.size();

    // Decide containment for every pair first, then materialize survivors.
    std::vector<bool> nested(n, false);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            if (candidates[i].left_ips > candidates[j].left_ips &&
                candidates[i].right_ips < candidates[j].right_ips) {
                nested[i] = true;
                break;
            }
        }
    }

    std::vector<PeakCandidate> survivors;
    survivors.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (!nested[i]) survivors.push_back(candidates[i]);
    }
    return survivors;
}

double interpolate_edge(const std::vector<double>& edges, double fractional_index) {
    if (edges.empty()) throw std::invalid_argument("interpolate_edge: empty edge array.");
    if (!(fractional_index > 0.0)) return edges.front();
    const double last = static_cast<double>(edges.size() - 1);
    if (fractional_index >= last) return edges.back();
    const size_t base = static_cast<size_t>(std::floor(fractional_index));
    const double frac = fractional_index - static_cast<double>(base);
    return edges[base] + frac * (edges[base + 1] - edges[base]);
}

std::vector<MergedPeak> merge_peaks(const std::vector<PeakCandidate>& candidates,
                                    const std::vector<double>& freq_edges) {
    std::vector<MergedPeak> merged;
    for (const auto& c : remove_nested_peaks(candidates)) {
        merged.push_back({c.bin_index,
                          interpolate_edge(freq_edges, c.left_ips),
                          interpolate_edge(freq_edges, c.right_ips),
                          c.peak_power,
                          c.prominence,
                          c.width_height});
    }
    return merged;
}
