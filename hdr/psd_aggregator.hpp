#pragma once

#include "waterfall_buffer.hpp"

#include <cstddef>
#include <vector>

// Smoothed frequency x power density of the whole waterfall, normalized to [0, 1].
struct PsdGrid {
    std::vector<double> freq_edges;  // num_bins + 1 points over [min_freq, max_freq]
    std::vector<double> power_edges; // psd_db_resolution points over [db_min, db_max]
    std::vector<double> density;     // freq_cells() x power_cells(), frequency major

    size_t freq_cells() const { return freq_edges.empty() ? 0 : freq_edges.size() - 1; }
    size_t power_cells() const { return power_edges.empty() ? 0 : power_edges.size() - 1; }
    double at(size_t f, size_t p) const { return density[f * power_cells() + p]; }
};

class PsdAggregator {
public:
    static constexpr double SMOOTHING_SIGMA = 2.0;

    PsdAggregator(double min_freq, double max_freq, size_t num_bins, size_t psd_db_resolution);

    // Rebuilt from scratch on every call; db_min/db_max drift between cycles.
    PsdGrid aggregate(const WaterfallBuffer& buffer, double db_min, double db_max) const;

    std::vector<double> frequency_edges() const;
    std::vector<double> power_edges(double db_min, double db_max) const;

    size_t num_bins() const { return bins; }
    size_t db_resolution() const { return db_steps; }

private:
    double lo;
    double hi;
    size_t bins;
    size_t db_steps;
};

// Power matrix (oldest row first) scaled for display: (power - db_min) / (db_max - db_min).
std::vector<double> normalize_power(const WaterfallBuffer& buffer, double db_min, double db_max);
// SNR variant: power relative to each bin's historical minimum, scaled against [snr_min, snr_max].
std::vector<double> normalize_snr(const WaterfallBuffer& buffer, double snr_min, double snr_max);

// Separable Gaussian filter with reflected borders, kernel radius round(4 * sigma).
void gaussian_smooth(std::vector<double>& grid, size_t rows, size_t cols, double sigma);
