#include "psd_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {
const double NaN = std::numeric_limits<double>::quiet_NaN();
constexpr double SMOOTHING_TRUNCATE = 4.0;
constexpr double DEGENERATE_RANGE_PAD_DB = 0.5;

std::vector<double> linspace(double start, double stop, size_t count) {
    std::vector<double> points(count);
    if (count == 1) {
        points[0] = start;
        return points;
    }
    double step = (stop - start) / static_cast<double>(count - 1);
    for (size_t i = 0; i < count; ++i) points[i] = start + step * static_cast<double>(i);
    points[count - 1] = stop;
    return points;
}

// Bin of value within uniform edges; the last bin is closed on the right. -1 if outside.
long uniform_bin(double value, const std::vector<double>& edges) {
    double first = edges.front();
    double last = edges.back();
    if (value < first || value > last) return -1;
    long cells = static_cast<long>(edges.size()) - 1;
    long idx = static_cast<long>(std::floor((value - first) / (last - first) * static_cast<double>(cells)));
    return std::min(std::max(idx, 0L), cells - 1);
}

// scipy.ndimage "reflect" mode: d c b a | a b c d | d c b a
size_t reflect_index(long i, size_t n) {
    long period = 2 * static_cast<long>(n);
    long m = i % period;
    if (m < 0) m += period;
    if (m >= static_cast<long>(n)) m = period - 1 - m;
    return static_cast<size_t>(m);
}

std::vector<double> gaussian_kernel(double sigma, long radius) {
    std::vector<double> kernel(2 * radius + 1);
    double sum = 0.0;
    for (long i = -radius; i <= radius; ++i) {
        double w = std::exp(-0.5 * static_cast<double>(i * i) / (sigma * sigma));
        kernel[i + radius] = w;
        sum += w;
    }
    for (double& w : kernel) w /= sum;
    return kernel;
}
}

PsdAggregator::PsdAggregator(double min_freq, double max_freq, size_t num_bins, size_t psd_db_resolution)
    : lo(min_freq), hi(max_freq), bins(num_bins), db_steps(psd_db_resolution) {
    if (bins == 0) throw std::invalid_argument("PsdAggregator: num_bins must be at least 1.");
    if (db_steps < 2) throw std::invalid_argument("PsdAggregator: psd_db_resolution must be at least 2.");
}

std::vector<double> PsdAggregator::frequency_edges() const {
    return linspace(lo, hi, bins + 1);
}

std::vector<double> PsdAggregator::power_edges(double db_min, double db_max) const {
    if (!(db_max > db_min)) {
        db_min -= DEGENERATE_RANGE_PAD_DB;
        db_max = db_min + 2.0 * DEGENERATE_RANGE_PAD_DB;
    }
    return linspace(db_min, db_max, db_steps);
}

PsdGrid PsdAggregator::aggregate(const WaterfallBuffer& buffer, double db_min, double db_max) const {
    PsdGrid grid;
    grid.freq_edges = frequency_edges();
    grid.power_edges = power_edges(db_min, db_max);
    const size_t f_cells = grid.freq_cells();
    const size_t p_cells = grid.power_cells();
    grid.density.assign(f_cells * p_cells, 0.0);

    for (size_t r = 0; r < buffer.height(); ++r) {
        for (size_t c = 0; c < buffer.num_bins(); ++c) {
            double f = buffer.frequency(r, c);
            double p = buffer.power(r, c);
            if (std::isnan(f) || std::isnan(p)) continue;
            long fi = uniform_bin(f, grid.freq_edges);
            long pi = uniform_bin(p, grid.power_edges);
            if (fi < 0 || pi < 0) continue;
            grid.density[static_cast<size_t>(fi) * p_cells + static_cast<size_t>(pi)] += 1.0;
        }
    }

    gaussian_smooth(grid.density, f_cells, p_cells, SMOOTHING_SIGMA);

    double peak = 0.0;
    for (double v : grid.density) peak = std::max(peak, v);
    if (peak > 0.0) {
        for (double& v : grid.density) v /= peak;
    }
    return grid;
}

void gaussian_smooth(std::vector<double>& grid, size_t rows, size_t cols, double sigma) {
    if (grid.empty() || rows == 0 || cols == 0 || !(sigma > 0.0)) return;
    const long radius = static_cast<long>(SMOOTHING_TRUNCATE * sigma + 0.5);
    const std::vector<double> kernel = gaussian_kernel(sigma, radius);
    std::vector<double> scratch(grid.size(), 0.0);

    // Along rows (axis 0).
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            double acc = 0.0;
            for (long k = -radius; k <= radius; ++k) {
                acc += kernel[k + radius] * grid[reflect_index(static_cast<long>(r) + k, rows) * cols + c];
            }
            scratch[r * cols + c] = acc;
        }
    }
    // Along columns (axis 1).
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            double acc = 0.0;
            for (long k = -radius; k <= radius; ++k) {
                acc += kernel[k + radius] * scratch[r * cols + reflect_index(static_cast<long>(c) + k, cols)];
            }
            grid[r * cols + c] = acc;
        }
    }
}

std::vector<double> normalize_power(const WaterfallBuffer& buffer, double db_min, double db_max) {
    const size_t rows = buffer.height();
    const size_t cols = buffer.num_bins();
    std::vector<double> out(rows * cols, NaN);
    double span = db_max - db_min;
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            double v = buffer.power(r, c);
            if (std::isnan(v)) continue;
            out[r * cols + c] = span > 0.0 ? (v - db_min) / span : 0.0;
        }
    }
    return out;
}

std::vector<double> normalize_snr(const WaterfallBuffer& buffer, double snr_min, double snr_max) {
    const size_t rows = buffer.height();
    const size_t cols = buffer.num_bins();
    const std::vector<double> floor_db = buffer.column_minimums();
    std::vector<double> out(rows * cols, NaN);
    double span = snr_max - snr_min;
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            double v = buffer.power(r, c);
            if (std::isnan(v)) continue;
            out[r * cols + c] = ((v - floor_db[c]) - snr_min) / span;
        }
    }
    return out;
}
