#include "top_n_ranker.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

std::vector<RankedBin> rank_busiest_bins(const WaterfallBuffer& buffer, size_t top_n) {
    const size_t cols = buffer.num_bins();
    const std::vector<double> floor_db = buffer.column_minimums();

    std::vector<RankedBin> ranked;
    ranked.reserve(cols);
    for (size_t c = 0; c < cols; ++c) {
        double variance = std::numeric_limits<double>::quiet_NaN();
        if (!std::isnan(floor_db[c])) {
            const std::vector<double> column = buffer.power_column(c);
            double sum = 0.0;
            size_t n = 0;
            for (double v : column) {
                if (std::isnan(v)) continue;
                sum += v - floor_db[c];
                ++n;
            }
            double mean = sum / static_cast<double>(n);
            double sum_sq = 0.0;
            for (double v : column) {
                if (std::isnan(v)) continue;
                double d = (v - floor_db[c]) - mean;
                sum_sq += d * d;
            }
            variance = sum_sq / static_cast<double>(n);
        }
        ranked.push_back({c, buffer.indexer().bin_frequency(c), variance});
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedBin& a, const RankedBin& b) {
        if (std::isnan(a.variance)) return false;
        if (std::isnan(b.variance)) return true;
        return a.variance > b.variance;
    });
    if (ranked.size() > top_n) ranked.resize(top_n);
    return ranked;
}

std::vector<double> top_n_frequencies(const WaterfallBuffer& buffer, size_t top_n) {
    std::vector<double> freqs;
    for (const auto& bin : rank_busiest_bins(buffer, top_n)) freqs.push_back(bin.frequency);
    return freqs;
}
