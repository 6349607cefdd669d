#include "frequency_indexer.hpp"
#include <cmath>
#include <stdexcept>

namespace {
// (max - min) / resolution is often a hair below an integer in binary floating point.
constexpr double BIN_COUNT_EPSILON = 1e-9;
}

FrequencyIndexer::FrequencyIndexer(double min_freq, double max_freq, double resolution)
    : lo(min_freq), hi(max_freq), res(resolution), bins(0) {
    if (max_freq <= min_freq) throw std::invalid_argument("FrequencyIndexer: max_freq must be greater than min_freq.");
    if (!(resolution > 0.0)) throw std::invalid_argument("FrequencyIndexer: resolution must be positive.");
    bins = static_cast<size_t>(std::floor((hi - lo) / res + BIN_COUNT_EPSILON)) + 1;
}

long FrequencyIndexer::index_of(double freq) const {
    return std::lround((freq - lo) / res);
}

bool FrequencyIndexer::try_index(double freq, size_t& idx) const {
    if (!in_range(freq)) return false;
    long i = index_of(freq);
    if (i < 0 || static_cast<size_t>(i) >= bins) return false;
    idx = static_cast<size_t>(i);
    return true;
}

double FrequencyIndexer::quantize(double freq) const {
    return std::round(freq / res) * res;
}

double FrequencyIndexer::bin_frequency(size_t idx) const {
    if (bins == 1) return lo;
    return lo + (hi - lo) * static_cast<double>(idx) / static_cast<double>(bins - 1);
}
