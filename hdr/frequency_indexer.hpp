#pragma once

#include <cstddef>

// Maps frequencies (MHz) onto the fixed-width bins of the waterfall.
class FrequencyIndexer {
public:
    FrequencyIndexer(double min_freq, double max_freq, double resolution);

    size_t num_bins() const { return bins; }
    double min_freq() const { return lo; }
    double max_freq() const { return hi; }
    double resolution() const { return res; }

    bool in_range(double freq) const { return freq >= lo && freq <= hi; }

    // round((freq - min_freq) / resolution); only meaningful for in-range frequencies.
    long index_of(double freq) const;
    // True and sets idx when freq is in range and lands on an existing bin.
    bool try_index(double freq, size_t& idx) const;

    double quantize(double freq) const;
    double bin_frequency(size_t idx) const;

private:
    double lo;
    double hi;
    double res;
    size_t bins;
};
