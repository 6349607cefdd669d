#pragma once

#include "waterfall_buffer.hpp"

#include <cstddef>
#include <vector>

struct RankedBin {
    size_t bin_index;
    double frequency;
    double variance;
};

// Busiest bins first: variance of (power - column minimum) over the retained history.
// Bins with no samples carry NaN variance and rank behind every populated bin.
std::vector<RankedBin> rank_busiest_bins(const WaterfallBuffer& buffer, size_t top_n);

std::vector<double> top_n_frequencies(const WaterfallBuffer& buffer, size_t top_n);
