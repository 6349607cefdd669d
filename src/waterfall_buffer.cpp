#include "waterfall_buffer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {
const double NaN = std::numeric_limits<double>::quiet_NaN();
}

WaterfallBuffer::WaterfallBuffer(const FrequencyIndexer& indexer, size_t height)
    : freq_index(indexer), rows(height), cols(indexer.num_bins()) {
    if (rows == 0) throw std::invalid_argument("WaterfallBuffer: height must be at least 1.");
    power_cells.assign(rows * cols, NaN);
    frequency_cells.assign(rows * cols, NaN);
}

bool WaterfallBuffer::ingest(const ScanBatch& batch) {
    std::vector<std::pair<size_t, const ScanSample*>> mapped;
    mapped.reserve(batch.samples.size());
    for (const auto& sample : batch.samples) {
        size_t idx = 0;
        if (freq_index.try_index(sample.frequency_mhz, idx)) {
            mapped.emplace_back(idx, &sample);
        }
    }
    dropped += batch.samples.size() - mapped.size();
    if (mapped.empty()) return false;

    // The oldest row becomes the newest one.
    size_t newest = head;
    head = (head + 1) % rows;
    double* power_row_ptr = power_cells.data() + newest * cols;
    double* freq_row_ptr = frequency_cells.data() + newest * cols;
    std::fill(power_row_ptr, power_row_ptr + cols, NaN);
    std::fill(freq_row_ptr, freq_row_ptr + cols, NaN);

    // Later samples for the same bin overwrite earlier ones.
    for (const auto& m : mapped) {
        power_row_ptr[m.first] = m.second->power_db;
        freq_row_ptr[m.first] = freq_index.quantize(m.second->frequency_mhz);
    }

    if (filled < rows) ++filled;
    return true;
}

std::vector<double> WaterfallBuffer::power_row(size_t row) const {
    if (row >= rows) throw std::out_of_range("WaterfallBuffer: row index out of range.");
    const double* begin = power_cells.data() + ((head + row) % rows) * cols;
    return std::vector<double>(begin, begin + cols);
}

std::vector<double> WaterfallBuffer::power_column(size_t col) const {
    if (col >= cols) throw std::out_of_range("WaterfallBuffer: column index out of range.");
    std::vector<double> column(rows);
    for (size_t r = 0; r < rows; ++r) column[r] = power(r, col);
    return column;
}

ColumnSummary WaterfallBuffer::summaries() const {
    ColumnSummary s;
    s.min.assign(cols, NaN);
    s.max.assign(cols, NaN);
    s.mean.assign(cols, NaN);
    s.current = current_row();

    std::vector<double> sum(cols, 0.0);
    std::vector<size_t> count(cols, 0);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            double v = power(r, c);
            if (std::isnan(v)) continue;
            if (count[c] == 0) {
                s.min[c] = v;
                s.max[c] = v;
            } else {
                s.min[c] = std::min(s.min[c], v);
                s.max[c] = std::max(s.max[c], v);
            }
            sum[c] += v;
            ++count[c];
        }
    }
    for (size_t c = 0; c < cols; ++c) {
        if (count[c] > 0) s.mean[c] = sum[c] / static_cast<double>(count[c]);
    }
    return s;
}

std::vector<double> WaterfallBuffer::column_minimums() const {
    std::vector<double> mins(cols, NaN);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            double v = power(r, c);
            if (std::isnan(v)) continue;
            if (std::isnan(mins[c]) || v < mins[c]) mins[c] = v;
        }
    }
    return mins;
}

bool WaterfallBuffer::value_range(double& db_min, double& db_max) const {
    bool found = false;
    for (double v : power_cells) {
        if (std::isnan(v)) continue;
        if (!found) {
            db_min = v;
            db_max = v;
            found = true;
        } else {
            db_min = std::min(db_min, v);
            db_max = std::max(db_max, v);
        }
    }
    return found;
}
