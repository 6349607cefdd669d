#pragma once

#include "frequency_indexer.hpp"
#include "scan_data.hpp"

#include <cstddef>
#include <vector>

// NaN-ignoring per-bin statistics over the retained history. Bins that never saw a sample stay NaN.
struct ColumnSummary {
    std::vector<double> min;
    std::vector<double> max;
    std::vector<double> mean;
    std::vector<double> current;
};

/**
 * Fixed-depth rolling time x frequency matrix.
 *
 * Holds `height` rows of `num_bins` power and quantized-frequency cells, oldest row first.
 * Rows live in a ring: ingesting a scan moves the head instead of shifting data, the row that
 * falls off the top is reused as the new newest row. Cells without a sample hold NaN.
 */
class WaterfallBuffer {
public:
    WaterfallBuffer(const FrequencyIndexer& indexer, size_t height);

    // Replaces the oldest row with the batch. Returns false (and leaves the rows untouched)
    // when no sample of the batch falls inside the configured frequency range. Out-of-range
    // samples are counted in dropped_samples() either way.
    bool ingest(const ScanBatch& batch);

    size_t height() const { return rows; }
    size_t num_bins() const { return cols; }
    // Scans ingested so far, saturating at height().
    size_t retained_scans() const { return filled; }
    size_t dropped_samples() const { return dropped; }

    // Logical row 0 is the oldest retained scan, row height()-1 the newest.
    double power(size_t row, size_t col) const { return power_cells[offset(row, col)]; }
    double frequency(size_t row, size_t col) const { return frequency_cells[offset(row, col)]; }
    std::vector<double> power_row(size_t row) const;
    std::vector<double> current_row() const { return power_row(rows - 1); }
    std::vector<double> power_column(size_t col) const;

    ColumnSummary summaries() const;
    std::vector<double> column_minimums() const;

    // Matrix-wide range over populated cells; false when every cell is NaN.
    bool value_range(double& db_min, double& db_max) const;

    const FrequencyIndexer& indexer() const { return freq_index; }

private:
    size_t offset(size_t row, size_t col) const { return ((head + row) % rows) * cols + col; }

    FrequencyIndexer freq_index;
    size_t rows;
    size_t cols;
    size_t head = 0;
    size_t filled = 0;
    size_t dropped = 0;
    std::vector<double> power_cells;
    std::vector<double> frequency_cells;
};
