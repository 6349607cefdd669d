#pragma once

#include "ingestion_source.hpp"

#include <fstream>
#include <optional>
#include <string>

/**
 * Replays a recorded scan log.
 *
 * CSV with header `ts,freq,db` (freq in MHz); consecutive rows sharing a timestamp form one
 * batch. Malformed rows are skipped with a warning. The source reports itself unhealthy once
 * the log is exhausted, which ends a run after the last batch has been processed.
 *
 * At most `batches_per_poll` batches are released per poll cycle: once that many have been
 * handed out, the next poll returns nothing and ends the caller's drain. The log is read
 * lazily, so only the batches in flight are held in memory.
 */
class ReplaySource : public IngestionSource {
public:
    ReplaySource(const std::string& path, bool verbose = false, size_t batches_per_poll = 1);
    ~ReplaySource() override = default;

    std::optional<ScanBatch> poll_batch() override;
    bool is_healthy() const override;
    void shutdown() override;

    size_t batches_read() const { return batch_count; }
    size_t rows_skipped() const { return skipped; }

private:
    bool read_row(double& ts, ScanSample& sample);

    std::string path;
    std::ifstream in;
    bool verbose;
    size_t batches_per_poll;
    size_t released_this_poll = 0;
    bool exhausted = false;
    bool stopped = false;
    bool have_lookahead = false;
    double lookahead_ts = 0.0;
    ScanSample lookahead_sample{0.0, 0.0};
    size_t line_no = 0;
    size_t batch_count = 0;
    size_t skipped = 0;
};
