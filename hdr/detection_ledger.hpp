#pragma once

#include "peak_merger.hpp"
#include "scan_data.hpp"

#include <cstddef>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

/**
 * Append-only detection history plus change-triggered scan-config snapshots.
 *
 * Layout under a rotation bucket directory:
 *   detections/detections.csv                         timestamp,start_freq,end_freq,dB,type
 *   detections/detections_scan_config_<time>.yaml     timestamp, min_freq, max_freq, scan_configs
 *
 * Every write goes through a temp file and a rename. Rows that fail to commit stay queued
 * and are retried on the next call; rows for one file keep their order, but a file that keeps
 * failing does not hold back rows bound for another one. The contents of the file last
 * committed are kept in memory so appending to it does not re-read it from disk.
 */
class DetectionLedger {
public:
    static const char* const CSV_HEADER;
    static const char* const CSV_NAME;

    DetectionLedger(double min_freq, double max_freq, bool verbose = false);

    // One processing cycle: snapshot the scan config if it changed, then append one row per peak.
    void record_cycle(const boost::filesystem::path& bucket_dir,
                      double scan_time,
                      const ScanConfig& scan_config,
                      const std::vector<MergedPeak>& peaks,
                      const std::string& detection_type);

    // True if a snapshot was written; false if unchanged or the write failed (retried next time).
    bool snapshot_scan_config(const boost::filesystem::path& detections_dir, double scan_time,
                              const ScanConfig& scan_config);

    void append(const boost::filesystem::path& csv_path, const std::vector<DetectionRecord>& records);

    // Retries queued rows; returns how many are still waiting.
    size_t flush_pending();

    size_t pending_records() const;
    size_t committed_records() const { return committed; }
    size_t scan_config_writes() const { return snapshot_writes; }

private:
    struct PendingAppend {
        boost::filesystem::path csv_path;
        std::vector<DetectionRecord> records;
    };

    void commit(const PendingAppend& pending);

    double min_freq;
    double max_freq;
    bool verbose;
    bool have_previous_config = false;
    ScanConfig previous_config;
    size_t snapshot_writes = 0;
    size_t committed = 0;
    std::vector<PendingAppend> pending;
    boost::filesystem::path cached_path;
    std::string cached_contents;
};
