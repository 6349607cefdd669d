#pragma once

#include "config.hpp"
#include "detection_ledger.hpp"
#include "ingestion_source.hpp"
#include "peak_detector.hpp"
#include "peak_merger.hpp"
#include "psd_aggregator.hpp"
#include "rotation_manager.hpp"
#include "scan_config_history.hpp"
#include "top_n_ranker.hpp"
#include "waterfall_archiver.hpp"
#include "waterfall_buffer.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

enum class RunState { INITIALIZING, RUNNING, RESETTING, STOPPED };

const char* to_string(RunState state);

// Cooperative flags shared between the processing loop and whoever may stop or reset it
// (signal handlers, a display layer).
class RunControl {
public:
    void request_stop() { keep_running = false; }
    void request_reset() { reset_requested = true; }
    bool should_continue() const { return keep_running.load(); }
    bool take_reset() { return reset_requested.exchange(false); }

private:
    std::atomic<bool> keep_running{true};
    std::atomic<bool> reset_requested{false};
};

// Everything derived from the waterfall for the newest processed scan.
struct CycleResult {
    double scan_time = 0.0;
    double db_min = 0.0;
    double db_max = 0.0;
    PsdGrid psd;
    ColumnSummary summary;
    std::vector<double> display; // normalized power (or SNR) matrix, oldest row first
    std::vector<RankedBin> top_bins;
    std::vector<MergedPeak> detections;
};

/**
 * Single-threaded pipeline driver: ingestion -> waterfall -> PSD / ranking -> detection ->
 * persistence. Owns the waterfall and the scan history; nothing else mutates them.
 */
class Orchestrator {
public:
    using Clock = std::function<double()>;

    Orchestrator(const Config& config, IngestionSource& source, RunControl& control,
                 std::unique_ptr<PeakDetector> detector = nullptr);

    // Time source for loop iterations and archive intervals; the system clock by default.
    void set_clock(Clock c) { clock = std::move(c); }

    // Loops until stopped or the source turns unhealthy, then shuts the source down.
    void run();

    // One loop body without the rate-limiting sleep. Returns the number of batches processed.
    size_t run_once(double now);

    // `now` picks the rotation bucket; the archive interval is checked against the clock.
    // Returns false when the batch was skipped as out of range.
    bool process_batch(const ScanBatch& batch, double now);

    // Ends the run and shuts the source down; safe to call more than once.
    void stop(const std::string& reason);

    RunState state() const { return run_state; }
    const WaterfallBuffer& buffer() const { return waterfall; }
    const ScanConfigHistory& history() const { return scan_history; }
    const CycleResult& last_cycle() const { return latest; }
    const std::vector<double>& frequency_edges() const { return freq_edges; }
    size_t cycles() const { return cycle_count; }
    size_t skipped_batches() const { return skipped; }
    const DetectionLedger* ledger() const { return detection_ledger ? &*detection_ledger : nullptr; }
    const WaterfallArchiver* archiver() const { return waterfall_archiver ? &*waterfall_archiver : nullptr; }
    const boost::filesystem::path& output_dir() const { return save_dir; }

private:
    void reset_derived();
    bool select_output(double now);
    void publish_snapshot(const CycleResult& result) const;

    const Config& cfg;
    IngestionSource& source;
    RunControl& control;
    std::unique_ptr<PeakDetector> detector;
    Clock clock;

    RunState run_state = RunState::INITIALIZING;
    FrequencyIndexer indexer;
    WaterfallBuffer waterfall;
    ScanConfigHistory scan_history;
    PsdAggregator aggregator;
    std::vector<double> freq_edges;

    double db_min;
    double db_max;

    std::optional<RotationManager> rotation;
    std::optional<DetectionLedger> detection_ledger;
    std::optional<WaterfallArchiver> waterfall_archiver;
    boost::filesystem::path save_dir;
    bool output_selected = false;

    CycleResult latest;
    size_t cycle_count = 0;
    size_t skipped = 0;
};
