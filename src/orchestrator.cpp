#include "orchestrator.hpp"
#include "atomic_file.hpp"
#include "time_utils.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <boost/format.hpp>
#include <yaml-cpp/yaml.h>

const char* to_string(RunState state) {
    switch (state) {
        case RunState::INITIALIZING: return "INITIALIZING";
        case RunState::RUNNING: return "RUNNING";
        case RunState::RESETTING: return "RESETTING";
        case RunState::STOPPED: return "STOPPED";
    }
    return "UNKNOWN";
}

Orchestrator::Orchestrator(const Config& config, IngestionSource& source, RunControl& control,
                           std::unique_ptr<PeakDetector> detector)
    : cfg(config),
      source(source),
      control(control),
      detector(std::move(detector)),
      clock(wall_clock_seconds),
      indexer(config.min_freq, config.max_freq, config.freq_resolution()),
      waterfall(indexer, config.waterfall_height),
      scan_history(config.waterfall_height, config.persistence_enabled()),
      aggregator(config.min_freq, config.max_freq, indexer.num_bins(), config.psd_db_resolution),
      freq_edges(aggregator.frequency_edges()),
      db_min(config.initial_db_min),
      db_max(config.initial_db_max),
      save_dir(config.save_path) {
    if (cfg.persistence_enabled()) {
        rotation.emplace(cfg.save_path, cfg.rotate_secs);
        waterfall_archiver.emplace(cfg.save_interval_minutes);
        if (this->detector) detection_ledger.emplace(cfg.min_freq, cfg.max_freq, cfg.verbose);
    }
    std::cout << boost::format("Waterfall: %.3f - %.3f MHz, %u bins of %.4f MHz, %u rows.\n")
                 % cfg.min_freq % cfg.max_freq % indexer.num_bins() % indexer.resolution() % cfg.waterfall_height;
}

void Orchestrator::run() {
    run_state = RunState::RUNNING;
    std::cout << "Waterfall running. Press Ctrl+C to stop." << std::endl;

    while (run_state != RunState::STOPPED && control.should_continue() && source.is_healthy()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg.poll_interval_ms));
        if (!control.should_continue()) break;
        run_once(clock());
    }

    stop(control.should_continue() ? "ingestion source is no longer healthy" : "stop requested");
}

size_t Orchestrator::run_once(double now) {
    if (run_state == RunState::STOPPED) return 0;
    if (control.take_reset()) {
        run_state = RunState::RESETTING;
        reset_derived();
    }
    run_state = RunState::RUNNING;

    std::vector<ScanBatch> drained;
    while (auto batch = source.poll_batch()) {
        drained.push_back(std::move(*batch));
    }
    if (drained.empty()) return 0;

    if (cfg.persistence_enabled()) select_output(now);

    size_t processed = 0;
    for (const auto& batch : drained) {
        if (process_batch(batch, now)) ++processed;
        if (!control.should_continue()) break;
    }
    return processed;
}

bool Orchestrator::process_batch(const ScanBatch& batch, double now) {
    const size_t dropped_before = waterfall.dropped_samples();
    const bool ingested = waterfall.ingest(batch);
    const size_t dropped = waterfall.dropped_samples() - dropped_before;
    if (dropped > 0) {
        std::cerr << boost::format("Warning: dropped %u of %u sample(s) outside %.3f to %.3f MHz in scan %.3f.\n")
                     % dropped % batch.samples.size() % cfg.min_freq % cfg.max_freq % batch.timestamp;
    }
    if (!ingested) {
        std::cout << boost::format("Scan is outside specified frequency range (%.3f to %.3f).\n")
                     % cfg.min_freq % cfg.max_freq;
        ++skipped;
        return false;
    }
    scan_history.push(batch.timestamp, batch.scan_config);

    double lo = 0.0;
    double hi = 0.0;
    if (waterfall.value_range(lo, hi)) {
        db_min = lo;
        db_max = hi;
    }

    CycleResult result;
    result.scan_time = batch.timestamp;
    result.db_min = db_min;
    result.db_max = db_max;
    result.psd = aggregator.aggregate(waterfall, db_min, db_max);
    freq_edges = result.psd.freq_edges;
    result.summary = waterfall.summaries();
    result.display = cfg.plot_snr ? normalize_snr(waterfall, cfg.snr_min, cfg.snr_max)
                                  : normalize_power(waterfall, db_min, db_max);
    result.top_bins = rank_busiest_bins(waterfall, cfg.top_n);

    if (detector) {
        result.detections = merge_peaks(detector->find_peaks(waterfall.current_row()), freq_edges);
    }

    if (cfg.persistence_enabled()) {
        if (output_selected || select_output(now)) {
            if (detection_ledger) {
                detection_ledger->record_cycle(save_dir, batch.timestamp, batch.scan_config,
                                               result.detections, detector->name());
            }
            waterfall_archiver->save_if_due(save_dir, clock(), batch.timestamp, scan_history, waterfall);
        }
    }

    if (!cfg.snapshot_path.empty()) publish_snapshot(result);

    if (cfg.verbose) {
        std::cout << boost::format("Processed scan %.3f: %u samples, %.1f to %.1f dB, %u detection(s).\n")
                     % batch.timestamp % batch.samples.size() % db_min % db_max % result.detections.size();
    }

    latest = std::move(result);
    ++cycle_count;
    return true;
}

void Orchestrator::stop(const std::string& reason) {
    if (run_state == RunState::STOPPED) return;
    run_state = RunState::STOPPED;
    std::cout << "\nWaterfall stopping: " << reason << "." << std::endl;
    if (detection_ledger && detection_ledger->pending_records() > 0) {
        size_t left = detection_ledger->flush_pending();
        if (left > 0) std::cerr << "Error: " << left << " detection(s) could not be saved." << std::endl;
    }
    source.shutdown();
    std::cout << boost::format("Processed %u scans (%u skipped).\n") % cycle_count % skipped;
}

void Orchestrator::reset_derived() {
    std::cout << "Waterfall: rebuilding derived state." << std::endl;
    freq_edges = aggregator.frequency_edges();
    latest = CycleResult();
}

bool Orchestrator::select_output(double now) {
    try {
        save_dir = rotation->select(now);
        output_selected = true;
    } catch (const std::exception& e) {
        std::cerr << "Error selecting output directory: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void Orchestrator::publish_snapshot(const CycleResult& result) const {
    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "scan_time" << YAML::Value << result.scan_time;
    emitter << YAML::Key << "db_min" << YAML::Value << result.db_min;
    emitter << YAML::Key << "db_max" << YAML::Value << result.db_max;
    emitter << YAML::Key << "min_freq" << YAML::Value << cfg.min_freq;
    emitter << YAML::Key << "max_freq" << YAML::Value << cfg.max_freq;
    emitter << YAML::Key << "freq_resolution" << YAML::Value << indexer.resolution();
    emitter << YAML::Key << "min" << YAML::Value << YAML::Flow << result.summary.min;
    emitter << YAML::Key << "max" << YAML::Value << YAML::Flow << result.summary.max;
    emitter << YAML::Key << "mean" << YAML::Value << YAML::Flow << result.summary.mean;
    emitter << YAML::Key << "current" << YAML::Value << YAML::Flow << result.summary.current;

    emitter << YAML::Key << "top_n" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& bin : result.top_bins) emitter << bin.frequency;
    emitter << YAML::EndSeq;

    emitter << YAML::Key << "detections" << YAML::Value << YAML::BeginSeq;
    for (const auto& d : result.detections) {
        emitter << YAML::Flow << YAML::BeginMap;
        emitter << YAML::Key << "start_freq" << YAML::Value << d.start_freq;
        emitter << YAML::Key << "end_freq" << YAML::Value << d.end_freq;
        emitter << YAML::Key << "dB" << YAML::Value << d.power_db;
        emitter << YAML::Key << "prominence" << YAML::Value << d.prominence;
        emitter << YAML::EndMap;
    }
    emitter << YAML::EndSeq;
    emitter << YAML::EndMap;

    try {
        write_file_atomically(cfg.snapshot_path, std::string(emitter.c_str()) + "\n");
    } catch (const std::exception& e) {
        std::cerr << "Error publishing snapshot: " << e.what() << std::endl;
    }
}
