#include "detection_ledger.hpp"
#include "atomic_file.hpp"
#include "time_utils.hpp"

#include <iostream>
#include <set>
#include <stdexcept>
#include <boost/format.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = boost::filesystem;

const char* const DetectionLedger::CSV_HEADER = "timestamp,start_freq,end_freq,dB,type\n";
const char* const DetectionLedger::CSV_NAME = "detections.csv";

DetectionLedger::DetectionLedger(double min_freq, double max_freq, bool verbose)
    : min_freq(min_freq), max_freq(max_freq), verbose(verbose) {}

void DetectionLedger::record_cycle(const fs::path& bucket_dir,
                                   double scan_time,
                                   const ScanConfig& scan_config,
                                   const std::vector<MergedPeak>& peaks,
                                   const std::string& detection_type) {
    const fs::path detections_dir = bucket_dir / "detections";
    try {
        ensure_directory(detections_dir);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }

    snapshot_scan_config(detections_dir, scan_time, scan_config);

    std::vector<DetectionRecord> records;
    records.reserve(peaks.size());
    for (const auto& peak : peaks) {
        records.push_back({scan_time, peak.start_freq, peak.end_freq, peak.power_db, detection_type});
    }
    append(detections_dir / CSV_NAME, records);
}

bool DetectionLedger::snapshot_scan_config(const fs::path& detections_dir, double scan_time,
                                           const ScanConfig& scan_config) {
    if (have_previous_config && previous_config == scan_config) return false;

    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "timestamp" << YAML::Value << scan_time;
    emitter << YAML::Key << "min_freq" << YAML::Value << min_freq;
    emitter << YAML::Key << "max_freq" << YAML::Value << max_freq;
    emitter << YAML::Key << "scan_configs" << YAML::Value << scan_config;
    emitter << YAML::EndMap;

    const fs::path path = detections_dir / ("detections_scan_config_" + timestamp_label(scan_time) + ".yaml");
    try {
        write_file_atomically(path, std::string(emitter.c_str()) + "\n");
    } catch (const std::exception& e) {
        std::cerr << "Error: failed to save scan config snapshot, will retry: " << e.what() << std::endl;
        return false;
    }

    previous_config = scan_config;
    have_previous_config = true;
    ++snapshot_writes;
    if (verbose) std::cout << "Wrote " << path.string() << std::endl;
    return true;
}

void DetectionLedger::append(const fs::path& csv_path, const std::vector<DetectionRecord>& records) {
    if (!records.empty()) {
        if (!pending.empty() && pending.back().csv_path == csv_path) {
            pending.back().records.insert(pending.back().records.end(), records.begin(), records.end());
        } else {
            pending.push_back({csv_path, records});
        }
    }
    flush_pending();
}

size_t DetectionLedger::flush_pending() {
    std::vector<PendingAppend> still_pending;
    std::set<fs::path> failed_paths;
    for (auto& p : pending) {
        if (failed_paths.count(p.csv_path)) {
            still_pending.push_back(std::move(p));
            continue;
        }
        try {
            commit(p);
        } catch (const std::exception& e) {
            std::cerr << boost::format("Error: %u detection(s) for %s not yet saved, will retry: %s\n")
                         % p.records.size() % p.csv_path.string() % e.what();
            failed_paths.insert(p.csv_path);
            still_pending.push_back(std::move(p));
            continue;
        }
        committed += p.records.size();
        if (verbose) {
            std::cout << boost::format("Saved %u detection(s) to %s\n") % p.records.size() % p.csv_path.string();
        }
    }
    pending = std::move(still_pending);
    return pending_records();
}

size_t DetectionLedger::pending_records() const {
    size_t n = 0;
    for (const auto& p : pending) n += p.records.size();
    return n;
}

void DetectionLedger::commit(const PendingAppend& p) {
    ensure_directory(p.csv_path.parent_path());
    std::string contents = p.csv_path == cached_path ? cached_contents : read_file(p.csv_path);
    if (contents.empty()) contents = CSV_HEADER;
    for (const auto& r : p.records) {
        contents += (boost::format("%.3f,%.6f,%.6f,%.2f,%s\n")
                     % r.timestamp % r.start_freq % r.end_freq % r.power_db % r.detection_type).str();
    }
    write_file_atomically(p.csv_path, contents);
    cached_path = p.csv_path;
    cached_contents = std::move(contents);
}
