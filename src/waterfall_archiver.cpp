#include "waterfall_archiver.hpp"
#include "atomic_file.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <iostream>
#include <sstream>
#include <boost/format.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = boost::filesystem;

WaterfallArchiver::WaterfallArchiver(double save_interval_minutes)
    : interval_secs(save_interval_minutes * 60.0) {}

bool WaterfallArchiver::save_if_due(const fs::path& bucket_dir,
                                    double now,
                                    double scan_time,
                                    const ScanConfigHistory& history,
                                    const WaterfallBuffer& buffer) {
    if (!armed) {
        armed = true;
        last_save = now;
        return false;
    }
    if (now - last_save <= interval_secs || history.empty()) return false;

    try {
        const fs::path waterfall_dir = bucket_dir / "waterfall";
        ensure_directory(waterfall_dir);
        save(waterfall_dir, scan_time, history, buffer);
    } catch (const std::exception& e) {
        std::cerr << "Error: failed to save waterfall, will retry: " << e.what() << std::endl;
        return false;
    }
    last_save = now;
    ++save_count;
    return true;
}

void WaterfallArchiver::save(const fs::path& waterfall_dir,
                             double scan_time,
                             const ScanConfigHistory& history,
                             const WaterfallBuffer& buffer) const {
    const std::string label = timestamp_label(scan_time);

    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "start_scan_timestamp" << YAML::Value << history.oldest_time();
    emitter << YAML::Key << "start_scan_config" << YAML::Value << history.oldest_config();
    emitter << YAML::Key << "end_scan_timestamp" << YAML::Value << history.newest_time();
    emitter << YAML::Key << "end_scan_config" << YAML::Value << history.newest_config();
    emitter << YAML::EndMap;
    write_file_atomically(waterfall_dir / ("config_" + label + ".yaml"), std::string(emitter.c_str()) + "\n");

    // Only rows that hold a scan; leading never-filled rows are skipped.
    std::ostringstream csv;
    csv << "timestamp";
    for (size_t c = 0; c < buffer.num_bins(); ++c) {
        csv << boost::format(",%.6f") % buffer.indexer().bin_frequency(c);
    }
    csv << "\n";
    const std::deque<double> times = history.timestamps();
    const size_t first_row = buffer.height() - std::min(buffer.retained_scans(), times.size());
    for (size_t r = first_row; r < buffer.height(); ++r) {
        csv << timestamp_label(times[times.size() - (buffer.height() - r)]);
        for (size_t c = 0; c < buffer.num_bins(); ++c) {
            double v = buffer.power(r, c);
            csv << ",";
            if (!std::isnan(v)) csv << boost::format("%.2f") % v;
        }
        csv << "\n";
    }
    const fs::path csv_path = waterfall_dir / ("waterfall_" + label + ".csv");
    write_file_atomically(csv_path, csv.str());

    std::cout << "Saving " << csv_path.string() << std::endl;
}
