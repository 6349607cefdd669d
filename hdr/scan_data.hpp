#pragma once

#include <map>
#include <string>
#include <vector>

// Opaque key/value description of the scanner state at capture time.
using ScanConfig = std::map<std::string, std::string>;

struct ScanSample {
    double frequency_mhz;
    double power_db;
};

// One scan, applied to the waterfall as a unit.
struct ScanBatch {
    double timestamp = 0.0;
    ScanConfig scan_config;
    std::vector<ScanSample> samples;
};

struct DetectionRecord {
    double timestamp;
    double start_freq;
    double end_freq;
    double power_db;
    std::string detection_type;
};
