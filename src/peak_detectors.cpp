#include "peak_detectors.hpp"
#include <cmath>
#include <stdexcept>
#include <boost/algorithm/string.hpp> // For boost::iequals

namespace {
constexpr double REL_HEIGHT = 0.7;
constexpr double WIDEBAND_HEIGHT_OFFSET_DB = 1.0;
}

NarrowbandPeakDetector::NarrowbandPeakDetector() : detector_name("narrowband") {
    params.min_width = 1.0;
    params.max_width = 10.0;
    params.min_prominence = 10.0;
    params.rel_height = REL_HEIGHT;
    params.wlen = 20;
}

std::vector<PeakCandidate> NarrowbandPeakDetector::find_peaks(const std::vector<double>& power_row) const {
    double mean = finite_mean(power_row);
    if (std::isnan(mean)) return {};
    PeakSearchParams p = params;
    p.min_height = mean;
    return find_signal_peaks(power_row, p);
}

WidebandPeakDetector::WidebandPeakDetector() : detector_name("wideband") {
    params.min_width = 10.0;
    params.min_prominence = 0.0;
    params.max_prominence = 20.0;
    params.rel_height = REL_HEIGHT;
}

std::vector<PeakCandidate> WidebandPeakDetector::find_peaks(const std::vector<double>& power_row) const {
    double mean = finite_mean(power_row);
    if (std::isnan(mean)) return {};
    PeakSearchParams p = params;
    p.min_height = mean + WIDEBAND_HEIGHT_OFFSET_DB;
    return find_signal_peaks(power_row, p);
}

std::unique_ptr<PeakDetector> make_peak_detector(const std::string& detection_type) {
    if (boost::iequals(detection_type, "narrowband")) {
        return std::make_unique<NarrowbandPeakDetector>();
    } else if (boost::iequals(detection_type, "wideband")) {
        return std::make_unique<WidebandPeakDetector>();
    }
    throw std::invalid_argument("Invalid detection type selected: " + detection_type);
}
