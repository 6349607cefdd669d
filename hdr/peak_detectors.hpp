#pragma once

#include "peak_detector.hpp"
#include "signal_peaks.hpp"

#include <memory>
#include <string>
#include <vector>

// Short, strong carriers: a few bins wide and well clear of the local floor.
class NarrowbandPeakDetector : public PeakDetector {
public:
    NarrowbandPeakDetector();
    ~NarrowbandPeakDetector() override = default;

    const std::string& name() const override { return detector_name; }
    std::vector<PeakCandidate> find_peaks(const std::vector<double>& power_row) const override;

private:
    std::string detector_name;
    PeakSearchParams params;
};

// Broad occupied bands: at least ten bins wide, any prominence up to 20 dB.
class WidebandPeakDetector : public PeakDetector {
public:
    WidebandPeakDetector();
    ~WidebandPeakDetector() override = default;

    const std::string& name() const override { return detector_name; }
    std::vector<PeakCandidate> find_peaks(const std::vector<double>& power_row) const override;

private:
    std::string detector_name;
    PeakSearchParams params;
};

// Case-insensitive "narrowband" / "wideband"; anything else throws std::invalid_argument.
std::unique_ptr<PeakDetector> make_peak_detector(const std::string& detection_type);
