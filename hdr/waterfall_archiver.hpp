#pragma once

#include "scan_config_history.hpp"
#include "waterfall_buffer.hpp"

#include <boost/filesystem.hpp>

// Periodic copies of the retained waterfall under `<bucket>/waterfall/`.
class WaterfallArchiver {
public:
    WaterfallArchiver(double save_interval_minutes);

    // The first call arms the timer. Later calls save once the interval has elapsed since the
    // last save; returns true when both artifacts were written.
    bool save_if_due(const boost::filesystem::path& bucket_dir,
                     double now,
                     double scan_time,
                     const ScanConfigHistory& history,
                     const WaterfallBuffer& buffer);

    void save(const boost::filesystem::path& waterfall_dir,
              double scan_time,
              const ScanConfigHistory& history,
              const WaterfallBuffer& buffer) const;

    size_t saves() const { return save_count; }

private:
    double interval_secs;
    bool armed = false;
    double last_save = 0.0;
    size_t save_count = 0;
};
