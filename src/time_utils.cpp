#include "time_utils.hpp"

#include <chrono>
#include <boost/format.hpp>

double wall_clock_seconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string timestamp_label(double scan_time) {
    return (boost::format("%.3f") % scan_time).str();
}
