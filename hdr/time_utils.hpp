#pragma once

#include <string>

// Seconds since the Unix epoch from the system clock.
double wall_clock_seconds();

// Label used for scan times in artifact file names.
std::string timestamp_label(double scan_time);
