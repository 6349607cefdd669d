#include "signal_peaks.hpp"
#include <algorithm>
#include <cmath>

namespace {

std::vector<double> fill_missing(const std::vector<double>& row, bool& any_finite) {
    double floor_value = std::numeric_limits<double>::infinity();
    any_finite = false;
    for (double v : row) {
        if (std::isnan(v)) continue;
        floor_value = std::min(floor_value, v);
        any_finite = true;
    }
    std::vector<double> x(row);
    if (!any_finite) return x;
    for (double& v : x) {
        if (std::isnan(v)) v = floor_value;
    }
    return x;
}

std::vector<long> local_maxima(const std::vector<double>& x) {
    std::vector<long> peaks;
    const long n = static_cast<long>(x.size());
    long i = 1;
    while (i < n - 1) {
        if (x[i - 1] < x[i]) {
            long ahead = i + 1;
            while (ahead < n - 1 && x[ahead] == x[i]) ++ahead;
            if (x[ahead] < x[i]) {
                long left_edge = i;
                long right_edge = ahead - 1;
                peaks.push_back((left_edge + right_edge) / 2);
                i = ahead;
            }
        }
        ++i;
    }
    return peaks;
}

}

double finite_mean(const std::vector<double>& row) {
    double sum = 0.0;
    size_t n = 0;
    for (double v : row) {
        if (std::isnan(v)) continue;
        sum += v;
        ++n;
    }
    return n ? sum / static_cast<double>(n) : std::numeric_limits<double>::quiet_NaN();
}

std::vector<PeakCandidate> find_signal_peaks(const std::vector<double>& row, const PeakSearchParams& params) {
    std::vector<PeakCandidate> candidates;
    if (row.size() < 3) return candidates;

    bool any_finite = false;
    const std::vector<double> x = fill_missing(row, any_finite);
    if (!any_finite) return candidates;

    const long n = static_cast<long>(x.size());
    const long half_window = params.wlen >= 2 ? static_cast<long>(params.wlen / 2) : -1;

    for (long peak : local_maxima(x)) {
        const double height = x[peak];
        if (height < params.min_height || height > params.max_height) continue;

        long i_min = 0;
        long i_max = n - 1;
        if (half_window >= 0) {
            i_min = std::max(peak - half_window, 0L);
            i_max = std::min(peak + half_window, n - 1);
        }

        long left_base = peak;
        double left_min = height;
        for (long i = peak; i >= i_min && x[i] <= height; --i) {
            if (x[i] < left_min) {
                left_min = x[i];
                left_base = i;
            }
        }
        long right_base = peak;
        double right_min = height;
        for (long i = peak; i <= i_max && x[i] <= height; ++i) {
            if (x[i] < right_min) {
                right_min = x[i];
                right_base = i;
            }
        }

        const double prominence = height - std::max(left_min, right_min);
        if (prominence < params.min_prominence || prominence > params.max_prominence) continue;

        const double width_height = height - prominence * params.rel_height;

        long i = peak;
        while (left_base < i && width_height < x[i]) --i;
        double left_ips = static_cast<double>(i);
        if (x[i] < width_height) left_ips += (width_height - x[i]) / (x[i + 1] - x[i]);

        i = peak;
        while (i < right_base && width_height < x[i]) ++i;
        double right_ips = static_cast<double>(i);
        if (x[i] < width_height) right_ips -= (width_height - x[i]) / (x[i - 1] - x[i]);

        const double width = right_ips - left_ips;
        if (width < params.min_width || width > params.max_width) continue;

        candidates.push_back({static_cast<size_t>(peak), left_ips, right_ips, height, prominence, width_height});
    }
    return candidates;
}
