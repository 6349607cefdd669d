#include "psd_estimator.hpp"
#include <cmath>
#include <algorithm>
#include <iostream>
#include <boost/math/constants/constants.hpp>
#include <boost/algorithm/string.hpp> // For boost::iequals

constexpr double PI = boost::math::constants::pi<double>();

PsdEstimator::PsdEstimator(const Config& config)
    : PsdEstimator(config.fft_len, config.avg_num, config.fft_window_type, config.fft_wisdom_path) {}

PsdEstimator::PsdEstimator(size_t fft_len, size_t avg_num, const std::string& window_type,
                           const std::string& wisdom_path)
    : fft_len(fft_len), avg_num(avg_num), window_type(window_type) {
    if (fft_len == 0) throw std::runtime_error("FFT length cannot be zero.");
    if (avg_num == 0) throw std::runtime_error("Averaging number must be at least 1.");
    fft_in.resize(fft_len);
    fft_out.resize(fft_len);
    psd_sum.assign(fft_len, 0.0);
    generate_window();

    unsigned flags = FFTW_ESTIMATE;
    if (!wisdom_path.empty()) {
        if (fftwf_import_wisdom_from_filename(wisdom_path.c_str())) {
            std::cout << "Loaded FFTW wisdom from " << wisdom_path << std::endl;
            flags = FFTW_WISDOM_ONLY;
        } else {
            std::cerr << "Warning: Failed to load FFTW wisdom from " << wisdom_path << ". Planning may take longer." << std::endl;
            flags = FFTW_MEASURE;
        }
    }

    auto make_plan = [this](unsigned plan_flags) {
        return fftwf_plan_dft_1d(static_cast<int>(this->fft_len),
                                 reinterpret_cast<fftwf_complex*>(fft_in.data()),
                                 reinterpret_cast<fftwf_complex*>(fft_out.data()),
                                 FFTW_FORWARD,
                                 plan_flags);
    };
    fft_plan.reset(make_plan(flags));
    if (!fft_plan && (flags & FFTW_WISDOM_ONLY)) {
        std::cerr << "Warning: Wisdom has no plan for length " << fft_len << ". Falling back to FFTW_ESTIMATE." << std::endl;
        fft_plan.reset(make_plan(FFTW_ESTIMATE));
    }
    if (!fft_plan) {
        throw std::runtime_error("FFTW failed to create plan.");
    }
}

void PsdEstimator::generate_window() {
    window.resize(fft_len);
    const double denom = fft_len > 1 ? static_cast<double>(fft_len - 1) : 1.0;
    if (boost::iequals(window_type, "hann")) {
        for (size_t i = 0; i < fft_len; ++i)
            window[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * PI * i / denom)));
    } else if (boost::iequals(window_type, "hamming")) {
        for (size_t i = 0; i < fft_len; ++i)
            window[i] = static_cast<float>(0.54 - 0.46 * std::cos(2.0 * PI * i / denom));
    } else if (boost::iequals(window_type, "blackmanharris")) {
        const double a0 = 0.35875, a1 = 0.48829, a2 = 0.14128, a3 = 0.01168;
        for (size_t i = 0; i < fft_len; ++i)
            window[i] = static_cast<float>(a0 - a1 * std::cos(2 * PI * i / denom) + a2 * std::cos(4 * PI * i / denom)
                                           - a3 * std::cos(6 * PI * i / denom));
    } else if (boost::iequals(window_type, "none")) {
        std::fill(window.begin(), window.end(), 1.0f);
    } else {
        throw std::runtime_error("Unsupported FFT window: " + window_type);
    }

    // Unit energy per sample, so power is comparable across windows.
    double window_power = 0.0;
    for (float w : window) window_power += static_cast<double>(w) * w;
    if (window_power > 1e-9) {
        float norm_factor = static_cast<float>(std::sqrt(static_cast<double>(fft_len) / window_power));
        for (float& w : window) w *= norm_factor;
    }
}

void PsdEstimator::reset() {
    current_avg_count = 0;
    std::fill(psd_sum.begin(), psd_sum.end(), 0.0);
}

bool PsdEstimator::process_block(const std::vector<std::complex<float>>& data, std::vector<double>& psd_db) {
    if (data.size() != fft_len) {
        throw std::invalid_argument("PsdEstimator: block of " + std::to_string(data.size()) +
                                    " samples, expected " + std::to_string(fft_len));
    }

    for (size_t i = 0; i < fft_len; ++i) {
        fft_in[i] = data[i] * window[i];
    }
    fftwf_execute(fft_plan.get());

    const double norm_factor = 1.0 / (static_cast<double>(fft_len) * static_cast<double>(fft_len));
    for (size_t i = 0; i < fft_len; ++i) {
        size_t shifted_idx = (i + fft_len / 2) % fft_len; // FFT shift
        double power_val = std::norm(fft_out[shifted_idx]) * norm_factor;
        psd_sum[i] += 10.0 * std::log10(std::max(power_val, 1e-20));
    }

    if (++current_avg_count < avg_num) return false;

    psd_db.resize(fft_len);
    const double avg_factor = 1.0 / static_cast<double>(current_avg_count);
    for (size_t i = 0; i < fft_len; ++i) psd_db[i] = psd_sum[i] * avg_factor;
    reset();
    return true;
}

void PsdEstimator::save_wisdom(const std::string& path) {
    if (!path.empty()) {
        if (fftwf_export_wisdom_to_filename(path.c_str())) {
            std::cout << "Saved FFTW wisdom to " << path << std::endl;
        } else {
            std::cerr << "Error saving FFTW wisdom to " << path << std::endl;
        }
    }
}
