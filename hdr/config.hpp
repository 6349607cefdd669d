#pragma once

#include <string>
#include <vector>
#include <stdexcept> // For std::runtime_error
#include <iostream>  // For std::cerr in validate

#include <yaml-cpp/yaml.h>

// Frequencies of the waterfall itself are in MHz, radio settings in Hz.
struct Config {
    // Waterfall Range
    double min_freq = 2200.0;
    double max_freq = 6000.0;
    double sampling_rate = 8.192e6;
    size_t fft_len = 256;

    // Waterfall Parameters
    size_t waterfall_height = 100;
    size_t psd_db_resolution = 90;
    double snr_min = 0.0;
    double snr_max = 50.0;
    bool plot_snr = false;
    double initial_db_min = -220.0;
    double initial_db_max = -150.0;
    size_t top_n = 0;
    std::string detection_type = "";

    // Persistence
    std::string save_path = "";
    double save_interval_minutes = 1.0;
    long rotate_secs = 900;
    std::string snapshot_path = "";

    // Ingestion
    std::string replay_path = "";
    size_t replay_batches_per_poll = 1;
    size_t poll_interval_ms = 100;

    // USRP Sweep Settings
    std::string usrp_args = "type=b200";
    double rx_gain = 40.0;
    std::string rx_ant = "TX/RX";
    std::string subdev = "A:A";
    double clock_rate = 0.0;
    double step_freq = 0.0;
    double settling_time = 0.05;
    size_t avg_num = 10;
    std::string fft_window_type = "hann";
    size_t num_samples_block = 16384;
    std::string fft_wisdom_path = "";
    bool set_thread_priority = true;

    bool verbose = false;

    double freq_resolution() const { return sampling_rate / static_cast<double>(fft_len) / 1e6; }
    double sweep_step_hz() const { return step_freq > 0.0 ? step_freq : sampling_rate; }
    bool persistence_enabled() const { return !save_path.empty(); }

    void load_from_yaml(const std::string& filename);
    void save_to_yaml(const std::string& filename) const;
    void validate() const;
};
