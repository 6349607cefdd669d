#include "config.hpp"
#include <fstream>
#include <boost/algorithm/string.hpp> // For boost::iequals

void Config::load_from_yaml(const std::string& filename) {
    YAML::Node config_node;
    try {
        config_node = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error loading config file '" + filename + "': " + e.what());
    }

    #define LOAD_YAML_PARAM(param_name, type) \
        if (config_node[#param_name]) param_name = config_node[#param_name].as<type>()

    try {
        LOAD_YAML_PARAM(min_freq, double);
        LOAD_YAML_PARAM(max_freq, double);
        LOAD_YAML_PARAM(sampling_rate, double);
        LOAD_YAML_PARAM(fft_len, size_t);
        LOAD_YAML_PARAM(waterfall_height, size_t);
        LOAD_YAML_PARAM(psd_db_resolution, size_t);
        LOAD_YAML_PARAM(snr_min, double);
        LOAD_YAML_PARAM(snr_max, double);
        LOAD_YAML_PARAM(plot_snr, bool);
        LOAD_YAML_PARAM(initial_db_min, double);
        LOAD_YAML_PARAM(initial_db_max, double);
        LOAD_YAML_PARAM(top_n, size_t);
        LOAD_YAML_PARAM(detection_type, std::string);
        LOAD_YAML_PARAM(save_path, std::string);
        LOAD_YAML_PARAM(save_interval_minutes, double);
        LOAD_YAML_PARAM(rotate_secs, long);
        LOAD_YAML_PARAM(snapshot_path, std::string);
        LOAD_YAML_PARAM(replay_path, std::string);
        LOAD_YAML_PARAM(replay_batches_per_poll, size_t);
        LOAD_YAML_PARAM(poll_interval_ms, size_t);
        LOAD_YAML_PARAM(usrp_args, std::string);
        LOAD_YAML_PARAM(rx_gain, double);
        LOAD_YAML_PARAM(rx_ant, std::string);
        LOAD_YAML_PARAM(subdev, std::string);
        LOAD_YAML_PARAM(clock_rate, double);
        LOAD_YAML_PARAM(step_freq, double);
        LOAD_YAML_PARAM(settling_time, double);
        LOAD_YAML_PARAM(avg_num, size_t);
        LOAD_YAML_PARAM(fft_window_type, std::string);
        LOAD_YAML_PARAM(num_samples_block, size_t);
        LOAD_YAML_PARAM(fft_wisdom_path, std::string);
        LOAD_YAML_PARAM(set_thread_priority, bool);
        LOAD_YAML_PARAM(verbose, bool);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value in config file '" + filename + "': " + e.what());
    }

    #undef LOAD_YAML_PARAM
}

void Config::save_to_yaml(const std::string& filename) const {
    YAML::Emitter emitter;
    emitter << YAML::BeginMap;

    #define SAVE_YAML_PARAM(param_name) \
        emitter << YAML::Key << #param_name << YAML::Value << param_name

    SAVE_YAML_PARAM(min_freq);
    SAVE_YAML_PARAM(max_freq);
    SAVE_YAML_PARAM(sampling_rate);
    SAVE_YAML_PARAM(fft_len);
    SAVE_YAML_PARAM(waterfall_height);
    SAVE_YAML_PARAM(psd_db_resolution);
    SAVE_YAML_PARAM(snr_min);
    SAVE_YAML_PARAM(snr_max);
    SAVE_YAML_PARAM(plot_snr);
    SAVE_YAML_PARAM(initial_db_min);
    SAVE_YAML_PARAM(initial_db_max);
    SAVE_YAML_PARAM(top_n);
    SAVE_YAML_PARAM(detection_type);
    SAVE_YAML_PARAM(save_path);
    SAVE_YAML_PARAM(save_interval_minutes);
    SAVE_YAML_PARAM(rotate_secs);
    SAVE_YAML_PARAM(snapshot_path);
    SAVE_YAML_PARAM(replay_path);
    SAVE_YAML_PARAM(replay_batches_per_poll);
    SAVE_YAML_PARAM(poll_interval_ms);
    SAVE_YAML_PARAM(usrp_args);
    SAVE_YAML_PARAM(rx_gain);
    SAVE_YAML_PARAM(rx_ant);
    SAVE_YAML_PARAM(subdev);
    SAVE_YAML_PARAM(clock_rate);
    SAVE_YAML_PARAM(step_freq);
    SAVE_YAML_PARAM(settling_time);
    SAVE_YAML_PARAM(avg_num);
    SAVE_YAML_PARAM(fft_window_type);
    SAVE_YAML_PARAM(num_samples_block);
    SAVE_YAML_PARAM(fft_wisdom_path);
    SAVE_YAML_PARAM(set_thread_priority);
    SAVE_YAML_PARAM(verbose);

    #undef SAVE_YAML_PARAM

    emitter << YAML::EndMap;

    std::ofstream fout(filename);
    if (!fout.is_open()) {
        throw std::runtime_error("Error opening file for saving config: " + filename);
    }
    fout << emitter.c_str() << std::endl;
}

void Config::validate() const {
    if (max_freq <= min_freq) throw std::runtime_error("max_freq must be greater than min_freq.");
    if (sampling_rate <= 0) throw std::runtime_error("Sampling rate must be positive.");
    if (fft_len == 0) throw std::runtime_error("FFT length must be positive.");
    if (waterfall_height == 0) throw std::runtime_error("waterfall_height must be at least 1.");
    if (psd_db_resolution < 2) throw std::runtime_error("psd_db_resolution must be at least 2.");
    if (snr_max <= snr_min) throw std::runtime_error("snr_max must be greater than snr_min.");
    if (initial_db_max <= initial_db_min) throw std::runtime_error("initial_db_max must be greater than initial_db_min.");
    if (rotate_secs < 0) throw std::runtime_error("rotate_secs cannot be negative.");
    if (replay_batches_per_poll == 0) throw std::runtime_error("replay_batches_per_poll must be at least 1.");
    if (save_interval_minutes <= 0) throw std::runtime_error("save_interval_minutes must be positive.");
    if (!detection_type.empty() && !boost::iequals(detection_type, "wideband") &&
        !boost::iequals(detection_type, "narrowband")) {
        throw std::runtime_error("Unsupported detection type: " + detection_type + ". Choose 'wideband' or 'narrowband'.");
    }
    if (!detection_type.empty() && save_path.empty()) {
        std::cerr << "Warning: detection_type set but no save_path given; detections will not be persisted." << std::endl;
    }
}
