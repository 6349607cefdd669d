#include "cli_options.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <boost/format.hpp>

namespace {

template <typename T>
std::function<void(const T&)> must_be_positive(const char* name) {
    return [name](const T& v) {
        if (!(v > 0)) throw po::validation_error(po::validation_error::invalid_option_value, name, std::to_string(v));
    };
}

template <typename T>
std::function<void(const T&)> must_not_be_negative(const char* name) {
    return [name](const T& v) {
        if (v < 0) throw po::validation_error(po::validation_error::invalid_option_value, name, std::to_string(v));
    };
}

} // namespace

void add_config_options(po::options_description& desc, Config& cfg, bool with_usrp_keys) {
    desc.add_options()
        ("verbose,v", po::bool_switch(&cfg.verbose)->default_value(cfg.verbose), "Enable verbose output")

        // Waterfall Range
        ("min-freq", po::value<double>(&cfg.min_freq)->default_value(cfg.min_freq), "Lowest waterfall frequency (MHz)")
        ("max-freq", po::value<double>(&cfg.max_freq)->default_value(cfg.max_freq), "Highest waterfall frequency (MHz)")
        ("sampling-rate", po::value<double>(&cfg.sampling_rate)->default_value(cfg.sampling_rate)->notifier(must_be_positive<double>("sampling-rate")), "Sampling rate (Sps), sets bin resolution with fft-len")
        ("fft-len", po::value<size_t>(&cfg.fft_len)->default_value(cfg.fft_len)->notifier(must_be_positive<size_t>("fft-len")), "FFT length (points)")

        // Waterfall Parameters
        ("waterfall-height", po::value<size_t>(&cfg.waterfall_height)->default_value(cfg.waterfall_height)->notifier(must_be_positive<size_t>("waterfall-height")), "Number of scans kept in the waterfall")
        ("psd-db-resolution", po::value<size_t>(&cfg.psd_db_resolution)->default_value(cfg.psd_db_resolution), "Number of power levels in the PSD histogram")
        ("snr-min", po::value<double>(&cfg.snr_min)->default_value(cfg.snr_min), "Lower SNR display bound (dB)")
        ("snr-max", po::value<double>(&cfg.snr_max)->default_value(cfg.snr_max), "Upper SNR display bound (dB)")
        ("plot-snr", po::value<bool>(&cfg.plot_snr)->default_value(cfg.plot_snr)->implicit_value(true), "Display SNR instead of absolute power")
        ("initial-db-min", po::value<double>(&cfg.initial_db_min)->default_value(cfg.initial_db_min), "Power range lower bound before any scan (dB)")
        ("initial-db-max", po::value<double>(&cfg.initial_db_max)->default_value(cfg.initial_db_max), "Power range upper bound before any scan (dB)")
        ("top-n", po::value<size_t>(&cfg.top_n)->default_value(cfg.top_n), "Number of busiest bins to report (0 to disable)")
        ("detection-type", po::value<std::string>(&cfg.detection_type)->default_value(cfg.detection_type), "Peak detector ('wideband', 'narrowband' or empty)")

        // Persistence
        ("save-path", po::value<std::string>(&cfg.save_path)->default_value(cfg.save_path), "Output directory (empty disables persistence)")
        ("save-interval", po::value<double>(&cfg.save_interval_minutes)->default_value(cfg.save_interval_minutes)->notifier(must_be_positive<double>("save-interval")), "Minutes between waterfall archives")
        ("rotate-secs", po::value<long>(&cfg.rotate_secs)->default_value(cfg.rotate_secs)->notifier(must_not_be_negative<long>("rotate-secs")), "Output directory rotation period (s, 0 to disable)")
        ("snapshot-path", po::value<std::string>(&cfg.snapshot_path)->default_value(cfg.snapshot_path), "File rewritten with the latest cycle result")

        // Ingestion
        ("poll-interval", po::value<size_t>(&cfg.poll_interval_ms)->default_value(cfg.poll_interval_ms), "Sleep between processing cycles (ms)")
    ;

    if (!with_usrp_keys) {
        desc.add_options()
            ("replay", po::value<std::string>(&cfg.replay_path)->default_value(cfg.replay_path), "Scan log to replay (CSV 'ts,freq,db')")
            ("replay-batches", po::value<size_t>(&cfg.replay_batches_per_poll)->default_value(cfg.replay_batches_per_poll)->notifier(must_be_positive<size_t>("replay-batches")), "Scans replayed per processing cycle");
        return;
    }

    desc.add_options()
        // USRP Settings
        ("usrp-args", po::value<std::string>(&cfg.usrp_args)->default_value(cfg.usrp_args), "UHD device arguments (e.g., 'type=b210')")
        ("rx-gain", po::value<double>(&cfg.rx_gain)->default_value(cfg.rx_gain), "RX gain (dB)")
        ("rx-ant", po::value<std::string>(&cfg.rx_ant)->default_value(cfg.rx_ant), "RX Antenna")
        ("subdev", po::value<std::string>(&cfg.subdev)->default_value(cfg.subdev), "USRP Subdevice Spec")
        ("clock-rate", po::value<double>(&cfg.clock_rate)->default_value(cfg.clock_rate), "Optional Master clock rate (Hz, 0 for default)")

        // Sweep Parameters
        ("step-freq", po::value<double>(&cfg.step_freq)->default_value(cfg.step_freq)->notifier(must_not_be_negative<double>("step-freq")), "Sweep frequency step (Hz, 0 for sampling rate)")
        ("settling", po::value<double>(&cfg.settling_time)->default_value(cfg.settling_time)->notifier(must_not_be_negative<double>("settling")), "RX tune settling time (s)")
        ("avg", po::value<size_t>(&cfg.avg_num)->default_value(cfg.avg_num)->notifier(must_be_positive<size_t>("avg")), "Number of PSDs to average per step")
        ("window", po::value<std::string>(&cfg.fft_window_type)->default_value(cfg.fft_window_type), "FFT window ('none', 'hann', 'hamming', 'blackmanharris')")
        ("block-size", po::value<size_t>(&cfg.num_samples_block)->default_value(cfg.num_samples_block)->notifier(must_be_positive<size_t>("block-size")), "RX receive block size (samples)")
        ("wisdom-path", po::value<std::string>(&cfg.fft_wisdom_path)->default_value(cfg.fft_wisdom_path), "Path for FFTW wisdom file (load/save)")
        ("no-priority", po::bool_switch()->notifier([&cfg](bool v){ if (v) cfg.set_thread_priority = false; }), "Disable setting real-time thread priority")
    ;
}

int parse_command_line(int argc, char* argv[], Config& cfg, const std::string& caption,
                       const po::options_description& extra, po::variables_map& vm,
                       bool with_usrp_keys) {
    // The YAML file has to be applied before the option defaults are bound, otherwise
    // notify() would write the built-in defaults back over it.
    po::options_description file_opts;
    file_opts.add_options()
        ("config,c", po::value<std::string>(), "Load configuration from YAML file");

    po::options_description desc(caption);
    try {
        po::variables_map file_vm;
        po::store(po::command_line_parser(argc, argv).options(file_opts).allow_unregistered().run(), file_vm);
        if (file_vm.count("config")) {
            std::string config_path = file_vm["config"].as<std::string>();
            std::cout << "Loading configuration from: " << config_path << std::endl;
            cfg.load_from_yaml(config_path);
        }

        desc.add_options()
            ("help,h", "Show help message")
            ("save-config", po::value<std::string>(), "Save current configuration to YAML file and exit");
        desc.add(file_opts);
        add_config_options(desc, cfg, with_usrp_keys);
        desc.add(extra);

        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        po::notify(vm);

        if (vm.count("save-config")) {
            std::string save_path = vm["save-config"].as<std::string>();
            std::cout << "Saving current configuration to: " << save_path << std::endl;
            cfg.save_to_yaml(save_path);
            return EXIT_SUCCESS;
        }
        cfg.validate();

    } catch (const po::error& e) {
        std::cerr << "Command Line Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Configuration Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return CLI_CONTINUE;
}

void print_config_summary(const Config& cfg, bool with_usrp_keys) {
    std::cout << "\n--- Configuration Summary ---" << std::endl;
    std::cout << boost::format("Freq Range:       %.3f - %.3f MHz (Resolution: %.4f MHz)\n")
                 % cfg.min_freq % cfg.max_freq % cfg.freq_resolution();
    std::cout << boost::format("Waterfall:        %u rows | PSD levels: %u | Display: %s\n")
                 % cfg.waterfall_height % cfg.psd_db_resolution % (cfg.plot_snr ? "SNR" : "power");
    std::cout << boost::format("Detection:        %s | Top-N: %u\n")
                 % (cfg.detection_type.empty() ? "disabled" : cfg.detection_type) % cfg.top_n;
    if (cfg.persistence_enabled()) {
        std::cout << boost::format("Save Path:        %s (rotate every %d s, archive every %.1f min)\n")
                     % cfg.save_path % cfg.rotate_secs % cfg.save_interval_minutes;
    } else {
        std::cout << "Save Path:        disabled" << std::endl;
    }
    if (!cfg.snapshot_path.empty()) {
        std::cout << boost::format("Snapshot:         %s\n") % cfg.snapshot_path;
    }
    if (with_usrp_keys) {
        std::cout << boost::format("USRP Args:        '%s'\n") % cfg.usrp_args;
        std::cout << boost::format("Sample Rate:      %.2f Msps | Step: %.2f MHz\n")
                     % (cfg.sampling_rate / 1e6) % (cfg.sweep_step_hz() / 1e6);
        std::cout << boost::format("RX Gain:          %.1f dB | RX Antenna: %s\n") % cfg.rx_gain % cfg.rx_ant;
        std::cout << boost::format("  FFT Size: %u | Avg: %u | Window: %s | Block Size: %u\n")
                     % cfg.fft_len % cfg.avg_num % cfg.fft_window_type % cfg.num_samples_block;
        std::cout << "Thread Priority:  " << (cfg.set_thread_priority ? "Real-time" : "Normal") << std::endl;
        if (!cfg.fft_wisdom_path.empty()) {
            std::cout << boost::format("FFTW Wisdom:      %s\n") % cfg.fft_wisdom_path;
        }
    } else {
        std::cout << boost::format("Replay:           %s (%u scan(s) per cycle)\n")
                     % cfg.replay_path % cfg.replay_batches_per_poll;
    }
    std::cout << "Verbose:          " << (cfg.verbose ? "Enabled" : "Disabled") << std::endl;
    std::cout << "---------------------------\n" << std::endl;
}
