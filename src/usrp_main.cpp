#include "config.hpp"
#include "cli_options.hpp"
#include "orchestrator.hpp"
#include "peak_detectors.hpp"
#include "psd_estimator.hpp" // For PsdEstimator::save_wisdom
#include "usrp_sweep_source.hpp"
#include "usrp_utils.hpp"

#include <uhd/usrp/multi_usrp.hpp>
#include <uhd/utils/safe_main.hpp> // For UHD_SAFE_MAIN
#include <uhd/utils/log.hpp>       // For uhd::log::set_log_level

#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept> // For std::invalid_argument from string_to_severity
#include <system_error>

namespace {
RunControl run_control;

void handle_stop_signal(int) {
    run_control.request_stop();
}
} // namespace

int UHD_SAFE_MAIN(int argc, char* argv[]) {
    Config cfg;

    po::options_description uhd_opts;
    uhd_opts.add_options()
        ("log-level", po::value<std::string>()->default_value("info")->notifier([](const std::string& level_str) {
             try {
                uhd::log::set_log_level(string_to_severity(level_str));
             } catch (const std::invalid_argument&) {
                 throw po::validation_error(po::validation_error::invalid_option_value, "log-level", level_str);
             }
        }), "Set UHD log level ('trace', 'debug', 'info', 'warning', 'error', 'fatal')")
    ;

    po::variables_map vm;
    int exit_code = parse_command_line(argc, argv, cfg, "RF Waterfall USRP Sweep Options", uhd_opts, vm, true);
    if (exit_code != CLI_CONTINUE) return exit_code;
    print_config_summary(cfg, true);

    uhd::usrp::multi_usrp::sptr usrp;
    try {
        usrp = make_configured_usrp(cfg);
        perform_calibration(cfg, usrp);
        std::cout << "USRP Initialization Complete." << std::endl;
    } catch (const uhd::exception& e) {
        std::cerr << "UHD Error during initialization: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Initialization Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    try {
        std::unique_ptr<PeakDetector> detector;
        if (!cfg.detection_type.empty()) detector = make_peak_detector(cfg.detection_type);

        UsrpSweepSource source(usrp, cfg);
        Orchestrator orchestrator(cfg, source, run_control, std::move(detector));
        source.start();
        orchestrator.run();
    } catch (const std::system_error& e) {
        std::cerr << "Error launching threads: " << e.what() << " (code: " << e.code() << ")" << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (!cfg.fft_wisdom_path.empty()) {
        PsdEstimator::save_wisdom(cfg.fft_wisdom_path);
    }

    std::cout << "Exiting gracefully." << std::endl;
    return EXIT_SUCCESS;
}
