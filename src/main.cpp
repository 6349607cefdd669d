#include "config.hpp"
#include "cli_options.hpp"
#include "orchestrator.hpp"
#include "peak_detectors.hpp"
#include "replay_source.hpp"

#include <boost/format.hpp>

#include <csignal>
#include <iostream>
#include <memory>

namespace {
RunControl run_control;

void handle_stop_signal(int) {
    run_control.request_stop();
}
} // namespace

int main(int argc, char* argv[]) {
    Config cfg;
    po::options_description no_extra;
    po::variables_map vm;
    int exit_code = parse_command_line(argc, argv, cfg, "RF Waterfall Options", no_extra, vm, false);
    if (exit_code != CLI_CONTINUE) return exit_code;

    if (cfg.replay_path.empty()) {
        std::cerr << "Error: no scan source given. Use --replay <file> (or run rf_waterfall_usrp for live scans)." << std::endl;
        return EXIT_FAILURE;
    }
    print_config_summary(cfg, false);

    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    try {
        ReplaySource source(cfg.replay_path, cfg.verbose, cfg.replay_batches_per_poll);
        std::unique_ptr<PeakDetector> detector;
        if (!cfg.detection_type.empty()) detector = make_peak_detector(cfg.detection_type);

        Orchestrator orchestrator(cfg, source, run_control, std::move(detector));
        orchestrator.run();

        if (source.rows_skipped() > 0) {
            std::cerr << boost::format("Warning: %u malformed row(s) skipped in %s.\n")
                         % source.rows_skipped() % cfg.replay_path;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "Exiting gracefully." << std::endl;
    return EXIT_SUCCESS;
}
