#include "usrp_utils.hpp"
#include <iostream> // For std::cout, std::cerr
#include <thread>   // For std::this_thread::sleep_for
#include <chrono>   // For 1s literal, std::chrono::duration
#include <cmath>
#include <boost/algorithm/string.hpp> // For boost::iequals
#include <uhd/types/tune_request.hpp>
#include <stdexcept> // For std::invalid_argument in string_to_severity

using namespace std::chrono_literals;

uhd::usrp::multi_usrp::sptr make_configured_usrp(const Config& cfg) {
    std::cout << "Creating USRP device with args: " << cfg.usrp_args << "..." << std::endl;
    uhd::usrp::multi_usrp::sptr usrp = uhd::usrp::multi_usrp::make(cfg.usrp_args);

    if (cfg.clock_rate > 0.0) {
        std::cout << "Setting master clock rate: " << cfg.clock_rate / 1e6 << " MHz..." << std::endl;
        usrp->set_master_clock_rate(cfg.clock_rate);
    }
    usrp->set_clock_source("internal");

    std::cout << "Setting subdevice spec: " << cfg.subdev << "..." << std::endl;
    usrp->set_rx_subdev_spec(uhd::usrp::subdev_spec_t(cfg.subdev), 0);

    std::cout << "Setting sample rate: " << cfg.sampling_rate / 1e6 << " Msps..." << std::endl;
    usrp->set_rx_rate(cfg.sampling_rate, 0);
    double actual_rx_rate = usrp->get_rx_rate(0);
    std::cout << "Actual RX Rate: " << actual_rx_rate / 1e6 << " Msps" << std::endl;
    if (std::abs(actual_rx_rate - cfg.sampling_rate) > 1.0) {
        // Bin frequencies are derived from the actual rate, but the waterfall grid is not.
        std::cerr << "Warning: Actual RX sample rate (" << actual_rx_rate
                  << ") deviates significantly from requested rate (" << cfg.sampling_rate << ")!" << std::endl;
    }

    std::cout << "Setting RX Gain: " << cfg.rx_gain << " dB..." << std::endl;
    usrp->set_rx_gain(cfg.rx_gain, 0);
    std::cout << "Actual RX Gain: " << usrp->get_rx_gain(0) << " dB" << std::endl;

    std::cout << "Setting RX Antenna: " << cfg.rx_ant << "..." << std::endl;
    usrp->set_rx_antenna(cfg.rx_ant, 0);

    std::cout << "Setting initial RX Freq: " << cfg.min_freq << " MHz..." << std::endl;
    usrp->set_rx_freq(uhd::tune_request_t(cfg.min_freq * 1e6), 0);
    std::this_thread::sleep_for(std::chrono::duration<double>(cfg.settling_time));

    return usrp;
}

void perform_calibration(const Config& cfg, uhd::usrp::multi_usrp::sptr usrp) {
    std::cout << "\nPerforming device calibrations..." << std::endl;

    size_t channel = 0;
    try {
        std::cout << "  Calibrating RX channel " << channel << "..." << std::endl;
        usrp->set_rx_agc(false, channel); // Fixed gain, so sweeps are comparable

        std::cout << "    Performing RX DC offset calibration..." << std::endl;
        usrp->set_rx_dc_offset(true, channel);
        std::this_thread::sleep_for(1s);

        std::cout << "    Performing RX IQ imbalance calibration..." << std::endl;
        usrp->set_rx_iq_balance(true, channel);
        std::this_thread::sleep_for(1s);

        std::cout << "  RX Calibration for channel " << channel << " complete." << std::endl;
    } catch (const uhd::exception& e) {
        std::cerr << "Warning: RX calibration failed for channel " << channel << ": " << e.what() << std::endl;
    }
    if (cfg.verbose) {
        std::cout << "  RX gain after calibration: " << usrp->get_rx_gain(channel) << " dB" << std::endl;
    }
    std::cout << "Device calibrations finished.\n" << std::endl;
}

uhd::log::severity_level string_to_severity(const std::string& level) {
    if (boost::iequals(level, "trace"))
        return uhd::log::severity_level::trace;
    else if (boost::iequals(level, "debug"))
        return uhd::log::severity_level::debug;
    else if (boost::iequals(level, "info"))
        return uhd::log::severity_level::info;
    else if (boost::iequals(level, "warning"))
        return uhd::log::severity_level::warning;
    else if (boost::iequals(level, "error"))
        return uhd::log::severity_level::error;
    else if (boost::iequals(level, "fatal"))
        return uhd::log::severity_level::fatal;
    else
        throw std::invalid_argument("Invalid log level: " + level);
}
