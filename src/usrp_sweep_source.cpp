#include "usrp_sweep_source.hpp"
#include "psd_estimator.hpp"
#include "time_utils.hpp"

#include <uhd/types/tune_request.hpp>
#include <uhd/stream.hpp>
#include <uhd/utils/thread.hpp>     // For uhd::set_thread_priority_safe

#include <iostream>
#include <vector>
#include <complex>
#include <chrono>
#include <algorithm>
#include <boost/format.hpp>

namespace {
// Batches beyond this are dropped oldest-first if the processing side stalls.
constexpr size_t MAX_QUEUED_SWEEPS = 64;
}

UsrpSweepSource::UsrpSweepSource(uhd::usrp::multi_usrp::sptr usrp, const Config& config)
    : usrp(usrp), cfg(config) {}

UsrpSweepSource::~UsrpSweepSource() {
    shutdown();
}

void UsrpSweepSource::start() {
    if (worker.joinable()) return;
    std::cout << "Launching RX sweep thread..." << std::endl;
    worker = std::thread(&UsrpSweepSource::rx_thread, this);
}

std::optional<ScanBatch> UsrpSweepSource::poll_batch() {
    std::lock_guard<std::mutex> lock(mtx);
    if (pending.empty()) return std::nullopt;
    ScanBatch batch = std::move(pending.front());
    pending.pop_front();
    return batch;
}

bool UsrpSweepSource::is_healthy() const {
    return !failed.load() && !stop_requested.load();
}

void UsrpSweepSource::shutdown() {
    stop_requested = true;
    if (worker.joinable()) {
        std::cout << "Waiting for RX thread to join..." << std::endl;
        worker.join();
        std::cout << "RX thread joined." << std::endl;
    }
}

ScanConfig UsrpSweepSource::sweep_config(double actual_rate) const {
    return {
        {"usrp_args", cfg.usrp_args},
        {"sample_rate", (boost::format("%.0f") % actual_rate).str()},
        {"rx_gain", (boost::format("%.1f") % cfg.rx_gain).str()},
        {"rx_ant", cfg.rx_ant},
        {"fft_len", std::to_string(cfg.fft_len)},
        {"avg_num", std::to_string(cfg.avg_num)},
        {"window", cfg.fft_window_type},
        {"step_freq", (boost::format("%.0f") % cfg.sweep_step_hz()).str()},
    };
}

void UsrpSweepSource::rx_thread() {
    if (cfg.set_thread_priority) {
        uhd::set_thread_priority_safe();
    }
    std::cout << "RX Thread: Starting." << std::endl;

    try {
        PsdEstimator estimator(cfg);

        uhd::stream_args_t stream_args("fc32", "sc16");
        stream_args.channels = {0};
        uhd::rx_streamer::sptr rx_stream = usrp->get_rx_stream(stream_args);

        uhd::stream_cmd_t stream_cmd(uhd::stream_cmd_t::STREAM_MODE_START_CONTINUOUS);
        stream_cmd.stream_now = true;
        rx_stream->issue_stream_cmd(stream_cmd);

        std::vector<std::complex<float>> rx_buffer(cfg.num_samples_block);
        std::vector<std::complex<float>> fft_input_buffer(cfg.fft_len);
        std::vector<double> psd_db;
        uhd::rx_metadata_t md;

        const double start_hz = cfg.min_freq * 1e6;
        const double end_hz = cfg.max_freq * 1e6;
        const double step_hz = cfg.sweep_step_hz();

        while (!stop_requested) {
            const double actual_rate = usrp->get_rx_rate(0);
            ScanBatch batch;
            batch.scan_config = sweep_config(actual_rate);

            for (double center = start_hz; center <= end_hz + step_hz / 2 && !stop_requested; center += step_hz) {
                if (cfg.verbose) std::cout << "RX Tuning to: " << center / 1e6 << " MHz" << std::endl;
                usrp->set_rx_freq(uhd::tune_request_t(center), 0);
                std::this_thread::sleep_for(std::chrono::duration<double>(cfg.settling_time));

                try {
                    if (!usrp->get_rx_sensor("lo_locked", 0).to_bool()) {
                        std::cerr << "Warning: RX LO failed to lock at " << center / 1e6 << " MHz after settling time." << std::endl;
                    }
                } catch (const uhd::key_error&) {
                    if (cfg.verbose) std::cout << "  (LO lock sensor not found, proceeding after wait)." << std::endl;
                }

                estimator.reset();
                size_t collected = 0;
                bool have_psd = false;
                // Samples received before the retune settled are stale; drop one block.
                rx_stream->recv(rx_buffer.data(), rx_buffer.size(), md, 0.1);

                while (!have_psd && !stop_requested) {
                    size_t num_rx_samps = rx_stream->recv(rx_buffer.data(), rx_buffer.size(), md, 0.1);
                    if (md.error_code == uhd::rx_metadata_t::ERROR_CODE_OVERFLOW) {
                        if (cfg.verbose) std::cerr << "RX overflow at " << center / 1e6 << " MHz." << std::endl;
                        continue;
                    }
                    if (md.error_code != uhd::rx_metadata_t::ERROR_CODE_NONE &&
                        md.error_code != uhd::rx_metadata_t::ERROR_CODE_TIMEOUT) {
                        throw std::runtime_error("RX Error at " + std::to_string(center / 1e6) + " MHz: " + md.strerror());
                    }
                    if (num_rx_samps == 0) {
                        std::cerr << "Warning: RX receive timeout at " << center / 1e6 << " MHz." << std::endl;
                        continue;
                    }

                    size_t pos = 0;
                    while (pos < num_rx_samps && !have_psd) {
                        size_t to_copy = std::min(num_rx_samps - pos, cfg.fft_len - collected);
                        std::copy(rx_buffer.begin() + pos, rx_buffer.begin() + pos + to_copy,
                                  fft_input_buffer.begin() + collected);
                        collected += to_copy;
                        pos += to_copy;
                        if (collected == cfg.fft_len) {
                            collected = 0;
                            have_psd = estimator.process_block(fft_input_buffer, psd_db);
                        }
                    }
                }
                if (!have_psd) break;

                const double bin_hz = actual_rate / static_cast<double>(cfg.fft_len);
                for (size_t i = 0; i < psd_db.size(); ++i) {
                    double freq_hz = center + (static_cast<double>(i) - static_cast<double>(cfg.fft_len) / 2.0) * bin_hz;
                    batch.samples.push_back({freq_hz / 1e6, psd_db[i]});
                }
            }

            if (stop_requested) break;
            batch.timestamp = wall_clock_seconds();
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (pending.size() >= MAX_QUEUED_SWEEPS) {
                    std::cerr << "Warning: processing is behind, dropping oldest queued sweep." << std::endl;
                    pending.pop_front();
                }
                pending.push_back(std::move(batch));
            }
            ++sweeps;
            if (cfg.verbose) std::cout << "RX Thread: sweep " << sweeps.load() << " complete." << std::endl;
        }

        stream_cmd.stream_mode = uhd::stream_cmd_t::STREAM_MODE_STOP_CONTINUOUS;
        rx_stream->issue_stream_cmd(stream_cmd);
    } catch (const uhd::exception& e) {
        std::cerr << "RX Thread: UHD error: " << e.what() << std::endl;
        failed = true;
    } catch (const std::exception& e) {
        std::cerr << "RX Thread: " << e.what() << std::endl;
        failed = true;
    }

    std::cout << "RX Thread: Stopped after " << sweeps.load() << " sweeps." << std::endl;
}
