#pragma once

#include "config.hpp"
#include "ingestion_source.hpp"

#include <uhd/usrp/multi_usrp.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

/**
 * Live scans from a USRP.
 *
 * A receive thread steps the tuner across [min_freq, max_freq], estimates an averaged PSD at
 * every step and queues one ScanBatch per completed sweep. The processing thread drains the
 * queue through poll_batch(); neither side ever waits on the other beyond the queue lock.
 */
class UsrpSweepSource : public IngestionSource {
public:
    UsrpSweepSource(uhd::usrp::multi_usrp::sptr usrp, const Config& config);
    ~UsrpSweepSource() override;

    void start();

    std::optional<ScanBatch> poll_batch() override;
    bool is_healthy() const override;
    void shutdown() override;

    size_t sweeps_completed() const { return sweeps.load(); }

private:
    void rx_thread();
    ScanConfig sweep_config(double actual_rate) const;

    uhd::usrp::multi_usrp::sptr usrp;
    const Config& cfg;

    std::thread worker;
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> failed{false};
    std::atomic<size_t> sweeps{0};

    std::mutex mtx;
    std::deque<ScanBatch> pending;
};
