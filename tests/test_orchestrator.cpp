#include "orchestrator.hpp"
#include "atomic_file.hpp"
#include "peak_detectors.hpp"
#include "replay_source.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace fs = boost::filesystem;

namespace {

// 100 - 110 MHz at 0.1 MHz per bin.
Config small_config() {
    Config cfg;
    cfg.min_freq = 100.0;
    cfg.max_freq = 110.0;
    cfg.sampling_rate = 25.6e6;
    cfg.fft_len = 256;
    cfg.waterfall_height = 4;
    cfg.psd_db_resolution = 21;
    cfg.poll_interval_ms = 0;
    return cfg;
}

// Full sweep at a -100 dB floor with a carrier centred on 105.0 MHz.
ScanBatch carrier_batch(double timestamp, const ScanConfig& scan_config = {{"gain", "40"}}) {
    ScanBatch batch;
    batch.timestamp = timestamp;
    batch.scan_config = scan_config;
    for (int j = 0; j <= 100; ++j) {
        double power = -100.0;
        if (j == 49 || j == 51) power = -80.0;
        if (j == 50) power = -60.0;
        batch.samples.push_back({100.0 + 0.1 * j, power});
    }
    return batch;
}

// Replay log of `scans` one-sample scans, one second apart from t=1.
fs::path write_scan_log(const fs::path& dir, int scans) {
    std::ostringstream log;
    log << "ts,freq,db\n";
    for (int i = 1; i <= scans; ++i) log << i << ",105.0," << (-90 - i % 7) << "\n";
    const fs::path path = dir / "scan.csv";
    write_file_atomically(path, log.str());
    return path;
}

size_t count_files_with_prefix(const fs::path& dir, const std::string& prefix) {
    size_t n = 0;
    for (fs::directory_iterator it(dir), end; it != end; ++it) {
        if (it->path().filename().string().rfind(prefix, 0) == 0) ++n;
    }
    return n;
}

}

class OrchestratorTest : public ::testing::Test {
protected:
    TempDir tmp;
    Config cfg = small_config();
    QueueSource source;
    RunControl control;
};

TEST_F(OrchestratorTest, SamplesLandInNewestRow) {
    Orchestrator orchestrator(cfg, source, control);
    source.push(make_batch(1.0, {{105.0, -90.0}, {105.1, -95.0}}));
    EXPECT_EQ(orchestrator.run_once(0.0), 1u);

    std::vector<double> row = orchestrator.buffer().current_row();
    ASSERT_EQ(row.size(), 101u);
    for (size_t c = 0; c < row.size(); ++c) {
        if (c == 50) EXPECT_DOUBLE_EQ(row[c], -90.0);
        else if (c == 51) EXPECT_DOUBLE_EQ(row[c], -95.0);
        else EXPECT_TRUE(std::isnan(row[c])) << "column " << c;
    }

    const CycleResult& result = orchestrator.last_cycle();
    EXPECT_DOUBLE_EQ(result.scan_time, 1.0);
    EXPECT_DOUBLE_EQ(result.db_min, -95.0);
    EXPECT_DOUBLE_EQ(result.db_max, -90.0);
    EXPECT_EQ(result.psd.freq_cells(), 101u);
    EXPECT_EQ(result.psd.power_cells(), 20u);
    EXPECT_EQ(result.display.size(), 4u * 101u);
    EXPECT_TRUE(result.detections.empty());
    EXPECT_EQ(orchestrator.frequency_edges().size(), 102u);
}

TEST_F(OrchestratorTest, OutOfRangeBatchIsSkipped) {
    Orchestrator orchestrator(cfg, source, control);
    source.push(make_batch(1.0, {{99.9, -80.0}}));
    EXPECT_EQ(orchestrator.run_once(0.0), 0u);
    EXPECT_EQ(orchestrator.skipped_batches(), 1u);
    EXPECT_EQ(orchestrator.cycles(), 0u);
    EXPECT_EQ(orchestrator.buffer().retained_scans(), 0u);
    EXPECT_TRUE(orchestrator.history().empty());
}

TEST_F(OrchestratorTest, DroppedSamplesAreReported) {
    Orchestrator orchestrator(cfg, source, control);
    source.push(make_batch(1.0, {{99.9, -80.0}, {105.0, -90.0}, {120.0, -70.0}}));
    testing::internal::CaptureStderr();
    EXPECT_EQ(orchestrator.run_once(0.0), 1u);
    std::string log = testing::internal::GetCapturedStderr();
    EXPECT_NE(log.find("dropped 2 of 3 sample(s) outside 100.000 to 110.000 MHz"), std::string::npos) << log;
    EXPECT_EQ(orchestrator.buffer().dropped_samples(), 2u);

    // A scan with nothing in range is skipped but its samples still count.
    source.push(make_batch(2.0, {{120.0, -70.0}}));
    testing::internal::CaptureStderr();
    EXPECT_EQ(orchestrator.run_once(1.0), 0u);
    log = testing::internal::GetCapturedStderr();
    EXPECT_NE(log.find("dropped 1 of 1 sample(s)"), std::string::npos) << log;
    EXPECT_EQ(orchestrator.buffer().dropped_samples(), 3u);
    EXPECT_EQ(orchestrator.skipped_batches(), 1u);
}

TEST_F(OrchestratorTest, InRangeScanLogsNoDrops) {
    Orchestrator orchestrator(cfg, source, control);
    source.push(make_batch(1.0, {{105.0, -90.0}}));
    testing::internal::CaptureStderr();
    orchestrator.run_once(0.0);
    EXPECT_EQ(testing::internal::GetCapturedStderr().find("dropped"), std::string::npos);
}

TEST_F(OrchestratorTest, SingleValueWaterfallStillAggregates) {
    Orchestrator orchestrator(cfg, source, control);
    source.push(make_batch(1.0, {{105.0, -90.0}}));
    orchestrator.run_once(0.0);
    const CycleResult& result = orchestrator.last_cycle();
    EXPECT_DOUBLE_EQ(result.db_min, -90.0);
    EXPECT_DOUBLE_EQ(result.db_max, -90.0);
    EXPECT_DOUBLE_EQ(result.psd.power_edges.front(), -90.5);
    EXPECT_DOUBLE_EQ(result.psd.power_edges.back(), -89.5);
}

TEST_F(OrchestratorTest, HistoryFollowsWaterfallWithPersistence) {
    cfg.save_path = (tmp.path() / "out").string();
    Orchestrator orchestrator(cfg, source, control);
    for (int i = 0; i < 6; ++i) {
        source.push(make_batch(i, {{101.0 + i, -90.0}}, {{"scan", std::to_string(i)}}));
        orchestrator.run_once(1000.0 + i);
        EXPECT_EQ(orchestrator.history().size(), orchestrator.buffer().retained_scans());
    }
    EXPECT_EQ(orchestrator.history().size(), 4u);
    EXPECT_EQ(orchestrator.history().oldest_config().at("scan"), "2");
}

TEST_F(OrchestratorTest, DetectionsPersistedInRotationBucket) {
    cfg.save_path = (tmp.path() / "out").string();
    cfg.detection_type = "narrowband";
    Orchestrator orchestrator(cfg, source, control, make_peak_detector(cfg.detection_type));
    source.push(carrier_batch(950.0));
    EXPECT_EQ(orchestrator.run_once(950.0), 1u);

    EXPECT_EQ(orchestrator.output_dir(), tmp.path() / "out" / "900");
    const std::vector<MergedPeak>& detections = orchestrator.last_cycle().detections;
    ASSERT_EQ(detections.size(), 1u);
    EXPECT_LT(detections[0].start_freq, 105.0);
    EXPECT_GT(detections[0].end_freq, 105.0);
    EXPECT_DOUBLE_EQ(detections[0].power_db, -60.0);

    const fs::path detections_dir = tmp.path() / "out" / "900" / "detections";
    std::string csv = read_file(detections_dir / DetectionLedger::CSV_NAME);
    EXPECT_EQ(count_lines(csv), 2u);
    EXPECT_NE(csv.find(",narrowband\n"), std::string::npos);
    EXPECT_TRUE(fs::exists(detections_dir / "detections_scan_config_950.000.yaml"));
    ASSERT_NE(orchestrator.ledger(), nullptr);
    EXPECT_EQ(orchestrator.ledger()->committed_records(), 1u);

    // Next bucket.
    source.push(carrier_batch(1800.0));
    orchestrator.run_once(1800.0);
    EXPECT_TRUE(fs::exists(tmp.path() / "out" / "1800" / "detections" / DetectionLedger::CSV_NAME));
}

TEST_F(OrchestratorTest, WaterfallArchivedAfterInterval) {
    cfg.save_path = (tmp.path() / "out").string();
    Orchestrator orchestrator(cfg, source, control);
    EXPECT_EQ(orchestrator.ledger(), nullptr);
    double now = 1000.0;
    orchestrator.set_clock([&now] { return now; });

    source.push(make_batch(1000.0, {{105.0, -90.0}}));
    orchestrator.run_once(now);
    now = 1100.0;
    source.push(make_batch(1100.0, {{105.0, -91.0}}));
    orchestrator.run_once(now);

    ASSERT_NE(orchestrator.archiver(), nullptr);
    EXPECT_EQ(orchestrator.archiver()->saves(), 1u);
    EXPECT_TRUE(fs::exists(tmp.path() / "out" / "900" / "waterfall" / "waterfall_1100.000.csv"));
    EXPECT_TRUE(fs::exists(tmp.path() / "out" / "900" / "waterfall" / "config_1100.000.yaml"));
}

TEST_F(OrchestratorTest, ArchiveIntervalUsesClockPerScan) {
    cfg.save_path = (tmp.path() / "out").string();
    cfg.save_interval_minutes = 1.0;
    Orchestrator orchestrator(cfg, source, control);
    double now = 1000.0;
    orchestrator.set_clock([&now] { now += 40.0; return now; });

    // Three scans drained in one cycle still see the clock move between them.
    for (int i = 0; i < 3; ++i) source.push(make_batch(i, {{105.0, -90.0}}));
    EXPECT_EQ(orchestrator.run_once(1000.0), 3u);
    EXPECT_EQ(orchestrator.archiver()->saves(), 1u);
}

TEST_F(OrchestratorTest, ReplayRunWritesWaterfallArchives) {
    cfg.save_path = (tmp.path() / "out").string();
    cfg.save_interval_minutes = 0.05;
    ReplaySource replay(write_scan_log(tmp.path(), 20).string());
    Orchestrator orchestrator(cfg, replay, control);
    double now = 1000.0;
    orchestrator.set_clock([&now] { return now += 1.0; });
    orchestrator.run();

    EXPECT_EQ(orchestrator.cycles(), 20u);
    ASSERT_NE(orchestrator.archiver(), nullptr);
    EXPECT_GT(orchestrator.archiver()->saves(), 0u);
    const fs::path waterfall_dir = tmp.path() / "out" / "900" / "waterfall";
    ASSERT_TRUE(fs::is_directory(waterfall_dir));
    EXPECT_EQ(count_files_with_prefix(waterfall_dir, "waterfall_"), orchestrator.archiver()->saves());
    EXPECT_EQ(count_files_with_prefix(waterfall_dir, "config_"), orchestrator.archiver()->saves());
}

TEST_F(OrchestratorTest, ReplayFeedsOneScanPerCycle) {
    ReplaySource replay(write_scan_log(tmp.path(), 50).string());
    Orchestrator orchestrator(cfg, replay, control);
    EXPECT_EQ(orchestrator.run_once(1000.0), 1u);
    EXPECT_EQ(orchestrator.cycles(), 1u);
    EXPECT_DOUBLE_EQ(orchestrator.last_cycle().scan_time, 1.0);
    EXPECT_EQ(orchestrator.run_once(1001.0), 1u);
    EXPECT_DOUBLE_EQ(orchestrator.last_cycle().scan_time, 2.0);
    EXPECT_EQ(replay.batches_read(), 2u);
}

TEST_F(OrchestratorTest, SnapshotPublishedEveryCycle) {
    cfg.snapshot_path = (tmp.path() / "latest.yaml").string();
    cfg.top_n = 2;
    Orchestrator orchestrator(cfg, source, control, make_peak_detector("narrowband"));
    source.push(carrier_batch(5.0));
    orchestrator.run_once(5.0);

    YAML::Node snapshot = YAML::LoadFile(cfg.snapshot_path);
    EXPECT_DOUBLE_EQ(snapshot["scan_time"].as<double>(), 5.0);
    EXPECT_DOUBLE_EQ(snapshot["db_max"].as<double>(), -60.0);
    EXPECT_EQ(snapshot["top_n"].size(), 2u);
    EXPECT_EQ(snapshot["current"].size(), 101u);
    EXPECT_EQ(snapshot["detections"].size(), 1u);
}

TEST_F(OrchestratorTest, RunStopsWhenSourceIsExhausted) {
    QueueSource finite(true);
    Orchestrator orchestrator(cfg, finite, control);
    for (int i = 0; i < 3; ++i) finite.push(make_batch(i, {{105.0, -90.0 - i}}));
    orchestrator.run();

    EXPECT_EQ(orchestrator.cycles(), 3u);
    EXPECT_EQ(orchestrator.state(), RunState::STOPPED);
    EXPECT_EQ(finite.shutdowns(), 1u);

    orchestrator.stop("again");
    EXPECT_EQ(finite.shutdowns(), 1u);
    EXPECT_EQ(orchestrator.run_once(0.0), 0u);
}

TEST_F(OrchestratorTest, StopRequestEndsRun) {
    source.push(make_batch(1.0, {{105.0, -90.0}}));
    Orchestrator orchestrator(cfg, source, control);
    control.request_stop();
    orchestrator.run();
    EXPECT_EQ(orchestrator.cycles(), 0u);
    EXPECT_EQ(source.shutdowns(), 1u);
    EXPECT_STREQ(to_string(orchestrator.state()), "STOPPED");
}

TEST_F(OrchestratorTest, ResetKeepsWaterfall) {
    Orchestrator orchestrator(cfg, source, control);
    source.push(make_batch(1.0, {{105.0, -90.0}}));
    orchestrator.run_once(0.0);
    ASSERT_DOUBLE_EQ(orchestrator.last_cycle().scan_time, 1.0);

    control.request_reset();
    EXPECT_EQ(orchestrator.run_once(1.0), 0u);
    EXPECT_DOUBLE_EQ(orchestrator.last_cycle().scan_time, 0.0);
    EXPECT_EQ(orchestrator.buffer().retained_scans(), 1u);
    EXPECT_EQ(orchestrator.state(), RunState::RUNNING);
    EXPECT_FALSE(control.take_reset());
}
