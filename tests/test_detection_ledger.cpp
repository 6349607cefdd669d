#include "atomic_file.hpp"
#include "detection_ledger.hpp"
#include "test_util.hpp"
#include "time_utils.hpp"

#include <gtest/gtest.h>
#include <boost/filesystem/fstream.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = boost::filesystem;

namespace {
MergedPeak peak(double start, double end, double power) {
    return {0, start, end, power, 20.0, power - 14.0};
}

size_t count_files_with_prefix(const fs::path& dir, const std::string& prefix) {
    size_t n = 0;
    for (fs::directory_iterator it(dir), end; it != end; ++it) {
        if (it->path().filename().string().rfind(prefix, 0) == 0) ++n;
    }
    return n;
}
}

TEST(DetectionLedgerTest, TimestampLabel) {
    EXPECT_EQ(timestamp_label(1700000000.5), "1700000000.500");
}

TEST(DetectionLedgerTest, HeaderWrittenOnce) {
    TempDir tmp;
    DetectionLedger ledger(100.0, 110.0);
    ledger.record_cycle(tmp.path(), 1.0, {{"gain", "40"}}, {peak(104.8, 105.2, -60.0)}, "narrowband");
    ledger.record_cycle(tmp.path(), 2.0, {{"gain", "40"}},
                        {peak(101.0, 101.5, -70.0), peak(108.0, 108.25, -65.5)}, "narrowband");

    const fs::path csv = tmp.path() / "detections" / DetectionLedger::CSV_NAME;
    std::string contents = read_file(csv);
    EXPECT_EQ(contents.find(DetectionLedger::CSV_HEADER), 0u);
    EXPECT_EQ(count_lines(contents), 4u);
    EXPECT_NE(contents.find("1.000,104.800000,105.200000,-60.00,narrowband\n"), std::string::npos);
    EXPECT_NE(contents.find("2.000,108.000000,108.250000,-65.50,narrowband\n"), std::string::npos);
    EXPECT_EQ(ledger.committed_records(), 3u);

    // A new process appending to an existing file keeps the single header.
    DetectionLedger restarted(100.0, 110.0);
    restarted.record_cycle(tmp.path(), 3.0, {{"gain", "40"}}, {peak(102.0, 103.0, -75.0)}, "wideband");
    contents = read_file(csv);
    EXPECT_EQ(count_lines(contents), 5u);
    EXPECT_EQ(contents.find("timestamp,", 1), std::string::npos);
}

TEST(DetectionLedgerTest, NoPeaksNoCsv) {
    TempDir tmp;
    DetectionLedger ledger(100.0, 110.0);
    ledger.record_cycle(tmp.path(), 1.0, {{"gain", "40"}}, {}, "wideband");
    EXPECT_FALSE(fs::exists(tmp.path() / "detections" / DetectionLedger::CSV_NAME));
    EXPECT_EQ(ledger.scan_config_writes(), 1u);
}

TEST(DetectionLedgerTest, ScanConfigSnapshotOnlyOnChange) {
    TempDir tmp;
    DetectionLedger ledger(100.0, 110.0);
    const ScanConfig a = {{"gain", "40"}};
    const ScanConfig b = {{"gain", "30"}};
    double t = 1.0;
    for (const ScanConfig& cfg : {a, a, b, b, a}) {
        ledger.record_cycle(tmp.path(), t, cfg, {}, "wideband");
        t += 1.0;
    }
    EXPECT_EQ(ledger.scan_config_writes(), 3u);
    const fs::path dir = tmp.path() / "detections";
    EXPECT_EQ(count_files_with_prefix(dir, "detections_scan_config_"), 3u);

    YAML::Node snapshot = YAML::LoadFile((dir / "detections_scan_config_3.000.yaml").string());
    EXPECT_DOUBLE_EQ(snapshot["timestamp"].as<double>(), 3.0);
    EXPECT_DOUBLE_EQ(snapshot["min_freq"].as<double>(), 100.0);
    EXPECT_DOUBLE_EQ(snapshot["max_freq"].as<double>(), 110.0);
    EXPECT_EQ(snapshot["scan_configs"]["gain"].as<std::string>(), "30");
}

TEST(DetectionLedgerTest, FailedWritesAreRetried) {
    TempDir tmp;
    // A plain file where the detections directory should go makes every write fail.
    const fs::path blocker = tmp.path() / "detections";
    {
        fs::ofstream out(blocker);
        out << "x";
    }

    DetectionLedger ledger(100.0, 110.0);
    ledger.record_cycle(tmp.path(), 1.0, {{"gain", "40"}}, {peak(104.0, 105.0, -60.0)}, "narrowband");
    EXPECT_EQ(ledger.pending_records(), 1u);
    EXPECT_EQ(ledger.committed_records(), 0u);
    EXPECT_EQ(ledger.scan_config_writes(), 0u);

    fs::remove(blocker);
    ledger.record_cycle(tmp.path(), 2.0, {{"gain", "40"}}, {peak(106.0, 107.0, -61.0)}, "narrowband");
    EXPECT_EQ(ledger.pending_records(), 0u);
    EXPECT_EQ(ledger.committed_records(), 2u);
    EXPECT_EQ(ledger.scan_config_writes(), 1u);

    std::string contents = read_file(blocker / DetectionLedger::CSV_NAME);
    EXPECT_EQ(count_lines(contents), 3u);
    // Queued rows keep their original order.
    EXPECT_LT(contents.find("1.000,"), contents.find("2.000,"));
}

TEST(DetectionLedgerTest, FailingBucketDoesNotBlockNewerOnes) {
    TempDir tmp;
    const fs::path old_bucket = tmp.path() / "900";
    const fs::path new_bucket = tmp.path() / "1800";
    fs::create_directories(old_bucket);
    const fs::path blocker = old_bucket / "detections";
    {
        fs::ofstream out(blocker);
        out << "x";
    }

    DetectionLedger ledger(100.0, 110.0);
    ledger.record_cycle(old_bucket, 1.0, {{"gain", "40"}}, {peak(104.0, 105.0, -60.0)}, "narrowband");
    ledger.record_cycle(new_bucket, 2.0, {{"gain", "40"}}, {peak(106.0, 107.0, -61.0)}, "narrowband");
    ledger.record_cycle(new_bucket, 3.0, {{"gain", "40"}}, {peak(108.0, 109.0, -62.0)}, "narrowband");

    EXPECT_EQ(ledger.pending_records(), 1u);
    EXPECT_EQ(ledger.committed_records(), 2u);
    std::string contents = read_file(new_bucket / "detections" / DetectionLedger::CSV_NAME);
    EXPECT_EQ(count_lines(contents), 3u);
    EXPECT_LT(contents.find("2.000,"), contents.find("3.000,"));

    fs::remove(blocker);
    EXPECT_EQ(ledger.flush_pending(), 0u);
    contents = read_file(blocker / DetectionLedger::CSV_NAME);
    EXPECT_EQ(count_lines(contents), 2u);
    EXPECT_NE(contents.find("1.000,104.000000,105.000000,-60.00,narrowband\n"), std::string::npos);
}

TEST(DetectionLedgerTest, AppendsFromCommittedContents) {
    TempDir tmp;
    DetectionLedger ledger(100.0, 110.0);
    ledger.record_cycle(tmp.path(), 1.0, {{"gain", "40"}}, {peak(104.0, 105.0, -60.0)}, "narrowband");
    const fs::path csv = tmp.path() / "detections" / DetectionLedger::CSV_NAME;
    fs::remove(csv);

    // The file is not re-read: the next commit republishes everything this ledger wrote.
    ledger.record_cycle(tmp.path(), 2.0, {{"gain", "40"}}, {peak(106.0, 107.0, -61.0)}, "narrowband");
    std::string contents = read_file(csv);
    EXPECT_EQ(contents.find(DetectionLedger::CSV_HEADER), 0u);
    EXPECT_EQ(count_lines(contents), 3u);
    EXPECT_LT(contents.find("1.000,"), contents.find("2.000,"));
}
