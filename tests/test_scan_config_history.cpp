#include "scan_config_history.hpp"
#include "waterfall_buffer.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

TEST(ScanConfigHistoryTest, TracksRetainedRows) {
    FrequencyIndexer indexer(100.0, 110.0, 0.1);
    WaterfallBuffer buffer(indexer, 3);
    ScanConfigHistory history(3, true);
    for (int i = 0; i < 7; ++i) {
        ScanBatch batch = make_batch(10.0 + i, {{105.0, -90.0}}, {{"gain", std::to_string(i)}});
        ASSERT_TRUE(buffer.ingest(batch));
        history.push(batch.timestamp, batch.scan_config);
        EXPECT_EQ(history.size(), buffer.retained_scans());
    }
    EXPECT_DOUBLE_EQ(history.oldest_time(), 14.0);
    EXPECT_DOUBLE_EQ(history.newest_time(), 16.0);
    EXPECT_EQ(history.oldest_config().at("gain"), "4");
    EXPECT_EQ(history.config_at(15.0).at("gain"), "5");
    EXPECT_THROW(history.config_at(12.0), std::out_of_range);
}

TEST(ScanConfigHistoryTest, TimestampsOnlyWithoutPersistence) {
    ScanConfigHistory history(2, false);
    history.push(1.0, {{"a", "b"}});
    EXPECT_TRUE(history.newest_config().empty());
    EXPECT_EQ(history.timestamps().size(), 1u);
}

TEST(ScanConfigHistoryTest, EmptyHistoryThrows) {
    ScanConfigHistory history(2, true);
    EXPECT_TRUE(history.empty());
    EXPECT_THROW(history.oldest_time(), std::out_of_range);
    EXPECT_THROW(ScanConfigHistory(0, true), std::invalid_argument);
}
