#include <gtest/gtest.h>

#include "modules/storage/MemoryTimeSeriesStore.hpp"

using namespace std::chrono_literals;

namespace {

DataPoint point(int deviceId, const std::string& address, double value, TimestampHelper::TimePoint ts) {
    DataPoint p;
    p.deviceId = deviceId;
    p.address = address;
    p.rawValue = value;
    p.scaledValue = value;
    p.timestamp = ts;
    return p;
}

}  // namespace

TEST(TimeSeriesStoreTest, StatisticsCountPerAddress) {
    MemoryTimeSeriesStore store;
    auto t0 = TimestampHelper::Clock::now() - 1h;
    store.writePoint(point(1, "40001", 1, t0));
    store.writePoint(point(1, "40001", 2, t0 + 1min));
    store.writePoint(point(1, "40002", 3, t0 + 2min));
    store.writePoint(point(2, "D100", 4, t0 + 3min));
    store.writePoint(point(1, "40001", 5, t0 - 2h));

    auto all = store.queryStatistics(std::nullopt, t0, t0 + 10min);
    EXPECT_EQ(all["total_points"].asInt(), 4);
    EXPECT_EQ(all["addresses"]["40001"].asInt(), 2);
    EXPECT_EQ(all["addresses"]["D100"].asInt(), 1);
    EXPECT_FALSE(all.isMember("error"));

    auto one = store.queryStatistics(2, t0, t0 + 10min);
    EXPECT_EQ(one["total_points"].asInt(), 1);
    EXPECT_EQ(one["addresses"].size(), 1u);
}

TEST(TimeSeriesStoreTest, StatisticsNeverThrow) {
    MemoryTimeSeriesStore store;
    store.setFailing(true);

    auto now = TimestampHelper::Clock::now();
    Json::Value stats;
    EXPECT_NO_THROW(stats = store.queryStatistics(std::nullopt, now - 1h, now));
    EXPECT_EQ(stats["total_points"].asInt(), 0);
    EXPECT_TRUE(stats["addresses"].isObject());
    EXPECT_TRUE(stats.isMember("error"));

    EXPECT_THROW(store.queryPoints(std::nullopt, now - 1h, now), PersistenceError);
    EXPECT_FALSE(store.writePoint(point(1, "40001", 1, now)));
}

TEST(TimeSeriesStoreTest, PointsOrderedByTimeThenAddress) {
    MemoryTimeSeriesStore store;
    auto t0 = TimestampHelper::Clock::now() - 1h;
    store.writePoint(point(1, "40002", 1, t0 + 1s));
    store.writePoint(point(1, "40003", 2, t0));
    store.writePoint(point(1, "40001", 3, t0 + 1s));

    auto points = store.queryPoints(1, t0, t0 + 1min);
    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[0].address, "40003");
    EXPECT_EQ(points[1].address, "40001");
    EXPECT_EQ(points[2].address, "40002");
}
