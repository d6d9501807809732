#include <gtest/gtest.h>

#include "TestHelpers.hpp"
#include "modules/analysis/AnomalyDetector.hpp"

using namespace std::chrono_literals;
using namespace testing_support;

namespace {

class AnomalyDetectorTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryTimeSeriesStore> store = std::make_shared<MemoryTimeSeriesStore>();
    TimestampHelper::TimePoint t0 = TimestampHelper::Clock::now() - 24h;

    void addPoint(int deviceId, const std::string& address, double value, TimestampHelper::TimePoint ts) {
        DataPoint p;
        p.deviceId = deviceId;
        p.deviceName = "PLC-" + std::to_string(deviceId);
        p.address = address;
        p.rawValue = value;
        p.scaledValue = value;
        p.timestamp = ts;
        store->writePoint(p);
    }

    AnomalyReport run(RangeTable ranges = {}) const {
        AnomalyDetector detector(store, std::move(ranges));
        return detector.detect(t0 - 1h, t0 + 12h);
    }
};

}  // namespace

TEST_F(AnomalyDetectorTest, DetectsInterruptionsWithSeverity) {
    addPoint(1, "40001", 10, t0);
    addPoint(1, "40001", 10, t0 + 400s);          // 6.7 分钟
    addPoint(1, "40001", 10, t0 + 400s + 2000s);  // 33.3 分钟

    auto report = run();
    ASSERT_EQ(report.count(AnomalyType::DataInterruption), 2);
    ASSERT_EQ(report.total(), 2);

    // 倒序：较晚的中断在前
    EXPECT_EQ(report.anomalies[0].severity, "high");
    EXPECT_EQ(report.anomalies[0].description, "数据中断33.3分钟");
    EXPECT_EQ(report.anomalies[1].severity, "medium");
    EXPECT_EQ(report.anomalies[1].description, "数据中断6.7分钟");
}

TEST_F(AnomalyDetectorTest, GapAtThresholdIsNotAnInterruption) {
    addPoint(1, "40001", 10, t0);
    addPoint(1, "40001", 10, t0 + 300s);
    EXPECT_EQ(run().total(), 0);
}

TEST_F(AnomalyDetectorTest, DetectsValueSpike) {
    for (int i = 0; i < 19; ++i) {
        addPoint(1, "40001", 10, t0 + std::chrono::seconds(60 * i));
    }
    addPoint(1, "40001", 500, t0 + 19min);

    auto report = run();
    ASSERT_EQ(report.count(AnomalyType::ValueSpike), 1);
    EXPECT_EQ(report.count(AnomalyType::OutOfRange), 0);
    const auto& spike = report.anomalies.front();
    EXPECT_EQ(spike.value, 500.0);
    EXPECT_EQ(spike.severity, "high");
    EXPECT_EQ(spike.description, "数值突变: 500 (平均值: 34.50)");
}

TEST_F(AnomalyDetectorTest, SinglePointSeriesIsSkipped) {
    addPoint(1, "40001", 5000, t0);
    EXPECT_EQ(run().total(), 0);
}

TEST_F(AnomalyDetectorTest, OutOfRangeUsesDefaultAndConfiguredRanges) {
    addPoint(1, "40001", 1500, t0);
    addPoint(1, "40001", 5, t0 + 60s);
    addPoint(1, "40002", 60, t0);
    addPoint(1, "40002", 40, t0 + 60s);

    auto device = makeDevice(1, "PLC-1", {"40001", "40002"});
    device.addressConfigs[1].rangeMax = 50;
    RangeTable ranges;
    ranges.addDevices({device});

    auto report = run(ranges);
    ASSERT_EQ(report.count(AnomalyType::OutOfRange), 2);

    std::set<std::string> descriptions;
    for (const auto& a : report.anomalies) descriptions.insert(a.description);
    EXPECT_TRUE(descriptions.count("数值超范围: 1500 (正常范围: 0-1000)"));
    EXPECT_TRUE(descriptions.count("数值超范围: 60 (正常范围: 0-50)"));
}

TEST_F(AnomalyDetectorTest, CommunicationErrorsBecomeAnomalies) {
    CommunicationError err;
    err.deviceId = 2;
    err.deviceName = "PLC-2";
    err.errorType = "timeout";
    err.message = "receive timeout";
    err.severity = "medium";
    err.timestamp = t0 + 1h;
    store->writeCommunicationError(err);

    auto report = run();
    ASSERT_EQ(report.total(), 1);
    const auto& a = report.anomalies[0];
    EXPECT_EQ(a.type, AnomalyType::CommunicationError);
    EXPECT_EQ(a.address, "communication");
    EXPECT_EQ(a.description, "通信异常: receive timeout");
    EXPECT_EQ(a.severity, "medium");
    EXPECT_FALSE(a.value.has_value());
}

TEST_F(AnomalyDetectorTest, FiltersByDevice) {
    addPoint(1, "40001", 10, t0);
    addPoint(1, "40001", 10, t0 + 1h);
    addPoint(2, "40001", 10, t0);
    addPoint(2, "40001", 10, t0 + 2h);

    AnomalyDetector detector(store);
    auto report = detector.detect(t0 - 1h, t0 + 12h, 2);
    ASSERT_EQ(report.total(), 1);
    EXPECT_EQ(report.anomalies[0].deviceId, 2);
}

TEST_F(AnomalyDetectorTest, StoreFailureYieldsErrorReport) {
    addPoint(1, "40001", 10, t0);
    store->setFailing(true);

    auto report = run();
    EXPECT_EQ(report.total(), 0);
    ASSERT_TRUE(report.error.has_value());

    auto json = report.toJson();
    EXPECT_EQ(json["summary"]["total_anomalies"].asInt(), 0);
    EXPECT_TRUE(json.isMember("error"));
    EXPECT_EQ(json["summary"]["anomaly_types"]["value_spike"].asInt(), 0);
}

TEST(AnomalyDetectorNoStoreTest, MissingStoreYieldsErrorReport) {
    AnomalyDetector detector(nullptr);
    auto now = TimestampHelper::Clock::now();

    AnomalyReport report;
    EXPECT_NO_THROW(report = detector.detect(now - 1h, now));
    EXPECT_EQ(report.total(), 0);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_TRUE(report.toJson().isMember("error"));
}
