#include <gtest/gtest.h>

#include "TestHelpers.hpp"
#include "modules/analysis/PerformanceAnalyzer.hpp"

using namespace std::chrono_literals;

TEST(PerformanceAnalyzerTest, HealthScoreWeights) {
    PerformanceMetrics perfect;
    perfect.connectionUptime = 100;
    perfect.dataCollectionRate = 100;
    perfect.dataCompleteness = 100;
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::healthScore(perfect), 100.0);

    PerformanceMetrics m;
    m.connectionUptime = 50;
    m.dataCollectionRate = 80;
    m.dataCompleteness = 60;
    m.avgResponseTime = 200;
    m.dataAnomalies = 2;
    EXPECT_NEAR(PerformanceAnalyzer::healthScore(m), 68.0, 1e-9);

    PerformanceMetrics slow;
    slow.avgResponseTime = 5000;
    slow.dataAnomalies = 40;
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::healthScore(slow), 0.0);
}

TEST(PerformanceAnalyzerTest, HealthyDeviceGetsPositiveFeedback) {
    PerformanceMetrics m;
    m.connectionUptime = 99;
    m.dataCollectionRate = 95;
    m.dataCompleteness = 90;
    m.avgResponseTime = 50;

    auto list = PerformanceAnalyzer::recommendations(m);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0], "设备运行状态良好，性能指标正常");
}

TEST(PerformanceAnalyzerTest, EachWeakMetricAddsRecommendation) {
    PerformanceMetrics m;
    m.connectionUptime = 10;
    m.connectionFailures = 11;
    m.avgResponseTime = 600;
    m.dataCollectionRate = 10;
    m.dataCompleteness = 10;
    m.dataAnomalies = 6;
    m.dataGaps = 6;
    EXPECT_EQ(PerformanceAnalyzer::recommendations(m).size(), 7u);
}

TEST(PerformanceAnalyzerTest, ComputesMetricsFromLogsAndPoints) {
    auto store = std::make_shared<MemoryTimeSeriesStore>();
    auto end = TimestampHelper::Clock::now();
    auto start = end - 2h;

    for (auto [status, rt] : std::vector<std::pair<std::string, double>>{
             {"success", 100}, {"success", 200}, {"failed", 0}}) {
        CollectLog log;
        log.deviceId = 7;
        log.status = status;
        log.responseTimeMs = rt;
        log.timestamp = end - 30min;
        store->writeCollectLog(log);
    }
    for (int i = 0; i < 5; ++i) {
        DataPoint p;
        p.deviceId = 7;
        p.address = "40001";
        p.scaledValue = 10;
        p.timestamp = end - 30min + std::chrono::seconds(60 * i);
        store->writePoint(p);
    }

    PerformanceAnalyzer analyzer(store);
    auto report = analyzer.analyze(7, start, end);
    const auto& m = report.metrics;

    EXPECT_EQ(m.successfulCollections, 2);
    EXPECT_EQ(m.failedCollections, 1);
    EXPECT_EQ(m.connectionFailures, 1);
    EXPECT_DOUBLE_EQ(m.avgResponseTime, 100.0);
    EXPECT_DOUBLE_EQ(m.dataCollectionRate, 66.67);
    EXPECT_DOUBLE_EQ(m.connectionUptime, 100.0);
    EXPECT_EQ(m.dataGaps, 0);
    EXPECT_EQ(m.totalDataPoints, 5);
    EXPECT_DOUBLE_EQ(m.dataCompleteness, 25.0);
    EXPECT_EQ(m.dataAnomalies, 0);

    EXPECT_NEAR(report.healthScore, 75.17, 0.011);
    ASSERT_EQ(report.recommendations.size(), 2u);
    EXPECT_EQ(report.recommendations[0], "数据采集成功率偏低，建议检查PLC地址配置和设备状态");
    EXPECT_EQ(report.recommendations[1], "数据完整性不足，建议检查采集配置和存储系统");

    auto json = report.toJson();
    EXPECT_EQ(json["device_id"].asInt(), 7);
    EXPECT_EQ(json["metrics"]["total_data_points"].asInt64(), 5);
}

TEST(PerformanceAnalyzerTest, NoLogsMeansNoUptime) {
    auto store = std::make_shared<MemoryTimeSeriesStore>();
    auto end = TimestampHelper::Clock::now();
    PerformanceAnalyzer analyzer(store);

    auto report = analyzer.analyze(1, end - 30min, end);
    EXPECT_EQ(report.metrics.connectionUptime, 0.0);
    EXPECT_DOUBLE_EQ(report.metrics.avgResponseTime, 100.0);
    EXPECT_EQ(report.metrics.dataGaps, 1);
}

TEST(PerformanceAnalyzerTest, StoreFailureReturnsEmptyMetrics) {
    auto store = std::make_shared<MemoryTimeSeriesStore>();
    store->setFailing(true);
    PerformanceAnalyzer analyzer(store);

    auto end = TimestampHelper::Clock::now();
    auto report = analyzer.analyze(1, end - 1h, end);
    EXPECT_EQ(report.metrics.successfulCollections, 0);
    EXPECT_DOUBLE_EQ(report.healthScore, 25.0);
}
