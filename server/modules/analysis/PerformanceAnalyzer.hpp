#pragma once

#include "AnomalyDetector.hpp"

/**
 * @brief 设备性能指标
 */
struct PerformanceMetrics {
    double connectionUptime = 0.0;
    int connectionFailures = 0;
    double avgResponseTime = 0.0;
    double dataCollectionRate = 0.0;
    int64_t totalDataPoints = 0;
    int successfulCollections = 0;
    int failedCollections = 0;
    double dataCompleteness = 0.0;
    int dataAnomalies = 0;
    int dataGaps = 0;

    Json::Value toJson() const {
        Json::Value json;
        json["connection_uptime"] = connectionUptime;
        json["connection_failures"] = connectionFailures;
        json["avg_response_time"] = avgResponseTime;
        json["data_collection_rate"] = dataCollectionRate;
        json["total_data_points"] = static_cast<Json::Int64>(totalDataPoints);
        json["successful_collections"] = successfulCollections;
        json["failed_collections"] = failedCollections;
        json["data_completeness"] = dataCompleteness;
        json["data_anomalies"] = dataAnomalies;
        json["data_gaps"] = dataGaps;
        return json;
    }
};

struct PerformanceReport {
    int deviceId = 0;
    PerformanceMetrics metrics;
    double healthScore = 0.0;
    std::vector<std::string> recommendations;
    TimestampHelper::TimePoint start;
    TimestampHelper::TimePoint end;

    Json::Value toJson() const {
        Json::Value json;
        json["device_id"] = deviceId;
        json["metrics"] = metrics.toJson();
        json["health_score"] = healthScore;
        Json::Value list(Json::arrayValue);
        for (const auto& r : recommendations) list.append(r);
        json["recommendations"] = list;
        json["time_range"]["start"] = TimestampHelper::format(start);
        json["time_range"]["end"] = TimestampHelper::format(end);
        return json;
    }
};

/**
 * @brief 设备性能分析（采集日志 + 数据点 + 异常数）
 */
class PerformanceAnalyzer {
public:
    PerformanceAnalyzer(std::shared_ptr<TimeSeriesStore> store, RangeTable ranges = {})
        : store_(store), detector_(std::move(store), std::move(ranges)) {}

    PerformanceReport analyze(int deviceId, TimestampHelper::TimePoint start,
                              TimestampHelper::TimePoint end) const {
        PerformanceReport report;
        report.deviceId = deviceId;
        report.start = start;
        report.end = end;
        report.metrics = computeMetrics(deviceId, start, end);
        report.healthScore = healthScore(report.metrics);
        report.recommendations = recommendations(report.metrics);
        return report;
    }

    /**
     * @brief 加权健康分（0-100，保留两位小数）
     */
    static double healthScore(const PerformanceMetrics& m) {
        double responseScore = std::max(0.0, 100.0 - m.avgResponseTime / 10.0);
        double anomalyScore = std::max(0.0, 100.0 - m.dataAnomalies * 5.0);
        double score = m.connectionUptime * 0.3
                     + m.dataCollectionRate * 0.25
                     + m.dataCompleteness * 0.2
                     + responseScore * 0.15
                     + anomalyScore * 0.1;
        return round2(score);
    }

    static std::vector<std::string> recommendations(const PerformanceMetrics& m) {
        std::vector<std::string> list;
        if (m.connectionUptime < 90) {
            list.emplace_back("设备连接不稳定，建议检查网络连接和PLC设备状态");
        }
        if (m.connectionFailures > 10) {
            list.emplace_back("连接失败次数过多，建议检查网络配置和设备可达性");
        }
        if (m.avgResponseTime > 500) {
            list.emplace_back("设备响应时间较长，建议优化网络环境或调整采集频率");
        }
        if (m.dataCollectionRate < 80) {
            list.emplace_back("数据采集成功率偏低，建议检查PLC地址配置和设备状态");
        }
        if (m.dataCompleteness < 85) {
            list.emplace_back("数据完整性不足，建议检查采集配置和存储系统");
        }
        if (m.dataAnomalies > 5) {
            list.emplace_back("数据异常较多，建议检查设备运行状态和数据有效性");
        }
        if (m.dataGaps > 5) {
            list.emplace_back("数据缺失较多，建议检查采集任务调度和系统资源");
        }
        if (list.empty()) {
            list.emplace_back("设备运行状态良好，性能指标正常");
        }
        return list;
    }

private:
    std::shared_ptr<TimeSeriesStore> store_;
    AnomalyDetector detector_;

    static double round2(double v) {
        return std::round(v * 100.0) / 100.0;
    }

    PerformanceMetrics computeMetrics(int deviceId, TimestampHelper::TimePoint start,
                                      TimestampHelper::TimePoint end) const {
        PerformanceMetrics m;

        std::vector<CollectLog> logs;
        try {
            logs = store_->queryCollectLogs(deviceId, start, end);
        } catch (const std::exception& e) {
            LOG_ERROR << "[Anomaly] Performance metrics for device " << deviceId << " failed: " << e.what();
            return m;
        }

        int total = static_cast<int>(logs.size());
        int success = 0;
        double rtSum = 0.0;
        for (const auto& log : logs) {
            if (log.status == "success") ++success;
            rtSum += log.responseTimeMs;
        }

        double hours = TimestampHelper::secondsBetween(start, end) / 3600.0;
        int expected = std::max(1, static_cast<int>(hours));

        m.successfulCollections = success;
        m.failedCollections = total - success;
        m.connectionFailures = total - success;
        m.avgResponseTime = round2(total > 0 ? rtSum / total : 100.0);
        m.dataCollectionRate = round2(total > 0 ? static_cast<double>(success) / total * 100.0 : 0.0);
        m.connectionUptime = round2(std::min(100.0, static_cast<double>(success) / expected * 100.0));
        m.dataGaps = std::max(0, expected - success);

        auto stats = store_->queryStatistics(deviceId, start, end);
        if (stats.isMember("error")) {
            LOG_WARN << "[Anomaly] Statistics unavailable for device " << deviceId << ": "
                     << stats["error"].asString();
        }
        m.totalDataPoints = stats.get("total_points", 0).asInt64();
        m.dataCompleteness = round2(std::min(100.0,
            static_cast<double>(m.totalDataPoints) / (expected * 10.0) * 100.0));

        auto anomalies = detector_.detect(start, end, deviceId);
        m.dataAnomalies = anomalies.total();
        return m;
    }
};
