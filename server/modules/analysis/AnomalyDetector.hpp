#pragma once

#include "modules/device/domain/Device.hpp"
#include "modules/storage/TimeSeriesStore.hpp"

/**
 * @brief 异常类型
 */
enum class AnomalyType {
    DataInterruption,
    ValueSpike,
    OutOfRange,
    CommunicationError
};

inline const char* anomalyTypeToString(AnomalyType type) {
    switch (type) {
        case AnomalyType::DataInterruption: return "data_interruption";
        case AnomalyType::ValueSpike: return "value_spike";
        case AnomalyType::OutOfRange: return "out_of_range";
        case AnomalyType::CommunicationError: return "communication_error";
    }
    return "data_interruption";
}

/**
 * @brief 单条异常
 */
struct Anomaly {
    int deviceId = 0;
    std::string deviceName;
    std::string address;
    AnomalyType type = AnomalyType::DataInterruption;
    std::string description;
    TimestampHelper::TimePoint timestamp;
    std::optional<double> value;
    std::string severity;

    Json::Value toJson() const {
        Json::Value json;
        json["device_id"] = deviceId;
        json["device_name"] = deviceName;
        json["address"] = address;
        json["anomaly_type"] = anomalyTypeToString(type);
        json["anomaly_description"] = description;
        json["timestamp"] = TimestampHelper::format(timestamp);
        json["value"] = value ? Json::Value(*value) : Json::Value::null;
        json["severity"] = severity;
        return json;
    }
};

/**
 * @brief 检测结果（异常按时间倒序）
 */
struct AnomalyReport {
    std::vector<Anomaly> anomalies;
    std::map<AnomalyType, int> counts;
    TimestampHelper::TimePoint start;
    TimestampHelper::TimePoint end;
    std::optional<std::string> error;

    int total() const { return static_cast<int>(anomalies.size()); }

    int count(AnomalyType type) const {
        auto it = counts.find(type);
        return it == counts.end() ? 0 : it->second;
    }

    Json::Value toJson() const {
        Json::Value json;
        Json::Value list(Json::arrayValue);
        for (const auto& a : anomalies) {
            list.append(a.toJson());
        }
        json["anomalies"] = list;

        Json::Value types(Json::objectValue);
        for (auto type : {AnomalyType::DataInterruption, AnomalyType::ValueSpike,
                          AnomalyType::OutOfRange, AnomalyType::CommunicationError}) {
            types[anomalyTypeToString(type)] = count(type);
        }
        json["summary"]["total_anomalies"] = total();
        json["summary"]["anomaly_types"] = types;
        json["time_range"]["start"] = TimestampHelper::format(start);
        json["time_range"]["end"] = TimestampHelper::format(end);
        if (error) json["error"] = *error;
        return json;
    }
};

/**
 * @brief 值域表：全局默认值域 + 按 (设备, 存储键) 的工程量程
 */
class RangeTable {
public:
    RangeTable(double defaultMin = Constants::ANOMALY_RANGE_MIN,
               double defaultMax = Constants::ANOMALY_RANGE_MAX)
        : defaultRange_(defaultMin, defaultMax) {}

    /**
     * @brief 收集设备地址上配置的量程（任一端缺失时用默认值补齐）
     */
    void addDevices(const std::vector<Device>& devices) {
        for (const auto& device : devices) {
            for (const auto& cfg : device.addressConfigs) {
                if (!cfg.rangeMin && !cfg.rangeMax) continue;
                ranges_[{device.id, device.storageKey(cfg)}] = {
                    cfg.rangeMin.value_or(defaultRange_.first),
                    cfg.rangeMax.value_or(defaultRange_.second)
                };
            }
        }
    }

    std::pair<double, double> rangeFor(int deviceId, const std::string& address) const {
        auto it = ranges_.find({deviceId, address});
        return it == ranges_.end() ? defaultRange_ : it->second;
    }

private:
    std::pair<double, double> defaultRange_;
    std::map<std::pair<int, std::string>, std::pair<double, double>> ranges_;
};

/**
 * @brief 时序数据异常检测
 *
 * 规则（按设备 + 地址分组，时间升序，少于 2 个点的分组跳过）：
 * - 数据中断：相邻两点间隔 > 300 秒，30 分钟以内 medium，否则 high
 * - 数值突变：至少 3 个点且样本标准差 > 0，|v - 均值| > 3σ
 * - 超出值域：默认 [0, 1000]，地址配置了工程量程时以量程为准
 * - 通讯异常：通讯错误记录原样转为异常
 */
class AnomalyDetector {
public:
    AnomalyDetector(std::shared_ptr<TimeSeriesStore> store, RangeTable ranges = {})
        : store_(std::move(store)), ranges_(std::move(ranges)) {}

    /**
     * @brief 执行检测（不抛异常，存储缺失或故障时返回带 error 的空结果）
     */
    AnomalyReport detect(TimestampHelper::TimePoint start, TimestampHelper::TimePoint end,
                         std::optional<int> deviceId = std::nullopt) const {
        AnomalyReport report;
        report.start = start;
        report.end = end;

        if (!store_) {
            LOG_WARN << "[Anomaly] Detection skipped: time-series store not available";
            report.error = "时序存储不可用";
            return report;
        }

        try {
            auto points = store_->queryPoints(deviceId, start, end);
            auto errors = store_->queryCommunicationErrors(deviceId, start, end);

            std::map<std::pair<int, std::string>, std::vector<const StoredPoint*>> groups;
            for (const auto& p : points) {
                groups[{p.deviceId, p.address}].push_back(&p);
            }

            for (auto& [key, series] : groups) {
                if (series.size() < 2) continue;
                std::stable_sort(series.begin(), series.end(), [](const StoredPoint* a, const StoredPoint* b) {
                    return a->timestamp < b->timestamp;
                });
                detectInterruptions(series, report);
                detectSpikes(series, report);
                detectOutOfRange(series, report);
            }

            for (const auto& e : errors) {
                Anomaly a;
                a.deviceId = e.deviceId;
                a.deviceName = e.deviceName;
                a.address = "communication";
                a.type = AnomalyType::CommunicationError;
                a.description = "通信异常: " + e.message;
                a.timestamp = e.timestamp;
                a.severity = e.severity.empty() ? "high" : e.severity;
                add(report, std::move(a));
            }
        } catch (const std::exception& e) {
            LOG_ERROR << "[Anomaly] Detection failed: " << e.what();
            report.anomalies.clear();
            report.counts.clear();
            report.error = e.what();
            return report;
        }

        std::stable_sort(report.anomalies.begin(), report.anomalies.end(), [](const Anomaly& a, const Anomaly& b) {
            return a.timestamp > b.timestamp;
        });
        LOG_DEBUG << "[Anomaly] " << report.total() << " anomalies detected";
        return report;
    }

private:
    std::shared_ptr<TimeSeriesStore> store_;
    RangeTable ranges_;

    using Series = std::vector<const StoredPoint*>;

    static void add(AnomalyReport& report, Anomaly anomaly) {
        ++report.counts[anomaly.type];
        report.anomalies.push_back(std::move(anomaly));
    }

    static Anomaly fromPoint(const StoredPoint& p, AnomalyType type, std::string description,
                             std::string severity) {
        Anomaly a;
        a.deviceId = p.deviceId;
        a.deviceName = p.deviceName.empty() ? "设备" + std::to_string(p.deviceId) : p.deviceName;
        a.address = p.address;
        a.type = type;
        a.description = std::move(description);
        a.timestamp = p.timestamp;
        a.value = p.value;
        a.severity = std::move(severity);
        return a;
    }

    static std::string fixed(double v, int digits) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::fixed << std::setprecision(digits) << v;
        return oss.str();
    }

    static void detectInterruptions(const Series& series, AnomalyReport& report) {
        for (size_t i = 1; i < series.size(); ++i) {
            auto gap = TimestampHelper::secondsBetween(series[i - 1]->timestamp, series[i]->timestamp);
            if (gap <= Constants::ANOMALY_GAP_SEC) continue;

            add(report, fromPoint(*series[i - 1], AnomalyType::DataInterruption,
                                  "数据中断" + fixed(gap / 60.0, 1) + "分钟",
                                  gap < Constants::ANOMALY_GAP_HIGH_SEC ? "medium" : "high"));
        }
    }

    static void detectSpikes(const Series& series, AnomalyReport& report) {
        if (series.size() < 3) return;

        double sum = 0.0;
        for (const auto* p : series) sum += p->value;
        double mean = sum / static_cast<double>(series.size());

        double sq = 0.0;
        for (const auto* p : series) sq += (p->value - mean) * (p->value - mean);
        double stdev = std::sqrt(sq / static_cast<double>(series.size() - 1));
        if (stdev <= 0.0) return;

        for (const auto* p : series) {
            if (std::abs(p->value - mean) > Constants::ANOMALY_SPIKE_SIGMA * stdev) {
                add(report, fromPoint(*p, AnomalyType::ValueSpike,
                                      "数值突变: " + StringUtils::formatNumber(p->value)
                                          + " (平均值: " + fixed(mean, 2) + ")",
                                      "high"));
            }
        }
    }

    void detectOutOfRange(const Series& series, AnomalyReport& report) const {
        auto [lo, hi] = ranges_.rangeFor(series.front()->deviceId, series.front()->address);
        for (const auto* p : series) {
            if (p->value < lo || p->value > hi) {
                add(report, fromPoint(*p, AnomalyType::OutOfRange,
                                      "数值超范围: " + StringUtils::formatNumber(p->value) + " (正常范围: "
                                          + StringUtils::formatNumber(lo) + "-" + StringUtils::formatNumber(hi) + ")",
                                      "medium"));
            }
        }
    }
};
