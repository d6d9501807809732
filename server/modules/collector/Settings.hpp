#pragma once

#include "common/utils/Constants.hpp"
#include "common/utils/StringUtils.hpp"

/**
 * @brief 采集运行参数
 *
 * 由 SettingsStore 加载，启动时传入 Collector，变更时通过 reloadSettings 推送。
 * 不存在全局可变的"当前设置"。
 */
struct Settings {
    double collectIntervalSeconds = Constants::DEFAULT_COLLECT_INTERVAL_SEC;
    int connectTimeoutMs = Constants::DEFAULT_CONNECT_TIMEOUT_MS;
    int receiveTimeoutMs = Constants::DEFAULT_RECEIVE_TIMEOUT_MS;
    int maxConcurrentConnections = Constants::DEFAULT_MAX_CONNECTIONS;
    int dataRetentionDays = Constants::DEFAULT_RETENTION_DAYS;
    int workerCount = Constants::DEFAULT_WORKER_COUNT;
    int cycleCeilingSeconds = Constants::CYCLE_CEILING_SEC;
    int deviceWaitSeconds = Constants::DEVICE_WAIT_SEC;

    bool operator==(const Settings&) const = default;

    Json::Value toJson() const {
        Json::Value json;
        json["plc_collect_interval"] = collectIntervalSeconds;
        json["plc_connect_timeout"] = connectTimeoutMs;
        json["plc_receive_timeout"] = receiveTimeoutMs;
        json["max_concurrent_connections"] = maxConcurrentConnections;
        json["data_retention_days"] = dataRetentionDays;
        json["worker_count"] = workerCount;
        json["cycle_ceiling_seconds"] = cycleCeilingSeconds;
        json["device_wait_seconds"] = deviceWaitSeconds;
        return json;
    }
};

/**
 * @brief 采集参数校验
 *
 * 输入为 key/value 形式的 JSON 对象（值可以是数字或数字字符串，
 * system_settings 表中全部以字符串存储）。
 */
class SettingsValidator {
public:
    /**
     * @brief 校验全部字段，返回错误列表（空表示合法）
     */
    static std::vector<std::string> validate(const Json::Value& obj) {
        std::vector<std::string> errors;
        for (const auto& rule : rules()) {
            checkField(obj, rule, errors);
        }
        return errors;
    }

    /**
     * @brief 将合法字段覆盖到 base 上，非法字段保留 base 原值并记入 warnings
     */
    static Settings merge(const Settings& base, const Json::Value& obj,
                          std::vector<std::string>& warnings) {
        Settings result = base;
        for (const auto& rule : rules()) {
            std::vector<std::string> errors;
            auto value = checkField(obj, rule, errors);
            if (!errors.empty()) {
                for (auto& e : errors) {
                    warnings.push_back(e + "，保留原值");
                }
                continue;
            }
            if (value) {
                rule.apply(result, *value);
            }
        }
        return result;
    }

private:
    struct Rule {
        const char* key;
        const char* label;
        bool integral;
        double min;
        double max;
        const char* unit;
        void (*apply)(Settings&, double);
    };

    static const std::vector<Rule>& rules() {
        static const std::vector<Rule> table = {
            {"plc_collect_interval", "采集间隔", false, 1, 3600, "秒",
             [](Settings& s, double v) { s.collectIntervalSeconds = v; }},
            {"plc_connect_timeout", "连接超时", true, 100, 30000, "毫秒",
             [](Settings& s, double v) { s.connectTimeoutMs = static_cast<int>(v); }},
            {"plc_receive_timeout", "接收超时", true, 100, 60000, "毫秒",
             [](Settings& s, double v) { s.receiveTimeoutMs = static_cast<int>(v); }},
            {"max_concurrent_connections", "最大并发连接数", true, 1, 1000, "",
             [](Settings& s, double v) { s.maxConcurrentConnections = static_cast<int>(v); }},
            {"data_retention_days", "数据保留天数", true, 0, 3650, "天",
             [](Settings& s, double v) { s.dataRetentionDays = static_cast<int>(v); }},
            {"worker_count", "采集线程数", true, 1, 64, "",
             [](Settings& s, double v) { s.workerCount = static_cast<int>(v); }},
            {"cycle_ceiling_seconds", "采集周期上限", true, 1, 3600, "秒",
             [](Settings& s, double v) { s.cycleCeilingSeconds = static_cast<int>(v); }},
            {"device_wait_seconds", "设备采集等待上限", true, 1, 600, "秒",
             [](Settings& s, double v) { s.deviceWaitSeconds = static_cast<int>(v); }},
        };
        return table;
    }

    /**
     * @return 字段缺失返回 nullopt；非法时写入 errors 并返回 nullopt
     */
    static std::optional<double> checkField(const Json::Value& obj, const Rule& rule,
                                            std::vector<std::string>& errors) {
        if (!obj.isObject() || !obj.isMember(rule.key) || obj[rule.key].isNull()) {
            return std::nullopt;
        }

        const auto& raw = obj[rule.key];
        std::optional<double> value;
        if (raw.isNumeric() && !raw.isBool()) {
            value = raw.asDouble();
        } else if (raw.isString()) {
            value = StringUtils::parseDouble(raw.asString());
        }

        std::string label = rule.label;
        if (!value) {
            errors.push_back(label + "必须是数字");
            return std::nullopt;
        }
        if (rule.integral && std::floor(*value) != *value) {
            errors.push_back(label + "必须是整数");
            return std::nullopt;
        }
        if (*value < rule.min) {
            errors.push_back(label + "不能小于" + formatBound(rule.min) + rule.unit);
            return std::nullopt;
        }
        if (*value > rule.max) {
            errors.push_back(label + "不能大于" + formatBound(rule.max) + rule.unit);
            return std::nullopt;
        }
        return value;
    }

    static std::string formatBound(double v) {
        return std::to_string(static_cast<long>(v));
    }
};
