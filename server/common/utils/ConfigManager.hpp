#pragma once

#include "LoggerManager.hpp"
#include "common/database/DatabaseService.hpp"
#include "modules/collector/Settings.hpp"

/**
 * @brief 配置管理器 - 负责加载、验证和管理应用配置
 *
 * 启动时检查配置文件的完整性和正确性：
 * - JSON 语法检查
 * - 必填字段检查（listeners、db_clients）
 * - 端口范围、类型合法性校验
 * - 占位符值警告（YOUR_*、CHANGE_ME 等）
 * - 采集默认参数（custom_config.collector）与异常检测值域（custom_config.anomaly）
 */
class ConfigManager {
public:
    /** 校验结果：errors 阻断启动，warnings 仅提示 */
    struct Report {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        bool ok() const { return errors.empty(); }
    };

    /**
     * @brief 加载并验证配置文件
     * @return 是否成功加载，失败时已输出详细错误信息到 stderr 和日志
     */
    static bool load() {
        auto configPath = findConfigFile();
        if (!configPath) {
            return false;
        }

        Json::Value root;
        if (!parseConfigFile(*configPath, root)) {
            return false;
        }

        auto report = validate(root);
        if (!report.warnings.empty()) {
            printWarnings("配置警告 (" + *configPath + ")", report.warnings);
        }
        if (!report.ok()) {
            printErrors("配置验证失败: " + *configPath, report.errors);
            return false;
        }

        apply(root);

        try {
            drogon::app().loadConfigFile(*configPath);
        } catch (const std::exception& e) {
            printErrors("Drogon 加载配置失败", {e.what()});
            return false;
        }

        LOG_INFO << "[Config] Config loaded from: " << *configPath;
        return true;
    }

    /**
     * @brief 校验完整配置（listeners / db_clients / custom_config）
     */
    static Report validate(const Json::Value& root) {
        Report report;
        validateListeners(root, report.errors);
        validateDbClients(root, report.errors, report.warnings);
        validateCustom(root, report.errors, report.warnings);
        return report;
    }

    /**
     * @brief 提取自定义配置，缺省字段回落到内置默认值
     */
    static void apply(const Json::Value& root) {
        const auto& dbClients = root["db_clients"];
        DatabaseService::setUseFastClient(
            dbClients.isArray() && !dbClients.empty() && dbClients[0].get("is_fast", false).asBool());

        const auto& custom = root["custom_config"];
        std::unique_lock lock(mutex_);
        logLevel_ = custom.get("log_level", "INFO").asString();
        consoleLog_ = custom.get("console_log", false).asBool();

        collectorDefaults_ = Settings{};
        if (custom["collector"].isObject()) {
            std::vector<std::string> ignored;
            collectorDefaults_ = SettingsValidator::merge(Settings{}, custom["collector"], ignored);
        }

        anomalyRange_ = {Constants::ANOMALY_RANGE_MIN, Constants::ANOMALY_RANGE_MAX};
        if (custom["anomaly"].isObject()) {
            const auto& anomaly = custom["anomaly"];
            anomalyRange_.first = anomaly.get("range_min", Constants::ANOMALY_RANGE_MIN).asDouble();
            anomalyRange_.second = anomaly.get("range_max", Constants::ANOMALY_RANGE_MAX).asDouble();
        }
    }

    static std::string getLogLevel() {
        std::shared_lock lock(mutex_);
        return logLevel_;
    }

    static bool isConsoleLogEnabled() {
        std::shared_lock lock(mutex_);
        return consoleLog_;
    }

    /**
     * @brief 采集参数默认值（custom_config.collector）
     *
     * system_settings 表中的值在此基础上覆盖。
     */
    static Settings getCollectorDefaults() {
        std::shared_lock lock(mutex_);
        return collectorDefaults_;
    }

    /** 异常检测默认值域 {min, max} */
    static std::pair<double, double> getAnomalyRange() {
        std::shared_lock lock(mutex_);
        return anomalyRange_;
    }

private:
    inline static std::shared_mutex mutex_;
    inline static std::string logLevel_ = "INFO";
    inline static bool consoleLog_ = false;
    inline static Settings collectorDefaults_{};
    inline static std::pair<double, double> anomalyRange_{Constants::ANOMALY_RANGE_MIN, Constants::ANOMALY_RANGE_MAX};

    // ─── 配置文件查找 ───────────────────────────────────────────

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> paths = {
            "./config/config.local.json",
            "../../config/config.local.json",
            "../config/config.local.json",
            "./config/config.json",
            "../../config/config.json",
            "../config/config.json",
            "config.json"
        };

        for (const auto& path : paths) {
            if (std::filesystem::exists(path)) {
                return path;
            }
        }

        std::vector<std::string> hints = {"请在以下位置之一创建配置文件:"};
        for (const auto& p : paths) {
            hints.push_back("  - " + p);
        }
        hints.emplace_back("可参考 config/config.example.json");
        printErrors("未找到配置文件", hints);
        return std::nullopt;
    }

    // ─── JSON 解析 ──────────────────────────────────────────────

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printErrors("JSON 解析失败: " + path, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }

        if (!root.isObject()) {
            printErrors("JSON 格式错误: " + path, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }

        return true;
    }

    // ─── 配置验证 ──────────────────────────────────────────────

    static void validateListeners(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("listeners") || !root["listeners"].isArray() || root["listeners"].empty()) {
            errors.emplace_back("[listeners] 缺少监听配置，需要至少一个监听地址");
            return;
        }

        for (Json::ArrayIndex i = 0; i < root["listeners"].size(); ++i) {
            const auto& item = root["listeners"][i];
            auto prefix = "[listeners[" + std::to_string(i) + "]] ";

            if (!item.isMember("address") || !item["address"].isString() ||
                item["address"].asString().empty()) {
                errors.push_back(prefix + "缺少 address 字段");
            }

            validatePort(item, prefix, errors);
        }
    }

    static void validateDbClients(const Json::Value& root,
                                  std::vector<std::string>& errors,
                                  std::vector<std::string>& warnings) {
        if (!root.isMember("db_clients") || !root["db_clients"].isArray() ||
            root["db_clients"].empty()) {
            errors.emplace_back("[db_clients] 缺少数据库配置，需要至少一个 PostgreSQL 连接");
            return;
        }

        for (Json::ArrayIndex i = 0; i < root["db_clients"].size(); ++i) {
            const auto& db = root["db_clients"][i];
            auto prefix = "[db_clients[" + std::to_string(i) + "]] ";

            // 必填字符串字段
            for (const char* field : {"name", "rdbms", "host", "user", "dbname"}) {
                if (!db.isMember(field) || !db[field].isString() ||
                    db[field].asString().empty()) {
                    errors.push_back(prefix + "缺少必填字段: " + field);
                }
            }

            validatePort(db, prefix, errors);

            // 密码字段：必须存在，检测占位符
            if (!db.isMember("passwd") || !db["passwd"].isString()) {
                errors.push_back(prefix + "缺少 passwd 字段");
            } else if (isPlaceholder(db["passwd"].asString())) {
                warnings.push_back(prefix + "passwd 看起来是占位符，请填入实际密码");
            }
        }
    }

    static void validateCustom(const Json::Value& root,
                               std::vector<std::string>& errors,
                               std::vector<std::string>& warnings) {
        if (!root.isMember("custom_config") || !root["custom_config"].isObject()) {
            errors.emplace_back("[custom_config] 缺少自定义配置节");
            return;
        }
        const auto& custom = root["custom_config"];

        if (custom.isMember("log_level") &&
            (!custom["log_level"].isString() || !LogFormat::parseLevel(custom["log_level"].asString()))) {
            warnings.emplace_back("[custom_config] log_level 无效，可选 TRACE/DEBUG/INFO/WARN/ERROR/FATAL，将使用 INFO");
        }

        if (custom.isMember("collector")) {
            if (!custom["collector"].isObject()) {
                errors.emplace_back("[custom_config.collector] 必须是 JSON 对象");
            } else {
                for (const auto& e : SettingsValidator::validate(custom["collector"])) {
                    errors.push_back("[custom_config.collector] " + e);
                }
            }
        }

        if (custom.isMember("anomaly")) {
            const auto& anomaly = custom["anomaly"];
            if (!anomaly.isObject()) {
                errors.emplace_back("[custom_config.anomaly] 必须是 JSON 对象");
                return;
            }
            for (const char* field : {"range_min", "range_max"}) {
                if (anomaly.isMember(field) && !anomaly[field].isNumeric()) {
                    errors.push_back(std::string("[custom_config.anomaly] ") + field + " 必须是数字");
                }
            }
            if (anomaly["range_min"].isNumeric() && anomaly["range_max"].isNumeric() &&
                anomaly["range_min"].asDouble() >= anomaly["range_max"].asDouble()) {
                errors.emplace_back("[custom_config.anomaly] range_min 必须小于 range_max");
            }
        }
    }

    // ─── 工具方法 ──────────────────────────────────────────────

    static void validatePort(const Json::Value& obj, const std::string& prefix,
                             std::vector<std::string>& errors) {
        if (!obj.isMember("port") || !obj["port"].isNumeric()) {
            errors.push_back(prefix + "缺少 port 字段");
        } else {
            int port = obj["port"].asInt();
            if (port < 1 || port > 65535) {
                errors.push_back(prefix + "port 值无效: " +
                    std::to_string(port) + "（有效范围: 1-65535）");
            }
        }
    }

    static bool isPlaceholder(const std::string& value) {
        if (value.empty()) return false;
        if (value.starts_with("YOUR_") || value.starts_with("your_")) return true;
        if (value.find("CHANGE_ME") != std::string::npos) return true;
        if (value.find("TODO") != std::string::npos) return true;
        if (value == "password" || value == "PASSWORD") return true;
        return false;
    }

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
