#include <gtest/gtest.h>

#include "common/utils/ConfigManager.hpp"
#include "common/utils/JsonHelper.hpp"

namespace {

Json::Value baseConfig() {
    return JsonHelper::parse(R"({
        "listeners": [{"address": "0.0.0.0", "port": 8000}],
        "db_clients": [{
            "name": "default", "rdbms": "postgresql", "host": "127.0.0.1", "port": 5432,
            "dbname": "plc", "user": "postgres", "passwd": "secret", "is_fast": true
        }],
        "custom_config": {
            "log_level": "debug",
            "console_log": true,
            "collector": {"plc_collect_interval": 2, "worker_count": 4},
            "anomaly": {"range_min": -10, "range_max": 250}
        }
    })");
}

bool contains(const std::vector<std::string>& messages, const std::string& needle) {
    return std::any_of(messages.begin(), messages.end(),
                       [&](const std::string& m) { return m.find(needle) != std::string::npos; });
}

}  // namespace

TEST(ConfigManagerTest, ValidConfigPasses) {
    auto report = ConfigManager::validate(baseConfig());
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.warnings.empty());
}

TEST(ConfigManagerTest, ReportsStructuralErrors) {
    auto root = baseConfig();
    root["listeners"][0]["port"] = 70000;
    root["db_clients"][0].removeMember("host");
    root["custom_config"]["collector"]["plc_connect_timeout"] = 10;
    root["custom_config"]["anomaly"]["range_min"] = 500;

    auto report = ConfigManager::validate(root);
    EXPECT_FALSE(report.ok());
    EXPECT_TRUE(contains(report.errors, "[listeners[0]] port 值无效: 70000"));
    EXPECT_TRUE(contains(report.errors, "[db_clients[0]] 缺少必填字段: host"));
    EXPECT_TRUE(contains(report.errors, "[custom_config.collector] 连接超时不能小于100毫秒"));
    EXPECT_TRUE(contains(report.errors, "range_min 必须小于 range_max"));
}

TEST(ConfigManagerTest, MissingSectionsAreErrors) {
    auto report = ConfigManager::validate(Json::Value(Json::objectValue));
    EXPECT_EQ(report.errors.size(), 3u);
}

TEST(ConfigManagerTest, PlaceholderPasswordAndUnknownLevelWarn) {
    auto root = baseConfig();
    root["db_clients"][0]["passwd"] = "your_password";
    root["custom_config"]["log_level"] = "verbose";

    auto report = ConfigManager::validate(root);
    EXPECT_TRUE(report.ok());
    ASSERT_EQ(report.warnings.size(), 2u);
    EXPECT_TRUE(contains(report.warnings, "占位符"));
    EXPECT_TRUE(contains(report.warnings, "log_level 无效"));
}

TEST(ConfigManagerTest, ApplyExtractsCustomConfig) {
    ConfigManager::apply(baseConfig());

    EXPECT_EQ(ConfigManager::getLogLevel(), "debug");
    EXPECT_TRUE(ConfigManager::isConsoleLogEnabled());
    EXPECT_TRUE(DatabaseService::useFastClient());

    auto defaults = ConfigManager::getCollectorDefaults();
    EXPECT_DOUBLE_EQ(defaults.collectIntervalSeconds, 2.0);
    EXPECT_EQ(defaults.workerCount, 4);
    EXPECT_EQ(defaults.receiveTimeoutMs, Constants::DEFAULT_RECEIVE_TIMEOUT_MS);

    auto [lo, hi] = ConfigManager::getAnomalyRange();
    EXPECT_DOUBLE_EQ(lo, -10.0);
    EXPECT_DOUBLE_EQ(hi, 250.0);

    // 再次应用时未配置的段回落默认值
    auto bare = baseConfig();
    bare["custom_config"] = Json::Value(Json::objectValue);
    bare["db_clients"][0]["is_fast"] = false;
    ConfigManager::apply(bare);
    EXPECT_EQ(ConfigManager::getLogLevel(), "INFO");
    EXPECT_EQ(ConfigManager::getCollectorDefaults(), Settings{});
    EXPECT_DOUBLE_EQ(ConfigManager::getAnomalyRange().second, Constants::ANOMALY_RANGE_MAX);
    EXPECT_FALSE(DatabaseService::useFastClient());
}
