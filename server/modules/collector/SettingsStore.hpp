#pragma once

#include "Settings.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/utils/FieldHelper.hpp"

/**
 * @brief 采集参数来源
 */
class SettingsStore {
public:
    virtual ~SettingsStore() = default;
    virtual Settings load() = 0;
};

/**
 * @brief system_settings 表（key / value，value 以文本存储）
 *
 * 表中缺失或非法的字段回落到 defaults（来自 config.json 的 custom_config.collector）。
 */
class PgSettingsStore : public SettingsStore {
public:
    explicit PgSettingsStore(Settings defaults) : defaults_(std::move(defaults)) {}

    Settings load() override {
        Json::Value obj(Json::objectValue);
        try {
            auto result = db_.execSqlSync("SELECT key, value FROM system_settings");
            for (const auto& row : result) {
                obj[FieldHelper::getString(row["key"])] = FieldHelper::getString(row["value"]);
            }
        } catch (const std::exception& e) {
            LOG_ERROR << "[Config] Load system_settings failed, using defaults: " << e.what();
            return defaults_;
        }

        std::vector<std::string> warnings;
        auto settings = SettingsValidator::merge(defaults_, obj, warnings);
        for (const auto& w : warnings) {
            LOG_WARN << "[Config] system_settings: " << w;
        }
        return settings;
    }

private:
    DatabaseService db_;
    Settings defaults_;
};
