#pragma once

#include "TimestampHelper.hpp"

/**
 * @brief 数据库行字段读取
 *
 * NULL 列统一回落到默认值或 std::nullopt。
 */
namespace FieldHelper {

inline std::string getString(const drogon::orm::Field& field, const std::string& defaultValue = "") {
    return field.isNull() ? defaultValue : field.as<std::string>();
}

inline int getInt(const drogon::orm::Field& field, int defaultValue = 0) {
    return field.isNull() ? defaultValue : field.as<int>();
}

inline int64_t getInt64(const drogon::orm::Field& field, int64_t defaultValue = 0) {
    return field.isNull() ? defaultValue : field.as<int64_t>();
}

inline double getDouble(const drogon::orm::Field& field, double defaultValue = 0.0) {
    return field.isNull() ? defaultValue : field.as<double>();
}

inline std::optional<int> getOptionalInt(const drogon::orm::Field& field) {
    if (field.isNull()) return std::nullopt;
    return field.as<int>();
}

inline std::optional<std::string> getOptionalString(const drogon::orm::Field& field) {
    if (field.isNull()) return std::nullopt;
    return field.as<std::string>();
}

/**
 * @brief 读取 EXTRACT(EPOCH FROM ts) 列
 * 查询统一以 epoch 秒取时间，避免解析数据库时区格式
 */
inline TimestampHelper::TimePoint getEpoch(const drogon::orm::Field& field) {
    return TimestampHelper::fromEpochSeconds(getDouble(field));
}

}  // namespace FieldHelper
