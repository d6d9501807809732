#pragma once

#include <json/json.h>

#include "StringUtils.hpp"

/**
 * @brief JSON 解析与宽松字段读取
 *
 * 地址配置等持久化 JSON 中数值可能以字符串存储，读取时统一兼容
 */
namespace JsonHelper {

/**
 * @brief 将字符串反序列化为 Json::Value
 * @throws std::runtime_error 解析失败时抛出
 */
inline Json::Value parse(const std::string& jsonStr) {
    Json::CharReaderBuilder reader;
    Json::Value result;
    std::string errs;
    std::istringstream iss(jsonStr);
    if (!Json::parseFromStream(reader, iss, &result, &errs)) {
        throw std::runtime_error("JSON parse error: " + errs);
    }
    return result;
}

/** 数值字段（数字或数字字符串均可），缺失或非法返回默认值 */
inline double getDouble(const Json::Value& obj, const char* key, double defaultValue) {
    if (!obj.isObject() || !obj.isMember(key)) return defaultValue;
    const auto& v = obj[key];
    if (v.isNumeric()) return v.asDouble();
    if (v.isString()) return StringUtils::parseDouble(v.asString()).value_or(defaultValue);
    return defaultValue;
}

inline int getInt(const Json::Value& obj, const char* key, int defaultValue) {
    return static_cast<int>(getDouble(obj, key, defaultValue));
}

inline std::string getString(const Json::Value& obj, const char* key, const std::string& defaultValue = "") {
    if (!obj.isObject() || !obj.isMember(key)) return defaultValue;
    const auto& v = obj[key];
    if (v.isString()) return v.asString();
    if (v.isNumeric() || v.isBool()) return v.asString();
    return defaultValue;
}

inline bool getBool(const Json::Value& obj, const char* key, bool defaultValue) {
    if (!obj.isObject() || !obj.isMember(key)) return defaultValue;
    const auto& v = obj[key];
    if (v.isBool()) return v.asBool();
    if (v.isNumeric()) return v.asDouble() != 0.0;
    if (v.isString()) {
        const auto s = v.asString();
        return s == "true" || s == "1";
    }
    return defaultValue;
}

}  // namespace JsonHelper
