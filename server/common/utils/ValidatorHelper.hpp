#pragma once

#include "AppException.hpp"
#include "StringUtils.hpp"
#include "TimestampHelper.hpp"

/**
 * @brief 参数校验和解析工具类
 *
 * 提供安全的查询参数解析和统一的 JSON 校验功能
 */
class ValidatorHelper {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;

    // ==================== 查询参数 ====================

    /**
     * @brief 从请求中安全获取整数参数
     * @return 参数缺失或非法时返回默认值
     */
    static int getIntParam(const HttpRequestPtr& req, const std::string& name, int defaultValue = 0) {
        return getOptionalIntParam(req, name).value_or(defaultValue);
    }

    /**
     * @brief 可选整数参数（缺失或非法返回空）
     */
    static std::optional<int> getOptionalIntParam(const HttpRequestPtr& req, const std::string& name) {
        auto value = StringUtils::parseInt(StringUtils::trim(req->getParameter(name)));
        if (!value || *value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(*value);
    }

    /**
     * @brief 时间参数（ISO 8601 UTC）
     * @throws ValidationException 参数存在但格式非法
     */
    static std::optional<TimestampHelper::TimePoint> getTimeParam(const HttpRequestPtr& req,
                                                                  const std::string& name) {
        auto raw = StringUtils::trim(req->getParameter(name));
        if (raw.empty()) return std::nullopt;

        auto tp = TimestampHelper::parse(raw);
        if (!tp) {
            throw ValidationException(name + " 时间格式错误，应为 YYYY-MM-DDTHH:MM:SSZ");
        }
        return tp;
    }

    /**
     * @brief start / end 时间区间，缺省为 [end - defaultSpan, now]
     * @throws ValidationException 格式非法或 start 晚于 end
     */
    template<typename Duration>
    static std::pair<TimestampHelper::TimePoint, TimestampHelper::TimePoint>
    getTimeRange(const HttpRequestPtr& req, Duration defaultSpan) {
        auto end = getTimeParam(req, "end").value_or(TimestampHelper::Clock::now());
        auto start = getTimeParam(req, "start").value_or(end - defaultSpan);
        if (start > end) {
            throw ValidationException("开始时间不能晚于结束时间");
        }
        return {start, end};
    }

    // ==================== JSON 校验 ====================

    static bool hasNonEmptyString(const Json::Value& json, const std::string& field) {
        return json.isMember(field) && json[field].isString() && !json[field].asString().empty();
    }

    /** 数字字段（布尔值不算） */
    static bool hasNumber(const Json::Value& json, const std::string& field) {
        return json.isMember(field) && json[field].isNumeric() && !json[field].isBool();
    }

    /**
     * @brief 校验结果
     */
    struct ValidationResult {
        bool valid = true;
        std::string errorMessage;

        operator bool() const { return valid; }

        static ValidationResult ok() {
            return {true, ""};
        }

        static ValidationResult fail(const std::string& message) {
            return {false, message};
        }

        /**
         * @brief 如果校验失败则抛出 ValidationException
         */
        void throwIfInvalid() const {
            if (!valid) {
                throw ValidationException(errorMessage);
            }
        }
    };

    static ValidationResult requireNonEmptyString(const Json::Value& json,
                                                   const std::string& field,
                                                   const std::string& fieldName) {
        if (!hasNonEmptyString(json, field)) {
            return ValidationResult::fail(fieldName + "不能为空");
        }
        return ValidationResult::ok();
    }

    static ValidationResult requireNumber(const Json::Value& json,
                                          const std::string& field,
                                          const std::string& fieldName) {
        if (!hasNumber(json, field)) {
            return ValidationResult::fail(fieldName + "必须是数字");
        }
        return ValidationResult::ok();
    }
};
