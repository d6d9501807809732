#pragma once

#include "AppException.hpp"
#include "Response.hpp"

/**
 * @brief 全局异常处理器
 *
 * 控制器中未捕获的异常统一转换为 {code, message} 响应：
 * - AppException 按自身错误码与 HTTP 状态
 * - Drogon ORM 异常视为持久化错误（503）
 * - 其余异常返回 500
 */
class AppExceptionHandler {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    struct Mapped {
        int code;
        std::string message;
        HttpStatusCode status;
    };

    static Mapped map(const std::exception& e) {
        if (const auto* appEx = dynamic_cast<const AppException*>(&e)) {
            return {appEx->getCode(), appEx->getMessage(), appEx->getStatus()};
        }
        if (dynamic_cast<const drogon::orm::DrogonDbException*>(&e)) {
            return {ErrorCodes::DATABASE_ERROR, "数据库不可用", k503ServiceUnavailable};
        }
        return {ErrorCodes::INTERNAL_ERROR, "服务器内部错误", k500InternalServerError};
    }

    static void setup() {
        drogon::app().setExceptionHandler([](const std::exception& e,
                                             const HttpRequestPtr& req,
                                             std::function<void (const HttpResponsePtr &)> &&callback) {
            auto mapped = map(e);
            if (mapped.status == k500InternalServerError) {
                LOG_ERROR << "[Http] Unhandled exception on " << req->methodString() << " "
                          << req->path() << ": " << e.what();
            } else if (static_cast<int>(mapped.status) >= 500) {
                LOG_WARN << "[Http] " << req->methodString() << " " << req->path()
                         << " failed: " << e.what();
            }
            callback(Response::error(mapped.code, mapped.message, mapped.status));
        });
    }
};
