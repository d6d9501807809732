#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 统一响应格式工具类：{code, message, data}
 */
class Response {
public:
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpResponse = drogon::HttpResponse;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static HttpResponsePtr ok(const Json::Value &data = Json::Value::null,
                               const std::string &message = "Success") {
        Json::Value json;
        json["code"] = ErrorCodes::SUCCESS;
        json["message"] = message;
        if (!data.isNull()) {
            json["data"] = data;
        }

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(k200OK);
        return resp;
    }

    static HttpResponsePtr error(int code,
                                   const std::string &message,
                                   HttpStatusCode status = k400BadRequest) {
        Json::Value json;
        json["code"] = code;
        json["message"] = message;

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(status);
        return resp;
    }

    static HttpResponsePtr badRequest(const std::string &message = "请求参数错误") {
        return error(ErrorCodes::BAD_REQUEST, message, k400BadRequest);
    }

    static HttpResponsePtr badGateway(const std::string &message = "设备通讯失败") {
        return error(ErrorCodes::NETWORK_ERROR, message, k502BadGateway);
    }
};
