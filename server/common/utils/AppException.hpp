#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 应用异常基类
 */
class AppException : public std::exception {
public:
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

private:
    int code_;
    std::string message_;
    HttpStatusCode status_;

public:
    AppException(int code, std::string message, HttpStatusCode status = k400BadRequest)
        : code_(code), message_(std::move(message)), status_(status) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
    HttpStatusCode getStatus() const { return status_; }
};

/**
 * @brief 资源不存在
 */
class NotFoundException : public AppException {
public:
    explicit NotFoundException(const std::string& message = "资源不存在")
        : AppException(ErrorCodes::NOT_FOUND, message, k404NotFound) {}
};

/**
 * @brief 请求参数验证失败
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "验证失败")
        : AppException(ErrorCodes::VALIDATION_FAILED, message, k400BadRequest) {}
};

/**
 * @brief 配置错误 - 地址/参数非法，在任何 IO 之前同步拒绝
 */
class ConfigurationError : public AppException {
public:
    explicit ConfigurationError(const std::string& message)
        : AppException(ErrorCodes::CONFIGURATION_ERROR, message, k400BadRequest) {}
};

/**
 * @brief 网络错误 - 超时 / 拒绝 / 复位 / socket 失败
 *
 * 只在协议处理器内部传播，由 DeviceConnection 转为退避状态，不会抛给调度器。
 */
class NetworkError : public AppException {
public:
    explicit NetworkError(const std::string& message)
        : AppException(ErrorCodes::NETWORK_ERROR, message, k502BadGateway) {}
};

/**
 * @brief 协议数据错误 - 设备在线但拒绝了请求或响应无法解码
 */
class ProtocolDataError : public AppException {
public:
    explicit ProtocolDataError(const std::string& message)
        : AppException(ErrorCodes::PROTOCOL_DATA_ERROR, message, k502BadGateway) {}
};

/**
 * @brief 持久化错误 - 时序库不可用
 */
class PersistenceError : public AppException {
public:
    explicit PersistenceError(const std::string& message)
        : AppException(ErrorCodes::DATABASE_ERROR, message, k503ServiceUnavailable) {}
};
