#pragma once

#include "modules/device/domain/Device.hpp"
#include "modules/storage/TimeSeriesStore.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief 一次批量读取的结果
 */
struct ReadResult {
    std::map<std::string, std::optional<double>> values;  // 存储键 → 值（nullopt = 读取失败）
    bool isOnline = false;                                 // 至少一个地址得到了协议层响应

    size_t successCount() const {
        return static_cast<size_t>(std::count_if(values.begin(), values.end(),
            [](const auto& kv) { return kv.second.has_value(); }));
    }
};

/**
 * @brief 协议处理器接口
 *
 * 每台设备一个实例，由 DeviceConnection 独占持有并串行调用。
 * 实现类不自带锁。
 */
class ProtocolHandler {
public:
    /** 通讯错误上报回调（由 DeviceConnection 注入，写入时序库） */
    using ErrorSink = std::function<void(const CommunicationError&)>;

    explicit ProtocolHandler(Device device) : device_(std::move(device)) {}
    virtual ~ProtocolHandler() = default;

    ProtocolHandler(const ProtocolHandler&) = delete;
    ProtocolHandler& operator=(const ProtocolHandler&) = delete;

    /**
     * @brief 根据设备配置构建客户端状态（端点 / 字节序 / 站号）
     * @throws ConfigurationError 端点或端口非法
     */
    virtual void createInstance() = 0;

    /** @brief 建立会话，失败返回 false 并记录 lastError */
    virtual bool connect() = 0;

    /** @brief 释放会话（幂等） */
    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief 按配置顺序读取全部地址
     *
     * 会话不可用时所有键均为 nullopt，isOnline = false。
     */
    virtual ReadResult readAddresses(const std::vector<AddressConfig>& configs) = 0;

    /**
     * @brief 写入单个地址
     * @return 设备拒绝或网络失败返回 false
     * @throws ConfigurationError 地址/数值非法或地址只读（不会发起任何 IO）
     */
    virtual bool writeAddress(const std::string& address, double value,
                              std::optional<int> stationId = std::nullopt) = 0;

    /** @brief 运行中调整超时（不重连） */
    virtual void updateTimeouts(int connectTimeoutMs, int receiveTimeoutMs) = 0;

    virtual std::string protocolName() const = 0;

    // ==================== 公共访问 ====================

    const Device& device() const { return device_; }
    const std::string& lastError() const { return lastError_; }
    void setErrorSink(ErrorSink sink) { errorSink_ = std::move(sink); }

    // ==================== 共享工具 ====================

    /**
     * @brief 根据错误信息判断是否为网络类错误
     */
    static bool isNetworkError(const std::string& message) {
        auto lower = StringUtils::toLower(message);
        return StringUtils::containsAny(lower, {
            "timeout", "connection", "network", "socket",
            "unreachable", "refused", "reset", "closed"
        });
    }

    /**
     * @brief 写入前校验
     * @throws ConfigurationError
     */
    static void validateWrite(const std::string& address, double value) {
        if (StringUtils::trim(address).empty()) {
            throw ConfigurationError("写入地址不能为空");
        }
        if (address.size() > Constants::WRITE_ADDRESS_MAX_LENGTH) {
            throw ConfigurationError("写入地址长度不能超过"
                + std::to_string(Constants::WRITE_ADDRESS_MAX_LENGTH) + "个字符");
        }
        if (!std::isfinite(value)) {
            throw ConfigurationError("写入值必须是有限数值");
        }
        if (std::fabs(value) > Constants::WRITE_VALUE_MAX_ABS) {
            throw ConfigurationError("写入值超出允许范围");
        }
    }

protected:
    Device device_;
    std::string lastError_;
    ErrorSink errorSink_;

    void reportError(const std::string& errorType, const std::string& message,
                     const std::string& severity,
                     std::optional<std::string> address = std::nullopt,
                     std::optional<int> stationId = std::nullopt) {
        if (!errorSink_) return;
        CommunicationError err;
        err.deviceId = device_.id;
        err.deviceName = device_.name;
        err.errorType = errorType;
        err.message = message;
        err.severity = severity;
        err.address = std::move(address);
        err.stationId = stationId;
        errorSink_(err);
    }
};
