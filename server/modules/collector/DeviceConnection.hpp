#pragma once

#include "common/network/ConnectionState.hpp"
#include "common/protocol/ProtocolHandler.hpp"
#include "modules/storage/TimeSeriesStore.hpp"

/**
 * @brief 单台设备的连接
 *
 * 独占一个 ProtocolHandler，维护连接状态机与重连退避。
 * 所有操作由同一把可重入锁串行化（采集线程、写入接口、状态查询可能并发调用）。
 */
class DeviceConnection {
public:
    DeviceConnection(Device device, std::unique_ptr<ProtocolHandler> handler,
                     std::shared_ptr<TimeSeriesStore> store)
        : device_(std::move(device)), handler_(std::move(handler)), store_(std::move(store)) {
        if (store_) {
            auto store = store_;
            handler_->setErrorSink([store](const CommunicationError& err) {
                store->writeCommunicationError(err);
            });
        }
    }

    ~DeviceConnection() {
        std::lock_guard lock(mutex_);
        handler_->disconnect();
    }

    DeviceConnection(const DeviceConnection&) = delete;
    DeviceConnection& operator=(const DeviceConnection&) = delete;

    // ==================== 连接管理 ====================

    /**
     * @brief 建立连接（已连接或处于退避窗口内时跳过）
     * @return 当前是否已连接
     */
    bool connect() {
        std::lock_guard lock(mutex_);
        auto now = ConnectionStateMachine::Clock::now();
        if (state_.shouldSkipConnect(now)) {
            if (!state_.isConnected()) {
                LOG_DEBUG << "[Collector] Skip reconnect " << device_.name << ", backoff "
                          << state_.currentDelay() << "s (retry " << state_.retryCount() << ")";
            }
            return state_.isConnected();
        }

        state_.onAttempt(now);
        bool ok = false;
        std::string error;
        try {
            ok = handler_->connect();
            if (!ok) error = handler_->lastError();
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (ok) {
            state_.onConnected(TimestampHelper::now());
            LOG_INFO << "[Collector] Device connected: " << device_.name;
            return true;
        }

        if (error.empty()) error = "连接失败";
        fail(error, "connection_failed");
        LOG_ERROR << "[Collector] Device connect failed " << device_.name << ": " << error;
        return false;
    }

    /** 主动断开（幂等） */
    void disconnect() {
        std::lock_guard lock(mutex_);
        handler_->disconnect();
        state_.onDisconnect();
    }

    void updateTimeouts(int connectTimeoutMs, int receiveTimeoutMs) {
        std::lock_guard lock(mutex_);
        handler_->updateTimeouts(connectTimeoutMs, receiveTimeoutMs);
        LOG_DEBUG << "[Collector] Timeouts updated for " << device_.name
                  << ": connect=" << connectTimeoutMs << "ms, receive=" << receiveTimeoutMs << "ms";
    }

    // ==================== 数据读写 ====================

    /**
     * @brief 读取设备全部采集地址
     *
     * 设备无协议层响应时转入退避状态并记录通讯错误。
     */
    ReadResult read() {
        std::lock_guard lock(mutex_);
        if (!state_.isConnected()) {
            LOG_WARN << "[Collector] Device not connected, cannot read: " << device_.name;
            ReadResult empty;
            for (const auto& cfg : device_.addressConfigs) {
                empty.values[device_.storageKey(cfg)] = std::nullopt;
            }
            return empty;
        }

        auto result = handler_->readAddresses(device_.addressConfigs);
        if (!result.isOnline) {
            auto error = handler_->lastError().empty() ? std::string("网络通信失败") : handler_->lastError();
            handler_->disconnect();
            fail(error, "connection_failed");
            LOG_ERROR << "[Collector] Device offline during read " << device_.name << ": " << error;
        }
        return result;
    }

    /**
     * @brief 写入单个地址
     * @throws ConfigurationError 参数非法或地址只读
     */
    bool write(const std::string& address, double value, std::optional<int> stationId = std::nullopt) {
        std::lock_guard lock(mutex_);
        bool ok = handler_->writeAddress(address, value, stationId);
        if (!ok) {
            LOG_ERROR << "[Collector] Write failed " << device_.name << " " << address
                      << ": " << handler_->lastError();
            if (!handler_->isConnected() && state_.isConnected()) {
                fail(handler_->lastError(), "connection_failed");
            }
        }
        return ok;
    }

    // ==================== 状态查询 ====================

    const Device& device() const { return device_; }

    bool isConnected() const {
        std::lock_guard lock(mutex_);
        return state_.isConnected();
    }

    std::string lastError() const {
        std::lock_guard lock(mutex_);
        return state_.lastError();
    }

    int retryCount() const {
        std::lock_guard lock(mutex_);
        return state_.retryCount();
    }

    ConnectionStatus status() const {
        std::lock_guard lock(mutex_);
        return state_.status();
    }

    std::string protocolName() const {
        std::lock_guard lock(mutex_);
        return handler_->protocolName();
    }

    /**
     * @brief {is_connected, last_error, device_name, status, retry_count, last_connect_time, state}
     */
    Json::Value getStatus() const {
        std::lock_guard lock(mutex_);
        Json::Value json;
        json["is_connected"] = state_.isConnected();
        json["last_error"] = state_.lastError().empty() ? Json::Value::null : Json::Value(state_.lastError());
        json["device_name"] = device_.name;
        json["status"] = state_.isConnected() ? Constants::DEVICE_STATUS_ONLINE : Constants::DEVICE_STATUS_OFFLINE;
        json["retry_count"] = state_.retryCount();
        json["last_connect_time"] = state_.lastConnectTime().empty()
            ? Json::Value::null : Json::Value(state_.lastConnectTime());
        json["state"] = state_.statusString();
        return json;
    }

private:
    Device device_;
    std::unique_ptr<ProtocolHandler> handler_;
    std::shared_ptr<TimeSeriesStore> store_;
    ConnectionStateMachine state_;
    mutable std::recursive_mutex mutex_;

    void fail(const std::string& error, const char* errorType) {
        state_.onFailure(error);
        if (!store_) return;

        CommunicationError err;
        err.deviceId = device_.id;
        err.deviceName = device_.name;
        err.errorType = errorType;
        err.message = error;
        err.severity = "high";
        store_->writeCommunicationError(err);
    }
};
