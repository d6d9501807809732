#pragma once

#include "ProtocolHandler.hpp"
#include "common/network/SocketTransport.hpp"

/**
 * @brief 基于 SocketTransport 的协议处理器公共实现
 *
 * 负责会话建立 / 释放、超时调整和批量读取的错误归类，子类只实现协议本身：
 *   - openSession()  TCP 建立后的协议握手（Fins 节点握手、S7 COTP + Setup）
 *   - readValue()    单地址读取
 *   - writeValue()   单地址写入
 *
 * 错误归类：
 *   NetworkError      → 关闭会话，剩余地址全部置空，isOnline 由已有响应决定
 *   ProtocolDataError → 该地址置空，设备视为在线，继续下一个地址
 *   其他异常          → 该地址置空，继续下一个地址
 */
class TcpProtocolHandler : public ProtocolHandler {
public:
    TcpProtocolHandler(Device device, int connectTimeoutMs, int receiveTimeoutMs)
        : ProtocolHandler(std::move(device)),
          connectTimeoutMs_(connectTimeoutMs), receiveTimeoutMs_(receiveTimeoutMs) {}

    void createInstance() override {
        if (StringUtils::trim(device_.host).empty()) {
            throw ConfigurationError("设备 " + device_.name + " 未配置 IP 地址");
        }
        if (device_.port <= 0 || device_.port > 65535) {
            throw ConfigurationError("设备 " + device_.name + " 端口非法: " + std::to_string(device_.port));
        }
        transport_ = std::make_unique<SocketTransport>(
            device_.host, static_cast<uint16_t>(device_.port), connectTimeoutMs_, receiveTimeoutMs_);
    }

    bool connect() override {
        try {
            if (!transport_) createInstance();
            transport_->open();
            openSession();
            sessionOpen_ = true;
            lastError_.clear();
            LOG_INFO << logTag() << " Connected to " << device_.name << " (" << transport_->endpoint() << ")";
            return true;
        } catch (const std::exception& e) {
            lastError_ = e.what();
            sessionOpen_ = false;
            if (transport_) transport_->close();
            if (isNetworkError(lastError_)) {
                LOG_ERROR << logTag() << " Network error connecting " << device_.name << ": " << lastError_;
            } else {
                LOG_ERROR << logTag() << " Connect failed for " << device_.name << ": " << lastError_;
            }
            return false;
        }
    }

    void disconnect() override {
        if (transport_ && transport_->isOpen()) {
            LOG_INFO << logTag() << " Disconnected from " << device_.name;
        }
        closeSession();
    }

    bool isConnected() const override {
        return sessionOpen_ && transport_ && transport_->isOpen();
    }

    void updateTimeouts(int connectTimeoutMs, int receiveTimeoutMs) override {
        connectTimeoutMs_ = connectTimeoutMs;
        receiveTimeoutMs_ = receiveTimeoutMs;
        if (transport_) transport_->setTimeouts(connectTimeoutMs, receiveTimeoutMs);
    }

    ReadResult readAddresses(const std::vector<AddressConfig>& configs) override {
        ReadResult result;
        if (!isConnected()) {
            // 对端已断开但会话尚未释放
            if (sessionOpen_) {
                lastError_ = "connection closed by peer (" + transport_->endpoint() + ")";
                LOG_ERROR << logTag() << " Network error reading " << device_.name << ": " << lastError_;
                closeSession();
            }
            for (const auto& cfg : configs) {
                result.values[device_.storageKey(cfg)] = std::nullopt;
            }
            return result;
        }

        bool sessionLost = false;
        for (const auto& cfg : configs) {
            auto key = device_.storageKey(cfg);
            if (sessionLost) {
                result.values[key] = std::nullopt;
                continue;
            }

            try {
                result.values[key] = readValue(cfg);
                result.isOnline = true;
            } catch (const NetworkError& e) {
                lastError_ = e.what();
                LOG_ERROR << logTag() << " Network error reading " << device_.name
                          << " address " << cfg.address << ": " << e.what();
                result.values[key] = std::nullopt;
                closeSession();
                sessionLost = true;
            } catch (const ProtocolDataError& e) {
                LOG_WARN << logTag() << " Read failed but device online " << device_.name
                         << " (address " << cfg.address << ", type " << valueTypeToString(cfg.type)
                         << "): " << e.what();
                result.values[key] = std::nullopt;
                result.isOnline = true;
            } catch (const std::exception& e) {
                LOG_ERROR << logTag() << " Error reading " << device_.name
                          << " address " << cfg.address << ": " << e.what();
                result.values[key] = std::nullopt;
            }
        }
        return result;
    }

    bool writeAddress(const std::string& address, double value,
                      std::optional<int> stationId = std::nullopt) override {
        validateWrite(address, value);
        bool ok = guardedWrite([&] { return writeValue(StringUtils::trim(address), value, stationId); });
        if (ok) {
            LOG_INFO << logTag() << " Write " << device_.name << " " << address << " = " << value;
        }
        return ok;
    }

protected:
    /**
     * @brief 写操作的统一错误处理
     *
     * 未连接 / 网络错误 / 设备拒绝返回 false；ConfigurationError 继续向上抛出。
     */
    template<typename Fn>
    bool guardedWrite(Fn&& fn) {
        if (!isConnected()) {
            lastError_ = "设备未连接";
            LOG_ERROR << logTag() << " Write to " << device_.name << " skipped: not connected";
            return false;
        }

        try {
            return fn();
        } catch (const NetworkError& e) {
            lastError_ = e.what();
            LOG_ERROR << logTag() << " Network error writing " << device_.name << ": " << e.what();
            closeSession();
            return false;
        } catch (const ProtocolDataError& e) {
            lastError_ = e.what();
            LOG_ERROR << logTag() << " Write rejected by " << device_.name << ": " << e.what();
            return false;
        }
    }

    std::unique_ptr<SocketTransport> transport_;

    /** 日志前缀，例如 "[Modbus]" */
    virtual const char* logTag() const = 0;

    /** TCP 建立后的协议握手，默认无需握手 */
    virtual void openSession() {}

    /**
     * @return 值；字符串无法转为数值时返回 nullopt
     * @throws NetworkError / ProtocolDataError / ConfigurationError
     */
    virtual std::optional<double> readValue(const AddressConfig& cfg) = 0;

    /**
     * @return 设备确认写入返回 true
     * @throws NetworkError / ProtocolDataError / ConfigurationError
     */
    virtual bool writeValue(const std::string& address, double value, std::optional<int> stationId) = 0;

    /** 发送请求并接收一个完整响应帧 */
    std::vector<uint8_t> transact(const std::vector<uint8_t>& request,
                                  const SocketTransport::FrameLengthFn& frameLength) {
        if (!transport_ || !transport_->isOpen()) {
            throw NetworkError("connection not open");
        }
        transport_->discardPending();
        transport_->send(request);
        return transport_->receiveFrame(frameLength);
    }

    void closeSession() {
        sessionOpen_ = false;
        if (transport_) transport_->close();
    }

    /** 字符串读数 → 数值，失败记录告警 */
    std::optional<double> coerceString(const std::string& text, const AddressConfig& cfg) const {
        auto number = ValueCodec::stringToNumber(text);
        if (!number) {
            LOG_WARN << logTag() << " String value '" << text << "' at " << device_.name
                     << " address " << cfg.address << " is not numeric";
        }
        return number;
    }

private:
    int connectTimeoutMs_;
    int receiveTimeoutMs_;
    bool sessionOpen_ = false;
};
