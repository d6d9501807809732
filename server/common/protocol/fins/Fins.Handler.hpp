#pragma once

#include "Fins.Types.hpp"
#include "Fins.Utils.hpp"

#include "common/protocol/TcpProtocolHandler.hpp"
#include "common/protocol/ValueCodec.hpp"

#include <thread>

namespace fins {

/**
 * @brief 欧姆龙 Fins/TCP 协议处理器
 *
 * 连接后先完成节点地址握手，之后以 0101 / 0102 命令读写存储区。
 * 32 位数值按设备级字节序解码（默认 CDAB）；字符串按字内低字节在前存放。
 * 读取失败最多重试 2 次，全部失败后上报通讯错误。
 */
class FinsHandler : public TcpProtocolHandler {
public:
    FinsHandler(Device device, int connectTimeoutMs, int receiveTimeoutMs)
        : TcpProtocolHandler(std::move(device), connectTimeoutMs, receiveTimeoutMs) {}

    std::string protocolName() const override { return Constants::PROTOCOL_OMRON_FINS; }

    const FinsSession& session() const { return session_; }

protected:
    const char* logTag() const override { return "[Fins]"; }

    void openSession() override {
        transport_->send(FinsUtils::buildNodeAddressRequest());
        auto response = transport_->receiveFrame(&FinsUtils::frameLength);
        session_ = FinsUtils::parseNodeAddressResponse(response);
        LOG_DEBUG << "[Fins] Node handshake " << device_.name
                  << ": client=" << static_cast<int>(session_.clientNode)
                  << " server=" << static_cast<int>(session_.serverNode);
    }

    /**
     * @brief 带重试的单地址读取
     *
     * 重试延迟 0.1s、0.2s；网络错误时先重建会话再重试。
     */
    std::optional<double> readValue(const AddressConfig& cfg) override {
        auto addr = FinsUtils::parseAddress(cfg.address);

        for (int attempt = 0; ; ++attempt) {
            try {
                return readOnce(addr, cfg);
            } catch (const NetworkError& e) {
                if (attempt < Constants::FINS_MAX_RETRIES) {
                    waitBeforeRetry(attempt);
                    reopenQuietly();
                    continue;
                }
                LOG_ERROR << "[Fins] Network failure " << device_.name << " (address " << cfg.address
                          << ", type " << valueTypeToString(cfg.type) << "): " << e.what();
                reportError("network_error", e.what(), "high", cfg.address);
                throw;
            } catch (const ProtocolDataError& e) {
                if (attempt < Constants::FINS_MAX_RETRIES) {
                    waitBeforeRetry(attempt);
                    continue;
                }
                reportError("read_failed", e.what(), "medium", cfg.address);
                throw;
            }
        }
    }

    bool writeValue(const std::string& address, double value, std::optional<int>) override {
        auto addr = FinsUtils::parseAddress(address);

        std::vector<uint8_t> data;
        if (addr.bit) {
            data.push_back(value != 0.0 ? 0x01 : 0x00);
        } else {
            auto type = value < 0 ? ValueType::Int16 : ValueType::UInt16;
            data = ValueCodec::encode(std::trunc(value), type, ByteOrder::Big);
        }

        auto sid = nextSid();
        auto frame = transact(FinsUtils::buildWriteRequest(session_, addr, 1, data), &FinsUtils::frameLength);
        FinsUtils::parseResponse(frame, sid, CommandCodes::MEMORY_AREA_WRITE);
        return true;
    }

private:
    FinsSession session_;

    uint8_t nextSid() {
        session_.sid = static_cast<uint8_t>(session_.sid + 1);
        return session_.sid;
    }

    std::optional<double> readOnce(const FinsAddress& addr, const AddressConfig& cfg) {
        // 位地址：按位读取 1 位
        if (addr.bit) {
            auto data = readArea(addr, 1);
            if (data.empty()) throw ProtocolDataError("Fins 位读取应答为空");
            return data[0] != 0 ? 1.0 : 0.0;
        }

        uint16_t words = valueTypeWordCount(cfg.type, cfg.stringLength);
        auto data = readArea(addr, words);
        if (data.size() < static_cast<size_t>(words) * 2) {
            throw ProtocolDataError("Fins 应答数据长度不足");
        }

        if (cfg.type == ValueType::String) {
            FinsUtils::swapBytesInWords(data);
            return coerceString(ValueCodec::decodeString(data.data(), data.size()), cfg);
        }

        ByteOrder order = cfg.wordSwap ? applyWordSwap(device_.byteOrder) : device_.byteOrder;
        return ValueCodec::decode(data.data(), data.size(), cfg.type, order);
    }

    std::vector<uint8_t> readArea(const FinsAddress& addr, uint16_t count) {
        auto sid = nextSid();
        auto frame = transact(FinsUtils::buildReadRequest(session_, addr, count), &FinsUtils::frameLength);
        return FinsUtils::parseResponse(frame, sid, CommandCodes::MEMORY_AREA_READ);
    }

    static void waitBeforeRetry(int attempt) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100 * (attempt + 1)));
    }

    /** 重建 TCP 连接与节点握手，失败留给下一次尝试报告 */
    void reopenQuietly() {
        try {
            transport_->open();
            openSession();
        } catch (const std::exception& e) {
            LOG_DEBUG << "[Fins] Reconnect before retry failed for " << device_.name << ": " << e.what();
        }
    }
};

}  // namespace fins
