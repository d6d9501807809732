#pragma once

#include "S7.Types.hpp"
#include "S7.Utils.hpp"

#include "common/protocol/TcpProtocolHandler.hpp"
#include "common/protocol/ValueCodec.hpp"

namespace s7 {

/**
 * @brief 西门子 S7 协议处理器（ISO-on-TCP，默认端口 102）
 *
 * 建链：COTP 连接请求（机架 0 / 槽位 1）→ S7 通讯设置协商 PDU 长度。
 * 读写使用 read-var / write-var，数值按大端解码。
 */
class S7Handler : public TcpProtocolHandler {
public:
    S7Handler(Device device, int connectTimeoutMs, int receiveTimeoutMs)
        : TcpProtocolHandler(std::move(device), connectTimeoutMs, receiveTimeoutMs) {}

    std::string protocolName() const override { return Constants::PROTOCOL_SIEMENS_S7; }

    uint16_t pduSize() const { return pduSize_; }

protected:
    const char* logTag() const override { return "[S7]"; }

    void openSession() override {
        transport_->send(S7Utils::buildConnectionRequest());
        S7Utils::parseConnectionConfirm(transport_->receiveFrame(&S7Utils::frameLength));

        transport_->send(S7Utils::buildSetupCommunication(nextRef()));
        pduSize_ = S7Utils::parseSetupResponse(transport_->receiveFrame(&S7Utils::frameLength));
        LOG_DEBUG << "[S7] Session established with " << device_.name << ", PDU size " << pduSize_;
    }

    std::optional<double> readValue(const AddressConfig& cfg) override {
        auto addr = S7Utils::parseAddress(cfg.address);

        if (addr.isBit()) {
            auto data = readVar(addr, 1);
            if (data.empty()) throw ProtocolDataError("S7 位读取应答为空");
            return (data[0] & 0x01) ? 1.0 : 0.0;
        }

        // 字节地址（DBB / MB）按无符号字节解释
        if (addr.size == AccessSize::Byte) {
            auto data = readVar(addr, 1);
            if (data.empty()) throw ProtocolDataError("S7 字节读取应答为空");
            if (cfg.type == ValueType::Bool) return data[0] != 0 ? 1.0 : 0.0;
            return static_cast<double>(data[0]);
        }

        if (cfg.type == ValueType::String) {
            auto length = static_cast<uint16_t>(std::max(cfg.stringLength, 1));
            auto data = readVar(addr, length);
            return coerceString(ValueCodec::decodeString(data.data(), data.size()), cfg);
        }

        uint16_t bytes = static_cast<uint16_t>(valueTypeWordCount(cfg.type) * 2);
        auto data = readVar(addr, bytes);
        if (data.size() < bytes) {
            throw ProtocolDataError("S7 应答数据长度不足");
        }
        return ValueCodec::decode(data.data(), data.size(), cfg.type, ByteOrder::Big);
    }

    bool writeValue(const std::string& address, double value, std::optional<int>) override {
        auto addr = S7Utils::parseAddress(address);

        std::vector<uint8_t> data;
        if (addr.isBit()) {
            data = {static_cast<uint8_t>(value != 0.0 ? 1 : 0)};
        } else if (addr.size == AccessSize::Byte) {
            data = {static_cast<uint8_t>(std::clamp(std::trunc(value), 0.0, 255.0))};
        } else if (addr.size == AccessSize::DWord) {
            data = ValueCodec::encode(std::trunc(value), ValueType::Int32, ByteOrder::Big);
        } else {
            auto type = value < 0 ? ValueType::Int16 : ValueType::UInt16;
            data = ValueCodec::encode(std::trunc(value), type, ByteOrder::Big);
        }

        auto frame = transact(S7Utils::buildWriteRequest(nextRef(), addr, data), &S7Utils::frameLength);
        S7Utils::parseWriteResponse(frame);
        return true;
    }

private:
    uint16_t pduRef_ = 0;
    uint16_t pduSize_ = REQUESTED_PDU_SIZE;

    uint16_t nextRef() { return ++pduRef_; }

    std::vector<uint8_t> readVar(const S7Address& addr, uint16_t byteCount) {
        auto frame = transact(S7Utils::buildReadRequest(nextRef(), addr, byteCount), &S7Utils::frameLength);
        return S7Utils::parseReadResponse(frame);
    }
};

}  // namespace s7
