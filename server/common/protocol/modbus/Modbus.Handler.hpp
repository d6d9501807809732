#pragma once

#include "Modbus.Types.hpp"
#include "Modbus.Utils.hpp"

#include "common/protocol/TcpProtocolHandler.hpp"
#include "common/protocol/ValueCodec.hpp"

#include <thread>

namespace modbus {

/**
 * @brief Modbus 协议处理器（Modbus TCP / RTU / RTU over TCP）
 *
 * 帧模式由 plcType 决定：包含 "rtu" 时使用 RTU 帧（CRC16）经 TCP 透传，
 * 否则使用 MBAP 帧。请求-应答严格串行，由 DeviceConnection 保证。
 *
 * 站号优先级：地址级 stationId > 设备默认站号（加载时已按协议串后缀解析）
 */
class ModbusHandler : public TcpProtocolHandler {
public:
    ModbusHandler(Device device, int connectTimeoutMs, int receiveTimeoutMs)
        : TcpProtocolHandler(std::move(device), connectTimeoutMs, receiveTimeoutMs),
          mode_(parseFrameMode(device_.plcType)),
          stationId_(device_.stationId),
          currentStation_(stationId_) {}

    std::string protocolName() const override {
        if (device_.isRtuOverTcp()) return Constants::PROTOCOL_MODBUS_RTU_OVER_TCP;
        return mode_ == FrameMode::RTU ? Constants::PROTOCOL_MODBUS_RTU : Constants::PROTOCOL_MODBUS_TCP;
    }

    FrameMode frameMode() const { return mode_; }
    int stationId() const { return stationId_; }

    // ==================== 扩展写操作 ====================

    /**
     * @brief 广播写（站号 0，所有从站执行，不等待应答）
     */
    bool broadcastWrite(const std::string& address, double value) {
        validateWrite(address, value);
        return guardedWrite([&] {
            auto req = buildWrite(StringUtils::trim(address), value, BROADCAST_STATION);
            transport_->send(ModbusUtils::buildWriteRequest(mode_, req));
            LOG_INFO << "[Modbus] Broadcast write " << device_.name << " " << address << " = " << value;
            return true;
        });
    }

    /**
     * @brief 写保持寄存器中的单个位（读-改-写）
     * @param bit 0-15
     */
    bool writeBitInRegister(const std::string& address, int bit, bool on,
                            std::optional<int> stationId = std::nullopt) {
        validateWrite(address, on ? 1.0 : 0.0);
        if (bit < 0 || bit > 15) {
            throw ConfigurationError("寄存器位序号必须在0-15之间: " + std::to_string(bit));
        }

        auto addr = ModbusUtils::parseAddress(address, RegisterType::HOLDING_REGISTER);
        if (addr.registerType != RegisterType::HOLDING_REGISTER) {
            throw ConfigurationError("只能对保持寄存器执行位写入: " + address);
        }

        return guardedWrite([&] {
            uint8_t station = selectStation(stationId.value_or(stationId_));
            auto data = readArea(station, FuncCodes::READ_HOLDING_REGISTERS, addr.offset, 1);
            uint16_t current = static_cast<uint16_t>((data[0] << 8) | data[1]);
            uint16_t mask = static_cast<uint16_t>(1u << bit);
            uint16_t updated = on ? static_cast<uint16_t>(current | mask) : static_cast<uint16_t>(current & ~mask);

            ModbusWriteRequest req{station, FuncCodes::WRITE_SINGLE_REGISTER, addr.offset,
                                   {static_cast<uint8_t>(updated >> 8), static_cast<uint8_t>(updated & 0xFF)}};
            bool ok = sendWrite(req);
            if (ok) {
                LOG_INFO << "[Modbus] Write bit " << device_.name << " " << address << "." << bit << " = " << on;
            }
            return ok;
        });
    }

protected:
    const char* logTag() const override { return "[Modbus]"; }

    std::optional<double> readValue(const AddressConfig& cfg) override {
        auto addr = ModbusUtils::parseAddress(cfg.address, parseRegisterType(cfg.registerType));
        uint8_t station = selectStation(cfg.effectiveStation(stationId_));
        uint8_t fc = registerTypeToFuncCode(addr.registerType);

        // 线圈 / 离散输入按位读取
        if (isBitRegister(addr.registerType)) {
            auto data = readArea(station, fc, addr.offset, 1);
            return ModbusUtils::extractBit(data.data(), 0, data.size()) ? 1.0 : 0.0;
        }

        uint16_t words = valueTypeWordCount(cfg.type, cfg.stringLength);
        auto data = readArea(station, fc, addr.offset, words);

        if (cfg.type == ValueType::String) {
            auto text = ValueCodec::decodeString(data.data(), data.size());
            return coerceString(text, cfg);
        }

        ByteOrder order = cfg.wordSwap ? applyWordSwap(cfg.byteOrder) : cfg.byteOrder;
        return ValueCodec::decode(data.data(), data.size(), cfg.type, order);
    }

    bool writeValue(const std::string& address, double value, std::optional<int> stationId) override {
        uint8_t station = selectStation(stationId.value_or(stationId_));
        auto req = buildWrite(address, value, station);
        return sendWrite(req);
    }

private:
    FrameMode mode_;
    int stationId_;
    int currentStation_;
    uint16_t transactionId_ = 0;

    /**
     * @brief 切换目标站号（RTU over TCP 总线切换后等待 20ms）
     */
    uint8_t selectStation(int station) {
        if (station != currentStation_) {
            if (device_.isRtuOverTcp()) {
                LOG_DEBUG << "[Modbus] Switching " << device_.name << " to station " << station;
                std::this_thread::sleep_for(std::chrono::milliseconds(Constants::STATION_SWITCH_DELAY_MS));
            }
            currentStation_ = station;
        }
        return static_cast<uint8_t>(station);
    }

    /**
     * @brief 按地址区构建写请求（线圈 FC05，保持寄存器 FC06）
     * @throws ConfigurationError 只读地址
     */
    ModbusWriteRequest buildWrite(const std::string& address, double value, uint8_t station) const {
        auto addr = ModbusUtils::parseAddress(address, RegisterType::HOLDING_REGISTER);
        if (!isWritable(addr.registerType)) {
            throw ConfigurationError(registerTypeToString(addr.registerType) + " 地址 " + address + " 是只读的，无法写入");
        }

        if (addr.registerType == RegisterType::COIL) {
            return {station, FuncCodes::WRITE_SINGLE_COIL, addr.offset,
                    {static_cast<uint8_t>(value != 0.0 ? 1 : 0)}};
        }

        auto type = value < 0 ? ValueType::Int16 : ValueType::UInt16;
        return {station, FuncCodes::WRITE_SINGLE_REGISTER, addr.offset,
                ValueCodec::encode(std::trunc(value), type, ByteOrder::Big)};
    }

    bool sendWrite(ModbusWriteRequest req) {
        req.transactionId = ++transactionId_;
        auto response = exchange(ModbusUtils::buildWriteRequest(mode_, req), req.transactionId);

        if (response.isException) {
            throw ProtocolDataError("Modbus 写入异常: " + exceptionCodeToString(response.exceptionCode));
        }
        if (response.functionCode != req.functionCode) {
            throw ProtocolDataError("Modbus 写入应答功能码不匹配");
        }
        return true;
    }

    /**
     * @brief 读取一段连续地址，返回有效数据字节
     * @throws ProtocolDataError 异常应答 / 应答不匹配 / 数据不足
     */
    std::vector<uint8_t> readArea(uint8_t station, uint8_t fc, uint16_t offset, uint16_t quantity) {
        ModbusRequest req{station, fc, offset, quantity, ++transactionId_};
        auto response = exchange(ModbusUtils::buildRequest(mode_, req), req.transactionId);

        if (response.isException) {
            throw ProtocolDataError("Modbus 异常应答 (FC" + std::to_string(fc) + "): "
                                    + exceptionCodeToString(response.exceptionCode));
        }
        if (response.functionCode != fc) {
            throw ProtocolDataError("Modbus 应答功能码不匹配: 期望 " + std::to_string(fc)
                                    + "，实际 " + std::to_string(response.functionCode));
        }

        size_t expected = isBitRegister(funcCodeToRegisterType(fc).value_or(RegisterType::HOLDING_REGISTER))
            ? (quantity + 7u) / 8u : quantity * 2u;
        if (response.data.size() < expected) {
            throw ProtocolDataError("Modbus 应答数据长度不足: " + std::to_string(response.data.size())
                                    + " < " + std::to_string(expected));
        }
        return response.data;
    }

    ModbusResponse exchange(const std::vector<uint8_t>& frame, uint16_t transactionId) {
        LOG_TRACE << "[Modbus] TX " << device_.name << ": " << ModbusUtils::toHexString(frame);

        ModbusResponse response;
        transact(frame, [&](const std::vector<uint8_t>& buffer) {
            return ModbusUtils::parseResponse(mode_, buffer, response);
        });

        if (mode_ == FrameMode::TCP && response.transactionId != transactionId) {
            throw ProtocolDataError("Modbus 事务号不匹配: 期望 " + std::to_string(transactionId)
                                    + "，实际 " + std::to_string(response.transactionId));
        }
        return response;
    }
};

}  // namespace modbus
