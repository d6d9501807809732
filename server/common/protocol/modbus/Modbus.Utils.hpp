#pragma once

#include "Modbus.Types.hpp"
#include "common/utils/AppException.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <iomanip>

namespace modbus {

/**
 * @brief Modbus 工具类
 * CRC16 计算、PDU 构建、TCP/RTU 帧封装与解析、地址解析
 */
class ModbusUtils {
public:
    /** 帧校验失败标记（CRC 不匹配或帧格式异常） */
    static constexpr size_t FRAME_CORRUPT = SIZE_MAX;

    // ==================== CRC16 (Modbus RTU) ====================

    static uint16_t crc16(const uint8_t* data, size_t len) {
        uint16_t crc = 0xFFFF;
        for (size_t i = 0; i < len; ++i) {
            crc ^= data[i];
            for (int j = 0; j < 8; ++j) {
                if (crc & 0x0001) {
                    crc = (crc >> 1) ^ 0xA001;
                } else {
                    crc >>= 1;
                }
            }
        }
        return crc;
    }

    static uint16_t crc16(const std::vector<uint8_t>& data) {
        return crc16(data.data(), data.size());
    }

    // ==================== PDU 构建 ====================

    /**
     * @brief 读请求 PDU: [FC(1)][StartAddr(2)][Quantity(2)]
     */
    static std::vector<uint8_t> buildReadPdu(uint8_t functionCode, uint16_t startAddress, uint16_t quantity) {
        return {
            functionCode,
            static_cast<uint8_t>(startAddress >> 8), static_cast<uint8_t>(startAddress & 0xFF),
            static_cast<uint8_t>(quantity >> 8), static_cast<uint8_t>(quantity & 0xFF)
        };
    }

    /**
     * @brief 写请求 PDU
     * FC05: [FC][Addr(2)][0xFF00 | 0x0000]
     * FC06: [FC][Addr(2)][Value(2)]
     * FC10: [FC][Addr(2)][Qty(2)][ByteCount(1)][Data...]
     */
    static std::vector<uint8_t> buildWritePdu(const ModbusWriteRequest& req) {
        std::vector<uint8_t> pdu = {
            req.functionCode,
            static_cast<uint8_t>(req.address >> 8), static_cast<uint8_t>(req.address & 0xFF)
        };

        if (req.functionCode == FuncCodes::WRITE_MULTIPLE_REGISTERS) {
            pdu.push_back(static_cast<uint8_t>(req.quantity >> 8));
            pdu.push_back(static_cast<uint8_t>(req.quantity & 0xFF));
            pdu.push_back(static_cast<uint8_t>(req.data.size()));
            pdu.insert(pdu.end(), req.data.begin(), req.data.end());
        } else if (req.functionCode == FuncCodes::WRITE_SINGLE_COIL) {
            bool on = std::any_of(req.data.begin(), req.data.end(), [](uint8_t b) { return b != 0; });
            pdu.push_back(on ? 0xFF : 0x00);
            pdu.push_back(0x00);
        } else {
            pdu.push_back(req.data.size() > 0 ? req.data[0] : 0);
            pdu.push_back(req.data.size() > 1 ? req.data[1] : 0);
        }
        return pdu;
    }

    // ==================== 帧封装 ====================

    /**
     * @brief MBAP 封装: [TransID(2)][ProtocolID(2)=0][Length(2)][UnitID(1)][PDU...]
     */
    static std::vector<uint8_t> wrapTcp(uint16_t transactionId, uint8_t unitId, const std::vector<uint8_t>& pdu) {
        uint16_t length = static_cast<uint16_t>(pdu.size() + 1);
        std::vector<uint8_t> frame = {
            static_cast<uint8_t>(transactionId >> 8), static_cast<uint8_t>(transactionId & 0xFF),
            0x00, 0x00,
            static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length & 0xFF),
            unitId
        };
        frame.insert(frame.end(), pdu.begin(), pdu.end());
        return frame;
    }

    /**
     * @brief RTU 封装: [SlaveAddr(1)][PDU...][CRC16 Lo][CRC16 Hi]
     */
    static std::vector<uint8_t> wrapRtu(uint8_t slaveId, const std::vector<uint8_t>& pdu) {
        std::vector<uint8_t> frame;
        frame.reserve(pdu.size() + 3);
        frame.push_back(slaveId);
        frame.insert(frame.end(), pdu.begin(), pdu.end());
        uint16_t crc = crc16(frame);
        frame.push_back(static_cast<uint8_t>(crc & 0xFF));
        frame.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF));
        return frame;
    }

    static std::vector<uint8_t> buildRequest(FrameMode mode, const ModbusRequest& req) {
        auto pdu = buildReadPdu(req.functionCode, req.startAddress, req.quantity);
        return mode == FrameMode::RTU ? wrapRtu(req.slaveId, pdu)
                                      : wrapTcp(req.transactionId, req.slaveId, pdu);
    }

    static std::vector<uint8_t> buildWriteRequest(FrameMode mode, const ModbusWriteRequest& req) {
        auto pdu = buildWritePdu(req);
        return mode == FrameMode::RTU ? wrapRtu(req.slaveId, pdu)
                                      : wrapTcp(req.transactionId, req.slaveId, pdu);
    }

    // ==================== 帧解析 ====================

    /**
     * @brief 解析 Modbus TCP 响应帧
     * @return 消耗的字节数（0 = 数据不足，FRAME_CORRUPT = 帧头非法）
     */
    static size_t parseTcpResponse(const std::vector<uint8_t>& buffer, ModbusResponse& out) {
        // MBAP Header(7) + FC(1)
        if (buffer.size() < 8) return 0;

        uint16_t protoId = (static_cast<uint16_t>(buffer[2]) << 8) | buffer[3];
        uint16_t length  = (static_cast<uint16_t>(buffer[4]) << 8) | buffer[5];

        // Length 包含 UnitID 之后的全部字节，最大 254
        if (protoId != 0 || length < 2 || length > 254) return FRAME_CORRUPT;

        size_t totalLen = 6 + length;
        if (buffer.size() < totalLen) return 0;

        out = ModbusResponse{};
        out.mode = FrameMode::TCP;
        out.transactionId = (static_cast<uint16_t>(buffer[0]) << 8) | buffer[1];
        out.slaveId = buffer[6];
        if (!decodePdu(buffer.data() + 7, totalLen - 7, out)) return FRAME_CORRUPT;
        return totalLen;
    }

    /**
     * @brief 解析 Modbus RTU 响应帧
     * @return 消耗的字节数（0 = 数据不足，FRAME_CORRUPT = CRC 或格式错误）
     */
    static size_t parseRtuResponse(const std::vector<uint8_t>& buffer, ModbusResponse& out) {
        if (buffer.size() < 2) return 0;

        size_t pduLen = expectedPduLength(buffer.data() + 1, buffer.size() - 1);
        if (pduLen == FRAME_CORRUPT) return FRAME_CORRUPT;
        if (pduLen == 0) return 0;

        size_t frameLen = 1 + pduLen + 2;
        if (buffer.size() < frameLen) return 0;

        uint16_t crcRecv = static_cast<uint16_t>(buffer[frameLen - 2])
                         | (static_cast<uint16_t>(buffer[frameLen - 1]) << 8);
        if (crcRecv != crc16(buffer.data(), frameLen - 2)) return FRAME_CORRUPT;

        out = ModbusResponse{};
        out.mode = FrameMode::RTU;
        out.slaveId = buffer[0];
        if (!decodePdu(buffer.data() + 1, pduLen, out)) return FRAME_CORRUPT;
        return frameLen;
    }

    static size_t parseResponse(FrameMode mode, const std::vector<uint8_t>& buffer, ModbusResponse& out) {
        return mode == FrameMode::RTU ? parseRtuResponse(buffer, out) : parseTcpResponse(buffer, out);
    }

    /** 从线圈/离散输入位数据中提取布尔值 */
    static bool extractBit(const uint8_t* data, uint16_t bitOffset, size_t dataSize) {
        uint16_t byteIdx = bitOffset / 8;
        if (byteIdx >= dataSize) return false;
        uint8_t bitIdx = bitOffset % 8;
        return (data[byteIdx] >> bitIdx) & 0x01;
    }

    // ==================== 地址解析 ====================

    /**
     * @brief 解析地址字符串为寄存器区 + 偏移
     *
     *   1-9999       → 线圈，偏移 = n - 1
     *   10001-19999  → 离散输入，偏移 = n - 10001
     *   30001-39999  → 输入寄存器，偏移 = n - 30001
     *   40001-49999  → 保持寄存器，偏移 = n - 40001
     *   "x=4;100"    → 强制功能码，偏移从 0 开始
     *   其余数字     → fallback 寄存器区，偏移 = n
     *
     * @throws ConfigurationError 地址格式非法
     */
    static ModbusAddress parseAddress(const std::string& address, RegisterType fallback) {
        auto addr = StringUtils::trim(address);

        if (addr.starts_with("x=") || addr.starts_with("X=")) {
            auto semi = addr.find(';');
            if (semi == std::string::npos) {
                throw ConfigurationError("Modbus 地址格式错误: " + address);
            }
            auto fc = StringUtils::parseInt(addr.substr(2, semi - 2));
            auto offset = StringUtils::parseInt(addr.substr(semi + 1));
            if (!fc || !offset || *offset < 0 || *offset > 0xFFFF) {
                throw ConfigurationError("Modbus 地址格式错误: " + address);
            }
            auto type = funcCodeToRegisterType(static_cast<int>(*fc));
            if (!type) {
                throw ConfigurationError("不支持的 Modbus 读功能码: " + std::to_string(*fc));
            }
            return {*type, static_cast<uint16_t>(*offset)};
        }

        auto n = StringUtils::parseInt(addr);
        if (!n || *n < 0) {
            throw ConfigurationError("Modbus 地址格式错误: " + address);
        }

        long v = *n;
        if (v >= 1 && v <= 9999) return {RegisterType::COIL, static_cast<uint16_t>(v - 1)};
        if (v >= 10001 && v <= 19999) return {RegisterType::DISCRETE_INPUT, static_cast<uint16_t>(v - 10001)};
        if (v >= 30001 && v <= 39999) return {RegisterType::INPUT_REGISTER, static_cast<uint16_t>(v - 30001)};
        if (v >= 40001 && v <= 49999) return {RegisterType::HOLDING_REGISTER, static_cast<uint16_t>(v - 40001)};

        if (v > 0xFFFF) {
            throw ConfigurationError("Modbus 地址超出范围: " + address);
        }
        return {fallback, static_cast<uint16_t>(v)};
    }

    // ==================== 工具函数 ====================

    static std::string toHexString(const std::vector<uint8_t>& data) {
        std::ostringstream oss;
        for (size_t i = 0; i < data.size(); ++i) {
            if (i > 0) oss << " ";
            oss << std::hex << std::uppercase << std::setw(2)
                << std::setfill('0') << static_cast<int>(data[i]);
        }
        return oss.str();
    }

private:
    static bool isWriteEcho(uint8_t fc) {
        return fc == FuncCodes::WRITE_SINGLE_COIL ||
               fc == FuncCodes::WRITE_SINGLE_REGISTER ||
               fc == FuncCodes::WRITE_MULTIPLE_REGISTERS;
    }

    /**
     * @brief 根据功能码推算响应 PDU 长度（RTU 无长度字段）
     * @return 0 = 数据不足，FRAME_CORRUPT = 格式非法
     */
    static size_t expectedPduLength(const uint8_t* pdu, size_t available) {
        if (available < 1) return 0;
        uint8_t fc = pdu[0];

        if (fc & 0x80) return 2;           // FC|0x80 + ExceptionCode
        if (isWriteEcho(fc)) return 5;     // FC + Addr(2) + Value/Qty(2)

        if (fc < FuncCodes::READ_COILS || fc > FuncCodes::READ_INPUT_REGISTERS) return FRAME_CORRUPT;
        if (available < 2) return 0;
        uint8_t byteCount = pdu[1];
        if (byteCount == 0 || byteCount > 250) return FRAME_CORRUPT;
        return 2 + static_cast<size_t>(byteCount);
    }

    /**
     * @brief 解码响应 PDU 到 out（mode / slaveId / transactionId 由调用方填写）
     */
    static bool decodePdu(const uint8_t* pdu, size_t len, ModbusResponse& out) {
        if (len < 1) return false;
        uint8_t fc = pdu[0];

        if (fc & 0x80) {
            out.isException = true;
            out.functionCode = fc & 0x7F;
            out.exceptionCode = len > 1 ? pdu[1] : 0;
            return true;
        }

        out.functionCode = fc;
        if (isWriteEcho(fc)) {
            if (len < 5) return false;
            out.data.assign(pdu + 1, pdu + 5);
            return true;
        }

        if (len < 2) return false;
        uint8_t byteCount = pdu[1];
        if (len < 2 + static_cast<size_t>(byteCount)) return false;
        out.data.assign(pdu + 2, pdu + 2 + byteCount);
        return true;
    }
};

}  // namespace modbus
