#pragma once

#include "S7.Types.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/StringUtils.hpp"

#include <regex>
#include <vector>

namespace s7 {

/**
 * @brief S7comm 工具类
 * 地址解析、ISO-on-TCP 建链帧、读写变量帧的构建与解析
 */
class S7Utils {
public:
    static constexpr size_t FRAME_CORRUPT = SIZE_MAX;

    // ==================== 地址解析 ====================

    /**
     * @brief 解析 S7 地址
     *
     *   DB1.DBX0.1 / DB1.DBB2 / DB1.DBW4 / DB1.DBD8
     *   M10 / MB10 / MW10 / MD10 / M10.1
     *   I0.0 / IB0 / IW2 / ID4，Q 区同理
     *
     * @throws ConfigurationError 地址格式非法
     */
    static S7Address parseAddress(const std::string& address) {
        static const std::regex dbPattern(R"(^DB(\d+)\.DB([XBWD])(\d+)(?:\.(\d+))?$)");
        static const std::regex areaPattern(R"(^([MIQ])([XBWD]?)(\d+)(?:\.(\d+))?$)");

        auto addr = StringUtils::toUpper(StringUtils::trim(address));
        std::smatch m;
        S7Address result;
        std::string sizeLetter;

        if (std::regex_match(addr, m, dbPattern)) {
            result.area = Area::DataBlock;
            result.dbNumber = static_cast<uint16_t>(toNumber(m[1].str(), 0xFFFF, address));
            sizeLetter = m[2].str();
        } else if (std::regex_match(addr, m, areaPattern)) {
            char area = m[1].str()[0];
            result.area = area == 'M' ? Area::Merker : (area == 'I' ? Area::Inputs : Area::Outputs);
            sizeLetter = m[2].str();
        } else {
            throw ConfigurationError("S7 地址格式错误: " + address);
        }

        result.byteOffset = static_cast<uint32_t>(toNumber(m[3].str(), 0xFFFF, address));
        bool hasBit = m[4].matched;

        if (sizeLetter == "X" || (sizeLetter.empty() && hasBit)) {
            if (!hasBit) {
                throw ConfigurationError("S7 位地址缺少位序号: " + address);
            }
            result.bit = static_cast<uint8_t>(toNumber(m[4].str(), 7, address));
            result.size = AccessSize::Bit;
            return result;
        }
        if (hasBit) {
            throw ConfigurationError("S7 字节/字地址不能带位序号: " + address);
        }

        if (sizeLetter == "B") result.size = AccessSize::Byte;
        else if (sizeLetter == "W") result.size = AccessSize::Word;
        else if (sizeLetter == "D") result.size = AccessSize::DWord;
        else result.size = AccessSize::Unspecified;
        return result;
    }

    // ==================== 建链帧 ====================

    /**
     * @brief COTP 连接请求（TPDU 1024，本地 TSAP 0x0100，远端 TSAP 0x01xx）
     */
    static std::vector<uint8_t> buildConnectionRequest(int rack = DEFAULT_RACK, int slot = DEFAULT_SLOT) {
        uint16_t remoteTsap = static_cast<uint16_t>(0x0100 | ((rack * 32 + slot) & 0xFF));
        std::vector<uint8_t> cotp = {
            0x11, PduTypes::COTP_CONNECTION_REQUEST,
            0x00, 0x00,             // 目标引用
            0x00, 0x01,             // 源引用
            0x00,                   // 类别
            0xC0, 0x01, 0x0A,       // TPDU 大小 1024
            0xC1, 0x02, static_cast<uint8_t>(LOCAL_TSAP >> 8), static_cast<uint8_t>(LOCAL_TSAP & 0xFF),
            0xC2, 0x02, static_cast<uint8_t>(remoteTsap >> 8), static_cast<uint8_t>(remoteTsap & 0xFF)
        };
        return wrapTpkt(cotp);
    }

    /**
     * @brief S7 通讯设置（协商 PDU 长度）
     */
    static std::vector<uint8_t> buildSetupCommunication(uint16_t pduRef, uint16_t pduSize = REQUESTED_PDU_SIZE) {
        std::vector<uint8_t> params = {
            Functions::SETUP_COMMUNICATION, 0x00,
            0x00, 0x01,             // 最大并发（主叫）
            0x00, 0x01,             // 最大并发（被叫）
            static_cast<uint8_t>(pduSize >> 8), static_cast<uint8_t>(pduSize & 0xFF)
        };
        return wrapJob(pduRef, params, {});
    }

    // ==================== 读写帧 ====================

    /**
     * @brief 读变量请求
     * @param byteCount 读取字节数（位地址忽略，固定读 1 位）
     */
    static std::vector<uint8_t> buildReadRequest(uint16_t pduRef, const S7Address& addr, uint16_t byteCount) {
        std::vector<uint8_t> params = {Functions::READ_VAR, 0x01};
        appendItem(params, addr, addr.isBit() ? 1 : byteCount);
        return wrapJob(pduRef, params, {});
    }

    /**
     * @brief 写变量请求
     * @param data 位地址为 1 字节（0/1），其余为大端字节
     */
    static std::vector<uint8_t> buildWriteRequest(uint16_t pduRef, const S7Address& addr,
                                                  const std::vector<uint8_t>& data) {
        std::vector<uint8_t> params = {Functions::WRITE_VAR, 0x01};
        appendItem(params, addr, addr.isBit() ? 1 : static_cast<uint16_t>(data.size()));

        uint16_t bitLength = addr.isBit() ? 1 : static_cast<uint16_t>(data.size() * 8);
        std::vector<uint8_t> payload = {
            0x00,
            addr.isBit() ? DataTransportSizes::BIT : DataTransportSizes::BYTE_WORD_DWORD,
            static_cast<uint8_t>(bitLength >> 8), static_cast<uint8_t>(bitLength & 0xFF)
        };
        payload.insert(payload.end(), data.begin(), data.end());
        return wrapJob(pduRef, params, payload);
    }

    // ==================== 帧解析 ====================

    /**
     * @brief 根据 TPKT 头计算帧长度
     * @return 0 = 数据不足，FRAME_CORRUPT = 版本或长度非法
     */
    static size_t frameLength(const std::vector<uint8_t>& buffer) {
        if (buffer.empty()) return 0;
        if (buffer[0] != 0x03) return FRAME_CORRUPT;
        if (buffer.size() < TPKT_HEADER_SIZE) return 0;
        size_t length = (static_cast<size_t>(buffer[2]) << 8) | buffer[3];
        if (length < TPKT_HEADER_SIZE + 3) return FRAME_CORRUPT;
        return length;
    }

    /** @throws ProtocolDataError 非连接确认帧 */
    static void parseConnectionConfirm(const std::vector<uint8_t>& frame) {
        if (frame.size() < TPKT_HEADER_SIZE + 2 || frame[5] != PduTypes::COTP_CONNECTION_CONFIRM) {
            throw ProtocolDataError("S7 COTP 连接被拒绝");
        }
    }

    /**
     * @brief 解析通讯设置应答
     * @return 协商后的 PDU 长度
     */
    static uint16_t parseSetupResponse(const std::vector<uint8_t>& frame) {
        checkAckHeader(frame);
        size_t p = RESPONSE_PARAM_OFFSET;
        if (frame.size() < p + 8 || frame[p] != Functions::SETUP_COMMUNICATION) {
            throw ProtocolDataError("S7 通讯设置应答格式错误");
        }
        return static_cast<uint16_t>((frame[p + 6] << 8) | frame[p + 7]);
    }

    /**
     * @brief 解析读变量应答，返回数据字节
     * @throws ProtocolDataError 头部错误 / 返回码非成功 / 长度不足
     */
    static std::vector<uint8_t> parseReadResponse(const std::vector<uint8_t>& frame) {
        size_t d = checkAckHeader(frame, Functions::READ_VAR);
        if (frame.size() < d + 4) {
            throw ProtocolDataError("S7 读应答数据段长度不足");
        }

        uint8_t returnCode = frame[d];
        if (returnCode != RETURN_CODE_SUCCESS) {
            throw ProtocolDataError("S7 读取失败: " + returnCodeToString(returnCode));
        }

        uint8_t transport = frame[d + 1];
        size_t length = (static_cast<size_t>(frame[d + 2]) << 8) | frame[d + 3];
        if (transport == DataTransportSizes::BYTE_WORD_DWORD) {
            length /= 8;
        } else if (transport == DataTransportSizes::BIT) {
            length = (length + 7) / 8;
        }

        if (frame.size() < d + 4 + length) {
            throw ProtocolDataError("S7 读应答数据不完整");
        }
        return std::vector<uint8_t>(frame.begin() + static_cast<long>(d + 4),
                                    frame.begin() + static_cast<long>(d + 4 + length));
    }

    /** @throws ProtocolDataError 写入被拒绝 */
    static void parseWriteResponse(const std::vector<uint8_t>& frame) {
        size_t d = checkAckHeader(frame, Functions::WRITE_VAR);
        if (frame.size() < d + 1) {
            throw ProtocolDataError("S7 写应答数据段长度不足");
        }
        if (frame[d] != RETURN_CODE_SUCCESS) {
            throw ProtocolDataError("S7 写入失败: " + returnCodeToString(frame[d]));
        }
    }

private:
    static long toNumber(const std::string& text, long max, const std::string& address) {
        auto n = StringUtils::parseInt(text);
        if (!n || *n < 0 || *n > max) {
            throw ConfigurationError("S7 地址超出范围: " + address);
        }
        return *n;
    }

    static std::vector<uint8_t> wrapTpkt(const std::vector<uint8_t>& payload) {
        uint16_t length = static_cast<uint16_t>(TPKT_HEADER_SIZE + payload.size());
        std::vector<uint8_t> frame = {
            0x03, 0x00, static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length & 0xFF)
        };
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }

    /** COTP DT + S7 Job 头 + 参数 + 数据 */
    static std::vector<uint8_t> wrapJob(uint16_t pduRef, const std::vector<uint8_t>& params,
                                        const std::vector<uint8_t>& data) {
        std::vector<uint8_t> body = {0x02, PduTypes::COTP_DATA, 0x80};
        std::vector<uint8_t> header = {
            0x32, MessageTypes::JOB, 0x00, 0x00,
            static_cast<uint8_t>(pduRef >> 8), static_cast<uint8_t>(pduRef & 0xFF),
            static_cast<uint8_t>(params.size() >> 8), static_cast<uint8_t>(params.size() & 0xFF),
            static_cast<uint8_t>(data.size() >> 8), static_cast<uint8_t>(data.size() & 0xFF)
        };
        body.insert(body.end(), header.begin(), header.end());
        body.insert(body.end(), params.begin(), params.end());
        body.insert(body.end(), data.begin(), data.end());
        return wrapTpkt(body);
    }

    /** 变量规格项：12 0A 10 TS Count(2) DB(2) Area Addr(3) */
    static void appendItem(std::vector<uint8_t>& out, const S7Address& addr, uint16_t count) {
        uint32_t bitAddress = addr.byteOffset * 8 + (addr.isBit() ? addr.bit : 0);
        out.insert(out.end(), {
            0x12, 0x0A, 0x10,
            addr.isBit() ? TransportSizes::BIT : TransportSizes::BYTE,
            static_cast<uint8_t>(count >> 8), static_cast<uint8_t>(count & 0xFF),
            static_cast<uint8_t>(addr.dbNumber >> 8), static_cast<uint8_t>(addr.dbNumber & 0xFF),
            static_cast<uint8_t>(addr.area),
            static_cast<uint8_t>((bitAddress >> 16) & 0xFF),
            static_cast<uint8_t>((bitAddress >> 8) & 0xFF),
            static_cast<uint8_t>(bitAddress & 0xFF)
        });
    }

    /**
     * @brief 校验 Ack-Data 头与错误类
     * @return 数据段起始偏移
     */
    static size_t checkAckHeader(const std::vector<uint8_t>& frame, std::optional<uint8_t> function = std::nullopt) {
        size_t s = TPKT_HEADER_SIZE + COTP_DT_SIZE;
        if (frame.size() < RESPONSE_PARAM_OFFSET || frame[5] != PduTypes::COTP_DATA || frame[s] != 0x32) {
            throw ProtocolDataError("S7 应答帧头非法");
        }
        if (frame[s + 1] != MessageTypes::ACK_DATA) {
            throw ProtocolDataError("S7 应答类型非法: " + std::to_string(frame[s + 1]));
        }

        uint8_t errorClass = frame[s + 10];
        uint8_t errorCode = frame[s + 11];
        if (errorClass != 0 || errorCode != 0) {
            throw ProtocolDataError("S7 应答错误: class=" + std::to_string(errorClass)
                                    + " code=" + std::to_string(errorCode));
        }

        size_t paramLength = (static_cast<size_t>(frame[s + 6]) << 8) | frame[s + 7];
        if (function && (frame.size() <= RESPONSE_PARAM_OFFSET || frame[RESPONSE_PARAM_OFFSET] != *function)) {
            throw ProtocolDataError("S7 应答功能码不匹配");
        }
        return RESPONSE_PARAM_OFFSET + paramLength;
    }
};

}  // namespace s7
