#pragma once

#include "Fins.Types.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/StringUtils.hpp"

#include <vector>

namespace fins {

/**
 * @brief FINS/TCP 工具类
 * 地址解析、节点握手帧、存储区读写帧的构建与解析
 */
class FinsUtils {
public:
    static constexpr size_t FRAME_CORRUPT = SIZE_MAX;

    // ==================== 地址解析 ====================

    /**
     * @brief 解析存储区地址
     *
     *   D100 / DM100 → DM 区 100 字
     *   CIO10 / 10   → CIO 区 10 字
     *   W5 / H3 / A1 → WR / HR / AR 区
     *   D100.05      → DM 区 100 字第 5 位
     *
     * @throws ConfigurationError 地址格式非法
     */
    static FinsAddress parseAddress(const std::string& address) {
        auto addr = StringUtils::toUpper(StringUtils::trim(address));
        if (addr.empty()) {
            throw ConfigurationError("Fins 地址不能为空");
        }

        FinsAddress result;
        size_t pos = 0;
        if (addr.starts_with("CIO")) {
            result.area = Area::CIO;
            pos = 3;
        } else if (addr.starts_with("DM")) {
            result.area = Area::DM;
            pos = 2;
        } else if (std::isdigit(static_cast<unsigned char>(addr[0]))) {
            result.area = Area::CIO;
        } else {
            switch (addr[0]) {
                case 'D': result.area = Area::DM; break;
                case 'W': result.area = Area::WR; break;
                case 'H': result.area = Area::HR; break;
                case 'A': result.area = Area::AR; break;
                default:
                    throw ConfigurationError("不支持的 Fins 存储区: " + address);
            }
            pos = 1;
        }

        auto rest = addr.substr(pos);
        auto dot = rest.find('.');
        auto word = StringUtils::parseInt(rest.substr(0, dot));
        if (!word || *word < 0 || *word > 0xFFFF) {
            throw ConfigurationError("Fins 地址格式错误: " + address);
        }
        result.word = static_cast<uint16_t>(*word);

        if (dot != std::string::npos) {
            auto bit = StringUtils::parseInt(rest.substr(dot + 1));
            if (!bit || *bit < 0 || *bit > 15) {
                throw ConfigurationError("Fins 位地址必须在0-15之间: " + address);
            }
            result.bit = static_cast<uint8_t>(*bit);
        }
        return result;
    }

    // ==================== 帧构建 ====================

    /**
     * @brief 节点地址请求：FINS + Length(12) + Cmd(0) + Err(0) + ClientNode(4)
     * @param clientNode 0 表示由 PLC 自动分配
     */
    static std::vector<uint8_t> buildNodeAddressRequest(uint8_t clientNode = 0) {
        std::vector<uint8_t> frame;
        appendTcpHeader(frame, 12, TcpCommands::NODE_ADDRESS_REQUEST);
        appendU32(frame, clientNode);
        return frame;
    }

    /**
     * @brief 存储区读取（0101）
     * @param count 字访问时为字数，位访问时为位数
     */
    static std::vector<uint8_t> buildReadRequest(const FinsSession& session, const FinsAddress& addr,
                                                 uint16_t count) {
        std::vector<uint8_t> body = finsHeader(session);
        body.push_back(CommandCodes::MEMORY_AREA_MRC);
        body.push_back(CommandCodes::MEMORY_AREA_READ);
        appendAreaAddress(body, addr, count);
        return wrapFrame(body);
    }

    /**
     * @brief 存储区写入（0102）
     * @param data 字访问时每字 2 字节大端，位访问时每位 1 字节
     */
    static std::vector<uint8_t> buildWriteRequest(const FinsSession& session, const FinsAddress& addr,
                                                  uint16_t count, const std::vector<uint8_t>& data) {
        std::vector<uint8_t> body = finsHeader(session);
        body.push_back(CommandCodes::MEMORY_AREA_MRC);
        body.push_back(CommandCodes::MEMORY_AREA_WRITE);
        appendAreaAddress(body, addr, count);
        body.insert(body.end(), data.begin(), data.end());
        return wrapFrame(body);
    }

    // ==================== 帧解析 ====================

    /**
     * @brief 计算 FINS/TCP 帧总长度
     * @return 0 = 数据不足，FRAME_CORRUPT = 魔数或长度非法
     */
    static size_t frameLength(const std::vector<uint8_t>& buffer) {
        size_t check = std::min<size_t>(buffer.size(), 4);
        if (!std::equal(buffer.begin(), buffer.begin() + static_cast<long>(check), MAGIC)) {
            return FRAME_CORRUPT;
        }
        if (buffer.size() < 8) return 0;

        uint32_t length = readU32(buffer, 4);
        if (length < 8 || length > MAX_FRAME_LENGTH) return FRAME_CORRUPT;
        return 8 + static_cast<size_t>(length);
    }

    /**
     * @brief 解析节点地址应答
     * @throws ProtocolDataError
     */
    static FinsSession parseNodeAddressResponse(const std::vector<uint8_t>& frame) {
        checkTcpHeader(frame, TcpCommands::NODE_ADDRESS_RESPONSE);
        if (frame.size() < TCP_HEADER_SIZE + 8) {
            throw ProtocolDataError("Fins 节点握手应答长度不足");
        }
        FinsSession session;
        session.clientNode = static_cast<uint8_t>(readU32(frame, 16) & 0xFF);
        session.serverNode = static_cast<uint8_t>(readU32(frame, 20) & 0xFF);
        return session;
    }

    /**
     * @brief 解析存储区读写应答，返回结束码之后的数据
     * @throws ProtocolDataError FINS/TCP 错误码、SID 不匹配、结束码非零
     */
    static std::vector<uint8_t> parseResponse(const std::vector<uint8_t>& frame, uint8_t expectedSid,
                                              uint8_t expectedSrc) {
        checkTcpHeader(frame, TcpCommands::FRAME_SEND);

        size_t base = TCP_HEADER_SIZE;
        if (frame.size() < base + FINS_HEADER_SIZE + 4) {
            throw ProtocolDataError("Fins 应答长度不足");
        }
        uint8_t sid = frame[base + 9];
        if (sid != expectedSid) {
            throw ProtocolDataError("Fins SID 不匹配: 期望 " + std::to_string(expectedSid)
                                    + "，实际 " + std::to_string(sid));
        }

        uint8_t mrc = frame[base + 10];
        uint8_t src = frame[base + 11];
        if (mrc != CommandCodes::MEMORY_AREA_MRC || src != expectedSrc) {
            throw ProtocolDataError("Fins 应答命令码不匹配");
        }

        uint8_t mres = frame[base + 12];
        uint8_t sres = frame[base + 13];
        if ((mres & 0x7F) != 0 || (sres & 0x3F) != 0) {
            throw ProtocolDataError("Fins 结束码异常: " + endCodeToString(mres, sres));
        }
        return std::vector<uint8_t>(frame.begin() + static_cast<long>(base + 14), frame.end());
    }

    // ==================== 字节工具 ====================

    static uint32_t readU32(const std::vector<uint8_t>& buf, size_t offset) {
        return (static_cast<uint32_t>(buf[offset]) << 24) |
               (static_cast<uint32_t>(buf[offset + 1]) << 16) |
               (static_cast<uint32_t>(buf[offset + 2]) << 8) |
               static_cast<uint32_t>(buf[offset + 3]);
    }

    /** 字内字节交换（欧姆龙字符串按字低字节在前存放） */
    static void swapBytesInWords(std::vector<uint8_t>& data) {
        for (size_t i = 0; i + 1 < data.size(); i += 2) {
            std::swap(data[i], data[i + 1]);
        }
    }

private:
    static void appendU32(std::vector<uint8_t>& out, uint32_t v) {
        out.push_back(static_cast<uint8_t>(v >> 24));
        out.push_back(static_cast<uint8_t>(v >> 16));
        out.push_back(static_cast<uint8_t>(v >> 8));
        out.push_back(static_cast<uint8_t>(v));
    }

    /** Length 字段为 Command 起之后的字节数 */
    static void appendTcpHeader(std::vector<uint8_t>& out, uint32_t length, uint32_t command) {
        out.insert(out.end(), MAGIC, MAGIC + 4);
        appendU32(out, length);
        appendU32(out, command);
        appendU32(out, 0);
    }

    static std::vector<uint8_t> finsHeader(const FinsSession& session) {
        return {
            0x80,                 // ICF: 命令，需要应答
            0x00,                 // RSV
            0x02,                 // GCT
            0x00,                 // DNA: 本地网络
            session.serverNode,   // DA1
            0x00,                 // DA2: CPU 单元
            0x00,                 // SNA
            session.clientNode,   // SA1
            0x00,                 // SA2
            session.sid           // SID
        };
    }

    static void appendAreaAddress(std::vector<uint8_t>& out, const FinsAddress& addr, uint16_t count) {
        out.push_back(areaCode(addr.area, addr.bit.has_value()));
        out.push_back(static_cast<uint8_t>(addr.word >> 8));
        out.push_back(static_cast<uint8_t>(addr.word & 0xFF));
        out.push_back(addr.bit.value_or(0));
        out.push_back(static_cast<uint8_t>(count >> 8));
        out.push_back(static_cast<uint8_t>(count & 0xFF));
    }

    static std::vector<uint8_t> wrapFrame(const std::vector<uint8_t>& body) {
        std::vector<uint8_t> frame;
        frame.reserve(TCP_HEADER_SIZE + body.size());
        appendTcpHeader(frame, static_cast<uint32_t>(8 + body.size()), TcpCommands::FRAME_SEND);
        frame.insert(frame.end(), body.begin(), body.end());
        return frame;
    }

    static void checkTcpHeader(const std::vector<uint8_t>& frame, uint32_t expectedCommand) {
        if (frame.size() < TCP_HEADER_SIZE || !std::equal(MAGIC, MAGIC + 4, frame.begin())) {
            throw ProtocolDataError("Fins/TCP 帧头非法");
        }
        uint32_t command = readU32(frame, 8);
        uint32_t error = readU32(frame, 12);
        if (error != 0) {
            throw ProtocolDataError("Fins/TCP 错误码: " + std::to_string(error));
        }
        if (command != expectedCommand) {
            throw ProtocolDataError("Fins/TCP 命令不匹配: " + std::to_string(command));
        }
    }
};

}  // namespace fins
