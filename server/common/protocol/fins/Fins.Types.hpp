#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace fins {

// ==================== FINS/TCP 常量 ====================

/** FINS/TCP 帧头魔数 "FINS" */
inline constexpr uint8_t MAGIC[4] = {'F', 'I', 'N', 'S'};

/** FINS/TCP 帧头长度：Magic(4) + Length(4) + Command(4) + ErrorCode(4) */
inline constexpr size_t TCP_HEADER_SIZE = 16;

/** FINS 命令帧头长度：ICF RSV GCT DNA DA1 DA2 SNA SA1 SA2 SID */
inline constexpr size_t FINS_HEADER_SIZE = 10;

/** 单帧允许的最大长度（防御异常长度字段） */
inline constexpr uint32_t MAX_FRAME_LENGTH = 2048;

/** FINS/TCP 命令 */
struct TcpCommands {
    static constexpr uint32_t NODE_ADDRESS_REQUEST = 0x00000000;
    static constexpr uint32_t NODE_ADDRESS_RESPONSE = 0x00000001;
    static constexpr uint32_t FRAME_SEND = 0x00000002;
};

/** FINS 命令码（MRC/SRC） */
struct CommandCodes {
    static constexpr uint8_t MEMORY_AREA_MRC = 0x01;
    static constexpr uint8_t MEMORY_AREA_READ = 0x01;
    static constexpr uint8_t MEMORY_AREA_WRITE = 0x02;
};

// ==================== 存储区 ====================

enum class Area {
    CIO,    // 输入输出继电器区
    WR,     // 工作区 W
    HR,     // 保持区 H
    AR,     // 辅助区 A
    DM      // 数据存储区 D / DM
};

inline const char* areaToString(Area area) {
    switch (area) {
        case Area::CIO: return "CIO";
        case Area::WR: return "W";
        case Area::HR: return "H";
        case Area::AR: return "A";
        case Area::DM: return "D";
    }
    return "D";
}

/**
 * @brief 存储区代码（CS/CJ 系列）
 * @param bitAccess true 为位访问代码，false 为字访问代码
 */
inline uint8_t areaCode(Area area, bool bitAccess) {
    switch (area) {
        case Area::CIO: return bitAccess ? 0x30 : 0xB0;
        case Area::WR:  return bitAccess ? 0x31 : 0xB1;
        case Area::HR:  return bitAccess ? 0x32 : 0xB2;
        case Area::AR:  return bitAccess ? 0x33 : 0xB3;
        case Area::DM:  return bitAccess ? 0x02 : 0x82;
    }
    return 0x82;
}

// ==================== 结构体 ====================

/** 解析后的存储区地址，例如 D100.05 → {DM, 100, 5} */
struct FinsAddress {
    Area area = Area::DM;
    uint16_t word = 0;
    std::optional<uint8_t> bit;
};

/** 节点握手后确定的会话参数 */
struct FinsSession {
    uint8_t clientNode = 0;
    uint8_t serverNode = 0;
    uint8_t sid = 0;
};

/** 结束码 → 描述（常见值） */
inline std::string endCodeToString(uint8_t mres, uint8_t sres) {
    uint16_t code = static_cast<uint16_t>(((mres & 0x7F) << 8) | (sres & 0x3F));
    switch (code) {
        case 0x0000: return "normal completion";
        case 0x0101: return "local node not in network";
        case 0x0201: return "destination node not in network";
        case 0x0401: return "service not supported";
        case 0x1001: return "command too long";
        case 0x1002: return "command too short";
        case 0x1101: return "area classification missing";
        case 0x1103: return "address range exceeded";
        case 0x2101: return "area read-only";
        case 0x2202: return "cannot execute in current mode";
        default: {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "end code 0x%04X", code);
            return buf;
        }
    }
}

}  // namespace fins
