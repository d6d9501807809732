#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace s7 {

// ==================== 协议常量 ====================

/** TPKT 头：Version(1)=3 Reserved(1) Length(2) */
inline constexpr size_t TPKT_HEADER_SIZE = 4;

/** COTP 数据帧头：Length(1)=2 PDUType(1)=0xF0 EOT(1)=0x80 */
inline constexpr size_t COTP_DT_SIZE = 3;

/** S7 请求头长度（Job） */
inline constexpr size_t S7_REQUEST_HEADER_SIZE = 10;

/** S7 应答头长度（Ack-Data，含错误类/错误码） */
inline constexpr size_t S7_RESPONSE_HEADER_SIZE = 12;

/** 数据区起始偏移：TPKT + COTP + S7 应答头 */
inline constexpr size_t RESPONSE_PARAM_OFFSET = TPKT_HEADER_SIZE + COTP_DT_SIZE + S7_RESPONSE_HEADER_SIZE;

/** 默认机架 / 槽位（S7-1200） */
inline constexpr int DEFAULT_RACK = 0;
inline constexpr int DEFAULT_SLOT = 1;

/** 本地 TSAP */
inline constexpr uint16_t LOCAL_TSAP = 0x0100;

/** 请求协商的 PDU 长度 */
inline constexpr uint16_t REQUESTED_PDU_SIZE = 480;

struct PduTypes {
    static constexpr uint8_t COTP_CONNECTION_REQUEST = 0xE0;
    static constexpr uint8_t COTP_CONNECTION_CONFIRM = 0xD0;
    static constexpr uint8_t COTP_DATA = 0xF0;
};

struct MessageTypes {
    static constexpr uint8_t JOB = 0x01;
    static constexpr uint8_t ACK_DATA = 0x03;
};

struct Functions {
    static constexpr uint8_t SETUP_COMMUNICATION = 0xF0;
    static constexpr uint8_t READ_VAR = 0x04;
    static constexpr uint8_t WRITE_VAR = 0x05;
};

/** 请求项的传输类型 */
struct TransportSizes {
    static constexpr uint8_t BIT = 0x01;
    static constexpr uint8_t BYTE = 0x02;
};

/** 数据项的传输类型（应答 / 写入数据段） */
struct DataTransportSizes {
    static constexpr uint8_t BIT = 0x03;
    static constexpr uint8_t BYTE_WORD_DWORD = 0x04;   // 长度单位：位
    static constexpr uint8_t OCTET_STRING = 0x09;      // 长度单位：字节
};

/** 数据项返回码 */
inline constexpr uint8_t RETURN_CODE_SUCCESS = 0xFF;

// ==================== 存储区 ====================

enum class Area : uint8_t {
    Inputs = 0x81,       // I
    Outputs = 0x82,      // Q
    Merker = 0x83,       // M
    DataBlock = 0x84     // DB
};

/** 地址中声明的访问宽度 */
enum class AccessSize {
    Bit,         // DBX / M10.1 / I0.0
    Byte,        // DBB / MB / IB / QB
    Word,        // DBW / MW / IW / QW
    DWord,       // DBD / MD / ID / QD
    Unspecified  // M10：宽度由数据类型决定
};

/**
 * @brief 解析后的 S7 地址
 */
struct S7Address {
    Area area = Area::DataBlock;
    uint16_t dbNumber = 0;      // 仅 DB 区
    uint32_t byteOffset = 0;
    uint8_t bit = 0;
    AccessSize size = AccessSize::Unspecified;

    bool isBit() const { return size == AccessSize::Bit; }
};

inline const char* areaToString(Area area) {
    switch (area) {
        case Area::Inputs: return "I";
        case Area::Outputs: return "Q";
        case Area::Merker: return "M";
        case Area::DataBlock: return "DB";
    }
    return "DB";
}

/** 数据项返回码 → 描述 */
inline std::string returnCodeToString(uint8_t code) {
    switch (code) {
        case 0x01: return "hardware fault";
        case 0x03: return "accessing the object not allowed";
        case 0x05: return "address out of range";
        case 0x06: return "data type not supported";
        case 0x07: return "data type inconsistent";
        case 0x0A: return "object does not exist";
        case 0xFF: return "success";
        default: return "return code " + std::to_string(code);
    }
}

}  // namespace s7
