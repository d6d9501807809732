#pragma once

#include "common/utils/StringUtils.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

// ==================== 枚举类型 ====================

/** 地址的语义数据类型 */
enum class ValueType {
    Bool,
    Int16,
    UInt16,
    Int32,
    UInt32,
    Float,
    String
};

/**
 * @brief 32 位数值的字节序（避免使用 BIG_ENDIAN/LITTLE_ENDIAN，与 Linux <endian.h> 宏冲突）
 *
 * 16 位数值在三种协议中均为寄存器内大端，不受此配置影响。
 */
enum class ByteOrder {
    Big,          // ABCD
    Little,       // DCBA
    BigSwap,      // BADC
    LittleSwap    // CDAB
};

// ==================== 枚举解析函数 ====================

inline ValueType parseValueType(const std::string& str) {
    auto s = StringUtils::toLower(str);
    if (s == "bool" || s == "boolean" || s == "bit") return ValueType::Bool;
    if (s == "int16" || s == "short") return ValueType::Int16;
    if (s == "uint16" || s == "ushort" || s == "word") return ValueType::UInt16;
    if (s == "int32" || s == "int" || s == "dint") return ValueType::Int32;
    if (s == "uint32" || s == "uint" || s == "dword") return ValueType::UInt32;
    if (s == "float" || s == "float32" || s == "real") return ValueType::Float;
    if (s == "string" || s == "str") return ValueType::String;
    return ValueType::Int16;  // 默认
}

inline const char* valueTypeToString(ValueType type) {
    switch (type) {
        case ValueType::Bool: return "bool";
        case ValueType::Int16: return "int16";
        case ValueType::UInt16: return "uint16";
        case ValueType::Int32: return "int32";
        case ValueType::UInt32: return "uint32";
        case ValueType::Float: return "float";
        case ValueType::String: return "string";
    }
    return "int16";
}

inline ByteOrder parseByteOrder(const std::string& str) {
    auto s = StringUtils::toUpper(StringUtils::trim(str));
    if (s == "ABCD" || s == "BIG_ENDIAN") return ByteOrder::Big;
    if (s == "DCBA" || s == "LITTLE_ENDIAN") return ByteOrder::Little;
    if (s == "BADC" || s == "BIG_ENDIAN_BYTE_SWAP") return ByteOrder::BigSwap;
    if (s == "CDAB" || s == "LITTLE_ENDIAN_BYTE_SWAP") return ByteOrder::LittleSwap;
    return ByteOrder::LittleSwap;  // 默认 CDAB
}

inline const char* byteOrderToString(ByteOrder order) {
    switch (order) {
        case ByteOrder::Big: return "ABCD";
        case ByteOrder::Little: return "DCBA";
        case ByteOrder::BigSwap: return "BADC";
        case ByteOrder::LittleSwap: return "CDAB";
    }
    return "CDAB";
}

/** 再做一次字（16 位）顺序交换：ABCD↔CDAB，BADC↔DCBA */
inline ByteOrder applyWordSwap(ByteOrder order) {
    switch (order) {
        case ByteOrder::Big: return ByteOrder::LittleSwap;
        case ByteOrder::LittleSwap: return ByteOrder::Big;
        case ByteOrder::BigSwap: return ByteOrder::Little;
        case ByteOrder::Little: return ByteOrder::BigSwap;
    }
    return order;
}

/** 数据类型 → 占用字（16 位）数，字符串按每字 2 字符计算 */
inline uint16_t valueTypeWordCount(ValueType type, int stringLength = 10) {
    switch (type) {
        case ValueType::Bool:
        case ValueType::Int16:
        case ValueType::UInt16:
            return 1;
        case ValueType::Int32:
        case ValueType::UInt32:
        case ValueType::Float:
            return 2;
        case ValueType::String:
            return static_cast<uint16_t>((std::max(stringLength, 1) + 1) / 2);
    }
    return 1;
}

/**
 * @brief 数值编解码：设备字节 ↔ double
 */
class ValueCodec {
public:
    /**
     * @brief 按字节序从原始字节中提取数值
     * @param data 至少 2 字节（16 位类型）或 4 字节（32 位类型）
     * @throws std::invalid_argument 字节数不足或类型为字符串
     */
    static double decode(const uint8_t* data, size_t len, ValueType type, ByteOrder order) {
        switch (type) {
            case ValueType::Bool:
            case ValueType::Int16:
            case ValueType::UInt16: {
                if (len < 2) throw std::invalid_argument("decode: need 2 bytes");
                uint16_t raw = static_cast<uint16_t>((data[0] << 8) | data[1]);
                if (type == ValueType::Bool) return raw != 0 ? 1.0 : 0.0;
                if (type == ValueType::Int16) return static_cast<double>(static_cast<int16_t>(raw));
                return static_cast<double>(raw);
            }
            case ValueType::Int32:
            case ValueType::UInt32:
            case ValueType::Float: {
                if (len < 4) throw std::invalid_argument("decode: need 4 bytes");
                std::vector<uint8_t> buf(data, data + 4);
                toBigEndian(buf, order);
                uint32_t raw = (static_cast<uint32_t>(buf[0]) << 24) |
                               (static_cast<uint32_t>(buf[1]) << 16) |
                               (static_cast<uint32_t>(buf[2]) << 8) |
                               static_cast<uint32_t>(buf[3]);
                if (type == ValueType::Int32) return static_cast<double>(static_cast<int32_t>(raw));
                if (type == ValueType::UInt32) return static_cast<double>(raw);
                return static_cast<double>(std::bit_cast<float>(raw));
            }
            case ValueType::String:
                break;
        }
        throw std::invalid_argument("decode: string type is not numeric");
    }

    /**
     * @brief 数值编码为设备字节（decode 的逆操作），超出范围时钳位
     */
    static std::vector<uint8_t> encode(double value, ValueType type, ByteOrder order) {
        switch (type) {
            case ValueType::Bool:
                return {0x00, static_cast<uint8_t>(value != 0.0 ? 1 : 0)};
            case ValueType::Int16: {
                auto v = static_cast<uint16_t>(static_cast<int16_t>(std::clamp(value, -32768.0, 32767.0)));
                return {static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v & 0xFF)};
            }
            case ValueType::UInt16: {
                auto v = static_cast<uint16_t>(std::clamp(value, 0.0, 65535.0));
                return {static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v & 0xFF)};
            }
            case ValueType::Int32:
            case ValueType::UInt32:
            case ValueType::Float: {
                uint32_t raw = 0;
                if (type == ValueType::Int32) {
                    raw = static_cast<uint32_t>(static_cast<int32_t>(
                        std::clamp(value, -2147483648.0, 2147483647.0)));
                } else if (type == ValueType::UInt32) {
                    raw = static_cast<uint32_t>(std::clamp(value, 0.0, 4294967295.0));
                } else {
                    raw = std::bit_cast<uint32_t>(static_cast<float>(value));
                }
                std::vector<uint8_t> buf = {
                    static_cast<uint8_t>(raw >> 24), static_cast<uint8_t>(raw >> 16),
                    static_cast<uint8_t>(raw >> 8), static_cast<uint8_t>(raw)
                };
                fromBigEndian(buf, order);
                return buf;
            }
            case ValueType::String:
                break;
        }
        throw std::invalid_argument("encode: string type is not writable");
    }

    /**
     * @brief 提取 ASCII 字符串：截止到第一个 NUL，去除首尾空白
     */
    static std::string decodeString(const uint8_t* data, size_t len) {
        size_t end = 0;
        while (end < len && data[end] != 0) ++end;
        return StringUtils::trim(std::string(reinterpret_cast<const char*>(data), end));
    }

    /**
     * @brief 字符串 → 数值，无法转换返回 nullopt
     */
    static std::optional<double> stringToNumber(const std::string& text) {
        return StringUtils::parseDouble(text);
    }

private:
    /**
     * @brief 将 4 字节从指定字节序转为标准大端（ABCD）
     *
     * 以 0x3F9D70A4 (1.23f) 为例：
     *   ABCD: 3F 9D 70 A4
     *   DCBA: A4 70 9D 3F  (完全反转)
     *   BADC: 9D 3F A4 70  (字内字节交换)
     *   CDAB: 70 A4 3F 9D  (字顺序反转)
     */
    static void toBigEndian(std::vector<uint8_t>& buf, ByteOrder order) {
        switch (order) {
            case ByteOrder::Big: break;
            case ByteOrder::Little: std::reverse(buf.begin(), buf.end()); break;
            case ByteOrder::BigSwap: swapBytesInWords(buf); break;
            case ByteOrder::LittleSwap: reverseWords(buf); break;
        }
    }

    /** 四种变换均为对合（自逆），大端 → 目标字节序与上面相同 */
    static void fromBigEndian(std::vector<uint8_t>& buf, ByteOrder order) {
        toBigEndian(buf, order);
    }

    /** 反转 word (16-bit) 顺序: [W0][W1]...[Wn] → [Wn]...[W1][W0] */
    static void reverseWords(std::vector<uint8_t>& buf) {
        size_t numWords = buf.size() / 2;
        if (numWords < 2) return;

        for (size_t i = 0; i < numWords / 2; ++i) {
            size_t j = numWords - 1 - i;
            std::swap(buf[i * 2], buf[j * 2]);
            std::swap(buf[i * 2 + 1], buf[j * 2 + 1]);
        }
    }

    /** Word 内字节交换: [AB][CD] → [BA][DC] */
    static void swapBytesInWords(std::vector<uint8_t>& buf) {
        for (size_t i = 0; i + 1 < buf.size(); i += 2) {
            std::swap(buf[i], buf[i + 1]);
        }
    }
};
