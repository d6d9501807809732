#pragma once

#include "common/utils/StringUtils.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace modbus {

// ==================== 枚举类型 ====================

/** 寄存器类型 */
enum class RegisterType {
    COIL,               // FC01 Read Coils, 地址 1-9999
    DISCRETE_INPUT,     // FC02 Read Discrete Inputs, 地址 10001-19999
    HOLDING_REGISTER,   // FC03 Read Holding Registers, 地址 40001-49999
    INPUT_REGISTER      // FC04 Read Input Registers, 地址 30001-39999
};

/** Modbus 帧模式 */
enum class FrameMode {
    TCP,    // MBAP Header
    RTU     // SlaveAddr + PDU + CRC16
};

// ==================== 功能码常量 ====================

struct FuncCodes {
    static constexpr uint8_t READ_COILS = 0x01;
    static constexpr uint8_t READ_DISCRETE_INPUTS = 0x02;
    static constexpr uint8_t READ_HOLDING_REGISTERS = 0x03;
    static constexpr uint8_t READ_INPUT_REGISTERS = 0x04;
    static constexpr uint8_t WRITE_SINGLE_COIL = 0x05;
    static constexpr uint8_t WRITE_SINGLE_REGISTER = 0x06;
    static constexpr uint8_t WRITE_MULTIPLE_REGISTERS = 0x10;
};

/** 广播站号（所有从站执行，不回复） */
inline constexpr uint8_t BROADCAST_STATION = 0;

// ==================== 帧结构 ====================

/** Modbus 读请求参数 */
struct ModbusRequest {
    uint8_t slaveId;
    uint8_t functionCode;
    uint16_t startAddress;
    uint16_t quantity;
    uint16_t transactionId = 0;  // 仅 TCP 模式
};

/** Modbus 写请求参数 */
struct ModbusWriteRequest {
    uint8_t slaveId;
    uint8_t functionCode;       // FC05/FC06/FC10
    uint16_t address;
    std::vector<uint8_t> data;  // 编码后的值（寄存器大端）
    uint16_t quantity = 1;      // 寄存器数量（FC10 使用）
    uint16_t transactionId = 0; // 仅 TCP 模式
};

/** 解析后的 Modbus 响应 */
struct ModbusResponse {
    FrameMode mode;
    uint8_t slaveId = 0;
    uint8_t functionCode = 0;
    std::vector<uint8_t> data;    // 读响应：有效数据；写响应：Addr(2)+Value/Qty(2)
    bool isException = false;
    uint8_t exceptionCode = 0;
    uint16_t transactionId = 0;   // 仅 TCP 模式
};

/** 解析后的地址：寄存器区 + 线上偏移 */
struct ModbusAddress {
    RegisterType registerType;
    uint16_t offset;
};

// ==================== 枚举解析函数 ====================

/** 兼容 "holding" / "HOLDING_REGISTER" 两种写法 */
inline RegisterType parseRegisterType(const std::string& str) {
    auto s = StringUtils::toLower(str);
    if (s == "coil" || s == "coils") return RegisterType::COIL;
    if (s == "discrete" || s == "discrete_input" || s == "discrete-input") return RegisterType::DISCRETE_INPUT;
    if (s == "input" || s == "input_register" || s == "input-register") return RegisterType::INPUT_REGISTER;
    return RegisterType::HOLDING_REGISTER;  // 默认
}

inline std::string registerTypeToString(RegisterType type) {
    switch (type) {
        case RegisterType::COIL: return "coil";
        case RegisterType::DISCRETE_INPUT: return "discrete";
        case RegisterType::HOLDING_REGISTER: return "holding";
        case RegisterType::INPUT_REGISTER: return "input";
    }
    return "holding";
}

inline FrameMode parseFrameMode(const std::string& plcType) {
    return StringUtils::contains(StringUtils::toLower(plcType), "rtu") ? FrameMode::RTU : FrameMode::TCP;
}

/** 寄存器类型 → 读取功能码 */
inline uint8_t registerTypeToFuncCode(RegisterType type) {
    switch (type) {
        case RegisterType::COIL: return FuncCodes::READ_COILS;
        case RegisterType::DISCRETE_INPUT: return FuncCodes::READ_DISCRETE_INPUTS;
        case RegisterType::HOLDING_REGISTER: return FuncCodes::READ_HOLDING_REGISTERS;
        case RegisterType::INPUT_REGISTER: return FuncCodes::READ_INPUT_REGISTERS;
    }
    return FuncCodes::READ_HOLDING_REGISTERS;
}

/** 读取功能码 → 寄存器类型（非读功能码返回 nullopt） */
inline std::optional<RegisterType> funcCodeToRegisterType(int functionCode) {
    switch (functionCode) {
        case FuncCodes::READ_COILS: return RegisterType::COIL;
        case FuncCodes::READ_DISCRETE_INPUTS: return RegisterType::DISCRETE_INPUT;
        case FuncCodes::READ_HOLDING_REGISTERS: return RegisterType::HOLDING_REGISTER;
        case FuncCodes::READ_INPUT_REGISTERS: return RegisterType::INPUT_REGISTER;
        default: return std::nullopt;
    }
}

/** 是否为位类型寄存器（线圈/离散输入） */
inline bool isBitRegister(RegisterType type) {
    return type == RegisterType::COIL || type == RegisterType::DISCRETE_INPUT;
}

/** 寄存器类型是否可写 */
inline bool isWritable(RegisterType type) {
    return type == RegisterType::COIL || type == RegisterType::HOLDING_REGISTER;
}

/** Modbus 异常码 → 描述 */
inline std::string exceptionCodeToString(uint8_t code) {
    switch (code) {
        case 0x01: return "illegal function";
        case 0x02: return "illegal data address";
        case 0x03: return "illegal data value";
        case 0x04: return "slave device failure";
        case 0x05: return "acknowledge";
        case 0x06: return "slave device busy";
        case 0x0A: return "gateway path unavailable";
        case 0x0B: return "gateway target device failed to respond";
        default: return "exception code " + std::to_string(code);
    }
}

}  // namespace modbus
