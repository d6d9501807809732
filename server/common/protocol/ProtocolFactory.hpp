#pragma once

#include "common/protocol/modbus/Modbus.hpp"
#include "common/protocol/fins/Fins.Handler.hpp"
#include "common/protocol/s7/S7.Handler.hpp"

/** 协议族 */
enum class ProtocolFamily {
    Modbus,
    OmronFins,
    SiemensS7
};

inline const char* protocolFamilyToString(ProtocolFamily family) {
    switch (family) {
        case ProtocolFamily::Modbus: return "Modbus";
        case ProtocolFamily::OmronFins: return "Omron";
        case ProtocolFamily::SiemensS7: return "Siemens";
    }
    return "Modbus";
}

/**
 * @brief 协议处理器工厂
 *
 * 对 plcType + " " + protocol 做小写子串匹配，未识别时回退到 Modbus 并告警。
 */
class ProtocolFactory {
public:
    /**
     * @brief 识别协议族
     * @param recognized 输出：是否命中关键字（未命中时返回 Modbus）
     */
    static ProtocolFamily detect(const std::string& plcType, const std::string& protocol,
                                 bool* recognized = nullptr) {
        auto text = StringUtils::toLower(plcType + " " + protocol);
        if (recognized) *recognized = true;

        if (StringUtils::containsAny(text, {"modbus", "mb_", "mbtcp", "mbrtu", "mb-rtu"})) {
            return ProtocolFamily::Modbus;
        }
        if (StringUtils::containsAny(text, {"omron", "欧姆龙", "fins"})) {
            return ProtocolFamily::OmronFins;
        }
        if (StringUtils::containsAny(text, {"siemens", "西门子", "s7"})) {
            return ProtocolFamily::SiemensS7;
        }

        if (recognized) *recognized = false;
        return ProtocolFamily::Modbus;
    }

    static std::unique_ptr<ProtocolHandler> create(const Device& device, int connectTimeoutMs,
                                                   int receiveTimeoutMs) {
        bool recognized = false;
        auto family = detect(device.plcType, device.protocol, &recognized);
        if (!recognized) {
            LOG_WARN << "[Protocol] Unknown PLC type '" << device.plcType
                     << "' for device " << device.name << ", falling back to Modbus";
        }

        LOG_DEBUG << "[Protocol] Creating " << protocolFamilyToString(family)
                  << " handler for device " << device.name;

        switch (family) {
            case ProtocolFamily::OmronFins:
                return std::make_unique<fins::FinsHandler>(device, connectTimeoutMs, receiveTimeoutMs);
            case ProtocolFamily::SiemensS7:
                return std::make_unique<s7::S7Handler>(device, connectTimeoutMs, receiveTimeoutMs);
            case ProtocolFamily::Modbus:
                break;
        }
        return std::make_unique<modbus::ModbusHandler>(device, connectTimeoutMs, receiveTimeoutMs);
    }

    /**
     * @brief 支持的协议变体列表
     */
    static Json::Value supportedProtocols() {
        struct Entry {
            const char* name;
            const char* description;
            int port;
        };
        static const Entry entries[] = {
            {Constants::PROTOCOL_MODBUS_TCP, "Modbus TCP（MBAP 帧）", Constants::MODBUS_DEFAULT_PORT},
            {Constants::PROTOCOL_MODBUS_RTU, "Modbus RTU（CRC16 帧，经 TCP 透传）", Constants::MODBUS_DEFAULT_PORT},
            {Constants::PROTOCOL_MODBUS_RTU_OVER_TCP, "Modbus RTU over TCP（多站共享链路）", Constants::MODBUS_DEFAULT_PORT},
            {Constants::PROTOCOL_OMRON_FINS, "欧姆龙 Fins/TCP", Constants::FINS_DEFAULT_PORT},
            {Constants::PROTOCOL_SIEMENS_S7, "西门子 S7（ISO-on-TCP）", Constants::S7_DEFAULT_PORT},
        };

        Json::Value list(Json::arrayValue);
        for (const auto& e : entries) {
            Json::Value item;
            item["name"] = e.name;
            item["description"] = e.description;
            item["default_port"] = e.port;
            list.append(item);
        }
        return list;
    }
};
