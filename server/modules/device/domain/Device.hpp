#pragma once

#include "modules/device/domain/AddressConfig.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief PLC 设备快照
 *
 * 由 RegistrySource 加载，一个采集周期内不可变；需要刷新时重新加载整个快照。
 */
struct Device {
    int id = 0;
    std::string name;
    std::string plcType;                     // 例如 "Modbus TCP" / "Modbus RTU over TCP" / "Omron Fins"
    std::string protocol;                    // 例如 "modbus_tcp" / "modbus_tcp:3" / "fins"
    std::string host;
    int port = Constants::MODBUS_DEFAULT_PORT;
    ByteOrder byteOrder = ByteOrder::LittleSwap;
    int stationId = 1;                       // 已解析的默认站号，见 defaultStation()
    std::optional<int> groupId;
    std::vector<AddressConfig> addressConfigs;

    /** 排序键：分组优先，未分组排在最后 */
    std::pair<int, int> sortKey() const {
        return {groupId.value_or(Constants::UNGROUPED_SORT_KEY), id};
    }

    /**
     * @brief 解析设备默认站号
     *
     * 协议串后缀 ":<站号>"（例如 "modbus_tcp:3"）优先于 station_id 列，
     * 后缀不是 0-255 的整数时忽略。加载设备时解析一次，其余位置只读 stationId。
     */
    static int defaultStation(const std::string& protocol, int configured) {
        auto colon = protocol.rfind(':');
        if (colon != std::string::npos) {
            auto suffix = StringUtils::parseInt(StringUtils::trim(protocol.substr(colon + 1)));
            if (suffix && *suffix >= 0 && *suffix <= 255) {
                return static_cast<int>(*suffix);
            }
        }
        return configured;
    }

    /** plcType 同时包含 tcp 与 rtu（RTU 帧经 TCP 透传，一条链路挂多个站） */
    bool isRtuOverTcp() const {
        auto t = StringUtils::toLower(plcType);
        return StringUtils::contains(t, "tcp") && StringUtils::contains(t, "rtu");
    }

    /**
     * @brief 数据存储键
     *
     * RTU over TCP 下同一地址可能出现在多个站上，因此附加站号后缀。
     */
    std::string storageKey(const AddressConfig& cfg) const {
        if (isRtuOverTcp()) {
            return cfg.address + "_s" + std::to_string(cfg.effectiveStation(stationId));
        }
        return cfg.address;
    }

    /** 根据存储键查找地址配置（支持带 _s 后缀的键） */
    const AddressConfig* findAddress(const std::string& key) const {
        for (const auto& cfg : addressConfigs) {
            if (cfg.address == key || storageKey(cfg) == key) return &cfg;
        }
        auto pos = key.rfind("_s");
        if (pos != std::string::npos) {
            auto bare = key.substr(0, pos);
            for (const auto& cfg : addressConfigs) {
                if (cfg.address == bare) return &cfg;
            }
        }
        return nullptr;
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id;
        json["name"] = name;
        json["plc_type"] = plcType;
        json["protocol"] = protocol;
        json["ip_address"] = host;
        json["port"] = port;
        json["byte_order"] = byteOrderToString(byteOrder);
        json["station_id"] = stationId;
        json["group_id"] = groupId ? Json::Value(*groupId) : Json::Value::null;

        Json::Value addresses(Json::arrayValue);
        for (const auto& cfg : addressConfigs) {
            addresses.append(cfg.toJson());
        }
        json["addresses"] = addresses;
        return json;
    }
};
