#pragma once

#include "common/database/DatabaseService.hpp"
#include "common/utils/FieldHelper.hpp"
#include "modules/device/domain/Device.hpp"

/**
 * @brief 设备注册表（采集器只读取启用的设备，并回写采集状态）
 */
class RegistrySource {
public:
    virtual ~RegistrySource() = default;

    /** 启用的设备，按 id 升序 */
    virtual std::vector<Device> listActiveDevices() = 0;

    /**
     * @brief 回写设备状态
     * @param collected 为 true 时同时刷新 last_collect_time
     */
    virtual void markCollected(int deviceId, bool online, bool collected = true) = 0;
};

/**
 * @brief plc_device 表
 */
class PgRegistrySource : public RegistrySource {
public:
    std::vector<Device> listActiveDevices() override {
        auto result = db_.execSqlSync(R"(
            SELECT id, name, plc_type, protocol, ip_address, port, byte_order, station_id,
                   group_id, addresses
            FROM plc_device
            WHERE is_active = TRUE
            ORDER BY id
        )");

        std::vector<Device> devices;
        devices.reserve(result.size());
        for (const auto& row : result) {
            devices.push_back(fromRow(row));
        }
        return devices;
    }

    void markCollected(int deviceId, bool online, bool collected) override {
        std::string sql = "UPDATE plc_device SET is_connected = ?::boolean, status = ?, updated_at = CURRENT_TIMESTAMP";
        if (collected) sql += ", last_collect_time = CURRENT_TIMESTAMP";
        sql += " WHERE id = ?";

        try {
            db_.execSqlSync(sql, {
                online ? "true" : "false",
                online ? Constants::DEVICE_STATUS_ONLINE : Constants::DEVICE_STATUS_OFFLINE,
                std::to_string(deviceId)
            });
        } catch (const std::exception& e) {
            LOG_ERROR << "[Collector] Update device " << deviceId << " status failed: " << e.what();
        }
    }

private:
    DatabaseService db_;

    static Device fromRow(const drogon::orm::Row& row) {
        Device device;
        device.id = FieldHelper::getInt(row["id"]);
        device.name = FieldHelper::getString(row["name"]);
        device.plcType = FieldHelper::getString(row["plc_type"]);
        device.protocol = FieldHelper::getString(row["protocol"]);
        device.host = FieldHelper::getString(row["ip_address"]);
        device.port = FieldHelper::getInt(row["port"], Constants::MODBUS_DEFAULT_PORT);
        device.byteOrder = parseByteOrder(FieldHelper::getString(row["byte_order"], "CDAB"));
        device.stationId = Device::defaultStation(device.protocol, FieldHelper::getInt(row["station_id"], 1));
        device.groupId = FieldHelper::getOptionalInt(row["group_id"]);
        device.addressConfigs = AddressConfig::parseList(FieldHelper::getString(row["addresses"], "[]"));
        return device;
    }
};
