#pragma once

#include "common/protocol/ValueCodec.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief 线性量程变换参数（原始值区间 → 工程值区间）
 */
struct ScalingConfig {
    bool enabled = false;
    double inputMin = 0.0;
    double inputMax = 100.0;
    double outputMin = 0.0;
    double outputMax = 10.0;

    Json::Value toJson() const {
        Json::Value json;
        json["enabled"] = enabled;
        json["inputMin"] = inputMin;
        json["inputMax"] = inputMax;
        json["outputMin"] = outputMin;
        json["outputMax"] = outputMax;
        return json;
    }
};

/**
 * @brief 单个采集地址配置
 *
 * 由 parseList 在设备加载时统一规范化，之后只读。字段名与持久化 JSON 保持一致
 * （驼峰），方便前端直接编辑。
 */
struct AddressConfig {
    std::string id;
    std::string name;
    std::string address;
    ValueType type = ValueType::Int16;
    std::string unit;
    std::string description;
    std::optional<int> stationId;           // 空 = 使用设备默认站号
    int functionCode = 3;
    std::string registerType = "holding";   // coil | discrete | input | holding
    ByteOrder byteOrder = ByteOrder::LittleSwap;
    bool wordSwap = false;
    int scanRate = 1000;
    int stringLength = Constants::DEFAULT_STRING_LENGTH;
    double scale = 1.0;
    ScalingConfig scaling;
    std::optional<double> rangeMin;         // 工程量程（异常检测用）
    std::optional<double> rangeMax;

    /** 实际使用的站号：地址级优先，否则取设备默认 */
    int effectiveStation(int deviceStation) const {
        return stationId.value_or(deviceStation);
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id;
        json["name"] = name;
        json["address"] = address;
        json["type"] = valueTypeToString(type);
        json["unit"] = unit;
        json["description"] = description;
        json["stationId"] = stationId ? Json::Value(*stationId) : Json::Value::null;
        json["functionCode"] = functionCode;
        json["registerType"] = registerType;
        json["byteOrder"] = byteOrderToString(byteOrder);
        json["wordSwap"] = wordSwap;
        json["scanRate"] = scanRate;
        json["stringLength"] = stringLength;
        json["scale"] = scale;
        json["scaling"] = scaling.toJson();
        if (rangeMin) json["rangeMin"] = *rangeMin;
        if (rangeMax) json["rangeMax"] = *rangeMax;
        return json;
    }

    // ==================== 规范化 ====================

    /**
     * @brief 从单个 JSON 对象构建，缺失字段取默认值
     */
    static AddressConfig fromJson(const Json::Value& obj) {
        AddressConfig cfg;
        cfg.address = JsonHelper::getString(obj, "address");
        cfg.id = JsonHelper::getString(obj, "id", std::to_string(std::hash<std::string>{}(cfg.address)));
        cfg.name = JsonHelper::getString(obj, "name");
        cfg.type = parseValueType(JsonHelper::getString(obj, "type", "int16"));
        cfg.unit = JsonHelper::getString(obj, "unit");
        cfg.description = JsonHelper::getString(obj, "description");

        if (obj.isMember("stationId") && !obj["stationId"].isNull()
            && !(obj["stationId"].isString() && obj["stationId"].asString().empty())) {
            cfg.stationId = JsonHelper::getInt(obj, "stationId", 1);
        }

        cfg.functionCode = JsonHelper::getInt(obj, "functionCode", 3);
        cfg.registerType = StringUtils::toLower(JsonHelper::getString(obj, "registerType", "holding"));
        cfg.byteOrder = parseByteOrder(JsonHelper::getString(obj, "byteOrder", "CDAB"));
        cfg.wordSwap = JsonHelper::getBool(obj, "wordSwap", false);
        cfg.scanRate = JsonHelper::getInt(obj, "scanRate", 1000);
        cfg.stringLength = JsonHelper::getInt(obj, "stringLength", Constants::DEFAULT_STRING_LENGTH);
        cfg.scale = JsonHelper::getDouble(obj, "scale", 1.0);

        if (obj.isMember("scaling") && obj["scaling"].isObject()) {
            const auto& s = obj["scaling"];
            cfg.scaling.enabled = JsonHelper::getBool(s, "enabled", false);
            cfg.scaling.inputMin = JsonHelper::getDouble(s, "inputMin", 0.0);
            cfg.scaling.inputMax = JsonHelper::getDouble(s, "inputMax", 100.0);
            cfg.scaling.outputMin = JsonHelper::getDouble(s, "outputMin", 0.0);
            cfg.scaling.outputMax = JsonHelper::getDouble(s, "outputMax", 10.0);
        }

        if (obj.isMember("rangeMin") && obj["rangeMin"].isNumeric()) cfg.rangeMin = obj["rangeMin"].asDouble();
        if (obj.isMember("rangeMax") && obj["rangeMax"].isNumeric()) cfg.rangeMax = obj["rangeMax"].asDouble();
        return cfg;
    }

    /**
     * @brief 解析设备的地址列表
     *
     * 支持两种存储格式：
     *   - 对象数组：[{"address": "40001", "type": "float", ...}, ...]
     *   - 旧格式字符串数组：["40001", "40002"]，id 为 legacy_{i}，名称为 地址{i+1}
     *
     * 无法解析时记录错误并返回空列表。
     */
    static std::vector<AddressConfig> parseList(const std::string& text) {
        if (StringUtils::trim(text).empty()) return {};

        Json::Value root;
        try {
            root = JsonHelper::parse(text);
        } catch (const std::exception& e) {
            LOG_ERROR << "[Device] Failed to parse address config: " << e.what();
            return {};
        }
        return parseList(root);
    }

    static std::vector<AddressConfig> parseList(const Json::Value& root) {
        std::vector<AddressConfig> configs;
        if (!root.isArray()) {
            if (!root.isNull()) {
                LOG_ERROR << "[Device] Address config is not an array";
            }
            return configs;
        }

        for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
            const auto& item = root[i];
            if (item.isObject()) {
                configs.push_back(fromJson(item));
            } else if (item.isString()) {
                if (item.asString().empty()) continue;
                AddressConfig cfg;
                cfg.id = "legacy_" + std::to_string(i);
                cfg.name = "地址" + std::to_string(i + 1);
                cfg.address = item.asString();
                configs.push_back(std::move(cfg));
            } else {
                LOG_WARN << "[Device] Skipping unsupported address entry at index " << i;
            }
        }
        return configs;
    }
};
