#include <gtest/gtest.h>

#include "modules/device/domain/Device.hpp"

TEST(AddressConfigTest, ParsesObjectEntries) {
    auto configs = AddressConfig::parseList(R"([
        {"id": "t1", "name": "温度", "address": "40001", "type": "float", "byteOrder": "ABCD",
         "stationId": 3, "scale": 0.1, "rangeMin": -20, "rangeMax": 120,
         "scaling": {"enabled": true, "inputMin": 0, "inputMax": 4000, "outputMin": 0, "outputMax": 100}},
        {"address": "40003", "stationId": ""}
    ])");

    ASSERT_EQ(configs.size(), 2u);
    const auto& t = configs[0];
    EXPECT_EQ(t.id, "t1");
    EXPECT_EQ(t.type, ValueType::Float);
    EXPECT_EQ(t.byteOrder, ByteOrder::Big);
    EXPECT_EQ(t.stationId, 3);
    EXPECT_DOUBLE_EQ(t.scale, 0.1);
    EXPECT_TRUE(t.scaling.enabled);
    EXPECT_DOUBLE_EQ(t.scaling.inputMax, 4000);
    EXPECT_EQ(t.rangeMin, -20);
    EXPECT_EQ(t.rangeMax, 120);

    const auto& plain = configs[1];
    EXPECT_FALSE(plain.stationId.has_value());
    EXPECT_EQ(plain.type, ValueType::Int16);
    EXPECT_EQ(plain.byteOrder, ByteOrder::LittleSwap);
    EXPECT_EQ(plain.stringLength, Constants::DEFAULT_STRING_LENGTH);
    EXPECT_FALSE(plain.id.empty());
}

TEST(AddressConfigTest, ParsesLegacyStringArray) {
    auto configs = AddressConfig::parseList(R"(["40001", "", "40002"])");
    ASSERT_EQ(configs.size(), 2u);
    EXPECT_EQ(configs[0].id, "legacy_0");
    EXPECT_EQ(configs[0].name, "地址1");
    EXPECT_EQ(configs[1].id, "legacy_2");
    EXPECT_EQ(configs[1].name, "地址3");
    EXPECT_EQ(configs[1].address, "40002");
}

TEST(AddressConfigTest, InvalidDocumentsYieldEmptyList) {
    EXPECT_TRUE(AddressConfig::parseList("").empty());
    EXPECT_TRUE(AddressConfig::parseList("not json").empty());
    EXPECT_TRUE(AddressConfig::parseList(R"({"address": "40001"})").empty());
}

TEST(AddressConfigTest, EffectiveStationFallsBackToDevice) {
    AddressConfig cfg;
    EXPECT_EQ(cfg.effectiveStation(5), 5);
    cfg.stationId = 2;
    EXPECT_EQ(cfg.effectiveStation(5), 2);
}

TEST(DeviceTest, RtuOverTcpStorageKeysCarryStation) {
    Device device;
    device.plcType = "Modbus RTU over TCP";
    device.stationId = 1;
    device.addressConfigs = AddressConfig::parseList(R"([
        {"address": "40001"},
        {"address": "40001", "stationId": 2}
    ])");

    ASSERT_TRUE(device.isRtuOverTcp());
    EXPECT_EQ(device.storageKey(device.addressConfigs[0]), "40001_s1");
    EXPECT_EQ(device.storageKey(device.addressConfigs[1]), "40001_s2");

    auto* found = device.findAddress("40001_s2");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->stationId, 2);

    EXPECT_EQ(device.findAddress("40009"), nullptr);
}

TEST(DeviceTest, DefaultStationPrefersProtocolSuffix) {
    EXPECT_EQ(Device::defaultStation("modbus_tcp:9", 4), 9);
    EXPECT_EQ(Device::defaultStation("modbus_tcp", 4), 4);
    EXPECT_EQ(Device::defaultStation("modbus_tcp:abc", 4), 4);
    EXPECT_EQ(Device::defaultStation("modbus_tcp:300", 4), 4);
    EXPECT_EQ(Device::defaultStation("modbus_rtu_over_tcp: 0 ", 1), 0);
}

TEST(DeviceTest, PlainTcpUsesBareAddress) {
    Device device;
    device.plcType = "Modbus TCP";
    device.addressConfigs = AddressConfig::parseList(R"(["40001"])");
    EXPECT_FALSE(device.isRtuOverTcp());
    EXPECT_EQ(device.storageKey(device.addressConfigs[0]), "40001");
    EXPECT_NE(device.findAddress("40001"), nullptr);
}

TEST(DeviceTest, SortKeyPlacesUngroupedLast) {
    Device grouped;
    grouped.id = 9;
    grouped.groupId = 2;
    Device ungrouped;
    ungrouped.id = 1;

    EXPECT_LT(grouped.sortKey(), ungrouped.sortKey());
    EXPECT_EQ(ungrouped.sortKey().first, Constants::UNGROUPED_SORT_KEY);
}
