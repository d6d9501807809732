#include <gtest/gtest.h>

#include "TestHelpers.hpp"

using namespace testing_support;

TEST(DataPipelineTest, ScaleFactorWinsOverLinearScaling) {
    AddressConfig cfg;
    cfg.scale = 0.1;
    cfg.scaling.enabled = true;
    EXPECT_DOUBLE_EQ(DataPipeline::scale(cfg, 250), 25.0);
}

TEST(DataPipelineTest, LinearScalingMapsRange) {
    AddressConfig cfg;
    cfg.scaling = {true, 0, 4000, 0, 100};
    EXPECT_DOUBLE_EQ(DataPipeline::scale(cfg, 2000), 50.0);
    EXPECT_DOUBLE_EQ(DataPipeline::scale(cfg, 0), 0.0);

    cfg.scaling = {true, 4, 20, 0, 16};
    EXPECT_DOUBLE_EQ(DataPipeline::scale(cfg, 12), 8.0);
}

TEST(DataPipelineTest, DegenerateInputRangeReturnsRaw) {
    AddressConfig cfg;
    cfg.scaling = {true, 5, 5, 0, 100};
    EXPECT_DOUBLE_EQ(DataPipeline::scale(cfg, 7), 7.0);

    AddressConfig plain;
    EXPECT_DOUBLE_EQ(DataPipeline::scale(plain, 7), 7.0);
}

TEST(DataPipelineTest, BuildPointsSkipsFailedReadsAndCarriesTags) {
    auto device = makeDevice(3, "PLC-3", {"40001", "40002"});
    device.addressConfigs[0].unit = "℃";
    device.addressConfigs[0].scale = 2;

    ReadResult result;
    result.isOnline = true;
    result.values["40001"] = 21;
    result.values["40002"] = std::nullopt;
    result.values["49999"] = 1;   // 无对应配置

    auto points = DataPipeline::buildPoints(device, result, 12.5);
    ASSERT_EQ(points.size(), 1u);
    const auto& p = points[0];
    EXPECT_EQ(p.deviceId, 3);
    EXPECT_EQ(p.address, "40001");
    EXPECT_DOUBLE_EQ(p.rawValue, 21);
    EXPECT_DOUBLE_EQ(p.scaledValue, 42);
    EXPECT_EQ(p.quality, "good");
    EXPECT_DOUBLE_EQ(p.responseTimeMs, 12.5);
    EXPECT_EQ(p.unit, "℃");
    EXPECT_EQ(p.dataType, "int16");
    EXPECT_EQ(p.byteOrder, "CDAB");
    EXPECT_EQ(p.stationId, 1);
}

TEST(DataPipelineTest, SmallDevicesWritePointByPoint) {
    auto store = std::make_shared<MemoryTimeSeriesStore>();
    DataPipeline pipeline(store);
    auto device = makeDevice(1, "PLC-1", {"40001", "40002", "40003"});

    ReadResult result;
    result.isOnline = true;
    result.values = {{"40001", 1.0}, {"40002", std::nullopt}, {"40003", 3.0}};

    EXPECT_EQ(pipeline.process(device, result, 5), 2u);
    EXPECT_EQ(store->points().size(), 2u);
    EXPECT_EQ(store->batchWrites(), 0);
}

TEST(DataPipelineTest, LargeDevicesUseBatchWrite) {
    auto store = std::make_shared<MemoryTimeSeriesStore>();
    DataPipeline pipeline(store);

    std::vector<std::string> addresses;
    ReadResult result;
    result.isOnline = true;
    for (int i = 0; i < 12; ++i) {
        auto addr = std::to_string(40001 + i);
        addresses.push_back(addr);
        result.values[addr] = i;
    }
    auto device = makeDevice(1, "PLC-1", addresses);

    EXPECT_EQ(pipeline.process(device, result, 5), 12u);
    EXPECT_EQ(store->batchWrites(), 1);
}

TEST(DataPipelineTest, StoreFailureIsNotPropagated) {
    auto store = std::make_shared<MemoryTimeSeriesStore>();
    store->setFailing(true);
    DataPipeline pipeline(store);
    auto device = makeDevice(1, "PLC-1", {"40001"});

    ReadResult result;
    result.isOnline = true;
    result.values["40001"] = 5;

    EXPECT_EQ(pipeline.process(device, result, 5), 0u);
}

TEST(DataPipelineTest, NothingToStoreWhenAllReadsFailed) {
    auto store = std::make_shared<MemoryTimeSeriesStore>();
    DataPipeline pipeline(store);
    auto device = makeDevice(1, "PLC-1", {"40001"});

    ReadResult result;
    result.values["40001"] = std::nullopt;
    EXPECT_EQ(pipeline.process(device, result, 5), 0u);
    EXPECT_TRUE(store->points().empty());
}
