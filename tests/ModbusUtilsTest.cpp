#include <gtest/gtest.h>

#include "common/protocol/modbus/Modbus.Utils.hpp"

using namespace modbus;

TEST(ModbusUtilsTest, Crc16MatchesReferenceFrame) {
    // 01 03 00 00 00 0A → CRC C5 CD
    std::vector<uint8_t> frame = {0x01, 0x03, 0x00, 0x00, 0x00, 0x0A};
    EXPECT_EQ(ModbusUtils::crc16(frame), 0xCDC5);
}

TEST(ModbusUtilsTest, BuildsTcpReadRequest) {
    ModbusRequest req{0x11, FuncCodes::READ_HOLDING_REGISTERS, 0x006B, 3, 0x0001};
    auto frame = ModbusUtils::buildRequest(FrameMode::TCP, req);
    std::vector<uint8_t> expected = {0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x11, 0x03, 0x00, 0x6B, 0x00, 0x03};
    EXPECT_EQ(frame, expected);
}

TEST(ModbusUtilsTest, BuildsRtuReadRequestWithCrc) {
    ModbusRequest req{0x01, FuncCodes::READ_HOLDING_REGISTERS, 0x0000, 10};
    auto frame = ModbusUtils::buildRequest(FrameMode::RTU, req);
    std::vector<uint8_t> expected = {0x01, 0x03, 0x00, 0x00, 0x00, 0x0A, 0xC5, 0xCD};
    EXPECT_EQ(frame, expected);
}

TEST(ModbusUtilsTest, SingleCoilWriteUsesFF00) {
    ModbusWriteRequest req{1, FuncCodes::WRITE_SINGLE_COIL, 0x0013, {1}};
    auto pdu = ModbusUtils::buildWritePdu(req);
    std::vector<uint8_t> expected = {0x05, 0x00, 0x13, 0xFF, 0x00};
    EXPECT_EQ(pdu, expected);

    req.data = {0};
    EXPECT_EQ(ModbusUtils::buildWritePdu(req)[3], 0x00);
}

TEST(ModbusUtilsTest, ParsesTcpReadResponse) {
    std::vector<uint8_t> buffer = {0x00, 0x07, 0x00, 0x00, 0x00, 0x07, 0x01, 0x03, 0x04, 0x12, 0x34, 0x56, 0x78};
    ModbusResponse response;
    ASSERT_EQ(ModbusUtils::parseTcpResponse(buffer, response), buffer.size());
    EXPECT_EQ(response.transactionId, 7);
    EXPECT_EQ(response.slaveId, 1);
    EXPECT_EQ(response.functionCode, 3);
    EXPECT_FALSE(response.isException);
    EXPECT_EQ(response.data, (std::vector<uint8_t>{0x12, 0x34, 0x56, 0x78}));
}

TEST(ModbusUtilsTest, TcpResponseNeedsMoreData) {
    std::vector<uint8_t> partial = {0x00, 0x07, 0x00, 0x00, 0x00, 0x07, 0x01, 0x03, 0x04, 0x12};
    ModbusResponse response;
    EXPECT_EQ(ModbusUtils::parseTcpResponse(partial, response), 0u);
}

TEST(ModbusUtilsTest, TcpResponseWithBadProtocolIdIsCorrupt) {
    std::vector<uint8_t> buffer = {0x00, 0x01, 0x00, 0x01, 0x00, 0x03, 0x01, 0x03, 0x00};
    ModbusResponse response;
    EXPECT_EQ(ModbusUtils::parseTcpResponse(buffer, response), ModbusUtils::FRAME_CORRUPT);
}

TEST(ModbusUtilsTest, ParsesExceptionResponse) {
    std::vector<uint8_t> buffer = {0x00, 0x02, 0x00, 0x00, 0x00, 0x03, 0x01, 0x83, 0x02};
    ModbusResponse response;
    ASSERT_EQ(ModbusUtils::parseTcpResponse(buffer, response), buffer.size());
    EXPECT_TRUE(response.isException);
    EXPECT_EQ(response.functionCode, 3);
    EXPECT_EQ(response.exceptionCode, 2);
    EXPECT_EQ(exceptionCodeToString(response.exceptionCode), "illegal data address");
}

TEST(ModbusUtilsTest, RtuResponseCrcMismatchIsCorrupt) {
    std::vector<uint8_t> pdu = {0x03, 0x02, 0x00, 0x2A};
    auto frame = ModbusUtils::wrapRtu(0x01, pdu);

    ModbusResponse response;
    ASSERT_EQ(ModbusUtils::parseRtuResponse(frame, response), frame.size());
    EXPECT_EQ(response.data, (std::vector<uint8_t>{0x00, 0x2A}));

    frame.back() ^= 0xFF;
    EXPECT_EQ(ModbusUtils::parseRtuResponse(frame, response), ModbusUtils::FRAME_CORRUPT);
}

TEST(ModbusUtilsTest, ExtractsBitsLsbFirst) {
    uint8_t data[] = {0b00000101, 0b00000001};
    EXPECT_TRUE(ModbusUtils::extractBit(data, 0, 2));
    EXPECT_FALSE(ModbusUtils::extractBit(data, 1, 2));
    EXPECT_TRUE(ModbusUtils::extractBit(data, 2, 2));
    EXPECT_TRUE(ModbusUtils::extractBit(data, 8, 2));
    EXPECT_FALSE(ModbusUtils::extractBit(data, 16, 2));
}

TEST(ModbusUtilsTest, ParsesConventionalAddressRanges) {
    auto coil = ModbusUtils::parseAddress("1", RegisterType::HOLDING_REGISTER);
    EXPECT_EQ(coil.registerType, RegisterType::COIL);
    EXPECT_EQ(coil.offset, 0);

    auto discrete = ModbusUtils::parseAddress("10005", RegisterType::HOLDING_REGISTER);
    EXPECT_EQ(discrete.registerType, RegisterType::DISCRETE_INPUT);
    EXPECT_EQ(discrete.offset, 4);

    auto input = ModbusUtils::parseAddress("30010", RegisterType::HOLDING_REGISTER);
    EXPECT_EQ(input.registerType, RegisterType::INPUT_REGISTER);
    EXPECT_EQ(input.offset, 9);

    auto holding = ModbusUtils::parseAddress(" 40001 ", RegisterType::COIL);
    EXPECT_EQ(holding.registerType, RegisterType::HOLDING_REGISTER);
    EXPECT_EQ(holding.offset, 0);
}

TEST(ModbusUtilsTest, RawOffsetUsesFallbackRegisterType) {
    auto addr = ModbusUtils::parseAddress("0", RegisterType::INPUT_REGISTER);
    EXPECT_EQ(addr.registerType, RegisterType::INPUT_REGISTER);
    EXPECT_EQ(addr.offset, 0);

    auto high = ModbusUtils::parseAddress("50000", RegisterType::HOLDING_REGISTER);
    EXPECT_EQ(high.registerType, RegisterType::HOLDING_REGISTER);
    EXPECT_EQ(high.offset, 50000);
}

TEST(ModbusUtilsTest, ForcedFunctionCodeAddress) {
    auto addr = ModbusUtils::parseAddress("x=4;100", RegisterType::HOLDING_REGISTER);
    EXPECT_EQ(addr.registerType, RegisterType::INPUT_REGISTER);
    EXPECT_EQ(addr.offset, 100);

    EXPECT_THROW(ModbusUtils::parseAddress("x=6;1", RegisterType::HOLDING_REGISTER), ConfigurationError);
    EXPECT_THROW(ModbusUtils::parseAddress("x=3", RegisterType::HOLDING_REGISTER), ConfigurationError);
}

TEST(ModbusUtilsTest, RejectsMalformedAddresses) {
    EXPECT_THROW(ModbusUtils::parseAddress("abc", RegisterType::HOLDING_REGISTER), ConfigurationError);
    EXPECT_THROW(ModbusUtils::parseAddress("-1", RegisterType::HOLDING_REGISTER), ConfigurationError);
    EXPECT_THROW(ModbusUtils::parseAddress("70000", RegisterType::HOLDING_REGISTER), ConfigurationError);
}

TEST(ModbusTypesTest, RegisterTypeMapping) {
    EXPECT_EQ(parseRegisterType("HOLDING_REGISTER"), RegisterType::HOLDING_REGISTER);
    EXPECT_EQ(parseRegisterType("coil"), RegisterType::COIL);
    EXPECT_EQ(parseRegisterType("input"), RegisterType::INPUT_REGISTER);
    EXPECT_EQ(registerTypeToFuncCode(RegisterType::DISCRETE_INPUT), FuncCodes::READ_DISCRETE_INPUTS);
    EXPECT_FALSE(funcCodeToRegisterType(16).has_value());
    EXPECT_TRUE(isWritable(RegisterType::COIL));
    EXPECT_FALSE(isWritable(RegisterType::INPUT_REGISTER));
    EXPECT_EQ(parseFrameMode("Modbus RTU over TCP"), FrameMode::RTU);
    EXPECT_EQ(parseFrameMode("Modbus TCP"), FrameMode::TCP);
}
