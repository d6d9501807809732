#include <gtest/gtest.h>

#include "common/protocol/ProtocolFactory.hpp"
#include "modules/collector/DataPipeline.hpp"
#include "LoopbackServer.hpp"

using namespace modbus;
using testing_support::LoopbackServer;

namespace {

/**
 * @brief 本机回环 Modbus TCP 从站
 *
 * 单线程顺序处理一个客户端：100 个保持/输入寄存器（共用）和 100 个线圈。
 * 站号 0 视为广播，执行写入但不应答。
 */
class LoopbackSlave {
public:
    int port() const { return server_.port(); }

    void setRegister(size_t index, uint16_t value) {
        std::lock_guard lock(mutex_);
        registers_[index] = value;
    }

    uint16_t reg(size_t index) {
        std::lock_guard lock(mutex_);
        return registers_[index];
    }

    void setCoil(size_t index, bool on) {
        std::lock_guard lock(mutex_);
        coils_[index] = on;
    }

    bool coil(size_t index) {
        std::lock_guard lock(mutex_);
        return coils_[index];
    }

    void dropClient() { server_.dropClient(); }

private:
    std::mutex mutex_;
    std::array<uint16_t, 100> registers_{};
    std::array<bool, 100> coils_{};
    // 最后构造、最先析构：服务线程退出前寄存器仍然有效
    testing_support::LoopbackServer server_{[this](int fd) { handleClient(fd); }};

    void handleClient(int fd) {
        while (true) {
            uint8_t header[7];
            if (!LoopbackServer::readExact(fd, header, sizeof(header))) return;
            size_t length = (static_cast<size_t>(header[4]) << 8) | header[5];
            if (length < 2) return;

            std::vector<uint8_t> pdu(length - 1);
            if (!LoopbackServer::readExact(fd, pdu.data(), pdu.size())) return;

            auto reply = process(pdu);
            uint8_t unit = header[6];
            if (unit == 0) continue;

            uint16_t tid = static_cast<uint16_t>((header[0] << 8) | header[1]);
            LoopbackServer::sendAll(fd, ModbusUtils::wrapTcp(tid, unit, reply));
        }
    }

    static std::vector<uint8_t> exception(uint8_t fc, uint8_t code) {
        return {static_cast<uint8_t>(fc | 0x80), code};
    }

    std::vector<uint8_t> process(const std::vector<uint8_t>& pdu) {
        std::lock_guard lock(mutex_);
        uint8_t fc = pdu[0];
        if (pdu.size() < 5) return exception(fc, 0x03);

        uint16_t addr = static_cast<uint16_t>((pdu[1] << 8) | pdu[2]);
        uint16_t value = static_cast<uint16_t>((pdu[3] << 8) | pdu[4]);

        switch (fc) {
            case FuncCodes::READ_HOLDING_REGISTERS:
            case FuncCodes::READ_INPUT_REGISTERS: {
                if (addr + value > registers_.size()) return exception(fc, 0x02);
                std::vector<uint8_t> reply = {fc, static_cast<uint8_t>(value * 2)};
                for (uint16_t i = 0; i < value; ++i) {
                    reply.push_back(static_cast<uint8_t>(registers_[addr + i] >> 8));
                    reply.push_back(static_cast<uint8_t>(registers_[addr + i] & 0xFF));
                }
                return reply;
            }
            case FuncCodes::READ_COILS:
            case FuncCodes::READ_DISCRETE_INPUTS: {
                if (addr + value > coils_.size()) return exception(fc, 0x02);
                std::vector<uint8_t> bits((value + 7) / 8, 0);
                for (uint16_t i = 0; i < value; ++i) {
                    if (coils_[addr + i]) bits[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
                }
                std::vector<uint8_t> reply = {fc, static_cast<uint8_t>(bits.size())};
                reply.insert(reply.end(), bits.begin(), bits.end());
                return reply;
            }
            case FuncCodes::WRITE_SINGLE_REGISTER:
                if (addr >= registers_.size()) return exception(fc, 0x02);
                registers_[addr] = value;
                return pdu;
            case FuncCodes::WRITE_SINGLE_COIL:
                if (addr >= coils_.size()) return exception(fc, 0x02);
                coils_[addr] = value == 0xFF00;
                return pdu;
            default:
                return exception(fc, 0x01);
        }
    }
};

AddressConfig address(const std::string& addr, ValueType type = ValueType::Int16) {
    AddressConfig cfg;
    cfg.id = addr;
    cfg.address = addr;
    cfg.type = type;
    return cfg;
}

class ModbusHandlerTest : public ::testing::Test {
protected:
    LoopbackSlave slave;

    Device device() const {
        Device d;
        d.id = 1;
        d.name = "slave";
        d.plcType = "Modbus TCP";
        d.protocol = "modbus_tcp";
        d.host = "127.0.0.1";
        d.port = slave.port();
        return d;
    }
};

}  // namespace

TEST_F(ModbusHandlerTest, ReadsRegistersCoilsAndFloats) {
    slave.setRegister(0, 0xFFFE);
    slave.setRegister(2, 0x70A4);
    slave.setRegister(3, 0x3F9D);
    slave.setCoil(0, true);

    ModbusHandler handler(device(), 1000, 1000);
    ASSERT_TRUE(handler.connect()) << handler.lastError();
    EXPECT_TRUE(handler.isConnected());
    EXPECT_EQ(handler.protocolName(), "Modbus TCP");

    auto result = handler.readAddresses({
        address("40001"),
        address("40003", ValueType::Float),
        address("1"),
        address("40100", ValueType::Float)
    });

    EXPECT_TRUE(result.isOnline);
    EXPECT_EQ(result.values.at("40001"), -2.0);
    ASSERT_TRUE(result.values.at("40003").has_value());
    EXPECT_FLOAT_EQ(static_cast<float>(*result.values.at("40003")), 1.23f);
    EXPECT_EQ(result.values.at("1"), 1.0);
    // 超出从站地址范围：异常应答，设备仍在线
    EXPECT_FALSE(result.values.at("40100").has_value());
    EXPECT_TRUE(handler.isConnected());
}

TEST_F(ModbusHandlerTest, WritesRegistersAndCoils) {
    ModbusHandler handler(device(), 1000, 1000);
    ASSERT_TRUE(handler.connect());

    EXPECT_TRUE(handler.writeAddress("40010", 1234));
    EXPECT_EQ(slave.reg(9), 1234);

    EXPECT_TRUE(handler.writeAddress("5", 1));
    EXPECT_TRUE(slave.coil(4));

    EXPECT_TRUE(handler.writeAddress("40011", -2));
    EXPECT_EQ(slave.reg(10), 0xFFFE);
}

TEST_F(ModbusHandlerTest, ReadOnlyAreasRejectWrites) {
    ModbusHandler handler(device(), 1000, 1000);
    ASSERT_TRUE(handler.connect());
    EXPECT_THROW(handler.writeAddress("30001", 1), ConfigurationError);
    EXPECT_THROW(handler.writeAddress("10001", 1), ConfigurationError);
    EXPECT_TRUE(handler.isConnected());
}

TEST_F(ModbusHandlerTest, WriteBitInRegisterKeepsOtherBits) {
    slave.setRegister(4, 0x0001);
    ModbusHandler handler(device(), 1000, 1000);
    ASSERT_TRUE(handler.connect());

    EXPECT_TRUE(handler.writeBitInRegister("40005", 3, true));
    EXPECT_EQ(slave.reg(4), 0x0009);
    EXPECT_TRUE(handler.writeBitInRegister("40005", 0, false));
    EXPECT_EQ(slave.reg(4), 0x0008);

    EXPECT_THROW(handler.writeBitInRegister("40005", 16, true), ConfigurationError);
    EXPECT_THROW(handler.writeBitInRegister("1", 0, true), ConfigurationError);
}

TEST_F(ModbusHandlerTest, BroadcastWriteExpectsNoReply) {
    ModbusHandler handler(device(), 1000, 1000);
    ASSERT_TRUE(handler.connect());

    EXPECT_TRUE(handler.broadcastWrite("40020", 7));
    auto result = handler.readAddresses({address("40020")});
    EXPECT_EQ(result.values.at("40020"), 7.0);
}

TEST_F(ModbusHandlerTest, WriteWithoutSessionFails) {
    ModbusHandler handler(device(), 1000, 1000);
    EXPECT_FALSE(handler.writeAddress("40001", 1));
    EXPECT_EQ(handler.lastError(), "设备未连接");
}

TEST_F(ModbusHandlerTest, DroppedPeerMarksDeviceOffline) {
    ModbusHandler handler(device(), 1000, 1000);
    ASSERT_TRUE(handler.connect());
    ASSERT_TRUE(handler.readAddresses({address("40001")}).isOnline);

    slave.dropClient();
    auto result = handler.readAddresses({address("40001"), address("40002")});
    EXPECT_FALSE(result.isOnline);
    EXPECT_FALSE(result.values.at("40001").has_value());
    EXPECT_FALSE(result.values.at("40002").has_value());
    EXPECT_FALSE(handler.isConnected());
    EXPECT_TRUE(ProtocolHandler::isNetworkError(handler.lastError())) << handler.lastError();
}

TEST(ModbusHandlerConnectTest, RefusedConnectionReportsError) {
    // 取一个空闲端口后立即关闭监听
    int port = 0;
    {
        LoopbackSlave closed;
        port = closed.port();
    }

    Device d;
    d.name = "offline";
    d.plcType = "Modbus TCP";
    d.host = "127.0.0.1";
    d.port = port;

    ModbusHandler handler(d, 500, 500);
    EXPECT_FALSE(handler.connect());
    EXPECT_FALSE(handler.isConnected());
    EXPECT_TRUE(ProtocolHandler::isNetworkError(handler.lastError())) << handler.lastError();
}

TEST(ModbusHandlerConnectTest, InvalidEndpointIsConfigurationError) {
    Device d;
    d.name = "no-host";
    ModbusHandler handler(d, 500, 500);
    EXPECT_THROW(handler.createInstance(), ConfigurationError);

    d.host = "127.0.0.1";
    d.port = 70000;
    ModbusHandler badPort(d, 500, 500);
    EXPECT_THROW(badPort.createInstance(), ConfigurationError);
}

TEST(ModbusHandlerConnectTest, HandlerUsesResolvedDeviceStation) {
    Device d;
    d.plcType = "Modbus RTU over TCP";
    d.protocol = "modbus_rtu_over_tcp:3";
    d.stationId = Device::defaultStation(d.protocol, 1);
    d.addressConfigs = AddressConfig::parseList(R"([
        {"address": "40001", "stationId": 1},
        {"address": "40001"}
    ])");

    ModbusHandler handler(d, 1000, 1000);
    EXPECT_EQ(handler.stationId(), 3);

    // 存储键、数据点站号与处理器使用同一个默认站号
    auto first = d.storageKey(d.addressConfigs[0]);
    auto second = d.storageKey(d.addressConfigs[1]);
    EXPECT_EQ(first, "40001_s1");
    EXPECT_EQ(second, "40001_s3");

    ReadResult result;
    result.isOnline = true;
    result.values[first] = 10;
    result.values[second] = 30;
    auto points = DataPipeline::buildPoints(d, result, 1.0);
    ASSERT_EQ(points.size(), 2u);
    std::map<std::string, int> stations;
    for (const auto& p : points) stations[p.address] = p.stationId;
    EXPECT_EQ(stations.at("40001_s1"), 1);
    EXPECT_EQ(stations.at("40001_s3"), 3);
}

TEST(ProtocolFactoryTest, DetectsFamilyFromTypeAndProtocol) {
    bool recognized = false;
    EXPECT_EQ(ProtocolFactory::detect("Modbus RTU over TCP", "", &recognized), ProtocolFamily::Modbus);
    EXPECT_TRUE(recognized);
    EXPECT_EQ(ProtocolFactory::detect("欧姆龙 CP1H", ""), ProtocolFamily::OmronFins);
    EXPECT_EQ(ProtocolFactory::detect("PLC", "fins"), ProtocolFamily::OmronFins);
    EXPECT_EQ(ProtocolFactory::detect("西门子 S7-1200", ""), ProtocolFamily::SiemensS7);

    EXPECT_EQ(ProtocolFactory::detect("Mitsubishi", "mc", &recognized), ProtocolFamily::Modbus);
    EXPECT_FALSE(recognized);
}

TEST(ProtocolFactoryTest, CreatesMatchingHandler) {
    Device d;
    d.name = "x";
    d.host = "127.0.0.1";

    d.plcType = "Omron NJ";
    EXPECT_EQ(ProtocolFactory::create(d, 1000, 1000)->protocolName(), Constants::PROTOCOL_OMRON_FINS);
    d.plcType = "Siemens S7-1500";
    EXPECT_EQ(ProtocolFactory::create(d, 1000, 1000)->protocolName(), Constants::PROTOCOL_SIEMENS_S7);
    d.plcType = "Modbus RTU over TCP";
    EXPECT_EQ(ProtocolFactory::create(d, 1000, 1000)->protocolName(), Constants::PROTOCOL_MODBUS_RTU_OVER_TCP);
    d.plcType = "unknown";
    EXPECT_EQ(ProtocolFactory::create(d, 1000, 1000)->protocolName(), Constants::PROTOCOL_MODBUS_TCP);

    EXPECT_TRUE(ProtocolFactory::supportedProtocols().isArray());
}
