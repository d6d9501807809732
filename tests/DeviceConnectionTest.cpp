#include <gtest/gtest.h>

#include "TestHelpers.hpp"

using namespace testing_support;

namespace {

class DeviceConnectionTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeBehavior> behavior = std::make_shared<FakeBehavior>();
    std::shared_ptr<MemoryTimeSeriesStore> store = std::make_shared<MemoryTimeSeriesStore>();
    Device device = makeDevice(1, "PLC-1", {"40001", "40002"});

    std::unique_ptr<DeviceConnection> makeConnection() {
        return std::make_unique<DeviceConnection>(device, std::make_unique<FakeHandler>(device, behavior), store);
    }
};

}  // namespace

TEST_F(DeviceConnectionTest, ConnectSucceeds) {
    auto conn = makeConnection();
    EXPECT_TRUE(conn->connect());
    EXPECT_TRUE(conn->isConnected());

    auto status = conn->getStatus();
    EXPECT_TRUE(status["is_connected"].asBool());
    EXPECT_EQ(status["state"].asString(), "connected");
    EXPECT_EQ(status["status"].asString(), Constants::DEVICE_STATUS_ONLINE);
    EXPECT_TRUE(status["last_error"].isNull());
    EXPECT_FALSE(status["last_connect_time"].isNull());

    // 已连接时不重复握手
    EXPECT_TRUE(conn->connect());
    EXPECT_EQ(behavior->connects.load(), 1);
}

TEST_F(DeviceConnectionTest, FailedConnectEntersBackoffAndRecordsError) {
    behavior->connectOk = false;
    auto conn = makeConnection();

    EXPECT_FALSE(conn->connect());
    EXPECT_EQ(conn->status(), ConnectionStatus::Backoff);
    EXPECT_EQ(conn->retryCount(), 1);
    EXPECT_EQ(conn->lastError(), "connection refused");

    auto errors = store->errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].errorType, "connection_failed");
    EXPECT_EQ(errors[0].deviceName, "PLC-1");

    // 退避窗口内（2 秒）跳过重连
    behavior->connectOk = true;
    EXPECT_FALSE(conn->connect());
    EXPECT_EQ(behavior->connects.load(), 1);

    auto status = conn->getStatus();
    EXPECT_EQ(status["state"].asString(), "backoff");
    EXPECT_EQ(status["retry_count"].asInt(), 1);
}

TEST_F(DeviceConnectionTest, ReadWithoutSessionReturnsNulls) {
    auto conn = makeConnection();
    auto result = conn->read();
    EXPECT_FALSE(result.isOnline);
    ASSERT_EQ(result.values.size(), 2u);
    EXPECT_FALSE(result.values.at("40001").has_value());
    EXPECT_EQ(behavior->reads.load(), 0);
}

TEST_F(DeviceConnectionTest, ReadReturnsValues) {
    behavior->setValue("40001", 12);
    auto conn = makeConnection();
    ASSERT_TRUE(conn->connect());

    auto result = conn->read();
    EXPECT_TRUE(result.isOnline);
    EXPECT_EQ(result.values.at("40001"), 12.0);
    EXPECT_FALSE(result.values.at("40002").has_value());
    EXPECT_EQ(result.successCount(), 1u);
}

TEST_F(DeviceConnectionTest, OfflineReadDropsSession) {
    auto conn = makeConnection();
    ASSERT_TRUE(conn->connect());

    behavior->online = false;
    auto result = conn->read();
    EXPECT_FALSE(result.isOnline);
    EXPECT_FALSE(conn->isConnected());
    EXPECT_EQ(conn->status(), ConnectionStatus::Backoff);
    EXPECT_EQ(conn->lastError(), "receive timeout");

    // 协议层上报一条 timeout，连接层再记录一条 connection_failed
    auto errors = store->errors();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].errorType, "timeout");
    EXPECT_EQ(errors[1].errorType, "connection_failed");
}

TEST_F(DeviceConnectionTest, WriteDelegatesToHandler) {
    auto conn = makeConnection();
    ASSERT_TRUE(conn->connect());

    EXPECT_TRUE(conn->write("40010", 42));
    {
        std::lock_guard lock(behavior->mutex);
        ASSERT_EQ(behavior->writes.size(), 1u);
        EXPECT_EQ(behavior->writes[0].first, "40010");
        EXPECT_EQ(behavior->writes[0].second, 42.0);
    }

    behavior->writeOk = false;
    EXPECT_FALSE(conn->write("40010", 1));
    EXPECT_TRUE(conn->isConnected());
}

TEST_F(DeviceConnectionTest, InvalidWriteThrowsBeforeIo) {
    auto conn = makeConnection();
    ASSERT_TRUE(conn->connect());
    EXPECT_THROW(conn->write("", 1), ConfigurationError);
    EXPECT_THROW(conn->write("40001", std::nan("")), ConfigurationError);
    EXPECT_THROW(conn->write("40001", 1e11), ConfigurationError);
    EXPECT_THROW(conn->write(std::string(101, '4'), 1), ConfigurationError);

    std::lock_guard lock(behavior->mutex);
    EXPECT_TRUE(behavior->writes.empty());
}

TEST_F(DeviceConnectionTest, TimeoutUpdateReachesHandler) {
    auto conn = makeConnection();
    conn->updateTimeouts(1500, 2500);
    EXPECT_EQ(behavior->connectTimeoutMs.load(), 1500);
    EXPECT_EQ(behavior->receiveTimeoutMs.load(), 2500);
}

TEST_F(DeviceConnectionTest, DisconnectIsIdempotent) {
    auto conn = makeConnection();
    ASSERT_TRUE(conn->connect());
    conn->disconnect();
    conn->disconnect();
    EXPECT_EQ(conn->status(), ConnectionStatus::Disconnected);
    EXPECT_EQ(conn->getStatus()["status"].asString(), Constants::DEVICE_STATUS_OFFLINE);
}
