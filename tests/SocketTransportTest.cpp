#include <gtest/gtest.h>

#include "common/network/SocketTransport.hpp"
#include "common/protocol/ProtocolHandler.hpp"
#include "LoopbackServer.hpp"

using testing_support::LoopbackServer;

namespace {

/** 首字节为长度的简单帧，0xFF 视为损坏 */
size_t lengthPrefixed(const std::vector<uint8_t>& buf) {
    if (buf.empty()) return 0;
    if (buf[0] == 0xFF) return SIZE_MAX;
    return buf.size() >= buf[0] ? buf[0] : 0;
}

/** 每收到 1 字节命令返回对应的脚本应答，命令 0 表示不应答 */
class ScriptedPeer {
public:
    int port() const { return server_.port(); }

private:
    LoopbackServer server_{[](int fd) {
        while (true) {
            uint8_t cmd = 0;
            if (!LoopbackServer::readExact(fd, &cmd, 1)) return;
            switch (cmd) {
                case 1: LoopbackServer::sendAll(fd, {3, 0xAA, 0xBB}); break;
                case 2: LoopbackServer::sendAll(fd, {2, 0x01, 0x99, 0x99}); break;    // 尾部多余字节
                case 3: LoopbackServer::sendAll(fd, {0xFF, 0x00}); break;
                case 4: return;                                                        // 断开
                default: break;
            }
        }
    }};
};

}  // namespace

TEST(SocketTransportTest, ReceivesFramesAndDropsTrailingBytes) {
    ScriptedPeer peer;
    SocketTransport transport("127.0.0.1", static_cast<uint16_t>(peer.port()), 1000, 1000);
    transport.open();
    ASSERT_TRUE(transport.isOpen());

    transport.send({1});
    EXPECT_EQ(transport.receiveFrame(&lengthPrefixed), (std::vector<uint8_t>{3, 0xAA, 0xBB}));

    transport.send({2});
    EXPECT_EQ(transport.receiveFrame(&lengthPrefixed), (std::vector<uint8_t>{2, 0x01}));

    transport.discardPending();
    transport.send({1});
    EXPECT_EQ(transport.receiveExact(3), (std::vector<uint8_t>{3, 0xAA, 0xBB}));
}

TEST(SocketTransportTest, CorruptFrameKeepsConnection) {
    ScriptedPeer peer;
    SocketTransport transport("127.0.0.1", static_cast<uint16_t>(peer.port()), 1000, 1000);
    transport.open();

    transport.send({3});
    EXPECT_THROW(transport.receiveFrame(&lengthPrefixed), ProtocolDataError);
    EXPECT_TRUE(transport.isOpen());
}

TEST(SocketTransportTest, ReceiveTimeoutClosesConnection) {
    ScriptedPeer peer;
    SocketTransport transport("127.0.0.1", static_cast<uint16_t>(peer.port()), 1000, 200);
    transport.open();

    transport.send({0});
    try {
        transport.receiveFrame(&lengthPrefixed);
        FAIL() << "expected NetworkError";
    } catch (const NetworkError& e) {
        EXPECT_NE(std::string(e.what()).find("receive timeout"), std::string::npos) << e.what();
        EXPECT_TRUE(ProtocolHandler::isNetworkError(e.what()));
    }
    EXPECT_FALSE(transport.isOpen());
    EXPECT_THROW(transport.send({1}), NetworkError);
}

TEST(SocketTransportTest, PeerCloseIsNetworkError) {
    ScriptedPeer peer;
    SocketTransport transport("127.0.0.1", static_cast<uint16_t>(peer.port()), 1000, 1000);
    transport.open();

    transport.send({4});
    try {
        transport.receiveFrame(&lengthPrefixed);
        FAIL() << "expected NetworkError";
    } catch (const NetworkError& e) {
        EXPECT_NE(std::string(e.what()).find("closed"), std::string::npos) << e.what();
    }
    EXPECT_FALSE(transport.isOpen());

    // 同一实例可重新打开
    transport.open();
    transport.send({1});
    EXPECT_EQ(transport.receiveExact(3).size(), 3u);
}

TEST(SocketTransportTest, RefusedConnectReportsNetworkError) {
    int port = 0;
    {
        ScriptedPeer closed;
        port = closed.port();
    }

    SocketTransport transport("127.0.0.1", static_cast<uint16_t>(port), 500, 500);
    try {
        transport.open();
        FAIL() << "expected NetworkError";
    } catch (const NetworkError& e) {
        EXPECT_TRUE(ProtocolHandler::isNetworkError(e.what())) << e.what();
    }
    EXPECT_FALSE(transport.isOpen());
}
