#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace testing_support {

/**
 * @brief 本机回环 TCP 服务端（127.0.0.1，随机端口）
 *
 * 单线程按顺序服务客户端，每个连接交给 session 处理，session 返回即关闭该连接
 * 并等待下一个客户端。作为 PLC 从站的替身使用。
 */
class LoopbackServer {
public:
    using Session = std::function<void(int fd)>;

    explicit LoopbackServer(Session session) : session_(std::move(session)) {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listenFd_, 4);

        socklen_t len = sizeof(addr);
        ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        stopping_ = true;
        ::shutdown(listenFd_, SHUT_RDWR);
        dropClient();
        thread_.join();
        ::close(listenFd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    int port() const { return port_; }

    /** 已接受的连接数 */
    int accepted() const { return accepted_.load(); }

    /** 断开当前客户端（模拟设备掉线） */
    void dropClient() {
        std::lock_guard lock(mutex_);
        if (clientFd_ >= 0) ::shutdown(clientFd_, SHUT_RDWR);
    }

    static bool readExact(int fd, uint8_t* buf, size_t n) {
        size_t got = 0;
        while (got < n) {
            ssize_t r = ::recv(fd, buf + got, n - got, 0);
            if (r <= 0) return false;
            got += static_cast<size_t>(r);
        }
        return true;
    }

    static void sendAll(int fd, const std::vector<uint8_t>& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }

private:
    Session session_;
    int listenFd_ = -1;
    int clientFd_ = -1;
    int port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<int> accepted_{0};
    std::mutex mutex_;
    std::thread thread_;

    void serve() {
        while (!stopping_) {
            int fd = ::accept(listenFd_, nullptr, nullptr);
            if (fd < 0) return;
            ++accepted_;
            {
                std::lock_guard lock(mutex_);
                clientFd_ = fd;
            }
            session_(fd);
            {
                std::lock_guard lock(mutex_);
                clientFd_ = -1;
            }
            ::close(fd);
        }
    }
};

}  // namespace testing_support
