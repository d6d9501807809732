#pragma once

#include "common/utils/AppException.hpp"

#include <trantor/net/EventLoopThreadPool.h>
#include <trantor/net/Resolver.h>
#include <trantor/net/TcpClient.h>

/**
 * @brief 传输层共享 IO 线程池
 *
 * 所有 SocketTransport 的 TcpClient 都挂在这里的 EventLoop 上，首次使用时启动。
 */
class TransportLoopPool {
public:
    static trantor::EventLoop* nextLoop() {
        return instance().pool_->getNextLoop();
    }

    static std::shared_ptr<trantor::Resolver> resolver() {
        return instance().resolver_;
    }

private:
    static constexpr size_t NUM_THREADS = 2;
    static constexpr size_t RESOLVE_TIMEOUT_SEC = 10;

    std::unique_ptr<trantor::EventLoopThreadPool> pool_;
    std::shared_ptr<trantor::Resolver> resolver_;

    TransportLoopPool() {
        pool_ = std::make_unique<trantor::EventLoopThreadPool>(NUM_THREADS, "PlcIoPool");
        pool_->start();
        resolver_ = trantor::Resolver::newResolver(pool_->getNextLoop(), RESOLVE_TIMEOUT_SEC);
        LOG_INFO << "[Transport] IO pool started with " << NUM_THREADS << " threads";
    }

    static TransportLoopPool& instance() {
        static TransportLoopPool pool;
        return pool;
    }
};

/**
 * @brief 阻塞式 TCP 客户端传输层（trantor::TcpClient 之上的同步适配）
 *
 * 每个协议处理器持有一个实例，由采集工作线程同步调用（调用方负责串行化）。
 * 连接、收发都在 IO 线程的 EventLoop 中执行，调用线程通过 future 等待结果：
 *   - open()          runAfter 连接超时，连接回调 / 错误回调兑现 promise
 *   - receiveFrame()  消息回调累积字节，凑齐一帧后兑现；runAfter 接收超时
 *
 * 超时可在运行中调整，下一次 IO 即生效。所有网络故障统一抛出 NetworkError，
 * 错误信息包含 timeout / connection / refused / closed 等关键字，供上层分类。
 */
class SocketTransport {
public:
    /** 帧长度探测函数：返回 0 表示数据不足，SIZE_MAX 表示帧损坏，否则为完整帧长度 */
    using FrameLengthFn = std::function<size_t(const std::vector<uint8_t>&)>;

    SocketTransport(std::string host, uint16_t port, int connectTimeoutMs, int receiveTimeoutMs)
        : host_(std::move(host)), port_(port),
          connectTimeoutMs_(connectTimeoutMs), receiveTimeoutMs_(receiveTimeoutMs) {}

    ~SocketTransport() { close(); }

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    // ==================== 连接管理 ====================

    /**
     * @brief 建立连接（已连接时先关闭旧连接）
     * @throws NetworkError 解析失败 / 拒绝 / 超时
     */
    void open() {
        close();

        auto address = resolveAddress();
        auto session = std::make_shared<Session>();
        session->loop = TransportLoopPool::nextLoop();
        session->endpoint = endpoint();

        auto connected = std::make_shared<std::promise<std::string>>();
        auto result = connected->get_future();
        session->connectWaiter = connected;

        int timeoutMs = connectTimeoutMs();
        session->loop->runInLoop([session, address, timeoutMs] {
            startConnect(session, address, timeoutMs);
        });

        std::string error;
        if (result.wait_for(std::chrono::milliseconds(timeoutMs) + LOOP_GRACE) != std::future_status::ready) {
            error = "connection timeout after " + std::to_string(timeoutMs) + "ms";
        } else {
            error = result.get();
        }

        if (!error.empty()) {
            release(session);
            throw NetworkError(error + " (" + endpoint() + ")");
        }

        session_ = std::move(session);
        LOG_DEBUG << "[Transport] Connected to " << endpoint();
    }

    void close() noexcept {
        if (session_) {
            release(session_);
            session_.reset();
        }
    }

    bool isOpen() const { return session_ && session_->open.load(); }

    /** 运行中调整超时（不重连） */
    void setTimeouts(int connectTimeoutMs, int receiveTimeoutMs) {
        connectTimeoutMs_.store(connectTimeoutMs, std::memory_order_relaxed);
        receiveTimeoutMs_.store(receiveTimeoutMs, std::memory_order_relaxed);
    }

    int connectTimeoutMs() const { return connectTimeoutMs_.load(std::memory_order_relaxed); }
    int receiveTimeoutMs() const { return receiveTimeoutMs_.load(std::memory_order_relaxed); }

    std::string endpoint() const { return host_ + ":" + std::to_string(port_); }

    // ==================== 数据收发 ====================

    /**
     * @brief 投递发送（由 IO 线程写出，写失败表现为后续接收的连接关闭）
     * @throws NetworkError 未连接
     */
    void send(const std::vector<uint8_t>& data) {
        auto session = ensureOpen();
        std::string payload(data.begin(), data.end());
        session->loop->runInLoop([session, payload = std::move(payload)] {
            if (session->conn && session->conn->connected()) {
                session->conn->send(payload);
            }
        });
    }

    /**
     * @brief 接收一个完整帧
     *
     * 累积字节直到 frameLength 给出完整帧长度；多余字节丢弃（请求-应答模式下不应出现）。
     * 整个帧共享一个接收超时。网络错误后连接即关闭。
     *
     * @throws NetworkError 超时 / 对端关闭
     * @throws ProtocolDataError 帧损坏
     */
    std::vector<uint8_t> receiveFrame(const FrameLengthFn& frameLength) {
        auto session = ensureOpen();
        auto promise = std::make_shared<std::promise<std::vector<uint8_t>>>();
        auto future = promise->get_future();
        int timeoutMs = receiveTimeoutMs();

        session->loop->runInLoop([session, frameLength, promise, timeoutMs] {
            awaitFrame(session, frameLength, promise, timeoutMs);
        });

        try {
            if (future.wait_for(std::chrono::milliseconds(timeoutMs) + LOOP_GRACE) != std::future_status::ready) {
                throw NetworkError("receive timeout");
            }
            return future.get();
        } catch (const NetworkError& e) {
            close();
            throw NetworkError(std::string(e.what()) + " (" + endpoint() + ")");
        }
    }

    /** 接收固定长度数据 */
    std::vector<uint8_t> receiveExact(size_t count) {
        return receiveFrame([count](const std::vector<uint8_t>& buf) -> size_t {
            return buf.size() >= count ? count : 0;
        });
    }

    /** 丢弃接收缓冲中残留的字节（如上一次超时后迟到的响应） */
    void discardPending() noexcept {
        if (!session_) return;
        auto session = session_;
        session->loop->runInLoop([session] { session->buffer.clear(); });
    }

private:
    using FramePromise = std::shared_ptr<std::promise<std::vector<uint8_t>>>;

    /** 等待中的一次帧接收 */
    struct PendingFrame {
        FrameLengthFn frameLength;
        FramePromise promise;
        trantor::TimerId timer = 0;
    };

    /**
     * @brief 一次连接的全部状态
     *
     * 除 open 外所有字段只在 loop 线程读写；每次 open() 新建一个，
     * 旧连接的迟到回调只会落在旧 Session 上。
     */
    struct Session {
        trantor::EventLoop* loop = nullptr;
        std::string endpoint;
        std::shared_ptr<trantor::TcpClient> client;
        trantor::TcpConnectionPtr conn;
        std::vector<uint8_t> buffer;
        std::shared_ptr<std::promise<std::string>> connectWaiter;
        trantor::TimerId connectTimer = 0;
        std::optional<PendingFrame> pending;
        std::atomic<bool> open{false};
    };

    /** IO 线程未按时回应时的额外等待 */
    static constexpr std::chrono::milliseconds LOOP_GRACE{1000};

    std::string host_;
    uint16_t port_;
    std::shared_ptr<Session> session_;
    std::atomic<int> connectTimeoutMs_;
    std::atomic<int> receiveTimeoutMs_;

    std::shared_ptr<Session> ensureOpen() const {
        if (!isOpen()) {
            throw NetworkError("connection not open: " + endpoint());
        }
        return session_;
    }

    /** IP 字面量直接使用，主机名交给 trantor::Resolver */
    trantor::InetAddress resolveAddress() const {
        trantor::InetAddress literal(host_, port_, host_.find(':') != std::string::npos);
        if (!literal.isUnspecified()) return literal;

        auto promise = std::make_shared<std::promise<trantor::InetAddress>>();
        auto future = promise->get_future();
        TransportLoopPool::resolver()->resolve(host_, [promise](const trantor::InetAddress& addr) {
            promise->set_value(addr);
        });

        if (future.wait_for(std::chrono::milliseconds(connectTimeoutMs())) != std::future_status::ready) {
            throw NetworkError("connection failed: cannot resolve host " + host_ + " (timeout)");
        }
        auto resolved = future.get();
        if (resolved.isUnspecified() || resolved.toIp() == "0.0.0.0") {
            throw NetworkError("connection failed: cannot resolve host " + host_);
        }
        return trantor::InetAddress(resolved.toIp(), port_, resolved.isIpV6());
    }

    // ==================== loop 线程 ====================

    static void startConnect(const std::shared_ptr<Session>& session, const trantor::InetAddress& address,
                             int timeoutMs) {
        std::weak_ptr<Session> weak = session;
        auto client = std::make_shared<trantor::TcpClient>(
            session->loop, address, "PlcClient_" + session->endpoint);

        client->setConnectionCallback([weak](const trantor::TcpConnectionPtr& conn) {
            auto s = weak.lock();
            if (!s) return;
            if (conn->connected()) {
                conn->setTcpNoDelay(true);
                s->conn = conn;
                s->open = true;
                completeConnect(s, "");
            } else {
                s->open = false;
                s->conn.reset();
                completeConnect(s, "connection closed during handshake");
                failPending(s, NetworkError("connection closed by peer"));
            }
        });

        client->setConnectionErrorCallback([weak] {
            if (auto s = weak.lock()) {
                completeConnect(s, "connection failed: connection refused or unreachable");
            }
        });

        client->setMessageCallback([weak](const trantor::TcpConnectionPtr&, trantor::MsgBuffer* buf) {
            auto s = weak.lock();
            if (s) {
                auto data = reinterpret_cast<const uint8_t*>(buf->peek());
                s->buffer.insert(s->buffer.end(), data, data + buf->readableBytes());
            }
            buf->retrieveAll();
            if (s) deliver(s);
        });

        session->client = client;
        session->connectTimer = session->loop->runAfter(timeoutMs / 1000.0, [weak, timeoutMs] {
            if (auto s = weak.lock()) {
                s->connectTimer = 0;
                completeConnect(s, "connection timeout after " + std::to_string(timeoutMs) + "ms");
            }
        });
        client->connect();
    }

    /** 兑现连接等待，error 为空表示成功 */
    static void completeConnect(const std::shared_ptr<Session>& s, const std::string& error) {
        if (s->connectTimer) {
            s->loop->invalidateTimer(s->connectTimer);
            s->connectTimer = 0;
        }
        if (s->connectWaiter) {
            s->connectWaiter->set_value(error);
            s->connectWaiter.reset();
        }
    }

    static void awaitFrame(const std::shared_ptr<Session>& s, const FrameLengthFn& frameLength,
                           const FramePromise& promise, int timeoutMs) {
        if (!s->conn) {
            promise->set_exception(std::make_exception_ptr(NetworkError("connection closed by peer")));
            return;
        }
        // 同一连接上一次只有一个等待者（调用方串行化）
        failPending(s, NetworkError("receive superseded"));

        std::weak_ptr<Session> weak = s;
        PendingFrame pending{frameLength, promise, 0};
        pending.timer = s->loop->runAfter(timeoutMs / 1000.0, [weak, promise] {
            auto session = weak.lock();
            if (!session || !session->pending || session->pending->promise != promise) return;
            session->pending.reset();
            promise->set_exception(std::make_exception_ptr(NetworkError("receive timeout")));
        });
        s->pending = std::move(pending);
        deliver(s);
    }

    /** 缓冲中已凑齐一帧时交付给等待者 */
    static void deliver(const std::shared_ptr<Session>& s) {
        if (!s->pending || s->buffer.empty()) return;

        size_t len = s->pending->frameLength(s->buffer);
        if (len == 0 || (len != SIZE_MAX && len > s->buffer.size())) return;

        auto pending = std::move(*s->pending);
        s->pending.reset();
        s->loop->invalidateTimer(pending.timer);

        if (len == SIZE_MAX) {
            s->buffer.clear();
            pending.promise->set_exception(std::make_exception_ptr(
                ProtocolDataError("corrupt frame received from " + s->endpoint)));
            return;
        }

        std::vector<uint8_t> frame(s->buffer.begin(), s->buffer.begin() + static_cast<long>(len));
        s->buffer.clear();
        pending.promise->set_value(std::move(frame));
    }

    static void failPending(const std::shared_ptr<Session>& s, const NetworkError& error) {
        if (!s->pending) return;
        auto pending = std::move(*s->pending);
        s->pending.reset();
        s->loop->invalidateTimer(pending.timer);
        pending.promise->set_exception(std::make_exception_ptr(error));
    }

    /** 在 loop 线程中断开并释放 TcpClient */
    static void release(const std::shared_ptr<Session>& session) noexcept {
        session->open = false;
        auto s = session;
        s->loop->runInLoop([s] {
            completeConnect(s, "connection closed");
            failPending(s, NetworkError("connection closed"));
            if (s->conn) {
                s->conn->forceClose();
                s->conn.reset();
            }
            if (s->client) {
                s->client->stop();
                s->client.reset();
            }
            s->buffer.clear();
        });
    }
};
