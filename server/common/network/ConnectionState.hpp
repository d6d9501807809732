#pragma once

#include "common/utils/Constants.hpp"

#include <chrono>
#include <cmath>
#include <string>

/**
 * @brief 设备连接状态枚举
 *
 * Backoff 表示上次连接（或读取）失败，处于退避等待中。
 */
enum class ConnectionStatus {
    Disconnected,  // 未连接或已主动断开
    Connecting,    // 正在建立连接
    Connected,     // 会话可用
    Backoff        // 失败后退避等待
};

inline std::string connectionStatusToString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Backoff:      return "backoff";
    }
    return "disconnected";
}

/**
 * @brief 指数退避重连策略
 *
 * - 延迟 = 2^n 秒（n 为连续失败次数），最大 5 分钟
 * - 无抖动，无最大重试限制
 */
class ReconnectPolicy {
public:
    using Clock = std::chrono::steady_clock;

    /** 连续失败 n 次后的等待时长（秒），n = 0 时为 1 秒 */
    static double delayFor(int attempts) {
        double delay = std::pow(2.0, static_cast<double>((std::max)(attempts, 0)));
        return (std::min)(delay, Constants::RECONNECT_MAX_DELAY_SEC);
    }

    double getDelay() const { return delayFor(attempts_); }

    /**
     * @brief 当前是否仍处于退避窗口内
     */
    bool inBackoff(Clock::time_point now) const {
        if (attempts_ <= 0) return false;
        auto elapsed = std::chrono::duration<double>(now - lastAttempt_).count();
        return elapsed < getDelay();
    }

    void recordAttempt(Clock::time_point when) { lastAttempt_ = when; }
    void recordFailure() { ++attempts_; }
    void reset() { attempts_ = 0; }

    int attempts() const { return attempts_; }
    Clock::time_point lastAttempt() const { return lastAttempt_; }

private:
    int attempts_ = 0;
    Clock::time_point lastAttempt_{};
};

/**
 * @brief 设备连接状态机
 *
 * 每个 DeviceConnection 持有一个实例，所有状态转换集中在此。不自带锁，
 * 由 DeviceConnection 的互斥量保护。
 *
 * 状态转换表：
 *   Disconnected →[attempt]→ Connecting →[connected]→ Connected
 *   Connecting   →[failure]→ Backoff    →[attempt]→ Connecting
 *   Connected    →[failure]→ Backoff            （读取时设备离线）
 *   Any          →[disconnect]→ Disconnected
 */
class ConnectionStateMachine {
public:
    using Clock = ReconnectPolicy::Clock;

    ConnectionStatus status() const { return status_; }
    std::string statusString() const { return connectionStatusToString(status_); }
    bool isConnected() const { return status_ == ConnectionStatus::Connected; }

    /**
     * @brief 是否跳过本次连接尝试（已连接，或仍在退避窗口内）
     */
    bool shouldSkipConnect(Clock::time_point now = Clock::now()) const {
        if (isConnected()) return true;
        return policy_.inBackoff(now);
    }

    // ==================== 状态事件 ====================

    void onAttempt(Clock::time_point now = Clock::now()) {
        policy_.recordAttempt(now);
        transition(ConnectionStatus::Connecting, "attempt");
    }

    void onConnected(std::string wallClock) {
        transition(ConnectionStatus::Connected, "connected");
        policy_.reset();
        lastError_.clear();
        lastConnectTime_ = std::move(wallClock);
    }

    void onFailure(const std::string& reason) {
        lastError_ = reason;
        policy_.recordFailure();
        transition(ConnectionStatus::Backoff, "failure");
    }

    void onDisconnect() {
        transition(ConnectionStatus::Disconnected, "disconnect");
    }

    // ==================== 查询 ====================

    int retryCount() const { return policy_.attempts(); }
    double currentDelay() const { return policy_.getDelay(); }
    const std::string& lastError() const { return lastError_; }
    const std::string& lastConnectTime() const { return lastConnectTime_; }
    Clock::time_point lastAttempt() const { return policy_.lastAttempt(); }

private:
    ConnectionStatus status_ = ConnectionStatus::Disconnected;
    ReconnectPolicy policy_;
    std::string lastError_;
    std::string lastConnectTime_;

    void transition(ConnectionStatus newStatus, const char* event) {
        if (status_ != newStatus) {
            LOG_TRACE << "ConnFSM: " << connectionStatusToString(status_)
                      << " →[" << event << "]→ " << connectionStatusToString(newStatus);
            status_ = newStatus;
        }
    }
};
