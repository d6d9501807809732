#pragma once

#include "TimeSeriesStore.hpp"
#include "common/utils/AppException.hpp"

/**
 * @brief 内存时序存储
 *
 * 单机调试与测试使用。setFailing(true) 模拟存储不可用：
 * 写入返回 false / 0，查询抛出 PersistenceError。
 */
class MemoryTimeSeriesStore : public TimeSeriesStore {
public:
    void setFailing(bool failing) { failing_ = failing; }

    bool writePoint(const DataPoint& point) override {
        std::lock_guard lock(mutex_);
        if (failing_) return false;
        points_.push_back(point);
        return true;
    }

    size_t writeBatch(const std::vector<DataPoint>& points) override {
        std::lock_guard lock(mutex_);
        if (failing_) return 0;
        points_.insert(points_.end(), points.begin(), points.end());
        ++batchWrites_;
        return points.size();
    }

    bool writeCommunicationError(const CommunicationError& error) override {
        std::lock_guard lock(mutex_);
        if (failing_) return false;
        errors_.push_back(error);
        return true;
    }

    bool writeCollectLog(const CollectLog& log) override {
        std::lock_guard lock(mutex_);
        if (failing_) return false;
        logs_.push_back(log);
        return true;
    }

    std::vector<StoredPoint> queryPoints(std::optional<int> deviceId,
                                         TimePoint start, TimePoint end) override {
        std::lock_guard lock(mutex_);
        throwIfFailing();

        std::vector<StoredPoint> result;
        for (const auto& p : points_) {
            if (deviceId && p.deviceId != *deviceId) continue;
            if (p.timestamp < start || p.timestamp > end) continue;
            result.push_back({p.deviceId, p.deviceName, p.address, p.scaledValue,
                              p.rawValue, p.quality, p.timestamp});
        }
        std::stable_sort(result.begin(), result.end(), [](const StoredPoint& a, const StoredPoint& b) {
            if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
            return a.address < b.address;
        });
        return result;
    }

    std::vector<CommunicationError> queryCommunicationErrors(std::optional<int> deviceId,
                                                             TimePoint start, TimePoint end) override {
        std::lock_guard lock(mutex_);
        throwIfFailing();

        std::vector<CommunicationError> result;
        for (const auto& e : errors_) {
            if (deviceId && e.deviceId != *deviceId) continue;
            if (e.timestamp < start || e.timestamp > end) continue;
            result.push_back(e);
        }
        return result;
    }

    std::vector<CollectLog> queryCollectLogs(int deviceId, TimePoint start, TimePoint end) override {
        std::lock_guard lock(mutex_);
        throwIfFailing();

        std::vector<CollectLog> result;
        for (const auto& l : logs_) {
            if (l.deviceId != deviceId) continue;
            if (l.timestamp < start || l.timestamp > end) continue;
            result.push_back(l);
        }
        return result;
    }

    Json::Value queryStatistics(std::optional<int> deviceId, TimePoint start, TimePoint end) override {
        std::lock_guard lock(mutex_);
        auto stats = emptyStatistics();
        if (failing_) {
            stats["error"] = "存储不可用";
            return stats;
        }

        int total = 0;
        for (const auto& p : points_) {
            if (deviceId && p.deviceId != *deviceId) continue;
            if (p.timestamp < start || p.timestamp > end) continue;
            ++total;
            stats["addresses"][p.address] = stats["addresses"].get(p.address, 0).asInt() + 1;
        }
        stats["total_points"] = total;
        return stats;
    }

    size_t deleteBefore(TimePoint cutoff) override {
        std::lock_guard lock(mutex_);
        if (failing_) return 0;
        auto before = points_.size();
        std::erase_if(points_, [cutoff](const DataPoint& p) { return p.timestamp < cutoff; });
        return before - points_.size();
    }

    // ==================== 测试观察接口 ====================

    std::vector<DataPoint> points() const {
        std::lock_guard lock(mutex_);
        return points_;
    }

    std::vector<CommunicationError> errors() const {
        std::lock_guard lock(mutex_);
        return errors_;
    }

    std::vector<CollectLog> logs() const {
        std::lock_guard lock(mutex_);
        return logs_;
    }

    int batchWrites() const {
        std::lock_guard lock(mutex_);
        return batchWrites_;
    }

private:
    mutable std::mutex mutex_;
    std::atomic<bool> failing_{false};
    std::vector<DataPoint> points_;
    std::vector<CommunicationError> errors_;
    std::vector<CollectLog> logs_;
    int batchWrites_ = 0;

    void throwIfFailing() const {
        if (failing_) throw PersistenceError("存储不可用");
    }
};
