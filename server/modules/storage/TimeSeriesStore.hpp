#pragma once

#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 单个采集点（追加写入）
 */
struct DataPoint {
    int deviceId = 0;
    std::string deviceName;
    std::string address;           // 存储键（RTU over TCP 下带 _s{站号}）
    double rawValue = 0.0;
    double scaledValue = 0.0;
    std::string quality = "good";
    double responseTimeMs = 0.0;
    TimestampHelper::TimePoint timestamp = TimestampHelper::Clock::now();

    // 标签
    int stationId = 1;
    std::string registerType;
    int functionCode = 3;
    std::string dataType;
    std::string unit;
    std::string byteOrder;
    bool wordSwap = false;
    int scanRate = 1000;

    double value() const { return scaledValue; }
};

/**
 * @brief 设备单次采集结果日志
 */
struct CollectLog {
    int deviceId = 0;
    std::string status;            // success | failed | error
    std::string message;
    double responseTimeMs = 0.0;
    TimestampHelper::TimePoint timestamp = TimestampHelper::Clock::now();
};

/**
 * @brief 通讯错误记录
 */
struct CommunicationError {
    int deviceId = 0;
    std::string deviceName;
    std::string errorType = "connection_failed";
    std::string message;
    std::string severity = "high";
    std::optional<std::string> address;
    std::optional<int> stationId;
    TimestampHelper::TimePoint timestamp = TimestampHelper::Clock::now();
};

/**
 * @brief 查询返回的已存储数据点
 */
struct StoredPoint {
    int deviceId = 0;
    std::string deviceName;
    std::string address;
    double value = 0.0;
    double rawValue = 0.0;
    std::string quality;
    TimestampHelper::TimePoint timestamp;
};

/**
 * @brief 时序存储接口
 *
 * 写入接口失败时返回 false / 0，不抛异常；查询接口在存储不可用时抛出
 * PersistenceError（queryStatistics 除外，它返回带 error 字段的空结构）。
 */
class TimeSeriesStore {
public:
    using TimePoint = TimestampHelper::TimePoint;

    virtual ~TimeSeriesStore() = default;

    virtual bool writePoint(const DataPoint& point) = 0;
    virtual size_t writeBatch(const std::vector<DataPoint>& points) = 0;
    virtual bool writeCommunicationError(const CommunicationError& error) = 0;
    virtual bool writeCollectLog(const CollectLog& log) = 0;

    /** 按 (timestamp, address) 升序 */
    virtual std::vector<StoredPoint> queryPoints(std::optional<int> deviceId,
                                                 TimePoint start, TimePoint end) = 0;
    virtual std::vector<CommunicationError> queryCommunicationErrors(std::optional<int> deviceId,
                                                                     TimePoint start, TimePoint end) = 0;
    virtual std::vector<CollectLog> queryCollectLogs(int deviceId, TimePoint start, TimePoint end) = 0;

    /**
     * @brief 统计：{total_points, addresses: {addr: count}}，失败时附加 error 字段
     */
    virtual Json::Value queryStatistics(std::optional<int> deviceId, TimePoint start, TimePoint end) = 0;

    /** 删除 cutoff 之前的数据点，返回删除数量 */
    virtual size_t deleteBefore(TimePoint cutoff) = 0;

protected:
    static Json::Value emptyStatistics() {
        Json::Value stats;
        stats["total_points"] = 0;
        stats["addresses"] = Json::objectValue;
        return stats;
    }
};
