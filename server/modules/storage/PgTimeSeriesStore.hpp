#pragma once

#include "TimeSeriesStore.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/FieldHelper.hpp"
#include "common/utils/StringUtils.hpp"

/**
 * @brief PostgreSQL 时序存储
 *
 * 表结构见 DatabaseInitializer：plc_data / plc_communication_error / plc_collect_log。
 * 由采集工作线程调用，统一走 DatabaseService::execSqlSync。
 */
class PgTimeSeriesStore : public TimeSeriesStore {
public:
    bool writePoint(const DataPoint& point) override {
        try {
            db_.execSqlSync(INSERT_POINT_SQL, pointParams(point));
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR << "[Storage] Write point failed " << point.deviceName << " "
                      << point.address << ": " << e.what();
            return false;
        }
    }

    size_t writeBatch(const std::vector<DataPoint>& points) override {
        if (points.empty()) return 0;

        std::string sql = std::string(INSERT_POINT_PREFIX) + " VALUES ";
        std::vector<std::string> params;
        params.reserve(points.size() * POINT_COLUMNS);
        for (size_t i = 0; i < points.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += POINT_PLACEHOLDERS;
            auto row = pointParams(points[i]);
            params.insert(params.end(), std::make_move_iterator(row.begin()), std::make_move_iterator(row.end()));
        }

        try {
            db_.execSqlSync(sql, params);
            return points.size();
        } catch (const std::exception& e) {
            LOG_ERROR << "[Storage] Batch write failed (" << points.size() << " points): " << e.what();
            return 0;
        }
    }

    bool writeCommunicationError(const CommunicationError& error) override {
        try {
            db_.execSqlSync(R"(
                INSERT INTO plc_communication_error
                (device_id, device_name, error_type, message, severity, address, station_id, ts)
                VALUES (?, ?, ?, ?, ?, NULLIF(?, ''), NULLIF(?, '')::int, ?::timestamptz)
            )", {
                std::to_string(error.deviceId),
                error.deviceName,
                error.errorType,
                error.message,
                error.severity,
                error.address.value_or(""),
                error.stationId ? std::to_string(*error.stationId) : "",
                TimestampHelper::format(error.timestamp)
            });
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR << "[Storage] Write communication error failed " << error.deviceName << ": " << e.what();
            return false;
        }
    }

    bool writeCollectLog(const CollectLog& log) override {
        try {
            db_.execSqlSync(R"(
                INSERT INTO plc_collect_log (device_id, status, message, response_time, ts)
                VALUES (?, ?, ?, ?, ?::timestamptz)
            )", {
                std::to_string(log.deviceId),
                log.status,
                log.message,
                StringUtils::formatNumber(log.responseTimeMs),
                TimestampHelper::format(log.timestamp)
            });
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR << "[Storage] Write collect log failed device " << log.deviceId << ": " << e.what();
            return false;
        }
    }

    std::vector<StoredPoint> queryPoints(std::optional<int> deviceId,
                                         TimePoint start, TimePoint end) override {
        std::string sql = R"(
            SELECT device_id, device_name, address, value, raw_value, quality,
                   EXTRACT(EPOCH FROM ts)::float8 AS epoch
            FROM plc_data
            WHERE ts >= ?::timestamptz AND ts <= ?::timestamptz
        )";
        auto params = rangeParams(start, end);
        appendDeviceFilter(sql, params, deviceId);
        sql += " ORDER BY ts, address";

        auto result = query("points", sql, params);
        std::vector<StoredPoint> points;
        points.reserve(result.size());
        for (const auto& row : result) {
            StoredPoint p;
            p.deviceId = FieldHelper::getInt(row["device_id"]);
            p.deviceName = FieldHelper::getString(row["device_name"]);
            p.address = FieldHelper::getString(row["address"]);
            p.value = FieldHelper::getDouble(row["value"]);
            p.rawValue = FieldHelper::getDouble(row["raw_value"]);
            p.quality = FieldHelper::getString(row["quality"], "good");
            p.timestamp = FieldHelper::getEpoch(row["epoch"]);
            points.push_back(std::move(p));
        }
        return points;
    }

    std::vector<CommunicationError> queryCommunicationErrors(std::optional<int> deviceId,
                                                             TimePoint start, TimePoint end) override {
        std::string sql = R"(
            SELECT device_id, device_name, error_type, message, severity, address, station_id,
                   EXTRACT(EPOCH FROM ts)::float8 AS epoch
            FROM plc_communication_error
            WHERE ts >= ?::timestamptz AND ts <= ?::timestamptz
        )";
        auto params = rangeParams(start, end);
        appendDeviceFilter(sql, params, deviceId);
        sql += " ORDER BY ts";

        auto result = query("communication errors", sql, params);
        std::vector<CommunicationError> errors;
        errors.reserve(result.size());
        for (const auto& row : result) {
            CommunicationError e;
            e.deviceId = FieldHelper::getInt(row["device_id"]);
            e.deviceName = FieldHelper::getString(row["device_name"]);
            e.errorType = FieldHelper::getString(row["error_type"], "connection_failed");
            e.message = FieldHelper::getString(row["message"]);
            e.severity = FieldHelper::getString(row["severity"], "high");
            e.address = FieldHelper::getOptionalString(row["address"]);
            e.stationId = FieldHelper::getOptionalInt(row["station_id"]);
            e.timestamp = FieldHelper::getEpoch(row["epoch"]);
            errors.push_back(std::move(e));
        }
        return errors;
    }

    std::vector<CollectLog> queryCollectLogs(int deviceId, TimePoint start, TimePoint end) override {
        auto result = query("collect logs", R"(
            SELECT device_id, status, message, response_time, EXTRACT(EPOCH FROM ts)::float8 AS epoch
            FROM plc_collect_log
            WHERE device_id = ? AND ts >= ?::timestamptz AND ts <= ?::timestamptz
            ORDER BY ts
        )", {std::to_string(deviceId), TimestampHelper::format(start), TimestampHelper::format(end)});

        std::vector<CollectLog> logs;
        logs.reserve(result.size());
        for (const auto& row : result) {
            CollectLog l;
            l.deviceId = FieldHelper::getInt(row["device_id"]);
            l.status = FieldHelper::getString(row["status"]);
            l.message = FieldHelper::getString(row["message"]);
            l.responseTimeMs = FieldHelper::getDouble(row["response_time"]);
            l.timestamp = FieldHelper::getEpoch(row["epoch"]);
            logs.push_back(std::move(l));
        }
        return logs;
    }

    Json::Value queryStatistics(std::optional<int> deviceId, TimePoint start, TimePoint end) override {
        auto stats = emptyStatistics();

        std::string sql = R"(
            SELECT address, COUNT(*)::bigint AS cnt
            FROM plc_data
            WHERE ts >= ?::timestamptz AND ts <= ?::timestamptz
        )";
        auto params = rangeParams(start, end);
        appendDeviceFilter(sql, params, deviceId);
        sql += " GROUP BY address ORDER BY address";

        try {
            auto result = db_.execSqlSync(sql, params);
            int64_t total = 0;
            for (const auto& row : result) {
                auto count = FieldHelper::getInt64(row["cnt"]);
                stats["addresses"][FieldHelper::getString(row["address"])] = static_cast<Json::Int64>(count);
                total += count;
            }
            stats["total_points"] = static_cast<Json::Int64>(total);
        } catch (const std::exception& e) {
            LOG_ERROR << "[Storage] Query statistics failed: " << e.what();
            stats["error"] = e.what();
        }
        return stats;
    }

    size_t deleteBefore(TimePoint cutoff) override {
        try {
            auto result = db_.execSqlSync("DELETE FROM plc_data WHERE ts < ?::timestamptz",
                                          {TimestampHelper::format(cutoff)});
            return result.affectedRows();
        } catch (const std::exception& e) {
            LOG_ERROR << "[Storage] Delete before " << TimestampHelper::format(cutoff)
                      << " failed: " << e.what();
            return 0;
        }
    }

private:
    DatabaseService db_;

    static constexpr size_t POINT_COLUMNS = 19;
    static constexpr const char* INSERT_POINT_PREFIX = R"(
        INSERT INTO plc_data
        (device_id, device_name, address, station_id, register_type, function_code, data_type,
         unit, byte_order, word_swap, scan_rate, value, raw_value, scaled_value, quality,
         response_time, ts, created_at, updated_at))";
    static constexpr const char* POINT_PLACEHOLDERS =
        "(?, ?, ?, ?, ?, ?, ?, ?, ?, ?::boolean, ?, ?, ?, ?, ?, ?, ?::timestamptz, ?::timestamptz, ?::timestamptz)";
    inline static const std::string INSERT_POINT_SQL =
        std::string(INSERT_POINT_PREFIX) + " VALUES " + POINT_PLACEHOLDERS;

    static std::vector<std::string> pointParams(const DataPoint& p) {
        auto ts = TimestampHelper::format(p.timestamp);
        auto now = TimestampHelper::now();
        return {
            std::to_string(p.deviceId),
            p.deviceName,
            p.address,
            std::to_string(p.stationId),
            p.registerType,
            std::to_string(p.functionCode),
            p.dataType,
            p.unit,
            p.byteOrder,
            p.wordSwap ? "true" : "false",
            std::to_string(p.scanRate),
            StringUtils::formatNumber(p.value()),
            StringUtils::formatNumber(p.rawValue),
            StringUtils::formatNumber(p.scaledValue),
            p.quality,
            StringUtils::formatNumber(p.responseTimeMs),
            ts,
            now,
            now
        };
    }

    static std::vector<std::string> rangeParams(TimePoint start, TimePoint end) {
        return {TimestampHelper::format(start), TimestampHelper::format(end)};
    }

    static void appendDeviceFilter(std::string& sql, std::vector<std::string>& params,
                                   std::optional<int> deviceId) {
        if (!deviceId) return;
        sql += " AND device_id = ?";
        params.push_back(std::to_string(*deviceId));
    }

    DatabaseService::Result query(const char* what, const std::string& sql,
                                  const std::vector<std::string>& params) {
        try {
            return db_.execSqlSync(sql, params);
        } catch (const std::exception& e) {
            LOG_ERROR << "[Storage] Query " << what << " failed: " << e.what();
            throw PersistenceError(std::string("查询 ") + what + " 失败: " + e.what());
        }
    }
};
