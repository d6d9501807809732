#pragma once

#include "Collector.hpp"
#include "modules/analysis/PerformanceAnalyzer.hpp"
#include "common/utils/BlockingCall.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ValidatorHelper.hpp"

/**
 * @brief 采集器状态 / 控制接口
 *
 * 采集器接口均可能阻塞（设备锁、同步数据库），统一通过 BlockingCall 移出 IO 线程。
 */
class CollectorController : public drogon::HttpController<CollectorController> {
public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    // 状态
    ADD_METHOD_TO(CollectorController::allStatus, "/api/collector/status", Get);
    ADD_METHOD_TO(CollectorController::deviceStatus, "/api/collector/status/{id}", Get);
    ADD_METHOD_TO(CollectorController::protocols, "/api/collector/protocols", Get);
    ADD_METHOD_TO(CollectorController::stats, "/api/collector/stats", Get);
    // 控制
    ADD_METHOD_TO(CollectorController::reloadDevices, "/api/collector/devices/reload", Post);
    ADD_METHOD_TO(CollectorController::reloadSettings, "/api/collector/settings/reload", Post);
    ADD_METHOD_TO(CollectorController::writeAddress, "/api/collector/devices/{id}/write", Post);
    // 分析
    ADD_METHOD_TO(CollectorController::anomalies, "/api/collector/anomalies", Get);
    ADD_METHOD_TO(CollectorController::statistics, "/api/collector/statistics", Get);
    ADD_METHOD_TO(CollectorController::performance, "/api/collector/performance/{id}", Get);
    METHOD_LIST_END

    // ==================== 状态 ====================

    Task<HttpResponsePtr> allStatus(HttpRequestPtr /*req*/) {
        auto data = co_await BlockingCall<Json::Value>([] {
            return Collector::instance().getAllStatus();
        });
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> deviceStatus(HttpRequestPtr /*req*/, int id) {
        if (id <= 0) co_return Response::badRequest("无效的设备ID");

        auto data = co_await BlockingCall<Json::Value>([id] {
            return Collector::instance().getStatus(id);
        });
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> protocols(HttpRequestPtr /*req*/) {
        auto data = co_await BlockingCall<Json::Value>([] {
            return Collector::instance().getProtocolInfo();
        });
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> stats(HttpRequestPtr /*req*/) {
        co_return Response::ok(Collector::instance().getStats());
    }

    // ==================== 控制 ====================

    Task<HttpResponsePtr> reloadDevices(HttpRequestPtr /*req*/) {
        auto data = co_await BlockingCall<Json::Value>([] {
            auto& collector = Collector::instance();
            collector.reloadDevices();
            Json::Value result;
            result["connections"] = static_cast<Json::UInt64>(collector.connectionCount());
            return result;
        });
        co_return Response::ok(data, "设备已重新加载");
    }

    Task<HttpResponsePtr> reloadSettings(HttpRequestPtr /*req*/) {
        auto data = co_await BlockingCall<Json::Value>([] {
            auto& collector = Collector::instance();
            collector.reloadSettings();
            return collector.settings().toJson();
        });
        co_return Response::ok(data, "采集参数已更新");
    }

    Task<HttpResponsePtr> writeAddress(HttpRequestPtr req, int id) {
        if (id <= 0) co_return Response::badRequest("无效的设备ID");

        auto json = req->getJsonObject();
        if (!json) co_return Response::badRequest("请求体格式错误");

        ValidatorHelper::requireNonEmptyString(*json, "address", "写入地址").throwIfInvalid();
        ValidatorHelper::requireNumber(*json, "value", "写入值").throwIfInvalid();

        auto address = (*json)["address"].asString();
        auto value = (*json)["value"].asDouble();
        std::optional<int> stationId;
        if (json->isMember("station_id") && (*json)["station_id"].isInt()) {
            stationId = (*json)["station_id"].asInt();
        }

        auto data = co_await BlockingCall<Json::Value>([id, address, value, stationId] {
            Json::Value result;
            result["success"] = Collector::instance().writeAddress(id, address, value, stationId);
            result["device_id"] = id;
            result["address"] = address;
            result["value"] = value;
            return result;
        });

        if (!data["success"].asBool()) {
            co_return Response::badGateway("写入失败");
        }
        co_return Response::ok(data, "写入成功");
    }

    // ==================== 分析 ====================

    Task<HttpResponsePtr> anomalies(HttpRequestPtr req) {
        auto range = ValidatorHelper::getTimeRange(req, std::chrono::hours(24));
        auto start = range.first;
        auto end = range.second;
        auto deviceId = ValidatorHelper::getOptionalIntParam(req, "device_id");

        auto data = co_await BlockingCall<Json::Value>([start, end, deviceId] {
            // 采集器未启动时由 detect 返回带 error 的空结果
            AnomalyDetector detector(Collector::instance().store(), loadRanges());
            return detector.detect(start, end, deviceId).toJson();
        });
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> statistics(HttpRequestPtr req) {
        auto range = ValidatorHelper::getTimeRange(req, std::chrono::hours(24));
        auto start = range.first;
        auto end = range.second;
        auto deviceId = ValidatorHelper::getOptionalIntParam(req, "device_id");

        auto data = co_await BlockingCall<Json::Value>([start, end, deviceId] {
            return requireStore()->queryStatistics(deviceId, start, end);
        });
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> performance(HttpRequestPtr req, int id) {
        if (id <= 0) co_return Response::badRequest("无效的设备ID");

        int hours = ValidatorHelper::getIntParam(req, "hours", 24);
        if (hours < 1 || hours > 24 * 30) co_return Response::badRequest("hours 取值范围 1-720");

        auto data = co_await BlockingCall<Json::Value>([id, hours] {
            auto end = TimestampHelper::Clock::now();
            auto start = end - std::chrono::hours(hours);
            PerformanceAnalyzer analyzer(requireStore(), loadRanges());
            return analyzer.analyze(id, start, end).toJson();
        });
        co_return Response::ok(data);
    }

private:
    static std::shared_ptr<TimeSeriesStore> requireStore() {
        auto store = Collector::instance().store();
        if (!store) throw PersistenceError("采集器未启动");
        return store;
    }

    /**
     * @brief 默认值域 + 设备地址上配置的工程量程
     */
    static RangeTable loadRanges() {
        auto [lo, hi] = ConfigManager::getAnomalyRange();
        RangeTable ranges(lo, hi);
        try {
            PgRegistrySource registry;
            ranges.addDevices(registry.listActiveDevices());
        } catch (const std::exception& e) {
            LOG_WARN << "[Anomaly] Address ranges unavailable, using defaults: " << e.what();
        }
        return ranges;
    }
};
