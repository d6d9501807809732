#pragma once

#include "common/protocol/ProtocolHandler.hpp"
#include "modules/storage/TimeSeriesStore.hpp"

/**
 * @brief 采集数据处理管线
 *
 * 读取结果 → 量程变换 → 数据点（附带标签）→ 时序存储。
 * 存储故障只记录日志，不向采集任务抛出。
 */
class DataPipeline {
public:
    explicit DataPipeline(std::shared_ptr<TimeSeriesStore> store)
        : store_(std::move(store)) {}

    /**
     * @brief 原始值 → 工程值
     *
     * scale != 1 时直接相乘；否则启用线性量程时按区间映射
     * （输入区间退化时原样返回）。
     */
    static double scale(const AddressConfig& cfg, double raw) {
        if (cfg.scale != 1.0) {
            return raw * cfg.scale;
        }
        if (cfg.scaling.enabled) {
            const auto& s = cfg.scaling;
            if (s.inputMax == s.inputMin) return raw;
            return s.outputMin + (raw - s.inputMin) * (s.outputMax - s.outputMin) / (s.inputMax - s.inputMin);
        }
        return raw;
    }

    /**
     * @brief 构造数据点（仅包含读取成功的地址）
     */
    static std::vector<DataPoint> buildPoints(const Device& device, const ReadResult& result,
                                              double responseTimeMs,
                                              TimestampHelper::TimePoint timestamp = TimestampHelper::Clock::now()) {
        std::vector<DataPoint> points;
        for (const auto& [key, value] : result.values) {
            if (!value) continue;

            const auto* cfg = device.findAddress(key);
            if (!cfg) {
                LOG_WARN << "[Pipeline] No address config for key " << key << " on device " << device.name;
                continue;
            }

            DataPoint p;
            p.deviceId = device.id;
            p.deviceName = device.name;
            p.address = key;
            p.rawValue = *value;
            p.scaledValue = scale(*cfg, *value);
            p.quality = "good";
            p.responseTimeMs = responseTimeMs;
            p.timestamp = timestamp;
            p.stationId = cfg->effectiveStation(device.stationId);
            p.registerType = cfg->registerType;
            p.functionCode = cfg->functionCode;
            p.dataType = valueTypeToString(cfg->type);
            p.unit = cfg->unit;
            p.byteOrder = byteOrderToString(cfg->byteOrder);
            p.wordSwap = cfg->wordSwap;
            p.scanRate = cfg->scanRate;
            points.push_back(std::move(p));
        }
        return points;
    }

    /**
     * @brief 处理一次读取结果并写入存储
     * @return 成功写入的数据点数量
     */
    size_t process(const Device& device, const ReadResult& result, double responseTimeMs) {
        try {
            auto points = buildPoints(device, result, responseTimeMs);
            if (points.empty()) return 0;

            if (device.addressConfigs.size() <= Constants::BATCH_WRITE_THRESHOLD) {
                size_t written = 0;
                for (const auto& p : points) {
                    if (store_->writePoint(p)) {
                        ++written;
                    } else {
                        LOG_WARN << "[Pipeline] Point not stored: " << device.name << " " << p.address;
                    }
                }
                return written;
            }

            auto written = store_->writeBatch(points);
            if (written < points.size()) {
                LOG_WARN << "[Pipeline] Batch stored " << written << "/" << points.size()
                         << " points for " << device.name;
            } else {
                LOG_DEBUG << "[Pipeline] Batch stored " << written << " points for " << device.name;
            }
            return written;
        } catch (const std::exception& e) {
            LOG_ERROR << "[Pipeline] Process failed for " << device.name << ": " << e.what();
            return 0;
        }
    }

private:
    std::shared_ptr<TimeSeriesStore> store_;
};
