#pragma once

#include "DataPipeline.hpp"
#include "DeviceConnection.hpp"
#include "RegistrySource.hpp"
#include "Settings.hpp"
#include "SettingsStore.hpp"
#include "common/protocol/ProtocolFactory.hpp"

#include <shared_mutex>

/**
 * @brief 采集统计
 */
struct CollectorStats {
    uint64_t totalCollections = 0;       // 周期数
    uint64_t successfulCollections = 0;  // 设备次数
    uint64_t failedCollections = 0;      // 设备次数
    uint64_t coalescedCycles = 0;        // 上一周期未结束而跳过的周期数
    std::string lastCollectionTime;
    double averageCollectionTime = 0.0;  // 秒，EWMA

    Json::Value toJson() const {
        Json::Value json;
        json["total_collections"] = static_cast<Json::UInt64>(totalCollections);
        json["successful_collections"] = static_cast<Json::UInt64>(successfulCollections);
        json["failed_collections"] = static_cast<Json::UInt64>(failedCollections);
        json["coalesced_cycles"] = static_cast<Json::UInt64>(coalescedCycles);
        json["last_collection_time"] = lastCollectionTime.empty() ? Json::Value::null : Json::Value(lastCollectionTime);
        json["average_collection_time"] = averageCollectionTime;
        return json;
    }
};

/**
 * @brief PLC 采集调度器（单例）
 *
 * 职责：
 * - 加载启用设备并维护每台设备的 DeviceConnection（数量受最大并发连接数限制）
 * - 周期触发采集：每台设备作为一个任务提交到工作线程池
 * - 每日 02:00 清理过期数据
 * - 运行中调整参数（采集间隔、超时、连接上限、线程数）
 *
 * 线程模型：
 * - 定时器运行在独立的 EventLoopThread 上，只负责把采集周期投递到 cycleQueue_
 * - 采集周期之间用 try_lock 互斥，上一周期未结束时本次直接跳过
 * - 设备任务在 workerQueue_ 中执行，周期线程按 deviceWaitSeconds 等待每个任务
 */
class Collector {
public:
    using HandlerFactory = std::function<std::unique_ptr<ProtocolHandler>(const Device&, int, int)>;
    using ConnectionMap = std::map<int, std::shared_ptr<DeviceConnection>>;

    static Collector& instance() {
        static Collector collector;
        return collector;
    }

    explicit Collector(HandlerFactory factory = &ProtocolFactory::create)
        : factory_(std::move(factory)) {}

    ~Collector() { stop(); }

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    // ==================== 生命周期 ====================

    /**
     * @brief 启动：加载设备、建立连接、启动定时器
     * @param settingsStore 可为空（此时 reloadSettings() 不可用，只能 applySettings）
     */
    void start(const Settings& settings,
               std::shared_ptr<RegistrySource> registry,
               std::shared_ptr<TimeSeriesStore> store,
               std::shared_ptr<SettingsStore> settingsStore = nullptr) {
        if (running_) {
            LOG_WARN << "[Collector] Already running";
            return;
        }

        {
            std::lock_guard lock(settingsMutex_);
            settings_ = settings;
        }
        registry_ = std::move(registry);
        store_ = std::move(store);
        settingsStore_ = std::move(settingsStore);
        pipeline_ = std::make_unique<DataPipeline>(store_);

        workerQueue_ = std::make_shared<trantor::ConcurrentTaskQueue>(
            static_cast<size_t>(settings.workerCount), "collector");
        cycleQueue_ = std::make_unique<trantor::ConcurrentTaskQueue>(2, "collector-cycle");
        running_ = true;

        reloadDevices();

        loopThread_ = std::make_unique<trantor::EventLoopThread>("CollectorLoop");
        loopThread_->run();
        scheduleCollection(settings.collectIntervalSeconds);
        scheduleCleanup();

        LOG_INFO << "[Collector] Started: interval=" << settings.collectIntervalSeconds
                 << "s, workers=" << settings.workerCount
                 << ", maxConnections=" << settings.maxConcurrentConnections;
    }

    /**
     * @brief 停止：取消定时器 → 停止接收新周期 → 停止线程池 → 断开全部连接
     */
    void stop() {
        if (!running_.exchange(false)) return;

        if (loopThread_) {
            auto* loop = loopThread_->getLoop();
            loop->runInLoop([this, loop]() {
                loop->invalidateTimer(collectTimerId_);
                loop->invalidateTimer(cleanupTimerId_);
                collectTimerId_ = 0;
                cleanupTimerId_ = 0;
            });
            loop->quit();
            loopThread_->wait();
            loopThread_.reset();
        }

        if (cycleQueue_) {
            cycleQueue_->stop();
            cycleQueue_.reset();
        }
        if (workerQueue_) {
            workerQueue_->stop();
            workerQueue_.reset();
        }

        ConnectionMap old;
        {
            std::unique_lock lock(connectionsMutex_);
            old.swap(connections_);
        }
        for (auto& [id, conn] : old) {
            conn->disconnect();
        }

        LOG_INFO << "[Collector] Stopped, " << old.size() << " connections closed";
    }

    bool isRunning() const { return running_; }

    // ==================== 设备加载 ====================

    /**
     * @brief 重新加载启用设备并替换全部连接
     *
     * 按 (分组, id) 排序后截断到最大并发连接数，超出的设备不建立连接。
     */
    void reloadDevices() {
        if (!registry_) return;

        std::vector<Device> devices;
        try {
            devices = registry_->listActiveDevices();
        } catch (const std::exception& e) {
            LOG_ERROR << "[Collector] Load devices failed: " << e.what();
            return;
        }

        std::sort(devices.begin(), devices.end(), [](const Device& a, const Device& b) {
            return a.sortKey() < b.sortKey();
        });

        auto s = settings();
        auto cap = static_cast<size_t>(std::max(s.maxConcurrentConnections, 0));
        if (devices.size() > cap) {
            std::string skipped;
            for (size_t i = cap; i < devices.size(); ++i) {
                if (!skipped.empty()) skipped += ", ";
                skipped += devices[i].name + "(id=" + std::to_string(devices[i].id) + ")";
            }
            LOG_WARN << "[Collector] " << devices.size() << " active devices exceed max connections "
                     << cap << ", not collected: " << skipped;
            devices.resize(cap);
        }

        ConnectionMap fresh;
        for (auto& device : devices) {
            auto id = device.id;
            auto name = device.name;
            auto handler = factory_(device, s.connectTimeoutMs, s.receiveTimeoutMs);
            if (!handler) {
                LOG_ERROR << "[Collector] No protocol handler for device " << name;
                continue;
            }

            auto conn = std::make_shared<DeviceConnection>(std::move(device), std::move(handler), store_);
            conn->updateTimeouts(s.connectTimeoutMs, s.receiveTimeoutMs);
            bool online = conn->connect();
            registry_->markCollected(id, online, false);
            fresh.emplace(id, std::move(conn));
        }

        ConnectionMap old;
        {
            std::unique_lock lock(connectionsMutex_);
            old.swap(connections_);
            connections_ = std::move(fresh);
        }
        for (auto& [id, conn] : old) {
            conn->disconnect();
        }

        LOG_INFO << "[Collector] Loaded " << connectionCount() << " device connections";
    }

    // ==================== 参数调整 ====================

    /**
     * @brief 从 SettingsStore 重新读取参数并应用
     */
    void reloadSettings() {
        if (!settingsStore_) {
            LOG_WARN << "[Collector] No settings store attached, reload ignored";
            return;
        }
        applySettings(settingsStore_->load());
    }

    /**
     * @brief 应用新参数
     *
     * 超时变化原地更新全部连接；采集间隔变化重新调度；
     * 连接上限变化重新加载设备；线程数变化重建线程池。
     */
    void applySettings(const Settings& next) {
        Settings prev;
        {
            std::lock_guard lock(settingsMutex_);
            prev = settings_;
            settings_ = next;
        }
        if (prev == next) {
            LOG_DEBUG << "[Collector] Settings unchanged";
            return;
        }

        if (prev.connectTimeoutMs != next.connectTimeoutMs || prev.receiveTimeoutMs != next.receiveTimeoutMs) {
            for (auto& [id, conn] : snapshot()) {
                conn->updateTimeouts(next.connectTimeoutMs, next.receiveTimeoutMs);
            }
        }

        if (prev.collectIntervalSeconds != next.collectIntervalSeconds && running_) {
            LOG_INFO << "[Collector] Collect interval changed " << prev.collectIntervalSeconds
                     << "s -> " << next.collectIntervalSeconds << "s";
            scheduleCollection(next.collectIntervalSeconds);
        }

        if (prev.workerCount != next.workerCount && running_) {
            rebuildWorkers(next.workerCount);
        }

        if (prev.maxConcurrentConnections != next.maxConcurrentConnections) {
            LOG_INFO << "[Collector] Max connections changed " << prev.maxConcurrentConnections
                     << " -> " << next.maxConcurrentConnections << ", reloading devices";
            reloadDevices();
        }
    }

    Settings settings() const {
        std::lock_guard lock(settingsMutex_);
        return settings_;
    }

    // ==================== 采集 ====================

    /**
     * @brief 执行一个采集周期
     *
     * 上一周期仍在执行时直接返回（计入 coalesced_cycles）。
     */
    void collectAll() {
        std::unique_lock cycleLock(cycleMutex_, std::try_to_lock);
        if (!cycleLock.owns_lock()) {
            LOG_WARN << "[Collector] Previous cycle still running, skipping this one";
            std::lock_guard lock(statsMutex_);
            ++stats_.coalescedCycles;
            return;
        }
        if (!running_) return;

        auto started = std::chrono::steady_clock::now();
        auto s = settings();
        size_t deviceCount = 0;
        size_t successCount = 0;

        try {
            auto devices = registry_->listActiveDevices();
            if (devices.empty()) {
                LOG_DEBUG << "[Collector] No active devices";
            }

            auto conns = snapshot();
            auto queue = workers();
            std::vector<std::future<bool>> futures;
            futures.reserve(devices.size());

            for (const auto& device : devices) {
                // 超出连接上限或尚未加载的设备不参与本周期统计，上限告警在 reloadDevices 中输出
                auto it = conns.find(device.id);
                if (it == conns.end()) {
                    LOG_TRACE << "[Collector] No connection for device " << device.name << " (id=" << device.id << ")";
                    continue;
                }
                ++deviceCount;

                if (elapsedSeconds(started) > s.cycleCeilingSeconds) {
                    LOG_WARN << "[Collector] Cycle exceeded " << s.cycleCeilingSeconds
                             << "s, remaining devices skipped";
                    break;
                }

                auto promise = std::make_shared<std::promise<bool>>();
                futures.push_back(promise->get_future());
                queue->runTaskInQueue([this, conn = it->second, promise]() {
                    promise->set_value(collectDevice(*conn));
                });
            }

            for (auto& future : futures) {
                if (future.wait_for(std::chrono::seconds(s.deviceWaitSeconds)) != std::future_status::ready) {
                    LOG_WARN << "[Collector] Device task exceeded " << s.deviceWaitSeconds << "s, abandoned";
                    continue;
                }
                try {
                    if (future.get()) ++successCount;
                } catch (const std::future_error& e) {
                    LOG_WARN << "[Collector] Device task dropped: " << e.what();
                }
            }
        } catch (const std::exception& e) {
            LOG_ERROR << "[Collector] Collect cycle failed: " << e.what();
        }

        auto duration = elapsedSeconds(started);
        recordCycle(deviceCount, successCount, duration);
        LOG_DEBUG << "[Collector] Cycle done: " << successCount << "/" << deviceCount
                  << " devices in " << duration << "s";
    }

    /**
     * @brief 采集单台设备（工作线程中执行，不抛异常）
     * @return 至少读到一个地址
     */
    bool collectDevice(DeviceConnection& conn) {
        const auto& device = conn.device();
        try {
            if (!conn.isConnected() && !conn.connect()) {
                auto error = conn.lastError();
                writeLog(device.id, "failed", "连接失败: " + error, 0.0);
                registry_->markCollected(device.id, false, false);
                return false;
            }

            if (device.addressConfigs.empty()) {
                LOG_WARN << "[Collector] Device " << device.name << " has no address configured";
                writeLog(device.id, "failed", "没有配置采集地址", 0.0);
                return false;
            }

            auto started = std::chrono::steady_clock::now();
            auto result = conn.read();
            double responseTimeMs = elapsedSeconds(started) * 1000.0;

            pipeline_->process(device, result, responseTimeMs);
            registry_->markCollected(device.id, result.isOnline);

            auto success = result.successCount();
            auto total = device.addressConfigs.size();
            if (success > 0) {
                writeLog(device.id, "success",
                         "成功采集 " + std::to_string(success) + "/" + std::to_string(total) + " 个地址",
                         responseTimeMs);
                return true;
            }
            writeLog(device.id, "failed", "所有" + std::to_string(total) + "个地址采集失败", responseTimeMs);
            return false;
        } catch (const std::exception& e) {
            LOG_ERROR << "[Collector] Collect device " << device.name << " failed: " << e.what();
            writeLog(device.id, "error", e.what(), 0.0);
            registry_->markCollected(device.id, false, false);
            return false;
        }
    }

    // ==================== 数据清理 ====================

    /**
     * @brief 删除超过保留天数的数据点
     * @return 删除数量
     */
    size_t cleanupOldData() {
        auto days = settings().dataRetentionDays;
        if (days <= 0) {
            LOG_INFO << "[Collector] Data retention is " << days << " days, cleanup skipped";
            return 0;
        }
        if (!store_) return 0;

        auto cutoff = TimestampHelper::Clock::now() - std::chrono::hours(24) * days;
        auto deleted = store_->deleteBefore(cutoff);
        LOG_INFO << "[Collector] Cleanup removed " << deleted << " points before "
                 << TimestampHelper::format(cutoff);
        return deleted;
    }

    // ==================== 状态查询 ====================

    /**
     * @brief 设备状态（单台）
     */
    Json::Value getStatus(int deviceId) const {
        auto conns = snapshot();
        auto it = conns.find(deviceId);
        if (it == conns.end()) {
            Json::Value json;
            json["is_connected"] = false;
            json["last_error"] = "设备连接不存在";
            json["device_name"] = "Unknown";
            json["status"] = Constants::DEVICE_STATUS_OFFLINE;
            json["retry_count"] = 0;
            json["last_connect_time"] = Json::Value::null;
            json["state"] = connectionStatusToString(ConnectionStatus::Disconnected);
            return json;
        }
        return it->second->getStatus();
    }

    /**
     * @brief 全部设备状态，键为设备 id
     */
    Json::Value getAllStatus() const {
        Json::Value json(Json::objectValue);
        for (const auto& [id, conn] : snapshot()) {
            json[std::to_string(id)] = conn->getStatus();
        }
        return json;
    }

    Json::Value getProtocolInfo() const {
        int active = 0;
        for (const auto& [id, conn] : snapshot()) {
            if (conn->isConnected()) ++active;
        }

        Json::Value json;
        json["protocol_type"] = "Unified Protocol Architecture";
        json["supported_protocols"] = ProtocolFactory::supportedProtocols();
        json["active_connections"] = active;
        json["thread_pool_workers"] = settings().workerCount;
        return json;
    }

    Json::Value getStats() const {
        std::lock_guard lock(statsMutex_);
        return stats_.toJson();
    }

    CollectorStats stats() const {
        std::lock_guard lock(statsMutex_);
        return stats_;
    }

    size_t connectionCount() const {
        std::shared_lock lock(connectionsMutex_);
        return connections_.size();
    }

    std::shared_ptr<TimeSeriesStore> store() const { return store_; }

    // ==================== 写入 ====================

    /**
     * @brief 向设备地址写入数值
     * @throws NotFoundException 设备没有连接（未启用或超出连接上限）
     * @throws NetworkError 设备无法连接
     * @throws ConfigurationError 参数非法或地址只读
     */
    bool writeAddress(int deviceId, const std::string& address, double value,
                      std::optional<int> stationId = std::nullopt) {
        auto conns = snapshot();
        auto it = conns.find(deviceId);
        if (it == conns.end()) {
            throw NotFoundException("设备连接不存在");
        }

        auto& conn = it->second;
        if (!conn->isConnected() && !conn->connect()) {
            throw NetworkError("设备未连接: " + conn->lastError());
        }
        return conn->write(address, value, stationId);
    }

private:
    HandlerFactory factory_;
    std::shared_ptr<RegistrySource> registry_;
    std::shared_ptr<TimeSeriesStore> store_;
    std::shared_ptr<SettingsStore> settingsStore_;
    std::unique_ptr<DataPipeline> pipeline_;

    mutable std::mutex settingsMutex_;
    Settings settings_;

    mutable std::shared_mutex connectionsMutex_;
    ConnectionMap connections_;

    std::mutex cycleMutex_;
    std::atomic<bool> running_{false};

    mutable std::mutex statsMutex_;
    CollectorStats stats_;

    std::mutex workersMutex_;
    std::shared_ptr<trantor::ConcurrentTaskQueue> workerQueue_;
    std::unique_ptr<trantor::ConcurrentTaskQueue> cycleQueue_;

    std::unique_ptr<trantor::EventLoopThread> loopThread_;
    trantor::TimerId collectTimerId_{0};
    trantor::TimerId cleanupTimerId_{0};

    ConnectionMap snapshot() const {
        std::shared_lock lock(connectionsMutex_);
        return connections_;
    }

    std::shared_ptr<trantor::ConcurrentTaskQueue> workers() {
        std::lock_guard lock(workersMutex_);
        return workerQueue_;
    }

    /**
     * @brief 线程池重建需等待当前周期结束
     */
    void rebuildWorkers(int count) {
        std::lock_guard cycleLock(cycleMutex_);
        std::shared_ptr<trantor::ConcurrentTaskQueue> old;
        {
            std::lock_guard lock(workersMutex_);
            old = std::move(workerQueue_);
            workerQueue_ = std::make_shared<trantor::ConcurrentTaskQueue>(static_cast<size_t>(count), "collector");
        }
        if (old) old->stop();
        LOG_INFO << "[Collector] Worker pool resized to " << count;
    }

    /** 定时器 id 只在 CollectorLoop 线程中读写 */
    void scheduleCollection(double intervalSeconds) {
        if (!loopThread_) return;
        auto* loop = loopThread_->getLoop();
        loop->runInLoop([this, loop, intervalSeconds]() {
            if (collectTimerId_ != 0) {
                loop->invalidateTimer(collectTimerId_);
            }
            collectTimerId_ = loop->runEvery(intervalSeconds, [this]() {
                if (!running_ || !cycleQueue_) return;
                cycleQueue_->runTaskInQueue([this]() {
                    try {
                        collectAll();
                    } catch (const std::exception& e) {
                        LOG_ERROR << "[Collector] collectAll exception: " << e.what();
                    }
                });
            });
        });
    }

    /**
     * @brief 每日 CLEANUP_HOUR 点（本地时间）执行一次，执行后重新挂下一次
     */
    void scheduleCleanup() {
        if (!loopThread_) return;
        auto* loop = loopThread_->getLoop();
        loop->runInLoop([this, loop]() {
            auto delay = secondsUntilLocalHour(Constants::CLEANUP_HOUR);
            cleanupTimerId_ = loop->runAfter(delay, [this]() {
                try {
                    cleanupOldData();
                } catch (const std::exception& e) {
                    LOG_ERROR << "[Collector] Cleanup exception: " << e.what();
                }
                if (running_) scheduleCleanup();
            });
            LOG_DEBUG << "[Collector] Next cleanup in " << delay << "s";
        });
    }

    static double secondsUntilLocalHour(int hour) {
        std::time_t now = std::time(nullptr);
        std::tm target{};
        localtime_r(&now, &target);
        target.tm_hour = hour;
        target.tm_min = 0;
        target.tm_sec = 0;
        target.tm_isdst = -1;

        auto next = std::mktime(&target);
        if (next <= now) {
            target.tm_mday += 1;
            target.tm_isdst = -1;
            next = std::mktime(&target);
        }
        return std::difftime(next, now);
    }

    static double elapsedSeconds(std::chrono::steady_clock::time_point since) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - since).count();
    }

    void recordCycle(size_t deviceCount, size_t successCount, double duration) {
        std::lock_guard lock(statsMutex_);
        ++stats_.totalCollections;
        stats_.successfulCollections += successCount;
        stats_.failedCollections += deviceCount - successCount;
        stats_.lastCollectionTime = TimestampHelper::now();
        stats_.averageCollectionTime = stats_.totalCollections == 1
            ? duration
            : stats_.averageCollectionTime * 0.7 + duration * 0.3;
    }

    void writeLog(int deviceId, const std::string& status, const std::string& message, double responseTimeMs) {
        if (!store_) return;
        CollectLog log;
        log.deviceId = deviceId;
        log.status = status;
        log.message = message;
        log.responseTimeMs = responseTimeMs;
        if (!store_->writeCollectLog(log)) {
            LOG_WARN << "[Collector] Collect log not stored for device " << deviceId;
        }
    }
};
