// mimalloc: 全局替换 new/delete，必须在所有其他 include 之前
#include <mimalloc-new-delete.h>

// Utils
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/ExceptionHandler.hpp"
#include "common/utils/BlockingCall.hpp"

// Database
#include "common/database/DatabaseInitializer.hpp"
#include "common/database/DatabaseService.hpp"

// Collector
#include "modules/collector/Collector.hpp"
#include "modules/collector/Collector.Controller.hpp"
#include "modules/storage/PgTimeSeriesStore.hpp"

using namespace drogon;

// ─── 启动错误输出 ──────────────────────────────────────────

/**
 * @brief 输出启动阶段错误到控制台和日志
 */
void printStartupError(const std::string& title, const std::string& detail,
                       const std::vector<std::string>& hints = {}) {
    std::string border(60, '=');
    std::cerr << "\n" << border << "\n";
    std::cerr << " [ERROR] " << title << "\n";
    std::cerr << std::string(60, '-') << "\n";
    std::cerr << "  " << detail << "\n";
    if (!hints.empty()) {
        std::cerr << "\n  请检查:\n";
        for (const auto& hint : hints) {
            std::cerr << "    - " << hint << "\n";
        }
    }
    std::cerr << border << "\n" << std::endl;

    LOG_FATAL << "[Startup] " << title << ": " << detail;
}

/**
 * @brief 根据失败阶段返回排查提示
 */
std::vector<std::string> getStageHints(const std::string& stage) {
    if (stage == "database:ping" || stage == "database:initialize") {
        return {
            "PostgreSQL 服务是否正在运行",
            "config 中 db_clients 的 host/port 是否正确",
            "数据库用户名和密码是否正确",
            "数据库名称是否存在",
            "防火墙/安全组是否放行了数据库端口",
        };
    }
    if (stage == "collector:start") {
        return {
            "plc_device 表是否已正确创建",
            "system_settings 中的采集参数是否合法",
            "数据库连接是否稳定",
        };
    }
    return {};
}

/**
 * @brief 服务器启动回调
 */
void onServerStarted() {
    auto listeners = app().getListeners();
    std::cout << "PLC collector started" << std::endl;
    for (const auto& addr : listeners) {
        std::cout << "  -> http://" << addr.toIpPort() << std::endl;
        LOG_INFO << "Server listening on http://" << addr.toIpPort();
    }
    std::cout << "Logs: ./logs/plc-collector_*.log" << std::endl;

    // 异步初始化任务（顺序执行）
    async_run([]() -> Task<> {
        std::string stage = "startup:init";
        try {
            stage = "database:ping";
            LOG_INFO << "[Startup] " << stage;
            DatabaseService dbHealthCheck;
            co_await dbHealthCheck.ping();

            stage = "database:initialize";
            LOG_INFO << "[Startup] " << stage;
            // 1. 建表（必须先完成）
            auto defaults = ConfigManager::getCollectorDefaults();
            co_await DatabaseInitializer::initialize(defaults);

            stage = "collector:start";
            LOG_INFO << "[Startup] " << stage;
            // 2. 加载采集参数并启动采集器（首次建连会阻塞，移出 IO 线程）
            co_await BlockingCall<bool>([defaults]() {
                auto settingsStore = std::make_shared<PgSettingsStore>(defaults);
                Collector::instance().start(settingsStore->load(),
                                            std::make_shared<PgRegistrySource>(),
                                            std::make_shared<PgTimeSeriesStore>(),
                                            settingsStore);
                return true;
            });

            LOG_INFO << "[Startup] bootstrap completed, "
                     << Collector::instance().connectionCount() << " device connection(s)";
        } catch (const std::exception& e) {
            printStartupError("启动阶段失败: " + stage, e.what(), getStageHints(stage));
            app().getLoop()->queueInLoop([]() {
                app().quit();
            });
        }
    });
}

/**
 * @brief 服务器退出回调
 */
void onServerStopping() {
    LOG_INFO << "Server is stopping, cleaning up resources...";

    // 停止采集定时器与线程池，断开全部设备连接
    Collector::instance().stop();

    LOG_INFO << "All resources cleaned up";
}

int main() {
    // 0. 验证 mimalloc 已激活
    int v = mi_version();
    std::cout << "mimalloc v" << (v / 100) << "." << (v % 100) << " active" << std::endl;

    // 1. 初始化日志系统（AsyncFileLogger 异步写盘 + 按日期轮转）
    LoggerManager::initialize("./logs");

    // 2. 加载并验证配置文件（失败时 ConfigManager 已输出详细错误）
    if (!ConfigManager::load()) {
        std::cerr << "Server startup aborted due to configuration errors." << std::endl;
        LoggerManager::close();
        return 1;
    }

    // 3. 应用配置
    LoggerManager::setLogLevel(ConfigManager::getLogLevel());
    LoggerManager::setConsoleEcho(ConfigManager::isConsoleLogEnabled());

    // 4. 设置全局异常处理
    AppExceptionHandler::setup();

    // 5. 注册启动回调
    app().registerBeginningAdvice([]() {
        // 检查 DB 客户端是否可用（Drogon 根据配置创建连接池）
        try {
            DatabaseService dbService;
            if (!dbService.getClient()) {
                printStartupError("数据库客户端不可用",
                    "Drogon 未能创建 DB 客户端 'default'", {
                    "config 中 db_clients 配置是否正确",
                    "PostgreSQL 服务是否正在运行",
                    "数据库连接地址和端口是否可达",
                });
                std::exit(1);
            }
        } catch (const std::exception& e) {
            printStartupError("数据库客户端初始化失败", e.what(), {
                "config 中 db_clients 配置是否正确",
                "PostgreSQL 服务是否正在运行",
                "数据库连接地址和端口是否可达",
            });
            std::exit(1);
        }

        onServerStarted();
    });

    // 6. 启动服务器
    app().run();

    // 7. 服务器退出后清理资源
    onServerStopping();
    LoggerManager::close();

    return 0;
}
