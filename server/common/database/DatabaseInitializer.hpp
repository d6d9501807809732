#pragma once

#include "modules/collector/Settings.hpp"
#include "DatabaseService.hpp"

/**
 * @brief 启动时建表（幂等，可重复执行）
 */
class DatabaseInitializer {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    template<typename T = void> using Task = drogon::Task<T>;

    /**
     * @param defaults system_settings 为空时写入的初始采集参数
     */
    static Task<> initialize(Settings defaults = {}) {
        auto db = DatabaseService().getClient();

        LOG_INFO << "[Startup] Checking database initialization...";

        // 抑制 IF NOT EXISTS 产生的 NOTICE（"relation already exists, skipping"）
        co_await db->execSqlCoro("SET client_min_messages = WARNING");

        // 数据库级别固定 UTC 时区
        co_await db->execSqlCoro(R"(
            DO $$ BEGIN
                EXECUTE format('ALTER DATABASE %I SET timezone = ''UTC''', current_database());
            END $$
        )");

        co_await createTables(db);
        co_await createTriggers(db);
        co_await initializeTimescaleDB(db);
        co_await seedSettings(db, defaults);

        LOG_INFO << "[Startup] Database initialization completed";
    }

private:
    static Task<> createTables(const DbClientPtr& db) {
        // ==================== 设备表 ====================
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS plc_device (
                id SERIAL PRIMARY KEY,
                name VARCHAR(100) NOT NULL,
                plc_type VARCHAR(50) NOT NULL DEFAULT 'modbus_tcp',
                protocol VARCHAR(20) NOT NULL DEFAULT 'tcp',
                ip_address VARCHAR(64) NOT NULL,
                port INT NOT NULL DEFAULT 502,
                addresses TEXT NOT NULL DEFAULT '[]',
                byte_order VARCHAR(10) NOT NULL DEFAULT 'CDAB',
                station_id INT NOT NULL DEFAULT 1,
                description TEXT,
                is_active BOOLEAN NOT NULL DEFAULT TRUE,
                is_connected BOOLEAN NOT NULL DEFAULT FALSE,
                status VARCHAR(20) NOT NULL DEFAULT 'offline',
                last_collect_time TIMESTAMPTZ NULL,
                group_id INT NULL,
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_plc_device_active ON plc_device (is_active))");

        // ==================== 系统参数表 ====================
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS system_settings (
                key VARCHAR(100) PRIMARY KEY,
                value TEXT NOT NULL,
                description TEXT,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP
            )
        )");

        // ==================== 采集数据表 ====================
        // 主键包含 ts，转换为超表时要求唯一约束带分区列
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS plc_data (
                id BIGSERIAL,
                device_id INT NOT NULL,
                device_name VARCHAR(100) NOT NULL,
                address VARCHAR(100) NOT NULL,
                station_id INT,
                register_type VARCHAR(50),
                function_code INT,
                data_type VARCHAR(20),
                unit VARCHAR(20),
                byte_order VARCHAR(10),
                word_swap BOOLEAN DEFAULT FALSE,
                scan_rate INT,
                value DOUBLE PRECISION NOT NULL,
                raw_value DOUBLE PRECISION,
                scaled_value DOUBLE PRECISION,
                quality VARCHAR(20) NOT NULL DEFAULT 'good',
                response_time DOUBLE PRECISION,
                ts TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                PRIMARY KEY (id, ts)
            )
        )");
        // 1. 设备+时间：按设备查询、统计
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_plc_data_device_ts ON plc_data (device_id, ts DESC))");
        // 2. 时间：异常检测全量扫描、过期清理
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_plc_data_ts ON plc_data (ts))");

        // ==================== 通讯错误表 ====================
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS plc_communication_error (
                id BIGSERIAL PRIMARY KEY,
                device_id INT NOT NULL,
                device_name VARCHAR(100) NOT NULL,
                error_type VARCHAR(50) NOT NULL,
                message TEXT NOT NULL,
                severity VARCHAR(20) NOT NULL DEFAULT 'high',
                address VARCHAR(100) NULL,
                station_id INT NULL,
                ts TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_plc_comm_error_ts ON plc_communication_error (ts DESC))");

        // ==================== 采集日志表 ====================
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS plc_collect_log (
                id BIGSERIAL PRIMARY KEY,
                device_id INT NOT NULL,
                status VARCHAR(20) NOT NULL,
                message TEXT,
                response_time DOUBLE PRECISION DEFAULT 0,
                ts TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_plc_collect_log_device_ts ON plc_collect_log (device_id, ts DESC))");

        LOG_INFO << "[Startup] Tables created/verified";
    }

    static Task<> initializeTimescaleDB(const DbClientPtr& db) {
        try {
            auto extResult = co_await db->execSqlCoro(R"(
                SELECT EXISTS (
                    SELECT 1 FROM pg_extension WHERE extname = 'timescaledb'
                ) as installed
            )");

            if (!extResult[0]["installed"].as<bool>()) {
                try {
                    co_await db->execSqlCoro("CREATE EXTENSION IF NOT EXISTS timescaledb CASCADE");
                    LOG_INFO << "[Startup] TimescaleDB extension created";
                } catch (const std::exception&) {
                    LOG_INFO << "[Startup] TimescaleDB not available, plc_data stays a plain table";
                    co_return;
                }
            }

            // 每天一个分区，过期清理按 ts 删除
            co_await db->execSqlCoro(R"(
                SELECT create_hypertable(
                    'plc_data',
                    'ts',
                    chunk_time_interval => INTERVAL '1 day',
                    if_not_exists => TRUE,
                    migrate_data => TRUE
                )
            )");
            LOG_INFO << "[Startup] plc_data is a TimescaleDB hypertable";
        } catch (const std::exception& e) {
            LOG_WARN << "[Startup] TimescaleDB initialization skipped: " << e.what();
        }
    }

    static Task<> createTriggers(const DbClientPtr& db) {
        co_await db->execSqlCoro(R"(
            CREATE OR REPLACE FUNCTION update_updated_at_column()
            RETURNS TRIGGER AS $$
            BEGIN
                NEW.updated_at = CURRENT_TIMESTAMP;
                RETURN NEW;
            END;
            $$ language 'plpgsql'
        )");

        for (const char* table : {"plc_device", "system_settings"}) {
            std::string sql = std::string(R"(
                DO $$ BEGIN
                    CREATE TRIGGER update_)") + table + R"(_updated_at BEFORE UPDATE ON )" + table + R"(
                        FOR EACH ROW EXECUTE FUNCTION update_updated_at_column();
                EXCEPTION WHEN duplicate_object THEN null; END $$
            )";
            co_await db->execSqlCoro(sql);
        }

        LOG_INFO << "[Startup] Database triggers created/verified";
    }

    /**
     * @brief 补齐缺失的采集参数行（已有值不覆盖）
     */
    static Task<> seedSettings(const DbClientPtr& db, const Settings& defaults) {
        auto json = defaults.toJson();
        for (const auto& key : json.getMemberNames()) {
            co_await db->execSqlCoro(R"(
                INSERT INTO system_settings (key, value, description)
                VALUES ($1, $2, $3)
                ON CONFLICT (key) DO NOTHING
            )", key, StringUtils::formatNumber(json[key].asDouble()), std::string("采集参数"));
        }
    }
};
