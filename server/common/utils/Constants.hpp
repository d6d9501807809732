#pragma once

/**
 * @brief 全局常量定义
 *
 * 集中管理项目中的魔法数字，提高可维护性和可读性
 */
namespace Constants {

// ==================== 采集默认值 ====================

/** 默认采集间隔（秒） */
inline constexpr double DEFAULT_COLLECT_INTERVAL_SEC = 5.0;

/** 默认连接超时（毫秒） */
inline constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 5000;

/** 默认接收超时（毫秒） */
inline constexpr int DEFAULT_RECEIVE_TIMEOUT_MS = 10000;

/** 默认最大并发连接数 */
inline constexpr int DEFAULT_MAX_CONNECTIONS = 100;

/** 默认数据保留天数 */
inline constexpr int DEFAULT_RETENTION_DAYS = 30;

/** 采集线程池默认大小 */
inline constexpr int DEFAULT_WORKER_COUNT = 10;

/** 单次采集周期上限（秒），超过后不再提交新任务 */
inline constexpr int CYCLE_CEILING_SEC = 300;

/** 单台设备采集等待上限（秒） */
inline constexpr int DEVICE_WAIT_SEC = 60;

/** 未分组设备的排序键 */
inline constexpr int UNGROUPED_SORT_KEY = 999;

/** 每日数据清理时刻（本地时间，时） */
inline constexpr int CLEANUP_HOUR = 2;

/** 单点写入 / 批量写入的地址数阈值 */
inline constexpr size_t BATCH_WRITE_THRESHOLD = 10;

// ==================== 重连策略 ====================

/** 重连最大退避（秒）- 5分钟 */
inline constexpr double RECONNECT_MAX_DELAY_SEC = 300.0;

// ==================== 写入校验 ====================

/** 写入地址最大长度 */
inline constexpr size_t WRITE_ADDRESS_MAX_LENGTH = 100;

/** 写入数值绝对值上限 */
inline constexpr double WRITE_VALUE_MAX_ABS = 1e10;

// ==================== 协议相关 ====================

/** RTU 总线切换站号后的等待（毫秒） */
inline constexpr int STATION_SWITCH_DELAY_MS = 20;

/** 字符串读取默认长度（字符） */
inline constexpr int DEFAULT_STRING_LENGTH = 10;

/** Fins 读取最大重试次数 */
inline constexpr int FINS_MAX_RETRIES = 2;

/** Modbus TCP 默认端口 */
inline constexpr int MODBUS_DEFAULT_PORT = 502;

/** Omron Fins/TCP 默认端口 */
inline constexpr int FINS_DEFAULT_PORT = 9600;

/** Siemens S7 (ISO-on-TCP) 默认端口 */
inline constexpr int S7_DEFAULT_PORT = 102;

// ==================== 协议类型 ====================

inline constexpr const char* PROTOCOL_MODBUS_TCP = "Modbus TCP";
inline constexpr const char* PROTOCOL_MODBUS_RTU = "Modbus RTU";
inline constexpr const char* PROTOCOL_MODBUS_RTU_OVER_TCP = "Modbus RTU over TCP";
inline constexpr const char* PROTOCOL_OMRON_FINS = "Omron Fins";
inline constexpr const char* PROTOCOL_SIEMENS_S7 = "Siemens S7";

// ==================== 异常检测 ====================

/** 数据中断阈值（秒） */
inline constexpr double ANOMALY_GAP_SEC = 300.0;

/** 数据中断高严重度阈值（秒） */
inline constexpr double ANOMALY_GAP_HIGH_SEC = 1800.0;

/** 突变判定的标准差倍数 */
inline constexpr double ANOMALY_SPIKE_SIGMA = 3.0;

/** 默认值域下限 */
inline constexpr double ANOMALY_RANGE_MIN = 0.0;

/** 默认值域上限 */
inline constexpr double ANOMALY_RANGE_MAX = 1000.0;

// ==================== 设备状态 ====================

inline constexpr const char* DEVICE_STATUS_ONLINE = "online";
inline constexpr const char* DEVICE_STATUS_OFFLINE = "offline";

}  // namespace Constants
