#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 0: 成功
 * - 1xxx: 客户端错误（请求参数、资源不存在、配置错误等）
 * - 5xxx: 服务器内部错误（数据库、网络、协议）
 */
namespace ErrorCodes {

// ==================== 成功 ====================

/** 操作成功 */
inline constexpr int SUCCESS = 0;

// ==================== 客户端错误 (1xxx) ====================

/** 资源不存在 */
inline constexpr int NOT_FOUND = 1001;

/** 请求参数错误 */
inline constexpr int BAD_REQUEST = 1002;

/** 数据验证失败 */
inline constexpr int VALIDATION_FAILED = 1005;

/** 地址配置或参数非法（未发起任何 IO） */
inline constexpr int CONFIGURATION_ERROR = 1006;

// ==================== 服务器错误 (5xxx) ====================

/** 服务器内部错误 */
inline constexpr int INTERNAL_ERROR = 5000;

/** 数据库错误（时序库 / 注册表不可用） */
inline constexpr int DATABASE_ERROR = 5001;

/** 网络错误（超时、拒绝、复位） */
inline constexpr int NETWORK_ERROR = 5003;

/** 协议数据错误（异常响应、解码失败） */
inline constexpr int PROTOCOL_DATA_ERROR = 5004;

}  // namespace ErrorCodes
