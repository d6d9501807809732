#pragma once

/**
 * @brief Modbus 协议模块
 *
 * 包含:
 * - Modbus.Types.hpp   - 寄存器区、功能码、请求/应答结构
 * - Modbus.Utils.hpp   - CRC16、PDU 构建、TCP/RTU 帧封装与解析、地址解析
 * - Modbus.Handler.hpp - 协议处理器：站号切换、类型化读取、写入
 */

#include "Modbus.Types.hpp"
#include "Modbus.Utils.hpp"
#include "Modbus.Handler.hpp"
