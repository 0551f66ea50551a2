#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 值类型模块 (core)
#define CORE_DEBUG(...)    RCLOGIC_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     RCLOGIC_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     RCLOGIC_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    RCLOGIC_LOG_ERROR("[ERR][core] " __VA_ARGS__)
#define CORE_CRITICAL(...) RCLOGIC_LOG_CRITICAL("[CRT][core] " __VA_ARGS__)

// 列式模块 (columnar)
#define COLUMNAR_DEBUG(...)    RCLOGIC_LOG_DEBUG("[DBG][col ] " __VA_ARGS__)
#define COLUMNAR_INFO(...)     RCLOGIC_LOG_INFO("[INF][col ] " __VA_ARGS__)
#define COLUMNAR_WARN(...)     RCLOGIC_LOG_WARN("[WRN][col ] " __VA_ARGS__)
#define COLUMNAR_ERROR(...)    RCLOGIC_LOG_ERROR("[ERR][col ] " __VA_ARGS__)
#define COLUMNAR_CRITICAL(...) RCLOGIC_LOG_CRITICAL("[CRT][col ] " __VA_ARGS__)

// 分支逻辑模块 (logic)
#define LOGIC_DEBUG(...)    RCLOGIC_LOG_DEBUG("[DBG][lgc ] " __VA_ARGS__)
#define LOGIC_INFO(...)     RCLOGIC_LOG_INFO("[INF][lgc ] " __VA_ARGS__)
#define LOGIC_WARN(...)     RCLOGIC_LOG_WARN("[WRN][lgc ] " __VA_ARGS__)
#define LOGIC_ERROR(...)    RCLOGIC_LOG_ERROR("[ERR][lgc ] " __VA_ARGS__)
#define LOGIC_CRITICAL(...) RCLOGIC_LOG_CRITICAL("[CRT][lgc ] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)    RCLOGIC_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_INFO(...)     RCLOGIC_LOG_INFO("[INF][util] " __VA_ARGS__)
#define UTILS_WARN(...)     RCLOGIC_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)    RCLOGIC_LOG_ERROR("[ERR][util] " __VA_ARGS__)
#define UTILS_CRITICAL(...) RCLOGIC_LOG_CRITICAL("[CRT][util] " __VA_ARGS__)

// 条件调试日志
#if ENABLE_CLASSIFIER_DEBUG_LOGS
    #define RCLOGIC_LOG_CLASSIFIER_DEBUG(...) CORE_DEBUG(__VA_ARGS__)
#else
    #define RCLOGIC_LOG_CLASSIFIER_DEBUG(...) do {} while(0)
#endif

#if ENABLE_PARSER_DEBUG_LOGS
    #define RCLOGIC_LOG_PARSER_DEBUG(...) LOGIC_DEBUG(__VA_ARGS__)
#else
    #define RCLOGIC_LOG_PARSER_DEBUG(...) do {} while(0)
#endif
