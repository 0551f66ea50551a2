#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用

#ifndef ENABLE_CLASSIFIER_DEBUG_LOGS
#define ENABLE_CLASSIFIER_DEBUG_LOGS 0   // 逐值分类与驻留池淘汰（热路径，默认关闭）
#endif

#ifndef ENABLE_PARSER_DEBUG_LOGS
#define ENABLE_PARSER_DEBUG_LOGS 0       // 词法/语法分析过程
#endif

// 条件日志宏在 ModuleLoggers.hpp 中基于模块宏定义：
// RCLOGIC_LOG_CLASSIFIER_DEBUG -> CORE_DEBUG
// RCLOGIC_LOG_PARSER_DEBUG     -> LOGIC_DEBUG
