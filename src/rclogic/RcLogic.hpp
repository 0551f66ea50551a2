#pragma once

// RcLogic库 - REDCap 响应值类型系统与分支逻辑翻译

#include <string>

// 值类型
#include "rclogic/core/ErrorCode.hpp"
#include "rclogic/core/Exception.hpp"
#include "rclogic/core/Expected.hpp"
#include "rclogic/core/ValueCategory.hpp"
#include "rclogic/core/ClassifierConfig.hpp"
#include "rclogic/core/ValueClassifier.hpp"
#include "rclogic/core/RedcapValue.hpp"
#include "rclogic/core/ValueFactory.hpp"

// 列式存储
#include "rclogic/columnar/BooleanMask.hpp"
#include "rclogic/columnar/RedcapValueArray.hpp"
#include "rclogic/columnar/DataTable.hpp"

// 分支逻辑
#include "rclogic/logic/LogicGrammar.hpp"
#include "rclogic/logic/LogicTranslator.hpp"

// 版本信息
#define RCLOGIC_VERSION_MAJOR 1
#define RCLOGIC_VERSION_MINOR 0
#define RCLOGIC_VERSION_PATCH 0
#define RCLOGIC_VERSION_STRING "1.0.0"

// 导出宏定义
#ifdef _WIN32
    #ifdef RCLOGIC_SHARED
        #ifdef RCLOGIC_EXPORTS
            #define RCLOGIC_API __declspec(dllexport)
        #else
            #define RCLOGIC_API __declspec(dllimport)
        #endif
    #else
        #define RCLOGIC_API
    #endif
#else
    #define RCLOGIC_API
#endif

namespace rclogic {

inline std::string getVersion() {
    return RCLOGIC_VERSION_STRING;
}

/**
 * @brief 初始化RcLogic库
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
RCLOGIC_API bool initialize(const std::string& log_file_path = "", bool enable_console = true);

/**
 * @brief 清理RcLogic库资源（刷新并关闭日志）
 */
RCLOGIC_API void cleanup();

// 常用入口
using core::makeValue;
using columnar::makeArray;
using logic::evaluate;

} // namespace rclogic
