#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace rclogic {
namespace logic {

/**
 * @brief 翻译器配置
 */
struct TranslatorOptions {
    size_t cache_capacity = 256;                                  // 谓词缓存容量，0 表示关闭
    std::unordered_map<std::string, std::string> field_aliases;   // 逻辑中的名字 -> 导出列名
    std::string checkbox_separator = "___";                       // 复选框导出列名分隔符

    /**
     * @brief 分隔符为空时抛出 ConfigException
     */
    void validate() const;
};

}} // namespace rclogic::logic
