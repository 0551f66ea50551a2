#pragma once

#include <cstdint>
#include <ostream>

namespace rclogic {
namespace core {

/**
 * @brief 响应值类别
 *
 * Missing/Number/Text 为基本类别，Date 与 Code 是 Text 的细分。
 * 文本族 {Text, Date, Code} 的数值恒为 NaN。
 */
enum class ValueCategory : uint8_t {
    Missing = 0,  // 空串
    Number = 1,   // 可完整解析为有符号十进制数
    Text = 2,     // 其他文本
    Date = 3,     // 匹配已配置的日期/时间格式
    Code = 4      // 已配置的缺失数据代码（如 "NA-2"）
};

inline bool isTextFamily(ValueCategory category) noexcept {
    return category == ValueCategory::Text ||
           category == ValueCategory::Date ||
           category == ValueCategory::Code;
}

inline const char* toString(ValueCategory category) noexcept {
    switch (category) {
        case ValueCategory::Missing: return "MISSING";
        case ValueCategory::Number:  return "NUMBER";
        case ValueCategory::Text:    return "TEXT";
        case ValueCategory::Date:    return "DATE";
        case ValueCategory::Code:    return "CODE";
        default:                     return "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, ValueCategory category) {
    return os << toString(category);
}

}} // namespace rclogic::core
