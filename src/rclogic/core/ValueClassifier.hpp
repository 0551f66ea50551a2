#pragma once

#include "rclogic/core/ValueCategory.hpp"
#include "rclogic/core/ClassifierConfig.hpp"

#include <string_view>
#include <optional>

namespace rclogic {
namespace core {

/**
 * @brief 分类结果
 */
struct Classification {
    ValueCategory category;
    double numeric_value;  // 文本族为 NaN，Missing 为 0.0
};

/**
 * @brief 原始字符串 -> 值类别的分类器
 *
 * 按严格优先级判定：
 * 1. 空串 -> Missing
 * 2. 缺失数据代码 -> Code
 * 3. 可完整解析为有符号十进制数 -> Number
 * 4. 匹配某个日期格式（按配置顺序） -> Date
 * 5. 其余 -> Text
 */
class ValueClassifier {
public:
    explicit ValueClassifier(ClassifierConfig config = ClassifierConfig::standard());

    Classification classify(std::string_view raw) const;

    /**
     * @brief 严格的数字解析
     *
     * 允许前导 '+' 或 '-'、小数与指数；不允许空白、inf/nan、十六进制，
     * 必须消费整个字符串，超出 double 范围视为不可解析。
     */
    static std::optional<double> parseNumber(std::string_view text);

    bool isMissingCode(std::string_view raw) const;

    /**
     * @brief 返回第一个匹配的日期格式下标
     */
    std::optional<size_t> matchDateFormat(std::string_view raw) const;

    const ClassifierConfig& getConfig() const { return config_; }

private:
    ClassifierConfig config_;
};

}} // namespace rclogic::core
