#pragma once

#include "rclogic/logic/LogicExpression.hpp"
#include "rclogic/logic/LogicParser.hpp"
#include "rclogic/logic/TranslatorOptions.hpp"

#include <optional>
#include <set>
#include <string>

namespace rclogic {
namespace logic {

/**
 * @brief 降级结果
 */
struct LoweredLogic {
    LogicExpression::Ptr root;
    std::set<std::string> referenced_fields;
};

/**
 * @brief 具体语法树 -> 抽象语法树
 *
 * - 按右操作数形态推断比较种类（Numeric / Categorical / Field）
 * - 解析字段名：先查别名表，复选框引用 [f(2)] 缺省映射为 f___2
 * - 收集全部引用字段
 */
class LogicLowering {
public:
    explicit LogicLowering(const TranslatorOptions& options);

    LoweredLogic lower(const ParseTree& tree) const;

    /**
     * @brief 逻辑中的字段引用 -> 数据表中的导出列名
     */
    std::string resolveFieldName(const std::string& field, const std::optional<std::string>& choice) const;

private:
    const TranslatorOptions& options_;

    LogicExpression::Ptr lowerNode(const SyntaxNode& node, const ParseTree& tree,
                                   std::set<std::string>& fields) const;
    LogicExpression::Ptr lowerComparison(const SyntaxNode& node, const ParseTree& tree,
                                         std::set<std::string>& fields) const;
    LogicExpression::Ptr lowerField(const SyntaxNode& node, std::set<std::string>& fields) const;
};

}} // namespace rclogic::logic
