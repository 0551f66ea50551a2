#pragma once

#include "rclogic/logic/LogicExpression.hpp"
#include "rclogic/columnar/BooleanMask.hpp"
#include "rclogic/columnar/DataTable.hpp"

#include <set>
#include <string>
#include <vector>

namespace rclogic {
namespace logic {

/**
 * @brief 编译后的分支逻辑谓词
 *
 * 创建后不可变，可以在线程间共享。对数据表求值得到逐行布尔掩码，
 * AND/OR/NOT 的组合方式与语法树完全一致。
 */
class CompiledPredicate {
public:
    CompiledPredicate(std::string logic, LogicExpression::Ptr root, std::set<std::string> fields);

    const std::string& logic() const noexcept { return logic_; }
    const LogicExpression::Ptr& root() const noexcept { return root_; }
    const std::set<std::string>& referencedFields() const noexcept { return fields_; }

    /**
     * @brief 对数据表逐行求值
     * @throws UnknownFieldException 表中缺少引用的字段
     */
    columnar::BooleanMask evaluate(const columnar::DataTable& table) const;

    /**
     * @brief 表中缺少的引用字段（按字段名排序）
     */
    std::vector<std::string> missingFields(const columnar::DataTable& table) const;

    std::string toString() const;

private:
    std::string logic_;
    LogicExpression::Ptr root_;
    std::set<std::string> fields_;

    columnar::BooleanMask evaluateNode(const LogicExpression& node, const columnar::DataTable& table) const;
    columnar::BooleanMask evaluateComparison(const LogicExpression& node, const columnar::DataTable& table) const;
};

/**
 * @brief evaluate(predicate, table) 便捷形式
 */
inline columnar::BooleanMask evaluate(const CompiledPredicate& predicate, const columnar::DataTable& table) {
    return predicate.evaluate(table);
}

}} // namespace rclogic::logic
