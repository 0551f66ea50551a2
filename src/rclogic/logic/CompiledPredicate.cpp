#include "rclogic/logic/CompiledPredicate.hpp"
#include "rclogic/core/Exception.hpp"
#include "rclogic/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace rclogic {
namespace logic {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) {
            out += ", ";
        }
        out += name;
    }
    return out;
}

} // namespace

CompiledPredicate::CompiledPredicate(std::string logic, LogicExpression::Ptr root, std::set<std::string> fields)
    : logic_(std::move(logic)), root_(std::move(root)), fields_(std::move(fields)) {
    if (!root_) {
        RCLOGIC_THROW(core::InputTypeException, "Compiled predicate requires an expression");
    }
}

std::vector<std::string> CompiledPredicate::missingFields(const columnar::DataTable& table) const {
    std::vector<std::string> missing;
    for (const auto& field : fields_) {
        if (!table.hasColumn(field)) {
            missing.push_back(field);
        }
    }
    return missing;
}

columnar::BooleanMask CompiledPredicate::evaluate(const columnar::DataTable& table) const {
    auto missing = missingFields(table);
    if (!missing.empty()) {
        LOGIC_ERROR("Logic '{}' references fields absent from the table: {}", logic_, joinNames(missing));
        core::UnknownFieldException e(fmt::format("Unknown field '{}' in branching logic", missing.front()),
                                      missing.front(), __FILE__, __LINE__);
        e.addContext(fmt::format("logic: {}", logic_));
        throw e;
    }
    return evaluateNode(*root_, table);
}

columnar::BooleanMask CompiledPredicate::evaluateNode(const LogicExpression& node,
                                                      const columnar::DataTable& table) const {
    switch (node.kind()) {
        case ExpressionKind::Comparison:
            return evaluateComparison(node, table);
        case ExpressionKind::And:
            return columnar::maskAnd(evaluateNode(*node.left(), table), evaluateNode(*node.right(), table));
        case ExpressionKind::Or:
            return columnar::maskOr(evaluateNode(*node.left(), table), evaluateNode(*node.right(), table));
        case ExpressionKind::Not:
            return columnar::maskNot(evaluateNode(*node.left(), table));
        case ExpressionKind::FieldRef:
        case ExpressionKind::Literal:
        default:
            RCLOGIC_THROW(core::InputTypeException,
                          fmt::format("Expression '{}' is not a predicate", node.toString()));
    }
}

columnar::BooleanMask CompiledPredicate::evaluateComparison(const LogicExpression& node,
                                                            const columnar::DataTable& table) const {
    const columnar::RedcapValueArray& column = table.column(node.left()->text());
    const LogicExpression& rhs = *node.right();

    switch (node.comparisonKind()) {
        case ComparisonKind::Numeric:
            return column.compare(node.op(), core::Operand(rhs.number()));

        case ComparisonKind::Categorical:
            return column.compare(node.op(), core::Operand(rhs.text()));

        case ComparisonKind::Field: {
            const columnar::RedcapValueArray& other = table.column(rhs.text());
            if (node.op() == core::CompareOp::Equal || node.op() == core::CompareOp::NotEqual) {
                return column.compare(node.op(), other);
            }

            // 排序比较时右列逐行转换：NUMBER/MISSING 作为数字，其余作为原始串
            const auto& raw = other.rawStrings();
            const auto& numeric = other.numericValues();
            const auto& categories = other.categories();

            std::vector<core::Operand> operands;
            operands.reserve(other.size());
            for (size_t i = 0; i < other.size(); ++i) {
                if (categories[i] == core::ValueCategory::Number || categories[i] == core::ValueCategory::Missing) {
                    operands.emplace_back(numeric[i]);
                } else {
                    operands.emplace_back(raw[i]);
                }
            }
            return column.compare(node.op(), operands);
        }

        default:
            RCLOGIC_THROW(core::InputTypeException, "Unsupported comparison kind");
    }
}

std::string CompiledPredicate::toString() const {
    return root_->toString();
}

}} // namespace rclogic::logic
