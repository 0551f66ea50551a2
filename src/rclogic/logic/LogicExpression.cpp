#include "rclogic/logic/LogicExpression.hpp"
#include "rclogic/core/Exception.hpp"

#include <fmt/format.h>

namespace rclogic {
namespace logic {

const char* toString(ExpressionKind kind) noexcept {
    switch (kind) {
        case ExpressionKind::FieldRef:   return "FieldRef";
        case ExpressionKind::Literal:    return "Literal";
        case ExpressionKind::Comparison: return "Comparison";
        case ExpressionKind::And:        return "And";
        case ExpressionKind::Or:         return "Or";
        case ExpressionKind::Not:        return "Not";
        default:                         return "Unknown";
    }
}

const char* toString(ComparisonKind kind) noexcept {
    switch (kind) {
        case ComparisonKind::Numeric:     return "Numeric";
        case ComparisonKind::Categorical: return "Categorical";
        case ComparisonKind::Field:       return "Field";
        default:                          return "Unknown";
    }
}

LogicExpression::Ptr LogicExpression::field(std::string name) {
    auto node = std::shared_ptr<LogicExpression>(new LogicExpression(ExpressionKind::FieldRef));
    node->text_ = std::move(name);
    return node;
}

LogicExpression::Ptr LogicExpression::numberLiteral(double value, std::string text) {
    auto node = std::shared_ptr<LogicExpression>(new LogicExpression(ExpressionKind::Literal));
    node->literal_kind_ = LiteralKind::Number;
    node->number_ = value;
    node->text_ = std::move(text);
    return node;
}

LogicExpression::Ptr LogicExpression::stringLiteral(std::string text) {
    auto node = std::shared_ptr<LogicExpression>(new LogicExpression(ExpressionKind::Literal));
    node->literal_kind_ = LiteralKind::String;
    node->text_ = std::move(text);
    return node;
}

LogicExpression::Ptr LogicExpression::comparison(core::CompareOp op, ComparisonKind kind, Ptr left, Ptr right) {
    if (!left || !right || left->kind() != ExpressionKind::FieldRef) {
        throw core::RcLogicException("Comparison requires a field on the left and an operand on the right",
                                     core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    auto node = std::shared_ptr<LogicExpression>(new LogicExpression(ExpressionKind::Comparison));
    node->op_ = op;
    node->comparison_kind_ = kind;
    node->left_ = std::move(left);
    node->right_ = std::move(right);
    return node;
}

LogicExpression::Ptr LogicExpression::conjunction(Ptr left, Ptr right) {
    auto node = std::shared_ptr<LogicExpression>(new LogicExpression(ExpressionKind::And));
    node->left_ = std::move(left);
    node->right_ = std::move(right);
    return node;
}

LogicExpression::Ptr LogicExpression::disjunction(Ptr left, Ptr right) {
    auto node = std::shared_ptr<LogicExpression>(new LogicExpression(ExpressionKind::Or));
    node->left_ = std::move(left);
    node->right_ = std::move(right);
    return node;
}

LogicExpression::Ptr LogicExpression::negation(Ptr operand) {
    auto node = std::shared_ptr<LogicExpression>(new LogicExpression(ExpressionKind::Not));
    node->left_ = std::move(operand);
    return node;
}

std::string LogicExpression::toString() const {
    switch (kind_) {
        case ExpressionKind::FieldRef:
            return fmt::format("[{}]", text_);
        case ExpressionKind::Literal:
            return literal_kind_ == LiteralKind::String ? fmt::format("'{}'", text_) : text_;
        case ExpressionKind::Comparison:
            return fmt::format("{} {} {}", left_->toString(), core::toString(op_), right_->toString());
        case ExpressionKind::And:
            return fmt::format("({} AND {})", left_->toString(), right_->toString());
        case ExpressionKind::Or:
            return fmt::format("({} OR {})", left_->toString(), right_->toString());
        case ExpressionKind::Not:
            return fmt::format("!({})", left_->toString());
        default:
            return "?";
    }
}

void LogicExpression::collectFields(std::set<std::string>& fields) const {
    if (kind_ == ExpressionKind::FieldRef) {
        fields.insert(text_);
        return;
    }
    if (left_) {
        left_->collectFields(fields);
    }
    if (right_) {
        right_->collectFields(fields);
    }
}

}} // namespace rclogic::logic
