#include "rclogic/logic/LogicLowering.hpp"
#include "rclogic/core/Exception.hpp"
#include "rclogic/core/ValueClassifier.hpp"

#include <fmt/format.h>

namespace rclogic {
namespace logic {

namespace {

[[noreturn]] void malformed(const SyntaxNode& node, const ParseTree& tree) {
    RCLOGIC_THROW_ARGS(core::ParseException,
                       fmt::format("Malformed syntax tree at {} node", toString(node.kind())),
                       node.offset(), tree.source);
}

} // namespace

LogicLowering::LogicLowering(const TranslatorOptions& options)
    : options_(options) {
}

LoweredLogic LogicLowering::lower(const ParseTree& tree) const {
    if (!tree.root) {
        RCLOGIC_THROW_ARGS(core::ParseException, "Nothing to lower", 0, tree.source);
    }

    LoweredLogic lowered;
    lowered.root = lowerNode(*tree.root, tree, lowered.referenced_fields);
    return lowered;
}

std::string LogicLowering::resolveFieldName(const std::string& field,
                                            const std::optional<std::string>& choice) const {
    const std::string logic_name = choice ? fmt::format("{}({})", field, *choice) : field;

    auto alias = options_.field_aliases.find(logic_name);
    if (alias != options_.field_aliases.end()) {
        return alias->second;
    }
    if (!choice) {
        return field;
    }

    // 导出约定：负号写作下划线，例如 race(-99) -> race____99
    std::string code = *choice;
    for (auto& c : code) {
        if (c == '-') {
            c = '_';
        }
    }
    return field + options_.checkbox_separator + code;
}

LogicExpression::Ptr LogicLowering::lowerNode(const SyntaxNode& node, const ParseTree& tree,
                                              std::set<std::string>& fields) const {
    switch (node.kind()) {
        case SyntaxKind::Start:
            return lowerNode(node.child(0), tree, fields);

        case SyntaxKind::LogicStr:
        case SyntaxKind::AndTerm: {
            // 子节点形如 x (op x)*，左结合折叠
            LogicExpression::Ptr result = lowerNode(node.child(0), tree, fields);
            for (size_t i = 2; i < node.childCount(); i += 2) {
                LogicExpression::Ptr next = lowerNode(node.child(i), tree, fields);
                result = node.kind() == SyntaxKind::LogicStr
                    ? LogicExpression::disjunction(std::move(result), std::move(next))
                    : LogicExpression::conjunction(std::move(result), std::move(next));
            }
            return result;
        }

        case SyntaxKind::Term: {
            const SyntaxNode& first = node.child(0);
            if (first.kind() == SyntaxKind::Comparison) {
                return lowerComparison(first, tree, fields);
            }
            if (first.isToken(TokenType::LParen)) {
                return lowerNode(node.child(1), tree, fields);
            }
            if (first.isToken(TokenType::Bang)) {
                return LogicExpression::negation(lowerNode(node.child(2), tree, fields));
            }
            malformed(node, tree);
        }

        case SyntaxKind::Comparison:
            return lowerComparison(node, tree, fields);

        default:
            malformed(node, tree);
    }
}

LogicExpression::Ptr LogicLowering::lowerComparison(const SyntaxNode& node, const ParseTree& tree,
                                                    std::set<std::string>& fields) const {
    if (node.childCount() != 3) {
        malformed(node, tree);
    }

    LogicExpression::Ptr left = lowerField(node.child(0), fields);

    const Token& op_token = node.child(1).token();
    auto op = LogicGrammar::instance().compareOp(op_token.text);
    if (!op) {
        RCLOGIC_THROW_ARGS(core::ParseException,
                           fmt::format("Unknown comparison operator '{}'", op_token.text),
                           op_token.offset, tree.source);
    }

    const SyntaxNode& rhs = node.child(2);
    switch (rhs.kind()) {
        case SyntaxKind::FieldName:
            return LogicExpression::comparison(*op, ComparisonKind::Field,
                                               std::move(left), lowerField(rhs, fields));

        case SyntaxKind::CategoricalValue:
            return LogicExpression::comparison(*op, ComparisonKind::Categorical, std::move(left),
                                               LogicExpression::stringLiteral(rhs.child(0).token().text));

        case SyntaxKind::NumericValue: {
            const Token& number = rhs.child(0).token();
            auto value = core::ValueClassifier::parseNumber(number.text);
            if (!value) {
                RCLOGIC_THROW_ARGS(core::ParseException,
                                   fmt::format("Numeric literal '{}' is out of range", number.text),
                                   number.offset, tree.source);
            }
            return LogicExpression::comparison(*op, ComparisonKind::Numeric, std::move(left),
                                               LogicExpression::numberLiteral(*value, number.text));
        }

        default:
            malformed(rhs, tree);
    }
}

LogicExpression::Ptr LogicLowering::lowerField(const SyntaxNode& node, std::set<std::string>& fields) const {
    // [ IDENTIFIER ( "(" CHOICE_CODE ")" )? ]
    const std::string& field = node.child(1).token().text;
    std::optional<std::string> choice;
    if (node.childCount() == 6) {
        choice = node.child(3).token().text;
    }

    std::string resolved = resolveFieldName(field, choice);
    fields.insert(resolved);
    return LogicExpression::field(std::move(resolved));
}

}} // namespace rclogic::logic
