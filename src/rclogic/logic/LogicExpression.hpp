#pragma once

#include "rclogic/core/RedcapValue.hpp"

#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace rclogic {
namespace logic {

enum class ExpressionKind : uint8_t {
    FieldRef,
    Literal,
    Comparison,
    And,
    Or,
    Not
};

/**
 * @brief 比较的种类，由右操作数的形态在降级阶段推断
 */
enum class ComparisonKind : uint8_t {
    Numeric,      // 右侧为裸数字：数值比较
    Categorical,  // 右侧为引号字符串：精确匹配 / 字典序
    Field         // 右侧为另一个字段：逐行比较
};

enum class LiteralKind : uint8_t {
    Number,
    String
};

const char* toString(ExpressionKind kind) noexcept;
const char* toString(ComparisonKind kind) noexcept;

/**
 * @brief 分支逻辑的抽象语法树节点（不可变）
 *
 * 通过静态工厂构造，节点之间以 shared_ptr<const> 共享，
 * 编译后的谓词可以安全地在线程间共享。
 */
class LogicExpression {
public:
    using Ptr = std::shared_ptr<const LogicExpression>;

    static Ptr field(std::string name);
    static Ptr numberLiteral(double value, std::string text);
    static Ptr stringLiteral(std::string text);
    static Ptr comparison(core::CompareOp op, ComparisonKind kind, Ptr left, Ptr right);
    static Ptr conjunction(Ptr left, Ptr right);
    static Ptr disjunction(Ptr left, Ptr right);
    static Ptr negation(Ptr operand);

    ExpressionKind kind() const noexcept { return kind_; }

    // FieldRef: 字段名；Literal: 字面量原文
    const std::string& text() const noexcept { return text_; }

    // Literal
    LiteralKind literalKind() const noexcept { return literal_kind_; }
    double number() const noexcept { return number_; }

    // Comparison
    core::CompareOp op() const noexcept { return op_; }
    ComparisonKind comparisonKind() const noexcept { return comparison_kind_; }

    // Comparison/And/Or 的左右子树；Not 的操作数在 left()
    const Ptr& left() const noexcept { return left_; }
    const Ptr& right() const noexcept { return right_; }

    /**
     * @brief 规范化输出，And/Or 总是带括号，便于检查优先级
     *
     * 例如 "[a] < 2 OR [a] >= 30 AND [b] = 1" 输出
     * "([a] < 2 OR ([a] >= 30 AND [b] = 1))"
     */
    std::string toString() const;

    void collectFields(std::set<std::string>& fields) const;

private:
    explicit LogicExpression(ExpressionKind kind) : kind_(kind) {}

    ExpressionKind kind_;
    std::string text_;
    LiteralKind literal_kind_ = LiteralKind::String;
    double number_ = 0.0;
    core::CompareOp op_ = core::CompareOp::Equal;
    ComparisonKind comparison_kind_ = ComparisonKind::Categorical;
    Ptr left_;
    Ptr right_;
};

}} // namespace rclogic::logic
