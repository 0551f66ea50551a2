#pragma once

#include "rclogic/logic/LogicGrammar.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rclogic {
namespace logic {

/**
 * @brief 具体语法树节点类型，与产生式一一对应
 */
enum class SyntaxKind : uint8_t {
    Start,
    LogicStr,
    AndTerm,
    Term,
    Comparison,
    FieldName,
    CategoricalValue,
    NumericValue,
    Token  // 叶子：携带词法单元
};

const char* toString(SyntaxKind kind) noexcept;

/**
 * @brief 具体语法树节点
 */
class SyntaxNode {
public:
    SyntaxNode(SyntaxKind kind, size_t offset) : kind_(kind), offset_(offset) {}
    explicit SyntaxNode(Token token)
        : kind_(SyntaxKind::Token), offset_(token.offset), token_(std::move(token)) {}

    SyntaxKind kind() const noexcept { return kind_; }
    size_t offset() const noexcept { return offset_; }

    // 仅叶子节点有效
    const Token& token() const noexcept { return token_; }

    const std::vector<std::unique_ptr<SyntaxNode>>& children() const noexcept { return children_; }
    const SyntaxNode& child(size_t index) const { return *children_.at(index); }
    size_t childCount() const noexcept { return children_.size(); }

    SyntaxNode& addChild(std::unique_ptr<SyntaxNode> node) {
        children_.push_back(std::move(node));
        return *children_.back();
    }

    bool isToken(TokenType type) const noexcept {
        return kind_ == SyntaxKind::Token && token_.type == type;
    }

    /**
     * @brief S表达式形式的树结构，用于调试
     */
    std::string dump() const;

private:
    SyntaxKind kind_;
    size_t offset_;
    Token token_{TokenType::End, "", 0};
    std::vector<std::unique_ptr<SyntaxNode>> children_;
};

/**
 * @brief 解析结果：预处理后的源串 + 语法树根
 */
struct ParseTree {
    std::string source;
    std::unique_ptr<SyntaxNode> root;
};

/**
 * @brief 递归下降语法分析器
 *
 * 只负责按产生式构建具体语法树，不做语义判断；
 * 比较种类推断和字段名解析在 LogicLowering 中完成。
 */
class LogicParser {
public:
    explicit LogicParser(const LogicGrammar& grammar = LogicGrammar::instance());

    /**
     * @brief 预处理、分词并解析
     * @throws ParseException 空串或违反文法，offset 为预处理后字符串中的位置
     */
    ParseTree parse(std::string_view logic) const;

private:
    const LogicGrammar& grammar_;
};

}} // namespace rclogic::logic
