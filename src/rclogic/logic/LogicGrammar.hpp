#pragma once

#include "rclogic/core/RedcapValue.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rclogic {
namespace logic {

/**
 * @brief 词法单元类型
 */
enum class TokenType : uint8_t {
    LBracket,       // [
    RBracket,       // ]
    LParen,         // (
    RParen,         // )
    Bang,           // !
    CompOp,         // = <> < <= > >=
    And,            // AND（大小写不敏感）
    Or,             // OR（大小写不敏感）
    Identifier,     // 字段名或方括号内的选项代码
    QuotedString,   // 单引号字符串，text 不含引号
    SignedNumber,   // 有符号数字
    End             // 输入结束
};

struct Token {
    TokenType type;
    std::string text;
    size_t offset;  // 在预处理后字符串中的位置
};

/**
 * @brief 产生式
 */
struct GrammarRule {
    std::string name;
    std::string definition;
};

/**
 * @brief 分支逻辑文法
 *
 * 保存产生式与终结符表，LogicLexer 与 LogicParser 都以它为准。
 * AND 的优先级高于 OR，括号可以覆盖优先级，!(...) 对括号内表达式取反。
 */
class LogicGrammar {
public:
    static const LogicGrammar& instance();

    const std::vector<GrammarRule>& rules() const noexcept { return rules_; }

    /**
     * @brief 以 EBNF 文本形式输出全部产生式
     */
    std::string toEbnf() const;

    /**
     * @brief 比较运算符表，按长度降序排列以便最长匹配
     */
    const std::vector<std::pair<std::string, core::CompareOp>>& comparisonOperators() const noexcept {
        return comparison_operators_;
    }

    /**
     * @brief 关键字（大小写不敏感），不是关键字时返回空
     */
    std::optional<TokenType> keyword(std::string_view word) const;

    std::optional<core::CompareOp> compareOp(std::string_view text) const;

    static const char* tokenName(TokenType type) noexcept;

    /**
     * @brief 预处理
     *
     * - 双引号与弯引号统一为单引号
     * - "!=" 规范化为 "<>"
     * 引号内的内容保持原样。
     */
    static std::string preprocess(std::string_view logic);

private:
    LogicGrammar();

    std::vector<GrammarRule> rules_;
    std::vector<std::pair<std::string, core::CompareOp>> comparison_operators_;
};

/**
 * @brief 词法分析器，输入为预处理后的字符串
 */
class LogicLexer {
public:
    explicit LogicLexer(std::string_view input,
                        const LogicGrammar& grammar = LogicGrammar::instance());

    /**
     * @brief 切分全部词法单元，末尾附加 End
     * @throws ParseException 非法字符或未闭合的引号
     */
    std::vector<Token> tokenize() const;

private:
    std::string_view input_;
    const LogicGrammar& grammar_;
};

}} // namespace rclogic::logic
