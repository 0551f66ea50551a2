#include "rclogic/logic/LogicGrammar.hpp"
#include "rclogic/core/Exception.hpp"
#include "rclogic/utils/ModuleLoggers.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace rclogic {
namespace logic {

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isWordStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(lhs[i])) !=
            std::toupper(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

enum class QuoteFamily : uint8_t {
    None,
    AsciiSingle,
    AsciiDouble,
    CurlySingle,  // ‘ ’
    CurlyDouble   // “ ”
};

// 识别 pos 处的引号字符，length 写入其字节数（UTF-8 弯引号为3字节）
QuoteFamily quoteAt(std::string_view text, size_t pos, size_t& length) {
    length = 1;
    const char c = text[pos];
    if (c == '\'') {
        return QuoteFamily::AsciiSingle;
    }
    if (c == '"') {
        return QuoteFamily::AsciiDouble;
    }
    if (static_cast<unsigned char>(c) == 0xE2 && pos + 2 < text.size() &&
        static_cast<unsigned char>(text[pos + 1]) == 0x80) {
        const auto third = static_cast<unsigned char>(text[pos + 2]);
        if (third == 0x98 || third == 0x99) {
            length = 3;
            return QuoteFamily::CurlySingle;
        }
        if (third == 0x9C || third == 0x9D) {
            length = 3;
            return QuoteFamily::CurlyDouble;
        }
    }
    return QuoteFamily::None;
}

// 从 pos 开始是否是数字的起始（可带一个符号）
bool numberStartsAt(std::string_view text, size_t pos) {
    size_t i = pos;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        ++i;
    }
    if (i >= text.size()) {
        return false;
    }
    if (isDigit(text[i])) {
        return true;
    }
    return text[i] == '.' && i + 1 < text.size() && isDigit(text[i + 1]);
}

size_t scanNumber(std::string_view text, size_t pos) {
    size_t i = pos;
    if (text[i] == '-' || text[i] == '+') {
        ++i;
    }
    while (i < text.size() && isDigit(text[i])) {
        ++i;
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && isDigit(text[i])) {
            ++i;
        }
    }
    // 指数部分只有在后面确实跟着数字时才吞掉
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        size_t j = i + 1;
        if (j < text.size() && (text[j] == '+' || text[j] == '-')) {
            ++j;
        }
        if (j < text.size() && isDigit(text[j])) {
            while (j < text.size() && isDigit(text[j])) {
                ++j;
            }
            i = j;
        }
    }
    return i;
}

} // namespace

// ========== LogicGrammar ==========

LogicGrammar::LogicGrammar() {
    rules_ = {
        {"start",             "logic_str"},
        {"logic_str",         "and_term (OR and_term)*"},
        {"and_term",          "term (AND term)*"},
        {"term",              "comparison | \"(\" logic_str \")\" | \"!\" \"(\" logic_str \")\""},
        {"comparison",        "field_name COMP_OP (field_name | categorical_value | numeric_value)"},
        {"field_name",        "\"[\" IDENTIFIER ( \"(\" CHOICE_CODE \")\" )? \"]\""},
        {"categorical_value", "QUOTED_STRING"},
        {"numeric_value",     "SIGNED_NUMBER"},
        {"COMP_OP",           "\"=\" | \"<>\" | \"<\" | \"<=\" | \">\" | \">=\""},
        {"AND",               "\"AND\"i"},
        {"OR",                "\"OR\"i"},
        {"IDENTIFIER",        "/[A-Za-z_][A-Za-z0-9_]*/"},
        {"CHOICE_CODE",       "IDENTIFIER | SIGNED_NUMBER"},
        {"QUOTED_STRING",     "\"'\" /[^']*/ \"'\""},
        {"SIGNED_NUMBER",     "/[+-]?(\\d+(\\.\\d*)?|\\.\\d+)([eE][+-]?\\d+)?/"}
    };

    comparison_operators_ = {
        {"<=", core::CompareOp::LessEqual},
        {">=", core::CompareOp::GreaterEqual},
        {"<>", core::CompareOp::NotEqual},
        {"<",  core::CompareOp::Less},
        {">",  core::CompareOp::Greater},
        {"=",  core::CompareOp::Equal}
    };
}

const LogicGrammar& LogicGrammar::instance() {
    static const LogicGrammar grammar;
    return grammar;
}

std::string LogicGrammar::toEbnf() const {
    size_t width = 0;
    for (const auto& rule : rules_) {
        width = std::max(width, rule.name.size());
    }

    std::string ebnf;
    for (const auto& rule : rules_) {
        ebnf += fmt::format("{:<{}} : {}\n", rule.name, width, rule.definition);
    }
    return ebnf;
}

std::optional<TokenType> LogicGrammar::keyword(std::string_view word) const {
    if (equalsIgnoreCase(word, "and")) {
        return TokenType::And;
    }
    if (equalsIgnoreCase(word, "or")) {
        return TokenType::Or;
    }
    return std::nullopt;
}

std::optional<core::CompareOp> LogicGrammar::compareOp(std::string_view text) const {
    for (const auto& [symbol, op] : comparison_operators_) {
        if (symbol == text) {
            return op;
        }
    }
    return std::nullopt;
}

const char* LogicGrammar::tokenName(TokenType type) noexcept {
    switch (type) {
        case TokenType::LBracket:     return "'['";
        case TokenType::RBracket:     return "']'";
        case TokenType::LParen:       return "'('";
        case TokenType::RParen:       return "')'";
        case TokenType::Bang:         return "'!'";
        case TokenType::CompOp:       return "COMP_OP";
        case TokenType::And:          return "AND";
        case TokenType::Or:           return "OR";
        case TokenType::Identifier:   return "IDENTIFIER";
        case TokenType::QuotedString: return "QUOTED_STRING";
        case TokenType::SignedNumber: return "SIGNED_NUMBER";
        case TokenType::End:          return "end of input";
        default:                      return "unknown";
    }
}

std::string LogicGrammar::preprocess(std::string_view logic) {
    std::string result;
    result.reserve(logic.size());

    QuoteFamily open = QuoteFamily::None;
    size_t i = 0;
    while (i < logic.size()) {
        size_t length = 1;
        const QuoteFamily family = quoteAt(logic, i, length);

        if (open == QuoteFamily::None) {
            if (family != QuoteFamily::None) {
                result += '\'';
                open = family;
                i += length;
                continue;
            }
            if (logic[i] == '!' && i + 1 < logic.size() && logic[i + 1] == '=') {
                result += "<>";
                i += 2;
                continue;
            }
            result += logic[i];
            ++i;
            continue;
        }

        // 引号内：只有同一类引号才闭合，其余字符原样保留
        if (family == open) {
            result += '\'';
            open = QuoteFamily::None;
        } else {
            result.append(logic.substr(i, length));
        }
        i += length;
    }

    return result;
}

// ========== LogicLexer ==========

LogicLexer::LogicLexer(std::string_view input, const LogicGrammar& grammar)
    : input_(input)
    , grammar_(grammar) {
}

std::vector<Token> LogicLexer::tokenize() const {
    std::vector<Token> tokens;
    const std::string source(input_);
    size_t bracket_depth = 0;
    size_t pos = 0;

    while (pos < input_.size()) {
        const char c = input_[pos];

        if (isSpace(c)) {
            ++pos;
            continue;
        }

        switch (c) {
            case '[':
                tokens.push_back({TokenType::LBracket, "[", pos});
                ++bracket_depth;
                ++pos;
                continue;
            case ']':
                tokens.push_back({TokenType::RBracket, "]", pos});
                if (bracket_depth > 0) {
                    --bracket_depth;
                }
                ++pos;
                continue;
            case '(':
                tokens.push_back({TokenType::LParen, "(", pos});
                ++pos;
                continue;
            case ')':
                tokens.push_back({TokenType::RParen, ")", pos});
                ++pos;
                continue;
            case '\'': {
                const size_t close = input_.find('\'', pos + 1);
                if (close == std::string_view::npos) {
                    RCLOGIC_THROW_ARGS(core::ParseException, "Unterminated quoted literal", pos, source);
                }
                tokens.push_back({TokenType::QuotedString,
                                  std::string(input_.substr(pos + 1, close - pos - 1)), pos});
                pos = close + 1;
                continue;
            }
            default:
                break;
        }

        bool matched_operator = false;
        for (const auto& entry : grammar_.comparisonOperators()) {
            const std::string& symbol = entry.first;
            if (input_.compare(pos, symbol.size(), symbol) == 0) {
                tokens.push_back({TokenType::CompOp, symbol, pos});
                pos += symbol.size();
                matched_operator = true;
                break;
            }
        }
        if (matched_operator) {
            continue;
        }

        if (c == '!') {
            tokens.push_back({TokenType::Bang, "!", pos});
            ++pos;
            continue;
        }

        if (numberStartsAt(input_, pos)) {
            const size_t end = scanNumber(input_, pos);
            tokens.push_back({TokenType::SignedNumber, std::string(input_.substr(pos, end - pos)), pos});
            pos = end;
            continue;
        }

        if (isWordStart(c)) {
            size_t end = pos + 1;
            while (end < input_.size() && isWordChar(input_[end])) {
                ++end;
            }
            const std::string_view word = input_.substr(pos, end - pos);

            // 方括号内的单词总是字段名，即使拼写为 and/or
            std::optional<TokenType> keyword;
            if (bracket_depth == 0) {
                keyword = grammar_.keyword(word);
            }
            tokens.push_back({keyword ? *keyword : TokenType::Identifier, std::string(word), pos});
            pos = end;
            continue;
        }

        RCLOGIC_THROW_ARGS(core::ParseException,
                           fmt::format("Unexpected character '{}'", c), pos, source);
    }

    tokens.push_back({TokenType::End, "", input_.size()});
    RCLOGIC_LOG_PARSER_DEBUG("Tokenized '{}' into {} token(s)", source, tokens.size());
    return tokens;
}

}} // namespace rclogic::logic
