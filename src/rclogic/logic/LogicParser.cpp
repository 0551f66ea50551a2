#include "rclogic/logic/LogicParser.hpp"
#include "rclogic/core/Exception.hpp"
#include "rclogic/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace rclogic {
namespace logic {

const char* toString(SyntaxKind kind) noexcept {
    switch (kind) {
        case SyntaxKind::Start:            return "start";
        case SyntaxKind::LogicStr:         return "logic_str";
        case SyntaxKind::AndTerm:          return "and_term";
        case SyntaxKind::Term:             return "term";
        case SyntaxKind::Comparison:       return "comparison";
        case SyntaxKind::FieldName:        return "field_name";
        case SyntaxKind::CategoricalValue: return "categorical_value";
        case SyntaxKind::NumericValue:     return "numeric_value";
        case SyntaxKind::Token:            return "token";
        default:                           return "unknown";
    }
}

std::string SyntaxNode::dump() const {
    if (kind_ == SyntaxKind::Token) {
        return fmt::format("{}:'{}'", LogicGrammar::tokenName(token_.type), token_.text);
    }
    std::string out = fmt::format("({}", toString(kind_));
    for (const auto& child : children_) {
        out += ' ';
        out += child->dump();
    }
    out += ')';
    return out;
}

namespace {

/**
 * @brief 单次解析的状态：词法单元序列 + 当前位置
 */
class RecursiveDescent {
public:
    RecursiveDescent(const std::string& source, std::vector<Token> tokens)
        : source_(source), tokens_(std::move(tokens)) {}

    std::unique_ptr<SyntaxNode> parseStart() {
        auto start = std::make_unique<SyntaxNode>(SyntaxKind::Start, 0);
        start->addChild(parseLogicStr());
        if (peek().type != TokenType::End) {
            fail(fmt::format("Unexpected {} after complete expression", describe(peek())));
        }
        return start;
    }

private:
    const std::string& source_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    const Token& peek() const {
        return tokens_[pos_];
    }

    Token advance() {
        Token token = tokens_[pos_];
        if (token.type != TokenType::End) {
            ++pos_;
        }
        return token;
    }

    static std::string describe(const Token& token) {
        if (token.type == TokenType::End) {
            return "end of input";
        }
        return fmt::format("{} '{}'", LogicGrammar::tokenName(token.type), token.text);
    }

    [[noreturn]] void fail(const std::string& message) const {
        RCLOGIC_THROW_ARGS(core::ParseException, message, peek().offset, source_);
    }

    std::unique_ptr<SyntaxNode> expect(TokenType type) {
        if (peek().type != type) {
            fail(fmt::format("Expected {} but found {}", LogicGrammar::tokenName(type), describe(peek())));
        }
        return std::make_unique<SyntaxNode>(advance());
    }

    // logic_str : and_term (OR and_term)*
    std::unique_ptr<SyntaxNode> parseLogicStr() {
        auto node = std::make_unique<SyntaxNode>(SyntaxKind::LogicStr, peek().offset);
        node->addChild(parseAndTerm());
        while (peek().type == TokenType::Or) {
            node->addChild(std::make_unique<SyntaxNode>(advance()));
            node->addChild(parseAndTerm());
        }
        return node;
    }

    // and_term : term (AND term)*
    std::unique_ptr<SyntaxNode> parseAndTerm() {
        auto node = std::make_unique<SyntaxNode>(SyntaxKind::AndTerm, peek().offset);
        node->addChild(parseTerm());
        while (peek().type == TokenType::And) {
            node->addChild(std::make_unique<SyntaxNode>(advance()));
            node->addChild(parseTerm());
        }
        return node;
    }

    // term : comparison | "(" logic_str ")" | "!" "(" logic_str ")"
    std::unique_ptr<SyntaxNode> parseTerm() {
        auto node = std::make_unique<SyntaxNode>(SyntaxKind::Term, peek().offset);
        switch (peek().type) {
            case TokenType::LParen:
                node->addChild(expect(TokenType::LParen));
                node->addChild(parseLogicStr());
                node->addChild(expect(TokenType::RParen));
                break;
            case TokenType::Bang:
                node->addChild(expect(TokenType::Bang));
                node->addChild(expect(TokenType::LParen));
                node->addChild(parseLogicStr());
                node->addChild(expect(TokenType::RParen));
                break;
            case TokenType::LBracket:
                node->addChild(parseComparison());
                break;
            default:
                fail(fmt::format("Expected a comparison, '(' or '!' but found {}", describe(peek())));
        }
        return node;
    }

    // comparison : field_name COMP_OP (field_name | categorical_value | numeric_value)
    std::unique_ptr<SyntaxNode> parseComparison() {
        auto node = std::make_unique<SyntaxNode>(SyntaxKind::Comparison, peek().offset);
        node->addChild(parseFieldName());
        node->addChild(expect(TokenType::CompOp));

        switch (peek().type) {
            case TokenType::LBracket:
                node->addChild(parseFieldName());
                break;
            case TokenType::QuotedString: {
                auto value = std::make_unique<SyntaxNode>(SyntaxKind::CategoricalValue, peek().offset);
                value->addChild(std::make_unique<SyntaxNode>(advance()));
                node->addChild(std::move(value));
                break;
            }
            case TokenType::SignedNumber: {
                auto value = std::make_unique<SyntaxNode>(SyntaxKind::NumericValue, peek().offset);
                value->addChild(std::make_unique<SyntaxNode>(advance()));
                node->addChild(std::move(value));
                break;
            }
            default:
                fail(fmt::format("Expected a field, quoted value or number but found {}", describe(peek())));
        }
        return node;
    }

    // field_name : "[" IDENTIFIER ( "(" CHOICE_CODE ")" )? "]"
    std::unique_ptr<SyntaxNode> parseFieldName() {
        auto node = std::make_unique<SyntaxNode>(SyntaxKind::FieldName, peek().offset);
        node->addChild(expect(TokenType::LBracket));
        node->addChild(expect(TokenType::Identifier));

        if (peek().type == TokenType::LParen) {
            node->addChild(expect(TokenType::LParen));
            if (peek().type != TokenType::Identifier && peek().type != TokenType::SignedNumber) {
                fail(fmt::format("Expected a checkbox choice code but found {}", describe(peek())));
            }
            node->addChild(std::make_unique<SyntaxNode>(advance()));
            node->addChild(expect(TokenType::RParen));
        }

        node->addChild(expect(TokenType::RBracket));
        return node;
    }
};

bool isBlank(std::string_view text) {
    for (char c : text) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return false;
        }
    }
    return true;
}

} // namespace

LogicParser::LogicParser(const LogicGrammar& grammar)
    : grammar_(grammar) {
}

ParseTree LogicParser::parse(std::string_view logic) const {
    ParseTree tree;
    tree.source = LogicGrammar::preprocess(logic);

    if (isBlank(tree.source)) {
        RCLOGIC_THROW_ARGS(core::ParseException, "Branching logic is empty", 0, tree.source);
    }

    LogicLexer lexer(tree.source, grammar_);
    RecursiveDescent descent(tree.source, lexer.tokenize());
    tree.root = descent.parseStart();

    RCLOGIC_LOG_PARSER_DEBUG("Parsed '{}': {}", tree.source, tree.root->dump());
    return tree;
}

}} // namespace rclogic::logic
