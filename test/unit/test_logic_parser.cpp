#include <gtest/gtest.h>
#include "rclogic/core/Exception.hpp"
#include "rclogic/logic/LogicGrammar.hpp"
#include "rclogic/logic/LogicLowering.hpp"
#include "rclogic/logic/LogicParser.hpp"

using namespace rclogic::core;
using namespace rclogic::logic;

class LogicGrammarTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    std::vector<TokenType> types(const std::string& input) const {
        std::vector<TokenType> result;
        for (const auto& token : LogicLexer(input).tokenize()) {
            result.push_back(token.type);
        }
        return result;
    }
};

TEST_F(LogicGrammarTest, RulesAndEbnf) {
    const auto& grammar = LogicGrammar::instance();
    ASSERT_FALSE(grammar.rules().empty());
    EXPECT_EQ(grammar.rules().front().name, "start");

    const std::string ebnf = grammar.toEbnf();
    EXPECT_NE(ebnf.find("and_term (OR and_term)*"), std::string::npos);
    EXPECT_NE(ebnf.find("comparison"), std::string::npos);
}

TEST_F(LogicGrammarTest, KeywordsAreCaseInsensitive) {
    const auto& grammar = LogicGrammar::instance();
    EXPECT_EQ(grammar.keyword("AND"), TokenType::And);
    EXPECT_EQ(grammar.keyword("and"), TokenType::And);
    EXPECT_EQ(grammar.keyword("Or"), TokenType::Or);
    EXPECT_FALSE(grammar.keyword("android").has_value());
}

TEST_F(LogicGrammarTest, ComparisonOperators) {
    const auto& grammar = LogicGrammar::instance();
    EXPECT_EQ(grammar.compareOp("<="), CompareOp::LessEqual);
    EXPECT_EQ(grammar.compareOp("<>"), CompareOp::NotEqual);
    EXPECT_EQ(grammar.compareOp("="), CompareOp::Equal);
    EXPECT_FALSE(grammar.compareOp("!=").has_value());
    EXPECT_FALSE(grammar.compareOp("==").has_value());
}

// 双引号与弯引号统一为单引号，!= 规范化为 <>
TEST_F(LogicGrammarTest, Preprocess) {
    EXPECT_EQ(LogicGrammar::preprocess("[a] = \"x\""), "[a] = 'x'");
    EXPECT_EQ(LogicGrammar::preprocess("[a] != 1"), "[a] <> 1");
    EXPECT_EQ(LogicGrammar::preprocess("[a] = '!='"), "[a] = '!='");
    EXPECT_EQ(LogicGrammar::preprocess("[a] = \xE2\x80\x9C" "yes" "\xE2\x80\x9D"), "[a] = 'yes'");
    EXPECT_EQ(LogicGrammar::preprocess("[a] = \xE2\x80\x98" "no" "\xE2\x80\x99"), "[a] = 'no'");
    EXPECT_EQ(LogicGrammar::preprocess("[a] = \"it's\""), "[a] = 'it's'");
}

TEST_F(LogicGrammarTest, LexerTokens) {
    auto tokens = LogicLexer("[age] >= 18 and [sex] = '1'").tokenize();
    ASSERT_EQ(tokens.size(), 12u);
    EXPECT_EQ(tokens[0].type, TokenType::LBracket);
    EXPECT_EQ(tokens[1].type, TokenType::Identifier);
    EXPECT_EQ(tokens[1].text, "age");
    EXPECT_EQ(tokens[3].type, TokenType::CompOp);
    EXPECT_EQ(tokens[3].text, ">=");
    EXPECT_EQ(tokens[4].type, TokenType::SignedNumber);
    EXPECT_EQ(tokens[4].text, "18");
    EXPECT_EQ(tokens[5].type, TokenType::And);
    EXPECT_EQ(tokens[10].type, TokenType::QuotedString);
    EXPECT_EQ(tokens[10].text, "1");
    EXPECT_EQ(tokens[10].offset, 24u);
    EXPECT_EQ(tokens[11].type, TokenType::End);
}

// 方括号内的 and/or 是字段名
TEST_F(LogicGrammarTest, KeywordsInsideBracketsAreIdentifiers) {
    EXPECT_EQ(types("[and] = 1 OR [or] = 2"),
              (std::vector<TokenType>{TokenType::LBracket, TokenType::Identifier, TokenType::RBracket,
                                      TokenType::CompOp, TokenType::SignedNumber, TokenType::Or,
                                      TokenType::LBracket, TokenType::Identifier, TokenType::RBracket,
                                      TokenType::CompOp, TokenType::SignedNumber, TokenType::End}));
}

TEST_F(LogicGrammarTest, SignedNumbers) {
    auto tokens = LogicLexer("-1.5 +2 .5 1e3 7").tokenize();
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].text, "-1.5");
    EXPECT_EQ(tokens[1].text, "+2");
    EXPECT_EQ(tokens[2].text, ".5");
    EXPECT_EQ(tokens[3].text, "1e3");
    EXPECT_EQ(tokens[4].text, "7");
}

TEST_F(LogicGrammarTest, LexerErrors) {
    try {
        LogicLexer("[a] = 'open").tokenize();
        FAIL() << "Expected ParseException";
    } catch (const ParseException& e) {
        EXPECT_EQ(e.getOffset(), 6u);
    }

    try {
        LogicLexer("[a] # 1").tokenize();
        FAIL() << "Expected ParseException";
    } catch (const ParseException& e) {
        EXPECT_EQ(e.getOffset(), 4u);
        EXPECT_EQ(e.getErrorCode(), ErrorCode::ParseError);
    }
}

class LogicParserTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    size_t errorOffset(const std::string& logic) const {
        try {
            parser_.parse(logic);
        } catch (const ParseException& e) {
            return e.getOffset();
        }
        ADD_FAILURE() << "Expected ParseException for: " << logic;
        return static_cast<size_t>(-1);
    }

    LogicParser parser_;
};

TEST_F(LogicParserTest, ConcreteTreeShape) {
    auto tree = parser_.parse("[a] = 1 OR [b] = '2'");
    ASSERT_NE(tree.root, nullptr);
    EXPECT_EQ(tree.root->kind(), SyntaxKind::Start);

    const auto& logic_str = tree.root->child(0);
    EXPECT_EQ(logic_str.kind(), SyntaxKind::LogicStr);
    ASSERT_EQ(logic_str.childCount(), 3u);
    EXPECT_TRUE(logic_str.child(1).isToken(TokenType::Or));

    const auto& comparison = logic_str.child(2).child(0).child(0);
    EXPECT_EQ(comparison.kind(), SyntaxKind::Comparison);
    EXPECT_EQ(comparison.child(0).kind(), SyntaxKind::FieldName);
    EXPECT_EQ(comparison.child(2).kind(), SyntaxKind::CategoricalValue);

    EXPECT_EQ(tree.root->dump().rfind("(start (logic_str (and_term", 0), 0u);
}

TEST_F(LogicParserTest, ParsesNegationAndGroups) {
    EXPECT_NO_THROW(parser_.parse("!([a] > '2' AND [b] = '1')"));
    EXPECT_NO_THROW(parser_.parse("([a] = 1 OR [b] = 2) AND [c] <> 3"));
    EXPECT_NO_THROW(parser_.parse("[a] = [b]"));
    EXPECT_NO_THROW(parser_.parse("[symptoms(2)] = '1'"));
    EXPECT_NO_THROW(parser_.parse("[race(-99)] = '1'"));
}

TEST_F(LogicParserTest, SourceIsPreprocessed) {
    auto tree = parser_.parse("[a] != \"x\"");
    EXPECT_EQ(tree.source, "[a] <> 'x'");
}

// 错误位置是预处理后字符串中的偏移
TEST_F(LogicParserTest, ErrorOffsets) {
    EXPECT_EQ(errorOffset("[a] >="), 6u);
    EXPECT_EQ(errorOffset(""), 0u);
    EXPECT_EQ(errorOffset("   "), 0u);
    EXPECT_EQ(errorOffset("[a] = 1 [b]"), 8u);
    EXPECT_EQ(errorOffset("[a] = 1 AND"), 11u);
    EXPECT_EQ(errorOffset("!([a] = 1"), 9u);
    EXPECT_EQ(errorOffset("! [a] = 1"), 2u);
    EXPECT_EQ(errorOffset("[a = 1"), 3u);
    EXPECT_EQ(errorOffset("[a] 1"), 4u);
    EXPECT_EQ(errorOffset("[a] = 1 OR OR [b] = 1"), 11u);
}

TEST_F(LogicParserTest, ParseExceptionCarriesLogic) {
    try {
        parser_.parse("[a] >=");
        FAIL() << "Expected ParseException";
    } catch (const ParseException& e) {
        EXPECT_EQ(e.getLogic(), "[a] >=");
        EXPECT_NE(e.getDetailedMessage().find("logic: [a] >="), std::string::npos);
    }
}

class LogicLoweringTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.field_aliases["fever(1)"] = "fever_yes";
    }

    void TearDown() override {}

    LoweredLogic lower(const std::string& logic) const {
        LogicLowering lowering(options_);
        return lowering.lower(parser_.parse(logic));
    }

    TranslatorOptions options_;
    LogicParser parser_;
};

// AND 的优先级高于 OR
TEST_F(LogicLoweringTest, AndBindsTighterThanOr) {
    auto lowered = lower("[a] < 2 OR [a] >= 30 AND [b] = 1");
    EXPECT_EQ(lowered.root->toString(), "([a] < 2 OR ([a] >= 30 AND [b] = 1))");
    EXPECT_EQ(lowered.referenced_fields, (std::set<std::string>{"a", "b"}));
}

TEST_F(LogicLoweringTest, ChainsFoldLeft) {
    EXPECT_EQ(lower("[a] = 1 OR [b] = 2 OR [c] = 3").root->toString(),
              "(([a] = 1 OR [b] = 2) OR [c] = 3)");
    EXPECT_EQ(lower("[a] = 1 and [b] = 2 AND [c] = 3").root->toString(),
              "(([a] = 1 AND [b] = 2) AND [c] = 3)");
}

TEST_F(LogicLoweringTest, ParenthesesOverridePrecedence) {
    EXPECT_EQ(lower("([a] = 1 OR [b] = 2) AND [c] = 3").root->toString(),
              "(([a] = 1 OR [b] = 2) AND [c] = 3)");
}

TEST_F(LogicLoweringTest, Negation) {
    auto lowered = lower("!([a] > '2' AND [b] = '1')");
    ASSERT_EQ(lowered.root->kind(), ExpressionKind::Not);
    EXPECT_EQ(lowered.root->toString(), "!(([a] > '2' AND [b] = '1'))");
}

// 比较种类由右操作数的形态决定
TEST_F(LogicLoweringTest, ComparisonKinds) {
    auto numeric = lower("[a] = 25").root;
    EXPECT_EQ(numeric->comparisonKind(), ComparisonKind::Numeric);
    EXPECT_DOUBLE_EQ(numeric->right()->number(), 25.0);
    EXPECT_EQ(numeric->op(), CompareOp::Equal);

    auto categorical = lower("[a] = '25'").root;
    EXPECT_EQ(categorical->comparisonKind(), ComparisonKind::Categorical);
    EXPECT_EQ(categorical->right()->text(), "25");

    auto field = lower("[a] <= [b]").root;
    EXPECT_EQ(field->comparisonKind(), ComparisonKind::Field);
    EXPECT_EQ(field->op(), CompareOp::LessEqual);
    EXPECT_EQ(field->right()->text(), "b");
}

TEST_F(LogicLoweringTest, CheckboxReferences) {
    auto lowered = lower("[symptoms(2)] = '1' OR [fever(1)] = '1' OR [race(-99)] = '1'");
    EXPECT_EQ(lowered.referenced_fields,
              (std::set<std::string>{"symptoms___2", "fever_yes", "race____99"}));
}

TEST_F(LogicLoweringTest, ResolveFieldName) {
    LogicLowering lowering(options_);
    EXPECT_EQ(lowering.resolveFieldName("age", std::nullopt), "age");
    EXPECT_EQ(lowering.resolveFieldName("symptoms", std::string("3")), "symptoms___3");
    EXPECT_EQ(lowering.resolveFieldName("fever", std::string("1")), "fever_yes");

    options_.field_aliases["dob"] = "date_of_birth";
    EXPECT_EQ(lowering.resolveFieldName("dob", std::nullopt), "date_of_birth");
}
