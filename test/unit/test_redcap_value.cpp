#include <gtest/gtest.h>
#include "rclogic/core/Exception.hpp"
#include "rclogic/core/RedcapValue.hpp"
#include "rclogic/core/ValueFactory.hpp"
#include <cmath>
#include <unordered_set>

using namespace rclogic::core;

class RedcapValueTest : public ::testing::Test {
protected:
    void SetUp() override {
        ClassifierConfig config = ClassifierConfig::standard();
        config.withMissingCodes({"NA"});
        factory_ = std::make_unique<ValueFactory>(config);
    }

    void TearDown() override {
        factory_.reset();
    }

    RedcapValue value(const std::string& raw) const {
        return factory_->makeValue(raw);
    }

    std::unique_ptr<ValueFactory> factory_;
};

// 默认构造为 Missing
TEST_F(RedcapValueTest, DefaultIsMissing) {
    RedcapValue missing;
    EXPECT_TRUE(missing.isMissing());
    EXPECT_EQ(missing.rawString(), "");
    EXPECT_DOUBLE_EQ(missing.numericValue(), 0.0);
    EXPECT_FALSE(missing.isNa());
    EXPECT_TRUE(RedcapValue::missing().equals(missing));
}

TEST_F(RedcapValueTest, AccessorsKeepRawString) {
    auto number = value("13.0");
    EXPECT_EQ(number.rawString(), "13.0");
    EXPECT_DOUBLE_EQ(number.numericValue(), 13.0);
    EXPECT_EQ(number.category(), ValueCategory::Number);
    EXPECT_TRUE(number.isNumber());
    EXPECT_FALSE(number.isTextLike());

    auto code = value("NA");
    EXPECT_EQ(code.category(), ValueCategory::Code);
    EXPECT_TRUE(code.isTextLike());
    EXPECT_TRUE(code.isNa());
}

// 与字符串比较只看原始串
TEST_F(RedcapValueTest, StringEqualityIsExact) {
    EXPECT_TRUE(value("25") == "25");
    EXPECT_FALSE(value("25") == "25.0");
    EXPECT_FALSE(value("1.0") == "1");
    EXPECT_TRUE(value("1.0") != "1");
    EXPECT_TRUE(value("yes") == "yes");
}

// 与数字比较用数值
TEST_F(RedcapValueTest, NumericEquality) {
    EXPECT_TRUE(value("25") == 25);
    EXPECT_TRUE(value("25.0") == 25.0);
    EXPECT_TRUE(value("1e1") == 10);
    EXPECT_FALSE(value("25") == 26);
    EXPECT_TRUE(value("25") != 26);
}

// Missing 等于 ""、0 和 0.0，但不等于 "0"
TEST_F(RedcapValueTest, MissingEqualitySemantics) {
    auto missing = value("");
    EXPECT_TRUE(missing == "");
    EXPECT_TRUE(missing == 0);
    EXPECT_TRUE(missing == 0.0);
    EXPECT_FALSE(missing == "0");
    EXPECT_TRUE(missing != "0");
}

// Missing 与值比较：对方为 Missing 或数值为 0 即相等，字符串仍按原样比较
TEST_F(RedcapValueTest, MissingEqualsZeroValue) {
    auto missing = value("");
    EXPECT_TRUE(missing == value("0"));
    EXPECT_TRUE(missing == value("0.0"));
    EXPECT_TRUE(missing == RedcapValue());
    EXPECT_FALSE(missing == value("1"));
    EXPECT_FALSE(missing == value("NA"));
    EXPECT_FALSE(missing == value("abc"));
    EXPECT_FALSE(missing == "0");

    // 非 Missing 一侧仍按原始串比较
    EXPECT_FALSE(value("0") == missing);
}

TEST_F(RedcapValueTest, ValueToValueUsesRawStrings) {
    EXPECT_TRUE(value("1") == value("1"));
    EXPECT_FALSE(value("1") == value("1.0"));
    EXPECT_TRUE(value("1") != value("1.0"));
    EXPECT_TRUE(value("") == RedcapValue());
}

// 字符串顺序按字节的字典序
TEST_F(RedcapValueTest, LexicographicOrdering) {
    EXPECT_TRUE(value("13") < "13.0");
    EXPECT_TRUE(value("100") < "9");
    EXPECT_TRUE(value("abc") < "abd");
    EXPECT_TRUE(value("b") > "a");
    EXPECT_TRUE(value("b") >= "b");
    EXPECT_TRUE(value("a") <= "a");
    EXPECT_TRUE(value("2023-01-15") < value("2023-02-01"));
    EXPECT_TRUE(value("") < "a");
}

TEST_F(RedcapValueTest, NumericOrdering) {
    EXPECT_TRUE(value("9") < 100);
    EXPECT_TRUE(value("100") > 9);
    EXPECT_TRUE(value("90") >= 90);
    EXPECT_TRUE(value("-1.5") <= -1.5);
    EXPECT_TRUE(value("") < 1);
}

// 文本族与数字比较恒为 false（不等于除外）
TEST_F(RedcapValueTest, TextFamilyNeverComparesNumerically) {
    for (const char* raw : {"abc", "2023-01-15", "NA"}) {
        auto v = value(raw);
        EXPECT_FALSE(v == 5) << raw;
        EXPECT_TRUE(v != 5) << raw;
        EXPECT_FALSE(v < 5) << raw;
        EXPECT_FALSE(v <= 5) << raw;
        EXPECT_FALSE(v > 5) << raw;
        EXPECT_FALSE(v >= 5) << raw;
    }
}

TEST_F(RedcapValueTest, CompareMatchesNamedMethods) {
    auto v = value("42");
    EXPECT_EQ(v.compare(CompareOp::Less, Operand(50)), v.lessThan(50));
    EXPECT_EQ(v.compare(CompareOp::GreaterEqual, Operand(42)), v.greaterEqual(42));
    EXPECT_EQ(v.compare(CompareOp::NotEqual, Operand("42")), !v.equals("42"));
}

TEST_F(RedcapValueTest, Arithmetic) {
    EXPECT_DOUBLE_EQ(value("10").add(5), 15.0);
    EXPECT_DOUBLE_EQ(value("10").sub(2.5), 7.5);
    EXPECT_DOUBLE_EQ(value("10").mul(value("3")), 30.0);
    EXPECT_DOUBLE_EQ(value("10").div(4), 2.5);
    EXPECT_DOUBLE_EQ(value("10") + 1, 11.0);
    EXPECT_DOUBLE_EQ(value("10") - "4", 6.0);
}

// 除零与不可解析的操作数得到 NaN，不抛异常
TEST_F(RedcapValueTest, ArithmeticDegradesToNaN) {
    EXPECT_TRUE(std::isnan(value("10").div(0)));
    EXPECT_TRUE(std::isnan(value("10").div(value(""))));
    EXPECT_TRUE(std::isnan(value("abc").add(1)));
    EXPECT_TRUE(std::isnan(value("NA").mul(2)));
    EXPECT_TRUE(std::isnan(value("10").add("x")));
    EXPECT_TRUE(std::isnan(value("10").add(value("abc"))));
}

TEST_F(RedcapValueTest, MissingActsAsZeroInArithmetic) {
    EXPECT_DOUBLE_EQ(value("").add(5), 5.0);
    EXPECT_DOUBLE_EQ(value("5").sub(value("")), 5.0);
}

TEST_F(RedcapValueTest, NoneOperandIsRejected) {
    auto v = value("1");
    EXPECT_THROW(v.equals(Operand::none()), InputTypeException);
    EXPECT_THROW(v.compare(CompareOp::Less, Operand::none()), InputTypeException);
    EXPECT_THROW(v.add(Operand::none()), InputTypeException);
}

// 相等性与驻留无关
TEST_F(RedcapValueTest, InterningDoesNotAffectEquality) {
    auto a = value("42");
    auto b = value("42");
    EXPECT_TRUE(a.sharesStorageWith(b));
    EXPECT_TRUE(a == b);

    ClassifierConfig config = ClassifierConfig::standard();
    config.enable_interning = false;
    ValueFactory plain(config);
    EXPECT_EQ(plain.internPool(), nullptr);

    auto c = plain.makeValue("42");
    auto d = plain.makeValue("42");
    EXPECT_FALSE(c.sharesStorageWith(d));
    EXPECT_TRUE(c == d);
    EXPECT_TRUE(a == c);
}

TEST_F(RedcapValueTest, HashFollowsRawString) {
    std::unordered_set<RedcapValue> values;
    values.insert(value("1"));
    values.insert(value("1"));
    values.insert(value("1.0"));
    EXPECT_EQ(values.size(), 2u);

    values.insert(value(""));
    values.insert(value("0"));
    EXPECT_EQ(values.size(), 4u);
    EXPECT_EQ(values.count(value("0")), 1u);
}

TEST_F(RedcapValueTest, DefaultFactoryFreeFunction) {
    auto v = makeValue("7");
    EXPECT_EQ(v.category(), ValueCategory::Number);
    EXPECT_TRUE(makeValue("").isMissing());
}

TEST_F(RedcapValueTest, DebugString) {
    EXPECT_EQ(value("abc").toDebugString().find("RedcapValue(raw='abc'"), 0u);
    EXPECT_NE(value("abc").toDebugString().find("TEXT"), std::string::npos);
}
