#include <gtest/gtest.h>
#include "rclogic/columnar/RedcapValueArray.hpp"
#include "rclogic/core/Exception.hpp"
#include "rclogic/core/ValueFactory.hpp"
#include <cmath>

using namespace rclogic::core;
using namespace rclogic::columnar;

class RedcapValueArrayTest : public ::testing::Test {
protected:
    void SetUp() override {
        scores_ = makeArray({"25", "90", "", "abc", "13.0"});
    }

    void TearDown() override {}

    RedcapValueArray scores_;
};

TEST_F(RedcapValueArrayTest, BuildsParallelArrays) {
    ASSERT_EQ(scores_.size(), 5u);
    EXPECT_FALSE(scores_.empty());
    EXPECT_EQ(scores_.rawStrings()[3], "abc");
    EXPECT_DOUBLE_EQ(scores_.numericValues()[1], 90.0);
    EXPECT_EQ(scores_.categories()[2], ValueCategory::Missing);
    EXPECT_EQ(scores_.categories()[3], ValueCategory::Text);
    EXPECT_TRUE(std::isnan(scores_.numericValues()[3]));
}

TEST_F(RedcapValueArrayTest, ConstructorChecksLengths) {
    EXPECT_THROW(RedcapValueArray({1.0, 2.0}, {"1"}, {ValueCategory::Number}), ValueMismatchException);
    EXPECT_NO_THROW(RedcapValueArray({1.0}, {"1"}, {ValueCategory::Number}));
}

// 元素与标量版本语义一致
TEST_F(RedcapValueArrayTest, ElementsMatchScalars) {
    for (long long i = 0; i < static_cast<long long>(scores_.size()); ++i) {
        auto element = scores_.at(i);
        auto scalar = makeValue(scores_.rawStrings()[static_cast<size_t>(i)]);
        EXPECT_TRUE(element == scalar);
        EXPECT_EQ(element.category(), scalar.category());
    }
}

TEST_F(RedcapValueArrayTest, PositionalAccess) {
    EXPECT_EQ(scores_.at(0).rawString(), "25");
    EXPECT_EQ(scores_.at(-1).rawString(), "13.0");
    EXPECT_THROW(scores_.at(5), IndexException);
    EXPECT_THROW(scores_.at(-6), IndexException);
}

TEST_F(RedcapValueArrayTest, SliceClampsBounds) {
    auto middle = scores_.slice(1, 3);
    ASSERT_EQ(middle.size(), 2u);
    EXPECT_EQ(middle.rawStrings()[0], "90");
    EXPECT_EQ(middle.rawStrings()[1], "");

    EXPECT_EQ(scores_.slice(-2, 100).size(), 2u);
    EXPECT_EQ(scores_.slice(4, 1).size(), 0u);
}

TEST_F(RedcapValueArrayTest, TakeWithAndWithoutFill) {
    auto taken = scores_.take({4, 0, -1});
    ASSERT_EQ(taken.size(), 3u);
    EXPECT_EQ(taken.rawStrings()[0], "13.0");
    EXPECT_EQ(taken.rawStrings()[2], "13.0");

    auto filled = scores_.take({0, -1}, true);
    ASSERT_EQ(filled.size(), 2u);
    EXPECT_EQ(filled.categories()[1], ValueCategory::Missing);

    EXPECT_THROW(scores_.take({-2}, true), IndexException);
    EXPECT_THROW(scores_.take({10}), IndexException);
}

TEST_F(RedcapValueArrayTest, ConcatAndCopy) {
    auto joined = RedcapValueArray::concat({scores_, makeArray({"x"})});
    ASSERT_EQ(joined.size(), 6u);
    EXPECT_EQ(joined.rawStrings()[5], "x");

    auto copied = scores_.copy();
    EXPECT_EQ(copied.rawStrings(), scores_.rawStrings());
    EXPECT_GT(scores_.getMemoryUsage(), 0u);
}

TEST_F(RedcapValueArrayTest, FromValues) {
    auto array = RedcapValueArray::fromValues({makeValue("1"), makeValue(""), makeValue("z")});
    ASSERT_EQ(array.size(), 3u);
    EXPECT_EQ(array.categories()[0], ValueCategory::Number);
    EXPECT_EQ(array.categories()[1], ValueCategory::Missing);
    EXPECT_EQ(array.categories()[2], ValueCategory::Text);
}

// 标量操作数广播到每个元素
TEST_F(RedcapValueArrayTest, CompareWithScalar) {
    EXPECT_EQ(scores_.equals(Operand("25")), (BooleanMask{true, false, false, false, false}));
    EXPECT_EQ(scores_.equals(Operand(13)), (BooleanMask{false, false, false, false, true}));
    EXPECT_EQ(scores_.compare(CompareOp::GreaterEqual, Operand(25)),
              (BooleanMask{true, true, false, false, false}));
    EXPECT_EQ(scores_.compare(CompareOp::NotEqual, Operand(13)),
              (BooleanMask{true, true, true, true, false}));
    // Missing 的数值为 0
    EXPECT_EQ(scores_.equals(Operand(0)), (BooleanMask{false, false, true, false, false}));
}

TEST_F(RedcapValueArrayTest, CompareWithArrayAndOperandList) {
    auto other = makeArray({"25", "9", "", "abd", "13"});
    EXPECT_EQ(scores_.equals(other), (BooleanMask{true, false, true, false, false}));
    // 值对值的大小比较按原始串
    EXPECT_EQ(scores_.compare(CompareOp::Less, other), (BooleanMask{false, false, false, true, false}));

    std::vector<Operand> operands{Operand(25), Operand("90"), Operand(""), Operand(1), Operand(13)};
    EXPECT_EQ(scores_.equals(operands), (BooleanMask{true, true, true, false, true}));
}

TEST_F(RedcapValueArrayTest, MissingEqualsZeroElementwise) {
    auto missing = makeArray({"", "", "", "", "0"});
    auto other = makeArray({"0", "0.0", "", "abc", ""});
    EXPECT_EQ(missing.equals(other), (BooleanMask{true, true, true, false, false}));
    EXPECT_EQ(missing.compare(CompareOp::NotEqual, other), (BooleanMask{false, false, false, true, true}));
    EXPECT_EQ(missing.equals(Operand(makeValue("0"))), (BooleanMask{true, true, true, true, true}));
}

TEST_F(RedcapValueArrayTest, LengthMismatchThrows) {
    auto shorter = makeArray({"1", "2"});
    EXPECT_THROW(scores_.equals(shorter), ValueMismatchException);
    EXPECT_THROW(scores_.add(shorter), ValueMismatchException);
    EXPECT_THROW(scores_.compare(CompareOp::Less, std::vector<Operand>{Operand(1)}), ValueMismatchException);
}

TEST_F(RedcapValueArrayTest, NoneOperandThrows) {
    EXPECT_THROW(scores_.equals(Operand::none()), InputTypeException);
    EXPECT_THROW(scores_.add(Operand::none()), InputTypeException);
}

// NaN 结果记为 $$CALC_ERR 文本
TEST_F(RedcapValueArrayTest, ArithmeticWithScalar) {
    auto sum = scores_.add(Operand(5));
    ASSERT_EQ(sum.size(), 5u);
    EXPECT_DOUBLE_EQ(sum.numericValues()[0], 30.0);
    EXPECT_EQ(sum.categories()[0], ValueCategory::Number);
    EXPECT_DOUBLE_EQ(sum.numericValues()[2], 5.0);
    EXPECT_EQ(sum.categories()[2], ValueCategory::Number);
    EXPECT_EQ(sum.rawStrings()[3], RedcapValueArray::kCalcError);
    EXPECT_EQ(sum.categories()[3], ValueCategory::Text);
    EXPECT_TRUE(std::isnan(sum.numericValues()[3]));

    auto quotient = scores_.div(Operand(0));
    for (size_t i = 0; i < quotient.size(); ++i) {
        EXPECT_EQ(quotient.rawStrings()[i], RedcapValueArray::kCalcError);
    }
}

// 溢出结果与 NaN 一样记为 $$CALC_ERR
TEST_F(RedcapValueArrayTest, OverflowBecomesCalcError) {
    auto huge = makeArray({"1e308", "-1e308", "2"});
    auto product = huge.mul(Operand(10));

    EXPECT_EQ(product.rawStrings()[0], RedcapValueArray::kCalcError);
    EXPECT_EQ(product.categories()[0], ValueCategory::Text);
    EXPECT_TRUE(std::isnan(product.numericValues()[0]));
    EXPECT_EQ(product.rawStrings()[1], RedcapValueArray::kCalcError);
    EXPECT_EQ(product.categories()[2], ValueCategory::Number);

    // 三个数组与重新分类原始串的结果一致
    for (long long i = 0; i < static_cast<long long>(product.size()); ++i) {
        auto element = product.at(i);
        EXPECT_EQ(element.category(), makeValue(element.rawString()).category());
    }
}

TEST_F(RedcapValueArrayTest, MissingWithMissingStaysMissing) {
    auto left = makeArray({"", "", "4"});
    auto right = makeArray({"", "2", ""});

    auto sum = left.add(right);
    EXPECT_EQ(sum.categories()[0], ValueCategory::Missing);
    EXPECT_EQ(sum.rawStrings()[0], "");
    EXPECT_EQ(sum.categories()[1], ValueCategory::Number);
    EXPECT_DOUBLE_EQ(sum.numericValues()[1], 2.0);
    EXPECT_DOUBLE_EQ(sum.numericValues()[2], 4.0);

    auto with_scalar = left.mul(Operand(RedcapValue()));
    EXPECT_EQ(with_scalar.categories()[0], ValueCategory::Missing);
    EXPECT_EQ(with_scalar.categories()[2], ValueCategory::Number);
    EXPECT_DOUBLE_EQ(with_scalar.numericValues()[2], 0.0);
}

TEST_F(RedcapValueArrayTest, ArithmeticWithStringOperand) {
    auto product = makeArray({"2", "3"}).mul(Operand("4"));
    EXPECT_DOUBLE_EQ(product.numericValues()[0], 8.0);
    EXPECT_DOUBLE_EQ(product.numericValues()[1], 12.0);

    auto invalid = makeArray({"2"}).sub(Operand("four"));
    EXPECT_EQ(invalid.rawStrings()[0], RedcapValueArray::kCalcError);
}

TEST_F(RedcapValueArrayTest, NaAndMissingMasks) {
    EXPECT_EQ(scores_.isNa(), (BooleanMask{false, false, false, true, false}));
    EXPECT_EQ(scores_.isMissing(), (BooleanMask{false, false, true, false, false}));
}

class BooleanMaskTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(BooleanMaskTest, LogicalOperations) {
    BooleanMask a{true, true, false, false};
    BooleanMask b{true, false, true, false};

    EXPECT_EQ(maskAnd(a, b), (BooleanMask{true, false, false, false}));
    EXPECT_EQ(maskOr(a, b), (BooleanMask{true, true, true, false}));
    EXPECT_EQ(maskNot(a), (BooleanMask{false, false, true, true}));
    EXPECT_EQ(countTrue(a), 2u);
    EXPECT_EQ(maskToIndices(b), (std::vector<size_t>{0, 2}));
}

TEST_F(BooleanMaskTest, LengthMismatch) {
    EXPECT_THROW(maskAnd(BooleanMask{true}, BooleanMask{true, false}), ValueMismatchException);
    EXPECT_THROW(maskOr(BooleanMask{}, BooleanMask{false}), ValueMismatchException);
}
