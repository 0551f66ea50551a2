#include <gtest/gtest.h>
#include "rclogic/columnar/DataTable.hpp"
#include "rclogic/core/Exception.hpp"

using namespace rclogic::core;
using namespace rclogic::columnar;

class DataTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        rows_ = {
            {"record_id", "age", "sex"},
            {"1", "25", "1"},
            {"2", "",   "2"},
            {"3", "67", "1"}
        };
    }

    void TearDown() override {
        rows_.clear();
    }

    std::vector<std::vector<std::string>> rows_;
};

// 首行为表头
TEST_F(DataTableTest, FromRows) {
    auto table = DataTable::fromRows(rows_);
    EXPECT_EQ(table.columnCount(), 3u);
    EXPECT_EQ(table.rowCount(), 3u);
    EXPECT_EQ(table.columnNames(), (std::vector<std::string>{"record_id", "age", "sex"}));

    const auto& age = table.column("age");
    EXPECT_EQ(age.categories()[1], ValueCategory::Missing);
    EXPECT_DOUBLE_EQ(age.numericValues()[2], 67.0);
}

TEST_F(DataTableTest, FromRowsRejectsRaggedRows) {
    rows_.push_back({"4", "30"});
    EXPECT_THROW(DataTable::fromRows(rows_), ValueMismatchException);
}

TEST_F(DataTableTest, FromRowsEmptyAndHeaderOnly) {
    auto empty = DataTable::fromRows({});
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.rowCount(), 0u);

    std::vector<std::vector<std::string>> header_row;
    header_row.push_back(std::vector<std::string>{"a", "b"});
    auto header_only = DataTable::fromRows(header_row);
    EXPECT_EQ(header_only.columnCount(), 2u);
    EXPECT_EQ(header_only.rowCount(), 0u);
}

TEST_F(DataTableTest, FromColumns) {
    auto table = DataTable::fromColumns({
        {"a", {"1", "2"}},
        {"b", {"x", ""}}
    });
    EXPECT_EQ(table.rowCount(), 2u);
    EXPECT_TRUE(table.hasColumn("b"));
    EXPECT_FALSE(table.hasColumn("c"));
    EXPECT_EQ(table.findColumn("c"), nullptr);
    ASSERT_NE(table.findColumn("a"), nullptr);
    EXPECT_EQ(table.findColumn("a")->rawStrings()[1], "2");
}

TEST_F(DataTableTest, ColumnShapeIsValidated) {
    EXPECT_THROW(DataTable::fromColumns({{"a", {"1", "2"}}, {"b", {"1"}}}), ValueMismatchException);
    EXPECT_THROW(DataTable::fromColumns({{"a", {"1"}}, {"a", {"2"}}}), ConfigException);
}

TEST_F(DataTableTest, UnknownColumnThrows) {
    auto table = DataTable::fromRows(rows_);
    try {
        table.column("weight");
        FAIL() << "Expected UnknownFieldException";
    } catch (const UnknownFieldException& e) {
        EXPECT_EQ(e.getFieldName(), "weight");
        EXPECT_EQ(e.getErrorCode(), ErrorCode::UnknownField);
    }
}

TEST_F(DataTableTest, FilterByMask) {
    auto table = DataTable::fromRows(rows_);
    auto males = table.filter(table.column("sex").equals(Operand("1")));

    ASSERT_EQ(males.rowCount(), 2u);
    EXPECT_EQ(males.column("record_id").rawStrings(), (std::vector<std::string>{"1", "3"}));
    EXPECT_EQ(males.column("age").rawStrings(), (std::vector<std::string>{"25", "67"}));

    EXPECT_THROW(table.filter(BooleanMask{true}), ValueMismatchException);
}

TEST_F(DataTableTest, TakeRows) {
    auto table = DataTable::fromRows(rows_);
    auto reordered = table.takeRows({2, 0});
    EXPECT_EQ(reordered.column("record_id").rawStrings(), (std::vector<std::string>{"3", "1"}));
}

TEST_F(DataTableTest, CustomFactoryAppliesMissingCodes) {
    ClassifierConfig config = ClassifierConfig::standard();
    config.withMissingCodes({"UNK"});
    ValueFactory factory(config);

    auto table = DataTable::fromColumns({{"sex", {"1", "UNK"}}}, factory);
    EXPECT_EQ(table.column("sex").categories()[1], ValueCategory::Code);
}
