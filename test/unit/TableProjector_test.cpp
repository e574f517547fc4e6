#include "sheetpress/core/TableProjector.hpp"
#include "sheetpress/core/Exception.hpp"
#include <gtest/gtest.h>

namespace sheetpress {
namespace core {

namespace {
CellValue v(const char* text) { return CellValue(text); }
}

TEST(TableProjectorTest, ZipRowPairsByPosition) {
    Row header = {v("Name"), v("Age")};
    Row row = {v("Alice"), v("30")};
    Record expected = {{v("Name"), v("Alice")}, {v("Age"), v("30")}};
    EXPECT_EQ(TableProjector::zipRow(header, row), expected);
}

TEST(TableProjectorTest, ZipRowTruncatesToShorter) {
    Row header = {v("A"), v("B"), v("C")};
    Row row = {v("1")};
    EXPECT_EQ(TableProjector::zipRow(header, row).size(), 1u);
    EXPECT_EQ(TableProjector::zipRow(row, header).size(), 1u);
}

// 表头不去重，空表头单元格也保留
TEST(TableProjectorTest, KeepsDuplicateAndNullHeaders) {
    Table table = {
        {v("X"), v("X"), CellValue()},
        {v("1"), v("2"), v("3")},
        {CellValue(), CellValue(), CellValue()},
    };
    auto records = TableProjector::toRecords(table);
    ASSERT_EQ(records.size(), 2u);
    ASSERT_EQ(records[0].size(), 3u);
    EXPECT_EQ(records[0][1], (Field{v("X"), v("2")}));
    EXPECT_EQ(records[0][2], (Field{CellValue(), v("3")}));
    EXPECT_EQ(records[1][0], (Field{v("X"), CellValue()}));
}

TEST(TableProjectorTest, HeaderOnlyTableHasNoRecords) {
    Table table = {{v("Name")}};
    EXPECT_TRUE(TableProjector::toRecords(table).empty());
}

TEST(TableProjectorTest, EmptyTableRaises) {
    try {
        TableProjector::toRecords(Table());
        FAIL() << "expected EmptyTableException";
    } catch (const EmptyTableException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::EmptyTable);
    }
}

}} // namespace sheetpress::core
