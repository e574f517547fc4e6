#include "sheetpress/core/CellReference.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/utils/Logger.hpp"
#include <gtest/gtest.h>

namespace sheetpress {
namespace core {

class CellReferenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("", Logger::Level::WARN, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }
};

TEST_F(CellReferenceTest, DecodeSingleLetters) {
    EXPECT_EQ(CellReference::decodeColumn("A"), 0u);
    EXPECT_EQ(CellReference::decodeColumn("B"), 1u);
    EXPECT_EQ(CellReference::decodeColumn("Z"), 25u);
    EXPECT_EQ(CellReference::decodeColumn("z"), 25u);
}

TEST_F(CellReferenceTest, DecodeMultipleLetters) {
    EXPECT_EQ(CellReference::decodeColumn("AA"), 26u);
    EXPECT_EQ(CellReference::decodeColumn("AZ"), 51u);
    EXPECT_EQ(CellReference::decodeColumn("BA"), 52u);
    EXPECT_EQ(CellReference::decodeColumn("ZZ"), 701u);
    EXPECT_EQ(CellReference::decodeColumn("AAA"), 702u);
    EXPECT_EQ(CellReference::decodeColumn("XFD"), 16383u);
}

TEST_F(CellReferenceTest, EncodeColumn) {
    EXPECT_EQ(CellReference::encodeColumn(0), "A");
    EXPECT_EQ(CellReference::encodeColumn(25), "Z");
    EXPECT_EQ(CellReference::encodeColumn(26), "AA");
    EXPECT_EQ(CellReference::encodeColumn(701), "ZZ");
    EXPECT_EQ(CellReference::encodeColumn(702), "AAA");
    EXPECT_EQ(CellReference::encodeColumn(16383), "XFD");
}

// 三个字母以内的所有列都能往返
TEST_F(CellReferenceTest, ColumnRoundTripThroughThreeLetters) {
    const uint32_t three_letters = 26 + 26 * 26 + 26 * 26 * 26;
    for (uint32_t n = 0; n < three_letters && n < CellReference::MAX_COLUMNS; ++n) {
        ASSERT_EQ(CellReference::decodeColumn(CellReference::encodeColumn(n)), n) << n;
    }
}

TEST_F(CellReferenceTest, DecodeCell) {
    CellCoordinate c = CellReference::decodeCell("B3");
    EXPECT_EQ(c.col, 1u);
    EXPECT_EQ(c.row, 2u);

    c = CellReference::decodeCell("A1");
    EXPECT_EQ(c, (CellCoordinate{0, 0}));

    c = CellReference::decodeCell("XFD1048576");
    EXPECT_EQ(c.col, 16383u);
    EXPECT_EQ(c.row, 1048575u);
}

TEST_F(CellReferenceTest, EncodeCell) {
    EXPECT_EQ(CellReference::encodeCell(CellCoordinate{1, 2}), "B3");
    EXPECT_EQ(CellReference::encodeCell(CellCoordinate{27, 99}), "AB100");
}

TEST_F(CellReferenceTest, MalformedReferences) {
    EXPECT_THROW(CellReference::decodeCell("12A"), MalformedReferenceException);
    EXPECT_THROW(CellReference::decodeCell("A"), MalformedReferenceException);
    EXPECT_THROW(CellReference::decodeCell("A0"), MalformedReferenceException);
    EXPECT_THROW(CellReference::decodeCell("A1B"), MalformedReferenceException);
    EXPECT_THROW(CellReference::decodeCell(""), MalformedReferenceException);
    EXPECT_THROW(CellReference::decodeCell("XFE1"), MalformedReferenceException);
    EXPECT_THROW(CellReference::decodeCell("A1048577"), MalformedReferenceException);
    EXPECT_THROW(CellReference::decodeColumn("A1"), MalformedReferenceException);
}

TEST_F(CellReferenceTest, MalformedReferenceCarriesErrorCode) {
    try {
        CellReference::decodeCell("12A");
        FAIL() << "expected MalformedReferenceException";
    } catch (const MalformedReferenceException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::MalformedReference);
        EXPECT_EQ(e.getReference(), "12A");
    }
}

TEST_F(CellReferenceTest, ShapeFromRange) {
    EXPECT_EQ(CellReference::shapeFromRange("A1:B2"), (TableShape{2, 2}));
    EXPECT_EQ(CellReference::shapeFromRange("A1:C4"), (TableShape{3, 4}));
    EXPECT_EQ(CellReference::shapeFromRange("A1"), (TableShape{1, 1}));
    EXPECT_EQ(CellReference::shapeFromRange("B2:D5"), (TableShape{4, 5}));
    EXPECT_THROW(CellReference::shapeFromRange("A1:"), MalformedReferenceException);
    EXPECT_THROW(CellReference::shapeFromRange("1A:B2"), MalformedReferenceException);
}

// 范围内的所有引用都落在形状里
TEST_F(CellReferenceTest, ShapeBoundsEveryReferenceInRange) {
    TableShape shape = CellReference::shapeFromRange("A1:AC30");
    for (uint32_t col = 0; col < 29; ++col) {
        for (uint32_t row = 0; row < 30; ++row) {
            CellCoordinate c = CellReference::decodeCell(CellReference::encodeCell(CellCoordinate{col, row}));
            ASSERT_TRUE(shape.contains(c)) << CellReference::encodeCell(c);
        }
    }
    EXPECT_FALSE(shape.contains(CellReference::decodeCell("AD1")));
    EXPECT_FALSE(shape.contains(CellReference::decodeCell("A31")));
}

TEST_F(CellReferenceTest, ColumnCacheDecodesOnce) {
    ColumnCache cache;
    EXPECT_EQ(cache.decode("AB"), 27u);
    EXPECT_EQ(cache.decode("AB"), 27u);
    EXPECT_EQ(cache.decode("C"), 2u);
    EXPECT_EQ(cache.size(), 2u);

    CellCoordinate c = CellReference::decodeCell("AB7", &cache);
    EXPECT_EQ(c.col, 27u);
    EXPECT_EQ(c.row, 6u);
    EXPECT_EQ(cache.size(), 2u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

}} // namespace sheetpress::core
