#include "sheetpress/core/Workbook.hpp"
#include "sheetpress/core/Worksheet.hpp"
#include "sheetpress/core/TableProjector.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/utils/Logger.hpp"
#include "support/TestPackage.hpp"
#include <gtest/gtest.h>
#include <memory>

namespace sheetpress {
namespace core {

namespace {

CellValue v(const char* text) { return CellValue(text); }
const CellValue null_value = std::nullopt;

// 用逐行拉取的方式收集整张表
Table collectRows(const Worksheet& sheet) {
    Table table;
    RowStream rows = sheet.rows();
    Row row;
    while (rows.next(row)) {
        table.push_back(row);
    }
    return table;
}

} // namespace

class WorksheetTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("", Logger::Level::WARN, false);
        dir_ = std::make_unique<test::TempDir>("worksheet");
        path_ = dir_->file("book.xlsx");
    }

    void TearDown() override {
        dir_.reset();
        Logger::getInstance().shutdown();
    }

    // 单工作表的工作簿
    std::unique_ptr<Workbook> singleSheet(const std::string& dimension, const std::string& sheet_data,
                                          const std::vector<std::string>& shared = {},
                                          const WorkbookOptions& options = WorkbookOptions()) {
        test::TestPackage package;
        if (!shared.empty()) {
            package.add("xl/sharedStrings.xml", test::sharedStringsXml(shared));
        }
        package.add("xl/worksheets/sheet1.xml", test::worksheetXml(dimension, sheet_data));
        package.writeTo(path_);
        return std::make_unique<Workbook>(Path(path_), options);
    }

    std::unique_ptr<test::TempDir> dir_;
    std::string path_;
};

TEST_F(WorksheetTest, EndToEndNameAge) {
    auto book = singleSheet("A1:B2",
        "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>0</v></c><c r=\"B1\" t=\"s\"><v>1</v></c></row>"
        "<row r=\"2\"><c r=\"A2\" t=\"inlineStr\"><is><t>Alice</t></is></c><c r=\"B2\"><v>30</v></c></row>",
        {"Name", "Age"});

    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_EQ(sheet->shape(), (TableShape{2, 2}));
    EXPECT_EQ(sheet->declaredDimension(), std::optional<std::string>("A1:B2"));

    const Table expected = {{v("Name"), v("Age")}, {v("Alice"), v("30")}};
    EXPECT_EQ(sheet->materialize(), expected);
    EXPECT_EQ(collectRows(*sheet), expected);

    auto records = TableProjector::toRecords(sheet->materialize());
    ASSERT_EQ(records.size(), 1u);
    const Record expected_record = {{v("Name"), v("Alice")}, {v("Age"), v("30")}};
    EXPECT_EQ(records[0], expected_record);

    RecordStream stream = TableProjector::toRecords(sheet->rows());
    Record record;
    ASSERT_TRUE(stream.next(record));
    EXPECT_EQ(record, expected_record);
    EXPECT_FALSE(stream.next(record));
}

// 稀疏单元格：缺失地址为空值，空行整行为空
TEST_F(WorksheetTest, SparseCellsFillWithNull) {
    auto book = singleSheet("A1:C4",
        "<row r=\"1\"><c r=\"B1\"><v>b1</v></c></row>"
        "<row r=\"3\"><c r=\"A3\"><v>a3</v></c><c r=\"C3\"><v>c3</v></c></row>");

    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    const Table expected = {
        {null_value, v("b1"), null_value},
        {null_value, null_value, null_value},
        {v("a3"), null_value, v("c3")},
        {null_value, null_value, null_value},
    };
    EXPECT_EQ(sheet->materialize(), expected);
    EXPECT_EQ(collectRows(*sheet), expected);
}

// 逐行拉取与稠密表格逐格一致
TEST_F(WorksheetTest, EagerAndLazyAgree) {
    const std::vector<std::pair<std::string, std::string>> sheets = {
        {"A1:D3", "<row r=\"1\"><c r=\"A1\"><v>1</v></c><c r=\"B1\"><v>2</v></c>"
                  "<c r=\"C1\"><v>3</v></c><c r=\"D1\"><v>4</v></c></row>"
                  "<row r=\"2\"><c r=\"D2\"><v>x</v></c></row>"
                  "<row r=\"3\"><c r=\"A3\"><v>y</v></c></row>"},
        {"A1:B5", "<row r=\"5\"><c r=\"B5\"><v>last</v></c></row>"},
        {"A1:C2", ""},
        {"", "<row r=\"2\"><c r=\"C2\"><v>only</v></c></row>"},
        {"A1:B2", "<row><c><v>p</v></c><c><v>q</v></c></row><row><c><v>r</v></c></row>"},
    };

    for (const auto& entry : sheets) {
        auto book = singleSheet(entry.first, entry.second);
        auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
        const Table& eager = sheet->materialize();
        Table lazy = collectRows(*sheet);

        ASSERT_EQ(lazy.size(), sheet->height()) << entry.second;
        for (uint32_t row = 0; row < sheet->height(); ++row) {
            ASSERT_EQ(lazy[row].size(), sheet->width());
            for (uint32_t col = 0; col < sheet->width(); ++col) {
                EXPECT_EQ(lazy[row][col], eager[row][col]) << entry.second << " @" << row << "," << col;
            }
        }
    }
}

TEST_F(WorksheetTest, ColumnDecodesSharedAcrossEagerAndLazy) {
    auto book = singleSheet("A1:C3",
        "<row r=\"1\"><c r=\"A1\"><v>1</v></c><c r=\"B1\"><v>2</v></c></row>"
        "<row r=\"2\"><c r=\"A2\"><v>3</v></c><c r=\"C2\"><v>4</v></c></row>"
        "<row r=\"3\"><c r=\"B3\"><v>5</v></c></row>");
    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_EQ(sheet->decodedColumnCount(), 0u);

    sheet->materialize();
    EXPECT_EQ(sheet->decodedColumnCount(), 3u);

    Table first = collectRows(*sheet);
    Table second = collectRows(*sheet);
    EXPECT_EQ(sheet->decodedColumnCount(), 3u);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first[1][2], v("4"));
}

TEST_F(WorksheetTest, DuplicateAddressLastWins) {
    auto book = singleSheet("A1:A1",
        "<row r=\"1\"><c r=\"A1\"><v>first</v></c><c r=\"A1\"><v>second</v></c></row>");

    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_EQ(sheet->materialize()[0][0], v("second"));
    EXPECT_EQ(collectRows(*sheet)[0][0], v("second"));
}

TEST_F(WorksheetTest, CellOutsideDimension) {
    auto book = singleSheet("A1:B2",
        "<row r=\"1\"><c r=\"A1\"><v>a</v></c></row><row r=\"3\"><c r=\"A3\"><v>x</v></c></row>");

    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_THROW(sheet->materialize(), CellException);
    EXPECT_THROW(collectRows(*sheet), CellException);

    auto wide = singleSheet("A1:B2", "<row r=\"1\"><c r=\"C1\"><v>x</v></c></row>");
    auto wide_sheet = wide->loadWorksheet("xl/worksheets/sheet1.xml");
    try {
        wide_sheet->materialize();
        FAIL() << "expected CellException";
    } catch (const CellException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CellOutOfRange);
        EXPECT_EQ(e.getRow(), 0);
        EXPECT_EQ(e.getCol(), 2);
    }
}

// 逐行拉取不能回到已经输出的行
TEST_F(WorksheetTest, LazyRejectsEarlierRow) {
    auto book = singleSheet("A1:A2",
        "<row r=\"2\"><c r=\"A2\"><v>two</v></c></row><row r=\"1\"><c r=\"A1\"><v>one</v></c></row>");

    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    const Table expected = {{v("one")}, {v("two")}};
    EXPECT_EQ(sheet->materialize(), expected);
    EXPECT_THROW(collectRows(*sheet), WorksheetException);
}

TEST_F(WorksheetTest, SharedStringIndexOutOfRange) {
    auto book = singleSheet("A1:A1", "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>2</v></c></row>", {"a", "b"});

    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_THROW(sheet->materialize(), InvalidSharedStringIndexException);
    EXPECT_THROW(collectRows(*sheet), InvalidSharedStringIndexException);
}

TEST_F(WorksheetTest, SharedStringIndexIsLookedUp) {
    std::vector<std::string> shared;
    std::string row;
    for (int i = 0; i < 10; ++i) {
        shared.push_back("s" + std::to_string(i));
        row += "<c r=\"" + CellReference::encodeColumn(static_cast<uint32_t>(i)) + "1\" t=\"s\"><v>" +
               std::to_string(i) + "</v></c>";
    }
    auto book = singleSheet("A1:J1", "<row r=\"1\">" + row + "</row>", shared);

    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    const Row& first = sheet->materialize()[0];
    for (size_t i = 0; i < shared.size(); ++i) {
        EXPECT_EQ(first[i], CellValue(shared[i]));
    }
    EXPECT_EQ(book->sharedStrings().size(), shared.size());
}

TEST_F(WorksheetTest, NoSharedStringsEntry) {
    auto book = singleSheet("A1:B1", "<row r=\"1\"><c r=\"A1\"><v>1</v></c><c r=\"B1\"><v>2</v></c></row>");

    EXPECT_TRUE(book->sharedStrings().empty());
    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    const Table expected = {{v("1"), v("2")}};
    EXPECT_EQ(sheet->materialize(), expected);

    auto referencing = singleSheet("A1", "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>0</v></c></row>");
    auto bad = referencing->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_THROW(bad->materialize(), InvalidSharedStringIndexException);
}

TEST_F(WorksheetTest, MissingDimensionUsesBoundingBox) {
    auto book = singleSheet("", "<row r=\"3\"><c r=\"B3\"><v>x</v></c></row>");

    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_FALSE(sheet->declaredDimension().has_value());
    EXPECT_EQ(sheet->shape(), (TableShape{2, 3}));
}

TEST_F(WorksheetTest, EmptySheetHasNoRecords) {
    auto book = singleSheet("", "");
    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_TRUE(sheet->shape().empty());
    EXPECT_TRUE(sheet->materialize().empty());
    EXPECT_THROW(TableProjector::toRecords(sheet->rows()), EmptyTableException);
    EXPECT_THROW(TableProjector::toRecords(sheet->materialize()), EmptyTableException);
}

TEST_F(WorksheetTest, BlankCellsAreNull) {
    auto book = singleSheet("A1:C1",
        "<row r=\"1\"><c r=\"A1\" s=\"3\"/><c r=\"B1\"><v></v></c><c r=\"C1\" t=\"s\"/></row>",
        {"unused"});

    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    const Table expected = {{null_value, null_value, null_value}};
    EXPECT_EQ(sheet->materialize(), expected);
}

TEST_F(WorksheetTest, SanitizeOption) {
    const std::string data =
        "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>0</v></c><c r=\"B1\"><v>  7 </v></c></row>";

    auto sanitized = singleSheet("A1:B1", data, {"  line one\r\nline two  "});
    auto sheet = sanitized->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_EQ(sheet->materialize()[0][0], v("line one line two"));
    EXPECT_EQ(sheet->materialize()[0][1], v("7"));

    WorkbookOptions raw_options;
    raw_options.sanitize = false;
    auto raw = singleSheet("A1:B1", data, {"  line one\r\nline two  "}, raw_options);
    auto raw_sheet = raw->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_EQ(raw_sheet->materialize()[0][1], v("  7 "));
}

TEST_F(WorksheetTest, MalformedAddress) {
    auto book = singleSheet("A1:B2", "<row r=\"1\"><c r=\"12A\"><v>x</v></c></row>");
    auto sheet = book->loadWorksheet("xl/worksheets/sheet1.xml");
    EXPECT_THROW(sheet->materialize(), MalformedReferenceException);
}

TEST_F(WorksheetTest, MalformedXml) {
    test::TestPackage()
        .add("xl/worksheets/sheet1.xml", "<worksheet><sheetData><row></sheetData>")
        .writeTo(path_);
    Workbook book{Path(path_)};
    EXPECT_THROW(book.loadWorksheet("xl/worksheets/sheet1.xml"), XMLException);
}

}} // namespace sheetpress::core
