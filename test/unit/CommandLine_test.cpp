#include "sheetpress/app/CommandLine.hpp"
#include "sheetpress/app/Converter.hpp"
#include "sheetpress/SheetPress.hpp"
#include "support/TestPackage.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <memory>
#include <sstream>

namespace sheetpress {
namespace app {

class CommandLineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("", Logger::Level::WARN, false);
        dir_ = std::make_unique<test::TempDir>("cli");
        input_ = dir_->file("people.xlsx");
    }

    void TearDown() override {
        dir_.reset();
        Logger::getInstance().shutdown();
    }

    void writeBook() {
        test::TestPackage()
            .add("xl/workbook.xml", test::workbookXml({"Staff", "Notes"}))
            .add("xl/sharedStrings.xml", test::sharedStringsXml({"Name", "Age"}))
            .add("xl/worksheets/sheet1.xml", test::worksheetXml("A1:B2",
                "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>0</v></c><c r=\"B1\" t=\"s\"><v>1</v></c></row>"
                "<row r=\"2\"><c r=\"A2\"><v>Alice</v></c><c r=\"B2\"><v>30</v></c></row>"))
            .add("xl/worksheets/sheet2.xml", test::worksheetXml("A1:A2",
                "<row r=\"1\"><c r=\"A1\"><v>Text</v></c></row>"
                "<row r=\"2\"><c r=\"A2\"><v>a, b</v></c></row>"))
            .writeTo(input_);
    }

    int run(const std::vector<std::string>& args) {
        out_.str("");
        err_.str("");
        std::vector<std::string> argv = {"sheetpress"};
        argv.insert(argv.end(), args.begin(), args.end());
        CommandLine command_line(out_, err_);
        return command_line.run(argv);
    }

    std::unique_ptr<test::TempDir> dir_;
    std::string input_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(CommandLineTest, RequiresAFormat) {
    writeBook();
    EXPECT_EQ(run({input_}), 1);
    EXPECT_NE(err_.str().find("ERROR. Choose at least one output format."), std::string::npos);
    EXPECT_NE(err_.str().find("--csv"), std::string::npos);
}

TEST_F(CommandLineTest, MissingInput) {
    const std::string missing = dir_->file("absent.xlsx");
    EXPECT_EQ(run({missing, "--csv", "--quiet"}), 2);
    EXPECT_NE(err_.str().find("ERROR. \"" + missing + "\" does not exist"), std::string::npos);
}

TEST_F(CommandLineTest, NotAnExcelFile) {
    {
        std::ofstream out(input_, std::ios::binary);
        out << "Name,Age\n";
    }
    EXPECT_EQ(run({input_, "--json", "--quiet"}), 2);
    EXPECT_NE(err_.str().find("ERROR. \"" + input_ + "\" is not an Excel 2007+ file"), std::string::npos);
}

TEST_F(CommandLineTest, ConvertsEverySheetToEveryFormat) {
    writeBook();
    EXPECT_EQ(run({input_, "--csv", "--json", "--yaml", "--log-level", "off"}), 0) << err_.str();

    const std::string progress = out_.str();
    EXPECT_NE(progress.find("Saving 01-Staff as csv"), std::string::npos);
    EXPECT_NE(progress.find("Saving 01-Staff as json"), std::string::npos);
    EXPECT_NE(progress.find("Saving 02-Notes as yaml"), std::string::npos);
    EXPECT_LT(progress.find("Saving 01-Staff as yaml"), progress.find("Saving 02-Notes as csv"));

    EXPECT_EQ(test::readFile(dir_->file("people.01-Staff.csv")), "Name,Age\r\nAlice,30\r\n");
    EXPECT_EQ(test::readFile(dir_->file("people.02-Notes.csv")), "Text\r\n\"a, b\"\r\n");

    auto json = nlohmann::json::parse(test::readFile(dir_->file("people.01-Staff.json")));
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0]["Name"], "Alice");
    EXPECT_EQ(json[0]["Age"], "30");

    EXPECT_FALSE(test::readFile(dir_->file("people.02-Notes.yaml")).empty());
}

TEST_F(CommandLineTest, OutputDirectoryIsCreated) {
    writeBook();
    const std::string out_dir = dir_->file("exports/today");
    EXPECT_EQ(run({input_, "--csv", "-o", out_dir, "--quiet"}), 0) << err_.str();
    EXPECT_TRUE(out_.str().empty());
    EXPECT_FALSE(test::readFile(out_dir + "/people.01-Staff.csv").empty());
}

TEST_F(CommandLineTest, OutputDirectoryConflict) {
    writeBook();
    const std::string blocker = dir_->file("blocker");
    {
        std::ofstream out(blocker);
        out << "x";
    }
    EXPECT_EQ(run({input_, "--csv", "--output-dir", blocker, "--quiet"}), 1);
    EXPECT_NE(err_.str().find("(DirectoryCreationConflict)"), std::string::npos);
}

TEST_F(CommandLineTest, OtherErrorsReportCode) {
    test::TestPackage()
        .add("xl/worksheets/sheet1.xml", test::worksheetXml("A1",
            "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>4</v></c></row>"))
        .writeTo(input_);
    EXPECT_EQ(run({input_, "--csv", "--quiet"}), 1);
    EXPECT_NE(err_.str().find("ERROR. "), std::string::npos);
    EXPECT_NE(err_.str().find("(InvalidSharedStringIndex)"), std::string::npos);
}

TEST_F(CommandLineTest, ParsesSettings) {
    writeBook();
    EXPECT_EQ(run({input_, "--yaml", "--csv", "--no-sanitize", "--log-level", "debug", "--quiet"}), 0);

    // 同一次运行内 CommandLine 保存解析结果
    CommandLine command_line(out_, err_);
    EXPECT_EQ(command_line.run(std::vector<std::string>{"sheetpress", input_, "--yaml", "--csv",
                                                        "--no-sanitize", "--log-level", "error", "-q"}), 0);
    const auto& options = command_line.getConvertOptions();
    ASSERT_EQ(options.formats.size(), 2u);
    EXPECT_EQ(options.formats[0], output::OutputFormat::Csv);
    EXPECT_EQ(options.formats[1], output::OutputFormat::Yaml);
    EXPECT_FALSE(options.sanitize);
    EXPECT_FALSE(options.show_progress);
    EXPECT_EQ(command_line.getLogSettings().level, Logger::Level::ERROR);
    EXPECT_FALSE(command_line.getLogSettings().console);
}

TEST_F(CommandLineTest, UnknownLogLevel) {
    writeBook();
    EXPECT_EQ(run({input_, "--csv", "--log-level", "loud"}), 1);
    EXPECT_NE(err_.str().find("Unknown log level"), std::string::npos);
}

TEST_F(CommandLineTest, Version) {
    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_NE(out_.str().find(SHEETPRESS_VERSION_STRING), std::string::npos);
}

TEST_F(CommandLineTest, ConverterCountsFiles) {
    writeBook();
    ConvertOptions options;
    options.input = core::Path(input_);
    options.formats = {output::OutputFormat::Json};
    options.show_progress = false;

    std::ostringstream progress;
    Converter converter(options, progress);
    EXPECT_EQ(converter.run(), 2u);
    ASSERT_EQ(converter.getWrittenFiles().size(), 2u);
    EXPECT_EQ(converter.getWrittenFiles()[1].filename(), "people.02-Notes.json");
    EXPECT_TRUE(progress.str().empty());
}

}} // namespace sheetpress::app
