#pragma once

#include "sheetpress/output/SheetWriter.hpp"
#include <string>

namespace sheetpress {
namespace output {

struct CsvOptions {
    char delimiter = ',';
    char quote_char = '"';
    std::string line_terminator = "\r\n";
};

/**
 * @brief CSV写出器
 *
 * 逐行拉取工作表（Worksheet::rows()），每行一条记录。
 * 只在字段包含分隔符、引号或换行时加引号，引号本身写两次；空值写成空字段。
 */
class CsvWriter : public SheetWriter {
public:
    CsvWriter() = default;
    explicit CsvWriter(const CsvOptions& options) : options_(options) {}

    void render(const core::Worksheet& sheet, std::ostream& out) const override;
    OutputFormat getFormat() const override { return OutputFormat::Csv; }

    const CsvOptions& getOptions() const { return options_; }

    std::string escapeField(const std::string& field) const;
    std::string formatRow(const core::Row& row) const;

private:
    CsvOptions options_;
};

}} // namespace sheetpress::output
