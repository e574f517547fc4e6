#include "sheetpress/output/CsvWriter.hpp"
#include "sheetpress/core/Worksheet.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"

namespace sheetpress {
namespace output {

void CsvWriter::render(const core::Worksheet& sheet, std::ostream& out) const {
    core::RowStream rows = sheet.rows();
    core::Row row;
    while (rows.next(row)) {
        out << formatRow(row);
    }
    OUTPUT_DEBUG("CSV: wrote {} rows for sheet '{}'", rows.rowsEmitted(), sheet.getName());
}

std::string CsvWriter::escapeField(const std::string& field) const {
    bool needs_quotes = field.find(options_.delimiter) != std::string::npos ||
                        field.find(options_.quote_char) != std::string::npos ||
                        field.find('\n') != std::string::npos ||
                        field.find('\r') != std::string::npos;

    if (!needs_quotes) {
        return field;
    }

    std::string escaped(1, options_.quote_char);
    escaped.reserve(field.size() + 2);
    for (char c : field) {
        if (c == options_.quote_char) {
            escaped += options_.quote_char;
        }
        escaped += c;
    }
    escaped += options_.quote_char;
    return escaped;
}

std::string CsvWriter::formatRow(const core::Row& row) const {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            line += options_.delimiter;
        }
        if (row[i]) {
            line += escapeField(*row[i]);
        }
    }
    line += options_.line_terminator;
    return line;
}

}} // namespace sheetpress::output
