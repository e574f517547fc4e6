#include "sheetpress/output/WriterRegistry.hpp"
#include "sheetpress/output/CsvWriter.hpp"
#include "sheetpress/output/JsonWriter.hpp"
#include "sheetpress/output/YamlWriter.hpp"
#include "sheetpress/core/Exception.hpp"
#include <fmt/format.h>

namespace sheetpress {
namespace output {

std::unique_ptr<SheetWriter> WriterRegistry::create(OutputFormat format) {
    switch (format) {
        case OutputFormat::Csv:  return std::make_unique<CsvWriter>();
        case OutputFormat::Json: return std::make_unique<JsonWriter>();
        case OutputFormat::Yaml: return std::make_unique<YamlWriter>();
    }
    SHEETPRESS_THROW(core::SheetPressException,
                     fmt::format("Unsupported output format: {}", static_cast<int>(format)),
                     core::ErrorCode::InvalidArgument);
}

}} // namespace sheetpress::output
