#include "sheetpress/output/SheetWriter.hpp"
#include "sheetpress/core/Worksheet.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <fstream>

namespace sheetpress {
namespace output {

void SheetWriter::write(const core::Worksheet& sheet, const core::Path& target) const {
    OUTPUT_DEBUG("Writing sheet '{}' as {} to {}", sheet.getName(), formatName(getFormat()), target.string());

    // 二进制模式，行结束符由各个写出器自己决定
    std::ofstream file(target.native(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        OUTPUT_ERROR("Cannot open output file: {}", target.string());
        SHEETPRESS_THROW(core::FileException, "Cannot open output file", target.string(),
                         core::ErrorCode::FileWriteError);
    }

    render(sheet, file);

    file.flush();
    if (!file) {
        OUTPUT_ERROR("Failed to write output file: {}", target.string());
        SHEETPRESS_THROW(core::FileException, "Failed to write output file", target.string(),
                         core::ErrorCode::FileWriteError);
    }
}

std::string SheetWriter::fieldName(const core::CellValue& key) {
    return key ? *key : std::string("null");
}

}} // namespace sheetpress::output
