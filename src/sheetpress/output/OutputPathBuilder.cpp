#include "sheetpress/output/OutputPathBuilder.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace sheetpress {
namespace output {

core::Path OutputPathBuilder::directoryFor(const core::Path& source, const core::Path& output_dir) {
    return output_dir.empty() ? source.parent() : output_dir;
}

core::Path OutputPathBuilder::build(const core::Path& source, const core::Path& output_dir,
                                    const std::string& sheet_name, OutputFormat format) {
    std::string filename = fmt::format("{}.{}.{}", source.stem(), sheet_name, formatExtension(format));
    return directoryFor(source, output_dir) / filename;
}

void OutputPathBuilder::prepare(const core::Path& directory) {
    if (directory.isDirectory()) {
        return;
    }
    if (directory.exists()) {
        OUTPUT_ERROR("Output path exists and is not a directory: {}", directory.string());
        SHEETPRESS_THROW(core::DirectoryCreationException,
                         "Output path exists and is not a directory", directory.string());
    }
    if (!directory.createDirectories()) {
        SHEETPRESS_THROW(core::DirectoryCreationException,
                         "Cannot create output directory", directory.string());
    }
    OUTPUT_INFO("Created output directory: {}", directory.string());
}

}} // namespace sheetpress::output
