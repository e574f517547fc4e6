#include "sheetpress/SheetPress.hpp"
#include "sheetpress/core/Path.hpp"
#include <iostream>
#include <exception>

namespace sheetpress {

bool initialize(const std::string& log_file_path, Logger::Level level, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, level, enable_console);
        SHEETPRESS_LOG_DEBUG("SheetPress {} initialized", getVersion());
        return true;
    } catch (const std::exception& e) {
        if (enable_console) {
            std::cerr << "Failed to initialize SheetPress: " << e.what() << std::endl;
        }
        return false;
    }
}

void cleanup() {
    SHEETPRESS_LOG_DEBUG("SheetPress cleanup");
    Logger::getInstance().flush();
    Logger::getInstance().shutdown();
}

std::unique_ptr<core::Workbook> openWorkbook(const std::string& filename, const core::WorkbookOptions& options) {
    return std::make_unique<core::Workbook>(core::Path(filename), options);
}

} // namespace sheetpress
