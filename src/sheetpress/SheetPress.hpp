#pragma once

// SheetPress - Excel 2007+ 工作表提取库

#include <string>
#include <memory>

#include "sheetpress/core/WorkbookTypes.hpp"
#include "sheetpress/core/Workbook.hpp"
#include "sheetpress/core/Worksheet.hpp"
#include "sheetpress/core/TableProjector.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/utils/Logger.hpp"

// 版本信息
#define SHEETPRESS_VERSION_MAJOR 1
#define SHEETPRESS_VERSION_MINOR 0
#define SHEETPRESS_VERSION_PATCH 0
#define SHEETPRESS_VERSION_STRING "1.0.0"

namespace sheetpress {

inline std::string getVersion() {
    return SHEETPRESS_VERSION_STRING;
}

/**
 * @brief 初始化日志系统
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param level 最低日志等级
 * @param enable_console 是否输出到控制台
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "",
                Logger::Level level = Logger::Level::WARN,
                bool enable_console = true);

/**
 * @brief 刷新并关闭日志
 */
void cleanup();

/**
 * @brief 打开工作簿（只记录路径，真正的读取发生在遍历时）
 */
std::unique_ptr<core::Workbook> openWorkbook(const std::string& filename,
                                             const core::WorkbookOptions& options = core::WorkbookOptions());

} // namespace sheetpress
