#pragma once

#include "sheetpress/core/Path.hpp"
#include "sheetpress/output/OutputFormat.hpp"
#include "sheetpress/utils/Logger.hpp"
#include <string>
#include <vector>

namespace sheetpress {
namespace app {

/**
 * @brief 一次转换的参数，由命令行填充
 */
struct ConvertOptions {
    core::Path input;                            // 源工作簿
    core::Path output_dir;                       // 为空时写到源文件所在目录
    std::vector<output::OutputFormat> formats;   // 按命令行顺序，不重复
    bool sanitize = true;
    bool show_progress = true;                   // 打印 "Saving <sheet> as <format>"
};

/**
 * @brief 日志配置
 */
struct LogSettings {
    Logger::Level level = Logger::Level::WARN;
    std::string file;                            // 为空时不写文件
    bool console = true;
};

}} // namespace sheetpress::app
