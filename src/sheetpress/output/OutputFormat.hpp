#pragma once

#include <string>
#include <vector>
#include <optional>

namespace sheetpress {
namespace output {

/**
 * @brief 支持的输出格式
 */
enum class OutputFormat {
    Csv,
    Json,
    Yaml
};

/**
 * @brief 格式名称，用于命令行参数和进度输出（"csv"、"json"、"yaml"）
 */
const char* formatName(OutputFormat format) noexcept;

/**
 * @brief 输出文件扩展名，不含点
 */
const char* formatExtension(OutputFormat format) noexcept;

/**
 * @brief 按名称解析格式，不区分大小写
 */
std::optional<OutputFormat> parseFormat(const std::string& name);

/**
 * @brief 所有格式，按命令行中的顺序
 */
const std::vector<OutputFormat>& allFormats();

}} // namespace sheetpress::output
