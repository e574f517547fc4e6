#pragma once

#include "sheetpress/output/OutputFormat.hpp"
#include "sheetpress/core/Path.hpp"
#include <string>

namespace sheetpress {
namespace output {

/**
 * @brief 输出文件路径：<目录>/<源文件名去扩展名>.<工作表名>.<扩展名>
 */
class OutputPathBuilder {
public:
    /**
     * @param source 源工作簿路径
     * @param output_dir 输出目录；为空时使用源文件所在目录
     * @param sheet_name 工作表名称
     */
    static core::Path build(const core::Path& source, const core::Path& output_dir,
                            const std::string& sheet_name, OutputFormat format);

    /**
     * @brief 输出目录：output_dir 为空时取源文件所在目录
     */
    static core::Path directoryFor(const core::Path& source, const core::Path& output_dir);

    /**
     * @brief 确保目录存在
     * @throws DirectoryCreationException 路径已被非目录占用，或创建失败
     */
    static void prepare(const core::Path& directory);
};

}} // namespace sheetpress::output
