#pragma once

#include "sheetpress/app/ConvertOptions.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace sheetpress {
namespace app {

enum class ExitCode : int {
    Success = 0,
    Failure = 1,        // 参数错误或转换失败
    InvalidInput = 2    // 输入不存在或不是Excel 2007+文件
};

/**
 * @brief sheetpress 命令行
 *
 * 用法: sheetpress <file> [--csv] [--json] [--yaml] [-o DIR] [--no-sanitize]
 *                         [--log-level LEVEL] [--log-file FILE] [--quiet] [--version]
 *
 * 进度和版本写到 out，诊断信息写到 err。
 */
class CommandLine {
public:
    CommandLine(std::ostream& out, std::ostream& err);

    /**
     * @return 进程退出码
     */
    int run(int argc, const char* const argv[]);

    int run(const std::vector<std::string>& args);

    const ConvertOptions& getConvertOptions() const { return convert_; }
    const LogSettings& getLogSettings() const { return log_; }

private:
    int execute();

    std::ostream& out_;
    std::ostream& err_;
    ConvertOptions convert_;
    LogSettings log_;
};

}} // namespace sheetpress::app
