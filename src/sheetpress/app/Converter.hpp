#pragma once

#include "sheetpress/app/ConvertOptions.hpp"
#include "sheetpress/core/Path.hpp"
#include <ostream>
#include <vector>

namespace sheetpress {
namespace app {

/**
 * @brief 把工作簿的每个工作表按选定格式写出
 *
 * 按归档顺序访问工作表，每个工作表依次写出所有格式。
 * 任何错误都直接抛出，已经写出的文件保留。
 */
class Converter {
public:
    Converter(const ConvertOptions& options, std::ostream& progress);

    /**
     * @return 写出的文件数量
     * @throws SheetPressException 及其子类
     */
    size_t run();

    const std::vector<core::Path>& getWrittenFiles() const { return written_; }

private:
    ConvertOptions options_;
    std::ostream& progress_;
    std::vector<core::Path> written_;
};

}} // namespace sheetpress::app
