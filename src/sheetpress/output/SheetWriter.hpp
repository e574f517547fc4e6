#pragma once

#include "sheetpress/output/OutputFormat.hpp"
#include "sheetpress/core/Path.hpp"
#include "sheetpress/core/WorkbookTypes.hpp"
#include <ostream>
#include <string>

namespace sheetpress {
namespace core { class Worksheet; }

namespace output {

/**
 * @brief 工作表写出接口 - 策略模式
 *
 * 每种输出格式一个实现，由 WriterRegistry 按 OutputFormat 创建。
 */
class SheetWriter {
public:
    virtual ~SheetWriter() = default;

    /**
     * @brief 把工作表写到文件
     * @throws FileException 文件无法打开或写入失败（FileWriteError）
     */
    void write(const core::Worksheet& sheet, const core::Path& target) const;

    /**
     * @brief 把工作表写到流
     */
    virtual void render(const core::Worksheet& sheet, std::ostream& out) const = 0;

    virtual OutputFormat getFormat() const = 0;

    /**
     * @brief 记录中的字段名；空字段名写成 "null"
     */
    static std::string fieldName(const core::CellValue& key);
};

}} // namespace sheetpress::output
