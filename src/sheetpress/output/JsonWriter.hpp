#pragma once

#include "sheetpress/output/SheetWriter.hpp"
#include <nlohmann/json.hpp>

namespace sheetpress {
namespace output {

/**
 * @brief JSON写出器：记录数组，4空格缩进，非ASCII字符原样输出
 *
 * 字段顺序与表头一致；表头重复时保留第一次出现的位置和最后一次的值。
 * @throws EmptyTableException 工作表没有任何行
 */
class JsonWriter : public SheetWriter {
public:
    explicit JsonWriter(int indent = 4) : indent_(indent) {}

    void render(const core::Worksheet& sheet, std::ostream& out) const override;
    OutputFormat getFormat() const override { return OutputFormat::Json; }

    static nlohmann::ordered_json toJson(const core::Record& record);

private:
    int indent_;
};

}} // namespace sheetpress::output
