#pragma once

#include "sheetpress/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace sheetpress {
namespace reader {

/**
 * @brief <sheetData> 中一个 <c> 元素的原始内容，尚未解码
 */
struct RawCell {
    std::string reference;                  // "B3"；省略r属性时为空
    std::string type;                       // t属性："s"、"inlineStr"、"str"、"n"...
    std::optional<std::string> value;       // <v> 文本
    std::optional<std::string> inline_text; // <is> 内 <t> 拼接后的文本
    uint32_t row_number = 0;                // 所在 <row> 的1基行号
};

/**
 * @brief 工作表XML解析器
 *
 * 只收集单元格的原始内容和 <dimension ref>，
 * 坐标解码、共享字符串解析都留给core层。
 */
class WorksheetParser : public BaseSAXParser {
public:
    WorksheetParser() = default;
    ~WorksheetParser() override = default;

    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::optional<std::string>& getDimension() const { return dimension_; }

    const std::vector<RawCell>& getCells() const { return cells_; }
    std::vector<RawCell> takeCells() { return std::move(cells_); }

    void clear();

protected:
    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::optional<std::string> dimension_;
    std::vector<RawCell> cells_;

    struct CellState {
        bool in_sheet_data = false;
        bool in_cell = false;
        bool in_value = false;
        bool in_inline = false;
        bool in_inline_text = false;
        int phonetic_depth = 0;
        uint32_t current_row = 0;
        RawCell cell;
    };
    CellState cs_;
};

}} // namespace sheetpress::reader
