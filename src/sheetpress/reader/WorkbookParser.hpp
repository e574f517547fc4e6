/**
 * @file WorkbookParser.hpp
 * @brief 工作簿清单（xl/workbook.xml）解析器
 */

#pragma once

#include "sheetpress/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace sheetpress {
namespace reader {

/**
 * @brief <sheets> 中的一条工作表声明
 */
struct SheetDeclaration {
    std::string name;
    std::string sheet_id;
    std::string rel_id;     // 例如 "rId3"

    SheetDeclaration(std::string n, std::string sid, std::string rid)
        : name(std::move(n)), sheet_id(std::move(sid)), rel_id(std::move(rid)) {}
};

/**
 * @brief 按声明顺序收集工作表名称与关系ID
 */
class WorkbookParser : public BaseSAXParser {
public:
    WorkbookParser() = default;
    ~WorkbookParser() override = default;

    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<SheetDeclaration>& getSheets() const { return sheets_; }

    void clear() {
        sheets_.clear();
        in_sheets_section_ = false;
    }

protected:
    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::vector<SheetDeclaration> sheets_;
    bool in_sheets_section_ = false;
};

}} // namespace sheetpress::reader
