/**
 * @file WorkbookParser.cpp
 * @brief 工作簿清单解析器实现
 */

#include "sheetpress/reader/WorkbookParser.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"

namespace sheetpress {
namespace reader {

void WorkbookParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name == "sheets") {
        in_sheets_section_ = true;
        return;
    }

    if (name != "sheet" || !in_sheets_section_) {
        return;
    }

    std::string sheet_name = getAttributeOr(attributes, "name", "");
    std::string sheet_id = getAttributeOr(attributes, "sheetId", "");
    // 关系ID的前缀由命名空间声明决定，通常是 "r:"
    auto rel_id = findPrefixedAttribute(attributes, "id");

    if (!rel_id || rel_id->empty()) {
        READER_WARN("Sheet element without relationship id: name='{}', sheetId='{}'", sheet_name, sheet_id);
        return;
    }

    READER_DEBUG("Declared sheet '{}' (sheetId={}, {})", sheet_name, sheet_id, *rel_id);
    sheets_.emplace_back(std::move(sheet_name), std::move(sheet_id), std::move(*rel_id));
}

void WorkbookParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "sheets") {
        in_sheets_section_ = false;
    }
}

}} // namespace sheetpress::reader
