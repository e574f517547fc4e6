#include "sheetpress/reader/WorksheetParser.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <cstdlib>

namespace sheetpress {
namespace reader {

void WorksheetParser::clear() {
    dimension_.reset();
    cells_.clear();
    cs_ = CellState{};
}

void WorksheetParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (cs_.in_cell) {
        if (name == "v") {
            cs_.in_value = true;
            startCollectingText();
        } else if (name == "is") {
            cs_.in_inline = true;
        } else if (name == "rPh") {
            cs_.phonetic_depth++;
        } else if (name == "t" && cs_.in_inline && cs_.phonetic_depth == 0) {
            cs_.in_inline_text = true;
            startCollectingText();
        }
        return;
    }

    if (name == "c" && cs_.in_sheet_data) {
        cs_.in_cell = true;
        cs_.cell = RawCell{};
        cs_.cell.reference = getAttributeOr(attributes, "r", "");
        cs_.cell.type = getAttributeOr(attributes, "t", "");
        cs_.cell.row_number = cs_.current_row;
    } else if (name == "row" && cs_.in_sheet_data) {
        auto r = findAttribute(attributes, "r");
        uint32_t next = cs_.current_row + 1;
        if (r) {
            char* end = nullptr;
            unsigned long value = std::strtoul(r->c_str(), &end, 10);
            if (!r->empty() && end && *end == '\0' && value > 0) {
                next = static_cast<uint32_t>(value);
            } else {
                READER_WARN("Ignoring malformed row number '{}'", *r);
            }
        }
        cs_.current_row = next;
    } else if (name == "sheetData") {
        cs_.in_sheet_data = true;
    } else if (name == "dimension") {
        auto ref = findAttribute(attributes, "ref");
        if (ref && !ref->empty()) {
            dimension_ = std::move(*ref);
        }
    }
}

void WorksheetParser::onEndElement(std::string_view name, int /*depth*/) {
    if (cs_.in_cell) {
        if (name == "v" && cs_.in_value) {
            // 空的 <v/> 视为没有值
            if (!getCurrentText().empty()) {
                cs_.cell.value = getCurrentText();
            }
            cs_.in_value = false;
            stopCollectingText();
        } else if (name == "t" && cs_.in_inline_text) {
            if (!getCurrentText().empty()) {
                if (!cs_.cell.inline_text) {
                    cs_.cell.inline_text = std::string();
                }
                *cs_.cell.inline_text += getCurrentText();
            }
            cs_.in_inline_text = false;
            stopCollectingText();
        } else if (name == "rPh") {
            if (cs_.phonetic_depth > 0) {
                cs_.phonetic_depth--;
            }
        } else if (name == "is") {
            cs_.in_inline = false;
        } else if (name == "c") {
            SHEETPRESS_LOG_CELL_TRACE("Cell {} t='{}' value={}", cs_.cell.reference, cs_.cell.type,
                                      cs_.cell.value ? *cs_.cell.value : std::string("<null>"));
            cells_.push_back(std::move(cs_.cell));
            cs_.cell = RawCell{};
            cs_.in_cell = false;
            cs_.in_value = false;
            cs_.in_inline = false;
            cs_.in_inline_text = false;
            cs_.phonetic_depth = 0;
        }
        return;
    }

    if (name == "sheetData") {
        cs_.in_sheet_data = false;
        READER_DEBUG("Collected {} cells from sheetData", cells_.size());
    }
}

}} // namespace sheetpress::reader
