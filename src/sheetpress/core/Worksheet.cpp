#include "sheetpress/core/Worksheet.hpp"
#include "sheetpress/core/Workbook.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/core/TextSanitizer.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace sheetpress {
namespace core {

Worksheet::Worksheet(const Workbook& workbook, std::string entry_path, std::string name, const std::string& xml)
    : workbook_(workbook)
    , entry_path_(std::move(entry_path))
    , name_(std::move(name)) {
    reader::WorksheetParser parser;
    if (!parser.parse(xml)) {
        SHEETPRESS_THROW(XMLException, parser.getErrorMessage(), entry_path_);
    }

    dimension_ = parser.getDimension();
    cells_ = parser.takeCells();

    if (dimension_) {
        shape_ = CellReference::shapeFromRange(*dimension_);
    } else {
        shape_ = boundingShape();
        CORE_WARN("Worksheet {} has no <dimension>, using bounding box {}x{} of {} cells",
                  entry_path_, shape_.width, shape_.height, cells_.size());
    }

    CORE_DEBUG("Worksheet '{}' ({}) shape {}x{}, {} cells",
               name_, entry_path_, shape_.width, shape_.height, cells_.size());
}

TableShape Worksheet::boundingShape() const {
    TableShape shape;
    std::optional<CellCoordinate> last;
    for (const auto& cell : cells_) {
        CellCoordinate coord = locate(cell, last);
        shape.width = std::max(shape.width, coord.col + 1);
        shape.height = std::max(shape.height, coord.row + 1);
        last = coord;
    }
    return shape;
}

CellCoordinate Worksheet::locate(const reader::RawCell& cell, const std::optional<CellCoordinate>& last) const {
    if (!cell.reference.empty()) {
        return CellReference::decodeCell(cell.reference, &columns_);
    }

    // 省略r属性：行号来自 <row>，列号紧接同一行的上一个单元格
    if (cell.row_number == 0) {
        SHEETPRESS_THROW(MalformedReferenceException, std::string(), "cell without address outside a row");
    }
    CellCoordinate coord;
    coord.row = cell.row_number - 1;
    coord.col = (last && last->row == coord.row) ? last->col + 1 : 0;
    if (coord.col >= CellReference::MAX_COLUMNS) {
        SHEETPRESS_THROW(MalformedReferenceException, std::string(), "implicit column past XFD");
    }
    return coord;
}

void Worksheet::checkBounds(const CellCoordinate& coord, const reader::RawCell& cell) const {
    if (!shape_.contains(coord)) {
        SHEETPRESS_THROW(CellException,
                         fmt::format("Cell {} outside declared dimension {}x{} of worksheet '{}'",
                                     cell.reference.empty() ? CellReference::encodeCell(coord) : cell.reference,
                                     shape_.width, shape_.height, name_),
                         static_cast<int>(coord.row), static_cast<int>(coord.col));
    }
}

CellValue Worksheet::resolveValue(const reader::RawCell& cell) const {
    CellValue value;

    if (cell.type == "s") {
        if (cell.value) {
            value = workbook_.sharedStrings().resolve(*cell.value);
        }
    } else if (cell.type == "inlineStr") {
        value = cell.inline_text ? cell.inline_text : cell.value;
    } else {
        value = cell.value;
    }

    if (value && workbook_.getOptions().sanitize) {
        value = TextSanitizer::sanitize(*value);
    }
    return value;
}

const Table& Worksheet::materialize() const {
    if (table_) {
        return *table_;
    }

    Table table(shape_.height, Row(shape_.width));
    std::optional<CellCoordinate> last;

    for (const auto& cell : cells_) {
        CellCoordinate coord = locate(cell, last);
        checkBounds(coord, cell);
        table[coord.row][coord.col] = resolveValue(cell);
        last = coord;
    }

    CORE_DEBUG("Materialized worksheet '{}' ({} rows)", name_, table.size());
    table_ = std::move(table);
    return *table_;
}

RowStream Worksheet::rows() const {
    return RowStream(*this);
}

}} // namespace sheetpress::core
