#include "sheetpress/core/RowStream.hpp"
#include "sheetpress/core/Worksheet.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace sheetpress {
namespace core {

RowStream::RowStream(const Worksheet& sheet)
    : sheet_(&sheet)
    , shape_(sheet.shape())
    , buffer_(sheet.shape().width) {
}

bool RowStream::fetchPending() {
    if (pending_) {
        return true;
    }
    if (cell_index_ >= sheet_->cells_.size()) {
        return false;
    }

    const reader::RawCell& cell = sheet_->cells_[cell_index_++];
    CellCoordinate coord = sheet_->locate(cell, last_coord_);
    sheet_->checkBounds(coord, cell);
    last_coord_ = coord;
    pending_.emplace(coord, sheet_->resolveValue(cell));
    return true;
}

bool RowStream::next(Row& row) {
    if (next_row_ >= shape_.height) {
        return false;
    }

    while (fetchPending()) {
        const CellCoordinate& coord = pending_->first;
        if (coord.row > next_row_) {
            break;
        }
        if (coord.row < next_row_) {
            SHEETPRESS_THROW(WorksheetException,
                             fmt::format("Cell {} appears after row {} was already emitted",
                                         CellReference::encodeCell(coord), next_row_),
                             sheet_->getName());
        }
        buffer_[coord.col] = std::move(pending_->second);
        pending_.reset();
    }

    SHEETPRESS_LOG_ROW_TRACE("Emitting row {} of worksheet '{}'", next_row_, sheet_->getName());
    row = std::move(buffer_);
    buffer_.assign(shape_.width, CellValue());
    ++next_row_;
    return true;
}

}} // namespace sheetpress::core
