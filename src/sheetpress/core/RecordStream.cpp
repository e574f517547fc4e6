#include "sheetpress/core/RecordStream.hpp"
#include "sheetpress/core/TableProjector.hpp"
#include "sheetpress/core/Exception.hpp"

namespace sheetpress {
namespace core {

RecordStream::RecordStream(RowStream rows)
    : rows_(std::move(rows)) {
    if (!rows_.next(header_)) {
        SHEETPRESS_THROW(EmptyTableException, "Row sequence is empty, no header row");
    }
}

bool RecordStream::next(Record& record) {
    if (!rows_.next(row_)) {
        return false;
    }
    record = TableProjector::zipRow(header_, row_);
    return true;
}

}} // namespace sheetpress::core
