#include "sheetpress/core/TableProjector.hpp"
#include "sheetpress/core/Exception.hpp"
#include <algorithm>

namespace sheetpress {
namespace core {

Record TableProjector::zipRow(const Row& header, const Row& row) {
    size_t n = std::min(header.size(), row.size());
    Record record;
    record.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        record.emplace_back(header[i], row[i]);
    }
    return record;
}

RecordStream TableProjector::toRecords(RowStream rows) {
    return RecordStream(std::move(rows));
}

std::vector<Record> TableProjector::toRecords(const Table& table) {
    if (table.empty()) {
        SHEETPRESS_THROW(EmptyTableException, "Table has no header row");
    }

    std::vector<Record> records;
    records.reserve(table.size() - 1);
    for (size_t i = 1; i < table.size(); ++i) {
        records.push_back(zipRow(table.front(), table[i]));
    }
    return records;
}

}} // namespace sheetpress::core
