#pragma once

#include "sheetpress/core/WorkbookTypes.hpp"
#include "sheetpress/core/RecordStream.hpp"
#include <vector>

namespace sheetpress {
namespace core {

/**
 * @brief 把行序列投影成以表头为键的记录
 *
 * 不检查表头是否重复；行与表头长度不同时按较短者截断。
 */
class TableProjector {
public:
    static Record zipRow(const Row& header, const Row& row);

    static RecordStream toRecords(RowStream rows);

    /**
     * @throws EmptyTableException 表格没有任何行
     */
    static std::vector<Record> toRecords(const Table& table);
};

}} // namespace sheetpress::core
