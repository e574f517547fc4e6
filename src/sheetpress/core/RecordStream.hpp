#pragma once

#include "sheetpress/core/WorkbookTypes.hpp"
#include "sheetpress/core/RowStream.hpp"

namespace sheetpress {
namespace core {

/**
 * @brief 逐条拉取记录：第一行作为表头，其余每行与表头按位置配对
 */
class RecordStream {
public:
    /**
     * @brief 立即拉取表头
     * @throws EmptyTableException 行序列为空
     */
    explicit RecordStream(RowStream rows);

    bool next(Record& record);

    const Row& header() const { return header_; }

private:
    RowStream rows_;
    Row header_;
    Row row_;
};

}} // namespace sheetpress::core
