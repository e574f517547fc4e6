#pragma once

#include "sheetpress/core/WorkbookTypes.hpp"
#include "sheetpress/core/CellReference.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

namespace sheetpress {
namespace core {

class Worksheet;

/**
 * @brief 按行拉取工作表内容
 *
 * 只维护一行缓冲。遇到属于后面行的单元格时输出当前行，
 * 单元格用尽后把剩余行（直到 height）全部输出，没有单元格的行输出为全空行。
 * 因此总共输出 height 行，与 Worksheet::materialize() 的结果逐格一致。
 *
 * 要求单元格按行先后出现；回到更早的行会抛出 WorksheetException。
 * RowStream 引用所属的 Worksheet，不能比它活得更久。
 */
class RowStream {
public:
    /**
     * @brief 取下一行
     * @param row 输出，长度等于工作表宽度
     * @return 没有更多行时返回false
     */
    bool next(Row& row);

    TableShape shape() const { return shape_; }

    /**
     * @brief 已经输出的行数
     */
    size_t rowsEmitted() const { return next_row_; }

private:
    friend class Worksheet;
    explicit RowStream(const Worksheet& sheet);

    // 解码下一个单元格到 pending_，没有更多单元格时返回false
    bool fetchPending();

    const Worksheet* sheet_;
    TableShape shape_;
    size_t cell_index_ = 0;
    uint32_t next_row_ = 0;
    Row buffer_;
    std::optional<CellCoordinate> last_coord_;
    std::optional<std::pair<CellCoordinate, CellValue>> pending_;
};

}} // namespace sheetpress::core
