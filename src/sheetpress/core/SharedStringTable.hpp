#pragma once

#include "sheetpress/core/WorkbookTypes.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

namespace sheetpress {
namespace archive { class ZipReader; }

namespace core {

/**
 * @brief 只读共享字符串表，下标即共享字符串ID
 */
class SharedStringTable {
public:
    SharedStringTable() = default;
    explicit SharedStringTable(std::vector<CellValue> strings);

    /**
     * @brief 从包中读取共享字符串表
     *
     * 条目不存在时返回空表；条目存在但无法读取或不是合法XML时抛出异常。
     * @param reader 已打开的归档
     * @param entry_path 共享字符串条目路径
     */
    static SharedStringTable load(archive::ZipReader& reader, const std::string& entry_path);

    /**
     * @brief 按下标取值
     * @throws InvalidSharedStringIndexException 下标越界
     */
    const CellValue& at(size_t index) const;

    /**
     * @brief 按单元格中的索引文本取值，例如 "12"
     * @throws InvalidSharedStringIndexException 不是非负整数或越界
     */
    const CellValue& resolve(std::string_view index_text) const;

    size_t size() const { return strings_.size(); }
    bool empty() const { return strings_.empty(); }

private:
    std::vector<CellValue> strings_;
};

}} // namespace sheetpress::core
