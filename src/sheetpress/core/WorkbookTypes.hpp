#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace sheetpress {
namespace core {

/**
 * @file WorkbookTypes.hpp
 * @brief 提取结果相关的类型定义与工作簿选项
 */

// 单元格值：文本或空值，不做数字/日期解码
using CellValue = std::optional<std::string>;

// 一行，长度恰好等于工作表宽度
using Row = std::vector<CellValue>;

// 行优先的稠密表格
using Table = std::vector<Row>;

// 一条记录：按表头顺序排列的 (字段, 值)；字段本身也可能为空值
using Field = std::pair<CellValue, CellValue>;
using Record = std::vector<Field>;

/**
 * @brief 工作簿选项配置结构体
 */
struct WorkbookOptions {
    bool sanitize = true;                                      // 规整文本（去首尾空白、换行变空格）

    // 包内条目位置
    std::string worksheet_prefix = "xl/worksheets/sheet";      // 工作表条目前缀
    std::string shared_strings_path = "xl/sharedStrings.xml";
    std::string workbook_path = "xl/workbook.xml";
    std::string relationships_path = "xl/_rels/workbook.xml.rels";
};

}} // namespace sheetpress::core
