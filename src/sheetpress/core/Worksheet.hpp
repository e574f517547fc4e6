#pragma once

#include "sheetpress/core/WorkbookTypes.hpp"
#include "sheetpress/core/CellReference.hpp"
#include "sheetpress/core/RowStream.hpp"
#include "sheetpress/reader/WorksheetParser.hpp"
#include <string>
#include <vector>
#include <optional>

namespace sheetpress {
namespace core {

class Workbook;

/**
 * @brief 一个工作表条目的提取器
 *
 * 构造时解析XML并确定尺寸（来自 <dimension ref>，缺失时取已有单元格的外接矩形），
 * 之后尺寸不再改变。单元格坐标和值在提取时才解码：
 * - materialize()：稠密表格，重复地址以最后一次为准，结果缓存
 * - rows()：逐行拉取，见 RowStream
 *
 * 落在尺寸之外的单元格抛出 CellException。
 */
class Worksheet {
public:
    /**
     * @param workbook 所属工作簿，提供共享字符串表和选项
     * @param entry_path 包内路径，如 "xl/worksheets/sheet1.xml"
     * @param name 显示名称
     * @param xml 条目内容
     */
    Worksheet(const Workbook& workbook, std::string entry_path, std::string name, const std::string& xml);

    Worksheet(const Worksheet&) = delete;
    Worksheet& operator=(const Worksheet&) = delete;

    const std::string& getName() const { return name_; }
    const std::string& getEntryPath() const { return entry_path_; }
    const Workbook& getWorkbook() const { return workbook_; }

    TableShape shape() const { return shape_; }
    uint32_t width() const { return shape_.width; }
    uint32_t height() const { return shape_.height; }

    /**
     * @brief 声明的尺寸字符串；缺失时为空
     */
    const std::optional<std::string>& declaredDimension() const { return dimension_; }

    size_t cellCount() const { return cells_.size(); }

    /**
     * @brief 已解码并缓存的不同列数，materialize() 与 rows() 共用同一缓存
     */
    size_t decodedColumnCount() const { return columns_.size(); }

    /**
     * @brief 稠密表格，height 行 × width 列，缺失单元格为空值
     */
    const Table& materialize() const;

    /**
     * @brief 逐行拉取
     */
    RowStream rows() const;

private:
    friend class RowStream;

    /**
     * @brief 计算单元格坐标
     * @param last 同一遍历中上一个单元格的坐标，用于省略r属性的单元格
     */
    CellCoordinate locate(const reader::RawCell& cell, const std::optional<CellCoordinate>& last) const;

    void checkBounds(const CellCoordinate& coord, const reader::RawCell& cell) const;

    CellValue resolveValue(const reader::RawCell& cell) const;

    TableShape boundingShape() const;

    const Workbook& workbook_;
    std::string entry_path_;
    std::string name_;
    std::optional<std::string> dimension_;
    std::vector<reader::RawCell> cells_;
    mutable ColumnCache columns_;
    TableShape shape_;

    mutable std::optional<Table> table_;
};

}} // namespace sheetpress::core
