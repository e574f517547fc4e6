/**
 * @file CellReference.hpp
 * @brief A1风格单元格引用与0基坐标之间的转换
 */

#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <cstdint>
#include <cstddef>

namespace sheetpress {
namespace core {

/**
 * @brief 0基坐标
 */
struct CellCoordinate {
    uint32_t col = 0;
    uint32_t row = 0;

    bool operator==(const CellCoordinate& other) const { return col == other.col && row == other.row; }
    bool operator!=(const CellCoordinate& other) const { return !(*this == other); }
};

/**
 * @brief 表格尺寸，宽高都是开区间上界
 */
struct TableShape {
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const TableShape& other) const { return width == other.width && height == other.height; }
    bool operator!=(const TableShape& other) const { return !(*this == other); }

    bool contains(const CellCoordinate& c) const { return c.col < width && c.row < height; }
    bool empty() const { return width == 0 || height == 0; }
};

class ColumnCache;

/**
 * @brief 单元格引用编解码
 *
 * 列字母是双射26进制（A=1 ... Z=26, AA=27），结果减一得到0基列号；
 * 行号直接减一。所有非法输入抛出 MalformedReferenceException。
 */
class CellReference {
public:
    static constexpr uint32_t MAX_COLUMNS = 16384;     // XFD
    static constexpr uint32_t MAX_ROWS = 1048576;

    /**
     * @brief 列字母 -> 0基列号，大小写不敏感
     */
    static uint32_t decodeColumn(std::string_view letters);

    /**
     * @brief 0基列号 -> 列字母（大写）
     */
    static std::string encodeColumn(uint32_t index);

    /**
     * @brief "B3" -> {col=1, row=2}
     * @param cache 可选的列解码缓存
     */
    static CellCoordinate decodeCell(std::string_view ref, ColumnCache* cache = nullptr);

    static std::string encodeCell(const CellCoordinate& coord);

    /**
     * @brief "A1:C4" -> {width=3, height=4}
     *
     * 左上角固定视为A1。只有一个引用（空表的 "A1"）时按该引用计算。
     */
    static TableShape shapeFromRange(std::string_view range);

private:
    static size_t splitLetters(std::string_view ref);
    static uint32_t decodeRow(std::string_view digits, std::string_view ref);
};

/**
 * @brief 单个工作表内的列解码缓存
 *
 * 同一列的字母在一个工作表中会重复出现很多次，缓存后只解码一次。
 */
class ColumnCache {
public:
    uint32_t decode(std::string_view letters);

    size_t size() const { return cache_.size(); }
    void clear() { cache_.clear(); }

private:
    std::unordered_map<std::string, uint32_t> cache_;
};

}} // namespace sheetpress::core
