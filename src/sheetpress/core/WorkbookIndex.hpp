#pragma once

#include "sheetpress/core/WorkbookTypes.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <unordered_map>

namespace sheetpress {
namespace archive { class ZipReader; }

namespace core {

/**
 * @brief 工作表声明：关系ID（"rId3" 中的 3）与显示名称
 */
struct SheetEntry {
    int rel_id = 0;
    std::string name;
};

/**
 * @brief 工作簿索引：关系ID -> 工作表名称，保持首次声明的顺序
 *
 * 另外记录 workbook.xml.rels 中关系ID指向的工作表条目，
 * 用于把 xl/worksheets/sheetN.xml 对应回它的声明。
 */
class WorkbookIndex {
public:
    WorkbookIndex() = default;

    /**
     * @brief 从包中读取清单和关系文件
     *
     * 两个条目都可以缺失：缺清单时索引为空，缺关系文件时用条目名的数字后缀作为关系ID。
     */
    static WorkbookIndex load(archive::ZipReader& reader, const WorkbookOptions& options);

    /**
     * @brief 登记一条声明；重复的ID保留首次位置，名称以最后一次为准
     */
    void addSheet(int rel_id, const std::string& name);

    /**
     * @brief 登记关系目标，entry_path 为包内完整路径
     */
    void addTarget(const std::string& entry_path, int rel_id);

    const std::vector<SheetEntry>& sheets() const { return sheets_; }
    bool empty() const { return sheets_.empty(); }

    std::optional<std::string> declaredName(int rel_id) const;

    /**
     * @brief 工作表条目对应的关系ID；没有关系文件时取条目名的数字后缀
     */
    std::optional<int> relationshipIdFor(const std::string& entry_path) const;

    /**
     * @brief 工作表显示名称
     *
     * 能找到声明时为 "{id:02d}-{name}"，否则为条目名去掉扩展名（例如 "sheet1"）。
     */
    std::string sheetNameFor(const std::string& entry_path) const;

    /**
     * @brief "rId12" -> 12；前缀不是 rId 或数字部分非法时为空
     */
    static std::optional<int> parseRelationshipId(std::string_view rel_id);

    /**
     * @brief "xl/worksheets/sheet3.xml" -> "sheet3"
     */
    static std::string entryStem(std::string_view entry_path);

    /**
     * @brief "sheet3" -> 3
     */
    static std::optional<int> stemNumber(std::string_view stem);

    /**
     * @brief 把关系文件中的 Target 解析成包内完整路径
     *
     * 相对路径以 xl/ 为基准，"/xl/..." 这种绝对路径去掉开头的斜杠。
     */
    static std::string resolveTarget(std::string_view target);

private:
    std::vector<SheetEntry> sheets_;
    std::unordered_map<int, size_t> id_index_;
    std::unordered_map<std::string, int> target_ids_;
};

}} // namespace sheetpress::core
