#pragma once

#include "sheetpress/core/Path.hpp"
#include "sheetpress/core/WorkbookTypes.hpp"
#include "sheetpress/core/SharedStringTable.hpp"
#include "sheetpress/core/WorkbookIndex.hpp"
#include "sheetpress/core/Worksheet.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sheetpress {
namespace archive { class ZipReader; }

namespace core {

/**
 * @brief 只读工作簿
 *
 * 共享字符串表和工作簿索引各自最多加载一次（std::call_once），之后在对象生命周期内缓存。
 * 每次遍历都会打开一个ZipReader，遍历结束或抛出异常时自动关闭。
 */
class Workbook {
public:
    using WorksheetCallback = std::function<void(const Worksheet&)>;

    explicit Workbook(const Path& path, const WorkbookOptions& options = WorkbookOptions());

    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;

    const Path& getPath() const { return path_; }
    const WorkbookOptions& getOptions() const { return options_; }

    /**
     * @brief 按归档顺序访问每个工作表条目
     *
     * 在第一个工作表之前完成共享字符串表和索引的加载。
     * Worksheet 只在回调期间有效。
     * @return 访问过的工作表数量
     * @throws NotAnArchiveException 输入不是ZIP包
     * @throws FileException 输入文件不存在
     */
    size_t forEachWorksheet(const WorksheetCallback& callback) const;

    /**
     * @brief 读取指定的工作表条目
     * @throws MissingEntryException 条目不存在
     */
    std::unique_ptr<Worksheet> loadWorksheet(const std::string& entry_path) const;

    /**
     * @brief 所有工作表条目，按归档顺序
     */
    std::vector<std::string> getWorksheetEntries() const;

    /**
     * @brief 所有工作表的显示名称，按归档顺序
     */
    std::vector<std::string> getSheetNames() const;

    const SharedStringTable& sharedStrings() const;
    const WorkbookIndex& index() const;

    bool isWorksheetEntry(const std::string& entry_path) const;

private:
    std::unique_ptr<archive::ZipReader> openArchive() const;
    void ensureLoaded(archive::ZipReader& reader) const;
    std::vector<std::string> worksheetEntries(const archive::ZipReader& reader) const;
    std::unique_ptr<Worksheet> readWorksheet(archive::ZipReader& reader, const std::string& entry_path) const;

    Path path_;
    WorkbookOptions options_;

    mutable std::once_flag strings_once_;
    mutable std::once_flag index_once_;
    mutable SharedStringTable shared_strings_;
    mutable WorkbookIndex index_;
};

}} // namespace sheetpress::core
