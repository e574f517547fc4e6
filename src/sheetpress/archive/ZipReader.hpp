#pragma once

#include "sheetpress/core/Path.hpp"
#include "sheetpress/archive/ZipError.hpp"
#include <string>
#include <vector>
#include <string_view>
#include <mutex>
#include <cstdint>

namespace sheetpress {
namespace archive {

/**
 * @brief 只读ZIP访问器，基于minizip-ng
 *
 * 特性：
 * - RAII：析构时自动关闭句柄
 * - 条目列表按中央目录顺序缓存
 * - 线程安全（内部互斥）
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        bool is_directory = false;
    };

    explicit ZipReader(const core::Path& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * 打开ZIP文件进行读取
     * @return 文件不存在、不可读或不是ZIP容器时返回false
     */
    bool open();

    /**
     * 关闭ZIP文件，可重复调用
     */
    void close();

    bool isOpen() const { return is_open_; }

    /**
     * 获取所有文件条目（不含目录），保持归档中的顺序
     */
    std::vector<std::string> listFiles() const;

    /**
     * 获取所有条目的详细信息
     */
    std::vector<EntryInfo> listEntriesInfo() const;

    /**
     * 条目是否存在
     * @param internal_path ZIP内部路径，区分大小写
     */
    bool hasEntry(std::string_view internal_path) const;

    /**
     * 提取条目到字符串
     * @param internal_path ZIP内部路径
     * @param content 输出内容
     * @return 错误码
     */
    ZipError extractFile(std::string_view internal_path, std::string& content);

    const core::Path& getPath() const { return filepath_; }

private:
    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;
    mutable std::mutex mutex_;

    std::vector<EntryInfo> entries_;

    void cleanup();
    void buildEntryList();
};

}} // namespace sheetpress::archive
