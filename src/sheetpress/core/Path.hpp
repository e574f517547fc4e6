#pragma once

#include <string>
#include <filesystem>

namespace sheetpress {
namespace core {

/**
 * @brief UTF-8路径封装
 *
 * 内部始终保存UTF-8字符串；Windows下通过utf8cpp转换成宽字符路径。
 */
class Path {
private:
    std::string utf8_path_;

public:
    Path() = default;
    explicit Path(const std::string& path);
    explicit Path(const char* path);

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    // 文件系统查询
    bool exists() const;
    bool isFile() const;
    bool isDirectory() const;

    /**
     * @brief 文件名（不含目录），例如 "data/book.xlsx" -> "book.xlsx"
     */
    std::string filename() const;

    /**
     * @brief 去掉最后一个扩展名的文件名，例如 "book.xlsx" -> "book"
     */
    std::string stem() const;

    /**
     * @brief 父目录；没有目录部分时返回 "."
     */
    Path parent() const;

    Path operator/(const std::string& child) const;

    /**
     * @brief 递归创建目录
     * @return 目录已存在或创建成功返回true
     */
    bool createDirectories() const;

    std::filesystem::path native() const;

#ifdef _WIN32
    std::wstring getWidePath() const;
#endif

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }
};

}} // namespace sheetpress::core
