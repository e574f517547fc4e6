/**
 * @file Exception.hpp
 * @brief SheetPress异常类定义
 */

#ifndef SHEETPRESS_EXCEPTION_HPP
#define SHEETPRESS_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <cstddef>
#include "sheetpress/core/ErrorCode.hpp"

namespace sheetpress {
namespace core {

/**
 * @brief SheetPress基础异常类
 */
class SheetPressException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    SheetPressException(const std::string& message,
                        ErrorCode code = ErrorCode::InternalError,
                        const char* file = nullptr,
                        int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return toString(error_code_); }

    /**
     * @brief 获取详细错误信息（错误码、位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public SheetPressException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 输入文件不是合法的ZIP/OPC包
 */
class NotAnArchiveException : public FileException {
public:
    explicit NotAnArchiveException(const std::string& filename,
                                   const char* file = nullptr, int line = 0);
};

/**
 * @brief 包内缺少必需的条目（例如工作表本身）
 */
class MissingEntryException : public SheetPressException {
public:
    explicit MissingEntryException(const std::string& entry,
                                   const char* file = nullptr, int line = 0);

    const std::string& getEntry() const { return entry_; }

private:
    std::string entry_;
};

/**
 * @brief 单元格引用无法解码
 */
class MalformedReferenceException : public SheetPressException {
public:
    MalformedReferenceException(const std::string& reference, const std::string& reason,
                                const char* file = nullptr, int line = 0);

    const std::string& getReference() const { return reference_; }

private:
    std::string reference_;
};

/**
 * @brief 单元格落在工作表声明的范围之外
 */
class CellException : public SheetPressException {
public:
    CellException(const std::string& message,
                  int row = -1, int col = -1,
                  const char* file = nullptr, int line = 0);

    int getRow() const { return row_; }
    int getCol() const { return col_; }

private:
    int row_;
    int col_;
};

/**
 * @brief 共享字符串索引越界或不是整数
 */
class InvalidSharedStringIndexException : public SheetPressException {
public:
    InvalidSharedStringIndexException(const std::string& index_text, size_t table_size,
                                      const char* file = nullptr, int line = 0);

    const std::string& getIndexText() const { return index_text_; }
    size_t getTableSize() const { return table_size_; }

private:
    std::string index_text_;
    size_t table_size_;
};

/**
 * @brief 没有表头行，无法投影出记录
 */
class EmptyTableException : public SheetPressException {
public:
    explicit EmptyTableException(const std::string& message,
                                 const char* file = nullptr, int line = 0);
};

/**
 * @brief 输出目录无法创建
 */
class DirectoryCreationException : public SheetPressException {
public:
    DirectoryCreationException(const std::string& message, const std::string& directory,
                               const char* file = nullptr, int line = 0);

    const std::string& getDirectory() const { return directory_; }

private:
    std::string directory_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public SheetPressException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }

private:
    std::string xml_path_;
};

/**
 * @brief 工作表相关异常
 */
class WorksheetException : public SheetPressException {
public:
    WorksheetException(const std::string& message,
                       const std::string& worksheet_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getWorksheetName() const { return worksheet_name_; }

private:
    std::string worksheet_name_;
};

} // namespace core
} // namespace sheetpress

// 便捷宏定义：自动带上抛出位置
#define SHEETPRESS_THROW(ExceptionType, ...) \
    throw ExceptionType(__VA_ARGS__, __FILE__, __LINE__)

#define SHEETPRESS_THROW_IF(condition, ExceptionType, ...) \
    do { if (condition) { SHEETPRESS_THROW(ExceptionType, __VA_ARGS__); } } while(0)

#endif // SHEETPRESS_EXCEPTION_HPP
