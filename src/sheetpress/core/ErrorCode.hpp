#pragma once

#include <cstdint>

namespace sheetpress {
namespace core {

/**
 * @brief SheetPress统一错误码
 *
 * 底层模块（archive/xml/reader）返回错误码，
 * 公共接口把错误码包装成异常抛给调用方。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileWriteError = 23,
    FileReadError = 24,
    DirectoryCreationConflict = 25,

    // 包结构错误 (40-59)
    NotAnArchive = 40,
    MissingEntry = 41,
    InvalidWorksheet = 42,

    // 单元格与表格错误 (60-79)
    MalformedReference = 60,
    CellOutOfRange = 61,
    InvalidSharedStringIndex = 62,
    EmptyTable = 63,

    // XML处理错误 (80-89)
    XmlParseError = 80
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

}} // namespace sheetpress::core
