/**
 * @file Exception.cpp
 * @brief SheetPress异常类实现
 */

#include "sheetpress/core/Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace sheetpress {
namespace core {

SheetPressException::SheetPressException(const std::string& message,
                                         ErrorCode code,
                                         const char* file,
                                         int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string SheetPressException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void SheetPressException::addContext(const std::string& context) {
    context_.push_back(context);
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : SheetPressException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

NotAnArchiveException::NotAnArchiveException(const std::string& filename,
                                             const char* file, int line)
    : FileException("Not a valid Excel 2007+ package", filename,
                    ErrorCode::NotAnArchive, file, line) {
}

MissingEntryException::MissingEntryException(const std::string& entry,
                                             const char* file, int line)
    : SheetPressException(fmt::format("Package entry not found: {}", entry),
                          ErrorCode::MissingEntry, file, line)
    , entry_(entry) {
}

MalformedReferenceException::MalformedReferenceException(const std::string& reference,
                                                         const std::string& reason,
                                                         const char* file, int line)
    : SheetPressException(fmt::format("Malformed cell reference '{}': {}", reference, reason),
                          ErrorCode::MalformedReference, file, line)
    , reference_(reference) {
}

CellException::CellException(const std::string& message, int row, int col,
                             const char* file, int line)
    : SheetPressException(fmt::format("{} (row: {}, col: {})", message, row, col),
                          ErrorCode::CellOutOfRange, file, line)
    , row_(row)
    , col_(col) {
}

InvalidSharedStringIndexException::InvalidSharedStringIndexException(const std::string& index_text,
                                                                     size_t table_size,
                                                                     const char* file, int line)
    : SheetPressException(fmt::format("Invalid shared string index '{}' (table size: {})",
                                      index_text, table_size),
                          ErrorCode::InvalidSharedStringIndex, file, line)
    , index_text_(index_text)
    , table_size_(table_size) {
}

EmptyTableException::EmptyTableException(const std::string& message, const char* file, int line)
    : SheetPressException(message, ErrorCode::EmptyTable, file, line) {
}

DirectoryCreationException::DirectoryCreationException(const std::string& message,
                                                       const std::string& directory,
                                                       const char* file, int line)
    : SheetPressException(fmt::format("{} (directory: {})", message, directory),
                          ErrorCode::DirectoryCreationConflict, file, line)
    , directory_(directory) {
}

XMLException::XMLException(const std::string& message, const std::string& xml_path,
                           const char* file, int line)
    : SheetPressException(xml_path.empty() ? message : fmt::format("{} (part: {})", message, xml_path),
                          ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path) {
}

WorksheetException::WorksheetException(const std::string& message,
                                       const std::string& worksheet_name,
                                       const char* file, int line)
    : SheetPressException(fmt::format("{} (worksheet: {})", message, worksheet_name),
                          ErrorCode::InvalidWorksheet, file, line)
    , worksheet_name_(worksheet_name) {
}

} // namespace core
} // namespace sheetpress
