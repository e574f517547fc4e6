#include "sheetpress/core/ErrorCode.hpp"

namespace sheetpress {
namespace core {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileAccessDenied: return "FileAccessDenied";
        case ErrorCode::FileWriteError: return "FileWriteError";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::DirectoryCreationConflict: return "DirectoryCreationConflict";
        case ErrorCode::NotAnArchive: return "NotAnArchive";
        case ErrorCode::MissingEntry: return "MissingEntry";
        case ErrorCode::InvalidWorksheet: return "InvalidWorksheet";
        case ErrorCode::MalformedReference: return "MalformedReference";
        case ErrorCode::CellOutOfRange: return "CellOutOfRange";
        case ErrorCode::InvalidSharedStringIndex: return "InvalidSharedStringIndex";
        case ErrorCode::EmptyTable: return "EmptyTable";
        case ErrorCode::XmlParseError: return "XmlParseError";
    }
    return "Unknown";
}

}} // namespace sheetpress::core
