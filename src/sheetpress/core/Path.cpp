#include "sheetpress/core/Path.hpp"
#include "sheetpress/utils/Logger.hpp"
#include <system_error>

#ifdef _WIN32
#include <utf8.h>
#endif

namespace sheetpress {
namespace core {

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : Path(std::string(path ? path : "")) {}

#ifdef _WIN32
std::wstring Path::getWidePath() const {
    std::wstring result;
    utf8::utf8to16(utf8_path_.begin(), utf8_path_.end(), std::back_inserter(result));
    return result;
}
#endif

std::filesystem::path Path::native() const {
#ifdef _WIN32
    return std::filesystem::path(getWidePath());
#else
    return std::filesystem::path(utf8_path_);
#endif
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::exists(native(), ec);
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::is_regular_file(native(), ec);
}

bool Path::isDirectory() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::is_directory(native(), ec);
}

std::string Path::filename() const {
    size_t pos = utf8_path_.find_last_of("/\\");
    return pos == std::string::npos ? utf8_path_ : utf8_path_.substr(pos + 1);
}

std::string Path::stem() const {
    std::string name = filename();
    size_t dot = name.find_last_of('.');
    // ".hidden" 这种以点开头的名字整体作为stem
    if (dot == std::string::npos || dot == 0) {
        return name;
    }
    return name.substr(0, dot);
}

Path Path::parent() const {
    size_t pos = utf8_path_.find_last_of("/\\");
    if (pos == std::string::npos) {
        return Path(".");
    }
    if (pos == 0) {
        return Path(utf8_path_.substr(0, 1));
    }
    return Path(utf8_path_.substr(0, pos));
}

Path Path::operator/(const std::string& child) const {
    if (utf8_path_.empty()) {
        return Path(child);
    }
    char last = utf8_path_.back();
    if (last == '/' || last == '\\') {
        return Path(utf8_path_ + child);
    }
    return Path(utf8_path_ + "/" + child);
}

bool Path::createDirectories() const {
    if (utf8_path_.empty()) return false;
    if (isDirectory()) return true;

    std::error_code ec;
    std::filesystem::create_directories(native(), ec);
    if (ec) {
        SHEETPRESS_LOG_DEBUG("Failed to create directory '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return isDirectory();
}

}} // namespace sheetpress::core
