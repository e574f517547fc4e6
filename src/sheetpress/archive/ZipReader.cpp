#include "sheetpress/archive/ZipReader.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <algorithm>
#include <array>
#include <climits>

namespace sheetpress {
namespace archive {

ZipReader::ZipReader(const core::Path& path)
    : filepath_(path) {
}

ZipReader::~ZipReader() {
    cleanup();
}

bool ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();

    if (!filepath_.isFile()) {
        ARCHIVE_DEBUG("Not a regular file: {}", filepath_.string());
        return false;
    }

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return false;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_DEBUG("Failed to open zip file for reading: {}, error: {}", filepath_.string(), result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return false;
    }

    is_open_ = true;
    buildEntryList();
    ARCHIVE_DEBUG("Zip archive opened for reading: {} ({} entries)", filepath_.string(), entries_.size());
    return true;
}

void ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
}

std::vector<std::string> ZipReader::listFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    files.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (!entry.is_directory) {
            files.push_back(entry.path);
        }
    }
    return files;
}

std::vector<ZipReader::EntryInfo> ZipReader::listEntriesInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool ZipReader::hasEntry(std::string_view internal_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const EntryInfo& e) { return e.path == internal_path; });
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    std::string path_str(internal_path);
    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0) != MZ_OK) {
        ARCHIVE_DEBUG("File {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }

    mz_zip_file* info = nullptr;
    if (mz_zip_reader_entry_get_info(unzip_handle_, &info) != MZ_OK || !info) {
        return ZipError::BadFormat;
    }

    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }

    // 分块读取，不信任头部记录的大小
    content.clear();
    if (info->uncompressed_size > 0 && info->uncompressed_size < static_cast<uint64_t>(INT32_MAX)) {
        content.reserve(static_cast<size_t>(info->uncompressed_size));
    }

    constexpr size_t BUFFER_SIZE = 64 * 1024;
    std::array<char, BUFFER_SIZE> buffer;
    int32_t bytes_read = 0;
    do {
        bytes_read = mz_zip_reader_entry_read(unzip_handle_, buffer.data(),
                                              static_cast<int32_t>(buffer.size()));
        if (bytes_read > 0) {
            content.append(buffer.data(), static_cast<size_t>(bytes_read));
        }
    } while (bytes_read > 0);

    mz_zip_reader_entry_close(unzip_handle_);

    if (bytes_read < 0) {
        ARCHIVE_ERROR("Failed to read entry {}, error: {}", internal_path, bytes_read);
        content.clear();
        return ZipError::IoFail;
    }

    SHEETPRESS_LOG_ZIP_ENTRY("Extracted file {} from zip, size: {} bytes", internal_path, content.size());
    return ZipError::Ok;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entries_.clear();
}

void ZipReader::buildEntryList() {
    entries_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info) {
            if (file_info->filename && file_info->filename[0] != '\0') {
                EntryInfo info;
                info.path = file_info->filename;
                info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
                info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
                info.is_directory = (info.path.back() == '/');
                entries_.push_back(std::move(info));
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);
}

}} // namespace sheetpress::archive
