#pragma once

#include "support/ZipWriter.hpp"
#include "sheetpress/core/Path.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace sheetpress {
namespace test {

constexpr const char* kMainNs = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
constexpr const char* kRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";

// 在磁盘上即时生成一个xlsx包
class TestPackage {
public:
    TestPackage& add(const std::string& entry, const std::string& content) {
        entries_.emplace_back(entry, content);
        return *this;
    }

    void writeTo(const std::string& path) const {
        archive::ZipWriter writer{core::Path(path)};
        ASSERT_TRUE(writer.open()) << path;
        for (const auto& entry : entries_) {
            ASSERT_TRUE(archive::isSuccess(writer.addFile(entry.first, entry.second))) << entry.first;
        }
        ASSERT_TRUE(writer.close());
    }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

inline std::string worksheetXml(const std::string& dimension, const std::string& sheet_data) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
    xml += std::string("<worksheet xmlns=\"") + kMainNs + "\" xmlns:r=\"" + kRelNs + "\">";
    if (!dimension.empty()) {
        xml += "<dimension ref=\"" + dimension + "\"/>";
    }
    xml += "<sheetData>" + sheet_data + "</sheetData></worksheet>";
    return xml;
}

inline std::string sharedStringsXml(const std::vector<std::string>& strings) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
    xml += std::string("<sst xmlns=\"") + kMainNs + "\" count=\"" + std::to_string(strings.size()) +
           "\" uniqueCount=\"" + std::to_string(strings.size()) + "\">";
    for (const auto& s : strings) {
        xml += "<si><t>" + s + "</t></si>";
    }
    xml += "</sst>";
    return xml;
}

// names[i] 对应 rId(i+1) 和 worksheets/sheet(i+1).xml
inline std::string workbookXml(const std::vector<std::string>& names) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
    xml += std::string("<workbook xmlns=\"") + kMainNs + "\" xmlns:r=\"" + kRelNs + "\"><sheets>";
    for (size_t i = 0; i < names.size(); ++i) {
        std::string id = std::to_string(i + 1);
        xml += "<sheet name=\"" + names[i] + "\" sheetId=\"" + id + "\" r:id=\"rId" + id + "\"/>";
    }
    xml += "</sheets></workbook>";
    return xml;
}

inline std::string relationshipsXml(const std::vector<std::pair<std::string, std::string>>& id_targets) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
    xml += "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
    for (const auto& rel : id_targets) {
        xml += "<Relationship Id=\"" + rel.first +
               "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\""
               " Target=\"" + rel.second + "\"/>";
    }
    xml += "</Relationships>";
    return xml;
}

// 测试用临时目录，析构时删除
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("sheetpress_" + name)) {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    std::string string() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}} // namespace sheetpress::test
