#include "sheetpress/core/SharedStringTable.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/archive/ZipReader.hpp"
#include "sheetpress/reader/SharedStringsParser.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace sheetpress {
namespace core {

SharedStringTable::SharedStringTable(std::vector<CellValue> strings)
    : strings_(std::move(strings)) {
}

SharedStringTable SharedStringTable::load(archive::ZipReader& reader, const std::string& entry_path) {
    if (!reader.hasEntry(entry_path)) {
        CORE_DEBUG("No shared strings entry '{}', using empty table", entry_path);
        return SharedStringTable();
    }

    std::string xml;
    auto err = reader.extractFile(entry_path, xml);
    if (archive::isError(err)) {
        SHEETPRESS_THROW(FileException,
                         fmt::format("Cannot read shared strings ({})", archive::toString(err)),
                         reader.getPath().string(), ErrorCode::FileReadError);
    }

    reader::SharedStringsParser parser;
    if (!parser.parse(xml)) {
        SHEETPRESS_THROW(XMLException, parser.getErrorMessage(), entry_path);
    }

    SharedStringTable table(parser.takeStrings());
    CORE_DEBUG("Loaded {} shared strings", table.size());
    return table;
}

const CellValue& SharedStringTable::at(size_t index) const {
    if (index >= strings_.size()) {
        SHEETPRESS_THROW(InvalidSharedStringIndexException, std::to_string(index), strings_.size());
    }
    return strings_[index];
}

const CellValue& SharedStringTable::resolve(std::string_view index_text) const {
    // 允许两侧空白，其余必须全是数字
    size_t begin = index_text.find_first_not_of(" \t\r\n");
    size_t end = index_text.find_last_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        SHEETPRESS_THROW(InvalidSharedStringIndexException, std::string(index_text), strings_.size());
    }
    std::string_view digits = index_text.substr(begin, end - begin + 1);

    size_t index = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            SHEETPRESS_THROW(InvalidSharedStringIndexException, std::string(index_text), strings_.size());
        }
        index = index * 10 + static_cast<size_t>(c - '0');
        if (index > strings_.size()) {
            // 已经越界，不必继续累加
            SHEETPRESS_THROW(InvalidSharedStringIndexException, std::string(index_text), strings_.size());
        }
    }
    return at(index);
}

}} // namespace sheetpress::core
