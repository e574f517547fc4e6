/**
 * @file CellReference.cpp
 * @brief 单元格引用编解码实现
 */

#include "sheetpress/core/CellReference.hpp"
#include "sheetpress/core/Exception.hpp"
#include <algorithm>

namespace sheetpress {
namespace core {

namespace {

inline bool isAsciiLetter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

inline bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

uint32_t CellReference::decodeColumn(std::string_view letters) {
    if (letters.empty()) {
        SHEETPRESS_THROW(MalformedReferenceException, std::string(letters), "empty column");
    }

    uint32_t value = 0;
    for (char c : letters) {
        if (!isAsciiLetter(c)) {
            SHEETPRESS_THROW(MalformedReferenceException, std::string(letters), "column must be letters only");
        }
        uint32_t digit = static_cast<uint32_t>((c | 0x20) - 'a' + 1);
        value = value * 26 + digit;
        if (value > MAX_COLUMNS) {
            SHEETPRESS_THROW(MalformedReferenceException, std::string(letters), "column past XFD");
        }
    }
    return value - 1;
}

std::string CellReference::encodeColumn(uint32_t index) {
    std::string result;
    uint64_t n = static_cast<uint64_t>(index) + 1;
    while (n > 0) {
        uint64_t rem = (n - 1) % 26;
        result.push_back(static_cast<char>('A' + rem));
        n = (n - 1) / 26;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

size_t CellReference::splitLetters(std::string_view ref) {
    size_t pos = 0;
    while (pos < ref.size() && isAsciiLetter(ref[pos])) {
        ++pos;
    }
    return pos;
}

uint32_t CellReference::decodeRow(std::string_view digits, std::string_view ref) {
    if (digits.empty()) {
        SHEETPRESS_THROW(MalformedReferenceException, std::string(ref), "missing row digits");
    }

    uint64_t row = 0;
    for (char c : digits) {
        if (!isAsciiDigit(c)) {
            SHEETPRESS_THROW(MalformedReferenceException, std::string(ref), "letters and digits interleaved");
        }
        row = row * 10 + static_cast<uint64_t>(c - '0');
        if (row > MAX_ROWS) {
            SHEETPRESS_THROW(MalformedReferenceException, std::string(ref), "row past 1048576");
        }
    }
    if (row == 0) {
        SHEETPRESS_THROW(MalformedReferenceException, std::string(ref), "row numbers start at 1");
    }
    return static_cast<uint32_t>(row - 1);
}

CellCoordinate CellReference::decodeCell(std::string_view ref, ColumnCache* cache) {
    size_t split = splitLetters(ref);
    if (split == 0) {
        SHEETPRESS_THROW(MalformedReferenceException, std::string(ref), "missing column letters");
    }

    std::string_view letters = ref.substr(0, split);
    CellCoordinate coord;
    coord.row = decodeRow(ref.substr(split), ref);
    coord.col = cache ? cache->decode(letters) : decodeColumn(letters);
    return coord;
}

std::string CellReference::encodeCell(const CellCoordinate& coord) {
    return encodeColumn(coord.col) + std::to_string(static_cast<uint64_t>(coord.row) + 1);
}

TableShape CellReference::shapeFromRange(std::string_view range) {
    size_t colon = range.find(':');
    std::string_view bottom_right = colon == std::string_view::npos ? range : range.substr(colon + 1);

    if (colon != std::string_view::npos) {
        // 左上角只做格式校验
        decodeCell(range.substr(0, colon));
    }

    CellCoordinate br = decodeCell(bottom_right);
    return TableShape{br.col + 1, br.row + 1};
}

uint32_t ColumnCache::decode(std::string_view letters) {
    std::string key(letters);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }
    uint32_t col = CellReference::decodeColumn(letters);
    cache_.emplace(std::move(key), col);
    return col;
}

}} // namespace sheetpress::core
