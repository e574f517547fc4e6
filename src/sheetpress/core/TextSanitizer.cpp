#include "sheetpress/core/TextSanitizer.hpp"
#include <utf8.h>
#include <iterator>
#include <vector>

namespace sheetpress {
namespace core {

bool TextSanitizer::isLineBreak(char32_t cp) {
    switch (cp) {
        case 0x0A: case 0x0B: case 0x0C: case 0x0D:
        case 0x1C: case 0x1D: case 0x1E:
        case 0x85:
        case 0x2028: case 0x2029:
            return true;
        default:
            return false;
    }
}

bool TextSanitizer::isWhitespace(char32_t cp) {
    if (cp == 0x20 || (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F)) return true;
    if (cp == 0x85 || cp == 0xA0 || cp == 0x1680) return true;
    if (cp >= 0x2000 && cp <= 0x200A) return true;
    return cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

std::string TextSanitizer::sanitize(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    // 非法UTF-8先替换成U+FFFD，避免解码时抛异常
    std::string valid;
    const std::string* source = &text;
    if (!utf8::is_valid(text.begin(), text.end())) {
        utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));
        source = &valid;
    }

    std::u32string cps;
    cps.reserve(source->size());
    utf8::utf8to32(source->begin(), source->end(), std::back_inserter(cps));

    size_t begin = 0;
    size_t end = cps.size();
    while (begin < end && isWhitespace(cps[begin])) ++begin;
    while (end > begin && isWhitespace(cps[end - 1])) --end;

    std::vector<std::u32string> segments;
    std::u32string current;
    for (size_t i = begin; i < end; ++i) {
        char32_t cp = cps[i];
        if (isLineBreak(cp)) {
            if (cp == 0x0D && i + 1 < end && cps[i + 1] == 0x0A) {
                ++i;
            }
            if (!current.empty()) {
                segments.push_back(std::move(current));
            }
            current.clear();
        } else {
            current.push_back(cp);
        }
    }
    if (!current.empty()) {
        segments.push_back(std::move(current));
    }

    std::string result;
    result.reserve(source->size());
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result.push_back(' ');
        }
        utf8::utf32to8(segments[i].begin(), segments[i].end(), std::back_inserter(result));
    }
    return result;
}

}} // namespace sheetpress::core
