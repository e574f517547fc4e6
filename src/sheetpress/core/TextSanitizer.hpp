#pragma once

#include <string>

namespace sheetpress {
namespace core {

/**
 * @brief 单元格文本规整
 *
 * 去掉首尾空白，按换行类字符切分，丢弃空片段，再用单个空格连接。
 * 换行类字符包括 \n \r \v \f \x1c-\x1e 以及 U+0085 U+2028 U+2029；
 * "\r\n" 视为一次换行。多次调用结果不变。
 */
class TextSanitizer {
public:
    static std::string sanitize(const std::string& text);

    static bool isLineBreak(char32_t cp);
    static bool isWhitespace(char32_t cp);
};

}} // namespace sheetpress::core
