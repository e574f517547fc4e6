#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <cstddef>
#include <expat.h>
#include "sheetpress/core/span.hpp"

namespace sheetpress {
namespace xml {

using core::span;

/**
 * @brief 流式XML解析器，基于libexpat
 *
 * 事件驱动：开始元素、结束元素、文本三类回调。
 * 元素文本在对应的结束元素之前一次性回调，实体已由expat解码。
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败（XML格式错误）
    MemoryError,           // 内存错误
    CallbackError          // 回调函数抛出异常
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// XML属性（直接引用expat缓冲区，仅在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, span<const XMLAttribute> attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    // 回调函数设置
    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);
    void setErrorCallback(ErrorCallback callback);

    // 解析选项设置
    void setTrimWhitespace(bool trim) { trim_whitespace_ = trim; }
    void setCollectText(bool collect) { collect_text_ = collect; }

    // 一次性解析
    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    // 流式解析支持
    XMLParseError beginParsing();
    XMLParseError feedData(const char* data, size_t size);
    XMLParseError endParsing();

    // 状态查询
    bool isParsing() const { return is_parsing_; }
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    size_t getBytesParsed() const { return bytes_parsed_; }
    size_t getElementsParsed() const { return elements_parsed_; }
    int getCurrentLineNumber() const;
    int getCurrentColumnNumber() const;

private:
    XML_Parser parser_ = nullptr;

    bool is_parsing_ = false;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    // 属性缓存池，每个开始元素复用
    std::vector<XMLAttribute> attribute_pool_;

    std::string current_text_;
    bool collecting_text_ = false;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    ErrorCallback error_callback_;

    bool trim_whitespace_ = true;
    bool collect_text_ = true;

    size_t bytes_parsed_ = 0;
    size_t elements_parsed_ = 0;

    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    XMLParseError parseChunk(const char* chunk, size_t size, bool is_final);
    span<const XMLAttribute> parseAttributes(const XML_Char** attrs);
    static std::string_view trimStringView(std::string_view str);
    void handleError(XMLParseError error, const std::string& message);
    void abortFromCallback(const char* where, const std::exception& e);
};

}} // namespace sheetpress::xml
