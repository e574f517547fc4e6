#include "sheetpress/xml/XMLStreamReader.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <cstring>
#include <climits>
#include <fmt/format.h>

namespace sheetpress {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attribute_pool_.reserve(16);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    is_parsing_ = false;
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attribute_pool_.clear();
    current_text_.clear();
    collecting_text_ = false;
    bytes_parsed_ = 0;
    elements_parsed_ = 0;
}

void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

void XMLStreamReader::setErrorCallback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }

    XMLParseError result = beginParsing();
    if (isError(result)) {
        return result;
    }

    result = parseChunk(buffer, size, true);
    if (isSuccess(result)) {
        XML_DEBUG("Parsed {} bytes, {} elements", bytes_parsed_, elements_parsed_);
    }
    return result;
}

XMLParseError XMLStreamReader::beginParsing() {
    resetState();
    if (!initializeParser()) {
        return last_error_;
    }
    is_parsing_ = true;
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::feedData(const char* data, size_t size) {
    return parseChunk(data, size, false);
}

XMLParseError XMLStreamReader::endParsing() {
    return parseChunk(nullptr, 0, true);
}

XMLParseError XMLStreamReader::parseChunk(const char* chunk, size_t size, bool is_final) {
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Parser not initialized");
        return XMLParseError::ParserCreateFailed;
    }
    if (isError(last_error_)) {
        return last_error_;
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        handleError(XMLParseError::InvalidInput, "XML chunk too large");
        return XMLParseError::InvalidInput;
    }

    bytes_parsed_ += size;

    if (XML_Parse(parser_, chunk, static_cast<int>(size), is_final ? 1 : 0) == XML_STATUS_ERROR) {
        is_parsing_ = false;
        // 回调异常已经记录了更具体的错误
        if (last_error_ == XMLParseError::CallbackError) {
            return last_error_;
        }
        std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
            XML_GetCurrentLineNumber(parser_),
            XML_GetCurrentColumnNumber(parser_),
            XML_ErrorString(XML_GetErrorCode(parser_)));
        handleError(XMLParseError::ParseFailed, error_msg);
        return XMLParseError::ParseFailed;
    }

    if (is_final) {
        is_parsing_ = false;
    }
    return XMLParseError::Ok;
}

int XMLStreamReader::getCurrentLineNumber() const {
    return parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
}

int XMLStreamReader::getCurrentColumnNumber() const {
    return parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : -1;
}

void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;

    auto attributes = reader->parseAttributes(attrs);

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, attributes, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("Start element", e);
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
    reader->collecting_text_ = reader->collect_text_;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};

    if (reader->collecting_text_ && !reader->current_text_.empty()) {
        std::string_view text_content = reader->trim_whitespace_ ?
            trimStringView(reader->current_text_) : std::string_view{reader->current_text_};

        if (!text_content.empty() && reader->text_callback_) {
            try {
                reader->text_callback_(text_content, reader->current_depth_);
            } catch (const std::exception& e) {
                reader->abortFromCallback("Text", e);
            }
        }
    }

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("End element", e);
        }
    }

    reader->current_text_.clear();
    reader->collecting_text_ = reader->collect_text_;
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    if (reader->collecting_text_ && len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

span<const XMLAttribute> XMLStreamReader::parseAttributes(const XML_Char** attrs) {
    attribute_pool_.clear();

    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            if (attrs[i + 1]) {
                attribute_pool_.emplace_back(
                    std::string_view{attrs[i], std::strlen(attrs[i])},
                    std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
            }
        }
    }

    return span<const XMLAttribute>{attribute_pool_.data(), attribute_pool_.size()};
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;

    XML_ERROR("{}", message);

    if (error_callback_) {
        error_callback_(error, message, getCurrentLineNumber(), getCurrentColumnNumber());
    }
}

void XMLStreamReader::abortFromCallback(const char* where, const std::exception& e) {
    // 只记录第一个异常，随后停止解析
    if (last_error_ == XMLParseError::CallbackError) {
        return;
    }
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", where, e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

}} // namespace sheetpress::xml
