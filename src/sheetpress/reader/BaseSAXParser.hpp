#pragma once

#include "sheetpress/xml/XMLStreamReader.hpp"
#include "sheetpress/utils/Logger.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>

namespace sheetpress {
namespace reader {

using core::span;

/**
 * @brief SAX解析器基类，为各个包内部件的解析器提供统一入口
 *
 * - 基于XMLStreamReader的事件回调
 * - 元素名按本地名比较（忽略 "x:" 之类的命名空间前缀）
 * - 文本原样保留，不裁剪空白
 */
class BaseSAXParser {
protected:
    struct ParseState {
        std::vector<std::string> element_stack;
        std::string current_text;
        bool collecting_text = false;
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_text.clear();
            collecting_text = false;
            has_error = false;
            error_message.clear();
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @param xml_content XML字符串内容
     * @return 是否解析成功
     */
    bool parseXML(const std::string& xml_content) {
        state_.reset();

        if (xml_content.empty()) {
            setError("Empty XML content");
            return false;
        }

        xml::XMLStreamReader reader;
        reader.setTrimWhitespace(false);

        reader.setStartElementCallback([this](std::string_view name, span<const xml::XMLAttribute> attributes, int depth) {
            handleStartElement(localName(name), attributes, depth);
        });
        reader.setEndElementCallback([this](std::string_view name, int depth) {
            handleEndElement(localName(name), depth);
        });
        reader.setTextCallback([this](std::string_view text, int depth) {
            handleText(text, depth);
        });

        auto result = reader.parseFromString(xml_content);
        if (xml::isError(result)) {
            state_.has_error = true;
            state_.error_message = reader.getLastErrorMessage();
            return false;
        }
        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

    /**
     * @brief 去掉命名空间前缀："x:row" -> "row"
     */
    static std::string_view localName(std::string_view name) {
        size_t colon = name.rfind(':');
        return colon == std::string_view::npos ? name : name.substr(colon + 1);
    }

protected:
    void handleStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) {
        state_.element_stack.emplace_back(name);
        onStartElement(name, attributes, depth);
    }

    void handleEndElement(std::string_view name, int depth) {
        onEndElement(name, depth);
        if (!state_.element_stack.empty()) {
            state_.element_stack.pop_back();
        }
    }

    void handleText(std::string_view text, int depth) {
        if (state_.collecting_text) {
            state_.current_text.append(text.data(), text.size());
        }
        onText(text, depth);
    }

    // 子类重写的虚函数
    virtual void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    /**
     * @brief 按完整名称查找属性
     */
    static std::optional<std::string> findAttribute(span<const xml::XMLAttribute> attributes, std::string_view name) {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return std::string(attr.value);
            }
        }
        return std::nullopt;
    }

    /**
     * @brief 查找带任意前缀的属性，例如 "r:id" 或 "ns3:id"
     */
    static std::optional<std::string> findPrefixedAttribute(span<const xml::XMLAttribute> attributes, std::string_view local) {
        for (const auto& attr : attributes) {
            size_t colon = attr.name.rfind(':');
            if (colon != std::string_view::npos && attr.name.substr(colon + 1) == local) {
                return std::string(attr.value);
            }
        }
        return std::nullopt;
    }

    static std::string getAttributeOr(span<const xml::XMLAttribute> attributes, std::string_view name,
                                      const std::string& default_value) {
        auto val = findAttribute(attributes, name);
        return val ? *val : default_value;
    }

    void startCollectingText() {
        state_.collecting_text = true;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
    }

    const std::string& getCurrentText() const { return state_.current_text; }

    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
        SHEETPRESS_LOG_ERROR("Parser Error: {}", message);
    }

    bool isInElement(std::string_view element_name) const {
        return std::find(state_.element_stack.begin(), state_.element_stack.end(), element_name)
               != state_.element_stack.end();
    }

    std::string getCurrentElement() const {
        return state_.element_stack.empty() ? std::string() : state_.element_stack.back();
    }
};

}} // namespace sheetpress::reader
