#include "sheetpress/reader/SharedStringsParser.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cstdlib>

namespace sheetpress {
namespace reader {

namespace {
// 最短的条目 "<si/>"，uniqueCount 只是提示，预留量不超过内容能容纳的条目数
constexpr size_t kMinItemSize = 5;
}

void SharedStringsParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name == "si") {
        item_.start();
    } else if (name == "rPh") {
        item_.phonetic_depth++;
    } else if (name == "t") {
        if (item_.in_item && item_.phonetic_depth == 0) {
            item_.in_text = true;
            startCollectingText();
        }
    } else if (name == "sst") {
        auto unique = findAttribute(attributes, "uniqueCount");
        if (unique) {
            char* end = nullptr;
            unsigned long long value = std::strtoull(unique->c_str(), &end, 10);
            if (end && *end == '\0' && !unique->empty()) {
                declared_unique_count_ = static_cast<size_t>(value);
                strings_.reserve(std::min<unsigned long long>(value, content_size_ / kMinItemSize));
            }
        }
    }
}

void SharedStringsParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "t") {
        if (item_.in_text) {
            if (!getCurrentText().empty()) {
                item_.text += getCurrentText();
                item_.has_text = true;
            }
            item_.in_text = false;
            stopCollectingText();
        }
    } else if (name == "rPh") {
        if (item_.phonetic_depth > 0) {
            item_.phonetic_depth--;
        }
    } else if (name == "si") {
        if (item_.has_text) {
            strings_.emplace_back(std::move(item_.text));
        } else {
            strings_.emplace_back(std::nullopt);
        }
        item_.in_item = false;
        item_.text.clear();
    } else if (name == "sst") {
        if (declared_unique_count_ && *declared_unique_count_ != strings_.size()) {
            READER_DEBUG("Shared string count {} differs from declared uniqueCount {}",
                         strings_.size(), *declared_unique_count_);
        }
    }
}

std::vector<std::optional<std::string>> SharedStringsParser::takeStrings() {
    std::vector<std::optional<std::string>> result = std::move(strings_);
    clear();
    return result;
}

void SharedStringsParser::clear() {
    strings_.clear();
    declared_unique_count_.reset();
    item_ = ItemState{};
}

}} // namespace sheetpress::reader
