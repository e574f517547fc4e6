#pragma once

#include "sheetpress/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace sheetpress {
namespace reader {

/**
 * @brief 共享字符串表解析器
 *
 * 解析 xl/sharedStrings.xml：每个 <si> 产生一项，
 * 项内所有 <t> 文本（包括富文本 <r><t>）按文档顺序拼接，
 * 注音 <rPh> 中的文本不计入。没有任何文本的 <si> 记为空值。
 */
class SharedStringsParser : public BaseSAXParser {
public:
    SharedStringsParser() = default;
    ~SharedStringsParser() override = default;

    /**
     * @brief 解析共享字符串XML内容
     * @param xml_content XML内容
     * @return 是否解析成功
     */
    bool parse(const std::string& xml_content) {
        clear();
        content_size_ = xml_content.size();
        return parseXML(xml_content);
    }

    const std::vector<std::optional<std::string>>& getStrings() const { return strings_; }

    /**
     * @brief 移出解析结果，解析器随后为空
     */
    std::vector<std::optional<std::string>> takeStrings();

    size_t getStringCount() const { return strings_.size(); }

    /**
     * @brief <sst uniqueCount> 声明的数量，没有声明时为空
     */
    std::optional<size_t> getDeclaredUniqueCount() const { return declared_unique_count_; }

    void clear();

protected:
    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    struct ItemState {
        bool in_item = false;       // 是否在<si>内
        bool in_text = false;       // 是否在<t>内
        int phonetic_depth = 0;     // <rPh> 嵌套层数
        bool has_text = false;
        std::string text;

        void start() {
            in_item = true;
            in_text = false;
            phonetic_depth = 0;
            has_text = false;
            text.clear();
        }
    };

    std::vector<std::optional<std::string>> strings_;
    std::optional<size_t> declared_unique_count_;
    size_t content_size_ = 0;
    ItemState item_;
};

}} // namespace sheetpress::reader
