#pragma once

#include "sheetpress/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace sheetpress {
namespace reader {

/**
 * @brief 关系文件（*.rels）解析器
 *
 * 解析时同步建立 Id -> 下标 索引。
 */
class RelationshipsParser : public BaseSAXParser {
public:
    struct Relationship {
        std::string id;          // 如 "rId1"
        std::string type;        // 关系类型URI
        std::string target;      // 如 "worksheets/sheet1.xml"
        std::string target_mode = "Internal";
    };

    RelationshipsParser() = default;
    ~RelationshipsParser() override = default;

    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<Relationship>& getRelationships() const { return relationships_; }

    /**
     * @brief 根据ID查找关系
     * @return 未找到返回nullptr
     */
    const Relationship* findById(const std::string& id) const;

    void clear() {
        relationships_.clear();
        id_index_.clear();
    }

protected:
    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}

private:
    std::vector<Relationship> relationships_;
    std::unordered_map<std::string, size_t> id_index_;
};

}} // namespace sheetpress::reader
