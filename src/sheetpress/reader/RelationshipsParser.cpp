#include "sheetpress/reader/RelationshipsParser.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"

namespace sheetpress {
namespace reader {

void RelationshipsParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name != "Relationship") {
        return;
    }

    Relationship rel;
    rel.id = getAttributeOr(attributes, "Id", "");
    rel.type = getAttributeOr(attributes, "Type", "");
    rel.target = getAttributeOr(attributes, "Target", "");
    rel.target_mode = getAttributeOr(attributes, "TargetMode", "Internal");

    if (rel.id.empty() || rel.target.empty()) {
        READER_WARN("Skipping relationship without Id or Target");
        return;
    }

    // 重复ID以最后一次为准
    auto it = id_index_.find(rel.id);
    if (it != id_index_.end()) {
        relationships_[it->second] = std::move(rel);
        return;
    }

    id_index_.emplace(rel.id, relationships_.size());
    relationships_.push_back(std::move(rel));
}

const RelationshipsParser::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) {
        return nullptr;
    }
    return &relationships_[it->second];
}

}} // namespace sheetpress::reader
