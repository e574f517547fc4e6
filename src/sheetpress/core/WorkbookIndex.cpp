#include "sheetpress/core/WorkbookIndex.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/archive/ZipReader.hpp"
#include "sheetpress/reader/WorkbookParser.hpp"
#include "sheetpress/reader/RelationshipsParser.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <climits>

namespace sheetpress {
namespace core {

namespace {

bool readOptionalEntry(archive::ZipReader& reader, const std::string& entry_path, std::string& xml) {
    if (!reader.hasEntry(entry_path)) {
        CORE_DEBUG("No '{}' entry in package", entry_path);
        return false;
    }
    auto err = reader.extractFile(entry_path, xml);
    if (archive::isError(err)) {
        SHEETPRESS_THROW(FileException,
                         fmt::format("Cannot read {} ({})", entry_path, archive::toString(err)),
                         reader.getPath().string(), ErrorCode::FileReadError);
    }
    return true;
}

std::optional<int> parsePositiveInt(std::string_view digits) {
    if (digits.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
        if (value > INT_MAX) {
            return std::nullopt;
        }
    }
    return static_cast<int>(value);
}

} // namespace

WorkbookIndex WorkbookIndex::load(archive::ZipReader& reader, const WorkbookOptions& options) {
    WorkbookIndex index;

    std::string xml;
    if (readOptionalEntry(reader, options.workbook_path, xml)) {
        reader::WorkbookParser parser;
        if (!parser.parse(xml)) {
            SHEETPRESS_THROW(XMLException, parser.getErrorMessage(), options.workbook_path);
        }
        for (const auto& decl : parser.getSheets()) {
            auto id = parseRelationshipId(decl.rel_id);
            if (!id) {
                CORE_WARN("Ignoring sheet '{}' with unexpected relationship id '{}'", decl.name, decl.rel_id);
                continue;
            }
            index.addSheet(*id, decl.name);
        }
    }

    xml.clear();
    if (readOptionalEntry(reader, options.relationships_path, xml)) {
        reader::RelationshipsParser parser;
        if (!parser.parse(xml)) {
            SHEETPRESS_THROW(XMLException, parser.getErrorMessage(), options.relationships_path);
        }
        for (const auto& rel : parser.getRelationships()) {
            if (rel.target_mode == "External") {
                continue;
            }
            auto id = parseRelationshipId(rel.id);
            if (id) {
                index.addTarget(resolveTarget(rel.target), *id);
            }
        }
    }

    CORE_DEBUG("Workbook index: {} sheets, {} relationship targets",
               index.sheets_.size(), index.target_ids_.size());
    return index;
}

void WorkbookIndex::addSheet(int rel_id, const std::string& name) {
    auto it = id_index_.find(rel_id);
    if (it != id_index_.end()) {
        sheets_[it->second].name = name;
        return;
    }
    id_index_.emplace(rel_id, sheets_.size());
    sheets_.push_back(SheetEntry{rel_id, name});
}

void WorkbookIndex::addTarget(const std::string& entry_path, int rel_id) {
    target_ids_[entry_path] = rel_id;
}

std::optional<std::string> WorkbookIndex::declaredName(int rel_id) const {
    auto it = id_index_.find(rel_id);
    if (it == id_index_.end()) {
        return std::nullopt;
    }
    return sheets_[it->second].name;
}

std::optional<int> WorkbookIndex::relationshipIdFor(const std::string& entry_path) const {
    if (!target_ids_.empty()) {
        auto it = target_ids_.find(entry_path);
        if (it != target_ids_.end()) {
            return it->second;
        }
        return std::nullopt;
    }
    return stemNumber(entryStem(entry_path));
}

std::string WorkbookIndex::sheetNameFor(const std::string& entry_path) const {
    auto rel_id = relationshipIdFor(entry_path);
    if (rel_id) {
        auto name = declaredName(*rel_id);
        if (name) {
            return fmt::format("{:02d}-{}", *rel_id, *name);
        }
    }
    // 没有声明可用：保持原始条目名
    return entryStem(entry_path);
}

std::optional<int> WorkbookIndex::parseRelationshipId(std::string_view rel_id) {
    constexpr std::string_view prefix = "rId";
    if (rel_id.size() <= prefix.size() || rel_id.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }
    return parsePositiveInt(rel_id.substr(prefix.size()));
}

std::string WorkbookIndex::entryStem(std::string_view entry_path) {
    size_t slash = entry_path.rfind('/');
    std::string_view name = slash == std::string_view::npos ? entry_path : entry_path.substr(slash + 1);
    size_t dot = name.rfind('.');
    if (dot != std::string_view::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    return std::string(name);
}

std::optional<int> WorkbookIndex::stemNumber(std::string_view stem) {
    size_t pos = stem.size();
    while (pos > 0 && stem[pos - 1] >= '0' && stem[pos - 1] <= '9') {
        --pos;
    }
    return parsePositiveInt(stem.substr(pos));
}

std::string WorkbookIndex::resolveTarget(std::string_view target) {
    if (!target.empty() && target.front() == '/') {
        return std::string(target.substr(1));
    }

    // 处理 "../" 片段
    std::vector<std::string> parts{"xl"};
    size_t start = 0;
    while (start <= target.size()) {
        size_t slash = target.find('/', start);
        std::string_view part = target.substr(start, slash == std::string_view::npos ? std::string_view::npos
                                                                                     : slash - start);
        if (part == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!part.empty() && part != ".") {
            parts.emplace_back(part);
        }
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }

    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += '/';
        result += parts[i];
    }
    return result;
}

}} // namespace sheetpress::core
