#include "sheetpress/output/YamlWriter.hpp"
#include "sheetpress/core/Worksheet.hpp"
#include "sheetpress/core/TableProjector.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <string>
#include <utility>
#include <vector>

namespace sheetpress {
namespace output {

void YamlWriter::emitRecord(YAML::Emitter& emitter, const core::Record& record) {
    // 重复字段：保留第一次的位置，最后一次的值
    std::vector<std::pair<std::string, core::CellValue>> fields;
    fields.reserve(record.size());
    for (const auto& field : record) {
        std::string key = fieldName(field.first);
        bool replaced = false;
        for (auto& existing : fields) {
            if (existing.first == key) {
                existing.second = field.second;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            fields.emplace_back(std::move(key), field.second);
        }
    }

    // 键和值一律双引号，读回时始终是字符串
    emitter << YAML::BeginMap;
    for (const auto& field : fields) {
        emitter << YAML::Key << YAML::DoubleQuoted << field.first << YAML::Value;
        if (field.second) {
            emitter << YAML::DoubleQuoted << *field.second;
        } else {
            emitter << YAML::Null;
        }
    }
    emitter << YAML::EndMap;
}

void YamlWriter::render(const core::Worksheet& sheet, std::ostream& out) const {
    core::RecordStream records = core::TableProjector::toRecords(sheet.rows());

    YAML::Emitter emitter;
    emitter.SetSeqFormat(YAML::Block);
    emitter.SetMapFormat(YAML::Block);

    size_t count = 0;
    emitter << YAML::BeginSeq;
    core::Record record;
    while (records.next(record)) {
        emitRecord(emitter, record);
        ++count;
    }
    emitter << YAML::EndSeq;

    if (!emitter.good()) {
        SHEETPRESS_THROW(core::SheetPressException,
                         fmt::format("YAML emitter failed: {}", emitter.GetLastError()),
                         core::ErrorCode::InternalError);
    }

    out << emitter.c_str() << '\n';
    OUTPUT_DEBUG("YAML: wrote {} records for sheet '{}'", count, sheet.getName());
}

}} // namespace sheetpress::output
