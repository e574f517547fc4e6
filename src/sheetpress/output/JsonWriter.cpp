#include "sheetpress/output/JsonWriter.hpp"
#include "sheetpress/core/Worksheet.hpp"
#include "sheetpress/core/TableProjector.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"

namespace sheetpress {
namespace output {

nlohmann::ordered_json JsonWriter::toJson(const core::Record& record) {
    nlohmann::ordered_json object = nlohmann::ordered_json::object();
    for (const auto& field : record) {
        const std::string key = fieldName(field.first);
        if (field.second) {
            object[key] = *field.second;
        } else {
            object[key] = nullptr;
        }
    }
    return object;
}

void JsonWriter::render(const core::Worksheet& sheet, std::ostream& out) const {
    core::RecordStream records = core::TableProjector::toRecords(sheet.rows());

    nlohmann::ordered_json array = nlohmann::ordered_json::array();
    core::Record record;
    while (records.next(record)) {
        array.push_back(toJson(record));
    }

    // 未做规整的文本可能含非法UTF-8，替换而不是抛出
    out << array.dump(indent_, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    OUTPUT_DEBUG("JSON: wrote {} records for sheet '{}'", array.size(), sheet.getName());
}

}} // namespace sheetpress::output
