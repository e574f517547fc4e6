#include "sheetpress/output/OutputFormat.hpp"
#include <cctype>

namespace sheetpress {
namespace output {

const char* formatName(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Csv:  return "csv";
        case OutputFormat::Json: return "json";
        case OutputFormat::Yaml: return "yaml";
    }
    return "unknown";
}

const char* formatExtension(OutputFormat format) noexcept {
    // 扩展名与格式名一致
    return formatName(format);
}

std::optional<OutputFormat> parseFormat(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (OutputFormat format : allFormats()) {
        if (lower == formatName(format)) {
            return format;
        }
    }
    if (lower == "yml") {
        return OutputFormat::Yaml;
    }
    return std::nullopt;
}

const std::vector<OutputFormat>& allFormats() {
    static const std::vector<OutputFormat> formats = {
        OutputFormat::Csv, OutputFormat::Json, OutputFormat::Yaml
    };
    return formats;
}

}} // namespace sheetpress::output
