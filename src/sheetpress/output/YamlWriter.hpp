#pragma once

#include "sheetpress/output/SheetWriter.hpp"
#include <yaml-cpp/yaml.h>

namespace sheetpress {
namespace output {

/**
 * @brief YAML写出器：与JSON相同的记录，块风格
 *
 * @throws EmptyTableException 工作表没有任何行
 */
class YamlWriter : public SheetWriter {
public:
    void render(const core::Worksheet& sheet, std::ostream& out) const override;
    OutputFormat getFormat() const override { return OutputFormat::Yaml; }

    /**
     * @brief 输出一条记录（一个映射）
     */
    static void emitRecord(YAML::Emitter& emitter, const core::Record& record);
};

}} // namespace sheetpress::output
