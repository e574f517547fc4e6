#pragma once

#include "sheetpress/output/OutputFormat.hpp"
#include "sheetpress/output/SheetWriter.hpp"
#include <memory>

namespace sheetpress {
namespace output {

/**
 * @brief 输出格式到写出器的映射
 */
class WriterRegistry {
public:
    static std::unique_ptr<SheetWriter> create(OutputFormat format);
};

}} // namespace sheetpress::output
