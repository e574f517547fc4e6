#include "sheetpress/app/Converter.hpp"
#include "sheetpress/core/Workbook.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/output/WriterRegistry.hpp"
#include "sheetpress/output/OutputPathBuilder.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <memory>

namespace sheetpress {
namespace app {

Converter::Converter(const ConvertOptions& options, std::ostream& progress)
    : options_(options)
    , progress_(progress) {
}

size_t Converter::run() {
    SHEETPRESS_THROW_IF(options_.formats.empty(), core::SheetPressException,
                        "No output format selected", core::ErrorCode::InvalidArgument);

    written_.clear();

    std::vector<std::unique_ptr<output::SheetWriter>> writers;
    writers.reserve(options_.formats.size());
    for (output::OutputFormat format : options_.formats) {
        writers.push_back(output::WriterRegistry::create(format));
    }

    core::WorkbookOptions workbook_options;
    workbook_options.sanitize = options_.sanitize;
    core::Workbook workbook(options_.input, workbook_options);

    core::Path directory = output::OutputPathBuilder::directoryFor(options_.input, options_.output_dir);
    bool directory_ready = false;

    size_t sheets = workbook.forEachWorksheet([&](const core::Worksheet& sheet) {
        if (!directory_ready) {
            output::OutputPathBuilder::prepare(directory);
            directory_ready = true;
        }

        for (const auto& writer : writers) {
            const char* name = output::formatName(writer->getFormat());
            if (options_.show_progress) {
                progress_ << "Saving " << sheet.getName() << " as " << name << std::endl;
            }

            core::Path target = output::OutputPathBuilder::build(options_.input, options_.output_dir,
                                                                 sheet.getName(), writer->getFormat());
            writer->write(sheet, target);
            written_.push_back(target);
            APP_INFO("Saved {} ({}x{}) to {}", sheet.getName(), sheet.width(), sheet.height(), target.string());
        }
    });

    if (sheets == 0) {
        APP_WARN("No worksheets found in {}", options_.input.string());
    }
    APP_DEBUG("Converted {} worksheets into {} files", sheets, written_.size());
    return written_.size();
}

}} // namespace sheetpress::app
