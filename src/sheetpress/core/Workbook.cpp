#include "sheetpress/core/Workbook.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/archive/ZipReader.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace sheetpress {
namespace core {

Workbook::Workbook(const Path& path, const WorkbookOptions& options)
    : path_(path)
    , options_(options) {
}

std::unique_ptr<archive::ZipReader> Workbook::openArchive() const {
    if (!path_.exists()) {
        SHEETPRESS_THROW(FileException, "Input file does not exist", path_.string(), ErrorCode::FileNotFound);
    }

    auto reader = std::make_unique<archive::ZipReader>(path_);
    if (!reader->open()) {
        SHEETPRESS_THROW(NotAnArchiveException, path_.string());
    }
    return reader;
}

void Workbook::ensureLoaded(archive::ZipReader& reader) const {
    std::call_once(strings_once_, [&]() {
        shared_strings_ = SharedStringTable::load(reader, options_.shared_strings_path);
    });
    std::call_once(index_once_, [&]() {
        index_ = WorkbookIndex::load(reader, options_);
    });
}

const SharedStringTable& Workbook::sharedStrings() const {
    std::call_once(strings_once_, [this]() {
        auto reader = openArchive();
        shared_strings_ = SharedStringTable::load(*reader, options_.shared_strings_path);
    });
    return shared_strings_;
}

const WorkbookIndex& Workbook::index() const {
    std::call_once(index_once_, [this]() {
        auto reader = openArchive();
        index_ = WorkbookIndex::load(*reader, options_);
    });
    return index_;
}

bool Workbook::isWorksheetEntry(const std::string& entry_path) const {
    const std::string& prefix = options_.worksheet_prefix;
    static const std::string suffix = ".xml";
    return entry_path.size() > prefix.size() + suffix.size() - 1 &&
           entry_path.compare(0, prefix.size(), prefix) == 0 &&
           entry_path.compare(entry_path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> Workbook::worksheetEntries(const archive::ZipReader& reader) const {
    std::vector<std::string> entries;
    for (auto& name : reader.listFiles()) {
        if (isWorksheetEntry(name)) {
            entries.push_back(std::move(name));
        }
    }
    return entries;
}

std::unique_ptr<Worksheet> Workbook::readWorksheet(archive::ZipReader& reader, const std::string& entry_path) const {
    std::string xml;
    auto err = reader.extractFile(entry_path, xml);
    if (err == archive::ZipError::FileNotFound) {
        SHEETPRESS_THROW(MissingEntryException, entry_path);
    }
    if (archive::isError(err)) {
        SHEETPRESS_THROW(FileException,
                         fmt::format("Cannot read {} ({})", entry_path, archive::toString(err)),
                         path_.string(), ErrorCode::FileReadError);
    }

    std::string name = index_.sheetNameFor(entry_path);
    return std::make_unique<Worksheet>(*this, entry_path, std::move(name), xml);
}

size_t Workbook::forEachWorksheet(const WorksheetCallback& callback) const {
    auto reader = openArchive();
    ensureLoaded(*reader);

    size_t visited = 0;
    for (const auto& entry : worksheetEntries(*reader)) {
        auto sheet = readWorksheet(*reader, entry);
        callback(*sheet);
        ++visited;
    }

    CORE_DEBUG("Visited {} worksheets in {}", visited, path_.string());
    return visited;
}

std::unique_ptr<Worksheet> Workbook::loadWorksheet(const std::string& entry_path) const {
    auto reader = openArchive();
    ensureLoaded(*reader);
    if (!reader->hasEntry(entry_path)) {
        SHEETPRESS_THROW(MissingEntryException, entry_path);
    }
    return readWorksheet(*reader, entry_path);
}

std::vector<std::string> Workbook::getWorksheetEntries() const {
    auto reader = openArchive();
    return worksheetEntries(*reader);
}

std::vector<std::string> Workbook::getSheetNames() const {
    auto reader = openArchive();
    ensureLoaded(*reader);

    std::vector<std::string> names;
    for (const auto& entry : worksheetEntries(*reader)) {
        names.push_back(index_.sheetNameFor(entry));
    }
    return names;
}

}} // namespace sheetpress::core
