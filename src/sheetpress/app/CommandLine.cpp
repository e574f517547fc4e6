#include "sheetpress/app/CommandLine.hpp"
#include "sheetpress/app/Converter.hpp"
#include "sheetpress/SheetPress.hpp"
#include "sheetpress/core/Exception.hpp"
#include "sheetpress/utils/ModuleLoggers.hpp"
#include <argparse/argparse.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace sheetpress {
namespace app {

namespace {

constexpr const char* kDescription = "Excel 2007+ to CSV, JSON and YAML converter";

int exitCode(ExitCode code) {
    return static_cast<int>(code);
}

} // anonymous namespace

CommandLine::CommandLine(std::ostream& out, std::ostream& err)
    : out_(out)
    , err_(err) {
}

int CommandLine::run(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    return run(static_cast<int>(argv.size()), argv.data());
}

int CommandLine::run(int argc, const char* const argv[]) {
    argparse::ArgumentParser program("sheetpress", SHEETPRESS_VERSION_STRING,
                                     argparse::default_arguments::none);
    program.add_description(kDescription);

    program.add_argument("filepath")
        .help("Excel 2007+ workbook to convert")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string());
    program.add_argument("--csv").help("write every sheet as CSV")
        .default_value(false).implicit_value(true);
    program.add_argument("--json").help("write every sheet as JSON")
        .default_value(false).implicit_value(true);
    program.add_argument("--yaml").help("write every sheet as YAML")
        .default_value(false).implicit_value(true);
    program.add_argument("-o", "--output-dir")
        .help("output directory (defaults to the workbook's directory)")
        .default_value(std::string());
    program.add_argument("--no-sanitize").help("keep cell text as stored")
        .default_value(false).implicit_value(true);
    program.add_argument("--log-level")
        .help("trace, debug, info, warn, error, critical or off")
        .default_value(std::string("warn"));
    program.add_argument("--log-file").help("also write the log to this file")
        .default_value(std::string());
    program.add_argument("-q", "--quiet").help("no progress output and no console log")
        .default_value(false).implicit_value(true);
    program.add_argument("-h", "--help").help("show this help message and exit")
        .default_value(false).implicit_value(true);
    program.add_argument("--version").help("print the version and exit")
        .default_value(false).implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        err_ << "ERROR. " << e.what() << "\n\n" << program.help().str();
        return exitCode(ExitCode::Failure);
    }

    if (program.get<bool>("--help")) {
        out_ << program.help().str();
        return exitCode(ExitCode::Success);
    }
    if (program.get<bool>("--version")) {
        out_ << "sheetpress " << getVersion() << std::endl;
        return exitCode(ExitCode::Success);
    }

    convert_ = ConvertOptions();
    for (output::OutputFormat format : output::allFormats()) {
        if (program.get<bool>(std::string("--") + output::formatName(format))) {
            convert_.formats.push_back(format);
        }
    }
    if (convert_.formats.empty()) {
        err_ << "\nERROR. Choose at least one output format.\n\n" << program.help().str();
        return exitCode(ExitCode::Failure);
    }

    std::string input = program.get<std::string>("filepath");
    if (input.empty()) {
        err_ << "\nERROR. No input file given.\n\n" << program.help().str();
        return exitCode(ExitCode::Failure);
    }

    bool quiet = program.get<bool>("--quiet");
    convert_.input = core::Path(input);
    convert_.output_dir = core::Path(program.get<std::string>("--output-dir"));
    convert_.sanitize = !program.get<bool>("--no-sanitize");
    convert_.show_progress = !quiet;

    log_ = LogSettings();
    std::string level_name = program.get<std::string>("--log-level");
    if (!Logger::parseLevel(level_name, log_.level)) {
        err_ << fmt::format("ERROR. Unknown log level '{}'\n", level_name);
        return exitCode(ExitCode::Failure);
    }
    log_.file = program.get<std::string>("--log-file");
    log_.console = !quiet;

    if (!initialize(log_.file, log_.level, log_.console)) {
        err_ << fmt::format("ERROR. Cannot initialize logging ({})\n", log_.file);
        return exitCode(ExitCode::Failure);
    }

    int code = execute();
    cleanup();
    return code;
}

int CommandLine::execute() {
    const std::string& path = convert_.input.string();

    if (!convert_.input.exists()) {
        err_ << fmt::format("ERROR. \"{}\" does not exist\n", path);
        return exitCode(ExitCode::InvalidInput);
    }

    try {
        Converter converter(convert_, out_);
        size_t files = converter.run();
        APP_INFO("Wrote {} files from {}", files, path);
        return exitCode(ExitCode::Success);
    } catch (const core::NotAnArchiveException& e) {
        APP_DEBUG("{}", e.getDetailedMessage());
        err_ << fmt::format("ERROR. \"{}\" is not an Excel 2007+ file\n", path);
        return exitCode(ExitCode::InvalidInput);
    } catch (const core::SheetPressException& e) {
        APP_ERROR("{}", e.getDetailedMessage());
        err_ << fmt::format("ERROR. {} ({})\n", e.what(), e.getErrorCodeString());
        return exitCode(ExitCode::Failure);
    } catch (const std::exception& e) {
        APP_ERROR("Unexpected error: {}", e.what());
        err_ << fmt::format("ERROR. {} ({})\n", e.what(), core::toString(core::ErrorCode::InternalError));
        return exitCode(ExitCode::Failure);
    }
}

}} // namespace sheetpress::app
