#include "sheetlink/service/LinkExtractor.hpp"
#include "sheetlink/service/LinkMerger.hpp"
#include "sheetlink/service/TemplateGenerator.hpp"
#include "sheetlink/service/ErrorReporter.hpp"
#include "sheetlink/utils/Logger.hpp"
#include "sheetlink/core/ProcessingOptions.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitReportedError = 1;
constexpr int kExitUsage = 2;

sheetlink::core::Error fileError(const std::string& path, int saved_errno) {
    using sheetlink::core::ErrorCode;
    ErrorCode code = (saved_errno == EACCES || saved_errno == EPERM) ? ErrorCode::PermissionDenied : ErrorCode::IOError;
    return sheetlink::core::makeError(code, fmt::format("{}: {}", path, std::strerror(saved_errno)));
}

sheetlink::core::Result<std::vector<uint8_t>> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fileError(path, errno);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return fileError(path, errno);
    }
    return data;
}

sheetlink::core::VoidResult writeFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fileError(path, errno);
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        return fileError(path, errno);
    }
    return sheetlink::core::VoidResult{};
}

int reportError(const sheetlink::core::Error& error) {
    fmt::print(stderr, "{}\n", sheetlink::service::ErrorReporter::fromError(error).message);
    return kExitReportedError;
}

void printLinks(const std::vector<sheetlink::service::LinkRecord>& links) {
    for (const auto& link : links) {
        fmt::print("  row {:>5}  {}  ->  {}\n", link.row, link.title, link.url);
    }
}

template<typename ResultT>
int finishOperation(const ResultT& result, const std::string& output_path) {
    if (!result.isSuccess()) {
        fmt::print(stderr, "{}\n", result.error_message.value_or("Unknown error"));
        return kExitReportedError;
    }
    if (auto written = writeFile(output_path, *result.output_file); !written) {
        return reportError(written.error());
    }
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"SheetLink - extract and merge spreadsheet hyperlinks"};
    app.require_subcommand(1);

    size_t max_size_mb = sheetlink::core::Constants::kDefaultMaxFileSizeMB;
    int header_rows = sheetlink::core::Constants::kDefaultMaxHeaderSearchRows;
    int max_url_length = sheetlink::core::Constants::kDefaultMaxUrlLength;
    std::string log_file = "logs/sheetlink.log";
    bool verbose = false;

    app.add_option("--max-size-mb", max_size_mb, "Maximum input file size in MB")->check(CLI::PositiveNumber);
    app.add_option("--header-rows", header_rows, "Number of rows searched for the header")->check(CLI::PositiveNumber);
    app.add_option("--max-url-length", max_url_length, "Maximum accepted URL length")
        ->check(CLI::Range(1, sheetlink::core::Constants::kMaxUrlLengthCeiling));
    app.add_option("--log-file", log_file, "Log file path");
    app.add_flag("-v,--verbose", verbose, "Echo log messages to the console");

    std::string input_path;
    std::string output_path;
    std::string column_name = "Title";
    std::string template_kind;

    auto* extract_cmd = app.add_subcommand("extract", "Extract hyperlink targets from a column");
    extract_cmd->add_option("input", input_path, "Input .xlsx file")->required()->check(CLI::ExistingFile);
    extract_cmd->add_option("output", output_path, "Output .xlsx file")->required();
    extract_cmd->add_option("-c,--column", column_name, "Header of the column holding the hyperlinks");

    auto* merge_cmd = app.add_subcommand("merge", "Merge Title and URL columns into hyperlinks");
    merge_cmd->add_option("input", input_path, "Input .xlsx file")->required()->check(CLI::ExistingFile);
    merge_cmd->add_option("output", output_path, "Output .xlsx file")->required();

    auto* template_cmd = app.add_subcommand("template", "Write a sample workbook");
    template_cmd->add_option("kind", template_kind, "Template kind")->required()
        ->check(CLI::IsMember({"extract", "merge"}));
    template_cmd->add_option("output", output_path, "Output .xlsx file")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? kExitOk : kExitUsage;
    }

    auto& logger = sheetlink::Logger::getInstance();
    logger.initialize(log_file, sheetlink::Logger::Level::INFO, verbose);

    sheetlink::core::ProcessingOptions options = sheetlink::core::ProcessingOptions::fromMegabytes(max_size_mb);
    options.max_header_search_rows = header_rows;
    options.max_url_length = max_url_length;
    if (auto valid = options.validate(); !valid) {
        fmt::print(stderr, "Invalid option {}: {}\n", valid.error().context, valid.error().message);
        logger.shutdown();
        return kExitUsage;
    }

    int exit_code = kExitOk;
    if (*extract_cmd) {
        auto input = readFile(input_path);
        if (!input) {
            exit_code = reportError(input.error());
        } else {
            sheetlink::service::LinkExtractor extractor(options);
            auto result = extractor.extract(input.value(), column_name);
            exit_code = finishOperation(result, output_path);
            if (exit_code == kExitOk) {
                fmt::print("Total rows: {}, Links found: {}\n", result.total_rows, result.links_found);
                printLinks(result.links);
            }
        }
    } else if (*merge_cmd) {
        auto input = readFile(input_path);
        if (!input) {
            exit_code = reportError(input.error());
        } else {
            sheetlink::service::LinkMerger merger(options);
            auto result = merger.merge(input.value());
            exit_code = finishOperation(result, output_path);
            if (exit_code == kExitOk) {
                fmt::print("Total rows: {}, Links created: {}\n", result.total_rows, result.links_created);
                printLinks(result.links);
            }
        }
    } else if (*template_cmd) {
        auto bytes = template_kind == "extract" ? sheetlink::service::TemplateGenerator::extractionTemplate()
                                                : sheetlink::service::TemplateGenerator::mergeTemplate();
        if (!bytes) {
            exit_code = reportError(bytes.error());
        } else if (auto written = writeFile(output_path, bytes.value()); !written) {
            exit_code = reportError(written.error());
        } else {
            fmt::print("Template written to {}\n", output_path);
        }
    }

    logger.shutdown();
    return exit_code;
}
