#include "sheetlink/service/LinkExtractor.hpp"
#include "sheetlink/service/ErrorReporter.hpp"
#include "sheetlink/service/FileValidator.hpp"
#include "sheetlink/service/HeaderLocator.hpp"
#include "sheetlink/reader/WorkbookReader.hpp"
#include "sheetlink/writer/WorkbookWriter.hpp"
#include "sheetlink/utils/StringUtils.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include "sheetlink/core/Exception.hpp"
#include <chrono>
#include <string>

namespace sheetlink {
namespace service {

namespace {

constexpr double kTitleColumnWidth = 30.0;
constexpr double kUrlColumnWidth = 50.0;

struct PendingCell {
    int column;
    std::string value;
    int style_id;
};

} // namespace

ExtractionResult LinkExtractor::extract(const uint8_t* data, size_t size, std::string_view column_name) const {
    ExtractionResult result;
    result.context.input_bytes = size;
    const auto start_time = std::chrono::steady_clock::now();

    try {
        auto valid = FileValidator::validate(data, size, options_);
        if (!valid) {
            core::throwError(valid.error());
        }

        SERVICE_INFO("Starting link extraction for column '{}' ({} bytes)", column_name, size);

        reader::Workbook workbook = reader::WorkbookReader::open(data, size).valueOrThrow();

        auto header = HeaderLocator::findColumn(workbook, column_name, options_.max_header_search_rows);
        if (!header) {
            SERVICE_WARN("Column '{}' not found in spreadsheet", column_name);
            SHEETLINK_THROW(core::ColumnNotFoundException, std::string(column_name), options_.max_header_search_rows);
        }

        buildOutput(workbook, *header, result);
    } catch (const std::exception&) {
        ErrorReport report = ErrorReporter::fromCurrentException();
        result.total_rows = 0;
        result.links_found = 0;
        result.links.clear();
        result.output_file.reset();
        result.error_message = report.message;
        result.error_code = report.code;
    }

    result.context.rows = result.total_rows;
    result.context.error_code = result.error_code;
    result.context.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    if (result.error_message) {
        SERVICE_ERROR("Link extraction failed after {} ms: {}", result.context.elapsed_ms, *result.error_message);
    } else {
        SERVICE_INFO("Link extraction completed. Total rows: {}, Links found: {}, Input: {} bytes, Elapsed: {} ms",
                     result.total_rows, result.links_found, result.context.input_bytes, result.context.elapsed_ms);
    }
    return result;
}

void LinkExtractor::buildOutput(const reader::Workbook& workbook, const HeaderMatch& header,
                                ExtractionResult& result) const {
    writer::WorkbookWriter output("Extracted Links");

    // 表头行：按原列号复制
    for (const auto& row : workbook.rows()) {
        if (row.index != header.row) {
            continue;
        }
        for (const auto& cell : row.cells) {
            output.setCell(1, cell.column, workbook.cellValue(cell), writer::StyleId::kBold);
        }
        break;
    }

    int output_row = 2;
    std::vector<PendingCell> pending;
    for (const auto& row : workbook.rows()) {
        if (row.index <= header.row) {
            continue;
        }

        pending.clear();
        bool has_data = false;
        std::optional<std::string> target_link;

        for (const auto& cell : row.cells) {
            std::string value = workbook.cellValue(cell);
            if (!utils::StringUtils::isBlank(value)) {
                has_data = true;
            }

            int style_id = writer::StyleId::kDefault;
            if (auto link = workbook.hyperlinkFor(cell.ref)) {
                style_id = writer::StyleId::kHyperlink;
                if (cell.column == header.column) {
                    result.links.push_back(LinkRecord{row.index, value, *link});
                    target_link = std::move(link);
                }
            }
            pending.push_back(PendingCell{cell.column, std::move(value), style_id});
        }

        if (!has_data) {
            continue;
        }
        for (const auto& cell : pending) {
            output.setCell(output_row, cell.column, cell.value, cell.style_id);
        }
        // 第2列显示提取出的地址
        if (target_link) {
            output.setCell(output_row, 2, *target_link, writer::StyleId::kDefault);
        }
        ++output_row;
    }

    output.setColumnWidth(1, kTitleColumnWidth);
    output.setColumnWidth(2, kUrlColumnWidth);

    result.output_file = output.save().valueOrThrow();
    result.total_rows = output_row - 2;
    result.links_found = static_cast<int>(result.links.size());
}

}} // namespace sheetlink::service
