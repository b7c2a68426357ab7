#include "sheetlink/service/LinkMerger.hpp"
#include "sheetlink/service/ErrorReporter.hpp"
#include "sheetlink/service/FileValidator.hpp"
#include "sheetlink/service/HeaderLocator.hpp"
#include "sheetlink/reader/WorkbookReader.hpp"
#include "sheetlink/writer/WorkbookWriter.hpp"
#include "sheetlink/utils/UrlSanitizer.hpp"
#include "sheetlink/utils/StringUtils.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include "sheetlink/core/Exception.hpp"
#include <algorithm>
#include <chrono>
#include <fmt/format.h>

namespace sheetlink {
namespace service {

namespace {

constexpr const char* kTitleColumn = "Title";
constexpr const char* kUrlColumn = "URL";
constexpr double kTitleColumnWidth = 40.0;
constexpr double kUrlColumnWidth = 60.0;

// 行内第一个位于指定列的单元格文本（去除首尾空白）
std::string cellTextAt(const reader::Workbook& workbook, const reader::Row& row, int column) {
    for (const auto& cell : row.cells) {
        if (cell.column == column) {
            return std::string(utils::StringUtils::trim(workbook.cellValue(cell)));
        }
    }
    return std::string();
}

void recordFailure(MergeResult& result) {
    ErrorReport report = ErrorReporter::fromCurrentException();
    result.total_rows = 0;
    result.links_created = 0;
    result.links.clear();
    result.output_file.reset();
    result.error_message = report.message;
    result.error_code = report.code;
}

void finishContext(MergeResult& result, std::chrono::steady_clock::time_point start_time, const char* operation) {
    result.context.rows = result.total_rows;
    result.context.error_code = result.error_code;
    result.context.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    if (result.error_message) {
        SERVICE_ERROR("{} failed after {} ms: {}", operation, result.context.elapsed_ms, *result.error_message);
    } else {
        SERVICE_INFO("{} completed. Total rows: {}, Links created: {}, Input: {} bytes, Elapsed: {} ms",
                     operation, result.total_rows, result.links_created,
                     result.context.input_bytes, result.context.elapsed_ms);
    }
}

} // namespace

MergeResult LinkMerger::merge(const uint8_t* data, size_t size) const {
    MergeResult result;
    result.context.input_bytes = size;
    const auto start_time = std::chrono::steady_clock::now();

    try {
        auto valid = FileValidator::validate(data, size, options_);
        if (!valid) {
            core::throwError(valid.error());
        }

        reader::Workbook workbook = reader::WorkbookReader::open(data, size).valueOrThrow();

        const int search_rows = options_.max_header_search_rows;
        auto title_header = HeaderLocator::findColumn(workbook, kTitleColumn, search_rows);
        auto url_header = HeaderLocator::findColumn(workbook, kUrlColumn, search_rows);

        if (!title_header && !url_header) {
            SERVICE_WARN("Required columns not found for merge: neither '{}' nor '{}'", kTitleColumn, kUrlColumn);
            SHEETLINK_THROW(core::ProcessingException,
                            fmt::format("Required columns '{}' and '{}' were not found in the first {} rows of the spreadsheet. "
                                        "💡 Tip: Add a header row with '{}' and '{}' columns.",
                                        kTitleColumn, kUrlColumn, search_rows, kTitleColumn, kUrlColumn),
                            core::ErrorCode::ExcelProcessing);
        }
        if (!title_header) {
            SHEETLINK_THROW(core::ColumnNotFoundException, kTitleColumn, search_rows);
        }
        if (!url_header) {
            SHEETLINK_THROW(core::ColumnNotFoundException, kUrlColumn, search_rows);
        }

        // 两个表头可能不在同一行，数据从较大的表头行之后开始
        const int header_row = std::max(title_header->row, url_header->row);
        SERVICE_DEBUG("Found columns - Title: {}, URL: {}, Header row: {}",
                      title_header->column, url_header->column, header_row);

        std::vector<MergeRow> rows;
        for (const auto& row : workbook.rows()) {
            if (row.index <= header_row) {
                continue;
            }
            MergeRow merge_row;
            merge_row.title = cellTextAt(workbook, row, title_header->column);
            merge_row.url = cellTextAt(workbook, row, url_header->column);
            rows.push_back(std::move(merge_row));
        }

        buildOutput(rows, result);
    } catch (const std::exception&) {
        recordFailure(result);
    }

    finishContext(result, start_time, "Link merge");
    return result;
}

MergeResult LinkMerger::createMergedFile(const std::vector<std::string>& titles,
                                         const std::vector<std::string>& urls) const {
    MergeResult result;
    const auto start_time = std::chrono::steady_clock::now();

    try {
        const size_t count = std::min(titles.size(), urls.size());
        std::vector<MergeRow> rows;
        rows.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            result.context.input_bytes += titles[i].size() + urls[i].size();
            MergeRow merge_row;
            merge_row.title = std::string(utils::StringUtils::trim(titles[i]));
            merge_row.url = std::string(utils::StringUtils::trim(urls[i]));
            rows.push_back(std::move(merge_row));
        }
        buildOutput(rows, result);
    } catch (const std::exception&) {
        recordFailure(result);
    }

    finishContext(result, start_time, "Merged file creation");
    return result;
}

void LinkMerger::buildOutput(const std::vector<MergeRow>& rows, MergeResult& result) const {
    writer::WorkbookWriter output("Merged Links");
    output.setCell(1, 1, kTitleColumn, writer::StyleId::kMergeHeader);
    output.setCell(1, 2, kUrlColumn, writer::StyleId::kMergeHeader);

    int output_row = 2;
    for (const auto& row : rows) {
        if (row.title.empty() && row.url.empty()) {
            continue;
        }

        auto sanitized = utils::UrlSanitizer::sanitize(std::string_view(row.url), options_.max_url_length);
        if (sanitized) {
            output.setCell(output_row, 1, row.title, writer::StyleId::kHyperlink);
            output.addHyperlink(output_row, 1, *sanitized);
            result.links.push_back(LinkRecord{output_row, row.title, *sanitized});
            result.links_created++;
        } else {
            if (!row.url.empty()) {
                SERVICE_DEBUG("Row {} keeps plain text, URL rejected: {}", output_row, row.url);
            }
            output.setCell(output_row, 1, row.title, writer::StyleId::kDefault);
        }
        output.setCell(output_row, 2, row.url, writer::StyleId::kDefault);
        ++output_row;
    }

    output.setColumnWidth(1, kTitleColumnWidth);
    output.setColumnWidth(2, kUrlColumnWidth);

    result.output_file = output.save().valueOrThrow();
    result.total_rows = output_row - 2;
}

}} // namespace sheetlink::service
