#include "sheetlink/service/TemplateGenerator.hpp"
#include "sheetlink/writer/WorkbookWriter.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include "sheetlink/core/Exception.hpp"
#include <utility>

namespace sheetlink {
namespace service {

namespace {

constexpr const char* kSheetName = "Data";
constexpr double kTitleColumnWidth = 30.0;
constexpr double kUrlColumnWidth = 50.0;

core::Result<std::vector<uint8_t>> saveTemplate(const writer::WorkbookWriter& output, const char* kind) {
    auto bytes = output.save();
    if (!bytes) {
        SERVICE_ERROR("Failed to generate {} template: {}", kind, bytes.error().fullMessage());
        return bytes;
    }
    SERVICE_DEBUG("Generated {} template ({} bytes)", kind, bytes.value().size());
    return bytes;
}

} // namespace

core::Result<std::vector<uint8_t>> TemplateGenerator::extractionTemplate() {
    try {
        writer::WorkbookWriter output(kSheetName);
        output.setCell(1, 1, "Title", writer::StyleId::kExtractHeader);
        output.setCell(1, 2, "URL", writer::StyleId::kExtractHeader);

        output.setCell(2, 1, "Example Link 1", writer::StyleId::kHyperlink);
        output.addHyperlink(2, 1, "https://www.example.com");
        output.setCell(3, 1, "Example Link 2", writer::StyleId::kHyperlink);
        output.addHyperlink(3, 1, "https://www.google.com");

        output.setCell(5, 1, "Add hyperlinks to Title column. URLs will be extracted automatically.",
                       writer::StyleId::kCaption);

        output.setColumnWidth(1, kTitleColumnWidth);
        output.setColumnWidth(2, kUrlColumnWidth);
        return saveTemplate(output, "extraction");
    } catch (const core::SheetLinkException& e) {
        return core::makeError(e.getErrorCode(), e.what());
    }
}

core::Result<std::vector<uint8_t>> TemplateGenerator::mergeTemplate() {
    static const std::pair<const char*, const char*> kSamples[] = {
        {"Google", "https://www.google.com"},
        {"GitHub", "https://github.com"},
        {"Stack Overflow", "https://stackoverflow.com"},
    };

    try {
        writer::WorkbookWriter output(kSheetName);
        output.setCell(1, 1, "Title", writer::StyleId::kMergeHeader);
        output.setCell(1, 2, "URL", writer::StyleId::kMergeHeader);

        int row = 2;
        for (const auto& sample : kSamples) {
            output.setCell(row, 1, sample.first);
            output.setCell(row, 2, sample.second);
            ++row;
        }

        // 空一行后写说明
        output.setCell(row + 1, 1, "Add your Title and URL values. URLs will be converted to hyperlinks.",
                       writer::StyleId::kCaption);

        output.setColumnWidth(1, kTitleColumnWidth);
        output.setColumnWidth(2, kUrlColumnWidth);
        return saveTemplate(output, "merge");
    } catch (const core::SheetLinkException& e) {
        return core::makeError(e.getErrorCode(), e.what());
    }
}

}} // namespace sheetlink::service
