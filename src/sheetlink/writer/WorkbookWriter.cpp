#include "sheetlink/writer/WorkbookWriter.hpp"
#include "sheetlink/archive/ZipWriter.hpp"
#include "sheetlink/xml/ContentTypes.hpp"
#include "sheetlink/xml/Relationships.hpp"
#include "sheetlink/xml/XMLStreamWriter.hpp"
#include "sheetlink/utils/CellAddress.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include "sheetlink/core/Constants.hpp"
#include "sheetlink/core/Exception.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace sheetlink {
namespace writer {

namespace {

constexpr const char* kMainNamespace = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
constexpr const char* kRelsNamespace = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";

constexpr const char* kWorkbookContentType = "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml";
constexpr const char* kWorksheetContentType = "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml";
constexpr const char* kStylesContentType = "application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml";

bool needsPreserveSpace(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    return is_space(text.front()) || is_space(text.back()) || text.find('\n') != std::string_view::npos;
}

} // namespace

WorkbookWriter::WorkbookWriter(std::string sheet_name)
    : sheet_name_(std::move(sheet_name)), palette_(StylePalette::standard()) {
}

void WorkbookWriter::checkPosition(int row, int column) const {
    SHEETLINK_THROW_IF(row < 1 || row > core::Constants::kMaxRows,
                       core::ParameterException, fmt::format("Row {} is out of range", row), "row");
    SHEETLINK_THROW_IF(column < 1 || column > core::Constants::kMaxColumns,
                       core::ParameterException, fmt::format("Column {} is out of range", column), "column");
}

void WorkbookWriter::setCell(int row, int column, std::string_view value, int style_id) {
    checkPosition(row, column);
    SHEETLINK_THROW_IF(!palette_.isValidStyle(style_id),
                       core::ParameterException, fmt::format("Unknown style index {}", style_id), "style_id");
    CellData& cell = rows_[row][column];
    cell.value.assign(value.data(), value.size());
    cell.style_id = style_id;
}

void WorkbookWriter::setCellStyle(int row, int column, int style_id) {
    checkPosition(row, column);
    SHEETLINK_THROW_IF(!palette_.isValidStyle(style_id),
                       core::ParameterException, fmt::format("Unknown style index {}", style_id), "style_id");
    rows_[row][column].style_id = style_id;
}

void WorkbookWriter::setColumnWidth(int column, double width) {
    SHEETLINK_THROW_IF(column < 1 || column > core::Constants::kMaxColumns,
                       core::ParameterException, fmt::format("Column {} is out of range", column), "column");
    SHEETLINK_THROW_IF(width <= 0.0 || width > 255.0,
                       core::ParameterException, fmt::format("Column width {} is out of range", width), "width");
    column_widths_[column] = width;
}

void WorkbookWriter::addHyperlink(int row, int column, std::string_view url) {
    checkPosition(row, column);
    std::string ref = utils::CellAddress::format(row, column);
    for (auto& link : hyperlinks_) {
        if (link.ref == ref) {
            link.url.assign(url.data(), url.size());
            return;
        }
    }
    HyperlinkEntry entry;
    entry.ref = std::move(ref);
    entry.url.assign(url.data(), url.size());
    entry.rel_id = fmt::format("rId{}", hyperlinks_.size() + 1);
    hyperlinks_.push_back(std::move(entry));
}

std::string WorkbookWriter::dimensionRef() const {
    if (rows_.empty()) {
        return "A1";
    }
    int first_row = rows_.begin()->first;
    int last_row = rows_.rbegin()->first;
    int first_col = core::Constants::kMaxColumns;
    int last_col = 1;
    for (const auto& [row_index, cells] : rows_) {
        (void)row_index;
        if (!cells.empty()) {
            first_col = std::min(first_col, cells.begin()->first);
            last_col = std::max(last_col, cells.rbegin()->first);
        }
    }
    if (first_col > last_col) {
        first_col = last_col;
    }
    if (first_row == last_row && first_col == last_col) {
        return utils::CellAddress::format(first_row, first_col);
    }
    return utils::CellAddress::formatRange(first_row, first_col, last_row, last_col);
}

std::string WorkbookWriter::generateContentTypesXML() const {
    xml::ContentTypes content_types;
    content_types.addPackageDefaults();
    content_types.addOverride("/xl/workbook.xml", kWorkbookContentType);
    content_types.addOverride("/xl/worksheets/sheet1.xml", kWorksheetContentType);
    content_types.addOverride("/xl/styles.xml", kStylesContentType);
    return content_types.toXML();
}

std::string WorkbookWriter::generateRootRelsXML() const {
    xml::Relationships rels;
    rels.addRelationship(xml::RelationshipType::kOfficeDocument, "xl/workbook.xml");
    return rels.toXML();
}

std::string WorkbookWriter::generateWorkbookXML() const {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("workbook");
    writer.writeAttribute("xmlns", kMainNamespace);
    writer.writeAttribute("xmlns:r", kRelsNamespace);

    writer.startElement("bookViews");
    writer.startElement("workbookView");
    writer.writeAttribute("activeTab", 0);
    writer.endElement(); // workbookView
    writer.endElement(); // bookViews

    writer.startElement("sheets");
    writer.startElement("sheet");
    writer.writeAttribute("name", sheet_name_);
    writer.writeAttribute("sheetId", 1);
    writer.writeAttribute("r:id", "rId1");
    writer.endElement(); // sheet
    writer.endElement(); // sheets

    writer.endElement(); // workbook
    writer.endDocument();
    return writer.release();
}

std::string WorkbookWriter::generateWorkbookRelsXML() const {
    xml::Relationships rels;
    rels.addRelationship(xml::RelationshipType::kWorksheet, "worksheets/sheet1.xml");   // rId1
    rels.addRelationship(xml::RelationshipType::kStyles, "styles.xml");                 // rId2
    return rels.toXML();
}

std::string WorkbookWriter::generateWorksheetXML() const {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("worksheet");
    writer.writeAttribute("xmlns", kMainNamespace);
    writer.writeAttribute("xmlns:r", kRelsNamespace);

    writer.startElement("dimension");
    writer.writeAttribute("ref", dimensionRef());
    writer.endElement(); // dimension

    writer.startElement("sheetViews");
    writer.startElement("sheetView");
    writer.writeAttribute("tabSelected", 1);
    writer.writeAttribute("workbookViewId", 0);
    writer.endElement(); // sheetView
    writer.endElement(); // sheetViews

    writer.startElement("sheetFormatPr");
    writer.writeAttribute("defaultRowHeight", 15);
    writer.endElement(); // sheetFormatPr

    if (!column_widths_.empty()) {
        writer.startElement("cols");
        for (const auto& [column, width] : column_widths_) {
            writer.startElement("col");
            writer.writeAttribute("min", column);
            writer.writeAttribute("max", column);
            writer.writeAttribute("width", width);
            writer.writeAttribute("customWidth", 1);
            writer.endElement(); // col
        }
        writer.endElement(); // cols
    }

    writer.startElement("sheetData");
    for (const auto& [row_index, cells] : rows_) {
        writer.startElement("row");
        writer.writeAttribute("r", row_index);
        for (const auto& [column, cell] : cells) {
            writer.startElement("c");
            writer.writeAttribute("r", utils::CellAddress::format(row_index, column));
            if (cell.style_id != StyleId::kDefault) {
                writer.writeAttribute("s", cell.style_id);
            }
            if (!cell.value.empty()) {
                writer.writeAttribute("t", "inlineStr");
                writer.startElement("is");
                writer.startElement("t");
                if (needsPreserveSpace(cell.value)) {
                    writer.writeAttribute("xml:space", "preserve");
                }
                writer.writeText(cell.value);
                writer.endElement(); // t
                writer.endElement(); // is
            }
            writer.endElement(); // c
        }
        writer.endElement(); // row
    }
    writer.endElement(); // sheetData

    if (!hyperlinks_.empty()) {
        writer.startElement("hyperlinks");
        for (const auto& link : hyperlinks_) {
            writer.startElement("hyperlink");
            writer.writeAttribute("ref", link.ref);
            writer.writeAttribute("r:id", link.rel_id);
            writer.endElement(); // hyperlink
        }
        writer.endElement(); // hyperlinks
    }

    writer.startElement("pageMargins");
    writer.writeAttribute("left", 0.7);
    writer.writeAttribute("right", 0.7);
    writer.writeAttribute("top", 0.75);
    writer.writeAttribute("bottom", 0.75);
    writer.writeAttribute("header", 0.3);
    writer.writeAttribute("footer", 0.3);
    writer.endElement(); // pageMargins

    writer.endElement(); // worksheet
    writer.endDocument();
    return writer.release();
}

std::string WorkbookWriter::generateWorksheetRelsXML() const {
    xml::Relationships rels;
    for (const auto& link : hyperlinks_) {
        rels.addRelationship(link.rel_id, xml::RelationshipType::kHyperlink, link.url, "External");
    }
    return rels.toXML();
}

core::Result<std::vector<uint8_t>> WorkbookWriter::save() const {
    archive::ZipWriter zip;
    archive::ZipError result = zip.open();
    if (result == archive::ZipError::Ok) {
        result = zip.setCompressionLevel(core::Constants::kCompressionLevel);
    }

    // 部件顺序固定
    const std::pair<const char*, std::string> parts[] = {
        {"[Content_Types].xml", generateContentTypesXML()},
        {"_rels/.rels", generateRootRelsXML()},
        {"xl/workbook.xml", generateWorkbookXML()},
        {"xl/_rels/workbook.xml.rels", generateWorkbookRelsXML()},
        {"xl/styles.xml", palette_.toXML()},
        {"xl/worksheets/sheet1.xml", generateWorksheetXML()},
    };
    for (const auto& part : parts) {
        if (result != archive::ZipError::Ok) {
            break;
        }
        result = zip.addFile(part.first, part.second);
    }
    if (result == archive::ZipError::Ok && !hyperlinks_.empty()) {
        result = zip.addFile("xl/worksheets/_rels/sheet1.xml.rels", generateWorksheetRelsXML());
    }

    std::vector<uint8_t> output;
    if (result == archive::ZipError::Ok) {
        result = zip.finish(output);
    }
    if (result != archive::ZipError::Ok) {
        WRITER_ERROR("Failed to write workbook '{}': {}", sheet_name_, archive::toString(result));
        return core::makeError(core::ErrorCode::ZipError,
                               fmt::format("Failed to write output package: {}", archive::toString(result)),
                               sheet_name_);
    }

    WRITER_DEBUG("Workbook '{}' written: {} rows, {} hyperlinks, {} bytes",
                 sheet_name_, rows_.size(), hyperlinks_.size(), output.size());
    return output;
}

}} // namespace sheetlink::writer
