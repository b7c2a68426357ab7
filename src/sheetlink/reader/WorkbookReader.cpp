#include "sheetlink/reader/WorkbookReader.hpp"
#include "sheetlink/reader/RelationshipsParser.hpp"
#include "sheetlink/reader/SharedStringsParser.hpp"
#include "sheetlink/reader/WorkbookParser.hpp"
#include "sheetlink/reader/WorksheetParser.hpp"
#include "sheetlink/xml/Relationships.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include <cstring>
#include <vector>
#include <fmt/format.h>

namespace sheetlink {
namespace reader {

namespace {

constexpr uint8_t kOle2Signature[] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};

bool isOle2Document(const uint8_t* data, size_t size) {
    return size >= sizeof(kOle2Signature) && std::memcmp(data, kOle2Signature, sizeof(kOle2Signature)) == 0;
}

core::Error zipFailure(archive::ZipError error, const std::string& path) {
    switch (error) {
        case archive::ZipError::TooLarge:
            return core::makeError(core::ErrorCode::OutOfMemory,
                                   fmt::format("Package part '{}' is too large to process", path), path);
        case archive::ZipError::FileNotFound:
            return core::makeError(core::ErrorCode::ExcelProcessing,
                                   fmt::format("Required package part '{}' is missing", path), path);
        default:
            return core::makeError(core::ErrorCode::ZipError,
                                   fmt::format("Failed to read package part '{}': {}", path, archive::toString(error)), path);
    }
}

} // namespace

core::Result<Workbook> WorkbookReader::open(const uint8_t* data, size_t size, uint64_t max_part_size) {
    if (!data || size == 0) {
        return core::makeError(core::ErrorCode::InvalidFileFormat, "File is empty");
    }
    if (isOle2Document(data, size)) {
        READER_WARN("检测到 OLE2 复合文档（{} 字节），不支持旧版 .xls", size);
        return core::makeError(core::ErrorCode::InvalidFileFormat, "The legacy .xls format is not supported.",
                               "Please open the file in Excel and save it as an .xlsx workbook.");
    }

    archive::ZipReader zip(data, size, max_part_size);
    archive::ZipError zip_result = zip.open();
    if (zip_result != archive::ZipError::Ok) {
        return core::makeError(core::ErrorCode::ExcelProcessing,
                               fmt::format("File is not a valid spreadsheet package: {}", archive::toString(zip_result)));
    }

    // 1. 定位 workbook.xml
    std::string workbook_path = "xl/workbook.xml";
    if (zip.fileExists("_rels/.rels") == archive::ZipError::Ok) {
        std::string root_rels_xml;
        if (auto read = readPart(zip, "_rels/.rels", root_rels_xml); !read) {
            return read.error();
        }
        RelationshipsParser root_rels;
        if (auto parsed = root_rels.parse(root_rels_xml, "_rels/.rels"); !parsed) {
            return parsed.error();
        }
        if (const auto* office = root_rels.findByType(xml::RelationshipType::kOfficeDocument)) {
            workbook_path = resolvePartPath("", office->target);
        }
    }

    std::string workbook_xml;
    if (auto read = readPart(zip, workbook_path, workbook_xml); !read) {
        return read.error();
    }
    WorkbookParser workbook_parser;
    if (auto parsed = workbook_parser.parse(workbook_xml); !parsed) {
        return parsed.error();
    }
    if (workbook_parser.getSheets().empty()) {
        return core::makeError(core::ErrorCode::ExcelProcessing, "Workbook contains no worksheets", workbook_path);
    }
    const SheetInfo& first_sheet = workbook_parser.getSheets().front();

    // 2. 工作簿关系：工作表与共享字符串
    const std::string workbook_dir = directoryOf(workbook_path);
    std::string sheet_path;
    std::string shared_strings_path;
    const std::string workbook_rels_path = relsPathFor(workbook_path);
    if (zip.fileExists(workbook_rels_path) == archive::ZipError::Ok) {
        std::string workbook_rels_xml;
        if (auto read = readPart(zip, workbook_rels_path, workbook_rels_xml); !read) {
            return read.error();
        }
        RelationshipsParser workbook_rels;
        if (auto parsed = workbook_rels.parse(workbook_rels_xml, workbook_rels_path); !parsed) {
            return parsed.error();
        }
        if (const auto* sheet_rel = workbook_rels.findById(first_sheet.rel_id)) {
            sheet_path = resolvePartPath(workbook_dir, sheet_rel->target);
        }
        if (const auto* sst_rel = workbook_rels.findByType(xml::RelationshipType::kSharedStrings)) {
            shared_strings_path = resolvePartPath(workbook_dir, sst_rel->target);
        }
    }
    if (sheet_path.empty()) {
        sheet_path = workbook_dir + "worksheets/sheet1.xml";
        READER_DEBUG("工作表 '{}' 的关系无法解析，使用默认路径 {}", first_sheet.name, sheet_path);
    }
    if (shared_strings_path.empty()) {
        shared_strings_path = workbook_dir + "sharedStrings.xml";
    }

    Workbook workbook;
    workbook.sheet_name_ = first_sheet.name;

    // 3. 共享字符串（可选）
    if (zip.fileExists(shared_strings_path) == archive::ZipError::Ok) {
        std::string sst_xml;
        if (auto read = readPart(zip, shared_strings_path, sst_xml); !read) {
            return read.error();
        }
        SharedStringsParser sst_parser;
        if (auto parsed = sst_parser.parse(sst_xml); !parsed) {
            return parsed.error();
        }
        workbook.shared_strings_ = sst_parser.takeStrings();
    }

    // 4. 工作表
    std::string sheet_xml;
    if (auto read = readPart(zip, sheet_path, sheet_xml); !read) {
        return read.error();
    }
    WorksheetParser sheet_parser;
    if (auto parsed = sheet_parser.parse(sheet_xml, sheet_path); !parsed) {
        return parsed.error();
    }
    workbook.rows_ = sheet_parser.takeRows();

    // 5. 超链接：单元格地址 -> 关系ID -> 目标；同一地址以第一个为准
    std::vector<HyperlinkRef> hyperlinks = sheet_parser.takeHyperlinks();
    for (auto& link : hyperlinks) {
        workbook.hyperlink_ids_.emplace(std::move(link.ref), std::move(link.rel_id));
    }
    const std::string sheet_rels_path = relsPathFor(sheet_path);
    if (!workbook.hyperlink_ids_.empty() && zip.fileExists(sheet_rels_path) == archive::ZipError::Ok) {
        std::string sheet_rels_xml;
        if (auto read = readPart(zip, sheet_rels_path, sheet_rels_xml); !read) {
            return read.error();
        }
        RelationshipsParser sheet_rels;
        if (auto parsed = sheet_rels.parse(sheet_rels_xml, sheet_rels_path); !parsed) {
            return parsed.error();
        }
        for (const auto& rel : sheet_rels.getRelationships()) {
            workbook.link_targets_.emplace(rel.id, rel.target);
        }
    }

    READER_INFO("打开工作表 '{}'：{} 行，{} 个共享字符串，{} 个超链接",
                workbook.sheet_name_, workbook.rows_.size(), workbook.shared_strings_.size(),
                workbook.hyperlink_ids_.size());
    return workbook;
}

core::VoidResult WorkbookReader::readPart(archive::ZipReader& zip, const std::string& path, std::string& content) {
    archive::ZipError result = zip.extractFile(path, content);
    if (result != archive::ZipError::Ok) {
        READER_WARN("读取部件失败: {} ({})", path, archive::toString(result));
        return zipFailure(result, path);
    }
    return core::VoidResult{};
}

std::string WorkbookReader::resolvePartPath(std::string_view source_dir, std::string_view target) {
    std::string combined;
    if (!target.empty() && target.front() == '/') {
        combined = std::string(target.substr(1));
    } else {
        combined = std::string(source_dir);
        combined.append(target.data(), target.size());
    }

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= combined.size()) {
        size_t slash = combined.find('/', start);
        if (slash == std::string::npos) {
            slash = combined.size();
        }
        std::string segment = combined.substr(start, slash - start);
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(std::move(segment));
        }
        start = slash + 1;
    }

    std::string resolved;
    for (const auto& segment : segments) {
        if (!resolved.empty()) {
            resolved += '/';
        }
        resolved += segment;
    }
    return resolved;
}

std::string WorkbookReader::relsPathFor(std::string_view part_path) {
    size_t slash = part_path.rfind('/');
    if (slash == std::string_view::npos) {
        return fmt::format("_rels/{}.rels", part_path);
    }
    return fmt::format("{}/_rels/{}.rels", part_path.substr(0, slash), part_path.substr(slash + 1));
}

std::string WorkbookReader::directoryOf(std::string_view part_path) {
    size_t slash = part_path.rfind('/');
    return slash == std::string_view::npos ? std::string() : std::string(part_path.substr(0, slash + 1));
}

}} // namespace sheetlink::reader
