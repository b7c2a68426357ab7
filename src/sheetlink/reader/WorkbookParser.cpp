#include "sheetlink/reader/WorkbookParser.hpp"

namespace sheetlink {
namespace reader {

void WorkbookParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name == "sheets") {
        in_sheets_ = true;
    } else if (name == "sheet" && in_sheets_) {
        SheetInfo info;
        info.name = getAttributeOr(attributes, "name", "");
        info.sheet_id = getAttributeOr(attributes, "sheetId", "");
        if (auto rid = findRelationshipId(attributes)) {
            info.rel_id = std::string(*rid);
        }
        sheets_.push_back(std::move(info));
    }
}

void WorkbookParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "sheets") {
        in_sheets_ = false;
    }
}

}} // namespace sheetlink::reader
