#include "sheetlink/reader/RelationshipsParser.hpp"

namespace sheetlink {
namespace reader {

namespace {

std::string_view typeSuffix(std::string_view type) {
    size_t slash = type.rfind('/');
    return slash == std::string_view::npos ? type : type.substr(slash + 1);
}

} // namespace

void RelationshipsParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name != "Relationship") {
        return;
    }
    xml::Relationship rel;
    rel.id = getAttributeOr(attributes, "Id", "");
    rel.type = getAttributeOr(attributes, "Type", "");
    rel.target = getAttributeOr(attributes, "Target", "");
    rel.target_mode = getAttributeOr(attributes, "TargetMode", "Internal");
    if (rel.id.empty()) {
        return;
    }
    relationships_.push_back(std::move(rel));
}

const xml::Relationship* RelationshipsParser::findById(std::string_view id) const {
    for (const auto& rel : relationships_) {
        if (rel.id == id) {
            return &rel;
        }
    }
    return nullptr;
}

const xml::Relationship* RelationshipsParser::findByType(std::string_view type) const {
    std::string_view wanted = typeSuffix(type);
    for (const auto& rel : relationships_) {
        if (typeSuffix(rel.type) == wanted) {
            return &rel;
        }
    }
    return nullptr;
}

}} // namespace sheetlink::reader
