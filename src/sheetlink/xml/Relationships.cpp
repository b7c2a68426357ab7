#include "sheetlink/xml/Relationships.hpp"
#include "sheetlink/xml/XMLStreamWriter.hpp"
#include <fmt/format.h>

namespace sheetlink {
namespace xml {

std::string Relationships::addRelationship(const std::string& type, const std::string& target,
                                           const std::string& target_mode) {
    std::string id = generateId();
    relationships_.push_back({id, type, target, target_mode});
    return id;
}

void Relationships::addRelationship(const std::string& id, const std::string& type,
                                    const std::string& target, const std::string& target_mode) {
    relationships_.push_back({id, type, target, target_mode});
}

std::string Relationships::generateId() const {
    return fmt::format("rId{}", relationships_.size() + 1);
}

std::string Relationships::toXML() const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Relationships");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/package/2006/relationships");

    for (const auto& rel : relationships_) {
        writer.startElement("Relationship");
        writer.writeAttribute("Id", rel.id);
        writer.writeAttribute("Type", rel.type);
        writer.writeAttribute("Target", rel.target);
        if (!rel.target_mode.empty() && rel.target_mode != "Internal") {
            writer.writeAttribute("TargetMode", rel.target_mode);
        }
        writer.endElement(); // Relationship
    }

    writer.endElement(); // Relationships
    writer.endDocument();
    return writer.release();
}

}} // namespace sheetlink::xml
