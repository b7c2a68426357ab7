#include "sheetlink/xml/ContentTypes.hpp"
#include "sheetlink/xml/XMLStreamWriter.hpp"

namespace sheetlink {
namespace xml {

void ContentTypes::addDefault(const std::string& extension, const std::string& content_type) {
    default_types_.push_back({extension, content_type});
}

void ContentTypes::addOverride(const std::string& part_name, const std::string& content_type) {
    override_types_.push_back({part_name, content_type});
}

void ContentTypes::addPackageDefaults() {
    addDefault("rels", "application/vnd.openxmlformats-package.relationships+xml");
    addDefault("xml", "application/xml");
}

std::string ContentTypes::toXML() const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Types");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/package/2006/content-types");

    for (const auto& def : default_types_) {
        writer.startElement("Default");
        writer.writeAttribute("Extension", def.extension);
        writer.writeAttribute("ContentType", def.content_type);
        writer.endElement();
    }

    for (const auto& over : override_types_) {
        writer.startElement("Override");
        writer.writeAttribute("PartName", over.part_name);
        writer.writeAttribute("ContentType", over.content_type);
        writer.endElement();
    }

    writer.endElement(); // Types
    writer.endDocument();
    return writer.release();
}

}} // namespace sheetlink::xml
