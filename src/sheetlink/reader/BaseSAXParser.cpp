#include "sheetlink/reader/BaseSAXParser.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include <charconv>

namespace sheetlink {
namespace reader {

core::VoidResult BaseSAXParser::parseXML(std::string_view xml_content, std::string_view part_name) {
    current_text_.clear();
    collecting_text_ = false;
    has_error_ = false;
    error_message_.clear();

    if (xml_content.empty()) {
        return core::makeError(core::ErrorCode::XmlParseError, "Empty XML content", std::string(part_name));
    }

    xml::XMLStreamReader reader;
    reader.setTrimWhitespace(false);
    reader.setStartElementCallback([this](std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
        onStartElement(localName(name), attributes, depth);
    });
    reader.setEndElementCallback([this](std::string_view name, int depth) {
        onEndElement(localName(name), depth);
        current_text_.clear();
    });
    reader.setTextCallback([this](std::string_view text, int depth) {
        if (collecting_text_) {
            current_text_.append(text.data(), text.size());
        }
        onText(text, depth);
    });

    // XML 层的错误覆盖子类记录的处理错误
    reader.setErrorCallback([this, part_name](xml::XMLParseError, const std::string& message, int line, int column) {
        has_error_ = true;
        error_message_ = message;
        READER_WARN("Failed to parse {} near line {}, column {}: {}", part_name, line, column, message);
    });

    if (reader.parseFromString(xml_content) != xml::XMLParseError::Ok) {
        return core::makeError(core::ErrorCode::XmlParseError, error_message_, std::string(part_name));
    }

    if (has_error_) {
        return core::makeError(core::ErrorCode::ExcelProcessing, error_message_, std::string(part_name));
    }
    return core::VoidResult{};
}

std::optional<int> BaseSAXParser::findIntAttribute(const std::vector<xml::XMLAttribute>& attributes, std::string_view name) {
    auto val = findAttribute(attributes, name);
    if (!val || val->empty()) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(val->data(), val->data() + val->size(), value);
    if (ec != std::errc() || ptr != val->data() + val->size()) {
        return std::nullopt;
    }
    return value;
}

void BaseSAXParser::setError(const std::string& message) {
    if (!has_error_) {
        has_error_ = true;
        error_message_ = message;
    }
}

}} // namespace sheetlink::reader
