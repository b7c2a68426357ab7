#include "sheetlink/xml/XMLStreamWriter.hpp"
#include "sheetlink/core/Exception.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace sheetlink {
namespace xml {

namespace {

// XML 1.0 只允许 \t \n \r 这三个控制字符
bool isDroppedControl(unsigned char c) {
    return c < 0x20 && c != '\t' && c != '\n' && c != '\r';
}

} // namespace

XMLStreamWriter::XMLStreamWriter() {
    buffer_.reserve(4096);
}

void XMLStreamWriter::startDocument() {
    buffer_.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        XML_WARN("Auto-closing unclosed element: {}", element_stack_.back());
        endElement();
    }
}

void XMLStreamWriter::startElement(std::string_view name) {
    if (name.empty()) {
        throw core::ParameterException("Element name cannot be empty", "name", __FILE__, __LINE__);
    }

    ensureElementClosed();

    buffer_.push_back('<');
    buffer_.append(name.data(), name.size());
    element_stack_.emplace_back(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        throw core::OperationException("No element to close", "endElement",
                                       core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }

    if (in_element_) {
        flushPendingAttributes();
        buffer_.append(" />");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_stack_.back());
        buffer_.push_back('>');
    }
    element_stack_.pop_back();
}

void XMLStreamWriter::writeEmptyElement(std::string_view name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::writeAttribute(std::string_view name, std::string_view value) {
    if (!in_element_) {
        throw core::OperationException("Cannot write attribute outside of element", "writeAttribute",
                                       core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    if (name.empty()) {
        throw core::ParameterException("Attribute name cannot be empty", "name", __FILE__, __LINE__);
    }
    pending_attributes_.push_back({std::string(name), std::string(value)});
}

void XMLStreamWriter::writeAttribute(std::string_view name, int value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeAttribute(std::string_view name, double value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeText(std::string_view text) {
    ensureElementClosed();
    appendEscapedText(buffer_, text);
}

void XMLStreamWriter::writeText(int value) {
    ensureElementClosed();
    buffer_.append(fmt::format("{}", value));
}

void XMLStreamWriter::writeTextElement(std::string_view name, std::string_view text) {
    startElement(name);
    writeText(text);
    endElement();
}

std::string XMLStreamWriter::release() {
    std::string out;
    out.swap(buffer_);
    element_stack_.clear();
    pending_attributes_.clear();
    in_element_ = false;
    return out;
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        flushPendingAttributes();
        buffer_.push_back('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::flushPendingAttributes() {
    for (const auto& attr : pending_attributes_) {
        buffer_.push_back(' ');
        buffer_.append(attr.name);
        buffer_.append("=\"");
        appendEscapedAttribute(buffer_, attr.value);
        buffer_.push_back('"');
    }
    pending_attributes_.clear();
}

void XMLStreamWriter::appendEscapedText(std::string& out, std::string_view text) {
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (ch) {
            case '&': out.append("&amp;"); break;
            case '<': out.append("&lt;"); break;
            case '>': out.append("&gt;"); break;
            default:
                if (!isDroppedControl(c)) {
                    out.push_back(ch);
                }
                break;
        }
    }
}

void XMLStreamWriter::appendEscapedAttribute(std::string& out, std::string_view value) {
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (ch) {
            case '&':  out.append("&amp;"); break;
            case '<':  out.append("&lt;"); break;
            case '>':  out.append("&gt;"); break;
            case '"':  out.append("&quot;"); break;
            case '\t': out.append("&#9;"); break;
            case '\n': out.append("&#10;"); break;
            case '\r': out.append("&#13;"); break;
            default:
                if (!isDroppedControl(c)) {
                    out.push_back(ch);
                }
                break;
        }
    }
}

}} // namespace sheetlink::xml
