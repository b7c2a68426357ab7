#include "sheetlink/xml/XMLStreamReader.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include <climits>
#include <cstring>
#include <new>
#include <fmt/format.h>

namespace sheetlink {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attributes_.reserve(16);
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attributes_.clear();
    current_text_.clear();
    collecting_text_ = false;
    pending_exception_ = nullptr;
    elements_parsed_ = 0;
}

XMLParseError XMLStreamReader::parseFromString(std::string_view xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();

    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        handleError(XMLParseError::MemoryError, "XML document too large");
        return XMLParseError::MemoryError;
    }

    if (!initializeParser()) {
        return last_error_;
    }

    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        cleanupParser();
        return XMLParseError::MemoryError;
    }
    std::memcpy(expat_buffer, buffer, size);

    XML_Status status = XML_ParseBuffer(parser_, static_cast<int>(size), 1);

    if (pending_exception_) {
        cleanupParser();
        std::exception_ptr pending = pending_exception_;
        pending_exception_ = nullptr;
        std::rethrow_exception(pending);
    }

    // 回调异常通过 XML_StopParser 中止解析，错误已记录
    if (last_error_ == XMLParseError::CallbackError) {
        cleanupParser();
        return last_error_;
    }

    if (status == XML_STATUS_ERROR) {
        std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
            XML_GetCurrentLineNumber(parser_),
            XML_GetCurrentColumnNumber(parser_),
            XML_ErrorString(XML_GetErrorCode(parser_)));
        handleError(XMLParseError::ParseFailed, error_msg);
        cleanupParser();
        return XMLParseError::ParseFailed;
    }

    cleanupParser();
    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    return XMLParseError::Ok;
}

void XMLCALL XMLStreamReader::startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    std::string_view element_name{name, std::strlen(name)};

    reader->elements_parsed_++;

    try {
        // 属性视图直接引用 expat 缓冲区，只在本次回调内有效
        reader->attributes_.clear();
        if (attrs) {
            for (int i = 0; attrs[i] && attrs[i + 1]; i += 2) {
                reader->attributes_.emplace_back(std::string_view{attrs[i], std::strlen(attrs[i])},
                                                 std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
            }
        }

        if (reader->start_element_callback_) {
            reader->start_element_callback_(element_name, reader->attributes_, reader->current_depth_);
        }
    } catch (const std::bad_alloc&) {
        reader->deferOutOfMemory();
        return;
    } catch (const std::exception& e) {
        reader->failFromCallback("Start element", e);
        return;
    }

    reader->current_depth_++;
    reader->current_text_.clear();
    reader->collecting_text_ = true;
}

void XMLCALL XMLStreamReader::endElementHandler(void* user_data, const XML_Char* name) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    reader->current_depth_--;

    std::string_view element_name{name, std::strlen(name)};

    if (reader->collecting_text_ && !reader->current_text_.empty() && reader->text_callback_) {
        std::string_view text = reader->current_text_;
        if (reader->trim_whitespace_) {
            size_t start = text.find_first_not_of(" \t\n\r");
            size_t end = text.find_last_not_of(" \t\n\r");
            text = start == std::string_view::npos ? std::string_view{} : text.substr(start, end - start + 1);
        }
        if (!text.empty()) {
            try {
                reader->text_callback_(text, reader->current_depth_);
            } catch (const std::bad_alloc&) {
                reader->deferOutOfMemory();
                return;
            } catch (const std::exception& e) {
                reader->failFromCallback("Text", e);
                return;
            }
        }
    }

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::bad_alloc&) {
            reader->deferOutOfMemory();
            return;
        } catch (const std::exception& e) {
            reader->failFromCallback("End element", e);
            return;
        }
    }

    reader->current_text_.clear();
    // 结束标签之后的文本属于父元素的混合内容，不再收集
    reader->collecting_text_ = false;
}

void XMLCALL XMLStreamReader::characterDataHandler(void* user_data, const XML_Char* data, int len) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    if (reader->collecting_text_ && len > 0) {
        try {
            reader->current_text_.append(data, static_cast<size_t>(len));
        } catch (const std::bad_alloc&) {
            reader->deferOutOfMemory();
        }
    }
}

void XMLStreamReader::failFromCallback(const char* stage, const std::exception& e) {
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", stage, e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

// 内存不足不折算为解析错误，留给上层按 OutOfMemory 分类
void XMLStreamReader::deferOutOfMemory() {
    pending_exception_ = std::current_exception();
    last_error_ = XMLParseError::MemoryError;
    XML_StopParser(parser_, XML_FALSE);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;

    XML_DEBUG("XML parse error: {}", message);

    if (error_callback_) {
        int line = parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
        int column = parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : -1;
        error_callback_(error, message, line, column);
    }
}

}} // namespace sheetlink::xml
