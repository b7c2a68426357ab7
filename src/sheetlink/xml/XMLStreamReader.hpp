#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <exception>
#include <expat.h>

namespace sheetlink {
namespace xml {

/**
 * @brief 基于libexpat的流式XML解析器
 *
 * 事件驱动：开始元素、结束元素、元素文本、错误。
 * 元素文本在结束标签处一次性回调（只包含该元素自身的直接文本）。
 * 实体引用由 expat 解码，回调拿到的是最终文本。
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    MemoryError,           // 内存错误
    CallbackError          // 回调函数抛出异常
};

constexpr bool operator!(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

// XML属性（仅在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v) : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    // 回调函数设置
    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }
    void setErrorCallback(ErrorCallback callback) { error_callback_ = std::move(callback); }

    // 解析选项设置
    void setTrimWhitespace(bool trim) { trim_whitespace_ = trim; }

    // 解析方法；回调中的 std::bad_alloc 在解析器释放后重新抛出
    XMLParseError parseFromString(std::string_view xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    size_t getElementsParsed() const { return elements_parsed_; }

private:
    static void XMLCALL startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* user_data, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* user_data, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    void handleError(XMLParseError error, const std::string& message);
    void failFromCallback(const char* stage, const std::exception& e);
    void deferOutOfMemory();

    XML_Parser parser_ = nullptr;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    std::vector<XMLAttribute> attributes_;
    std::string current_text_;
    bool collecting_text_ = false;
    std::exception_ptr pending_exception_;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    ErrorCallback error_callback_;

    bool trim_whitespace_ = true;
    size_t elements_parsed_ = 0;
};

}} // namespace sheetlink::xml
