/**
 * @file XMLStreamWriter.hpp
 * @brief 内存缓冲的XML流写入器
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace sheetlink {
namespace xml {

/**
 * @brief 顺序写出 XML 文档到内存字符串
 *
 * 属性在元素开始标签关闭前缓存；没有内容的元素输出为自闭合形式 "<x />"。
 * 文本与属性值自动转义，XML 1.0 不允许的控制字符被丢弃。
 * 调用顺序错误（属性写在元素外、多余的 endElement）抛出异常。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter();

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    /**
     * @brief 文档操作
     */
    void startDocument();
    void endDocument();

    /**
     * @brief 元素操作
     */
    void startElement(std::string_view name);
    void endElement();
    void writeEmptyElement(std::string_view name);

    /**
     * @brief 属性操作
     */
    void writeAttribute(std::string_view name, std::string_view value);
    void writeAttribute(std::string_view name, int value);
    void writeAttribute(std::string_view name, double value);

    /**
     * @brief 文本内容操作
     */
    void writeText(std::string_view text);
    void writeText(int value);

    /**
     * @brief 写一个只含文本的元素：<name>text</name>
     */
    void writeTextElement(std::string_view name, std::string_view text);

    size_t depth() const { return element_stack_.size(); }
    const std::string& toString() const { return buffer_; }
    std::string release();

    static void appendEscapedText(std::string& out, std::string_view text);
    static void appendEscapedAttribute(std::string& out, std::string_view value);

private:
    struct PendingAttribute {
        std::string name;
        std::string value;
    };

    void ensureElementClosed();
    void flushPendingAttributes();

    std::string buffer_;
    std::vector<std::string> element_stack_;
    std::vector<PendingAttribute> pending_attributes_;
    bool in_element_ = false;
};

}} // namespace sheetlink::xml
