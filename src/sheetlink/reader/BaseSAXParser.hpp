#pragma once

#include "sheetlink/xml/XMLStreamReader.hpp"
#include "sheetlink/core/Expected.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sheetlink {
namespace reader {

/**
 * @brief SAX解析器基类 - 为各个包部件解析器提供统一的事件分发和属性工具
 *
 * 元素名与属性名在分发前去掉命名空间前缀（"x:row" -> "row"、"r:id" 保留原名），
 * 子类按本地名匹配即可兼容带前缀的文档。
 */
class BaseSAXParser {
public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @param xml_content XML内容
     * @param part_name 部件名，仅用于错误信息
     * @return 成功或 XmlParseError
     */
    core::VoidResult parseXML(std::string_view xml_content, std::string_view part_name);

    bool hasError() const { return has_error_; }
    const std::string& getErrorMessage() const { return error_message_; }

protected:
    // 子类重写的事件处理
    virtual void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 通用工具方法 ====================

    static std::string_view localName(std::string_view name) {
        size_t colon = name.find(':');
        return colon == std::string_view::npos ? name : name.substr(colon + 1);
    }

    static std::optional<std::string_view> findAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                                         std::string_view name) {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief 查找关系 ID 属性（r:id，前缀可能不同）
     */
    static std::optional<std::string_view> findRelationshipId(const std::vector<xml::XMLAttribute>& attributes) {
        for (const auto& attr : attributes) {
            size_t colon = attr.name.find(':');
            if (colon != std::string_view::npos && attr.name.substr(colon + 1) == "id" &&
                attr.name.substr(0, colon) != "xmlns") {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    static std::optional<int> findIntAttribute(const std::vector<xml::XMLAttribute>& attributes, std::string_view name);

    static std::string getAttributeOr(const std::vector<xml::XMLAttribute>& attributes, std::string_view name,
                                      std::string_view default_value) {
        auto val = findAttribute(attributes, name);
        return std::string(val ? *val : default_value);
    }

    // 文本收集：onEndElement 中通过 getCurrentText() 取得元素的直接文本
    void startCollectingText() { collecting_text_ = true; current_text_.clear(); }
    void stopCollectingText() { collecting_text_ = false; }
    const std::string& getCurrentText() const { return current_text_; }

    void setError(const std::string& message);

private:
    std::string current_text_;
    bool collecting_text_ = false;
    bool has_error_ = false;
    std::string error_message_;
};

}} // namespace sheetlink::reader
