#pragma once

#include "sheetlink/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace sheetlink {
namespace reader {

/**
 * @brief 共享字符串表解析器
 *
 * 解析 xl/sharedStrings.xml。每个 <si> 产生一个条目，富文本的各个 <r><t> 片段按顺序拼接；
 * <rPh> 拼音注释中的 <t> 不计入文本。
 */
class SharedStringsParser : public BaseSAXParser {
public:
    SharedStringsParser() = default;
    ~SharedStringsParser() override = default;

    core::VoidResult parse(std::string_view xml_content) {
        clear();
        return parseXML(xml_content, "sharedStrings");
    }

    /**
     * @brief 根据索引获取字符串
     * @return 字符串内容，索引越界返回 nullptr
     */
    const std::string* getString(size_t index) const {
        return index < strings_.size() ? &strings_[index] : nullptr;
    }

    size_t getStringCount() const { return strings_.size(); }

    // 转移解析结果的所有权
    std::vector<std::string> takeStrings() { return std::move(strings_); }

    void clear();

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::vector<std::string> strings_;
    std::string current_string_;
    bool in_si_ = false;
    int phonetic_depth_ = 0;   // <rPh> 嵌套层数
};

}} // namespace sheetlink::reader
