#pragma once

#include "sheetlink/reader/BaseSAXParser.hpp"
#include "sheetlink/xml/Relationships.hpp"
#include <string>
#include <vector>

namespace sheetlink {
namespace reader {

/**
 * @brief 关系文件解析器（*.rels）
 */
class RelationshipsParser : public BaseSAXParser {
public:
    RelationshipsParser() = default;
    ~RelationshipsParser() override = default;

    core::VoidResult parse(std::string_view xml_content, std::string_view part_name) {
        relationships_.clear();
        return parseXML(xml_content, part_name);
    }

    const std::vector<xml::Relationship>& getRelationships() const { return relationships_; }

    const xml::Relationship* findById(std::string_view id) const;

    /**
     * @brief 查找第一个指定类型的关系
     *
     * 类型按末尾的短名比较（".../officeDocument"），兼容 strict 命名空间。
     */
    const xml::Relationship* findByType(std::string_view type) const;

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}

private:
    std::vector<xml::Relationship> relationships_;
};

}} // namespace sheetlink::reader
