#pragma once

#include <string>
#include <vector>

namespace sheetlink {
namespace xml {

// 常用关系类型
namespace RelationshipType {
constexpr const char* kOfficeDocument = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
constexpr const char* kWorksheet = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";
constexpr const char* kStyles = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";
constexpr const char* kSharedStrings = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/sharedStrings";
constexpr const char* kHyperlink = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink";
} // namespace RelationshipType

struct Relationship {
    std::string id;
    std::string type;
    std::string target;
    std::string target_mode; // "Internal" or "External"
};

/**
 * @brief 一个 .rels 部件的关系表
 */
class Relationships {
public:
    /**
     * @brief 添加关系并返回自动分配的 ID（rId1, rId2 ...）
     */
    std::string addRelationship(const std::string& type, const std::string& target,
                                const std::string& target_mode = "Internal");

    void addRelationship(const std::string& id, const std::string& type,
                         const std::string& target, const std::string& target_mode);

    std::string toXML() const;

    void clear() { relationships_.clear(); }
    size_t size() const { return relationships_.size(); }
    bool empty() const { return relationships_.empty(); }
    const std::vector<Relationship>& items() const { return relationships_; }

private:
    std::string generateId() const;

    std::vector<Relationship> relationships_;
};

}} // namespace sheetlink::xml
