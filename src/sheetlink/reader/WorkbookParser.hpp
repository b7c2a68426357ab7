#pragma once

#include "sheetlink/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace sheetlink {
namespace reader {

/**
 * @brief 工作表信息（来自 workbook.xml 的 <sheet> 元素）
 */
struct SheetInfo {
    std::string name;
    std::string sheet_id;
    std::string rel_id;
};

/**
 * @brief workbook.xml 解析器，只关心 <sheets> 中的工作表列表
 */
class WorkbookParser : public BaseSAXParser {
public:
    WorkbookParser() = default;
    ~WorkbookParser() override = default;

    core::VoidResult parse(std::string_view xml_content) {
        sheets_.clear();
        in_sheets_ = false;
        return parseXML(xml_content, "workbook");
    }

    const std::vector<SheetInfo>& getSheets() const { return sheets_; }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::vector<SheetInfo> sheets_;
    bool in_sheets_ = false;
};

}} // namespace sheetlink::reader
