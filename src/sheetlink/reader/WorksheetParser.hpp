#pragma once

#include "sheetlink/reader/BaseSAXParser.hpp"
#include "sheetlink/reader/SheetModel.hpp"
#include <string>
#include <vector>

namespace sheetlink {
namespace reader {

/**
 * @brief 工作表XML解析器
 *
 * 收集 <sheetData> 中的行和单元格，以及 <hyperlinks> 中的超链接引用。
 * 单元格按文档中的存储顺序保存；缺少 r 属性的行/单元格按前一个位置加一推断。
 * 公式、样式和其它工作表特性一律忽略。
 */
class WorksheetParser : public BaseSAXParser {
public:
    WorksheetParser() = default;
    ~WorksheetParser() override = default;

    core::VoidResult parse(std::string_view xml_content, std::string_view part_name);

    std::vector<Row> takeRows() { return std::move(rows_); }
    std::vector<HyperlinkRef> takeHyperlinks() { return std::move(hyperlinks_); }

    const std::vector<Row>& getRows() const { return rows_; }
    const std::vector<HyperlinkRef>& getHyperlinks() const { return hyperlinks_; }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    enum class CellType {
        Number,         // 默认，<v> 按字面文本处理
        SharedString,   // t="s"
        InlineString,   // t="inlineStr"
        Other           // t="b" / "str" / "e" 等，同样按字面文本处理
    };

    void beginRow(const std::vector<xml::XMLAttribute>& attributes);
    void beginCell(const std::vector<xml::XMLAttribute>& attributes);
    void finishCell();

    std::vector<Row> rows_;
    std::vector<HyperlinkRef> hyperlinks_;

    // 解析状态
    bool in_sheet_data_ = false;
    bool in_row_ = false;
    bool in_cell_ = false;
    bool in_inline_string_ = false;
    int phonetic_depth_ = 0;
    int last_row_index_ = 0;
    int last_column_ = 0;

    Cell current_cell_;
    CellType current_type_ = CellType::Number;
    bool has_value_ = false;
    std::string value_text_;
    std::string inline_text_;
};

}} // namespace sheetlink::reader
