#include "sheetlink/reader/WorksheetParser.hpp"
#include "sheetlink/utils/CellAddress.hpp"
#include "sheetlink/core/Constants.hpp"
#include <fast_float/fast_float.h>
#include <fmt/format.h>

namespace sheetlink {
namespace reader {

core::VoidResult WorksheetParser::parse(std::string_view xml_content, std::string_view part_name) {
    rows_.clear();
    hyperlinks_.clear();
    in_sheet_data_ = false;
    in_row_ = false;
    in_cell_ = false;
    in_inline_string_ = false;
    phonetic_depth_ = 0;
    last_row_index_ = 0;
    last_column_ = 0;
    return parseXML(xml_content, part_name);
}

void WorksheetParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name == "sheetData") {
        in_sheet_data_ = true;
    } else if (!in_sheet_data_) {
        if (name == "hyperlink") {
            auto ref = findAttribute(attributes, "ref");
            auto rel_id = findRelationshipId(attributes);
            // 只有带关系ID的超链接指向外部地址，location 形式的内部跳转不处理
            if (ref && rel_id) {
                hyperlinks_.push_back(HyperlinkRef{std::string(*ref), std::string(*rel_id)});
            }
        }
    } else if (name == "row") {
        beginRow(attributes);
    } else if (name == "c" && in_row_) {
        beginCell(attributes);
    } else if (!in_cell_) {
        return;
    } else if (name == "v") {
        startCollectingText();
    } else if (name == "is") {
        in_inline_string_ = true;
    } else if (name == "rPh") {
        phonetic_depth_++;
    } else if (name == "t" && in_inline_string_ && phonetic_depth_ == 0) {
        startCollectingText();
    }
}

void WorksheetParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "sheetData") {
        in_sheet_data_ = false;
    } else if (!in_sheet_data_) {
        return;
    } else if (name == "row") {
        in_row_ = false;
    } else if (name == "c") {
        if (in_cell_) {
            finishCell();
        }
    } else if (!in_cell_) {
        return;
    } else if (name == "v") {
        value_text_ = getCurrentText();
        has_value_ = true;
        stopCollectingText();
    } else if (name == "is") {
        in_inline_string_ = false;
    } else if (name == "rPh") {
        if (phonetic_depth_ > 0) {
            phonetic_depth_--;
        }
    } else if (name == "t" && in_inline_string_ && phonetic_depth_ == 0) {
        inline_text_ += getCurrentText();
        has_value_ = true;
        stopCollectingText();
    }
}

void WorksheetParser::beginRow(const std::vector<xml::XMLAttribute>& attributes) {
    auto index = findIntAttribute(attributes, "r");
    int row_index = (index && *index > 0) ? *index : last_row_index_ + 1;
    if (row_index > core::Constants::kMaxRows) {
        setError(fmt::format("Row index {} exceeds the worksheet limit", row_index));
        return;
    }

    Row row;
    row.index = row_index;
    rows_.push_back(std::move(row));

    last_row_index_ = row_index;
    last_column_ = 0;
    in_row_ = true;
}

void WorksheetParser::beginCell(const std::vector<xml::XMLAttribute>& attributes) {
    Row& row = rows_.back();

    current_cell_ = Cell{};
    current_cell_.row = row.index;
    current_cell_.column = last_column_ + 1;

    if (auto ref = findAttribute(attributes, "r")) {
        auto position = utils::CellAddress::parse(*ref);
        if (position) {
            current_cell_.column = position->column;
        } else {
            setError(fmt::format("Invalid cell reference '{}' in row {}", *ref, row.index));
        }
    }
    if (current_cell_.column > core::Constants::kMaxColumns) {
        setError(fmt::format("Column index {} exceeds the worksheet limit", current_cell_.column));
        current_cell_.column = core::Constants::kMaxColumns;
    }
    current_cell_.ref = utils::CellAddress::format(current_cell_.row, current_cell_.column);
    last_column_ = current_cell_.column;

    std::string_view type = findAttribute(attributes, "t").value_or("n");
    if (type == "s") {
        current_type_ = CellType::SharedString;
    } else if (type == "inlineStr") {
        current_type_ = CellType::InlineString;
    } else if (type == "n") {
        current_type_ = CellType::Number;
    } else {
        current_type_ = CellType::Other;
    }

    has_value_ = false;
    value_text_.clear();
    inline_text_.clear();
    phonetic_depth_ = 0;
    in_inline_string_ = false;
    in_cell_ = true;
}

void WorksheetParser::finishCell() {
    in_cell_ = false;
    in_inline_string_ = false;

    if (!has_value_) {
        current_cell_.value = std::monostate{};
    } else if (current_type_ == CellType::SharedString) {
        // 共享字符串索引 - 使用 fast_float 解析
        size_t index = 0;
        const char* begin = value_text_.data();
        const char* end = begin + value_text_.size();
        auto [ptr, ec] = fast_float::from_chars(begin, end, index);
        if (ec == std::errc() && ptr == end) {
            current_cell_.value = SharedStringRef{index};
        } else {
            setError(fmt::format("Invalid shared string index '{}' in cell {}", value_text_, current_cell_.ref));
        }
    } else if (current_type_ == CellType::InlineString && !inline_text_.empty()) {
        current_cell_.value = InlineString{std::move(inline_text_)};
    } else {
        current_cell_.value = std::move(value_text_);
    }

    rows_.back().cells.push_back(std::move(current_cell_));
    current_cell_ = Cell{};
}

}} // namespace sheetlink::reader
