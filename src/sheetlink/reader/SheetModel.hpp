#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace sheetlink {
namespace reader {

/**
 * @brief 共享字符串表中的索引（t="s"）
 */
struct SharedStringRef {
    size_t index = 0;
};

/**
 * @brief 内联字符串（t="inlineStr"，<is> 中各片段拼接后的文本）
 */
struct InlineString {
    std::string text;
};

/**
 * @brief 单元格存储值
 *
 * - std::monostate   : 没有 <v>
 * - SharedStringRef  : 共享字符串索引
 * - InlineString     : 内联字符串
 * - std::string      : <v> 中的字面文本（数字、布尔、公式结果字符串）
 */
using CellValue = std::variant<std::monostate, SharedStringRef, InlineString, std::string>;

struct Cell {
    std::string ref;        // 规范化后的地址，如 "B7"
    int row = 0;            // 1基
    int column = 0;         // 1基
    CellValue value;
};

struct Row {
    int index = 0;          // 1基
    std::vector<Cell> cells;   // 保持文档中的存储顺序
};

/**
 * @brief 工作表 <hyperlink> 元素（只保留外部链接需要的字段）
 */
struct HyperlinkRef {
    std::string ref;
    std::string rel_id;
};

/**
 * @brief 把存储值解析为文本
 * @param value 单元格存储值
 * @param shared_strings 共享字符串表
 * @return 解析后的文本；无值或共享字符串索引越界时返回空串
 */
std::string resolveCellValue(const CellValue& value, const std::vector<std::string>& shared_strings);

}} // namespace sheetlink::reader
