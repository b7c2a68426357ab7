#pragma once

#include "sheetlink/reader/Workbook.hpp"
#include <optional>
#include <string_view>

namespace sheetlink {
namespace service {

/**
 * @brief 表头单元格的位置（1基行号与列号）
 */
struct HeaderMatch {
    int row = 0;
    int column = 0;
};

/**
 * @brief 在前若干行中查找列名
 *
 * 按文档顺序扫描前 max_rows 个行元素，行内按单元格的存储顺序扫描，
 * 列号取自单元格地址而不是单元格在行内的位置。
 * 单元格文本与列名不区分大小写完全相等即命中，返回第一个命中位置。
 */
class HeaderLocator {
public:
    static std::optional<HeaderMatch> findColumn(const reader::Workbook& workbook,
                                                 std::string_view column_name,
                                                 int max_rows);
};

}} // namespace sheetlink::service
