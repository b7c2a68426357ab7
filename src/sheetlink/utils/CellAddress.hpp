#pragma once

#include "sheetlink/core/Expected.hpp"
#include <string>
#include <string_view>

namespace sheetlink {
namespace utils {

/**
 * @brief 单元格位置（行列均从1开始）
 */
struct CellPosition {
    int row = 0;
    int column = 0;

    bool operator==(const CellPosition& other) const {
        return row == other.row && column == other.column;
    }
};

/**
 * @brief 单元格地址换算
 *
 * 所有行列号均为1基索引，与工作表 XML 中的 r 属性一致：
 * - columnToLetters(1) == "A"，columnToLetters(28) == "AB"
 * - format(7, 2) == "B7"
 * - parse("B7") == {7, 2}
 */
class CellAddress {
public:
    /**
     * @brief 列号转换为字母表示（A, B, ..., Z, AA, AB, ...）
     * @param column 列号（1开始，最大 16384）
     * @throws core::ParameterException 列号越界
     */
    static std::string columnToLetters(int column);

    /**
     * @brief 字母列转换为列号（不区分大小写）
     * @return 列号（1开始）；非字母或越界时返回错误
     */
    static core::Result<int> lettersToColumn(std::string_view letters);

    /**
     * @brief 生成单元格引用（如 "B7"）
     */
    static std::string format(int row, int column);

    /**
     * @brief 生成范围引用（如 "A1:B3"）
     */
    static std::string formatRange(int first_row, int first_column, int last_row, int last_column);

    /**
     * @brief 解析单元格引用，接受 "$B$7" 形式的绝对引用
     */
    static core::Result<CellPosition> parse(std::string_view reference);
};

}} // namespace sheetlink::utils
