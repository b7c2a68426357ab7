#pragma once

#include "sheetlink/reader/SheetModel.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sheetlink {
namespace reader {

class WorkbookReader;

/**
 * @brief 输入工作簿的只读视图（第一个工作表）
 *
 * 由 WorkbookReader::open 构造，持有解析后的行、共享字符串表和超链接映射，
 * 不引用原始字节缓冲区。
 */
class Workbook {
public:
    Workbook() = default;
    Workbook(Workbook&&) = default;
    Workbook& operator=(Workbook&&) = default;
    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;

    const std::string& sheetName() const { return sheet_name_; }

    /**
     * @brief 按文档顺序返回全部行，可重复遍历
     */
    const std::vector<Row>& rows() const { return rows_; }

    /**
     * @brief 单元格的解析文本（没有存储值时为空串）
     */
    std::string cellValue(const Cell& cell) const {
        return resolveCellValue(cell.value, shared_strings_);
    }

    /**
     * @brief 查找单元格的超链接目标
     * @param address 单元格地址，如 "A2"
     * @return 目标地址；没有超链接或关系ID无法解析时返回 std::nullopt
     */
    std::optional<std::string> hyperlinkFor(std::string_view address) const;

    size_t sharedStringCount() const { return shared_strings_.size(); }
    size_t hyperlinkCount() const { return hyperlink_ids_.size(); }

private:
    friend class WorkbookReader;

    std::string sheet_name_;
    std::vector<Row> rows_;
    std::vector<std::string> shared_strings_;
    std::unordered_map<std::string, std::string> hyperlink_ids_;   // 单元格地址 -> 关系ID
    std::unordered_map<std::string, std::string> link_targets_;    // 关系ID -> 目标
};

}} // namespace sheetlink::reader
