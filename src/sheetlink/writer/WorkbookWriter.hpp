#pragma once

#include "sheetlink/writer/StylePalette.hpp"
#include "sheetlink/core/Expected.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sheetlink {
namespace writer {

/**
 * @brief 单工作表输出工作簿
 *
 * 在内存中收集单元格、列宽和外部超链接，save() 时生成完整的包：
 * [Content_Types].xml、_rels/.rels、xl/workbook.xml、xl/_rels/workbook.xml.rels、
 * xl/styles.xml、xl/worksheets/sheet1.xml 以及按需生成的工作表关系文件。
 *
 * 单元格文本以内联字符串写出，不生成共享字符串表。
 * 同样的内容总是产生逐字节相同的包。
 */
class WorkbookWriter {
public:
    explicit WorkbookWriter(std::string sheet_name);

    WorkbookWriter(const WorkbookWriter&) = delete;
    WorkbookWriter& operator=(const WorkbookWriter&) = delete;

    /**
     * @brief 写入单元格文本，已有内容和样式被覆盖
     * @param row 行号（1开始）
     * @param column 列号（1开始）
     * @param value 文本
     * @param style_id 样式索引，见 StyleId
     * @throws core::ParameterException 行列越界或样式不存在
     */
    void setCell(int row, int column, std::string_view value, int style_id = StyleId::kDefault);

    /**
     * @brief 修改已有单元格的样式（单元格不存在时创建空单元格）
     */
    void setCellStyle(int row, int column, int style_id);

    void setColumnWidth(int column, double width);

    /**
     * @brief 为单元格添加外部超链接，同一单元格重复添加时以最后一次为准
     */
    void addHyperlink(int row, int column, std::string_view url);

    /**
     * @brief 生成包数据
     * @return 包字节；ZIP 写出失败时返回 ZipError
     */
    core::Result<std::vector<uint8_t>> save() const;

    const std::string& sheetName() const { return sheet_name_; }
    const StylePalette& palette() const { return palette_; }
    size_t rowCount() const { return rows_.size(); }
    size_t hyperlinkCount() const { return hyperlinks_.size(); }

    // 生成单个部件，供测试直接检查
    std::string generateContentTypesXML() const;
    std::string generateRootRelsXML() const;
    std::string generateWorkbookXML() const;
    std::string generateWorkbookRelsXML() const;
    std::string generateWorksheetXML() const;
    std::string generateWorksheetRelsXML() const;

private:
    struct CellData {
        std::string value;
        int style_id = StyleId::kDefault;
    };

    struct HyperlinkEntry {
        std::string ref;
        std::string url;
        std::string rel_id;
    };

    void checkPosition(int row, int column) const;
    std::string dimensionRef() const;

    std::string sheet_name_;
    StylePalette palette_;
    std::map<int, std::map<int, CellData>> rows_;   // 行号 -> (列号 -> 单元格)
    std::map<int, double> column_widths_;
    std::vector<HyperlinkEntry> hyperlinks_;
};

}} // namespace sheetlink::writer
