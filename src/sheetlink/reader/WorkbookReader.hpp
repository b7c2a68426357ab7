#pragma once

#include "sheetlink/reader/Workbook.hpp"
#include "sheetlink/core/Expected.hpp"
#include "sheetlink/archive/ZipReader.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace sheetlink {
namespace reader {

/**
 * @brief 从内存缓冲区打开工作簿包并解析第一个工作表
 *
 * 解析路径：
 * 1. _rels/.rels 中的 officeDocument 关系定位 workbook.xml（缺省 xl/workbook.xml）
 * 2. workbook.xml 给出工作表列表，第一个 <sheet> 通过 workbook.xml.rels 定位部件（缺省 xl/worksheets/sheet1.xml）
 * 3. sharedStrings.xml 可选
 * 4. 工作表自身的 .rels 提供超链接目标
 *
 * 错误映射：
 * - OLE2 复合文档（旧版 .xls）：InvalidFileFormat
 * - 非法 ZIP / 缺少部件 / 没有工作表：ExcelProcessing
 * - XML 解析失败：XmlParseError
 * - 条目解压后超过上限：OutOfMemory
 */
class WorkbookReader {
public:
    static constexpr uint64_t kDefaultMaxPartSize = 256ull * 1024 * 1024;

    /**
     * @brief 打开工作簿
     * @param data 包数据
     * @param size 数据长度
     * @param max_part_size 单个部件解压后的大小上限
     */
    static core::Result<Workbook> open(const uint8_t* data, size_t size,
                                       uint64_t max_part_size = kDefaultMaxPartSize);

    /**
     * @brief 按 OPC 规则把关系目标解析为包内路径
     * @param source_dir 来源部件所在目录（如 "xl/"，根目录为空串）
     * @param target 关系中的 Target
     * @return 规范化后的包内路径（无前导斜杠，已消除 "." 和 ".."）
     */
    static std::string resolvePartPath(std::string_view source_dir, std::string_view target);

    /**
     * @brief 部件对应的关系文件路径，如 "xl/workbook.xml" -> "xl/_rels/workbook.xml.rels"
     */
    static std::string relsPathFor(std::string_view part_path);

private:
    static core::VoidResult readPart(archive::ZipReader& zip, const std::string& path, std::string& content);
    static std::string directoryOf(std::string_view part_path);
};

}} // namespace sheetlink::reader
