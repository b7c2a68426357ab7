#pragma once

#include "sheetlink/service/Results.hpp"
#include "sheetlink/core/ProcessingOptions.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

namespace sheetlink {
namespace reader {
class Workbook;
}

namespace service {

struct HeaderMatch;

/**
 * @brief 超链接提取
 *
 * 在输入工作表中定位目标列，生成 "Extracted Links" 工作表：
 * - 第1行复制原表头行（粗体），列号保持不变
 * - 表头之后的每个非空行按原列号复制到输出的下一行，空行丢弃
 * - 带超链接的单元格使用超链接样式；目标列中的超链接记录为 LinkRecord（源行号），
 *   并把链接地址以纯文本写入输出的第2列
 *
 * 所有错误都整理进结果记录，不向调用方抛异常。实例无状态，可在多个线程中并发调用。
 */
class LinkExtractor {
public:
    explicit LinkExtractor(const core::ProcessingOptions& options = core::ProcessingOptions())
        : options_(options) {}

    ExtractionResult extract(const uint8_t* data, size_t size, std::string_view column_name = "Title") const;

    ExtractionResult extract(const std::vector<uint8_t>& input, std::string_view column_name = "Title") const {
        return extract(input.data(), input.size(), column_name);
    }

    const core::ProcessingOptions& options() const { return options_; }

private:
    void buildOutput(const reader::Workbook& workbook, const HeaderMatch& header, ExtractionResult& result) const;

    core::ProcessingOptions options_;
};

}} // namespace sheetlink::service
