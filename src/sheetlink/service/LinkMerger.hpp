#pragma once

#include "sheetlink/service/Results.hpp"
#include "sheetlink/core/ProcessingOptions.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sheetlink {
namespace service {

/**
 * @brief Title/URL 两列合并为超链接
 *
 * 输出 "Merged Links" 工作表：A 列为标题，B 列为原始地址文本。
 * 地址能通过 UrlSanitizer 时，A 列单元格获得指向规范化地址的超链接和超链接样式。
 * 地址无效的行照常输出（不带链接），标题与地址都为空的行跳过。
 * LinkRecord::row 为输出表中的行号。
 */
class LinkMerger {
public:
    explicit LinkMerger(const core::ProcessingOptions& options = core::ProcessingOptions())
        : options_(options) {}

    /**
     * @brief 从工作表中读取 "Title" 与 "URL" 两列并合并
     *
     * 两列分别定位，数据从两个表头行中较大者的下一行开始。
     * 只缺一列时报告 E002 并给出列名；两列都缺时报告 E003。
     */
    MergeResult merge(const uint8_t* data, size_t size) const;

    MergeResult merge(const std::vector<uint8_t>& input) const {
        return merge(input.data(), input.size());
    }

    /**
     * @brief 直接从两组平行数据生成合并结果，按较短的一组配对
     */
    MergeResult createMergedFile(const std::vector<std::string>& titles,
                                 const std::vector<std::string>& urls) const;

    const core::ProcessingOptions& options() const { return options_; }

private:
    struct MergeRow {
        std::string title;
        std::string url;
    };

    void buildOutput(const std::vector<MergeRow>& rows, MergeResult& result) const;

    core::ProcessingOptions options_;
};

}} // namespace sheetlink::service
