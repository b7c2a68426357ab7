#pragma once

#include "sheetlink/core/Expected.hpp"
#include <cstdint>
#include <vector>

namespace sheetlink {
namespace service {

/**
 * @brief 示例工作簿生成
 *
 * 两个模板都与输入无关，多次调用得到逐字节相同的输出，调用方可以按模板类型缓存。
 */
class TemplateGenerator {
public:
    /**
     * @brief 提取模板：Title/URL 表头（浅蓝）、两行带超链接的示例、一行灰色说明
     */
    static core::Result<std::vector<uint8_t>> extractionTemplate();

    /**
     * @brief 合并模板：Title/URL 表头（浅绿）、三行纯文本示例地址、一行灰色说明
     */
    static core::Result<std::vector<uint8_t>> mergeTemplate();
};

}} // namespace sheetlink::service
