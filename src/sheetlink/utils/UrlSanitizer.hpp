#pragma once

#include "sheetlink/core/Constants.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace sheetlink {
namespace utils {

/**
 * @brief 把用户填写的文本整理成可以安全写入超链接的绝对 URL
 *
 * 规则依次为：
 * 1. 缺失或全空白 -> 无结果
 * 2. 去除首尾空白
 * 3. 超过 max_url_length -> 无结果
 * 4. 不以 http:// https:// mailto: 开头（不区分大小写）时补 https://
 * 5. 按绝对 URI 解析，格式错误 -> 无结果
 * 6. 协议只允许 http、https、mailto
 * 7. 返回规范化形式：协议与主机小写、去掉默认端口、空路径补 "/"、
 *    解析 "." 与 ".." 路径段、对空格与非 ASCII 字节做百分号编码
 */
class UrlSanitizer {
public:
    static std::optional<std::string> sanitize(std::string_view raw,
                                               int max_url_length = core::Constants::kDefaultMaxUrlLength);

    /**
     * @brief 可缺失输入的版本，缺失时直接返回无结果
     */
    static std::optional<std::string> sanitizeOptional(const std::optional<std::string>& raw,
                                                       int max_url_length = core::Constants::kDefaultMaxUrlLength);

    static bool isAllowedScheme(std::string_view scheme);
};

}} // namespace sheetlink::utils
