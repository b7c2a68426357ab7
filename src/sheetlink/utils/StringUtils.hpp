#pragma once

#include <string>
#include <string_view>
#include <cctype>

namespace sheetlink {
namespace utils {

/**
 * @brief 字符串辅助函数（ASCII 语义，按字节处理 UTF-8）
 */
class StringUtils {
public:
    static bool isSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    /**
     * @brief 去除前后空白字符
     */
    static std::string_view trim(std::string_view str) {
        size_t start = 0;
        size_t end = str.length();
        while (start < end && isSpace(str[start])) {
            ++start;
        }
        while (end > start && isSpace(str[end - 1])) {
            --end;
        }
        return str.substr(start, end - start);
    }

    static bool isBlank(std::string_view str) {
        return trim(str).empty();
    }

    /**
     * @brief 不区分大小写的比较
     */
    static bool equalsIgnoreCase(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    static bool startsWithIgnoreCase(std::string_view str, std::string_view prefix) {
        return str.size() >= prefix.size() && equalsIgnoreCase(str.substr(0, prefix.size()), prefix);
    }

    static std::string toLower(std::string_view str) {
        std::string result(str);
        for (auto& c : result) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return result;
    }
};

}} // namespace sheetlink::utils
