#include "sheetlink/utils/UrlSanitizer.hpp"
#include "sheetlink/utils/StringUtils.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include <cctype>
#include <cstdint>
#include <vector>

namespace sheetlink {
namespace utils {

namespace {

enum class UrlPart { Path, Query, Fragment };

bool isHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

bool isSubDelim(unsigned char c) {
    switch (c) {
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
            return true;
        default:
            return false;
    }
}

void appendEscaped(std::string& out, unsigned char c) {
    static const char* kHex = "0123456789ABCDEF";
    out.push_back('%');
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0F]);
}

// 对路径、查询、片段中不允许出现的字节做百分号编码，已有的合法转义保持不变
std::string escapeComponent(std::string_view text, UrlPart part) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '%') {
            if (i + 2 < text.size() && isHexDigit(text[i + 1]) && isHexDigit(text[i + 2])) {
                out.push_back('%');
                out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(text[i + 1]))));
                out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(text[i + 2]))));
                i += 2;
            } else {
                appendEscaped(out, c);
            }
            continue;
        }
        bool allowed = isUnreserved(c) || isSubDelim(c) || c == ':' || c == '@' || c == '/';
        if (part != UrlPart::Path && c == '?') {
            allowed = true;
        }
        if (allowed) {
            out.push_back(static_cast<char>(c));
        } else {
            appendEscaped(out, c);
        }
    }
    return out;
}

// 解析 "." 与 ".." 路径段
std::string removeDotSegments(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t pos = 1;  // 跳过开头的 '/'
    bool trailing_slash = false;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        std::string_view segment = path.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        bool last = next == std::string_view::npos;
        if (segment == ".") {
            trailing_slash = last;
        } else if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            trailing_slash = last;
        } else {
            segments.push_back(segment);
            trailing_slash = false;
        }
        if (last) {
            break;
        }
        pos = next + 1;
    }

    std::string out;
    for (auto segment : segments) {
        out.push_back('/');
        out.append(segment.data(), segment.size());
    }
    if (trailing_slash || out.empty()) {
        out.push_back('/');
    }
    return out;
}

bool isValidHostChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c >= 0x80;
}

// 按 '.' 切分主机名，末尾的单个 '.' 不产生空标签
std::vector<std::string_view> splitLabels(std::string_view host) {
    if (!host.empty() && host.back() == '.') {
        host.remove_suffix(1);
    }
    std::vector<std::string_view> labels;
    size_t pos = 0;
    while (pos <= host.size()) {
        size_t next = host.find('.', pos);
        if (next == std::string_view::npos) {
            labels.push_back(host.substr(pos));
            break;
        }
        labels.push_back(host.substr(pos, next - pos));
        pos = next + 1;
    }
    return labels;
}

// IPv4 的一段：十进制、0x 开头的十六进制或 0 开头的八进制
std::optional<uint64_t> parseIPv4Part(std::string_view part) {
    int base = 10;
    if (part.size() > 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X')) {
        base = 16;
        part.remove_prefix(2);
    } else if (part.size() > 1 && part[0] == '0') {
        base = 8;
        part.remove_prefix(1);
    }
    if (part.empty() || part.size() > 11) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : part) {
        int digit = 0;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (base == 16 && isHexDigit(c)) {
            digit = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        } else {
            return std::nullopt;
        }
        if (digit >= base) {
            return std::nullopt;
        }
        value = value * static_cast<uint64_t>(base) + static_cast<uint64_t>(digit);
    }
    return value;
}

bool isNumericLabel(std::string_view label) {
    if (label.empty()) {
        return false;
    }
    if (label.size() > 2 && label[0] == '0' && (label[1] == 'x' || label[1] == 'X')) {
        for (char c : label.substr(2)) {
            if (!isHexDigit(c)) {
                return false;
            }
        }
        return true;
    }
    for (char c : label) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool isNumericHost(const std::vector<std::string_view>& labels) {
    for (auto label : labels) {
        if (!isNumericLabel(label)) {
            return false;
        }
    }
    return true;
}

// 数字主机名按 IPv4 规范化："1234" -> "0.0.4.210"，"127.1" -> "127.0.0.1"
std::optional<std::string> formatIPv4(const std::vector<std::string_view>& labels) {
    if (labels.empty() || labels.size() > 4) {
        return std::nullopt;
    }
    uint64_t address = 0;
    for (size_t i = 0; i < labels.size(); ++i) {
        auto part = parseIPv4Part(labels[i]);
        if (!part) {
            return std::nullopt;
        }
        if (i + 1 < labels.size()) {
            if (*part > 255) {
                return std::nullopt;
            }
            address |= *part << (8 * (3 - i));
        } else {
            // 最后一段填满剩余的字节
            uint64_t limit = uint64_t{1} << (8 * (4 - i));
            if (*part >= limit) {
                return std::nullopt;
            }
            address |= *part;
        }
    }
    return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF);
}

std::optional<std::string> normalizeHost(std::string_view host) {
    if (host.empty()) {
        return std::nullopt;
    }

    // IPv6 字面量
    if (host.front() == '[') {
        if (host.size() < 3 || host.back() != ']') {
            return std::nullopt;
        }
        for (char c : host.substr(1, host.size() - 2)) {
            if (!isHexDigit(c) && c != ':' && c != '.') {
                return std::nullopt;
            }
        }
        return StringUtils::toLower(host);
    }

    if (host.front() == '.' || host.find("..") != std::string_view::npos) {
        return std::nullopt;
    }
    for (char c : host) {
        if (!isValidHostChar(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    std::vector<std::string_view> labels = splitLabels(host);
    if (isNumericHost(labels)) {
        return formatIPv4(labels);
    }
    for (auto label : labels) {
        if (label.front() == '-' || label.back() == '-') {
            return std::nullopt;
        }
    }
    return StringUtils::toLower(host);
}

std::optional<std::string> normalizeUserInfo(std::string_view userinfo) {
    for (char c : userinfo) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7F) {
            return std::nullopt;
        }
    }
    return escapeComponent(userinfo, UrlPart::Fragment);
}

std::optional<std::string> sanitizeMailto(std::string_view rest) {
    if (rest.empty()) {
        return std::nullopt;
    }
    for (char c : rest) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7F) {
            return std::nullopt;
        }
    }
    return "mailto:" + std::string(rest);
}

std::optional<std::string> sanitizeHierarchical(const std::string& scheme, std::string_view rest) {
    // rest 为 "://" 之后的部分
    size_t authority_end = rest.find_first_of("/\\?#");
    std::string_view authority = rest.substr(0, authority_end);
    std::string_view tail = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    std::string userinfo_part;
    size_t at = authority.rfind('@');
    if (at != std::string_view::npos) {
        auto userinfo = normalizeUserInfo(authority.substr(0, at));
        if (!userinfo) {
            return std::nullopt;
        }
        userinfo_part = *userinfo + "@";
        authority = authority.substr(at + 1);
    }

    std::string_view host_text = authority;
    std::string_view port_text;
    bool has_port = false;
    size_t bracket = authority.rfind(']');
    size_t colon = authority.rfind(':');
    if (colon != std::string_view::npos && (bracket == std::string_view::npos || colon > bracket)) {
        host_text = authority.substr(0, colon);
        port_text = authority.substr(colon + 1);
        has_port = true;
    }

    auto host = normalizeHost(host_text);
    if (!host) {
        return std::nullopt;
    }

    std::string port_part;
    // "host:" 与省略端口等价
    if (has_port && !port_text.empty()) {
        if (port_text.size() > 5) {
            return std::nullopt;
        }
        long port = 0;
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            port = port * 10 + (c - '0');
        }
        if (port > 65535) {
            return std::nullopt;
        }
        bool is_default = (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
        if (!is_default) {
            port_part = ":" + std::to_string(port);
        }
    }

    // 反斜杠按路径分隔符处理
    std::string tail_text(tail);
    size_t tail_stop = tail_text.find_first_of("?#");
    for (size_t i = 0; i < tail_text.size() && i < tail_stop; ++i) {
        if (tail_text[i] == '\\') {
            tail_text[i] = '/';
        }
    }

    std::string_view remaining = tail_text;
    size_t fragment_pos = remaining.find('#');
    std::string_view fragment;
    bool has_fragment = fragment_pos != std::string_view::npos;
    if (has_fragment) {
        fragment = remaining.substr(fragment_pos + 1);
        remaining = remaining.substr(0, fragment_pos);
    }
    size_t query_pos = remaining.find('?');
    std::string_view query;
    bool has_query = query_pos != std::string_view::npos;
    if (has_query) {
        query = remaining.substr(query_pos + 1);
        remaining = remaining.substr(0, query_pos);
    }

    std::string path = remaining.empty() ? std::string("/") : removeDotSegments(remaining);

    std::string result = scheme + "://" + userinfo_part + *host + port_part + escapeComponent(path, UrlPart::Path);
    if (has_query) {
        result += "?" + escapeComponent(query, UrlPart::Query);
    }
    if (has_fragment) {
        result += "#" + escapeComponent(fragment, UrlPart::Fragment);
    }
    return result;
}

} // namespace

bool UrlSanitizer::isAllowedScheme(std::string_view scheme) {
    return scheme == "http" || scheme == "https" || scheme == "mailto";
}

std::optional<std::string> UrlSanitizer::sanitizeOptional(const std::optional<std::string>& raw, int max_url_length) {
    if (!raw) {
        return std::nullopt;
    }
    return sanitize(std::string_view(*raw), max_url_length);
}

std::optional<std::string> UrlSanitizer::sanitize(std::string_view raw, int max_url_length) {
    std::string_view trimmed = StringUtils::trim(raw);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (trimmed.size() > static_cast<size_t>(max_url_length)) {
        UTILS_DEBUG("URL rejected: length {} exceeds {}", trimmed.size(), max_url_length);
        return std::nullopt;
    }

    std::string candidate(trimmed);
    if (!StringUtils::startsWithIgnoreCase(candidate, "http://") &&
        !StringUtils::startsWithIgnoreCase(candidate, "https://") &&
        !StringUtils::startsWithIgnoreCase(candidate, "mailto:")) {
        candidate = "https://" + candidate;
    }

    size_t colon = candidate.find(':');
    std::string scheme = StringUtils::toLower(std::string_view(candidate).substr(0, colon));
    if (!isAllowedScheme(scheme)) {
        return std::nullopt;
    }

    std::string_view rest = std::string_view(candidate).substr(colon + 1);
    std::optional<std::string> result;
    if (scheme == "mailto") {
        result = sanitizeMailto(rest);
    } else {
        result = sanitizeHierarchical(scheme, rest.substr(2));
    }

    if (!result) {
        UTILS_DEBUG("URL rejected as malformed: {}", candidate);
    }
    return result;
}

}} // namespace sheetlink::utils
