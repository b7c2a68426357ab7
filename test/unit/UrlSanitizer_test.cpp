#include "sheetlink/utils/UrlSanitizer.hpp"
#include "sheetlink/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <optional>
#include <string>

namespace sheetlink {
namespace utils {

class UrlSanitizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlink::Logger::getInstance().initialize("logs/UrlSanitizer_test.log",
                                                   sheetlink::Logger::Level::DEBUG,
                                                   false);
    }

    static std::optional<std::string> sanitize(const std::string& raw, int max_length = 2000) {
        return UrlSanitizer::sanitize(std::string_view(raw), max_length);
    }
};

// 测试1: 缺失与空白输入
TEST_F(UrlSanitizerTest, BlankInputHasNoResult) {
    EXPECT_FALSE(sanitize(""));
    EXPECT_FALSE(sanitize("   "));
    EXPECT_FALSE(sanitize("\t\n"));
    EXPECT_FALSE(UrlSanitizer::sanitizeOptional(std::nullopt));
}

// 测试2: 缺少协议时补 https
TEST_F(UrlSanitizerTest, PrependsHttpsWhenSchemeMissing) {
    EXPECT_EQ(sanitize("example.com"), "https://example.com/");
    EXPECT_EQ(sanitize("www.example.com/docs"), "https://www.example.com/docs");
    EXPECT_EQ(sanitize("  example.com  "), "https://example.com/");
}

TEST_F(UrlSanitizerTest, KeepsHttpAndHttps) {
    EXPECT_EQ(sanitize("https://github.com"), "https://github.com/");
    EXPECT_EQ(sanitize("http://example.com/page?q=1#top"), "http://example.com/page?q=1#top");
    EXPECT_EQ(UrlSanitizer::sanitizeOptional(std::string("https://github.com")), "https://github.com/");
}

// 测试3: 规范化
TEST_F(UrlSanitizerTest, NormalizesSchemeAndHost) {
    EXPECT_EQ(sanitize("HTTPS://Example.COM/Path"), "https://example.com/Path");
    EXPECT_EQ(sanitize("HTTP://EXAMPLE.com"), "http://example.com/");
}

TEST_F(UrlSanitizerTest, DropsDefaultPorts) {
    EXPECT_EQ(sanitize("https://example.com:443/a"), "https://example.com/a");
    EXPECT_EQ(sanitize("http://example.com:80"), "http://example.com/");
    EXPECT_EQ(sanitize("http://example.com:8080"), "http://example.com:8080/");
    EXPECT_EQ(sanitize("https://example.com:80/"), "https://example.com:80/");
}

TEST_F(UrlSanitizerTest, EmptyPortMeansDefaultPort) {
    EXPECT_EQ(sanitize("https://example.com:"), "https://example.com/");
    EXPECT_EQ(sanitize("http://example.com:/docs"), "http://example.com/docs");
    EXPECT_EQ(sanitize("example.com:"), "https://example.com/");
}

TEST_F(UrlSanitizerTest, NumericHostsBecomeIPv4) {
    EXPECT_EQ(sanitize("https://1234"), "https://0.0.4.210/");
    EXPECT_EQ(sanitize("http://127.1/status"), "http://127.0.0.1/status");
    EXPECT_EQ(sanitize("http://192.168.0.10:8080"), "http://192.168.0.10:8080/");
    EXPECT_EQ(sanitize("http://0x7f.0.0.1"), "http://127.0.0.1/");
    EXPECT_EQ(sanitize("http://4294967295"), "http://255.255.255.255/");
    EXPECT_FALSE(sanitize("http://4294967296"));
    EXPECT_FALSE(sanitize("http://256.1.1.1"));
    EXPECT_FALSE(sanitize("http://1.2.3.4.5"));
    // 含字母的标签仍按域名处理
    EXPECT_EQ(sanitize("https://123.example.com"), "https://123.example.com/");
}

TEST_F(UrlSanitizerTest, RejectsHyphenAtLabelEdges) {
    EXPECT_FALSE(sanitize("http://-foo.com"));
    EXPECT_FALSE(sanitize("https://foo-.example.com"));
    EXPECT_FALSE(sanitize("https://example.-com"));
    EXPECT_EQ(sanitize("https://my-site.example.com"), "https://my-site.example.com/");
}

TEST_F(UrlSanitizerTest, ResolvesDotSegments) {
    EXPECT_EQ(sanitize("https://example.com/a/./b/../c"), "https://example.com/a/c");
    EXPECT_EQ(sanitize("https://example.com/../x"), "https://example.com/x");
    EXPECT_EQ(sanitize("https://example.com/a/b/"), "https://example.com/a/b/");
}

TEST_F(UrlSanitizerTest, PercentEncodesUnsafeBytes) {
    EXPECT_EQ(sanitize("https://example.com/a b"), "https://example.com/a%20b");
    EXPECT_EQ(sanitize("https://example.com/\xC3\xBC"), "https://example.com/%C3%BC");
    EXPECT_EQ(sanitize("https://example.com/%e4%b8%ad"), "https://example.com/%E4%B8%AD");
    EXPECT_EQ(sanitize("https://example.com/100%"), "https://example.com/100%25");
}

TEST_F(UrlSanitizerTest, BackslashBecomesPathSeparator) {
    EXPECT_EQ(sanitize("https://example.com\\docs\\index.html"), "https://example.com/docs/index.html");
}

// 测试4: mailto
TEST_F(UrlSanitizerTest, Mailto) {
    EXPECT_EQ(sanitize("mailto:someone@example.com"), "mailto:someone@example.com");
    EXPECT_EQ(sanitize("MAILTO:someone@example.com"), "mailto:someone@example.com");
    EXPECT_FALSE(sanitize("mailto:"));
    EXPECT_FALSE(sanitize("mailto:some one@example.com"));
}

// 测试5: 不安全的协议
TEST_F(UrlSanitizerTest, RejectsDisallowedSchemes) {
    EXPECT_FALSE(sanitize("javascript:alert(1)"));
    EXPECT_FALSE(sanitize("JavaScript:alert(document.cookie)"));
    EXPECT_FALSE(sanitize("file:///etc/passwd"));
    EXPECT_FALSE(sanitize("ftp://example.com/file"));
    EXPECT_FALSE(sanitize("data:text/html,<script>alert(1)</script>"));
}

// 测试6: 格式错误
TEST_F(UrlSanitizerTest, RejectsMalformedUrls) {
    EXPECT_FALSE(sanitize("https://"));
    EXPECT_FALSE(sanitize("https://exa mple.com"));
    EXPECT_FALSE(sanitize("https://example..com"));
    EXPECT_FALSE(sanitize("https://example.com:99999"));
    EXPECT_FALSE(sanitize("https://example.com:port"));
    EXPECT_FALSE(sanitize("not a url"));
}

// 测试7: 长度限制
TEST_F(UrlSanitizerTest, RejectsOverlongInput) {
    std::string long_url(2001, 'a');
    EXPECT_FALSE(sanitize(long_url));

    std::string at_limit = "https://example.com/" + std::string(1980, 'a');
    ASSERT_EQ(at_limit.size(), 2000u);
    EXPECT_TRUE(sanitize(at_limit));

    EXPECT_FALSE(sanitize("https://example.com/abc", 10));
}

TEST_F(UrlSanitizerTest, AllowedSchemes) {
    EXPECT_TRUE(UrlSanitizer::isAllowedScheme("http"));
    EXPECT_TRUE(UrlSanitizer::isAllowedScheme("https"));
    EXPECT_TRUE(UrlSanitizer::isAllowedScheme("mailto"));
    EXPECT_FALSE(UrlSanitizer::isAllowedScheme("javascript"));
    EXPECT_FALSE(UrlSanitizer::isAllowedScheme("HTTP"));
}

}} // namespace sheetlink::utils
