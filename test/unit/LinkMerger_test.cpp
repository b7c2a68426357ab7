#include "sheetlink/service/LinkMerger.hpp"
#include "sheetlink/reader/WorkbookReader.hpp"
#include "sheetlink/utils/Logger.hpp"
#include "TestPackages.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sheetlink {
namespace service {

class LinkMergerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlink::Logger::getInstance().initialize("logs/LinkMerger_test.log",
                                                   sheetlink::Logger::Level::DEBUG,
                                                   false);
    }

    static reader::Workbook openOutput(const MergeResult& result) {
        EXPECT_TRUE(result.output_file.has_value());
        const auto& bytes = *result.output_file;
        auto workbook = reader::WorkbookReader::open(bytes.data(), bytes.size());
        EXPECT_TRUE(workbook);
        return std::move(workbook).valueOrThrow();
    }

    static std::string textAt(const reader::Workbook& workbook, int row, int column) {
        for (const auto& r : workbook.rows()) {
            if (r.index != row) {
                continue;
            }
            for (const auto& cell : r.cells) {
                if (cell.column == column) {
                    return workbook.cellValue(cell);
                }
            }
        }
        return std::string();
    }

    LinkMerger merger_;
};

// 测试1: 标题与地址合并为超链接
TEST_F(LinkMergerTest, MergesTitleAndUrlColumns) {
    auto input = test::buildWorkbook(test::worksheetXml(
        test::row(1, test::inlineCell("A1", "Title") + test::inlineCell("B1", "URL")) +
        test::row(2, test::inlineCell("A2", "Google") + test::inlineCell("B2", "www.google.com")) +
        test::row(3, test::inlineCell("A3", "  GitHub  ") + test::inlineCell("B3", "https://github.com")) +
        test::row(4, test::inlineCell("A4", "Mail") + test::inlineCell("B4", "mailto:team@example.com"))));

    MergeResult result = merger_.merge(input);
    ASSERT_TRUE(result.isSuccess()) << result.error_message.value_or("");
    EXPECT_EQ(result.total_rows, 3);
    EXPECT_EQ(result.links_created, 3);

    ASSERT_EQ(result.links.size(), 3u);
    EXPECT_EQ(result.links[0].title, "Google");
    EXPECT_EQ(result.links[0].url, "https://www.google.com/");
    EXPECT_EQ(result.links[1].title, "GitHub");
    EXPECT_EQ(result.links[1].url, "https://github.com/");
    EXPECT_EQ(result.links[2].url, "mailto:team@example.com");

    auto output = openOutput(result);
    EXPECT_EQ(output.sheetName(), "Merged Links");
    EXPECT_EQ(textAt(output, 1, 1), "Title");
    EXPECT_EQ(textAt(output, 1, 2), "URL");
    EXPECT_EQ(textAt(output, 2, 1), "Google");
    // B 列保留原始（去空白后的）文本
    EXPECT_EQ(textAt(output, 2, 2), "www.google.com");
    EXPECT_EQ(textAt(output, 3, 1), "GitHub");

    EXPECT_EQ(output.hyperlinkCount(), 3u);
    EXPECT_EQ(output.hyperlinkFor("A2"), std::optional<std::string>("https://www.google.com/"));
    EXPECT_EQ(output.hyperlinkFor("A4"), std::optional<std::string>("mailto:team@example.com"));
    EXPECT_FALSE(output.hyperlinkFor("B2"));
}

// 测试2: 列顺序任意，表头可在不同行
TEST_F(LinkMergerTest, ColumnsInAnyOrderAndDifferentHeaderRows) {
    auto input = test::buildWorkbook(test::worksheetXml(
        test::row(1, test::inlineCell("C1", "title")) +
        test::row(2, test::inlineCell("A2", "url") + test::inlineCell("C2", "ignored")) +
        test::row(3, test::inlineCell("A3", "example.org") + test::inlineCell("C3", "Example"))));

    MergeResult result = merger_.merge(input);
    ASSERT_TRUE(result.isSuccess()) << result.error_message.value_or("");
    // 数据从较大的表头行之后开始
    EXPECT_EQ(result.total_rows, 1);
    ASSERT_EQ(result.links.size(), 1u);
    EXPECT_EQ(result.links[0].title, "Example");
    EXPECT_EQ(result.links[0].url, "https://example.org/");
}

// 测试3: 地址无效的行保留为纯文本
TEST_F(LinkMergerTest, InvalidUrlsStayPlainText) {
    auto input = test::buildWorkbook(test::worksheetXml(
        test::row(1, test::inlineCell("A1", "Title") + test::inlineCell("B1", "URL")) +
        test::row(2, test::inlineCell("A2", "Script") + test::inlineCell("B2", "javascript:alert(1)")) +
        test::row(3, test::inlineCell("A3", "No url")) +
        test::row(4, "<c r=\"A4\"/><c r=\"B4\"/>") +
        test::row(5, test::inlineCell("B5", "https://example.com")) +
        test::row(6, test::inlineCell("A6", "Broken") + test::inlineCell("B6", "https://exa mple.com"))));

    MergeResult result = merger_.merge(input);
    ASSERT_TRUE(result.isSuccess()) << result.error_message.value_or("");
    // 第4行标题与地址都为空，被跳过
    EXPECT_EQ(result.total_rows, 4);
    EXPECT_EQ(result.links_created, 1);
    ASSERT_EQ(result.links.size(), 1u);
    EXPECT_EQ(result.links[0].title, "");
    EXPECT_EQ(result.links[0].url, "https://example.com/");

    auto output = openOutput(result);
    EXPECT_EQ(textAt(output, 2, 1), "Script");
    EXPECT_EQ(textAt(output, 2, 2), "javascript:alert(1)");
    EXPECT_FALSE(output.hyperlinkFor("A2"));
    EXPECT_EQ(textAt(output, 3, 1), "No url");
    EXPECT_EQ(output.hyperlinkFor("A4"), std::optional<std::string>("https://example.com/"));
    EXPECT_EQ(textAt(output, 5, 1), "Broken");
    EXPECT_FALSE(output.hyperlinkFor("A5"));

    const std::string sheet = test::readPart(*result.output_file, "xl/worksheets/sheet1.xml");
    EXPECT_NE(sheet.find(R"(<c r="A1" s="5" t="inlineStr">)"), std::string::npos);
    EXPECT_NE(sheet.find(R"(<c r="A2" t="inlineStr">)"), std::string::npos);
    EXPECT_NE(sheet.find(R"(<c r="A4" s="2" />)"), std::string::npos);
}

// 测试4: URL 长度限制来自配置
TEST_F(LinkMergerTest, MaxUrlLengthOption) {
    core::ProcessingOptions options;
    options.max_url_length = 20;
    LinkMerger strict(options);

    auto input = test::buildWorkbook(test::worksheetXml(
        test::row(1, test::inlineCell("A1", "Title") + test::inlineCell("B1", "URL")) +
        test::row(2, test::inlineCell("A2", "Short") + test::inlineCell("B2", "a.io")) +
        test::row(3, test::inlineCell("A3", "Long") + test::inlineCell("B3", "https://example.com/a/very/long/path"))));

    MergeResult result = strict.merge(input);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.total_rows, 2);
    EXPECT_EQ(result.links_created, 1);
}

// 测试5: 缺少列
TEST_F(LinkMergerTest, MissingBothColumnsReportsE003) {
    auto input = test::buildWorkbook(test::worksheetXml(
        test::row(1, test::inlineCell("A1", "Name") + test::inlineCell("B1", "Link"))));

    MergeResult result = merger_.merge(input);
    EXPECT_FALSE(result.isSuccess());
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_EQ(result.error_message->rfind("E003: ", 0), 0u);
    EXPECT_NE(result.error_message->find("'Title' and 'URL'"), std::string::npos);
    EXPECT_EQ(result.error_code, core::ErrorCode::ExcelProcessing);
    EXPECT_FALSE(result.output_file.has_value());
}

TEST_F(LinkMergerTest, MissingUrlColumnReportsE002) {
    auto input = test::buildWorkbook(test::worksheetXml(
        test::row(1, test::inlineCell("A1", "Title") + test::inlineCell("B1", "Link"))));

    MergeResult result = merger_.merge(input);
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_EQ(result.error_message->rfind("E002: Column 'URL' not found", 0), 0u);
    EXPECT_EQ(result.error_code, core::ErrorCode::InvalidColumn);
    EXPECT_EQ(result.total_rows, 0);
    EXPECT_EQ(result.links_created, 0);
}

TEST_F(LinkMergerTest, MissingTitleColumnReportsE002) {
    auto input = test::buildWorkbook(test::worksheetXml(
        test::row(1, test::inlineCell("A1", "Name") + test::inlineCell("B1", "URL"))));

    MergeResult result = merger_.merge(input);
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_EQ(result.error_message->rfind("E002: Column 'Title' not found", 0), 0u);
}

// 测试6: 直接由列表生成
TEST_F(LinkMergerTest, CreateMergedFileFromLists) {
    std::vector<std::string> titles = {"Google", " Docs ", "Bad", "Extra"};
    std::vector<std::string> urls = {"google.com", "https://docs.example.com/a b", "file:///etc/passwd"};

    MergeResult result = merger_.createMergedFile(titles, urls);
    ASSERT_TRUE(result.isSuccess()) << result.error_message.value_or("");
    // 按较短的列表配对
    EXPECT_EQ(result.total_rows, 3);
    EXPECT_EQ(result.links_created, 2);
    ASSERT_EQ(result.links.size(), 2u);
    EXPECT_EQ(result.links[0].url, "https://google.com/");
    EXPECT_EQ(result.links[1].title, "Docs");
    EXPECT_EQ(result.links[1].url, "https://docs.example.com/a%20b");

    auto output = openOutput(result);
    EXPECT_EQ(textAt(output, 4, 1), "Bad");
    EXPECT_EQ(textAt(output, 4, 2), "file:///etc/passwd");
    EXPECT_FALSE(output.hyperlinkFor("A4"));
}

TEST_F(LinkMergerTest, CreateMergedFileWithEmptyLists) {
    MergeResult result = merger_.createMergedFile({}, {});
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.total_rows, 0);
    EXPECT_EQ(result.links_created, 0);

    auto output = openOutput(result);
    EXPECT_EQ(output.rows().size(), 1u);
}

}} // namespace sheetlink::service
