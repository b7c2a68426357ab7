#include "sheetlink/service/HeaderLocator.hpp"
#include "sheetlink/reader/WorkbookReader.hpp"
#include "sheetlink/utils/Logger.hpp"
#include "TestPackages.hpp"
#include <gtest/gtest.h>

namespace sheetlink {
namespace service {

class HeaderLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlink::Logger::getInstance().initialize("logs/HeaderLocator_test.log",
                                                   sheetlink::Logger::Level::DEBUG,
                                                   false);
    }

    static reader::Workbook open(const std::string& rows, const std::vector<std::string>& shared = {}) {
        auto bytes = test::buildWorkbook(test::worksheetXml(rows),
                                         shared.empty() ? std::string() : test::sharedStringsXml(shared));
        auto result = reader::WorkbookReader::open(bytes.data(), bytes.size());
        EXPECT_TRUE(result);
        return std::move(result).valueOrThrow();
    }
};

// 测试1: 第一行表头
TEST_F(HeaderLocatorTest, FindsHeaderInFirstRow) {
    auto workbook = open(test::row(1, test::inlineCell("A1", "Name") + test::inlineCell("B1", "Title")));

    auto match = HeaderLocator::findColumn(workbook, "Title", 10);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->row, 1);
    EXPECT_EQ(match->column, 2);
}

// 测试2: 不区分大小写，使用共享字符串
TEST_F(HeaderLocatorTest, MatchIsCaseInsensitive) {
    auto workbook = open(test::row(2, test::sharedCell("A2", 0) + test::sharedCell("B2", 1)), {"TITLE", "url"});

    auto title = HeaderLocator::findColumn(workbook, "Title", 10);
    ASSERT_TRUE(title);
    EXPECT_EQ(title->row, 2);
    EXPECT_EQ(title->column, 1);

    auto url = HeaderLocator::findColumn(workbook, "URL", 10);
    ASSERT_TRUE(url);
    EXPECT_EQ(url->column, 2);

    // 只做整串比较
    EXPECT_FALSE(HeaderLocator::findColumn(workbook, "Tit", 10));
}

// 测试3: 单元格存储顺序不代表列顺序
TEST_F(HeaderLocatorTest, UsesParsedColumnNotStoragePosition) {
    auto workbook = open(test::row(1, test::inlineCell("D1", "Title") + test::inlineCell("A1", "Other")));

    auto match = HeaderLocator::findColumn(workbook, "title", 10);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->column, 4);
}

// 测试4: 搜索行数限制
TEST_F(HeaderLocatorTest, RespectsSearchLimit) {
    auto workbook = open(test::row(1, test::inlineCell("A1", "Report")) +
                         test::row(2, test::inlineCell("A2", "Generated 2024")) +
                         test::row(3, test::inlineCell("A3", "Title")));

    EXPECT_FALSE(HeaderLocator::findColumn(workbook, "Title", 2));

    auto match = HeaderLocator::findColumn(workbook, "Title", 3);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->row, 3);
}

// 测试5: 第一次出现的位置优先
TEST_F(HeaderLocatorTest, FirstMatchWins) {
    auto workbook = open(test::row(1, test::inlineCell("C1", "Title") + test::inlineCell("E1", "Title")) +
                         test::row(2, test::inlineCell("A2", "Title")));

    auto match = HeaderLocator::findColumn(workbook, "Title", 10);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->row, 1);
    EXPECT_EQ(match->column, 3);
}

// 测试6: 空列名从不匹配
TEST_F(HeaderLocatorTest, BlankNameNeverMatches) {
    auto workbook = open(test::row(1, "<c r=\"A1\"/>" + test::inlineCell("B1", "Title")));

    EXPECT_FALSE(HeaderLocator::findColumn(workbook, "", 10));
    EXPECT_FALSE(HeaderLocator::findColumn(workbook, "   ", 10));
    EXPECT_FALSE(HeaderLocator::findColumn(workbook, "Title", 0));
}

}} // namespace sheetlink::service
