#include "sheetlink/writer/WorkbookWriter.hpp"
#include "sheetlink/writer/StylePalette.hpp"
#include "sheetlink/archive/ZipReader.hpp"
#include "sheetlink/utils/Logger.hpp"
#include "sheetlink/core/Exception.hpp"
#include "TestPackages.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sheetlink {
namespace writer {

class WorkbookWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlink::Logger::getInstance().initialize("logs/WorkbookWriter_test.log",
                                                   sheetlink::Logger::Level::DEBUG,
                                                   false);
    }

    static bool contains(const std::string& text, const std::string& fragment) {
        return text.find(fragment) != std::string::npos;
    }
};

// 测试1: 样式表索引固定
TEST_F(WorkbookWriterTest, StandardPaletteIndices) {
    StylePalette palette = StylePalette::standard();
    EXPECT_EQ(palette.cellXfCount(), 6u);
    EXPECT_EQ(palette.fontCount(), 4u);
    EXPECT_EQ(palette.fillCount(), 4u);
    EXPECT_TRUE(palette.isValidStyle(StyleId::kDefault));
    EXPECT_TRUE(palette.isValidStyle(StyleId::kMergeHeader));
    EXPECT_FALSE(palette.isValidStyle(6));
    EXPECT_FALSE(palette.isValidStyle(-1));

    const std::string xml = palette.toXML();
    EXPECT_TRUE(contains(xml, R"(<fonts count="4">)"));
    EXPECT_TRUE(contains(xml, R"(<patternFill patternType="gray125" />)"));
    EXPECT_TRUE(contains(xml, R"(<fgColor rgb="FFD9EAF7" />)"));
    EXPECT_TRUE(contains(xml, R"(<cellXfs count="6">)"));
    // 超链接样式：下划线 + 蓝色
    EXPECT_TRUE(contains(xml, R"(<u /><sz val="11" /><color rgb="FF0000FF" />)"));
    EXPECT_TRUE(contains(xml, R"(<xf numFmtId="0" fontId="1" fillId="2" borderId="0" xfId="0" applyFont="1" applyFill="1" />)"));
}

TEST_F(WorkbookWriterTest, PaletteRejectsUnknownReferences) {
    StylePalette palette;
    EXPECT_EQ(palette.cellXfCount(), 1u);
    EXPECT_THROW(palette.addCellXf(StylePalette::CellXf{3, 0, 0}), core::ParameterException);
    EXPECT_THROW(palette.addCellXf(StylePalette::CellXf{0, 5, 0}), core::ParameterException);

    int font = palette.addFont(StylePalette::Font{true, false, ""});
    EXPECT_EQ(palette.addCellXf(StylePalette::CellXf{font, 1, 0}), 1);
}

// 测试2: 工作表 XML
TEST_F(WorkbookWriterTest, WorksheetXml) {
    WorkbookWriter writer("Links");
    writer.setCell(2, 3, "Hello & <world>", StyleId::kBold);
    writer.setCell(1, 1, "first");
    writer.setCell(4, 2, "  padded");
    writer.setColumnWidth(2, 42.5);

    const std::string xml = writer.generateWorksheetXML();
    EXPECT_TRUE(contains(xml, R"(<dimension ref="A1:C4" />)"));
    EXPECT_TRUE(contains(xml, R"(<col min="2" max="2" width="42.5" customWidth="1" />)"));
    EXPECT_TRUE(contains(xml, R"(<row r="1"><c r="A1" t="inlineStr"><is><t>first</t></is></c></row>)"));
    EXPECT_TRUE(contains(xml, R"(<c r="C2" s="1" t="inlineStr"><is><t>Hello &amp; &lt;world&gt;</t></is></c>)"));
    EXPECT_TRUE(contains(xml, R"(<t xml:space="preserve">  padded</t>)"));
    EXPECT_FALSE(contains(xml, "<hyperlinks>"));

    // 行按行号排序输出
    EXPECT_LT(xml.find(R"(<row r="1">)"), xml.find(R"(<row r="2">)"));
}

TEST_F(WorkbookWriterTest, DimensionForEmptyAndSingleCell) {
    WorkbookWriter empty("Empty");
    EXPECT_TRUE(contains(empty.generateWorksheetXML(), R"(<dimension ref="A1" />)"));

    WorkbookWriter single("Single");
    single.setCell(3, 2, "x");
    EXPECT_TRUE(contains(single.generateWorksheetXML(), R"(<dimension ref="B3" />)"));
}

TEST_F(WorkbookWriterTest, SetCellOverwritesAndRestyles) {
    WorkbookWriter writer("Sheet");
    writer.setCell(1, 1, "old", StyleId::kBold);
    writer.setCell(1, 1, "new");
    writer.setCellStyle(1, 2, StyleId::kCaption);

    const std::string xml = writer.generateWorksheetXML();
    EXPECT_TRUE(contains(xml, R"(<c r="A1" t="inlineStr"><is><t>new</t></is></c>)"));
    EXPECT_TRUE(contains(xml, R"(<c r="B1" s="4" />)"));
    EXPECT_EQ(writer.rowCount(), 1u);
}

TEST_F(WorkbookWriterTest, RejectsInvalidArguments) {
    WorkbookWriter writer("Sheet");
    EXPECT_THROW(writer.setCell(0, 1, "x"), core::ParameterException);
    EXPECT_THROW(writer.setCell(1, 16385, "x"), core::ParameterException);
    EXPECT_THROW(writer.setCell(1, 1, "x", 99), core::ParameterException);
    EXPECT_THROW(writer.setColumnWidth(1, 0.0), core::ParameterException);
    EXPECT_THROW(writer.setColumnWidth(1, 300.0), core::ParameterException);
    EXPECT_THROW(writer.addHyperlink(1048577, 1, "https://example.com/"), core::ParameterException);
}

// 测试3: 超链接关系
TEST_F(WorkbookWriterTest, HyperlinkRelationships) {
    WorkbookWriter writer("Links");
    writer.setCell(2, 1, "A", StyleId::kHyperlink);
    writer.addHyperlink(2, 1, "https://a.example/");
    writer.addHyperlink(3, 1, "https://b.example/?x=1&y=2");
    writer.addHyperlink(2, 1, "https://replaced.example/");

    EXPECT_EQ(writer.hyperlinkCount(), 2u);

    const std::string sheet = writer.generateWorksheetXML();
    EXPECT_TRUE(contains(sheet, R"(<hyperlink ref="A2" r:id="rId1" />)"));
    EXPECT_TRUE(contains(sheet, R"(<hyperlink ref="A3" r:id="rId2" />)"));

    const std::string rels = writer.generateWorksheetRelsXML();
    EXPECT_TRUE(contains(rels, R"(Target="https://replaced.example/" TargetMode="External")"));
    EXPECT_TRUE(contains(rels, R"(Target="https://b.example/?x=1&amp;y=2" TargetMode="External")"));
    EXPECT_FALSE(contains(rels, "https://a.example/"));
}

// 测试4: 工作簿部件
TEST_F(WorkbookWriterTest, WorkbookParts) {
    WorkbookWriter writer("Extracted Links");

    EXPECT_TRUE(contains(writer.generateWorkbookXML(), R"(<sheet name="Extracted Links" sheetId="1" r:id="rId1" />)"));

    const std::string workbook_rels = writer.generateWorkbookRelsXML();
    EXPECT_TRUE(contains(workbook_rels, R"(Id="rId1")"));
    EXPECT_TRUE(contains(workbook_rels, R"(Target="worksheets/sheet1.xml")"));
    EXPECT_TRUE(contains(workbook_rels, R"(Target="styles.xml")"));

    const std::string content_types = writer.generateContentTypesXML();
    EXPECT_TRUE(contains(content_types, R"(PartName="/xl/worksheets/sheet1.xml")"));
    EXPECT_TRUE(contains(content_types, R"(PartName="/xl/styles.xml")"));

    EXPECT_TRUE(contains(writer.generateRootRelsXML(), R"(Target="xl/workbook.xml")"));
}

// 测试5: 打包
TEST_F(WorkbookWriterTest, SaveProducesPackageInFixedOrder) {
    WorkbookWriter writer("Links");
    writer.setCell(1, 1, "Title");
    auto plain = writer.save();
    ASSERT_TRUE(plain) << plain.error().fullMessage();

    archive::ZipReader zip(plain.value().data(), plain.value().size());
    ASSERT_EQ(zip.open(), archive::ZipError::Ok);
    std::vector<std::string> expected = {
        "[Content_Types].xml", "_rels/.rels", "xl/workbook.xml", "xl/_rels/workbook.xml.rels",
        "xl/styles.xml", "xl/worksheets/sheet1.xml"
    };
    EXPECT_EQ(zip.listFiles(), expected);

    writer.addHyperlink(1, 1, "https://example.com/");
    auto linked = writer.save();
    ASSERT_TRUE(linked);
    archive::ZipReader linked_zip(linked.value().data(), linked.value().size());
    ASSERT_EQ(linked_zip.open(), archive::ZipError::Ok);
    EXPECT_EQ(linked_zip.listFiles().size(), 7u);
    EXPECT_EQ(linked_zip.listFiles().back(), "xl/worksheets/_rels/sheet1.xml.rels");

    // 同一写入器重复保存结果相同
    auto again = writer.save();
    ASSERT_TRUE(again);
    EXPECT_EQ(linked.value(), again.value());
}

}} // namespace sheetlink::writer
