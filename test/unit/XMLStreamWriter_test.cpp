#include "sheetlink/xml/XMLStreamWriter.hpp"
#include "sheetlink/xml/Relationships.hpp"
#include "sheetlink/xml/ContentTypes.hpp"
#include "sheetlink/utils/Logger.hpp"
#include "sheetlink/core/Exception.hpp"
#include <gtest/gtest.h>
#include <string>

namespace sheetlink {
namespace xml {

class XMLStreamWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlink::Logger::getInstance().initialize("logs/XMLStreamWriter_test.log",
                                                   sheetlink::Logger::Level::DEBUG,
                                                   false);
    }

    XMLStreamWriter writer_;
};

// 测试1: 文档声明
TEST_F(XMLStreamWriterTest, DocumentDeclaration) {
    writer_.startDocument();
    writer_.writeEmptyElement("root");
    writer_.endDocument();

    EXPECT_EQ(writer_.toString(),
              "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n<root />");
}

// 测试2: 嵌套元素与属性
TEST_F(XMLStreamWriterTest, NestedElementsWithAttributes) {
    writer_.startElement("row");
    writer_.writeAttribute("r", 3);
    writer_.startElement("c");
    writer_.writeAttribute("r", "A3");
    writer_.writeAttribute("s", 2);
    writer_.writeTextElement("v", "hello");
    writer_.endElement();
    writer_.endElement();

    EXPECT_EQ(writer_.toString(), "<row r=\"3\"><c r=\"A3\" s=\"2\"><v>hello</v></c></row>");
    EXPECT_EQ(writer_.depth(), 0u);
}

TEST_F(XMLStreamWriterTest, DoubleAttribute) {
    writer_.startElement("col");
    writer_.writeAttribute("width", 30.0);
    writer_.writeAttribute("height", 12.5);
    writer_.endElement();

    EXPECT_EQ(writer_.toString(), "<col width=\"30\" height=\"12.5\" />");
}

// 测试3: 文本转义
TEST_F(XMLStreamWriterTest, EscapesText) {
    writer_.startElement("t");
    writer_.writeText("Tom & Jerry <\"quoted\">");
    writer_.endElement();

    EXPECT_EQ(writer_.toString(), "<t>Tom &amp; Jerry &lt;\"quoted\"&gt;</t>");
}

TEST_F(XMLStreamWriterTest, EscapesAttributes) {
    writer_.startElement("a");
    writer_.writeAttribute("href", "https://example.com/?a=1&b=\"2\"");
    writer_.writeAttribute("note", "line1\nline2\tend\r");
    writer_.endElement();

    EXPECT_EQ(writer_.toString(),
              "<a href=\"https://example.com/?a=1&amp;b=&quot;2&quot;\" note=\"line1&#10;line2&#9;end&#13;\" />");
}

// 测试4: 丢弃 XML 1.0 不允许的控制字符
TEST_F(XMLStreamWriterTest, DropsInvalidControlCharacters) {
    std::string text = "a";
    text.push_back('\x01');
    text.push_back('b');
    text.push_back('\x1F');
    text.push_back('\n');

    std::string out;
    XMLStreamWriter::appendEscapedText(out, text);
    EXPECT_EQ(out, "ab\n");
}

TEST_F(XMLStreamWriterTest, PreservesUtf8) {
    writer_.writeTextElement("t", "链接标题 ü");
    EXPECT_EQ(writer_.toString(), "<t>链接标题 ü</t>");
}

// 测试5: 错误用法
TEST_F(XMLStreamWriterTest, EndElementWithoutStartThrows) {
    EXPECT_THROW(writer_.endElement(), core::OperationException);
}

TEST_F(XMLStreamWriterTest, AttributeOutsideElementThrows) {
    writer_.startElement("root");
    writer_.writeText("body");
    EXPECT_THROW(writer_.writeAttribute("late", "value"), core::OperationException);
}

TEST_F(XMLStreamWriterTest, EmptyNameThrows) {
    EXPECT_THROW(writer_.startElement(""), core::ParameterException);
    writer_.startElement("root");
    EXPECT_THROW(writer_.writeAttribute("", "value"), core::ParameterException);
}

// 测试6: endDocument 自动关闭未关闭的元素，release 重置状态
TEST_F(XMLStreamWriterTest, EndDocumentClosesOpenElementsAndReleaseResets) {
    writer_.startElement("a");
    writer_.startElement("b");
    writer_.writeText("x");
    writer_.endDocument();

    std::string out = writer_.release();
    EXPECT_EQ(out, "<a><b>x</b></a>");
    EXPECT_TRUE(writer_.toString().empty());
    EXPECT_EQ(writer_.depth(), 0u);
}

// 测试7: 关系与内容类型部件
TEST_F(XMLStreamWriterTest, RelationshipsXml) {
    Relationships rels;
    std::string id1 = rels.addRelationship(RelationshipType::kWorksheet, "worksheets/sheet1.xml");
    std::string id2 = rels.addRelationship(RelationshipType::kHyperlink, "https://example.com/", "External");
    EXPECT_EQ(id1, "rId1");
    EXPECT_EQ(id2, "rId2");

    std::string xml = rels.toXML();
    EXPECT_NE(xml.find("<Relationship Id=\"rId1\""), std::string::npos);
    EXPECT_NE(xml.find("Target=\"worksheets/sheet1.xml\" />"), std::string::npos);
    EXPECT_NE(xml.find("Target=\"https://example.com/\" TargetMode=\"External\""), std::string::npos);
}

TEST_F(XMLStreamWriterTest, ContentTypesXml) {
    ContentTypes types;
    types.addPackageDefaults();
    types.addOverride("/xl/workbook.xml",
                      "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml");

    std::string xml = types.toXML();
    EXPECT_NE(xml.find("<Default Extension=\"rels\""), std::string::npos);
    EXPECT_NE(xml.find("<Default Extension=\"xml\" ContentType=\"application/xml\" />"), std::string::npos);
    EXPECT_NE(xml.find("<Override PartName=\"/xl/workbook.xml\""), std::string::npos);
}

}} // namespace sheetlink::xml
