#include "sheetlink/xml/XMLStreamReader.hpp"
#include "sheetlink/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

namespace sheetlink {
namespace xml {

class XMLStreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlink::Logger::getInstance().initialize("logs/XMLStreamReader_test.log",
                                                   sheetlink::Logger::Level::DEBUG,
                                                   false);
        reader_ = std::make_unique<XMLStreamReader>();
    }

    void TearDown() override {
        reader_.reset();
    }

    std::unique_ptr<XMLStreamReader> reader_;

    const std::string workbook_xml_ = R"(<?xml version="1.0" encoding="UTF-8"?>
<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"
          xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">
    <sheets>
        <sheet name="Links &amp; Notes" sheetId="1" r:id="rId1"/>
        <sheet name="Sheet2" sheetId="2" r:id="rId2"/>
    </sheets>
</workbook>)";
};

// 测试1: 元素顺序与深度
TEST_F(XMLStreamReaderTest, ElementsAndDepth) {
    std::vector<std::pair<std::string, int>> starts;
    std::vector<std::string> ends;

    reader_->setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>&, int depth) {
        starts.emplace_back(std::string(name), depth);
    });
    reader_->setEndElementCallback([&](std::string_view name, int) {
        ends.emplace_back(name);
    });

    ASSERT_EQ(reader_->parseFromString(workbook_xml_), XMLParseError::Ok);

    ASSERT_EQ(starts.size(), 4u);
    EXPECT_EQ(starts[0].first, "workbook");
    EXPECT_EQ(starts[0].second, 0);
    EXPECT_EQ(starts[1].first, "sheets");
    EXPECT_EQ(starts[1].second, 1);
    EXPECT_EQ(starts[2].first, "sheet");
    EXPECT_EQ(starts[2].second, 2);

    ASSERT_EQ(ends.size(), 4u);
    EXPECT_EQ(ends.back(), "workbook");
    EXPECT_EQ(reader_->getElementsParsed(), 4u);
}

// 测试2: 属性值已解码实体
TEST_F(XMLStreamReaderTest, AttributesAreDecoded) {
    std::vector<std::map<std::string, std::string>> sheets;

    reader_->setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>& attributes, int) {
        if (name != "sheet") {
            return;
        }
        std::map<std::string, std::string> values;
        for (const auto& attr : attributes) {
            values[std::string(attr.name)] = std::string(attr.value);
        }
        sheets.push_back(std::move(values));
    });

    ASSERT_EQ(reader_->parseFromString(workbook_xml_), XMLParseError::Ok);
    ASSERT_EQ(sheets.size(), 2u);
    EXPECT_EQ(sheets[0]["name"], "Links & Notes");
    EXPECT_EQ(sheets[0]["r:id"], "rId1");
    EXPECT_EQ(sheets[1]["sheetId"], "2");
}

// 测试3: 文本回调只包含元素的直接文本
TEST_F(XMLStreamReaderTest, TextIsDeliveredBeforeEndElement) {
    std::vector<std::string> events;

    reader_->setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>&, int) {
        events.push_back("start:" + std::string(name));
    });
    reader_->setTextCallback([&](std::string_view text, int) {
        events.push_back("text:" + std::string(text));
    });
    reader_->setEndElementCallback([&](std::string_view name, int) {
        events.push_back("end:" + std::string(name));
    });

    ASSERT_EQ(reader_->parseFromString("<si><t>  Hello &amp; bye  </t><t/></si>"), XMLParseError::Ok);

    std::vector<std::string> expected = {
        "start:si", "start:t", "text:Hello & bye", "end:t", "start:t", "end:t", "end:si"
    };
    EXPECT_EQ(events, expected);
}

TEST_F(XMLStreamReaderTest, TrimCanBeDisabled) {
    std::vector<std::string> texts;
    reader_->setTrimWhitespace(false);
    reader_->setTextCallback([&](std::string_view text, int) {
        texts.emplace_back(text);
    });

    ASSERT_EQ(reader_->parseFromString("<t xml:space=\"preserve\">  padded  </t>"), XMLParseError::Ok);
    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts[0], "  padded  ");
}

// 测试4: 格式错误的文档
TEST_F(XMLStreamReaderTest, MalformedXml) {
    std::vector<std::string> errors;
    reader_->setErrorCallback([&](XMLParseError, const std::string& message, int, int) {
        errors.push_back(message);
    });

    EXPECT_EQ(reader_->parseFromString("<root><unclosed></root>"), XMLParseError::ParseFailed);
    EXPECT_EQ(reader_->getLastError(), XMLParseError::ParseFailed);
    EXPECT_FALSE(reader_->getLastErrorMessage().empty());
    EXPECT_EQ(errors.size(), 1u);
}

TEST_F(XMLStreamReaderTest, EmptyInput) {
    EXPECT_EQ(reader_->parseFromString(""), XMLParseError::InvalidInput);
}

// 测试5: 回调抛出异常时中止解析
TEST_F(XMLStreamReaderTest, CallbackExceptionStopsParsing) {
    int sheets_seen = 0;
    reader_->setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>&, int) {
        if (name == "sheet") {
            ++sheets_seen;
            throw std::runtime_error("stop here");
        }
    });

    EXPECT_EQ(reader_->parseFromString(workbook_xml_), XMLParseError::CallbackError);
    EXPECT_EQ(sheets_seen, 1);
    EXPECT_NE(reader_->getLastErrorMessage().find("stop here"), std::string::npos);
}

// 内存不足不会被当作解析错误，解析器释放后原样抛出
TEST_F(XMLStreamReaderTest, OutOfMemoryInCallbackIsRethrown) {
    reader_->setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>&, int) {
        if (name == "sheet") {
            throw std::bad_alloc();
        }
    });
    int errors = 0;
    reader_->setErrorCallback([&](XMLParseError, const std::string&, int, int) {
        ++errors;
    });

    EXPECT_THROW(reader_->parseFromString(workbook_xml_), std::bad_alloc);
    EXPECT_EQ(reader_->getLastError(), XMLParseError::MemoryError);
    EXPECT_EQ(errors, 0);

    reader_->setStartElementCallback(nullptr);
    EXPECT_EQ(reader_->parseFromString("<a/>"), XMLParseError::Ok);
}

TEST_F(XMLStreamReaderTest, OutOfMemoryInTextCallbackIsRethrown) {
    reader_->setTextCallback([&](std::string_view, int) {
        throw std::bad_alloc();
    });

    EXPECT_THROW(reader_->parseFromString("<t>text</t>"), std::bad_alloc);
}

// 测试6: 同一个读取器可重复使用
TEST_F(XMLStreamReaderTest, ReaderIsReusable) {
    int elements = 0;
    reader_->setStartElementCallback([&](std::string_view, const std::vector<XMLAttribute>&, int) {
        ++elements;
    });

    EXPECT_EQ(reader_->parseFromString("<bad>"), XMLParseError::ParseFailed);
    elements = 0;
    EXPECT_EQ(reader_->parseFromString("<a><b/><c/></a>"), XMLParseError::Ok);
    EXPECT_EQ(elements, 3);
}

}} // namespace sheetlink::xml
