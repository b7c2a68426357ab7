#include "sheetlink/writer/StylePalette.hpp"
#include "sheetlink/xml/XMLStreamWriter.hpp"
#include "sheetlink/core/Exception.hpp"

namespace sheetlink {
namespace writer {

StylePalette::StylePalette() {
    // 默认字体、Excel 要求的两个保留填充和默认格式
    fonts_.push_back(Font{});
    fills_.push_back(Fill{"none", ""});
    fills_.push_back(Fill{"gray125", ""});
    cell_xfs_.push_back(CellXf{});
}

StylePalette StylePalette::standard() {
    StylePalette palette;

    int bold_font = palette.addFont(Font{true, false, ""});
    int link_font = palette.addFont(Font{true, true, "FF0000FF"});
    int caption_font = palette.addFont(Font{false, false, "FF888888"});

    int blue_fill = palette.addFill(Fill{"solid", "FFD9EAF7"});
    int green_fill = palette.addFill(Fill{"solid", "FFD9F7E8"});

    palette.addCellXf(CellXf{bold_font, 0, 0});             // 1 粗体
    palette.addCellXf(CellXf{link_font, 0, 0});             // 2 超链接
    palette.addCellXf(CellXf{bold_font, blue_fill, 0});     // 3 提取模板表头
    palette.addCellXf(CellXf{caption_font, 0, 0});          // 4 说明文字
    palette.addCellXf(CellXf{bold_font, green_fill, 0});    // 5 合并表头
    return palette;
}

int StylePalette::addFont(const Font& font) {
    fonts_.push_back(font);
    return static_cast<int>(fonts_.size() - 1);
}

int StylePalette::addFill(const Fill& fill) {
    fills_.push_back(fill);
    return static_cast<int>(fills_.size() - 1);
}

int StylePalette::addCellXf(const CellXf& xf) {
    if (xf.font_id < 0 || static_cast<size_t>(xf.font_id) >= fonts_.size() ||
        xf.fill_id < 0 || static_cast<size_t>(xf.fill_id) >= fills_.size() ||
        xf.border_id != 0) {
        SHEETLINK_THROW(core::ParameterException, "Cell format references an unknown font, fill or border", "xf");
    }
    cell_xfs_.push_back(xf);
    return static_cast<int>(cell_xfs_.size() - 1);
}

std::string StylePalette::toXML() const {
    xml::XMLStreamWriter writer;
    writer.startDocument();

    writer.startElement("styleSheet");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");

    writer.startElement("fonts");
    writer.writeAttribute("count", static_cast<int>(fonts_.size()));
    for (const auto& font : fonts_) {
        writer.startElement("font");
        if (font.bold) {
            writer.writeEmptyElement("b");
        }
        if (font.underline) {
            writer.writeEmptyElement("u");
        }
        writer.startElement("sz");
        writer.writeAttribute("val", 11);
        writer.endElement(); // sz
        writer.startElement("color");
        if (font.color.empty()) {
            writer.writeAttribute("theme", 1);
        } else {
            writer.writeAttribute("rgb", font.color);
        }
        writer.endElement(); // color
        writer.startElement("name");
        writer.writeAttribute("val", "Calibri");
        writer.endElement(); // name
        writer.startElement("family");
        writer.writeAttribute("val", 2);
        writer.endElement(); // family
        writer.startElement("scheme");
        writer.writeAttribute("val", "minor");
        writer.endElement(); // scheme
        writer.endElement(); // font
    }
    writer.endElement(); // fonts

    writer.startElement("fills");
    writer.writeAttribute("count", static_cast<int>(fills_.size()));
    for (const auto& fill : fills_) {
        writer.startElement("fill");
        writer.startElement("patternFill");
        writer.writeAttribute("patternType", fill.pattern);
        if (!fill.fg_color.empty()) {
            writer.startElement("fgColor");
            writer.writeAttribute("rgb", fill.fg_color);
            writer.endElement(); // fgColor
            writer.startElement("bgColor");
            writer.writeAttribute("indexed", 64);
            writer.endElement(); // bgColor
        }
        writer.endElement(); // patternFill
        writer.endElement(); // fill
    }
    writer.endElement(); // fills

    // 只有一个空边框
    writer.startElement("borders");
    writer.writeAttribute("count", 1);
    writer.startElement("border");
    writer.writeEmptyElement("left");
    writer.writeEmptyElement("right");
    writer.writeEmptyElement("top");
    writer.writeEmptyElement("bottom");
    writer.writeEmptyElement("diagonal");
    writer.endElement(); // border
    writer.endElement(); // borders

    writer.startElement("cellStyleXfs");
    writer.writeAttribute("count", 1);
    writer.startElement("xf");
    writer.writeAttribute("numFmtId", 0);
    writer.writeAttribute("fontId", 0);
    writer.writeAttribute("fillId", 0);
    writer.writeAttribute("borderId", 0);
    writer.endElement(); // xf
    writer.endElement(); // cellStyleXfs

    writer.startElement("cellXfs");
    writer.writeAttribute("count", static_cast<int>(cell_xfs_.size()));
    for (const auto& xf : cell_xfs_) {
        writer.startElement("xf");
        writer.writeAttribute("numFmtId", 0);
        writer.writeAttribute("fontId", xf.font_id);
        writer.writeAttribute("fillId", xf.fill_id);
        writer.writeAttribute("borderId", xf.border_id);
        writer.writeAttribute("xfId", 0);
        if (xf.font_id != 0) {
            writer.writeAttribute("applyFont", 1);
        }
        if (xf.fill_id != 0) {
            writer.writeAttribute("applyFill", 1);
        }
        writer.endElement(); // xf
    }
    writer.endElement(); // cellXfs

    writer.startElement("cellStyles");
    writer.writeAttribute("count", 1);
    writer.startElement("cellStyle");
    writer.writeAttribute("name", "Normal");
    writer.writeAttribute("xfId", 0);
    writer.writeAttribute("builtinId", 0);
    writer.endElement(); // cellStyle
    writer.endElement(); // cellStyles

    writer.endElement(); // styleSheet
    writer.endDocument();
    return writer.release();
}

}} // namespace sheetlink::writer
