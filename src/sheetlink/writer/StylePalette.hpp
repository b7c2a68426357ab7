#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sheetlink {
namespace writer {

// 固定样式索引（cellXfs 中的位置），输出文档按位置引用
namespace StyleId {
constexpr int kDefault = 0;
constexpr int kBold = 1;
constexpr int kHyperlink = 2;       // 蓝色下划线
constexpr int kExtractHeader = 3;   // 粗体 + 浅蓝填充
constexpr int kCaption = 4;         // 灰色说明文字
constexpr int kMergeHeader = 5;     // 粗体 + 浅绿填充
} // namespace StyleId

/**
 * @brief 单个输出文档的样式表
 *
 * 每个 WorkbookWriter 持有自己的实例，不在调用之间共享。
 * standard() 构造的调色板保证 StyleId 中的 0-5 六个索引。
 */
class StylePalette {
public:
    struct Font {
        bool bold = false;
        bool underline = false;
        std::string color;      // ARGB，空串表示主题色
    };

    struct Fill {
        std::string pattern;    // none / gray125 / solid
        std::string fg_color;   // 仅 solid 使用
    };

    struct CellXf {
        int font_id = 0;
        int fill_id = 0;
        int border_id = 0;
    };

    StylePalette();

    /**
     * @brief 构造标准调色板（索引 0-5 见 StyleId）
     */
    static StylePalette standard();

    int addFont(const Font& font);
    int addFill(const Fill& fill);
    int addCellXf(const CellXf& xf);

    size_t fontCount() const { return fonts_.size(); }
    size_t fillCount() const { return fills_.size(); }
    size_t cellXfCount() const { return cell_xfs_.size(); }

    bool isValidStyle(int style_id) const {
        return style_id >= 0 && static_cast<size_t>(style_id) < cell_xfs_.size();
    }

    /**
     * @brief 生成 xl/styles.xml
     */
    std::string toXML() const;

private:
    std::vector<Font> fonts_;
    std::vector<Fill> fills_;
    std::vector<CellXf> cell_xfs_;
};

}} // namespace sheetlink::writer
