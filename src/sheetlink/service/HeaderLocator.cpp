#include "sheetlink/service/HeaderLocator.hpp"
#include "sheetlink/utils/StringUtils.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"

namespace sheetlink {
namespace service {

std::optional<HeaderMatch> HeaderLocator::findColumn(const reader::Workbook& workbook,
                                                     std::string_view column_name,
                                                     int max_rows) {
    // 空列名不参与匹配，否则会命中第一个空单元格
    if (utils::StringUtils::isBlank(column_name) || max_rows <= 0) {
        return std::nullopt;
    }

    int scanned = 0;
    for (const auto& row : workbook.rows()) {
        if (scanned++ >= max_rows) {
            break;
        }
        for (const auto& cell : row.cells) {
            if (utils::StringUtils::equalsIgnoreCase(workbook.cellValue(cell), column_name)) {
                SERVICE_DEBUG("Found column '{}' at {} (row {}, column {})",
                              column_name, cell.ref, row.index, cell.column);
                return HeaderMatch{row.index, cell.column};
            }
        }
    }
    return std::nullopt;
}

}} // namespace sheetlink::service
