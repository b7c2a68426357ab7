#include "sheetlink/reader/Workbook.hpp"

namespace sheetlink {
namespace reader {

std::string resolveCellValue(const CellValue& value, const std::vector<std::string>& shared_strings) {
    if (const auto* ref = std::get_if<SharedStringRef>(&value)) {
        return ref->index < shared_strings.size() ? shared_strings[ref->index] : std::string();
    }
    if (const auto* inline_string = std::get_if<InlineString>(&value)) {
        return inline_string->text;
    }
    if (const auto* literal = std::get_if<std::string>(&value)) {
        return *literal;
    }
    return std::string();
}

std::optional<std::string> Workbook::hyperlinkFor(std::string_view address) const {
    auto link = hyperlink_ids_.find(std::string(address));
    if (link == hyperlink_ids_.end()) {
        return std::nullopt;
    }
    auto target = link_targets_.find(link->second);
    if (target == link_targets_.end()) {
        return std::nullopt;
    }
    return target->second;
}

}} // namespace sheetlink::reader
