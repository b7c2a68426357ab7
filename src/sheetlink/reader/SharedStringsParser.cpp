#include "sheetlink/reader/SharedStringsParser.hpp"

namespace sheetlink {
namespace reader {

void SharedStringsParser::clear() {
    strings_.clear();
    current_string_.clear();
    in_si_ = false;
    phonetic_depth_ = 0;
}

void SharedStringsParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name == "sst") {
        // 按 uniqueCount 预分配
        if (auto unique_count = findIntAttribute(attributes, "uniqueCount"); unique_count && *unique_count > 0) {
            strings_.reserve(static_cast<size_t>(*unique_count));
        }
    } else if (name == "si") {
        in_si_ = true;
        current_string_.clear();
    } else if (name == "rPh") {
        phonetic_depth_++;
    } else if (name == "t" && in_si_ && phonetic_depth_ == 0) {
        startCollectingText();
    }
}

void SharedStringsParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "t") {
        if (in_si_ && phonetic_depth_ == 0) {
            current_string_ += getCurrentText();
        }
        stopCollectingText();
    } else if (name == "rPh") {
        if (phonetic_depth_ > 0) {
            phonetic_depth_--;
        }
    } else if (name == "si") {
        strings_.push_back(std::move(current_string_));
        current_string_.clear();
        in_si_ = false;
    }
}

}} // namespace sheetlink::reader
