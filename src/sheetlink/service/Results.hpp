#pragma once

#include "sheetlink/core/ErrorCode.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sheetlink {
namespace service {

/**
 * @brief 单次调用的处理指标，供外部观测组件记录
 */
struct ProcessContext {
    size_t input_bytes = 0;
    int rows = 0;
    int64_t elapsed_ms = 0;
    core::ErrorCode error_code = core::ErrorCode::Ok;
};

/**
 * @brief 一条提取或合并得到的链接
 *
 * row 的含义因操作而不同：提取时为源表中的行号，合并时为输出表中的行号。
 */
struct LinkRecord {
    int row = 0;
    std::string title;
    std::string url;
};

struct ExtractionResult {
    int total_rows = 0;
    int links_found = 0;
    std::vector<LinkRecord> links;
    std::optional<std::vector<uint8_t>> output_file;
    std::optional<std::string> error_message;
    core::ErrorCode error_code = core::ErrorCode::Ok;
    ProcessContext context;

    bool isSuccess() const { return output_file.has_value() && !error_message.has_value(); }
};

struct MergeResult {
    int total_rows = 0;
    int links_created = 0;
    std::vector<LinkRecord> links;
    std::optional<std::vector<uint8_t>> output_file;
    std::optional<std::string> error_message;
    core::ErrorCode error_code = core::ErrorCode::Ok;
    ProcessContext context;

    bool isSuccess() const { return output_file.has_value() && !error_message.has_value(); }
};

}} // namespace sheetlink::service
