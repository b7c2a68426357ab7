#pragma once

#include "sheetlink/core/Constants.hpp"
#include "sheetlink/core/Expected.hpp"
#include <cstddef>

namespace sheetlink {
namespace core {

/**
 * @file ProcessingOptions.hpp
 * @brief 单次提取/合并调用的处理限制
 *
 * 由调用方在配置加载时构造并 validate() 一次，之后按值传入各操作，调用期间不可变。
 */
struct ProcessingOptions {
    size_t max_file_size_bytes = Constants::kDefaultMaxFileSizeMB * 1024 * 1024;  // 输入文件大小上限
    int max_header_search_rows = Constants::kDefaultMaxHeaderSearchRows;           // 表头搜索行数
    int max_url_length = Constants::kDefaultMaxUrlLength;                          // URL 最大长度

    /**
     * @brief 以 MB 为单位构造文件大小上限，其余取默认值
     */
    static ProcessingOptions fromMegabytes(size_t max_file_size_mb) {
        ProcessingOptions options;
        options.max_file_size_bytes = max_file_size_mb * 1024 * 1024;
        return options;
    }

    /**
     * @brief 配置加载校验：max_url_length 不得超过 10000，各限制必须为正
     */
    VoidResult validate() const {
        if (max_file_size_bytes == 0) {
            return makeError(ErrorCode::InvalidArgument, "max file size must be positive", "max_file_size_bytes");
        }
        if (max_header_search_rows <= 0) {
            return makeError(ErrorCode::InvalidArgument, "header search rows must be positive", "max_header_search_rows");
        }
        if (max_url_length <= 0 || max_url_length > Constants::kMaxUrlLengthCeiling) {
            return makeError(ErrorCode::InvalidArgument,
                             fmt::format("max url length must be within 1-{}", Constants::kMaxUrlLengthCeiling),
                             "max_url_length");
        }
        return VoidResult{};
    }
};

}} // namespace sheetlink::core
