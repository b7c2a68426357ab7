#pragma once

#include <cstddef>
#include <cstdint>

namespace sheetlink {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // I/O 缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;

    // 默认处理限制
    static constexpr size_t kDefaultMaxFileSizeMB = 10;
    static constexpr int kDefaultMaxHeaderSearchRows = 10;
    static constexpr int kDefaultMaxUrlLength = 2000;
    static constexpr int kMaxUrlLengthCeiling = 10000;

    // 输出包的压缩级别与固定时间戳（2020-01-01 00:00:00 UTC），保证输出可重复
    static constexpr int kCompressionLevel = 6;
    static constexpr int64_t kFixedEntryTime = 1577836800;

    // 工作表列数上限（XFD）
    static constexpr int kMaxColumns = 16384;
    static constexpr int kMaxRows = 1048576;
};

} // namespace core
} // namespace sheetlink
