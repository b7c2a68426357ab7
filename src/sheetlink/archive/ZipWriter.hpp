#pragma once

#include "sheetlink/archive/ZipError.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sheetlink {
namespace archive {

/**
 * @brief 在内存中生成 ZIP 包
 *
 * 条目按 addFile 调用顺序写入，时间戳固定，相同输入产生逐字节相同的输出。
 */
class ZipWriter {
public:
    struct Stats {
        size_t entries_written = 0;
        size_t bytes_written = 0;
    };

    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    ZipError open();

    /**
     * 添加文件
     * @return 同一路径重复写入返回 DuplicateEntry
     */
    ZipError addFile(std::string_view internal_path, std::string_view content);

    /**
     * 写出中央目录并取回完整的包数据，之后写入器关闭
     */
    ZipError finish(std::vector<uint8_t>& output);

    /**
     * 设置压缩级别（0-9），0 表示 STORE
     */
    ZipError setCompressionLevel(int level);

    bool isOpen() const { return is_open_; }
    const Stats& getStats() const { return stats_; }

private:
    void cleanup();
    void initializeFileInfo(void* file_info_ptr, const std::string& path, size_t size) const;

    void* zip_handle_ = nullptr;
    void* mem_stream_ = nullptr;
    bool is_open_ = false;
    int compression_level_;
    std::unordered_set<std::string> written_paths_;
    Stats stats_;
};

}} // namespace sheetlink::archive
