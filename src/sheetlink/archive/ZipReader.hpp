#pragma once

#include "sheetlink/archive/ZipError.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sheetlink {
namespace archive {

/**
 * @brief 从内存缓冲区读取 ZIP 包
 *
 * 不持有缓冲区，调用方需保证缓冲区在读取器生命周期内有效。
 * 每个实例只在一个调用内使用，不做内部加锁。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        int compression_method = 0;
        bool is_directory = false;
    };

    /**
     * @param data 包数据
     * @param size 数据长度
     * @param max_entry_size 单个条目解压后的大小上限，超出返回 TooLarge
     */
    ZipReader(const uint8_t* data, size_t size, uint64_t max_entry_size = 256ull * 1024 * 1024);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * 打开并建立条目索引
     * @return BadFormat 表示不是合法的 ZIP 包
     */
    ZipError open();
    void close();
    bool isOpen() const { return is_open_; }

    /**
     * 按包内顺序返回全部条目路径
     */
    std::vector<std::string> listFiles() const;

    ZipError fileExists(std::string_view internal_path) const;
    bool getEntryInfo(std::string_view internal_path, EntryInfo& info) const;

    /**
     * 提取条目内容到字符串
     * @return FileNotFound / TooLarge / IoFail
     */
    ZipError extractFile(std::string_view internal_path, std::string& content);

private:
    void cleanup();
    ZipError buildEntryIndex();

    const uint8_t* data_;
    size_t size_;
    uint64_t max_entry_size_;
    void* unzip_handle_ = nullptr;
    bool is_open_ = false;

    std::vector<std::string> entry_order_;
    std::unordered_map<std::string, EntryInfo> entry_index_;
};

}} // namespace sheetlink::archive
