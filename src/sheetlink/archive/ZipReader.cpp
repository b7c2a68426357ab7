#include "sheetlink/archive/ZipReader.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>

namespace sheetlink {
namespace archive {

ZipReader::ZipReader(const uint8_t* data, size_t size, uint64_t max_entry_size)
    : data_(data), size_(size), max_entry_size_(max_entry_size) {
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipError ZipReader::open() {
    cleanup();

    if (!data_ || size_ == 0) {
        return ZipError::InvalidParameter;
    }
    if (size_ > static_cast<size_t>(INT32_MAX)) {
        return ZipError::TooLarge;
    }

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    // minizip 接口要求非 const 指针，copy=0 时只读取不修改
    int32_t result = mz_zip_reader_open_buffer(unzip_handle_, const_cast<uint8_t*>(data_),
                                               static_cast<int32_t>(size_), 0);
    if (result != MZ_OK) {
        ARCHIVE_WARN("Buffer of {} bytes is not a readable zip archive, error: {}", size_, result);
        cleanup();
        return ZipError::BadFormat;
    }

    is_open_ = true;
    ZipError index_result = buildEntryIndex();
    if (index_result != ZipError::Ok) {
        cleanup();
        return index_result;
    }

    ARCHIVE_DEBUG("Opened zip archive from memory: {} bytes, {} entries", size_, entry_order_.size());
    return ZipError::Ok;
}

void ZipReader::close() {
    cleanup();
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entry_order_.clear();
    entry_index_.clear();
}

ZipError ZipReader::buildEntryIndex() {
    int32_t result = mz_zip_reader_goto_first_entry(unzip_handle_);
    if (result == MZ_END_OF_LIST) {
        return ZipError::Ok;
    }
    if (result != MZ_OK) {
        ARCHIVE_WARN("Failed to read first zip entry, error: {}", result);
        return ZipError::BadFormat;
    }

    do {
        mz_zip_file* info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &info) != MZ_OK || !info || !info->filename) {
            return ZipError::BadFormat;
        }

        EntryInfo entry;
        entry.path = info->filename;
        entry.compressed_size = static_cast<uint64_t>(info->compressed_size);
        entry.uncompressed_size = static_cast<uint64_t>(info->uncompressed_size);
        entry.compression_method = info->compression_method;
        entry.is_directory = mz_zip_reader_entry_is_dir(unzip_handle_) == MZ_OK;

        // 同名条目以最后一个为准
        if (entry_index_.find(entry.path) == entry_index_.end()) {
            entry_order_.push_back(entry.path);
        }
        entry_index_[entry.path] = std::move(entry);

        result = mz_zip_reader_goto_next_entry(unzip_handle_);
    } while (result == MZ_OK);

    if (result != MZ_END_OF_LIST) {
        ARCHIVE_WARN("Zip central directory is truncated, error: {}", result);
        return ZipError::BadFormat;
    }
    return ZipError::Ok;
}

std::vector<std::string> ZipReader::listFiles() const {
    return entry_order_;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    if (!is_open_) {
        return ZipError::NotOpen;
    }
    return entry_index_.count(std::string(internal_path)) ? ZipError::Ok : ZipError::FileNotFound;
}

bool ZipReader::getEntryInfo(std::string_view internal_path, EntryInfo& info) const {
    auto it = entry_index_.find(std::string(internal_path));
    if (it == entry_index_.end()) {
        return false;
    }
    info = it->second;
    return true;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    std::string path_str(internal_path);
    auto it = entry_index_.find(path_str);
    if (it == entry_index_.end()) {
        return ZipError::FileNotFound;
    }
    if (it->second.uncompressed_size > max_entry_size_) {
        ARCHIVE_WARN("Entry {} declares {} bytes, limit is {}", path_str,
                     it->second.uncompressed_size, max_entry_size_);
        return ZipError::TooLarge;
    }

    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0) != MZ_OK) {
        return ZipError::FileNotFound;
    }
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", path_str);
        return ZipError::IoFail;
    }

    // 按块读取，不信任头部声明的大小
    std::string buffer;
    buffer.reserve(static_cast<size_t>(it->second.uncompressed_size));
    char chunk[8192];
    int32_t bytes_read = 0;
    ZipError status = ZipError::Ok;
    while ((bytes_read = mz_zip_reader_entry_read(unzip_handle_, chunk, static_cast<int32_t>(sizeof(chunk)))) > 0) {
        buffer.append(chunk, static_cast<size_t>(bytes_read));
        if (buffer.size() > max_entry_size_) {
            status = ZipError::TooLarge;
            break;
        }
    }
    if (status == ZipError::Ok && bytes_read < 0) {
        ARCHIVE_WARN("Failed to inflate entry {}, error: {}", path_str, bytes_read);
        status = ZipError::BadFormat;
    }
    int32_t close_result = mz_zip_reader_entry_close(unzip_handle_);
    if (status == ZipError::Ok && close_result != MZ_OK) {
        ARCHIVE_WARN("Entry {} failed verification on close, error: {}", path_str, close_result);
        status = ZipError::BadFormat;
    }

    if (status != ZipError::Ok) {
        return status;
    }

    content.swap(buffer);
    ARCHIVE_DEBUG("Extracted {} ({} bytes)", path_str, content.size());
    return ZipError::Ok;
}

}} // namespace sheetlink::archive
