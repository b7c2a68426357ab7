#include "sheetlink/archive/ZipWriter.hpp"
#include "sheetlink/core/Constants.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_strm_mem.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>

namespace sheetlink {
namespace archive {

ZipWriter::ZipWriter()
    : compression_level_(core::Constants::kCompressionLevel) {
}

ZipWriter::~ZipWriter() {
    cleanup();
}

ZipError ZipWriter::open() {
    cleanup();

    mem_stream_ = mz_stream_mem_create();
    if (!mem_stream_) {
        ARCHIVE_ERROR("Failed to create memory stream");
        return ZipError::InternalError;
    }
    mz_stream_mem_set_grow_size(mem_stream_, 128 * 1024);
    if (mz_stream_open(mem_stream_, nullptr, MZ_OPEN_MODE_CREATE) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open memory stream");
        cleanup();
        return ZipError::IoFail;
    }

    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        cleanup();
        return ZipError::InternalError;
    }

    mz_zip_writer_set_compress_method(zip_handle_, MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));

    int32_t result = mz_zip_writer_open(zip_handle_, mem_stream_, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip writer on memory stream, error: {}", result);
        cleanup();
        return ZipError::IoFail;
    }

    // 不写 Data Descriptor，提高与其他读取器的兼容性
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }

    is_open_ = true;
    written_paths_.clear();
    stats_ = Stats{};
    return ZipError::Ok;
}

ZipError ZipWriter::setCompressionLevel(int level) {
    if (level < 0 || level > 9) {
        ARCHIVE_ERROR("Invalid compression level: {}", level);
        return ZipError::InvalidParameter;
    }
    compression_level_ = level;
    if (zip_handle_) {
        mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));
    }
    return ZipError::Ok;
}

void ZipWriter::initializeFileInfo(void* file_info_ptr, const std::string& path, size_t size) const {
    mz_zip_file& file_info = *static_cast<mz_zip_file*>(file_info_ptr);
    file_info = {};
    file_info.filename = path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compressed_size = 0;
    file_info.compression_method = compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE;

    // 固定时间戳，保证输出可重复
    file_info.modified_date = static_cast<time_t>(core::Constants::kFixedEntryTime);
    file_info.creation_date = static_cast<time_t>(core::Constants::kFixedEntryTime);
    file_info.accessed_date = static_cast<time_t>(core::Constants::kFixedEntryTime);

    file_info.flag = 0;
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;
}

ZipError ZipWriter::addFile(std::string_view internal_path, std::string_view content) {
    if (!is_open_ || !zip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for writing");
        return ZipError::NotOpen;
    }
    if (internal_path.empty()) {
        return ZipError::InvalidParameter;
    }

    std::string path_str(internal_path);
    if (written_paths_.count(path_str)) {
        ARCHIVE_WARN("Entry {} already written", path_str);
        return ZipError::DuplicateEntry;
    }
    if (content.size() > static_cast<size_t>(INT32_MAX)) {
        return ZipError::TooLarge;
    }

    mz_zip_file file_info;
    initializeFileInfo(&file_info, path_str, content.size());

    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {}, error: {}", path_str, result);
        return ZipError::IoFail;
    }

    if (!content.empty()) {
        int32_t written = mz_zip_writer_entry_write(zip_handle_, content.data(), static_cast<int32_t>(content.size()));
        if (written != static_cast<int32_t>(content.size())) {
            ARCHIVE_ERROR("Short write for entry {}: {} of {} bytes", path_str, written, content.size());
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::IoFail;
        }
    }

    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry {}, error: {}", path_str, result);
        return ZipError::IoFail;
    }

    written_paths_.insert(path_str);
    stats_.entries_written++;
    stats_.bytes_written += content.size();
    return ZipError::Ok;
}

ZipError ZipWriter::finish(std::vector<uint8_t>& output) {
    if (!is_open_ || !zip_handle_) {
        return ZipError::NotOpen;
    }

    int32_t result = mz_zip_writer_close(zip_handle_);
    is_open_ = false;
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize zip archive, error: {}", result);
        cleanup();
        return ZipError::IoFail;
    }

    int32_t length = 0;
    const void* buffer = nullptr;
    if (mz_stream_mem_get_buffer_length(mem_stream_, &length) != MZ_OK ||
        mz_stream_mem_get_buffer(mem_stream_, &buffer) != MZ_OK || !buffer || length <= 0) {
        ARCHIVE_ERROR("Memory stream holds no archive data");
        cleanup();
        return ZipError::InternalError;
    }

    const uint8_t* bytes = static_cast<const uint8_t*>(buffer);
    output.assign(bytes, bytes + length);

    ARCHIVE_DEBUG("Zip archive finalized: {} entries, {} bytes raw, {} bytes packed",
                  stats_.entries_written, stats_.bytes_written, output.size());
    cleanup();
    return ZipError::Ok;
}

void ZipWriter::cleanup() {
    if (zip_handle_) {
        if (is_open_) {
            mz_zip_writer_close(zip_handle_);
        }
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }
    if (mem_stream_) {
        mz_stream_close(mem_stream_);
        mz_stream_mem_delete(&mem_stream_);
        mem_stream_ = nullptr;
    }
    is_open_ = false;
}

}} // namespace sheetlink::archive
