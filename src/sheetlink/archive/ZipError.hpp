#pragma once

namespace sheetlink {
namespace archive {

// ZIP 读写状态码
enum class ZipError {
    Ok,                   // 操作成功
    NotOpen,              // ZIP 未打开
    IoFail,               // 读写失败
    BadFormat,            // ZIP 格式错误
    TooLarge,             // 条目超出大小限制
    FileNotFound,         // 条目不存在
    InvalidParameter,     // 无效参数
    DuplicateEntry,       // 条目重复写入
    InternalError         // 内部错误
};

constexpr bool operator!(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok:               return "ok";
        case ZipError::NotOpen:          return "archive not open";
        case ZipError::IoFail:           return "I/O failure";
        case ZipError::BadFormat:        return "bad ZIP format";
        case ZipError::TooLarge:         return "entry too large";
        case ZipError::FileNotFound:     return "entry not found";
        case ZipError::InvalidParameter: return "invalid parameter";
        case ZipError::DuplicateEntry:   return "duplicate entry";
        default:                         return "internal error";
    }
}

}} // namespace sheetlink::archive
