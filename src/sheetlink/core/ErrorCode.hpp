#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace sheetlink {
namespace core {

/**
 * @brief SheetLink统一错误码
 *
 * 按区间分组：
 * - 1-19   通用错误
 * - 20-39  文件/输入错误（对外映射为 E001/E011/E012）
 * - 40-59  表格结构错误（对外映射为 E002/E003）
 * - 60-79  ZIP/XML处理错误
 * - 90-99  兜底错误
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    OutOfMemory = 2,
    InternalError = 3,

    // 文件/输入错误 (20-39)
    InvalidFileFormat = 20,
    IOError = 21,
    PermissionDenied = 22,

    // 表格结构错误 (40-59)
    InvalidColumn = 40,
    ExcelProcessing = 41,
    InvalidCellReference = 42,

    // ZIP/XML处理错误 (60-79)
    ZipError = 60,
    XmlParseError = 61,
    XmlMissingElement = 62,

    // 兜底 (90-99)
    Unexpected = 99
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    explicit operator bool() const noexcept { return isError(); }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码对应的稳定前缀（E001、E002 ...），供调用方程序化匹配
 *
 * 内部错误码（ZIP/XML/单元格引用等）归并到 E003，未分类错误归并到 E999。
 */
const char* errorPrefix(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

inline Error success() {
    return Error(ErrorCode::Ok);
}

}} // namespace sheetlink::core
