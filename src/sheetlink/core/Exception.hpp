/**
 * @file Exception.hpp
 * @brief SheetLink异常类定义
 *
 * 异常只在库内部使用：对外操作在最外层统一捕获，并转换为结果记录中的错误信息。
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "sheetlink/core/ErrorCode.hpp"

namespace sheetlink {
namespace core {

/**
 * @brief SheetLink基础异常类
 */
class SheetLinkException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    SheetLinkException(const std::string& message,
                       ErrorCode code = ErrorCode::InternalError,
                       const char* file = nullptr,
                       int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息（含错误码、位置与上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件格式异常（E001），附带给用户的修复建议
 */
class FormatException : public SheetLinkException {
public:
    FormatException(const std::string& message,
                    const std::string& suggestion = "",
                    const char* file = nullptr, int line = 0);

    const std::string& getSuggestion() const { return suggestion_; }

private:
    std::string suggestion_;
};

/**
 * @brief 列未找到异常（E002）
 */
class ColumnNotFoundException : public SheetLinkException {
public:
    ColumnNotFoundException(const std::string& column_name,
                            int search_rows,
                            const char* file = nullptr, int line = 0);

    const std::string& getColumnName() const { return column_name_; }
    int getSearchRows() const { return search_rows_; }
    std::string getSuggestion() const;

private:
    std::string column_name_;
    int search_rows_;
};

/**
 * @brief 表格结构异常（E003）
 */
class ProcessingException : public SheetLinkException {
public:
    ProcessingException(const std::string& message,
                        ErrorCode code = ErrorCode::ExcelProcessing,
                        const char* file = nullptr, int line = 0);
};

/**
 * @brief 读取输入失败（E011/E012）
 */
class IOException : public SheetLinkException {
public:
    IOException(const std::string& message,
                ErrorCode code = ErrorCode::IOError,
                const char* file = nullptr, int line = 0);
};

/**
 * @brief 内存相关异常（E010）
 */
class MemoryException : public SheetLinkException {
public:
    MemoryException(const std::string& message,
                    size_t requested_size = 0,
                    const char* file = nullptr, int line = 0);

    size_t getRequestedSize() const { return requested_size_; }

private:
    size_t requested_size_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public SheetLinkException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作顺序错误等
 */
class OperationException : public SheetLinkException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief 把 Error 转成对应类型的异常抛出
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace sheetlink::core

// 便捷宏定义，适用于 (message, detail, file, line) 形式的异常
#define SHEETLINK_THROW(ExceptionType, message, detail) \
    throw ExceptionType(message, detail, __FILE__, __LINE__)

#define SHEETLINK_THROW_IF(condition, ExceptionType, message, detail) \
    do { if (condition) { SHEETLINK_THROW(ExceptionType, message, detail); } } while(0)
