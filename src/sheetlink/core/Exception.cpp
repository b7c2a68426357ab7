/**
 * @file Exception.cpp
 * @brief SheetLink异常类实现
 */

#include "sheetlink/core/Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace sheetlink {
namespace core {

// SheetLinkException 实现
SheetLinkException::SheetLinkException(const std::string& message,
                                       ErrorCode code,
                                       const char* file,
                                       int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string SheetLinkException::getErrorCodeString() const {
    return fmt::format("{} {}", errorPrefix(error_code_), toString(error_code_));
}

std::string SheetLinkException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void SheetLinkException::addContext(const std::string& context) {
    context_.push_back(context);
}

// FormatException 实现
FormatException::FormatException(const std::string& message,
                                 const std::string& suggestion,
                                 const char* file, int line)
    : SheetLinkException(message, ErrorCode::InvalidFileFormat, file, line)
    , suggestion_(suggestion) {
}

// ColumnNotFoundException 实现
ColumnNotFoundException::ColumnNotFoundException(const std::string& column_name,
                                                 int search_rows,
                                                 const char* file, int line)
    : SheetLinkException(fmt::format("Column '{}' not found in the first {} rows of the spreadsheet.",
                                     column_name, search_rows),
                         ErrorCode::InvalidColumn, file, line)
    , column_name_(column_name)
    , search_rows_(search_rows) {
}

std::string ColumnNotFoundException::getSuggestion() const {
    return fmt::format("💡 Tip: Move the header row containing '{}' to row 1-{}, "
                       "or check the column name spelling (case-sensitive).",
                       column_name_, search_rows_);
}

// ProcessingException 实现
ProcessingException::ProcessingException(const std::string& message,
                                         ErrorCode code, const char* file, int line)
    : SheetLinkException(message, code, file, line) {
}

// IOException 实现
IOException::IOException(const std::string& message,
                         ErrorCode code, const char* file, int line)
    : SheetLinkException(message, code, file, line) {
}

// MemoryException 实现
MemoryException::MemoryException(const std::string& message,
                                 size_t requested_size, const char* file, int line)
    : SheetLinkException(message, ErrorCode::OutOfMemory, file, line)
    , requested_size_(requested_size) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : SheetLinkException(fmt::format("{} (parameter: {})", message, parameter_name),
                         ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// OperationException 实现
OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : SheetLinkException(fmt::format("{} (operation: {})", message, operation), code, file, line)
    , operation_(operation) {
}

void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidFileFormat:
            throw FormatException(error.message, error.context);
        case ErrorCode::OutOfMemory:
            throw MemoryException(error.fullMessage());
        case ErrorCode::IOError:
        case ErrorCode::PermissionDenied:
            throw IOException(error.fullMessage(), error.code);
        case ErrorCode::InvalidArgument:
            throw ParameterException(error.message, error.context);
        case ErrorCode::InvalidColumn:
        case ErrorCode::ExcelProcessing:
        case ErrorCode::InvalidCellReference:
        case ErrorCode::ZipError:
        case ErrorCode::XmlParseError:
        case ErrorCode::XmlMissingElement:
            throw ProcessingException(error.fullMessage(), error.code);
        default:
            throw SheetLinkException(error.fullMessage(), error.code);
    }
}

}} // namespace sheetlink::core
