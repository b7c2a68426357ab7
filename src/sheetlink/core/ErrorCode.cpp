#include "sheetlink/core/ErrorCode.hpp"

namespace sheetlink {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::OutOfMemory:
            return "Out of memory";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件/输入错误
        case ErrorCode::InvalidFileFormat:
            return "Invalid file format";
        case ErrorCode::IOError:
            return "I/O error";
        case ErrorCode::PermissionDenied:
            return "Permission denied";

        // 表格结构错误
        case ErrorCode::InvalidColumn:
            return "Invalid column";
        case ErrorCode::ExcelProcessing:
            return "Excel processing error";
        case ErrorCode::InvalidCellReference:
            return "Invalid cell reference";

        // ZIP/XML处理错误
        case ErrorCode::ZipError:
            return "ZIP error";
        case ErrorCode::XmlParseError:
            return "XML parse error";
        case ErrorCode::XmlMissingElement:
            return "Missing XML element";

        case ErrorCode::Unexpected:
            return "Unexpected error";

        default:
            return "Unknown error";
    }
}

const char* errorPrefix(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "";
        case ErrorCode::InvalidFileFormat:
            return "E001";
        case ErrorCode::InvalidColumn:
            return "E002";
        case ErrorCode::ExcelProcessing:
        case ErrorCode::InvalidCellReference:
        case ErrorCode::ZipError:
        case ErrorCode::XmlParseError:
        case ErrorCode::XmlMissingElement:
            return "E003";
        case ErrorCode::OutOfMemory:
            return "E010";
        case ErrorCode::IOError:
            return "E011";
        case ErrorCode::PermissionDenied:
            return "E012";
        default:
            return "E999";
    }
}

}} // namespace sheetlink::core
