#include "sheetlink/service/ErrorReporter.hpp"
#include "sheetlink/core/Exception.hpp"
#include <filesystem>
#include <ios>
#include <new>
#include <system_error>
#include <fmt/format.h>

namespace sheetlink {
namespace service {

namespace {

bool isPermissionError(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

std::string joinSuggestion(const std::string& message, const std::string& suggestion) {
    return suggestion.empty() ? message : fmt::format("{} {}", message, suggestion);
}

} // namespace

std::string ErrorReporter::formatMessage(core::ErrorCode code, const std::string& detail) {
    std::string body;
    switch (code) {
        case core::ErrorCode::OutOfMemory:
            body = "File is too large to process. Please reduce the file size and try again.";
            break;
        case core::ErrorCode::IOError:
            body = fmt::format("Could not read the file. Check if it is corrupted or locked. Details: {}", detail);
            break;
        case core::ErrorCode::PermissionDenied:
            body = "Permission denied while reading the file. Please check file permissions.";
            break;
        case core::ErrorCode::InvalidFileFormat:
        case core::ErrorCode::InvalidColumn:
        case core::ErrorCode::ExcelProcessing:
        case core::ErrorCode::InvalidCellReference:
        case core::ErrorCode::ZipError:
        case core::ErrorCode::XmlParseError:
        case core::ErrorCode::XmlMissingElement:
            body = detail;
            break;
        default:
            body = fmt::format("Error processing file: {}", detail);
            break;
    }
    const char* prefix = core::errorPrefix(code == core::ErrorCode::Ok ? core::ErrorCode::Unexpected : code);
    return fmt::format("{}: {}", prefix, body);
}

ErrorReport ErrorReporter::fromError(const core::Error& error) {
    core::ErrorCode code = error.isOk() ? core::ErrorCode::Unexpected : error.code;
    // 文件格式错误的 context 保存修复建议
    if (code == core::ErrorCode::InvalidFileFormat) {
        return ErrorReport{code, formatMessage(code, joinSuggestion(error.message, error.context))};
    }
    return ErrorReport{code, formatMessage(code, error.fullMessage())};
}

ErrorReport ErrorReporter::fromCurrentException() {
    try {
        throw;
    } catch (const core::ColumnNotFoundException& e) {
        return ErrorReport{core::ErrorCode::InvalidColumn,
                           formatMessage(core::ErrorCode::InvalidColumn, joinSuggestion(e.what(), e.getSuggestion()))};
    } catch (const core::FormatException& e) {
        return ErrorReport{core::ErrorCode::InvalidFileFormat,
                           formatMessage(core::ErrorCode::InvalidFileFormat, joinSuggestion(e.what(), e.getSuggestion()))};
    } catch (const core::SheetLinkException& e) {
        return ErrorReport{e.getErrorCode(), formatMessage(e.getErrorCode(), e.what())};
    } catch (const std::bad_alloc&) {
        return ErrorReport{core::ErrorCode::OutOfMemory, formatMessage(core::ErrorCode::OutOfMemory, "")};
    } catch (const std::filesystem::filesystem_error& e) {
        core::ErrorCode code = isPermissionError(e.code()) ? core::ErrorCode::PermissionDenied : core::ErrorCode::IOError;
        return ErrorReport{code, formatMessage(code, e.what())};
    } catch (const std::ios_base::failure& e) {
        return ErrorReport{core::ErrorCode::IOError, formatMessage(core::ErrorCode::IOError, e.what())};
    } catch (const std::system_error& e) {
        core::ErrorCode code = isPermissionError(e.code()) ? core::ErrorCode::PermissionDenied : core::ErrorCode::IOError;
        return ErrorReport{code, formatMessage(code, e.what())};
    } catch (const std::exception& e) {
        return ErrorReport{core::ErrorCode::Unexpected, formatMessage(core::ErrorCode::Unexpected, e.what())};
    }
}

}} // namespace sheetlink::service
