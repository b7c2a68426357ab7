#include "sheetlink/service/FileValidator.hpp"
#include "sheetlink/utils/ModuleLoggers.hpp"
#include <cstring>
#include <fmt/format.h>

namespace sheetlink {
namespace service {

namespace {

constexpr uint8_t kZipSignature[] = {0x50, 0x4B, 0x03, 0x04};
constexpr uint8_t kOle2Signature[] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};

core::Error formatError(const std::string& message, const std::string& suggestion) {
    return core::makeError(core::ErrorCode::InvalidFileFormat, message, suggestion);
}

} // namespace

FileValidator::Signature FileValidator::detectSignature(const uint8_t* data, size_t size) {
    if (!data) {
        return Signature::Unknown;
    }
    if (size >= sizeof(kZipSignature) && std::memcmp(data, kZipSignature, sizeof(kZipSignature)) == 0) {
        return Signature::Zip;
    }
    if (size >= sizeof(kOle2Signature) && std::memcmp(data, kOle2Signature, sizeof(kOle2Signature)) == 0) {
        return Signature::Ole2;
    }
    return Signature::Unknown;
}

core::VoidResult FileValidator::validate(const uint8_t* data, size_t size, const core::ProcessingOptions& options) {
    if (!data || size == 0) {
        return formatError("The uploaded file is empty.", "Please select a file that contains data.");
    }

    if (size > options.max_file_size_bytes) {
        const double size_mb = static_cast<double>(size) / (1024.0 * 1024.0);
        const double limit_mb = static_cast<double>(options.max_file_size_bytes) / (1024.0 * 1024.0);
        SERVICE_WARN("Rejected input of {} bytes, limit is {} bytes", size, options.max_file_size_bytes);
        return formatError(fmt::format("File size ({:.1f} MB) exceeds maximum allowed size ({:.1f} MB).", size_mb, limit_mb),
                           "Please reduce the file size or split the data into multiple files.");
    }

    if (size < sizeof(kZipSignature)) {
        return formatError("The uploaded file is not a valid Excel file (too small to contain a file signature).",
                           "Please upload a spreadsheet saved in .xlsx format.");
    }

    if (detectSignature(data, size) == Signature::Unknown) {
        return formatError("The uploaded file is not a valid Excel file (unrecognized file signature).",
                           "Please upload a spreadsheet saved in .xlsx format.");
    }
    return core::VoidResult{};
}

}} // namespace sheetlink::service
