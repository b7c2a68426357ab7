#pragma once

#include "sheetlink/core/Expected.hpp"
#include "sheetlink/core/ProcessingOptions.hpp"
#include <cstdint>
#include <string_view>

namespace sheetlink {
namespace service {

/**
 * @brief 解析前的输入检查：空文件、大小上限、文件签名
 *
 * 接受 ZIP 包（50 4B 03 04）和 OLE2 复合文档（D0 CF 11 E0 A1 B1 1A E1）两种签名。
 * OLE2 在这里放行，由 WorkbookReader 报告不支持。
 * 失败时返回 InvalidFileFormat，修复建议放在 Error::context 中。
 */
class FileValidator {
public:
    enum class Signature {
        Unknown,
        Zip,
        Ole2
    };

    static core::VoidResult validate(const uint8_t* data, size_t size, const core::ProcessingOptions& options);

    static Signature detectSignature(const uint8_t* data, size_t size);
};

}} // namespace sheetlink::service
