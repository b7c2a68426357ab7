#pragma once

#include "sheetlink/core/ErrorCode.hpp"
#include <string>

namespace sheetlink {
namespace service {

/**
 * @brief 对外报告的错误：错误码与带前缀的最终信息（如 "E002: Column 'Title' not found ..."）
 */
struct ErrorReport {
    core::ErrorCode code = core::ErrorCode::Unexpected;
    std::string message;
};

/**
 * @brief 把内部错误整理为对外错误信息
 *
 * 前缀与信息格式：
 * - E001 文件格式：原信息 + 修复建议
 * - E002 列不存在：原信息 + 修复建议
 * - E003 包结构问题：原信息
 * - E010 内存不足 / E012 权限不足：固定文本
 * - E011 读取失败：固定文本 + 详情
 * - E999 其它：固定文本 + 详情
 */
class ErrorReporter {
public:
    static ErrorReport fromError(const core::Error& error);

    /**
     * @brief 转换当前正在处理的异常，只能在 catch 块中调用
     *
     * 识别 SheetLink 异常层次、std::bad_alloc、文件系统/流/系统错误，
     * 其余 std::exception 归为 E999。
     */
    static ErrorReport fromCurrentException();

    /**
     * @brief 按错误码生成带前缀的最终信息
     */
    static std::string formatMessage(core::ErrorCode code, const std::string& detail);
};

}} // namespace sheetlink::service
