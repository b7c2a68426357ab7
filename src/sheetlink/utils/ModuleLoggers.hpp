#pragma once
#include "sheetlink/utils/Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    SHEETLINK_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     SHEETLINK_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     SHEETLINK_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    SHEETLINK_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)    SHEETLINK_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)     SHEETLINK_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)     SHEETLINK_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)    SHEETLINK_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// 写出模块 (writer)
#define WRITER_DEBUG(...)    SHEETLINK_LOG_DEBUG("[DBG][writ] " __VA_ARGS__)
#define WRITER_INFO(...)     SHEETLINK_LOG_INFO("[INF][writ] " __VA_ARGS__)
#define WRITER_WARN(...)     SHEETLINK_LOG_WARN("[WRN][writ] " __VA_ARGS__)
#define WRITER_ERROR(...)    SHEETLINK_LOG_ERROR("[ERR][writ] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)    SHEETLINK_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)     SHEETLINK_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)     SHEETLINK_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    SHEETLINK_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    SHEETLINK_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     SHEETLINK_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     SHEETLINK_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    SHEETLINK_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 服务模块 (service)
#define SERVICE_DEBUG(...)    SHEETLINK_LOG_DEBUG("[DBG][svc ] " __VA_ARGS__)
#define SERVICE_INFO(...)     SHEETLINK_LOG_INFO("[INF][svc ] " __VA_ARGS__)
#define SERVICE_WARN(...)     SHEETLINK_LOG_WARN("[WRN][svc ] " __VA_ARGS__)
#define SERVICE_ERROR(...)    SHEETLINK_LOG_ERROR("[ERR][svc ] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)    SHEETLINK_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_INFO(...)     SHEETLINK_LOG_INFO("[INF][util] " __VA_ARGS__)
#define UTILS_WARN(...)     SHEETLINK_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)    SHEETLINK_LOG_ERROR("[ERR][util] " __VA_ARGS__)
