#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_TRACE(...)    SHEETPRESS_LOG_TRACE("[TRC][core] " __VA_ARGS__)
#define CORE_DEBUG(...)    SHEETPRESS_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     SHEETPRESS_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     SHEETPRESS_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    SHEETPRESS_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  SHEETPRESS_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   SHEETPRESS_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   SHEETPRESS_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  SHEETPRESS_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     SHEETPRESS_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)      SHEETPRESS_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     SHEETPRESS_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) SHEETPRESS_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)  SHEETPRESS_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  SHEETPRESS_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) SHEETPRESS_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 输出模块 (output)
#define OUTPUT_DEBUG(...)  SHEETPRESS_LOG_DEBUG("[DBG][out ] " __VA_ARGS__)
#define OUTPUT_INFO(...)   SHEETPRESS_LOG_INFO("[INF][out ] " __VA_ARGS__)
#define OUTPUT_WARN(...)   SHEETPRESS_LOG_WARN("[WRN][out ] " __VA_ARGS__)
#define OUTPUT_ERROR(...)  SHEETPRESS_LOG_ERROR("[ERR][out ] " __VA_ARGS__)

// 应用模块 (app / 命令行)
#define APP_DEBUG(...)     SHEETPRESS_LOG_DEBUG("[DBG][app ] " __VA_ARGS__)
#define APP_INFO(...)      SHEETPRESS_LOG_INFO("[INF][app ] " __VA_ARGS__)
#define APP_WARN(...)      SHEETPRESS_LOG_WARN("[WRN][app ] " __VA_ARGS__)
#define APP_ERROR(...)     SHEETPRESS_LOG_ERROR("[ERR][app ] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_ZIP_ENTRY_LOGS
    #define SHEETPRESS_LOG_ZIP_ENTRY(...) ARCHIVE_DEBUG(__VA_ARGS__)
#else
    #define SHEETPRESS_LOG_ZIP_ENTRY(...) do {} while(0)
#endif

#if ENABLE_CELL_TRACE_LOGS
    #define SHEETPRESS_LOG_CELL_TRACE(...) CORE_TRACE(__VA_ARGS__)
#else
    #define SHEETPRESS_LOG_CELL_TRACE(...) do {} while(0)
#endif

#if ENABLE_ROW_TRACE_LOGS
    #define SHEETPRESS_LOG_ROW_TRACE(...) CORE_TRACE(__VA_ARGS__)
#else
    #define SHEETPRESS_LOG_ROW_TRACE(...) do {} while(0)
#endif
