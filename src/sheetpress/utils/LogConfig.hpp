#pragma once

// 日志控制宏
// 设置为 0 关闭对应的高频调试日志，设置为 1 打开

#define ENABLE_ZIP_ENTRY_LOGS 0     // 每个ZIP条目的读取日志
#define ENABLE_CELL_TRACE_LOGS 0    // 每个单元格的解析日志
#define ENABLE_ROW_TRACE_LOGS 0     // 惰性行输出日志
