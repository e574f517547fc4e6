#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace sheetpress {

/**
 * @brief 全局日志器
 *
 * 控制台输出带颜色，文件输出按大小滚动。
 * 所有格式化都通过 fmt 完成，首次写日志时自动初始化。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志系统
     * @param log_file_path 日志文件路径，为空时只输出到控制台
     * @param level 最低输出等级
     * @param enable_console 是否输出到控制台
     * @param max_file_size 单个日志文件最大字节数
     * @param max_files 保留的滚动文件数
     * @param write_mode 覆盖或追加
     */
    void initialize(const std::string& log_file_path = "logs/sheetpress.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isEnabled(Level level) const { return should_log(level); }

    void log(Level level, const std::string& message);

    template<typename... Args>
    void logFormatted(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            log(level, fmt_str);
        } else {
            try {
                log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
            } catch (const fmt::format_error& e) {
                log(level, fmt_str + " [format error: " + e.what() + "]");
            }
        }
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx =
            fmt::format("[{}:{}:{}] ", baseFilename(file), line, func ? func : "") + fmt_str;
        logFormatted(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

    static const char* levelName(Level level);
    static bool parseLevel(const std::string& name, Level& level);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;
    void flush_unlocked();

    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define SHEETPRESS_FUNC __FUNCTION__
#else
#  define SHEETPRESS_FUNC __func__
#endif

#define SHEETPRESS_LOG_TRACE(fmt, ...)    ::sheetpress::Logger::getInstance().logCtx(::sheetpress::Logger::Level::TRACE,    __FILE__, __LINE__, SHEETPRESS_FUNC, fmt, ##__VA_ARGS__)
#define SHEETPRESS_LOG_DEBUG(fmt, ...)    ::sheetpress::Logger::getInstance().logCtx(::sheetpress::Logger::Level::DEBUG,    __FILE__, __LINE__, SHEETPRESS_FUNC, fmt, ##__VA_ARGS__)
#define SHEETPRESS_LOG_INFO(fmt, ...)     ::sheetpress::Logger::getInstance().logCtx(::sheetpress::Logger::Level::INFO,     __FILE__, __LINE__, SHEETPRESS_FUNC, fmt, ##__VA_ARGS__)
#define SHEETPRESS_LOG_WARN(fmt, ...)     ::sheetpress::Logger::getInstance().logCtx(::sheetpress::Logger::Level::WARN,     __FILE__, __LINE__, SHEETPRESS_FUNC, fmt, ##__VA_ARGS__)
#define SHEETPRESS_LOG_ERROR(fmt, ...)    ::sheetpress::Logger::getInstance().logCtx(::sheetpress::Logger::Level::ERROR,    __FILE__, __LINE__, SHEETPRESS_FUNC, fmt, ##__VA_ARGS__)
#define SHEETPRESS_LOG_CRITICAL(fmt, ...) ::sheetpress::Logger::getInstance().logCtx(::sheetpress::Logger::Level::CRITICAL, __FILE__, __LINE__, SHEETPRESS_FUNC, fmt, ##__VA_ARGS__)

} // namespace sheetpress
