#pragma once

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

namespace sheetlink {

/**
 * @brief 进程级日志器
 *
 * 同时输出到控制台（带颜色）和滚动日志文件，行格式：
 * [时间] [级别] [线程] [文件:行:函数] 消息
 * 所有写入都在互斥锁内完成，可被多个并发的提取/合并调用共享。
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

    void initialize(const std::string& log_file_path = "logs/sheetlink.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }

    void trace(const std::string& message)    { write(Level::TRACE, message); }
    void debug(const std::string& message)    { write(Level::DEBUG, message); }
    void info(const std::string& message)     { write(Level::INFO, message); }
    void warn(const std::string& message)     { write(Level::WARN, message); }
    void error(const std::string& message)    { write(Level::ERROR, message); }
    void critical(const std::string& message) { write(Level::CRITICAL, message); }

    /**
     * @brief 带源码位置的格式化日志（在宏中使用）
     *
     * 格式串与参数不匹配时退化为输出原始格式串。
     */
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        std::string body;
        try {
            body = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            body = fmt_str;
        }
        write(level, fmt::format("[{}:{}:{}] {}", baseFilename(file), line, extractFunctionName(func), body));
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void write(Level level, const std::string& message);
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    // 提取函数名（去除命名空间和参数）
    static std::string extractFunctionName(const char* func_sig) {
        if (!func_sig) return "";
        std::string sig(func_sig);
        size_t last_colon = sig.rfind("::");
        if (last_colon != std::string::npos) {
            sig = sig.substr(last_colon + 2);
        }
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        return sig;
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

} // namespace sheetlink

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define SHEETLINK_FUNC __FUNCTION__
#else
#  define SHEETLINK_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define SHEETLINK_LOG_TRACE(fmt, ...)    ::sheetlink::Logger::getInstance().logCtx(::sheetlink::Logger::Level::TRACE,    __FILE__, __LINE__, SHEETLINK_FUNC, fmt, ##__VA_ARGS__)
#define SHEETLINK_LOG_DEBUG(fmt, ...)    ::sheetlink::Logger::getInstance().logCtx(::sheetlink::Logger::Level::DEBUG,    __FILE__, __LINE__, SHEETLINK_FUNC, fmt, ##__VA_ARGS__)
#define SHEETLINK_LOG_INFO(fmt, ...)     ::sheetlink::Logger::getInstance().logCtx(::sheetlink::Logger::Level::INFO,     __FILE__, __LINE__, SHEETLINK_FUNC, fmt, ##__VA_ARGS__)
#define SHEETLINK_LOG_WARN(fmt, ...)     ::sheetlink::Logger::getInstance().logCtx(::sheetlink::Logger::Level::WARN,     __FILE__, __LINE__, SHEETLINK_FUNC, fmt, ##__VA_ARGS__)
#define SHEETLINK_LOG_ERROR(fmt, ...)    ::sheetlink::Logger::getInstance().logCtx(::sheetlink::Logger::Level::ERROR,    __FILE__, __LINE__, SHEETLINK_FUNC, fmt, ##__VA_ARGS__)
#define SHEETLINK_LOG_CRITICAL(fmt, ...) ::sheetlink::Logger::getInstance().logCtx(::sheetlink::Logger::Level::CRITICAL, __FILE__, __LINE__, SHEETLINK_FUNC, fmt, ##__VA_ARGS__)

