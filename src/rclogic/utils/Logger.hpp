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

namespace rclogic {

/**
 * @brief 进程级日志器
 *
 * - 基于fmt的格式化，支持 "{}" 占位符
 * - 控制台彩色输出 + 可选的日志文件（按大小轮转）
 * - 未显式初始化时，首次写日志会以默认参数懒初始化
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

    static Logger& getInstance();

    /**
     * @brief 初始化日志器
     * @param log_file_path 日志文件路径，为空则只输出到控制台
     * @param level 最低输出等级
     * @param enable_console 是否输出到控制台
     * @param max_file_size 单个日志文件的最大字节数
     * @param max_files 轮转保留的文件数
     */
    void initialize(const std::string& log_file_path = "",
                    Level level = Level::WARN,
                    bool enable_console = true,
                    size_t max_file_size = 5 * 1024 * 1024,
                    size_t max_files = 3);

    void setLevel(Level level);
    Level getLevel() const;
    void setConsoleEnabled(bool enabled) { enable_console_.store(enabled); }

    /**
     * @brief 解析等级名称（大小写不敏感），无法识别时返回 fallback
     */
    static Level parseLevel(const std::string& name, Level fallback = Level::INFO);

    void trace(const std::string& message)    { write(Level::TRACE, message); }
    void debug(const std::string& message)    { write(Level::DEBUG, message); }
    void info(const std::string& message)     { write(Level::INFO, message); }
    void warn(const std::string& message)     { write(Level::WARN, message); }
    void error(const std::string& message)    { write(Level::ERROR, message); }
    void critical(const std::string& message) { write(Level::CRITICAL, message); }

    template<typename... Args>
    void log(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            write(level, fmt_str);
        } else {
            try {
                write(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
            } catch (const fmt::format_error&) {
                write(level, fmt_str);
            }
        }
    }

    // 带源码位置信息的接口（由宏调用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx =
            fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        log(level, fmt_with_ctx, std::forward<Args>(args)...);
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
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::WARN};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 5 * 1024 * 1024;
    size_t max_files_ = 3;
};

} // namespace rclogic

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define RCLOGIC_FUNC __FUNCTION__
#else
#  define RCLOGIC_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define RCLOGIC_LOG_TRACE(fmt, ...)    ::rclogic::Logger::getInstance().logCtx(::rclogic::Logger::Level::TRACE,    __FILE__, __LINE__, RCLOGIC_FUNC, fmt, ##__VA_ARGS__)
#define RCLOGIC_LOG_DEBUG(fmt, ...)    ::rclogic::Logger::getInstance().logCtx(::rclogic::Logger::Level::DEBUG,    __FILE__, __LINE__, RCLOGIC_FUNC, fmt, ##__VA_ARGS__)
#define RCLOGIC_LOG_INFO(fmt, ...)     ::rclogic::Logger::getInstance().logCtx(::rclogic::Logger::Level::INFO,     __FILE__, __LINE__, RCLOGIC_FUNC, fmt, ##__VA_ARGS__)
#define RCLOGIC_LOG_WARN(fmt, ...)     ::rclogic::Logger::getInstance().logCtx(::rclogic::Logger::Level::WARN,     __FILE__, __LINE__, RCLOGIC_FUNC, fmt, ##__VA_ARGS__)
#define RCLOGIC_LOG_ERROR(fmt, ...)    ::rclogic::Logger::getInstance().logCtx(::rclogic::Logger::Level::ERROR,    __FILE__, __LINE__, RCLOGIC_FUNC, fmt, ##__VA_ARGS__)
#define RCLOGIC_LOG_CRITICAL(fmt, ...) ::rclogic::Logger::getInstance().logCtx(::rclogic::Logger::Level::CRITICAL, __FILE__, __LINE__, RCLOGIC_FUNC, fmt, ##__VA_ARGS__)
