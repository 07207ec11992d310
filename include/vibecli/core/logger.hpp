#ifndef vibecli_CORE_LOGGER_HPP
#define vibecli_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <mutex>

namespace vibecli {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// "debug" / "info" / "warn" / "error", any case; unknown names map to INFO
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

/*
 * Process-wide diagnostics sink.
 *
 * Lines go to stderr so they never interleave with the model's streamed
 * reply on stdout. An optional file mirror receives the same lines without
 * escape codes. Safe to call from the streaming and subprocess threads.
 */
class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const { return level >= level_; }
    
    void set_color(bool on);
    
    // Empty path closes the mirror
    bool set_log_file(const std::string& path);
    
    void write(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 6, 7)));

private:
    Logger();
    ~Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    LogLevel level_;
    bool color_;
    FILE* mirror_;
    std::mutex mutex_;
};

#define VIBECLI_LOG_AT(lvl, ...) \
    do { \
        if (vibecli::Logger::instance().enabled(lvl)) \
            vibecli::Logger::instance().write(lvl, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...) VIBECLI_LOG_AT(vibecli::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  VIBECLI_LOG_AT(vibecli::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  VIBECLI_LOG_AT(vibecli::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) VIBECLI_LOG_AT(vibecli::LogLevel::ERROR, __VA_ARGS__)

} // namespace vibecli

#endif // vibecli_CORE_LOGGER_HPP
