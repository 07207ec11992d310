#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>

#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <unistd.h>

namespace vibecli {

namespace {

struct LevelStyle {
    const char* name;
    const char* ansi;
};

const LevelStyle kLevelStyles[] = {
    { "DEBUG", "\033[34m" },
    { "INFO",  "\033[32m" },
    { "WARN",  "\033[33m" },
    { "ERROR", "\033[31m" },
};

const LevelStyle& style_for(LogLevel level) {
    size_t idx = static_cast<size_t>(level);
    if (idx >= sizeof(kLevelStyles) / sizeof(kLevelStyles[0])) {
        idx = 1;
    }
    return kLevelStyles[idx];
}

// "bool vibecli::Dispatcher::handle_write(const Command&)" -> "Dispatcher::handle_write"
std::string short_origin(const char* pretty) {
    std::string sig(pretty);
    size_t paren = sig.find('(');
    if (paren != std::string::npos) {
        sig.erase(paren);
    }
    size_t space = sig.rfind(' ');
    if (space != std::string::npos) {
        sig.erase(0, space + 1);
    }
    while (!sig.empty() && (sig[0] == '*' || sig[0] == '&')) {
        sig.erase(0, 1);
    }
    const std::string ns = "vibecli::";
    if (sig.compare(0, ns.size(), ns) == 0) {
        sig.erase(0, ns.size());
    }
    return sig;
}

const char* file_tail(const char* path) {
    const char* slash = strrchr(path, '/');
    return slash ? slash + 1 : path;
}

std::string vformat(const char* fmt, va_list args) {
    char small[512];
    va_list again;
    va_copy(again, args);
    int n = vsnprintf(small, sizeof(small), fmt, args);
    if (n < 0) {
        va_end(again);
        return fmt;
    }
    if (static_cast<size_t>(n) < sizeof(small)) {
        va_end(again);
        return std::string(small, static_cast<size_t>(n));
    }
    std::string big(static_cast<size_t>(n) + 1, '\0');
    vsnprintf(&big[0], big.size(), fmt, again);
    va_end(again);
    big.resize(static_cast<size_t>(n));
    return big;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string key = to_lower(trim(name));
    if (key == "debug" || key == "trace") return LogLevel::DEBUG;
    if (key == "warn" || key == "warning") return LogLevel::WARN;
    if (key == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    return style_for(level).name;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , color_(isatty(STDERR_FILENO) != 0 && getenv("NO_COLOR") == nullptr)
    , mirror_(nullptr) {}

Logger::~Logger() {
    if (mirror_) {
        fclose(mirror_);
    }
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::set_color(bool on) { color_ = on; }

bool Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mirror_) {
        fclose(mirror_);
        mirror_ = nullptr;
    }
    if (path.empty()) {
        return true;
    }
    if (!create_parent_directory(path)) {
        return false;
    }
    mirror_ = fopen(path.c_str(), "a");
    return mirror_ != nullptr;
}

void Logger::write(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...) {
    if (!enabled(level)) return;
    
    va_list args;
    va_start(args, fmt);
    std::string message = vformat(fmt, args);
    va_end(args);
    
    char stamp[24];
    time_t now = time(nullptr);
    struct tm local;
    localtime_r(&now, &local);
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
    
    const LevelStyle& style = style_for(level);
    std::string origin = short_origin(func);
    
    // Call sites are only interesting when debugging
    std::string where;
    if (level_ == LogLevel::DEBUG) {
        char buf[256];
        snprintf(buf, sizeof(buf), " (%s %s:%d)", origin.c_str(), file_tail(file), line);
        where = buf;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (color_) {
        fprintf(stderr, "%s %s%-5s\033[0m\033[2m%s\033[0m %s\n",
                stamp, style.ansi, style.name, where.c_str(), message.c_str());
    } else {
        fprintf(stderr, "%s %-5s%s %s\n", stamp, style.name, where.c_str(), message.c_str());
    }
    fflush(stderr);
    
    if (mirror_) {
        fprintf(mirror_, "%s %-5s [%s] %s\n", stamp, style.name, origin.c_str(), message.c_str());
        fflush(mirror_);
    }
}

} // namespace vibecli
