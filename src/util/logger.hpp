#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace dxsync {

// Leveled logger writing timestamped lines to stderr.
// Lines from concurrent threads are never interleaved.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::string component = {})
        : level_(level), component_(std::move(component)) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }
    const std::string& component() const { return component_; }

    // Same level, different component tag.
    Logger child(const std::string& component) const {
        return Logger(level_, component);
    }

    void error(const char* fmt, ...) const {
        if (level_ < kError) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::string component_;

    static std::mutex& output_mutex() {
        static std::mutex m;
        return m;
    }

    void log_impl(const char* tag, const char* fmt, va_list ap) const {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf;
        localtime_r(&t, &tm_buf);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

        char msg[2048];
        std::vsnprintf(msg, sizeof(msg), fmt, ap);

        std::lock_guard<std::mutex> lock(output_mutex());
        if (component_.empty()) {
            std::fprintf(stderr, "%s [%s] %s\n", stamp, tag, msg);
        } else {
            std::fprintf(stderr, "%s [%s] %s: %s\n", stamp, tag,
                         component_.c_str(), msg);
        }
    }
};

} // namespace dxsync
