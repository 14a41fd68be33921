#pragma once
// Logger.hpp – Minimal leveled logger writing to stderr.

#include <cstdarg>
#include <cstdio>

namespace tdb {

class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kError) : level_(level) {}

    void warn(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kWarn, "WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kInfo, "INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kDebug, "DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;

    void emit(Level at, const char* tag, const char* fmt, va_list ap) const {
        if (level_ < at) return;
        std::fprintf(stderr, "[tdb %s] ", tag);
        std::vfprintf(stderr, fmt, ap);
        std::fprintf(stderr, "\n");
    }
};

} // namespace tdb
