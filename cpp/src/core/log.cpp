#include "tessera/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace tessera::core {

namespace {
    [[nodiscard]] LogLevel level_from_env() noexcept {
        const char* v = std::getenv("TESSERA_LOG_LEVEL");
        if (!v || v[0] == '\0') return LogLevel::Warn;
        if (std::strcmp(v, "error") == 0) return LogLevel::Error;
        if (std::strcmp(v, "warn") == 0) return LogLevel::Warn;
        if (std::strcmp(v, "info") == 0) return LogLevel::Info;
        if (std::strcmp(v, "debug") == 0) return LogLevel::Debug;
        return LogLevel::Warn;
    }

    std::atomic<int>& level_slot() noexcept {
        static std::atomic<int> slot{static_cast<int>(level_from_env())};
        return slot;
    }

    const char* level_prefix(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Error: return "error";
            case LogLevel::Warn: return "warn";
            case LogLevel::Info: return "info";
            case LogLevel::Debug: return "debug";
        }
        return "log";
    }
}

LogLevel log_level() noexcept {
    return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

void log_set_level(LogLevel level) noexcept {
    level_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

bool log_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= level_slot().load(std::memory_order_relaxed);
}

void log_write(LogLevel level, const char* fmt, ...) noexcept {
    if (!fmt || !log_enabled(level)) {
        return;
    }

    // Format into one buffer so concurrent writers don't interleave mid-line.
    char line[1024];
    int n = std::snprintf(line, sizeof(line), "%s: ", level_prefix(level));
    if (n < 0) return;

    va_list args;
    va_start(args, fmt);
    std::vsnprintf(line + n, sizeof(line) - static_cast<size_t>(n), fmt, args);
    va_end(args);

    std::fprintf(stderr, "%s\n", line);
}

} // namespace tessera::core
