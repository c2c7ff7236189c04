#pragma once

#include "tessera/core/types.hpp"

namespace tessera::core {

    enum class LogLevel : u8 {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
    };

    // Threshold starts from TESSERA_LOG_LEVEL (error|warn|info|debug), default warn.
    [[nodiscard]] LogLevel log_level() noexcept;
    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] bool log_enabled(LogLevel level) noexcept;

    // Writes "<level>: <message>\n" to stderr when level passes the threshold.
    void log_write(LogLevel level, const char* fmt, ...) noexcept
#if defined(__GNUC__)
        __attribute__((format(printf, 2, 3)))
#endif
        ;

} // namespace tessera::core
