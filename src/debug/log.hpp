#pragma once
#include <string>
#include <cstdio>
#include <cstdlib>
#include <utility>
#include <fmt/format.h>
#include "../config/Config.hpp"

enum LogLevel {
    NONE = -1,
    LOG  = 0,
    WARN,
    ERR,
    CRIT,
    INFO,
    TRACE
};

namespace Debug {
    inline bool traceEnabled() {
        // no config yet means we're either starting up or in tests, log everything
        return !g_pConfig || g_pConfig->m_config.trace_logging;
    }

    inline const char* levelPrefix(LogLevel level) {
        switch (level) {
            case LOG: return "[LOG] ";
            case WARN: return "[WARN] ";
            case ERR: return "[ERR] ";
            case CRIT: return "[CRITICAL] ";
            case INFO: return "[INFO] ";
            case TRACE: return "[TRACE] ";
            default: return "";
        }
    }

    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {
        if (level == NONE || (level == TRACE && !traceEnabled()))
            return;

        // one write per line, handler threads log concurrently
        const std::string MSG = fmt::format("{}{}\n", levelPrefix(level), fmt::vformat(fmt::string_view(fmt), fmt::make_format_args(args...)));

        std::FILE*        out = level == ERR || level == CRIT ? stderr : stdout;
        std::fputs(MSG.c_str(), out);
        std::fflush(out);
    }

    template <typename... Args>
    [[noreturn]] void die(fmt::format_string<Args...> fmt, Args&&... args) {
        log(CRIT, fmt, std::forward<Args>(args)...);
        std::exit(1);
    }
};
