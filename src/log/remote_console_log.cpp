#include "../../include/remote_console_log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace RemoteConsole
{
    static std::atomic<OnConsoleLog> g_on_console_log    { nullptr };
    static std::atomic<int32_t>      g_console_log_level {
        static_cast<int32_t>(RemoteConsoleLogLevel::LEVEL_INFO) };

    void onConsoleLog(OnConsoleLog on_console_log)
    {
        g_on_console_log.store(on_console_log);
    }

    void setConsoleLogLevel(RemoteConsoleLogLevel level)
    {
        g_console_log_level.store(static_cast<int32_t>(level));
    }

    RemoteConsoleLogLevel consoleLogLevel()
    {
        return static_cast<RemoteConsoleLogLevel>(g_console_log_level.load());
    }

    const char* consoleLogLevelName(RemoteConsoleLogLevel level)
    {
        switch (level)
        {
        case RemoteConsoleLogLevel::LEVEL_DEBUG:   return "DEBUG";
        case RemoteConsoleLogLevel::LEVEL_INFO:    return "INFO";
        case RemoteConsoleLogLevel::LEVEL_WARNING: return "WARNING";
        case RemoteConsoleLogLevel::LEVEL_ERROR:   return "ERROR";
        }
        return "UNKNOWN";
    }

    void consoleLog(RemoteConsoleLogLevel level, const char* fmt, ...)
    {
        if (static_cast<int32_t>(level) < g_console_log_level.load()) return;

        char buffer[4096] {0};
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        OnConsoleLog handler = g_on_console_log.load();
        if (handler) {
            handler(level, buffer);
            return;
        }

        std::fprintf(stderr, "[RCON][%s] %s\n", consoleLogLevelName(level), buffer);
        std::fflush(stderr);
    }
}
