#if !defined(__REMOTE_CONSOLE_LOG__)
#define __REMOTE_CONSOLE_LOG__

#include <cstdint>

// ---------------------------------------------------------------------------
// Portable printf-format checking macros
//
// RC_PRINTF_FUNC(fmt, first) – function-level attribute that instructs the
//   compiler to verify format strings at every call site.
//   fmt  = 1-based index of the format-string parameter
//   first= 1-based index of the first variadic argument
//   (member functions count the implicit `this` as parameter 1)
//   Supported: GCC, Clang (Android, Linux, MinGW, macOS, …)
//
// RC_PRINTF_STR – parameter annotation placed directly before the format-
//   string argument.  Enables /analyze checks on MSVC.  Empty elsewhere.
// ---------------------------------------------------------------------------
#if defined(__clang__) || defined(__GNUC__)
    #define RC_PRINTF_FUNC(fmt, first) \
        __attribute__((format(printf, fmt, first)))
    #define RC_PRINTF_STR
#elif defined(_MSC_VER)
    #include <sal.h>
    #define RC_PRINTF_FUNC(fmt, first)
    #define RC_PRINTF_STR _Printf_format_string_
#else
    #define RC_PRINTF_FUNC(fmt, first)
    #define RC_PRINTF_STR
#endif

namespace RemoteConsole
{
    enum class RemoteConsoleLogLevel : int32_t
    {
        LEVEL_DEBUG   = 0,
        LEVEL_INFO    = 1,
        LEVEL_WARNING = 2,
        LEVEL_ERROR   = 3,
    };

    using OnConsoleLog = void (*)(RemoteConsoleLogLevel, const char*);

    // Replaces the log sink. nullptr restores the default stderr sink.
    void onConsoleLog(OnConsoleLog on_console_log);

    // Messages below level are discarded (default LEVEL_INFO).
    void setConsoleLogLevel(RemoteConsoleLogLevel level);
    RemoteConsoleLogLevel consoleLogLevel();

    const char* consoleLogLevelName(RemoteConsoleLogLevel level);

    RC_PRINTF_FUNC(2, 3)
    void consoleLog(RemoteConsoleLogLevel level, RC_PRINTF_STR const char* fmt, ...);
}

#endif // __REMOTE_CONSOLE_LOG__
