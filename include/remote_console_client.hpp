#if !defined(__REMOTE_CONSOLE_CLIENT__)
#define __REMOTE_CONSOLE_CLIENT__

#include "remote_console_log.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace RemoteConsole
{
    static constexpr const char REMOTE_CONSOLE_DEFAULT_HOST[] {"127.0.0.1"};
    static constexpr int32_t    REMOTE_CONSOLE_DEFAULT_PORT       = 27020;
    static constexpr int32_t    REMOTE_CONSOLE_DEFAULT_TIMEOUT_MS = 5000;

    // -------------------------------------------------------------------------
    // One session with a remote console server.
    //
    // connect() opens the TCP stream and authenticates with the password given
    // at construction.  execute() sends one command and blocks for exactly one
    // response frame.  Nothing throws; failures are reported as false /
    // std::nullopt and logged through consoleLog().
    //
    // Not thread-safe: use one client per concurrent session.
    // -------------------------------------------------------------------------
    class RemoteConsoleClient
    {
    public:
        explicit RemoteConsoleClient(const char* password);
        ~RemoteConsoleClient();

        RemoteConsoleClient(const RemoteConsoleClient&) = delete;
        RemoteConsoleClient& operator=(const RemoteConsoleClient&) = delete;

        // timeout_ms bounds the connection attempt and every later read / write.
        // A previous session is dropped first.
        bool connect(const char* host = REMOTE_CONSOLE_DEFAULT_HOST,
                     int32_t port = REMOTE_CONSOLE_DEFAULT_PORT,
                     int32_t timeout_ms = REMOTE_CONSOLE_DEFAULT_TIMEOUT_MS);

        // Returns the response body (possibly empty), or std::nullopt when not
        // authenticated or when the exchange failed.  After a failed exchange
        // the session should be dropped with disconnect() and reconnected.
        std::optional<std::string> execute(const char* command);

        RC_PRINTF_FUNC(2, 3)
        std::optional<std::string> executeFormat(RC_PRINTF_STR const char* fmt, ...);

        // Safe to call any number of times.
        void disconnect();

        bool isConnected() const;
        bool isAuthenticated() const;

    private:
        struct Connection;

        bool authenticate();

        std::string                 _password;
        std::unique_ptr<Connection> _connection;
    };
}

#endif // __REMOTE_CONSOLE_CLIENT__
