#include "../../include/remote_console_client.hpp"
#include "../../include/remote_console_validation.hpp"
#include "../protocol/remote_console_protocol.hpp"
#include "../socket/remote_console_socket.hpp"

#include <cstdarg>
#include <cstdio>

namespace RemoteConsole
{
    // -------------------------------------------------------------------------
    // Connection (owns the socket for the lifetime of one session)
    // -------------------------------------------------------------------------
    struct RemoteConsoleClient::Connection
    {
        sock_t sock            { INVALID_SOCK };
        bool   authenticated   { false };
        bool   sockets_started { false };

        Connection() : sockets_started(startupSockets()) {}
        ~Connection()
        {
            if (sock != INVALID_SOCK)
                closeSocket(sock);
            if (sockets_started)
                cleanupSockets();
        }

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
    };

    RemoteConsoleClient::RemoteConsoleClient(const char* password)
        : _password(password ? password : "")
    {
    }

    RemoteConsoleClient::~RemoteConsoleClient()
    {
        disconnect();
    }

    // -------------------------------------------------------------------------
    // connect / disconnect
    // -------------------------------------------------------------------------
    bool RemoteConsoleClient::connect(const char* host, int32_t port, int32_t timeout_ms)
    {
        disconnect();

        const char* target = (host && host[0] != '\0') ? host : REMOTE_CONSOLE_DEFAULT_HOST;
        if (port <= 0 || port > 65535) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_ERROR, "RCON connection failed: invalid port %d", port);
            return false;
        }
        if (timeout_ms <= 0)
            timeout_ms = REMOTE_CONSOLE_DEFAULT_TIMEOUT_MS;

        auto connection = std::make_unique<Connection>();
        if (!connection->sockets_started) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_ERROR, "RCON connection failed: socket startup failed");
            return false;
        }

        consoleLog(RemoteConsoleLogLevel::LEVEL_DEBUG, "Connecting to %s:%d (timeout %d ms)", target, port, timeout_ms);
        connection->sock = connectWithTimeout(target, port, timeout_ms);
        if (connection->sock == INVALID_SOCK) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_ERROR, "RCON connection to %s:%d failed", target, port);
            return false;
        }

        _connection = std::move(connection);
        if (!authenticate()) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_ERROR, "RCON authentication with %s:%d failed", target, port);
            disconnect();
            return false;
        }

        consoleLog(RemoteConsoleLogLevel::LEVEL_INFO, "Connected to %s:%d", target, port);
        return true;
    }

    void RemoteConsoleClient::disconnect()
    {
        if (!_connection) return;
        _connection.reset();
        consoleLog(RemoteConsoleLogLevel::LEVEL_DEBUG, "Disconnected");
    }

    bool RemoteConsoleClient::isConnected() const
    {
        return _connection != nullptr;
    }

    bool RemoteConsoleClient::isAuthenticated() const
    {
        return _connection && _connection->authenticated;
    }

    // -------------------------------------------------------------------------
    // Handshake: one AUTH frame out, one frame back.  A request id of -1 is
    // the server's "bad password"; anything else parseable authenticates.
    // -------------------------------------------------------------------------
    bool RemoteConsoleClient::authenticate()
    {
        if (!sendFrame(_connection->sock, REMOTE_CONSOLE_REQUEST_ID,
                       RemoteConsolePacketType::PACKET_AUTH, _password))
            return false;

        auto response = receiveFrame(_connection->sock);
        if (!response) return false;

        if (response->request_id == REMOTE_CONSOLE_AUTH_FAILED_ID) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_ERROR, "Password rejected by server");
            return false;
        }

        _connection->authenticated = true;
        return true;
    }

    // -------------------------------------------------------------------------
    // Command execution
    // -------------------------------------------------------------------------
    std::optional<std::string> RemoteConsoleClient::execute(const char* command)
    {
        if (!isAuthenticated()) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_ERROR, "Not authenticated");
            return std::nullopt;
        }

        std::string sanitized = sanitizeInput(command);
        consoleLog(RemoteConsoleLogLevel::LEVEL_DEBUG, "rcon > %s", sanitized.c_str());

        if (!sendFrame(_connection->sock, REMOTE_CONSOLE_REQUEST_ID,
                       RemoteConsolePacketType::PACKET_EXEC_COMMAND, sanitized)) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_ERROR, "Failed to send command '%s'", sanitized.c_str());
            return std::nullopt;
        }

        auto response = receiveFrame(_connection->sock);
        if (!response) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_ERROR, "No response to command '%s'", sanitized.c_str());
            return std::nullopt;
        }
        return std::move(response->body);
    }

    std::optional<std::string> RemoteConsoleClient::executeFormat(const char* fmt, ...)
    {
        if (!fmt) return execute(nullptr);

        char buffer[4096] {0};
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);
        return execute(buffer);
    }

} // namespace RemoteConsole
