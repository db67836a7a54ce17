#include "remote_console_socket.hpp"
#include "../../include/remote_console_log.hpp"

#include <cstdio>
#include <cstring>
#include <vector>

#ifndef _WIN32
#  include <netdb.h>
#  include <fcntl.h>
#  include <cerrno>
#  include <poll.h>
#  include <sys/time.h>
#endif

#if defined(MSG_NOSIGNAL)
   // a peer that already closed must not raise SIGPIPE
   static constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
   static constexpr int SEND_FLAGS = 0;
#endif

namespace RemoteConsole
{
    bool startupSockets()
    {
#ifdef _WIN32
        WSADATA wsa;
        return WSAStartup(MAKEWORD(2, 2), &wsa) == 0;
#else
        return true;
#endif
    }

    void cleanupSockets()
    {
#ifdef _WIN32
        WSACleanup();
#endif
    }

    bool sendAll(sock_t sock, const void* data, size_t size)
    {
        const char* ptr = static_cast<const char*>(data);
        size_t remaining = size;
        while (remaining > 0) {
#ifdef _WIN32
            int chunk = static_cast<int>(remaining > 65536 ? 65536 : remaining);
            int sent  = ::send(sock, ptr, chunk, SEND_FLAGS);
#else
            ssize_t sent = ::send(sock, ptr, remaining, SEND_FLAGS);
#endif
            if (sent <= 0) return false;
            ptr       += sent;
            remaining -= static_cast<size_t>(sent);
        }
        return true;
    }

    bool recvAll(sock_t sock, void* data, size_t size)
    {
        char* ptr = static_cast<char*>(data);
        size_t remaining = size;
        while (remaining > 0) {
#ifdef _WIN32
            int chunk    = static_cast<int>(remaining > 65536 ? 65536 : remaining);
            int received = ::recv(sock, ptr, chunk, 0);
#else
            ssize_t received = ::recv(sock, ptr, remaining, 0);
#endif
            if (received <= 0) return false;
            ptr       += received;
            remaining -= static_cast<size_t>(received);
        }
        return true;
    }

    // -------------------------------------------------------------------------
    // Connect helpers
    // -------------------------------------------------------------------------
    static bool setBlocking(sock_t sock, bool blocking)
    {
#ifdef _WIN32
        u_long mode = blocking ? 0 : 1;
        return ioctlsocket(sock, FIONBIO, &mode) == 0;
#else
        int flags = fcntl(sock, F_GETFL, 0);
        if (flags < 0) return false;
        flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
        return fcntl(sock, F_SETFL, flags) == 0;
#endif
    }

    static bool applyIoTimeout(sock_t sock, int32_t timeout_ms)
    {
#ifdef _WIN32
        DWORD tv = static_cast<DWORD>(timeout_ms);
#else
        timeval tv {};
        tv.tv_sec  = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
#endif
        const char* opt = reinterpret_cast<const char*>(&tv);
        return setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, opt, sizeof(tv)) == 0 &&
               setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, opt, sizeof(tv)) == 0;
    }

    static bool connectInProgress()
    {
#ifdef _WIN32
        return WSAGetLastError() == WSAEWOULDBLOCK;
#else
        return errno == EINPROGRESS;
#endif
    }

    static bool awaitConnect(sock_t sock, const sockaddr* addr, socklen_t addr_len, int32_t timeout_ms)
    {
        if (!setBlocking(sock, false)) return false;

        if (::connect(sock, addr, addr_len) != 0) {
            if (!connectInProgress()) return false;

#ifdef _WIN32
            // a Winsock fd_set holds a count of sockets, not a bitmap indexed by descriptor
            fd_set write_fds;
            fd_set except_fds;
            FD_ZERO(&write_fds);
            FD_ZERO(&except_fds);
            FD_SET(sock, &write_fds);
            FD_SET(sock, &except_fds);

            timeval tv {};
            tv.tv_sec  = timeout_ms / 1000;
            tv.tv_usec = (timeout_ms % 1000) * 1000;

            int ready = ::select(0, nullptr, &write_fds, &except_fds, &tv);
#else
            // poll() has no FD_SETSIZE limit on the descriptor value
            pollfd pfd {};
            pfd.fd     = sock;
            pfd.events = POLLOUT;

            int ready;
            do {
                ready = ::poll(&pfd, 1, timeout_ms);
            } while (ready < 0 && errno == EINTR);
#endif
            if (ready <= 0) {
                consoleLog(RemoteConsoleLogLevel::LEVEL_DEBUG,
                           ready == 0 ? "connect() timed out after %d ms" : "Waiting for connect() failed (%d ms)",
                           timeout_ms);
                return false;
            }

            int error = 0;
            socklen_t error_len = sizeof(error);
            if (getsockopt(sock, SOL_SOCKET, SO_ERROR,
                           reinterpret_cast<char*>(&error), &error_len) != 0 || error != 0) {
                consoleLog(RemoteConsoleLogLevel::LEVEL_DEBUG, "connect() failed: %s", strerror(error));
                return false;
            }
        }

        return setBlocking(sock, true);
    }

    sock_t connectWithTimeout(const char* host, int32_t port, int32_t timeout_ms)
    {
        addrinfo hints {};
        hints.ai_family   = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;

        char service[16] {0};
        snprintf(service, sizeof(service), "%d", port);

        addrinfo* results = nullptr;
        int ret = getaddrinfo(host, service, &hints, &results);
        if (ret != 0) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_ERROR, "Cannot resolve %s: %s", host, gai_strerror(ret));
            return INVALID_SOCK;
        }

        sock_t connected = INVALID_SOCK;
        for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
            sock_t sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (sock == INVALID_SOCK) continue;

#if defined(SO_NOSIGPIPE)
            // a send to a closed peer must fail instead of raising SIGPIPE
            int no_sigpipe = 1;
            if (setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, &no_sigpipe, sizeof(no_sigpipe)) != 0) {
                closeSocket(sock);
                continue;
            }
#endif

            if (awaitConnect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen), timeout_ms) &&
                applyIoTimeout(sock, timeout_ms)) {
                connected = sock;
                break;
            }
            closeSocket(sock);
        }

        freeaddrinfo(results);
        return connected;
    }

    // -------------------------------------------------------------------------
    // Frame I/O
    // -------------------------------------------------------------------------
    bool sendFrame(sock_t sock,
                   int32_t request_id,
                   RemoteConsolePacketType packet_type,
                   const std::string& body)
    {
        if (sock == INVALID_SOCK) return false;

        std::vector<char> frame = encodeFrame(request_id, packet_type, body);
        if (frame.empty()) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_ERROR,
                       "Body of %zu bytes does not fit in one frame", body.size());
            return false;
        }

        if (!sendAll(sock, frame.data(), frame.size())) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_WARNING, "Failed to send %zu byte frame", frame.size());
            return false;
        }
        return true;
    }

    std::optional<RemoteConsoleFrame> receiveFrame(sock_t sock)
    {
        if (sock == INVALID_SOCK) return std::nullopt;

        char header_bytes[REMOTE_CONSOLE_HEADER_SIZE] {0};
        if (!recvAll(sock, header_bytes, sizeof(header_bytes))) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_WARNING, "Connection closed or timed out before a full frame header");
            return std::nullopt;
        }

        RemoteConsoleFrameHeader header = decodeFrameHeader(header_bytes);
        if (!header.valid()) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_WARNING, "Invalid frame size %d", header.size);
            return std::nullopt;
        }

        // header and body in one buffer, decoded as a whole frame
        size_t body_length = header.bodyLength();
        std::vector<char> bytes(REMOTE_CONSOLE_HEADER_SIZE + body_length, '\0');
        std::memcpy(bytes.data(), header_bytes, sizeof(header_bytes));
        if (body_length > 0 && !recvAll(sock, bytes.data() + REMOTE_CONSOLE_HEADER_SIZE, body_length)) {
            consoleLog(RemoteConsoleLogLevel::LEVEL_WARNING,
                       "Connection closed or timed out before %zu body bytes", body_length);
            return std::nullopt;
        }

        return decodeFrame(bytes.data(), bytes.size());
    }
}
