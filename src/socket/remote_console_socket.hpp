#if !defined(__REMOTE_CONSOLE_SOCKET__)
#define __REMOTE_CONSOLE_SOCKET__

#include "../protocol/remote_console_protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
   typedef SOCKET sock_t;
   static constexpr sock_t INVALID_SOCK = INVALID_SOCKET;
   // shutdown() wakes up any thread blocked in recv() before releasing the fd
   inline void closeSocket(sock_t s) { shutdown(s, SD_BOTH); closesocket(s); }
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#  include <unistd.h>
   typedef int sock_t;
   static constexpr sock_t INVALID_SOCK = -1;
   // POSIX: close() alone does NOT interrupt a blocked recv() in another thread.
   inline void closeSocket(sock_t s) { shutdown(s, SHUT_RDWR); close(s); }
#endif

namespace RemoteConsole
{
    // WSAStartup / WSACleanup on Windows, no-ops elsewhere.
    bool startupSockets();
    void cleanupSockets();

    bool sendAll(sock_t sock, const void* data, size_t size);
    bool recvAll(sock_t sock, void* data, size_t size);

    // -------------------------------------------------------------------------
    // Resolve host (IPv4 literal or host name) and connect within timeout_ms.
    // On success the socket is blocking and timeout_ms is applied to every
    // subsequent send / recv.  Returns INVALID_SOCK on failure.
    // -------------------------------------------------------------------------
    sock_t connectWithTimeout(const char* host, int32_t port, int32_t timeout_ms);

    // Writes one whole frame; a short write is completed before returning.
    bool sendFrame(sock_t sock,
                   int32_t request_id,
                   RemoteConsolePacketType packet_type,
                   const std::string& body);

    // Reads the 12-byte header, then exactly size - 8 body bytes.
    // std::nullopt on a short read, timeout or an out-of-range size.
    std::optional<RemoteConsoleFrame> receiveFrame(sock_t sock);
}

#endif // __REMOTE_CONSOLE_SOCKET__
