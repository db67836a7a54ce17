#if !defined(__REMOTE_CONSOLE_PROTOCOL__)
#define __REMOTE_CONSOLE_PROTOCOL__

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace RemoteConsole
{
    enum class RemoteConsolePacketType : int32_t
    {
        PACKET_RESPONSE_VALUE = 0,
        PACKET_EXEC_COMMAND   = 2,
        PACKET_AUTH_RESPONSE  = 2,
        PACKET_AUTH           = 3,
    };

    // Outbound frames always carry the same id; one request is in flight at a time.
    static constexpr int32_t REMOTE_CONSOLE_REQUEST_ID     = 1;
    // Servers answer a rejected AUTH with this request id.
    static constexpr int32_t REMOTE_CONSOLE_AUTH_FAILED_ID = -1;

    static constexpr size_t  REMOTE_CONSOLE_HEADER_SIZE     = 12;
    static constexpr int32_t REMOTE_CONSOLE_MIN_FRAME_SIZE  = 8;
    static constexpr int32_t REMOTE_CONSOLE_MAX_FRAME_SIZE  = 4 * 1024 * 1024;
    static constexpr size_t  REMOTE_CONSOLE_TERMINATOR_SIZE = 2;

    // RemoteConsoleFrame (little-endian)
    // - size        (4byte)  byte count of everything after this field
    // - request_id  (4byte)
    // - packet_type (4byte)
    // - body        (size - 8 byte)
    //   outbound: UTF-8 text + 0x00 0x00
    //   inbound : text, terminators optional
    struct RemoteConsoleFrameHeader
    {
        int32_t size        {0};
        int32_t request_id  {0};
        int32_t packet_type {0};

        inline bool valid() const {
            return size >= REMOTE_CONSOLE_MIN_FRAME_SIZE && size <= REMOTE_CONSOLE_MAX_FRAME_SIZE;
        }
        inline size_t bodyLength() const {
            return valid() ? static_cast<size_t>(size - REMOTE_CONSOLE_MIN_FRAME_SIZE) : 0;
        }
    };

    struct RemoteConsoleFrame
    {
        int32_t     request_id  {0};
        int32_t     packet_type {0};
        std::string body;
    };

    // Returns an empty buffer when the body does not fit in one frame.
    std::vector<char> encodeFrame(int32_t request_id,
                                  RemoteConsolePacketType packet_type,
                                  const std::string& body);

    // data must hold REMOTE_CONSOLE_HEADER_SIZE bytes.
    RemoteConsoleFrameHeader decodeFrameHeader(const char* data);

    // Drops malformed UTF-8 sequences and trailing NUL bytes. Never fails.
    std::string decodeFrameBody(const char* data, size_t size);

    // Decodes one complete frame occupying exactly size bytes.
    std::optional<RemoteConsoleFrame> decodeFrame(const char* data, size_t size);

    std::string sanitizeUtf8(const char* data, size_t size);
}

#endif // __REMOTE_CONSOLE_PROTOCOL__
