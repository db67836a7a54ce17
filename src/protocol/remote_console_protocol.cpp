#include "remote_console_protocol.hpp"

#include <cstring>

namespace RemoteConsole
{
    // -------------------------------------------------------------------------
    // Little-endian integer helpers (independent of host byte order)
    // -------------------------------------------------------------------------
    static void writeInt32(char* dst, int32_t value)
    {
        uint32_t v = static_cast<uint32_t>(value);
        dst[0] = static_cast<char>(v & 0xFF);
        dst[1] = static_cast<char>((v >> 8) & 0xFF);
        dst[2] = static_cast<char>((v >> 16) & 0xFF);
        dst[3] = static_cast<char>((v >> 24) & 0xFF);
    }

    static int32_t readInt32(const char* src)
    {
        const unsigned char* p = reinterpret_cast<const unsigned char*>(src);
        uint32_t v = static_cast<uint32_t>(p[0])
                   | (static_cast<uint32_t>(p[1]) << 8)
                   | (static_cast<uint32_t>(p[2]) << 16)
                   | (static_cast<uint32_t>(p[3]) << 24);
        return static_cast<int32_t>(v);
    }

    // Length of the well-formed UTF-8 sequence starting at p, 0 if malformed.
    static size_t utf8SequenceLength(const unsigned char* p, size_t remaining)
    {
        unsigned char lead = p[0];
        if (lead < 0x80) return 1;

        size_t   length      = 0;
        uint32_t code_point  = 0;
        uint32_t lower_bound = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2; code_point = lead & 0x1F; lower_bound = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3; code_point = lead & 0x0F; lower_bound = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4; code_point = lead & 0x07; lower_bound = 0x10000;
        } else {
            return 0;
        }

        if (remaining < length) return 0;
        for (size_t i = 1; i < length; ++i) {
            if ((p[i] & 0xC0) != 0x80) return 0;
            code_point = (code_point << 6) | (p[i] & 0x3F);
        }

        // overlong forms, surrogates and out-of-range values
        if (code_point < lower_bound || code_point > 0x10FFFF) return 0;
        if (code_point >= 0xD800 && code_point <= 0xDFFF)      return 0;
        return length;
    }

    std::string sanitizeUtf8(const char* data, size_t size)
    {
        std::string result;
        if (!data || size == 0) return result;
        result.reserve(size);

        const unsigned char* p = reinterpret_cast<const unsigned char*>(data);
        size_t i = 0;
        while (i < size) {
            size_t length = utf8SequenceLength(p + i, size - i);
            if (length == 0) {
                ++i;
                continue;
            }
            result.append(data + i, length);
            i += length;
        }
        return result;
    }

    std::vector<char> encodeFrame(int32_t request_id,
                                  RemoteConsolePacketType packet_type,
                                  const std::string& body)
    {
        const size_t max_body = static_cast<size_t>(REMOTE_CONSOLE_MAX_FRAME_SIZE -
                                                    REMOTE_CONSOLE_MIN_FRAME_SIZE) -
                                REMOTE_CONSOLE_TERMINATOR_SIZE;
        if (body.size() > max_body) return {};

        const int32_t size = static_cast<int32_t>(REMOTE_CONSOLE_MIN_FRAME_SIZE +
                                                  body.size() + REMOTE_CONSOLE_TERMINATOR_SIZE);

        std::vector<char> frame(REMOTE_CONSOLE_HEADER_SIZE + body.size() + REMOTE_CONSOLE_TERMINATOR_SIZE, '\0');
        writeInt32(frame.data(),     size);
        writeInt32(frame.data() + 4, request_id);
        writeInt32(frame.data() + 8, static_cast<int32_t>(packet_type));
        if (!body.empty())
            memcpy(frame.data() + REMOTE_CONSOLE_HEADER_SIZE, body.data(), body.size());
        // the two terminators are already zero
        return frame;
    }

    RemoteConsoleFrameHeader decodeFrameHeader(const char* data)
    {
        RemoteConsoleFrameHeader header;
        header.size        = readInt32(data);
        header.request_id  = readInt32(data + 4);
        header.packet_type = readInt32(data + 8);
        return header;
    }

    std::string decodeFrameBody(const char* data, size_t size)
    {
        std::string body = sanitizeUtf8(data, size);
        while (!body.empty() && body.back() == '\0')
            body.pop_back();
        return body;
    }

    std::optional<RemoteConsoleFrame> decodeFrame(const char* data, size_t size)
    {
        if (!data || size < REMOTE_CONSOLE_HEADER_SIZE) return std::nullopt;

        RemoteConsoleFrameHeader header = decodeFrameHeader(data);
        if (!header.valid()) return std::nullopt;
        if (size - REMOTE_CONSOLE_HEADER_SIZE != header.bodyLength()) return std::nullopt;

        RemoteConsoleFrame frame;
        frame.request_id  = header.request_id;
        frame.packet_type = header.packet_type;
        frame.body        = decodeFrameBody(data + REMOTE_CONSOLE_HEADER_SIZE, header.bodyLength());
        return frame;
    }
}
