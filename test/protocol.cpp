#include <gtest/gtest.h>

#include "protocol/remote_console_protocol.hpp"
#include "socket/remote_console_socket.hpp"
#include "remote_console_log.hpp"

#include <string>
#include <vector>
#include <cstring>

#ifndef _WIN32
#  include <sys/time.h>
#endif

using namespace RemoteConsole;

static void discardLog(RemoteConsoleLogLevel, const char*) {}

static int32_t readLE(const std::vector<char>& buffer, size_t offset)
{
    const unsigned char* p = reinterpret_cast<const unsigned char*>(buffer.data() + offset);
    return static_cast<int32_t>(p[0] | (p[1] << 8) | (p[2] << 16) | (static_cast<uint32_t>(p[3]) << 24));
}

// ---------------------------------------------------------------------------
// Frame encoding / decoding
// ---------------------------------------------------------------------------
TEST(Protocol, encodeFrameLayout)
{
    std::vector<char> frame = encodeFrame(REMOTE_CONSOLE_REQUEST_ID,
                                          RemoteConsolePacketType::PACKET_AUTH,
                                          "pass");

    ASSERT_EQ(frame.size(), 12u + 4u + 2u);
    EXPECT_EQ(readLE(frame, 0), 4 + 4 + 4 + 2);
    EXPECT_EQ(readLE(frame, 4), 1);
    EXPECT_EQ(readLE(frame, 8), 3);
    EXPECT_EQ(std::string(frame.data() + 12, 4), "pass");
    EXPECT_EQ(frame[16], '\0');
    EXPECT_EQ(frame[17], '\0');
}

TEST(Protocol, execCommandTypeIsTwo)
{
    std::vector<char> frame = encodeFrame(REMOTE_CONSOLE_REQUEST_ID,
                                          RemoteConsolePacketType::PACKET_EXEC_COMMAND,
                                          "ListPlayers");
    EXPECT_EQ(readLE(frame, 8), 2);
    EXPECT_EQ(readLE(frame, 0), static_cast<int32_t>(8 + strlen("ListPlayers") + 2));
}

TEST(Protocol, frameRoundTrip)
{
    const std::vector<std::string> bodies {
        "",
        "SaveWorld",
        "Broadcast caf\xC3\xA9 \xE2\x82\xAC",
        std::string(4096, 'x'),
    };

    for (const auto& body : bodies) {
        std::vector<char> frame = encodeFrame(7, RemoteConsolePacketType::PACKET_EXEC_COMMAND, body);
        auto decoded = decodeFrame(frame.data(), frame.size());
        ASSERT_TRUE(decoded.has_value()) << "body length " << body.size();
        EXPECT_EQ(decoded->request_id, 7);
        EXPECT_EQ(decoded->packet_type, 2);
        EXPECT_EQ(decoded->body, body);
    }
}

TEST(Protocol, negativeRequestIdSurvivesDecoding)
{
    std::vector<char> frame = encodeFrame(REMOTE_CONSOLE_AUTH_FAILED_ID,
                                          RemoteConsolePacketType::PACKET_AUTH_RESPONSE, "");
    RemoteConsoleFrameHeader header = decodeFrameHeader(frame.data());
    EXPECT_EQ(header.request_id, -1);
    EXPECT_EQ(header.size, 10);
    EXPECT_TRUE(header.valid());
    EXPECT_EQ(header.bodyLength(), 2u);
}

TEST(Protocol, decodeFrameRejectsMalformedInput)
{
    std::vector<char> frame = encodeFrame(1, RemoteConsolePacketType::PACKET_RESPONSE_VALUE, "hello");

    // shorter than a header
    EXPECT_FALSE(decodeFrame(frame.data(), 6).has_value());
    // body cut short
    EXPECT_FALSE(decodeFrame(frame.data(), frame.size() - 1).has_value());

    // trailing garbage
    std::vector<char> longer = frame;
    longer.push_back('z');
    EXPECT_FALSE(decodeFrame(longer.data(), longer.size()).has_value());

    // size smaller than id + type
    std::vector<char> tiny = frame;
    tiny[0] = 4; tiny[1] = 0; tiny[2] = 0; tiny[3] = 0;
    EXPECT_FALSE(decodeFrame(tiny.data(), tiny.size()).has_value());

    EXPECT_FALSE(decodeFrame(nullptr, 0).has_value());
}

TEST(Protocol, oversizedBodyIsNotEncoded)
{
    std::string body(static_cast<size_t>(REMOTE_CONSOLE_MAX_FRAME_SIZE), 'a');
    EXPECT_TRUE(encodeFrame(1, RemoteConsolePacketType::PACKET_EXEC_COMMAND, body).empty());
}

TEST(Protocol, decodeFrameBodyStripsTrailingNul)
{
    const char raw[] {'o', 'k', '\0', '\0'};
    EXPECT_EQ(decodeFrameBody(raw, sizeof(raw)), "ok");

    const char inner[] {'a', '\0', 'b', '\0'};
    EXPECT_EQ(decodeFrameBody(inner, sizeof(inner)), std::string("a\0b", 3));

    EXPECT_EQ(decodeFrameBody(nullptr, 0), "");
}

TEST(Protocol, decodeFrameBodyDropsInvalidUtf8)
{
    const std::string valid = "Player caf\xC3\xA9 \xF0\x9F\x8E\xAE";
    EXPECT_EQ(decodeFrameBody(valid.data(), valid.size()), valid);

    const std::string stray = "ab\xFF\xFE" "cd";
    EXPECT_EQ(decodeFrameBody(stray.data(), stray.size()), "abcd");

    const std::string overlong = "x\xC0\xAFy";
    EXPECT_EQ(decodeFrameBody(overlong.data(), overlong.size()), "xy");

    const std::string surrogate = "x\xED\xA0\x80y";
    EXPECT_EQ(decodeFrameBody(surrogate.data(), surrogate.size()), "xy");

    const std::string cut = "euro \xE2\x82";
    EXPECT_EQ(decodeFrameBody(cut.data(), cut.size()), "euro ");
}

// ---------------------------------------------------------------------------
// Frame I/O over a connected socket pair
// ---------------------------------------------------------------------------
#ifndef _WIN32
class FrameSocket : public ::testing::Test
{
protected:
    int fds[2] { -1, -1 };

    void SetUp() override
    {
        onConsoleLog(discardLog);
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    }

    void TearDown() override
    {
        for (int& fd : fds) {
            if (fd != -1) ::close(fd);
            fd = -1;
        }
        onConsoleLog(nullptr);
    }

    void closeWriter()
    {
        ::close(fds[1]);
        fds[1] = -1;
    }
};

TEST_F(FrameSocket, sendThenReceive)
{
    ASSERT_TRUE(sendFrame(fds[1], REMOTE_CONSOLE_REQUEST_ID,
                          RemoteConsolePacketType::PACKET_EXEC_COMMAND, "SaveWorld"));

    auto frame = receiveFrame(fds[0]);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->request_id, 1);
    EXPECT_EQ(frame->packet_type, 2);
    EXPECT_EQ(frame->body, "SaveWorld");
}

TEST_F(FrameSocket, bodiesSurviveSendAndReceive)
{
    const std::vector<std::string> bodies {
        "",
        "SaveWorld",
        "Broadcast caf\xC3\xA9 \xE2\x82\xAC",
        std::string(4096, 'x'),
    };

    for (const auto& body : bodies) {
        ASSERT_TRUE(sendFrame(fds[1], 7, RemoteConsolePacketType::PACKET_EXEC_COMMAND, body));

        auto frame = receiveFrame(fds[0]);
        ASSERT_TRUE(frame.has_value()) << "body length " << body.size();
        EXPECT_EQ(frame->request_id, 7);
        EXPECT_EQ(frame->packet_type, 2);
        EXPECT_EQ(frame->body, body);
    }
}

TEST_F(FrameSocket, sendToClosedPeerFails)
{
    ::close(fds[0]);
    fds[0] = -1;

    // the process must survive the write; a SIGPIPE would end the test run here
    EXPECT_FALSE(sendFrame(fds[1], REMOTE_CONSOLE_REQUEST_ID,
                           RemoteConsolePacketType::PACKET_EXEC_COMMAND, "SaveWorld"));
    EXPECT_FALSE(sendFrame(fds[1], REMOTE_CONSOLE_REQUEST_ID,
                           RemoteConsolePacketType::PACKET_EXEC_COMMAND, "SaveWorld"));
}

TEST_F(FrameSocket, truncatedHeaderFails)
{
    std::vector<char> frame = encodeFrame(1, RemoteConsolePacketType::PACKET_RESPONSE_VALUE, "PONG");
    ASSERT_TRUE(sendAll(fds[1], frame.data(), 6));
    closeWriter();

    EXPECT_FALSE(receiveFrame(fds[0]).has_value());
}

TEST_F(FrameSocket, truncatedBodyFails)
{
    std::vector<char> frame = encodeFrame(1, RemoteConsolePacketType::PACKET_RESPONSE_VALUE, "a longer body");
    ASSERT_TRUE(sendAll(fds[1], frame.data(), frame.size() - 3));
    closeWriter();

    EXPECT_FALSE(receiveFrame(fds[0]).has_value());
}

TEST_F(FrameSocket, bareHeaderGivesEmptyBody)
{
    const char header[12] {8, 0, 0, 0, 1, 0, 0, 0, 2, 0, 0, 0};
    ASSERT_TRUE(sendAll(fds[1], header, sizeof(header)));

    auto frame = receiveFrame(fds[0]);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->request_id, 1);
    EXPECT_EQ(frame->packet_type, 2);
    EXPECT_TRUE(frame->body.empty());
}

TEST_F(FrameSocket, outOfRangeSizeFails)
{
    char negative[12] {0};
    memset(negative, 0xFF, 4);
    negative[4] = 1;
    ASSERT_TRUE(sendAll(fds[1], negative, sizeof(negative)));
    EXPECT_FALSE(receiveFrame(fds[0]).has_value());
}

TEST_F(FrameSocket, readTimesOut)
{
    timeval tv {};
    tv.tv_usec = 200 * 1000;
    ASSERT_EQ(setsockopt(fds[0], SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)), 0);

    EXPECT_FALSE(receiveFrame(fds[0]).has_value());
}

TEST_F(FrameSocket, frameSplitAcrossWritesIsReassembled)
{
    std::vector<char> frame = encodeFrame(1, RemoteConsolePacketType::PACKET_RESPONSE_VALUE, "split response");
    ASSERT_TRUE(sendAll(fds[1], frame.data(), 5));
    ASSERT_TRUE(sendAll(fds[1], frame.data() + 5, 9));
    ASSERT_TRUE(sendAll(fds[1], frame.data() + 14, frame.size() - 14));

    auto decoded = receiveFrame(fds[0]);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->body, "split response");
}

TEST(Socket, invalidSocketIsRejected)
{
    onConsoleLog(discardLog);
    EXPECT_FALSE(sendFrame(INVALID_SOCK, 1, RemoteConsolePacketType::PACKET_AUTH, "x"));
    EXPECT_FALSE(receiveFrame(INVALID_SOCK).has_value());
    onConsoleLog(nullptr);
}
#endif
