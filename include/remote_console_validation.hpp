#if !defined(__REMOTE_CONSOLE_VALIDATION__)
#define __REMOTE_CONSOLE_VALIDATION__

#include <cstddef>
#include <cstdint>
#include <string>

namespace RemoteConsole
{
    static constexpr size_t  REMOTE_CONSOLE_MAX_INPUT_LENGTH    = 256;
    static constexpr size_t  REMOTE_CONSOLE_MIN_PASSWORD_LENGTH = 8;
    static constexpr size_t  REMOTE_CONSOLE_MAX_PASSWORD_LENGTH = 128;
    static constexpr int32_t REMOTE_CONSOLE_MIN_PORT            = 1024;
    static constexpr int32_t REMOTE_CONSOLE_MAX_PORT            = 65535;

    // Removes & | ; $ ` \n \r < > " ', trims surrounding whitespace and cuts
    // the result to max_length bytes without splitting a UTF-8 sequence.
    std::string sanitizeInput(const char* value, size_t max_length = REMOTE_CONSOLE_MAX_INPUT_LENGTH);

    bool validatePort(int32_t port);
    bool validateStrongPassword(const char* password);
}

#endif // __REMOTE_CONSOLE_VALIDATION__
