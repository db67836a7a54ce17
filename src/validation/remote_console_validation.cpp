#include "../../include/remote_console_validation.hpp"

#include <cstring>

namespace RemoteConsole
{
    static constexpr const char DISALLOWED_CHARACTERS[] {"&|;$`\n\r<>\"'"};
    static constexpr const char WHITESPACE_CHARACTERS[] {" \t\n\r\f\v"};

    static std::string trim(const std::string& value)
    {
        size_t begin = value.find_first_not_of(WHITESPACE_CHARACTERS);
        if (begin == std::string::npos) return std::string();
        size_t end = value.find_last_not_of(WHITESPACE_CHARACTERS);
        return value.substr(begin, end - begin + 1);
    }

    std::string sanitizeInput(const char* value, size_t max_length)
    {
        if (!value) return std::string();

        std::string result;
        result.reserve(strlen(value));
        for (const char* p = value; *p != '\0'; ++p) {
            if (strchr(DISALLOWED_CHARACTERS, *p) == nullptr)
                result.push_back(*p);
        }

        result = trim(result);
        if (result.size() <= max_length) return result;

        // back off to the start of a UTF-8 sequence
        size_t cut = max_length;
        while (cut > 0 && (static_cast<unsigned char>(result[cut]) & 0xC0) == 0x80)
            --cut;
        result.resize(cut);
        return result;
    }

    bool validatePort(int32_t port)
    {
        return port >= REMOTE_CONSOLE_MIN_PORT && port <= REMOTE_CONSOLE_MAX_PORT;
    }

    bool validateStrongPassword(const char* password)
    {
        if (!password) return false;

        size_t length = strlen(password);
        if (length < REMOTE_CONSOLE_MIN_PASSWORD_LENGTH || length > REMOTE_CONSOLE_MAX_PASSWORD_LENGTH)
            return false;
        return !trim(password).empty();
    }
}
