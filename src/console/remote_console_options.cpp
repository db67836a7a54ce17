#include "../../include/remote_console_options.hpp"

#include <cstdlib>
#include <cstring>

namespace RemoteConsole
{
    static bool parseNumber(const char* text, int32_t& out)
    {
        char* end = nullptr;
        long value = std::strtol(text, &end, 10);
        if (end == text || *end != '\0' || value < 0 || value > 65535) return false;
        out = static_cast<int32_t>(value);
        return true;
    }

    bool parseConsoleOptions(int argc, const char* const argv[], RemoteConsoleOptions& options, std::string& error)
    {
        int i = 1;
        while (i < argc) {
            const char* option = argv[i];

            if (std::strcmp(option, "-h") == 0) {
                options.help = true;
                return true;
            }
            if (std::strcmp(option, "-v") == 0) {
                options.verbose = true;
                ++i;
                continue;
            }
            if (option[0] != '-') {
                // end of options
                break;
            }

            bool takes_value = std::strcmp(option, "-p") == 0 || std::strcmp(option, "-s") == 0 ||
                               std::strcmp(option, "-P") == 0 || std::strcmp(option, "-t") == 0;
            if (!takes_value) {
                error = std::string("unknown option ") + option + ".";
                return false;
            }
            if (i + 1 >= argc) {
                error = std::string("option ") + option + " requires an argument.";
                return false;
            }
            const char* value = argv[i + 1];

            switch (option[1]) {
            case 'p':
                options.password     = value;
                options.has_password = true;
                break;
            case 's':
                options.host = value;
                break;
            case 'P':
                if (!parseNumber(value, options.port)) {
                    error = std::string("invalid port '") + value + "'.";
                    return false;
                }
                break;
            case 't':
            {
                int32_t seconds = 0;
                if (!parseNumber(value, seconds) || seconds == 0) {
                    error = std::string("invalid timeout '") + value + "'.";
                    return false;
                }
                options.timeout_ms = seconds * 1000;
                break;
            }
            default:
                break;
            }
            i += 2;
        }

        for (; i < argc; ++i) {
            if (!options.command.empty()) options.command += " ";
            options.command += argv[i];
        }
        return true;
    }

    bool readPasswordLine(std::istream& in, std::string& password)
    {
        if (!std::getline(in, password)) return false;
        if (!password.empty() && password.back() == '\r') password.pop_back();
        return true;
    }
}
