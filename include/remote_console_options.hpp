#if !defined(__REMOTE_CONSOLE_OPTIONS__)
#define __REMOTE_CONSOLE_OPTIONS__

#include "remote_console_client.hpp"

#include <cstdint>
#include <istream>
#include <string>

namespace RemoteConsole
{
    // -------------------------------------------------------------------------
    // Command line of the rconsole front end.
    //
    //   rconsole [-p password] [-s host] [-P port] [-t seconds] [-v] [command [args]...]
    //
    // The word after an option is its value even when it starts with '-'.
    // Without -p the password is read from stdin instead, which keeps it out
    // of the process list.
    // -------------------------------------------------------------------------
    struct RemoteConsoleOptions
    {
        std::string host       { REMOTE_CONSOLE_DEFAULT_HOST };
        std::string password;
        bool        has_password { false };
        int32_t     port       { REMOTE_CONSOLE_DEFAULT_PORT };
        int32_t     timeout_ms { REMOTE_CONSOLE_DEFAULT_TIMEOUT_MS };
        bool        verbose    { false };
        bool        help       { false };
        // words after the options joined by single spaces; empty reads commands from stdin
        std::string command;
    };

    // false with a message in error when the command line cannot be used.
    // -h stops parsing and sets help.
    bool parseConsoleOptions(int argc, const char* const argv[], RemoteConsoleOptions& options, std::string& error);

    // One line from in without its line ending.  false at end of input.
    bool readPasswordLine(std::istream& in, std::string& password);
}

#endif // __REMOTE_CONSOLE_OPTIONS__
