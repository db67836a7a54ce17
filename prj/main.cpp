#include <remote_console_client.hpp>
#include <remote_console_options.hpp>
#include <remote_console_validation.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#ifdef _WIN32
#  include <io.h>
#  include <windows.h>
#  define RC_ISATTY(fd) _isatty(fd)
#  define RC_FILENO(f)  _fileno(f)
#else
#  include <termios.h>
#  include <unistd.h>
#  define RC_ISATTY(fd) isatty(fd)
#  define RC_FILENO(f)  fileno(f)
#endif

using namespace RemoteConsole;

static void printUsage(const char* program)
{
    std::printf(
        "%s [OPTIONS] [command [args]...]\n"
        "Executes a command on a remote console (RCON) server and prints the response.\n"
        "Without a command, commands are read line by line from stdin ('exit' quits).\n\n"
        "  -p  password (%zu-%zu characters, prompted for when omitted)\n"
        "  -s  server (default: %s)\n"
        "  -P  port (default: %d)\n"
        "  -t  timeout in seconds (default: %d)\n"
        "  -v  verbose logging\n"
        "  -h  this message and exit.\n",
        program,
        REMOTE_CONSOLE_MIN_PASSWORD_LENGTH, REMOTE_CONSOLE_MAX_PASSWORD_LENGTH,
        REMOTE_CONSOLE_DEFAULT_HOST,
        REMOTE_CONSOLE_DEFAULT_PORT,
        REMOTE_CONSOLE_DEFAULT_TIMEOUT_MS / 1000);
}

// Turns off terminal echo while the password is typed.
class EchoOff
{
public:
    EchoOff()
    {
#ifdef _WIN32
        _handle = GetStdHandle(STD_INPUT_HANDLE);
        _active = GetConsoleMode(_handle, &_mode) &&
                  SetConsoleMode(_handle, _mode & ~static_cast<DWORD>(ENABLE_ECHO_INPUT));
#else
        if (tcgetattr(STDIN_FILENO, &_mode) == 0) {
            termios silent = _mode;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            _active = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
        }
#endif
    }
    ~EchoOff()
    {
        if (!_active) return;
#ifdef _WIN32
        SetConsoleMode(_handle, _mode);
#else
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &_mode);
#endif
    }

    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

private:
    bool _active { false };
#ifdef _WIN32
    HANDLE _handle { nullptr };
    DWORD  _mode { 0 };
#else
    termios _mode {};
#endif
};

static bool promptPassword(bool interactive, std::string& password)
{
    if (!interactive)
        return readPasswordLine(std::cin, password);

    std::printf("RCON Password: ");
    std::fflush(stdout);
    bool ok;
    {
        EchoOff echo_off;
        ok = readPasswordLine(std::cin, password);
    }
    std::printf("\n");
    return ok;
}

// 0 on success, EXIT_FAILURE when the command could not be run.
static int runCommand(RemoteConsoleClient& client, const std::string& command)
{
    auto response = client.execute(command.c_str());
    if (!response) {
        std::fprintf(stderr, "Error: no response to '%s'.\n", command.c_str());
        return EXIT_FAILURE;
    }

    if (response->empty() || response->back() != '\n')
        std::printf("%s\n", response->c_str());
    else
        std::printf("%s", response->c_str());
    std::fflush(stdout);
    return EXIT_SUCCESS;
}

static int runSession(RemoteConsoleClient& client, bool interactive)
{
    std::string line;
    while (true) {
        if (interactive) {
            std::printf("RCON> ");
            std::fflush(stdout);
        }
        if (!std::getline(std::cin, line)) break;

        if (line == "exit" || line == "EXIT") break;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        // the connection state is unknown after a failed exchange
        if (int r = runCommand(client, line)) return r;
    }
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    RemoteConsoleOptions options;
    std::string error;
    if (!parseConsoleOptions(argc, argv, options, error)) {
        std::fprintf(stderr, "Error: %s\n", error.c_str());
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }
    if (options.help) {
        printUsage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (options.verbose)
        setConsoleLogLevel(RemoteConsoleLogLevel::LEVEL_DEBUG);

    bool interactive = RC_ISATTY(RC_FILENO(stdin)) != 0;
    if (!options.has_password) {
        if (!promptPassword(interactive, options.password)) {
            std::fprintf(stderr, "Error: no password given.\n");
            return EXIT_FAILURE;
        }
        options.has_password = true;
    }
    if (!validateStrongPassword(options.password.c_str())) {
        std::fprintf(stderr, "Error: password must be %zu-%zu characters.\n",
                     REMOTE_CONSOLE_MIN_PASSWORD_LENGTH, REMOTE_CONSOLE_MAX_PASSWORD_LENGTH);
        return EXIT_FAILURE;
    }
    if (!validatePort(options.port)) {
        std::fprintf(stderr, "Error: port must be between %d and %d.\n",
                     REMOTE_CONSOLE_MIN_PORT, REMOTE_CONSOLE_MAX_PORT);
        return EXIT_FAILURE;
    }

    RemoteConsoleClient client(options.password.c_str());
    if (!client.connect(options.host.c_str(), options.port, options.timeout_ms)) {
        std::fprintf(stderr,
            "Connection failed. Ensure:\n"
            "  1. Server is running\n"
            "  2. RCON is enabled in server settings\n"
            "  3. Password is correct\n");
        return EXIT_FAILURE;
    }

    int result = EXIT_SUCCESS;
    if (!options.command.empty()) {
        result = runCommand(client, options.command);
    }
    else {
        if (interactive)
            std::printf("Connected to %s:%d. Type 'exit' to quit.\n", options.host.c_str(), options.port);
        result = runSession(client, interactive);
    }

    client.disconnect();
    return result;
}
