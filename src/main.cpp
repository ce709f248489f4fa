// main.cpp
// anagram_client - terminal client for the real-time anagram game
//
// Usage: anagram_client [ws[s]://host[:port]/path]
//
// Connects once (no reconnect), then runs the curses UI until Ctrl+C or /exit.

#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

#include "client_config.hpp"
#include "core/log.hpp"
#include "session/runtime.hpp"
#include "transport/client_connection.hpp"
#include "tui/terminal.hpp"

using namespace anagram;

namespace {

void print_usage(FILE* out, const char* prog) {
    fprintf(out, "Usage: %s [url]\n", prog);
    fprintf(out, "\nArguments:\n");
    fprintf(out, "  url    WebSocket endpoint, ws:// or wss:// (default: %s)\n", DEFAULT_SERVER_URL);
    fprintf(out, "\nOptions:\n");
    fprintf(out, "  -h, --help   Show this help\n");
    fprintf(out, "\nIn the client:\n");
    fprintf(out, "  Enter        send the line as a guess or chat message\n");
    fprintf(out, "  /clear       clear the chat log\n");
    fprintf(out, "  /exit        quit (also Ctrl+C)\n");
    fprintf(out, "  Ctrl+E       dismiss the error line\n");
}

// @return -1 to continue, otherwise the exit code
int parse_args(int argc, char* argv[], ClientConfig& config) {
    bool have_url = false;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(stdout, argv[0]);
            return 0;
        }
        if (argv[i][0] == '-' && argv[i][1] != '\0') {
            fprintf(stderr, "Unknown option: %s\n\n", argv[i]);
            print_usage(stderr, argv[0]);
            return 1;
        }
        if (have_url) {
            fprintf(stderr, "Unexpected argument: %s\n\n", argv[i]);
            print_usage(stderr, argv[0]);
            return 1;
        }
        config.url = argv[i];
        have_url = true;
    }
    return -1;
}

}  // namespace

int main(int argc, char* argv[]) {
    ClientConfig config;
    int early_exit = parse_args(argc, argv, config);
    if (early_exit >= 0) {
        return early_exit;
    }

    // TLS close_notify on a reset socket must not kill the process
    signal(SIGPIPE, SIG_IGN);

    tui::Terminal terminal(config);
    try {
        terminal.start();
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "Error running program: %s\n", e.what());
        return 1;
    }

    transport::ConnectionOptions options;
    options.connect_timeout_ms = config.connect_timeout_ms;

    int code;
    {
        session::SessionRuntime<transport::ClientConnection, tui::Terminal> runtime(
            config, terminal,
            [options](const ClientConfig& c) {
                return transport::ClientConnection::dial(c.url, options);
            });
        code = runtime.run();
    }

    terminal.stop();
    ANAGRAM_LOG_INFO("[Main] exit %d", code);
    return code;
}
