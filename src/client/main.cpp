#include "control/protocol.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <print>
#include <string>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [-s PATH] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  change-layout manual");
    std::println(stderr, "  change-layout spiral");
    std::println(stderr, "  change-layout stack-main [--size N] [--stack-layout tabbed|tiled|stacked]");
    std::println(stderr, "  stack-focus-next              Focus the next window in the stack");
    std::println(stderr, "  stack-focus-prev              Focus the previous window in the stack");
    std::println(stderr, "  stack-swap-main               Swap the main window with the stack window");
    std::println(stderr, "  stack-main-rotate-next        Rotate the stack into the main area");
    std::println(stderr, "  stack-main-rotate-prev        Rotate in the opposite direction");
    std::println(stderr, "Options:");
    std::println(stderr, "  -s, --socket-path PATH        Daemon control socket");
}

int main(int argc, char* argv[]) {
    std::string sock_path;
    int i = 1;

    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--socket-path" || arg == "-s") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            sock_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            break;
        }
    }

    if (i >= argc) {
        usage(argv[0]);
        return 2;
    }

    std::string line;
    for (; i < argc; i++) {
        if (!line.empty()) line += ' ';
        line += argv[i];
    }

    if (sock_path.empty()) sock_path = platform::ipc_endpoint();

    UnixSocketClient client;
    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is stackway running?");
        return 1;
    }

    if (!client.send_line(line)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    std::string response;
    if (!client.recv_line(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    auto reply = parse_reply(response);
    if (!reply) {
        std::println(stderr, "Malformed reply: {}", reply.error());
        return 1;
    }
    if (!reply->ok) {
        std::println(stderr, "ERROR: {}", reply->message);
        return 1;
    }
    return 0;
}
