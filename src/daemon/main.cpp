#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <print>
#include <string>

static void print_usage() {
    std::println("Usage: stackway [options]");
    std::println("Options:");
    std::println("  -f, --foreground                 Run in foreground (don't daemonize)");
    std::println("  -v, --verbose                    Enable verbose logging");
    std::println("  -c, --config PATH                Config file path");
    std::println("  -s, --socket-path PATH           Control socket path");
    std::println("      --default-layout LAYOUT      manual, spiral or stack-main");
    std::println("      --stack-main-size N          Main window width in percent (0-100)");
    std::println("      --stack-main-stack-layout L  tabbed, tiled or stacked");
    std::println("      --on-window-focus CMD        sway command run on the focused window");
    std::println("      --on-window-focus-leave CMD  sway command run on the window losing focus");
    std::println("      --on-exit CMD                sway command run when stackway exits");
    std::println("      --workspace-renaming         Name workspaces after their applications");
    std::println("  -h, --help                       Show this help");
}

// Flags given on the command line; they win over the config file.
struct Overrides {
    std::string socket_path;
    std::optional<LayoutMode> default_layout;
    std::optional<uint8_t> stack_main_size;
    std::optional<StackLayout> stack_layout;
    std::optional<std::string> on_window_focus;
    std::optional<std::string> on_window_focus_leave;
    std::optional<std::string> on_exit;
    bool workspace_renaming = false;

    void apply(Config& config) const {
        if (!socket_path.empty()) config.socket_path = socket_path;
        if (default_layout) config.layout.default_mode = *default_layout;
        if (stack_main_size) config.layout.stack_main_size = *stack_main_size;
        if (stack_layout) config.layout.stack_main_stack_layout = *stack_layout;
        if (on_window_focus) config.hooks.on_window_focus = *on_window_focus;
        if (on_window_focus_leave) config.hooks.on_window_focus_leave = *on_window_focus_leave;
        if (on_exit) config.hooks.on_exit = *on_exit;
        if (workspace_renaming) config.workspace_renaming = true;
    }
};

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;
    Overrides overrides;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&]() -> const char* {
            if (i + 1 < argc) return argv[++i];
            std::println(stderr, "stackway: {} needs a value", arg);
            return nullptr;
        };

        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            auto v = value();
            if (!v) return 2;
            config_path = v;
        } else if (arg == "--socket-path" || arg == "-s") {
            auto v = value();
            if (!v) return 2;
            overrides.socket_path = v;
        } else if (arg == "--default-layout") {
            auto v = value();
            if (!v) return 2;
            overrides.default_layout = parse_layout_name(v);
            if (!overrides.default_layout) {
                std::println(stderr, "stackway: unknown layout '{}'", v);
                return 2;
            }
        } else if (arg == "--stack-main-size") {
            auto v = value();
            if (!v) return 2;
            std::string s = v;
            int size = -1;
            auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), size);
            if (ec != std::errc{} || end != s.data() + s.size() || size < 0 || size > 100) {
                std::println(stderr, "stackway: invalid size '{}'", s);
                return 2;
            }
            overrides.stack_main_size = static_cast<uint8_t>(size);
        } else if (arg == "--stack-main-stack-layout") {
            auto v = value();
            if (!v) return 2;
            overrides.stack_layout = parse_stack_layout(v);
            if (!overrides.stack_layout) {
                std::println(stderr, "stackway: unknown stack layout '{}'", v);
                return 2;
            }
        } else if (arg == "--on-window-focus") {
            auto v = value();
            if (!v) return 2;
            overrides.on_window_focus = v;
        } else if (arg == "--on-window-focus-leave") {
            auto v = value();
            if (!v) return 2;
            overrides.on_window_focus_leave = v;
        } else if (arg == "--on-exit") {
            auto v = value();
            if (!v) return 2;
            overrides.on_exit = v;
        } else if (arg == "--workspace-renaming") {
            overrides.workspace_renaming = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::println(stderr, "stackway: unknown option '{}'", arg);
            print_usage();
            return 2;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    overrides.apply(config);

    if (!foreground && !platform::daemonize()) {
        return 1;
    }

    if (verbose) {
        std::println(stderr, "[stackway] Starting (default layout: {})",
                     layout_name(config.layout.initial()));
    }

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    return loop.run();
}
