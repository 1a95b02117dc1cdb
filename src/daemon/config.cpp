#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

LayoutMode Config::Layout::initial() const {
    if (std::holds_alternative<StackMainLayout>(default_mode)) {
        return StackMainLayout{.size = stack_main_size, .stack_layout = stack_main_stack_layout};
    }
    return default_mode;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("layout")) {
            auto& l = j["layout"];
            if (l.contains("default")) {
                auto name = l["default"].get<std::string>();
                if (auto mode = parse_layout_name(name)) {
                    cfg.layout.default_mode = *mode;
                } else {
                    std::println(stderr, "config: unknown layout '{}', keeping {}", name,
                                 layout_name(cfg.layout.default_mode));
                }
            }
            if (l.contains("stack_main")) {
                auto& sm = l["stack_main"];
                if (sm.contains("size")) {
                    int size = sm["size"].get<int>();
                    if (size >= 0 && size <= 100) {
                        cfg.layout.stack_main_size = static_cast<uint8_t>(size);
                    } else {
                        std::println(stderr, "config: stack_main.size {} out of range", size);
                    }
                }
                if (sm.contains("stack_layout")) {
                    auto name = sm["stack_layout"].get<std::string>();
                    if (auto sl = parse_stack_layout(name)) {
                        cfg.layout.stack_main_stack_layout = *sl;
                    } else {
                        std::println(stderr, "config: unknown stack layout '{}'", name);
                    }
                }
            }
        }

        if (j.contains("hooks")) {
            auto& h = j["hooks"];
            if (h.contains("on_window_focus")) cfg.hooks.on_window_focus = h["on_window_focus"].get<std::string>();
            if (h.contains("on_window_focus_leave")) cfg.hooks.on_window_focus_leave = h["on_window_focus_leave"].get<std::string>();
            if (h.contains("on_exit")) cfg.hooks.on_exit = h["on_exit"].get<std::string>();
        }

        if (j.contains("workspace_renaming")) cfg.workspace_renaming = j["workspace_renaming"].get<bool>();
        if (j.contains("socket_path")) cfg.socket_path = j["socket_path"].get<std::string>();
        if (j.contains("sway_socket")) cfg.sway_socket = j["sway_socket"].get<std::string>();
        if (j.contains("queue_capacity")) {
            auto cap = j["queue_capacity"].get<size_t>();
            if (cap > 0) cfg.queue_capacity = cap;
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
