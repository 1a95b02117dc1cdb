#pragma once

#include "layout/layout_mode.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Layout {
        LayoutMode default_mode = ManualLayout{};
        uint8_t stack_main_size = DEFAULT_STACK_MAIN_SIZE;
        StackLayout stack_main_stack_layout = StackLayout::Tabbed;

        // Layout new workspaces start with; stack-main takes the defaults above.
        LayoutMode initial() const;
    } layout;

    // sway commands run against a window, e.g. "opacity 1". Empty disables.
    struct Hooks {
        std::string on_window_focus;
        std::string on_window_focus_leave;
        std::string on_exit;
    } hooks;

    bool workspace_renaming = false;

    std::string socket_path;  // control socket; empty = platform default
    std::string sway_socket;  // empty = $SWAYSOCK
    size_t queue_capacity = 64;

    static Config load(const std::string& path);
    static Config load_default();
};
