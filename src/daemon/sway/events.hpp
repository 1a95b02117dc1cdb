#pragma once

#include <cstdint>
#include <string>
#include <variant>

using WindowId = int64_t;

// Window events from sway do not say which workspace the container lives on.
// workspace stays -1 until the engine resolves it against the tree.
struct WindowNew {
    WindowId window_id = 0;
    int workspace = -1;
    std::string app_id;
    int width = 0;
    int height = 0;
    bool floating = false;
};

struct WindowClose {
    WindowId window_id = 0;
};

struct WindowFocus {
    WindowId window_id = 0;
    int workspace = -1;
};

struct WindowMove {
    WindowId window_id = 0;
};

struct WindowFloating {
    WindowId window_id = 0;
    bool floating = false;
};

struct WorkspaceFocus {
    int workspace = -1;
    std::string name;
};

// Sent by sway when an empty workspace is destroyed.
struct WorkspaceEmpty {
    int workspace = -1;
};

struct Shutdown {};

using Event = std::variant<WindowNew, WindowClose, WindowFocus, WindowMove, WindowFloating,
                           WorkspaceFocus, WorkspaceEmpty, Shutdown>;

// Short name for logging.
const char* event_name(const Event& event);
