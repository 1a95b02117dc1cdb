#pragma once

#include <string>

namespace platform {

// Per-user config directory for stackway, empty if $HOME is unknown.
std::string config_dir();

// Default control socket, $XDG_RUNTIME_DIR/stackway-$WAYLAND_DISPLAY.sock.
std::string ipc_endpoint();

} // namespace platform
