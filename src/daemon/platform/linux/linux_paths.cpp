#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

std::string env_or(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : fallback;
}

} // namespace

std::string config_dir() {
    auto xdg = env_or("XDG_CONFIG_HOME", "");
    if (!xdg.empty()) return xdg + "/stackway";
    auto home = env_or("HOME", "");
    if (home.empty()) return {};
    return home + "/.config/stackway";
}

std::string ipc_endpoint() {
    return env_or("XDG_RUNTIME_DIR", "/tmp") + "/stackway-" + env_or("WAYLAND_DISPLAY", "unknown") +
           ".sock";
}

} // namespace platform
