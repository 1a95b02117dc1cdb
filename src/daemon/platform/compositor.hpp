#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct WorkspaceInfo {
    int num = -1;      // -1 for workspaces without a leading number
    std::string name;
    bool focused = false;
};

// Request/reply side of the compositor connection. The layout engine only
// talks to the compositor through this, so tests can hand it a fake.
class Compositor {
public:
    virtual ~Compositor() = default;
    virtual std::expected<void, std::string> run_command(const std::string& command) = 0;
    virtual std::expected<nlohmann::json, std::string> get_tree() = 0;
    virtual std::expected<WorkspaceInfo, std::string> get_focused_workspace() = 0;
};
