#pragma once

#include "events.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Queries over the JSON returned by GET_TREE. Pointers point into the tree
// passed in and are valid as long as it is.
namespace tree {

struct Rect {
    int width = 0;
    int height = 0;
};

// Leaf container holding a view (tiled or floating).
bool is_window(const nlohmann::json& node);
bool is_floating(const nlohmann::json& node);

const nlohmann::json* find_node(const nlohmann::json& root, WindowId id);
const nlohmann::json* find_workspace(const nlohmann::json& root, int num);
// Workspace that contains the node with `id`, or nullptr.
const nlohmann::json* workspace_of(const nlohmann::json& root, WindowId id);

Rect rect_of(const nlohmann::json& node);

// Focused window below `node`, if any.
std::optional<WindowId> focused_window(const nlohmann::json& node);

// Tiled windows of a workspace, most recently focused first. Follows each
// container's `focus` list, so the order matches what sway reports.
std::vector<WindowId> windows_in_focus_order(const nlohmann::json& workspace);

// Distinct app ids (or X11 classes) of the workspace's windows, in tree order.
std::vector<std::string> app_names(const nlohmann::json& workspace);

} // namespace tree
