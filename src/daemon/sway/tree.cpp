#include "tree.hpp"

#include <algorithm>

namespace tree {

namespace {

const nlohmann::json* find_first(const nlohmann::json& node, auto&& pred) {
    if (pred(node)) return &node;

    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (const auto& child : node[key]) {
            if (auto* found = find_first(child, pred)) return found;
        }
    }
    return nullptr;
}

bool has_children(const nlohmann::json& node, const char* key) {
    return node.contains(key) && node[key].is_array() && !node[key].empty();
}

void collect_focus_order(const nlohmann::json& node, std::vector<WindowId>& out) {
    if (is_window(node)) {
        if (!is_floating(node)) out.push_back(node.value("id", WindowId{0}));
        return;
    }
    if (!node.contains("nodes")) return;
    const auto& children = node["nodes"];

    // Children listed in `focus` first (most recent first), then any the list missed.
    std::vector<const nlohmann::json*> ordered;
    if (node.contains("focus") && node["focus"].is_array()) {
        for (const auto& fid : node["focus"]) {
            for (const auto& child : children) {
                if (child.value("id", WindowId{0}) == fid.get<WindowId>()) {
                    ordered.push_back(&child);
                    break;
                }
            }
        }
    }
    for (const auto& child : children) {
        if (std::ranges::find(ordered, &child) == ordered.end()) ordered.push_back(&child);
    }

    for (const auto* child : ordered) collect_focus_order(*child, out);
}

void collect_apps(const nlohmann::json& node, std::vector<std::string>& out) {
    if (is_window(node)) {
        std::string name;
        if (node.contains("app_id") && node["app_id"].is_string()) {
            name = node["app_id"].get<std::string>();
        } else if (node.contains("window_properties") && node["window_properties"].is_object()) {
            name = node["window_properties"].value("class", "");
        }
        if (!name.empty() && std::ranges::find(out, name) == out.end()) out.push_back(name);
        return;
    }
    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (const auto& child : node[key]) collect_apps(child, out);
    }
}

} // namespace

bool is_window(const nlohmann::json& node) {
    auto type = node.value("type", "");
    if (type != "con" && type != "floating_con") return false;
    return !has_children(node, "nodes") && !has_children(node, "floating_nodes");
}

bool is_floating(const nlohmann::json& node) {
    return node.value("type", "") == "floating_con";
}

const nlohmann::json* find_node(const nlohmann::json& root, WindowId id) {
    return find_first(root, [id](const nlohmann::json& n) {
        return n.value("id", WindowId{-1}) == id;
    });
}

const nlohmann::json* find_workspace(const nlohmann::json& root, int num) {
    return find_first(root, [num](const nlohmann::json& n) {
        return n.value("type", "") == "workspace" && n.value("num", -1) == num;
    });
}

const nlohmann::json* workspace_of(const nlohmann::json& root, WindowId id) {
    return find_first(root, [id](const nlohmann::json& n) {
        return n.value("type", "") == "workspace" && find_node(n, id) != nullptr;
    });
}

Rect rect_of(const nlohmann::json& node) {
    if (!node.contains("rect") || !node["rect"].is_object()) return {};
    const auto& r = node["rect"];
    return {.width = r.value("width", 0), .height = r.value("height", 0)};
}

std::optional<WindowId> focused_window(const nlohmann::json& node) {
    auto* found = find_first(node, [](const nlohmann::json& n) {
        return is_window(n) && n.value("focused", false);
    });
    if (!found) return std::nullopt;
    return found->value("id", WindowId{0});
}

std::vector<WindowId> windows_in_focus_order(const nlohmann::json& workspace) {
    std::vector<WindowId> out;
    collect_focus_order(workspace, out);
    return out;
}

std::vector<std::string> app_names(const nlohmann::json& workspace) {
    std::vector<std::string> out;
    collect_apps(workspace, out);
    return out;
}

} // namespace tree
