#include "layout_mode.hpp"

Orientation opposite(Orientation o) {
    return o == Orientation::Horizontal ? Orientation::Vertical : Orientation::Horizontal;
}

Orientation seed_orientation(int width, int height) {
    return width >= height ? Orientation::Horizontal : Orientation::Vertical;
}

const char* split_command(Orientation o) {
    return o == Orientation::Horizontal ? "split h" : "split v";
}

const char* stack_layout_command(StackLayout layout) {
    switch (layout) {
        case StackLayout::Tabbed: return "tabbed";
        case StackLayout::Stacked: return "stacking";
        case StackLayout::Tiled: return "splitv";
    }
    return "splitv";
}

const char* layout_name(const LayoutMode& mode) {
    if (std::holds_alternative<SpiralLayout>(mode)) return "spiral";
    if (std::holds_alternative<StackMainLayout>(mode)) return "stack-main";
    return "manual";
}

const char* stack_layout_name(StackLayout layout) {
    switch (layout) {
        case StackLayout::Tabbed: return "tabbed";
        case StackLayout::Stacked: return "stacked";
        case StackLayout::Tiled: return "tiled";
    }
    return "tiled";
}

std::optional<StackLayout> parse_stack_layout(std::string_view name) {
    if (name == "tabbed") return StackLayout::Tabbed;
    if (name == "tiled") return StackLayout::Tiled;
    if (name == "stacked") return StackLayout::Stacked;
    return std::nullopt;
}

std::optional<LayoutMode> parse_layout_name(std::string_view name) {
    if (name == "manual") return LayoutMode{ManualLayout{}};
    if (name == "spiral") return LayoutMode{SpiralLayout{}};
    if (name == "stack-main" || name == "stack_main") return LayoutMode{StackMainLayout{}};
    return std::nullopt;
}

bool same_layout(const LayoutMode& a, const LayoutMode& b) {
    if (a.index() != b.index()) return false;
    if (auto* sa = std::get_if<StackMainLayout>(&a)) {
        return *sa == std::get<StackMainLayout>(b);
    }
    return true;
}
