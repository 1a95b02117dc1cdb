#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Split applied to a container, named after the sway command that sets it:
// Horizontal is `split h` (children side by side), Vertical is `split v`.
enum class Orientation { Horizontal, Vertical };

enum class StackLayout { Tabbed, Tiled, Stacked };

inline constexpr uint8_t DEFAULT_STACK_MAIN_SIZE = 70;

struct ManualLayout {
    bool operator==(const ManualLayout&) const = default;
};

struct SpiralLayout {
    // Split given to the last new window; unset until the first one arrives.
    std::optional<Orientation> last_split;

    bool operator==(const SpiralLayout&) const = default;
};

struct StackMainLayout {
    uint8_t size = DEFAULT_STACK_MAIN_SIZE; // main area width in percent
    StackLayout stack_layout = StackLayout::Tabbed;

    bool operator==(const StackMainLayout&) const = default;
};

using LayoutMode = std::variant<ManualLayout, SpiralLayout, StackMainLayout>;

Orientation opposite(Orientation o);

// `split h` for a container at least as wide as it is tall, `split v` otherwise.
Orientation seed_orientation(int width, int height);

const char* split_command(Orientation o);

// Argument for sway's `layout` command.
const char* stack_layout_command(StackLayout layout);

const char* layout_name(const LayoutMode& mode);
const char* stack_layout_name(StackLayout layout);

std::optional<StackLayout> parse_stack_layout(std::string_view name);

// "manual", "spiral" or "stack-main" (StackMain gets default parameters).
std::optional<LayoutMode> parse_layout_name(std::string_view name);

// Same layout kind and parameters; the spiral toggle is ignored.
bool same_layout(const LayoutMode& a, const LayoutMode& b);
