#pragma once

#include "layout_mode.hpp"
#include "sway/events.hpp"

#include <cstddef>
#include <optional>
#include <vector>

// Layout bookkeeping for one workspace.
//
// Invariants:
//  - main_window() is set iff the mode is stack-main and a window is tracked
//  - stack() never contains main_window() and holds no duplicates
//  - cursor(), when set, is an entry of stack()
class WorkspaceState {
public:
    explicit WorkspaceState(LayoutMode mode = ManualLayout{});

    const LayoutMode& mode() const { return mode_; }
    // Drops main/stack bookkeeping and resets the spiral seed.
    void set_mode(LayoutMode mode);

    bool is_stack_main() const;
    const StackMainLayout* stack_main() const;

    // Spiral: split for the next new window, alternating from a seed taken
    // from the window's rect. nullopt when the mode is not spiral.
    std::optional<Orientation> next_split(int width, int height);

    std::optional<WindowId> main_window() const { return main_; }
    const std::vector<WindowId>& stack() const { return stack_; }
    bool tracks(WindowId id) const;
    size_t window_count() const { return stack_.size() + (main_ ? 1 : 0); }

    enum class Placement { Ignored, Main, Stack };

    // First window becomes main, later ones go to the back of the stack.
    Placement add_window(WindowId id);

    struct Removal {
        bool removed = false;
        bool was_main = false;
        std::optional<WindowId> promoted; // stack front that replaced main
    };
    Removal remove_window(WindowId id);

    // Replace main and stack wholesale (layout change). Ignored unless stack-main.
    void assign(std::optional<WindowId> main, const std::vector<WindowId>& stack);

    // Stack entry one step from the cursor, wrapping around. Without a cursor
    // forward starts at the front and backward at the back.
    std::optional<WindowId> cursor_step(bool forward) const;
    std::optional<WindowId> cursor() const { return cursor_; }
    void set_cursor(WindowId id);

    struct Swap {
        WindowId old_main;
        WindowId new_main;
        size_t index;
    };
    // Exchange main with the cursor entry (front when there is none) in place.
    std::optional<Swap> swap_main();

    struct Rotation {
        WindowId old_main;
        WindowId new_main;
    };
    // Front becomes main, old main goes to the back.
    std::optional<Rotation> rotate_next();
    // Back becomes main, old main goes to the front.
    std::optional<Rotation> rotate_prev();

    std::optional<WindowId> focused() const { return focused_; }
    // Records focus and returns the previously focused window.
    std::optional<WindowId> note_focus(WindowId id);
    void forget(WindowId id);

private:
    LayoutMode mode_;
    std::optional<WindowId> main_;
    std::vector<WindowId> stack_;
    std::optional<WindowId> cursor_;
    std::optional<WindowId> focused_;
};
