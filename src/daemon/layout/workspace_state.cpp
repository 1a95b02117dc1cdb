#include "workspace_state.hpp"

#include <algorithm>

WorkspaceState::WorkspaceState(LayoutMode mode) : mode_(std::move(mode)) {}

void WorkspaceState::set_mode(LayoutMode mode) {
    mode_ = std::move(mode);
    main_.reset();
    stack_.clear();
    cursor_.reset();
}

bool WorkspaceState::is_stack_main() const {
    return std::holds_alternative<StackMainLayout>(mode_);
}

const StackMainLayout* WorkspaceState::stack_main() const {
    return std::get_if<StackMainLayout>(&mode_);
}

std::optional<Orientation> WorkspaceState::next_split(int width, int height) {
    auto* spiral = std::get_if<SpiralLayout>(&mode_);
    if (!spiral) return std::nullopt;

    Orientation next = spiral->last_split ? opposite(*spiral->last_split)
                                          : seed_orientation(width, height);
    spiral->last_split = next;
    return next;
}

bool WorkspaceState::tracks(WindowId id) const {
    return main_ == id || std::ranges::find(stack_, id) != stack_.end();
}

WorkspaceState::Placement WorkspaceState::add_window(WindowId id) {
    if (!is_stack_main() || tracks(id)) return Placement::Ignored;

    if (!main_) {
        main_ = id;
        return Placement::Main;
    }
    stack_.push_back(id);
    return Placement::Stack;
}

WorkspaceState::Removal WorkspaceState::remove_window(WindowId id) {
    forget(id);

    Removal r;
    if (main_ == id) {
        r.removed = true;
        r.was_main = true;
        if (stack_.empty()) {
            main_.reset();
        } else {
            main_ = stack_.front();
            stack_.erase(stack_.begin());
            if (cursor_ == main_) cursor_.reset();
            r.promoted = main_;
        }
        return r;
    }

    auto it = std::ranges::find(stack_, id);
    if (it != stack_.end()) {
        stack_.erase(it);
        r.removed = true;
    }
    return r;
}

void WorkspaceState::assign(std::optional<WindowId> main, const std::vector<WindowId>& stack) {
    if (!is_stack_main()) return;

    main_ = main;
    stack_.clear();
    cursor_.reset();
    for (WindowId id : stack) {
        if (id == main_ || std::ranges::find(stack_, id) != stack_.end()) continue;
        stack_.push_back(id);
    }
    if (!main_ && !stack_.empty()) {
        main_ = stack_.front();
        stack_.erase(stack_.begin());
    }
}

std::optional<WindowId> WorkspaceState::cursor_step(bool forward) const {
    if (stack_.empty()) return std::nullopt;
    size_t n = stack_.size();

    auto it = cursor_ ? std::ranges::find(stack_, *cursor_) : stack_.end();
    if (it == stack_.end()) {
        return forward ? stack_.front() : stack_.back();
    }
    auto i = static_cast<size_t>(it - stack_.begin());
    return forward ? stack_[(i + 1) % n] : stack_[(i + n - 1) % n];
}

void WorkspaceState::set_cursor(WindowId id) {
    if (std::ranges::find(stack_, id) != stack_.end()) cursor_ = id;
}

std::optional<WorkspaceState::Swap> WorkspaceState::swap_main() {
    if (!is_stack_main() || !main_ || stack_.empty()) return std::nullopt;

    size_t index = 0;
    if (cursor_) {
        auto it = std::ranges::find(stack_, *cursor_);
        if (it != stack_.end()) index = static_cast<size_t>(it - stack_.begin());
    }

    Swap s{.old_main = *main_, .new_main = stack_[index], .index = index};
    main_ = s.new_main;
    stack_[index] = s.old_main;
    cursor_ = s.old_main;
    return s;
}

std::optional<WorkspaceState::Rotation> WorkspaceState::rotate_next() {
    if (!is_stack_main() || !main_ || stack_.empty()) return std::nullopt;

    Rotation r{.old_main = *main_, .new_main = stack_.front()};
    stack_.erase(stack_.begin());
    stack_.push_back(r.old_main);
    main_ = r.new_main;
    if (cursor_ == r.new_main) cursor_.reset();
    return r;
}

std::optional<WorkspaceState::Rotation> WorkspaceState::rotate_prev() {
    if (!is_stack_main() || !main_ || stack_.empty()) return std::nullopt;

    Rotation r{.old_main = *main_, .new_main = stack_.back()};
    stack_.pop_back();
    stack_.insert(stack_.begin(), r.old_main);
    main_ = r.new_main;
    if (cursor_ == r.new_main) cursor_.reset();
    return r;
}

std::optional<WindowId> WorkspaceState::note_focus(WindowId id) {
    auto prev = focused_;
    focused_ = id;
    set_cursor(id);
    return prev;
}

void WorkspaceState::forget(WindowId id) {
    if (focused_ == id) focused_.reset();
    if (cursor_ == id) cursor_.reset();
}
