#include "layout_engine.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <variant>

namespace {

std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

struct LayoutEngine::Dispatch {
    LayoutEngine& engine;
    int num;

    Reply operator()(const ChangeLayout& c) const { return engine.change_layout(num, c.layout); }
    Reply operator()(const StackFocusNext&) const { return engine.stack_focus(num, true); }
    Reply operator()(const StackFocusPrev&) const { return engine.stack_focus(num, false); }
    Reply operator()(const StackSwapMain&) const { return engine.stack_swap_main(num); }
    Reply operator()(const StackMainRotateNext&) const { return engine.stack_rotate(num, true); }
    Reply operator()(const StackMainRotatePrev&) const { return engine.stack_rotate(num, false); }
};

LayoutEngine::LayoutEngine(Config config, Compositor& compositor, bool verbose)
    : config_(std::move(config)), compositor_(compositor), verbose_(verbose) {}

const WorkspaceState* LayoutEngine::workspace(int num) const {
    auto it = workspaces_.find(num);
    return it != workspaces_.end() ? &it->second : nullptr;
}

WorkspaceState& LayoutEngine::state_for(int num) {
    auto it = workspaces_.find(num);
    if (it == workspaces_.end()) {
        it = workspaces_.emplace(num, WorkspaceState(config_.layout.initial())).first;
        log(std::format("workspace {} starts as {}", num, layout_name(it->second.mode())));
    }
    return it->second;
}

void LayoutEngine::handle_event(const Event& event) {
    log(std::string("event ") + event_name(event));

    if (auto* ev = std::get_if<WindowNew>(&event)) {
        if (ev->floating) return;
        on_window_new(ev->window_id, ev->workspace, {.width = ev->width, .height = ev->height});
    } else if (auto* ev = std::get_if<WindowClose>(&event)) {
        on_window_close(ev->window_id);
    } else if (auto* ev = std::get_if<WindowFocus>(&event)) {
        on_window_focus(*ev);
    } else if (auto* ev = std::get_if<WindowMove>(&event)) {
        on_window_move(ev->window_id);
    } else if (auto* ev = std::get_if<WindowFloating>(&event)) {
        if (ev->floating) {
            on_window_close(ev->window_id);
        } else {
            on_window_new(ev->window_id, -1, {});
        }
    } else if (auto* ev = std::get_if<WorkspaceFocus>(&event)) {
        if (ev->workspace >= 0) state_for(ev->workspace);
    } else if (auto* ev = std::get_if<WorkspaceEmpty>(&event)) {
        if (workspaces_.erase(ev->workspace)) log(std::format("workspace {} dropped", ev->workspace));
    } else if (std::holds_alternative<Shutdown>(event)) {
        log("compositor is shutting down");
        stop();
    }
}

void LayoutEngine::on_window_new(WindowId id, int workspace_hint, tree::Rect rect) {
    int num = workspace_hint;

    auto tree = compositor_.get_tree();
    if (tree) {
        if (auto* node = tree::find_node(*tree, id)) {
            if (tree::is_floating(*node)) return;
            auto r = tree::rect_of(*node);
            if (r.width > 0 || r.height > 0) rect = r;
        }
        if (num < 0) {
            if (auto* ws = tree::workspace_of(*tree, id)) num = ws->value("num", -1);
        }
    } else {
        std::println(stderr, "engine: get_tree failed: {}", tree.error());
    }

    if (num < 0) {
        if (auto focused = compositor_.get_focused_workspace()) num = focused->num;
    }
    if (num < 0) {
        log(std::format("window {} is not on a numbered workspace, not laid out", id));
        return;
    }

    auto& ws = state_for(num);
    if (std::holds_alternative<SpiralLayout>(ws.mode())) {
        place_spiral(ws, id, rect);
    } else if (ws.is_stack_main()) {
        place_stack_main(num, ws, id);
    }
    rename_workspace(num);
}

void LayoutEngine::place_spiral(WorkspaceState& ws, WindowId id, tree::Rect rect) {
    auto split = ws.next_split(rect.width, rect.height);
    if (!split) return;
    run_logged(std::format("[con_id={}] {}", id, split_command(*split)), "spiral split");
}

void LayoutEngine::place_stack_main(int num, WorkspaceState& ws, WindowId id) {
    const auto* sm = ws.stack_main();
    switch (ws.add_window(id)) {
        case WorkspaceState::Placement::Ignored:
            return;
        case WorkspaceState::Placement::Main:
            run_logged(std::format("[con_id={}] focus; split h", id), "stack-main new main");
            return;
        case WorkspaceState::Placement::Stack:
            break;
    }

    auto mark = stack_mark(num);
    std::string cmd;
    if (ws.stack().size() == 1) {
        // First stack entry: wrap it in the stack container and mark that.
        cmd = std::format("[con_id={0}] move left; [con_id={0}] split v; [con_id={0}] layout {1}; "
                          "[con_id={0}] focus; focus parent; mark --add {2}; ",
                          id, stack_layout_command(sm->stack_layout), mark);
    } else {
        cmd = std::format("[con_id={}] move container to mark {}; ", id, mark);
    }
    cmd += std::format("[con_id={0}] resize set width {1} ppt; [con_id={2}] focus",
                       *ws.main_window(), sm->size, id);
    run_logged(cmd, "stack-main new stack window");
}

void LayoutEngine::on_window_close(WindowId id) {
    int num = detach_window(id);
    // Untracked windows were on the workspace the user is looking at.
    if (num < 0) num = focused_workspace_num();
    rename_workspace(num);
}

void LayoutEngine::on_window_move(WindowId id) {
    int dest = -1;
    if (auto tree = compositor_.get_tree()) {
        if (auto* ws = tree::workspace_of(*tree, id)) dest = ws->value("num", -1);
    } else {
        std::println(stderr, "engine: get_tree failed: {}", tree.error());
    }
    if (dest < 0) dest = focused_workspace_num();

    // Untracked windows can only have been moved away from the focused workspace.
    int from = owner_of(id);
    if (from < 0) from = focused_workspace_num();

    // Moves inside a workspace include the ones our own layout commands cause.
    if (from == dest) {
        log(std::format("window {} moved within workspace {}", id, dest));
        return;
    }

    detach_window(id);
    on_window_new(id, dest, {});
    rename_workspace(from);
}

int LayoutEngine::owner_of(WindowId id) const {
    for (const auto& [num, ws] : workspaces_) {
        if (ws.tracks(id)) return num;
    }
    return -1;
}

int LayoutEngine::focused_workspace_num() {
    auto focused = compositor_.get_focused_workspace();
    if (!focused) {
        std::println(stderr, "engine: focused workspace unknown: {}", focused.error());
        return -1;
    }
    return focused->num;
}

int LayoutEngine::detach_window(WindowId id) {
    int owner = -1;
    for (auto& [num, ws] : workspaces_) {
        if (!ws.tracks(id)) {
            ws.forget(id);
            continue;
        }
        owner = num;

        auto removal = ws.remove_window(id);
        const auto* sm = ws.stack_main();
        if (!sm) continue;

        if (removal.promoted) {
            WindowId p = *removal.promoted;
            if (ws.stack().empty()) {
                run_logged(std::format("[con_id={}] focus; layout splith; move up", p),
                           "stack-main promote last window");
            } else {
                run_logged(std::format("[con_id={0}] focus; move right; resize set width {1} ppt", p,
                                       sm->size),
                           "stack-main promote");
            }
        } else if (removal.removed && ws.main_window() && !ws.stack().empty()) {
            run_logged(std::format("[con_id={}] resize set width {} ppt", *ws.main_window(), sm->size),
                       "stack-main resize");
        }
    }
    return owner;
}

void LayoutEngine::on_window_focus(const WindowFocus& ev) {
    int num = ev.workspace;
    if (num < 0) num = focused_workspace_num();

    std::optional<WindowId> prev;
    if (num >= 0) prev = state_for(num).note_focus(ev.window_id);

    const auto& hooks = config_.hooks;
    if (prev && *prev != ev.window_id && !hooks.on_window_focus_leave.empty()) {
        run_logged(std::format("[con_id={}] {}", *prev, hooks.on_window_focus_leave),
                   "on_window_focus_leave");
    }
    if (!hooks.on_window_focus.empty()) {
        run_logged(std::format("[con_id={}] {}", ev.window_id, hooks.on_window_focus),
                   "on_window_focus");
    }
}

Reply LayoutEngine::handle_command(const Command& cmd) {
    log(std::string("command ") + command_name(cmd));

    auto focused = compositor_.get_focused_workspace();
    if (!focused) {
        return Reply::failure("cannot query focused workspace: " + focused.error());
    }
    if (focused->num < 0) {
        return Reply::failure(std::format("{} '{}' (name it with a leading number, e.g. '1: web')",
                                          reply_error::UNKNOWN_WORKSPACE, focused->name));
    }

    return std::visit(Dispatch{*this, focused->num}, cmd);
}

Reply LayoutEngine::change_layout(int num, const LayoutMode& layout) {
    auto& ws = state_for(num);
    if (same_layout(ws.mode(), layout)) {
        log(std::format("layout already {} on workspace {}", layout_name(layout), num));
        return Reply::success();
    }

    ws.set_mode(layout);
    log(std::format("workspace {} is now {}", num, layout_name(layout)));

    const auto* sm = ws.stack_main();
    if (!sm) return Reply::success();

    auto tree = compositor_.get_tree();
    if (!tree) return Reply::failure("cannot read tree: " + tree.error());

    auto* node = tree::find_workspace(*tree, num);
    if (!node) return Reply::success();

    auto windows = tree::windows_in_focus_order(*node);
    if (windows.empty()) return Reply::success();

    WindowId main = windows.front();
    if (auto f = tree::focused_window(*node); f && std::ranges::find(windows, *f) != windows.end()) {
        main = *f;
    }
    std::vector<WindowId> stack;
    for (WindowId w : windows) {
        if (w != main) stack.push_back(w);
    }
    ws.assign(main, stack);

    std::string cmd;
    if (ws.stack().empty()) {
        cmd = std::format("[con_id={}] focus; split h", main);
    } else {
        auto mark = stack_mark(num);
        WindowId first = ws.stack().front();
        cmd = std::format("[con_id={0}] move left; [con_id={0}] split v; [con_id={0}] layout {1}; "
                          "[con_id={0}] focus; focus parent; mark --add {2}; ",
                          first, stack_layout_command(sm->stack_layout), mark);
        for (size_t i = 1; i < ws.stack().size(); i++) {
            cmd += std::format("[con_id={}] move container to mark {}; ", ws.stack()[i], mark);
        }
        cmd += std::format("[con_id={0}] resize set width {1} ppt; [con_id={0}] focus", main, sm->size);
    }

    if (auto r = send(cmd); !r) return Reply::failure("compositor: " + r.error());
    return Reply::success();
}

Reply LayoutEngine::not_stack_main(int num) const {
    const auto* ws = workspace(num);
    return Reply::failure(std::format("{} (workspace {} is {})", reply_error::NOT_IN_STACK_MAIN, num,
                                      layout_name(ws ? ws->mode() : config_.layout.initial())));
}

WorkspaceState* LayoutEngine::stack_main_state(int num) {
    if (auto it = workspaces_.find(num); it != workspaces_.end()) {
        return it->second.is_stack_main() ? &it->second : nullptr;
    }
    if (!std::holds_alternative<StackMainLayout>(config_.layout.initial())) return nullptr;
    return &state_for(num);
}

Reply LayoutEngine::stack_focus(int num, bool forward) {
    auto* state = stack_main_state(num);
    if (!state) return not_stack_main(num);
    auto& ws = *state;

    auto target = ws.cursor_step(forward);
    if (!target) return Reply::success();

    if (auto r = send(std::format("[con_id={}] focus", *target)); !r) {
        return Reply::failure("compositor: " + r.error());
    }
    ws.set_cursor(*target);
    return Reply::success();
}

Reply LayoutEngine::stack_swap_main(int num) {
    auto* state = stack_main_state(num);
    if (!state) return not_stack_main(num);
    auto& ws = *state;

    auto before = ws;
    auto swap = ws.swap_main();
    if (!swap) return Reply::success();

    auto cmd = std::format("[con_id={0}] swap container with con_id {1}; [con_id={1}] focus",
                           swap->old_main, swap->new_main);
    if (auto r = send(cmd); !r) {
        ws = before;
        return Reply::failure("compositor: " + r.error());
    }
    return Reply::success();
}

Reply LayoutEngine::stack_rotate(int num, bool forward) {
    auto* state = stack_main_state(num);
    if (!state) return not_stack_main(num);
    auto& ws = *state;

    auto before = ws;
    auto rotation = forward ? ws.rotate_next() : ws.rotate_prev();
    if (!rotation) return Reply::success();

    // Swap the old main into the new main's slot, then bubble it through the
    // stack to the far end so the physical order matches the stored one.
    std::string cmd = std::format("[con_id={}] swap container with con_id {}; ",
                                  rotation->old_main, rotation->new_main);
    const auto& stack = ws.stack();
    if (forward) {
        for (size_t i = 0; i + 1 < stack.size(); i++) {
            cmd += std::format("[con_id={}] swap container with con_id {}; ", rotation->old_main,
                               stack[i]);
        }
    } else {
        for (size_t i = stack.size(); i-- > 1;) {
            cmd += std::format("[con_id={}] swap container with con_id {}; ", rotation->old_main,
                               stack[i]);
        }
    }
    cmd += std::format("[con_id={}] focus", rotation->new_main);

    if (auto r = send(cmd); !r) {
        ws = before;
        return Reply::failure("compositor: " + r.error());
    }
    return Reply::success();
}

void LayoutEngine::rename_workspace(int num) {
    if (!config_.workspace_renaming || num < 0) return;

    auto tree = compositor_.get_tree();
    if (!tree) return;
    auto* node = tree::find_workspace(*tree, num);
    if (!node) return;

    auto apps = tree::app_names(*node);
    std::string name = std::to_string(num);
    if (!apps.empty()) {
        name += ":";
        for (const auto& app : apps) name += " " + app;
    }

    auto current = node->value("name", "");
    if (current == name) return;
    run_logged(std::format("rename workspace {} to {}", quoted(current), quoted(name)),
               "workspace rename");
}

bool LayoutEngine::run(InputQueue& queue, const ReplySink& sink) {
    bool connection_lost = false;

    while (!stopped_) {
        auto input = queue.pop();
        if (!input) break;

        if (auto* ev = std::get_if<Event>(&*input)) {
            handle_event(*ev);
        } else if (auto* req = std::get_if<ControlRequest>(&*input)) {
            sink(req->client_fd, handle_command(req->command));
        } else if (auto* term = std::get_if<Terminate>(&*input)) {
            connection_lost = term->connection_lost;
            log(connection_lost ? "compositor connection lost" : "termination requested");
            stop();
        }
    }
    stop();

    for (auto& rest : queue.close()) {
        if (auto* req = std::get_if<ControlRequest>(&rest)) {
            sink(req->client_fd, Reply::failure(reply_error::SHUTTING_DOWN));
        }
    }
    return connection_lost;
}

void LayoutEngine::stop() {
    if (stopped_) return;
    stopped_ = true;

    if (!config_.hooks.on_exit.empty()) {
        log("executing exit command: " + config_.hooks.on_exit);
        run_logged(config_.hooks.on_exit, "on_exit");
    }
}

std::string LayoutEngine::stack_mark(int num) const {
    return std::format("_stackway_stack_{}", num);
}

void LayoutEngine::run_logged(const std::string& cmd, const char* context) {
    if (auto r = send(cmd); !r) {
        std::println(stderr, "engine: {} failed: {}", context, r.error());
    }
}

std::expected<void, std::string> LayoutEngine::send(const std::string& cmd) {
    log("-> " + cmd);
    return compositor_.run_command(cmd);
}

void LayoutEngine::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[stackway] engine: {}", msg);
    }
}
