#pragma once

#include "config.hpp"
#include "control/protocol.hpp"
#include "input_queue.hpp"
#include "layout/workspace_state.hpp"
#include "platform/compositor.hpp"
#include "sway/events.hpp"
#include "sway/tree.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <string>

// Owns all workspace layout state and every command sent to the compositor.
// Inputs are handled one at a time, each to completion, on a single thread.
class LayoutEngine {
public:
    using ReplySink = std::function<void(int client_fd, const Reply& reply)>;

    LayoutEngine(Config config, Compositor& compositor, bool verbose = false);

    LayoutEngine(const LayoutEngine&) = delete;
    LayoutEngine& operator=(const LayoutEngine&) = delete;

    void handle_event(const Event& event);
    Reply handle_command(const Command& cmd);

    // Consume `queue` until a Shutdown event, a Terminate input or the queue
    // is closed. Then runs the exit hook, closes the queue and answers every
    // request still in it with a shutting-down error.
    // Returns true if the stop was caused by losing the compositor.
    bool run(InputQueue& queue, const ReplySink& sink);

    bool stopped() const { return stopped_; }

    const WorkspaceState* workspace(int num) const;
    size_t workspace_count() const { return workspaces_.size(); }

private:
    struct Dispatch;

    WorkspaceState& state_for(int num);

    void on_window_new(WindowId id, int workspace_hint, tree::Rect rect);
    void on_window_close(WindowId id);
    // Re-places the window only when it changed workspace.
    void on_window_move(WindowId id);
    void on_window_focus(const WindowFocus& ev);

    void place_spiral(WorkspaceState& ws, WindowId id, tree::Rect rect);
    void place_stack_main(int num, WorkspaceState& ws, WindowId id);
    // Drops `id` from whichever workspace tracks it. Returns that workspace or -1.
    int detach_window(WindowId id);
    int owner_of(WindowId id) const;
    // -1 when the compositor cannot be asked.
    int focused_workspace_num();

    Reply change_layout(int num, const LayoutMode& layout);
    Reply stack_focus(int num, bool forward);
    Reply stack_swap_main(int num);
    Reply stack_rotate(int num, bool forward);
    // Existing stack-main state of `num`, created only when new workspaces
    // start in stack-main. nullptr otherwise.
    WorkspaceState* stack_main_state(int num);
    Reply not_stack_main(int num) const;

    void rename_workspace(int num);
    void stop();

    std::string stack_mark(int num) const;

    // Run a command; failures are only logged.
    void run_logged(const std::string& cmd, const char* context);
    std::expected<void, std::string> send(const std::string& cmd);

    void log(const std::string& msg);

    const Config config_;
    Compositor& compositor_;
    bool verbose_;

    std::map<int, WorkspaceState> workspaces_;
    bool stopped_ = false;
};
