#pragma once

#include "events.hpp"
#include "platform/compositor.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct EventReadError {
    bool fatal = false; // the subscription connection is gone
    std::string message;
};

class SwayIpc : public Compositor {
public:
    // `socket_path` overrides $SWAYSOCK / $I3SOCK when non-empty.
    explicit SwayIpc(std::string socket_path = {}, bool verbose = false);
    ~SwayIpc() override;

    SwayIpc(const SwayIpc&) = delete;
    SwayIpc& operator=(const SwayIpc&) = delete;

    // Open the command connection. Returns false if no socket is known or connecting fails.
    bool connect();

    // Open the subscription connection and subscribe to `kinds`
    // (e.g. "window", "workspace", "shutdown"). Must call connect() first.
    bool subscribe(const std::vector<std::string>& kinds);

    std::expected<void, std::string> run_command(const std::string& command) override;
    std::expected<nlohmann::json, std::string> get_tree() override;
    std::expected<WorkspaceInfo, std::string> get_focused_workspace() override;
    std::expected<std::vector<WorkspaceInfo>, std::string> get_workspaces();

    // Read one frame from the subscription connection. Call when event_fd()
    // is readable. nullopt means an event we do not act on.
    std::expected<std::optional<Event>, EventReadError> read_event();

    // FD for epoll registration (event subscription socket).
    int event_fd() const { return event_fd_; }
    const std::string& socket_path() const { return sway_sock_; }

    // Explicit path, else $SWAYSOCK, else $I3SOCK. Empty if none is set.
    static std::string resolve_socket_path(const std::string& explicit_path);

private:
    // One request/reply exchange on the command connection. Any failure closes
    // the connection; the next request reconnects.
    std::expected<std::string, std::string> request(uint32_t type, const std::string& payload = "");

    int connect_socket(const std::string& path);
    void drop_query_connection();

    void log(const std::string& msg);

    int query_fd_ = -1;   // for RUN_COMMAND, GET_TREE etc.
    int event_fd_ = -1;   // for subscribed events
    std::string sway_sock_;
    bool verbose_;
};
