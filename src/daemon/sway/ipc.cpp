#include "ipc.hpp"

#include "ipc_codec.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayIpc::SwayIpc(std::string socket_path, bool verbose)
    : sway_sock_(resolve_socket_path(socket_path)), verbose_(verbose) {}

SwayIpc::~SwayIpc() {
    if (query_fd_ >= 0) ::close(query_fd_);
    if (event_fd_ >= 0) ::close(event_fd_);
}

std::string SwayIpc::resolve_socket_path(const std::string& explicit_path) {
    if (!explicit_path.empty()) return explicit_path;
    if (const char* sock = std::getenv("SWAYSOCK")) return sock;
    if (const char* sock = std::getenv("I3SOCK")) return sock;
    return {};
}

bool SwayIpc::connect() {
    if (sway_sock_.empty()) {
        std::println(stderr, "sway: $SWAYSOCK not set");
        return false;
    }

    query_fd_ = connect_socket(sway_sock_);
    return query_fd_ >= 0;
}

bool SwayIpc::subscribe(const std::vector<std::string>& kinds) {
    event_fd_ = connect_socket(sway_sock_);
    if (event_fd_ < 0) return false;

    auto fail = [this](const std::string& why) {
        std::println(stderr, "sway: subscribe failed: {}", why);
        ::close(event_fd_);
        event_fd_ = -1;
        return false;
    };

    nlohmann::json payload = kinds;
    if (!write_frame(event_fd_, ipc_type::SUBSCRIBE, payload.dump())) {
        return fail(std::strerror(errno));
    }

    // Read subscribe response
    auto frame = read_frame(event_fd_);
    if (!frame) return fail(frame_error_name(frame.error()));

    try {
        auto ack = nlohmann::json::parse(frame->payload);
        if (!ack.value("success", false)) return fail("compositor refused subscription");
    } catch (const nlohmann::json::exception& e) {
        return fail(e.what());
    }

    log(std::format("subscribed to {}", payload.dump()));
    return true;
}

std::expected<void, std::string> SwayIpc::run_command(const std::string& command) {
    log("run_command: " + command);
    auto reply = request(ipc_type::RUN_COMMAND, command);
    if (!reply) return std::unexpected(reply.error());

    try {
        auto results = nlohmann::json::parse(*reply);
        if (!results.is_array()) return std::unexpected(std::string("malformed command reply"));
        for (const auto& r : results) {
            if (!r.value("success", false)) {
                return std::unexpected(r.value("error", std::string("command failed")));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
    return {};
}

std::expected<nlohmann::json, std::string> SwayIpc::get_tree() {
    auto reply = request(ipc_type::GET_TREE);
    if (!reply) return std::unexpected(reply.error());

    try {
        return nlohmann::json::parse(*reply);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

std::expected<std::vector<WorkspaceInfo>, std::string> SwayIpc::get_workspaces() {
    auto reply = request(ipc_type::GET_WORKSPACES);
    if (!reply) return std::unexpected(reply.error());

    std::vector<WorkspaceInfo> out;
    try {
        auto j = nlohmann::json::parse(*reply);
        for (const auto& ws : j) {
            out.push_back({
                .num = ws.value("num", -1),
                .name = ws.value("name", ""),
                .focused = ws.value("focused", false),
            });
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
    return out;
}

std::expected<WorkspaceInfo, std::string> SwayIpc::get_focused_workspace() {
    auto workspaces = get_workspaces();
    if (!workspaces) return std::unexpected(workspaces.error());

    for (auto& ws : *workspaces) {
        if (ws.focused) return ws;
    }
    return std::unexpected(std::string("no focused workspace"));
}

std::expected<std::optional<Event>, EventReadError> SwayIpc::read_event() {
    if (event_fd_ < 0) {
        return std::unexpected(EventReadError{.fatal = true, .message = "not subscribed"});
    }

    auto frame = read_frame(event_fd_);
    if (!frame) {
        bool fatal = frame.error() != FrameError::BadMagic;
        return std::unexpected(EventReadError{.fatal = fatal,
                                              .message = frame_error_name(frame.error())});
    }

    auto event = decode_event(*frame);
    if (!event) {
        return std::unexpected(EventReadError{.fatal = false, .message = event.error()});
    }
    return *event;
}

std::expected<std::string, std::string> SwayIpc::request(uint32_t type, const std::string& payload) {
    if (query_fd_ < 0) {
        if (sway_sock_.empty()) return std::unexpected(std::string("no compositor socket"));
        log("reconnecting command connection");
        query_fd_ = connect_socket(sway_sock_);
        if (query_fd_ < 0) return std::unexpected(std::string("compositor unreachable"));
    }

    if (!write_frame(query_fd_, type, payload)) {
        int err = errno;
        drop_query_connection();
        return std::unexpected(std::format("send failed: {}", std::strerror(err)));
    }

    auto frame = read_frame(query_fd_);
    if (!frame) {
        drop_query_connection();
        return std::unexpected(std::string(frame_error_name(frame.error())));
    }
    if (frame->type != type) {
        drop_query_connection();
        return std::unexpected(std::format("unexpected reply type {}", frame->type));
    }
    return std::move(frame->payload);
}

int SwayIpc::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

void SwayIpc::drop_query_connection() {
    if (query_fd_ >= 0) {
        ::close(query_fd_);
        query_fd_ = -1;
    }
}

void SwayIpc::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[stackway] sway: {}", msg);
    }
}
