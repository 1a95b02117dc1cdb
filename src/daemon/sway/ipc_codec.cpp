#include "ipc_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <unistd.h>
#include <variant>

namespace {

void put_le32(char* out, uint32_t v) {
    out[0] = static_cast<char>(v & 0xff);
    out[1] = static_cast<char>((v >> 8) & 0xff);
    out[2] = static_cast<char>((v >> 16) & 0xff);
    out[3] = static_cast<char>((v >> 24) & 0xff);
}

uint32_t get_le32(const char* in) {
    auto b = reinterpret_cast<const unsigned char*>(in);
    return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
           (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
}

// Reads until `len` bytes arrived. Returns bytes read; less than `len` means EOF or error.
size_t read_full(int fd, char* buf, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::recv(fd, buf + total, len - total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        total += static_cast<size_t>(n);
    }
    return total;
}

bool drain(int fd, uint32_t len) {
    char buf[4096];
    while (len > 0) {
        size_t chunk = std::min<size_t>(len, sizeof(buf));
        if (read_full(fd, buf, chunk) != chunk) return false;
        len -= static_cast<uint32_t>(chunk);
    }
    return true;
}

std::optional<Event> decode_window_event(const nlohmann::json& j) {
    auto change = j.value("change", "");
    if (!j.contains("container") || !j["container"].is_object()) return std::nullopt;
    const auto& c = j["container"];
    WindowId id = c.value("id", WindowId{0});

    if (change == "new") {
        WindowNew ev{.window_id = id};
        if (c.contains("app_id") && c["app_id"].is_string()) {
            ev.app_id = c["app_id"].get<std::string>();
        } else if (c.contains("window_properties") && c["window_properties"].is_object()) {
            ev.app_id = c["window_properties"].value("class", "");
        }
        if (c.contains("rect") && c["rect"].is_object()) {
            ev.width = c["rect"].value("width", 0);
            ev.height = c["rect"].value("height", 0);
        }
        ev.floating = c.value("type", "") == "floating_con";
        return ev;
    }
    if (change == "close") return WindowClose{.window_id = id};
    if (change == "focus") return WindowFocus{.window_id = id};
    if (change == "move") return WindowMove{.window_id = id};
    if (change == "floating") {
        return WindowFloating{.window_id = id, .floating = c.value("type", "") == "floating_con"};
    }
    return std::nullopt;
}

std::optional<Event> decode_workspace_event(const nlohmann::json& j) {
    auto change = j.value("change", "");
    if (!j.contains("current") || !j["current"].is_object()) return std::nullopt;
    const auto& cur = j["current"];
    int num = cur.value("num", -1);

    if (change == "focus") {
        return WorkspaceFocus{.workspace = num, .name = cur.value("name", "")};
    }
    if (change == "empty") return WorkspaceEmpty{.workspace = num};
    return std::nullopt;
}

} // namespace

const char* frame_error_name(FrameError err) {
    switch (err) {
        case FrameError::Truncated: return "truncated frame";
        case FrameError::BadMagic: return "bad magic";
        case FrameError::ConnectionClosed: return "connection closed";
    }
    return "unknown";
}

const char* event_name(const Event& event) {
    struct Namer {
        const char* operator()(const WindowNew&) const { return "window::new"; }
        const char* operator()(const WindowClose&) const { return "window::close"; }
        const char* operator()(const WindowFocus&) const { return "window::focus"; }
        const char* operator()(const WindowMove&) const { return "window::move"; }
        const char* operator()(const WindowFloating&) const { return "window::floating"; }
        const char* operator()(const WorkspaceFocus&) const { return "workspace::focus"; }
        const char* operator()(const WorkspaceEmpty&) const { return "workspace::empty"; }
        const char* operator()(const Shutdown&) const { return "shutdown"; }
    };
    return std::visit(Namer{}, event);
}

std::string encode_message(uint32_t type, std::string_view payload) {
    std::string out(IPC_HEADER_LEN + payload.size(), '\0');
    std::memcpy(out.data(), IPC_MAGIC, IPC_MAGIC_LEN);
    put_le32(out.data() + 6, static_cast<uint32_t>(payload.size()));
    put_le32(out.data() + 10, type);
    std::memcpy(out.data() + IPC_HEADER_LEN, payload.data(), payload.size());
    return out;
}

std::expected<Frame, FrameError> decode_frame(std::string_view bytes, size_t& consumed) {
    consumed = 0;
    if (bytes.size() < IPC_HEADER_LEN) return std::unexpected(FrameError::Truncated);
    if (std::memcmp(bytes.data(), IPC_MAGIC, IPC_MAGIC_LEN) != 0) {
        return std::unexpected(FrameError::BadMagic);
    }

    uint32_t len = get_le32(bytes.data() + 6);
    if (bytes.size() - IPC_HEADER_LEN < len) return std::unexpected(FrameError::Truncated);

    Frame frame;
    frame.type = get_le32(bytes.data() + 10);
    frame.payload.assign(bytes.data() + IPC_HEADER_LEN, len);
    consumed = IPC_HEADER_LEN + len;
    return frame;
}

std::expected<Frame, FrameError> read_frame(int fd) {
    char header[IPC_HEADER_LEN];
    size_t got = read_full(fd, header, IPC_HEADER_LEN);
    if (got == 0) return std::unexpected(FrameError::ConnectionClosed);
    if (got < IPC_HEADER_LEN) return std::unexpected(FrameError::Truncated);

    uint32_t len = get_le32(header + 6);
    if (len > IPC_MAX_PAYLOAD) return std::unexpected(FrameError::Truncated);

    if (std::memcmp(header, IPC_MAGIC, IPC_MAGIC_LEN) != 0) {
        if (!drain(fd, len)) return std::unexpected(FrameError::Truncated);
        return std::unexpected(FrameError::BadMagic);
    }

    Frame frame;
    frame.type = get_le32(header + 10);
    frame.payload.resize(len);
    if (read_full(fd, frame.payload.data(), len) != len) {
        return std::unexpected(FrameError::Truncated);
    }
    return frame;
}

bool write_frame(int fd, uint32_t type, std::string_view payload) {
    auto msg = encode_message(type, payload);
    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = ::send(fd, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::expected<std::optional<Event>, std::string> decode_event(const Frame& frame) {
    if (frame.type == ipc_type::EVENT_SHUTDOWN) {
        return std::optional<Event>{Shutdown{}};
    }
    if (frame.type != ipc_type::EVENT_WINDOW && frame.type != ipc_type::EVENT_WORKSPACE) {
        return std::optional<Event>{};
    }

    try {
        auto j = nlohmann::json::parse(frame.payload);
        if (!j.is_object()) return std::unexpected(std::string("event payload is not an object"));
        if (frame.type == ipc_type::EVENT_WINDOW) return decode_window_event(j);
        return decode_workspace_event(j);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}
