#include <catch2/catch.hpp>

#include "sway/ipc_codec.hpp"

#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace {

struct SocketPair {
    int fds[2] = {-1, -1};

    SocketPair() { ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds); }
    ~SocketPair() {
        if (fds[0] >= 0) ::close(fds[0]);
        if (fds[1] >= 0) ::close(fds[1]);
    }

    void write_raw(const std::string& bytes) {
        REQUIRE(::write(fds[1], bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size()));
    }
    void close_writer() {
        ::close(fds[1]);
        fds[1] = -1;
    }
};

Frame window_frame(const std::string& json) {
    return Frame{.type = ipc_type::EVENT_WINDOW, .payload = json};
}

} // namespace

TEST_CASE("Frame encoding", "[codec]") {

    SECTION("HeaderLayout") {
        auto msg = encode_message(ipc_type::GET_TREE, "");
        REQUIRE(msg.size() == IPC_HEADER_LEN);
        REQUIRE(msg.substr(0, 6) == "i3-ipc");
        // length 0, type 4, both little endian
        REQUIRE(msg.substr(6, 4) == std::string("\0\0\0\0", 4));
        REQUIRE(msg.substr(10, 4) == std::string("\x04\0\0\0", 4));
    }

    SECTION("EventTypeHighBit") {
        auto msg = encode_message(ipc_type::EVENT_WINDOW, "{}");
        REQUIRE(msg.substr(6, 4) == std::string("\x02\0\0\0", 4));
        REQUIRE(msg.substr(10, 4) == std::string("\x03\0\0\x80", 4));
        REQUIRE(msg.substr(IPC_HEADER_LEN) == "{}");
    }

    SECTION("DecodeWithTrailingBytes") {
        auto bytes = encode_message(ipc_type::RUN_COMMAND, "[{\"success\":true}]") + "i3-";
        size_t consumed = 0;
        auto frame = decode_frame(bytes, consumed);
        REQUIRE(frame.has_value());
        REQUIRE(frame->type == ipc_type::RUN_COMMAND);
        REQUIRE(frame->payload == "[{\"success\":true}]");
        REQUIRE(consumed == bytes.size() - 3);
    }

    SECTION("DecodeIncomplete") {
        auto bytes = encode_message(ipc_type::RUN_COMMAND, "focus left");
        size_t consumed = 99;
        REQUIRE(decode_frame(bytes.substr(0, 10), consumed).error() == FrameError::Truncated);
        REQUIRE(decode_frame(bytes.substr(0, bytes.size() - 1), consumed).error() ==
                FrameError::Truncated);
        REQUIRE(consumed == 0);
    }

    SECTION("DecodeBadMagic") {
        auto bytes = encode_message(ipc_type::RUN_COMMAND, "x");
        bytes[0] = 'I';
        size_t consumed = 0;
        REQUIRE(decode_frame(bytes, consumed).error() == FrameError::BadMagic);
    }
}

TEST_CASE("Frame reading from a socket", "[codec]") {
    SocketPair sp;

    SECTION("TwoFramesInOneWrite") {
        sp.write_raw(encode_message(ipc_type::EVENT_WINDOW, "{\"a\":1}") +
                     encode_message(ipc_type::EVENT_SHUTDOWN, "{}"));
        auto first = read_frame(sp.fds[0]);
        auto second = read_frame(sp.fds[0]);
        REQUIRE(first.has_value());
        REQUIRE(first->payload == "{\"a\":1}");
        REQUIRE(second.has_value());
        REQUIRE(second->type == ipc_type::EVENT_SHUTDOWN);
    }

    SECTION("EofAtBoundaryIsClosed") {
        sp.close_writer();
        REQUIRE(read_frame(sp.fds[0]).error() == FrameError::ConnectionClosed);
    }

    SECTION("EofInsideFrameIsTruncated") {
        auto bytes = encode_message(ipc_type::GET_TREE, "{\"nodes\":[]}");
        sp.write_raw(bytes.substr(0, bytes.size() - 4));
        sp.close_writer();
        REQUIRE(read_frame(sp.fds[0]).error() == FrameError::Truncated);
    }

    SECTION("BadMagicKeepsStreamAligned") {
        auto bad = encode_message(ipc_type::EVENT_WINDOW, "garbage");
        bad.replace(0, 6, "xx-ipc");
        sp.write_raw(bad + encode_message(ipc_type::EVENT_WINDOW, "{}"));

        REQUIRE(read_frame(sp.fds[0]).error() == FrameError::BadMagic);
        auto next = read_frame(sp.fds[0]);
        REQUIRE(next.has_value());
        REQUIRE(next->payload == "{}");
    }

    SECTION("WriteFrameRoundTrip") {
        REQUIRE(write_frame(sp.fds[1], ipc_type::SUBSCRIBE, "[\"window\"]"));
        auto frame = read_frame(sp.fds[0]);
        REQUIRE(frame.has_value());
        REQUIRE(frame->type == ipc_type::SUBSCRIBE);
        REQUIRE(frame->payload == "[\"window\"]");
    }
}

TEST_CASE("Event decoding", "[codec]") {

    SECTION("WindowNew") {
        auto ev = decode_event(window_frame(R"({
            "change": "new",
            "container": {"id": 42, "type": "con", "app_id": "foot",
                          "rect": {"x": 0, "y": 0, "width": 1920, "height": 1080}}
        })"));
        REQUIRE(ev.has_value());
        REQUIRE(ev->has_value());
        auto* n = std::get_if<WindowNew>(&**ev);
        REQUIRE(n != nullptr);
        REQUIRE(n->window_id == 42);
        REQUIRE(n->app_id == "foot");
        REQUIRE(n->width == 1920);
        REQUIRE(n->height == 1080);
        REQUIRE(n->workspace == -1);
        REQUIRE_FALSE(n->floating);
    }

    SECTION("WindowNewX11Class") {
        auto ev = decode_event(window_frame(R"({
            "change": "new",
            "container": {"id": 7, "type": "floating_con", "app_id": null,
                          "window_properties": {"class": "Firefox"}}
        })"));
        auto* n = std::get_if<WindowNew>(&**ev);
        REQUIRE(n != nullptr);
        REQUIRE(n->app_id == "Firefox");
        REQUIRE(n->floating);
    }

    SECTION("WindowChanges") {
        auto close = decode_event(window_frame(R"({"change":"close","container":{"id":3}})"));
        REQUIRE(std::get<WindowClose>(**close).window_id == 3);

        auto focus = decode_event(window_frame(R"({"change":"focus","container":{"id":4}})"));
        REQUIRE(std::get<WindowFocus>(**focus).window_id == 4);

        auto move = decode_event(window_frame(R"({"change":"move","container":{"id":5}})"));
        REQUIRE(std::get<WindowMove>(**move).window_id == 5);

        auto fl = decode_event(
            window_frame(R"({"change":"floating","container":{"id":6,"type":"floating_con"}})"));
        REQUIRE(std::get<WindowFloating>(**fl).floating);
    }

    SECTION("IgnoredChange") {
        auto ev = decode_event(window_frame(R"({"change":"title","container":{"id":3}})"));
        REQUIRE(ev.has_value());
        REQUIRE_FALSE(ev->has_value());
    }

    SECTION("WorkspaceEvents") {
        Frame f{.type = ipc_type::EVENT_WORKSPACE,
                .payload = R"({"change":"focus","current":{"num":3,"name":"3: web"}})"};
        auto ev = decode_event(f);
        auto& focus = std::get<WorkspaceFocus>(**ev);
        REQUIRE(focus.workspace == 3);
        REQUIRE(focus.name == "3: web");

        f.payload = R"({"change":"empty","current":{"num":5,"name":"5"}})";
        REQUIRE(std::get<WorkspaceEmpty>(**decode_event(f)).workspace == 5);
    }

    SECTION("Shutdown") {
        Frame f{.type = ipc_type::EVENT_SHUTDOWN, .payload = R"({"change":"exit"})"};
        auto ev = decode_event(f);
        REQUIRE(std::holds_alternative<Shutdown>(**ev));
    }

    SECTION("UnknownEventType") {
        Frame f{.type = 0x80000001, .payload = "{}"};
        auto ev = decode_event(f);
        REQUIRE(ev.has_value());
        REQUIRE_FALSE(ev->has_value());
    }

    SECTION("InvalidJson") {
        REQUIRE_FALSE(decode_event(window_frame("{not json")).has_value());
    }
}
