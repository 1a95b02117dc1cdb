#pragma once

#include "layout/layout_mode.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <variant>

// Requests accepted on the control socket, one per line.
struct ChangeLayout {
    LayoutMode layout;
};
struct StackFocusNext {};
struct StackFocusPrev {};
struct StackSwapMain {};
struct StackMainRotateNext {};
struct StackMainRotatePrev {};

using Command = std::variant<ChangeLayout, StackFocusNext, StackFocusPrev, StackSwapMain,
                             StackMainRotateNext, StackMainRotatePrev>;

struct Reply {
    bool ok = true;
    std::string message;

    static Reply success() { return {}; }
    static Reply failure(std::string msg) { return {.ok = false, .message = std::move(msg)}; }
};

namespace reply_error {
inline constexpr const char* NOT_IN_STACK_MAIN = "not in stack-main mode";
inline constexpr const char* UNKNOWN_WORKSPACE = "unknown workspace";
inline constexpr const char* SHUTTING_DOWN = "daemon is shutting down";
inline constexpr const char* UNRECOGNIZED_LAYOUT = "unrecognized layout";
} // namespace reply_error

// Name used on the wire, e.g. "stack-swap-main".
const char* command_name(const Command& cmd);

std::expected<Command, std::string> parse_command(std::string_view line);

// "OK" or "ERROR: <message>", without the trailing newline.
std::string format_reply(const Reply& reply);
std::expected<Reply, std::string> parse_reply(std::string_view line);
