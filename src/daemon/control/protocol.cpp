#include "protocol.hpp"

#include <charconv>
#include <format>
#include <vector>

namespace {

std::vector<std::string_view> split_words(std::string_view line) {
    std::vector<std::string_view> words;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r' ||
                                   line[i] == '\n')) {
            i++;
        }
        size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '\r' &&
               line[i] != '\n') {
            i++;
        }
        if (i > start) words.push_back(line.substr(start, i - start));
    }
    return words;
}

std::expected<uint8_t, std::string> parse_size(std::string_view s) {
    int value = -1;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || value < 0 || value > 100) {
        return std::unexpected(std::format("invalid size '{}'", s));
    }
    return static_cast<uint8_t>(value);
}

// change-layout <manual|spiral|stack-main> [--size N] [--stack-layout L]
std::expected<Command, std::string> parse_change_layout(const std::vector<std::string_view>& args) {
    if (args.size() < 2) return std::unexpected(std::string("missing layout"));

    auto layout = parse_layout_name(args[1]);
    if (!layout) return std::unexpected(std::string(reply_error::UNRECOGNIZED_LAYOUT));

    auto* stack_main = std::get_if<StackMainLayout>(&*layout);
    for (size_t i = 2; i < args.size(); i++) {
        auto arg = args[i];
        bool has_value = i + 1 < args.size();

        if (stack_main && arg == "--size" && has_value) {
            auto size = parse_size(args[++i]);
            if (!size) return std::unexpected(size.error());
            stack_main->size = *size;
        } else if (stack_main && arg == "--stack-layout" && has_value) {
            auto sl = parse_stack_layout(args[++i]);
            if (!sl) return std::unexpected(std::string("unrecognized stack layout"));
            stack_main->stack_layout = *sl;
        } else {
            return std::unexpected(std::format("unexpected argument '{}'", arg));
        }
    }
    return ChangeLayout{.layout = *layout};
}

} // namespace

const char* command_name(const Command& cmd) {
    struct Namer {
        const char* operator()(const ChangeLayout&) const { return "change-layout"; }
        const char* operator()(const StackFocusNext&) const { return "stack-focus-next"; }
        const char* operator()(const StackFocusPrev&) const { return "stack-focus-prev"; }
        const char* operator()(const StackSwapMain&) const { return "stack-swap-main"; }
        const char* operator()(const StackMainRotateNext&) const { return "stack-main-rotate-next"; }
        const char* operator()(const StackMainRotatePrev&) const { return "stack-main-rotate-prev"; }
    };
    return std::visit(Namer{}, cmd);
}

std::expected<Command, std::string> parse_command(std::string_view line) {
    auto words = split_words(line);
    if (words.empty()) return std::unexpected(std::string("empty command"));

    auto name = words[0];
    if (name == "change-layout") return parse_change_layout(words);

    Command cmd;
    if (name == "stack-focus-next") cmd = StackFocusNext{};
    else if (name == "stack-focus-prev") cmd = StackFocusPrev{};
    else if (name == "stack-swap-main") cmd = StackSwapMain{};
    else if (name == "stack-main-rotate-next") cmd = StackMainRotateNext{};
    else if (name == "stack-main-rotate-prev") cmd = StackMainRotatePrev{};
    else return std::unexpected(std::format("unknown command '{}'", name));

    if (words.size() > 1) {
        return std::unexpected(std::format("unexpected argument '{}'", words[1]));
    }
    return cmd;
}

std::string format_reply(const Reply& reply) {
    if (reply.ok) return "OK";
    return "ERROR: " + reply.message;
}

std::expected<Reply, std::string> parse_reply(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.remove_suffix(1);

    if (line == "OK") return Reply::success();

    constexpr std::string_view prefix = "ERROR:";
    if (line.starts_with(prefix)) {
        auto msg = line.substr(prefix.size());
        if (msg.starts_with(' ')) msg.remove_prefix(1);
        return Reply::failure(std::string(msg));
    }
    return std::unexpected(std::format("malformed reply '{}'", line));
}
