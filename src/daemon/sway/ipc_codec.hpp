#pragma once

#include "events.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

// i3-ipc message types (requests and their replies share the code).
namespace ipc_type {
inline constexpr uint32_t RUN_COMMAND = 0;
inline constexpr uint32_t GET_WORKSPACES = 1;
inline constexpr uint32_t SUBSCRIBE = 2;
inline constexpr uint32_t GET_TREE = 4;

// Events have the high bit set.
inline constexpr uint32_t EVENT_WORKSPACE = 0x80000000;
inline constexpr uint32_t EVENT_WINDOW = 0x80000003;
inline constexpr uint32_t EVENT_SHUTDOWN = 0x80000006;
} // namespace ipc_type

// Header: "i3-ipc" (6 bytes) + length (4 bytes LE) + type (4 bytes LE)
inline constexpr char IPC_MAGIC[] = "i3-ipc";
inline constexpr size_t IPC_MAGIC_LEN = 6;
inline constexpr size_t IPC_HEADER_LEN = 14;
// Upper bound for a payload we are willing to buffer.
inline constexpr uint32_t IPC_MAX_PAYLOAD = 64u * 1024 * 1024;

struct Frame {
    uint32_t type = 0;
    std::string payload;
};

enum class FrameError { Truncated, BadMagic, ConnectionClosed };

const char* frame_error_name(FrameError err);

std::string encode_message(uint32_t type, std::string_view payload = {});

// Decode one frame from the front of `bytes`. On success `consumed` is the
// number of bytes the frame occupied. Incomplete input is Truncated.
std::expected<Frame, FrameError> decode_frame(std::string_view bytes, size_t& consumed);

// Blocking read of exactly one frame from a stream socket.
// EOF before the first header byte is ConnectionClosed, EOF later is Truncated.
// A frame with a bad magic has its payload drained before BadMagic is returned.
std::expected<Frame, FrameError> read_frame(int fd);

// Write a whole frame. Returns false on a short write or a closed peer.
bool write_frame(int fd, uint32_t type, std::string_view payload = {});

// Map an event frame to an Event. Changes we do not act on decode to nullopt;
// a payload that is not valid JSON is an error.
std::expected<std::optional<Event>, std::string> decode_event(const Frame& frame);
