#pragma once

#include "config.hpp"
#include "input_queue.hpp"
#include "layout_engine.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "sway/ipc.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

// Main thread side of the daemon. Multiplexes signals, the control socket and
// the sway subscription with epoll and feeds everything into the input queue;
// the layout engine consumes it on its own thread.
class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();

    // Returns the process exit status: 1 if the compositor connection was lost.
    int run();

private:
    struct PendingReply {
        int client_fd;
        Reply reply;
    };

    void on_client_readable(int fd);
    void on_sway_readable();
    void on_engine_notify();

    // Blocks while the queue is full. False once the engine has stopped.
    bool enqueue(Input input);

    void post_reply(int client_fd, const Reply& reply);
    void flush_replies();
    void reply_now(int client_fd, const Reply& reply);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // read_event() runs here, requests on the engine thread; they use
    // separate connections.
    SwayIpc sway_;
    UnixSocketServer ipc_server_;
    InputQueue queue_;
    LayoutEngine engine_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int notify_fd_ = -1;

    std::mutex replies_mutex_;
    std::vector<PendingReply> replies_;

    std::atomic<bool> engine_done_{false};
    std::atomic<bool> connection_lost_{false};
    bool running_ = false;

    std::jthread engine_thread_;
};
