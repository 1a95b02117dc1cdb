#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      sway_(config_.sway_socket, verbose_),
      queue_(config_.queue_capacity),
      engine_(config_, sway_, verbose_) {}

LinuxEventLoop::~LinuxEventLoop() {
    // Unblocks an engine that never saw a Terminate.
    queue_.close();
    if (engine_thread_.joinable()) engine_thread_.join();

    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (notify_fd_ >= 0) ::close(notify_fd_);
}

bool LinuxEventLoop::init() {
    if (!sway_.connect()) {
        std::println(stderr, "sway: cannot connect (is SWAYSOCK set?)");
        return false;
    }
    if (!sway_.subscribe({"window", "workspace", "shutdown"})) {
        std::println(stderr, "sway: subscribe failed");
        return false;
    }
    log("sway IPC connected at " + sway_.socket_path());

    auto ipc_path = config_.socket_path.empty() ? platform::ipc_endpoint() : config_.socket_path;
    if (!ipc_server_.start(ipc_path)) return false;
    log("control socket listening on " + ipc_path);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Blocked before the engine thread starts so it inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGHUP);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGQUIT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    notify_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (notify_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) return true;
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    };

    if (!add_fd(signal_fd_) || !add_fd(ipc_server_.server_fd()) || !add_fd(notify_fd_) ||
        !add_fd(sway_.event_fd())) {
        return false;
    }

    engine_thread_ = std::jthread([this](std::stop_token) {
        bool lost = engine_.run(queue_, [this](int fd, const Reply& reply) { post_reply(fd, reply); });
        connection_lost_.store(lost, std::memory_order_release);
        engine_done_.store(true, std::memory_order_release);

        uint64_t val = 1;
        if (::write(notify_fd_, &val, sizeof(val)) < 0) {
            std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
        }
    });

    running_ = true;
    return true;
}

int LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            enqueue(Terminate{});
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                    log(std::format("received signal {}, shutting down", info.ssi_signo));
                }
                enqueue(Terminate{});
            } else if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
            } else if (fd == notify_fd_) {
                on_engine_notify();
            } else if (fd == sway_.event_fd()) {
                on_sway_readable();
            } else {
                on_client_readable(fd);
            }
        }
    }

    if (engine_thread_.joinable()) engine_thread_.join();
    flush_replies();
    ipc_server_.stop();

    return connection_lost_.load(std::memory_order_acquire) ? 1 : 0;
}

void LinuxEventLoop::on_client_readable(int fd) {
    std::string line;
    switch (ipc_server_.read_line(fd, line)) {
        case IpcServer::ReadStatus::Pending:
            return;
        case IpcServer::ReadStatus::Closed:
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            ipc_server_.close_client(fd);
            return;
        case IpcServer::ReadStatus::Line:
            break;
    }

    // One request per connection; stop watching until the reply is written.
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);

    auto cmd = parse_command(line);
    if (!cmd) {
        log("rejected request '" + line + "': " + cmd.error());
        reply_now(fd, Reply::failure(cmd.error()));
        return;
    }

    if (!enqueue(ControlRequest{.command = std::move(*cmd), .client_fd = fd})) {
        reply_now(fd, Reply::failure(reply_error::SHUTTING_DOWN));
    }
}

void LinuxEventLoop::on_sway_readable() {
    auto event = sway_.read_event();
    if (!event) {
        std::println(stderr, "sway: {}", event.error().message);
        if (event.error().fatal) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, sway_.event_fd(), nullptr);
            enqueue(Terminate{.connection_lost = true});
        }
        return;
    }
    if (*event) enqueue(std::move(**event));
}

void LinuxEventLoop::on_engine_notify() {
    uint64_t val;
    if (::read(notify_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "eventfd read failed: {}", std::strerror(errno));
    }

    flush_replies();

    if (engine_done_.load(std::memory_order_acquire)) {
        log("engine stopped");
        running_ = false;
    }
}

bool LinuxEventLoop::enqueue(Input input) {
    return queue_.push(std::move(input));
}

void LinuxEventLoop::post_reply(int client_fd, const Reply& reply) {
    {
        std::lock_guard lock(replies_mutex_);
        replies_.push_back({client_fd, reply});
    }
    uint64_t val = 1;
    if (::write(notify_fd_, &val, sizeof(val)) < 0) {
        std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::flush_replies() {
    std::vector<PendingReply> ready;
    {
        std::lock_guard lock(replies_mutex_);
        ready.swap(replies_);
    }
    for (auto& r : ready) {
        reply_now(r.client_fd, r.reply);
    }
}

void LinuxEventLoop::reply_now(int client_fd, const Reply& reply) {
    if (!ipc_server_.send_reply(client_fd, format_reply(reply))) {
        log(std::format("client {} went away before its reply", client_fd));
    }
    ipc_server_.close_client(client_fd);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[stackway] {}", msg);
    }
}
