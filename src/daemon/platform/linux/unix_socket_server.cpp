#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

bool fill_address(sockaddr_un& addr, const std::string& path) {
    addr = {};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

// True if something accepts connections on `path`.
bool endpoint_alive(const sockaddr_un& addr) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;
    bool alive = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return alive;
}

} // namespace

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr;
    if (!fill_address(addr, endpoint)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }

    if (endpoint_alive(addr)) {
        std::println(stderr, "ipc: another daemon is already listening on {}", endpoint);
        return false;
    }
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind({}) failed: {}", endpoint, std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 16) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        ::unlink(endpoint.c_str());
        return false;
    }

    socket_path_ = endpoint;
    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

IpcServer::ReadStatus UnixSocketServer::read_line(int client_fd, std::string& line) {
    auto* client = find_client(client_fd);
    if (!client) return ReadStatus::Closed;

    char buf[1024];
    for (;;) {
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            return ReadStatus::Closed;
        }
        if (n == 0) {
            // Peer shut down its side; an unterminated request still counts.
            if (client->buf.empty()) return ReadStatus::Closed;
            line = std::move(client->buf);
            client->buf.clear();
            return ReadStatus::Line;
        }

        client->buf.append(buf, static_cast<size_t>(n));

        auto pos = client->buf.find('\n');
        if (pos != std::string::npos) {
            if (pos > MAX_LINE) return ReadStatus::Closed;
            line = client->buf.substr(0, pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            client->buf.erase(0, pos + 1);
            return ReadStatus::Line;
        }
        if (client->buf.size() > MAX_LINE) return ReadStatus::Closed;
    }
    return ReadStatus::Pending;
}

bool UnixSocketServer::send_reply(int client_fd, const std::string& line) {
    std::string msg = line + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
