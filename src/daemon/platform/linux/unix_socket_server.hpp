#pragma once

#include "platform/ipc_server.hpp"

#include <cstddef>
#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    static constexpr size_t MAX_LINE = 4096;

    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    // Fails if another daemon already answers on `endpoint`; a stale socket
    // file is removed.
    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadStatus read_line(int client_fd, std::string& line) override;
    bool send_reply(int client_fd, const std::string& line) override;
    void close_client(int client_fd) override;


private:
    int server_fd_ = -1;
    std::string socket_path_;

    struct ClientBuffer {
        int fd;
        std::string buf;
    };
    std::vector<ClientBuffer> clients_;

    ClientBuffer* find_client(int fd);
};
