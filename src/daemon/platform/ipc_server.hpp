#pragma once

#include <string>

// Line-based request/reply server for the control socket.
class IpcServer {
public:
    enum class ReadStatus {
        Line,     // a complete request line was read
        Pending,  // need more data
        Closed,   // peer hung up, errored or exceeded the line limit
    };

    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual ReadStatus read_line(int client_fd, std::string& line) = 0;
    virtual bool send_reply(int client_fd, const std::string& line) = 0;
    virtual void close_client(int client_fd) = 0;
};
