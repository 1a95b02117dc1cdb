#pragma once

#include <string>

// Sends one request line to the daemon and waits for its one-line reply.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send_line(const std::string& line) = 0;
    virtual bool recv_line(std::string& line, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
};
