#pragma once
#include <thread>
#include <atomic>
#include <string>
#include <cstdint>

#include "core/socket_compat.h"

// Serves /health, /ready and /metrics over plain HTTP/1.1
class HttpMetricsServer {
public:
    ~HttpMetricsServer();

    // Binds synchronously; false if the port cannot be bound
    bool start(const std::string& host, int port);
    void stop();

    uint16_t port() const { return boundPort_; }

    // Status line and body for a request path
    static std::string buildResponse(const std::string& path);

private:
    void run();

    std::atomic<bool> running_{false};
    std::thread thread_;
    SOCKET listenSock_{INVALID_SOCKET};
    uint16_t boundPort_{0};
};
