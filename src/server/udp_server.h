#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "core/socket_compat.h"

class AddressSupplier;
class QueryLog;
struct RespondResult;

/**
 * UDP front end of the responder.
 *
 * Every worker thread blocks in recvfrom() on the same socket, answers the
 * datagram and sends the reply back to its source. Bad datagrams are
 * logged and dropped; they never stop the loop.
 */
class UdpServer {
public:
    UdpServer(std::string host, int port, int workers,
              AddressSupplier& supplier, QueryLog* queryLog = nullptr);
    ~UdpServer();

    UdpServer(const UdpServer&) = delete;
    UdpServer& operator=(const UdpServer&) = delete;

    // Binds and starts the workers; false if the address cannot be bound
    bool start();
    void stop();

    bool running() const { return running_; }
    uint16_t port() const { return boundPort_; }

private:
    void run();
    void handleDatagram(const uint8_t* data, size_t len, const sockaddr_in& peer);
    void report(const std::string& client, const RespondResult& result);

    std::string host_;
    int port_;
    int workers_;
    AddressSupplier& supplier_;
    QueryLog* queryLog_;

    std::atomic<bool> running_{false};
    SOCKET sock_{INVALID_SOCKET};
    uint16_t boundPort_{0};
    std::vector<std::thread> threads_;
};
