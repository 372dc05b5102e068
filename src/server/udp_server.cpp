#include "server/udp_server.h"
#include "server/query_log.h"
#include "dns/dns_types.h"
#include "dns/query_responder.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

#include <cerrno>
#include <cstring>
#include <sys/time.h>
#include <utility>

// How often idle workers look at running_
constexpr int RECV_TIMEOUT_MS = 250;

UdpServer::UdpServer(std::string host, int port, int workers,
                     AddressSupplier& supplier, QueryLog* queryLog)
    : host_(std::move(host))
    , port_(port)
    , workers_(workers)
    , supplier_(supplier)
    , queryLog_(queryLog) {}

UdpServer::~UdpServer() {
    stop();
}

bool UdpServer::start() {
    if (running_) return true;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        Logger::instance().log(LogLevel::Error, "DNS: bad listen address " + host_);
        return false;
    }

    sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock_ == INVALID_SOCKET) {
        Logger::instance().log(LogLevel::Error,
            std::string("DNS: socket() failed: ") + std::strerror(errno));
        return false;
    }

    if (bind(sock_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        Logger::instance().log(LogLevel::Error,
            "DNS: cannot bind " + host_ + ":" + std::to_string(port_) +
            ": " + std::strerror(errno));
        closesocket(sock_);
        sock_ = INVALID_SOCKET;
        return false;
    }

    timeval tv{};
    tv.tv_sec = 0;
    tv.tv_usec = RECV_TIMEOUT_MS * 1000;
    if (setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        Logger::instance().log(LogLevel::Error,
            std::string("DNS: cannot set receive timeout: ") + std::strerror(errno));
        closesocket(sock_);
        sock_ = INVALID_SOCKET;
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    getsockname(sock_, (sockaddr*)&bound, &len);
    boundPort_ = ntohs(bound.sin_port);

    running_ = true;
    for (int i = 0; i < workers_; i++)
        threads_.emplace_back(&UdpServer::run, this);

    Logger::instance().log(LogLevel::Info,
        "DNS listening on " + host_ + ":" + std::to_string(boundPort_) +
        " (" + std::to_string(workers_) + " worker" + (workers_ == 1 ? "" : "s") + ")");
    return true;
}

void UdpServer::stop() {
    if (!running_ && threads_.empty()) return;
    running_ = false;

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();

    if (sock_ != INVALID_SOCKET) {
        closesocket(sock_);
        sock_ = INVALID_SOCKET;
    }
    Logger::instance().log(LogLevel::Info, "DNS listener stopped");
}

void UdpServer::run() {
    uint8_t buf[DNS_MAX_UDP_SIZE];

    while (running_) {
        sockaddr_in peer{};
        socklen_t peerLen = sizeof(peer);

        // MSG_TRUNC reports the real length of oversize datagrams
        ssize_t n = recvfrom(sock_, buf, sizeof(buf), MSG_TRUNC, (sockaddr*)&peer, &peerLen);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;
            if (!running_) break;
            Logger::instance().log(LogLevel::Error,
                std::string("DNS: recvfrom failed: ") + std::strerror(errno));
            continue;
        }

        Metrics::instance().inc(metric::REQUESTS);

        if (static_cast<size_t>(n) > sizeof(buf)) {
            RespondResult dropped;
            dropped.error = ErrorKind::MalformedRequest;
            dropped.detail = "datagram of " + std::to_string(n) + " bytes exceeds 512";
            report(peerToString(peer), dropped);
            continue;
        }

        try {
            handleDatagram(buf, static_cast<size_t>(n), peer);
        } catch (const std::exception& ex) {
            Metrics::instance().inc(metric::INTERNAL);
            Logger::instance().log(LogLevel::Error,
                "DNS: request from " + peerToString(peer) + " failed: " + ex.what());
        }
    }
}

void UdpServer::handleDatagram(const uint8_t* data, size_t len, const sockaddr_in& peer) {
    RespondResult result = QueryResponder::respond(data, len, supplier_);
    std::string client = peerToString(peer);
    report(client, result);

    if (!result.ok())
        return;

    ssize_t sent = sendto(sock_, result.bytes.data(), result.bytes.size(), 0,
                          (const sockaddr*)&peer, sizeof(peer));
    if (sent < 0) {
        Metrics::instance().inc(metric::SEND_FAILURES);
        Logger::instance().log(LogLevel::Warn,
            "DNS: failed to send response to " + client + ": " + std::strerror(errno));
        return;
    }
    Metrics::instance().inc(metric::RESPONSES);
}

void UdpServer::report(const std::string& client, const RespondResult& result) {
    if (result.ok()) {
        Logger::instance().log(LogLevel::Debug,
            client + " " + result.question.name.toString() +
            " type " + std::to_string(result.question.qtype) +
            " -> " + result.address.toString());
    } else {
        Metrics::instance().inc(Metrics::errorCounter(errorKindLabel(*result.error)));
        Logger::instance().log(LogLevel::Warn,
            "DNS: dropped datagram from " + client + ": " +
            errorKindName(*result.error) +
            (result.detail.empty() ? "" : " (" + result.detail + ")"));
    }

    if (queryLog_)
        queryLog_->record(client, result);
}
