#include "monitoring/http_metrics_server.h"
#include "monitoring/metrics.h"
#include "monitoring/health.h"
#include "core/logger.h"

#include <cerrno>
#include <cstring>
#include <sstream>

HttpMetricsServer::~HttpMetricsServer() {
    stop();
}

bool HttpMetricsServer::start(const std::string& host, int port) {
    if (running_) return true;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        Logger::instance().log(LogLevel::Error, "Metrics: bad listen address " + host);
        return false;
    }

    listenSock_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listenSock_ == INVALID_SOCKET) {
        Logger::instance().log(LogLevel::Error,
            std::string("Metrics: socket() failed: ") + std::strerror(errno));
        return false;
    }

    int yes = 1;
    setsockopt(listenSock_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    if (bind(listenSock_, (sockaddr*)&addr, sizeof(addr)) < 0 ||
        listen(listenSock_, 16) < 0) {
        Logger::instance().log(LogLevel::Error,
            "Metrics: cannot listen on " + host + ":" + std::to_string(port) +
            ": " + std::strerror(errno));
        closesocket(listenSock_);
        listenSock_ = INVALID_SOCKET;
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    getsockname(listenSock_, (sockaddr*)&bound, &len);
    boundPort_ = ntohs(bound.sin_port);

    running_ = true;
    thread_ = std::thread(&HttpMetricsServer::run, this);
    Logger::instance().log(LogLevel::Info,
        "Metrics listening on " + host + ":" + std::to_string(boundPort_));
    return true;
}

void HttpMetricsServer::stop() {
    if (!running_) return;
    running_ = false;
    // Wakes the blocking accept()
    if (listenSock_ != INVALID_SOCKET)
        shutdown(listenSock_, SHUT_RDWR);

    if (thread_.joinable())
        thread_.join();

    if (listenSock_ != INVALID_SOCKET) {
        closesocket(listenSock_);
        listenSock_ = INVALID_SOCKET;
    }
}

std::string HttpMetricsServer::buildResponse(const std::string& path) {
    std::string response;
    int statusCode = 200;
    std::string statusText = "OK";
    std::string contentType = "text/plain";

    if (path == "/health") {
        response = "OK";
    } else if (path == "/ready") {
        auto health = Health::check();
        response = health.message;
        if (!health.ok) {
            statusCode = 503;
            statusText = "Service Unavailable";
        }
    } else if (path == "/metrics") {
        contentType = "text/plain; version=0.0.4; charset=utf-8";
        response = Metrics::instance().renderPrometheus();
    } else {
        statusCode = 404;
        statusText = "Not Found";
        response = "Endpoint not found";
    }

    std::ostringstream httpResponse;
    httpResponse << "HTTP/1.1 " << statusCode << " " << statusText << "\r\n";
    httpResponse << "Content-Type: " << contentType << "\r\n";
    httpResponse << "Content-Length: " << response.size() << "\r\n";
    httpResponse << "Connection: close\r\n";
    httpResponse << "\r\n";
    httpResponse << response;
    return httpResponse.str();
}

void HttpMetricsServer::run() {
    while (running_) {
        SOCKET client = accept(listenSock_, nullptr, nullptr);
        if (client == INVALID_SOCKET) {
            if (!running_) break;
            continue;
        }

        char buffer[4096];
        ssize_t bytesRead = recv(client, buffer, sizeof(buffer) - 1, 0);
        if (bytesRead <= 0) {
            closesocket(client);
            continue;
        }
        buffer[bytesRead] = '\0';
        std::string request(buffer);

        // "GET /path HTTP/1.1"
        std::string path;
        size_t pathStart = request.find(' ');
        if (pathStart != std::string::npos) {
            size_t pathEnd = request.find(' ', pathStart + 1);
            if (pathEnd != std::string::npos) {
                path = request.substr(pathStart + 1, pathEnd - pathStart - 1);
            }
        }

        std::string out = buildResponse(path);
        if (send(client, out.data(), out.size(), MSG_NOSIGNAL) < 0) {
            Logger::instance().log(LogLevel::Debug,
                std::string("Metrics: send failed: ") + std::strerror(errno));
        }
        closesocket(client);
    }
}
