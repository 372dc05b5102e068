#include <catch2/catch.hpp>

#include "core/readiness_state.h"
#include "core/socket_compat.h"
#include "monitoring/health.h"
#include "monitoring/http_metrics_server.h"
#include "monitoring/metrics.h"

#include <sys/time.h>

TEST_CASE("metrics render sorted Prometheus lines", "[metrics]") {
    Metrics::instance().reset();
    Metrics::instance().inc(metric::REQUESTS);
    Metrics::instance().inc(metric::REQUESTS, 2);
    Metrics::instance().inc(Metrics::errorCounter("no_question"));

    CHECK(Metrics::instance().value(metric::REQUESTS) == 3);
    CHECK(Metrics::instance().value("never_set") == 0);
    CHECK(Metrics::instance().renderPrometheus() ==
          "sinkhole_errors_total{kind=\"no_question\"} 1\n"
          "sinkhole_requests_total 3\n");
    Metrics::instance().reset();
}

TEST_CASE("a default health status is not ok", "[health]") {
    HealthStatus status;
    CHECK_FALSE(status.ok);
    CHECK(status.message.empty());
}

TEST_CASE("readiness drives /ready", "[metrics][health]") {
    auto& readiness = ReadinessStateMachine::instance();

    readiness.setState(ReadinessState::STARTING);
    CHECK_FALSE(Health::check().ok);
    CHECK(HttpMetricsServer::buildResponse("/ready").rfind("HTTP/1.1 503", 0) == 0);

    readiness.setState(ReadinessState::READY);
    CHECK(Health::check().ok);
    CHECK(Health::check().message == "READY");
    CHECK(HttpMetricsServer::buildResponse("/ready").rfind("HTTP/1.1 200", 0) == 0);

    readiness.setState(ReadinessState::STOPPING, "signal received");
    CHECK(Health::check().message == "STOPPING: signal received");

    readiness.setState(ReadinessState::STARTING);
}

TEST_CASE("unknown paths get 404 and /health always answers", "[metrics]") {
    CHECK(HttpMetricsServer::buildResponse("/nope").rfind("HTTP/1.1 404", 0) == 0);
    std::string health = HttpMetricsServer::buildResponse("/health");
    CHECK(health.rfind("HTTP/1.1 200", 0) == 0);
    CHECK(health.find("\r\n\r\nOK") != std::string::npos);
}

TEST_CASE("metrics server answers over HTTP", "[metrics][network]") {
    Metrics::instance().reset();
    Metrics::instance().inc(metric::RESPONSES, 5);

    HttpMetricsServer server;
    REQUIRE(server.start("127.0.0.1", 0));
    REQUIRE(server.port() != 0);

    SOCKET s = socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(s != INVALID_SOCKET);
    timeval tv{2, 0};
    setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(server.port());
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    REQUIRE(connect(s, (sockaddr*)&addr, sizeof(addr)) == 0);

    std::string request = "GET /metrics HTTP/1.1\r\nHost: localhost\r\n\r\n";
    REQUIRE(send(s, request.data(), request.size(), 0) == static_cast<ssize_t>(request.size()));

    std::string reply;
    char buf[1024];
    ssize_t n;
    while ((n = recv(s, buf, sizeof(buf), 0)) > 0)
        reply.append(buf, static_cast<size_t>(n));
    closesocket(s);
    server.stop();

    CHECK(reply.rfind("HTTP/1.1 200 OK", 0) == 0);
    CHECK(reply.find("sinkhole_responses_total 5") != std::string::npos);
    Metrics::instance().reset();
}
