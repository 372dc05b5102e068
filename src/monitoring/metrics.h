#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <mutex>

// Counter names used by the UDP server
namespace metric {
constexpr const char* REQUESTS      = "sinkhole_requests_total";
constexpr const char* RESPONSES     = "sinkhole_responses_total";
constexpr const char* SEND_FAILURES = "sinkhole_send_failures_total";
constexpr const char* INTERNAL      = "sinkhole_internal_errors_total";
}

class Metrics {
public:
    static Metrics& instance();

    void inc(const std::string& name, int64_t value = 1);
    int64_t value(const std::string& name) const;

    // sinkhole_errors_total{kind="<label>"}
    static std::string errorCounter(const std::string& kindLabel);

    std::string renderPrometheus() const;

    // Tests only
    void reset();

private:
    Metrics() = default;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> counters_;
};
