#include "server/query_log.h"
#include "dns/query_responder.h"

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

QueryLog::QueryLog(const std::string& path)
    : out_(path, std::ios::app) {
    if (!out_.is_open())
        throw std::runtime_error("cannot open query log " + path);
}

std::string QueryLog::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

void QueryLog::record(const std::string& client, const RespondResult& result) {
    json j;
    j["ts"] = timestamp();
    j["client"] = client;

    if (result.ok()) {
        j["id"] = result.id;
        j["name"] = result.question.name.toString();
        j["qtype"] = result.question.qtype;
        j["qclass"] = result.question.qclass;
        j["answer"] = result.address.toString();
    } else {
        j["error"] = errorKindLabel(*result.error);
        j["detail"] = result.detail;
    }

    // Labels are raw bytes; replace anything that is not valid UTF-8
    std::string line = j.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
}
