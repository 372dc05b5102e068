#pragma once
#include <fstream>
#include <mutex>
#include <string>

struct RespondResult;

/**
 * JSON-lines record of every datagram the server handled.
 *
 * One object per line:
 *   {"ts":"...","client":"10.0.0.5:5353","id":4660,"name":"example.com.",
 *    "qtype":1,"qclass":1,"answer":"192.167.3.4"}
 * or, when the datagram was dropped,
 *   {"ts":"...","client":"...","error":"no_question","detail":"..."}
 */
class QueryLog {
public:
    // Throws std::runtime_error if the file cannot be opened for append
    explicit QueryLog(const std::string& path);

    void record(const std::string& client, const RespondResult& result);

private:
    static std::string timestamp();

    std::mutex mutex_;
    std::ofstream out_;
};
