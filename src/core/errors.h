#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidNetwork,     // CIDR string failed to parse
    RangeTooSmall,      // network holds fewer than 3 addresses
    MalformedRequest,   // request bytes are not a DNS message
    NoQuestion,         // request has an empty question section
    EncodeError         // response could not be serialized
};

const char* errorKindName(ErrorKind kind);

// Snake-case form used for metric labels and the query log
const char* errorKindLabel(ErrorKind kind);

class SinkholeError : public std::runtime_error {
public:
    SinkholeError(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};
