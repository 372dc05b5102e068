#include "core/errors.h"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidNetwork:   return "InvalidNetwork";
        case ErrorKind::RangeTooSmall:    return "RangeTooSmall";
        case ErrorKind::MalformedRequest: return "MalformedRequest";
        case ErrorKind::NoQuestion:       return "NoQuestion";
        case ErrorKind::EncodeError:      return "EncodeError";
        default:                          return "Unknown";
    }
}

const char* errorKindLabel(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidNetwork:   return "invalid_network";
        case ErrorKind::RangeTooSmall:    return "range_too_small";
        case ErrorKind::MalformedRequest: return "malformed_request";
        case ErrorKind::NoQuestion:       return "no_question";
        case ErrorKind::EncodeError:      return "encode_error";
        default:                          return "unknown";
    }
}

SinkholeError::SinkholeError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(errorKindName(kind)) +
                         (detail.empty() ? "" : ": " + detail))
    , kind_(kind)
    , detail_(detail) {}
