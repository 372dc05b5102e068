#pragma once
#include <cstddef>
#include <cstdint>

enum class DnsRecordType : uint16_t {
    A     = 1,
    NS    = 2,
    CNAME = 5,
    SOA   = 6,
    PTR   = 12,
    MX    = 15,
    TXT   = 16,
    AAAA  = 28,
    OPT   = 41
};

enum class DnsClass : uint16_t {
    IN  = 1,
    ANY = 255
};

enum class DnsOpcode : uint8_t {
    Query  = 0,
    IQuery = 1,
    Status = 2,
    Notify = 4,
    Update = 5
};

// Wire values (RFC 1035 4.1.1)
enum class DnsResponseCode : uint8_t {
    NoError  = 0,
    FormErr  = 1,
    ServFail = 2,
    NxDomain = 3,
    NotImp   = 4,
    Refused  = 5
};

constexpr size_t DNS_HEADER_SIZE = 12;
constexpr size_t DNS_MAX_UDP_SIZE = 512;
constexpr size_t DNS_MAX_LABEL = 63;
constexpr size_t DNS_MAX_NAME = 255;
