#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "dns_types.h"

// Domain name as its raw labels; the root name has none
struct DnsName {
    std::vector<std::string> labels;

    // "example.com." form, "." for the root
    std::string toString() const;

    // Parses dotted text, trailing dot optional. Throws std::invalid_argument
    // on empty or oversize labels.
    static DnsName fromString(const std::string& text);

    bool operator==(const DnsName& other) const { return labels == other.labels; }
    bool operator!=(const DnsName& other) const { return labels != other.labels; }
};

struct DnsHeader {
    uint16_t id = 0;
    bool isResponse = false;
    DnsOpcode opcode = DnsOpcode::Query;
    bool authoritative = false;
    bool truncated = false;
    bool recursionDesired = false;
    bool recursionAvailable = false;
    DnsResponseCode rcode = DnsResponseCode::NoError;
};

struct DnsQuestion {
    DnsName name;
    uint16_t qtype = static_cast<uint16_t>(DnsRecordType::A);
    uint16_t qclass = static_cast<uint16_t>(DnsClass::IN);

    bool operator==(const DnsQuestion& other) const {
        return name == other.name && qtype == other.qtype && qclass == other.qclass;
    }
};

struct DnsRecord {
    DnsName name;
    uint16_t type = 0;
    uint16_t rclass = static_cast<uint16_t>(DnsClass::IN);
    uint32_t ttl = 0;
    std::vector<uint8_t> rdata;
};

struct DnsMessage {
    DnsHeader header;
    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> answers;
    std::vector<DnsRecord> authorities;
    std::vector<DnsRecord> additionals;
};

// Throws SinkholeError(MalformedRequest)
DnsMessage decodeDnsMessage(const uint8_t* buf, size_t len);
DnsMessage decodeDnsMessage(const std::vector<uint8_t>& buf);

// Throws SinkholeError(EncodeError)
std::vector<uint8_t> encodeDnsMessage(const DnsMessage& msg);
