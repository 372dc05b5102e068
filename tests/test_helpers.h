#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "dns/dns_packet.h"
#include "dns/query_responder.h"

// Always hands out the same address and counts the calls
class FixedAddressSupplier : public AddressSupplier {
public:
    explicit FixedAddressSupplier(uint32_t value) : address_{value} {}

    Ipv4Address next() override {
        calls++;
        return address_;
    }

    int calls = 0;

private:
    Ipv4Address address_;
};

inline std::vector<uint8_t> buildQuery(uint16_t id, const std::string& name,
                                       uint16_t qtype = 1, uint16_t qclass = 1) {
    DnsMessage msg;
    msg.header.id = id;
    msg.header.recursionDesired = true;
    msg.questions.push_back(DnsQuestion{DnsName::fromString(name), qtype, qclass});
    return encodeDnsMessage(msg);
}
