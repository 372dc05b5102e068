#include "dns/address_pool.h"
#include "core/errors.h"
#include "core/random_source.h"

#include <arpa/inet.h>
#include <cctype>
#include <cstdio>

std::string Ipv4Address::toString() const {
    char ip[16];
    snprintf(ip, sizeof(ip), "%u.%u.%u.%u",
             (value >> 24) & 0xff, (value >> 16) & 0xff,
             (value >> 8) & 0xff, value & 0xff);
    return ip;
}

std::array<uint8_t, 4> Ipv4Address::toBytes() const {
    return {
        static_cast<uint8_t>(value >> 24),
        static_cast<uint8_t>(value >> 16),
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value)
    };
}

Ipv4Address Ipv4Address::fromBytes(const uint8_t* bytes) {
    return Ipv4Address{(uint32_t(bytes[0]) << 24) | (uint32_t(bytes[1]) << 16)
                     | (uint32_t(bytes[2]) << 8) | uint32_t(bytes[3])};
}

AddressPool::AddressPool(uint32_t base, uint32_t range, int prefix)
    : base_(base), range_(range), prefix_(prefix) {}

static int parsePrefix(const std::string& text, const std::string& cidr) {
    if (text.empty()) {
        throw SinkholeError(ErrorKind::InvalidNetwork,
                            "bad prefix length in '" + cidr + "'");
    }
    // Leading zeros are accepted; the value saturates above 32 so long
    // digit strings cannot overflow
    int prefix = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw SinkholeError(ErrorKind::InvalidNetwork,
                                "bad prefix length in '" + cidr + "'");
        }
        prefix = prefix * 10 + (c - '0');
        if (prefix > 32)
            prefix = 33;
    }
    if (prefix > 32) {
        throw SinkholeError(ErrorKind::InvalidNetwork,
                            "prefix length above 32 in '" + cidr + "'");
    }
    return prefix;
}

AddressPool AddressPool::fromCidr(const std::string& cidr) {
    size_t slash = cidr.find('/');
    std::string addrText = cidr.substr(0, slash);

    // No prefix means a single host network
    int prefix = 32;
    if (slash != std::string::npos)
        prefix = parsePrefix(cidr.substr(slash + 1), cidr);

    in_addr addr{};
    if (inet_pton(AF_INET, addrText.c_str(), &addr) != 1) {
        throw SinkholeError(ErrorKind::InvalidNetwork,
                            "bad IPv4 address in '" + cidr + "'");
    }

    // 1 << 32 does not fit
    if (prefix == 0) {
        throw SinkholeError(ErrorKind::RangeTooSmall,
                            "address count of '" + cidr + "' overflows 32 bits");
    }

    uint32_t range = uint32_t(1) << (32 - prefix);
    if (range <= 2) {
        throw SinkholeError(ErrorKind::RangeTooSmall,
                            "'" + cidr + "' has no usable host addresses");
    }

    uint32_t mask = ~(range - 1);
    uint32_t base = ntohl(addr.s_addr) & mask;
    return AddressPool(base, range, prefix);
}

Ipv4Address AddressPool::sample(RandomSource& rng) const {
    uint32_t offset = rng.uniform(1, range_ - 1);
    return Ipv4Address{base_ + offset};
}

std::string AddressPool::toString() const {
    return Ipv4Address{base_}.toString() + "/" + std::to_string(prefix_);
}
