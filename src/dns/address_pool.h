#pragma once
#include <array>
#include <cstdint>
#include <string>

class RandomSource;

struct Ipv4Address {
    uint32_t value = 0;   // host byte order

    std::string toString() const;
    std::array<uint8_t, 4> toBytes() const;   // network byte order

    static Ipv4Address fromBytes(const uint8_t* bytes);

    bool operator==(const Ipv4Address& other) const { return value == other.value; }
    bool operator!=(const Ipv4Address& other) const { return value != other.value; }
};

/**
 * IPv4 block handed out to clients.
 *
 * Built once from a CIDR string and read-only afterwards, so a single
 * instance can be shared by every worker thread.
 */
class AddressPool {
public:
    // Throws SinkholeError(InvalidNetwork) or SinkholeError(RangeTooSmall)
    static AddressPool fromCidr(const std::string& cidr);

    // Uniform pick that never returns the network or the topmost address
    Ipv4Address sample(RandomSource& rng) const;

    uint32_t base() const { return base_; }
    uint32_t range() const { return range_; }

    Ipv4Address firstUsable() const { return Ipv4Address{base_ + 1}; }
    Ipv4Address lastUsable() const { return Ipv4Address{base_ + range_ - 2}; }

    std::string toString() const;

private:
    AddressPool(uint32_t base, uint32_t range, int prefix);

    uint32_t base_;
    uint32_t range_;
    int prefix_;
};
