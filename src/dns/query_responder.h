#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/errors.h"
#include "dns/address_pool.h"
#include "dns/dns_packet.h"

class RandomSource;

// Where the address in an answer comes from
class AddressSupplier {
public:
    virtual ~AddressSupplier() = default;
    virtual Ipv4Address next() = 0;
};

// Samples the configured pool; pool and source must outlive the supplier
class PoolAddressSupplier : public AddressSupplier {
public:
    PoolAddressSupplier(const AddressPool& pool, RandomSource& rng);

    Ipv4Address next() override;

private:
    const AddressPool& pool_;
    RandomSource& rng_;
};

struct RespondResult {
    std::vector<uint8_t> bytes;          // empty on failure
    std::optional<ErrorKind> error;
    std::string detail;

    // Filled on success
    uint16_t id = 0;
    DnsQuestion question;
    Ipv4Address address;

    bool ok() const { return !error.has_value(); }
};

/**
 * Turns one DNS request into a response with a single A record.
 *
 * Only the first question is answered, whatever its type. The responder
 * performs no I/O and keeps no state, so concurrent calls are fine as long
 * as the supplier is thread safe.
 */
class QueryResponder {
public:
    static constexpr uint32_t ANSWER_TTL = 600;

    static RespondResult respond(const uint8_t* data, size_t len, AddressSupplier& supplier);
    static RespondResult respond(const std::vector<uint8_t>& data, AddressSupplier& supplier);
};
