#include "dns/query_responder.h"
#include "core/random_source.h"

PoolAddressSupplier::PoolAddressSupplier(const AddressPool& pool, RandomSource& rng)
    : pool_(pool), rng_(rng) {}

Ipv4Address PoolAddressSupplier::next() {
    return pool_.sample(rng_);
}

static RespondResult failure(ErrorKind kind, const std::string& detail) {
    RespondResult r;
    r.error = kind;
    r.detail = detail;
    return r;
}

RespondResult QueryResponder::respond(const uint8_t* data, size_t len,
                                      AddressSupplier& supplier) {
    DnsMessage request;
    try {
        request = decodeDnsMessage(data, len);
    } catch (const SinkholeError& e) {
        return failure(ErrorKind::MalformedRequest, e.detail());
    }

    if (request.questions.empty())
        return failure(ErrorKind::NoQuestion, "request has no question");

    const DnsQuestion& query = request.questions.front();

    DnsMessage response;
    response.header.id = request.header.id;
    response.header.isResponse = true;
    response.header.opcode = DnsOpcode::Query;
    response.header.rcode = DnsResponseCode::NoError;
    response.questions.push_back(query);

    Ipv4Address address = supplier.next();
    auto bytes = address.toBytes();

    DnsRecord answer;
    answer.name = query.name;
    answer.type = static_cast<uint16_t>(DnsRecordType::A);
    answer.rclass = static_cast<uint16_t>(DnsClass::IN);
    answer.ttl = ANSWER_TTL;
    answer.rdata.assign(bytes.begin(), bytes.end());
    response.answers.push_back(std::move(answer));

    RespondResult result;
    try {
        result.bytes = encodeDnsMessage(response);
    } catch (const SinkholeError& e) {
        return failure(ErrorKind::EncodeError, e.detail());
    }

    result.id = request.header.id;
    result.question = query;
    result.address = address;
    return result;
}

RespondResult QueryResponder::respond(const std::vector<uint8_t>& data,
                                      AddressSupplier& supplier) {
    return respond(data.data(), data.size(), supplier);
}
