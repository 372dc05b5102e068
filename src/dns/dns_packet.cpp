#include "dns_packet.h"
#include "core/errors.h"

#include <cctype>
#include <map>
#include <stdexcept>
#include <utility>

namespace {

constexpr int MAX_POINTER_HOPS = 64;

[[noreturn]] void malformed(const std::string& what) {
    throw SinkholeError(ErrorKind::MalformedRequest, what);
}

[[noreturn]] void unencodable(const std::string& what) {
    throw SinkholeError(ErrorKind::EncodeError, what);
}

void need(size_t off, size_t count, size_t len, const char* what) {
    if (off > len || len - off < count)
        malformed(std::string("truncated ") + what);
}

uint16_t read16(const uint8_t* buf, size_t& off, size_t len, const char* what) {
    need(off, 2, len, what);
    uint16_t v = static_cast<uint16_t>((buf[off] << 8) | buf[off + 1]);
    off += 2;
    return v;
}

uint32_t read32(const uint8_t* buf, size_t& off, size_t len, const char* what) {
    need(off, 4, len, what);
    uint32_t v = (uint32_t(buf[off]) << 24) | (uint32_t(buf[off + 1]) << 16)
               | (uint32_t(buf[off + 2]) << 8) | uint32_t(buf[off + 3]);
    off += 4;
    return v;
}

// Advances off past the name, or past the first pointer if it is compressed
DnsName readName(const uint8_t* buf, size_t& off, size_t len) {
    DnsName name;
    size_t wireLength = 1;
    size_t pos = off;
    bool jumped = false;
    int hops = 0;

    while (true) {
        need(pos, 1, len, "name");
        uint8_t labelLen = buf[pos];

        if ((labelLen & 0xC0) == 0xC0) {
            need(pos, 2, len, "compression pointer");
            size_t ptr = (size_t(labelLen & 0x3F) << 8) | buf[pos + 1];
            // Only backward pointers, which also rules out loops
            if (ptr >= pos)
                malformed("forward compression pointer");
            if (++hops > MAX_POINTER_HOPS)
                malformed("too many compression pointers");
            if (!jumped) {
                off = pos + 2;
                jumped = true;
            }
            pos = ptr;
            continue;
        }
        if ((labelLen & 0xC0) != 0)
            malformed("reserved label type");

        pos++;
        if (labelLen == 0)
            break;

        need(pos, labelLen, len, "label");
        wireLength += 1 + labelLen;
        if (wireLength > DNS_MAX_NAME)
            malformed("name longer than 255 octets");

        name.labels.emplace_back(reinterpret_cast<const char*>(buf + pos), labelLen);
        pos += labelLen;
    }

    if (!jumped)
        off = pos;
    return name;
}

DnsRecord readRecord(const uint8_t* buf, size_t& off, size_t len) {
    DnsRecord r;
    r.name = readName(buf, off, len);
    r.type = read16(buf, off, len, "record type");
    r.rclass = read16(buf, off, len, "record class");
    r.ttl = read32(buf, off, len, "record ttl");
    uint16_t rdlen = read16(buf, off, len, "record length");
    need(off, rdlen, len, "record data");
    if ((r.type == static_cast<uint16_t>(DnsRecordType::A) && rdlen != 4) ||
        (r.type == static_cast<uint16_t>(DnsRecordType::AAAA) && rdlen != 16)) {
        malformed("address record with rdata length " + std::to_string(rdlen));
    }
    r.rdata.assign(buf + off, buf + off + rdlen);
    off += rdlen;
    return r;
}

class Writer {
public:
    void put8(uint8_t v) { out_.push_back(v); }

    void put16(uint16_t v) {
        out_.push_back(static_cast<uint8_t>(v >> 8));
        out_.push_back(static_cast<uint8_t>(v & 0xff));
    }

    void put32(uint32_t v) {
        put16(static_cast<uint16_t>(v >> 16));
        put16(static_cast<uint16_t>(v & 0xffff));
    }

    void putName(const DnsName& name) {
        size_t wireLength = 1;
        for (const auto& label : name.labels) {
            if (label.empty())
                unencodable("empty label");
            if (label.size() > DNS_MAX_LABEL)
                unencodable("label longer than 63 octets: " + label);
            wireLength += 1 + label.size();
        }
        if (wireLength > DNS_MAX_NAME)
            unencodable("name longer than 255 octets: " + name.toString());

        for (size_t i = 0; i < name.labels.size(); i++) {
            std::string key = suffixKey(name, i);
            auto it = offsets_.find(key);
            if (it != offsets_.end()) {
                put16(static_cast<uint16_t>(0xC000 | it->second));
                return;
            }
            // Pointers only reach the first 16K of the message
            if (out_.size() <= 0x3FFF)
                offsets_.emplace(key, static_cast<uint16_t>(out_.size()));

            const auto& label = name.labels[i];
            put8(static_cast<uint8_t>(label.size()));
            out_.insert(out_.end(), label.begin(), label.end());
        }
        put8(0);
    }

    void putRecord(const DnsRecord& r) {
        if (r.rdata.size() > 0xFFFF)
            unencodable("record data longer than 65535 octets");
        putName(r.name);
        put16(r.type);
        put16(r.rclass);
        put32(r.ttl);
        put16(static_cast<uint16_t>(r.rdata.size()));
        out_.insert(out_.end(), r.rdata.begin(), r.rdata.end());
    }

    std::vector<uint8_t> take() { return std::move(out_); }

private:
    // Names compare case-insensitively for compression
    static std::string suffixKey(const DnsName& name, size_t from) {
        std::string key;
        for (size_t i = from; i < name.labels.size(); i++) {
            key.push_back(static_cast<char>(name.labels[i].size()));
            for (char c : name.labels[i])
                key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return key;
    }

    std::vector<uint8_t> out_;
    std::map<std::string, uint16_t> offsets_;
};

uint16_t sectionCount(size_t n, const char* section) {
    if (n > 0xFFFF)
        unencodable(std::string("too many entries in ") + section + " section");
    return static_cast<uint16_t>(n);
}

} // namespace

std::string DnsName::toString() const {
    if (labels.empty())
        return ".";
    std::string out;
    for (const auto& label : labels) {
        out += label;
        out += '.';
    }
    return out;
}

DnsName DnsName::fromString(const std::string& text) {
    DnsName name;
    if (text.empty() || text == ".")
        return name;

    size_t start = 0;
    while (start < text.size()) {
        size_t dot = text.find('.', start);
        if (dot == std::string::npos)
            dot = text.size();
        std::string label = text.substr(start, dot - start);
        if (label.empty())
            throw std::invalid_argument("empty label in '" + text + "'");
        if (label.size() > DNS_MAX_LABEL)
            throw std::invalid_argument("label longer than 63 octets in '" + text + "'");
        name.labels.push_back(label);
        start = dot + 1;
    }
    return name;
}

DnsMessage decodeDnsMessage(const uint8_t* buf, size_t len) {
    if (buf == nullptr || len < DNS_HEADER_SIZE)
        malformed("message shorter than DNS header (" + std::to_string(len) + " bytes)");

    DnsMessage msg;
    size_t off = 0;

    msg.header.id = read16(buf, off, len, "header");
    uint16_t flags = read16(buf, off, len, "header");
    msg.header.isResponse         = (flags & 0x8000) != 0;
    msg.header.opcode             = static_cast<DnsOpcode>((flags >> 11) & 0x0F);
    msg.header.authoritative      = (flags & 0x0400) != 0;
    msg.header.truncated          = (flags & 0x0200) != 0;
    msg.header.recursionDesired   = (flags & 0x0100) != 0;
    msg.header.recursionAvailable = (flags & 0x0080) != 0;
    msg.header.rcode              = static_cast<DnsResponseCode>(flags & 0x000F);

    uint16_t qd = read16(buf, off, len, "header");
    uint16_t an = read16(buf, off, len, "header");
    uint16_t ns = read16(buf, off, len, "header");
    uint16_t ar = read16(buf, off, len, "header");

    for (int i = 0; i < qd; i++) {
        DnsQuestion q;
        q.name = readName(buf, off, len);
        q.qtype = read16(buf, off, len, "question type");
        q.qclass = read16(buf, off, len, "question class");
        msg.questions.push_back(std::move(q));
    }

    for (int i = 0; i < an; i++)
        msg.answers.push_back(readRecord(buf, off, len));
    for (int i = 0; i < ns; i++)
        msg.authorities.push_back(readRecord(buf, off, len));
    for (int i = 0; i < ar; i++)
        msg.additionals.push_back(readRecord(buf, off, len));

    return msg;
}

DnsMessage decodeDnsMessage(const std::vector<uint8_t>& buf) {
    return decodeDnsMessage(buf.data(), buf.size());
}

std::vector<uint8_t> encodeDnsMessage(const DnsMessage& msg) {
    const DnsHeader& h = msg.header;
    uint16_t flags = 0;
    if (h.isResponse)         flags |= 0x8000;
    flags |= static_cast<uint16_t>((static_cast<uint8_t>(h.opcode) & 0x0F) << 11);
    if (h.authoritative)      flags |= 0x0400;
    if (h.truncated)          flags |= 0x0200;
    if (h.recursionDesired)   flags |= 0x0100;
    if (h.recursionAvailable) flags |= 0x0080;
    flags |= static_cast<uint16_t>(static_cast<uint8_t>(h.rcode) & 0x0F);

    Writer w;
    w.put16(h.id);
    w.put16(flags);
    w.put16(sectionCount(msg.questions.size(), "question"));
    w.put16(sectionCount(msg.answers.size(), "answer"));
    w.put16(sectionCount(msg.authorities.size(), "authority"));
    w.put16(sectionCount(msg.additionals.size(), "additional"));

    for (const auto& q : msg.questions) {
        w.putName(q.name);
        w.put16(q.qtype);
        w.put16(q.qclass);
    }
    for (const auto& r : msg.answers)     w.putRecord(r);
    for (const auto& r : msg.authorities) w.putRecord(r);
    for (const auto& r : msg.additionals) w.putRecord(r);

    return w.take();
}
