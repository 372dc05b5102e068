#include "core/random_source.h"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <string>

static void checkRange(uint32_t low, uint32_t high) {
    if (low >= high) {
        throw std::invalid_argument(
            "empty random range [" + std::to_string(low) + ", " +
            std::to_string(high) + ")");
    }
}

uint32_t SecureRandom::next32() {
    unsigned char buf[4];
    if (RAND_bytes(buf, sizeof(buf)) != 1) {
        char errbuf[256];
        ERR_error_string_n(ERR_get_error(), errbuf, sizeof(errbuf));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + errbuf);
    }
    return (uint32_t(buf[0]) << 24) | (uint32_t(buf[1]) << 16)
         | (uint32_t(buf[2]) << 8) | uint32_t(buf[3]);
}

uint32_t SecureRandom::uniform(uint32_t low, uint32_t high) {
    checkRange(low, high);
    const uint32_t span = high - low;

    // Reject the low (2^32 mod span) draws so every residue is equally likely
    const uint32_t threshold = (0u - span) % span;
    uint32_t r;
    do {
        r = next32();
    } while (r < threshold);

    return low + r % span;
}

SeededRandom::SeededRandom(uint32_t seed)
    : engine_(seed) {}

uint32_t SeededRandom::uniform(uint32_t low, uint32_t high) {
    checkRange(low, high);
    std::uniform_int_distribution<uint32_t> dist(low, high - 1);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(engine_);
}
