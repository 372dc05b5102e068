#pragma once
#include <cstdint>
#include <mutex>
#include <random>

/**
 * Source of uniformly distributed integers.
 * Implementations must be safe to call from several threads at once.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform value in [low, high). Throws std::invalid_argument if low >= high.
    virtual uint32_t uniform(uint32_t low, uint32_t high) = 0;
};

// OpenSSL RAND_bytes backed source
class SecureRandom : public RandomSource {
public:
    uint32_t uniform(uint32_t low, uint32_t high) override;

private:
    static uint32_t next32();
};

// Reproducible source for tests and pinned deployments
class SeededRandom : public RandomSource {
public:
    explicit SeededRandom(uint32_t seed);

    uint32_t uniform(uint32_t low, uint32_t high) override;

private:
    std::mutex mutex_;
    std::mt19937 engine_;
};
