#include <catch2/catch.hpp>

#include "core/random_source.h"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

TEST_CASE("SeededRandom repeats its sequence for a seed", "[random]") {
    SeededRandom a(99);
    SeededRandom b(99);
    for (int i = 0; i < 100; i++)
        REQUIRE(a.uniform(0, 1000000) == b.uniform(0, 1000000));
}

TEST_CASE("uniform rejects empty ranges", "[random]") {
    SeededRandom seeded(1);
    SecureRandom secure;

    CHECK_THROWS_AS(seeded.uniform(5, 5), std::invalid_argument);
    CHECK_THROWS_AS(seeded.uniform(6, 5), std::invalid_argument);
    CHECK_THROWS_AS(secure.uniform(5, 5), std::invalid_argument);
}

TEST_CASE("SecureRandom stays within bounds", "[random]") {
    SecureRandom rng;
    for (int i = 0; i < 5000; i++) {
        uint32_t v = rng.uniform(10, 17);
        REQUIRE(v >= 10);
        REQUIRE(v < 17);
    }
    CHECK(rng.uniform(41, 42) == 41);

    // Full width range
    uint32_t wide = rng.uniform(1, 0xFFFFFFFFu);
    CHECK(wide >= 1);
}

TEST_CASE("random sources can be shared between threads", "[random]") {
    SeededRandom seeded(3);
    SecureRandom secure;
    std::vector<std::thread> threads;
    std::atomic<int> outOfRange{0};

    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 2000; i++) {
                if (seeded.uniform(1, 255) >= 255) outOfRange++;
                if (secure.uniform(1, 255) >= 255) outOfRange++;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(outOfRange.load() == 0);
}
