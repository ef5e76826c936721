#include "random.hpp"
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace Random
{
    std::uint32_t secureSeed() {
        // sodium_init() is idempotent: 0 on first success, 1 if already done
        if (sodium_init() < 0) {
            spdlog::error("sodium_init failed; cannot seed random source");
            throw std::runtime_error("Failed to initialize libsodium");
        }
        return randombytes_random();
    }

    std::mt19937 makeEngine() {
        auto seed = secureSeed();
        spdlog::debug("Fuzz engine seeded from libsodium");
        return std::mt19937(seed);
    }
}
