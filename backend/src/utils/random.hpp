#pragma once
#include <cstdint>
#include <random>

namespace Random
{
    // Seed drawn from the libsodium CSPRNG. Throws std::runtime_error if
    // libsodium cannot be initialized.
    std::uint32_t secureSeed();

    // Default fuzz engine for schedulers constructed without an explicit one.
    std::mt19937 makeEngine();
}
