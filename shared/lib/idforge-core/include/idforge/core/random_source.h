/**
 * @file random_source.h
 * @brief Per-call random engine
 *
 * Each generate call owns one RandomSource; nothing is shared between
 * calls or threads. Unseeded sources draw their seed from OpenSSL.
 */

#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace idforge::core {

class RandomSource {
public:
    explicit RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {}

    /**
     * @brief 64 bits from the OpenSSL CSPRNG
     * @throws common::EntropyException if RAND_bytes fails
     */
    static uint64_t entropySeed();

    uint64_t seed() const { return seed_; }

    /// @brief Uniform integer in [lo, hi]
    long long uniform(long long lo, long long hi);

    /// @brief Uniform index in [0, n)
    size_t index(size_t n);

    /// @brief Uniform character of a non-empty alphabet
    char pick(const std::string& alphabet);

    bool coin();

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

/// @brief Seed of the index-th record of a batch (splitmix64 over base + index)
uint64_t deriveSeed(uint64_t base, uint64_t index);

} // namespace idforge::core
