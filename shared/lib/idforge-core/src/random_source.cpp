/**
 * @file random_source.cpp
 * @brief RandomSource implementation (OpenSSL RAND_bytes entropy)
 */

#include "idforge/core/random_source.h"
#include "exception/exceptions.h"
#include <openssl/rand.h>

namespace idforge::core {

uint64_t RandomSource::entropySeed() {
    unsigned char buf[sizeof(uint64_t)];
    if (RAND_bytes(buf, sizeof(buf)) != 1) {
        throw common::EntropyException("RAND_bytes failed");
    }
    uint64_t seed = 0;
    for (unsigned char b : buf) {
        seed = (seed << 8) | b;
    }
    return seed;
}

long long RandomSource::uniform(long long lo, long long hi) {
    std::uniform_int_distribution<long long> dist(lo, hi);
    return dist(engine_);
}

size_t RandomSource::index(size_t n) {
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(engine_);
}

char RandomSource::pick(const std::string& alphabet) {
    return alphabet[index(alphabet.size())];
}

bool RandomSource::coin() {
    return (engine_() & 1u) != 0;
}

uint64_t deriveSeed(uint64_t base, uint64_t index) {
    uint64_t z = base + (index + 1) * 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

} // namespace idforge::core
