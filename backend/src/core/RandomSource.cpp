#include "RandomSource.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

namespace {

void ensureSodium() {
    // sodium_init() is idempotent: 0 on first success, 1 when already initialised.
    if (sodium_init() < 0) {
        spdlog::error("libsodium initialisation failed");
        throw std::runtime_error("sodium_init failed");
    }
}

int mapIntoRange(std::uint32_t draw, int lo, int hi) {
    const std::uint32_t span = static_cast<std::uint32_t>(hi - lo) + 1u;
    return lo + static_cast<int>(draw % span);
}

} // namespace

SodiumRandom::SodiumRandom() {
    ensureSodium();
}

int SodiumRandom::uniform(int lo, int hi) {
    if (hi <= lo) return lo;
    const std::uint32_t span = static_cast<std::uint32_t>(hi - lo) + 1u;
    return lo + static_cast<int>(randombytes_uniform(span));
}

SeededRandom::SeededRandom(const std::array<unsigned char, SEED_BYTES>& s)
    : seed(s)
{
    ensureSodium();
}

SeededRandom::SeededRandom(std::uint64_t s)
    : seed{}
{
    ensureSodium();
    for (std::size_t i = 0; i < sizeof(s); ++i) {
        seed[i] = static_cast<unsigned char>((s >> (8 * i)) & 0xff);
    }
}

int SeededRandom::uniform(int lo, int hi) {
    if (hi <= lo) return lo;

    // Mix the draw counter into the upper half of the seed so every draw gets its own stream.
    std::array<unsigned char, SEED_BYTES> drawSeed = seed;
    for (std::size_t i = 0; i < sizeof(counter); ++i) {
        drawSeed[SEED_BYTES / 2 + i] ^= static_cast<unsigned char>((counter >> (8 * i)) & 0xff);
    }
    ++counter;

    std::uint32_t draw = 0;
    randombytes_buf_deterministic(&draw, sizeof(draw), drawSeed.data());
    return mapIntoRange(draw, lo, hi);
}

std::string randomHexId(const std::string& prefix, std::size_t bytes) {
    ensureSodium();

    std::vector<unsigned char> raw(bytes);
    randombytes_buf(raw.data(), raw.size());

    std::string hex(raw.size() * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), raw.data(), raw.size());
    hex.pop_back();
    return prefix + hex;
}
