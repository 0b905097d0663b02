#pragma once
#include <array>
#include <cstdint>
#include <string>

// Uniform integer draws for interval fuzzing and id generation.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Inclusive on both ends; returns lo when hi <= lo.
    virtual int uniform(int lo, int hi) = 0;
};

// System CSPRNG through libsodium.
class SodiumRandom : public RandomSource {
public:
    SodiumRandom(); // throws std::runtime_error if libsodium cannot initialise

    int uniform(int lo, int hi) override;
};

/*
  Replayable stream: the same seed yields the same sequence of draws.
  Each draw expands (seed, counter) with randombytes_buf_deterministic.
*/
class SeededRandom : public RandomSource {
public:
    static constexpr std::size_t SEED_BYTES = 32;

    explicit SeededRandom(const std::array<unsigned char, SEED_BYTES>& seed);
    explicit SeededRandom(std::uint64_t seed);

    int uniform(int lo, int hi) override;

private:
    std::array<unsigned char, SEED_BYTES> seed;
    std::uint64_t counter = 0;
};

// prefix followed by 2 * bytes hex characters of random data.
std::string randomHexId(const std::string& prefix, std::size_t bytes = 8);

inline std::string generateReviewId() {
    return randomHexId("rev_");
}
