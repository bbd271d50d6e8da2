#pragma once

/// @file seeded_random.hpp
/// @brief Replayable pseudo-random stream and stable seed hashing.

#include <cstdint>
#include <initializer_list>
#include <random>
#include <string>
#include <string_view>

namespace mf::foundation {

/// Deterministic random stream seeded by the caller.
///
/// Wraps std::mt19937_64, whose output sequence is fixed by the standard.
/// Doubles are built from the top 53 bits directly instead of going through
/// std::uniform_real_distribution, whose algorithm differs between standard
/// libraries. Copying a SeededRandom copies its stream position.
class SeededRandom {
public:
    explicit SeededRandom(uint64_t seed = 0) : seed_(seed), engine_(seed) {}

    /// Uniform double in [0, 1).
    [[nodiscard]] double nextDouble();

    /// Uniform integer in [0, bound). Returns 0 when bound is 0.
    [[nodiscard]] uint64_t nextBelow(uint64_t bound);

    /// True with the given probability in [0, 1].
    [[nodiscard]] bool chance(double probability);

    /// Raw 64-bit output.
    [[nodiscard]] uint64_t nextBits();

    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

    /// Number of values drawn so far.
    [[nodiscard]] uint64_t draws() const noexcept { return draws_; }

private:
    uint64_t seed_;
    uint64_t draws_ = 0;
    std::mt19937_64 engine_;
};

/// FNV-1a 64-bit hash of the parts, each preceded by its 8-byte length.
[[nodiscard]] uint64_t stableHash64(std::initializer_list<std::string_view> parts);

/// Lower-case, zero-padded 16 digit hex rendering of a seed.
[[nodiscard]] std::string seedToHex(uint64_t seed);

} // namespace mf::foundation
