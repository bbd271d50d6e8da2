/// @file seeded_random.cpp
/// @brief SeededRandom and seed hashing helpers.

#include "mf/foundation/seeded_random.hpp"

#include <array>

namespace mf::foundation {

namespace {

constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

constexpr double kTwoPow53 = 9007199254740992.0;

}  // namespace

uint64_t SeededRandom::nextBits() {
    ++draws_;
    return engine_();
}

double SeededRandom::nextDouble() {
    return static_cast<double>(nextBits() >> 11) / kTwoPow53;
}

uint64_t SeededRandom::nextBelow(uint64_t bound) {
    if (bound == 0) {
        return 0;
    }
    return static_cast<uint64_t>(nextDouble() * static_cast<double>(bound)) % bound;
}

bool SeededRandom::chance(double probability) {
    return nextDouble() < probability;
}

uint64_t stableHash64(std::initializer_list<std::string_view> parts) {
    uint64_t hash = kFnvOffsetBasis;
    auto mix = [&hash](unsigned char byte) {
        hash ^= byte;
        hash *= kFnvPrime;
    };
    // Each part is prefixed with its 64-bit little-endian length.
    for (auto part : parts) {
        uint64_t length = part.size();
        for (int i = 0; i < 8; ++i) {
            mix(static_cast<unsigned char>(length & 0xFF));
            length >>= 8;
        }
        for (char c : part) {
            mix(static_cast<unsigned char>(c));
        }
    }
    return hash;
}

std::string seedToHex(uint64_t seed) {
    static constexpr std::array<char, 16> kDigits = {
        '0', '1', '2', '3', '4', '5', '6', '7',
        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = kDigits[seed & 0xF];
        seed >>= 4;
    }
    return out;
}

}  // namespace mf::foundation
