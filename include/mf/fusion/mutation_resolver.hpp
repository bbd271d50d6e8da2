#pragma once

/// @file mutation_resolver.hpp
/// @brief Glitch probability, severity and multiplier resolution.

#include <string>
#include <vector>

#include "mf/foundation/seeded_random.hpp"
#include "mf/fusion/fusion_types.hpp"
#include "mf/game/catalyst.hpp"

namespace mf::fusion {

/// Static utility deciding whether a fusion glitches and how hard.
///
/// Probability (percent) = 1 base, +2 per catalyst of tier IV or above,
/// +5 when both are tier V, +0.5 per prior player fusion (at most +10),
/// capped by FusionConfig::glitchCapPercent.
///
/// A fusion is guaranteed to glitch when both catalysts are glitched or the
/// stones form a glitch pair (Opal+Opal, Amethyst+Opal, Pearl+Onyx).
///
/// Draw order from the fusion stream: one glitch roll (always consumed),
/// then one severity jitter draw only when the fusion glitched.
class MutationResolver {
public:
    MutationResolver() = delete;

    static constexpr double kBaseChancePercent = 1.0;
    static constexpr double kHighTierBonusPercent = 2.0;
    static constexpr double kDoubleMaxTierBonusPercent = 5.0;
    static constexpr double kPerFusionPercent = 0.5;
    static constexpr double kFusionCountCapPercent = 10.0;

    [[nodiscard]] static double glitchProbability(int32_t tier1, int32_t tier2,
                                                  int32_t playerFusionCount,
                                                  double capPercent);

    [[nodiscard]] static MutationResult resolve(const game::Catalyst& c1,
                                                const game::Catalyst& c2,
                                                int32_t playerFusionCount,
                                                const FusionConfig& config,
                                                foundation::SeededRandom& rng);

    /// Unordered stone pairs that always glitch.
    [[nodiscard]] static bool isGlitchPair(game::StoneType a, game::StoneType b) noexcept;

    /// Glitch class from the top seed byte, level 1 + severity / 20 capped at 5.
    /// Consumes no draws.
    [[nodiscard]] static game::GlitchProfile classify(uint64_t seed, int32_t severity) noexcept;

    [[nodiscard]] static GlitchSeverity levelFor(int32_t severity) noexcept;

    [[nodiscard]] static double multiplierFor(GlitchSeverity level) noexcept;

    [[nodiscard]] static std::vector<std::string> traitsFor(GlitchSeverity level);

    /// Catalyst with the mutation multiplier applied to its stat bonuses and
    /// elemental power. Returned unchanged when the fusion did not glitch.
    [[nodiscard]] static game::Catalyst applyGlitch(const game::Catalyst& catalyst,
                                                    const MutationResult& mutation);
};

}  // namespace mf::fusion
