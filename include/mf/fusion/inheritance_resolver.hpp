#pragma once

/// @file inheritance_resolver.hpp
/// @brief Ability and appearance inheritance for fused creatures.

#include <cstdint>
#include <string>

#include "mf/foundation/seeded_random.hpp"
#include "mf/fusion/fusion_types.hpp"
#include "mf/game/creature.hpp"
#include "mf/game/rule_tables.hpp"

namespace mf::fusion {

/// Static utility selecting what a fused creature keeps from its parents.
///
/// Abilities:
///   - passives: union by id (parent1 first), at most maxPassiveAbilities
///   - ultimate: the one with the highest energy cost, ties to parent1
///   - actives: union by id, stable-sorted by energy cost descending, capped
///     so that actives plus the ultimate stay within maxActiveAbilities
///
/// Ability selection consumes no random draws; appearance blending does.
class InheritanceResolver {
public:
    InheritanceResolver() = delete;

    static constexpr double kSizeJitter = 0.1;

    [[nodiscard]] static InheritedAbilities inheritAbilities(const game::Creature& parent1,
                                                             const game::Creature& parent2,
                                                             const FusionConfig& config);

    /// Blend the parents' looks.
    ///
    /// Colors come from the fusion seed. Genome slots are picked per slot
    /// from either parent (five draws), the size modifier is the parents'
    /// average plus a jitter (one draw). Mutation traits are appended only
    /// when the fusion glitched.
    [[nodiscard]] static game::Appearance blendAppearance(
        const game::Creature& parent1, const game::Creature& parent2,
        game::Family fusedFamily, const game::ElementInteraction* interaction,
        const MutationResult& mutation, uint64_t fusionSeed,
        foundation::SeededRandom& rng);
};

}  // namespace mf::fusion
