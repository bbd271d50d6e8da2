#pragma once

/// @file rarity_resolver.hpp
/// @brief Stat & rarity resolution for a fused creature.

#include <utility>

#include "mf/fusion/fusion_types.hpp"
#include "mf/game/catalyst.hpp"
#include "mf/game/creature.hpp"

namespace mf::fusion {

/// Static utility computing a fused creature's rarity and base stats.
///
/// Rarity never drops below the higher parent rarity. The escalation score
///   score = 10 * (tier1 + tier2) + (power1 + power2)
/// promotes by at most two tiers (see game::escalationSteps).
///
/// Stats blend both parents weighted by (1 + generation), then scale by the
/// result rarity's curve and round, floor zero.
class StatRarityResolver {
public:
    StatRarityResolver() = delete;

    [[nodiscard]] static int32_t escalationScore(const game::Catalyst& c1,
                                                 const game::Catalyst& c2) noexcept;

    [[nodiscard]] static RarityOutcome resolveRarity(const game::Creature& parent1,
                                                     const game::Creature& parent2,
                                                     const game::Catalyst& c1,
                                                     const game::Catalyst& c2);

    /// Blend weights for (parent1, parent2); they sum to 1.
    [[nodiscard]] static std::pair<double, double> parentWeights(
        const game::Creature& parent1, const game::Creature& parent2) noexcept;

    [[nodiscard]] static game::StatBlock resolveStats(const game::Creature& parent1,
                                                      const game::Creature& parent2,
                                                      game::Rarity rarity);

    /// Add both catalysts' stat bonuses to a stat block.
    [[nodiscard]] static game::StatBlock addCatalystBonuses(game::StatBlock stats,
                                                            const game::Catalyst& c1,
                                                            const game::Catalyst& c2);
};

}  // namespace mf::fusion
