/// @file rarity_resolver.cpp
/// @brief StatRarityResolver implementation.

#include "mf/fusion/rarity_resolver.hpp"

#include <algorithm>
#include <cmath>

#include "mf/game/rule_tables.hpp"

namespace mf::fusion {

using game::StatAxis;
using game::StatBlock;

namespace {

constexpr game::StatAxis kAxes[] = {StatAxis::Hp, StatAxis::Attack, StatAxis::Defense,
                                    StatAxis::Speed};

int32_t roundNonNegative(double value) {
    return std::max(0, static_cast<int32_t>(std::lround(value)));
}

}  // namespace

int32_t StatRarityResolver::escalationScore(const game::Catalyst& c1,
                                            const game::Catalyst& c2) noexcept {
    return 10 * (c1.tier + c2.tier) + c1.elementalPower + c2.elementalPower;
}

RarityOutcome StatRarityResolver::resolveRarity(const game::Creature& parent1,
                                                const game::Creature& parent2,
                                                const game::Catalyst& c1,
                                                const game::Catalyst& c2) {
    RarityOutcome out;
    out.baseRarity = std::max(parent1.rarity, parent2.rarity);
    out.escalationScore = escalationScore(c1, c2);
    out.finalRarity = game::promoteRarity(out.baseRarity, game::escalationSteps(out.escalationScore));
    out.promotion = static_cast<int32_t>(out.finalRarity) - static_cast<int32_t>(out.baseRarity);
    return out;
}

std::pair<double, double> StatRarityResolver::parentWeights(
    const game::Creature& parent1, const game::Creature& parent2) noexcept {
    double g1 = 1.0 + parent1.generation();
    double g2 = 1.0 + parent2.generation();
    return {g1 / (g1 + g2), g2 / (g1 + g2)};
}

StatBlock StatRarityResolver::resolveStats(const game::Creature& parent1,
                                           const game::Creature& parent2,
                                           game::Rarity rarity) {
    auto [w1, w2] = parentWeights(parent1, parent2);
    double curve = game::rarityStatCurve(rarity);

    StatBlock out;
    for (auto axis : kAxes) {
        double blended = w1 * parent1.stats.get(axis) + w2 * parent2.stats.get(axis);
        out.set(axis, roundNonNegative(blended * curve));
    }
    return out;
}

StatBlock StatRarityResolver::addCatalystBonuses(StatBlock stats, const game::Catalyst& c1,
                                                 const game::Catalyst& c2) {
    for (auto axis : kAxes) {
        stats.set(axis, std::max(0, stats.get(axis) + c1.bonusFor(axis) + c2.bonusFor(axis)));
    }
    return stats;
}

}  // namespace mf::fusion
