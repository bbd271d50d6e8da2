/// @file lineage.cpp
/// @brief LineageAnalyzer implementation.

#include "mf/fusion/lineage.hpp"

#include <algorithm>
#include <set>

namespace mf::fusion {

using game::Element;

namespace {

int32_t countOf(const std::array<int32_t, game::kElementCount>& counts, Element e) {
    return counts[static_cast<std::size_t>(e)];
}

std::optional<Element> dominant(const std::array<int32_t, game::kElementCount>& counts) {
    std::optional<Element> best;
    int32_t bestCount = 0;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        // Strictly greater keeps the earlier element on ties.
        if (counts[i] > bestCount) {
            bestCount = counts[i];
            best = static_cast<Element>(i);
        }
    }
    return best;
}

}  // namespace

std::array<int32_t, game::kElementCount> LineageAnalyzer::ancestorElements(
    const game::Creature& creature) {
    std::array<int32_t, game::kElementCount> counts{};
    for (const auto& entry : creature.fusionHistory) {
        ++counts[static_cast<std::size_t>(game::familyElement(entry.parent1Family))];
        ++counts[static_cast<std::size_t>(game::familyElement(entry.parent2Family))];
    }
    return counts;
}

LineageSummary LineageAnalyzer::summarize(const game::Creature& creature) {
    LineageSummary out;
    out.templateId = creature.templateId;
    out.generation = creature.generation();

    std::set<std::string> parents;
    for (const auto& entry : creature.fusionHistory) {
        parents.insert(entry.parent1Id.value());
        parents.insert(entry.parent2Id.value());
        out.uniqueMutations += entry.mutationCount;
    }
    out.ancestorCount = static_cast<int32_t>(parents.size());
    out.dominantElement = dominant(ancestorElements(creature));
    return out;
}

LineageModifiers LineageAnalyzer::modifiers(const game::Creature& creature) {
    LineageModifiers out;
    auto counts = ancestorElements(creature);

    out.damageBoostPercent += 2.0 * countOf(counts, Element::Fire);

    int32_t water = countOf(counts, Element::Water);
    if (water >= 3) {
        out.healingBoostPercent += 5.0 + 2.0 * (water - 3);
    }

    out.defenseBoostPercent += 3.0 * countOf(counts, Element::Earth);
    out.speedBoostPercent += 2.0 * countOf(counts, Element::Lightning);
    out.evasionPercent = std::min(15.0, 1.0 * countOf(counts, Element::Shadow));

    if (countOf(counts, Element::Light) >= 3 && dominant(counts) == Element::Light) {
        out.critChancePercent += 5.0;
    }

    if (creature.generation() >= kAncientGeneration) {
        out.damageBoostPercent += 10.0;
        out.defenseBoostPercent += 10.0;
    }
    return out;
}

}  // namespace mf::fusion
