/// @file inheritance_resolver.cpp
/// @brief InheritanceResolver implementation.

#include "mf/fusion/inheritance_resolver.hpp"

#include <algorithm>
#include <set>

#include "mf/foundation/game_logger.hpp"

namespace mf::fusion {

using game::Ability;
using game::Creature;
using game::VisualGenome;

namespace {

void appendUnique(std::vector<Ability>& out, std::set<std::string>& seen,
                  const std::vector<Ability>& from) {
    for (const auto& ability : from) {
        if (seen.insert(ability.id.value()).second) {
            out.push_back(ability);
        }
    }
}

void appendUniqueTags(std::vector<std::string>& out, const std::vector<std::string>& from) {
    for (const auto& tag : from) {
        if (std::find(out.begin(), out.end(), tag) == out.end()) {
            out.push_back(tag);
        }
    }
}

VisualGenome genomeOf(const Creature& creature) {
    if (creature.appearance.genome) {
        return *creature.appearance.genome;
    }
    return game::familyProfile(creature.family).defaultGenome;
}

template <typename T>
const T& pick(const T& first, const T& second, foundation::SeededRandom& rng) {
    return rng.nextDouble() < 0.5 ? first : second;
}

}  // namespace

InheritedAbilities InheritanceResolver::inheritAbilities(const Creature& parent1,
                                                         const Creature& parent2,
                                                         const FusionConfig& config) {
    InheritedAbilities out;

    std::set<std::string> seen;
    std::vector<Ability> passives;
    appendUnique(passives, seen, parent1.passives);
    appendUnique(passives, seen, parent2.passives);
    auto passiveCap = static_cast<std::size_t>(std::max(0, config.maxPassiveAbilities));
    for (std::size_t i = 0; i < passives.size(); ++i) {
        if (i < passiveCap) {
            out.passives.push_back(std::move(passives[i]));
        } else {
            out.dropped.push_back(passives[i].id);
        }
    }

    const Ability* ultimate = nullptr;
    for (const auto* parent : {&parent1, &parent2}) {
        if (!parent->ultimate) {
            continue;
        }
        if (ultimate == nullptr || parent->ultimate->tierScore() > ultimate->tierScore()) {
            if (ultimate != nullptr) {
                out.dropped.push_back(ultimate->id);
            }
            ultimate = &*parent->ultimate;
        } else if (parent->ultimate->id != ultimate->id) {
            out.dropped.push_back(parent->ultimate->id);
        }
    }
    // A creature needs one active, so a cap below two leaves no ultimate slot.
    if (ultimate != nullptr && config.maxActiveAbilities < 2) {
        out.dropped.push_back(ultimate->id);
    } else if (ultimate != nullptr) {
        out.ultimate = *ultimate;
    }

    std::vector<Ability> actives;
    appendUnique(actives, seen, parent1.actives);
    appendUnique(actives, seen, parent2.actives);
    std::stable_sort(actives.begin(), actives.end(), [](const Ability& a, const Ability& b) {
        return a.tierScore() > b.tierScore();
    });

    int32_t activeCap = config.maxActiveAbilities - (out.ultimate ? 1 : 0);
    auto cap = static_cast<std::size_t>(std::max(1, activeCap));
    for (std::size_t i = 0; i < actives.size(); ++i) {
        if (i < cap) {
            out.actives.push_back(std::move(actives[i]));
        } else {
            out.dropped.push_back(actives[i].id);
        }
    }

    if (!out.dropped.empty()) {
        MF_LOG_DEBUG(foundation::LogCategory::Fusion,
                     "dropped " + std::to_string(out.dropped.size()) + " inherited abilities");
    }
    return out;
}

game::Appearance InheritanceResolver::blendAppearance(
    const Creature& parent1, const Creature& parent2, game::Family fusedFamily,
    const game::ElementInteraction* interaction, const MutationResult& mutation,
    uint64_t fusionSeed, foundation::SeededRandom& rng) {
    game::Appearance out;
    std::string hex = foundation::seedToHex(fusionSeed);
    out.colorMutation = "#" + hex.substr(0, 6);
    out.glowColor = "#" + hex.substr(6, 6);
    out.particleTag = interaction != nullptr
                          ? interaction->result
                          : std::string(game::toString(game::familyElement(fusedFamily)));

    appendUniqueTags(out.visualTags, parent1.appearance.visualTags);
    appendUniqueTags(out.visualTags, parent2.appearance.visualTags);

    VisualGenome g1 = genomeOf(parent1);
    VisualGenome g2 = genomeOf(parent2);
    const VisualGenome& dominant = parent1.family == fusedFamily ? g1 : g2;

    VisualGenome genome;
    genome.baseForm = dominant.baseForm;
    genome.head = pick(g1.head, g2.head, rng);
    genome.torso = pick(g1.torso, g2.torso, rng);
    genome.limbs = pick(g1.limbs, g2.limbs, rng);
    genome.wings = pick(g1.wings, g2.wings, rng);
    genome.tail = pick(g1.tail, g2.tail, rng);
    double jitter = (rng.nextDouble() * 2.0 - 1.0) * kSizeJitter;
    genome.sizeModifier = std::max(0.1, (g1.sizeModifier + g2.sizeModifier) / 2.0 + jitter);

    appendUniqueTags(genome.mutationTraits, g1.mutationTraits);
    appendUniqueTags(genome.mutationTraits, g2.mutationTraits);
    if (mutation.glitched) {
        appendUniqueTags(genome.mutationTraits, mutation.traits);
        appendUniqueTags(out.visualTags, mutation.traits);
    }
    genome.paletteSeed = hex;
    out.genome = std::move(genome);
    return out;
}

}  // namespace mf::fusion
