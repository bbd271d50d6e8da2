#pragma once

/// @file rule_tables.hpp
/// @brief Read-only rule data: element matrix, interactions, rarity curve,
///        family profiles and domain effects.
///
/// All tables are immutable after static initialization and safe to read
/// from any number of threads.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mf/foundation/game_serializer.hpp"
#include "mf/game/creature.hpp"
#include "mf/game/element_types.hpp"

namespace mf::game {

// ── Elements ────────────────────────────────────────────────────────────────

/// Damage multiplier for an attack of one element against a defender of another.
[[nodiscard]] double elementEffectiveness(Element attacker, Element defender) noexcept;

/// Result of crossing two elements, used as narrative hint data and as a
/// combat damage multiplier.
struct ElementInteraction {
    Element first = Element::Fire;
    Element second = Element::Fire;
    std::string result;
    std::vector<std::string> abilityThemes;
    std::vector<std::string> namePrefixes;
    std::vector<std::string> nameSuffixes;
    std::string description;
    double damageMultiplier = 1.0;
};

/// Look up the interaction for an unordered element pair, nullptr if none.
[[nodiscard]] const ElementInteraction* findInteraction(Element a, Element b);

// ── Rarity ──────────────────────────────────────────────────────────────────

/// Escalation score at which a fusion result is promoted one tier.
inline constexpr int32_t kPromoteOneThreshold = 100;

/// Escalation score at which a fusion result is promoted two tiers.
inline constexpr int32_t kPromoteTwoThreshold = 160;

/// Number of tiers (0..2) an escalation score promotes by.
[[nodiscard]] constexpr int32_t escalationSteps(int32_t score) noexcept {
    if (score >= kPromoteTwoThreshold) {
        return 2;
    }
    return score >= kPromoteOneThreshold ? 1 : 0;
}

/// Canonical stat multiplier for a rarity tier.
[[nodiscard]] double rarityStatCurve(Rarity rarity) noexcept;

// ── Families ────────────────────────────────────────────────────────────────

struct FamilyProfile {
    Family family = Family::PyroKin;
    StatBlock baseStats;
    std::vector<std::string> visualTags;
    std::vector<std::string> paletteThemes;
    VisualGenome defaultGenome;
};

[[nodiscard]] const FamilyProfile& familyProfile(Family family);

// ── Domain effects ──────────────────────────────────────────────────────────

enum class DomainKind : uint8_t {
    ElementDamageBoost,    ///< Source team deals more damage of one element.
    RoundRegen,            ///< Source team regains max-HP percent each round end.
    EnergyRegen,           ///< Source team gains flat energy each round end.
    SpeedBoost,            ///< Source team speed percent increase.
    ElementVulnerability,  ///< Opposing team takes more damage of one element.
    DamageReduction,       ///< Source team takes less damage.
    Reflect,               ///< Share of damage taken returned to the attacker.
    DamageBoost            ///< Source team deals more damage of every element.
};

std::string_view toString(DomainKind kind);

struct DomainSpec {
    StoneType stone = StoneType::Ruby;
    std::string name;
    DomainKind kind = DomainKind::DamageBoost;
    double magnitude = 0.0;
    std::optional<Element> element;
    std::string description;
};

[[nodiscard]] const DomainSpec& domainSpec(StoneType stone);

}  // namespace mf::game

MF_SERIALIZABLE(mf::game::ElementInteraction, 1,
    field("first", &mf::game::ElementInteraction::first),
    field("second", &mf::game::ElementInteraction::second),
    field("result", &mf::game::ElementInteraction::result),
    field("abilityThemes", &mf::game::ElementInteraction::abilityThemes),
    field("namePrefixes", &mf::game::ElementInteraction::namePrefixes),
    field("nameSuffixes", &mf::game::ElementInteraction::nameSuffixes),
    field("description", &mf::game::ElementInteraction::description),
    field("damageMultiplier", &mf::game::ElementInteraction::damageMultiplier));

MF_SERIALIZABLE(mf::game::DomainSpec, 1,
    field("stone", &mf::game::DomainSpec::stone),
    field("name", &mf::game::DomainSpec::name),
    field("kind", &mf::game::DomainSpec::kind),
    field("magnitude", &mf::game::DomainSpec::magnitude),
    field("element", &mf::game::DomainSpec::element),
    field("description", &mf::game::DomainSpec::description));
