#pragma once

/// @file lineage.hpp
/// @brief Lineage summaries and ancestry-derived combat modifiers.

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "mf/foundation/game_serializer.hpp"
#include "mf/game/creature.hpp"

namespace mf::fusion {

/// Compact lineage description carried in fusion signatures.
struct LineageSummary {
    std::optional<std::string> templateId;
    int32_t generation = 0;
    int32_t ancestorCount = 0;    ///< Distinct parent ids across the history.
    int32_t uniqueMutations = 0;  ///< Sum of mutation counts across the history.
    std::optional<game::Element> dominantElement;
};

/// Percentage modifiers a creature's ancestry grants in battle.
struct LineageModifiers {
    double damageBoostPercent = 0.0;
    double healingBoostPercent = 0.0;
    double defenseBoostPercent = 0.0;
    double speedBoostPercent = 0.0;
    double evasionPercent = 0.0;
    double critChancePercent = 0.0;
};

/// Static utility deriving lineage data from fusion history.
///
/// Each history entry contributes its two parent families as ancestors.
/// Modifier rules per ancestor element:
///   fire       +2% damage each
///   water      +5% healing at three or more, +2% per extra
///   earth      +3% defense each
///   lightning  +2% speed each
///   shadow     +1% evasion each, at most 15%
///   light      +5% crit chance when dominant with three or more
///   generation >= 10 adds +10% damage and +10% defense
class LineageAnalyzer {
public:
    LineageAnalyzer() = delete;

    static constexpr int32_t kAncientGeneration = 10;

    /// Ancestor count per element, indexed by game::Element.
    [[nodiscard]] static std::array<int32_t, game::kElementCount> ancestorElements(
        const game::Creature& creature);

    [[nodiscard]] static LineageSummary summarize(const game::Creature& creature);

    [[nodiscard]] static LineageModifiers modifiers(const game::Creature& creature);
};

}  // namespace mf::fusion

MF_SERIALIZABLE(mf::fusion::LineageSummary, 1,
    field("templateId", &mf::fusion::LineageSummary::templateId),
    field("generation", &mf::fusion::LineageSummary::generation),
    field("ancestorCount", &mf::fusion::LineageSummary::ancestorCount),
    field("uniqueMutations", &mf::fusion::LineageSummary::uniqueMutations),
    field("dominantElement", &mf::fusion::LineageSummary::dominantElement));
