#pragma once

/// @file effect_pipeline.hpp
/// @brief Internal effect resolution shared by the combat resolver.

#include <vector>

#include "mf/combat/combat_types.hpp"

namespace mf::combat::detail {

/// Sum of domain magnitudes of one kind sourced by a team. Domains bound to
/// an element only count when it matches.
[[nodiscard]] double domainMagnitude(const Battle& battle, game::DomainKind kind,
                                     BattleTeam sourceTeam,
                                     std::optional<game::Element> element = std::nullopt);

/// Resolve every effect of an ability in order. The actor has already paid
/// its energy cost.
[[nodiscard]] std::vector<EffectResult> resolveAbility(Battle& battle, Participant& actor,
                                                       const game::Ability& ability,
                                                       const CombatAction& action);

/// Round-end bookkeeping: periodic domains, damage over time, duration
/// decrement and cooldown tick. Termination is left to the caller.
[[nodiscard]] std::vector<EffectResult> endOfRound(Battle& battle);

}  // namespace mf::combat::detail
