#pragma once

/// @file combat_resolver.hpp
/// @brief Turn-based battle state machine.

#include <cstdint>
#include <vector>

#include "mf/combat/combat_types.hpp"
#include "mf/foundation/game_result.hpp"

namespace mf::combat {

/// Static utility driving a Battle from creation to completion.
///
/// A battle is created active and advanced one action at a time. Every
/// accepted action yields a new Battle value; a rejected action returns an
/// error and leaves the input untouched, so the caller may retry.
///
/// Action validation order:
///   1. battle not complete            (BattleAlreadyComplete)
///   2. actor exists                   (ParticipantNotFound)
///   3. actor is the current turn      (NotActorsTurn)
///   4. actor not stunned or frozen    (ActorIncapacitated; passing is allowed)
///   5. ability owned and non-passive  (AbilityNotFound, AbilityNotUsable)
///   6. ability off cooldown           (AbilityOnCooldown)
///   7. enough energy                  (InsufficientEnergy)
///      Steps 6 and 7 are skipped for a system-override glitch.
///   8. targets exist, alive and legal (InvalidTarget)
///
/// Example:
/// @code
///   auto battle = CombatResolver::createBattle(BattleId("b-1"), mine, theirs, seed);
///   while (battle && !battle.value().complete) {
///       auto action = CombatResolver::suggestAction(battle.value());
///       battle = CombatResolver::submitAction(battle.value(), action);
///   }
/// @endcode
class CombatResolver {
public:
    CombatResolver() = delete;

    /// Damage multiplier against a front-row defender.
    static constexpr double kFrontRowTaken = 1.5;

    /// Damage multiplier against a back-row defender.
    static constexpr double kBackRowTaken = 0.75;

    /// Share of defense subtracted from raw damage.
    static constexpr double kDefenseFactor = 0.5;

    /// Chance that an attack on a stealthed target misses.
    static constexpr double kStealthMissChance = 0.5;

    /// Range of the seeded per-hit factor of a chaos-engine glitch.
    static constexpr double kChaosMinFactor = 0.5;
    static constexpr double kChaosMaxFactor = 2.5;

    /// Allies below this HP share make the AI prefer healing.
    static constexpr double kHealThreshold = 0.4;

    /// Validate both rosters and build an active battle at round 1.
    [[nodiscard]] static foundation::GameResult<Battle> createBattle(
        foundation::BattleId id, const std::vector<game::Creature>& team1,
        const std::vector<game::Creature>& team2, uint64_t seed,
        const CombatConfig& config = {});

    /// Resolve one action for the current actor.
    [[nodiscard]] static foundation::GameResult<Battle> submitAction(const Battle& battle,
                                                                     const CombatAction& action);

    /// Run the validation steps of submitAction without resolving anything.
    [[nodiscard]] static foundation::GameResult<void> validateAction(const Battle& battle,
                                                                     const CombatAction& action);

    /// Automated choice for the current actor. Always legal for an active battle.
    [[nodiscard]] static CombatAction suggestAction(const Battle& battle);

    /// Effective stat: base plus buffs minus debuffs in percentage points,
    /// floor zero. Speed also includes domain and lineage speed boosts.
    [[nodiscard]] static int32_t effectiveStat(const Battle& battle, const Participant& p,
                                               game::StatAxis axis);

    /// Order by effective speed descending, ties by lower id. Every
    /// participant is included.
    [[nodiscard]] static std::vector<foundation::CreatureId> computeTurnOrder(const Battle& battle);

    /// Domains unlocked by a creature's latest fusion when both catalysts
    /// were tier V, one per distinct stone type.
    [[nodiscard]] static std::vector<game::DomainSpec> domainsFor(const game::Creature& creature);

    /// True when the ability is off cooldown and affordable for the participant,
    /// or is any non-passive ability of a system-override glitch.
    [[nodiscard]] static bool isAvailable(const Participant& p, const game::Ability& ability);
};

}  // namespace mf::combat
