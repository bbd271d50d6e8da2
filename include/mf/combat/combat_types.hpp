#pragma once

/// @file combat_types.hpp
/// @brief Battle-scoped state: participants, timed modifiers, actions and log.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mf/foundation/game_serializer.hpp"
#include "mf/foundation/seeded_random.hpp"
#include "mf/foundation/types.hpp"
#include "mf/fusion/lineage.hpp"
#include "mf/game/creature.hpp"
#include "mf/game/rule_tables.hpp"

namespace mf::combat {

/// Combat tunables (see config key prefix "combat.").
struct CombatConfig {
    int32_t maxRounds = 50;
    int32_t maxTeamSize = 4;
    int32_t startingEnergy = 50;
    int32_t maxEnergy = 100;
    int32_t energyRegen = 15;     ///< Gained by the actor after every turn.
    double critChance = 0.05;
    double critMultiplier = 1.5;
};

enum class BattleTeam : uint8_t { Team1, Team2 };

enum class BattleWinner : uint8_t { Team1, Team2, Draw };

enum class BoardPosition : uint8_t { Front, Back };

std::string_view toString(BattleTeam team);
std::string_view toString(BattleWinner winner);
std::string_view toString(BoardPosition position);

[[nodiscard]] constexpr BattleTeam opponentOf(BattleTeam team) noexcept {
    return team == BattleTeam::Team1 ? BattleTeam::Team2 : BattleTeam::Team1;
}

/// Timed buff or debuff in percentage points on one stat axis.
struct TimedModifier {
    game::StatAxis axis = game::StatAxis::Attack;
    double percent = 0.0;
    int32_t remaining = 0;
    std::optional<foundation::CreatureId> source;
};

/// Timed status entry.
struct ActiveStatus {
    game::StatusType status = game::StatusType::Burn;
    int32_t remaining = 0;
    double magnitude = 0.0;
    std::optional<foundation::CreatureId> source;
};

/// Battle-wide modifier unlocked by a tier-V catalyst pair.
struct DomainEffect {
    game::DomainSpec spec;
    BattleTeam sourceTeam = BattleTeam::Team1;
    foundation::CreatureId sourceId;
};

/// Battle-scoped wrapper around a creature.
struct Participant {
    game::Creature creature;
    BattleTeam team = BattleTeam::Team1;
    BoardPosition position = BoardPosition::Front;
    int32_t maxHp = 0;
    int32_t currentHp = 0;
    int32_t energy = 0;
    std::vector<ActiveStatus> statuses;
    std::vector<TimedModifier> buffs;
    std::vector<TimedModifier> debuffs;
    std::map<std::string, int32_t> cooldowns;  ///< Ability id to remaining rounds.
    fusion::LineageModifiers lineage;

    [[nodiscard]] const foundation::CreatureId& id() const noexcept { return creature.id; }
    [[nodiscard]] bool isAlive() const noexcept { return currentHp > 0; }
    [[nodiscard]] bool hasStatus(game::StatusType status) const noexcept;

    /// Stunned or frozen participants may only pass.
    [[nodiscard]] bool isIncapacitated() const noexcept;

    [[nodiscard]] bool hasGlitch(game::GlitchClass glitchClass) const noexcept {
        return creature.glitch && creature.glitch->glitchClass == glitchClass;
    }

    [[nodiscard]] int32_t cooldownFor(const foundation::AbilityId& abilityId) const;
};

/// One submitted turn. An empty ability id is a pass.
struct CombatAction {
    foundation::CreatureId actorId;
    std::optional<foundation::AbilityId> abilityId;
    std::vector<foundation::CreatureId> targetIds;

    [[nodiscard]] bool isPass() const noexcept { return !abilityId.has_value(); }

    [[nodiscard]] static CombatAction pass(foundation::CreatureId actor) {
        return CombatAction{std::move(actor), std::nullopt, {}};
    }
};

/// Outcome of one effect against one target.
struct EffectResult {
    foundation::CreatureId targetId;
    game::EffectKind kind = game::EffectKind::Damage;
    int32_t amount = 0;        ///< Damage dealt or HP restored.
    bool missed = false;
    bool critical = false;
    bool applied = true;       ///< False when a status chance roll failed.
    std::optional<game::StatusType> status;
    std::optional<std::string> note;
    int32_t hpAfter = 0;
};

/// Append-only combat log entry. Round-end bookkeeping is logged with no action.
struct LogEntry {
    int32_t round = 1;
    int32_t turn = 0;
    std::optional<CombatAction> action;
    std::vector<EffectResult> results;
    std::string message;
};

/// A battle session.
///
/// Participant ids are unique across both rosters. The turn order holds
/// every participant, alive or not, and is rebuilt at the start of each
/// round. complete is true exactly when winner is set.
struct Battle {
    foundation::BattleId id;
    CombatConfig config;
    std::vector<Participant> team1;
    std::vector<Participant> team2;
    int32_t round = 1;
    int32_t turn = 1;          ///< Number of the next action, starting at 1.
    std::vector<foundation::CreatureId> turnOrder;
    std::size_t currentIndex = 0;
    std::vector<LogEntry> log;
    std::vector<DomainEffect> domains;
    bool complete = false;
    std::optional<BattleWinner> winner;
    foundation::SeededRandom rng;

    [[nodiscard]] std::vector<Participant>& roster(BattleTeam team) noexcept {
        return team == BattleTeam::Team1 ? team1 : team2;
    }
    [[nodiscard]] const std::vector<Participant>& roster(BattleTeam team) const noexcept {
        return team == BattleTeam::Team1 ? team1 : team2;
    }

    [[nodiscard]] Participant* find(const foundation::CreatureId& id);
    [[nodiscard]] const Participant* find(const foundation::CreatureId& id) const;

    [[nodiscard]] const foundation::CreatureId& currentActorId() const;

    [[nodiscard]] int32_t livingCount(BattleTeam team) const noexcept;
};

}  // namespace mf::combat

MF_SERIALIZABLE(mf::combat::CombatAction, 1,
    field("actorId", &mf::combat::CombatAction::actorId),
    field("abilityId", &mf::combat::CombatAction::abilityId),
    field("targetIds", &mf::combat::CombatAction::targetIds));

MF_SERIALIZABLE(mf::combat::EffectResult, 1,
    field("targetId", &mf::combat::EffectResult::targetId),
    field("kind", &mf::combat::EffectResult::kind),
    field("amount", &mf::combat::EffectResult::amount),
    field("missed", &mf::combat::EffectResult::missed),
    field("critical", &mf::combat::EffectResult::critical),
    field("applied", &mf::combat::EffectResult::applied),
    field("status", &mf::combat::EffectResult::status),
    field("note", &mf::combat::EffectResult::note),
    field("hpAfter", &mf::combat::EffectResult::hpAfter));

MF_SERIALIZABLE(mf::combat::LogEntry, 1,
    field("round", &mf::combat::LogEntry::round),
    field("turn", &mf::combat::LogEntry::turn),
    field("action", &mf::combat::LogEntry::action),
    field("results", &mf::combat::LogEntry::results),
    field("message", &mf::combat::LogEntry::message));
