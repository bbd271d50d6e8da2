#pragma once

/// @file ability.hpp
/// @brief Immutable ability values and their tagged effect payloads.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "mf/foundation/game_result.hpp"
#include "mf/foundation/game_serializer.hpp"
#include "mf/foundation/types.hpp"
#include "mf/game/element_types.hpp"

namespace mf::game {

enum class AbilityType : uint8_t { Passive, Active, Ultimate };

enum class EffectKind : uint8_t { Damage, Heal, Buff, Debuff, Status, Special };

/// Target selectors in resolution order.
enum class TargetSelector : uint8_t {
    SingleEnemy,
    AllEnemies,
    RandomEnemies,
    Self,
    AllAllies,
    RandomAlly
};

enum class StatusType : uint8_t {
    Burn,    ///< Loses magnitude percent of max HP at round end.
    Poison,  ///< Loses magnitude percent of max HP at round end.
    Stun,    ///< Cannot use abilities.
    Freeze,  ///< Cannot use abilities.
    Stealth, ///< Incoming damage misses half the time.
    Slow     ///< Informational; speed changes use debuffs.
};

std::string_view toString(AbilityType t);
std::string_view toString(EffectKind k);
std::string_view toString(TargetSelector s);
std::string_view toString(StatusType s);

/// Default duration for buffs and debuffs, in rounds.
inline constexpr int32_t kDefaultModifierDuration = 3;

/// Default duration for status entries, in rounds.
inline constexpr int32_t kDefaultStatusDuration = 2;

/// Damage scaled from the actor's stat.
struct DamageEffect {
    double power = 1.0;                      ///< Multiplier on the scaling stat.
    std::optional<Element> element;          ///< Overrides the ability element.
    std::optional<StatAxis> scaling;         ///< Defaults to Attack.
    std::optional<double> lifestealPercent;  ///< Share of damage returned to actor.
};

/// Healing as a fraction of the target's max HP (or the scaling stat).
struct HealEffect {
    double power = 0.0;
    std::optional<StatAxis> scaling;
};

/// Timed stat increase in percentage points.
struct BuffEffect {
    StatAxis axis = StatAxis::Attack;
    double percent = 0.0;
    int32_t duration = kDefaultModifierDuration;
};

/// Timed stat decrease in percentage points.
struct DebuffEffect {
    StatAxis axis = StatAxis::Attack;
    double percent = 0.0;
    int32_t duration = kDefaultModifierDuration;
};

/// Chance-based status application.
struct StatusEffect {
    StatusType status = StatusType::Burn;
    double chancePercent = 100.0;
    int32_t duration = kDefaultStatusDuration;
    double magnitude = 5.0;
};

/// Rule-bending effect recorded in the log without numeric resolution.
struct SpecialEffect {
    std::string tag;
};

using EffectPayload = std::variant<DamageEffect, HealEffect, BuffEffect,
                                   DebuffEffect, StatusEffect, SpecialEffect>;

/// One entry of an ability's ordered effect list.
struct AbilityEffect {
    TargetSelector target = TargetSelector::SingleEnemy;
    int32_t targetCount = 1;  ///< Used by the random selectors.
    EffectPayload payload;

    [[nodiscard]] EffectKind kind() const noexcept {
        return static_cast<EffectKind>(payload.index());
    }
};

/// Immutable combat capability.
///
/// Passive abilities never carry energy cost or cooldown; active and
/// ultimate abilities always do. Remaining cooldowns are battle state and
/// live on the combat participant.
struct Ability {
    foundation::AbilityId id;
    std::string name;
    std::string description;
    AbilityType type = AbilityType::Active;
    std::optional<int32_t> energyCost;
    std::optional<int32_t> cooldown;
    std::vector<AbilityEffect> effects;
    std::vector<std::string> tags;
    std::optional<Element> element;

    [[nodiscard]] bool isPassive() const noexcept { return type == AbilityType::Passive; }

    /// Inheritance priority: higher energy cost ranks higher.
    [[nodiscard]] int32_t tierScore() const noexcept { return energyCost.value_or(0); }
};

/// Check the structural invariants of an ability.
[[nodiscard]] foundation::GameResult<void> validateAbility(const Ability& ability);

/// Flattened, serializable description of one effect.
struct EffectSummary {
    EffectKind kind = EffectKind::Damage;
    TargetSelector target = TargetSelector::SingleEnemy;
    double magnitude = 0.0;
    std::optional<Element> element;
    std::optional<StatAxis> axis;
    std::optional<StatusType> status;
    std::optional<double> chancePercent;
    std::optional<int32_t> duration;
    std::optional<double> lifestealPercent;
    std::optional<std::string> tag;
};

/// Flattened, serializable description of an ability.
struct AbilitySummary {
    foundation::AbilityId id;
    std::string name;
    std::string description;
    AbilityType type = AbilityType::Active;
    std::optional<int32_t> energyCost;
    std::optional<int32_t> cooldown;
    std::optional<Element> element;
    std::vector<std::string> tags;
    std::vector<EffectSummary> effects;
};

[[nodiscard]] EffectSummary summarizeEffect(const AbilityEffect& effect);
[[nodiscard]] AbilitySummary summarizeAbility(const Ability& ability);

}  // namespace mf::game

MF_SERIALIZABLE(mf::game::EffectSummary, 1,
    field("kind", &mf::game::EffectSummary::kind),
    field("target", &mf::game::EffectSummary::target),
    field("magnitude", &mf::game::EffectSummary::magnitude),
    field("element", &mf::game::EffectSummary::element),
    field("axis", &mf::game::EffectSummary::axis),
    field("status", &mf::game::EffectSummary::status),
    field("chancePercent", &mf::game::EffectSummary::chancePercent),
    field("duration", &mf::game::EffectSummary::duration),
    field("lifestealPercent", &mf::game::EffectSummary::lifestealPercent),
    field("tag", &mf::game::EffectSummary::tag));

MF_SERIALIZABLE(mf::game::AbilitySummary, 1,
    field("id", &mf::game::AbilitySummary::id),
    field("name", &mf::game::AbilitySummary::name),
    field("description", &mf::game::AbilitySummary::description),
    field("type", &mf::game::AbilitySummary::type),
    field("energyCost", &mf::game::AbilitySummary::energyCost),
    field("cooldown", &mf::game::AbilitySummary::cooldown),
    field("element", &mf::game::AbilitySummary::element),
    field("tags", &mf::game::AbilitySummary::tags),
    field("effects", &mf::game::AbilitySummary::effects));
