/// @file ability.cpp
/// @brief Ability validation, enum names and summaries.

#include "mf/game/ability.hpp"

#include <type_traits>

namespace mf::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

std::string_view toString(AbilityType t) {
    switch (t) {
        case AbilityType::Passive:  return "passive";
        case AbilityType::Active:   return "active";
        case AbilityType::Ultimate: return "ultimate";
    }
    return "unknown";
}

std::string_view toString(EffectKind k) {
    switch (k) {
        case EffectKind::Damage:  return "damage";
        case EffectKind::Heal:    return "heal";
        case EffectKind::Buff:    return "buff";
        case EffectKind::Debuff:  return "debuff";
        case EffectKind::Status:  return "status";
        case EffectKind::Special: return "special";
    }
    return "unknown";
}

std::string_view toString(TargetSelector s) {
    switch (s) {
        case TargetSelector::SingleEnemy:   return "single-enemy";
        case TargetSelector::AllEnemies:    return "all-enemies";
        case TargetSelector::RandomEnemies: return "random-enemies";
        case TargetSelector::Self:          return "self";
        case TargetSelector::AllAllies:     return "all-allies";
        case TargetSelector::RandomAlly:    return "random-ally";
    }
    return "unknown";
}

std::string_view toString(StatusType s) {
    switch (s) {
        case StatusType::Burn:    return "burn";
        case StatusType::Poison:  return "poison";
        case StatusType::Stun:    return "stun";
        case StatusType::Freeze:  return "freeze";
        case StatusType::Stealth: return "stealth";
        case StatusType::Slow:    return "slow";
    }
    return "unknown";
}

GameResult<void> validateAbility(const Ability& ability) {
    auto fail = [&](const std::string& why) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidAbility,
            "ability '" + ability.id.value() + "': " + why, ability.id));
    };

    if (!ability.id.isValid()) {
        return fail("missing identifier");
    }
    if (ability.effects.empty()) {
        return fail("effect list is empty");
    }
    if (ability.isPassive()) {
        if (ability.energyCost || ability.cooldown) {
            return fail("passive ability carries energy cost or cooldown");
        }
    } else {
        if (!ability.energyCost || !ability.cooldown) {
            return fail("non-passive ability lacks energy cost or cooldown");
        }
        if (*ability.energyCost < 0 || *ability.cooldown < 0) {
            return fail("negative energy cost or cooldown");
        }
    }
    for (const auto& effect : ability.effects) {
        if (effect.targetCount < 1) {
            return fail("effect target count below one");
        }
        if (const auto* status = std::get_if<StatusEffect>(&effect.payload)) {
            if (status->chancePercent < 0.0 || status->chancePercent > 100.0) {
                return fail("status chance outside 0-100");
            }
        }
    }
    return GameResult<void>::ok();
}

EffectSummary summarizeEffect(const AbilityEffect& effect) {
    EffectSummary out;
    out.kind = effect.kind();
    out.target = effect.target;
    std::visit(
        [&out](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, DamageEffect>) {
                out.magnitude = payload.power;
                out.element = payload.element;
                out.axis = payload.scaling;
                out.lifestealPercent = payload.lifestealPercent;
            } else if constexpr (std::is_same_v<T, HealEffect>) {
                out.magnitude = payload.power;
                out.axis = payload.scaling;
            } else if constexpr (std::is_same_v<T, BuffEffect> ||
                                 std::is_same_v<T, DebuffEffect>) {
                out.magnitude = payload.percent;
                out.axis = payload.axis;
                out.duration = payload.duration;
            } else if constexpr (std::is_same_v<T, StatusEffect>) {
                out.magnitude = payload.magnitude;
                out.status = payload.status;
                out.chancePercent = payload.chancePercent;
                out.duration = payload.duration;
            } else {
                out.tag = payload.tag;
            }
        },
        effect.payload);
    return out;
}

AbilitySummary summarizeAbility(const Ability& ability) {
    AbilitySummary out;
    out.id = ability.id;
    out.name = ability.name;
    out.description = ability.description;
    out.type = ability.type;
    out.energyCost = ability.energyCost;
    out.cooldown = ability.cooldown;
    out.element = ability.element;
    out.tags = ability.tags;
    out.effects.reserve(ability.effects.size());
    for (const auto& effect : ability.effects) {
        out.effects.push_back(summarizeEffect(effect));
    }
    return out;
}

}  // namespace mf::game
