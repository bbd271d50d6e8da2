/// @file creature.cpp
/// @brief Creature helpers and invariant checks.

#include "mf/game/creature.hpp"

#include <algorithm>
#include <unordered_set>

namespace mf::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

int32_t StatBlock::get(StatAxis axis) const noexcept {
    switch (axis) {
        case StatAxis::Hp:      return hp;
        case StatAxis::Attack:  return attack;
        case StatAxis::Defense: return defense;
        case StatAxis::Speed:   return speed;
    }
    return 0;
}

void StatBlock::set(StatAxis axis, int32_t value) noexcept {
    switch (axis) {
        case StatAxis::Hp:      hp = value; break;
        case StatAxis::Attack:  attack = value; break;
        case StatAxis::Defense: defense = value; break;
        case StatAxis::Speed:   speed = value; break;
    }
}

int32_t Creature::generation() const noexcept {
    int32_t gen = 0;
    for (const auto& entry : fusionHistory) {
        gen = std::max(gen, entry.generation);
    }
    return gen;
}

const Ability* Creature::findUsableAbility(const foundation::AbilityId& abilityId) const {
    for (const auto& ability : actives) {
        if (ability.id == abilityId) {
            return &ability;
        }
    }
    if (ultimate && ultimate->id == abilityId) {
        return &*ultimate;
    }
    return nullptr;
}

GameResult<void> validateCreature(const Creature& creature) {
    auto fail = [&](const std::string& why) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidCreature,
            "creature '" + creature.id.value() + "': " + why, creature.id));
    };

    if (!creature.id.isValid()) {
        return fail("missing identifier");
    }
    if (!creature.ownerId.isValid()) {
        return fail("missing owner");
    }
    if (creature.stats.hp <= 0 || creature.stats.attack < 0 ||
        creature.stats.defense < 0 || creature.stats.speed < 0) {
        return fail("stat block must be non-negative with positive hp");
    }
    if (creature.actives.empty()) {
        return fail("at least one active ability is required");
    }
    if (creature.isFused() == creature.templateId.has_value()) {
        return fail(creature.isFused() ? "fused creature carries a template reference"
                                       : "starter creature lacks a template reference");
    }
    if (creature.glitch) {
        if (!creature.isFused()) {
            return fail("only fused creatures can be glitched");
        }
        if (creature.glitch->level < kMinGlitchLevel || creature.glitch->level > kMaxGlitchLevel) {
            return fail("glitch level must be within 1-5");
        }
    }

    std::unordered_set<std::string> seen;
    auto checkAbility = [&](const Ability& ability, AbilityType expected) -> GameResult<void> {
        if (ability.type != expected) {
            return fail("ability '" + ability.id.value() + "' is in the wrong slot");
        }
        if (!seen.insert(ability.id.value()).second) {
            return fail("duplicate ability '" + ability.id.value() + "'");
        }
        return validateAbility(ability);
    };

    for (const auto& ability : creature.passives) {
        auto result = checkAbility(ability, AbilityType::Passive);
        if (!result) {
            return result;
        }
    }
    for (const auto& ability : creature.actives) {
        auto result = checkAbility(ability, AbilityType::Active);
        if (!result) {
            return result;
        }
    }
    if (creature.ultimate) {
        auto result = checkAbility(*creature.ultimate, AbilityType::Ultimate);
        if (!result) {
            return result;
        }
    }
    return GameResult<void>::ok();
}

}  // namespace mf::game
