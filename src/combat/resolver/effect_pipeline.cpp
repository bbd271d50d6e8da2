/// @file effect_pipeline.cpp
/// @brief Damage, heal, modifier and status resolution.
///
/// Draw order per damage hit: one miss draw when the target is stealthed or
/// has lineage evasion, then one critical draw unless the hit missed, then
/// one chaos draw for a chaos-engine attacker. Status effects draw once per
/// target. Random selectors draw once per pick, and a reality-distorter
/// redraws a single-enemy target once when more than one enemy is alive.
///
/// Resolution stops as soon as the actor is defeated, e.g. by reflect.

#include "effect_pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>

#include "mf/combat/combat_resolver.hpp"

namespace mf::combat::detail {

using game::Ability;
using game::AbilityEffect;
using game::EffectKind;
using game::StatAxis;

namespace {

int32_t roundToInt(double value) {
    return static_cast<int32_t>(std::lround(value));
}

std::vector<Participant*> living(std::vector<Participant>& members) {
    std::vector<Participant*> out;
    for (auto& p : members) {
        if (p.isAlive()) {
            out.push_back(&p);
        }
    }
    return out;
}

Participant* pickRandom(std::vector<Participant>& members, foundation::SeededRandom& rng) {
    auto candidates = living(members);
    if (candidates.empty()) {
        return nullptr;
    }
    return candidates[rng.nextBelow(candidates.size())];
}

std::vector<Participant*> resolveTargets(Battle& battle, Participant& actor,
                                         const AbilityEffect& effect,
                                         const CombatAction& action) {
    auto& allies = battle.roster(actor.team);
    auto& enemies = battle.roster(opponentOf(actor.team));

    switch (effect.target) {
        case game::TargetSelector::SingleEnemy: {
            if (action.targetIds.empty()) {
                return {};
            }
            auto* target = battle.find(action.targetIds.front());
            if (target == nullptr || !target->isAlive()) {
                return {};
            }
            if (actor.hasGlitch(game::GlitchClass::RealityDistorter)) {
                auto candidates = living(enemies);
                if (candidates.size() > 1) {
                    return {candidates[battle.rng.nextBelow(candidates.size())]};
                }
            }
            return {target};
        }
        case game::TargetSelector::AllEnemies:
            return living(enemies);
        case game::TargetSelector::RandomEnemies: {
            std::vector<Participant*> out;
            for (int32_t i = 0; i < std::max(1, effect.targetCount); ++i) {
                if (auto* target = pickRandom(enemies, battle.rng)) {
                    out.push_back(target);
                }
            }
            return out;
        }
        case game::TargetSelector::Self:
            return {&actor};
        case game::TargetSelector::AllAllies:
            return living(allies);
        case game::TargetSelector::RandomAlly: {
            if (auto* target = pickRandom(allies, battle.rng)) {
                return {target};
            }
            return {};
        }
    }
    return {};
}

game::Element attackElement(const Participant& actor, const Ability& ability,
                            const game::DamageEffect& damage) {
    if (damage.element) {
        return *damage.element;
    }
    if (ability.element) {
        return *ability.element;
    }
    return actor.creature.element();
}

double outgoingMultiplier(const Battle& battle, const Participant& actor,
                          const Participant& target, game::Element element) {
    double m = target.position == BoardPosition::Front ? CombatResolver::kFrontRowTaken
                                                       : CombatResolver::kBackRowTaken;
    auto defenderElement = target.creature.element();
    m *= game::elementEffectiveness(element, defenderElement);
    if (const auto* interaction = game::findInteraction(element, defenderElement)) {
        m *= interaction->damageMultiplier;
    }

    double boost = domainMagnitude(battle, game::DomainKind::ElementDamageBoost, actor.team, element) +
                   domainMagnitude(battle, game::DomainKind::DamageBoost, actor.team);
    m *= 1.0 + boost / 100.0;
    m *= 1.0 + domainMagnitude(battle, game::DomainKind::ElementVulnerability, actor.team,
                               element) / 100.0;
    m *= 1.0 + actor.lineage.damageBoostPercent / 100.0;

    double reduction = domainMagnitude(battle, game::DomainKind::DamageReduction, target.team);
    m *= 1.0 - std::min(100.0, reduction) / 100.0;
    return m;
}

bool rollMiss(Battle& battle, const Participant& target) {
    if (target.hasStatus(game::StatusType::Stealth)) {
        return battle.rng.nextDouble() < CombatResolver::kStealthMissChance;
    }
    if (target.lineage.evasionPercent > 0.0) {
        return battle.rng.nextDouble() < target.lineage.evasionPercent / 100.0;
    }
    return false;
}

/// Appends the hit and, when the target's team reflects, the reflected
/// damage as a second result on the actor.
void applyDamage(Battle& battle, Participant& actor, Participant& target, const Ability& ability,
                 const game::DamageEffect& damage, std::vector<EffectResult>& results) {
    EffectResult result;
    result.targetId = target.id();
    result.kind = EffectKind::Damage;

    if (rollMiss(battle, target)) {
        result.missed = true;
        result.hpAfter = target.currentHp;
        results.push_back(std::move(result));
        return;
    }

    auto scaling = damage.scaling.value_or(StatAxis::Attack);
    double stat = CombatResolver::effectiveStat(battle, actor, scaling);
    double defense = 0.0;
    if (!actor.hasGlitch(game::GlitchClass::BypassSpecialist)) {
        defense = CombatResolver::effectiveStat(battle, target, StatAxis::Defense) *
                  CombatResolver::kDefenseFactor *
                  (1.0 + target.lineage.defenseBoostPercent / 100.0);
    }
    double raw = stat * damage.power - defense;
    double amount = raw * outgoingMultiplier(battle, actor, target,
                                             attackElement(actor, ability, damage));
    amount = std::max(1.0, amount);

    double critChance = battle.config.critChance + actor.lineage.critChancePercent / 100.0;
    if (battle.rng.nextDouble() < critChance) {
        result.critical = true;
        amount *= battle.config.critMultiplier;
    }
    if (actor.hasGlitch(game::GlitchClass::ChaosEngine)) {
        amount *= CombatResolver::kChaosMinFactor +
                  battle.rng.nextDouble() *
                      (CombatResolver::kChaosMaxFactor - CombatResolver::kChaosMinFactor);
    }

    int32_t dealt = std::min(target.currentHp, std::max(1, roundToInt(amount)));
    target.currentHp -= dealt;
    result.amount = dealt;
    result.hpAfter = target.currentHp;

    if (damage.lifestealPercent && actor.isAlive()) {
        int32_t healed = roundToInt(dealt * *damage.lifestealPercent / 100.0);
        actor.currentHp = std::min(actor.maxHp, actor.currentHp + healed);
        result.note = "lifesteal " + std::to_string(healed);
    }

    results.push_back(std::move(result));

    double reflectPercent = domainMagnitude(battle, game::DomainKind::Reflect, target.team);
    if (reflectPercent > 0.0 && dealt > 0) {
        int32_t reflected = std::min(actor.currentHp, roundToInt(dealt * reflectPercent / 100.0));
        actor.currentHp -= reflected;
        EffectResult back;
        back.targetId = actor.id();
        back.kind = EffectKind::Damage;
        back.amount = reflected;
        back.note = "reflected";
        back.hpAfter = actor.currentHp;
        results.push_back(std::move(back));
    }
}

EffectResult applyHeal(Battle& battle, const Participant& actor, Participant& target,
                       const game::HealEffect& heal) {
    EffectResult result;
    result.targetId = target.id();
    result.kind = EffectKind::Heal;

    double base = heal.scaling
                      ? CombatResolver::effectiveStat(battle, actor, *heal.scaling) * heal.power
                      : target.maxHp * heal.power;
    int32_t amount = roundToInt(base * (1.0 + actor.lineage.healingBoostPercent / 100.0));
    int32_t restored = std::clamp(amount, 0, target.maxHp - target.currentHp);
    target.currentHp += restored;
    result.amount = restored;
    result.hpAfter = target.currentHp;
    return result;
}

EffectResult applyModifier(const Participant& actor, Participant& target, EffectKind kind,
                           StatAxis axis, double percent, int32_t duration) {
    TimedModifier modifier{axis, percent, std::max(1, duration), actor.id()};
    if (kind == EffectKind::Buff) {
        target.buffs.push_back(std::move(modifier));
    } else {
        target.debuffs.push_back(std::move(modifier));
    }
    EffectResult result;
    result.targetId = target.id();
    result.kind = kind;
    result.note = std::string(game::toString(axis)) + " " + std::to_string(roundToInt(percent)) + "%";
    result.hpAfter = target.currentHp;
    return result;
}

EffectResult applyStatus(Battle& battle, const Participant& actor, Participant& target,
                         const game::StatusEffect& status) {
    EffectResult result;
    result.targetId = target.id();
    result.kind = EffectKind::Status;
    result.status = status.status;
    result.applied = battle.rng.nextDouble() < status.chancePercent / 100.0;
    result.hpAfter = target.currentHp;
    if (!result.applied) {
        return result;
    }

    int32_t duration = std::max(1, status.duration);
    for (auto& existing : target.statuses) {
        if (existing.status == status.status) {
            existing.remaining = std::max(existing.remaining, duration);
            existing.magnitude = std::max(existing.magnitude, status.magnitude);
            existing.source = actor.id();
            return result;
        }
    }
    target.statuses.push_back(ActiveStatus{status.status, duration, status.magnitude, actor.id()});
    return result;
}

template <typename Container>
void tickDurations(Container& entries) {
    for (auto& e : entries) {
        --e.remaining;
    }
    std::erase_if(entries, [](const auto& e) { return e.remaining <= 0; });
}

}  // namespace

double domainMagnitude(const Battle& battle, game::DomainKind kind, BattleTeam sourceTeam,
                       std::optional<game::Element> element) {
    double total = 0.0;
    for (const auto& domain : battle.domains) {
        if (domain.spec.kind != kind || domain.sourceTeam != sourceTeam) {
            continue;
        }
        if (domain.spec.element && domain.spec.element != element) {
            continue;
        }
        total += domain.spec.magnitude;
    }
    return total;
}

std::vector<EffectResult> resolveAbility(Battle& battle, Participant& actor, const Ability& ability,
                                         const CombatAction& action) {
    std::vector<EffectResult> results;
    for (const auto& effect : ability.effects) {
        if (!actor.isAlive()) {
            break;
        }
        for (auto* target : resolveTargets(battle, actor, effect, action)) {
            if (!actor.isAlive()) {
                break;
            }
            if (!target->isAlive()) {
                continue;
            }
            std::visit(
                [&](const auto& payload) {
                    using P = std::decay_t<decltype(payload)>;
                    if constexpr (std::is_same_v<P, game::DamageEffect>) {
                        applyDamage(battle, actor, *target, ability, payload, results);
                    } else if constexpr (std::is_same_v<P, game::HealEffect>) {
                        results.push_back(applyHeal(battle, actor, *target, payload));
                    } else if constexpr (std::is_same_v<P, game::BuffEffect>) {
                        results.push_back(applyModifier(actor, *target, EffectKind::Buff,
                                                        payload.axis, payload.percent,
                                                        payload.duration));
                    } else if constexpr (std::is_same_v<P, game::DebuffEffect>) {
                        results.push_back(applyModifier(actor, *target, EffectKind::Debuff,
                                                        payload.axis, payload.percent,
                                                        payload.duration));
                    } else if constexpr (std::is_same_v<P, game::StatusEffect>) {
                        results.push_back(applyStatus(battle, actor, *target, payload));
                    } else {
                        EffectResult special;
                        special.targetId = target->id();
                        special.kind = EffectKind::Special;
                        special.note = payload.tag;
                        special.hpAfter = target->currentHp;
                        results.push_back(std::move(special));
                    }
                },
                effect.payload);
        }
    }
    return results;
}

std::vector<EffectResult> endOfRound(Battle& battle) {
    std::vector<EffectResult> results;

    for (auto team : {BattleTeam::Team1, BattleTeam::Team2}) {
        double regen = domainMagnitude(battle, game::DomainKind::RoundRegen, team);
        double energy = domainMagnitude(battle, game::DomainKind::EnergyRegen, team);
        for (auto* p : living(battle.roster(team))) {
            if (regen > 0.0) {
                int32_t restored = std::clamp(roundToInt(p->maxHp * regen / 100.0), 0,
                                              p->maxHp - p->currentHp);
                p->currentHp += restored;
                EffectResult r;
                r.targetId = p->id();
                r.kind = EffectKind::Heal;
                r.amount = restored;
                r.note = "domain regen";
                r.hpAfter = p->currentHp;
                results.push_back(std::move(r));
            }
            if (energy > 0.0) {
                p->energy = std::min(battle.config.maxEnergy, p->energy + roundToInt(energy));
            }
        }
    }

    for (auto* team : {&battle.team1, &battle.team2}) {
        for (auto* p : living(*team)) {
            for (const auto& status : p->statuses) {
                if (status.status != game::StatusType::Burn &&
                    status.status != game::StatusType::Poison) {
                    continue;
                }
                if (!p->isAlive()) {
                    break;
                }
                int32_t amount = std::max(1, roundToInt(p->maxHp * status.magnitude / 100.0));
                int32_t dealt = std::min(p->currentHp, amount);
                p->currentHp -= dealt;
                EffectResult r;
                r.targetId = p->id();
                r.kind = EffectKind::Status;
                r.status = status.status;
                r.amount = dealt;
                r.hpAfter = p->currentHp;
                results.push_back(std::move(r));
            }
        }
    }

    for (auto* team : {&battle.team1, &battle.team2}) {
        for (auto& p : *team) {
            tickDurations(p.buffs);
            tickDurations(p.debuffs);
            tickDurations(p.statuses);
            for (auto& [id, remaining] : p.cooldowns) {
                remaining = std::max(0, remaining - 1);
            }
        }
    }
    return results;
}

}  // namespace mf::combat::detail
