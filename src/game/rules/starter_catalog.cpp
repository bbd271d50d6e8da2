/// @file starter_catalog.cpp
/// @brief Starter kits per family.

#include "mf/game/starter_catalog.hpp"

#include "mf/foundation/game_logger.hpp"
#include "mf/foundation/seeded_random.hpp"
#include "mf/game/rule_tables.hpp"

namespace mf::game {

using foundation::AbilityId;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr int32_t kStrikeCost = 10;
constexpr int32_t kSignatureCost = 30;
constexpr int32_t kSignatureCooldown = 2;

std::string prefixFor(Family family) {
    return std::string(toString(family));
}

AbilityEffect effect(TargetSelector target, EffectPayload payload, int32_t count = 1) {
    AbilityEffect e;
    e.target = target;
    e.targetCount = count;
    e.payload = std::move(payload);
    return e;
}

Ability active(Family family, std::string suffix, std::string name, std::string description,
               int32_t cost, int32_t cooldown, std::vector<AbilityEffect> effects) {
    Ability a;
    a.id = AbilityId(prefixFor(family) + "_" + suffix);
    a.name = std::move(name);
    a.description = std::move(description);
    a.type = AbilityType::Active;
    a.energyCost = cost;
    a.cooldown = cooldown;
    a.effects = std::move(effects);
    a.element = familyElement(family);
    a.tags = {std::string(toString(familyElement(family)))};
    return a;
}

Ability passive(Family family, std::string name, std::string description, StatAxis axis,
                double percent) {
    Ability a;
    a.id = AbilityId(prefixFor(family) + "_instinct");
    a.name = std::move(name);
    a.description = std::move(description);
    a.type = AbilityType::Passive;
    a.effects = {effect(TargetSelector::Self, BuffEffect{axis, percent, kDefaultModifierDuration})};
    a.element = familyElement(family);
    a.tags = {"passive"};
    return a;
}

Ability strike(Family family, std::string name) {
    return active(family, "strike", std::move(name), "A basic elemental attack.", kStrikeCost, 0,
                  {effect(TargetSelector::SingleEnemy, DamageEffect{1.0, std::nullopt,
                                                                    std::nullopt, std::nullopt})});
}

DamageEffect damage(double power, std::optional<double> lifesteal = std::nullopt) {
    return DamageEffect{power, std::nullopt, std::nullopt, lifesteal};
}

}  // namespace

std::string starterTemplateId(Family family) {
    return prefixFor(family) + "_starter";
}

std::vector<std::string> starterTemplateIds() {
    std::vector<std::string> ids;
    ids.reserve(kFamilyCount);
    for (std::size_t i = 0; i < kFamilyCount; ++i) {
        ids.push_back(starterTemplateId(static_cast<Family>(i)));
    }
    return ids;
}

std::optional<Family> starterFamily(std::string_view templateId) {
    for (std::size_t i = 0; i < kFamilyCount; ++i) {
        auto family = static_cast<Family>(i);
        if (starterTemplateId(family) == templateId) {
            return family;
        }
    }
    return std::nullopt;
}

std::vector<Ability> starterAbilities(Family family) {
    using T = TargetSelector;
    switch (family) {
        case Family::PyroKin:
            return {passive(family, "Kindled Scales", "Attack rises in the heat of battle.",
                            StatAxis::Attack, 5.0),
                    strike(family, "Ember Bite"),
                    active(family, "burst", "Flame Burst", "Scorches every enemy.",
                           kSignatureCost, kSignatureCooldown,
                           {effect(T::AllEnemies, damage(0.7)),
                            effect(T::AllEnemies, StatusEffect{StatusType::Burn, 40.0, 2, 4.0})})};
        case Family::AquaBorn:
            return {passive(family, "Tidecaller", "Slowly mends wounds.", StatAxis::Hp, 5.0),
                    strike(family, "Water Jet"),
                    active(family, "mend", "Tidal Mend", "Restores health to all allies.",
                           kSignatureCost, kSignatureCooldown,
                           {effect(T::AllAllies, HealEffect{0.12, std::nullopt})})};
        case Family::TerraForged:
            return {passive(family, "Bedrock Hide", "Naturally armored.", StatAxis::Defense, 5.0),
                    strike(family, "Rock Slam"),
                    active(family, "wall", "Stone Wall", "Hardens its own hide.",
                           kSignatureCost - 10, kSignatureCooldown,
                           {effect(T::Self, BuffEffect{StatAxis::Defense, 30.0, 3})})};
        case Family::VoltStream:
            return {passive(family, "Overcharge", "Moves faster than sight.", StatAxis::Speed, 5.0),
                    strike(family, "Spark Jab"),
                    active(family, "shock", "Static Shock", "A jolt that may stun.",
                           kSignatureCost, kSignatureCooldown,
                           {effect(T::SingleEnemy, damage(0.9)),
                            effect(T::SingleEnemy, StatusEffect{StatusType::Stun, 25.0, 1, 0.0})})};
        case Family::ShadowVeil:
            return {passive(family, "Umbral Edge", "Strikes from the dark.", StatAxis::Attack, 5.0),
                    strike(family, "Shade Claw"),
                    active(family, "veil", "Veil Step", "Fades from view and sharpens its claws.",
                           kSignatureCost - 5, kSignatureCooldown + 1,
                           {effect(T::Self, StatusEffect{StatusType::Stealth, 100.0, 2, 0.0}),
                            effect(T::Self, BuffEffect{StatAxis::Attack, 20.0, 2})})};
        case Family::Lumina:
            return {passive(family, "Halo Ward", "Light shields its bearer.", StatAxis::Defense, 5.0),
                    strike(family, "Glimmer Ray"),
                    active(family, "blessing", "Radiant Blessing", "Heals and inspires allies.",
                           kSignatureCost + 5, kSignatureCooldown + 1,
                           {effect(T::AllAllies, HealEffect{0.08, std::nullopt}),
                            effect(T::AllAllies, BuffEffect{StatAxis::Attack, 15.0, 2})})};
        case Family::SteelWorks:
            return {passive(family, "Reinforced Frame", "Built to last.", StatAxis::Hp, 5.0),
                    strike(family, "Piston Punch"),
                    active(family, "barrage", "Rivet Barrage", "Fires rivets at random enemies.",
                           kSignatureCost, kSignatureCooldown,
                           {effect(T::RandomEnemies, damage(0.8), 2)})};
        case Family::ArcaneRift:
            return {passive(family, "Rune Sight", "Sees weak points.", StatAxis::Attack, 5.0),
                    strike(family, "Mana Bolt"),
                    active(family, "hex", "Hex", "Curses an enemy's defenses.",
                           kSignatureCost, kSignatureCooldown,
                           {effect(T::SingleEnemy, DebuffEffect{StatAxis::Defense, 25.0, 3}),
                            effect(T::SingleEnemy, damage(0.6))})};
        case Family::AeroFlight:
            return {passive(family, "Tailwind", "Always rides the wind.", StatAxis::Speed, 5.0),
                    strike(family, "Wing Slice"),
                    active(family, "dive", "Gale Dive", "A diving strike that drains vigor.",
                           kSignatureCost + 5, kSignatureCooldown,
                           {effect(T::SingleEnemy, damage(1.3, 10.0)),
                            effect(T::SingleEnemy, DebuffEffect{StatAxis::Speed, 20.0, 2})})};
        case Family::Weirdos:
            return {passive(family, "Unstable Form", "Nobody knows what it will do.",
                            StatAxis::Speed, 5.0),
                    strike(family, "Wobble Smack"),
                    active(family, "glitch", "Glitch Burst", "Erratic bursts at random enemies.",
                           kSignatureCost, kSignatureCooldown,
                           {effect(T::RandomEnemies, damage(0.5), 3),
                            effect(T::Self, SpecialEffect{"scramble"})})};
    }
    return {};
}

GameResult<Creature> createStarter(std::string_view templateId, foundation::CreatureId id,
                                   foundation::PlayerId ownerId,
                                   foundation::Timestamp createdAt) {
    auto family = starterFamily(templateId);
    if (!family) {
        return GameResult<Creature>::err(GameError(
            ErrorCode::UnknownTemplate, "unknown starter template: " + std::string(templateId)));
    }

    const auto& profile = familyProfile(*family);
    Creature creature;
    creature.id = std::move(id);
    creature.ownerId = std::move(ownerId);
    creature.name = std::string(profile.defaultGenome.baseForm);
    creature.family = *family;
    creature.rarity = Rarity::Basic;
    creature.stats = profile.baseStats;
    for (auto& ability : starterAbilities(*family)) {
        if (ability.isPassive()) {
            creature.passives.push_back(std::move(ability));
        } else {
            creature.actives.push_back(std::move(ability));
        }
    }
    creature.templateId = std::string(templateId);
    creature.createdAt = createdAt;

    auto bits = foundation::seedToHex(foundation::stableHash64({templateId}));
    creature.appearance.colorMutation = "#" + bits.substr(0, 6);
    creature.appearance.glowColor = "#" + bits.substr(6, 6);
    creature.appearance.particleTag = std::string(toString(familyElement(*family)));
    creature.appearance.visualTags = profile.visualTags;
    creature.appearance.genome = profile.defaultGenome;
    creature.appearance.genome->paletteSeed = bits;

    auto valid = validateCreature(creature);
    if (!valid) {
        return GameResult<Creature>::err(valid.error());
    }
    MF_LOG_DEBUG(foundation::LogCategory::Core,
                 "created starter " + creature.id.value() + " from " + std::string(templateId));
    return GameResult<Creature>::ok(std::move(creature));
}

}  // namespace mf::game
