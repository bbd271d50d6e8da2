#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "mf/combat/combat_resolver.hpp"
#include "mf/game/starter_catalog.hpp"

using namespace mf::combat;
using namespace mf::game;
using mf::foundation::AbilityId;
using mf::foundation::BattleId;
using mf::foundation::CreatureId;
using mf::foundation::ErrorCode;
using mf::foundation::PlayerId;

namespace {

// ---------------------------------------------------------------------------
// Fixtures
// ---------------------------------------------------------------------------

Ability active(const std::string& id, int32_t cost, int32_t cooldown, AbilityEffect effect) {
    Ability a;
    a.id = AbilityId(id);
    a.name = id;
    a.type = AbilityType::Active;
    a.energyCost = cost;
    a.cooldown = cooldown;
    a.effects.push_back(std::move(effect));
    return a;
}

AbilityEffect effect(TargetSelector target, EffectPayload payload) {
    AbilityEffect e;
    e.target = target;
    e.payload = std::move(payload);
    return e;
}

Ability strike() {
    return active("strike", 10, 0, effect(TargetSelector::SingleEnemy, DamageEffect{1.0}));
}

Ability nova() {
    return active("nova", 30, 2, effect(TargetSelector::AllEnemies, DamageEffect{0.5}));
}

Ability mend() {
    return active("mend", 10, 0, effect(TargetSelector::Self, HealEffect{0.5}));
}

Ability weaken() {
    return active("weaken", 0, 0,
                  effect(TargetSelector::SingleEnemy, DebuffEffect{StatAxis::Attack, 50.0, 1}));
}

Ability stunner() {
    return active("stunner", 0, 0,
                  effect(TargetSelector::SingleEnemy, StatusEffect{StatusType::Stun, 100.0, 1}));
}

Ability expensive() {
    return active("expensive", 80, 0, effect(TargetSelector::SingleEnemy, DamageEffect{3.0}));
}

Ability instinct() {
    Ability a;
    a.id = AbilityId("instinct");
    a.name = "Instinct";
    a.type = AbilityType::Passive;
    a.effects.push_back(effect(TargetSelector::Self, SpecialEffect{"watchful"}));
    return a;
}

/// Earth creature with 200 HP, 40 attack and 20 defense. Earth against
/// earth is neutral, so damage expectations stay exact.
Creature bare(const std::string& id, const std::string& owner, int32_t speed,
              std::vector<Ability> actives = {strike()}) {
    Creature c;
    c.id = CreatureId(id);
    c.ownerId = PlayerId(owner);
    c.name = id;
    c.family = Family::TerraForged;
    c.stats = StatBlock{200, 40, 20, speed};
    c.actives = std::move(actives);
    c.templateId = starterTemplateId(Family::TerraForged);
    return c;
}

CombatConfig noCrits() {
    CombatConfig config;
    config.critChance = 0.0;
    return config;
}

Battle start(const std::vector<Creature>& team1, const std::vector<Creature>& team2,
             const CombatConfig& config = noCrits(), uint64_t seed = 42) {
    auto battle = CombatResolver::createBattle(BattleId("b-1"), team1, team2, seed, config);
    EXPECT_TRUE(battle.hasValue());
    return battle.value();
}

CombatAction use(const std::string& actor, const std::string& ability,
                 std::vector<std::string> targets = {}) {
    CombatAction action;
    action.actorId = CreatureId(actor);
    action.abilityId = AbilityId(ability);
    for (auto& t : targets) {
        action.targetIds.emplace_back(std::move(t));
    }
    return action;
}

Battle step(const Battle& battle, const CombatAction& action) {
    auto next = CombatResolver::submitAction(battle, action);
    EXPECT_TRUE(next.hasValue()) << (next ? "" : std::string(next.error().message()));
    return next.value();
}

Battle passTurn(const Battle& battle) {
    return step(battle, CombatAction::pass(battle.currentActorId()));
}

FusionHistoryEntry tierFiveFusion(StoneType first, StoneType second, int32_t tier = 5) {
    FusionHistoryEntry entry;
    entry.parent1Id = CreatureId("x");
    entry.parent2Id = CreatureId("y");
    entry.parent1Family = Family::TerraForged;
    entry.parent2Family = Family::TerraForged;
    entry.catalyst1Type = first;
    entry.catalyst2Type = second;
    entry.catalyst1Tier = tier;
    entry.catalyst2Tier = tier;
    entry.fusionSeed = "00000000000000aa";
    return entry;
}

Creature fused(const std::string& id, const std::string& owner, FusionHistoryEntry entry) {
    Creature c = bare(id, owner, 10);
    c.templateId.reset();
    c.fusionHistory.push_back(std::move(entry));
    return c;
}

/// Fused creature whose history holds `fusions` tier-I fusions of two
/// `parents` creatures, so it carries lineage but no domain.
Creature descendant(const std::string& id, const std::string& owner, Family parents,
                    int32_t fusions = 1, int32_t generation = 1) {
    auto entry = tierFiveFusion(StoneType::Ruby, StoneType::Ruby, kMinCatalystTier);
    entry.parent1Family = parents;
    entry.parent2Family = parents;
    entry.generation = generation;
    Creature c = fused(id, owner, entry);
    for (int32_t i = 1; i < fusions; ++i) {
        c.fusionHistory.push_back(entry);
    }
    return c;
}

Creature glitched(const std::string& id, const std::string& owner, GlitchClass glitchClass,
                  std::vector<Ability> actives = {strike()}) {
    Creature c = descendant(id, owner, Family::TerraForged);
    c.actives = std::move(actives);
    c.glitch = GlitchProfile{glitchClass, 3};
    return c;
}

Creature ofFamily(Creature c, Family family) {
    c.family = family;
    return c;
}

Ability flare() {
    return active("flare", 10, 0,
                  effect(TargetSelector::SingleEnemy, DamageEffect{1.0, Element::Fire}));
}

Ability shade() {
    return active("shade", 10, 0,
                  effect(TargetSelector::SingleEnemy, DamageEffect{1.0, Element::Shadow}));
}

Ability leech() {
    return active("leech", 10, 0,
                  effect(TargetSelector::SingleEnemy,
                         DamageEffect{1.0, std::nullopt, std::nullopt, 50.0}));
}

Ability ignite() {
    return active("ignite", 0, 0, effect(TargetSelector::SingleEnemy, StatusEffect{}));
}

Ability taint() {
    return active("taint", 0, 0,
                  effect(TargetSelector::SingleEnemy, StatusEffect{StatusType::Poison, 100.0, 2, 8.0}));
}

Ability haste() {
    return active("haste", 0, 0,
                  effect(TargetSelector::Self, BuffEffect{StatAxis::Speed, 100.0, 2}));
}

Ability slow() {
    return active("slow", 0, 0,
                  effect(TargetSelector::SingleEnemy, DebuffEffect{StatAxis::Speed, 50.0, 2}));
}

}  // namespace

// ---------------------------------------------------------------------------
// Battle creation
// ---------------------------------------------------------------------------

TEST(CombatResolverTest, CreateBattleSplitsRowsAndOrdersBySpeed) {
    auto battle = start({bare("a-1", "p-1", 10), bare("a-2", "p-1", 30), bare("a-3", "p-1", 20)},
                        {bare("b-1", "p-2", 20)});

    EXPECT_EQ(battle.round, 1);
    EXPECT_EQ(battle.turn, 1);
    EXPECT_FALSE(battle.complete);
    EXPECT_FALSE(battle.winner.has_value());

    ASSERT_EQ(battle.team1.size(), 3u);
    EXPECT_EQ(battle.team1[0].position, BoardPosition::Front);
    EXPECT_EQ(battle.team1[1].position, BoardPosition::Front);
    EXPECT_EQ(battle.team1[2].position, BoardPosition::Back);
    EXPECT_EQ(battle.team2[0].position, BoardPosition::Front);

    for (const auto& p : battle.team1) {
        EXPECT_EQ(p.currentHp, 200);
        EXPECT_EQ(p.maxHp, 200);
        EXPECT_EQ(p.energy, 50);
    }

    std::vector<CreatureId> expected{CreatureId("a-2"), CreatureId("a-3"), CreatureId("b-1"),
                                     CreatureId("a-1")};
    EXPECT_EQ(battle.turnOrder, expected);
    EXPECT_EQ(battle.currentActorId(), CreatureId("a-2"));

    ASSERT_EQ(battle.log.size(), 1u);
    EXPECT_EQ(battle.log[0].message, "battle started: 3v1, 0 domain effect(s)");
}

TEST(CombatResolverTest, StartingEnergyIsCappedByMaximum) {
    CombatConfig config = noCrits();
    config.startingEnergy = 120;
    auto battle = start({bare("a-1", "p-1", 10)}, {bare("b-1", "p-2", 10)}, config);
    EXPECT_EQ(battle.team1[0].energy, 100);
}

TEST(CombatResolverTest, CreateBattleRejectsBadRosters) {
    auto a = bare("a-1", "p-1", 10);
    auto b = bare("b-1", "p-2", 10);

    auto noId = CombatResolver::createBattle(BattleId(""), {a}, {b}, 1);
    ASSERT_TRUE(noId.hasError());
    EXPECT_EQ(noId.error().code(), ErrorCode::InvalidArgument);

    auto empty = CombatResolver::createBattle(BattleId("b"), {}, {b}, 1);
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code(), ErrorCode::InvalidRoster);

    std::vector<Creature> five;
    for (int i = 0; i < 5; ++i) {
        five.push_back(bare("a-" + std::to_string(i), "p-1", 10));
    }
    auto oversized = CombatResolver::createBattle(BattleId("b"), five, {b}, 1);
    ASSERT_TRUE(oversized.hasError());
    EXPECT_EQ(oversized.error().code(), ErrorCode::InvalidRoster);

    auto twice = CombatResolver::createBattle(BattleId("b"), {a}, {a}, 1);
    ASSERT_TRUE(twice.hasError());
    EXPECT_EQ(twice.error().code(), ErrorCode::InvalidRoster);

    auto broken = a;
    broken.actives.clear();
    auto invalid = CombatResolver::createBattle(BattleId("b"), {broken}, {b}, 1);
    ASSERT_TRUE(invalid.hasError());
    EXPECT_EQ(invalid.error().code(), ErrorCode::InvalidRoster);
}

TEST(CombatResolverTest, CreateBattleRejectsBadConfig) {
    CombatConfig config;
    config.maxRounds = 0;
    auto battle = CombatResolver::createBattle(BattleId("b"), {bare("a-1", "p-1", 10)},
                                               {bare("b-1", "p-2", 10)}, 1, config);
    ASSERT_TRUE(battle.hasError());
    EXPECT_EQ(battle.error().code(), ErrorCode::InvalidArgument);
}

// ---------------------------------------------------------------------------
// Action validation
// ---------------------------------------------------------------------------

class CombatValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto attacker = bare("a-1", "p-1", 30, {strike(), expensive()});
        attacker.passives.push_back(instinct());
        battle_ = start({attacker, bare("a-2", "p-1", 5)}, {bare("b-1", "p-2", 20)});
    }

    ErrorCode rejection(const CombatAction& action) {
        auto result = CombatResolver::submitAction(battle_, action);
        EXPECT_TRUE(result.hasError());
        return result ? ErrorCode::Success : result.error().code();
    }

    Battle battle_;
};

TEST_F(CombatValidationTest, OnlyTheCurrentActorMayAct) {
    EXPECT_EQ(rejection(use("b-1", "strike", {"a-1"})), ErrorCode::NotActorsTurn);
    EXPECT_EQ(rejection(CombatAction::pass(CreatureId("b-1"))), ErrorCode::NotActorsTurn);
    EXPECT_EQ(rejection(use("ghost", "strike", {"b-1"})), ErrorCode::ParticipantNotFound);
}

TEST_F(CombatValidationTest, AbilityMustBeOwnedAndUsable) {
    EXPECT_EQ(rejection(use("a-1", "instinct")), ErrorCode::AbilityNotUsable);
    EXPECT_EQ(rejection(use("a-1", "fireball", {"b-1"})), ErrorCode::AbilityNotFound);
    EXPECT_EQ(rejection(use("a-1", "expensive", {"b-1"})), ErrorCode::InsufficientEnergy);
}

TEST_F(CombatValidationTest, SingleEnemyEffectsNeedAnEnemyTarget) {
    EXPECT_EQ(rejection(use("a-1", "strike")), ErrorCode::InvalidTarget);
    EXPECT_EQ(rejection(use("a-1", "strike", {"a-2"})), ErrorCode::InvalidTarget);
    EXPECT_EQ(rejection(use("a-1", "strike", {"nobody"})), ErrorCode::InvalidTarget);
}

TEST_F(CombatValidationTest, RejectedActionLeavesBattleUnchanged) {
    auto result = CombatResolver::submitAction(battle_, use("a-1", "strike", {"a-2"}));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(battle_.turn, 1);
    EXPECT_EQ(battle_.log.size(), 1u);
    EXPECT_EQ(battle_.team2[0].currentHp, 200);

    EXPECT_TRUE(CombatResolver::validateAction(battle_, use("a-1", "strike", {"b-1"})).hasValue());
    EXPECT_TRUE(CombatResolver::submitAction(battle_, use("a-1", "strike", {"b-1"})).hasValue());
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

TEST(CombatResolverTest, DamageUsesDefenseAndRowMultiplier) {
    auto battle = start({bare("a-1", "p-1", 30)}, {bare("b-1", "p-2", 20), bare("b-2", "p-2", 10)});

    // (40 - 20 * 0.5) * 1.5 against the front row.
    auto afterFront = step(battle, use("a-1", "strike", {"b-1"}));
    EXPECT_EQ(afterFront.team2[0].currentHp, 155);
    const auto& entry = afterFront.log.back();
    ASSERT_EQ(entry.results.size(), 1u);
    EXPECT_EQ(entry.results[0].amount, 45);
    EXPECT_EQ(entry.results[0].hpAfter, 155);
    EXPECT_FALSE(entry.results[0].critical);
    EXPECT_EQ(entry.message, "a-1 uses strike");
    ASSERT_TRUE(entry.action.has_value());
    EXPECT_EQ(entry.action->actorId, CreatureId("a-1"));

    // 30 * 0.75 against the back row, rounded half away from zero.
    auto afterBack = step(battle, use("a-1", "strike", {"b-2"}));
    EXPECT_EQ(afterBack.team2[1].currentHp, 177);
}

TEST(CombatResolverTest, ActionSpendsEnergyAndAdvancesTurn) {
    auto battle = start({bare("a-1", "p-1", 30)}, {bare("b-1", "p-2", 20)});
    auto next = step(battle, use("a-1", "strike", {"b-1"}));

    EXPECT_EQ(next.team1[0].energy, 50 - 10 + 15);
    EXPECT_EQ(next.turn, 2);
    EXPECT_EQ(next.round, 1);
    EXPECT_EQ(next.currentActorId(), CreatureId("b-1"));
}

TEST(CombatResolverTest, PassingBothTurnsClosesTheRound) {
    auto battle = start({bare("a-1", "p-1", 30)}, {bare("b-1", "p-2", 20)});
    auto next = passTurn(passTurn(battle));

    EXPECT_EQ(next.round, 2);
    EXPECT_EQ(next.turn, 3);
    EXPECT_EQ(next.team1[0].energy, 65);
    EXPECT_EQ(next.currentActorId(), CreatureId("a-1"));

    ASSERT_GE(next.log.size(), 4u);
    EXPECT_EQ(next.log[1].message, "a-1 passes");
    EXPECT_EQ(next.log[3].message, "round 1 ends");
    EXPECT_FALSE(next.log[3].action.has_value());
}

TEST(CombatResolverTest, CooldownBlocksReuseUntilItExpires) {
    auto battle = start({bare("a-1", "p-1", 30, {strike(), nova()})}, {bare("b-1", "p-2", 20)});

    battle = step(battle, use("a-1", "nova"));
    EXPECT_EQ(battle.team2[0].currentHp, 185);
    EXPECT_EQ(battle.team1[0].cooldownFor(AbilityId("nova")), 2);
    battle = passTurn(battle);

    EXPECT_EQ(battle.round, 2);
    EXPECT_EQ(battle.team1[0].cooldownFor(AbilityId("nova")), 1);
    auto blocked = CombatResolver::submitAction(battle, use("a-1", "nova"));
    ASSERT_TRUE(blocked.hasError());
    EXPECT_EQ(blocked.error().code(), ErrorCode::AbilityOnCooldown);
    EXPECT_FALSE(CombatResolver::isAvailable(battle.team1[0], nova()));

    battle = passTurn(passTurn(battle));
    EXPECT_EQ(battle.round, 3);
    EXPECT_TRUE(CombatResolver::isAvailable(battle.team1[0], nova()));
    EXPECT_TRUE(CombatResolver::submitAction(battle, use("a-1", "nova")).hasValue());
}

TEST(CombatResolverTest, DefeatingTheLastEnemyCompletesTheBattle) {
    auto weak = bare("b-1", "p-2", 20);
    weak.stats.hp = 1;
    auto battle = start({bare("a-1", "p-1", 30)}, {weak});

    auto done = step(battle, use("a-1", "strike", {"b-1"}));
    EXPECT_TRUE(done.complete);
    ASSERT_TRUE(done.winner.has_value());
    EXPECT_EQ(*done.winner, BattleWinner::Team1);
    EXPECT_EQ(done.team2[0].currentHp, 0);
    EXPECT_EQ(done.log.back().message, "battle complete: team1 (roster defeated)");

    auto after = CombatResolver::submitAction(done, CombatAction::pass(CreatureId("b-1")));
    ASSERT_TRUE(after.hasError());
    EXPECT_EQ(after.error().code(), ErrorCode::BattleAlreadyComplete);
}

TEST(CombatResolverTest, RoundLimitAwardsHigherRemainingHpShare) {
    CombatConfig config = noCrits();
    config.maxRounds = 1;
    auto battle = start({bare("a-1", "p-1", 30)}, {bare("b-1", "p-2", 20)}, config);

    auto done = passTurn(step(battle, use("a-1", "strike", {"b-1"})));
    EXPECT_TRUE(done.complete);
    ASSERT_TRUE(done.winner.has_value());
    EXPECT_EQ(*done.winner, BattleWinner::Team1);
    EXPECT_EQ(done.round, 1);
    EXPECT_EQ(done.log.back().message, "battle complete: team1 (round limit)");
}

TEST(CombatResolverTest, RoundLimitWithEqualHpIsADraw) {
    CombatConfig config = noCrits();
    config.maxRounds = 1;
    auto battle = start({bare("a-1", "p-1", 30)}, {bare("b-1", "p-2", 20)}, config);

    auto done = passTurn(passTurn(battle));
    ASSERT_TRUE(done.winner.has_value());
    EXPECT_EQ(*done.winner, BattleWinner::Draw);
}

TEST(CombatResolverTest, DebuffLowersStatUntilRoundEnd) {
    auto battle = start({bare("a-1", "p-1", 30, {strike(), weaken()})}, {bare("b-1", "p-2", 20)});

    battle = step(battle, use("a-1", "weaken", {"b-1"}));
    ASSERT_EQ(battle.team2[0].debuffs.size(), 1u);
    EXPECT_EQ(CombatResolver::effectiveStat(battle, battle.team2[0], StatAxis::Attack), 20);

    battle = passTurn(battle);
    EXPECT_EQ(battle.round, 2);
    EXPECT_TRUE(battle.team2[0].debuffs.empty());
    EXPECT_EQ(CombatResolver::effectiveStat(battle, battle.team2[0], StatAxis::Attack), 40);
}

TEST(CombatResolverTest, StunnedActorMayOnlyPass) {
    auto battle = start({bare("a-1", "p-1", 30, {strike(), stunner()})}, {bare("b-1", "p-2", 20)});
    battle = step(battle, use("a-1", "stunner", {"b-1"}));

    ASSERT_TRUE(battle.team2[0].isIncapacitated());
    auto blocked = CombatResolver::submitAction(battle, use("b-1", "strike", {"a-1"}));
    ASSERT_TRUE(blocked.hasError());
    EXPECT_EQ(blocked.error().code(), ErrorCode::ActorIncapacitated);

    auto suggested = CombatResolver::suggestAction(battle);
    EXPECT_TRUE(suggested.isPass());
    EXPECT_EQ(suggested.actorId, CreatureId("b-1"));

    battle = step(battle, suggested);
    EXPECT_EQ(battle.round, 2);
    EXPECT_FALSE(battle.team2[0].isIncapacitated());
}

// ---------------------------------------------------------------------------
// Automated play
// ---------------------------------------------------------------------------

TEST(CombatResolverTest, SuggestActionPicksStrongestDamageOnWeakestEnemy) {
    auto battle = start({bare("a-1", "p-1", 30, {strike(), nova()})},
                        {bare("b-1", "p-2", 20), bare("b-2", "p-2", 10)});
    auto action = CombatResolver::suggestAction(battle);
    ASSERT_FALSE(action.isPass());
    EXPECT_EQ(*action.abilityId, AbilityId("nova"));

    auto single = start({bare("a-1", "p-1", 30)}, {bare("b-1", "p-2", 20), bare("b-2", "p-2", 10)});
    single.team2[1].currentHp = 50;
    auto targeted = CombatResolver::suggestAction(single);
    ASSERT_EQ(targeted.targetIds.size(), 1u);
    EXPECT_EQ(targeted.targetIds[0], CreatureId("b-2"));
}

TEST(CombatResolverTest, SuggestActionHealsWhenAllyIsLow) {
    auto battle = start({bare("a-1", "p-1", 30, {strike(), mend()})}, {bare("b-1", "p-2", 20)});
    EXPECT_EQ(*CombatResolver::suggestAction(battle).abilityId, AbilityId("strike"));

    battle.team1[0].currentHp = 50;
    auto action = CombatResolver::suggestAction(battle);
    ASSERT_FALSE(action.isPass());
    EXPECT_EQ(*action.abilityId, AbilityId("mend"));

    auto healed = step(battle, action);
    EXPECT_EQ(healed.team1[0].currentHp, 150);
}

TEST(CombatResolverTest, SuggestActionPassesWithoutEnergy) {
    auto battle = start({bare("a-1", "p-1", 30, {expensive()})}, {bare("b-1", "p-2", 20)});
    EXPECT_TRUE(CombatResolver::suggestAction(battle).isPass());
}

TEST(CombatResolverTest, StarterBattlesTerminateWithinRoundLimit) {
    std::vector<Creature> team1;
    std::vector<Creature> team2;
    for (auto family : {Family::PyroKin, Family::AquaBorn}) {
        auto c = createStarter(starterTemplateId(family),
                               CreatureId("p1-" + std::string(toString(family))), PlayerId("p-1"), 0);
        ASSERT_TRUE(c.hasValue());
        team1.push_back(c.value());
    }
    for (auto family : {Family::TerraForged, Family::VoltStream}) {
        auto c = createStarter(starterTemplateId(family),
                               CreatureId("p2-" + std::string(toString(family))), PlayerId("p-2"), 0);
        ASSERT_TRUE(c.hasValue());
        team2.push_back(c.value());
    }

    auto play = [&](uint64_t seed) {
        auto created = CombatResolver::createBattle(BattleId("auto"), team1, team2, seed);
        EXPECT_TRUE(created.hasValue());
        Battle battle = created.value();
        while (!battle.complete) {
            auto next = CombatResolver::submitAction(battle, CombatResolver::suggestAction(battle));
            EXPECT_TRUE(next.hasValue());
            if (!next) {
                break;
            }
            battle = std::move(next).value();
        }
        return battle;
    };

    auto battle = play(7);
    EXPECT_TRUE(battle.complete);
    ASSERT_TRUE(battle.winner.has_value());
    EXPECT_LE(battle.round, battle.config.maxRounds);
    for (const auto* roster : {&battle.team1, &battle.team2}) {
        for (const auto& p : *roster) {
            EXPECT_GE(p.currentHp, 0);
            EXPECT_LE(p.currentHp, p.maxHp);
            EXPECT_GE(p.energy, 0);
            EXPECT_LE(p.energy, battle.config.maxEnergy);
        }
    }

    auto replay = play(7);
    EXPECT_EQ(replay.winner, battle.winner);
    EXPECT_EQ(replay.log.size(), battle.log.size());
    EXPECT_EQ(replay.turn, battle.turn);
}

// ---------------------------------------------------------------------------
// Domains
// ---------------------------------------------------------------------------

TEST(CombatResolverTest, DomainsRequireTwoTierFiveCatalysts) {
    EXPECT_TRUE(CombatResolver::domainsFor(bare("a-1", "p-1", 10)).empty());
    EXPECT_TRUE(CombatResolver::domainsFor(
                    fused("f-1", "p-1", tierFiveFusion(StoneType::Ruby, StoneType::Onyx, 4)))
                    .empty());

    auto pair = CombatResolver::domainsFor(
        fused("f-1", "p-1", tierFiveFusion(StoneType::Ruby, StoneType::Onyx)));
    ASSERT_EQ(pair.size(), 2u);
    EXPECT_EQ(pair[0].kind, DomainKind::ElementDamageBoost);
    EXPECT_EQ(pair[1].kind, DomainKind::Reflect);

    auto same = CombatResolver::domainsFor(
        fused("f-1", "p-1", tierFiveFusion(StoneType::Ruby, StoneType::Ruby)));
    EXPECT_EQ(same.size(), 1u);
}

TEST(CombatResolverTest, BattleDeduplicatesDomainsPerTeam) {
    auto battle = start({fused("f-1", "p-1", tierFiveFusion(StoneType::Topaz, StoneType::Topaz)),
                         fused("f-2", "p-1", tierFiveFusion(StoneType::Topaz, StoneType::Pearl))},
                        {fused("f-3", "p-2", tierFiveFusion(StoneType::Topaz, StoneType::Topaz))});

    ASSERT_EQ(battle.domains.size(), 3u);
    EXPECT_EQ(battle.log[0].message, "battle started: 2v1, 3 domain effect(s)");

    // Storm adds 15 speed points for its own team only.
    EXPECT_EQ(CombatResolver::effectiveStat(battle, battle.team1[0], StatAxis::Speed), 12);
    EXPECT_EQ(CombatResolver::effectiveStat(battle, battle.team2[0], StatAxis::Speed), 12);
}

TEST(CombatResolverTest, SanctuaryReducesIncomingDamage) {
    auto guarded = fused("f-1", "p-2", tierFiveFusion(StoneType::Pearl, StoneType::Pearl));
    auto battle = start({bare("a-1", "p-1", 30)}, {guarded});

    auto next = step(battle, use("a-1", "strike", {"f-1"}));
    // Two earth ancestors add 6% defense: (40 - 10.6) * 1.5 * 0.9.
    EXPECT_EQ(next.team2[0].currentHp, 200 - 40);
}

TEST(CombatResolverTest, InfernoBoostsOnlyFireDamageOfItsTeam) {
    auto attacker = bare("a-1", "p-1", 30, {strike(), flare()});
    attacker.stats.attack = 50;
    auto battle = start({attacker, fused("f-1", "p-1", tierFiveFusion(StoneType::Ruby, StoneType::Ruby))},
                        {ofFamily(bare("b-1", "p-2", 20), Family::Lumina)});

    // (50 - 10) * 1.5 * 1.3 for fire, plain 60 for earth.
    auto fire = step(battle, use("a-1", "flare", {"b-1"}));
    EXPECT_EQ(fire.log.back().results[0].amount, 78);
    auto earth = step(battle, use("a-1", "strike", {"b-1"}));
    EXPECT_EQ(earth.log.back().results[0].amount, 60);
}

TEST(CombatResolverTest, EntropyBoostsEveryElement) {
    auto attacker = bare("a-1", "p-1", 30);
    attacker.stats.attack = 50;
    auto battle = start({attacker, fused("f-1", "p-1", tierFiveFusion(StoneType::Opal, StoneType::Opal))},
                        {bare("b-1", "p-2", 20)});

    auto next = step(battle, use("a-1", "strike", {"b-1"}));
    EXPECT_EQ(next.log.back().results[0].amount, 66);
    EXPECT_EQ(next.team2[0].currentHp, 134);
}

TEST(CombatResolverTest, EclipseAmplifiesShadowDamageOnEnemies) {
    auto defender = ofFamily(bare("b-1", "p-2", 20), Family::ShadowVeil);
    auto withDomain = start({bare("a-1", "p-1", 30, {strike(), shade()}),
                             fused("f-1", "p-1", tierFiveFusion(StoneType::Amethyst, StoneType::Amethyst))},
                            {defender});
    auto withoutDomain = start({bare("a-1", "p-1", 30, {strike(), shade()}),
                                fused("f-1", "p-1",
                                      tierFiveFusion(StoneType::Amethyst, StoneType::Amethyst, 4))},
                               {defender});

    EXPECT_EQ(step(withDomain, use("a-1", "shade", {"b-1"})).log.back().results[0].amount, 54);
    EXPECT_EQ(step(withoutDomain, use("a-1", "shade", {"b-1"})).log.back().results[0].amount, 45);
}

TEST(CombatResolverTest, BastionReflectsDamageAsSeparateResult) {
    auto battle = start({bare("a-1", "p-1", 30)},
                        {fused("f-1", "p-2", tierFiveFusion(StoneType::Onyx, StoneType::Onyx))});

    // (40 - 10.6) * 1.5 = 44.1, then 15% of 44 comes back.
    auto next = step(battle, use("a-1", "strike", {"f-1"}));
    const auto& results = next.log.back().results;
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].targetId, CreatureId("f-1"));
    EXPECT_EQ(results[0].amount, 44);
    EXPECT_EQ(results[0].hpAfter, 156);
    EXPECT_FALSE(results[0].note.has_value());
    EXPECT_EQ(results[1].targetId, CreatureId("a-1"));
    EXPECT_EQ(results[1].kind, EffectKind::Damage);
    EXPECT_EQ(results[1].amount, 7);
    EXPECT_EQ(results[1].note, "reflected");
    EXPECT_EQ(results[1].hpAfter, 193);
    EXPECT_EQ(next.team1[0].currentHp, 193);
}

TEST(CombatResolverTest, ReflectThatDefeatsTheActorStopsTheAbility) {
    auto battle = start({bare("a-1", "p-1", 30, {strike(), nova()})},
                        {fused("f-1", "p-2", tierFiveFusion(StoneType::Onyx, StoneType::Onyx)),
                         fused("f-2", "p-2", tierFiveFusion(StoneType::Onyx, StoneType::Onyx))});
    battle.team1[0].currentHp = 1;

    auto next = step(battle, use("a-1", "nova"));
    const auto& results = next.log.back().results;
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].targetId, CreatureId("f-1"));
    EXPECT_EQ(results[0].amount, 14);
    EXPECT_EQ(results[1].targetId, CreatureId("a-1"));
    EXPECT_EQ(results[1].amount, 1);
    EXPECT_EQ(results[1].hpAfter, 0);
    EXPECT_EQ(next.team2[1].currentHp, 200);
    EXPECT_TRUE(next.complete);
    EXPECT_EQ(next.winner, BattleWinner::Team2);
}

TEST(CombatResolverTest, ReflectThatDefeatsTheActorSkipsLaterEffects) {
    Ability drain = active("drain", 10, 0, effect(TargetSelector::SingleEnemy, DamageEffect{0.5}));
    drain.effects.push_back(effect(TargetSelector::Self, HealEffect{0.5}));
    auto battle = start({bare("a-1", "p-1", 30, {drain})},
                        {fused("f-1", "p-2", tierFiveFusion(StoneType::Onyx, StoneType::Onyx))});
    battle.team1[0].currentHp = 1;

    auto next = step(battle, use("a-1", "drain", {"f-1"}));
    const auto& results = next.log.back().results;
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].note, "reflected");
    EXPECT_TRUE(std::none_of(results.begin(), results.end(),
                             [](const EffectResult& r) { return r.kind == EffectKind::Heal; }));
    EXPECT_EQ(next.team1[0].currentHp, 0);
}

TEST(CombatResolverTest, TidalRegenAndGrowthEnergyApplyAtRoundEnd) {
    auto battle = start({bare("a-1", "p-1", 30),
                         fused("f-1", "p-1", tierFiveFusion(StoneType::Sapphire, StoneType::Emerald))},
                        {bare("b-1", "p-2", 20)});
    battle.team1[0].currentHp = 100;
    battle.team1[1].currentHp = 195;

    auto next = passTurn(passTurn(passTurn(battle)));
    EXPECT_EQ(next.round, 2);

    const auto& roundEnd = next.log.back();
    EXPECT_EQ(roundEnd.message, "round 1 ends");
    ASSERT_EQ(roundEnd.results.size(), 2u);
    EXPECT_EQ(roundEnd.results[0].targetId, CreatureId("a-1"));
    EXPECT_EQ(roundEnd.results[0].amount, 10);
    EXPECT_EQ(roundEnd.results[0].note, "domain regen");
    EXPECT_EQ(roundEnd.results[1].targetId, CreatureId("f-1"));
    EXPECT_EQ(roundEnd.results[1].amount, 5);

    EXPECT_EQ(next.team1[0].currentHp, 110);
    EXPECT_EQ(next.team1[1].currentHp, 200);
    EXPECT_EQ(next.team1[0].energy, 85);
    EXPECT_EQ(next.team1[1].energy, 85);
    EXPECT_EQ(next.team2[0].energy, 65);
}

// ---------------------------------------------------------------------------
// Effects
// ---------------------------------------------------------------------------

TEST(CombatResolverTest, LifestealHealsTheActor) {
    auto battle = start({bare("a-1", "p-1", 30, {leech()})}, {bare("b-1", "p-2", 20)});
    battle.team1[0].currentHp = 100;

    auto next = step(battle, use("a-1", "leech", {"b-1"}));
    const auto& hit = next.log.back().results[0];
    EXPECT_EQ(hit.amount, 45);
    EXPECT_EQ(hit.note, "lifesteal 23");
    EXPECT_EQ(next.team1[0].currentHp, 123);

    battle.team1[0].currentHp = 190;
    EXPECT_EQ(step(battle, use("a-1", "leech", {"b-1"})).team1[0].currentHp, 200);
}

TEST(CombatResolverTest, BurnAndPoisonTickAtRoundEnd) {
    auto battle = start({bare("a-1", "p-1", 30, {strike(), ignite(), taint()})},
                        {bare("b-1", "p-2", 20)});

    battle = passTurn(step(battle, use("a-1", "ignite", {"b-1"})));
    const auto& first = battle.log.back();
    EXPECT_EQ(first.message, "round 1 ends");
    ASSERT_EQ(first.results.size(), 1u);
    EXPECT_EQ(first.results[0].kind, EffectKind::Status);
    EXPECT_EQ(first.results[0].status, StatusType::Burn);
    EXPECT_EQ(first.results[0].amount, 10);
    EXPECT_EQ(battle.team2[0].currentHp, 190);

    battle = passTurn(step(battle, use("a-1", "taint", {"b-1"})));
    const auto& second = battle.log.back();
    ASSERT_EQ(second.results.size(), 2u);
    EXPECT_EQ(second.results[0].amount, 10);
    EXPECT_EQ(second.results[1].status, StatusType::Poison);
    EXPECT_EQ(second.results[1].amount, 16);
    EXPECT_EQ(battle.team2[0].currentHp, 164);

    battle = passTurn(passTurn(battle));
    EXPECT_EQ(battle.team2[0].currentHp, 148);
    EXPECT_TRUE(battle.team2[0].statuses.empty());
}

TEST(CombatResolverTest, StatusFailsWhenChanceRollFails) {
    auto fizzle = active("fizzle", 0, 0,
                         effect(TargetSelector::SingleEnemy, StatusEffect{StatusType::Stun, 0.0, 1}));
    auto battle = start({bare("a-1", "p-1", 30, {fizzle})}, {bare("b-1", "p-2", 20)});

    auto next = step(battle, use("a-1", "fizzle", {"b-1"}));
    const auto& result = next.log.back().results[0];
    EXPECT_EQ(result.kind, EffectKind::Status);
    EXPECT_FALSE(result.applied);
    EXPECT_TRUE(next.team2[0].statuses.empty());
    EXPECT_FALSE(next.team2[0].isIncapacitated());
    EXPECT_EQ(next.rng.draws(), 1u);
}

TEST(CombatResolverTest, StealthedTargetCanBeMissed) {
    auto stealthed = [](uint64_t seed) {
        auto battle = start({bare("a-1", "p-1", 30)}, {bare("b-1", "p-2", 20)}, noCrits(), seed);
        battle.team2[0].statuses.push_back(ActiveStatus{StatusType::Stealth, 2, 0.0, std::nullopt});
        return step(battle, use("a-1", "strike", {"b-1"}));
    };

    // Seed 1 draws below one half first, seed 2 does not.
    auto missed = stealthed(1);
    EXPECT_TRUE(missed.log.back().results[0].missed);
    EXPECT_EQ(missed.log.back().results[0].amount, 0);
    EXPECT_EQ(missed.team2[0].currentHp, 200);
    EXPECT_EQ(missed.rng.draws(), 1u);

    auto hit = stealthed(2);
    EXPECT_FALSE(hit.log.back().results[0].missed);
    EXPECT_EQ(hit.team2[0].currentHp, 155);
    EXPECT_EQ(hit.rng.draws(), 2u);
}

TEST(CombatResolverTest, TurnOrderFollowsSpeedBuffNextRound) {
    auto battle = start({bare("a-1", "p-1", 20, {strike(), haste()})}, {bare("b-1", "p-2", 30)});
    EXPECT_EQ(battle.currentActorId(), CreatureId("b-1"));

    battle = step(passTurn(battle), use("a-1", "haste"));
    EXPECT_EQ(battle.round, 2);
    EXPECT_EQ(CombatResolver::effectiveStat(battle, battle.team1[0], StatAxis::Speed), 40);
    std::vector<CreatureId> expected{CreatureId("a-1"), CreatureId("b-1")};
    EXPECT_EQ(battle.turnOrder, expected);
    EXPECT_EQ(battle.currentActorId(), CreatureId("a-1"));
}

TEST(CombatResolverTest, TurnOrderFollowsSpeedDebuffNextRound) {
    auto battle = start({bare("a-1", "p-1", 30, {strike(), slow()}), bare("a-2", "p-1", 10)},
                        {bare("b-1", "p-2", 20)});

    battle = step(battle, use("a-1", "slow", {"b-1"}));
    EXPECT_EQ(CombatResolver::effectiveStat(battle, battle.team2[0], StatAxis::Speed), 10);
    // The current round keeps its order.
    EXPECT_EQ(battle.currentActorId(), CreatureId("b-1"));

    battle = passTurn(passTurn(battle));
    EXPECT_EQ(battle.round, 2);
    // Equal speed falls back to id order.
    std::vector<CreatureId> expected{CreatureId("a-1"), CreatureId("a-2"), CreatureId("b-1")};
    EXPECT_EQ(battle.turnOrder, expected);
}

// ---------------------------------------------------------------------------
// Lineage
// ---------------------------------------------------------------------------

TEST(CombatResolverTest, FireLineageRaisesDamage) {
    auto battle = start({descendant("f-1", "p-1", Family::PyroKin)}, {bare("b-1", "p-2", 5)});
    // Two fire ancestors: 45 * 1.04.
    auto next = step(battle, use("f-1", "strike", {"b-1"}));
    EXPECT_EQ(next.log.back().results[0].amount, 47);
}

TEST(CombatResolverTest, EarthLineageRaisesDefense) {
    auto battle = start({bare("a-1", "p-1", 30)}, {descendant("f-1", "p-2", Family::TerraForged)});
    EXPECT_EQ(step(battle, use("a-1", "strike", {"f-1"})).log.back().results[0].amount, 44);
}

TEST(CombatResolverTest, AncientLineageRaisesDamageAndDefense) {
    auto attacker = descendant("f-1", "p-1", Family::TerraForged, 1, 10);
    attacker.stats.attack = 50;
    auto battle = start({attacker}, {bare("b-1", "p-2", 5)});
    EXPECT_EQ(step(battle, use("f-1", "strike", {"b-1"})).log.back().results[0].amount, 66);

    auto defender = descendant("f-2", "p-2", Family::PyroKin, 1, 10);
    defender.stats.defense = 30;
    auto guarded = start({bare("a-1", "p-1", 30)}, {defender});
    // (40 - 30 * 0.5 * 1.1) * 1.5 = 35.25.
    EXPECT_EQ(step(guarded, use("a-1", "strike", {"f-2"})).log.back().results[0].amount, 35);
}

TEST(CombatResolverTest, LightLineageAddsCritChance) {
    // Seed 43 opens with a draw below 0.05.
    auto lit = start({descendant("f-1", "p-1", Family::Lumina, 2)}, {bare("b-1", "p-2", 5)},
                     noCrits(), 43);
    ASSERT_DOUBLE_EQ(lit.team1[0].lineage.critChancePercent, 5.0);
    auto crit = step(lit, use("f-1", "strike", {"b-1"})).log.back().results[0];
    EXPECT_TRUE(crit.critical);
    EXPECT_EQ(crit.amount, 68);

    auto plain = start({descendant("f-1", "p-1", Family::TerraForged, 2)}, {bare("b-1", "p-2", 5)},
                       noCrits(), 43);
    auto normal = step(plain, use("f-1", "strike", {"b-1"})).log.back().results[0];
    EXPECT_FALSE(normal.critical);
    EXPECT_EQ(normal.amount, 45);
}

TEST(CombatResolverTest, ShadowLineageEvadesHits) {
    auto evasive = [](uint64_t seed) {
        auto battle = start({bare("a-1", "p-1", 30)},
                            {descendant("f-1", "p-2", Family::ShadowVeil, 8)}, noCrits(), seed);
        EXPECT_DOUBLE_EQ(battle.team2[0].lineage.evasionPercent, 15.0);
        return step(battle, use("a-1", "strike", {"f-1"}));
    };

    // Seed 1 opens below 0.15, seed 2 does not.
    auto missed = evasive(1);
    EXPECT_TRUE(missed.log.back().results[0].missed);
    EXPECT_EQ(missed.team2[0].currentHp, 200);
    EXPECT_EQ(missed.rng.draws(), 1u);

    auto hit = evasive(2);
    EXPECT_FALSE(hit.log.back().results[0].missed);
    EXPECT_EQ(hit.log.back().results[0].amount, 45);
    EXPECT_EQ(hit.rng.draws(), 2u);
}

TEST(CombatResolverTest, LightningLineageRaisesSpeedAndTurnOrder) {
    auto quick = descendant("f-1", "p-1", Family::VoltStream);
    quick.stats.speed = 50;
    auto battle = start({quick}, {bare("b-1", "p-2", 51)});
    EXPECT_EQ(CombatResolver::effectiveStat(battle, battle.team1[0], StatAxis::Speed), 52);
    EXPECT_EQ(battle.currentActorId(), CreatureId("f-1"));
}

TEST(CombatResolverTest, WaterLineageRaisesHealing) {
    auto healer = descendant("f-1", "p-1", Family::AquaBorn, 2);
    healer.actives = {strike(), mend()};
    auto battle = start({healer}, {bare("b-1", "p-2", 5)});
    battle.team1[0].currentHp = 50;
    // Four water ancestors: 100 * 1.07.
    EXPECT_EQ(step(battle, use("f-1", "mend")).team1[0].currentHp, 157);
}

// ---------------------------------------------------------------------------
// Glitches
// ---------------------------------------------------------------------------

TEST(CombatResolverTest, BypassSpecialistIgnoresDefense) {
    auto battle = start({glitched("f-1", "p-1", GlitchClass::BypassSpecialist)},
                        {bare("b-1", "p-2", 5)});
    EXPECT_EQ(step(battle, use("f-1", "strike", {"b-1"})).log.back().results[0].amount, 60);
}

TEST(CombatResolverTest, SystemOverrideIgnoresEnergyAndCooldowns) {
    auto battle = start({glitched("f-1", "p-1", GlitchClass::SystemOverride,
                                  {strike(), nova(), expensive()})},
                        {bare("b-1", "p-2", 5)});
    const auto& actor = battle.team1[0];
    EXPECT_TRUE(CombatResolver::isAvailable(actor, expensive()));
    EXPECT_FALSE(CombatResolver::isAvailable(actor, instinct()));

    battle = step(battle, use("f-1", "expensive", {"b-1"}));
    EXPECT_EQ(battle.team1[0].energy, 65);
    EXPECT_EQ(battle.team2[0].currentHp, 35);

    battle = step(passTurn(battle), use("f-1", "nova"));
    EXPECT_EQ(battle.team1[0].cooldownFor(AbilityId("nova")), 0);
    EXPECT_TRUE(CombatResolver::isAvailable(battle.team1[0], nova()));
    EXPECT_EQ(battle.team2[0].currentHp, 20);
}

TEST(CombatResolverTest, RealityDistorterRedrawsSingleTarget) {
    auto battle = start({glitched("f-1", "p-1", GlitchClass::RealityDistorter)},
                        {bare("b-1", "p-2", 5), bare("b-2", "p-2", 5)});

    // Seed 42 redraws onto the back-row enemy.
    auto next = step(battle, use("f-1", "strike", {"b-1"}));
    const auto& hit = next.log.back().results[0];
    EXPECT_EQ(hit.targetId, CreatureId("b-2"));
    EXPECT_EQ(hit.amount, 23);
    EXPECT_EQ(next.team2[0].currentHp, 200);
    EXPECT_EQ(next.rng.draws(), 2u);

    auto replay = step(battle, use("f-1", "strike", {"b-1"}));
    EXPECT_EQ(replay.log.back().results[0].targetId, hit.targetId);

    battle.team2[1].currentHp = 0;
    auto alone = step(battle, use("f-1", "strike", {"b-1"}));
    EXPECT_EQ(alone.log.back().results[0].targetId, CreatureId("b-1"));
    EXPECT_EQ(alone.rng.draws(), 1u);
}

TEST(CombatResolverTest, ChaosEngineScalesEachHit) {
    auto battle = start({glitched("f-1", "p-1", GlitchClass::ChaosEngine)}, {bare("b-1", "p-2", 5)});

    // 45 scaled by 0.5 + 2.0 * draw for the second draw of seed 42.
    auto next = step(battle, use("f-1", "strike", {"b-1"}));
    int32_t amount = next.log.back().results[0].amount;
    EXPECT_EQ(amount, 80);
    EXPECT_GE(amount, 23);
    EXPECT_LE(amount, 113);
    EXPECT_EQ(next.rng.draws(), 2u);
    EXPECT_EQ(step(battle, use("f-1", "strike", {"b-1"})).log.back().results[0].amount, amount);
}
