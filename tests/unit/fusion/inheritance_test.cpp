#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "mf/fusion/inheritance_resolver.hpp"
#include "mf/fusion/lineage.hpp"
#include "mf/game/starter_catalog.hpp"

using namespace mf::fusion;
using namespace mf::game;
using mf::foundation::AbilityId;
using mf::foundation::CreatureId;
using mf::foundation::PlayerId;

namespace {

Ability ability(const std::string& id, AbilityType type, int32_t cost) {
    Ability a;
    a.id = AbilityId(id);
    a.name = id;
    a.type = type;
    if (type != AbilityType::Passive) {
        a.energyCost = cost;
        a.cooldown = 0;
    }
    a.effects = {AbilityEffect{TargetSelector::SingleEnemy, 1, DamageEffect{}}};
    return a;
}

Creature bare(const std::string& id, Family family) {
    Creature c;
    c.id = CreatureId(id);
    c.ownerId = PlayerId("p");
    c.family = family;
    c.stats = {100, 10, 10, 10};
    return c;
}

std::vector<std::string> ids(const std::vector<Ability>& abilities) {
    std::vector<std::string> out;
    for (const auto& a : abilities) {
        out.push_back(a.id.value());
    }
    return out;
}

FusionHistoryEntry entry(int32_t generation, Family f1, Family f2, int32_t mutations = 0) {
    FusionHistoryEntry e;
    e.generation = generation;
    e.parent1Id = CreatureId("a" + std::to_string(generation));
    e.parent2Id = CreatureId("b" + std::to_string(generation));
    e.parent1Family = f1;
    e.parent2Family = f2;
    e.mutationCount = mutations;
    return e;
}

}  // namespace

// ---------------------------------------------------------------------------
// Abilities
// ---------------------------------------------------------------------------

TEST(InheritanceResolverTest, KeepsStrongestUltimateAndCapsActives) {
    auto p1 = bare("one", Family::PyroKin);
    p1.actives = {ability("a", AbilityType::Active, 10), ability("b", AbilityType::Active, 30)};
    p1.ultimate = ability("u1", AbilityType::Ultimate, 50);

    auto p2 = bare("two", Family::AquaBorn);
    p2.actives = {ability("c", AbilityType::Active, 20), ability("d", AbilityType::Active, 40),
                  ability("e", AbilityType::Active, 5)};
    p2.ultimate = ability("u2", AbilityType::Ultimate, 60);

    auto out = InheritanceResolver::inheritAbilities(p1, p2, FusionConfig{});
    ASSERT_TRUE(out.ultimate.has_value());
    EXPECT_EQ(out.ultimate->id, AbilityId("u2"));
    EXPECT_EQ(ids(out.actives), (std::vector<std::string>{"d", "b", "c"}));

    std::vector<AbilityId> expectedDropped{AbilityId("u1"), AbilityId("a"), AbilityId("e")};
    EXPECT_EQ(out.dropped, expectedDropped);
}

TEST(InheritanceResolverTest, UltimateTieGoesToFirstParent) {
    auto p1 = bare("one", Family::PyroKin);
    p1.actives = {ability("a", AbilityType::Active, 10)};
    p1.ultimate = ability("u1", AbilityType::Ultimate, 50);
    auto p2 = bare("two", Family::AquaBorn);
    p2.actives = {ability("b", AbilityType::Active, 10)};
    p2.ultimate = ability("u2", AbilityType::Ultimate, 50);

    auto out = InheritanceResolver::inheritAbilities(p1, p2, FusionConfig{});
    ASSERT_TRUE(out.ultimate.has_value());
    EXPECT_EQ(out.ultimate->id, AbilityId("u1"));
}

TEST(InheritanceResolverTest, SharedAbilitiesAreNotDuplicated) {
    auto p1 = createStarter("pyro_kin_starter", CreatureId("x"), PlayerId("p"), 0).value();
    auto p2 = createStarter("pyro_kin_starter", CreatureId("y"), PlayerId("p"), 0).value();

    auto out = InheritanceResolver::inheritAbilities(p1, p2, FusionConfig{});
    EXPECT_EQ(out.passives.size(), 1u);
    EXPECT_EQ(ids(out.actives),
              (std::vector<std::string>{"pyro_kin_burst", "pyro_kin_strike"}));
    EXPECT_TRUE(out.dropped.empty());
}

TEST(InheritanceResolverTest, PassiveCapDropsLatest) {
    auto p1 = bare("one", Family::PyroKin);
    p1.actives = {ability("a", AbilityType::Active, 10)};
    p1.passives = {ability("p1", AbilityType::Passive, 0), ability("p2", AbilityType::Passive, 0)};
    auto p2 = bare("two", Family::AquaBorn);
    p2.actives = {ability("b", AbilityType::Active, 10)};
    p2.passives = {ability("p3", AbilityType::Passive, 0)};

    FusionConfig config;
    config.maxPassiveAbilities = 2;
    auto out = InheritanceResolver::inheritAbilities(p1, p2, config);
    EXPECT_EQ(ids(out.passives), (std::vector<std::string>{"p1", "p2"}));
    ASSERT_EQ(out.dropped.size(), 1u);
    EXPECT_EQ(out.dropped[0], AbilityId("p3"));
}

TEST(InheritanceResolverTest, SingleSlotCapDropsUltimate) {
    auto p1 = bare("one", Family::PyroKin);
    p1.actives = {ability("a", AbilityType::Active, 10)};
    p1.ultimate = ability("u", AbilityType::Ultimate, 50);
    auto p2 = bare("two", Family::AquaBorn);
    p2.actives = {ability("b", AbilityType::Active, 20)};

    FusionConfig config;
    config.maxActiveAbilities = 1;
    auto out = InheritanceResolver::inheritAbilities(p1, p2, config);
    EXPECT_EQ(ids(out.actives), (std::vector<std::string>{"b"}));
    EXPECT_FALSE(out.ultimate.has_value());
    EXPECT_EQ(out.actives.size(), 1u);
    EXPECT_NE(std::find(out.dropped.begin(), out.dropped.end(), AbilityId("u")), out.dropped.end());
}

TEST(InheritanceResolverTest, TwoSlotCapKeepsUltimateAndOneActive) {
    auto p1 = bare("one", Family::PyroKin);
    p1.actives = {ability("a", AbilityType::Active, 10)};
    p1.ultimate = ability("u", AbilityType::Ultimate, 50);
    auto p2 = bare("two", Family::AquaBorn);
    p2.actives = {ability("b", AbilityType::Active, 20)};

    FusionConfig config;
    config.maxActiveAbilities = 2;
    auto out = InheritanceResolver::inheritAbilities(p1, p2, config);
    EXPECT_EQ(ids(out.actives), (std::vector<std::string>{"b"}));
    ASSERT_TRUE(out.ultimate.has_value());
    EXPECT_EQ(out.ultimate->id, AbilityId("u"));
}

// ---------------------------------------------------------------------------
// Appearance
// ---------------------------------------------------------------------------

TEST(InheritanceResolverTest, AppearanceIsSeededAndMerged) {
    auto p1 = createStarter("pyro_kin_starter", CreatureId("x"), PlayerId("p"), 0).value();
    auto p2 = createStarter("aero_flight_starter", CreatureId("y"), PlayerId("p"), 0).value();
    MutationResult calm;

    mf::foundation::SeededRandom rngA(77);
    mf::foundation::SeededRandom rngB(77);
    auto a = InheritanceResolver::blendAppearance(p1, p2, Family::AeroFlight, nullptr, calm,
                                                  0x1234567890abcdefULL, rngA);
    auto b = InheritanceResolver::blendAppearance(p1, p2, Family::AeroFlight, nullptr, calm,
                                                  0x1234567890abcdefULL, rngB);

    EXPECT_EQ(a.colorMutation, "#123456");
    EXPECT_EQ(a.glowColor, "#7890ab");
    EXPECT_EQ(a.particleTag, "air");
    ASSERT_TRUE(a.genome.has_value());
    EXPECT_EQ(a.genome->baseForm, "falcon");
    EXPECT_EQ(a.genome->paletteSeed, "1234567890abcdef");
    EXPECT_GE(a.genome->sizeModifier, 0.9);
    EXPECT_LE(a.genome->sizeModifier, 1.1);
    EXPECT_EQ(a.visualTags.size(), 6u);
    EXPECT_EQ(a.genome->head, b.genome->head);
    EXPECT_EQ(a.genome->sizeModifier, b.genome->sizeModifier);
}

// ---------------------------------------------------------------------------
// Lineage
// ---------------------------------------------------------------------------

TEST(LineageAnalyzerTest, StarterHasNoAncestry) {
    auto c = createStarter("lumina_starter", CreatureId("x"), PlayerId("p"), 0).value();
    auto summary = LineageAnalyzer::summarize(c);
    EXPECT_EQ(summary.generation, 0);
    EXPECT_EQ(summary.ancestorCount, 0);
    EXPECT_FALSE(summary.dominantElement.has_value());
    EXPECT_EQ(summary.templateId, std::optional<std::string>("lumina_starter"));

    auto mods = LineageAnalyzer::modifiers(c);
    EXPECT_DOUBLE_EQ(mods.damageBoostPercent, 0.0);
    EXPECT_DOUBLE_EQ(mods.evasionPercent, 0.0);
}

TEST(LineageAnalyzerTest, ElementCountsDriveModifiers) {
    auto c = bare("x", Family::PyroKin);
    c.fusionHistory = {entry(1, Family::PyroKin, Family::AquaBorn, 1),
                       entry(2, Family::AquaBorn, Family::TerraForged, 2),
                       entry(3, Family::AquaBorn, Family::AquaBorn)};

    auto counts = LineageAnalyzer::ancestorElements(c);
    EXPECT_EQ(counts[static_cast<std::size_t>(Element::Water)], 4);
    EXPECT_EQ(counts[static_cast<std::size_t>(Element::Fire)], 1);

    auto mods = LineageAnalyzer::modifiers(c);
    EXPECT_DOUBLE_EQ(mods.damageBoostPercent, 2.0);
    EXPECT_DOUBLE_EQ(mods.healingBoostPercent, 7.0);
    EXPECT_DOUBLE_EQ(mods.defenseBoostPercent, 3.0);

    auto summary = LineageAnalyzer::summarize(c);
    EXPECT_EQ(summary.generation, 3);
    EXPECT_EQ(summary.ancestorCount, 6);
    EXPECT_EQ(summary.uniqueMutations, 3);
    EXPECT_EQ(summary.dominantElement, Element::Water);
}

TEST(LineageAnalyzerTest, ShadowEvasionIsCapped) {
    auto c = bare("x", Family::ShadowVeil);
    for (int32_t g = 1; g <= 10; ++g) {
        c.fusionHistory.push_back(entry(g, Family::ShadowVeil, Family::ShadowVeil));
    }
    auto mods = LineageAnalyzer::modifiers(c);
    EXPECT_DOUBLE_EQ(mods.evasionPercent, 15.0);
    // generation 10 counts as ancient
    EXPECT_DOUBLE_EQ(mods.damageBoostPercent, 10.0);
    EXPECT_DOUBLE_EQ(mods.defenseBoostPercent, 10.0);
}

TEST(LineageAnalyzerTest, DominantLightGrantsCrit) {
    auto c = bare("x", Family::Lumina);
    c.fusionHistory = {entry(1, Family::Lumina, Family::Lumina),
                       entry(2, Family::Lumina, Family::PyroKin)};
    auto mods = LineageAnalyzer::modifiers(c);
    EXPECT_DOUBLE_EQ(mods.critChancePercent, 5.0);
}
