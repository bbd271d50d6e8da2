#pragma once

/// @file creature.hpp
/// @brief Long-lived creature entity and its value parts.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mf/foundation/game_result.hpp"
#include "mf/foundation/game_serializer.hpp"
#include "mf/foundation/types.hpp"
#include "mf/game/ability.hpp"
#include "mf/game/element_types.hpp"

namespace mf::game {

/// Non-negative base stats.
struct StatBlock {
    int32_t hp = 0;
    int32_t attack = 0;
    int32_t defense = 0;
    int32_t speed = 0;

    [[nodiscard]] int32_t get(StatAxis axis) const noexcept;
    void set(StatAxis axis, int32_t value) noexcept;

    bool operator==(const StatBlock&) const = default;
};

/// Structured body-part descriptors.
struct VisualGenome {
    std::string baseForm;
    std::string head;
    std::string torso;
    std::string limbs;
    std::optional<std::string> wings;
    std::optional<std::string> tail;
    std::vector<std::string> mutationTraits;
    std::string paletteSeed;
    double sizeModifier = 1.0;
};

struct Appearance {
    std::string colorMutation;  ///< "#rrggbb"
    std::string glowColor;      ///< "#rrggbb"
    std::string particleTag;
    std::vector<std::string> visualTags;
    std::optional<VisualGenome> genome;
};

/// One fusion step in a creature's lineage.
struct FusionHistoryEntry {
    int32_t generation = 1;
    foundation::CreatureId parent1Id;
    foundation::CreatureId parent2Id;
    Family parent1Family = Family::PyroKin;
    Family parent2Family = Family::PyroKin;
    foundation::CatalystId catalyst1Id;
    foundation::CatalystId catalyst2Id;
    StoneType catalyst1Type = StoneType::Ruby;
    StoneType catalyst2Type = StoneType::Ruby;
    int32_t catalyst1Tier = kMinCatalystTier;
    int32_t catalyst2Tier = kMinCatalystTier;
    std::string fusionSeed;
    int32_t mutationCount = 0;
    foundation::Timestamp timestamp = 0;
};

/// Rule-bending combat behaviour carried by a glitched fusion.
enum class GlitchClass : uint8_t {
    BypassSpecialist,  ///< Damage ignores the defender's defense.
    RealityDistorter,  ///< Single-enemy targets are redrawn among living enemies.
    ChaosEngine,       ///< Each hit is scaled by a seeded 0.5x-2.5x factor.
    SystemOverride     ///< Abilities cost no energy and start no cooldown.
};

inline constexpr std::size_t kGlitchClassCount = 4;

constexpr std::string_view toString(GlitchClass c) {
    switch (c) {
        case GlitchClass::BypassSpecialist: return "bypass_specialist";
        case GlitchClass::RealityDistorter: return "reality_distorter";
        case GlitchClass::ChaosEngine:      return "chaos_engine";
        case GlitchClass::SystemOverride:   return "system_override";
    }
    return "unknown";
}

inline constexpr int32_t kMinGlitchLevel = 1;
inline constexpr int32_t kMaxGlitchLevel = 5;

struct GlitchProfile {
    GlitchClass glitchClass = GlitchClass::BypassSpecialist;
    int32_t level = kMinGlitchLevel;  ///< 1-5, from the fusion's severity.
};

/// Battle-performance counters.
struct BattleRecord {
    int32_t wins = 0;
    int32_t losses = 0;
    int32_t draws = 0;
    int64_t damageDealt = 0;
};

/// A collectible creature.
///
/// A starter creature has an empty fusion history and a template id; a
/// fused creature has a non-empty history and no template id.
struct Creature {
    foundation::CreatureId id;
    foundation::PlayerId ownerId;
    std::string name;
    Family family = Family::PyroKin;
    Rarity rarity = Rarity::Basic;
    StatBlock stats;
    std::vector<Ability> passives;
    std::vector<Ability> actives;
    std::optional<Ability> ultimate;
    std::vector<FusionHistoryEntry> fusionHistory;
    Appearance appearance;
    std::optional<BattleRecord> battleRecord;
    std::optional<std::string> templateId;
    std::optional<GlitchProfile> glitch;  ///< Only fused creatures carry one.
    std::string lore;
    foundation::Timestamp createdAt = 0;

    /// Max generation across the fusion history, 0 when unfused.
    [[nodiscard]] int32_t generation() const noexcept;

    [[nodiscard]] bool isFused() const noexcept { return !fusionHistory.empty(); }

    [[nodiscard]] Element element() const noexcept { return familyElement(family); }

    /// Find an active or ultimate ability by id.
    [[nodiscard]] const Ability* findUsableAbility(const foundation::AbilityId& abilityId) const;
};

/// Check the structural invariants of a creature and all its abilities.
[[nodiscard]] foundation::GameResult<void> validateCreature(const Creature& creature);

}  // namespace mf::game

MF_SERIALIZABLE(mf::game::StatBlock, 1,
    field("hp", &mf::game::StatBlock::hp),
    field("attack", &mf::game::StatBlock::attack),
    field("defense", &mf::game::StatBlock::defense),
    field("speed", &mf::game::StatBlock::speed));

MF_SERIALIZABLE(mf::game::VisualGenome, 1,
    field("baseForm", &mf::game::VisualGenome::baseForm),
    field("head", &mf::game::VisualGenome::head),
    field("torso", &mf::game::VisualGenome::torso),
    field("limbs", &mf::game::VisualGenome::limbs),
    field("wings", &mf::game::VisualGenome::wings),
    field("tail", &mf::game::VisualGenome::tail),
    field("mutationTraits", &mf::game::VisualGenome::mutationTraits),
    field("paletteSeed", &mf::game::VisualGenome::paletteSeed),
    field("sizeModifier", &mf::game::VisualGenome::sizeModifier));

MF_SERIALIZABLE(mf::game::Appearance, 1,
    field("colorMutation", &mf::game::Appearance::colorMutation),
    field("glowColor", &mf::game::Appearance::glowColor),
    field("particleTag", &mf::game::Appearance::particleTag),
    field("visualTags", &mf::game::Appearance::visualTags),
    field("genome", &mf::game::Appearance::genome));

MF_SERIALIZABLE(mf::game::GlitchProfile, 1,
    field("glitchClass", &mf::game::GlitchProfile::glitchClass),
    field("level", &mf::game::GlitchProfile::level));

MF_SERIALIZABLE(mf::game::FusionHistoryEntry, 1,
    field("generation", &mf::game::FusionHistoryEntry::generation),
    field("parent1Id", &mf::game::FusionHistoryEntry::parent1Id),
    field("parent2Id", &mf::game::FusionHistoryEntry::parent2Id),
    field("parent1Family", &mf::game::FusionHistoryEntry::parent1Family),
    field("parent2Family", &mf::game::FusionHistoryEntry::parent2Family),
    field("catalyst1Id", &mf::game::FusionHistoryEntry::catalyst1Id),
    field("catalyst2Id", &mf::game::FusionHistoryEntry::catalyst2Id),
    field("catalyst1Type", &mf::game::FusionHistoryEntry::catalyst1Type),
    field("catalyst2Type", &mf::game::FusionHistoryEntry::catalyst2Type),
    field("catalyst1Tier", &mf::game::FusionHistoryEntry::catalyst1Tier),
    field("catalyst2Tier", &mf::game::FusionHistoryEntry::catalyst2Tier),
    field("fusionSeed", &mf::game::FusionHistoryEntry::fusionSeed),
    field("mutationCount", &mf::game::FusionHistoryEntry::mutationCount),
    field("timestamp", &mf::game::FusionHistoryEntry::timestamp));
