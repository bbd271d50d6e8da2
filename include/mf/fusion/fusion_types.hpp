#pragma once

/// @file fusion_types.hpp
/// @brief Tunables, requests and intermediate results of the fusion pipeline.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mf/foundation/game_serializer.hpp"
#include "mf/foundation/types.hpp"
#include "mf/game/ability.hpp"
#include "mf/game/creature.hpp"
#include "mf/game/element_types.hpp"

namespace mf::fusion {

/// Fusion tunables (see config key prefix "fusion.").
struct FusionConfig {
    int32_t maxActiveAbilities = 4;   ///< Ultimate included.
    int32_t maxPassiveAbilities = 5;
    double glitchCapPercent = 15.0;
};

/// Caller-supplied context of one fusion event.
struct FusionRequest {
    foundation::PlayerId playerId;
    foundation::Timestamp timestamp = 0;
    int32_t playerFusionCount = 0;   ///< Fusions the player performed before this one.
    std::optional<std::string> intent;  ///< Free-form hint for narrative generation.
};

/// Stat & rarity resolver output for the rarity half.
struct RarityOutcome {
    game::Rarity baseRarity = game::Rarity::Basic;
    game::Rarity finalRarity = game::Rarity::Basic;
    int32_t promotion = 0;
    int32_t escalationScore = 0;
};

enum class GlitchSeverity : uint8_t { None, Low, Medium, High, Extreme };

std::string_view toString(GlitchSeverity severity);

/// Mutation & glitch resolver output.
struct MutationResult {
    double probabilityPercent = 0.0;
    double roll = 0.0;              ///< Percent draw compared against the probability.
    bool guaranteed = false;        ///< Glitched catalysts or a glitch stone pair.
    bool glitched = false;
    int32_t severity = 0;           ///< 0-100, 0 when not glitched.
    GlitchSeverity level = GlitchSeverity::None;
    double multiplier = 1.0;
    int32_t mutationCount = 0;
    std::vector<std::string> traits;
    int32_t effectiveElementalPower = 0;
    std::optional<game::GlitchProfile> glitch;  ///< Set when glitched.
};

/// Ability set chosen for a fused creature.
struct InheritedAbilities {
    std::vector<game::Ability> passives;
    std::vector<game::Ability> actives;
    std::optional<game::Ability> ultimate;
    std::vector<foundation::AbilityId> dropped;
};

}  // namespace mf::fusion

MF_SERIALIZABLE(mf::fusion::RarityOutcome, 1,
    field("baseRarity", &mf::fusion::RarityOutcome::baseRarity),
    field("finalRarity", &mf::fusion::RarityOutcome::finalRarity),
    field("promotion", &mf::fusion::RarityOutcome::promotion),
    field("escalationScore", &mf::fusion::RarityOutcome::escalationScore));

MF_SERIALIZABLE(mf::fusion::MutationResult, 1,
    field("probabilityPercent", &mf::fusion::MutationResult::probabilityPercent),
    field("roll", &mf::fusion::MutationResult::roll),
    field("guaranteed", &mf::fusion::MutationResult::guaranteed),
    field("glitched", &mf::fusion::MutationResult::glitched),
    field("severity", &mf::fusion::MutationResult::severity),
    field("level", &mf::fusion::MutationResult::level),
    field("multiplier", &mf::fusion::MutationResult::multiplier),
    field("mutationCount", &mf::fusion::MutationResult::mutationCount),
    field("traits", &mf::fusion::MutationResult::traits),
    field("effectiveElementalPower", &mf::fusion::MutationResult::effectiveElementalPower),
    field("glitch", &mf::fusion::MutationResult::glitch));
