#pragma once

/// @file fusion_signature.hpp
/// @brief Deterministic description of one fusion event.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mf/foundation/game_result.hpp"
#include "mf/foundation/game_serializer.hpp"
#include "mf/fusion/fusion_types.hpp"
#include "mf/fusion/lineage.hpp"
#include "mf/game/catalyst.hpp"
#include "mf/game/creature.hpp"
#include "mf/game/rule_tables.hpp"

namespace mf::fusion {

/// Snapshot of a parent as it entered the fusion.
struct ParentSignature {
    foundation::CreatureId id;
    std::string name;
    game::Family family = game::Family::PyroKin;
    game::Element element = game::Element::Fire;
    game::Rarity rarity = game::Rarity::Basic;
    int32_t generation = 0;
    game::StatBlock stats;
    std::vector<game::AbilitySummary> passives;
    std::vector<game::AbilitySummary> actives;
    std::optional<game::AbilitySummary> ultimate;
    std::vector<std::string> visualTags;
    std::string lore;
    std::vector<game::FusionHistoryEntry> fusionHistory;
    LineageSummary lineage;
};

/// Snapshot of a catalyst as it entered the fusion.
struct CatalystSignature {
    foundation::CatalystId id;
    game::StoneType type = game::StoneType::Ruby;
    int32_t tier = game::kMinCatalystTier;
    bool glitched = false;
    int32_t elementalPower = 0;
    std::map<game::StatAxis, int32_t> statBonus;
    std::optional<game::DomainSpec> domain;  ///< Set for tier-V catalysts.
};

/// Everything a fusion decided, in a form narrative and art generation can
/// consume. Identical inputs always produce an identical signature.
struct FusionSignature {
    int32_t schemaVersion = 0;
    std::string fusionSeed;  ///< 16-digit hex of seed.
    foundation::Timestamp timestamp = 0;
    foundation::PlayerId playerId;
    std::optional<std::string> intent;
    int32_t playerFusionCount = 0;
    int32_t generation = 1;

    ParentSignature parent1;
    ParentSignature parent2;
    CatalystSignature catalyst1;
    CatalystSignature catalyst2;

    RarityOutcome rarity;
    MutationResult mutation;
    game::StatBlock stats;
    game::Family family = game::Family::PyroKin;
    game::Element element = game::Element::Fire;
    std::vector<game::AbilitySummary> passives;
    std::vector<game::AbilitySummary> actives;
    std::optional<game::AbilitySummary> ultimate;
    std::vector<foundation::AbilityId> droppedAbilities;
    game::Appearance appearance;
    std::optional<game::ElementInteraction> interaction;
    std::vector<game::DomainSpec> domains;
    std::vector<std::string> familyThemes;

    // Not serialized.
    uint64_t seed = 0;
    InheritedAbilities abilities;
};

/// Fusion seed for the given inputs.
[[nodiscard]] uint64_t fusionSeedFor(const foundation::CreatureId& parent1,
                                     const foundation::CreatureId& parent2,
                                     const foundation::CatalystId& catalyst1,
                                     const foundation::CatalystId& catalyst2,
                                     foundation::Timestamp timestamp);

/// Builds fusion signatures.
///
/// Inputs are validated first: both parents and catalysts must be
/// structurally valid, ids must be distinct, and all four inputs must
/// belong to the requesting player.
class FusionSignatureBuilder {
public:
    explicit FusionSignatureBuilder(FusionConfig config = {});

    [[nodiscard]] foundation::GameResult<FusionSignature> build(
        const game::Creature& parent1, const game::Creature& parent2,
        const game::Catalyst& catalyst1, const game::Catalyst& catalyst2,
        const FusionRequest& request) const;

    [[nodiscard]] const FusionConfig& config() const noexcept { return config_; }

private:
    FusionConfig config_;
};

/// Canonical JSON rendering of a signature.
[[nodiscard]] std::string toJson(const FusionSignature& signature);

}  // namespace mf::fusion

MF_SERIALIZABLE(mf::fusion::ParentSignature, 1,
    field("id", &mf::fusion::ParentSignature::id),
    field("name", &mf::fusion::ParentSignature::name),
    field("family", &mf::fusion::ParentSignature::family),
    field("element", &mf::fusion::ParentSignature::element),
    field("rarity", &mf::fusion::ParentSignature::rarity),
    field("generation", &mf::fusion::ParentSignature::generation),
    field("stats", &mf::fusion::ParentSignature::stats),
    field("passives", &mf::fusion::ParentSignature::passives),
    field("actives", &mf::fusion::ParentSignature::actives),
    field("ultimate", &mf::fusion::ParentSignature::ultimate),
    field("visualTags", &mf::fusion::ParentSignature::visualTags),
    field("lore", &mf::fusion::ParentSignature::lore),
    field("fusionHistory", &mf::fusion::ParentSignature::fusionHistory),
    field("lineage", &mf::fusion::ParentSignature::lineage));

MF_SERIALIZABLE(mf::fusion::CatalystSignature, 1,
    field("id", &mf::fusion::CatalystSignature::id),
    field("type", &mf::fusion::CatalystSignature::type),
    field("tier", &mf::fusion::CatalystSignature::tier),
    field("glitched", &mf::fusion::CatalystSignature::glitched),
    field("elementalPower", &mf::fusion::CatalystSignature::elementalPower),
    field("statBonus", &mf::fusion::CatalystSignature::statBonus),
    field("domain", &mf::fusion::CatalystSignature::domain));

MF_SERIALIZABLE(mf::fusion::FusionSignature, 1,
    field("schemaVersion", &mf::fusion::FusionSignature::schemaVersion),
    field("fusionSeed", &mf::fusion::FusionSignature::fusionSeed),
    field("timestamp", &mf::fusion::FusionSignature::timestamp),
    field("playerId", &mf::fusion::FusionSignature::playerId),
    field("intent", &mf::fusion::FusionSignature::intent),
    field("playerFusionCount", &mf::fusion::FusionSignature::playerFusionCount),
    field("generation", &mf::fusion::FusionSignature::generation),
    field("parent1", &mf::fusion::FusionSignature::parent1),
    field("parent2", &mf::fusion::FusionSignature::parent2),
    field("catalyst1", &mf::fusion::FusionSignature::catalyst1),
    field("catalyst2", &mf::fusion::FusionSignature::catalyst2),
    field("rarity", &mf::fusion::FusionSignature::rarity),
    field("mutation", &mf::fusion::FusionSignature::mutation),
    field("stats", &mf::fusion::FusionSignature::stats),
    field("family", &mf::fusion::FusionSignature::family),
    field("element", &mf::fusion::FusionSignature::element),
    field("passives", &mf::fusion::FusionSignature::passives),
    field("actives", &mf::fusion::FusionSignature::actives),
    field("ultimate", &mf::fusion::FusionSignature::ultimate),
    field("droppedAbilities", &mf::fusion::FusionSignature::droppedAbilities),
    field("appearance", &mf::fusion::FusionSignature::appearance),
    field("interaction", &mf::fusion::FusionSignature::interaction),
    field("domains", &mf::fusion::FusionSignature::domains),
    field("familyThemes", &mf::fusion::FusionSignature::familyThemes));
