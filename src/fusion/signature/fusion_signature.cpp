/// @file fusion_signature.cpp
/// @brief FusionSignatureBuilder implementation.

#include "mf/fusion/fusion_signature.hpp"

#include <algorithm>
#include <string>

#include "mf/foundation/game_logger.hpp"
#include "mf/foundation/seeded_random.hpp"
#include "mf/fusion/inheritance_resolver.hpp"
#include "mf/fusion/mutation_resolver.hpp"
#include "mf/fusion/rarity_resolver.hpp"
#include "mf/version.hpp"

namespace mf::fusion {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using game::Catalyst;
using game::Creature;

namespace {

std::vector<game::AbilitySummary> summarizeAll(const std::vector<game::Ability>& abilities) {
    std::vector<game::AbilitySummary> out;
    out.reserve(abilities.size());
    for (const auto& ability : abilities) {
        out.push_back(game::summarizeAbility(ability));
    }
    return out;
}

ParentSignature snapshotParent(const Creature& creature) {
    ParentSignature out;
    out.id = creature.id;
    out.name = creature.name;
    out.family = creature.family;
    out.element = creature.element();
    out.rarity = creature.rarity;
    out.generation = creature.generation();
    out.stats = creature.stats;
    out.passives = summarizeAll(creature.passives);
    out.actives = summarizeAll(creature.actives);
    if (creature.ultimate) {
        out.ultimate = game::summarizeAbility(*creature.ultimate);
    }
    out.visualTags = creature.appearance.visualTags;
    out.lore = creature.lore;
    out.fusionHistory = creature.fusionHistory;
    out.lineage = LineageAnalyzer::summarize(creature);
    return out;
}

CatalystSignature snapshotCatalyst(const Catalyst& catalyst) {
    CatalystSignature out;
    out.id = catalyst.id;
    out.type = catalyst.type;
    out.tier = catalyst.tier;
    out.glitched = catalyst.glitched;
    out.elementalPower = catalyst.elementalPower;
    out.statBonus = catalyst.statBonus;
    if (catalyst.isDomainTier()) {
        out.domain = game::domainSpec(catalyst.type);
    }
    return out;
}

/// Parent with the larger blend weight; ties go to the higher rarity, then
/// to parent1.
game::Family dominantFamily(const Creature& parent1, const Creature& parent2) {
    auto [w1, w2] = StatRarityResolver::parentWeights(parent1, parent2);
    if (w1 != w2) {
        return w1 > w2 ? parent1.family : parent2.family;
    }
    return parent2.rarity > parent1.rarity ? parent2.family : parent1.family;
}

const game::ElementInteraction* resolveInteraction(const Creature& parent1,
                                                   const Creature& parent2,
                                                   const Catalyst& c1,
                                                   const Catalyst& c2) {
    if (const auto* hit = game::findInteraction(c1.element(), c2.element())) {
        return hit;
    }
    return game::findInteraction(parent1.element(), parent2.element());
}

GameResult<void> checkInputs(const Creature& parent1, const Creature& parent2,
                             const Catalyst& c1, const Catalyst& c2,
                             const FusionRequest& request) {
    for (const auto* parent : {&parent1, &parent2}) {
        auto valid = game::validateCreature(*parent);
        if (!valid) {
            return GameResult<void>::err(valid.error().wrap("fusion input"));
        }
    }
    for (const auto* catalyst : {&c1, &c2}) {
        auto valid = game::validateCatalyst(*catalyst);
        if (!valid) {
            return GameResult<void>::err(valid.error().wrap("fusion input"));
        }
    }
    if (parent1.id == parent2.id) {
        return GameResult<void>::err(GameError(
            ErrorCode::DuplicateFusionInput, "a creature cannot fuse with itself: " + parent1.id.value()));
    }
    if (c1.id == c2.id) {
        return GameResult<void>::err(GameError(
            ErrorCode::DuplicateFusionInput, "catalyst used twice: " + c1.id.value()));
    }
    if (parent1.ownerId != request.playerId || parent2.ownerId != request.playerId) {
        return GameResult<void>::err(GameError(
            ErrorCode::OwnershipViolation,
            "player " + request.playerId.value() + " does not own both parents"));
    }
    if (c1.ownerId != request.playerId || c2.ownerId != request.playerId) {
        return GameResult<void>::err(GameError(
            ErrorCode::OwnershipViolation,
            "player " + request.playerId.value() + " does not own both catalysts"));
    }
    return GameResult<void>::ok();
}

}  // namespace

uint64_t fusionSeedFor(const foundation::CreatureId& parent1,
                       const foundation::CreatureId& parent2,
                       const foundation::CatalystId& catalyst1,
                       const foundation::CatalystId& catalyst2,
                       foundation::Timestamp timestamp) {
    std::string ts = std::to_string(timestamp);
    return foundation::stableHash64(
        {parent1.value(), parent2.value(), catalyst1.value(), catalyst2.value(), ts});
}

FusionSignatureBuilder::FusionSignatureBuilder(FusionConfig config) : config_(config) {}

GameResult<FusionSignature> FusionSignatureBuilder::build(const Creature& parent1,
                                                          const Creature& parent2,
                                                          const Catalyst& catalyst1,
                                                          const Catalyst& catalyst2,
                                                          const FusionRequest& request) const {
    auto checked = checkInputs(parent1, parent2, catalyst1, catalyst2, request);
    if (!checked) {
        MF_LOG_WARN(foundation::LogCategory::Fusion,
                    "fusion rejected: " + std::string(checked.error().message()));
        return GameResult<FusionSignature>::err(checked.error());
    }

    FusionSignature sig;
    sig.schemaVersion = kSignatureSchemaVersion;
    sig.seed = fusionSeedFor(parent1.id, parent2.id, catalyst1.id, catalyst2.id,
                             request.timestamp);
    sig.fusionSeed = foundation::seedToHex(sig.seed);
    sig.timestamp = request.timestamp;
    sig.playerId = request.playerId;
    sig.intent = request.intent;
    sig.playerFusionCount = request.playerFusionCount;
    sig.generation = 1 + std::max(parent1.generation(), parent2.generation());

    sig.parent1 = snapshotParent(parent1);
    sig.parent2 = snapshotParent(parent2);
    sig.catalyst1 = snapshotCatalyst(catalyst1);
    sig.catalyst2 = snapshotCatalyst(catalyst2);

    foundation::SeededRandom rng(sig.seed);

    // Rarity consumes no draws; the glitch roll always comes next.
    sig.rarity = StatRarityResolver::resolveRarity(parent1, parent2, catalyst1, catalyst2);
    sig.mutation = MutationResolver::resolve(catalyst1, catalyst2, request.playerFusionCount,
                                             config_, rng);
    if (sig.mutation.glitched) {
        sig.mutation.glitch = MutationResolver::classify(sig.seed, sig.mutation.severity);
    }

    auto stats = StatRarityResolver::resolveStats(parent1, parent2, sig.rarity.finalRarity);
    sig.stats = StatRarityResolver::addCatalystBonuses(
        stats, MutationResolver::applyGlitch(catalyst1, sig.mutation),
        MutationResolver::applyGlitch(catalyst2, sig.mutation));

    sig.family = dominantFamily(parent1, parent2);
    sig.element = game::familyElement(sig.family);

    const auto* interaction = resolveInteraction(parent1, parent2, catalyst1, catalyst2);
    if (interaction != nullptr) {
        sig.interaction = *interaction;
    }

    sig.abilities = InheritanceResolver::inheritAbilities(parent1, parent2, config_);
    sig.passives = summarizeAll(sig.abilities.passives);
    sig.actives = summarizeAll(sig.abilities.actives);
    if (sig.abilities.ultimate) {
        sig.ultimate = game::summarizeAbility(*sig.abilities.ultimate);
    }
    sig.droppedAbilities = sig.abilities.dropped;

    sig.appearance = InheritanceResolver::blendAppearance(
        parent1, parent2, sig.family, interaction, sig.mutation, sig.seed, rng);

    if (catalyst1.isDomainTier() && catalyst2.isDomainTier()) {
        sig.domains.push_back(game::domainSpec(catalyst1.type));
        if (catalyst2.type != catalyst1.type) {
            sig.domains.push_back(game::domainSpec(catalyst2.type));
        }
    }

    sig.familyThemes = game::familyProfile(sig.family).paletteThemes;
    if (interaction != nullptr) {
        for (const auto& theme : interaction->abilityThemes) {
            if (std::find(sig.familyThemes.begin(), sig.familyThemes.end(), theme) ==
                sig.familyThemes.end()) {
                sig.familyThemes.push_back(theme);
            }
        }
    }

    foundation::LogContext ctx;
    ctx.playerId = request.playerId;
    ctx.fusionSeed = sig.fusionSeed;
    ctx.extra["rarity"] = std::string(game::toString(sig.rarity.finalRarity));
    ctx.extra["generation"] = std::to_string(sig.generation);
    foundation::GameLogger::instance().logWithContext(
        foundation::LogLevel::Debug, foundation::LogCategory::Fusion, "fusion signature built", ctx);
    return GameResult<FusionSignature>::ok(std::move(sig));
}

std::string toJson(const FusionSignature& signature) {
    return foundation::GameSerializer::instance().serializeJson(signature);
}

}  // namespace mf::fusion
