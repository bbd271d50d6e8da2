/// @file fusion_engine.cpp
/// @brief FusionEngine implementation.

#include "mf/fusion/fusion_engine.hpp"

#include <cctype>

#include "mf/foundation/game_logger.hpp"

namespace mf::fusion {

using foundation::GameResult;
using game::Creature;

namespace {

std::string capitalized(std::string word) {
    if (!word.empty()) {
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    }
    return word;
}

std::string defaultLore(const FusionSignature& sig) {
    std::string lore = "Fused from " + sig.parent1.name + " and " + sig.parent2.name +
                       " with " + std::string(game::toString(sig.catalyst1.type)) + " " +
                       game::tierNumeral(sig.catalyst1.tier) + " and " +
                       std::string(game::toString(sig.catalyst2.type)) + " " +
                       game::tierNumeral(sig.catalyst2.tier) + ".";
    if (sig.interaction) {
        lore += " " + sig.interaction->description;
    }
    if (sig.mutation.glitch) {
        lore += " The fusion glitched (" + std::string(toString(sig.mutation.level)) + ", " +
                std::string(game::toString(sig.mutation.glitch->glitchClass)) + ").";
    }
    return lore;
}

game::FusionHistoryEntry historyEntryFor(const FusionSignature& sig) {
    game::FusionHistoryEntry entry;
    entry.generation = sig.generation;
    entry.parent1Id = sig.parent1.id;
    entry.parent2Id = sig.parent2.id;
    entry.parent1Family = sig.parent1.family;
    entry.parent2Family = sig.parent2.family;
    entry.catalyst1Id = sig.catalyst1.id;
    entry.catalyst2Id = sig.catalyst2.id;
    entry.catalyst1Type = sig.catalyst1.type;
    entry.catalyst2Type = sig.catalyst2.type;
    entry.catalyst1Tier = sig.catalyst1.tier;
    entry.catalyst2Tier = sig.catalyst2.tier;
    entry.fusionSeed = sig.fusionSeed;
    entry.mutationCount = sig.mutation.mutationCount;
    entry.timestamp = sig.timestamp;
    return entry;
}

}  // namespace

FusionEngine::FusionEngine(FusionConfig config) : builder_(config) {}

GameResult<FusionSignature> FusionEngine::buildSignature(const Creature& parent1,
                                                         const Creature& parent2,
                                                         const game::Catalyst& catalyst1,
                                                         const game::Catalyst& catalyst2,
                                                         const FusionRequest& request) const {
    return builder_.build(parent1, parent2, catalyst1, catalyst2, request);
}

std::string FusionEngine::defaultName(const FusionSignature& signature) {
    std::string base = signature.appearance.genome
                           ? signature.appearance.genome->baseForm
                           : game::familyProfile(signature.family).defaultGenome.baseForm;
    if (!signature.interaction || signature.interaction->namePrefixes.empty()) {
        return capitalized(base);
    }
    const auto& prefixes = signature.interaction->namePrefixes;
    const auto& prefix = prefixes[signature.seed % prefixes.size()];
    return prefix + " " + capitalized(base);
}

GameResult<Creature> FusionEngine::materialize(const FusionSignature& signature,
                                               foundation::CreatureId newCreatureId,
                                               std::optional<std::string> name,
                                               std::string lore) {
    Creature creature;
    creature.id = std::move(newCreatureId);
    creature.ownerId = signature.playerId;
    creature.name = name ? std::move(*name) : defaultName(signature);
    creature.family = signature.family;
    creature.rarity = signature.rarity.finalRarity;
    creature.stats = signature.stats;
    creature.passives = signature.abilities.passives;
    creature.actives = signature.abilities.actives;
    creature.ultimate = signature.abilities.ultimate;
    creature.glitch = signature.mutation.glitch;

    creature.fusionHistory = signature.parent1.fusionHistory;
    creature.fusionHistory.insert(creature.fusionHistory.end(),
                                  signature.parent2.fusionHistory.begin(),
                                  signature.parent2.fusionHistory.end());
    creature.fusionHistory.push_back(historyEntryFor(signature));

    creature.appearance = signature.appearance;
    creature.lore = lore.empty() ? defaultLore(signature) : std::move(lore);
    creature.createdAt = signature.timestamp;

    auto valid = game::validateCreature(creature);
    if (!valid) {
        return GameResult<Creature>::err(valid.error().wrap("materialize"));
    }

    foundation::LogContext ctx;
    ctx.creatureId = creature.id;
    ctx.playerId = creature.ownerId;
    ctx.fusionSeed = signature.fusionSeed;
    ctx.extra["rarity"] = std::string(game::toString(creature.rarity));
    ctx.extra["generation"] = std::to_string(creature.generation());
    foundation::GameLogger::instance().logWithContext(
        foundation::LogLevel::Info, foundation::LogCategory::Fusion,
        "fused " + creature.name, ctx);
    return GameResult<Creature>::ok(std::move(creature));
}

GameResult<FusionOutcome> FusionEngine::fuse(const Creature& parent1, const Creature& parent2,
                                             const game::Catalyst& catalyst1,
                                             const game::Catalyst& catalyst2,
                                             const FusionRequest& request,
                                             foundation::CreatureId newCreatureId) const {
    auto sig = buildSignature(parent1, parent2, catalyst1, catalyst2, request);
    if (!sig) {
        return GameResult<FusionOutcome>::err(sig.error());
    }
    auto creature = materialize(sig.value(), std::move(newCreatureId));
    if (!creature) {
        return GameResult<FusionOutcome>::err(creature.error());
    }
    return GameResult<FusionOutcome>::ok(
        FusionOutcome{std::move(sig).value(), std::move(creature).value()});
}

}  // namespace mf::fusion
