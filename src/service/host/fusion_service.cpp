/// @file fusion_service.cpp
/// @brief FusionService implementation.

#include "mf/service/fusion_service.hpp"

#include "mf/foundation/game_logger.hpp"

namespace mf::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

FusionService::FusionService(ICreatureRepository& creatures, ICatalystRepository& catalysts,
                             fusion::FusionConfig config)
    : creatures_(creatures), catalysts_(catalysts), engine_(config) {}

foundation::CreatureId FusionService::fusedCreatureId(const std::string& fusionSeed) {
    return foundation::CreatureId("fused-" + fusionSeed);
}

int32_t FusionService::fusionCount(const foundation::PlayerId& playerId) const {
    std::lock_guard lock(mutex_);
    auto it = fusionCounts_.find(playerId);
    return it == fusionCounts_.end() ? 0 : it->second;
}

GameResult<fusion::FusionOutcome> FusionService::fuse(const FusionOrder& order) {
    using Outcome = GameResult<fusion::FusionOutcome>;
    std::lock_guard fuseLock(fuseMutex_);

    auto parent1 = creatures_.findById(order.parent1);
    auto parent2 = creatures_.findById(order.parent2);
    if (!parent1 || !parent2) {
        const auto& missing = !parent1 ? order.parent1 : order.parent2;
        return Outcome::err(GameError(ErrorCode::NotFound, "creature not found: " + missing.value()));
    }
    auto catalyst1 = catalysts_.findById(order.catalyst1);
    auto catalyst2 = catalysts_.findById(order.catalyst2);
    if (!catalyst1 || !catalyst2) {
        const auto& missing = !catalyst1 ? order.catalyst1 : order.catalyst2;
        return Outcome::err(GameError(ErrorCode::NotFound, "catalyst not found: " + missing.value()));
    }

    fusion::FusionRequest request;
    request.playerId = order.playerId;
    request.timestamp = order.timestamp;
    request.playerFusionCount = fusionCount(order.playerId);
    request.intent = order.intent;

    auto signature = engine_.buildSignature(*parent1, *parent2, *catalyst1, *catalyst2, request);
    if (!signature) {
        return Outcome::err(signature.error());
    }

    auto newId = fusedCreatureId(signature.value().fusionSeed);
    if (creatures_.findById(newId)) {
        return Outcome::err(GameError(ErrorCode::AlreadyExists,
                                      "fusion already performed: " + newId.value()));
    }
    auto creature = fusion::FusionEngine::materialize(signature.value(), newId, order.name);
    if (!creature) {
        return Outcome::err(creature.error());
    }

    creatures_.save(creature.value());
    bool consumed = creatures_.remove(order.parent1);
    consumed = creatures_.remove(order.parent2) && consumed;
    consumed = catalysts_.remove(order.catalyst1) && consumed;
    consumed = catalysts_.remove(order.catalyst2) && consumed;
    if (!consumed) {
        MF_LOG_WARN(foundation::LogCategory::Host,
                    "fusion " + newId.value() + " inputs were removed concurrently");
    }
    {
        std::lock_guard lock(mutex_);
        ++fusionCounts_[order.playerId];
    }

    foundation::LogContext ctx;
    ctx.playerId = order.playerId;
    ctx.creatureId = newId;
    ctx.fusionSeed = signature.value().fusionSeed;
    foundation::GameLogger::instance().logWithContext(
        foundation::LogLevel::Info, foundation::LogCategory::Host, "fusion stored", ctx);

    return Outcome::ok(
        fusion::FusionOutcome{std::move(signature).value(), std::move(creature).value()});
}

}  // namespace mf::service
