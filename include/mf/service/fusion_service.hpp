#pragma once

/// @file fusion_service.hpp
/// @brief Host-level fusion: load inputs, fuse, persist the result.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "mf/foundation/game_result.hpp"
#include "mf/fusion/fusion_engine.hpp"
#include "mf/service/repository.hpp"

namespace mf::service {

/// Ids of the inputs to one fusion.
struct FusionOrder {
    foundation::PlayerId playerId;
    foundation::CreatureId parent1;
    foundation::CreatureId parent2;
    foundation::CatalystId catalyst1;
    foundation::CatalystId catalyst2;
    foundation::Timestamp timestamp = 0;
    std::optional<std::string> intent;
    std::optional<std::string> name;
};

/// Runs fusions against the creature and catalyst stores.
///
/// On success the fused creature is saved and both parents and both
/// catalysts are removed from storage. On failure storage is untouched.
/// The service counts fusions per player to feed the glitch probability.
class FusionService {
public:
    FusionService(ICreatureRepository& creatures, ICatalystRepository& catalysts,
                  fusion::FusionConfig config = {});

    [[nodiscard]] foundation::GameResult<fusion::FusionOutcome> fuse(const FusionOrder& order);

    [[nodiscard]] int32_t fusionCount(const foundation::PlayerId& playerId) const;

    /// Id given to the creature fused under a seed.
    [[nodiscard]] static foundation::CreatureId fusedCreatureId(const std::string& fusionSeed);

private:
    ICreatureRepository& creatures_;
    ICatalystRepository& catalysts_;
    fusion::FusionEngine engine_;

    std::mutex fuseMutex_;  ///< Serializes fusions so inputs are consumed once.
    mutable std::mutex mutex_;
    std::unordered_map<foundation::PlayerId, int32_t> fusionCounts_;
};

}  // namespace mf::service
