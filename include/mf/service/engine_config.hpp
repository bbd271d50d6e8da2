#pragma once

/// @file engine_config.hpp
/// @brief Aggregated engine tunables and their YAML binding.

#include "mf/combat/combat_types.hpp"
#include "mf/foundation/config_manager.hpp"
#include "mf/foundation/game_result.hpp"
#include "mf/fusion/fusion_types.hpp"
#include "mf/service/rating_updater.hpp"

namespace mf::service {

/// Every tunable of the engine, defaulted to the shipped rules.
struct EngineConfig {
    fusion::FusionConfig fusion;
    combat::CombatConfig combat;
    RatingConfig rating;
};

/// Build an EngineConfig from loaded configuration.
///
/// Keys that are absent keep their defaults. A key holding the wrong type
/// fails with ConfigTypeMismatch, a value outside its valid range with
/// ConfigValueOutOfRange.
[[nodiscard]] foundation::GameResult<EngineConfig> loadEngineConfig(
    const foundation::ConfigManager& config);

/// Check the ranges of an already built configuration.
[[nodiscard]] foundation::GameResult<void> validateEngineConfig(const EngineConfig& config);

}  // namespace mf::service
