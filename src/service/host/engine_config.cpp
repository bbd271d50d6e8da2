/// @file engine_config.cpp
/// @brief loadEngineConfig implementation.

#include "mf/service/engine_config.hpp"

#include <string>

#include "mf/foundation/game_logger.hpp"

namespace mf::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

/// Copy the value under key into target when present.
template <typename T>
GameResult<void> overrideFrom(const foundation::ConfigManager& config, std::string_view key,
                              T& target) {
    if (!config.hasKey(key)) {
        return GameResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    target = value.value();
    return GameResult<void>::ok();
}

GameResult<void> outOfRange(const std::string& what) {
    return GameResult<void>::err(GameError(ErrorCode::ConfigValueOutOfRange, what));
}

}  // namespace

GameResult<void> validateEngineConfig(const EngineConfig& config) {
    const auto& f = config.fusion;
    if (f.maxActiveAbilities < 2) {
        return outOfRange("fusion.max_active_abilities must be at least 2");
    }
    if (f.maxPassiveAbilities < 0) {
        return outOfRange("fusion.max_passive_abilities must not be negative");
    }
    if (f.glitchCapPercent < 0.0 || f.glitchCapPercent > 100.0) {
        return outOfRange("fusion.glitch_cap_percent must be within 0-100");
    }

    const auto& c = config.combat;
    if (c.maxRounds < 1) {
        return outOfRange("combat.max_rounds must be at least 1");
    }
    if (c.maxTeamSize < 1) {
        return outOfRange("combat.max_team_size must be at least 1");
    }
    if (c.maxEnergy < 0 || c.startingEnergy < 0 || c.energyRegen < 0) {
        return outOfRange("combat energy settings must not be negative");
    }
    if (c.critChance < 0.0 || c.critChance > 1.0) {
        return outOfRange("combat.crit_chance must be within 0-1");
    }
    if (c.critMultiplier < 1.0) {
        return outOfRange("combat.crit_multiplier must be at least 1");
    }

    const auto& r = config.rating;
    if (r.initialRating < 0 || r.decayFloor < 0 || r.decayAmount < 0) {
        return outOfRange("rating settings must not be negative");
    }
    if (r.inactivityDays < 1) {
        return outOfRange("rating.inactivity_days must be at least 1");
    }
    return GameResult<void>::ok();
}

GameResult<EngineConfig> loadEngineConfig(const foundation::ConfigManager& config) {
    EngineConfig cfg;

    for (const auto& step : {
             overrideFrom(config, "fusion.max_active_abilities", cfg.fusion.maxActiveAbilities),
             overrideFrom(config, "fusion.max_passive_abilities", cfg.fusion.maxPassiveAbilities),
             overrideFrom(config, "fusion.glitch_cap_percent", cfg.fusion.glitchCapPercent),
             overrideFrom(config, "combat.max_rounds", cfg.combat.maxRounds),
             overrideFrom(config, "combat.max_team_size", cfg.combat.maxTeamSize),
             overrideFrom(config, "combat.starting_energy", cfg.combat.startingEnergy),
             overrideFrom(config, "combat.max_energy", cfg.combat.maxEnergy),
             overrideFrom(config, "combat.energy_regen", cfg.combat.energyRegen),
             overrideFrom(config, "combat.crit_chance", cfg.combat.critChance),
             overrideFrom(config, "combat.crit_multiplier", cfg.combat.critMultiplier),
             overrideFrom(config, "rating.initial_rating", cfg.rating.initialRating),
             overrideFrom(config, "rating.inactivity_days", cfg.rating.inactivityDays),
             overrideFrom(config, "rating.decay_amount", cfg.rating.decayAmount),
             overrideFrom(config, "rating.decay_floor", cfg.rating.decayFloor),
         }) {
        if (!step) {
            MF_LOG_ERROR(foundation::LogCategory::Config,
                         "engine config rejected: " + std::string(step.error().message()));
            return GameResult<EngineConfig>::err(step.error());
        }
    }

    auto valid = validateEngineConfig(cfg);
    if (!valid) {
        MF_LOG_ERROR(foundation::LogCategory::Config,
                     "engine config rejected: " + std::string(valid.error().message()));
        return GameResult<EngineConfig>::err(valid.error());
    }

    MF_LOG_INFO(foundation::LogCategory::Config,
                "engine config loaded (max_rounds=" + std::to_string(cfg.combat.maxRounds) +
                    ", glitch_cap=" + std::to_string(cfg.fusion.glitchCapPercent) + ")");
    return GameResult<EngineConfig>::ok(cfg);
}

}  // namespace mf::service
