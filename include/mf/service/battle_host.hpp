#pragma once

/// @file battle_host.hpp
/// @brief Owns live battles and serializes actions per battle.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mf/combat/combat_resolver.hpp"
#include "mf/foundation/game_result.hpp"
#include "mf/service/repository.hpp"

namespace mf::service {

/// Rating records of both players after a settled battle.
struct SettledRatings {
    RatingRecord team1;
    RatingRecord team2;
};

/// Match host for battles.
///
/// Each battle is guarded by its own mutex, so at most one action is in
/// flight per battle while different battles proceed in parallel.
///
/// Example:
/// @code
///   BattleHost host(ratings, config.combat, config.rating);
///   auto started = host.startBattle(BattleId("b-1"), mine, theirs, seed);
///   auto state = host.submitAction(BattleId("b-1"), action);
/// @endcode
class BattleHost {
public:
    BattleHost(IRatingRepository& ratings, combat::CombatConfig combatConfig = {},
               RatingConfig ratingConfig = {});

    /// Create and register a battle. Fails with AlreadyExists for a live id.
    [[nodiscard]] foundation::GameResult<combat::Battle> startBattle(
        foundation::BattleId id, const std::vector<game::Creature>& team1,
        const std::vector<game::Creature>& team2, uint64_t seed);

    /// Apply one action. Fails with BattleNotFound for an unknown id, or with
    /// the resolver's error, in which case the battle is unchanged.
    [[nodiscard]] foundation::GameResult<combat::Battle> submitAction(
        const foundation::BattleId& id, const combat::CombatAction& action);

    /// Submit the resolver's suggested action for the current actor.
    [[nodiscard]] foundation::GameResult<combat::Battle> autoStep(const foundation::BattleId& id);

    /// Auto-step until the battle completes.
    [[nodiscard]] foundation::GameResult<combat::Battle> runToCompletion(
        const foundation::BattleId& id);

    /// Apply a completed battle's outcome to both players' ratings and
    /// drop the battle from the host. A battle settles at most once; a
    /// second call fails with BattleNotFound. Rating updates from this host
    /// are serialized, so battles sharing a player never lose an update.
    [[nodiscard]] foundation::GameResult<SettledRatings> settle(
        const foundation::BattleId& id, const foundation::PlayerId& team1Player,
        const foundation::PlayerId& team2Player, foundation::Timestamp timestamp);

    [[nodiscard]] std::optional<combat::Battle> snapshot(const foundation::BattleId& id) const;

    [[nodiscard]] std::size_t battleCount() const;

private:
    struct Session {
        std::mutex mutex;
        combat::Battle battle;
    };

    [[nodiscard]] std::shared_ptr<Session> session(const foundation::BattleId& id) const;

    IRatingRepository& ratings_;
    combat::CombatConfig combatConfig_;
    RatingConfig ratingConfig_;

    std::mutex ratingsMutex_;  ///< Held across rating load, apply and save.

    mutable std::mutex mutex_;
    std::unordered_map<foundation::BattleId, std::shared_ptr<Session>> sessions_;
};

}  // namespace mf::service
