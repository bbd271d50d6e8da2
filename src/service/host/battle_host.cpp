/// @file battle_host.cpp
/// @brief BattleHost implementation.

#include "mf/service/battle_host.hpp"

#include "mf/foundation/game_logger.hpp"

namespace mf::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameError notFound(const foundation::BattleId& id) {
    return GameError(ErrorCode::BattleNotFound, "no battle " + id.value());
}

MatchOutcome outcomeFor(combat::BattleWinner winner, combat::BattleTeam team) {
    if (winner == combat::BattleWinner::Draw) {
        return MatchOutcome::Draw;
    }
    bool team1Won = winner == combat::BattleWinner::Team1;
    return team1Won == (team == combat::BattleTeam::Team1) ? MatchOutcome::Win
                                                           : MatchOutcome::Loss;
}

}  // namespace

BattleHost::BattleHost(IRatingRepository& ratings, combat::CombatConfig combatConfig,
                       RatingConfig ratingConfig)
    : ratings_(ratings), combatConfig_(combatConfig), ratingConfig_(ratingConfig) {}

std::shared_ptr<BattleHost::Session> BattleHost::session(const foundation::BattleId& id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

GameResult<combat::Battle> BattleHost::startBattle(foundation::BattleId id,
                                                   const std::vector<game::Creature>& team1,
                                                   const std::vector<game::Creature>& team2,
                                                   uint64_t seed) {
    auto battle = combat::CombatResolver::createBattle(id, team1, team2, seed, combatConfig_);
    if (!battle) {
        return battle;
    }

    auto entry = std::make_shared<Session>();
    entry->battle = battle.value();

    std::lock_guard lock(mutex_);
    if (!sessions_.emplace(id, std::move(entry)).second) {
        return GameResult<combat::Battle>::err(
            GameError(ErrorCode::AlreadyExists, "battle already running: " + id.value()));
    }
    return battle;
}

GameResult<combat::Battle> BattleHost::submitAction(const foundation::BattleId& id,
                                                    const combat::CombatAction& action) {
    auto entry = session(id);
    if (!entry) {
        return GameResult<combat::Battle>::err(notFound(id));
    }
    std::lock_guard lock(entry->mutex);
    auto next = combat::CombatResolver::submitAction(entry->battle, action);
    if (next) {
        entry->battle = next.value();
    }
    return next;
}

GameResult<combat::Battle> BattleHost::autoStep(const foundation::BattleId& id) {
    auto entry = session(id);
    if (!entry) {
        return GameResult<combat::Battle>::err(notFound(id));
    }
    std::lock_guard lock(entry->mutex);
    auto action = combat::CombatResolver::suggestAction(entry->battle);
    auto next = combat::CombatResolver::submitAction(entry->battle, action);
    if (next) {
        entry->battle = next.value();
    }
    return next;
}

GameResult<combat::Battle> BattleHost::runToCompletion(const foundation::BattleId& id) {
    auto entry = session(id);
    if (!entry) {
        return GameResult<combat::Battle>::err(notFound(id));
    }
    std::lock_guard lock(entry->mutex);
    while (!entry->battle.complete) {
        auto action = combat::CombatResolver::suggestAction(entry->battle);
        auto next = combat::CombatResolver::submitAction(entry->battle, action);
        if (!next) {
            return next;
        }
        entry->battle = std::move(next).value();
    }
    return GameResult<combat::Battle>::ok(entry->battle);
}

GameResult<SettledRatings> BattleHost::settle(const foundation::BattleId& id,
                                              const foundation::PlayerId& team1Player,
                                              const foundation::PlayerId& team2Player,
                                              foundation::Timestamp timestamp) {
    auto entry = session(id);
    if (!entry) {
        return GameResult<SettledRatings>::err(notFound(id));
    }

    // Lock order: session, then ratings, then the session map.
    std::lock_guard lock(entry->mutex);
    {
        std::lock_guard mapLock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end() || it->second != entry) {
            return GameResult<SettledRatings>::err(notFound(id));
        }
    }
    if (!entry->battle.complete || !entry->battle.winner) {
        return GameResult<SettledRatings>::err(GameError(
            ErrorCode::InvalidArgument, "battle " + id.value() + " is still in progress"));
    }
    combat::BattleWinner winner = *entry->battle.winner;

    std::lock_guard ratingsLock(ratingsMutex_);

    auto load = [&](const foundation::PlayerId& player) {
        auto stored = ratings_.find(player);
        if (!stored) {
            return RatingUpdater::newRecord(player, ratingConfig_);
        }
        return RatingUpdater::applyDecay(*stored, timestamp, ratingConfig_);
    };
    RatingRecord before1 = load(team1Player);
    RatingRecord before2 = load(team2Player);

    auto after1 = RatingUpdater::applyMatch(before1, before2.rating,
                                            outcomeFor(winner, combat::BattleTeam::Team1), timestamp);
    if (!after1) {
        return GameResult<SettledRatings>::err(after1.error());
    }
    auto after2 = RatingUpdater::applyMatch(before2, before1.rating,
                                            outcomeFor(winner, combat::BattleTeam::Team2), timestamp);
    if (!after2) {
        return GameResult<SettledRatings>::err(after2.error());
    }

    ratings_.save(after1.value());
    ratings_.save(after2.value());
    {
        std::lock_guard mapLock(mutex_);
        sessions_.erase(id);
    }

    MF_LOG_INFO(foundation::LogCategory::Host,
                "settled battle " + id.value() + " (" + std::string(combat::toString(winner)) + ")");
    return GameResult<SettledRatings>::ok(
        SettledRatings{std::move(after1).value(), std::move(after2).value()});
}

std::optional<combat::Battle> BattleHost::snapshot(const foundation::BattleId& id) const {
    auto entry = session(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard lock(entry->mutex);
    return entry->battle;
}

std::size_t BattleHost::battleCount() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

}  // namespace mf::service
