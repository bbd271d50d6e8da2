/// @file rating_updater.cpp
/// @brief RatingUpdater implementation.

#include "mf/service/rating_updater.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "mf/foundation/game_logger.hpp"

namespace mf::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

std::string_view toString(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::Win:  return "win";
        case MatchOutcome::Loss: return "loss";
        case MatchOutcome::Draw: return "draw";
    }
    return "unknown";
}

std::string_view toString(Division division) {
    switch (division) {
        case Division::Bronze:   return "bronze";
        case Division::Silver:   return "silver";
        case Division::Gold:     return "gold";
        case Division::Platinum: return "platinum";
        case Division::Diamond:  return "diamond";
    }
    return "unknown";
}

int32_t RatingUpdater::kFactor(int32_t matchesPlayed) noexcept {
    if (matchesPlayed < 10) {
        return 40;  // Provisional: converge quickly.
    }
    if (matchesPlayed <= 100) {
        return 32;
    }
    return 24;  // Veteran.
}

double RatingUpdater::expectedScore(int32_t rating, int32_t opponentRating) {
    double exponent = static_cast<double>(opponentRating - rating) / 400.0;
    return 1.0 / (1.0 + std::pow(10.0, exponent));
}

int32_t RatingUpdater::updateRating(int32_t currentRating, int32_t opponentRating,
                                    int32_t matchesPlayed, bool won) {
    return updateRating(currentRating, opponentRating, matchesPlayed,
                        won ? MatchOutcome::Win : MatchOutcome::Loss);
}

int32_t RatingUpdater::updateRating(int32_t currentRating, int32_t opponentRating,
                                    int32_t matchesPlayed, MatchOutcome outcome) {
    double actual = 0.0;
    if (outcome == MatchOutcome::Win) {
        actual = 1.0;
    } else if (outcome == MatchOutcome::Draw) {
        actual = 0.5;
    }
    double delta = kFactor(matchesPlayed) * (actual - expectedScore(currentRating, opponentRating));
    return static_cast<int32_t>(std::lround(delta));
}

Division RatingUpdater::divisionFor(int32_t rating) noexcept {
    if (rating < 1000) {
        return Division::Bronze;
    }
    if (rating < 2000) {
        return Division::Silver;
    }
    if (rating < 3000) {
        return Division::Gold;
    }
    if (rating < 4000) {
        return Division::Platinum;
    }
    return Division::Diamond;
}

RatingRecord RatingUpdater::newRecord(foundation::PlayerId playerId, const RatingConfig& config) {
    RatingRecord record;
    record.playerId = std::move(playerId);
    record.rating = config.initialRating;
    return record;
}

GameResult<void> RatingUpdater::validate(const RatingRecord& record) {
    if (!record.playerId.isValid()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidRatingRecord, "rating record has no player id"));
    }
    if (record.rating < 0 || record.wins < 0 || record.losses < 0 || record.draws < 0 ||
        record.winStreak < 0 || record.bestWinStreak < record.winStreak) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidRatingRecord,
            "rating record for " + record.playerId.value() + " has negative or inconsistent counters"));
    }
    return GameResult<void>::ok();
}

GameResult<RatingRecord> RatingUpdater::applyMatch(const RatingRecord& record,
                                                   int32_t opponentRating, MatchOutcome outcome,
                                                   foundation::Timestamp timestamp) {
    auto valid = validate(record);
    if (!valid) {
        return GameResult<RatingRecord>::err(valid.error());
    }

    int32_t delta = updateRating(record.rating, opponentRating, record.matchesPlayed(), outcome);

    RatingRecord next = record;
    next.rating = std::max(0, record.rating + delta);
    switch (outcome) {
        case MatchOutcome::Win:
            ++next.wins;
            ++next.winStreak;
            next.bestWinStreak = std::max(next.bestWinStreak, next.winStreak);
            break;
        case MatchOutcome::Loss:
            ++next.losses;
            next.winStreak = 0;
            break;
        case MatchOutcome::Draw:
            ++next.draws;
            next.winStreak = 0;
            break;
    }
    next.lastMatchAt = timestamp;

    foundation::LogContext ctx;
    ctx.playerId = next.playerId;
    ctx.extra["outcome"] = std::string(toString(outcome));
    ctx.extra["delta"] = std::to_string(next.rating - record.rating);
    ctx.extra["division"] = std::string(toString(divisionFor(next.rating)));
    foundation::GameLogger::instance().logWithContext(
        foundation::LogLevel::Info, foundation::LogCategory::Rating,
        "rating " + std::to_string(record.rating) + " -> " + std::to_string(next.rating), ctx);
    return GameResult<RatingRecord>::ok(std::move(next));
}

RatingRecord RatingUpdater::applyDecay(const RatingRecord& record, foundation::Timestamp now,
                                       const RatingConfig& config) {
    if (record.rating <= config.decayFloor || config.inactivityDays <= 0) {
        return record;
    }
    int64_t window = static_cast<int64_t>(config.inactivityDays) * kMillisPerDay;
    foundation::Timestamp anchor = std::max(record.lastMatchAt, record.lastDecayAt);
    int64_t elapsed = now - anchor;
    if (elapsed <= window) {
        return record;
    }

    int64_t windows = elapsed / window;
    int64_t loss = windows * config.decayAmount;
    RatingRecord next = record;
    next.rating = static_cast<int32_t>(
        std::max<int64_t>(config.decayFloor, static_cast<int64_t>(record.rating) - loss));
    next.lastDecayAt = anchor + windows * window;

    MF_LOG_INFO(foundation::LogCategory::Rating,
                "decayed " + record.playerId.value() + " " + std::to_string(record.rating) +
                    " -> " + std::to_string(next.rating));
    return next;
}

}  // namespace mf::service
