#pragma once

/// @file rating_updater.hpp
/// @brief Elo-style rating updates, division buckets and inactivity decay.

#include <cstdint>
#include <string_view>

#include "mf/foundation/game_result.hpp"
#include "mf/foundation/game_serializer.hpp"
#include "mf/foundation/types.hpp"

namespace mf::service {

/// Rating tunables (see config key prefix "rating.").
struct RatingConfig {
    int32_t initialRating = 1000;
    int32_t inactivityDays = 7;
    int32_t decayAmount = 25;
    int32_t decayFloor = 1000;
};

enum class MatchOutcome : uint8_t { Win, Loss, Draw };

enum class Division : uint8_t { Bronze, Silver, Gold, Platinum, Diamond };

std::string_view toString(MatchOutcome outcome);
std::string_view toString(Division division);

/// Per-player rating state. Only the rating updater produces new values.
struct RatingRecord {
    foundation::PlayerId playerId;
    int32_t rating = 1000;
    int32_t wins = 0;
    int32_t losses = 0;
    int32_t draws = 0;
    int32_t winStreak = 0;
    int32_t bestWinStreak = 0;
    foundation::Timestamp lastMatchAt = 0;
    foundation::Timestamp lastDecayAt = 0;

    [[nodiscard]] int32_t matchesPlayed() const noexcept { return wins + losses + draws; }
};

/// Static utility for rating math.
///
/// Uses the standard Elo formula:
///   E(A) = 1 / (1 + 10^((R_B - R_A) / 400))
///
/// The K-factor steps down as a player's record grows: 40 below ten
/// matches, 32 up to one hundred, 24 after that.
class RatingUpdater {
public:
    RatingUpdater() = delete;

    static constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

    [[nodiscard]] static int32_t kFactor(int32_t matchesPlayed) noexcept;

    /// Expected score of a player against an opponent, in [0, 1].
    [[nodiscard]] static double expectedScore(int32_t rating, int32_t opponentRating);

    /// Rating delta for a win or a loss.
    [[nodiscard]] static int32_t updateRating(int32_t currentRating, int32_t opponentRating,
                                              int32_t matchesPlayed, bool won);

    /// Rating delta for any outcome (a draw scores 0.5).
    [[nodiscard]] static int32_t updateRating(int32_t currentRating, int32_t opponentRating,
                                              int32_t matchesPlayed, MatchOutcome outcome);

    [[nodiscard]] static Division divisionFor(int32_t rating) noexcept;

    /// Fresh record at the configured initial rating.
    [[nodiscard]] static RatingRecord newRecord(foundation::PlayerId playerId,
                                                const RatingConfig& config = {});

    /// Record after one finished match: rating floored at zero, counters
    /// and streaks updated.
    [[nodiscard]] static foundation::GameResult<RatingRecord> applyMatch(
        const RatingRecord& record, int32_t opponentRating, MatchOutcome outcome,
        foundation::Timestamp timestamp);

    /// Record after inactivity decay at time now. Each full inactivity
    /// window since the later of the last match and the last decay costs
    /// decayAmount, never going below decayFloor.
    [[nodiscard]] static RatingRecord applyDecay(const RatingRecord& record,
                                                 foundation::Timestamp now,
                                                 const RatingConfig& config = {});

    [[nodiscard]] static foundation::GameResult<void> validate(const RatingRecord& record);
};

}  // namespace mf::service

MF_SERIALIZABLE(mf::service::RatingRecord, 1,
    field("playerId", &mf::service::RatingRecord::playerId),
    field("rating", &mf::service::RatingRecord::rating),
    field("wins", &mf::service::RatingRecord::wins),
    field("losses", &mf::service::RatingRecord::losses),
    field("draws", &mf::service::RatingRecord::draws),
    field("winStreak", &mf::service::RatingRecord::winStreak),
    field("bestWinStreak", &mf::service::RatingRecord::bestWinStreak),
    field("lastMatchAt", &mf::service::RatingRecord::lastMatchAt),
    field("lastDecayAt", &mf::service::RatingRecord::lastDecayAt));
