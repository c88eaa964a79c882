#pragma once

/// @file season_runner.hpp
/// @brief Drives both rating stores over a chronologically ordered stream
///        of games.
///
/// Handles the season boundary (one team reversion per new season), skips
/// games without a final score for both stores and feeds each side's
/// performance records to the player store.

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "sre/foundation/rating_result.hpp"
#include "sre/foundation/types.hpp"
#include "sre/rating/engine_config.hpp"
#include "sre/rating/player_rating_store.hpp"
#include "sre/rating/team_rating_store.hpp"

namespace sre::rating {

/// One game with the performance records of both sides.
struct GameRecord {
    GameOutcome outcome;
    std::vector<PlayerPerformance> homePerformances;
    std::vector<PlayerPerformance> awayPerformances;
};

/// Counters accumulated over the runner's lifetime.
struct RunSummary {
    uint64_t gamesProcessed = 0;
    uint64_t gamesSkipped = 0;
    uint64_t playerUpdates = 0;
    uint64_t seasonReversions = 0;
    uint64_t inactivityReversions = 0;  ///< Players reverted for inactivity.
};

/// Sequential driver for historical or weekly processing.
///
/// Precondition: games are fed in non-decreasing (season, week) order.
///
/// Example:
/// @code
///   TeamRatingStore teams(cfg.team);
///   PlayerRatingStore players(cfg.player);
///   SeasonRunner runner(teams, players, cfg.runner);
///   for (const auto& game : games) {
///       runner.process(game);
///   }
///   runner.persist("elo/team_history.csv", "elo/player_history.csv");
/// @endcode
class SeasonRunner {
public:
    SeasonRunner(TeamRatingStore& teams, PlayerRatingStore& players,
                 RunnerConfig config = {});

    /// Apply one game to both stores.
    /// @return false if the game was skipped.
    bool process(const GameRecord& game);

    /// Apply a batch of games in order.
    /// @return Number of games applied.
    std::size_t processAll(const std::vector<GameRecord>& games);

    /// Opponent unit strength on the player scale for a team rating:
    /// the team's distance from its base, re-based onto the player base.
    [[nodiscard]] double opponentStrength(double opponentTeamRating) const;

    /// Save both ledgers. Stops at the first failure.
    [[nodiscard]] foundation::RatingResult<void> persist(
        const std::filesystem::path& teamPath,
        const std::filesystem::path& playerPath) const;

    [[nodiscard]] const RunSummary& summary() const noexcept { return summary_; }

private:
    void advanceCalendar(foundation::SeasonWeek when);

    TeamRatingStore& teams_;
    PlayerRatingStore& players_;
    RunnerConfig config_;
    RunSummary summary_;
    std::optional<foundation::SeasonWeek> current_;
};

} // namespace sre::rating
