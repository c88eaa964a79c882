/// @file season_runner.cpp
/// @brief SeasonRunner implementation.

#include "sre/rating/season_runner.hpp"

#include <string>

#include "sre/foundation/rating_logger.hpp"

namespace sre::rating {

using foundation::LogCategory;
using foundation::RatingResult;
using foundation::SeasonWeek;

SeasonRunner::SeasonRunner(TeamRatingStore& teams, PlayerRatingStore& players,
                           RunnerConfig config)
    : teams_(teams), players_(players), config_(config) {}

void SeasonRunner::advanceCalendar(SeasonWeek when) {
    if (current_ && *current_ == when) {
        return;
    }

    if (current_ && when.season != current_->season) {
        teams_.regressToMean(when.season);
        ++summary_.seasonReversions;
        SRE_LOG_INFO(LogCategory::Core, "season " + std::to_string(when.season) + " started");
    }
    if (config_.regressInactiveOnNewWeek) {
        summary_.inactivityReversions += players_.regressInactive(when.season, when.week);
    }
    current_ = when;
}

bool SeasonRunner::process(const GameRecord& game) {
    // The calendar moves even for skipped games so the season boundary is
    // detected on the first game of the season, played or not.
    advanceCalendar(game.outcome.when);

    auto update = teams_.apply(game.outcome);
    if (!update) {
        ++summary_.gamesSkipped;
        return false;
    }
    ++summary_.gamesProcessed;

    // Each side is rated against the other side's pre-game strength.
    summary_.playerUpdates += players_.applyPerformances(
        game.homePerformances, opponentStrength(update->awayBefore), game.outcome.when);
    summary_.playerUpdates += players_.applyPerformances(
        game.awayPerformances, opponentStrength(update->homeBefore), game.outcome.when);
    return true;
}

std::size_t SeasonRunner::processAll(const std::vector<GameRecord>& games) {
    std::size_t applied = 0;
    for (const auto& game : games) {
        if (process(game)) {
            ++applied;
        }
    }
    SRE_LOG_INFO(LogCategory::Core,
                 "processed " + std::to_string(applied) + " of " +
                     std::to_string(games.size()) + " games");
    return applied;
}

double SeasonRunner::opponentStrength(double opponentTeamRating) const {
    return players_.config().initialRating +
           (opponentTeamRating - teams_.config().initialRating);
}

RatingResult<void> SeasonRunner::persist(const std::filesystem::path& teamPath,
                                         const std::filesystem::path& playerPath) const {
    auto teamResult = teams_.saveHistory(teamPath);
    if (!teamResult) {
        SRE_LOG_ERROR(LogCategory::Ledger,
                      "failed to save team history: " +
                          std::string(teamResult.error().message()));
        return teamResult;
    }
    auto playerResult = players_.saveHistory(playerPath);
    if (!playerResult) {
        SRE_LOG_ERROR(LogCategory::Ledger,
                      "failed to save player history: " +
                          std::string(playerResult.error().message()));
    }
    return playerResult;
}

} // namespace sre::rating
