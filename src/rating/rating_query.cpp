/// @file rating_query.cpp
/// @brief RatingQueryService implementation.

#include "sre/rating/rating_query.hpp"

#include <algorithm>

#include "sre/foundation/rating_logger.hpp"

namespace sre::rating {

using foundation::LogCategory;

namespace {

/// Sort by rating descending, id ascending, and keep the first @p limit.
void rankAndTrim(std::vector<RankedEntity>& rows, std::size_t limit) {
    std::sort(rows.begin(), rows.end(), [](const RankedEntity& a, const RankedEntity& b) {
        if (a.rating != b.rating) {
            return a.rating > b.rating;
        }
        return a.entityId < b.entityId;
    });
    if (rows.size() > limit) {
        rows.resize(limit);
    }
}

} // namespace

RatingQueryService::RatingQueryService(const TeamRatingStore& teams,
                                       const PlayerRatingStore& players)
    : teams_(teams), players_(players) {}

double RatingQueryService::teamRating(const std::string& teamId) const {
    return teams_.rating(teamId);
}

double RatingQueryService::playerRating(const std::string& playerId) const {
    return players_.rating(playerId);
}

MatchupProbability RatingQueryService::matchupProbability(const std::string& homeTeam,
                                                          const std::string& awayTeam,
                                                          bool neutralSite) const {
    return teams_.matchupProbability(homeTeam, awayTeam, neutralSite);
}

double RatingQueryService::teamAdjustment(const std::vector<RosterSlot>& roster) const {
    return players_.teamAdjustment(roster);
}

MatchupProbability RatingQueryService::adjustedMatchupProbability(
    const std::string& homeTeam, const std::string& awayTeam,
    const std::vector<RosterSlot>& homeRoster, const std::vector<RosterSlot>& awayRoster,
    bool neutralSite) const {
    double home = teams_.rating(homeTeam) + players_.teamAdjustment(homeRoster);
    double away = teams_.rating(awayTeam) + players_.teamAdjustment(awayRoster);
    SRE_LOG_DEBUG(LogCategory::Query,
                  "adjusted matchup " + homeTeam + " vs " + awayTeam + ": " +
                      std::to_string(home) + " / " + std::to_string(away));
    return teams_.probabilityFor(home, away, neutralSite);
}

std::vector<RankedEntity> RatingQueryService::topTeams(std::size_t limit) const {
    std::vector<RankedEntity> rows;
    for (const auto& [id, value] : teams_.ratings()) {
        RankedEntity row;
        row.entityId = id;
        row.rating = value;
        rows.push_back(std::move(row));
    }
    rankAndTrim(rows, limit);
    return rows;
}

std::vector<RankedEntity> RatingQueryService::topPlayers(
    std::size_t limit, std::optional<foundation::Position> position) const {
    std::vector<RankedEntity> rows;
    for (auto& entry : players_.entries()) {
        if (position && entry.info.position != *position) {
            continue;
        }
        rows.push_back({std::move(entry.playerId), entry.rating, entry.info.position,
                        entry.info.games});
    }
    rankAndTrim(rows, limit);
    return rows;
}

std::vector<RatingRecord> RatingQueryService::teamHistory(const std::string& teamId) const {
    return teams_.historyOf(teamId);
}

std::vector<RatingRecord> RatingQueryService::playerHistory(const std::string& playerId) const {
    return players_.historyOf(playerId);
}

} // namespace sre::rating
