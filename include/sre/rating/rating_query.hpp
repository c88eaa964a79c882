#pragma once

/// @file rating_query.hpp
/// @brief Read-only access to both rating stores for feature builders and
///        inference pipelines.
///
/// Every call is a pure read taken under the owning store's shared lock,
/// so a query never observes a partially-applied update.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "sre/foundation/types.hpp"
#include "sre/rating/player_rating_store.hpp"
#include "sre/rating/rating_ledger.hpp"
#include "sre/rating/team_rating_store.hpp"

namespace sre::rating {

/// One leaderboard row.
struct RankedEntity {
    std::string entityId;
    double rating = 0.0;
    foundation::Position position = foundation::Position::Unknown;  ///< Players only.
    uint32_t games = 0;                                              ///< Players only.
};

/// Facade over a TeamRatingStore and a PlayerRatingStore.
///
/// Holds references; both stores must outlive the service.
///
/// Example:
/// @code
///   RatingQueryService query(teams, players);
///   auto p = query.adjustedMatchupProbability("KC", "BUF", kcRoster, bufRoster, false);
///   auto qbs = query.topPlayers(5, Position::QB);
/// @endcode
class RatingQueryService {
public:
    RatingQueryService(const TeamRatingStore& teams, const PlayerRatingStore& players);

    [[nodiscard]] double teamRating(const std::string& teamId) const;
    [[nodiscard]] double playerRating(const std::string& playerId) const;

    [[nodiscard]] MatchupProbability matchupProbability(const std::string& homeTeam,
                                                        const std::string& awayTeam,
                                                        bool neutralSite) const;

    [[nodiscard]] double teamAdjustment(const std::vector<RosterSlot>& roster) const;

    /// Matchup probability with each side's rating shifted by its roster's
    /// team adjustment.
    [[nodiscard]] MatchupProbability adjustedMatchupProbability(
        const std::string& homeTeam, const std::string& awayTeam,
        const std::vector<RosterSlot>& homeRoster,
        const std::vector<RosterSlot>& awayRoster, bool neutralSite) const;

    /// Highest-rated teams, rating descending then id ascending.
    [[nodiscard]] std::vector<RankedEntity> topTeams(std::size_t limit) const;

    /// Highest-rated players, optionally restricted to one position.
    [[nodiscard]] std::vector<RankedEntity> topPlayers(
        std::size_t limit, std::optional<foundation::Position> position = std::nullopt) const;

    /// Time series of one team's ratings.
    [[nodiscard]] std::vector<RatingRecord> teamHistory(const std::string& teamId) const;

    /// Time series of one player's ratings.
    [[nodiscard]] std::vector<RatingRecord> playerHistory(const std::string& playerId) const;

private:
    const TeamRatingStore& teams_;
    const PlayerRatingStore& players_;
};

} // namespace sre::rating
