#pragma once

/// @file team_rating_store.hpp
/// @brief Elo ratings per team with home advantage, margin-of-victory
///        scaling, playoff weighting and between-season reversion.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sre/foundation/rating_result.hpp"
#include "sre/foundation/types.hpp"
#include "sre/rating/engine_config.hpp"
#include "sre/rating/rating_ledger.hpp"

namespace sre::rating {

/// A finalized (or abandoned) game as delivered by the ingestion feed.
struct GameOutcome {
    std::string homeTeam;
    std::string awayTeam;
    std::optional<int32_t> homeScore;  ///< Missing score means the game is skipped.
    std::optional<int32_t> awayScore;
    foundation::SeasonWeek when;
    bool isPlayoff = false;
};

/// Win probabilities for a matchup. home + away == 1.
struct MatchupProbability {
    double home = 0.5;
    double away = 0.5;
};

/// Everything one applied game changed.
struct TeamGameUpdate {
    double homeBefore = 0.0;
    double awayBefore = 0.0;
    double homeAfter = 0.0;
    double awayAfter = 0.0;
    double homeExpected = 0.5;  ///< Home win expectation including home advantage.
    double homeDelta = 0.0;     ///< The away delta is exactly -homeDelta.
};

/// Live team ratings backed by an append-only ledger.
///
/// Unknown teams read as the base rating and are created on first update.
/// Games must be fed in non-decreasing (season, week) order; games within
/// one week may arrive in any order.
///
/// Thread-safe: one writer at a time (update, reversion, restore), any
/// number of concurrent readers. Readers never see half of a game applied.
///
/// Example:
/// @code
///   TeamRatingStore teams(config.team);
///   teams.initialize({"KC", "BUF"});
///   auto [kc, buf] = teams.update("KC", "BUF", 27, 24, 2024, 1, false);
///   auto p = teams.matchupProbability("BUF", "KC", false);
/// @endcode
class TeamRatingStore {
public:
    explicit TeamRatingStore(TeamRatingConfig config = {});

    TeamRatingStore(const TeamRatingStore&) = delete;
    TeamRatingStore& operator=(const TeamRatingStore&) = delete;

    /// Give every listed team the base rating unless it already has one.
    void initialize(const std::vector<std::string>& teamIds);

    /// Current rating, or the base rating for a team never seen.
    [[nodiscard]] double rating(const std::string& teamId) const;

    /// Apply one game result.
    ///
    /// Precondition: both scores are non-negative.
    ///
    /// The home advantage only shifts the expectation; the stored deltas are
    /// exactly opposite, so the pair of ratings is zero-sum per game. A tie
    /// changes nothing because the margin multiplier is ln(1) = 0. Two
    /// ledger records are appended for (season, week).
    ///
    /// @return {new home rating, new away rating}
    std::pair<double, double> update(const std::string& homeTeam,
                                     const std::string& awayTeam,
                                     int32_t homeScore, int32_t awayScore,
                                     int32_t season, int32_t week,
                                     bool isPlayoff);

    /// Feed entry point. Skips games with a missing score and rejects
    /// negative scores, returning std::nullopt in both cases.
    std::optional<TeamGameUpdate> apply(const GameOutcome& game);

    /// Pull every team toward the base rating by the reversion factor.
    ///
    /// Call exactly once at the start of @p season, before any of its games.
    /// Calling it again or mid-season compounds the reversion and is not
    /// detected. Each team gets a Reversion record at (season, 0).
    void regressToMean(int32_t season);

    /// Win probabilities, with home advantage unless @p neutralSite.
    [[nodiscard]] MatchupProbability matchupProbability(const std::string& homeTeam,
                                                        const std::string& awayTeam,
                                                        bool neutralSite) const;

    /// The same expectation for arbitrary ratings (e.g. roster-adjusted).
    [[nodiscard]] MatchupProbability probabilityFor(double homeRating, double awayRating,
                                                    bool neutralSite) const;

    /// Copy of the live rating map.
    [[nodiscard]] std::unordered_map<std::string, double> ratings() const;

    [[nodiscard]] std::size_t teamCount() const;

    /// Copy of the ledger.
    [[nodiscard]] RatingLedger history() const;

    /// Ledger records of one team.
    [[nodiscard]] std::vector<RatingRecord> historyOf(const std::string& teamId) const;

    [[nodiscard]] const TeamRatingConfig& config() const noexcept { return config_; }

    /// Persist the ledger as CSV.
    [[nodiscard]] foundation::RatingResult<void> saveHistory(
        const std::filesystem::path& path) const;

    /// Replace the live state with the one recorded at @p path.
    ///
    /// A missing or corrupt file is logged and leaves the store untouched,
    /// i.e. a fresh store starts cold.
    /// @return Number of teams restored.
    std::size_t loadHistory(const std::filesystem::path& path);

    /// Replace the live state with the one recorded in @p ledger.
    /// @return Number of teams restored.
    std::size_t restore(RatingLedger ledger);

private:
    [[nodiscard]] double ratingLocked(const std::string& teamId) const;

    TeamGameUpdate updateLocked(const std::string& homeTeam, const std::string& awayTeam,
                                int32_t homeScore, int32_t awayScore,
                                foundation::SeasonWeek when, bool isPlayoff);

    TeamRatingConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, double> ratings_;
    RatingLedger ledger_;
};

} // namespace sre::rating
