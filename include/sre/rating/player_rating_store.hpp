#pragma once

/// @file player_rating_store.hpp
/// @brief Per-player Elo ratings and their projection onto a team-level
///        adjustment.
///
/// A player is rated against an abstract opponent unit strength rather
/// than another player, so each update is single-sided: there is no
/// zero-sum pairing as with teams.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sre/foundation/rating_result.hpp"
#include "sre/foundation/types.hpp"
#include "sre/rating/engine_config.hpp"
#include "sre/rating/rating_ledger.hpp"

namespace sre::rating {

/// Cached per-player metadata. Always rebuildable from the ledger.
struct PlayerInfo {
    foundation::Position position = foundation::Position::Unknown;
    uint32_t games = 0;
    std::optional<foundation::SeasonWeek> lastUpdate;  ///< Last game update, if any.
};

/// One player's participation in one game, from the performance evaluator.
struct PlayerPerformance {
    std::string playerId;
    foundation::Position position = foundation::Position::Unknown;
    double snapShare = 0.0;         ///< Fraction of snaps played, [0, 1].
    double performanceScore = 0.5;  ///< [0, 1]; 0.5 is exactly as expected.
};

/// A player's rating together with its metadata.
struct PlayerRatingEntry {
    std::string playerId;
    double rating = 0.0;
    PlayerInfo info;
};

/// A rostered player, as used for the team adjustment.
struct RosterSlot {
    std::string playerId;
    foundation::Position position = foundation::Position::Unknown;
    double snapShare = 0.0;
};

/// Live player ratings backed by an append-only ledger.
///
/// Thread-safe in the same way as TeamRatingStore: a single writer lock,
/// shared reads. Independent of the team store.
class PlayerRatingStore {
public:
    explicit PlayerRatingStore(PlayerRatingConfig config = {});

    PlayerRatingStore(const PlayerRatingStore&) = delete;
    PlayerRatingStore& operator=(const PlayerRatingStore&) = delete;

    /// Create the player at the base rating unless already known.
    /// The position of a known player is never changed.
    void initializePlayer(const std::string& playerId, foundation::Position position);

    /// Current rating, or the base rating for an unknown player.
    [[nodiscard]] double rating(const std::string& playerId) const;

    /// Rate one performance.
    ///
    ///   K = K(position) * snapShare
    ///   E = 1 / (1 + 10^((opponentStrength - R) / 400))
    ///   R' = R + K * (performanceScore - E)
    ///
    /// Increments the game counter, sets the last update to (season, week)
    /// and appends one ledger record. An unknown player is created with
    /// Position::Unknown first.
    ///
    /// Precondition: snapShare and performanceScore lie in [0, 1].
    /// @return The new rating.
    double update(const std::string& playerId, double opponentStrength,
                  double performanceScore, double snapShare,
                  int32_t season, int32_t week);

    /// Rate every entry of one team's game against @p opponentStrength.
    ///
    /// Entries with snap share or performance outside [0, 1] are logged and
    /// skipped. Unknown players are created with the entry's position.
    /// @return Number of entries applied.
    std::size_t applyPerformances(const std::vector<PlayerPerformance>& entries,
                                  double opponentStrength, foundation::SeasonWeek when);

    /// Revert players idle for at least inactivityWeeks toward the base rating.
    ///
    /// Elapsed weeks count each season as weeksPerSeason weeks. Players never
    /// updated by a game are left alone. Reverted players get a Reversion
    /// record at (currentSeason, currentWeek); their last update and game
    /// count are unchanged.
    /// @return Number of players reverted.
    std::size_t regressInactive(int32_t currentSeason, int32_t currentWeek);

    /// Project a roster's ratings onto one additive team-rating modifier.
    ///
    /// For each weighted position, (sum of rating * snapShare) minus
    /// (players at that position * base) is multiplied by the position
    /// weight; the total is scaled and clamped to +/- adjustmentClamp.
    [[nodiscard]] double teamAdjustment(const std::vector<RosterSlot>& roster) const;

    [[nodiscard]] std::optional<PlayerInfo> playerInfo(const std::string& playerId) const;

    /// Copy of the live rating map.
    [[nodiscard]] std::unordered_map<std::string, double> ratings() const;

    /// Consistent copy of every player's rating and metadata.
    [[nodiscard]] std::vector<PlayerRatingEntry> entries() const;

    [[nodiscard]] std::size_t playerCount() const;

    [[nodiscard]] RatingLedger history() const;

    [[nodiscard]] std::vector<RatingRecord> historyOf(const std::string& playerId) const;

    [[nodiscard]] const PlayerRatingConfig& config() const noexcept { return config_; }

    [[nodiscard]] foundation::RatingResult<void> saveHistory(
        const std::filesystem::path& path) const;

    /// Replace the live state with the one recorded at @p path.
    /// A missing or corrupt file is logged and leaves the store untouched.
    /// @return Number of players restored.
    std::size_t loadHistory(const std::filesystem::path& path);

    /// Replace the live state with the one recorded in @p ledger.
    std::size_t restore(RatingLedger ledger);

private:
    struct PlayerState {
        double rating = 0.0;
        PlayerInfo info;
    };

    [[nodiscard]] double ratingLocked(const std::string& playerId) const;

    double updateLocked(const std::string& playerId, double opponentStrength,
                        double performanceScore, double snapShare,
                        foundation::SeasonWeek when);

    PlayerState& ensurePlayerLocked(const std::string& playerId,
                                    foundation::Position position);

    PlayerRatingConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, PlayerState> players_;
    RatingLedger ledger_;
};

} // namespace sre::rating
