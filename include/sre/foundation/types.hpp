#pragma once

/// @file types.hpp
/// @brief League calendar, entity and position types shared by the engine.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sre::foundation {

/// A point on the league calendar.
///
/// Ordered lexicographically by (season, week). Week 0 is the preseason
/// slot used for between-season reversion records.
struct SeasonWeek {
    int32_t season = 0;
    int32_t week = 0;

    constexpr auto operator<=>(const SeasonWeek&) const = default;
};

/// Number of weeks between two calendar points, counting each season as
/// @p weeksPerSeason weeks. Negative if @p to precedes @p from.
constexpr int32_t weeksBetween(SeasonWeek from, SeasonWeek to,
                               int32_t weeksPerSeason) {
    return (to.season - from.season) * weeksPerSeason + to.week - from.week;
}

/// Kind of rated entity.
enum class EntityType : uint8_t {
    Team = 0,
    Player = 1
};

constexpr std::string_view entityTypeName(EntityType type) {
    return type == EntityType::Team ? "team" : "player";
}

/// Player positions. A player's position is fixed at first observation.
enum class Position : uint8_t {
    QB = 0,
    RB,
    WR,
    TE,
    OL,
    DL,
    LB,
    CB,
    S,
    K,
    P,
    Unknown
};

/// Total number of positions, Unknown included.
inline constexpr std::size_t kPositionCount = 12;

/// Canonical abbreviation for a position.
constexpr std::string_view positionName(Position pos) {
    constexpr std::array<std::string_view, kPositionCount> names = {
        "QB", "RB", "WR", "TE", "OL", "DL", "LB", "CB", "S", "K", "P", "UNKNOWN"
    };
    auto idx = static_cast<std::size_t>(pos);
    return idx < kPositionCount ? names[idx] : "UNKNOWN";
}

/// Parse a canonical abbreviation. Anything unrecognized is Unknown.
constexpr Position parsePosition(std::string_view name) {
    for (std::size_t i = 0; i < kPositionCount; ++i) {
        auto pos = static_cast<Position>(i);
        if (positionName(pos) == name) {
            return pos;
        }
    }
    return Position::Unknown;
}

/// What produced a ledger record.
enum class RatingSource : uint8_t {
    Game = 0,      ///< Game result or per-game performance update.
    Reversion = 1  ///< Season or inactivity mean reversion.
};

constexpr std::string_view ratingSourceName(RatingSource source) {
    return source == RatingSource::Game ? "game" : "reversion";
}

} // namespace sre::foundation
