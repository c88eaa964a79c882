#pragma once

/// @file engine_config.hpp
/// @brief Tunable constants for the team and player rating stores.
///
/// Built once by the host (usually from YAML through loadEngineConfig())
/// and passed by value into each store's constructor.

#include <cstdint>
#include <unordered_map>

#include "sre/foundation/config_manager.hpp"
#include "sre/foundation/rating_result.hpp"
#include "sre/foundation/types.hpp"

namespace sre::rating {

/// Team Elo constants.
struct TeamRatingConfig {
    double initialRating = 1500.0;   ///< Base rating for unseen teams.
    double kFactor = 20.0;           ///< K before margin and playoff scaling.
    double homeAdvantage = 50.0;     ///< Added to the home rating in the expectation only.
    double reversionFactor = 0.33;   ///< Fraction pulled back to base between seasons.
    double playoffMultiplier = 1.2;  ///< K multiplier for playoff games.
};

/// Player Elo constants.
struct PlayerRatingConfig {
    double initialRating = 1000.0;
    double defaultKFactor = 20.0;    ///< K for positions missing from kFactors.
    double reversionFactor = 0.25;
    int32_t inactivityWeeks = 4;     ///< Weeks without an update before reversion applies.
    int32_t weeksPerSeason = 18;     ///< Calendar length used to count weeks across seasons.
    double adjustmentScale = 0.1;    ///< Scale applied to the summed positional delta.
    double adjustmentClamp = 100.0;  ///< Team adjustment is clamped to +/- this value.

    /// Position-specific base K-factors.
    std::unordered_map<foundation::Position, double> kFactors = {
        {foundation::Position::QB, 32.0}, {foundation::Position::RB, 20.0},
        {foundation::Position::WR, 20.0}, {foundation::Position::TE, 18.0},
        {foundation::Position::OL, 15.0}, {foundation::Position::DL, 15.0},
        {foundation::Position::LB, 18.0}, {foundation::Position::CB, 20.0},
        {foundation::Position::S, 18.0},
    };

    /// Positional weights for the team adjustment. Sum to 1.0.
    std::unordered_map<foundation::Position, double> positionWeights = {
        {foundation::Position::QB, 0.25}, {foundation::Position::RB, 0.08},
        {foundation::Position::WR, 0.12}, {foundation::Position::TE, 0.05},
        {foundation::Position::OL, 0.15}, {foundation::Position::DL, 0.12},
        {foundation::Position::LB, 0.10}, {foundation::Position::CB, 0.08},
        {foundation::Position::S, 0.05},
    };

    /// K-factor for a position, falling back to defaultKFactor.
    [[nodiscard]] double kFactorFor(foundation::Position pos) const {
        auto it = kFactors.find(pos);
        return it != kFactors.end() ? it->second : defaultKFactor;
    }
};

/// Season runner options.
struct RunnerConfig {
    /// Run player inactivity reversion each time a new (season, week) starts.
    bool regressInactiveOnNewWeek = false;
};

struct EngineConfig {
    TeamRatingConfig team;
    PlayerRatingConfig player;
    RunnerConfig runner;
};

/// Overlay the `elo.*` and `runner.*` keys of @p config onto the defaults.
///
/// Missing keys keep their default. Returns ConfigTypeMismatch for a key of
/// the wrong type and ConfigInvalidValue for out-of-range values (reversion
/// factors outside [0, 1], non-positive calendar lengths, negative weights,
/// unknown position names).
[[nodiscard]] foundation::RatingResult<EngineConfig> loadEngineConfig(
    const foundation::ConfigManager& config);

} // namespace sre::rating
