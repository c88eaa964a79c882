/// @file engine_config.cpp
/// @brief Builds EngineConfig from a loaded ConfigManager.

#include "sre/rating/engine_config.hpp"

#include <cmath>
#include <cstdint>
#include <string>

#include "sre/foundation/rating_logger.hpp"

namespace sre::rating {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::Position;
using foundation::RatingError;
using foundation::RatingResult;

namespace {

constexpr double kWeightSumTolerance = 1e-6;

/// Copy @p key into @p target when present. Absent keys are not an error.
template <typename T>
RatingResult<void> overlay(const ConfigManager& config, const std::string& key, T& target) {
    if (!config.hasKey(key)) {
        return RatingResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return RatingResult<void>::err(value.error());
    }
    target = value.value();
    return RatingResult<void>::ok();
}

RatingResult<void> invalid(const std::string& key, const std::string& why) {
    return RatingResult<void>::err(
        RatingError(ErrorCode::ConfigInvalidValue, key + ": " + why));
}

RatingResult<void> checkFraction(const std::string& key, double value) {
    if (value < 0.0 || value > 1.0) {
        return invalid(key, "must be within [0, 1]");
    }
    return RatingResult<void>::ok();
}

RatingResult<void> checkNonNegative(const std::string& key, double value) {
    if (value < 0.0) {
        return invalid(key, "must not be negative");
    }
    return RatingResult<void>::ok();
}

RatingResult<void> checkPositive(const std::string& key, int32_t value) {
    if (value <= 0) {
        return invalid(key, "must be positive");
    }
    return RatingResult<void>::ok();
}

/// Position weights distribute the whole roster adjustment.
RatingResult<void> checkWeightSum(const std::string& key,
                                  const std::unordered_map<Position, double>& weights) {
    double sum = 0.0;
    for (const auto& [pos, weight] : weights) {
        sum += weight;
    }
    if (std::abs(sum - 1.0) > kWeightSumTolerance) {
        return invalid(key, "must sum to 1.0, got " + std::to_string(sum));
    }
    return RatingResult<void>::ok();
}

/// Overlay a per-position table such as elo.player.k_factors.<POS>.
RatingResult<void> overlayPositionTable(const ConfigManager& config,
                                        const std::string& prefix,
                                        std::unordered_map<Position, double>& table) {
    auto names = config.childKeys(prefix);
    if (names.empty()) {
        return RatingResult<void>::ok();
    }

    // A table present in the file replaces the built-in one wholesale.
    std::unordered_map<Position, double> loaded;
    for (const auto& name : names) {
        auto key = prefix + "." + name;
        auto pos = foundation::parsePosition(name);
        if (pos == Position::Unknown) {
            return invalid(key, "unknown position");
        }
        auto value = config.get<double>(key);
        if (!value) {
            return RatingResult<void>::err(value.error());
        }
        if (value.value() < 0.0) {
            return invalid(key, "must not be negative");
        }
        loaded[pos] = value.value();
    }
    table = std::move(loaded);
    return RatingResult<void>::ok();
}

} // namespace

RatingResult<EngineConfig> loadEngineConfig(const ConfigManager& config) {
    EngineConfig cfg;
    auto& team = cfg.team;
    auto& player = cfg.player;

    const RatingResult<void> steps[] = {
        overlay(config, "elo.team.initial_rating", team.initialRating),
        overlay(config, "elo.team.k_factor", team.kFactor),
        overlay(config, "elo.team.home_advantage", team.homeAdvantage),
        overlay(config, "elo.team.reversion_factor", team.reversionFactor),
        overlay(config, "elo.team.playoff_multiplier", team.playoffMultiplier),
        overlay(config, "elo.player.initial_rating", player.initialRating),
        overlay(config, "elo.player.default_k_factor", player.defaultKFactor),
        overlay(config, "elo.player.reversion_factor", player.reversionFactor),
        overlay(config, "elo.player.inactivity_weeks", player.inactivityWeeks),
        overlay(config, "elo.player.weeks_per_season", player.weeksPerSeason),
        overlay(config, "elo.player.adjustment_scale", player.adjustmentScale),
        overlay(config, "elo.player.adjustment_clamp", player.adjustmentClamp),
        overlayPositionTable(config, "elo.player.k_factors", player.kFactors),
        overlayPositionTable(config, "elo.player.position_weights", player.positionWeights),
        overlay(config, "runner.regress_inactive_on_new_week",
                cfg.runner.regressInactiveOnNewWeek),
    };
    auto reject = [](const RatingError& error) {
        SRE_LOG_ERROR(LogCategory::Config,
                      "invalid engine config: " + std::string(error.message()));
        return RatingResult<EngineConfig>::err(error);
    };
    for (const auto& step : steps) {
        if (!step) {
            return reject(step.error());
        }
    }

    const RatingResult<void> checks[] = {
        checkNonNegative("elo.team.k_factor", team.kFactor),
        checkNonNegative("elo.team.playoff_multiplier", team.playoffMultiplier),
        checkFraction("elo.team.reversion_factor", team.reversionFactor),
        checkNonNegative("elo.player.default_k_factor", player.defaultKFactor),
        checkFraction("elo.player.reversion_factor", player.reversionFactor),
        checkPositive("elo.player.inactivity_weeks", player.inactivityWeeks),
        checkPositive("elo.player.weeks_per_season", player.weeksPerSeason),
        checkNonNegative("elo.player.adjustment_clamp", player.adjustmentClamp),
        checkWeightSum("elo.player.position_weights", player.positionWeights),
    };
    for (const auto& check : checks) {
        if (!check) {
            return reject(check.error());
        }
    }

    SRE_LOG_INFO(LogCategory::Config, "engine config loaded");
    return RatingResult<EngineConfig>::ok(std::move(cfg));
}

} // namespace sre::rating
