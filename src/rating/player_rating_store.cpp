/// @file player_rating_store.cpp
/// @brief PlayerRatingStore implementation.

#include "sre/rating/player_rating_store.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

#include "sre/foundation/rating_logger.hpp"
#include "sre/rating/elo_math.hpp"
#include "sre/rating/history_replay.hpp"

namespace sre::rating {

using foundation::EntityType;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::Position;
using foundation::RatingLogger;
using foundation::RatingResult;
using foundation::RatingSource;
using foundation::SeasonWeek;

namespace {

bool isUnitInterval(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

PlayerRatingStore::PlayerRatingStore(PlayerRatingConfig config)
    : config_(std::move(config)) {}

// -- Writes ------------------------------------------------------------------

void PlayerRatingStore::initializePlayer(const std::string& playerId, Position position) {
    std::unique_lock lock(mutex_);
    ensurePlayerLocked(playerId, position);
}

PlayerRatingStore::PlayerState& PlayerRatingStore::ensurePlayerLocked(
    const std::string& playerId, Position position) {
    auto [it, inserted] = players_.try_emplace(playerId);
    if (inserted) {
        it->second.rating = config_.initialRating;
        it->second.info.position = position;
    }
    return it->second;
}

double PlayerRatingStore::update(const std::string& playerId, double opponentStrength,
                                 double performanceScore, double snapShare,
                                 int32_t season, int32_t week) {
    std::unique_lock lock(mutex_);
    return updateLocked(playerId, opponentStrength, performanceScore, snapShare,
                        SeasonWeek{season, week});
}

double PlayerRatingStore::updateLocked(const std::string& playerId, double opponentStrength,
                                       double performanceScore, double snapShare,
                                       SeasonWeek when) {
    auto& state = ensurePlayerLocked(playerId, Position::Unknown);

    double k = config_.kFactorFor(state.info.position) * snapShare;
    double expected = EloMath::expectedScore(state.rating, opponentStrength);
    state.rating += EloMath::ratingDelta(k, performanceScore, expected);

    ++state.info.games;
    state.info.lastUpdate = when;

    ledger_.append({when, playerId, EntityType::Player, state.info.position,
                    state.rating, RatingSource::Game});
    return state.rating;
}

std::size_t PlayerRatingStore::applyPerformances(const std::vector<PlayerPerformance>& entries,
                                                 double opponentStrength, SeasonWeek when) {
    std::size_t applied = 0;
    std::vector<const PlayerPerformance*> rejected;
    {
        std::unique_lock lock(mutex_);
        for (const auto& entry : entries) {
            if (entry.playerId.empty() || !isUnitInterval(entry.snapShare) ||
                !isUnitInterval(entry.performanceScore)) {
                rejected.push_back(&entry);
                continue;
            }
            ensurePlayerLocked(entry.playerId, entry.position);
            updateLocked(entry.playerId, opponentStrength, entry.performanceScore,
                         entry.snapShare, when);
            ++applied;
        }
    }

    for (const auto* entry : rejected) {
        LogContext ctx;
        ctx.entityId = entry->playerId;
        ctx.when = when;
        ctx.extra["snap_share"] = std::to_string(entry->snapShare);
        ctx.extra["performance"] = std::to_string(entry->performanceScore);
        RatingLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Player, "skipping invalid performance entry", ctx);
    }
    return applied;
}

std::size_t PlayerRatingStore::regressInactive(int32_t currentSeason, int32_t currentWeek) {
    const SeasonWeek now{currentSeason, currentWeek};
    std::size_t reverted = 0;
    {
        std::unique_lock lock(mutex_);
        for (auto& [id, state] : players_) {
            if (!state.info.lastUpdate) {
                continue;
            }
            auto idle = foundation::weeksBetween(*state.info.lastUpdate, now,
                                                 config_.weeksPerSeason);
            if (idle < config_.inactivityWeeks) {
                continue;
            }
            state.rating = EloMath::revertToward(state.rating, config_.initialRating,
                                                 config_.reversionFactor);
            ledger_.append({now, id, EntityType::Player, state.info.position, state.rating,
                            RatingSource::Reversion});
            ++reverted;
        }
    }
    SRE_LOG_DEBUG(LogCategory::Player,
                  "inactivity reversion at " + std::to_string(currentSeason) + "/" +
                      std::to_string(currentWeek) + ": " + std::to_string(reverted) +
                      " players");
    return reverted;
}

// -- Reads -------------------------------------------------------------------

double PlayerRatingStore::rating(const std::string& playerId) const {
    std::shared_lock lock(mutex_);
    return ratingLocked(playerId);
}

double PlayerRatingStore::ratingLocked(const std::string& playerId) const {
    auto it = players_.find(playerId);
    return it != players_.end() ? it->second.rating : config_.initialRating;
}

double PlayerRatingStore::teamAdjustment(const std::vector<RosterSlot>& roster) const {
    std::shared_lock lock(mutex_);

    double total = 0.0;
    // Fixed position order keeps the floating-point sum reproducible.
    for (std::size_t p = 0; p < foundation::kPositionCount; ++p) {
        auto pos = static_cast<Position>(p);
        auto weight = config_.positionWeights.find(pos);
        if (weight == config_.positionWeights.end()) {
            continue;
        }

        double weighted = 0.0;
        std::size_t count = 0;
        for (const auto& slot : roster) {
            if (slot.position != pos) {
                continue;
            }
            weighted += ratingLocked(slot.playerId) * slot.snapShare;
            ++count;
        }
        if (count == 0) {
            continue;
        }

        double delta = weighted - static_cast<double>(count) * config_.initialRating;
        total += delta * weight->second;
    }

    return std::clamp(total * config_.adjustmentScale, -config_.adjustmentClamp,
                      config_.adjustmentClamp);
}

std::optional<PlayerInfo> PlayerRatingStore::playerInfo(const std::string& playerId) const {
    std::shared_lock lock(mutex_);
    auto it = players_.find(playerId);
    if (it == players_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::unordered_map<std::string, double> PlayerRatingStore::ratings() const {
    std::shared_lock lock(mutex_);
    std::unordered_map<std::string, double> out;
    out.reserve(players_.size());
    for (const auto& [id, state] : players_) {
        out.emplace(id, state.rating);
    }
    return out;
}

std::vector<PlayerRatingEntry> PlayerRatingStore::entries() const {
    std::shared_lock lock(mutex_);
    std::vector<PlayerRatingEntry> out;
    out.reserve(players_.size());
    for (const auto& [id, state] : players_) {
        out.push_back({id, state.rating, state.info});
    }
    return out;
}

std::size_t PlayerRatingStore::playerCount() const {
    std::shared_lock lock(mutex_);
    return players_.size();
}

RatingLedger PlayerRatingStore::history() const {
    std::shared_lock lock(mutex_);
    return ledger_;
}

std::vector<RatingRecord> PlayerRatingStore::historyOf(const std::string& playerId) const {
    std::shared_lock lock(mutex_);
    return ledger_.historyOf(playerId);
}

// -- Persistence -------------------------------------------------------------

RatingResult<void> PlayerRatingStore::saveHistory(const std::filesystem::path& path) const {
    RatingLedger snapshot = history();
    auto result = snapshot.save(path, EntityType::Player);
    if (result) {
        SRE_LOG_INFO(LogCategory::Ledger, "saved player history to " + path.string());
    }
    return result;
}

std::size_t PlayerRatingStore::loadHistory(const std::filesystem::path& path) {
    auto loaded = RatingLedger::load(path, EntityType::Player);
    if (!loaded) {
        LogContext ctx;
        ctx.extra["path"] = path.string();
        ctx.extra["reason"] = std::string(loaded.error().message());
        RatingLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Ledger,
            "player history unavailable, starting cold", ctx);
        return 0;
    }
    auto restored = restore(std::move(loaded).value());
    SRE_LOG_INFO(LogCategory::Ledger,
                 "restored " + std::to_string(restored) + " players from " + path.string());
    return restored;
}

std::size_t PlayerRatingStore::restore(RatingLedger ledger) {
    std::unordered_map<std::string, PlayerState> rebuilt;
    auto count = replayHistory<EntityType::Player>(
        ledger, [&rebuilt](const std::string& id, const ReplayedEntity& entity) {
            auto& state = rebuilt[id];
            state.rating = entity.latest->rating;
            state.info.position = entity.latest->position;
            state.info.games = entity.games;
            if (entity.latestGame != nullptr) {
                state.info.lastUpdate = entity.latestGame->when;
            }
        });

    std::unique_lock lock(mutex_);
    players_ = std::move(rebuilt);
    ledger_ = std::move(ledger);
    return count;
}

} // namespace sre::rating
