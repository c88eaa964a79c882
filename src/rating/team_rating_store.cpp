/// @file team_rating_store.cpp
/// @brief TeamRatingStore implementation.

#include "sre/rating/team_rating_store.hpp"

#include <iomanip>
#include <mutex>
#include <sstream>

#include "sre/foundation/rating_logger.hpp"
#include "sre/rating/elo_math.hpp"
#include "sre/rating/history_replay.hpp"

namespace sre::rating {

using foundation::EntityType;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RatingLogger;
using foundation::RatingResult;
using foundation::RatingSource;
using foundation::SeasonWeek;

namespace {

std::string fixed1(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

void logGameUpdate(const std::string& homeTeam, const std::string& awayTeam,
                   const TeamGameUpdate& update) {
    SRE_LOG_DEBUG(LogCategory::Team,
                  "updated: " + homeTeam + " " + fixed1(update.homeBefore) + "->" +
                      fixed1(update.homeAfter) + ", " + awayTeam + " " +
                      fixed1(update.awayBefore) + "->" + fixed1(update.awayAfter));
}

} // namespace

TeamRatingStore::TeamRatingStore(TeamRatingConfig config)
    : config_(std::move(config)) {}

// -- Writes ------------------------------------------------------------------

void TeamRatingStore::initialize(const std::vector<std::string>& teamIds) {
    std::size_t added = 0;
    {
        std::unique_lock lock(mutex_);
        for (const auto& id : teamIds) {
            if (ratings_.try_emplace(id, config_.initialRating).second) {
                ++added;
            }
        }
    }
    SRE_LOG_INFO(LogCategory::Team,
                 "initialized " + std::to_string(added) + " teams at " +
                     fixed1(config_.initialRating));
}

std::pair<double, double> TeamRatingStore::update(const std::string& homeTeam,
                                                  const std::string& awayTeam,
                                                  int32_t homeScore, int32_t awayScore,
                                                  int32_t season, int32_t week,
                                                  bool isPlayoff) {
    TeamGameUpdate result;
    {
        std::unique_lock lock(mutex_);
        result = updateLocked(homeTeam, awayTeam, homeScore, awayScore,
                              SeasonWeek{season, week}, isPlayoff);
    }
    logGameUpdate(homeTeam, awayTeam, result);
    return {result.homeAfter, result.awayAfter};
}

std::optional<TeamGameUpdate> TeamRatingStore::apply(const GameOutcome& game) {
    if (!game.homeScore || !game.awayScore) {
        LogContext ctx;
        ctx.when = game.when;
        ctx.extra["home"] = game.homeTeam;
        ctx.extra["away"] = game.awayTeam;
        RatingLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Team, "skipping game without final score", ctx);
        return std::nullopt;
    }
    if (*game.homeScore < 0 || *game.awayScore < 0) {
        LogContext ctx;
        ctx.when = game.when;
        ctx.extra["home"] = game.homeTeam;
        ctx.extra["away"] = game.awayTeam;
        ctx.extra["score"] =
            std::to_string(*game.homeScore) + "-" + std::to_string(*game.awayScore);
        RatingLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Team, "rejecting game with negative score", ctx);
        return std::nullopt;
    }

    TeamGameUpdate result;
    {
        std::unique_lock lock(mutex_);
        result = updateLocked(game.homeTeam, game.awayTeam, *game.homeScore,
                              *game.awayScore, game.when, game.isPlayoff);
    }
    logGameUpdate(game.homeTeam, game.awayTeam, result);
    return result;
}

TeamGameUpdate TeamRatingStore::updateLocked(const std::string& homeTeam,
                                             const std::string& awayTeam,
                                             int32_t homeScore, int32_t awayScore,
                                             SeasonWeek when, bool isPlayoff) {
    TeamGameUpdate out;
    out.homeBefore = ratingLocked(homeTeam);
    out.awayBefore = ratingLocked(awayTeam);

    out.homeExpected =
        EloMath::expectedScore(out.homeBefore + config_.homeAdvantage, out.awayBefore);
    double homeActual = EloMath::actualScore(homeScore, awayScore);

    double k = config_.kFactor * EloMath::movMultiplier(homeScore, awayScore) *
               (isPlayoff ? config_.playoffMultiplier : 1.0);

    // One delta, applied with opposite signs: the game is exactly zero-sum.
    out.homeDelta = EloMath::ratingDelta(k, homeActual, out.homeExpected);
    out.homeAfter = out.homeBefore + out.homeDelta;
    out.awayAfter = out.awayBefore - out.homeDelta;

    ratings_[homeTeam] = out.homeAfter;
    ratings_[awayTeam] = out.awayAfter;

    ledger_.append({when, homeTeam, EntityType::Team, foundation::Position::Unknown,
                    out.homeAfter, RatingSource::Game});
    ledger_.append({when, awayTeam, EntityType::Team, foundation::Position::Unknown,
                    out.awayAfter, RatingSource::Game});
    return out;
}

void TeamRatingStore::regressToMean(int32_t season) {
    const SeasonWeek preseason{season, 0};
    {
        std::unique_lock lock(mutex_);
        for (auto& [id, value] : ratings_) {
            value = EloMath::revertToward(value, config_.initialRating,
                                          config_.reversionFactor);
            ledger_.append({preseason, id, EntityType::Team, foundation::Position::Unknown,
                            value, RatingSource::Reversion});
        }
    }
    SRE_LOG_INFO(LogCategory::Team,
                 "applied " + fixed1(config_.reversionFactor * 100.0) +
                     "% reversion to mean for season " + std::to_string(season));
}

// -- Reads -------------------------------------------------------------------

double TeamRatingStore::rating(const std::string& teamId) const {
    std::shared_lock lock(mutex_);
    return ratingLocked(teamId);
}

double TeamRatingStore::ratingLocked(const std::string& teamId) const {
    auto it = ratings_.find(teamId);
    return it != ratings_.end() ? it->second : config_.initialRating;
}

MatchupProbability TeamRatingStore::matchupProbability(const std::string& homeTeam,
                                                       const std::string& awayTeam,
                                                       bool neutralSite) const {
    double home = 0.0;
    double away = 0.0;
    {
        std::shared_lock lock(mutex_);
        home = ratingLocked(homeTeam);
        away = ratingLocked(awayTeam);
    }
    return probabilityFor(home, away, neutralSite);
}

MatchupProbability TeamRatingStore::probabilityFor(double homeRating, double awayRating,
                                                   bool neutralSite) const {
    if (!neutralSite) {
        homeRating += config_.homeAdvantage;
    }
    MatchupProbability p;
    p.home = EloMath::expectedScore(homeRating, awayRating);
    p.away = 1.0 - p.home;
    return p;
}

std::unordered_map<std::string, double> TeamRatingStore::ratings() const {
    std::shared_lock lock(mutex_);
    return ratings_;
}

std::size_t TeamRatingStore::teamCount() const {
    std::shared_lock lock(mutex_);
    return ratings_.size();
}

RatingLedger TeamRatingStore::history() const {
    std::shared_lock lock(mutex_);
    return ledger_;
}

std::vector<RatingRecord> TeamRatingStore::historyOf(const std::string& teamId) const {
    std::shared_lock lock(mutex_);
    return ledger_.historyOf(teamId);
}

// -- Persistence -------------------------------------------------------------

RatingResult<void> TeamRatingStore::saveHistory(const std::filesystem::path& path) const {
    RatingLedger snapshot = history();
    if (snapshot.empty()) {
        SRE_LOG_WARN(LogCategory::Ledger, "no team history to save");
    }
    auto result = snapshot.save(path, EntityType::Team);
    if (result) {
        SRE_LOG_INFO(LogCategory::Ledger, "saved team history to " + path.string());
    }
    return result;
}

std::size_t TeamRatingStore::loadHistory(const std::filesystem::path& path) {
    auto loaded = RatingLedger::load(path, EntityType::Team);
    if (!loaded) {
        LogContext ctx;
        ctx.extra["path"] = path.string();
        ctx.extra["reason"] = std::string(loaded.error().message());
        RatingLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Ledger,
            "team history unavailable, starting cold", ctx);
        return 0;
    }
    auto restored = restore(std::move(loaded).value());
    SRE_LOG_INFO(LogCategory::Ledger,
                 "restored " + std::to_string(restored) + " teams from " + path.string());
    return restored;
}

std::size_t TeamRatingStore::restore(RatingLedger ledger) {
    std::unordered_map<std::string, double> rebuilt;
    auto count = replayHistory<EntityType::Team>(
        ledger, [&rebuilt](const std::string& id, const ReplayedEntity& entity) {
            rebuilt[id] = entity.latest->rating;
        });

    std::unique_lock lock(mutex_);
    ratings_ = std::move(rebuilt);
    ledger_ = std::move(ledger);
    return count;
}

} // namespace sre::rating
