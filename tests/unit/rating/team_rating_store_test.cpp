/// @file team_rating_store_test.cpp
/// @brief Unit tests for TeamRatingStore.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "sre/rating/team_rating_store.hpp"

using namespace sre::rating;
using sre::foundation::RatingSource;
using sre::foundation::SeasonWeek;

namespace {

class TempDir {
public:
    TempDir() {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("sre_team_test_" + std::to_string(now));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

GameOutcome game(const std::string& home, const std::string& away,
                 std::optional<int32_t> homeScore, std::optional<int32_t> awayScore,
                 int32_t season, int32_t week, bool playoff = false) {
    GameOutcome g;
    g.homeTeam = home;
    g.awayTeam = away;
    g.homeScore = homeScore;
    g.awayScore = awayScore;
    g.when = SeasonWeek{season, week};
    g.isPlayoff = playoff;
    return g;
}

} // namespace

class TeamRatingStoreTest : public ::testing::Test {
protected:
    TeamRatingStore store_;
};

// ===========================================================================
// Initialization and reads
// ===========================================================================

TEST_F(TeamRatingStoreTest, UnknownTeamReadsBaseRating) {
    EXPECT_DOUBLE_EQ(store_.rating("KC"), 1500.0);
    EXPECT_EQ(store_.teamCount(), 0u);
}

TEST_F(TeamRatingStoreTest, InitializeIsIdempotent) {
    store_.initialize({"KC", "BUF"});
    store_.update("KC", "BUF", 27, 24, 2024, 1, false);
    double kc = store_.rating("KC");

    store_.initialize({"KC", "BUF", "DAL"});
    EXPECT_DOUBLE_EQ(store_.rating("KC"), kc);
    EXPECT_DOUBLE_EQ(store_.rating("DAL"), 1500.0);
    EXPECT_EQ(store_.teamCount(), 3u);
}

TEST_F(TeamRatingStoreTest, InitializeAppendsNoHistory) {
    store_.initialize({"KC", "BUF"});
    EXPECT_TRUE(store_.history().empty());
}

// ===========================================================================
// Updates
// ===========================================================================

TEST_F(TeamRatingStoreTest, HomeWinScenario) {
    auto p = store_.matchupProbability("KC", "BUF", false);
    EXPECT_NEAR(p.home, 0.5715, 1e-3);

    auto [kc, buf] = store_.update("KC", "BUF", 27, 24, 2024, 1, false);
    EXPECT_NEAR(kc, 1511.9, 0.05);
    EXPECT_NEAR(buf, 1488.1, 0.05);
    EXPECT_DOUBLE_EQ(store_.rating("KC"), kc);
    EXPECT_DOUBLE_EQ(store_.rating("BUF"), buf);
}

TEST_F(TeamRatingStoreTest, UpdateIsZeroSum) {
    auto [kc, buf] = store_.update("KC", "BUF", 27, 24, 2024, 1, false);
    EXPECT_DOUBLE_EQ(kc + buf, 3000.0);

    double before = store_.rating("KC") + store_.rating("DAL");
    store_.update("DAL", "KC", 10, 31, 2024, 2, false);
    double after = store_.rating("KC") + store_.rating("DAL");
    EXPECT_NEAR(after, before, 1e-9);
}

TEST_F(TeamRatingStoreTest, ApplyReportsExactOppositeDeltas) {
    store_.update("KC", "BUF", 35, 10, 2024, 1, false);

    auto result = store_.apply(game("BUF", "KC", 20, 17, 2024, 2));
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->homeAfter, result->homeBefore + result->homeDelta);
    EXPECT_DOUBLE_EQ(result->awayAfter, result->awayBefore - result->homeDelta);
    EXPECT_GT(result->homeDelta, 0.0);
}

TEST_F(TeamRatingStoreTest, TieChangesNothing) {
    store_.update("KC", "BUF", 30, 3, 2024, 1, false);
    double kc = store_.rating("KC");
    double buf = store_.rating("BUF");

    auto [kcAfter, bufAfter] = store_.update("KC", "BUF", 20, 20, 2024, 2, false);
    EXPECT_DOUBLE_EQ(kcAfter, kc);
    EXPECT_DOUBLE_EQ(bufAfter, buf);
    // The tie is still recorded.
    EXPECT_EQ(store_.historyOf("KC").size(), 2u);
}

TEST_F(TeamRatingStoreTest, UpsetMovesMoreThanExpectedWin) {
    TeamRatingStore favoriteWins;
    TeamRatingStore underdogWins;
    for (auto* store : {&favoriteWins, &underdogWins}) {
        store->update("KC", "NYJ", 38, 7, 2024, 1, false);
    }

    double favGain = favoriteWins.update("KC", "NYJ", 24, 21, 2024, 2, false).first -
                     favoriteWins.history().records()[0].rating;
    double dogGain = underdogWins.update("KC", "NYJ", 21, 24, 2024, 2, false).second -
                     underdogWins.history().records()[1].rating;
    EXPECT_GT(dogGain, favGain);
}

TEST_F(TeamRatingStoreTest, LargerMarginMovesMore) {
    TeamRatingStore close;
    TeamRatingStore blowout;
    double closeGain = close.update("KC", "BUF", 24, 21, 2024, 1, false).first - 1500.0;
    double blowoutGain = blowout.update("KC", "BUF", 45, 3, 2024, 1, false).first - 1500.0;
    EXPECT_GT(blowoutGain, closeGain);
}

TEST_F(TeamRatingStoreTest, PlayoffGameUsesMultiplier) {
    TeamRatingStore regular;
    TeamRatingStore playoff;
    double regularGain = regular.update("KC", "BUF", 27, 24, 2024, 19, false).first - 1500.0;
    double playoffGain = playoff.update("KC", "BUF", 27, 24, 2024, 19, true).first - 1500.0;
    EXPECT_NEAR(playoffGain, regularGain * 1.2, 1e-9);
}

TEST_F(TeamRatingStoreTest, UpdateAppendsTwoGameRecords) {
    store_.update("KC", "BUF", 27, 24, 2024, 1, false);

    auto ledger = store_.history();
    const auto& records = ledger.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].entityId, "KC");
    EXPECT_EQ(records[1].entityId, "BUF");
    for (const auto& record : records) {
        EXPECT_EQ(record.when, (SeasonWeek{2024, 1}));
        EXPECT_EQ(record.source, RatingSource::Game);
    }
}

TEST_F(TeamRatingStoreTest, ApplySkipsMissingScore) {
    EXPECT_FALSE(store_.apply(game("KC", "BUF", std::nullopt, 24, 2024, 1)).has_value());
    EXPECT_FALSE(store_.apply(game("KC", "BUF", 27, std::nullopt, 2024, 1)).has_value());
    EXPECT_TRUE(store_.history().empty());
    EXPECT_EQ(store_.teamCount(), 0u);
}

TEST_F(TeamRatingStoreTest, ApplyRejectsNegativeScore) {
    EXPECT_FALSE(store_.apply(game("KC", "BUF", -3, 24, 2024, 1)).has_value());
    EXPECT_TRUE(store_.history().empty());
}

// ===========================================================================
// Probabilities
// ===========================================================================

TEST_F(TeamRatingStoreTest, NeutralSiteIsSymmetric) {
    store_.update("KC", "BUF", 31, 17, 2024, 1, false);

    auto ab = store_.matchupProbability("KC", "BUF", true);
    auto ba = store_.matchupProbability("BUF", "KC", true);
    EXPECT_NEAR(ab.home, ba.away, 1e-12);
    EXPECT_NEAR(ab.home + ab.away, 1.0, 1e-12);
}

TEST_F(TeamRatingStoreTest, HomeAdvantageFavorsHomeTeam) {
    auto neutral = store_.matchupProbability("KC", "BUF", true);
    auto home = store_.matchupProbability("KC", "BUF", false);
    EXPECT_DOUBLE_EQ(neutral.home, 0.5);
    EXPECT_GT(home.home, 0.5);
    EXPECT_NEAR(home.home + home.away, 1.0, 1e-12);
}

TEST_F(TeamRatingStoreTest, ProbabilityForArbitraryRatings) {
    auto p = store_.probabilityFor(1600.0, 1550.0, false);
    EXPECT_NEAR(p.home, 1.0 / (1.0 + std::pow(10.0, -100.0 / 400.0)), 1e-12);
}

// ===========================================================================
// Season reversion
// ===========================================================================

TEST_F(TeamRatingStoreTest, RegressToMeanPullsTowardBase) {
    store_.update("KC", "BUF", 45, 3, 2024, 1, false);
    double kc = store_.rating("KC");
    double buf = store_.rating("BUF");

    store_.regressToMean(2025);

    double kcAfter = store_.rating("KC");
    double bufAfter = store_.rating("BUF");
    EXPECT_NEAR(kcAfter, kc * 0.67 + 1500.0 * 0.33, 1e-9);
    EXPECT_LT(kcAfter, kc);
    EXPECT_GT(kcAfter, 1500.0);
    EXPECT_GT(bufAfter, buf);
    EXPECT_LT(bufAfter, 1500.0);
    EXPECT_LE(std::abs(kcAfter - 1500.0), std::abs(kc - 1500.0));
}

TEST_F(TeamRatingStoreTest, RegressToMeanAppendsPreseasonRecords) {
    store_.initialize({"KC"});
    store_.regressToMean(2025);

    auto history = store_.historyOf("KC");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].when, (SeasonWeek{2025, 0}));
    EXPECT_EQ(history[0].source, RatingSource::Reversion);
    EXPECT_DOUBLE_EQ(history[0].rating, 1500.0);
}

TEST_F(TeamRatingStoreTest, ReversionFactorZeroIsNoOp) {
    TeamRatingConfig config;
    config.reversionFactor = 0.0;
    TeamRatingStore store(config);
    store.update("KC", "BUF", 27, 24, 2024, 1, false);
    double kc = store.rating("KC");

    store.regressToMean(2025);
    EXPECT_DOUBLE_EQ(store.rating("KC"), kc);
}

// ===========================================================================
// Persistence and restore
// ===========================================================================

class TeamRatingStoreFileTest : public ::testing::Test {
protected:
    TempDir tmpDir_;
};

TEST_F(TeamRatingStoreFileTest, RestoreReproducesRatingsExactly) {
    TeamRatingStore live;
    live.update("KC", "BUF", 27, 24, 2024, 1, false);
    live.update("BUF", "DAL", 31, 10, 2024, 2, false);
    live.update("DAL", "KC", 14, 14, 2024, 3, false);
    live.regressToMean(2025);
    live.update("KC", "DAL", 20, 23, 2025, 1, true);

    auto path = tmpDir_.path() / "team_history.csv";
    ASSERT_TRUE(live.saveHistory(path).hasValue());

    TeamRatingStore restored;
    EXPECT_EQ(restored.loadHistory(path), 3u);
    for (const auto& [id, value] : live.ratings()) {
        EXPECT_EQ(restored.rating(id), value) << id;
    }
    EXPECT_EQ(restored.history().records(), live.history().records());
}

TEST_F(TeamRatingStoreFileTest, UpdatesContinueAfterRestore) {
    TeamRatingStore live;
    live.update("KC", "BUF", 27, 24, 2024, 1, false);
    auto path = tmpDir_.path() / "team_history.csv";
    ASSERT_TRUE(live.saveHistory(path).hasValue());

    TeamRatingStore restored;
    restored.loadHistory(path);

    auto expected = live.update("BUF", "KC", 17, 10, 2024, 2, false);
    auto actual = restored.update("BUF", "KC", 17, 10, 2024, 2, false);
    EXPECT_EQ(actual, expected);
}

TEST_F(TeamRatingStoreFileTest, MissingHistoryStartsCold) {
    TeamRatingStore store;
    EXPECT_EQ(store.loadHistory(tmpDir_.path() / "absent.csv"), 0u);
    EXPECT_EQ(store.teamCount(), 0u);
    EXPECT_DOUBLE_EQ(store.rating("KC"), 1500.0);
}

TEST_F(TeamRatingStoreFileTest, CorruptHistoryLeavesStoreUntouched) {
    TeamRatingStore store;
    store.update("KC", "BUF", 27, 24, 2024, 1, false);
    double kc = store.rating("KC");

    auto path = tmpDir_.path() / "corrupt.csv";
    {
        std::ofstream out(path);
        out << "season,week,entity_id,rating,source\n2024,1,KC,not-a-number,game\n";
    }

    EXPECT_EQ(store.loadHistory(path), 0u);
    EXPECT_DOUBLE_EQ(store.rating("KC"), kc);
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_F(TeamRatingStoreTest, ReadersNeverSeeHalfAppliedGame) {
    constexpr int kGames = 2000;
    std::atomic<bool> done{false};
    std::atomic<int> violations{0};

    std::thread reader([&] {
        while (!done.load(std::memory_order_acquire)) {
            auto snapshot = store_.ratings();
            double sum = 0.0;
            for (const auto& [id, value] : snapshot) {
                sum += value - 1500.0;
            }
            if (std::abs(sum) > 1e-6) {
                violations.fetch_add(1);
            }
        }
    });

    for (int i = 0; i < kGames; ++i) {
        store_.update("KC", "BUF", 20 + i % 7, 17 + i % 5, 2024, 1 + i / 200, false);
    }
    done.store(true, std::memory_order_release);
    reader.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(store_.history().size(), static_cast<std::size_t>(2 * kGames));
}
