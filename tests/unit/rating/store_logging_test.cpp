/// @file store_logging_test.cpp
/// @brief Rating stores must not call into the host logger while holding
///        their writer lock.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "sre/foundation/rating_logger.hpp"
#include "sre/rating/player_rating_store.hpp"
#include "sre/rating/team_rating_store.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace sre::rating;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;
using sre::foundation::LogCategory;
using sre::foundation::LogLevel;
using sre::foundation::Position;
using sre::foundation::RatingLogger;
using sre::foundation::SeasonWeek;

namespace {

// ---------------------------------------------------------------------------
// ReentrantLogger: on every message, reads a store from another thread and
// records whether that read completed while log() was still running.
// ---------------------------------------------------------------------------

class ReentrantLogger : public ILogger {
public:
    void setReader(std::function<void()> reader) {
        std::lock_guard lock(mutex_);
        reader_ = std::move(reader);
    }

    kcenon::common::VoidResult log(log_level /*level*/, const std::string& message) override {
        std::function<void()> reader;
        {
            std::lock_guard lock(mutex_);
            reader = reader_;
        }
        if (reader) {
            std::promise<void> done;
            auto finished = done.get_future();
            std::thread worker([reader, done = std::move(done)]() mutable {
                reader();
                done.set_value();
            });
            bool completed =
                finished.wait_for(std::chrono::seconds(2)) == std::future_status::ready;

            std::lock_guard lock(mutex_);
            workers_.push_back(std::move(worker));
            ++checked_;
            if (!completed) {
                blocked_.push_back(message);
            }
        }
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level /*level*/) const override { return true; }

    kcenon::common::VoidResult set_level(log_level /*level*/) override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return log_level::trace; }

    kcenon::common::VoidResult flush() override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    /// Wait for every reader thread. Call before the store goes away.
    void joinAll() {
        std::vector<std::thread> workers;
        {
            std::lock_guard lock(mutex_);
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    std::size_t checked() const {
        std::lock_guard lock(mutex_);
        return checked_;
    }

    std::vector<std::string> blocked() const {
        std::lock_guard lock(mutex_);
        return blocked_;
    }

private:
    mutable std::mutex mutex_;
    std::function<void()> reader_;
    std::vector<std::thread> workers_;
    std::vector<std::string> blocked_;
    std::size_t checked_ = 0;
};

} // namespace

class StoreLoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        logger_ = std::make_shared<ReentrantLogger>();
        registry.set_default_logger(logger_);

        auto& rating = RatingLogger::instance();
        savedTeam_ = rating.getCategoryLevel(LogCategory::Team);
        savedPlayer_ = rating.getCategoryLevel(LogCategory::Player);
        rating.setCategoryLevel(LogCategory::Team, LogLevel::Debug);
        rating.setCategoryLevel(LogCategory::Player, LogLevel::Debug);
    }

    void TearDown() override {
        logger_->joinAll();
        auto& rating = RatingLogger::instance();
        rating.setCategoryLevel(LogCategory::Team, savedTeam_);
        rating.setCategoryLevel(LogCategory::Player, savedPlayer_);
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<ReentrantLogger> logger_;
    LogLevel savedTeam_ = LogLevel::Info;
    LogLevel savedPlayer_ = LogLevel::Info;
};

TEST_F(StoreLoggingTest, TeamWritesLogAfterReleasingLock) {
    TeamRatingStore store;
    logger_->setReader([&store] { (void)store.rating("KC"); });

    store.initialize({"KC", "BUF"});
    store.update("KC", "BUF", 27, 24, 2024, 1, false);

    GameOutcome game;
    game.homeTeam = "BUF";
    game.awayTeam = "KC";
    game.homeScore = 20;
    game.awayScore = 17;
    game.when = SeasonWeek{2024, 2};
    ASSERT_TRUE(store.apply(game).has_value());

    store.regressToMean(2025);

    logger_->joinAll();
    EXPECT_GE(logger_->checked(), 4u);
    EXPECT_TRUE(logger_->blocked().empty())
        << "logged under the writer lock: " << logger_->blocked().front();
}

TEST_F(StoreLoggingTest, PlayerWritesLogAfterReleasingLock) {
    PlayerRatingStore store;
    logger_->setReader([&store] { (void)store.rating("QB1"); });

    std::vector<PlayerPerformance> entries = {
        {"QB1", Position::QB, 1.0, 0.7},
        {"WR1", Position::WR, 1.4, 0.5},
        {"", Position::RB, 0.5, 0.5},
    };
    EXPECT_EQ(store.applyPerformances(entries, 1000.0, SeasonWeek{2024, 1}), 1u);
    store.regressInactive(2024, 9);

    logger_->joinAll();
    EXPECT_GE(logger_->checked(), 3u);
    EXPECT_TRUE(logger_->blocked().empty())
        << "logged under the writer lock: " << logger_->blocked().front();
}
