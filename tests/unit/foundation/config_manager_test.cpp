#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "sre/foundation/config_manager.hpp"

using namespace sre::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("sre_config_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("engine.yaml", R"(
elo:
  team:
    k_factor: 24.0
    home_advantage: 55
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto k = config.get<double>("elo.team.k_factor");
    ASSERT_TRUE(k.hasValue());
    EXPECT_DOUBLE_EQ(k.value(), 24.0);

    auto hfa = config.get<int>("elo.team.home_advantage");
    ASSERT_TRUE(hfa.hasValue());
    EXPECT_EQ(hfa.value(), 55);
}

TEST_F(ConfigManagerTest, LoadString) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("runner:\n  regress_inactive_on_new_week: true\n").hasValue());

    auto flag = config.get<bool>("runner.regress_inactive_on_new_week");
    ASSERT_TRUE(flag.hasValue());
    EXPECT_TRUE(flag.value());
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("a: 1\nb: 2\n").hasValue());
    ASSERT_TRUE(config.loadString("a: 3\n").hasValue());

    EXPECT_EQ(config.get<int>("a").value(), 3);
    EXPECT_FALSE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("{}").hasValue());

    auto result = config.get<int>("elo.team.k_factor");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("value: hello").hasValue());

    auto result = config.get<double>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load(tmpDir_ / "missing.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
    EXPECT_EQ(result.error().subsystem(), "Config");
}

TEST_F(ConfigManagerTest, LoadMalformedYaml) {
    auto path = writeYaml("broken.yaml", "elo: [unclosed\n");
    ConfigManager config;
    auto result = config.load(path);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, HasKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("key: value").hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, ChildKeysListsDirectChildrenSorted) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
elo:
  player:
    k_factors:
      WR: 20
      QB: 32
      OL: 15
    initial_rating: 1000
)").hasValue());

    auto names = config.childKeys("elo.player.k_factors");
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "OL");
    EXPECT_EQ(names[1], "QB");
    EXPECT_EQ(names[2], "WR");

    auto player = config.childKeys("elo.player");
    ASSERT_EQ(player.size(), 2u);
    EXPECT_EQ(player[0], "initial_rating");
    EXPECT_EQ(player[1], "k_factors");

    EXPECT_TRUE(config.childKeys("elo.team").empty());
}
