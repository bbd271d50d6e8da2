#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "mf/foundation/config_manager.hpp"

using namespace mf::foundation;

namespace {

constexpr const char* kSampleYaml = R"(
combat:
  max_rounds: 30
  crit_chance: 0.1
fusion:
  glitch_cap_percent: 12.5
name: arena
tags: [a, b]
)";

}  // namespace

TEST(ConfigManagerTest, FlattensNestedKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml).hasValue());

    EXPECT_TRUE(config.hasKey("combat.max_rounds"));
    EXPECT_TRUE(config.hasKey("fusion.glitch_cap_percent"));
    EXPECT_FALSE(config.hasKey("combat"));

    auto keys = config.keys();
    ASSERT_EQ(keys.size(), 5u);
    EXPECT_EQ(keys.front(), "combat.crit_chance");
    EXPECT_EQ(keys.back(), "tags");
}

TEST(ConfigManagerTest, TypedGet) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml).hasValue());

    auto rounds = config.get<int32_t>("combat.max_rounds");
    ASSERT_TRUE(rounds.hasValue());
    EXPECT_EQ(rounds.value(), 30);

    auto crit = config.get<double>("combat.crit_chance");
    ASSERT_TRUE(crit.hasValue());
    EXPECT_DOUBLE_EQ(crit.value(), 0.1);

    auto name = config.get<std::string>("name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "arena");
}

TEST(ConfigManagerTest, MissingKeyAndTypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml).hasValue());

    auto missing = config.get<int32_t>("combat.max_team_size");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);

    auto wrong = config.get<int32_t>("name");
    ASSERT_TRUE(wrong.hasError());
    EXPECT_EQ(wrong.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigManagerTest, SetOverridesValue) {
    ConfigManager config;
    config.set("combat.max_rounds", 12);
    auto rounds = config.get<int32_t>("combat.max_rounds");
    ASSERT_TRUE(rounds.hasValue());
    EXPECT_EQ(rounds.value(), 12);
}

TEST(ConfigManagerTest, RejectsNonMappingRoot) {
    ConfigManager config;
    auto result = config.loadFromString("- just\n- a list\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, RejectsMalformedYaml) {
    ConfigManager config;
    auto result = config.loadFromString("combat: [unterminated");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, LoadReplacesPreviousEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml).hasValue());
    ASSERT_TRUE(config.loadFromString("rating:\n  decay_amount: 5\n").hasValue());
    EXPECT_FALSE(config.hasKey("combat.max_rounds"));
    EXPECT_TRUE(config.hasKey("rating.decay_amount"));
}

TEST(ConfigManagerTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "mf_config_manager_test.yaml";
    {
        std::ofstream out(path);
        out << kSampleYaml;
    }

    ConfigManager config;
    auto result = config.load(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(config.hasKey("fusion.glitch_cap_percent"));
}

TEST(ConfigManagerTest, MissingFileFails) {
    ConfigManager config;
    auto result = config.load("/nonexistent/mf/engine.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}
