#include "../../src/config/config.hpp"

#include "../../src/common/errors.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace prereq;

namespace fs = std::filesystem;

// ============================================================
// テストヘルパー
// ============================================================
class ConfigTest : public ::testing::Test {
   protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("prereq_config_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_ / "nested" / "deeper");
    }

    void TearDown() override { fs::remove_all(dir_); }

    void write_config(const fs::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    fs::path dir_;
};

// ============================================================
// 読み込み
// ============================================================
TEST_F(ConfigTest, LoadAllSections) {
    write_config(dir_ / ".prereq.yml", R"(# prereq settings
log:
  debug: true
  level: trace
  lang: ja

batch:
  threads: 4   # ワーカー数

serializer:
  max_depth: 16
)");

    config::ConfigLoader loader;
    ASSERT_TRUE(loader.load((dir_ / ".prereq.yml").string()));
    EXPECT_TRUE(loader.is_loaded());

    const auto& settings = loader.settings();
    EXPECT_TRUE(settings.debug);
    EXPECT_EQ(settings.level, debug::Level::Trace);
    EXPECT_EQ(settings.lang, 1);
    EXPECT_EQ(settings.threads, 4u);
    EXPECT_EQ(settings.max_depth, 16u);
    EXPECT_EQ(settings.parse_options().max_depth, 16u);
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    config::ConfigLoader loader;
    EXPECT_FALSE(loader.load((dir_ / "absent.yml").string()));
    EXPECT_FALSE(loader.is_loaded());
    EXPECT_FALSE(loader.settings().debug);
    EXPECT_EQ(loader.settings().threads, 1u);
    EXPECT_EQ(loader.settings().max_depth, 64u);
}

TEST_F(ConfigTest, InvalidNumbersKeepDefaults) {
    write_config(dir_ / ".prereq.yml", "batch:\n  threads: many\nserializer:\n  max_depth: -3\n");

    config::ConfigLoader loader;
    ASSERT_TRUE(loader.load((dir_ / ".prereq.yml").string()));
    EXPECT_EQ(loader.settings().threads, 1u);
    EXPECT_EQ(loader.settings().max_depth, 64u);
}

// ============================================================
// 探索
// ============================================================
TEST_F(ConfigTest, FindInParentDirectory) {
    write_config(dir_ / ".prereq.yml", "batch:\n  threads: 2\n");

    config::ConfigLoader loader;
    ASSERT_TRUE(loader.find_and_load((dir_ / "nested" / "deeper").string()));
    EXPECT_EQ(loader.settings().threads, 2u);
    EXPECT_EQ(fs::path(loader.config_path()), dir_ / ".prereq.yml");
}

TEST_F(ConfigTest, ApplyDebugSettings) {
    write_config(dir_ / ".prereq.yml", "log:\n  debug: true\n  level: warn\n");

    config::ConfigLoader loader;
    ASSERT_TRUE(loader.load((dir_ / ".prereq.yml").string()));
    loader.apply_debug_settings();

    EXPECT_TRUE(debug::g_debug_mode);
    EXPECT_EQ(debug::g_debug_level, debug::Level::Warn);
    EXPECT_FALSE(debug::enabled(debug::Level::Info));
    EXPECT_TRUE(debug::enabled(debug::Level::Error));

    // 他のテストへ影響しないよう戻す
    debug::set_debug_mode(false);
    debug::set_level(debug::Level::Debug);
}
