#include "core/Config.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <random>

namespace fs = std::filesystem;
using courier::core::Config;
using courier::core::json;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().reset();
        std::random_device rd;
        directory = fs::temp_directory_path() / ("courier_config_" + std::to_string(rd()));
        fs::create_directories(directory);
    }

    void TearDown() override {
        Config::instance().reset();
        std::error_code ec;
        fs::remove_all(directory, ec);
    }

    fs::path directory;
};

TEST_F(ConfigTest, ProvidesDefaults) {
    auto& config = Config::instance();
    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 4);
    EXPECT_EQ(config.get<int64_t>("retry.baseDelayMs"), 1000);
    EXPECT_DOUBLE_EQ(config.get<double>("retry.jitter"), 0.2);
    EXPECT_EQ(config.get<std::string>("logging.level"), "info");
    EXPECT_EQ(config.get<size_t>("history.finishedTasks"), 256u);
}

TEST_F(ConfigTest, FallsBackOnMissingOrMistypedKeys) {
    auto& config = Config::instance();
    EXPECT_EQ(config.get<int>("downloads.unknown", 7), 7);
    EXPECT_EQ(config.get<int>("logging.level", 3), 3);
}

TEST_F(ConfigTest, SetHasRemove) {
    auto& config = Config::instance();
    config.set("events.dispatchThreads", 6);
    config.set("extra.nested.flag", true);

    EXPECT_EQ(config.get<size_t>("events.dispatchThreads"), 6u);
    EXPECT_TRUE(config.has("extra.nested.flag"));

    EXPECT_TRUE(config.remove("extra.nested.flag"));
    EXPECT_FALSE(config.remove("extra.nested.flag"));
    EXPECT_FALSE(config.has("extra.nested.flag"));
}

TEST_F(ConfigTest, MergeKeepsUntouchedKeys) {
    auto& config = Config::instance();
    config.merge(json{{"retry", {{"multiplier", 3.0}}}});

    EXPECT_DOUBLE_EQ(config.get<double>("retry.multiplier"), 3.0);
    EXPECT_EQ(config.get<int64_t>("retry.maxDelayMs"), 60000);
}

TEST_F(ConfigTest, LoadPatchesDefaults) {
    auto path = directory / "config.json";
    std::ofstream(path) << R"({"downloads": {"timeoutMs": 5000}})";

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.get<int64_t>("downloads.timeoutMs"), 5000);
    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 4);
}

TEST_F(ConfigTest, RejectsBadFiles) {
    auto& config = Config::instance();
    EXPECT_FALSE(config.load(directory / "missing.json"));

    auto path = directory / "broken.json";
    std::ofstream(path) << "[1, 2";
    EXPECT_FALSE(config.load(path));
    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 4);
}

TEST_F(ConfigTest, SaveThenLoad) {
    auto path = directory / "nested" / "config.json";
    auto& config = Config::instance();
    config.set("logging.level", std::string("debug"));
    ASSERT_TRUE(config.save(path));

    config.reset();
    EXPECT_FALSE(config.save());
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.get<std::string>("logging.level"), "debug");
    EXPECT_TRUE(config.save());
}
