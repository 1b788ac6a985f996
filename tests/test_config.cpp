#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>
#include "shmkv/config.hpp"
#include "shmkv/layout.hpp"

using namespace shmkv;
namespace fs = std::filesystem;

namespace {
fs::path WriteTempConfig(const std::string& name, const std::string& contents) {
    fs::path path = fs::temp_directory_path() / ("shmkv_" + std::to_string(::getpid()) + "_" + name + ".json");
    std::ofstream out(path);
    out << contents;
    return path;
}
} // namespace

TEST(ConfigTest, DefaultsWithoutFile) {
    Config config = Config::Defaults();
    EXPECT_EQ(config.read_segment_name(), DEFAULT_SEGMENT_NAME);
    EXPECT_FALSE(config.read_verbose());
    EXPECT_EQ(config.read_poll_interval_ms(), 1000);
    EXPECT_TRUE(config.read_seed().empty());
    EXPECT_TRUE(config.read_watch_keys().empty());
}

TEST(ConfigTest, ReadsAllKeysFromFile) {
    fs::path path = WriteTempConfig("full", R"({
        "segment_name": "custom_store",
        "verbose": true,
        "poll_interval_ms": 250,
        "seed": {"username": "john_doe", "age": "25"},
        "watch_keys": ["username", "missing"]
    })");

    Config config(path.string());
    EXPECT_EQ(config.read_segment_name(), "custom_store");
    EXPECT_TRUE(config.read_verbose());
    EXPECT_EQ(config.read_poll_interval_ms(), 250);

    auto seed = config.read_seed();
    ASSERT_EQ(seed.size(), 2u);
    EXPECT_EQ(seed[0].first, "username");
    EXPECT_EQ(seed[0].second, "john_doe");
    EXPECT_EQ(seed[1].first, "age");
    EXPECT_EQ(seed[1].second, "25");

    auto watch = config.read_watch_keys();
    ASSERT_EQ(watch.size(), 2u);
    EXPECT_EQ(watch[0], "username");
    EXPECT_EQ(watch[1], "missing");

    fs::remove(path);
}

TEST(ConfigTest, SeedKeepsFileOrder) {
    fs::path path = WriteTempConfig("order", R"({
        "seed": {"username": "john_doe", "email": "john@example.com", "age": "25", "city": "New York"}
    })");

    Config config(path.string());
    auto seed = config.read_seed();
    ASSERT_EQ(seed.size(), 4u);
    EXPECT_EQ(seed[0].first, "username");
    EXPECT_EQ(seed[1].first, "email");
    EXPECT_EQ(seed[2].first, "age");
    EXPECT_EQ(seed[3].first, "city");

    fs::remove(path);
}

TEST(ConfigTest, SeedMustBeObject) {
    Config config = Config::FromJson({{"seed", nlohmann::ordered_json::array({"a", "b"})}});
    EXPECT_THROW(config.read_seed(), std::runtime_error);
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(Config("/nonexistent/shmkv.json"), std::runtime_error);
}

TEST(ConfigTest, MalformedJsonThrows) {
    fs::path path = WriteTempConfig("malformed", "{ \"segment_name\": ");
    EXPECT_THROW({ Config config(path.string()); }, nlohmann::json::exception);
    fs::remove(path);
}

TEST(ConfigTest, WrongTypesThrow) {
    Config config = Config::FromJson({{"verbose", "yes"}, {"seed", {{"k", 1}}}});
    EXPECT_THROW(config.read_verbose(), nlohmann::json::exception);
    EXPECT_THROW(config.read_seed(), nlohmann::json::exception);
}

TEST(ConfigTest, NonPositivePollIntervalThrows) {
    Config config = Config::FromJson({{"poll_interval_ms", 0}});
    EXPECT_THROW(config.read_poll_interval_ms(), std::runtime_error);
}

TEST(ConfigTest, RootMustBeObject) {
    EXPECT_THROW(Config::FromJson(nlohmann::ordered_json::array({1, 2})), std::runtime_error);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
