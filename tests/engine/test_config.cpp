/**
 * @file test_config.cpp
 * @brief Unit tests for the JSON configuration layer
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "config/Config.hpp"

#include "utils/TestHelpers.hpp"

#include <filesystem>
#include <fstream>

using namespace Lattice;
using namespace Lattice::Test;

namespace {

std::filesystem::path ScratchPath(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "lattice_tests";
    std::filesystem::create_directories(dir);
    return dir / name;
}

} // namespace

// =============================================================================
// Get / Set
// =============================================================================

TEST(ConfigTest, GetReturnsDefaultWhenMissing) {
    Config config;

    EXPECT_EQ(42, config.Get<int>("server.port", 42));
    EXPECT_EQ("fallback", config.Get<std::string>("a.b.c", "fallback"));
    EXPECT_FALSE(config.Has("server.port"));
}

TEST(ConfigTest, SetCreatesIntermediateObjects) {
    Config config;
    config.Set("server.network.port", 7777);

    EXPECT_TRUE(config.Has("server"));
    EXPECT_TRUE(config.Has("server.network"));
    EXPECT_EQ(7777, config.Get<int>("server.network.port", 0));
}

TEST(ConfigTest, MistypedValueFallsBackToDefault) {
    Config config;
    ASSERT_TRUE(config.LoadFromString(R"({"server": {"name": 12}})"));

    EXPECT_EQ("default", config.Get<std::string>("server.name", "default"));
}

TEST(ConfigTest, Vec3RoundTrip) {
    Config config;
    config.Set("world.spawn", glm::vec3(1.0f, 2.5f, -3.0f));

    EXPECT_VEC3_EQ(glm::vec3(1.0f, 2.5f, -3.0f), config.Get<glm::vec3>("world.spawn"));
}

TEST(ConfigTest, Vec3TooShortFallsBackToDefault) {
    Config config;
    ASSERT_TRUE(config.LoadFromString(R"({"world": {"spawn": [1, 2]}})"));

    EXPECT_VEC3_EQ(glm::vec3(9.0f), config.Get<glm::vec3>("world.spawn", glm::vec3(9.0f)));
}

TEST(ConfigTest, PathThroughScalarIsMissing) {
    Config config;
    ASSERT_TRUE(config.LoadFromString(R"({"server": 5})"));

    EXPECT_FALSE(config.Has("server.port"));
    EXPECT_EQ(1, config.Get<int>("server.port", 1));
}

// =============================================================================
// Load / Save
// =============================================================================

TEST(ConfigTest, LoadMissingFileReportsFileNotFound) {
    Config config;
    auto result = config.Load(ScratchPath("does_not_exist.json"));

    ASSERT_FALSE(result);
    EXPECT_EQ(ConfigError::FileNotFound, result.error());
}

TEST(ConfigTest, LoadMalformedFileReportsParseError) {
    auto path = ScratchPath("malformed.json");
    {
        std::ofstream file(path);
        file << "{ \"server\": ";
    }

    Config config;
    auto result = config.Load(path);

    ASSERT_FALSE(result);
    EXPECT_EQ(ConfigError::ParseError, result.error());
}

TEST(ConfigTest, LoadFromStringRejectsGarbage) {
    Config config;
    auto result = config.LoadFromString("not json at all");

    ASSERT_FALSE(result);
    EXPECT_EQ(ConfigError::ParseError, result.error());
}

TEST(ConfigTest, SaveThenLoad) {
    auto path = ScratchPath("roundtrip.json");

    Config written;
    written.Set("server.port", 6000);
    written.Set("logging.level", std::string("debug"));
    ASSERT_TRUE(written.Save(path));

    Config read;
    ASSERT_TRUE(read.Load(path));
    EXPECT_EQ(6000, read.Get<int>("server.port", 0));
    EXPECT_EQ("debug", read.Get<std::string>("logging.level", ""));
}

TEST(ConfigTest, SaveWithoutPathFails) {
    Config config;
    auto result = config.Save();

    ASSERT_FALSE(result);
    EXPECT_EQ(ConfigError::FileNotFound, result.error());
}

TEST(ConfigTest, CreateDefaultCoversEverySection) {
    auto path = ScratchPath("defaults.json");
    ASSERT_TRUE(Config::CreateDefault(path));

    Config config;
    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(5000, config.Get<int>("server.port", 0));
    EXPECT_EQ(64, config.Get<int>("server.max_clients", 0));
    EXPECT_EQ("127.0.0.1", config.Get<std::string>("client.server_address", ""));
    EXPECT_EQ(16, config.Get<int>("world.view_distance", 0));
    EXPECT_EQ("info", config.Get<std::string>("logging.level", ""));
}

TEST(ConfigTest, ErrorStrings) {
    EXPECT_STREQ("file not found", ConfigErrorToString(ConfigError::FileNotFound));
    EXPECT_STREQ("parse error", ConfigErrorToString(ConfigError::ParseError));
    EXPECT_STREQ("write error", ConfigErrorToString(ConfigError::WriteError));
}
