#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "tsim/foundation/config_manager.hpp"

using namespace tsim::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("tsim_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename, const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("village.yaml", R"(
simulation:
  seed: 1234
  start_hour: 6
world:
  name: "Riverside"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto seed = config.get<uint32_t>("simulation.seed");
    ASSERT_TRUE(seed.hasValue());
    EXPECT_EQ(seed.value(), 1234u);

    auto name = config.get<std::string>("world.name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "Riverside");
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, LoadMalformedFile) {
    auto path = writeYaml("broken.yaml", "simulation: [1, 2");
    ConfigManager config;
    auto result = config.load(path);
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, LoadFromString) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  level: debug\n").hasValue());

    auto level = config.get<std::string>("logging.level");
    ASSERT_TRUE(level.hasValue());
    EXPECT_EQ(level.value(), "debug");
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1\nb: 2\n").hasValue());
    ASSERT_TRUE(config.loadFromString("a: 3\n").hasValue());

    EXPECT_EQ(config.get<int>("a").value(), 3);
    EXPECT_FALSE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("{}").hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("value: hello").hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, GetOrReturnsFallbackForAbsentKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("simulation:\n  seed: 9\n").hasValue());

    EXPECT_EQ(config.getOr<int>("simulation.start_hour", 8).value(), 8);
    EXPECT_EQ(config.getOr<int>("simulation.seed", 0).value(), 9);
}

TEST_F(ConfigManagerTest, GetOrStillReportsTypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("simulation:\n  seed: twelve\n").hasValue());

    auto result = config.getOr<int>("simulation.seed", 0);
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, SequencesAreKeptWhole) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
buildings:
  - { def: Farm, x: 2, y: 3 }
  - { def: Well, x: 7, y: 1 }
)").hasValue());

    ASSERT_TRUE(config.hasKey("buildings"));
    auto node = config.node("buildings");
    ASSERT_TRUE(node.hasValue());
    ASSERT_TRUE(node.value().IsSequence());
    ASSERT_EQ(node.value().size(), 2u);
    EXPECT_EQ(node.value()[1]["def"].as<std::string>(), "Well");
}

TEST_F(ConfigManagerTest, NodeForMissingKey) {
    ConfigManager config;
    auto node = config.node("pawns");
    EXPECT_TRUE(node.hasError());
    EXPECT_EQ(node.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, HasKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("key: value").hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, CopyIsIndependentSnapshot) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("world:\n  max_x: 39\n").hasValue());

    ConfigManager copy = config;
    ASSERT_TRUE(config.loadFromString("world:\n  max_x: 12\n").hasValue());

    auto copied = copy.get<int>("world.max_x");
    ASSERT_TRUE(copied.hasValue());
    EXPECT_EQ(copied.value(), 39);
    EXPECT_EQ(config.get<int>("world.max_x").value(), 12);
}
