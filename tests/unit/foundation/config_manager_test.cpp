#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "ftr/foundation/config_manager.hpp"

using namespace ftr::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Unique directory per test so ctest --parallel does not collide
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("ftr_config_") + info->name());
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

TEST_F(ConfigManagerTest, LoadAndGetNestedKeys) {
    auto path = writeYaml("travel.yaml", R"(
travel:
  default_price: 150
  intermediate_scene: "LowMemory_TransitionScene"
  staged_transition: false
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto price = config.get<int64_t>("travel.default_price");
    ASSERT_TRUE(price.hasValue());
    EXPECT_EQ(price.value(), 150);
    EXPECT_EQ(config.get<std::string>("travel.intermediate_scene").value(),
              "LowMemory_TransitionScene");
    EXPECT_FALSE(config.get<bool>("travel.staged_transition").value());
}

TEST_F(ConfigManagerTest, SequencesAreLeaves) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("resolver:\n  role_types: [Hero, Avatar]\n").hasValue());

    auto types = config.get<std::vector<std::string>>("resolver.role_types");
    ASSERT_TRUE(types.hasValue());
    EXPECT_EQ(types.value(), (std::vector<std::string>{"Hero", "Avatar"}));
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("{}").hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("value: hello").hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_EQ(config.getOr<int>("value", 3), 3);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load(tmpDir_ / "missing.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYamlFails) {
    auto path = writeYaml("broken.yaml", "travel: [unterminated\n");
    ConfigManager config;
    auto result = config.load(path);
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, ScalarRootIsRejected) {
    ConfigManager config;
    auto result = config.loadString("just a string");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("a: 1\nb: 2\n").hasValue());
    ASSERT_TRUE(config.loadString("a: 5\n").hasValue());

    EXPECT_EQ(config.get<int>("a").value(), 5);
    EXPECT_FALSE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("travel.default_price", 90);

    auto result = config.get<int>("travel.default_price");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 90);
    EXPECT_TRUE(config.hasKey("travel.default_price"));
    EXPECT_FALSE(config.hasKey("travel"));
}
