// EN: Unit tests for ConfigManager - YAML loading, typed values, validation and environment overrides.
// FR: Tests unitaires pour ConfigManager - chargement YAML, valeurs typées, validation et surcharges d'environnement.

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "loopsaver/infrastructure/config/config_manager.hpp"
#include "loopsaver/infrastructure/logging/logger.hpp"

using namespace LSV;

namespace {

const std::string kTestYaml = R"(
checkpoint:
  safe: true
  compression_level: 6
  directory: ${LSV_TEST_CHECKPOINT_DIR}/runs
  quoted: "42"
  ratio: 0.75
  backends:
    - json
    - yaml

logging:
  level: info
)";

} // namespace

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);
        ConfigManager::getInstance().reset();
        setenv("LSV_TEST_CHECKPOINT_DIR", "/var/lib/loopsaver", 1);
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        unsetenv("LSV_TEST_CHECKPOINT_DIR");
        unsetenv("LSV_LOGGING_LEVEL");
    }
};

TEST_F(ConfigManagerTest, BasicOperations_ShouldStoreTypedValues) {
    auto& config = ConfigManager::getInstance();
    config.set("checkpoint", "path", ConfigValue(std::string("/tmp/ckpt")));
    config.set("checkpoint", "retries", ConfigValue(3));

    EXPECT_TRUE(config.has("checkpoint", "path"));
    EXPECT_EQ(config.get("checkpoint", "path").as<std::string>(), "/tmp/ckpt");
    EXPECT_EQ(config.get("checkpoint", "retries").as<int>(), 3);
    EXPECT_EQ(config.get("checkpoint", "retries").tryAs<int>(), 3);
    EXPECT_FALSE(config.get("checkpoint", "retries").tryAs<bool>().has_value());
    EXPECT_THROW(config.get("checkpoint", "retries").as<std::string>(), std::bad_variant_access);

    EXPECT_FALSE(config.has("checkpoint", "owner"));
    EXPECT_FALSE(config.has("logging", "path"));
    EXPECT_FALSE(config.get("checkpoint", "owner").isValid());
    EXPECT_FALSE(config.get("checkpoint", "owner").tryAs<int>().has_value());
    EXPECT_THROW(config.get("checkpoint", "owner").as<int>(), std::runtime_error);
}

TEST_F(ConfigManagerTest, LoadFromString_ShouldParseScalarsSequencesAndVariables) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kTestYaml));

    EXPECT_TRUE(config.get("checkpoint", "safe").as<bool>());
    EXPECT_EQ(config.get("checkpoint", "compression_level").as<int>(), 6);
    EXPECT_DOUBLE_EQ(config.get("checkpoint", "ratio").as<double>(), 0.75);
    EXPECT_EQ(config.get("checkpoint", "directory").as<std::string>(), "/var/lib/loopsaver/runs");

    // EN: Quoted scalars stay strings
    // FR: Les scalaires entre guillemets restent des chaînes
    EXPECT_EQ(config.get("checkpoint", "quoted").tryAs<std::string>(), std::string("42"));
    EXPECT_FALSE(config.get("checkpoint", "quoted").tryAs<int>().has_value());

    auto backends = config.get("checkpoint", "backends").as<std::vector<std::string>>();
    EXPECT_EQ(backends, (std::vector<std::string>{"json", "yaml"}));

    // EN: Unset variables are left verbatim
    // FR: Les variables absentes restent telles quelles
    ASSERT_TRUE(config.loadFromString("checkpoint:\n  directory: ${LSV_TEST_UNSET_VAR}/x\n"));
    EXPECT_EQ(config.get("checkpoint", "directory").as<std::string>(), "${LSV_TEST_UNSET_VAR}/x");
    EXPECT_FALSE(config.has("logging", "level"));
}

TEST_F(ConfigManagerTest, LoadFromString_ShouldFailOnMalformedYaml) {
    EXPECT_FALSE(ConfigManager::getInstance().loadFromString("checkpoint: [unclosed"));
}

TEST_F(ConfigManagerTest, LoadFromFile_ShouldFailOnMissingFile) {
    EXPECT_FALSE(ConfigManager::getInstance().loadFromFile("/nonexistent/loopsaver.yaml"));
}

TEST_F(ConfigManagerTest, SaveThenLoad_ShouldRoundTripThroughFile) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kTestYaml));

    auto file = std::filesystem::temp_directory_path() / "lsv_config_roundtrip.yaml";
    ASSERT_TRUE(config.saveToFile(file.string()));

    config.reset();
    ASSERT_TRUE(config.loadFromFile(file.string()));
    EXPECT_EQ(config.get("checkpoint", "compression_level").as<int>(), 6);
    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "info");
    EXPECT_EQ(config.get("checkpoint", "backends").as<std::vector<std::string>>().size(), 2u);

    std::filesystem::remove(file);
}

TEST_F(ConfigManagerTest, Validate_ShouldCheckTypesRangesAndRequiredKeys) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kTestYaml));

    ConfigManager::ValidationRule level_rule;
    level_rule.key = "checkpoint.compression_level";
    level_rule.type = "int";
    level_rule.min_value = -1;
    level_rule.max_value = 9;

    ConfigManager::ValidationRule log_rule;
    log_rule.key = "logging.level";
    log_rule.type = "string";
    log_rule.allowed_values = {"debug", "info", "warn", "error"};

    ConfigManager::ValidationRule required_rule;
    required_rule.key = "checkpoint.owner";
    required_rule.type = "string";
    required_rule.required = true;

    config.addValidationRules({level_rule, log_rule});

    std::vector<std::string> errors;
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());

    config.set("checkpoint", "compression_level", ConfigValue(10));
    config.set("logging", "level", ConfigValue(std::string("trace")));
    config.addValidationRules({required_rule});

    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.size(), 3u);
}

TEST_F(ConfigManagerTest, EnvironmentOverrides_ShouldParseByRuleType) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kTestYaml));

    ConfigManager::ValidationRule rule;
    rule.key = "logging.level";
    rule.type = "string";
    config.addValidationRules({rule});

    setenv("LSV_LOGGING_LEVEL", "debug", 1);
    EXPECT_EQ(config.loadEnvironmentOverrides(), 1u);
    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "debug");
}

TEST_F(ConfigManagerTest, EnvironmentOverrides_ShouldIgnoreValuesOfTheWrongType) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kTestYaml));

    ConfigManager::ValidationRule rule;
    rule.key = "checkpoint.compression_level";
    rule.type = "int";
    config.addValidationRules({rule});

    setenv("LSV_CHECKPOINT_COMPRESSION_LEVEL", "fast", 1);
    EXPECT_EQ(config.loadEnvironmentOverrides(), 0u);
    EXPECT_EQ(config.get("checkpoint", "compression_level").as<int>(), 6);

    setenv("LSV_CHECKPOINT_COMPRESSION_LEVEL", "9", 1);
    EXPECT_EQ(config.loadEnvironmentOverrides(), 1u);
    EXPECT_EQ(config.get("checkpoint", "compression_level").as<int>(), 9);
    unsetenv("LSV_CHECKPOINT_COMPRESSION_LEVEL");
}
