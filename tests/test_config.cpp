#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <memory>
#include "../src/core/config.hpp"
#include "../src/core/logger.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfigFile(const std::string& content) {
        auto config_path = test_dir / "test_config.ini";
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    std::filesystem::path test_dir;
};

// Test default values without a config file
TEST_F(ConfigTest, DefaultValues) {
    Config::AppConfig config;
    EXPECT_EQ(config.characters_path, "data/characters.json");
    EXPECT_TRUE(config.load_model_on_startup);
    EXPECT_EQ(config.decision_tree.max_depth, 10);
    EXPECT_EQ(config.decision_tree.min_samples_split, 2);
    EXPECT_EQ(config.decision_tree.min_samples_leaf, 1);
    EXPECT_EQ(config.decision_tree.max_text_features, 50u);
    EXPECT_DOUBLE_EQ(config.decision_tree.test_size, 0.2);
    EXPECT_EQ(config.decision_tree.random_seed, 42u);
    EXPECT_EQ(config.server.port, 5000);
    EXPECT_EQ(config.prometheus.metrics_path, "/metrics");
    EXPECT_EQ(config.logging.log_levels.at(LogComponent::CORE), LogLevel::INFO);
    EXPECT_EQ(config.logging.log_levels.at(LogComponent::IO_SERVER), LogLevel::WARN);
}

// Test general and DecisionTree section parsing
TEST_F(ConfigTest, DecisionTreeConfigParsing) {
    std::string config_content = R"(
characters_path = /srv/charactle/characters.json
model_path = /srv/charactle/dt.cbor
train_on_startup = false

[DecisionTree]
max_depth = 6
min_samples_split = 4
min_samples_leaf = 2
max_text_features = 80
test_size = 0.25
random_seed = 7
max_cv_folds = 3
min_samples_for_cv = 20
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->characters_path, "/srv/charactle/characters.json");
    EXPECT_EQ(config->model_path, "/srv/charactle/dt.cbor");
    EXPECT_FALSE(config->train_on_startup);
    EXPECT_EQ(config->decision_tree.max_depth, 6);
    EXPECT_EQ(config->decision_tree.min_samples_split, 4);
    EXPECT_EQ(config->decision_tree.min_samples_leaf, 2);
    EXPECT_EQ(config->decision_tree.max_text_features, 80u);
    EXPECT_DOUBLE_EQ(config->decision_tree.test_size, 0.25);
    EXPECT_EQ(config->decision_tree.random_seed, 7u);
    EXPECT_EQ(config->decision_tree.max_cv_folds, 3u);
    EXPECT_EQ(config->decision_tree.min_samples_for_cv, 20u);
}

// Test Server and Prometheus section parsing
TEST_F(ConfigTest, ServerAndPrometheusConfigParsing) {
    std::string config_content = R"(
[Server]
enabled = yes
host = 127.0.0.1
port = 8080
default_top_k = 3

[Prometheus]
enabled = false
metrics_path = /custom/metrics
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_TRUE(config->server.enabled);
    EXPECT_EQ(config->server.host, "127.0.0.1");
    EXPECT_EQ(config->server.port, 8080);
    EXPECT_EQ(config->server.default_top_k, 3u);
    EXPECT_FALSE(config->prometheus.enabled);
    EXPECT_EQ(config->prometheus.metrics_path, "/custom/metrics");
}

// Test per-component and wildcard log levels
TEST_F(ConfigTest, LoggingConfigParsing) {
    std::string config_content = R"(
[Logging]
default_level = ERROR
ml.* = DEBUG
io.server = TRACE
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto levels = manager.get_config()->logging.log_levels;
    EXPECT_EQ(levels.at(LogComponent::CORE), LogLevel::ERROR);
    EXPECT_EQ(levels.at(LogComponent::ML_TRAINING), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::ML_INTROSPECTION), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::IO_SERVER), LogLevel::TRACE);
    EXPECT_EQ(levels.at(LogComponent::STATE_PERSIST), LogLevel::ERROR);
}

// Test configuration validation
TEST_F(ConfigTest, ConfigValidation) {
    std::string invalid_config = R"(
[DecisionTree]
test_size = 1.5
min_samples_split = 1

[Server]
port = 70000
)";

    std::string config_file = createTestConfigFile(invalid_config);
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration(config_file));

    // Failed loads keep the previous (default) configuration
    EXPECT_DOUBLE_EQ(manager.get_config()->decision_tree.test_size, 0.2);

    std::vector<std::string> errors;
    Config::DecisionTreeConfig dt;
    dt.max_cv_folds = 1;
    EXPECT_FALSE(Config::validate_decision_tree_config(dt, errors));
    EXPECT_EQ(errors.size(), 1u);
}

// Test that a missing file is reported
TEST_F(ConfigTest, MissingFile) {
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration((test_dir / "nope.ini").string()));
}
