#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *CHARACTERS_PATH = "characters_path";
constexpr const char *MODEL_PATH = "model_path";
constexpr const char *LOAD_MODEL_ON_STARTUP = "load_model_on_startup";
constexpr const char *TRAIN_ON_STARTUP = "train_on_startup";
constexpr const char *SAVE_MODEL_AFTER_TRAINING = "save_model_after_training";

// Decision Tree Settings
constexpr const char *DT_MAX_DEPTH = "max_depth";
constexpr const char *DT_MIN_SAMPLES_SPLIT = "min_samples_split";
constexpr const char *DT_MIN_SAMPLES_LEAF = "min_samples_leaf";
constexpr const char *DT_MAX_TEXT_FEATURES = "max_text_features";
constexpr const char *DT_TEST_SIZE = "test_size";
constexpr const char *DT_RANDOM_SEED = "random_seed";
constexpr const char *DT_MAX_CV_FOLDS = "max_cv_folds";
constexpr const char *DT_MIN_SAMPLES_FOR_CV = "min_samples_for_cv";

// Server Settings
constexpr const char *SERVER_ENABLED = "enabled";
constexpr const char *SERVER_HOST = "host";
constexpr const char *SERVER_PORT = "port";
constexpr const char *SERVER_DEFAULT_TOP_K = "default_top_k";

// Prometheus Settings
constexpr const char *PROMETHEUS_ENABLED = "enabled";
constexpr const char *PROMETHEUS_METRICS_PATH = "metrics_path";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct DecisionTreeConfig {
  int max_depth = 10; // 0 means unlimited
  int min_samples_split = 2;
  int min_samples_leaf = 1;
  size_t max_text_features = 50;
  double test_size = 0.2;
  uint32_t random_seed = 42;
  size_t max_cv_folds = 5;
  size_t min_samples_for_cv = 10;
};

struct ServerConfig {
  bool enabled = true;
  std::string host = "0.0.0.0";
  int port = 5000;
  size_t default_top_k = 5;
};

struct PrometheusConfig {
  bool enabled = true;
  std::string metrics_path = "/metrics";
};

struct AppConfig {
  std::string characters_path = "data/characters.json";
  std::string model_path = "models/decision_tree_model.cbor";
  bool load_model_on_startup = true;
  bool train_on_startup = true;
  bool save_model_after_training = true;

  DecisionTreeConfig decision_tree;
  ServerConfig server;
  PrometheusConfig prometheus;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig();
};

// Validation functions for configuration parameters
bool validate_decision_tree_config(const DecisionTreeConfig &config,
                                   std::vector<std::string> &errors);
bool validate_server_config(const ServerConfig &config,
                            std::vector<std::string> &errors);
bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
