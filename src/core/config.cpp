#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.reader", LogComponent::IO_READER},
    {"io.server", LogComponent::IO_SERVER},
    {"ml.features", LogComponent::ML_FEATURES},
    {"ml.training", LogComponent::ML_TRAINING},
    {"ml.inference", LogComponent::ML_INFERENCE},
    {"ml.introspection", LogComponent::ML_INTROSPECTION},
    {"state.persist", LogComponent::STATE_PERSIST}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

AppConfig::AppConfig() {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE and training, which we want to see INFO messages from
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
  logging.log_levels[LogComponent::ML_TRAINING] = LogLevel::INFO;
}

bool validate_decision_tree_config(const DecisionTreeConfig &config,
                                   std::vector<std::string> &errors) {
  bool valid = true;

  if (config.max_depth < 0) {
    errors.push_back("Decision tree max_depth must be >= 0 (0 = unlimited)");
    valid = false;
  }

  if (config.min_samples_split < 2) {
    errors.push_back("Decision tree min_samples_split must be at least 2");
    valid = false;
  }

  if (config.min_samples_leaf < 1) {
    errors.push_back("Decision tree min_samples_leaf must be at least 1");
    valid = false;
  }

  if (config.max_text_features < 1) {
    errors.push_back("Decision tree max_text_features must be at least 1");
    valid = false;
  }

  if (config.test_size <= 0.0 || config.test_size >= 1.0) {
    errors.push_back("Decision tree test_size must be between 0 and 1");
    valid = false;
  }

  if (config.max_cv_folds < 2) {
    errors.push_back("Decision tree max_cv_folds must be at least 2");
    valid = false;
  }

  return valid;
}

bool validate_server_config(const ServerConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.port < 1 || config.port > 65535) {
    errors.push_back("Server port must be between 1 and 65535");
    valid = false;
  }

  if (config.host.empty()) {
    errors.push_back("Server host must not be empty");
    valid = false;
  }

  if (config.default_top_k < 1) {
    errors.push_back("Server default_top_k must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.metrics_path.empty() || config.metrics_path[0] != '/') {
    errors.push_back("Prometheus metrics path must start with '/'");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_decision_tree_config(config.decision_tree, errors))
    valid = false;

  if (!validate_server_config(config.server, errors))
    valid = false;

  if (!validate_prometheus_config(config.prometheus, errors))
    valid = false;

  if (config.train_on_startup && config.characters_path.empty()) {
    errors.push_back("train_on_startup requires characters_path to be set");
    valid = false;
  }

  if ((config.save_model_after_training || config.load_model_on_startup) &&
      config.model_path.empty()) {
    errors.push_back("Model persistence requires model_path to be set");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::CHARACTERS_PATH)
        config.characters_path = value;
      else if (key == Keys::MODEL_PATH)
        config.model_path = value;
      else if (key == Keys::LOAD_MODEL_ON_STARTUP)
        config.load_model_on_startup = string_to_bool(value);
      else if (key == Keys::TRAIN_ON_STARTUP)
        config.train_on_startup = string_to_bool(value);
      else if (key == Keys::SAVE_MODEL_AFTER_TRAINING)
        config.save_model_after_training = string_to_bool(value);
      else
        config.custom_settings[key] = value;

      // Decision tree settings
    } else if (current_section == "DecisionTree") {
      auto &dt = config.decision_tree;
      if (key == Keys::DT_MAX_DEPTH)
        dt.max_depth =
            Utils::string_to_number<int>(value).value_or(dt.max_depth);
      else if (key == Keys::DT_MIN_SAMPLES_SPLIT)
        dt.min_samples_split = Utils::string_to_number<int>(value).value_or(
            dt.min_samples_split);
      else if (key == Keys::DT_MIN_SAMPLES_LEAF)
        dt.min_samples_leaf = Utils::string_to_number<int>(value).value_or(
            dt.min_samples_leaf);
      else if (key == Keys::DT_MAX_TEXT_FEATURES)
        dt.max_text_features = Utils::string_to_number<size_t>(value).value_or(
            dt.max_text_features);
      else if (key == Keys::DT_TEST_SIZE)
        dt.test_size =
            Utils::string_to_number<double>(value).value_or(dt.test_size);
      else if (key == Keys::DT_RANDOM_SEED)
        dt.random_seed =
            Utils::string_to_number<uint32_t>(value).value_or(dt.random_seed);
      else if (key == Keys::DT_MAX_CV_FOLDS)
        dt.max_cv_folds =
            Utils::string_to_number<size_t>(value).value_or(dt.max_cv_folds);
      else if (key == Keys::DT_MIN_SAMPLES_FOR_CV)
        dt.min_samples_for_cv = Utils::string_to_number<size_t>(value).value_or(
            dt.min_samples_for_cv);
      else
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown key '" << key << "' in [DecisionTree]"
                  << std::endl;

      // Server settings
    } else if (current_section == "Server") {
      if (key == Keys::SERVER_ENABLED)
        config.server.enabled = string_to_bool(value);
      else if (key == Keys::SERVER_HOST)
        config.server.host = value;
      else if (key == Keys::SERVER_PORT)
        config.server.port =
            Utils::string_to_number<int>(value).value_or(config.server.port);
      else if (key == Keys::SERVER_DEFAULT_TOP_K)
        config.server.default_top_k =
            Utils::string_to_number<size_t>(value).value_or(
                config.server.default_top_k);

      // Prometheus settings
    } else if (current_section == "Prometheus") {
      if (key == Keys::PROMETHEUS_ENABLED)
        config.prometheus.enabled = string_to_bool(value);
      else if (key == Keys::PROMETHEUS_METRICS_PATH)
        config.prometheus.metrics_path = value;

      // Logging settings
    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "ml.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        }
      }
    }
  }

  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
