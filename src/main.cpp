#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/character_loader.hpp"
#include "io/web/model_service.hpp"
#include "io/web/web_server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
#include <unistd.h>
#endif

// Global atomic flag for signal handling
std::atomic<bool> g_shutdown_requested = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

namespace {
// Loads the saved model when asked to; a missing file is not an error
bool try_load_model(ModelService &service, const Config::AppConfig &config) {
  if (!config.load_model_on_startup)
    return false;
  if (!std::filesystem::exists(config.model_path)) {
    LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
        "No saved model at " << config.model_path);
    return false;
  }
  try {
    service.load_model(config.model_path);
    return true;
  } catch (const ModelError &e) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Could not load saved model: " << e.what());
    return false;
  }
}

bool train_from_catalogue(ModelService &service,
                          const Config::AppConfig &config) {
  try {
    auto records = CharacterLoader(config.characters_path).load();
    const auto &dt = config.decision_tree;
    TrainingMetrics metrics = service.train_records(
        records, TreeParams{dt.max_depth, dt.min_samples_split,
                            dt.min_samples_leaf});
    LOG(LogLevel::INFO, LogComponent::CORE,
        "Startup training finished: " << metrics.n_classes << " classes, "
                                      << metrics.n_training_samples
                                      << " training samples");
    if (config.save_model_after_training)
      service.save_model(config.model_path);
    return true;
  } catch (const ModelError &e) {
    LOG(LogLevel::ERROR, LogComponent::CORE,
        "Startup training failed: " << e.what());
    return false;
  }
}
} // namespace

int main(int argc, char *argv[]) {
  // Register signal handlers
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  if (!config_manager.load_configuration(config_file_to_load))
    std::cerr << "Using default configuration (could not load "
              << config_file_to_load << ")\n";

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE, "Charactle ML service starting up...");
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());
#endif

  ModelService service(*current_config);

  bool ready = try_load_model(service, *current_config);
  if (!ready && current_config->train_on_startup)
    ready = train_from_catalogue(service, *current_config);
  if (!ready)
    LOG(LogLevel::WARN, LogComponent::CORE,
        "No trained model available; POST /train-dt to train one");

  if (!current_config->server.enabled) {
    LOG(LogLevel::INFO, LogComponent::CORE,
        "Server disabled in configuration; exiting");
    return ready ? 0 : 1;
  }

  // --- Metrics Registration ---
  auto &memory_gauge = MetricsRegistry::instance().create_gauge(
      "charactle_ml_resident_memory_bytes",
      "Resident memory of the ML service process.");

  WebServer web_server(*current_config, service, MetricsRegistry::instance(),
                       memory_gauge);
  web_server.start();

  while (!g_shutdown_requested)
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown requested, stopping...");
  web_server.stop();
  LOG(LogLevel::INFO, LogComponent::CORE, "Charactle ML service stopped.");
  return 0;
}
