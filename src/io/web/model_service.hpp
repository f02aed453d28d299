#ifndef MODEL_SERVICE_HPP
#define MODEL_SERVICE_HPP

#include "core/config.hpp"
#include "models/character_model.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

struct ServiceResponse {
  int status = 200;
  nlohmann::json body;
};

// Request handling behind the HTTP routes. Owns the model and the lock that
// serializes train/load against every other operation; reads share the lock.
// Bodies are parsed JSON, responses carry {"success": ...} like the game
// backend expects.
class ModelService {
public:
  explicit ModelService(const Config::AppConfig &config);

  ServiceResponse health() const;
  ServiceResponse train(const nlohmann::json &body);
  ServiceResponse predict(const nlohmann::json &body) const;
  ServiceResponse predict_difficulty(const nlohmann::json &body) const;
  ServiceResponse feature_importance(const std::optional<std::string> &top_n) const;
  ServiceResponse rules(const std::optional<std::string> &max_depth) const;
  ServiceResponse visualize(const std::optional<std::string> &tree_type,
                            const std::optional<std::string> &max_depth) const;
  ServiceResponse info() const;

  // Startup operations driven by main()
  TrainingMetrics train_records(const std::vector<CharacterRecord> &records,
                                const TreeParams &params);
  void load_model(const std::string &path);
  void save_model(const std::string &path) const;
  bool is_trained() const;

  static constexpr size_t DEFAULT_TOP_N = 20;
  static constexpr int DEFAULT_RULES_DEPTH = 3;
  static constexpr int DEFAULT_DIAGRAM_DEPTH = 3;

private:
  template <typename Fn>
  ServiceResponse guarded(const char *endpoint, Fn &&handler) const;

  TreeParams params_from_body(const nlohmann::json &body) const;
  static CharacterRecord character_from_body(const nlohmann::json &body);

  Config::AppConfig config_;
  CharacterModel model_;
  mutable std::shared_mutex model_mutex_;
};

#endif // MODEL_SERVICE_HPP
