#ifndef CHARACTER_MODEL_HPP
#define CHARACTER_MODEL_HPP

#include "core/config.hpp"
#include "models/character_record.hpp"
#include "models/decision_tree.hpp"
#include "models/feature_assembler.hpp"
#include "models/label_encoder.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

struct TrainingMetrics {
  // Classifier
  double train_accuracy = 0.0;
  double test_accuracy = 0.0;
  std::vector<double> cv_scores;
  double cv_mean = 0.0;
  double cv_std = 0.0;
  size_t n_classes = 0;
  size_t n_features = 0;
  int classifier_depth = 0;
  size_t classifier_leaves = 0;

  // Regressor
  double train_r2 = 0.0;
  double test_r2 = 0.0;
  int regressor_depth = 0;
  size_t regressor_leaves = 0;

  size_t n_training_samples = 0;
  // Held-out samples; 0 when degraded_split is set
  size_t n_test_samples = 0;
  // True when no split was possible and the test metrics were computed on
  // the training partition
  bool degraded_split = false;

  nlohmann::json to_json() const;
  static TrainingMetrics from_json(const nlohmann::json &j);
};

struct LabelPrediction {
  std::string label;
  double probability = 0.0;
  double confidence = 0.0; // probability in percent
};

// Everything learned by one training run. Replaced as a whole, never
// patched in place.
struct ModelState {
  explicit ModelState(const Config::DecisionTreeConfig &config = {});

  FeatureAssembler assembler;
  LabelEncoder label_encoder{"id"};
  DecisionTree classifier;
  DecisionTree regressor;
  bool classifier_trained = false;
  bool regressor_trained = false;
  TrainingMetrics metrics;

  const std::vector<std::string> &class_names() const {
    return label_encoder.classes();
  }
};

// Joint classifier (character identity) and regressor (difficulty) over a
// shared feature space. Not internally synchronized: callers serialize
// train() and replace_state() against every other call.
class CharacterModel {
public:
  static constexpr double MIN_DIFFICULTY = 0.0;
  static constexpr double MAX_DIFFICULTY = 10.0;

  explicit CharacterModel(Config::DecisionTreeConfig config = {});

  // Trains with the tree hyperparameters from the configuration
  TrainingMetrics train(const std::vector<CharacterRecord> &records);
  TrainingMetrics train(const std::vector<CharacterRecord> &records,
                        const TreeParams &params);

  std::vector<LabelPrediction> predict_label(const CharacterRecord &record,
                                             size_t top_k) const;
  // Difficulty estimate clipped to [MIN_DIFFICULTY, MAX_DIFFICULTY]
  double predict_value(const CharacterRecord &record) const;

  nlohmann::json model_info() const;

  bool is_trained() const {
    return state_->classifier_trained && state_->regressor_trained;
  }
  const ModelState &state() const { return *state_; }
  void replace_state(std::unique_ptr<ModelState> state);
  const Config::DecisionTreeConfig &config() const { return config_; }

private:
  Config::DecisionTreeConfig config_;
  std::unique_ptr<ModelState> state_;
};

#endif // CHARACTER_MODEL_HPP
