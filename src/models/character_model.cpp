#include "models/character_model.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "models/model_evaluation.hpp"

#include <algorithm>
#include <map>
#include <numeric>

nlohmann::json TrainingMetrics::to_json() const {
  // cv_mean and cv_std are null when cross-validation did not run
  nlohmann::json cv_mean_json = nullptr;
  nlohmann::json cv_std_json = nullptr;
  if (!cv_scores.empty()) {
    cv_mean_json = cv_mean;
    cv_std_json = cv_std;
  }
  return {{"classifier",
           {{"train_accuracy", train_accuracy},
            {"test_accuracy", test_accuracy},
            {"cv_scores", cv_scores},
            {"cv_mean", cv_mean_json},
            {"cv_std", cv_std_json},
            {"n_classes", n_classes},
            {"n_features", n_features},
            {"tree_depth", classifier_depth},
            {"n_leaves", classifier_leaves}}},
          {"regressor",
           {{"train_r2", train_r2},
            {"test_r2", test_r2},
            {"tree_depth", regressor_depth},
            {"n_leaves", regressor_leaves}}},
          {"n_training_samples", n_training_samples},
          {"n_test_samples", n_test_samples},
          {"degraded_split", degraded_split}};
}

TrainingMetrics TrainingMetrics::from_json(const nlohmann::json &j) {
  TrainingMetrics m;
  const auto &clf = j.at("classifier");
  m.train_accuracy = clf.at("train_accuracy").get<double>();
  m.test_accuracy = clf.at("test_accuracy").get<double>();
  m.cv_scores = clf.at("cv_scores").get<std::vector<double>>();
  if (!m.cv_scores.empty()) {
    m.cv_mean = clf.at("cv_mean").get<double>();
    m.cv_std = clf.at("cv_std").get<double>();
  }
  m.n_classes = clf.at("n_classes").get<size_t>();
  m.n_features = clf.at("n_features").get<size_t>();
  m.classifier_depth = clf.at("tree_depth").get<int>();
  m.classifier_leaves = clf.at("n_leaves").get<size_t>();

  const auto &reg = j.at("regressor");
  m.train_r2 = reg.at("train_r2").get<double>();
  m.test_r2 = reg.at("test_r2").get<double>();
  m.regressor_depth = reg.at("tree_depth").get<int>();
  m.regressor_leaves = reg.at("n_leaves").get<size_t>();

  m.n_training_samples = j.at("n_training_samples").get<size_t>();
  m.n_test_samples = j.at("n_test_samples").get<size_t>();
  m.degraded_split = j.at("degraded_split").get<bool>();
  return m;
}

ModelState::ModelState(const Config::DecisionTreeConfig &config)
    : assembler(config.max_text_features),
      classifier(TreeTask::CLASSIFICATION,
                 TreeParams{config.max_depth, config.min_samples_split,
                            config.min_samples_leaf}),
      regressor(TreeTask::REGRESSION,
                TreeParams{config.max_depth, config.min_samples_split,
                           config.min_samples_leaf}) {}

CharacterModel::CharacterModel(Config::DecisionTreeConfig config)
    : config_(config), state_(std::make_unique<ModelState>(config_)) {}

TrainingMetrics
CharacterModel::train(const std::vector<CharacterRecord> &records) {
  return train(records, TreeParams{config_.max_depth, config_.min_samples_split,
                                   config_.min_samples_leaf});
}

TrainingMetrics CharacterModel::train(const std::vector<CharacterRecord> &records,
                                      const TreeParams &params) {
  if (records.empty())
    throw InsufficientDataError("Training needs at least one character");
  for (size_t i = 0; i < records.size(); ++i) {
    if (!records[i].id || records[i].id->empty())
      throw InvalidRecordError("id", "Character at index " + std::to_string(i) +
                                         " has no id");
  }

  LOG(LogLevel::INFO, LogComponent::ML_TRAINING,
      "Training decision trees on " << records.size() << " characters (max_depth="
                                    << params.max_depth << ", min_samples_split="
                                    << params.min_samples_split
                                    << ", min_samples_leaf="
                                    << params.min_samples_leaf << ")");

  // Build into a fresh state so a failed run leaves the current one intact
  auto next = std::make_unique<ModelState>(config_);
  next->classifier = DecisionTree(TreeTask::CLASSIFICATION, params);
  next->regressor = DecisionTree(TreeTask::REGRESSION, params);

  AssembledFeatures data = next->assembler.build(records, true);
  std::vector<int> y_class = next->label_encoder.fit_transform(data.class_targets);
  const std::vector<double> &y_reg = data.regression_targets;
  const size_t n = records.size();
  const size_t n_classes = next->label_encoder.size();

  std::map<int, size_t> class_counts;
  for (int code : y_class)
    ++class_counts[code];
  bool can_split = n > 5;
  for (const auto &[code, count] : class_counts)
    if (count < 2)
      can_split = false;

  std::optional<TrainTestSplit> split;
  if (can_split)
    split = stratified_train_test_split(y_class, n_classes, config_.test_size,
                                        config_.random_seed);

  TrainingMetrics &metrics = next->metrics;
  if (!split) {
    LOG(LogLevel::WARN, LogComponent::ML_TRAINING,
        "Dataset too small or imbalanced for a stratified split ("
            << n << " samples, " << n_classes
            << " classes); evaluating on the training data");
    TrainTestSplit all;
    all.train.resize(n);
    std::iota(all.train.begin(), all.train.end(), 0);
    all.test = all.train;
    split = std::move(all);
    metrics.degraded_split = true;
  }

  const FeatureMatrix X_train = select_rows(data.features, split->train);
  const FeatureMatrix X_test = select_rows(data.features, split->test);
  const std::vector<int> yc_train = select_rows(y_class, split->train);
  const std::vector<int> yc_test = select_rows(y_class, split->test);
  const std::vector<double> yr_train = select_rows(y_reg, split->train);
  const std::vector<double> yr_test = select_rows(y_reg, split->test);

  next->classifier.fit_classifier(X_train, yc_train, n_classes);
  next->regressor.fit_regressor(X_train, yr_train);
  next->classifier_trained = true;
  next->regressor_trained = true;

  auto predict_classes = [&](const FeatureMatrix &X) {
    std::vector<int> out;
    out.reserve(X.size());
    for (const auto &row : X)
      out.push_back(next->classifier.predict_class(row));
    return out;
  };
  auto predict_values = [&](const FeatureMatrix &X) {
    std::vector<double> out;
    out.reserve(X.size());
    for (const auto &row : X)
      out.push_back(next->regressor.predict_value(row));
    return out;
  };

  metrics.train_accuracy = accuracy_score(yc_train, predict_classes(X_train));
  metrics.test_accuracy = accuracy_score(yc_test, predict_classes(X_test));
  metrics.train_r2 = r2_score(yr_train, predict_values(X_train));
  metrics.test_r2 = r2_score(yr_test, predict_values(X_test));

  if (!metrics.degraded_split && n >= config_.min_samples_for_cv) {
    const size_t k = std::min(config_.max_cv_folds, n_classes);
    if (k >= 2) {
      metrics.cv_scores =
          cross_val_accuracy(data.features, y_class, n_classes, params, k);
      metrics.cv_mean = mean_of(metrics.cv_scores);
      metrics.cv_std = stddev_of(metrics.cv_scores);
    }
  }

  metrics.n_classes = n_classes;
  metrics.n_features = next->assembler.width();
  metrics.classifier_depth = next->classifier.depth();
  metrics.classifier_leaves = next->classifier.n_leaves();
  metrics.regressor_depth = next->regressor.depth();
  metrics.regressor_leaves = next->regressor.n_leaves();
  metrics.n_training_samples = split->train.size();
  // Only held-out samples count; a degraded run has none
  metrics.n_test_samples = metrics.degraded_split ? 0 : split->test.size();

  state_ = std::move(next);

  LOG(LogLevel::INFO, LogComponent::ML_TRAINING,
      "Training complete: " << n_classes << " classes, train_accuracy="
                            << metrics.train_accuracy
                            << ", test_accuracy=" << metrics.test_accuracy
                            << ", train_r2=" << metrics.train_r2
                            << ", test_r2=" << metrics.test_r2
                            << (metrics.degraded_split ? " (degraded split)"
                                                       : ""));
  return metrics;
}

std::vector<LabelPrediction>
CharacterModel::predict_label(const CharacterRecord &record,
                              size_t top_k) const {
  if (!state_->classifier_trained)
    throw NotTrainedError("Classifier");
  if (top_k == 0)
    throw InvalidArgumentError("top_k", "top_k must be at least 1");

  const std::vector<double> features = state_->assembler.transform_one(record);
  const std::vector<double> proba = state_->classifier.predict_proba(features);

  std::vector<size_t> order(proba.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return proba[a] > proba[b]; });

  std::vector<LabelPrediction> result;
  for (size_t idx : order) {
    if (result.size() == top_k || proba[idx] <= 0.0)
      break;
    LabelPrediction prediction;
    prediction.label = state_->label_encoder.inverse_one(static_cast<int>(idx));
    prediction.probability = proba[idx];
    prediction.confidence = proba[idx] * 100.0;
    result.push_back(std::move(prediction));
  }

  LOG(LogLevel::DEBUG, LogComponent::ML_INFERENCE,
      "Predicted " << result.size() << " candidate(s) for '"
                   << record.name_or_empty() << "'"
                   << (result.empty() ? std::string()
                                      : ", best: " + result.front().label));
  return result;
}

double CharacterModel::predict_value(const CharacterRecord &record) const {
  if (!state_->regressor_trained)
    throw NotTrainedError("Regressor");

  const std::vector<double> features = state_->assembler.transform_one(record);
  const double raw = state_->regressor.predict_value(features);
  const double clipped = std::clamp(raw, MIN_DIFFICULTY, MAX_DIFFICULTY);

  LOG(LogLevel::DEBUG, LogComponent::ML_INFERENCE,
      "Predicted difficulty " << raw << " (clipped " << clipped << ") for '"
                              << record.name_or_empty() << "'");
  return clipped;
}

nlohmann::json CharacterModel::model_info() const {
  const ModelState &s = *state_;
  const bool clf = s.classifier_trained;
  const bool reg = s.regressor_trained;

  nlohmann::json classifier = {
      {"is_trained", clf},
      {"n_classes", clf ? s.label_encoder.size() : 0},
      {"classes", clf ? s.class_names() : std::vector<std::string>{}},
      {"train_accuracy", clf ? s.metrics.train_accuracy : 0.0},
      {"test_accuracy", clf ? s.metrics.test_accuracy : 0.0},
      {"cv_mean", nullptr},
      {"tree_depth", clf ? s.classifier.depth() : 0},
      {"n_leaves", clf ? s.classifier.n_leaves() : 0}};
  if (!s.metrics.cv_scores.empty())
    classifier["cv_mean"] = s.metrics.cv_mean;

  return {{"classifier", classifier},
          {"regressor",
           {{"is_trained", reg},
            {"train_r2", reg ? s.metrics.train_r2 : 0.0},
            {"test_r2", reg ? s.metrics.test_r2 : 0.0},
            {"tree_depth", reg ? s.regressor.depth() : 0},
            {"n_leaves", reg ? s.regressor.n_leaves() : 0}}},
          {"n_features", s.assembler.width()},
          {"feature_names", s.assembler.feature_names()},
          {"degraded_split", s.metrics.degraded_split}};
}

void CharacterModel::replace_state(std::unique_ptr<ModelState> state) {
  if (!state)
    throw InvalidArgumentError("state", "Cannot install an empty model state");
  state_ = std::move(state);
  LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
      "Installed model state with " << state_->label_encoder.size()
                                    << " classes");
}
