#include "models/decision_tree.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

namespace {
// Values closer than this are treated as equal when placing thresholds
constexpr double kFeatureThreshold = 1e-7;
constexpr double kImpurityEpsilon = 1e-12;

double gini(const std::vector<double> &class_counts, double n) {
  if (n <= 0.0)
    return 0.0;
  double sum_sq = 0.0;
  for (double count : class_counts)
    sum_sq += (count / n) * (count / n);
  return 1.0 - sum_sq;
}

double squared_error(double sum, double sum_sq, double n) {
  if (n <= 0.0)
    return 0.0;
  double mean = sum / n;
  return std::max(0.0, sum_sq / n - mean * mean);
}

std::string task_to_string(TreeTask task) {
  return task == TreeTask::CLASSIFICATION ? "classifier" : "regressor";
}
} // namespace

DecisionTree::DecisionTree(TreeTask task, TreeParams params)
    : task_(task), params_(params) {
  if (params_.max_depth < 0)
    throw InvalidArgumentError("max_depth", "max_depth must be >= 0");
  if (params_.min_samples_split < 2)
    throw InvalidArgumentError("min_samples_split",
                               "min_samples_split must be >= 2");
  if (params_.min_samples_leaf < 1)
    throw InvalidArgumentError("min_samples_leaf",
                               "min_samples_leaf must be >= 1");
}

void DecisionTree::fit_classifier(const FeatureMatrix &X,
                                  const std::vector<int> &y,
                                  size_t n_classes) {
  if (task_ != TreeTask::CLASSIFICATION)
    throw InvalidArgumentError("task", "fit_classifier called on a regressor");
  if (n_classes == 0)
    throw InsufficientDataError("Classifier needs at least one class");

  std::vector<double> targets;
  targets.reserve(y.size());
  for (int label : y) {
    if (label < 0 || static_cast<size_t>(label) >= n_classes)
      throw InvalidArgumentError("y", "Class code " + std::to_string(label) +
                                          " outside [0, " +
                                          std::to_string(n_classes) + ")");
    targets.push_back(static_cast<double>(label));
  }
  n_classes_ = n_classes;
  fit_impl(X, targets);
}

void DecisionTree::fit_regressor(const FeatureMatrix &X,
                                 const std::vector<double> &y) {
  if (task_ != TreeTask::REGRESSION)
    throw InvalidArgumentError("task", "fit_regressor called on a classifier");
  n_classes_ = 0;
  fit_impl(X, y);
}

void DecisionTree::fit_impl(const FeatureMatrix &X,
                            const std::vector<double> &targets) {
  if (X.empty())
    throw InsufficientDataError("Cannot fit a decision tree on zero samples");
  if (X.size() != targets.size())
    throw InvalidArgumentError("y", "Feature matrix has " +
                                        std::to_string(X.size()) +
                                        " rows but " +
                                        std::to_string(targets.size()) +
                                        " targets were given");

  n_features_ = X.front().size();
  for (const auto &row : X)
    if (row.size() != n_features_)
      throw InvalidArgumentError("X", "Feature matrix rows differ in width");

  std::vector<size_t> indices(X.size());
  for (size_t i = 0; i < indices.size(); ++i)
    indices[i] = i;

  root_ = build_node(X, targets, std::move(indices), 0);

  LOG(LogLevel::DEBUG, LogComponent::ML_TRAINING,
      "Decision tree " << task_to_string(task_) << " fitted on " << X.size()
                       << " samples: depth=" << depth()
                       << ", leaves=" << n_leaves());
}

void DecisionTree::fill_node_stats(Node &node,
                                   const std::vector<double> &targets,
                                   const std::vector<size_t> &indices) const {
  const double n = static_cast<double>(indices.size());
  node.n_samples = indices.size();

  if (task_ == TreeTask::CLASSIFICATION) {
    std::vector<double> counts(n_classes_, 0.0);
    for (size_t i : indices)
      counts[static_cast<size_t>(targets[i])] += 1.0;
    node.impurity = gini(counts, n);
    node.value.assign(n_classes_, 0.0);
    for (size_t c = 0; c < n_classes_; ++c)
      node.value[c] = counts[c] / n;
  } else {
    double sum = 0.0;
    double sum_sq = 0.0;
    for (size_t i : indices) {
      sum += targets[i];
      sum_sq += targets[i] * targets[i];
    }
    node.impurity = squared_error(sum, sum_sq, n);
    node.value = {sum / n};
  }
}

std::unique_ptr<Node> DecisionTree::build_node(
    const FeatureMatrix &X, const std::vector<double> &targets,
    std::vector<size_t> indices, int depth) {
  auto node = std::make_unique<Node>();
  fill_node_stats(*node, targets, indices);

  const size_t n = indices.size();
  bool stop = (params_.max_depth > 0 && depth >= params_.max_depth) ||
              n < static_cast<size_t>(params_.min_samples_split) ||
              n < 2 * static_cast<size_t>(params_.min_samples_leaf) ||
              node->impurity <= kImpurityEpsilon;

  SplitCandidate split;
  if (!stop) {
    split = find_best_split(X, targets, indices);
    stop = split.feature_index < 0;
  }

  if (stop) {
    node->is_leaf = true;
    return node;
  }

  std::vector<size_t> left_indices;
  std::vector<size_t> right_indices;
  for (size_t i : indices) {
    if (X[i][static_cast<size_t>(split.feature_index)] <= split.threshold)
      left_indices.push_back(i);
    else
      right_indices.push_back(i);
  }

  node->feature_index = split.feature_index;
  node->split_value = split.threshold;
  node->left_child = build_node(X, targets, std::move(left_indices), depth + 1);
  node->right_child =
      build_node(X, targets, std::move(right_indices), depth + 1);
  return node;
}

DecisionTree::SplitCandidate
DecisionTree::find_best_split(const FeatureMatrix &X,
                              const std::vector<double> &targets,
                              const std::vector<size_t> &indices) const {
  SplitCandidate best;
  best.child_impurity = std::numeric_limits<double>::infinity();

  const size_t n = indices.size();
  const size_t min_leaf = static_cast<size_t>(params_.min_samples_leaf);
  const double n_total = static_cast<double>(n);

  std::vector<size_t> sorted = indices;
  for (size_t f = 0; f < n_features_; ++f) {
    std::stable_sort(sorted.begin(), sorted.end(), [&](size_t a, size_t b) {
      return X[a][f] < X[b][f];
    });
    if (X[sorted.back()][f] <= X[sorted.front()][f] + kFeatureThreshold)
      continue; // constant feature in this node

    // Running statistics of the left partition; right is total minus left
    std::vector<double> left_counts(n_classes_, 0.0);
    std::vector<double> total_counts(n_classes_, 0.0);
    double left_sum = 0.0, left_sum_sq = 0.0;
    double total_sum = 0.0, total_sum_sq = 0.0;
    for (size_t i : sorted) {
      if (task_ == TreeTask::CLASSIFICATION)
        total_counts[static_cast<size_t>(targets[i])] += 1.0;
      total_sum += targets[i];
      total_sum_sq += targets[i] * targets[i];
    }

    for (size_t pos = 1; pos < n; ++pos) {
      const size_t moved = sorted[pos - 1];
      if (task_ == TreeTask::CLASSIFICATION)
        left_counts[static_cast<size_t>(targets[moved])] += 1.0;
      left_sum += targets[moved];
      left_sum_sq += targets[moved] * targets[moved];

      const double x_prev = X[sorted[pos - 1]][f];
      const double x_next = X[sorted[pos]][f];
      if (x_next <= x_prev + kFeatureThreshold)
        continue;
      if (pos < min_leaf || n - pos < min_leaf)
        continue;

      const double n_left = static_cast<double>(pos);
      const double n_right = n_total - n_left;
      double left_impurity;
      double right_impurity;
      if (task_ == TreeTask::CLASSIFICATION) {
        std::vector<double> right_counts(n_classes_);
        for (size_t c = 0; c < n_classes_; ++c)
          right_counts[c] = total_counts[c] - left_counts[c];
        left_impurity = gini(left_counts, n_left);
        right_impurity = gini(right_counts, n_right);
      } else {
        left_impurity = squared_error(left_sum, left_sum_sq, n_left);
        right_impurity = squared_error(total_sum - left_sum,
                                       total_sum_sq - left_sum_sq, n_right);
      }

      const double child_impurity =
          (n_left * left_impurity + n_right * right_impurity) / n_total;
      if (child_impurity < best.child_impurity) {
        best.feature_index = static_cast<int>(f);
        best.child_impurity = child_impurity;
        best.threshold = (x_prev + x_next) / 2.0;
        if (best.threshold >= x_next)
          best.threshold = x_prev;
      }
    }
  }
  return best;
}

void DecisionTree::require_fitted(TreeTask expected) const {
  if (!root_)
    throw NotTrainedError(task_to_string(task_));
  if (task_ != expected)
    throw InvalidArgumentError("task", "Operation not supported by a " +
                                           task_to_string(task_));
}

const Node &DecisionTree::leaf_for(const std::vector<double> &features) const {
  if (features.size() != n_features_)
    throw InvalidArgumentError(
        "features", "Feature vector has " + std::to_string(features.size()) +
                        " columns, model expects " +
                        std::to_string(n_features_));

  const Node *node = root_.get();
  while (!node->is_leaf) {
    if (features[static_cast<size_t>(node->feature_index)] <=
        node->split_value)
      node = node->left_child.get();
    else
      node = node->right_child.get();
  }
  return *node;
}

std::vector<double>
DecisionTree::predict_proba(const std::vector<double> &features) const {
  require_fitted(TreeTask::CLASSIFICATION);
  return leaf_for(features).value;
}

int DecisionTree::predict_class(const std::vector<double> &features) const {
  auto proba = predict_proba(features);
  // First maximum wins, matching the class order of the label encoder
  return static_cast<int>(std::max_element(proba.begin(), proba.end()) -
                          proba.begin());
}

double DecisionTree::predict_value(const std::vector<double> &features) const {
  require_fitted(TreeTask::REGRESSION);
  return leaf_for(features).value.front();
}

namespace {
int node_depth(const Node *node) {
  if (node->is_leaf)
    return 0;
  return 1 + std::max(node_depth(node->left_child.get()),
                      node_depth(node->right_child.get()));
}

size_t count_leaves(const Node *node) {
  if (node->is_leaf)
    return 1;
  return count_leaves(node->left_child.get()) +
         count_leaves(node->right_child.get());
}

void accumulate_importance(const Node *node, std::vector<double> &out) {
  if (node->is_leaf)
    return;
  const Node *left = node->left_child.get();
  const Node *right = node->right_child.get();
  out[static_cast<size_t>(node->feature_index)] +=
      static_cast<double>(node->n_samples) * node->impurity -
      static_cast<double>(left->n_samples) * left->impurity -
      static_cast<double>(right->n_samples) * right->impurity;
  accumulate_importance(left, out);
  accumulate_importance(right, out);
}
} // namespace

int DecisionTree::depth() const { return root_ ? node_depth(root_.get()) : 0; }

size_t DecisionTree::n_leaves() const {
  return root_ ? count_leaves(root_.get()) : 0;
}

std::vector<double> DecisionTree::feature_importances() const {
  if (!root_)
    throw NotTrainedError(task_to_string(task_));

  std::vector<double> importances(n_features_, 0.0);
  accumulate_importance(root_.get(), importances);

  double total = 0.0;
  for (double value : importances)
    total += value;
  if (total > 0.0)
    for (double &value : importances)
      value /= total;
  return importances;
}

// --- Serialization ---

namespace {
nlohmann::json node_to_json(const Node &node) {
  nlohmann::json j = {{"value", node.value},
                      {"impurity", node.impurity},
                      {"n_samples", node.n_samples},
                      {"is_leaf", node.is_leaf}};
  if (!node.is_leaf) {
    j["feature_index"] = node.feature_index;
    j["split_value"] = node.split_value;
    j["left"] = node_to_json(*node.left_child);
    j["right"] = node_to_json(*node.right_child);
  }
  return j;
}

std::unique_ptr<Node> node_from_json(const nlohmann::json &j,
                                     size_t n_features, size_t value_size) {
  auto node = std::make_unique<Node>();
  node->value = j.at("value").get<std::vector<double>>();
  node->impurity = j.at("impurity").get<double>();
  node->n_samples = j.at("n_samples").get<size_t>();
  node->is_leaf = j.at("is_leaf").get<bool>();

  if (node->value.size() != value_size)
    throw CorruptStateError("Tree node value has " +
                            std::to_string(node->value.size()) +
                            " entries, expected " +
                            std::to_string(value_size));

  if (!node->is_leaf) {
    node->feature_index = j.at("feature_index").get<int>();
    node->split_value = j.at("split_value").get<double>();
    if (node->feature_index < 0 ||
        static_cast<size_t>(node->feature_index) >= n_features)
      throw CorruptStateError("Tree node references feature " +
                              std::to_string(node->feature_index) +
                              " outside the feature space");
    node->left_child = node_from_json(j.at("left"), n_features, value_size);
    node->right_child = node_from_json(j.at("right"), n_features, value_size);
  }
  return node;
}
} // namespace

nlohmann::json DecisionTree::to_json() const {
  nlohmann::json j = {
      {"task", task_to_string(task_)},
      {"params",
       {{"max_depth", params_.max_depth},
        {"min_samples_split", params_.min_samples_split},
        {"min_samples_leaf", params_.min_samples_leaf}}},
      {"n_features", n_features_},
      {"n_classes", n_classes_}};
  j["root"] = root_ ? node_to_json(*root_) : nlohmann::json(nullptr);
  return j;
}

DecisionTree DecisionTree::from_json(const nlohmann::json &j) {
  const std::string task_name = j.at("task").get<std::string>();
  TreeTask task;
  if (task_name == "classifier")
    task = TreeTask::CLASSIFICATION;
  else if (task_name == "regressor")
    task = TreeTask::REGRESSION;
  else
    throw CorruptStateError("Unknown tree task '" + task_name + "'");

  const auto &params_json = j.at("params");
  TreeParams params;
  params.max_depth = params_json.at("max_depth").get<int>();
  params.min_samples_split = params_json.at("min_samples_split").get<int>();
  params.min_samples_leaf = params_json.at("min_samples_leaf").get<int>();

  DecisionTree tree(task, params);
  tree.n_features_ = j.at("n_features").get<size_t>();
  tree.n_classes_ = j.at("n_classes").get<size_t>();

  const auto &root = j.at("root");
  if (!root.is_null()) {
    const size_t value_size =
        task == TreeTask::CLASSIFICATION ? tree.n_classes_ : 1;
    tree.root_ = node_from_json(root, tree.n_features_, value_size);
  }
  return tree;
}
