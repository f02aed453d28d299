#ifndef DECISION_TREE_HPP
#define DECISION_TREE_HPP

#include "models/features.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

enum class TreeTask { CLASSIFICATION, REGRESSION };

struct TreeParams {
  int max_depth = 10; // 0 means unlimited
  int min_samples_split = 2;
  int min_samples_leaf = 1;
};

struct Node {
  int feature_index = -1;   // Which feature from the vector to check
  double split_value = 0.0; // Samples with feature <= split_value go left
  std::unique_ptr<Node> left_child;
  std::unique_ptr<Node> right_child;

  bool is_leaf = false;
  // Class proportions for classification, {mean} for regression
  std::vector<double> value;
  double impurity = 0.0;
  size_t n_samples = 0;
};

// CART tree grown greedily with exhaustive threshold search. Classification
// uses Gini impurity, regression uses squared error. Training is fully
// deterministic: features are scanned in column order and the first strictly
// best split wins.
class DecisionTree {
public:
  explicit DecisionTree(TreeTask task = TreeTask::CLASSIFICATION,
                        TreeParams params = {});

  // y holds class codes in [0, n_classes)
  void fit_classifier(const FeatureMatrix &X, const std::vector<int> &y,
                      size_t n_classes);
  void fit_regressor(const FeatureMatrix &X, const std::vector<double> &y);

  std::vector<double> predict_proba(const std::vector<double> &features) const;
  int predict_class(const std::vector<double> &features) const;
  double predict_value(const std::vector<double> &features) const;

  bool is_fitted() const { return root_ != nullptr; }
  TreeTask task() const { return task_; }
  const TreeParams &params() const { return params_; }
  size_t n_features() const { return n_features_; }
  size_t n_classes() const { return n_classes_; }
  const Node *root() const { return root_.get(); }

  // Depth of the deepest leaf; a single-leaf tree has depth 0
  int depth() const;
  size_t n_leaves() const;
  // Normalised total impurity decrease per feature (sums to 1 unless the
  // tree is a single leaf, in which case all entries are 0)
  std::vector<double> feature_importances() const;

  nlohmann::json to_json() const;
  static DecisionTree from_json(const nlohmann::json &j);

private:
  TreeTask task_;
  TreeParams params_;
  size_t n_features_ = 0;
  size_t n_classes_ = 0;
  std::unique_ptr<Node> root_;

  struct SplitCandidate {
    int feature_index = -1;
    double threshold = 0.0;
    double child_impurity = 0.0;
  };

  void fit_impl(const FeatureMatrix &X, const std::vector<double> &targets);
  std::unique_ptr<Node> build_node(const FeatureMatrix &X,
                                   const std::vector<double> &targets,
                                   std::vector<size_t> indices, int depth);
  SplitCandidate find_best_split(const FeatureMatrix &X,
                                 const std::vector<double> &targets,
                                 const std::vector<size_t> &indices) const;
  void fill_node_stats(Node &node, const std::vector<double> &targets,
                       const std::vector<size_t> &indices) const;

  const Node &leaf_for(const std::vector<double> &features) const;
  void require_fitted(TreeTask expected) const;
};

#endif // DECISION_TREE_HPP
